#pragma once

#include <atomic>
#include <memory>

// Shared cancellation flag handed to backend calls.  Copies observe the
// same flag; cancel() is safe from any thread.
class CancelToken {
public:
    CancelToken() : m_flag(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() const { m_flag->store(true); }
    bool isCancelled() const { return m_flag->load(); }

private:
    std::shared_ptr<std::atomic<bool>> m_flag;
};
