#pragma once

#include <QString>
#include <QThread>
#include <QVector>
#include <atomic>
#include <memory>
#include "../core/CancelToken.h"
#include "../core/MusicData.h"

class PlaybackQueue;
class TrackResolver;

struct PopulatorJobSpec {
    QString           sourceId;   // default for refs without their own source
    QVector<TrackRef> refs;       // resolved and appended in this order
};

// Resolves the remainder of a play request on its own thread and appends
// each track to the queue through a populator ticket.
//
// The job shares ownership of the queue and resolver, so it stays valid
// after the request context that started it is gone.  Once a stop is
// requested it performs no further queue mutation.
class PopulatorJob {
public:
    enum class Outcome { Pending, Running, Completed, PartiallyFailed, Failed, Cancelled };

    PopulatorJob(PopulatorJobSpec spec, std::shared_ptr<PlaybackQueue> queue,
                 std::shared_ptr<TrackResolver> resolver, quint64 ticket);
    ~PopulatorJob();

    PopulatorJob(const PopulatorJob&) = delete;
    PopulatorJob& operator=(const PopulatorJob&) = delete;

    void start();
    // Sets the stop flag and trips the cancel token.  Never blocks.
    void requestStop();
    // Returns true once the thread has finished.  ms < 0 waits forever.
    bool wait(int ms);

    bool isStopRequested() const { return m_stop.load(); }
    bool isFinished() const;
    Outcome outcome() const { return m_outcome.load(); }
    int resolvedCount() const { return m_resolved.load(); }
    int failedCount() const { return m_failed.load(); }
    int duplicateCount() const { return m_duplicates.load(); }
    quint64 ticket() const { return m_ticket; }
    int id() const { return m_id; }
    int refCount() const { return m_spec.refs.size(); }

    static QString outcomeName(Outcome outcome);

private:
    void run();
    void finish(Outcome outcome);

    const PopulatorJobSpec m_spec;
    const std::shared_ptr<PlaybackQueue> m_queue;
    const std::shared_ptr<TrackResolver> m_resolver;
    const quint64 m_ticket;
    const int m_id;

    CancelToken m_cancel;
    std::atomic<bool> m_stop{false};
    std::atomic<Outcome> m_outcome{Outcome::Pending};
    std::atomic<int> m_resolved{0};
    std::atomic<int> m_failed{0};
    std::atomic<int> m_duplicates{0};
    std::unique_ptr<QThread> m_thread;
};
