#pragma once

#include <QMutex>
#include <QVector>
#include <memory>
#include "PopulatorJob.h"

class PlaybackQueue;
class TrackResolver;

// Owns the single background populator of a playback session.
//
// Replacing or stopping the populator first raises its stop flag, then
// revokes its ticket under the queue lock, so no mutation from the old
// job can land after the call returns.  The thread is then joined with a
// bounded wait; a job stuck in a backend call is parked in a detached list
// and joined when the supervisor is destroyed.
class SessionSupervisor {
public:
    SessionSupervisor(std::shared_ptr<PlaybackQueue> queue,
                      std::shared_ptr<TrackResolver> resolver,
                      int joinTimeoutMs = 1500);
    ~SessionSupervisor();

    SessionSupervisor(const SessionSupervisor&) = delete;
    SessionSupervisor& operator=(const SessionSupervisor&) = delete;

    void replacePopulator(const PopulatorJobSpec& spec);
    void stopPopulator();

    std::shared_ptr<PopulatorJob> activeJob() const;
    bool hasLiveJob() const;
    PopulatorJob::Outcome lastOutcome() const;
    // Blocks until the active job finishes.  ms < 0 waits forever.
    bool waitForActive(int ms);

    int detachedCount() const;
    void setJoinTimeout(int ms);
    int joinTimeout() const;

private:
    void stopLocked();
    void reapDetachedLocked();

    const std::shared_ptr<PlaybackQueue> m_queue;
    const std::shared_ptr<TrackResolver> m_resolver;

    mutable QMutex m_mutex;
    int m_joinTimeoutMs;
    std::shared_ptr<PopulatorJob> m_active;
    QVector<std::shared_ptr<PopulatorJob>> m_detached;
    PopulatorJob::Outcome m_lastOutcome = PopulatorJob::Outcome::Pending;
};
