#include "SessionSupervisor.h"
#include "../core/PlaybackQueue.h"

#include <QDebug>

SessionSupervisor::SessionSupervisor(std::shared_ptr<PlaybackQueue> queue,
                                     std::shared_ptr<TrackResolver> resolver,
                                     int joinTimeoutMs)
    : m_queue(std::move(queue))
    , m_resolver(std::move(resolver))
    , m_joinTimeoutMs(joinTimeoutMs)
{
}

SessionSupervisor::~SessionSupervisor()
{
    QMutexLocker lock(&m_mutex);
    stopLocked();
    for (const auto& job : m_detached) {
        qDebug() << "[Supervisor] joining detached job" << job->id();
        job->wait(-1);
    }
    m_detached.clear();
}

void SessionSupervisor::replacePopulator(const PopulatorJobSpec& spec)
{
    QMutexLocker lock(&m_mutex);
    stopLocked();
    reapDetachedLocked();

    const quint64 ticket = m_queue->openPopulatorTicket();
    m_active = std::make_shared<PopulatorJob>(spec, m_queue, m_resolver, ticket);
    m_lastOutcome = PopulatorJob::Outcome::Running;
    m_active->start();
}

void SessionSupervisor::stopPopulator()
{
    QMutexLocker lock(&m_mutex);
    stopLocked();
    reapDetachedLocked();
}

void SessionSupervisor::stopLocked()
{
    if (!m_active)
        return;

    std::shared_ptr<PopulatorJob> job = std::move(m_active);
    m_active.reset();

    // Order matters: the job treats a rejected append as a protocol
    // violation unless its stop flag is already up.
    job->requestStop();
    m_queue->revokePopulatorTicket(job->ticket());

    if (job->wait(m_joinTimeoutMs)) {
        m_lastOutcome = job->outcome();
        qDebug() << "[Supervisor] job" << job->id() << "stopped:"
                 << PopulatorJob::outcomeName(m_lastOutcome);
        return;
    }

    m_lastOutcome = PopulatorJob::Outcome::Cancelled;
    qWarning() << "[Supervisor] job" << job->id() << "did not stop within"
               << m_joinTimeoutMs << "ms, detaching";
    m_detached.append(job);
}

void SessionSupervisor::reapDetachedLocked()
{
    for (int i = m_detached.size() - 1; i >= 0; --i) {
        if (m_detached[i]->isFinished()) {
            qDebug() << "[Supervisor] reaped detached job" << m_detached[i]->id();
            m_detached.removeAt(i);
        }
    }
}

std::shared_ptr<PopulatorJob> SessionSupervisor::activeJob() const
{
    QMutexLocker lock(&m_mutex);
    return m_active;
}

bool SessionSupervisor::hasLiveJob() const
{
    QMutexLocker lock(&m_mutex);
    return m_active && !m_active->isFinished();
}

PopulatorJob::Outcome SessionSupervisor::lastOutcome() const
{
    QMutexLocker lock(&m_mutex);
    return m_active ? m_active->outcome() : m_lastOutcome;
}

bool SessionSupervisor::waitForActive(int ms)
{
    std::shared_ptr<PopulatorJob> job = activeJob();
    return job ? job->wait(ms) : true;
}

int SessionSupervisor::detachedCount() const
{
    QMutexLocker lock(&m_mutex);
    return m_detached.size();
}

void SessionSupervisor::setJoinTimeout(int ms)
{
    QMutexLocker lock(&m_mutex);
    m_joinTimeoutMs = qMax(0, ms);
}

int SessionSupervisor::joinTimeout() const
{
    QMutexLocker lock(&m_mutex);
    return m_joinTimeoutMs;
}
