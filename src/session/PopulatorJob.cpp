#include "PopulatorJob.h"
#include "../core/PlaybackQueue.h"
#include "../sources/TrackResolver.h"

#include <QDeadlineTimer>
#include <QDebug>

static std::atomic<int> s_nextJobId{1};

PopulatorJob::PopulatorJob(PopulatorJobSpec spec, std::shared_ptr<PlaybackQueue> queue,
                           std::shared_ptr<TrackResolver> resolver, quint64 ticket)
    : m_spec(std::move(spec))
    , m_queue(std::move(queue))
    , m_resolver(std::move(resolver))
    , m_ticket(ticket)
    , m_id(s_nextJobId.fetch_add(1))
{
}

PopulatorJob::~PopulatorJob()
{
    if (m_thread && m_thread->isRunning()) {
        requestStop();
        m_thread->wait();
    }
}

QString PopulatorJob::outcomeName(Outcome outcome)
{
    switch (outcome) {
    case Outcome::Pending:         return QStringLiteral("pending");
    case Outcome::Running:         return QStringLiteral("running");
    case Outcome::Completed:       return QStringLiteral("completed");
    case Outcome::PartiallyFailed: return QStringLiteral("partially-failed");
    case Outcome::Failed:          return QStringLiteral("failed");
    case Outcome::Cancelled:       return QStringLiteral("cancelled");
    }
    return QString();
}

void PopulatorJob::start()
{
    if (m_thread)
        return;
    m_outcome.store(Outcome::Running);
    m_thread.reset(QThread::create([this] { run(); }));
    m_thread->setObjectName(QStringLiteral("Populator-%1").arg(m_id));
    m_thread->start();
    qDebug() << "[Populator] job" << m_id << "started:" << m_spec.refs.size()
             << "refs, ticket" << m_ticket;
}

void PopulatorJob::requestStop()
{
    m_stop.store(true);
    m_cancel.cancel();
}

bool PopulatorJob::wait(int ms)
{
    if (!m_thread)
        return true;
    if (ms < 0)
        return m_thread->wait();
    return m_thread->wait(QDeadlineTimer(ms));
}

bool PopulatorJob::isFinished() const
{
    if (!m_thread)
        return m_outcome.load() != Outcome::Running;
    return m_thread->isFinished();
}

void PopulatorJob::finish(Outcome outcome)
{
    m_outcome.store(outcome);
    qInfo() << "[Populator] job" << m_id << outcomeName(outcome) << "-"
            << m_resolved.load() << "appended," << m_duplicates.load() << "duplicates,"
            << m_failed.load() << "failed of" << m_spec.refs.size();
}

void PopulatorJob::run()
{
    for (const TrackRef& ref : m_spec.refs) {
        if (m_stop.load()) {
            finish(Outcome::Cancelled);
            return;
        }

        const std::optional<Track> track = m_resolver->resolve(ref, m_spec.sourceId, m_cancel);

        // A cancelled job must not touch the queue, whatever the backend returned.
        if (m_stop.load()) {
            finish(Outcome::Cancelled);
            return;
        }

        if (!track) {
            m_failed.fetch_add(1);
            qWarning() << "[Populator] job" << m_id << "could not resolve" << ref.id
                       << "on" << (ref.sourceId.isEmpty() ? m_spec.sourceId : ref.sourceId);
            continue;
        }

        switch (m_queue->appendFromPopulator(m_ticket, *track)) {
        case PlaybackQueue::AppendResult::Appended:
            m_resolved.fetch_add(1);
            break;
        case PlaybackQueue::AppendResult::Duplicate:
            m_duplicates.fetch_add(1);
            break;
        case PlaybackQueue::AppendResult::Rejected:
            // The supervisor raises the stop flag before revoking a ticket.
            if (m_stop.load()) {
                finish(Outcome::Cancelled);
                return;
            }
            qFatal("[Populator] job %d: ticket %llu revoked without a stop request",
                   m_id, static_cast<unsigned long long>(m_ticket));
        }
    }

    m_queue->revokePopulatorTicket(m_ticket);

    if (m_failed.load() == 0)
        finish(Outcome::Completed);
    else if (m_resolved.load() + m_duplicates.load() == 0)
        finish(Outcome::Failed);
    else
        finish(Outcome::PartiallyFailed);
}
