#include "TrackResolver.h"
#include "CandidateNormalizer.h"
#include "SourceRegistry.h"

#include <QDebug>
#include <QtConcurrent/QtConcurrentMap>
#include <exception>

bool ResolveOutcome::anyAnswered() const
{
    for (const SourceReport& r : reports) {
        if (r.status == SourceStatus::Answered)
            return true;
    }
    return false;
}

QStringList ResolveOutcome::unreachableIds() const
{
    QStringList out;
    for (const SourceReport& r : reports) {
        if (r.status == SourceStatus::Unreachable)
            out.append(r.sourceId);
    }
    return out;
}

namespace {

struct SourceAnswer {
    SourceReport   report;
    QVector<Track> tracks;
};

} // namespace

TrackResolver::TrackResolver(std::shared_ptr<SourceRegistry> registry)
    : m_registry(std::move(registry))
{
}

ResolveOutcome TrackResolver::search(QueryType type, const QString& text) const
{
    ResolveOutcome outcome;
    const QVector<std::shared_ptr<IMediaSource>> sources = m_registry->sources();
    if (sources.isEmpty()) {
        qWarning() << "[Resolver] no sources enabled";
        return outcome;
    }

    const std::shared_ptr<SourceRegistry> registry = m_registry;
    auto ask = [type, text, registry](const std::shared_ptr<IMediaSource>& source) {
        SourceAnswer answer;
        answer.report.sourceId = source->sourceId();

        SourceSearchResult result;
        try {
            result = source->search(type, text);
        } catch (const std::exception& e) {
            result.ok = false;
            result.error = QString::fromUtf8(e.what());
        }

        if (!result.ok) {
            answer.report.status = SourceStatus::Unreachable;
            answer.report.error = result.error;
            return answer;
        }

        answer.report.status = SourceStatus::Answered;
        const CandidateNormalizer normalizer(registry->profile(answer.report.sourceId));
        for (const BackendCandidate& c : result.candidates) {
            BackendCandidate stamped = c;
            if (stamped.sourceId.isEmpty())
                stamped.sourceId = answer.report.sourceId;
            if (!registry->contains(stamped.sourceId)) {
                qDebug() << "[Resolver] candidate from unknown source dropped:" << stamped.sourceId;
                continue;
            }
            Track t = normalizer.normalize(stamped);
            if (!t.isValid())
                continue;
            answer.tracks.append(t);
        }
        answer.report.candidateCount = answer.tracks.size();
        return answer;
    };

    const QVector<SourceAnswer> answers =
        QtConcurrent::blockingMapped<QVector<SourceAnswer>>(sources, ask);

    for (const SourceAnswer& a : answers) {
        outcome.reports.append(a.report);
        outcome.candidates += a.tracks;
        if (a.report.status == SourceStatus::Unreachable)
            qWarning() << "[Resolver]" << a.report.sourceId << "unreachable:" << a.report.error;
    }

    qInfo() << "[Resolver]" << queryTypeName(type) << text << "->"
            << outcome.candidates.size() << "candidates,"
            << outcome.unreachableIds().size() << "of" << sources.size() << "sources unreachable";
    return outcome;
}

std::optional<Track> TrackResolver::resolve(const TrackRef& ref, const QString& defaultSourceId,
                                            const CancelToken& cancel) const
{
    const QString sourceId = ref.sourceId.isEmpty() ? defaultSourceId : ref.sourceId;
    const std::shared_ptr<IMediaSource> source = m_registry->source(sourceId);
    if (!source) {
        qWarning() << "[Resolver] unknown source for" << ref.id << ":" << sourceId;
        return std::nullopt;
    }

    std::optional<Track> track;
    try {
        track = source->resolveById(ref.id, cancel);
    } catch (const std::exception& e) {
        qWarning() << "[Resolver]" << sourceId << "resolve" << ref.id << "threw:" << e.what();
        return std::nullopt;
    }

    if (track && track->sourceId.isEmpty())
        track->sourceId = sourceId;
    return track;
}

// ── Track id lists ──────────────────────────────────────────────────
template <typename Fn>
static SourceIdList idsFrom(const std::shared_ptr<IMediaSource>& source, const QString& sourceId,
                            const char* what, Fn fn)
{
    SourceIdList result;
    if (!source) {
        result.error = QStringLiteral("unknown source");
        qWarning() << "[Resolver]" << what << "on unknown source" << sourceId;
        return result;
    }
    try {
        result = fn(*source);
    } catch (const std::exception& e) {
        result = SourceIdList();
        result.error = QString::fromUtf8(e.what());
        qWarning() << "[Resolver]" << sourceId << what << "threw:" << e.what();
        return result;
    }
    if (!result.ok)
        qWarning() << "[Resolver]" << sourceId << what << "failed:" << result.error;
    return result;
}

SourceIdList TrackResolver::expand(const QString& sourceId, QueryType type,
                                   const QString& itemId, int limit) const
{
    return idsFrom(m_registry->source(sourceId), sourceId, "expand", [&](IMediaSource& s) {
        return s.expand(type, itemId, limit);
    });
}

SourceIdList TrackResolver::randomTrackIds(const QString& sourceId, int count) const
{
    return idsFrom(m_registry->source(sourceId), sourceId, "randomTrackIds", [&](IMediaSource& s) {
        return s.randomTrackIds(count);
    });
}

SourceIdList TrackResolver::favouriteTrackIds(const QString& sourceId) const
{
    return idsFrom(m_registry->source(sourceId), sourceId, "favouriteTrackIds", [](IMediaSource& s) {
        return s.favouriteTrackIds();
    });
}
