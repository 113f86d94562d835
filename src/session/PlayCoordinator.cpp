#include "PlayCoordinator.h"
#include "SessionSupervisor.h"
#include "../core/CrashHandler.h"
#include "../core/PlaybackQueue.h"
#include "../sources/SourceRegistry.h"
#include "../sources/TrackResolver.h"

#include <QDebug>
#include <QRandomGenerator>
#include <QSet>

static QString refKey(const TrackRef& ref)
{
    return ref.sourceId + QLatin1Char('/') + ref.id;
}

static QVector<TrackRef> refsFromIds(const QString& sourceId, const QStringList& ids)
{
    QVector<TrackRef> refs;
    refs.reserve(ids.size());
    for (const QString& id : ids)
        refs.append({id, sourceId});
    return refs;
}

PlayCoordinator::PlayCoordinator(std::shared_ptr<PlaybackQueue> queue,
                                 std::shared_ptr<TrackResolver> resolver,
                                 std::shared_ptr<SessionSupervisor> supervisor,
                                 const MatchRanker& ranker,
                                 const CoordinatorOptions& options)
    : m_queue(std::move(queue))
    , m_resolver(std::move(resolver))
    , m_supervisor(std::move(supervisor))
    , m_ranker(ranker)
    , m_options(options)
{
}

RankOutcome PlayCoordinator::search(QueryType type, const QString& text) const
{
    return m_ranker.rank(type, text, m_resolver->search(type, text));
}

// ── Play requests ───────────────────────────────────────────────────
PlayResult PlayCoordinator::resolveAndEnqueue(QueryType type, const QString& text,
                                              PlaybackMode mode)
{
    qInfo() << "[Play]" << queryTypeName(type) << text << "mode" << playbackModeName(mode);
    CrashHandler::setRequestContext(queryTypeName(type) + QLatin1Char(' ') + text);
    m_supervisor->stopPopulator();

    const RankOutcome ranked = search(type, text);
    PlayResult result;
    result.status = ranked.status;
    if (!ranked.isFound())
        return result;

    result.match = ranked.matches.first();
    result.hasMatch = true;

    QVector<TrackRef> refs = refsFor(type, ranked);
    if (refs.isEmpty()) {
        qInfo() << "[Play]" << result.match.track.title << "has no playable tracks";
        result.status = MatchStatus::NotFound;
        return result;
    }
    return start(std::move(refs), mode, result);
}

PlayResult PlayCoordinator::playRandom(PlaybackMode mode)
{
    qInfo() << "[Play] random, mode" << playbackModeName(mode);
    CrashHandler::setRequestContext(QStringLiteral("random"));
    m_supervisor->stopPopulator();

    bool anyAnswered = false;
    QVector<QVector<TrackRef>> perSource;
    for (const QString& sourceId : m_resolver->registry()->ids()) {
        const SourceIdList list = m_resolver->randomTrackIds(sourceId, m_options.songCount);
        anyAnswered = anyAnswered || list.ok;
        perSource.append(refsFromIds(sourceId, list.ids));
    }
    return startInterleaved(perSource, anyAnswered, mode);
}

PlayResult PlayCoordinator::playFavourites(PlaybackMode mode)
{
    qInfo() << "[Play] favourites, mode" << playbackModeName(mode);
    CrashHandler::setRequestContext(QStringLiteral("favourites"));
    m_supervisor->stopPopulator();

    bool anyAnswered = false;
    QVector<QVector<TrackRef>> perSource;
    for (const QString& sourceId : m_resolver->registry()->ids()) {
        const SourceIdList list = m_resolver->favouriteTrackIds(sourceId);
        anyAnswered = anyAnswered || list.ok;
        perSource.append(refsFromIds(sourceId, list.ids));
    }
    return startInterleaved(perSource, anyAnswered, mode);
}

PlayResult PlayCoordinator::startInterleaved(const QVector<QVector<TrackRef>>& perSource,
                                             bool anyAnswered, PlaybackMode mode)
{
    PlayResult result;
    if (!anyAnswered) {
        qInfo() << "[Play] no source answered";
        result.status = MatchStatus::AllSourcesUnreachable;
        return result;
    }
    result.status = MatchStatus::Found;
    return start(interleave(perSource, m_options.songCount), mode, result);
}

// ── Track lists ─────────────────────────────────────────────────────
QVector<TrackRef> PlayCoordinator::refsFor(QueryType type, const RankOutcome& ranked) const
{
    const Track& top = ranked.matches.first().track;
    const int limit = m_options.songCount;

    switch (type) {
    case QueryType::Track: {
        QVector<TrackRef> refs;
        for (const RankedMatch& m : ranked.matches) {
            if (refs.size() >= limit)
                break;
            refs.append({m.track.id, m.track.sourceId});
        }
        fillWithRandom(&refs);
        return refs;
    }
    case QueryType::Artist:
        return refsFromIds(top.sourceId, m_resolver->expand(
            top.sourceId, type, top.artistId.isEmpty() ? top.id : top.artistId, limit).ids);
    case QueryType::Album:
        return refsFromIds(top.sourceId, m_resolver->expand(
            top.sourceId, type, top.albumId.isEmpty() ? top.id : top.albumId, limit).ids);
    case QueryType::Playlist:
        return refsFromIds(top.sourceId, m_resolver->expand(top.sourceId, type, top.id, limit).ids);
    case QueryType::Genre: {
        // A genre is not owned by one backend: collect it everywhere.
        const QString genre = top.genre.isEmpty() ? top.title : top.genre;
        QVector<QVector<TrackRef>> perSource;
        for (const QString& sourceId : m_resolver->registry()->ids())
            perSource.append(refsFromIds(sourceId, m_resolver->expand(sourceId, type, genre, limit).ids));
        return interleave(perSource, limit);
    }
    }
    return {};
}

// Round-robin merge of per-source lists, first occurrence wins.
QVector<TrackRef> PlayCoordinator::interleave(const QVector<QVector<TrackRef>>& perSource,
                                              int limit) const
{
    QVector<TrackRef> out;
    QSet<QString> seen;
    int longest = 0;
    for (const auto& list : perSource)
        longest = qMax(longest, int(list.size()));

    for (int i = 0; i < longest && out.size() < limit; ++i) {
        for (const auto& list : perSource) {
            if (i >= list.size() || out.size() >= limit)
                continue;
            const TrackRef& ref = list.at(i);
            if (seen.contains(refKey(ref)))
                continue;
            seen.insert(refKey(ref));
            out.append(ref);
        }
    }
    return out;
}

void PlayCoordinator::fillWithRandom(QVector<TrackRef>* refs) const
{
    const int missing = m_options.songCount - refs->size();
    if (missing <= 0)
        return;

    QVector<QVector<TrackRef>> perSource;
    for (const QString& sourceId : m_resolver->registry()->ids())
        perSource.append(refsFromIds(sourceId, m_resolver->randomTrackIds(sourceId, m_options.songCount).ids));

    QSet<QString> seen;
    for (const TrackRef& ref : *refs)
        seen.insert(refKey(ref));

    int added = 0;
    for (const TrackRef& ref : interleave(perSource, m_options.songCount + refs->size())) {
        if (added >= missing)
            break;
        if (seen.contains(refKey(ref)))
            continue;
        seen.insert(refKey(ref));
        refs->append(ref);
        ++added;
    }
    qDebug() << "[Play] filled" << added << "random tracks";
}

// ── Head / remainder split ──────────────────────────────────────────
PlayResult PlayCoordinator::start(QVector<TrackRef> refs, PlaybackMode mode, PlayResult result)
{
    if (refs.isEmpty()) {
        result.status = m_resolver->registry()->isEmpty() ? MatchStatus::AllSourcesUnreachable
                                                           : MatchStatus::NotFound;
        return result;
    }

    if (mode == PlaybackMode::Shuffle) {
        auto* rng = QRandomGenerator::global();
        for (int i = refs.size() - 1; i > 0; --i)
            refs.swapItemsAt(i, rng->bounded(i + 1));
    }

    m_queue->clear();
    m_queue->setMode(mode);

    const QString defaultSource = refs.first().sourceId;
    const CancelToken token;
    int consumed = 0;
    while (consumed < refs.size() && result.headSlice.size() < m_options.headSlice) {
        const TrackRef& ref = refs.at(consumed++);
        const std::optional<Track> track = m_resolver->resolve(ref, defaultSource, token);
        if (!track) {
            qWarning() << "[Play] head track" << ref.id << "unavailable on" << ref.sourceId;
            continue;
        }
        if (m_queue->enqueue(*track) > 0)
            result.headSlice.append(*track);
    }
    result.remainder = refs.mid(consumed);

    if (result.headSlice.isEmpty() && result.remainder.isEmpty()) {
        result.status = MatchStatus::NotFound;
        return result;
    }

    if (!result.headSlice.isEmpty())
        m_queue->setStatus(PlaybackStatus::Playing);
    if (!result.remainder.isEmpty())
        m_supervisor->replacePopulator({defaultSource, result.remainder});

    qInfo() << "[Play]" << result.headSlice.size() << "tracks ready,"
            << result.remainder.size() << "queued for background resolution";
    return result;
}
