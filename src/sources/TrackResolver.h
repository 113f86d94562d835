#pragma once

#include <QStringList>
#include <QVector>
#include <memory>
#include <optional>
#include "../core/CancelToken.h"
#include "../core/IMediaSource.h"
#include "../core/MusicData.h"

class SourceRegistry;

enum class SourceStatus { Answered, Unreachable };

struct SourceReport {
    QString      sourceId;
    SourceStatus status = SourceStatus::Unreachable;
    QString      error;
    int          candidateCount = 0;
};

struct ResolveOutcome {
    QVector<Track>        candidates;   // enable order, then backend order
    QVector<SourceReport> reports;      // one per enabled source, enable order

    bool anyAnswered() const;
    // Also true when no source is enabled at all.
    bool allUnreachable() const { return !anyAnswered(); }
    QStringList unreachableIds() const;
};

// Fans a query out to every enabled source in parallel and normalizes the
// answers.  A failing source is reported as unreachable and never fails
// the whole query.
class TrackResolver {
public:
    explicit TrackResolver(std::shared_ptr<SourceRegistry> registry);

    ResolveOutcome search(QueryType type, const QString& text) const;

    // Full lookup of one ref.  An empty ref source falls back to defaultSourceId.
    std::optional<Track> resolve(const TrackRef& ref, const QString& defaultSourceId,
                                 const CancelToken& cancel) const;

    // Track id lists from one source.  An unknown or throwing source comes
    // back with ok == false, like one that reports a failure itself.
    SourceIdList expand(const QString& sourceId, QueryType type, const QString& itemId,
                        int limit) const;
    SourceIdList randomTrackIds(const QString& sourceId, int count) const;
    SourceIdList favouriteTrackIds(const QString& sourceId) const;

    std::shared_ptr<SourceRegistry> registry() const { return m_registry; }

private:
    std::shared_ptr<SourceRegistry> m_registry;
};
