#pragma once

#include <QString>
#include <QStringList>
#include <QUrl>
#include <QVariantMap>
#include <QVector>
#include <optional>
#include "CancelToken.h"
#include "MusicData.h"

// One raw search hit, before normalization.  Field names inside raw vary
// by backend and by backend version.
struct BackendCandidate {
    QString     sourceId;
    QueryType   kind = QueryType::Track;
    QVariantMap raw;
};

struct SourceSearchResult {
    bool ok = false;                    // false → backend unreachable / failed
    QVector<BackendCandidate> candidates;
    QString error;
};

// An ok list may be empty: the backend answered and had nothing.
struct SourceIdList {
    bool        ok = false;
    QStringList ids;
    QString     error;
};

// Common interface for media backends (Subsonic-protocol servers, media
// library servers, local catalogs).
//
// Implementations are called from the request thread, from the resolver's
// fan-out pool and from the background populator, possibly concurrently:
// every method must be thread-safe.
class IMediaSource {
public:
    virtual ~IMediaSource() = default;

    // ── Identity ─────────────────────────────────────────────────
    virtual QString sourceId() const = 0;      // e.g. "navidrome", "plex"
    virtual QString displayName() const = 0;   // e.g. "Navidrome"

    // ── Search & Resolve ─────────────────────────────────────────
    virtual SourceSearchResult search(QueryType type, const QString& text) = 0;

    // Full track lookup.  Long-running implementations should poll
    // cancel and give up early; callers never rely on that alone.
    virtual std::optional<Track> resolveById(const QString& id,
                                             const CancelToken& cancel) = 0;

    // Deferred stream locator for tracks whose streamUrl was left empty.
    virtual QUrl streamLocatorFor(const Track& track) = 0;

    // ── Track lists ──────────────────────────────────────────────
    // Ordered track ids of an artist / album / playlist / genre.
    virtual SourceIdList expand(QueryType type, const QString& itemId, int limit) = 0;
    virtual SourceIdList randomTrackIds(int count) = 0;
    virtual SourceIdList favouriteTrackIds() = 0;
};
