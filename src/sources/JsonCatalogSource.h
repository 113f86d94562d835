#pragma once

#include <QHash>
#include <QReadWriteLock>
#include <QSet>
#include <QVariantMap>
#include <QVector>
#include <atomic>
#include "../core/IMediaSource.h"
#include "CandidateNormalizer.h"

// Media source backed by a JSON catalog file:
//
//   { "artists":   [ {...}, ... ],
//     "albums":    [ {...}, ... ],
//     "songs":     [ {...}, ... ],
//     "playlists": [ { ..., "entry": [ "songId" | {"id": ...}, ... ] } ],
//     "starred":   [ "songId", ... ] }
//
// Records use the field names of the configured schema profile, so the
// same loader serves subsonic-style and plex-style catalogs.
class JsonCatalogSource : public IMediaSource {
public:
    JsonCatalogSource(const QString& sourceId, const QString& displayName,
                      const SchemaProfile& profile = SchemaProfile::subsonic());

    bool loadFromFile(const QString& path, QString* error = nullptr);
    bool loadFromJson(const QByteArray& json, QString* error = nullptr);

    // "%1" is replaced by the track id.
    void setStreamUrlTemplate(const QString& tmpl);

    // Fault injection
    void setOutage(bool down) { m_outage.store(down); }
    void setFailingIds(const QStringList& ids);
    void setLatencyMs(int ms) { m_latencyMs.store(ms); }

    int songCount() const;
    int resolveCalls() const { return m_resolveCalls.load(); }

    // IMediaSource
    QString sourceId() const override { return m_sourceId; }
    QString displayName() const override { return m_displayName; }
    SourceSearchResult search(QueryType type, const QString& text) override;
    std::optional<Track> resolveById(const QString& id, const CancelToken& cancel) override;
    QUrl streamLocatorFor(const Track& track) override;
    SourceIdList expand(QueryType type, const QString& itemId, int limit) override;
    SourceIdList randomTrackIds(int count) override;
    SourceIdList favouriteTrackIds() override;

    // Records per search, most similar to the query text first.
    static constexpr int kSearchLimit = 100;

private:
    bool sleepLatency(const CancelToken* cancel) const;
    QStringList playlistEntryIds(const QVariantMap& playlist) const;

    const QString m_sourceId;
    const QString m_displayName;
    const CandidateNormalizer m_normalizer;

    mutable QReadWriteLock m_lock;
    QVector<QVariantMap> m_artists;
    QVector<QVariantMap> m_albums;
    QVector<QVariantMap> m_songs;
    QVector<QVariantMap> m_playlists;
    QStringList m_starred;
    QVector<Track> m_tracks;             // normalized m_songs, same order
    QHash<QString, int> m_trackIndex;    // id -> index into m_tracks
    QSet<QString> m_failingIds;
    QString m_streamTemplate;

    std::atomic<bool> m_outage{false};
    std::atomic<int> m_latencyMs{0};
    std::atomic<int> m_resolveCalls{0};
};
