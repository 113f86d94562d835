#ifndef MUSICDATA_H
#define MUSICDATA_H

#include <QString>
#include <QStringList>
#include <QVector>
#include <QMetaType>

QString formatDuration(int seconds);

// ── Query / Item Kind ───────────────────────────────────────────────
enum class QueryType {
    Artist,
    Album,
    Track,
    Genre,
    Playlist
};

QString   queryTypeName(QueryType type);
bool      parseQueryType(const QString& name, QueryType* out);

// ── Playback Mode / Status ──────────────────────────────────────────
enum class PlaybackMode {
    Linear,
    RepeatOne,
    RepeatAll,
    Shuffle
};

enum class PlaybackStatus {
    Stopped,
    Playing,
    Paused
};

QString   playbackModeName(PlaybackMode mode);
bool      parsePlaybackMode(const QString& name, PlaybackMode* out);

// ── Match Status ────────────────────────────────────────────────────
// NotFound and AllSourcesUnreachable must stay distinguishable: the
// intent layer speaks a different response for each.
enum class MatchStatus {
    Found,
    NotFound,
    AllSourcesUnreachable
};

QString   matchStatusName(MatchStatus status);

// ── Data Structs ────────────────────────────────────────────────────
struct Track {
    QString id;
    QString title;
    QString artist;
    QString artistId;
    QString album;
    QString albumId;
    QString genre;
    int     duration = 0;     // seconds
    int     bitrate = 0;      // kbps, 0 = unknown
    QString streamUrl;        // empty until streamLocatorFor() when expensive
    QString coverUrl;
    QString sourceId;         // originating backend, e.g. "navidrome"
    QueryType kind = QueryType::Track;

    bool isValid() const { return !id.isEmpty(); }
};

// Reference to a not-yet-resolved track on a given backend.
struct TrackRef {
    QString id;
    QString sourceId;         // empty → job default source

    bool operator==(const TrackRef& o) const
    {
        return id == o.id && sourceId == o.sourceId;
    }
};

struct QueueEntry {
    Track   track;
    qint64  offsetMs = 0;     // resume position, only mutated on the active entry
    quint64 serial = 0;       // assigned by the queue, stable across inserts
    bool    failed = false;   // playback failed, skipped on repeat-all wrap
};

// Lower-cased, trimmed title|artist|album key used for duplicate suppression.
QString duplicateKey(const Track& track);

Q_DECLARE_METATYPE(Track)

#endif // MUSICDATA_H
