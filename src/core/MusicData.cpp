#include "MusicData.h"

// ═════════════════════════════════════════════════════════════════════
//  Utility Functions
// ═════════════════════════════════════════════════════════════════════

QString formatDuration(int seconds)
{
    int m = seconds / 60;
    int s = seconds % 60;
    return QString("%1:%2").arg(m).arg(s, 2, 10, QChar('0'));
}

QString queryTypeName(QueryType type)
{
    switch (type) {
    case QueryType::Artist:   return QStringLiteral("artist");
    case QueryType::Album:    return QStringLiteral("album");
    case QueryType::Track:    return QStringLiteral("track");
    case QueryType::Genre:    return QStringLiteral("genre");
    case QueryType::Playlist: return QStringLiteral("playlist");
    }
    return QStringLiteral("track");
}

bool parseQueryType(const QString& name, QueryType* out)
{
    const QString n = name.trimmed().toLower();
    if (n == QLatin1String("artist"))        *out = QueryType::Artist;
    else if (n == QLatin1String("album"))    *out = QueryType::Album;
    else if (n == QLatin1String("track")
             || n == QLatin1String("song"))  *out = QueryType::Track;
    else if (n == QLatin1String("genre"))    *out = QueryType::Genre;
    else if (n == QLatin1String("playlist")) *out = QueryType::Playlist;
    else return false;
    return true;
}

QString playbackModeName(PlaybackMode mode)
{
    switch (mode) {
    case PlaybackMode::Linear:    return QStringLiteral("linear");
    case PlaybackMode::RepeatOne: return QStringLiteral("repeat-one");
    case PlaybackMode::RepeatAll: return QStringLiteral("repeat-all");
    case PlaybackMode::Shuffle:   return QStringLiteral("shuffle");
    }
    return QStringLiteral("linear");
}

bool parsePlaybackMode(const QString& name, PlaybackMode* out)
{
    const QString n = name.trimmed().toLower();
    if (n == QLatin1String("linear") || n == QLatin1String("normal"))
        *out = PlaybackMode::Linear;
    else if (n == QLatin1String("repeat-one") || n == QLatin1String("repeat"))
        *out = PlaybackMode::RepeatOne;
    else if (n == QLatin1String("repeat-all") || n == QLatin1String("loop"))
        *out = PlaybackMode::RepeatAll;
    else if (n == QLatin1String("shuffle"))
        *out = PlaybackMode::Shuffle;
    else
        return false;
    return true;
}

QString matchStatusName(MatchStatus status)
{
    switch (status) {
    case MatchStatus::Found:                 return QStringLiteral("found");
    case MatchStatus::NotFound:              return QStringLiteral("notFound");
    case MatchStatus::AllSourcesUnreachable: return QStringLiteral("allSourcesUnreachable");
    }
    return QStringLiteral("notFound");
}

QString duplicateKey(const Track& track)
{
    return track.title.trimmed().toLower() + QLatin1Char('|')
         + track.artist.trimmed().toLower() + QLatin1Char('|')
         + track.album.trimmed().toLower();
}
