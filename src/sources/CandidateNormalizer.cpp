#include "CandidateNormalizer.h"

#include <QDebug>

// ── Profiles ────────────────────────────────────────────────────────
SchemaProfile SchemaProfile::subsonic()
{
    SchemaProfile p;
    p.name      = QStringLiteral("subsonic");
    p.id        = { QStringLiteral("id") };
    p.title     = { QStringLiteral("title"), QStringLiteral("name") };
    p.itemName  = { QStringLiteral("name"), QStringLiteral("title") };
    p.artist    = { QStringLiteral("artist"), QStringLiteral("displayArtist"),
                    QStringLiteral("artists.0.name") };
    p.artistId  = { QStringLiteral("artistId"), QStringLiteral("artists.0.id") };
    p.album     = { QStringLiteral("album") };
    p.albumId   = { QStringLiteral("albumId"), QStringLiteral("parent") };
    p.genre     = { QStringLiteral("genre"), QStringLiteral("genres.0.name") };
    p.duration  = { QStringLiteral("duration") };
    p.bitrate   = { QStringLiteral("bitRate"), QStringLiteral("bitrate") };
    p.coverUrl  = { QStringLiteral("coverPosterUrl"), QStringLiteral("coverArt") };
    p.streamUrl = { QStringLiteral("streamUrl") };
    p.entries   = { QStringLiteral("entry"), QStringLiteral("entries") };
    return p;
}

SchemaProfile SchemaProfile::plex()
{
    SchemaProfile p;
    p.name      = QStringLiteral("plex");
    p.id        = { QStringLiteral("ratingKey"), QStringLiteral("key"),
                    QStringLiteral("id") };
    p.title     = { QStringLiteral("title"), QStringLiteral("raw_response.json.title") };
    p.itemName  = { QStringLiteral("title"), QStringLiteral("tag"), QStringLiteral("name") };
    // originalTitle carries multi-artist credits, check it before grandparentTitle
    p.artist    = { QStringLiteral("originalTitle"), QStringLiteral("grandparentTitle"),
                    QStringLiteral("Media.0.Artist.tag"),
                    QStringLiteral("raw_response.json.grandparentTitle"),
                    QStringLiteral("artist") };
    p.artistId  = { QStringLiteral("grandparentRatingKey"), QStringLiteral("artistId") };
    p.album     = { QStringLiteral("parentTitle"), QStringLiteral("Media.0.Album.title"),
                    QStringLiteral("raw_response.json.parentTitle"),
                    QStringLiteral("album") };
    p.albumId   = { QStringLiteral("parentRatingKey"), QStringLiteral("albumId") };
    p.genre     = { QStringLiteral("Genre.0.tag"), QStringLiteral("genre") };
    p.duration  = { QStringLiteral("duration"), QStringLiteral("Media.0.duration") };
    p.durationDivisor = 1000;
    p.bitrate   = { QStringLiteral("Media.0.bitrate"),
                    QStringLiteral("raw_response.json.Media.bitrate"),
                    QStringLiteral("bitrate") };
    p.coverUrl  = { QStringLiteral("coverPosterUrl"), QStringLiteral("thumb"),
                    QStringLiteral("parentThumb") };
    p.streamUrl = { QStringLiteral("Media.0.Part.0.key"), QStringLiteral("streamUrl") };
    p.entries   = { QStringLiteral("Metadata"), QStringLiteral("entries") };
    return p;
}

bool SchemaProfile::byName(const QString& name, SchemaProfile* out)
{
    const QString n = name.trimmed().toLower();
    if (n.isEmpty() || n == QLatin1String("subsonic") || n == QLatin1String("navidrome")) {
        *out = subsonic();
        return true;
    }
    if (n == QLatin1String("plex")) {
        *out = plex();
        return true;
    }
    return false;
}

// ── CandidateNormalizer ─────────────────────────────────────────────
CandidateNormalizer::CandidateNormalizer(const SchemaProfile& profile)
    : m_profile(profile)
{
}

QVariant CandidateNormalizer::valueAtPath(const QVariant& root, const QString& path)
{
    QVariant current = root;
    const QStringList parts = path.split(QLatin1Char('.'), Qt::SkipEmptyParts);
    for (const QString& part : parts) {
        bool isIndex = false;
        const int index = part.toInt(&isIndex);

        if (current.typeId() == QMetaType::QVariantList
            || current.typeId() == QMetaType::QStringList) {
            const QVariantList list = current.toList();
            if (list.isEmpty()) return QVariant();
            if (isIndex) {
                if (index < 0 || index >= list.size()) return QVariant();
                current = list.at(index);
                continue;
            }
            current = list.first();
        }

        if (current.typeId() != QMetaType::QVariantMap)
            return QVariant();
        const QVariantMap map = current.toMap();
        auto it = map.constFind(part);
        if (it == map.constEnd())
            return QVariant();
        current = it.value();
    }
    return current;
}

QString CandidateNormalizer::extract(const QVariantMap& raw, const QStringList& paths)
{
    const QVariant root(raw);
    for (const QString& path : paths) {
        QVariant v = valueAtPath(root, path);
        if (!v.isValid() || v.isNull()) continue;
        if (v.typeId() == QMetaType::QVariantMap || v.typeId() == QMetaType::QVariantList)
            continue;
        const QString s = v.toString().trimmed();
        if (!s.isEmpty())
            return s;
    }
    return QString();
}

int CandidateNormalizer::extractInt(const QVariantMap& raw, const QStringList& paths)
{
    const QString s = extract(raw, paths);
    bool ok = false;
    const double v = s.toDouble(&ok);
    return ok ? static_cast<int>(v) : 0;
}

Track CandidateNormalizer::normalize(const BackendCandidate& candidate) const
{
    const QVariantMap& raw = candidate.raw;
    Track t;
    t.kind     = candidate.kind;
    t.sourceId = candidate.sourceId;
    t.id       = extract(raw, m_profile.id);
    t.coverUrl = extract(raw, m_profile.coverUrl);

    switch (candidate.kind) {
    case QueryType::Track:
        t.title     = extract(raw, m_profile.title);
        t.artist    = extract(raw, m_profile.artist);
        t.artistId  = extract(raw, m_profile.artistId);
        t.album     = extract(raw, m_profile.album);
        t.albumId   = extract(raw, m_profile.albumId);
        t.genre     = extract(raw, m_profile.genre);
        t.duration  = extractInt(raw, m_profile.duration) / qMax(1, m_profile.durationDivisor);
        t.bitrate   = extractInt(raw, m_profile.bitrate);
        t.streamUrl = extract(raw, m_profile.streamUrl);
        break;
    case QueryType::Artist:
        t.title    = extract(raw, m_profile.itemName);
        t.artist   = t.title;
        t.artistId = t.id;
        break;
    case QueryType::Album:
        t.title    = extract(raw, m_profile.itemName);
        t.album    = t.title;
        t.albumId  = t.id;
        t.artist   = extract(raw, m_profile.artist);
        t.artistId = extract(raw, m_profile.artistId);
        t.genre    = extract(raw, m_profile.genre);
        break;
    case QueryType::Genre:
        t.title = extract(raw, m_profile.itemName);
        t.genre = t.title;
        if (t.id.isEmpty())
            t.id = t.title;
        break;
    case QueryType::Playlist:
        t.title = extract(raw, m_profile.itemName);
        break;
    }
    return t;
}
