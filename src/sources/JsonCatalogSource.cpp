#include "JsonCatalogSource.h"
#include "MatchRanker.h"

#include <QDebug>
#include <QElapsedTimer>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QRandomGenerator>
#include <QThread>
#include <algorithm>
#include <limits>

static QVector<QVariantMap> recordsOf(const QJsonObject& root, const QString& key)
{
    QVector<QVariantMap> out;
    const QJsonArray arr = root.value(key).toArray();
    out.reserve(arr.size());
    for (const QJsonValue& v : arr) {
        if (v.isObject())
            out.append(v.toObject().toVariantMap());
    }
    return out;
}

JsonCatalogSource::JsonCatalogSource(const QString& sourceId, const QString& displayName,
                                     const SchemaProfile& profile)
    : m_sourceId(sourceId)
    , m_displayName(displayName.isEmpty() ? sourceId : displayName)
    , m_normalizer(profile)
{
}

bool JsonCatalogSource::loadFromFile(const QString& path, QString* error)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        const QString msg = QStringLiteral("cannot open %1: %2").arg(path, file.errorString());
        qWarning() << "[Catalog]" << m_sourceId << msg;
        if (error) *error = msg;
        return false;
    }
    return loadFromJson(file.readAll(), error);
}

bool JsonCatalogSource::loadFromJson(const QByteArray& json, QString* error)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        const QString msg = parseError.error != QJsonParseError::NoError
            ? parseError.errorString()
            : QStringLiteral("catalog root is not an object");
        qWarning() << "[Catalog]" << m_sourceId << "parse failed:" << msg;
        if (error) *error = msg;
        return false;
    }

    const QJsonObject root = doc.object();
    QVector<QVariantMap> songs = recordsOf(root, QStringLiteral("songs"));

    QVector<Track> tracks;
    QHash<QString, int> index;
    tracks.reserve(songs.size());
    for (const QVariantMap& raw : songs) {
        Track t = m_normalizer.normalize({m_sourceId, QueryType::Track, raw});
        if (!t.isValid()) {
            qDebug() << "[Catalog]" << m_sourceId << "song without id skipped";
            continue;
        }
        if (index.contains(t.id))
            continue;
        index.insert(t.id, tracks.size());
        tracks.append(t);
    }

    QStringList starred;
    for (const QJsonValue& v : root.value(QStringLiteral("starred")).toArray()) {
        const QString id = v.isObject()
            ? CandidateNormalizer::extract(v.toObject().toVariantMap(), m_normalizer.profile().id)
            : v.toVariant().toString();
        if (!id.isEmpty())
            starred.append(id);
    }

    QWriteLocker locker(&m_lock);
    m_artists   = recordsOf(root, QStringLiteral("artists"));
    m_albums    = recordsOf(root, QStringLiteral("albums"));
    m_playlists = recordsOf(root, QStringLiteral("playlists"));
    m_songs     = std::move(songs);
    m_tracks    = std::move(tracks);
    m_trackIndex = std::move(index);
    m_starred   = starred;

    qInfo() << "[Catalog]" << m_sourceId << "loaded" << m_tracks.size() << "songs,"
            << m_albums.size() << "albums," << m_artists.size() << "artists,"
            << m_playlists.size() << "playlists";
    return true;
}

void JsonCatalogSource::setStreamUrlTemplate(const QString& tmpl)
{
    QWriteLocker locker(&m_lock);
    m_streamTemplate = tmpl;
}

void JsonCatalogSource::setFailingIds(const QStringList& ids)
{
    QWriteLocker locker(&m_lock);
    m_failingIds = QSet<QString>(ids.begin(), ids.end());
}

int JsonCatalogSource::songCount() const
{
    QReadLocker locker(&m_lock);
    return m_tracks.size();
}

// Sleeps the configured latency in small steps.  Returns false when the
// token was cancelled meanwhile.
bool JsonCatalogSource::sleepLatency(const CancelToken* cancel) const
{
    const int latency = m_latencyMs.load();
    if (latency <= 0)
        return !(cancel && cancel->isCancelled());

    QElapsedTimer timer;
    timer.start();
    while (timer.elapsed() < latency) {
        if (cancel && cancel->isCancelled())
            return false;
        QThread::msleep(10);
    }
    return !(cancel && cancel->isCancelled());
}

SourceSearchResult JsonCatalogSource::search(QueryType type, const QString& text)
{
    SourceSearchResult result;
    sleepLatency(nullptr);
    if (m_outage.load()) {
        result.error = QStringLiteral("%1 unreachable").arg(m_displayName);
        return result;
    }

    struct Hit {
        double           score;
        BackendCandidate candidate;
    };
    QVector<Hit> hits;

    auto consider = [&](const QVariantMap& raw) {
        BackendCandidate c{m_sourceId, type, raw};
        const Track t = m_normalizer.normalize(c);
        hits.append({MatchRanker::similarity(text, MatchRanker::matchField(t, type)), c});
    };

    {
        QReadLocker locker(&m_lock);
        switch (type) {
        case QueryType::Artist:   for (const QVariantMap& r : m_artists) consider(r); break;
        case QueryType::Album:    for (const QVariantMap& r : m_albums) consider(r); break;
        case QueryType::Track:    for (const QVariantMap& r : m_songs) consider(r); break;
        case QueryType::Playlist: for (const QVariantMap& r : m_playlists) consider(r); break;
        case QueryType::Genre: {
            QStringList seen;
            for (const Track& t : m_tracks) {
                if (t.genre.isEmpty() || seen.contains(t.genre, Qt::CaseInsensitive))
                    continue;
                seen.append(t.genre);
                QVariantMap raw;
                raw.insert(QStringLiteral("id"), t.genre);
                raw.insert(QStringLiteral("name"), t.genre);
                consider(raw);
            }
            break;
        }
        }
    }

    // Most relevant first, catalog order on ties; the cap applies after.
    std::stable_sort(hits.begin(), hits.end(), [](const Hit& a, const Hit& b) {
        return a.score > b.score;
    });

    result.ok = true;
    const int n = std::min<int>(hits.size(), kSearchLimit);
    result.candidates.reserve(n);
    for (int i = 0; i < n; ++i)
        result.candidates.append(hits[i].candidate);

    qDebug() << "[Catalog]" << m_sourceId << "search" << queryTypeName(type) << text
             << "->" << n << "of" << hits.size() << "records";
    return result;
}

std::optional<Track> JsonCatalogSource::resolveById(const QString& id, const CancelToken& cancel)
{
    m_resolveCalls.fetch_add(1);
    if (!sleepLatency(&cancel)) {
        qDebug() << "[Catalog]" << m_sourceId << "resolve cancelled:" << id;
        return std::nullopt;
    }
    if (m_outage.load())
        return std::nullopt;

    QReadLocker locker(&m_lock);
    if (m_failingIds.contains(id))
        return std::nullopt;
    auto it = m_trackIndex.constFind(id);
    if (it == m_trackIndex.constEnd())
        return std::nullopt;
    return m_tracks.at(it.value());
}

QUrl JsonCatalogSource::streamLocatorFor(const Track& track)
{
    if (!track.streamUrl.isEmpty())
        return QUrl(track.streamUrl);

    QReadLocker locker(&m_lock);
    if (m_streamTemplate.isEmpty() || track.id.isEmpty())
        return QUrl();
    return QUrl(m_streamTemplate.arg(track.id));
}

QStringList JsonCatalogSource::playlistEntryIds(const QVariantMap& playlist) const
{
    QStringList ids;
    const SchemaProfile& profile = m_normalizer.profile();
    for (const QString& key : profile.entries) {
        const QVariant value = playlist.value(key);
        if (!value.isValid())
            continue;
        for (const QVariant& entry : value.toList()) {
            const QString id = entry.typeId() == QMetaType::QVariantMap
                ? CandidateNormalizer::extract(entry.toMap(), profile.id)
                : entry.toString();
            if (!id.isEmpty())
                ids.append(id);
        }
        if (!ids.isEmpty())
            break;
    }
    return ids;
}

SourceIdList JsonCatalogSource::expand(QueryType type, const QString& itemId, int limit)
{
    SourceIdList result;
    sleepLatency(nullptr);
    if (m_outage.load()) {
        result.error = QStringLiteral("%1 unreachable").arg(m_displayName);
        return result;
    }
    result.ok = true;
    if (itemId.isEmpty())
        return result;

    QStringList& ids = result.ids;
    const int cap = limit > 0 ? limit : std::numeric_limits<int>::max();
    QReadLocker locker(&m_lock);

    auto collect = [&](auto matches) {
        for (const Track& t : m_tracks) {
            if (ids.size() >= cap)
                break;
            if (matches(t))
                ids.append(t.id);
        }
    };

    switch (type) {
    case QueryType::Track:
        if (m_trackIndex.contains(itemId))
            ids.append(itemId);
        break;
    case QueryType::Artist:
        collect([&](const Track& t) {
            return t.artistId == itemId
                || (t.artistId.isEmpty() && t.artist.compare(itemId, Qt::CaseInsensitive) == 0);
        });
        break;
    case QueryType::Album:
        collect([&](const Track& t) { return t.albumId == itemId; });
        break;
    case QueryType::Genre:
        collect([&](const Track& t) { return t.genre.compare(itemId, Qt::CaseInsensitive) == 0; });
        break;
    case QueryType::Playlist:
        for (const QVariantMap& raw : m_playlists) {
            if (CandidateNormalizer::extract(raw, m_normalizer.profile().id) != itemId)
                continue;
            ids = playlistEntryIds(raw).mid(0, cap);
            break;
        }
        break;
    }

    qDebug() << "[Catalog]" << m_sourceId << "expand" << queryTypeName(type)
             << itemId << "->" << ids.size() << "tracks";
    return result;
}

SourceIdList JsonCatalogSource::randomTrackIds(int count)
{
    SourceIdList result;
    sleepLatency(nullptr);
    if (m_outage.load()) {
        result.error = QStringLiteral("%1 unreachable").arg(m_displayName);
        return result;
    }
    result.ok = true;
    if (count <= 0)
        return result;

    QStringList ids;
    {
        QReadLocker locker(&m_lock);
        ids.reserve(m_tracks.size());
        for (const Track& t : m_tracks)
            ids.append(t.id);
    }

    // Partial Fisher-Yates, only the first count slots are needed.
    auto* rng = QRandomGenerator::global();
    const int n = std::min<int>(count, ids.size());
    for (int i = 0; i < n; ++i) {
        const int j = i + static_cast<int>(rng->bounded(ids.size() - i));
        ids.swapItemsAt(i, j);
    }
    result.ids = ids.mid(0, n);
    return result;
}

SourceIdList JsonCatalogSource::favouriteTrackIds()
{
    SourceIdList result;
    sleepLatency(nullptr);
    if (m_outage.load()) {
        result.error = QStringLiteral("%1 unreachable").arg(m_displayName);
        return result;
    }
    QReadLocker locker(&m_lock);
    result.ok = true;
    result.ids = m_starred;
    return result;
}
