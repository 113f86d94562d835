#include <QtTest/QtTest>
#include <QElapsedTimer>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>
#include <QThread>
#include "sources/JsonCatalogSource.h"

static const char* kCatalog = R"({
  "artists": [ { "id": "ar1", "name": "Queen" }, { "id": "ar2", "name": "Slayer" } ],
  "albums":  [ { "id": "al1", "name": "Jazz", "artist": "Queen", "artistId": "ar1" },
               { "id": "al2", "name": "Reign in Blood", "artist": "Slayer", "artistId": "ar2" } ],
  "songs": [
    { "id": "s1", "title": "Mustapha", "artist": "Queen", "artistId": "ar1",
      "album": "Jazz", "albumId": "al1", "genre": "Rock", "duration": 183, "bitRate": 320 },
    { "id": "s2", "title": "Bicycle Race", "artist": "Queen", "artistId": "ar1",
      "album": "Jazz", "albumId": "al1", "genre": "Rock", "duration": 181, "bitRate": 320 },
    { "id": "s3", "title": "Angel of Death", "artist": "Slayer", "artistId": "ar2",
      "album": "Reign in Blood", "albumId": "al2", "genre": "Metal", "duration": 291 },
    { "title": "no id" }
  ],
  "playlists": [ { "id": "pl1", "name": "Mix", "entry": [ "s3", { "id": "s1" } ] } ],
  "starred": [ "s2" ]
})";

static std::unique_ptr<JsonCatalogSource> makeSource()
{
    auto source = std::make_unique<JsonCatalogSource>(QStringLiteral("navidrome"),
                                                      QStringLiteral("Navidrome"));
    QString error;
    if (!source->loadFromJson(QByteArray(kCatalog), &error))
        qWarning() << "catalog failed to load:" << error;
    return source;
}

class tst_JsonCatalogSource : public QObject {
    Q_OBJECT

private slots:
    void load_skipsSongsWithoutId()
    {
        auto s = makeSource();
        QCOMPARE(s->songCount(), 3);
    }

    void load_rejectsMalformedJson()
    {
        JsonCatalogSource s(QStringLiteral("x"), QString());
        QString error;
        QVERIFY(!s.loadFromJson("{ not json", &error));
        QVERIFY(!error.isEmpty());
        QVERIFY(!s.loadFromJson("[1, 2]", &error));
        QCOMPARE(s.displayName(), QStringLiteral("x"));
    }

    void loadFromFile_missingFile()
    {
        JsonCatalogSource s(QStringLiteral("x"), QString());
        QString error;
        QVERIFY(!s.loadFromFile(QStringLiteral("/nonexistent/catalog.json"), &error));
        QVERIFY(!error.isEmpty());
    }

    void loadFromFile_roundTrip()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        QFile f(dir.filePath(QStringLiteral("catalog.json")));
        QVERIFY(f.open(QIODevice::WriteOnly));
        f.write(kCatalog);
        f.close();

        JsonCatalogSource s(QStringLiteral("navidrome"), QString());
        QVERIFY(s.loadFromFile(f.fileName()));
        QCOMPARE(s.songCount(), 3);
    }

    void search_returnsRecordsOfKind()
    {
        auto s = makeSource();
        const SourceSearchResult artists = s->search(QueryType::Artist, QStringLiteral("queen"));
        QVERIFY(artists.ok);
        QCOMPARE(artists.candidates.size(), 2);
        QCOMPARE(artists.candidates.first().sourceId, QStringLiteral("navidrome"));
        QCOMPARE(artists.candidates.first().kind, QueryType::Artist);

        const SourceSearchResult genres = s->search(QueryType::Genre, QStringLiteral("rock"));
        QVERIFY(genres.ok);
        QCOMPARE(genres.candidates.size(), 2);   // Rock, Metal
    }

    void search_largeCatalogKeepsBestMatch()
    {
        QJsonArray artists;
        for (int i = 1; i <= 150; ++i) {
            artists.append(QJsonObject{{"id", QStringLiteral("ar%1").arg(i)},
                                       {"name", QStringLiteral("Filler Band %1").arg(i)}});
        }
        artists.append(QJsonObject{{"id", "ar151"}, {"name", "Zebra Katz"}});

        JsonCatalogSource s(QStringLiteral("navidrome"), QString());
        QVERIFY(s.loadFromJson(QJsonDocument(QJsonObject{{"artists", artists}}).toJson()));

        const SourceSearchResult r = s.search(QueryType::Artist, QStringLiteral("zebra katz"));
        QVERIFY(r.ok);
        QCOMPARE(r.candidates.size(), 100);
        QCOMPARE(r.candidates.first().raw.value(QStringLiteral("id")).toString(),
                 QStringLiteral("ar151"));
    }

    void search_outageReportsFailure()
    {
        auto s = makeSource();
        s->setOutage(true);
        const SourceSearchResult r = s->search(QueryType::Track, QStringLiteral("x"));
        QVERIFY(!r.ok);
        QVERIFY(r.candidates.isEmpty());
        QVERIFY(!r.error.isEmpty());
    }

    void resolveById_findsAndFails()
    {
        auto s = makeSource();
        const CancelToken token;
        const auto t = s->resolveById(QStringLiteral("s3"), token);
        QVERIFY(t.has_value());
        QCOMPARE(t->title, QStringLiteral("Angel of Death"));
        QCOMPARE(t->sourceId, QStringLiteral("navidrome"));

        QVERIFY(!s->resolveById(QStringLiteral("missing"), token).has_value());

        s->setFailingIds({QStringLiteral("s3")});
        QVERIFY(!s->resolveById(QStringLiteral("s3"), token).has_value());
        QCOMPARE(s->resolveCalls(), 3);
    }

    void resolveById_latencyHonoursCancel()
    {
        auto s = makeSource();
        s->setLatencyMs(5000);
        CancelToken token;

        std::unique_ptr<QThread> canceller(QThread::create([token] {
            QThread::msleep(50);
            token.cancel();
        }));
        canceller->start();

        QElapsedTimer timer;
        timer.start();
        QVERIFY(!s->resolveById(QStringLiteral("s1"), token).has_value());
        QVERIFY(timer.elapsed() < 2000);
        QVERIFY(canceller->wait(2000));
    }

    void expand_byKind()
    {
        auto s = makeSource();
        const SourceIdList byArtist = s->expand(QueryType::Artist, QStringLiteral("ar1"), 0);
        QVERIFY(byArtist.ok);
        QCOMPARE(byArtist.ids, QStringList({"s1", "s2"}));
        QCOMPARE(s->expand(QueryType::Album, QStringLiteral("al2"), 0).ids, QStringList({"s3"}));
        QCOMPARE(s->expand(QueryType::Genre, QStringLiteral("rock"), 1).ids, QStringList({"s1"}));
        QCOMPARE(s->expand(QueryType::Playlist, QStringLiteral("pl1"), 0).ids,
                 QStringList({"s3", "s1"}));

        const SourceIdList unknown = s->expand(QueryType::Album, QStringLiteral("nope"), 0);
        QVERIFY(unknown.ok);
        QVERIFY(unknown.ids.isEmpty());
    }

    void randomAndFavourites()
    {
        auto s = makeSource();
        const QStringList random = s->randomTrackIds(2).ids;
        QCOMPARE(random.size(), 2);
        QVERIFY(random.at(0) != random.at(1));
        QCOMPARE(s->randomTrackIds(10).ids.size(), 3);
        QCOMPARE(s->favouriteTrackIds().ids, QStringList({"s2"}));
    }

    void idLists_outageReportsFailure()
    {
        auto s = makeSource();
        s->setOutage(true);
        const SourceIdList expanded = s->expand(QueryType::Artist, QStringLiteral("ar1"), 0);
        QVERIFY(!expanded.ok);
        QVERIFY(expanded.ids.isEmpty());
        QVERIFY(!expanded.error.isEmpty());

        const SourceIdList random = s->randomTrackIds(5);
        QVERIFY(!random.ok);
        QVERIFY(random.ids.isEmpty());
        QVERIFY(!s->favouriteTrackIds().ok);
    }

    void streamLocator_usesTemplate()
    {
        auto s = makeSource();
        Track t;
        t.id = QStringLiteral("s1");
        QVERIFY(s->streamLocatorFor(t).isEmpty());
        s->setStreamUrlTemplate(QStringLiteral("http://music.local/rest/stream?id=%1"));
        QCOMPARE(s->streamLocatorFor(t).toString(),
                 QStringLiteral("http://music.local/rest/stream?id=s1"));
        t.streamUrl = QStringLiteral("http://cdn/x.flac");
        QCOMPARE(s->streamLocatorFor(t).toString(), QStringLiteral("http://cdn/x.flac"));
    }
};

QTEST_MAIN(tst_JsonCatalogSource)
#include "tst_JsonCatalogSource.moc"
