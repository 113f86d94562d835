#include <QtTest/QtTest>
#include "sources/CandidateNormalizer.h"

static QVariantMap map(std::initializer_list<std::pair<QString, QVariant>> items)
{
    QVariantMap m;
    for (const auto& kv : items)
        m.insert(kv.first, kv.second);
    return m;
}

class tst_CandidateNormalizer : public QObject {
    Q_OBJECT

private slots:
    // ── Paths ────────────────────────────────────────────────────
    void valueAtPath_descendsMapsAndLists()
    {
        const QVariantMap raw = map({
            {QStringLiteral("Media"), QVariantList{
                map({{QStringLiteral("bitrate"), 1411}}),
                map({{QStringLiteral("bitrate"), 320}})}}});

        QCOMPARE(CandidateNormalizer::valueAtPath(raw, QStringLiteral("Media.0.bitrate")).toInt(), 1411);
        QCOMPARE(CandidateNormalizer::valueAtPath(raw, QStringLiteral("Media.1.bitrate")).toInt(), 320);
        // A list met with a name takes its first element
        QCOMPARE(CandidateNormalizer::valueAtPath(raw, QStringLiteral("Media.bitrate")).toInt(), 1411);
        QVERIFY(!CandidateNormalizer::valueAtPath(raw, QStringLiteral("Media.5.bitrate")).isValid());
        QVERIFY(!CandidateNormalizer::valueAtPath(raw, QStringLiteral("Nope.bitrate")).isValid());
    }

    void extract_firstNonEmptyWins()
    {
        const QVariantMap raw = map({
            {QStringLiteral("originalTitle"), QString()},
            {QStringLiteral("grandparentTitle"), QStringLiteral("  Queen ")},
            {QStringLiteral("artist"), QStringLiteral("Other")}});
        QCOMPARE(CandidateNormalizer::extract(raw, {QStringLiteral("originalTitle"),
                                                    QStringLiteral("grandparentTitle"),
                                                    QStringLiteral("artist")}),
                 QStringLiteral("Queen"));
        QCOMPARE(CandidateNormalizer::extract(raw, {QStringLiteral("missing")}), QString());
    }

    void extract_skipsContainers()
    {
        const QVariantMap raw = map({
            {QStringLiteral("artist"), map({{QStringLiteral("name"), QStringLiteral("x")}})},
            {QStringLiteral("displayArtist"), QStringLiteral("Queen")}});
        QCOMPARE(CandidateNormalizer::extract(raw, {QStringLiteral("artist"),
                                                    QStringLiteral("displayArtist")}),
                 QStringLiteral("Queen"));
    }

    // ── Profiles ─────────────────────────────────────────────────
    void byName_knownAndUnknown()
    {
        SchemaProfile p;
        QVERIFY(SchemaProfile::byName(QStringLiteral("Navidrome"), &p));
        QCOMPARE(p.name, QStringLiteral("subsonic"));
        QVERIFY(SchemaProfile::byName(QStringLiteral("plex"), &p));
        QCOMPARE(p.name, QStringLiteral("plex"));
        QVERIFY(!SchemaProfile::byName(QStringLiteral("jellyfin"), &p));
    }

    void normalize_subsonicSong()
    {
        const CandidateNormalizer n(SchemaProfile::subsonic());
        const QVariantMap raw = map({
            {QStringLiteral("id"), QStringLiteral("s1")},
            {QStringLiteral("title"), QStringLiteral("Bohemian Rhapsody")},
            {QStringLiteral("artist"), QStringLiteral("Queen")},
            {QStringLiteral("artistId"), QStringLiteral("ar1")},
            {QStringLiteral("album"), QStringLiteral("A Night at the Opera")},
            {QStringLiteral("albumId"), QStringLiteral("al1")},
            {QStringLiteral("genre"), QStringLiteral("Rock")},
            {QStringLiteral("duration"), 354},
            {QStringLiteral("bitRate"), 320}});

        const Track t = n.normalize({QStringLiteral("navidrome"), QueryType::Track, raw});
        QCOMPARE(t.id, QStringLiteral("s1"));
        QCOMPARE(t.title, QStringLiteral("Bohemian Rhapsody"));
        QCOMPARE(t.artist, QStringLiteral("Queen"));
        QCOMPARE(t.albumId, QStringLiteral("al1"));
        QCOMPARE(t.genre, QStringLiteral("Rock"));
        QCOMPARE(t.duration, 354);
        QCOMPARE(t.bitrate, 320);
        QCOMPARE(t.sourceId, QStringLiteral("navidrome"));
        QCOMPARE(t.kind, QueryType::Track);
    }

    void normalize_plexVersionsDisagreeOnFieldNames()
    {
        const CandidateNormalizer n(SchemaProfile::plex());

        // Newer SDK: flat grandparentTitle and nested media
        const QVariantMap modern = map({
            {QStringLiteral("ratingKey"), QStringLiteral("101")},
            {QStringLiteral("title"), QStringLiteral("Song")},
            {QStringLiteral("grandparentTitle"), QStringLiteral("Band")},
            {QStringLiteral("parentTitle"), QStringLiteral("Record")},
            {QStringLiteral("duration"), 241000},
            {QStringLiteral("Media"), QVariantList{map({{QStringLiteral("bitrate"), 1411}})}}});

        // Older SDK: only the raw response carries the artist
        const QVariantMap legacy = map({
            {QStringLiteral("key"), QStringLiteral("102")},
            {QStringLiteral("title"), QStringLiteral("Song 2")},
            {QStringLiteral("raw_response"), map({{QStringLiteral("json"), map({
                {QStringLiteral("grandparentTitle"), QStringLiteral("Legacy Band")}})}})},
            {QStringLiteral("bitrate"), 256}});

        const Track a = n.normalize({QStringLiteral("plex"), QueryType::Track, modern});
        QCOMPARE(a.id, QStringLiteral("101"));
        QCOMPARE(a.artist, QStringLiteral("Band"));
        QCOMPARE(a.album, QStringLiteral("Record"));
        QCOMPARE(a.duration, 241);
        QCOMPARE(a.bitrate, 1411);

        const Track b = n.normalize({QStringLiteral("plex"), QueryType::Track, legacy});
        QCOMPARE(b.id, QStringLiteral("102"));
        QCOMPARE(b.artist, QStringLiteral("Legacy Band"));
        QCOMPARE(b.bitrate, 256);
    }

    void normalize_plexPrefersOriginalTitle()
    {
        const CandidateNormalizer n(SchemaProfile::plex());
        const QVariantMap raw = map({
            {QStringLiteral("ratingKey"), QStringLiteral("7")},
            {QStringLiteral("title"), QStringLiteral("Duet")},
            {QStringLiteral("originalTitle"), QStringLiteral("A feat. B")},
            {QStringLiteral("grandparentTitle"), QStringLiteral("A")}});
        QCOMPARE(n.normalize({QStringLiteral("plex"), QueryType::Track, raw}).artist,
                 QStringLiteral("A feat. B"));
    }

    void normalize_nonTrackKinds()
    {
        const CandidateNormalizer n;
        const Track artist = n.normalize({QStringLiteral("navidrome"), QueryType::Artist,
            map({{QStringLiteral("id"), QStringLiteral("ar1")},
                 {QStringLiteral("name"), QStringLiteral("Queen")}})});
        QCOMPARE(artist.title, QStringLiteral("Queen"));
        QCOMPARE(artist.artist, QStringLiteral("Queen"));
        QCOMPARE(artist.artistId, QStringLiteral("ar1"));

        const Track album = n.normalize({QStringLiteral("navidrome"), QueryType::Album,
            map({{QStringLiteral("id"), QStringLiteral("al1")},
                 {QStringLiteral("name"), QStringLiteral("Jazz")},
                 {QStringLiteral("artist"), QStringLiteral("Queen")}})});
        QCOMPARE(album.album, QStringLiteral("Jazz"));
        QCOMPARE(album.albumId, QStringLiteral("al1"));
        QCOMPARE(album.artist, QStringLiteral("Queen"));

        const Track genre = n.normalize({QStringLiteral("navidrome"), QueryType::Genre,
            map({{QStringLiteral("name"), QStringLiteral("Rock")}})});
        QCOMPARE(genre.genre, QStringLiteral("Rock"));
        QCOMPARE(genre.id, QStringLiteral("Rock"));
    }

    void normalize_missingIdYieldsInvalidTrack()
    {
        const CandidateNormalizer n;
        const Track t = n.normalize({QStringLiteral("navidrome"), QueryType::Track,
                                     map({{QStringLiteral("title"), QStringLiteral("x")}})});
        QVERIFY(!t.isValid());
    }
};

QTEST_MAIN(tst_CandidateNormalizer)
#include "tst_CandidateNormalizer.moc"
