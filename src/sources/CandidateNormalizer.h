#pragma once

#include <QString>
#include <QStringList>
#include <QVariant>
#include "../core/IMediaSource.h"

// Ordered accessor paths per semantic field.  Backend SDK versions expose
// the same value under different names, so each field lists every name
// seen in the wild; the first one yielding a non-empty value wins.
//
// A path is dotted ("Media.0.bitrate").  Numeric parts index into lists,
// and a list met with a non-numeric part contributes its first element.
struct SchemaProfile {
    QString     name;
    QStringList id;
    QStringList title;
    QStringList itemName;        // display name of artist / album / genre / playlist
    QStringList artist;
    QStringList artistId;
    QStringList album;
    QStringList albumId;
    QStringList genre;
    QStringList duration;
    int         durationDivisor = 1;   // plex reports milliseconds
    QStringList bitrate;
    QStringList coverUrl;
    QStringList streamUrl;
    QStringList entries;      // playlist track id list

    static SchemaProfile subsonic();
    static SchemaProfile plex();
    static bool byName(const QString& name, SchemaProfile* out);
};

class CandidateNormalizer {
public:
    explicit CandidateNormalizer(const SchemaProfile& profile = SchemaProfile::subsonic());

    const SchemaProfile& profile() const { return m_profile; }

    // Converts one raw candidate into a Track stamped with its source.
    Track normalize(const BackendCandidate& candidate) const;

    // First non-empty string found along paths, or an empty string.
    static QString extract(const QVariantMap& raw, const QStringList& paths);
    static QVariant valueAtPath(const QVariant& root, const QString& path);

private:
    static int extractInt(const QVariantMap& raw, const QStringList& paths);

    SchemaProfile m_profile;
};
