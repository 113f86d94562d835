#pragma once

#include <QSettings>
#include <QStringList>

// INI-backed configuration.  Getters clamp out-of-range values and log
// the correction, so callers always see usable numbers.
class Settings {
public:
    explicit Settings(const QString& path = settingsPath());

    // <GenericDataLocation>/VoiceDeck/settings.ini
    static QString settingsPath();
    // --config value, then $VOICEDECK_CONFIG, then settingsPath().
    static QString resolvePath(const QString& cliPath);

    QString fileName() const { return m_settings.fileName(); }
    void sync() { m_settings.sync(); }

    // ── Sources ──────────────────────────────────────────────────────
    // Enable order; also the last tie-break when ranking duplicates.
    QStringList enabledSources() const;
    void setEnabledSources(const QStringList& ids);

    QStringList sourcePriority() const;
    void setSourcePriority(const QStringList& ids);

    bool preferHighBitrate() const;
    void setPreferHighBitrate(bool enabled);

    QString sourceCatalog(const QString& id) const;
    void setSourceCatalog(const QString& id, const QString& path);

    // "%1" is replaced by the track id
    QString sourceStreamUrl(const QString& id) const;
    void setSourceStreamUrl(const QString& id, const QString& tmpl);

    // "subsonic" or "plex"
    QString sourceSchema(const QString& id) const;
    void setSourceSchema(const QString& id, const QString& schema);

    // ── Playback ─────────────────────────────────────────────────────
    int songCount() const;
    void setSongCount(int count);

    int headSlice() const;
    void setHeadSlice(int count);

    qint64 rewindRestartMs() const;
    void setRewindRestartMs(qint64 ms);

    bool skipDuplicates() const;
    void setSkipDuplicates(bool enabled);

    // ── Ranking ──────────────────────────────────────────────────────
    double matchThreshold() const;
    void setMatchThreshold(double threshold);

    double dedupTolerance() const;
    void setDedupTolerance(double tolerance);

    // ── Session ──────────────────────────────────────────────────────
    int joinTimeoutMs() const;
    void setJoinTimeoutMs(int ms);

    // ── Logging ──────────────────────────────────────────────────────
    // 0 = warnings, 1 = info, 2 = debug
    int logLevel() const;
    void setLogLevel(int level);

    // False when the configuration cannot drive a session.
    bool validate(QStringList* errors = nullptr) const;

private:
    QStringList stringList(const QString& key, const QString& def) const;
    int clampedInt(const QString& key, int def, int lo, int hi) const;
    double clampedDouble(const QString& key, double def, double lo, double hi) const;
    static QString sourceKey(const QString& id, const char* field);

    QSettings m_settings;
};
