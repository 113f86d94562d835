#include "Settings.h"
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QStandardPaths>

// ── Settings INI path ───────────────────────────────────────────────
QString Settings::settingsPath()
{
    QDir dir(QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation)
             + QStringLiteral("/VoiceDeck"));
    if (!dir.exists()) dir.mkpath(QStringLiteral("."));
    return dir.filePath(QStringLiteral("settings.ini"));
}

QString Settings::resolvePath(const QString& cliPath)
{
    if (!cliPath.isEmpty())
        return QFileInfo(cliPath).absoluteFilePath();
    const QString env = qEnvironmentVariable("VOICEDECK_CONFIG");
    if (!env.isEmpty())
        return QFileInfo(env).absoluteFilePath();
    return settingsPath();
}

// ── Constructor ─────────────────────────────────────────────────────
Settings::Settings(const QString& path)
    : m_settings(path, QSettings::IniFormat)
{
    qDebug() << "[Settings] INI path:" << m_settings.fileName();
}

// ── Helpers ─────────────────────────────────────────────────────────
QString Settings::sourceKey(const QString& id, const char* field)
{
    return QStringLiteral("sources/%1/%2").arg(id, QLatin1String(field));
}

// INI lists come back as QStringList when unquoted and as one string when
// quoted, accept both.
QStringList Settings::stringList(const QString& key, const QString& def) const
{
    const QVariant v = m_settings.value(key, def);
    const QStringList raw = v.typeId() == QMetaType::QStringList
        ? v.toStringList()
        : v.toString().split(QLatin1Char(','));

    QStringList out;
    for (const QString& s : raw) {
        const QString t = s.trimmed();
        if (!t.isEmpty() && !out.contains(t))
            out.append(t);
    }
    return out;
}

int Settings::clampedInt(const QString& key, int def, int lo, int hi) const
{
    bool ok = false;
    const int v = m_settings.value(key, def).toInt(&ok);
    if (!ok) {
        qWarning() << "[Settings]" << key << "is not a number, using" << def;
        return def;
    }
    const int clamped = qBound(lo, v, hi);
    if (clamped != v)
        qWarning() << "[Settings]" << key << "=" << v << "out of range, using" << clamped;
    return clamped;
}

double Settings::clampedDouble(const QString& key, double def, double lo, double hi) const
{
    bool ok = false;
    const double v = m_settings.value(key, def).toDouble(&ok);
    if (!ok) {
        qWarning() << "[Settings]" << key << "is not a number, using" << def;
        return def;
    }
    const double clamped = qBound(lo, v, hi);
    if (clamped != v)
        qWarning() << "[Settings]" << key << "=" << v << "out of range, using" << clamped;
    return clamped;
}

// ── Sources ─────────────────────────────────────────────────────────
QStringList Settings::enabledSources() const
{
    return stringList(QStringLiteral("sources/enabled"), QStringLiteral("navidrome"));
}

void Settings::setEnabledSources(const QStringList& ids)
{
    m_settings.setValue(QStringLiteral("sources/enabled"), ids.join(QLatin1Char(',')));
}

QStringList Settings::sourcePriority() const
{
    return stringList(QStringLiteral("sources/priority"), QString());
}

void Settings::setSourcePriority(const QStringList& ids)
{
    m_settings.setValue(QStringLiteral("sources/priority"), ids.join(QLatin1Char(',')));
}

bool Settings::preferHighBitrate() const
{
    return m_settings.value(QStringLiteral("sources/preferHighBitrate"), false).toBool();
}

void Settings::setPreferHighBitrate(bool enabled)
{
    m_settings.setValue(QStringLiteral("sources/preferHighBitrate"), enabled);
}

QString Settings::sourceCatalog(const QString& id) const
{
    const QString path = m_settings.value(sourceKey(id, "catalog")).toString();
    if (path.isEmpty() || QFileInfo(path).isAbsolute())
        return path;
    // Relative catalog paths are relative to the INI file
    return QFileInfo(m_settings.fileName()).absoluteDir().filePath(path);
}

void Settings::setSourceCatalog(const QString& id, const QString& path)
{
    m_settings.setValue(sourceKey(id, "catalog"), path);
}

QString Settings::sourceStreamUrl(const QString& id) const
{
    return m_settings.value(sourceKey(id, "streamUrl")).toString();
}

void Settings::setSourceStreamUrl(const QString& id, const QString& tmpl)
{
    m_settings.setValue(sourceKey(id, "streamUrl"), tmpl);
}

QString Settings::sourceSchema(const QString& id) const
{
    const QString def = id.compare(QLatin1String("plex"), Qt::CaseInsensitive) == 0
        ? QStringLiteral("plex") : QStringLiteral("subsonic");
    return m_settings.value(sourceKey(id, "schema"), def).toString().trimmed().toLower();
}

void Settings::setSourceSchema(const QString& id, const QString& schema)
{
    m_settings.setValue(sourceKey(id, "schema"), schema);
}

// ── Playback ────────────────────────────────────────────────────────
int Settings::songCount() const
{
    return clampedInt(QStringLiteral("playback/songCount"), 50, 1, 500);
}

void Settings::setSongCount(int count)
{
    m_settings.setValue(QStringLiteral("playback/songCount"), count);
}

int Settings::headSlice() const
{
    return clampedInt(QStringLiteral("playback/headSlice"), 2, 1, songCount());
}

void Settings::setHeadSlice(int count)
{
    m_settings.setValue(QStringLiteral("playback/headSlice"), count);
}

qint64 Settings::rewindRestartMs() const
{
    return clampedInt(QStringLiteral("playback/rewindRestartMs"), 5000, 0, 600000);
}

void Settings::setRewindRestartMs(qint64 ms)
{
    m_settings.setValue(QStringLiteral("playback/rewindRestartMs"), ms);
}

bool Settings::skipDuplicates() const
{
    return m_settings.value(QStringLiteral("playback/skipDuplicates"), true).toBool();
}

void Settings::setSkipDuplicates(bool enabled)
{
    m_settings.setValue(QStringLiteral("playback/skipDuplicates"), enabled);
}

// ── Ranking ─────────────────────────────────────────────────────────
double Settings::matchThreshold() const
{
    return clampedDouble(QStringLiteral("ranking/threshold"), 0.6, 0.0, 1.0);
}

void Settings::setMatchThreshold(double threshold)
{
    m_settings.setValue(QStringLiteral("ranking/threshold"), threshold);
}

double Settings::dedupTolerance() const
{
    return clampedDouble(QStringLiteral("ranking/dedupTolerance"), 0.9, 0.0, 1.0);
}

void Settings::setDedupTolerance(double tolerance)
{
    m_settings.setValue(QStringLiteral("ranking/dedupTolerance"), tolerance);
}

// ── Session ─────────────────────────────────────────────────────────
int Settings::joinTimeoutMs() const
{
    return clampedInt(QStringLiteral("session/joinTimeoutMs"), 1500, 10, 60000);
}

void Settings::setJoinTimeoutMs(int ms)
{
    m_settings.setValue(QStringLiteral("session/joinTimeoutMs"), ms);
}

// ── Logging ─────────────────────────────────────────────────────────
int Settings::logLevel() const
{
    return clampedInt(QStringLiteral("log/level"), 1, 0, 2);
}

void Settings::setLogLevel(int level)
{
    m_settings.setValue(QStringLiteral("log/level"), level);
}

// ── Validation ──────────────────────────────────────────────────────
bool Settings::validate(QStringList* errors) const
{
    QStringList problems;

    const QStringList enabled = enabledSources();
    if (enabled.isEmpty())
        problems << QStringLiteral("sources/enabled lists no source");

    for (const QString& id : enabled) {
        const QString schema = sourceSchema(id);
        if (schema != QLatin1String("subsonic") && schema != QLatin1String("navidrome")
            && schema != QLatin1String("plex"))
            problems << QStringLiteral("%1 has unknown schema '%2'").arg(sourceKey(id, "schema"), schema);
    }

    for (const QString& id : sourcePriority()) {
        if (!enabled.contains(id))
            qWarning() << "[Settings] priority names a source that is not enabled:" << id;
    }

    for (const QString& p : problems)
        qWarning() << "[Settings]" << p;
    if (errors)
        *errors = problems;
    return problems.isEmpty();
}
