#include "SourceRegistry.h"

#include <QDebug>

int SourceRegistry::indexOfLocked(const QString& id) const
{
    for (int i = 0; i < m_entries.size(); ++i) {
        if (m_entries[i].source->sourceId() == id)
            return i;
    }
    return -1;
}

bool SourceRegistry::add(std::shared_ptr<IMediaSource> source, const SchemaProfile& profile)
{
    if (!source)
        return false;

    QWriteLocker locker(&m_lock);
    const QString id = source->sourceId();
    if (indexOfLocked(id) >= 0) {
        qWarning() << "[Sources] duplicate source id ignored:" << id;
        return false;
    }
    m_entries.append({std::move(source), profile});
    qInfo() << "[Sources] registered" << id << "schema:" << profile.name;
    return true;
}

std::shared_ptr<IMediaSource> SourceRegistry::source(const QString& id) const
{
    QReadLocker locker(&m_lock);
    const int i = indexOfLocked(id);
    return i >= 0 ? m_entries[i].source : nullptr;
}

QVector<std::shared_ptr<IMediaSource>> SourceRegistry::sources() const
{
    QReadLocker locker(&m_lock);
    QVector<std::shared_ptr<IMediaSource>> out;
    out.reserve(m_entries.size());
    for (const Entry& e : m_entries)
        out.append(e.source);
    return out;
}

QStringList SourceRegistry::ids() const
{
    QReadLocker locker(&m_lock);
    QStringList out;
    for (const Entry& e : m_entries)
        out.append(e.source->sourceId());
    return out;
}

SchemaProfile SourceRegistry::profile(const QString& id) const
{
    QReadLocker locker(&m_lock);
    const int i = indexOfLocked(id);
    return i >= 0 ? m_entries[i].profile : SchemaProfile::subsonic();
}

bool SourceRegistry::contains(const QString& id) const
{
    QReadLocker locker(&m_lock);
    return indexOfLocked(id) >= 0;
}

int SourceRegistry::count() const
{
    QReadLocker locker(&m_lock);
    return m_entries.size();
}
