#pragma once

#include <QReadWriteLock>
#include <QStringList>
#include <QVector>
#include <memory>
#include "../core/IMediaSource.h"
#include "CandidateNormalizer.h"

// Enabled media sources in enable order, each with the schema profile its
// raw candidates are normalized with.
//
// Register during startup; lookups are safe from any thread afterwards.
// Sources are shared so a background job keeps its backend alive even if
// the registry entry is dropped meanwhile.
class SourceRegistry {
public:
    // Returns false when a source with the same id is already registered.
    bool add(std::shared_ptr<IMediaSource> source,
             const SchemaProfile& profile = SchemaProfile::subsonic());

    std::shared_ptr<IMediaSource> source(const QString& id) const;
    QVector<std::shared_ptr<IMediaSource>> sources() const;
    QStringList ids() const;
    SchemaProfile profile(const QString& id) const;
    bool contains(const QString& id) const;
    int count() const;
    bool isEmpty() const { return count() == 0; }

private:
    struct Entry {
        std::shared_ptr<IMediaSource> source;
        SchemaProfile profile;
    };

    int indexOfLocked(const QString& id) const;

    mutable QReadWriteLock m_lock;
    QVector<Entry> m_entries;
};
