#include "PlaybackQueue.h"
#include <QRandomGenerator>
#include <QDebug>
#include <algorithm>

// ── Enqueue ─────────────────────────────────────────────────────────
int PlaybackQueue::enqueue(const QVector<Track>& tracks, Position position)
{
    QMutexLocker lock(&m_mutex);

    int at = m_entries.size();
    if (position == Position::Next) {
        at = (m_cursor < m_entries.size()) ? m_cursor + 1 : m_entries.size();
    } else if (m_regionStart >= 0) {
        at = m_regionStart;  // before the live populator's region
    }

    const int added = insertLocked(tracks, at, position == Position::Next);
    if (added > 0 && m_regionStart >= 0 && at <= m_regionStart)
        m_regionStart += added;

    qDebug() << "[Queue] Added" << added << "of" << tracks.size()
             << "tracks at" << at << "(" << m_entries.size() << "total)";
    return added;
}

int PlaybackQueue::enqueue(const Track& track, Position position)
{
    return enqueue(QVector<Track>{track}, position);
}

int PlaybackQueue::insertLocked(const QVector<Track>& tracks, int at, bool playNext)
{
    QVector<QueueEntry> fresh;
    fresh.reserve(tracks.size());
    for (const Track& t : tracks) {
        if (!t.isValid()) continue;
        const QString key = duplicateKey(t);
        if (m_skipDuplicates && m_keys.contains(key)) {
            qDebug() << "[Queue] Skipping duplicate:" << t.title << "by" << t.artist;
            continue;
        }
        m_keys.insert(key);
        QueueEntry e;
        e.track = t;
        e.serial = m_nextSerial++;
        fresh.append(e);
    }
    if (fresh.isEmpty()) return 0;

    const int oldSize = m_entries.size();
    at = qBound(0, at, oldSize);
    for (int i = 0; i < fresh.size(); ++i)
        m_entries.insert(at + i, fresh[i]);

    // Past-the-end cursor picks up the first new entry when appending
    // at the end; any other insert at or before the cursor shifts it.
    if (at < m_cursor || (at == m_cursor && m_cursor < oldSize))
        m_cursor += fresh.size();

    if (m_mode == PlaybackMode::Shuffle) {
        const quint64 current = (m_cursor < m_entries.size())
                                    ? m_entries[m_cursor].serial : 0;
        auto* rng = QRandomGenerator::global();
        int nextSlot = 0;
        for (const QueueEntry& e : fresh) {
            if (e.serial == current) continue;
            if (playNext) {
                m_shuffleOrder.insert(nextSlot++, e.serial);
            } else {
                // Random slot keeps the existing upcoming order stable
                int pos = rng->bounded(m_shuffleOrder.size() + 1);
                m_shuffleOrder.insert(pos, e.serial);
            }
        }
    }
    return fresh.size();
}

// ── Clear ───────────────────────────────────────────────────────────
void PlaybackQueue::clear()
{
    QMutexLocker lock(&m_mutex);
    m_entries.clear();
    m_keys.clear();
    m_shuffleOrder.clear();
    m_shuffleHistory.clear();
    m_cursor = 0;
    m_status = PlaybackStatus::Stopped;
    if (m_regionStart >= 0)
        m_regionStart = 0;
    qDebug() << "[Queue] Cleared";
}

// ── Mode / status / offset ──────────────────────────────────────────
void PlaybackQueue::setMode(PlaybackMode mode)
{
    QMutexLocker lock(&m_mutex);
    if (mode == m_mode) return;  // shuffle permutation stays fixed

    m_mode = mode;
    m_shuffleOrder.clear();
    m_shuffleHistory.clear();
    if (mode == PlaybackMode::Shuffle)
        rebuildShuffleOrderLocked();

    qDebug() << "[Queue] Mode:" << playbackModeName(mode)
             << "(" << m_shuffleOrder.size() << "shuffled upcoming)";
}

void PlaybackQueue::setStatus(PlaybackStatus status)
{
    QMutexLocker lock(&m_mutex);
    m_status = status;
}

bool PlaybackQueue::setOffset(qint64 ms)
{
    QMutexLocker lock(&m_mutex);
    if (m_cursor >= m_entries.size()) return false;
    m_entries[m_cursor].offsetMs = qMax<qint64>(0, ms);
    return true;
}

bool PlaybackQueue::restartCurrent()
{
    QMutexLocker lock(&m_mutex);
    if (m_cursor >= m_entries.size()) return false;
    m_entries[m_cursor].offsetMs = 0;
    return true;
}

// ── Navigation ──────────────────────────────────────────────────────
PlaybackQueue::AdvanceResult PlaybackQueue::advance()
{
    QMutexLocker lock(&m_mutex);
    return advanceLocked(false);
}

PlaybackQueue::AdvanceResult PlaybackQueue::markCurrentFailedAndSkip()
{
    QMutexLocker lock(&m_mutex);
    if (m_entries.isEmpty()) return AdvanceResult::QueueEmpty;
    if (m_cursor < m_entries.size()) {
        m_entries[m_cursor].failed = true;
        qWarning() << "[Queue] Playback failed, skipping:"
                   << m_entries[m_cursor].track.title;
    }
    return advanceLocked(true);
}

PlaybackQueue::AdvanceResult PlaybackQueue::advanceLocked(bool bypassRepeatOne)
{
    if (m_entries.isEmpty()) return AdvanceResult::QueueEmpty;
    const int size = m_entries.size();

    switch (m_mode) {
    case PlaybackMode::RepeatOne:
        if (!bypassRepeatOne) {
            if (m_cursor >= size) return AdvanceResult::EndOfQueue;
            m_entries[m_cursor].offsetMs = 0;
            return AdvanceResult::RepeatedOne;
        }
        // Forced skip behaves like linear
        Q_FALLTHROUGH();
    case PlaybackMode::Linear:
        if (m_cursor < size)
            ++m_cursor;
        if (m_cursor >= size) {
            m_status = PlaybackStatus::Stopped;
            return AdvanceResult::EndOfQueue;
        }
        resetActiveOffsetLocked();
        return AdvanceResult::Advanced;

    case PlaybackMode::RepeatAll: {
        int next = m_cursor + 1;
        while (next < size && m_entries[next].failed)
            ++next;
        if (next < size) {
            m_cursor = next;
            resetActiveOffsetLocked();
            return AdvanceResult::Advanced;
        }
        const int first = firstPlayableIndexLocked();
        if (first < 0) {
            m_cursor = size;
            m_status = PlaybackStatus::Stopped;
            return AdvanceResult::EndOfQueue;
        }
        m_cursor = first;
        resetActiveOffsetLocked();
        qDebug() << "[Queue] Repeat all: wrapped to" << first;
        return AdvanceResult::Wrapped;
    }

    case PlaybackMode::Shuffle:
        if (m_cursor < size)
            m_shuffleHistory.append(m_entries[m_cursor].serial);
        while (!m_shuffleOrder.isEmpty()) {
            int idx = indexOfSerialLocked(m_shuffleOrder.takeFirst());
            if (idx < 0) continue;
            m_cursor = idx;
            resetActiveOffsetLocked();
            return AdvanceResult::Advanced;
        }
        m_cursor = size;
        m_status = PlaybackStatus::Stopped;
        return AdvanceResult::EndOfQueue;
    }
    return AdvanceResult::EndOfQueue;
}

PlaybackQueue::RewindResult PlaybackQueue::rewind()
{
    QMutexLocker lock(&m_mutex);
    if (m_entries.isEmpty()) return RewindResult::QueueEmpty;
    const int size = m_entries.size();

    // Deep into the current track: the first rewind restarts it
    if (m_cursor < size && m_entries[m_cursor].offsetMs > m_rewindRestartMs) {
        m_entries[m_cursor].offsetMs = 0;
        return RewindResult::Restarted;
    }

    if (m_mode == PlaybackMode::Shuffle) {
        while (!m_shuffleHistory.isEmpty()) {
            int idx = indexOfSerialLocked(m_shuffleHistory.takeLast());
            if (idx < 0) continue;
            if (m_cursor < size)
                m_shuffleOrder.prepend(m_entries[m_cursor].serial);
            m_cursor = idx;
            resetActiveOffsetLocked();
            return RewindResult::MovedBack;
        }
        if (m_cursor >= size) {
            // Nothing in history but past the end: fall back to last entry
            m_cursor = size - 1;
            resetActiveOffsetLocked();
            return RewindResult::MovedBack;
        }
        resetActiveOffsetLocked();
        return RewindResult::AtStart;
    }

    if (m_cursor == 0) {
        resetActiveOffsetLocked();
        return RewindResult::AtStart;
    }
    --m_cursor;
    resetActiveOffsetLocked();
    return RewindResult::MovedBack;
}

// ── Reads ───────────────────────────────────────────────────────────
PlaybackQueue::Current PlaybackQueue::currentEntry() const
{
    QMutexLocker lock(&m_mutex);
    Current c;
    if (m_entries.isEmpty()) {
        c.state = Current::QueueEmpty;
    } else if (m_cursor >= m_entries.size()) {
        c.state = Current::Exhausted;
    } else {
        c.state = Current::Active;
        c.entry = m_entries.at(m_cursor);
        c.index = m_cursor;
    }
    return c;
}

QVector<QueueEntry> PlaybackQueue::peekUpcoming(int n) const
{
    QMutexLocker lock(&m_mutex);
    QVector<QueueEntry> result;
    const int size = m_entries.size();
    if (n <= 0 || size == 0) return result;

    switch (m_mode) {
    case PlaybackMode::RepeatOne:
        if (m_cursor < size)
            result.append(m_entries.at(m_cursor));
        break;
    case PlaybackMode::Linear:
        for (int i = m_cursor + 1; i < size && result.size() < n; ++i)
            result.append(m_entries.at(i));
        break;
    case PlaybackMode::RepeatAll: {
        int i = (m_cursor < size) ? m_cursor + 1 : 0;
        for (int steps = 0; steps < size && result.size() < n; ++steps, ++i) {
            const QueueEntry& e = m_entries.at(i % size);
            if (!e.failed)
                result.append(e);
        }
        break;
    }
    case PlaybackMode::Shuffle:
        for (quint64 serial : m_shuffleOrder) {
            if (result.size() >= n) break;
            int idx = indexOfSerialLocked(serial);
            if (idx >= 0)
                result.append(m_entries.at(idx));
        }
        break;
    }
    return result;
}

PlaybackQueue::Snapshot PlaybackQueue::snapshot() const
{
    QMutexLocker lock(&m_mutex);
    Snapshot s;
    s.entries = m_entries;
    s.cursor = m_cursor;
    s.mode = m_mode;
    s.status = m_status;
    s.shuffleOrder = m_shuffleOrder;
    return s;
}

int PlaybackQueue::size() const
{
    QMutexLocker lock(&m_mutex);
    return m_entries.size();
}

bool PlaybackQueue::isEmpty() const
{
    QMutexLocker lock(&m_mutex);
    return m_entries.isEmpty();
}

int PlaybackQueue::cursor() const
{
    QMutexLocker lock(&m_mutex);
    return m_cursor;
}

PlaybackMode PlaybackQueue::mode() const
{
    QMutexLocker lock(&m_mutex);
    return m_mode;
}

PlaybackStatus PlaybackQueue::status() const
{
    QMutexLocker lock(&m_mutex);
    return m_status;
}

// ── Options ─────────────────────────────────────────────────────────
void PlaybackQueue::setSkipDuplicates(bool enabled)
{
    QMutexLocker lock(&m_mutex);
    m_skipDuplicates = enabled;
}

void PlaybackQueue::setRewindRestartThreshold(qint64 ms)
{
    QMutexLocker lock(&m_mutex);
    m_rewindRestartMs = qMax<qint64>(0, ms);
}

qint64 PlaybackQueue::rewindRestartThreshold() const
{
    QMutexLocker lock(&m_mutex);
    return m_rewindRestartMs;
}

// ── Populator tickets ───────────────────────────────────────────────
quint64 PlaybackQueue::openPopulatorTicket()
{
    QMutexLocker lock(&m_mutex);
    if (m_liveTicket != 0) {
        qWarning() << "[Queue] Ticket" << m_liveTicket
                   << "still live while opening a new one, revoking it";
    }
    m_liveTicket = m_nextTicket++;
    m_regionStart = m_entries.size();
    qDebug() << "[Queue] Opened populator ticket" << m_liveTicket
             << "region starts at" << m_regionStart;
    return m_liveTicket;
}

PlaybackQueue::AppendResult PlaybackQueue::appendFromPopulator(quint64 ticket,
                                                               const Track& track)
{
    QMutexLocker lock(&m_mutex);
    if (ticket == 0 || ticket != m_liveTicket)
        return AppendResult::Rejected;
    const int added = insertLocked(QVector<Track>{track}, m_entries.size(), false);
    return added > 0 ? AppendResult::Appended : AppendResult::Duplicate;
}

void PlaybackQueue::revokePopulatorTicket(quint64 ticket)
{
    QMutexLocker lock(&m_mutex);
    if (ticket == 0 || ticket != m_liveTicket) return;
    m_liveTicket = 0;
    m_regionStart = -1;
    qDebug() << "[Queue] Revoked populator ticket" << ticket;
}

bool PlaybackQueue::isTicketLive(quint64 ticket) const
{
    QMutexLocker lock(&m_mutex);
    return ticket != 0 && ticket == m_liveTicket;
}

// ── Helpers (m_mutex held) ──────────────────────────────────────────
int PlaybackQueue::indexOfSerialLocked(quint64 serial) const
{
    for (int i = 0; i < m_entries.size(); ++i) {
        if (m_entries.at(i).serial == serial)
            return i;
    }
    return -1;
}

int PlaybackQueue::firstPlayableIndexLocked() const
{
    for (int i = 0; i < m_entries.size(); ++i) {
        if (!m_entries.at(i).failed)
            return i;
    }
    return -1;
}

void PlaybackQueue::rebuildShuffleOrderLocked()
{
    m_shuffleOrder.clear();
    for (int i = m_cursor + 1; i < m_entries.size(); ++i)
        m_shuffleOrder.append(m_entries.at(i).serial);
    // Fisher-Yates shuffle
    for (int i = m_shuffleOrder.size() - 1; i > 0; --i) {
        int j = QRandomGenerator::global()->bounded(i + 1);
        std::swap(m_shuffleOrder[i], m_shuffleOrder[j]);
    }
}

void PlaybackQueue::resetActiveOffsetLocked()
{
    if (m_cursor < m_entries.size())
        m_entries[m_cursor].offsetMs = 0;
}
