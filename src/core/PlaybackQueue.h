#pragma once
#include <QMutex>
#include <QSet>
#include <QVector>
#include "MusicData.h"

// Ordered play queue shared between the request thread and the background
// populator.  Every public method takes m_mutex; readers get copies.
//
// Cursor is always within [0, size()].  cursor == size() is the
// past-the-end state ("queue exhausted").
class PlaybackQueue {
public:
    enum class Position { Tail, Next };
    enum class AdvanceResult { Advanced, RepeatedOne, Wrapped, EndOfQueue, QueueEmpty };
    enum class RewindResult { MovedBack, Restarted, AtStart, QueueEmpty };
    enum class AppendResult { Appended, Duplicate, Rejected };

    struct Current {
        enum State { Active, QueueEmpty, Exhausted };
        State state = QueueEmpty;
        QueueEntry entry;
        int index = -1;

        bool isActive() const { return state == Active; }
    };

    struct Snapshot {
        QVector<QueueEntry> entries;
        int cursor = 0;
        PlaybackMode mode = PlaybackMode::Linear;
        PlaybackStatus status = PlaybackStatus::Stopped;
        QVector<quint64> shuffleOrder;   // upcoming serials, shuffle mode only
    };

    PlaybackQueue() = default;
    PlaybackQueue(const PlaybackQueue&) = delete;
    PlaybackQueue& operator=(const PlaybackQueue&) = delete;

    // Mutation
    int enqueue(const QVector<Track>& tracks, Position position = Position::Tail);
    int enqueue(const Track& track, Position position = Position::Tail);
    int enqueueNext(const QVector<Track>& tracks) { return enqueue(tracks, Position::Next); }
    void clear();
    void setMode(PlaybackMode mode);
    void setStatus(PlaybackStatus status);
    bool setOffset(qint64 ms);
    bool restartCurrent();

    // Navigation
    AdvanceResult advance();
    RewindResult rewind();
    // Playback of the current entry failed: flag it and move on, ignoring repeat-one.
    AdvanceResult markCurrentFailedAndSkip();

    // Snapshot reads
    Current currentEntry() const;
    QVector<QueueEntry> peekUpcoming(int n) const;
    Snapshot snapshot() const;
    int size() const;
    bool isEmpty() const;
    int cursor() const;
    PlaybackMode mode() const;
    PlaybackStatus status() const;

    // Options
    void setSkipDuplicates(bool enabled);
    void setRewindRestartThreshold(qint64 ms);
    qint64 rewindRestartThreshold() const;

    // Populator tickets. At most one is live at a time.  While it is live,
    // foreground tail enqueues land before the populator's region.
    quint64 openPopulatorTicket();
    AppendResult appendFromPopulator(quint64 ticket, const Track& track);
    void revokePopulatorTicket(quint64 ticket);
    bool isTicketLive(quint64 ticket) const;

private:
    int insertLocked(const QVector<Track>& tracks, int at, bool playNext);
    AdvanceResult advanceLocked(bool bypassRepeatOne);
    int indexOfSerialLocked(quint64 serial) const;
    int firstPlayableIndexLocked() const;
    void rebuildShuffleOrderLocked();
    void resetActiveOffsetLocked();

    mutable QMutex m_mutex;
    QVector<QueueEntry> m_entries;
    QSet<QString> m_keys;                // duplicate keys of m_entries
    QVector<quint64> m_shuffleOrder;     // upcoming, shuffle mode only
    QVector<quint64> m_shuffleHistory;   // played, most recent last
    int m_cursor = 0;
    PlaybackMode m_mode = PlaybackMode::Linear;
    PlaybackStatus m_status = PlaybackStatus::Stopped;
    quint64 m_nextSerial = 1;
    bool m_skipDuplicates = true;
    qint64 m_rewindRestartMs = 5000;

    quint64 m_liveTicket = 0;            // 0 = none
    quint64 m_nextTicket = 1;
    int m_regionStart = -1;              // first index owned by the live ticket
};
