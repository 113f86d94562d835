#include <QtTest/QtTest>
#include <QThread>
#include <memory>
#include "core/PlaybackQueue.h"

static Track makeTrack(const QString& id, const QString& title = {})
{
    Track t;
    t.id = id;
    t.title = title.isEmpty() ? id : title;
    t.artist = QStringLiteral("Artist");
    t.album = QStringLiteral("Album");
    t.sourceId = QStringLiteral("navidrome");
    return t;
}

static QVector<Track> makeTracks(int count, const QString& prefix = {})
{
    QVector<Track> v;
    for (int i = 1; i <= count; ++i)
        v.append(makeTrack(prefix + QString::number(i)));
    return v;
}

static QStringList ids(const QVector<QueueEntry>& entries)
{
    QStringList out;
    for (const QueueEntry& e : entries)
        out << e.track.id;
    return out;
}

static QString currentId(const PlaybackQueue& q)
{
    return q.currentEntry().entry.track.id;
}

class tst_PlaybackQueue : public QObject {
    Q_OBJECT

private slots:
    // ── Enqueue ──────────────────────────────────────────────────
    void enqueue_firstEntryBecomesCurrent()
    {
        PlaybackQueue q;
        QCOMPARE(q.enqueue(makeTracks(5)), 5);
        QCOMPARE(q.size(), 5);
        QCOMPARE(q.cursor(), 0);
        QVERIFY(q.currentEntry().isActive());
        QCOMPARE(currentId(q), QStringLiteral("1"));
    }

    void enqueue_skipsInvalidTracks()
    {
        PlaybackQueue q;
        QCOMPARE(q.enqueue(QVector<Track>{makeTrack("a"), Track(), makeTrack("b")}), 2);
        QCOMPARE(q.size(), 2);
    }

    void enqueueNext_insertsAfterCursor()
    {
        PlaybackQueue q;
        q.enqueue(makeTracks(3));                       // [1*, 2, 3]
        q.enqueueNext({makeTrack("X"), makeTrack("Y")});
        QCOMPARE(ids(q.snapshot().entries),
                 QStringList({"1", "X", "Y", "2", "3"}));
        QCOMPARE(currentId(q), QStringLiteral("1"));
        QCOMPARE(q.advance(), PlaybackQueue::AdvanceResult::Advanced);
        QCOMPARE(currentId(q), QStringLiteral("X"));
    }

    void enqueue_serialsStableAcrossInserts()
    {
        PlaybackQueue q;
        q.enqueue(makeTracks(3));
        const quint64 serialOf3 = q.snapshot().entries.at(2).serial;
        q.enqueueNext({makeTrack("X")});
        const auto entries = q.snapshot().entries;
        QCOMPARE(entries.at(3).track.id, QStringLiteral("3"));
        QCOMPARE(entries.at(3).serial, serialOf3);
    }

    void enqueue_afterExhaustion_resumesAtNewEntry()
    {
        PlaybackQueue q;
        q.enqueue(makeTracks(2));
        q.advance();
        QCOMPARE(q.advance(), PlaybackQueue::AdvanceResult::EndOfQueue);
        QCOMPARE(q.currentEntry().state, PlaybackQueue::Current::Exhausted);
        q.enqueue(makeTrack("3"));
        QCOMPARE(currentId(q), QStringLiteral("3"));
    }

    void enqueue_duplicatesSuppressed()
    {
        PlaybackQueue q;
        q.enqueue(makeTrack("a", "Song"));
        QCOMPARE(q.enqueue(makeTrack("b", "song ")), 0);
        QCOMPARE(q.size(), 1);

        q.setSkipDuplicates(false);
        QCOMPARE(q.enqueue(makeTrack("c", "Song")), 1);
        QCOMPARE(q.size(), 2);
    }

    void clear_resetsEverything()
    {
        PlaybackQueue q;
        q.enqueue(makeTracks(4));
        q.advance();
        q.setStatus(PlaybackStatus::Playing);
        q.clear();
        QVERIFY(q.isEmpty());
        QCOMPARE(q.cursor(), 0);
        QCOMPARE(q.status(), PlaybackStatus::Stopped);
        QCOMPARE(q.currentEntry().state, PlaybackQueue::Current::QueueEmpty);
        // Keys are gone too
        QCOMPARE(q.enqueue(makeTracks(4)), 4);
    }

    // ── Empty queue ──────────────────────────────────────────────
    void emptyQueue_reportsQueueEmpty()
    {
        PlaybackQueue q;
        QCOMPARE(q.advance(), PlaybackQueue::AdvanceResult::QueueEmpty);
        QCOMPARE(q.rewind(), PlaybackQueue::RewindResult::QueueEmpty);
        QCOMPARE(q.markCurrentFailedAndSkip(), PlaybackQueue::AdvanceResult::QueueEmpty);
        QCOMPARE(q.currentEntry().state, PlaybackQueue::Current::QueueEmpty);
        QVERIFY(q.peekUpcoming(3).isEmpty());
        QVERIFY(!q.setOffset(1000));
        QVERIFY(!q.restartCurrent());

        q.setMode(PlaybackMode::Shuffle);
        QCOMPARE(q.advance(), PlaybackQueue::AdvanceResult::QueueEmpty);
        QCOMPARE(q.rewind(), PlaybackQueue::RewindResult::QueueEmpty);
    }

    // ── Linear ───────────────────────────────────────────────────
    void advance_linear_stopsPastTheEnd()
    {
        PlaybackQueue q;
        q.enqueue(makeTracks(3));
        q.setStatus(PlaybackStatus::Playing);
        QCOMPARE(q.advance(), PlaybackQueue::AdvanceResult::Advanced);
        QCOMPARE(q.advance(), PlaybackQueue::AdvanceResult::Advanced);
        QCOMPARE(currentId(q), QStringLiteral("3"));
        QCOMPARE(q.advance(), PlaybackQueue::AdvanceResult::EndOfQueue);
        QCOMPARE(q.cursor(), 3);
        QCOMPARE(q.status(), PlaybackStatus::Stopped);
        QCOMPARE(q.advance(), PlaybackQueue::AdvanceResult::EndOfQueue);
        QCOMPARE(q.cursor(), 3);
    }

    void advance_resetsOffsetOfNewEntry()
    {
        PlaybackQueue q;
        q.enqueue(makeTracks(2));
        q.advance();
        QVERIFY(q.setOffset(9000));
        q.rewind();                     // restart
        q.rewind();                     // back to 1
        QCOMPARE(currentId(q), QStringLiteral("1"));
        QCOMPARE(q.currentEntry().entry.offsetMs, qint64(0));
    }

    // ── Repeat ───────────────────────────────────────────────────
    void advance_repeatOne_restartsSameEntry()
    {
        PlaybackQueue q;
        q.enqueue(makeTracks(3));
        q.setMode(PlaybackMode::RepeatOne);
        q.setOffset(1234);
        QCOMPARE(q.advance(), PlaybackQueue::AdvanceResult::RepeatedOne);
        QCOMPARE(currentId(q), QStringLiteral("1"));
        QCOMPARE(q.currentEntry().entry.offsetMs, qint64(0));
    }

    void advance_repeatAll_wraps()
    {
        PlaybackQueue q;
        q.enqueue(makeTracks(3));
        q.setMode(PlaybackMode::RepeatAll);
        q.advance();
        q.advance();
        QCOMPARE(q.advance(), PlaybackQueue::AdvanceResult::Wrapped);
        QCOMPARE(currentId(q), QStringLiteral("1"));
    }

    void advance_repeatAll_skipsFailedEntries()
    {
        PlaybackQueue q;
        q.enqueue(makeTracks(3));
        q.setMode(PlaybackMode::RepeatAll);
        q.advance();                                    // 2
        QCOMPARE(q.markCurrentFailedAndSkip(), PlaybackQueue::AdvanceResult::Advanced);
        QCOMPARE(currentId(q), QStringLiteral("3"));
        QCOMPARE(q.advance(), PlaybackQueue::AdvanceResult::Wrapped);
        QCOMPARE(currentId(q), QStringLiteral("1"));
        QCOMPARE(q.advance(), PlaybackQueue::AdvanceResult::Advanced);
        QCOMPARE(currentId(q), QStringLiteral("3"));
    }

    void markFailed_ignoresRepeatOne()
    {
        PlaybackQueue q;
        q.enqueue(makeTracks(2));
        q.setMode(PlaybackMode::RepeatOne);
        QCOMPARE(q.markCurrentFailedAndSkip(), PlaybackQueue::AdvanceResult::Advanced);
        QCOMPARE(currentId(q), QStringLiteral("2"));
        QVERIFY(q.snapshot().entries.at(0).failed);
    }

    // ── Rewind ───────────────────────────────────────────────────
    void rewind_deepIntoTrack_restarts()
    {
        PlaybackQueue q;
        q.enqueue(makeTracks(3));
        q.advance();
        q.setOffset(8000);
        QCOMPARE(q.rewind(), PlaybackQueue::RewindResult::Restarted);
        QCOMPARE(currentId(q), QStringLiteral("2"));
        QCOMPARE(q.currentEntry().entry.offsetMs, qint64(0));
    }

    void rewind_nearStart_movesBack()
    {
        PlaybackQueue q;
        q.enqueue(makeTracks(3));
        q.advance();
        q.setOffset(5000);              // not above the threshold
        QCOMPARE(q.rewind(), PlaybackQueue::RewindResult::MovedBack);
        QCOMPARE(currentId(q), QStringLiteral("1"));
    }

    void rewind_twiceStepsBackAfterRestart()
    {
        PlaybackQueue q;
        q.setRewindRestartThreshold(5000);
        q.enqueue(makeTracks(3));
        q.advance();
        q.setOffset(15000);
        QCOMPARE(q.rewind(), PlaybackQueue::RewindResult::Restarted);
        QCOMPARE(q.cursor(), 1);
        QCOMPARE(q.currentEntry().entry.offsetMs, qint64(0));

        QCOMPARE(q.rewind(), PlaybackQueue::RewindResult::MovedBack);
        QCOMPARE(q.cursor(), 0);
        QCOMPARE(currentId(q), QStringLiteral("1"));
    }

    void rewind_atStart_clamps()
    {
        PlaybackQueue q;
        q.enqueue(makeTracks(2));
        q.setOffset(100);
        QCOMPARE(q.rewind(), PlaybackQueue::RewindResult::AtStart);
        QCOMPARE(q.cursor(), 0);
        QCOMPARE(q.currentEntry().entry.offsetMs, qint64(0));
    }

    void rewind_customThreshold()
    {
        PlaybackQueue q;
        q.setRewindRestartThreshold(1000);
        q.enqueue(makeTracks(2));
        q.advance();
        q.setOffset(1500);
        QCOMPARE(q.rewind(), PlaybackQueue::RewindResult::Restarted);
    }

    void restartCurrent_resetsOffset()
    {
        PlaybackQueue q;
        q.enqueue(makeTracks(2));
        q.setOffset(42000);
        QVERIFY(q.restartCurrent());
        QCOMPARE(q.currentEntry().entry.offsetMs, qint64(0));
        QCOMPARE(q.cursor(), 0);
    }

    // ── Peek ─────────────────────────────────────────────────────
    void peek_linear()
    {
        PlaybackQueue q;
        q.enqueue(makeTracks(5));
        QCOMPARE(ids(q.peekUpcoming(2)), QStringList({"2", "3"}));
        QCOMPARE(ids(q.peekUpcoming(10)), QStringList({"2", "3", "4", "5"}));
    }

    void peek_repeatAll_wraps()
    {
        PlaybackQueue q;
        q.enqueue(makeTracks(3));
        q.setMode(PlaybackMode::RepeatAll);
        q.advance();
        q.advance();
        QCOMPARE(ids(q.peekUpcoming(2)), QStringList({"1", "2"}));
    }

    void peek_repeatOne_returnsCurrent()
    {
        PlaybackQueue q;
        q.enqueue(makeTracks(3));
        q.setMode(PlaybackMode::RepeatOne);
        QCOMPARE(ids(q.peekUpcoming(3)), QStringList({"1"}));
    }

    // ── Shuffle ──────────────────────────────────────────────────
    void shuffle_visitsEveryEntryOnce()
    {
        PlaybackQueue q;
        q.enqueue(makeTracks(6));
        q.setMode(PlaybackMode::Shuffle);

        QStringList visited{currentId(q)};
        for (int i = 0; i < 5; ++i) {
            QCOMPARE(q.advance(), PlaybackQueue::AdvanceResult::Advanced);
            visited << currentId(q);
        }
        QCOMPARE(QSet<QString>(visited.begin(), visited.end()).size(), 6);
        QCOMPARE(q.advance(), PlaybackQueue::AdvanceResult::EndOfQueue);
    }

    void shuffle_peekMatchesAdvance()
    {
        PlaybackQueue q;
        q.enqueue(makeTracks(8));
        q.setMode(PlaybackMode::Shuffle);
        const QStringList upcoming = ids(q.peekUpcoming(7));
        QCOMPARE(upcoming.size(), 7);
        for (const QString& expected : upcoming) {
            q.advance();
            QCOMPARE(currentId(q), expected);
        }
    }

    void shuffle_appendedEntriesJoinUpcomingOnly()
    {
        PlaybackQueue q;
        q.enqueue(makeTracks(4));
        q.setMode(PlaybackMode::Shuffle);
        q.advance();
        q.advance();
        const QStringList before = ids(q.peekUpcoming(10));

        q.enqueue(makeTracks(3, QStringLiteral("n")));
        const QStringList after = ids(q.peekUpcoming(10));
        QCOMPARE(after.size(), before.size() + 3);

        // Existing upcoming entries keep their relative order
        QStringList filtered;
        for (const QString& id : after) {
            if (before.contains(id))
                filtered << id;
        }
        QCOMPARE(filtered, before);

        // Played entries never come back
        QSet<QString> played;
        played.insert(currentId(q));
        while (q.advance() == PlaybackQueue::AdvanceResult::Advanced) {
            QVERIFY(!played.contains(currentId(q)));
            played.insert(currentId(q));
        }
        QCOMPARE(played.size(), 1 + after.size());
    }

    void shuffle_enqueueNextPlaysNext()
    {
        PlaybackQueue q;
        q.enqueue(makeTracks(10));
        q.setMode(PlaybackMode::Shuffle);
        q.enqueueNext({makeTrack("X")});
        q.advance();
        QCOMPARE(currentId(q), QStringLiteral("X"));
    }

    void shuffle_rewindWalksHistory()
    {
        PlaybackQueue q;
        q.enqueue(makeTracks(5));
        q.setMode(PlaybackMode::Shuffle);
        const QString first = currentId(q);
        q.advance();
        const QString second = currentId(q);

        QCOMPARE(q.rewind(), PlaybackQueue::RewindResult::MovedBack);
        QCOMPARE(currentId(q), first);
        QCOMPARE(ids(q.peekUpcoming(1)), QStringList({second}));

        QCOMPARE(q.rewind(), PlaybackQueue::RewindResult::AtStart);
        QCOMPARE(currentId(q), first);
    }

    // ── Populator tickets ────────────────────────────────────────
    void ticket_foregroundLandsBeforePopulatorRegion()
    {
        PlaybackQueue q;
        q.enqueue(makeTracks(2));
        const quint64 ticket = q.openPopulatorTicket();
        QCOMPARE(q.appendFromPopulator(ticket, makeTrack("P1")),
                 PlaybackQueue::AppendResult::Appended);
        q.enqueue(makeTrack("F1"));
        QCOMPARE(q.appendFromPopulator(ticket, makeTrack("P2")),
                 PlaybackQueue::AppendResult::Appended);
        q.enqueue(makeTrack("F2"));

        QCOMPARE(ids(q.snapshot().entries),
                 QStringList({"1", "2", "F1", "F2", "P1", "P2"}));

        q.revokePopulatorTicket(ticket);
        q.enqueue(makeTrack("F3"));
        QCOMPARE(ids(q.snapshot().entries).last(), QStringLiteral("F3"));
    }

    void ticket_revokedRejectsAppends()
    {
        PlaybackQueue q;
        const quint64 ticket = q.openPopulatorTicket();
        QVERIFY(q.isTicketLive(ticket));
        q.revokePopulatorTicket(ticket);
        QVERIFY(!q.isTicketLive(ticket));
        QCOMPARE(q.appendFromPopulator(ticket, makeTrack("late")),
                 PlaybackQueue::AppendResult::Rejected);
        QVERIFY(q.isEmpty());
    }

    void ticket_supersededTicketRejected()
    {
        PlaybackQueue q;
        const quint64 first = q.openPopulatorTicket();
        const quint64 second = q.openPopulatorTicket();
        QVERIFY(first != second);
        QCOMPARE(q.appendFromPopulator(first, makeTrack("a")),
                 PlaybackQueue::AppendResult::Rejected);
        QCOMPARE(q.appendFromPopulator(second, makeTrack("b")),
                 PlaybackQueue::AppendResult::Appended);
        QCOMPARE(q.appendFromPopulator(second, makeTrack("c", "b")),
                 PlaybackQueue::AppendResult::Duplicate);
        QCOMPARE(q.appendFromPopulator(0, makeTrack("d")),
                 PlaybackQueue::AppendResult::Rejected);
    }

    // ── Concurrency ──────────────────────────────────────────────
    void concurrent_appendAndNavigate()
    {
        PlaybackQueue q;
        q.setMode(PlaybackMode::RepeatAll);
        q.enqueue(makeTracks(3, QStringLiteral("f")));
        const quint64 ticket = q.openPopulatorTicket();

        std::unique_ptr<QThread> writer(QThread::create([&q, ticket] {
            for (int i = 0; i < 500; ++i)
                q.appendFromPopulator(ticket, makeTrack(QStringLiteral("p%1").arg(i)));
        }));
        writer->start();
        for (int i = 0; i < 500; ++i) {
            q.advance();
            q.peekUpcoming(5);
            QVERIFY(q.cursor() <= q.size());
        }
        QVERIFY(writer->wait(10000));
        QCOMPARE(q.size(), 503);
    }
};

QTEST_MAIN(tst_PlaybackQueue)
#include "tst_PlaybackQueue.moc"
