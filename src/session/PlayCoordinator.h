#pragma once

#include <QVector>
#include <memory>
#include "../core/MusicData.h"
#include "../sources/MatchRanker.h"

class PlaybackQueue;
class SessionSupervisor;
class TrackResolver;

struct CoordinatorOptions {
    int songCount = 50;   // target length of a generated play list
    int headSlice = 2;    // tracks resolved before returning
};

struct PlayResult {
    MatchStatus       status = MatchStatus::NotFound;
    QVector<Track>    headSlice;    // enqueued synchronously, playback starts here
    QVector<TrackRef> remainder;    // handed to the background populator
    RankedMatch       match;
    bool              hasMatch = false;

    bool isFound() const { return status == MatchStatus::Found; }
};

// Entry point of the intent layer: turns a spoken request into a queue
// whose head is playable when the call returns and whose tail is filled
// in the background.
class PlayCoordinator {
public:
    PlayCoordinator(std::shared_ptr<PlaybackQueue> queue,
                    std::shared_ptr<TrackResolver> resolver,
                    std::shared_ptr<SessionSupervisor> supervisor,
                    const MatchRanker& ranker,
                    const CoordinatorOptions& options = {});

    PlayResult resolveAndEnqueue(QueryType type, const QString& text, PlaybackMode mode);
    PlayResult playRandom(PlaybackMode mode);
    PlayResult playFavourites(PlaybackMode mode);

    // Ranked list without touching the queue.
    RankOutcome search(QueryType type, const QString& text) const;

    const CoordinatorOptions& options() const { return m_options; }

private:
    QVector<TrackRef> refsFor(QueryType type, const RankOutcome& ranked) const;
    QVector<TrackRef> interleave(const QVector<QVector<TrackRef>>& perSource, int limit) const;
    void fillWithRandom(QVector<TrackRef>* refs) const;
    PlayResult startInterleaved(const QVector<QVector<TrackRef>>& perSource, bool anyAnswered,
                                PlaybackMode mode);
    PlayResult start(QVector<TrackRef> refs, PlaybackMode mode, PlayResult result);

    std::shared_ptr<PlaybackQueue> m_queue;
    std::shared_ptr<TrackResolver> m_resolver;
    std::shared_ptr<SessionSupervisor> m_supervisor;
    MatchRanker m_ranker;
    CoordinatorOptions m_options;
};
