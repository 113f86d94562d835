#pragma once

#include <QStringList>
#include <QVector>
#include "../core/MusicData.h"

struct ResolveOutcome;

struct RankerOptions {
    double      threshold = 0.6;          // score >= threshold is kept
    double      dedupTolerance = 0.9;     // title and artist similarity for "same item"
    QStringList enableOrder;              // source ids, enable order
    QStringList priority;                 // explicit tie-break order, may be empty
    bool        preferHighBitrate = false;
};

struct ScoredCandidate {
    Track  track;
    double score = 0.0;
};

// One logical item: the representative track chosen among the
// candidates that dedup folded together, plus the rest.
struct RankedMatch {
    Track          track;
    double         score = 0.0;           // max member score
    QVector<Track> alternates;
};

struct RankOutcome {
    MatchStatus          status = MatchStatus::NotFound;
    QVector<RankedMatch> matches;         // descending score

    bool isFound() const { return status == MatchStatus::Found; }
};

// Scores normalized candidates against the spoken query, drops those
// under the threshold and folds the same logical item from several
// sources into one match.
class MatchRanker {
public:
    explicit MatchRanker(const RankerOptions& options = {});

    const RankerOptions& options() const { return m_options; }

    RankOutcome rank(QueryType type, const QString& text, const ResolveOutcome& resolved) const;
    // Top match only; status mirrors rank().
    RankOutcome best(QueryType type, const QString& text, const ResolveOutcome& resolved) const;

    // Ranking over already scored candidates (input order = first-seen order).
    RankOutcome rankScored(const QVector<ScoredCandidate>& scored, bool anySourceAnswered) const;

    // ── Matching primitives ──────────────────────────────────────
    // Lower-case, punctuation stripped, whitespace collapsed, leading "the " dropped.
    static QString normalizeForMatch(const QString& s);
    // Ratcliff/Obershelp 2*M/T over the raw strings.
    static double ratio(const QString& a, const QString& b);
    // Query similarity: 1.0 on exact normalized match, ratio plus a 0.2
    // prefix boost otherwise, capped at 1.0.
    static double similarity(const QString& query, const QString& value);
    static QString matchField(const Track& track, QueryType type);

private:
    double sameItemCloseness(const Track& a, const Track& b) const;
    bool preferred(const Track& a, int aInput, const Track& b, int bInput) const;
    static int rankIn(const QStringList& order, const QString& id);

    RankerOptions m_options;
};
