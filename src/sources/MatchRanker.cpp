#include "MatchRanker.h"
#include "TrackResolver.h"

#include <QDebug>
#include <algorithm>

MatchRanker::MatchRanker(const RankerOptions& options)
    : m_options(options)
{
}

// ── Matching primitives ─────────────────────────────────────────────
QString MatchRanker::normalizeForMatch(const QString& s)
{
    QString out;
    out.reserve(s.size());
    bool pendingSpace = false;
    for (const QChar c : s.toLower()) {
        if (c.isSpace()) {
            pendingSpace = !out.isEmpty();
            continue;
        }
        if (c.isPunct() || c.isSymbol())
            continue;
        if (pendingSpace) {
            out.append(QLatin1Char(' '));
            pendingSpace = false;
        }
        out.append(c);
    }
    if (out.startsWith(QLatin1String("the ")))
        out.remove(0, 4);
    return out;
}

namespace {

struct Block {
    int a = 0;
    int b = 0;
    int size = 0;
};

// Longest common substring of a[alo, ahi) and b[blo, bhi).  Ties resolve
// to the earliest position in a, then in b.
Block longestMatch(const QString& a, int alo, int ahi, const QString& b, int blo, int bhi)
{
    Block best{alo, blo, 0};
    QVector<int> prev(bhi - blo + 1, 0);
    QVector<int> cur(bhi - blo + 1, 0);
    for (int i = alo; i < ahi; ++i) {
        for (int j = blo; j < bhi; ++j) {
            const int k = j - blo + 1;
            if (a.at(i) == b.at(j)) {
                cur[k] = prev[k - 1] + 1;
                if (cur[k] > best.size) {
                    best.size = cur[k];
                    best.a = i - cur[k] + 1;
                    best.b = j - cur[k] + 1;
                }
            } else {
                cur[k] = 0;
            }
        }
        std::swap(prev, cur);
    }
    return best;
}

} // namespace

double MatchRanker::ratio(const QString& a, const QString& b)
{
    const int total = a.size() + b.size();
    if (total == 0)
        return 1.0;

    int matched = 0;
    struct Range { int alo, ahi, blo, bhi; };
    QVector<Range> pending{{0, int(a.size()), 0, int(b.size())}};
    while (!pending.isEmpty()) {
        const Range r = pending.takeLast();
        const Block m = longestMatch(a, r.alo, r.ahi, b, r.blo, r.bhi);
        if (m.size == 0)
            continue;
        matched += m.size;
        if (r.alo < m.a && r.blo < m.b)
            pending.append({r.alo, m.a, r.blo, m.b});
        if (m.a + m.size < r.ahi && m.b + m.size < r.bhi)
            pending.append({m.a + m.size, r.ahi, m.b + m.size, r.bhi});
    }
    return 2.0 * matched / total;
}

double MatchRanker::similarity(const QString& query, const QString& value)
{
    const QString q = normalizeForMatch(query);
    const QString v = normalizeForMatch(value);
    if (q.isEmpty() || v.isEmpty())
        return 0.0;
    if (q == v)
        return 1.0;

    double score = ratio(q, v);
    if (v.startsWith(q) || q.startsWith(v))
        score += 0.2;
    return std::min(score, 1.0);
}

QString MatchRanker::matchField(const Track& track, QueryType type)
{
    switch (type) {
    case QueryType::Artist: return track.artist.isEmpty() ? track.title : track.artist;
    case QueryType::Album:  return track.album.isEmpty() ? track.title : track.album;
    case QueryType::Genre:  return track.genre.isEmpty() ? track.title : track.genre;
    case QueryType::Track:
    case QueryType::Playlist:
        break;
    }
    return track.title;
}

// ── Ranking ─────────────────────────────────────────────────────────
int MatchRanker::rankIn(const QStringList& order, const QString& id)
{
    const int i = order.indexOf(id);
    return i < 0 ? order.size() : i;
}

// Combined title and artist ratio, or -1 when the two are different items.
double MatchRanker::sameItemCloseness(const Track& a, const Track& b) const
{
    const double tol = m_options.dedupTolerance;
    const double title = ratio(normalizeForMatch(a.title), normalizeForMatch(b.title));
    const double artist = ratio(normalizeForMatch(a.artist), normalizeForMatch(b.artist));
    if (title < tol || artist < tol)
        return -1.0;
    return title + artist;
}

// True when a should represent a group in place of b.
bool MatchRanker::preferred(const Track& a, int aInput, const Track& b, int bInput) const
{
    if (!m_options.priority.isEmpty()) {
        const int pa = rankIn(m_options.priority, a.sourceId);
        const int pb = rankIn(m_options.priority, b.sourceId);
        if (pa != pb)
            return pa < pb;
    }
    if (m_options.preferHighBitrate && a.bitrate != b.bitrate)
        return a.bitrate > b.bitrate;

    const int ea = rankIn(m_options.enableOrder, a.sourceId);
    const int eb = rankIn(m_options.enableOrder, b.sourceId);
    if (ea != eb)
        return ea < eb;
    return aInput < bInput;
}

RankOutcome MatchRanker::rankScored(const QVector<ScoredCandidate>& scored,
                                    bool anySourceAnswered) const
{
    RankOutcome outcome;
    if (!anySourceAnswered) {
        outcome.status = MatchStatus::AllSourcesUnreachable;
        return outcome;
    }

    struct Group {
        QVector<int> members;       // indexes into scored
        int          representative = -1;
        double       score = 0.0;
    };
    QVector<Group> groups;

    for (int i = 0; i < scored.size(); ++i) {
        const ScoredCandidate& c = scored[i];
        if (c.score < m_options.threshold)
            continue;

        // A choice set holds one version per backend, so two tracks of the
        // same backend are always different items.  Among the groups left,
        // the closest one wins.
        Group* home = nullptr;
        double homeCloseness = -1.0;
        for (Group& g : groups) {
            const bool sourceTaken = std::any_of(g.members.cbegin(), g.members.cend(), [&](int m) {
                return scored[m].track.sourceId == c.track.sourceId;
            });
            if (sourceTaken)
                continue;
            const double closeness = sameItemCloseness(scored[g.members.first()].track, c.track);
            if (closeness > homeCloseness) {
                home = &g;
                homeCloseness = closeness;
            }
        }
        if (!home) {
            groups.append(Group{});
            home = &groups.last();
        }

        home->members.append(i);
        home->score = std::max(home->score, c.score);
        if (home->representative < 0
            || preferred(c.track, i, scored[home->representative].track, home->representative))
            home->representative = i;
    }

    std::stable_sort(groups.begin(), groups.end(), [](const Group& l, const Group& r) {
        return l.score > r.score;
    });

    for (const Group& g : groups) {
        RankedMatch m;
        m.track = scored[g.representative].track;
        m.score = g.score;
        for (int idx : g.members) {
            if (idx != g.representative)
                m.alternates.append(scored[idx].track);
        }
        outcome.matches.append(m);
    }

    outcome.status = outcome.matches.isEmpty() ? MatchStatus::NotFound : MatchStatus::Found;
    return outcome;
}

RankOutcome MatchRanker::rank(QueryType type, const QString& text,
                              const ResolveOutcome& resolved) const
{
    QVector<ScoredCandidate> scored;
    scored.reserve(resolved.candidates.size());
    for (const Track& t : resolved.candidates)
        scored.append({t, similarity(text, matchField(t, type))});

    RankOutcome outcome = rankScored(scored, resolved.anyAnswered());
    if (outcome.isFound()) {
        const RankedMatch& top = outcome.matches.first();
        qDebug() << "[Ranker]" << text << "->" << top.track.title << "by" << top.track.artist
                 << "from" << top.track.sourceId << "score" << top.score
                 << "(" << outcome.matches.size() << "matches)";
    } else {
        qInfo() << "[Ranker]" << queryTypeName(type) << text << "->" << matchStatusName(outcome.status);
    }
    return outcome;
}

RankOutcome MatchRanker::best(QueryType type, const QString& text,
                              const ResolveOutcome& resolved) const
{
    RankOutcome outcome = rank(type, text, resolved);
    if (outcome.matches.size() > 1)
        outcome.matches.resize(1);
    return outcome;
}
