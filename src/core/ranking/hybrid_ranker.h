#pragma once

#include "core/ranking/scored_chunk.h"
#include "core/shared/search_result.h"

#include <QString>
#include <vector>

namespace hr {

struct FusedScore {
    int64_t chunkId = 0;
    double score = 0.0;
    SearchMethod method = SearchMethod::Hybrid;
    ScoreBreakdown breakdown;
};

struct RerankConfig {
    double exactTermWeight = 0.2;
    double technicalDensityWeight = 0.1;
    double lengthBonus = 0.1;
    int preferredMinLength = 200;
    int preferredMaxLength = 1500;
};

// HybridRanker fuses the lexical and semantic lists and applies the
// heuristic re-rank pass.
class HybridRanker {
public:
    explicit HybridRanker(const RerankConfig& config = {});

    // Each list is divided by its own maximum, then
    // score = alpha * semantic + (1 - alpha) * lexical with a missing side
    // counting as 0. Output is independent of input order.
    static std::vector<FusedScore> fuse(const std::vector<ScoredChunk>& lexical,
                                        const std::vector<ScoredChunk>& semantic,
                                        double alpha);

    // score *= 1 + (exact-term bonus + density bonus + length bonus), then
    // re-sort and truncate to topK. When any rescored value is not finite
    // the fused order is kept and only truncated; returns false in that case.
    bool rerank(const QString& query, std::vector<SearchResult>& results, int topK) const;

    // Fraction of whitespace-separated words containing a hydraulics term.
    static double technicalDensity(const QString& text);

    // Divides every score by the list maximum; no-op for an empty list or
    // a non-positive maximum.
    static std::vector<ScoredChunk> maxNormalize(const std::vector<ScoredChunk>& scores);

    const RerankConfig& config() const { return m_config; }

private:
    double rerankBonus(const QStringList& queryTerms, const QString& content) const;

    RerankConfig m_config;
};

} // namespace hr
