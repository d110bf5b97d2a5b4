#pragma once

#include "core/index/knowledge_store.h"
#include "core/ranking/scored_chunk.h"

#include <vector>

namespace hr {

// Cosine similarity between a query vector and the stored chunk vectors.
// Used when the vector index is unreachable, and directly by tests.
class SemanticScorer {
public:
    // Similarities at or below this are dropped.
    static constexpr double kMinSimilarity = 0.1;

    // dot(a, b) / (|a| * |b|); 0 when either norm is zero or the lengths
    // differ.
    static double cosineSimilarity(const std::vector<float>& a, const std::vector<float>& b);

    // Chunk-granular scores. Chunks with a missing, malformed or
    // differently sized vector are skipped. Sorted descending.
    std::vector<ScoredChunk> score(const std::vector<float>& queryVector,
                                   const std::vector<ChunkCandidate>& candidates) const;

    // Collapses chunk scores to one entry per document: the best chunk.
    static std::vector<ScoredChunk> bestChunkPerDocument(
        const std::vector<ScoredChunk>& scored,
        const std::vector<ChunkCandidate>& candidates);
};

} // namespace hr
