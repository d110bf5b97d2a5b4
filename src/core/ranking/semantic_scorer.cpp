#include "core/ranking/semantic_scorer.h"
#include "core/shared/logging.h"

#include <QHash>

#include <algorithm>
#include <cmath>

namespace hr {

namespace {

bool byScoreDescending(const ScoredChunk& a, const ScoredChunk& b)
{
    if (a.score != b.score) {
        return a.score > b.score;
    }
    return a.chunkId < b.chunkId;
}

} // namespace

double SemanticScorer::cosineSimilarity(const std::vector<float>& a, const std::vector<float>& b)
{
    if (a.size() != b.size() || a.empty()) {
        return 0.0;
    }

    double dot = 0.0;
    double normA = 0.0;
    double normB = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * static_cast<double>(b[i]);
        normA += static_cast<double>(a[i]) * static_cast<double>(a[i]);
        normB += static_cast<double>(b[i]) * static_cast<double>(b[i]);
    }

    if (normA <= 0.0 || normB <= 0.0) {
        return 0.0;
    }
    const double similarity = dot / (std::sqrt(normA) * std::sqrt(normB));
    return std::clamp(similarity, -1.0, 1.0);
}

std::vector<ScoredChunk> SemanticScorer::score(const std::vector<float>& queryVector,
                                               const std::vector<ChunkCandidate>& candidates) const
{
    std::vector<ScoredChunk> results;
    if (queryVector.empty()) {
        return results;
    }

    int skipped = 0;
    for (const ChunkCandidate& candidate : candidates) {
        const Chunk& chunk = candidate.chunk;
        if (chunk.embeddingState == EmbeddingState::Missing) {
            continue;
        }
        if (chunk.embeddingState == EmbeddingState::Malformed || !chunk.embedding) {
            LOG_WARN(hrRanking, "Skipping chunk %lld: malformed embedding",
                     static_cast<long long>(chunk.id));
            ++skipped;
            continue;
        }
        if (chunk.embedding->dimension() != static_cast<int>(queryVector.size())) {
            LOG_WARN(hrRanking, "Skipping chunk %lld: dimension %d, query has %zu",
                     static_cast<long long>(chunk.id), chunk.embedding->dimension(),
                     queryVector.size());
            ++skipped;
            continue;
        }

        const double similarity = cosineSimilarity(queryVector, chunk.embedding->values);
        if (similarity > kMinSimilarity) {
            results.push_back({chunk.id, similarity});
        }
    }

    std::sort(results.begin(), results.end(), byScoreDescending);

    if (skipped > 0) {
        LOG_INFO(hrRanking, "Semantic scoring skipped %d chunks with unusable vectors", skipped);
    }
    return results;
}

std::vector<ScoredChunk> SemanticScorer::bestChunkPerDocument(
    const std::vector<ScoredChunk>& scored,
    const std::vector<ChunkCandidate>& candidates)
{
    QHash<int64_t, QString> documentOf;
    for (const ChunkCandidate& candidate : candidates) {
        documentOf.insert(candidate.chunk.id, candidate.chunk.documentId);
    }

    QHash<QString, ScoredChunk> best;
    for (const ScoredChunk& entry : scored) {
        const QString documentId = documentOf.value(entry.chunkId);
        auto it = best.find(documentId);
        if (it == best.end()) {
            best.insert(documentId, entry);
        } else if (byScoreDescending(entry, it.value())) {
            it.value() = entry;
        }
    }

    std::vector<ScoredChunk> results;
    results.reserve(static_cast<size_t>(best.size()));
    for (auto it = best.cbegin(); it != best.cend(); ++it) {
        results.push_back(it.value());
    }
    std::sort(results.begin(), results.end(), byScoreDescending);
    return results;
}

} // namespace hr
