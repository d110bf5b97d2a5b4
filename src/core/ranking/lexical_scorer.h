#pragma once

#include "core/index/knowledge_store.h"
#include "core/ranking/scored_chunk.h"

#include <QStringList>
#include <vector>

namespace hr {

// Okapi BM25 over the candidate chunk set. Statistics (N, document
// frequency, average length) are computed per query from the candidates
// themselves; there is no persistent inverted index.
class LexicalScorer {
public:
    static constexpr double kK1 = 1.2;
    static constexpr double kB = 0.75;

    // Terms present in every candidate get a non-positive raw idf; the
    // floor keeps a matching chunk's contribution positive.
    static constexpr double kIdfFloor = 0.01;

    // Chunks without any query term are omitted. Sorted by score
    // descending, chunk id ascending on ties.
    std::vector<ScoredChunk> score(const QStringList& queryTerms,
                                   const std::vector<ChunkCandidate>& candidates) const;

    std::vector<ScoredChunk> score(const QString& query,
                                   const std::vector<ChunkCandidate>& candidates) const;

    // ln((N - n + 0.5) / (n + 0.5)) clamped to kIdfFloor.
    static double inverseDocumentFrequency(int corpusSize, int documentFrequency);
};

} // namespace hr
