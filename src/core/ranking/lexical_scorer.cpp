#include "core/ranking/lexical_scorer.h"
#include "core/ranking/text_tokenizer.h"
#include "core/shared/logging.h"

#include <QHash>
#include <QSet>

#include <algorithm>
#include <cmath>

namespace hr {

double LexicalScorer::inverseDocumentFrequency(int corpusSize, int documentFrequency)
{
    if (documentFrequency <= 0) {
        return 0.0;
    }
    const double idf = std::log((corpusSize - documentFrequency + 0.5) / (documentFrequency + 0.5));
    return std::max(idf, kIdfFloor);
}

std::vector<ScoredChunk> LexicalScorer::score(const QString& query,
                                              const std::vector<ChunkCandidate>& candidates) const
{
    return score(TextTokenizer::tokenize(query), candidates);
}

std::vector<ScoredChunk> LexicalScorer::score(const QStringList& queryTerms,
                                              const std::vector<ChunkCandidate>& candidates) const
{
    std::vector<ScoredChunk> results;
    if (queryTerms.isEmpty() || candidates.empty()) {
        return results;
    }

    // Unique query terms; a repeated term is counted once.
    QStringList terms;
    for (const QString& term : queryTerms) {
        if (!terms.contains(term)) {
            terms.append(term);
        }
    }

    struct TermCounts {
        int64_t chunkId = 0;
        int length = 0;
        QHash<QString, int> frequencies;
    };

    std::vector<TermCounts> corpus;
    corpus.reserve(candidates.size());
    QHash<QString, int> documentFrequency;
    double totalLength = 0.0;

    for (const ChunkCandidate& candidate : candidates) {
        const QStringList tokens = TextTokenizer::tokenize(candidate.chunk.content);
        if (tokens.isEmpty()) {
            continue;
        }

        TermCounts counts;
        counts.chunkId = candidate.chunk.id;
        counts.length = static_cast<int>(tokens.size());
        for (const QString& token : tokens) {
            if (terms.contains(token)) {
                ++counts.frequencies[token];
            }
        }
        for (auto it = counts.frequencies.cbegin(); it != counts.frequencies.cend(); ++it) {
            ++documentFrequency[it.key()];
        }
        totalLength += counts.length;
        corpus.push_back(std::move(counts));
    }

    if (corpus.empty()) {
        return results;
    }

    const int corpusSize = static_cast<int>(corpus.size());
    const double avgLength = totalLength / corpusSize;

    QHash<QString, double> idf;
    for (const QString& term : terms) {
        idf.insert(term, inverseDocumentFrequency(corpusSize, documentFrequency.value(term)));
    }

    for (const TermCounts& counts : corpus) {
        if (counts.frequencies.isEmpty()) {
            continue;
        }

        const double lengthNorm = 1.0 - kB + kB * (counts.length / avgLength);
        double total = 0.0;
        for (auto it = counts.frequencies.cbegin(); it != counts.frequencies.cend(); ++it) {
            const double tf = it.value();
            total += idf.value(it.key()) * (tf * (kK1 + 1.0)) / (tf + kK1 * lengthNorm);
        }
        results.push_back({counts.chunkId, total});
    }

    std::sort(results.begin(), results.end(), [](const ScoredChunk& a, const ScoredChunk& b) {
        if (a.score != b.score) {
            return a.score > b.score;
        }
        return a.chunkId < b.chunkId;
    });

    LOG_DEBUG(hrRanking, "BM25: %d terms, %d chunks, %zu matches",
              static_cast<int>(terms.size()), corpusSize, results.size());
    return results;
}

} // namespace hr
