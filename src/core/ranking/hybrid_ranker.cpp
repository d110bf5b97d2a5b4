#include "core/ranking/hybrid_ranker.h"
#include "core/ranking/text_tokenizer.h"
#include "core/shared/logging.h"

#include <algorithm>
#include <cmath>
#include <unordered_map>

namespace hr {

namespace {

const QStringList& technicalTerms()
{
    static const QStringList terms = {
        QStringLiteral("presión"), QStringLiteral("pressure"),
        QStringLiteral("caudal"), QStringLiteral("flow"),
        QStringLiteral("diámetro"), QStringLiteral("diameter"),
        QStringLiteral("tubería"), QStringLiteral("pipe"),
        QStringLiteral("bomba"), QStringLiteral("pump"),
        QStringLiteral("válvula"), QStringLiteral("valve"),
        QStringLiteral("hidráulico"), QStringLiteral("hydraulic"),
        QStringLiteral("agua"), QStringLiteral("water"),
        QStringLiteral("red"), QStringLiteral("network"),
    };
    return terms;
}

template <typename T>
void sortByScore(std::vector<T>& items)
{
    std::stable_sort(items.begin(), items.end(), [](const T& lhs, const T& rhs) {
        return lhs.score > rhs.score;
    });
}

} // namespace

HybridRanker::HybridRanker(const RerankConfig& config)
    : m_config(config)
{
}

std::vector<ScoredChunk> HybridRanker::maxNormalize(const std::vector<ScoredChunk>& scores)
{
    std::vector<ScoredChunk> normalized = scores;
    if (normalized.empty()) {
        return normalized;
    }
    double maxScore = normalized.front().score;
    for (const ScoredChunk& entry : normalized) {
        maxScore = std::max(maxScore, entry.score);
    }
    if (maxScore <= 0.0) {
        return normalized;
    }
    for (ScoredChunk& entry : normalized) {
        entry.score /= maxScore;
    }
    return normalized;
}

std::vector<FusedScore> HybridRanker::fuse(const std::vector<ScoredChunk>& lexical,
                                           const std::vector<ScoredChunk>& semantic,
                                           double alpha)
{
    const double semanticWeight = std::clamp(alpha, 0.0, 1.0);
    const double lexicalWeight = 1.0 - semanticWeight;

    const std::vector<ScoredChunk> lexicalNorm = maxNormalize(lexical);
    const std::vector<ScoredChunk> semanticNorm = maxNormalize(semantic);

    std::unordered_map<int64_t, FusedScore> fused;
    fused.reserve(lexical.size() + semantic.size());

    for (size_t i = 0; i < semanticNorm.size(); ++i) {
        FusedScore& entry = fused[semanticNorm[i].chunkId];
        entry.chunkId = semanticNorm[i].chunkId;
        entry.method = SearchMethod::Semantic;
        entry.breakdown.semanticRaw = semantic[i].score;
        entry.breakdown.semanticNormalized = semanticNorm[i].score;
    }

    for (size_t i = 0; i < lexicalNorm.size(); ++i) {
        auto it = fused.find(lexicalNorm[i].chunkId);
        if (it == fused.end()) {
            it = fused.emplace(lexicalNorm[i].chunkId, FusedScore{}).first;
            it->second.chunkId = lexicalNorm[i].chunkId;
            it->second.method = SearchMethod::Lexical;
        } else {
            it->second.method = SearchMethod::Hybrid;
        }
        it->second.breakdown.lexicalRaw = lexical[i].score;
        it->second.breakdown.lexicalNormalized = lexicalNorm[i].score;
    }

    std::vector<FusedScore> results;
    results.reserve(fused.size());
    for (auto& [chunkId, entry] : fused) {
        entry.score = semanticWeight * entry.breakdown.semanticNormalized
                    + lexicalWeight * entry.breakdown.lexicalNormalized;
        results.push_back(entry);
    }

    std::sort(results.begin(), results.end(), [](const FusedScore& lhs, const FusedScore& rhs) {
        if (lhs.score != rhs.score) {
            return lhs.score > rhs.score;
        }
        return lhs.chunkId < rhs.chunkId;
    });
    return results;
}

double HybridRanker::technicalDensity(const QString& text)
{
    const QStringList words = TextTokenizer::words(text);
    if (words.isEmpty()) {
        return 0.0;
    }

    int technicalCount = 0;
    for (const QString& word : words) {
        for (const QString& term : technicalTerms()) {
            if (word.contains(term)) {
                ++technicalCount;
                break;
            }
        }
    }
    return static_cast<double>(technicalCount) / words.size();
}

double HybridRanker::rerankBonus(const QStringList& queryTerms, const QString& content) const
{
    const QString lowered = content.toLower();
    double bonus = 0.0;

    if (!queryTerms.isEmpty()) {
        int exactMatches = 0;
        for (const QString& term : queryTerms) {
            if (lowered.contains(term)) {
                ++exactMatches;
            }
        }
        bonus += (static_cast<double>(exactMatches) / queryTerms.size()) * m_config.exactTermWeight;
    }

    bonus += technicalDensity(content) * m_config.technicalDensityWeight;

    const int length = static_cast<int>(content.size());
    if (length >= m_config.preferredMinLength && length <= m_config.preferredMaxLength) {
        bonus += m_config.lengthBonus;
    }
    return bonus;
}

bool HybridRanker::rerank(const QString& query, std::vector<SearchResult>& results, int topK) const
{
    const size_t limit = static_cast<size_t>(std::max(topK, 0));
    const QStringList queryTerms = TextTokenizer::tokenize(query);

    std::vector<SearchResult> reranked = results;
    bool ok = true;
    for (SearchResult& result : reranked) {
        const double bonus = rerankBonus(queryTerms, result.content);
        const double score = result.score * (1.0 + bonus);
        if (!std::isfinite(score)) {
            LOG_WARN(hrRanking, "Rerank failed on chunk %lld (bonus %f), keeping fused order",
                     static_cast<long long>(result.chunkId), bonus);
            ok = false;
            break;
        }
        result.scoreBreakdown.rerankBonus = bonus;
        result.score = score;
    }

    if (ok) {
        sortByScore(reranked);
        results = std::move(reranked);
    }
    if (results.size() > limit) {
        results.resize(limit);
    }
    return ok;
}

} // namespace hr
