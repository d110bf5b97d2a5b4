#pragma once

#include "core/quality/quality_types.h"

#include <QString>
#include <vector>

namespace hr {

// QualityValidator scores retrieved results on five axes and filters them
// against a floor. Stateless apart from its weights.
class QualityValidator {
public:
    explicit QualityValidator(const QualityWeights& weights = {});

    ValidationOutcome validate(const QString& query,
                               const std::vector<SearchResult>& results,
                               const QualityOptions& options = {}) const;

    QualityMetrics evaluate(const QString& query,
                            const SearchResult& result,
                            const QualityOptions& options = {}) const;

    // Strict: every sub-score clears its own fraction of minScore.
    // Default: only the weighted overall score must clear minScore.
    static bool passesThreshold(const QualityMetrics& metrics, double minScore, bool strictMode);

    static QualityReport generateQualityReport(const std::vector<QualityMetrics>& metrics);

    // ── Individual axes (exposed for tests) ─────────────────

    static double evaluateRelevance(const QString& query, const SearchResult& result,
                                    std::vector<QualityIssue>& issues);
    static double evaluateTechnicalAccuracy(const QString& content, std::vector<QualityIssue>& issues);
    static double evaluateCompleteness(const QString& content, std::vector<QualityIssue>& issues);
    static double evaluateFreshness(double createdAtEpoch, double nowEpoch, double maxAgeYears,
                                    std::vector<QualityIssue>& issues);
    static double evaluateSourceReliability(const SearchResult& result,
                                            const QStringList& preferredSources,
                                            std::vector<QualityIssue>& issues);

    static QStringList recommendationsFor(const QualityMetrics& metrics);

    // Wraps technical indicator words in ** markers.
    static QStringList emphasizeTechnicalTerms(const QStringList& highlights);

    const QualityWeights& weights() const { return m_weights; }

private:
    QualityWeights m_weights;
};

} // namespace hr
