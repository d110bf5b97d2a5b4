#include "core/quality/quality_validator.h"
#include "core/ranking/text_tokenizer.h"
#include "core/shared/logging.h"

#include <QDateTime>
#include <QRegularExpression>
#include <QSet>

#include <algorithm>

namespace hr {

namespace {

constexpr double kSecondsPerYear = 365.25 * 24.0 * 60.0 * 60.0;

constexpr double kLowRelevanceThreshold = 0.4;
constexpr double kLowTechnicalDensity = 0.02;
constexpr double kLowTechnicalPenalty = 0.7;
constexpr int kShortContentLength = 200;
constexpr int kMediumContentLength = 500;
constexpr double kOutdatedScore = 0.2;
constexpr double kUnreliableThreshold = 0.4;

const QStringList& reliableSources()
{
    static const QStringList sources = {
        QStringLiteral("awwa"), QStringLiteral("american water works association"),
        QStringLiteral("iso"), QStringLiteral("international organization for standardization"),
        QStringLiteral("epa"), QStringLiteral("environmental protection agency"),
        QStringLiteral("who"), QStringLiteral("world health organization"),
        QStringLiteral("asce"), QStringLiteral("american society of civil engineers"),
        QStringLiteral("iwa"), QStringLiteral("international water association"),
        QStringLiteral("unesco"), QStringLiteral("united nations educational"),
        QStringLiteral("world bank"), QStringLiteral("banco mundial"),
        QStringLiteral("bid"), QStringLiteral("banco interamericano de desarrollo"),
    };
    return sources;
}

const QStringList& technicalIndicators()
{
    static const QStringList indicators = {
        QStringLiteral("ecuación"), QStringLiteral("equation"),
        QStringLiteral("fórmula"), QStringLiteral("formula"),
        QStringLiteral("coeficiente"), QStringLiteral("coefficient"),
        QStringLiteral("parámetro"), QStringLiteral("parameter"),
        QStringLiteral("cálculo"), QStringLiteral("calculation"),
        QStringLiteral("análisis"), QStringLiteral("analysis"),
        QStringLiteral("dimensionamiento"), QStringLiteral("sizing"),
        QStringLiteral("diseño"), QStringLiteral("design"),
        QStringLiteral("especificación"), QStringLiteral("specification"),
        QStringLiteral("norma"), QStringLiteral("standard"),
        QStringLiteral("procedimiento"), QStringLiteral("procedure"),
        QStringLiteral("método"), QStringLiteral("method"),
        QStringLiteral("resultado"), QStringLiteral("result"),
        QStringLiteral("conclusión"), QStringLiteral("conclusion"),
    };
    return indicators;
}

const QStringList& completenessIndicators()
{
    static const QStringList indicators = {
        QStringLiteral("ejemplo"), QStringLiteral("example"),
        QStringLiteral("caso"), QStringLiteral("case"),
        QStringLiteral("procedimiento"), QStringLiteral("procedure"),
        QStringLiteral("paso"), QStringLiteral("step"),
        QStringLiteral("resultado"), QStringLiteral("result"),
        QStringLiteral("conclusión"), QStringLiteral("conclusion"),
        QStringLiteral("tabla"), QStringLiteral("table"),
        QStringLiteral("figura"), QStringLiteral("figure"),
        QStringLiteral("referencia"), QStringLiteral("reference"),
        QStringLiteral("bibliografía"), QStringLiteral("bibliography"),
    };
    return indicators;
}

const std::vector<QRegularExpression>& formulaPatterns()
{
    static const std::vector<QRegularExpression> patterns = {
        QRegularExpression(QStringLiteral("[A-Za-z]\\s*=\\s*[^.]*[+\\-*/]")),
        QRegularExpression(QStringLiteral("Q\\s*=\\s*[^.]*"), QRegularExpression::CaseInsensitiveOption),
        QRegularExpression(QStringLiteral("P\\s*=\\s*[^.]*"), QRegularExpression::CaseInsensitiveOption),
        QRegularExpression(QStringLiteral("H\\s*=\\s*[^.]*"), QRegularExpression::CaseInsensitiveOption),
    };
    return patterns;
}

const QRegularExpression& unitPattern()
{
    static const QRegularExpression re(
        QStringLiteral("\\b(m3/s|L/s|mca|kPa|bar|psi|mm|cm|m|km|gpm|cfs)\\b"),
        QRegularExpression::CaseInsensitiveOption);
    return re;
}

int countMatches(const QRegularExpression& re, const QString& text)
{
    int count = 0;
    QRegularExpressionMatchIterator it = re.globalMatch(text);
    while (it.hasNext()) {
        it.next();
        ++count;
    }
    return count;
}

void addIssue(std::vector<QualityIssue>& issues, QualityIssueKind kind, IssueSeverity severity,
              const QString& description, const QString& suggestion)
{
    QualityIssue issue;
    issue.kind = kind;
    issue.severity = severity;
    issue.description = description;
    issue.suggestion = suggestion;
    issues.push_back(issue);
}

} // namespace

QualityValidator::QualityValidator(const QualityWeights& weights)
    : m_weights(weights)
{
}

// ── Axes ────────────────────────────────────────────────────

double QualityValidator::evaluateRelevance(const QString& query, const SearchResult& result,
                                           std::vector<QualityIssue>& issues)
{
    const QStringList queryTerms = TextTokenizer::tokenize(query);
    const QStringList contentTerms = TextTokenizer::tokenize(result.content);
    const QSet<QString> contentSet(contentTerms.cbegin(), contentTerms.cend());

    int common = 0;
    for (const QString& term : queryTerms) {
        if (contentSet.contains(term)) {
            ++common;
        }
    }
    const double overlap = static_cast<double>(common) / std::max<qsizetype>(queryTerms.size(), 1);
    const double relevance = result.score * 0.7 + overlap * 0.3;

    if (relevance < kLowRelevanceThreshold) {
        addIssue(issues, QualityIssueKind::LowRelevance, IssueSeverity::High,
                 QStringLiteral("Content has low relevance to the query"),
                 QStringLiteral("Rephrase the query or use more specific terms"));
    }
    return std::min(relevance, 1.0);
}

double QualityValidator::evaluateTechnicalAccuracy(const QString& content,
                                                   std::vector<QualityIssue>& issues)
{
    const QString lowered = content.toLower();

    int indicatorCount = 0;
    for (const QString& term : technicalIndicators()) {
        if (lowered.contains(term)) {
            ++indicatorCount;
        }
    }

    int formulaCount = 0;
    for (const QRegularExpression& pattern : formulaPatterns()) {
        formulaCount += countMatches(pattern, content);
    }
    const int unitCount = countMatches(unitPattern(), content);

    const qsizetype words = std::max<qsizetype>(TextTokenizer::words(content).size(), 1);
    const double density = static_cast<double>(indicatorCount + formulaCount + unitCount) / words;

    double score = std::min(density * 10.0, 1.0);
    if (density < kLowTechnicalDensity) {
        addIssue(issues, QualityIssueKind::LowTechnicalDensity, IssueSeverity::Medium,
                 QStringLiteral("Content has low technical density"),
                 QStringLiteral("Look for more specialized documents"));
        score *= kLowTechnicalPenalty;
    }
    return score;
}

double QualityValidator::evaluateCompleteness(const QString& content,
                                              std::vector<QualityIssue>& issues)
{
    double lengthScore = 1.0;
    if (content.size() < kShortContentLength) {
        lengthScore = 0.3;
        addIssue(issues, QualityIssueKind::IncompleteInfo, IssueSeverity::Medium,
                 QStringLiteral("Content looks incomplete (very short)"),
                 QStringLiteral("Look for documents with more detail"));
    } else if (content.size() < kMediumContentLength) {
        lengthScore = 0.6;
    }

    const QString lowered = content.toLower();
    int indicatorCount = 0;
    for (const QString& indicator : completenessIndicators()) {
        if (lowered.contains(indicator)) {
            ++indicatorCount;
        }
    }
    const double indicatorScore = std::min(indicatorCount / 3.0, 1.0);

    return lengthScore * 0.6 + indicatorScore * 0.4;
}

double QualityValidator::evaluateFreshness(double createdAtEpoch, double nowEpoch, double maxAgeYears,
                                           std::vector<QualityIssue>& issues)
{
    if (maxAgeYears <= 0.0) {
        return 1.0;
    }

    const double ageYears = std::max(0.0, (nowEpoch - createdAtEpoch) / kSecondsPerYear);
    double score = std::max(0.0, 1.0 - ageYears / maxAgeYears);

    if (ageYears > maxAgeYears) {
        addIssue(issues, QualityIssueKind::OutdatedContent,
                 ageYears > maxAgeYears * 2.0 ? IssueSeverity::High : IssueSeverity::Medium,
                 QStringLiteral("Content is %1 years old").arg(ageYears, 0, 'f', 1),
                 QStringLiteral("Check whether the information is still valid"));
        score = kOutdatedScore;
    }
    return score;
}

double QualityValidator::evaluateSourceReliability(const SearchResult& result,
                                                   const QStringList& preferredSources,
                                                   std::vector<QualityIssue>& issues)
{
    const QString title = result.title.toLower();
    const QString content = result.content.toLower();

    auto mentions = [&](const QString& source) {
        const QString needle = source.toLower();
        return !needle.isEmpty() && (title.contains(needle) || content.contains(needle));
    };

    const bool reliable = std::any_of(reliableSources().cbegin(), reliableSources().cend(), mentions);
    const bool preferred = std::any_of(preferredSources.cbegin(), preferredSources.cend(), mentions);

    double score = 0.5;
    if (reliable) score += 0.4;
    if (preferred) score += 0.3;
    if (result.referenceCount > 0) score += 0.1;

    if (score < kUnreliableThreshold) {
        addIssue(issues, QualityIssueKind::UnreliableSource, IssueSeverity::Low,
                 QStringLiteral("Source is not among the recognized reliable sources"),
                 QStringLiteral("Verify the source before relying on it"));
    }
    return std::min(score, 1.0);
}

QStringList QualityValidator::recommendationsFor(const QualityMetrics& metrics)
{
    QStringList out;
    if (metrics.relevance < 0.6) {
        out.append(QStringLiteral("Refine the query with more specific terms"));
    }
    if (metrics.technicalAccuracy < 0.5) {
        out.append(QStringLiteral("Search more technical or specialized documents"));
    }
    if (metrics.completeness < 0.6) {
        out.append(QStringLiteral("Combine with information from additional sources"));
    }
    if (metrics.freshness < 0.7) {
        out.append(QStringLiteral("Check whether more recent information exists"));
    }
    if (metrics.sourceReliability < 0.6) {
        out.append(QStringLiteral("Cross-check with recognized industry sources"));
    }
    return out;
}

QStringList QualityValidator::emphasizeTechnicalTerms(const QStringList& highlights)
{
    QStringList out;
    out.reserve(highlights.size());
    for (QString highlight : highlights) {
        for (const QString& term : technicalIndicators()) {
            const QRegularExpression re(
                QStringLiteral("\\b(%1)\\b").arg(QRegularExpression::escape(term)),
                QRegularExpression::CaseInsensitiveOption | QRegularExpression::UseUnicodePropertiesOption);
            highlight.replace(re, QStringLiteral("**\\1**"));
        }
        out.append(highlight);
    }
    return out;
}

// ── Evaluation and filtering ────────────────────────────────

QualityMetrics QualityValidator::evaluate(const QString& query,
                                          const SearchResult& result,
                                          const QualityOptions& options) const
{
    const double now = options.nowEpoch > 0.0
        ? options.nowEpoch
        : static_cast<double>(QDateTime::currentSecsSinceEpoch());

    QualityMetrics metrics;
    metrics.relevance = evaluateRelevance(query, result, metrics.issues);
    metrics.technicalAccuracy = evaluateTechnicalAccuracy(result.content, metrics.issues);
    metrics.completeness = evaluateCompleteness(result.content, metrics.issues);
    metrics.freshness = evaluateFreshness(result.documentCreatedAt, now,
                                          options.maxContentAgeYears, metrics.issues);
    metrics.sourceReliability = evaluateSourceReliability(result, options.preferredSources,
                                                          metrics.issues);

    metrics.overall = metrics.relevance * m_weights.relevance
                    + metrics.technicalAccuracy * m_weights.technical
                    + metrics.completeness * m_weights.completeness
                    + metrics.freshness * m_weights.freshness
                    + metrics.sourceReliability * m_weights.source;

    metrics.recommendations = recommendationsFor(metrics);
    return metrics;
}

bool QualityValidator::passesThreshold(const QualityMetrics& metrics, double minScore, bool strictMode)
{
    if (strictMode) {
        return metrics.relevance >= minScore
            && metrics.technicalAccuracy >= minScore * 0.8
            && metrics.completeness >= minScore * 0.7
            && metrics.freshness >= minScore * 0.6
            && metrics.sourceReliability >= minScore * 0.5;
    }
    return metrics.overall >= minScore;
}

ValidationOutcome QualityValidator::validate(const QString& query,
                                             const std::vector<SearchResult>& results,
                                             const QualityOptions& options) const
{
    ValidationOutcome outcome;
    outcome.report.reserve(results.size());

    for (const SearchResult& result : results) {
        QualityMetrics metrics = evaluate(query, result, options);
        outcome.report.push_back(metrics);

        if (!passesThreshold(metrics, options.minQualityScore, options.strictMode)) {
            continue;
        }

        ValidatedResult accepted{result, std::move(metrics)};
        if (accepted.metrics.technicalAccuracy > 0.7) {
            accepted.result.highlights = emphasizeTechnicalTerms(accepted.result.highlights);
        }
        outcome.accepted.push_back(std::move(accepted));
    }

    std::stable_sort(outcome.accepted.begin(), outcome.accepted.end(),
                     [](const ValidatedResult& lhs, const ValidatedResult& rhs) {
                         return lhs.metrics.overall > rhs.metrics.overall;
                     });

    LOG_DEBUG(hrQuality, "Quality filter kept %zu of %zu results (strict=%d, min=%.2f)",
              outcome.accepted.size(), results.size(), options.strictMode ? 1 : 0,
              options.minQualityScore);
    return outcome;
}

QualityReport QualityValidator::generateQualityReport(const std::vector<QualityMetrics>& metrics)
{
    QualityReport report;
    if (metrics.empty()) {
        report.summary = QStringLiteral("No results to evaluate");
        report.recommendations = {QStringLiteral("Rephrase the query"),
                                  QStringLiteral("Broaden the search criteria")};
        return report;
    }

    double total = 0.0;
    for (const QualityMetrics& entry : metrics) {
        total += entry.overall;
        for (const QualityIssue& issue : entry.issues) {
            ++report.issuesSummary[qualityIssueKindToString(issue.kind)];
        }
        for (const QString& recommendation : entry.recommendations) {
            if (!report.recommendations.contains(recommendation)) {
                report.recommendations.append(recommendation);
            }
        }
    }
    report.overallQuality = total / static_cast<double>(metrics.size());

    QString verdict;
    if (report.overallQuality >= 0.8) {
        verdict = QStringLiteral("Excellent result quality.");
    } else if (report.overallQuality >= 0.6) {
        verdict = QStringLiteral("Good result quality.");
    } else if (report.overallQuality >= 0.4) {
        verdict = QStringLiteral("Moderate quality. Additional validation recommended.");
    } else {
        verdict = QStringLiteral("Low quality. Consider rephrasing the search.");
    }
    report.summary = QStringLiteral("Average quality: %1%. %2")
                         .arg(report.overallQuality * 100.0, 0, 'f', 1)
                         .arg(verdict);
    return report;
}

} // namespace hr
