#pragma once

#include "core/shared/search_result.h"

#include <QJsonObject>
#include <QMap>
#include <QString>
#include <QStringList>
#include <vector>

namespace hr {

enum class QualityIssueKind {
    LowRelevance,
    OutdatedContent,
    IncompleteInfo,
    LowTechnicalDensity,
    UnreliableSource,
};

enum class IssueSeverity {
    Low,
    Medium,
    High,
};

QString qualityIssueKindToString(QualityIssueKind kind);
QString issueSeverityToString(IssueSeverity severity);

struct QualityIssue {
    QualityIssueKind kind = QualityIssueKind::LowRelevance;
    IssueSeverity severity = IssueSeverity::Low;
    QString description;
    QString suggestion;
};

// Per-result quality, computed at query time and never persisted.
struct QualityMetrics {
    double relevance = 0.0;
    double technicalAccuracy = 0.0;
    double completeness = 0.0;
    double freshness = 0.0;
    double sourceReliability = 0.0;
    double overall = 0.0;
    std::vector<QualityIssue> issues;
    QStringList recommendations;
};

struct QualityWeights {
    double relevance = 0.30;
    double technical = 0.25;
    double completeness = 0.20;
    double freshness = 0.15;
    double source = 0.10;
};

struct QualityOptions {
    bool strictMode = false;
    double minQualityScore = 0.6;
    double maxContentAgeYears = 10.0;
    QStringList preferredSources;
    double nowEpoch = 0.0;           // 0 = current time
};

struct ValidatedResult {
    SearchResult result;
    QualityMetrics metrics;
};

struct ValidationOutcome {
    std::vector<ValidatedResult> accepted;    // Sorted by overall quality
    std::vector<QualityMetrics> report;       // One entry per input result, input order
};

struct QualityReport {
    double overallQuality = 0.0;
    QString summary;
    QStringList recommendations;
    QMap<QString, int> issuesSummary;         // Issue kind -> count
};

QJsonObject qualityMetricsToJson(const QualityMetrics& metrics);
QJsonObject qualityReportToJson(const QualityReport& report);

} // namespace hr
