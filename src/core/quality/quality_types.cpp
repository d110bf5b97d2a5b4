#include "core/quality/quality_types.h"

#include <QJsonArray>

namespace hr {

QString qualityIssueKindToString(QualityIssueKind kind)
{
    switch (kind) {
    case QualityIssueKind::LowRelevance:        return QStringLiteral("low_relevance");
    case QualityIssueKind::OutdatedContent:     return QStringLiteral("outdated_content");
    case QualityIssueKind::IncompleteInfo:      return QStringLiteral("incomplete_info");
    case QualityIssueKind::LowTechnicalDensity: return QStringLiteral("low_technical_density");
    case QualityIssueKind::UnreliableSource:    return QStringLiteral("unreliable_source");
    }
    return QStringLiteral("low_relevance");
}

QString issueSeverityToString(IssueSeverity severity)
{
    switch (severity) {
    case IssueSeverity::Low:    return QStringLiteral("low");
    case IssueSeverity::Medium: return QStringLiteral("medium");
    case IssueSeverity::High:   return QStringLiteral("high");
    }
    return QStringLiteral("low");
}

QJsonObject qualityMetricsToJson(const QualityMetrics& metrics)
{
    QJsonArray issues;
    for (const QualityIssue& issue : metrics.issues) {
        QJsonObject entry;
        entry[QStringLiteral("type")] = qualityIssueKindToString(issue.kind);
        entry[QStringLiteral("severity")] = issueSeverityToString(issue.severity);
        entry[QStringLiteral("description")] = issue.description;
        if (!issue.suggestion.isEmpty()) {
            entry[QStringLiteral("suggestion")] = issue.suggestion;
        }
        issues.append(entry);
    }

    QJsonObject json;
    json[QStringLiteral("relevance")] = metrics.relevance;
    json[QStringLiteral("technicalAccuracy")] = metrics.technicalAccuracy;
    json[QStringLiteral("completeness")] = metrics.completeness;
    json[QStringLiteral("freshness")] = metrics.freshness;
    json[QStringLiteral("sourceReliability")] = metrics.sourceReliability;
    json[QStringLiteral("overall")] = metrics.overall;
    json[QStringLiteral("issues")] = issues;
    json[QStringLiteral("recommendations")] = QJsonArray::fromStringList(metrics.recommendations);
    return json;
}

QJsonObject qualityReportToJson(const QualityReport& report)
{
    QJsonObject issues;
    for (auto it = report.issuesSummary.cbegin(); it != report.issuesSummary.cend(); ++it) {
        issues[it.key()] = it.value();
    }

    QJsonObject json;
    json[QStringLiteral("overallQuality")] = report.overallQuality;
    json[QStringLiteral("summary")] = report.summary;
    json[QStringLiteral("recommendations")] = QJsonArray::fromStringList(report.recommendations);
    json[QStringLiteral("issuesSummary")] = issues;
    return json;
}

} // namespace hr
