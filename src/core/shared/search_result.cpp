#include "core/shared/search_result.h"

#include <QJsonArray>

namespace hr {

QString searchMethodToString(SearchMethod method)
{
    switch (method) {
    case SearchMethod::Lexical:  return QStringLiteral("lexical");
    case SearchMethod::Semantic: return QStringLiteral("semantic");
    case SearchMethod::Hybrid:   return QStringLiteral("hybrid");
    }
    return QStringLiteral("unknown");
}

QString degradedReasonToString(DegradedReason reason)
{
    switch (reason) {
    case DegradedReason::None:               return QStringLiteral("none");
    case DegradedReason::FallbackActive:     return QStringLiteral("fallback_active");
    case DegradedReason::CredentialMissing:  return QStringLiteral("credential_missing");
    case DegradedReason::ModelNotFound:      return QStringLiteral("model_not_found");
    case DegradedReason::BackendUnreachable: return QStringLiteral("backend_unreachable");
    case DegradedReason::Timeout:            return QStringLiteral("timeout");
    case DegradedReason::InvalidResponse:    return QStringLiteral("invalid_response");
    case DegradedReason::CircuitOpen:        return QStringLiteral("circuit_open");
    }
    return QStringLiteral("unknown");
}

QJsonObject searchResultToJson(const SearchResult& result)
{
    QJsonObject breakdown;
    breakdown.insert(QStringLiteral("lexicalRaw"), result.scoreBreakdown.lexicalRaw);
    breakdown.insert(QStringLiteral("semanticRaw"), result.scoreBreakdown.semanticRaw);
    breakdown.insert(QStringLiteral("lexicalNormalized"), result.scoreBreakdown.lexicalNormalized);
    breakdown.insert(QStringLiteral("semanticNormalized"), result.scoreBreakdown.semanticNormalized);
    breakdown.insert(QStringLiteral("rerankBonus"), result.scoreBreakdown.rerankBonus);

    QJsonObject json;
    json.insert(QStringLiteral("id"), result.id);
    json.insert(QStringLiteral("documentId"), result.documentId);
    json.insert(QStringLiteral("chunkIndex"), result.chunkIndex);
    json.insert(QStringLiteral("title"), result.title);
    json.insert(QStringLiteral("content"), result.content);
    json.insert(QStringLiteral("category"), documentCategoryToString(result.category));
    json.insert(QStringLiteral("subcategory"), result.subcategory);
    json.insert(QStringLiteral("regions"), QJsonArray::fromStringList(result.regions));
    json.insert(QStringLiteral("score"), result.score);
    json.insert(QStringLiteral("method"), searchMethodToString(result.method));
    json.insert(QStringLiteral("scoreBreakdown"), breakdown);
    json.insert(QStringLiteral("highlights"), QJsonArray::fromStringList(result.highlights));
    if (result.degraded) {
        json.insert(QStringLiteral("degraded"), true);
        json.insert(QStringLiteral("degradedReason"), degradedReasonToString(result.degradedReason));
    }
    return json;
}

} // namespace hr
