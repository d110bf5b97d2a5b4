#pragma once

#include "core/shared/types.h"

#include <QString>
#include <QJsonObject>
#include <QStringList>
#include <cstdint>
#include <vector>

namespace hr {

// Which retrieval stage(s) contributed a fused result.
enum class SearchMethod {
    Lexical,
    Semantic,
    Hybrid,
};

QString searchMethodToString(SearchMethod method);

// Why a result or embedding was produced in degraded mode.
enum class DegradedReason {
    None,
    FallbackActive,       // Fallback provider is the configured provider
    CredentialMissing,    // Cloud backend has no enabled credential
    ModelNotFound,        // Local server does not have the requested model
    BackendUnreachable,
    Timeout,
    InvalidResponse,
    CircuitOpen,
};

QString degradedReasonToString(DegradedReason reason);

// Score breakdown for debugging/transparency.
struct ScoreBreakdown {
    double lexicalRaw = 0.0;
    double semanticRaw = 0.0;
    double lexicalNormalized = 0.0;
    double semanticNormalized = 0.0;
    double rerankBonus = 0.0;
};

struct SearchResult {
    QString id;               // Chunk record id
    int64_t chunkId = 0;
    QString documentId;
    int chunkIndex = 0;
    QString title;
    QString content;
    DocumentCategory category = DocumentCategory::General;
    QString subcategory;
    QStringList regions;
    QString language;
    double documentCreatedAt = 0.0;
    int referenceCount = 0;
    double score = 0.0;
    SearchMethod method = SearchMethod::Hybrid;
    ScoreBreakdown scoreBreakdown;
    QStringList highlights;
    bool degraded = false;
    DegradedReason degradedReason = DegradedReason::None;
};

QJsonObject searchResultToJson(const SearchResult& result);

} // namespace hr
