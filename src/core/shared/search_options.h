#pragma once

#include "core/shared/types.h"

#include <QString>
#include <optional>

namespace hr {

// Options for KnowledgeEngine::search(). Unset filters apply no
// narrowing.
struct SearchOptions {
    int topK = 10;
    double alpha = 0.6;               // Weight of the semantic list in fusion
    double minSemanticScore = 0.3;    // Floor for semantic-only hits
    double minBM25Score = 0.1;        // Floor for lexical-only hits
    bool rerank = true;

    std::optional<DocumentCategory> category;
    std::optional<QString> region;
    std::optional<QString> language;

    // Post-retrieval quality filtering.
    bool validateQuality = false;
    bool strictQuality = false;
    double minQualityScore = 0.6;
    QStringList preferredSources;

    DocumentFilter filter() const
    {
        DocumentFilter out;
        out.category = category;
        out.region = region;
        out.language = language;
        return out;
    }

    // Returns true if any filter field is set.
    bool hasFilters() const
    {
        return category.has_value() || region.has_value() || language.has_value();
    }
};

} // namespace hr
