#pragma once

#include "core/shared/types.h"

#include <QString>

#include <optional>
#include <utility>
#include <vector>

namespace hr {

struct VectorRecord;

// Boolean conjunction of equality terms over record metadata:
//   category == "hydraulics" && region == "LATAM" && language == "es"
// Supported fields are category, region and language. A region term matches
// a record whose region list contains the value.
class FilterExpression {
public:
    using Term = std::pair<QString, QString>;

    FilterExpression() = default;

    static FilterExpression fromFilter(const DocumentFilter& filter);

    // Returns nullopt for an unknown field or a malformed term.
    static std::optional<FilterExpression> parse(const QString& expression);

    bool addTerm(const QString& field, const QString& value);

    bool isEmpty() const { return m_terms.empty(); }
    const std::vector<Term>& terms() const { return m_terms; }

    bool matches(const VectorRecord& record) const;

    QString toString() const;

private:
    static bool isSupportedField(const QString& field);

    std::vector<Term> m_terms;
};

} // namespace hr
