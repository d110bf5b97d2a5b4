#include "core/vector/filter_expression.h"
#include "core/vector/vector_index_client.h"

#include <QRegularExpression>

namespace hr {

FilterExpression FilterExpression::fromFilter(const DocumentFilter& filter)
{
    FilterExpression expression;
    if (filter.category) {
        expression.addTerm(QStringLiteral("category"), documentCategoryToString(*filter.category));
    }
    if (filter.region) {
        expression.addTerm(QStringLiteral("region"), *filter.region);
    }
    if (filter.language) {
        expression.addTerm(QStringLiteral("language"), *filter.language);
    }
    return expression;
}

std::optional<FilterExpression> FilterExpression::parse(const QString& expression)
{
    FilterExpression out;
    if (expression.trimmed().isEmpty()) {
        return out;
    }

    static const QRegularExpression termPattern(
        QStringLiteral("^\\s*([A-Za-z_]+)\\s*==\\s*\"((?:[^\"\\\\]|\\\\.)*)\"\\s*$"));

    const QStringList parts = expression.split(QStringLiteral("&&"));
    for (const QString& part : parts) {
        const QRegularExpressionMatch match = termPattern.match(part);
        if (!match.hasMatch()) {
            return std::nullopt;
        }
        QString value = match.captured(2);
        value.replace(QStringLiteral("\\\""), QStringLiteral("\""));
        value.replace(QStringLiteral("\\\\"), QStringLiteral("\\"));
        if (!out.addTerm(match.captured(1), value)) {
            return std::nullopt;
        }
    }
    return out;
}

bool FilterExpression::isSupportedField(const QString& field)
{
    return field == QLatin1String("category")
        || field == QLatin1String("region")
        || field == QLatin1String("language");
}

bool FilterExpression::addTerm(const QString& field, const QString& value)
{
    if (!isSupportedField(field)) {
        return false;
    }
    m_terms.emplace_back(field, value);
    return true;
}

bool FilterExpression::matches(const VectorRecord& record) const
{
    for (const Term& term : m_terms) {
        if (term.first == QLatin1String("category")) {
            if (record.category != term.second) {
                return false;
            }
        } else if (term.first == QLatin1String("region")) {
            if (!record.regions.contains(term.second, Qt::CaseInsensitive)) {
                return false;
            }
        } else if (term.first == QLatin1String("language")) {
            if (record.language != term.second) {
                return false;
            }
        }
    }
    return true;
}

QString FilterExpression::toString() const
{
    QStringList rendered;
    rendered.reserve(static_cast<qsizetype>(m_terms.size()));
    for (const Term& term : m_terms) {
        QString escaped = term.second;
        escaped.replace(QStringLiteral("\\"), QStringLiteral("\\\\"));
        escaped.replace(QStringLiteral("\""), QStringLiteral("\\\""));
        rendered.append(QStringLiteral("%1 == \"%2\"").arg(term.first, escaped));
    }
    return rendered.join(QStringLiteral(" && "));
}

} // namespace hr
