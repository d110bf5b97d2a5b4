#include "core/retrieval/highlighter.h"

#include <QRegularExpression>

#include <algorithm>

namespace hr {

namespace {

const QRegularExpression& sentenceBreak()
{
    static const QRegularExpression re(QStringLiteral("[.!?]+"));
    return re;
}

} // namespace

QStringList extractHighlights(const QString& query, const QStringList& passages, int maxHighlights)
{
    QStringList highlights;
    if (maxHighlights <= 0) {
        return highlights;
    }

    const QStringList queryWords =
        query.toLower().split(QRegularExpression(QStringLiteral("\\s+")), Qt::SkipEmptyParts);
    const double required = std::min(2.0, queryWords.size() * 0.5);

    if (!queryWords.isEmpty()) {
        for (const QString& passage : passages) {
            for (const QString& sentence : passage.split(sentenceBreak())) {
                const QString trimmed = sentence.trimmed();
                if (trimmed.isEmpty()) {
                    continue;
                }
                const QString lowered = trimmed.toLower();
                const auto matches = std::count_if(queryWords.cbegin(), queryWords.cend(),
                                                   [&](const QString& word) { return lowered.contains(word); });
                if (matches >= required && !highlights.contains(trimmed)) {
                    highlights.append(trimmed);
                    if (highlights.size() >= maxHighlights) {
                        return highlights;
                    }
                }
            }
        }
    }

    for (const QString& passage : passages) {
        const QString first = passage.section(sentenceBreak(), 0, 0).trimmed();
        if (!first.isEmpty() && !highlights.contains(first)) {
            highlights.append(first);
            if (highlights.size() >= maxHighlights) {
                break;
            }
        }
    }
    return highlights;
}

} // namespace hr
