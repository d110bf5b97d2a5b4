#pragma once

#include <QString>
#include <QStringList>

namespace hr {

// Up to maxHighlights sentences that contain at least
// min(2, 0.5 * queryWords) of the query's words, topped up with the first
// sentence of each passage.
QStringList extractHighlights(const QString& query, const QStringList& passages, int maxHighlights = 3);

} // namespace hr
