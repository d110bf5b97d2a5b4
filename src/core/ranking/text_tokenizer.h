#pragma once

#include <QString>
#include <QStringList>

namespace hr {

// Shared tokenizer for the lexical scorer, the re-ranker and the quality
// validator. Query and corpus go through the same path so term
// frequencies are comparable.
class TextTokenizer {
public:
    // Lower-cases, replaces punctuation with spaces, drops tokens of two
    // characters or fewer and Spanish/English stop words.
    static QStringList tokenize(const QString& text);

    static bool isStopWord(const QString& token);

    // Whitespace split of the lower-cased text, no filtering.
    static QStringList words(const QString& text);
};

} // namespace hr
