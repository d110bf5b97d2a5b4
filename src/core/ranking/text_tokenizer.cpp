#include "core/ranking/text_tokenizer.h"

#include <QRegularExpression>
#include <QSet>

namespace hr {

namespace {

const QSet<QString>& stopWords()
{
    static const QSet<QString> words = {
        // Spanish
        QStringLiteral("el"), QStringLiteral("la"), QStringLiteral("de"), QStringLiteral("que"),
        QStringLiteral("y"), QStringLiteral("a"), QStringLiteral("en"), QStringLiteral("un"),
        QStringLiteral("es"), QStringLiteral("se"), QStringLiteral("no"), QStringLiteral("te"),
        QStringLiteral("lo"), QStringLiteral("le"), QStringLiteral("da"), QStringLiteral("su"),
        QStringLiteral("por"), QStringLiteral("son"), QStringLiteral("con"), QStringLiteral("para"),
        QStringLiteral("al"), QStringLiteral("del"), QStringLiteral("los"), QStringLiteral("las"),
        QStringLiteral("una"), QStringLiteral("como"),
        // English
        QStringLiteral("the"), QStringLiteral("and"), QStringLiteral("or"), QStringLiteral("but"),
        QStringLiteral("in"), QStringLiteral("on"), QStringLiteral("at"), QStringLiteral("to"),
        QStringLiteral("for"), QStringLiteral("of"), QStringLiteral("with"), QStringLiteral("by"),
        QStringLiteral("from"),
    };
    return words;
}

const QRegularExpression& whitespace()
{
    static const QRegularExpression re(QStringLiteral("\\s+"));
    return re;
}

} // namespace

QStringList TextTokenizer::tokenize(const QString& text)
{
    if (text.isEmpty()) {
        return {};
    }

    QString normalized = text.toLower();
    for (QChar& ch : normalized) {
        if (!ch.isLetterOrNumber() && ch != QLatin1Char('_') && !ch.isSpace()) {
            ch = QLatin1Char(' ');
        }
    }

    QStringList tokens;
    for (const QString& token : normalized.split(whitespace(), Qt::SkipEmptyParts)) {
        if (token.size() > 2 && !isStopWord(token)) {
            tokens.append(token);
        }
    }
    return tokens;
}

bool TextTokenizer::isStopWord(const QString& token)
{
    return stopWords().contains(token);
}

QStringList TextTokenizer::words(const QString& text)
{
    return text.toLower().split(whitespace(), Qt::SkipEmptyParts);
}

} // namespace hr
