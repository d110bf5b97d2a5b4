#include "core/indexing/chunker.h"
#include "core/shared/logging.h"

#include <QRegularExpression>

namespace hr {

namespace {

const QRegularExpression& paragraphSeparator()
{
    static const QRegularExpression re(QStringLiteral("\\n\\s*\\n"));
    return re;
}

const QRegularExpression& whitespace()
{
    static const QRegularExpression re(QStringLiteral("\\s+"));
    return re;
}

} // namespace

// ── Construction ────────────────────────────────────────────

Chunker::Chunker(const Config& config)
    : m_config(config)
{
    // Sanity-check config bounds
    if (m_config.maxSize <= 0) {
        m_config.maxSize = 1000;
    }
    if (m_config.overlap < 0) {
        m_config.overlap = 0;
    }
}

// ── Public API ──────────────────────────────────────────────

std::vector<QString> Chunker::chunkText(const QString& text) const
{
    std::vector<QString> chunks;

    const QStringList paragraphs = text.split(paragraphSeparator(), Qt::SkipEmptyParts);
    QString current;

    for (const QString& rawParagraph : paragraphs) {
        const QString paragraph = rawParagraph.trimmed();
        if (paragraph.isEmpty()) {
            continue;
        }

        if (paragraph.size() > m_config.maxSize) {
            // The open chunk closes; the last piece of the split stays open.
            emitChunk(current, chunks);
            current = splitOversizedParagraph(paragraph, chunks);
            continue;
        }

        if (current.isEmpty()) {
            current = paragraph;
            continue;
        }

        if (current.size() + 2 + paragraph.size() <= m_config.maxSize) {
            current += QStringLiteral("\n\n") + paragraph;
            continue;
        }

        const QString seed = overlapSeed(current, paragraph);
        emitChunk(current, chunks);
        current = seed.isEmpty() ? paragraph : seed + QLatin1Char(' ') + paragraph;
    }

    emitChunk(current, chunks);

    LOG_DEBUG(hrIndex, "Chunked text: %d chunks from %d chars",
              static_cast<int>(chunks.size()),
              static_cast<int>(text.size()));

    return chunks;
}

std::vector<Chunk> Chunker::chunkDocument(const QString& documentId, const QString& text) const
{
    const std::vector<QString> pieces = chunkText(text);

    std::vector<Chunk> chunks;
    chunks.reserve(pieces.size());
    for (size_t i = 0; i < pieces.size(); ++i) {
        Chunk c;
        c.documentId = documentId;
        c.chunkIndex = static_cast<int>(i);
        c.content = pieces[i];
        c.contentHash = computeContentHash(pieces[i]);
        chunks.push_back(std::move(c));
    }
    return chunks;
}

// ── Private helpers ─────────────────────────────────────────

QString Chunker::splitOversizedParagraph(const QString& paragraph, std::vector<QString>& out) const
{
    const QStringList words = paragraph.split(whitespace(), Qt::SkipEmptyParts);
    const int maxSize = m_config.maxSize;
    QString piece;

    for (const QString& word : words) {
        if (word.size() > maxSize) {
            emitChunk(piece, out);
            qsizetype pos = 0;
            for (; word.size() - pos > maxSize; pos += maxSize) {
                out.push_back(word.mid(pos, maxSize));
            }
            piece = word.mid(pos);
            continue;
        }

        if (piece.isEmpty()) {
            piece = word;
        } else if (piece.size() + 1 + word.size() <= maxSize) {
            piece += QLatin1Char(' ') + word;
        } else {
            emitChunk(piece, out);
            piece = word;
        }
    }

    return piece;
}

QString Chunker::overlapSeed(const QString& closedChunk, const QString& nextParagraph) const
{
    const int seedWords = m_config.overlap / 10;
    if (seedWords <= 0) {
        return {};
    }

    QStringList words = closedChunk.split(whitespace(), Qt::SkipEmptyParts);
    if (words.size() > seedWords) {
        words = words.mid(words.size() - seedWords);
    }

    // Drop leading seed words until seed + paragraph fits.
    while (!words.isEmpty()) {
        const QString seed = words.join(QLatin1Char(' '));
        if (seed.size() + 1 + nextParagraph.size() <= m_config.maxSize) {
            return seed;
        }
        words.removeFirst();
    }
    return {};
}

void Chunker::emitChunk(const QString& text, std::vector<QString>& out)
{
    const QString trimmed = text.trimmed();
    if (!trimmed.isEmpty()) {
        out.push_back(trimmed);
    }
}

} // namespace hr
