#pragma once

#include "core/shared/chunk.h"

#include <QString>
#include <QStringList>
#include <vector>

namespace hr {

// Configuration for the Chunker.
// Defined outside the class to avoid the "default member initializer needed
// within enclosing class" issue in C++.
struct ChunkerConfig {
    int maxSize = 1000;    // Characters per chunk, hard upper bound
    int overlap = 200;     // The seed is overlap / 10 words
};

// Chunker splits document text into overlapping segments for embedding.
//
// Split priority (highest to lowest):
//   1. Paragraph boundary (blank line)
//   2. Word boundary, for a paragraph longer than maxSize
//   3. Force character split at maxSize, for a single oversized word
//
// When a chunk closes at a paragraph boundary the next chunk is seeded with
// the last overlap/10 words of the previous one. Word and character splits
// inside an oversized paragraph carry no overlap; the last piece of such a
// paragraph stays open, so the following paragraph joins it or is seeded
// from it.
class Chunker {
public:
    using Config = ChunkerConfig;

    explicit Chunker(const Config& config = {});

    // Split text into ordered chunk strings. Returns an empty vector if the
    // text has no non-whitespace content.
    std::vector<QString> chunkText(const QString& text) const;

    // Same split, materialized as Chunk rows with contiguous chunkIndex
    // values starting at 0 and content hashes filled in.
    std::vector<Chunk> chunkDocument(const QString& documentId, const QString& text) const;

    const Config& config() const { return m_config; }

private:
    // Word-split a paragraph that alone exceeds maxSize. Closed pieces go to
    // out; the trailing piece is returned still open.
    QString splitOversizedParagraph(const QString& paragraph, std::vector<QString>& out) const;

    // Trailing words of a closed chunk that still leave room for nextParagraph.
    QString overlapSeed(const QString& closedChunk, const QString& nextParagraph) const;

    static void emitChunk(const QString& text, std::vector<QString>& out);

    Config m_config;
};

} // namespace hr
