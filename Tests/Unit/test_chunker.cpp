#include <QtTest/QtTest>
#include "core/indexing/chunker.h"
#include "core/shared/chunk.h"

#include <QRegularExpression>

#include <algorithm>

class TestChunker : public QObject {
    Q_OBJECT

private slots:
    // ── Basic behavior ───────────────────────────────────────────
    void testEmptyTextReturnsEmpty();
    void testWhitespaceOnlyReturnsEmpty();
    void testShortTextReturnsSingleChunk();
    void testParagraphsMergedUpToMaxSize();

    // ── Overlap ──────────────────────────────────────────────────
    void testLongTextCarriesWordOverlap();
    void testZeroOverlapHasNoSeed();
    void testSeedShrinksToFitMaxSize();

    // ── Oversized paragraphs ─────────────────────────────────────
    void testOversizedParagraphSplitsOnWords();
    void testOversizedWordForceSplit();
    void testOversizedTailSeedsNextParagraph();
    void testOversizedTailAbsorbsShortParagraph();

    // ── Chunk rows ───────────────────────────────────────────────
    void testChunkDocumentIndicesContiguous();
    void testChunkDocumentHashesContent();
    void testDeterministic();

    // ── Config ───────────────────────────────────────────────────
    void testInvalidConfigFallsBackToDefaults();

private:
    // Paragraph of distinct words "p<index>w<n>" padded to roughly `length`.
    static QString paragraph(int index, int length);
    static QStringList wordsOf(const QString& text);
};

QString TestChunker::paragraph(int index, int length)
{
    QStringList words;
    int size = 0;
    for (int n = 0; size < length; ++n) {
        const QString word = QStringLiteral("p%1w%2").arg(index).arg(n);
        words.append(word);
        size += static_cast<int>(word.size()) + 1;
    }
    return words.join(QLatin1Char(' '));
}

QStringList TestChunker::wordsOf(const QString& text)
{
    static const QRegularExpression ws(QStringLiteral("\\s+"));
    return text.split(ws, Qt::SkipEmptyParts);
}

// ── Basic behavior ───────────────────────────────────────────────

void TestChunker::testEmptyTextReturnsEmpty()
{
    hr::Chunker chunker;
    QVERIFY(chunker.chunkText(QString()).empty());
}

void TestChunker::testWhitespaceOnlyReturnsEmpty()
{
    hr::Chunker chunker;
    QVERIFY(chunker.chunkText(QStringLiteral("  \n\n \t \n\n  ")).empty());
}

void TestChunker::testShortTextReturnsSingleChunk()
{
    hr::Chunker chunker;
    const QString text = QStringLiteral("La ecuación de Darcy-Weisbach describe la pérdida de carga.");
    const auto chunks = chunker.chunkText(text);
    QCOMPARE(static_cast<int>(chunks.size()), 1);
    QCOMPARE(chunks[0], text);
}

void TestChunker::testParagraphsMergedUpToMaxSize()
{
    hr::Chunker chunker({300, 0});
    const QString text = paragraph(0, 100) + QStringLiteral("\n\n") + paragraph(1, 100);
    const auto chunks = chunker.chunkText(text);
    QCOMPARE(static_cast<int>(chunks.size()), 1);
    QVERIFY(chunks[0].contains(QStringLiteral("\n\n")));
}

// ── Overlap ──────────────────────────────────────────────────────

void TestChunker::testLongTextCarriesWordOverlap()
{
    hr::Chunker chunker({800, 100});

    QStringList paragraphs;
    int total = 0;
    for (int i = 0; total < 2500; ++i) {
        paragraphs.append(paragraph(i, 250));
        total += static_cast<int>(paragraphs.last().size()) + 2;
    }
    const QString text = paragraphs.join(QStringLiteral("\n\n"));
    QVERIFY(text.size() >= 2500);

    const auto chunks = chunker.chunkText(text);
    QVERIFY(chunks.size() >= 3);

    for (size_t i = 0; i < chunks.size(); ++i) {
        QVERIFY2(chunks[i].size() <= 800,
                 qPrintable(QStringLiteral("chunk %1 has %2 chars").arg(i).arg(chunks[i].size())));
        if (i == 0) {
            continue;
        }
        // overlap 100 seeds up to 10 trailing words of the previous chunk.
        const QStringList previous = wordsOf(chunks[i - 1]);
        const QStringList tail = previous.mid(std::max<qsizetype>(0, previous.size() - 10));
        const QString firstWord = wordsOf(chunks[i]).front();
        QVERIFY2(tail.contains(firstWord),
                 qPrintable(QStringLiteral("chunk %1 starts with %2").arg(i).arg(firstWord)));
    }
}

void TestChunker::testZeroOverlapHasNoSeed()
{
    hr::Chunker chunker({300, 0});
    const QString text = paragraph(0, 250) + QStringLiteral("\n\n") + paragraph(1, 250);
    const auto chunks = chunker.chunkText(text);
    QCOMPARE(static_cast<int>(chunks.size()), 2);
    QVERIFY(chunks[1].startsWith(QStringLiteral("p1w0")));
}

void TestChunker::testSeedShrinksToFitMaxSize()
{
    // The second paragraph leaves room for only a few seed words.
    hr::Chunker chunker({300, 200});
    const QString text = paragraph(0, 200) + QStringLiteral("\n\n") + paragraph(1, 280);
    const auto chunks = chunker.chunkText(text);
    QCOMPARE(static_cast<int>(chunks.size()), 2);
    QVERIFY(chunks[1].size() <= 300);
    QVERIFY(chunks[1].contains(QStringLiteral("p1w0")));
}

// ── Oversized paragraphs ─────────────────────────────────────────

void TestChunker::testOversizedParagraphSplitsOnWords()
{
    hr::Chunker chunker({200, 50});
    const QString text = paragraph(0, 900);
    const auto chunks = chunker.chunkText(text);
    QVERIFY(chunks.size() >= 5);

    QStringList rejoined;
    for (const QString& chunk : chunks) {
        QVERIFY(chunk.size() <= 200);
        rejoined.append(wordsOf(chunk));
    }
    // Word splits carry no overlap, so the words come back in order.
    QCOMPARE(rejoined, wordsOf(text));
}

void TestChunker::testOversizedWordForceSplit()
{
    hr::Chunker chunker({100, 0});
    QString word;
    word.fill(QLatin1Char('x'), 250);
    const auto chunks = chunker.chunkText(word);
    QCOMPARE(static_cast<int>(chunks.size()), 3);
    QCOMPARE(static_cast<int>(chunks[0].size()), 100);
    QCOMPARE(static_cast<int>(chunks[1].size()), 100);
    QCOMPARE(static_cast<int>(chunks[2].size()), 50);
}

// Paragraph 1 is 55 words: the split closes p1w0..p1w34 (199 chars) and
// leaves p1w35..p1w54 (119 chars) open.
void TestChunker::testOversizedTailSeedsNextParagraph()
{
    hr::Chunker chunker({200, 100});
    const QString first = paragraph(0, 40);
    const QString oversized = paragraph(1, 320);
    const QString last = paragraph(2, 100);
    const auto chunks = chunker.chunkText(first + QStringLiteral("\n\n") + oversized
                                          + QStringLiteral("\n\n") + last);

    QCOMPARE(static_cast<int>(chunks.size()), 4);
    for (const QString& chunk : chunks) {
        QVERIFY(chunk.size() <= 200);
    }
    const QStringList words = wordsOf(oversized);
    QCOMPARE(chunks[0], first);
    QCOMPARE(chunks[2], words.mid(35).join(QLatin1Char(' ')));
    // 119 + 2 + 103 chars does not fit, so the last paragraph takes the
    // ten trailing words of the split as its seed.
    QCOMPARE(chunks[3], words.mid(45).join(QLatin1Char(' ')) + QLatin1Char(' ') + last);
}

void TestChunker::testOversizedTailAbsorbsShortParagraph()
{
    hr::Chunker chunker({200, 100});
    const QString oversized = paragraph(1, 320);
    const QString last = paragraph(2, 40);
    const auto chunks = chunker.chunkText(oversized + QStringLiteral("\n\n") + last);

    QCOMPARE(static_cast<int>(chunks.size()), 2);
    QCOMPARE(chunks[1], wordsOf(oversized).mid(35).join(QLatin1Char(' ')) + QStringLiteral("\n\n") + last);
    QVERIFY(chunks[1].size() <= 200);
}

// ── Chunk rows ───────────────────────────────────────────────────

void TestChunker::testChunkDocumentIndicesContiguous()
{
    hr::Chunker chunker({200, 40});
    const QString text = paragraph(0, 180) + QStringLiteral("\n\n") + paragraph(1, 180)
        + QStringLiteral("\n\n") + paragraph(2, 180);
    const auto chunks = chunker.chunkDocument(QStringLiteral("doc-1"), text);
    QVERIFY(chunks.size() >= 3);
    for (size_t i = 0; i < chunks.size(); ++i) {
        QCOMPARE(chunks[i].chunkIndex, static_cast<int>(i));
        QCOMPARE(chunks[i].documentId, QStringLiteral("doc-1"));
        QVERIFY(chunks[i].embeddingState == hr::EmbeddingState::Missing);
    }
}

void TestChunker::testChunkDocumentHashesContent()
{
    hr::Chunker chunker;
    const auto chunks = chunker.chunkDocument(QStringLiteral("doc-1"), QStringLiteral("Caudal de diseño"));
    QCOMPARE(static_cast<int>(chunks.size()), 1);
    QCOMPARE(chunks[0].contentHash, hr::computeContentHash(QStringLiteral("Caudal de diseño")));
    QCOMPARE(static_cast<int>(chunks[0].contentHash.size()), 64);
}

void TestChunker::testDeterministic()
{
    hr::Chunker chunker({300, 100});
    const QString text = paragraph(0, 250) + QStringLiteral("\n\n") + paragraph(1, 250)
        + QStringLiteral("\n\n") + paragraph(2, 250);
    QCOMPARE(chunker.chunkText(text), chunker.chunkText(text));
}

// ── Config ───────────────────────────────────────────────────────

void TestChunker::testInvalidConfigFallsBackToDefaults()
{
    hr::Chunker chunker({0, -5});
    QCOMPARE(chunker.config().maxSize, 1000);
    QCOMPARE(chunker.config().overlap, 0);
}

QTEST_MAIN(TestChunker)
#include "test_chunker.moc"
