#include <QtTest/QtTest>
#include "core/index/knowledge_store.h"
#include "document_builders.h"

#include <memory>

using hr::test::makeChunk;
using hr::test::makeDocument;

class TestKnowledgeStore : public QObject {
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    // ── Documents ────────────────────────────────────────────────
    void testInsertAssignsChunkIds();
    void testGetDocumentRoundTrip();
    void testDuplicateInsertIsAtomic();
    void testListDocumentsFilters();
    void testUpdateDocumentFields();
    void testReplaceChunksKeepsIndicesContiguous();
    void testDeleteCascadesChunks();

    // ── Chunks ───────────────────────────────────────────────────
    void testEmbeddingStates();
    void testListChunksAfterPages();
    void testCandidateChunksCarryDocumentFields();

    // ── Domain lookups ───────────────────────────────────────────
    void testFormulasBySubcategory();
    void testRegulationsByRegion();
    void testEmbeddingHealth();
    void testSettings();

private:
    std::unique_ptr<hr::KnowledgeStore> m_store;
};

void TestKnowledgeStore::init()
{
    auto store = hr::KnowledgeStore::open(QStringLiteral(":memory:"));
    QVERIFY(store.has_value());
    m_store = std::make_unique<hr::KnowledgeStore>(std::move(*store));
}

void TestKnowledgeStore::cleanup()
{
    m_store.reset();
}

// ── Documents ────────────────────────────────────────────────────

void TestKnowledgeStore::testInsertAssignsChunkIds()
{
    std::vector<hr::Chunk> chunks = {makeChunk(QStringLiteral("uno")),
                                     makeChunk(QStringLiteral("dos"), {1.0f, 0.0f})};
    QVERIFY(m_store->insertDocument(makeDocument(QStringLiteral("doc-1"), hr::DocumentCategory::Hydraulics,
                                                 QStringLiteral("Tuberías"), QStringLiteral("uno dos")),
                                    chunks));
    QVERIFY(chunks[0].id > 0);
    QVERIFY(chunks[1].id > chunks[0].id);
    QCOMPARE(chunks[1].chunkIndex, 1);
    QVERIFY(chunks[0].embeddingState == hr::EmbeddingState::Missing);
    QVERIFY(chunks[1].embeddingState == hr::EmbeddingState::Valid);
    QCOMPARE(chunks[0].contentHash, hr::computeContentHash(QStringLiteral("uno")));
    QCOMPARE(m_store->countChunks().value_or(-1), static_cast<int64_t>(2));
}

void TestKnowledgeStore::testGetDocumentRoundTrip()
{
    hr::Document document = makeDocument(QStringLiteral("doc-1"), hr::DocumentCategory::BestPractices,
                                         QStringLiteral("Operación de bombas"),
                                         QStringLiteral("Contenido"),
                                         {QStringLiteral("Chile"), QStringLiteral("LATAM")});
    document.subcategory = QStringLiteral("pumps");
    document.metadata.language = QStringLiteral("en");
    document.metadata.keywords = {QStringLiteral("bomba")};
    document.metadata.references.push_back({QStringLiteral("r1"), QStringLiteral("manual"),
                                            QStringLiteral("M11"), QStringLiteral("AWWA"), 2017, {}});
    std::vector<hr::Chunk> chunks = {makeChunk(QStringLiteral("Contenido"))};
    QVERIFY(m_store->insertDocument(document, chunks));

    const auto loaded = m_store->getDocument(QStringLiteral("doc-1"));
    QVERIFY(loaded.has_value());
    QVERIFY(loaded->category == hr::DocumentCategory::BestPractices);
    QCOMPARE(loaded->subcategory, QStringLiteral("pumps"));
    QCOMPARE(loaded->regions, document.regions);
    QCOMPARE(loaded->metadata.language, QStringLiteral("en"));
    QCOMPARE(loaded->metadata.keywords, document.metadata.keywords);
    QCOMPARE(static_cast<int>(loaded->metadata.references.size()), 1);
    QCOMPARE(loaded->metadata.references[0].year, 2017);
    QCOMPARE(loaded->status, QStringLiteral("active"));
    QCOMPARE(loaded->createdAt, document.createdAt);

    QVERIFY(!m_store->getDocument(QStringLiteral("missing")).has_value());
}

void TestKnowledgeStore::testDuplicateInsertIsAtomic()
{
    const hr::Document document = makeDocument(QStringLiteral("doc-1"), hr::DocumentCategory::General,
                                               QStringLiteral("T"), QStringLiteral("C"));
    std::vector<hr::Chunk> first = {makeChunk(QStringLiteral("a"))};
    QVERIFY(m_store->insertDocument(document, first));

    std::vector<hr::Chunk> second = {makeChunk(QStringLiteral("b")), makeChunk(QStringLiteral("c"))};
    QVERIFY(!m_store->insertDocument(document, second));
    QCOMPARE(m_store->countChunks().value_or(-1), static_cast<int64_t>(1));
}

void TestKnowledgeStore::testListDocumentsFilters()
{
    std::vector<hr::Chunk> none;
    QVERIFY(m_store->insertDocument(makeDocument(QStringLiteral("old"), hr::DocumentCategory::Hydraulics,
                                                 QStringLiteral("Old"), QStringLiteral("x"),
                                                 {QStringLiteral("Chile")}, 1000.0), none));
    QVERIFY(m_store->insertDocument(makeDocument(QStringLiteral("new"), hr::DocumentCategory::Hydraulics,
                                                 QStringLiteral("New"), QStringLiteral("x"),
                                                 {QStringLiteral("Peru")}, 2000.0), none));
    QVERIFY(m_store->insertDocument(makeDocument(QStringLiteral("reg"), hr::DocumentCategory::Regulations,
                                                 QStringLiteral("Reg"), QStringLiteral("x"),
                                                 {QStringLiteral("Chile")}, 1500.0), none));

    const auto all = m_store->listDocuments();
    QCOMPARE(static_cast<int>(all.size()), 3);
    QCOMPARE(all[0].id, QStringLiteral("new"));

    hr::DocumentFilter hydraulics;
    hydraulics.category = hr::DocumentCategory::Hydraulics;
    QCOMPARE(static_cast<int>(m_store->listDocuments(hydraulics).size()), 2);

    hr::DocumentFilter chile;
    chile.region = QStringLiteral("Chile");
    QCOMPARE(static_cast<int>(m_store->listDocuments(chile).size()), 2);

    hr::DocumentFilter english;
    english.language = QStringLiteral("en");
    QVERIFY(m_store->listDocuments(english).empty());

    QCOMPARE(static_cast<int>(m_store->listDocuments({}, 1).size()), 1);
}

void TestKnowledgeStore::testUpdateDocumentFields()
{
    std::vector<hr::Chunk> none;
    QVERIFY(m_store->insertDocument(makeDocument(QStringLiteral("doc-1"), hr::DocumentCategory::General,
                                                 QStringLiteral("Antes"), QStringLiteral("x")), none));

    hr::DocumentPatch patch;
    patch.title = QStringLiteral("Después");
    patch.version = QStringLiteral("2.0");
    QVERIFY(m_store->updateDocumentFields(QStringLiteral("doc-1"), patch));

    const auto loaded = m_store->getDocument(QStringLiteral("doc-1"));
    QCOMPARE(loaded->title, QStringLiteral("Después"));
    QCOMPARE(loaded->version, QStringLiteral("2.0"));
    QCOMPARE(loaded->content, QStringLiteral("x"));
    QVERIFY(loaded->updatedAt > loaded->createdAt);

    QVERIFY(!m_store->updateDocumentFields(QStringLiteral("nope"), patch));
}

void TestKnowledgeStore::testReplaceChunksKeepsIndicesContiguous()
{
    std::vector<hr::Chunk> chunks = {makeChunk(QStringLiteral("a")), makeChunk(QStringLiteral("b")),
                                     makeChunk(QStringLiteral("c"))};
    QVERIFY(m_store->insertDocument(makeDocument(QStringLiteral("doc-1"), hr::DocumentCategory::General,
                                                 QStringLiteral("T"), QStringLiteral("a b c")), chunks));

    std::vector<hr::Chunk> replacement = {makeChunk(QStringLiteral("x")), makeChunk(QStringLiteral("y"))};
    QVERIFY(m_store->replaceChunks(QStringLiteral("doc-1"), replacement));

    const auto stored = m_store->chunksForDocument(QStringLiteral("doc-1"));
    QCOMPARE(static_cast<int>(stored.size()), 2);
    QCOMPARE(stored[0].chunkIndex, 0);
    QCOMPARE(stored[1].chunkIndex, 1);
    QCOMPARE(stored[0].content, QStringLiteral("x"));
    QCOMPARE(m_store->countChunks().value_or(-1), static_cast<int64_t>(2));

    QVERIFY(!m_store->replaceChunks(QStringLiteral("nope"), replacement));
}

void TestKnowledgeStore::testDeleteCascadesChunks()
{
    std::vector<hr::Chunk> chunks = {makeChunk(QStringLiteral("a")), makeChunk(QStringLiteral("b"))};
    QVERIFY(m_store->insertDocument(makeDocument(QStringLiteral("doc-1"), hr::DocumentCategory::General,
                                                 QStringLiteral("T"), QStringLiteral("a b")), chunks));
    QVERIFY(m_store->deleteDocument(QStringLiteral("doc-1")));
    QCOMPARE(m_store->countChunks().value_or(-1), static_cast<int64_t>(0));
    QVERIFY(!m_store->deleteDocument(QStringLiteral("doc-1")));
}

// ── Chunks ───────────────────────────────────────────────────────

void TestKnowledgeStore::testEmbeddingStates()
{
    std::vector<hr::Chunk> chunks = {makeChunk(QStringLiteral("a")), makeChunk(QStringLiteral("b")),
                                     makeChunk(QStringLiteral("c"))};
    QVERIFY(m_store->insertDocument(makeDocument(QStringLiteral("doc-1"), hr::DocumentCategory::General,
                                                 QStringLiteral("T"), QStringLiteral("a b c")), chunks));

    hr::StoredEmbedding embedding;
    embedding.values = {0.25f, -0.5f, 1.0f};
    embedding.providerId = QStringLiteral("ollama-nomic");
    QVERIFY(m_store->updateChunkEmbedding(chunks[0].id, embedding));
    QVERIFY(m_store->markChunkEmbeddingFailed(chunks[1].id, QStringLiteral("malformed")));
    QVERIFY(m_store->markChunkEmbeddingFailed(chunks[2].id, QStringLiteral("timeout")));

    const auto stored = m_store->chunksByIds({chunks[0].id, chunks[1].id, chunks[2].id});
    QCOMPARE(static_cast<int>(stored.size()), 3);
    QVERIFY(stored[0].embeddingState == hr::EmbeddingState::Valid);
    QVERIFY(stored[0].embedding->values == embedding.values);
    QCOMPARE(stored[0].embedding->providerId, QStringLiteral("ollama-nomic"));
    QVERIFY(stored[1].embeddingState == hr::EmbeddingState::Malformed);
    QVERIFY(stored[2].embeddingState == hr::EmbeddingState::Missing);
    QCOMPARE(stored[2].embeddingError, QStringLiteral("timeout"));

    // A corrupt blob reads back as malformed.
    sqlite3_stmt* stmt = nullptr;
    QCOMPARE(sqlite3_prepare_v2(m_store->rawDb(), "UPDATE chunks SET embedding_dim = 5 WHERE id = ?1",
                                -1, &stmt, nullptr), SQLITE_OK);
    sqlite3_bind_int64(stmt, 1, chunks[0].id);
    QCOMPARE(sqlite3_step(stmt), SQLITE_DONE);
    sqlite3_finalize(stmt);
    QVERIFY(m_store->chunksByIds({chunks[0].id})[0].embeddingState == hr::EmbeddingState::Malformed);
}

void TestKnowledgeStore::testListChunksAfterPages()
{
    std::vector<hr::Chunk> chunks;
    for (int i = 0; i < 5; ++i) {
        chunks.push_back(makeChunk(QStringLiteral("chunk %1").arg(i)));
    }
    QVERIFY(m_store->insertDocument(makeDocument(QStringLiteral("doc-1"), hr::DocumentCategory::General,
                                                 QStringLiteral("T"), QStringLiteral("x")), chunks));

    const auto firstPage = m_store->listChunksAfter(0, 2);
    QCOMPARE(static_cast<int>(firstPage.size()), 2);
    const auto secondPage = m_store->listChunksAfter(firstPage.back().id, 2);
    QCOMPARE(static_cast<int>(secondPage.size()), 2);
    QVERIFY(secondPage.front().id > firstPage.back().id);
    const auto lastPage = m_store->listChunksAfter(secondPage.back().id, 2);
    QCOMPARE(static_cast<int>(lastPage.size()), 1);
    QVERIFY(m_store->listChunksAfter(lastPage.back().id, 2).empty());
}

void TestKnowledgeStore::testCandidateChunksCarryDocumentFields()
{
    hr::Document document = makeDocument(QStringLiteral("doc-1"), hr::DocumentCategory::Hydraulics,
                                         QStringLiteral("Golpe de ariete"), QStringLiteral("x"),
                                         {QStringLiteral("LATAM")});
    document.metadata.references.push_back({});
    document.metadata.references.push_back({});
    std::vector<hr::Chunk> chunks = {makeChunk(QStringLiteral("a")), makeChunk(QStringLiteral("b"))};
    QVERIFY(m_store->insertDocument(document, chunks));

    std::vector<hr::Chunk> other = {makeChunk(QStringLiteral("c"))};
    QVERIFY(m_store->insertDocument(makeDocument(QStringLiteral("doc-2"), hr::DocumentCategory::General,
                                                 QStringLiteral("Otro"), QStringLiteral("c")), other));

    hr::DocumentFilter filter;
    filter.region = QStringLiteral("LATAM");
    const auto candidates = m_store->candidateChunks(filter);
    QCOMPARE(static_cast<int>(candidates.size()), 2);
    QCOMPARE(candidates[0].title, QStringLiteral("Golpe de ariete"));
    QVERIFY(candidates[0].category == hr::DocumentCategory::Hydraulics);
    QCOMPARE(candidates[0].regions, QStringList({QStringLiteral("LATAM")}));
    QCOMPARE(candidates[0].language, QStringLiteral("es"));
    QCOMPARE(candidates[0].referenceCount, 2);

    QCOMPARE(static_cast<int>(m_store->candidateChunks({}).size()), 3);
}

// ── Domain lookups ───────────────────────────────────────────────

void TestKnowledgeStore::testFormulasBySubcategory()
{
    hr::Document pumps = makeDocument(QStringLiteral("pumps"), hr::DocumentCategory::Hydraulics,
                                      QStringLiteral("Bombas"), QStringLiteral("x"));
    pumps.subcategory = QStringLiteral("pumps");
    pumps.metadata.formulas.push_back({QStringLiteral("f1"), QStringLiteral("Potencia"),
                                       QStringLiteral("pump"), QStringLiteral("P = ρ g Q H / η")});
    hr::Document pipes = makeDocument(QStringLiteral("pipes"), hr::DocumentCategory::Hydraulics,
                                      QStringLiteral("Tuberías"), QStringLiteral("x"));
    pipes.subcategory = QStringLiteral("pipes");
    pipes.metadata.formulas.push_back({QStringLiteral("f2"), QStringLiteral("Darcy"),
                                       QStringLiteral("head_loss"), QStringLiteral("hf = f L/D v²/2g")});
    hr::Document regulation = makeDocument(QStringLiteral("reg"), hr::DocumentCategory::Regulations,
                                           QStringLiteral("Norma"), QStringLiteral("x"));
    regulation.metadata.formulas.push_back({QStringLiteral("f3"), QStringLiteral("Ignorada"), {}, {}});

    std::vector<hr::Chunk> none;
    QVERIFY(m_store->insertDocument(pumps, none));
    QVERIFY(m_store->insertDocument(pipes, none));
    QVERIFY(m_store->insertDocument(regulation, none));

    QCOMPARE(static_cast<int>(m_store->formulas(std::nullopt).size()), 2);
    const auto pumpFormulas = m_store->formulas(QStringLiteral("pumps"));
    QCOMPARE(static_cast<int>(pumpFormulas.size()), 1);
    QCOMPARE(pumpFormulas[0].id, QStringLiteral("f1"));
    QVERIFY(m_store->formulas(QStringLiteral("tanks")).empty());
}

void TestKnowledgeStore::testRegulationsByRegion()
{
    hr::Document chile = makeDocument(QStringLiteral("nch"), hr::DocumentCategory::Regulations,
                                      QStringLiteral("NCh 691"), QStringLiteral("Agua potable"),
                                      {QStringLiteral("Chile")});
    chile.metadata.references.push_back({QStringLiteral("r1"), QStringLiteral("standard"),
                                         QStringLiteral("NCh 691"), QStringLiteral("INN"), 2015, {}});
    std::vector<hr::Chunk> none;
    QVERIFY(m_store->insertDocument(chile, none));
    QVERIFY(m_store->insertDocument(makeDocument(QStringLiteral("hyd"), hr::DocumentCategory::Hydraulics,
                                                 QStringLiteral("Manual"), QStringLiteral("x"),
                                                 {QStringLiteral("Chile")}), none));

    const auto regulations = m_store->regulations(QStringLiteral("Chile"));
    QCOMPARE(static_cast<int>(regulations.size()), 1);
    QCOMPARE(regulations[0].id, QStringLiteral("nch"));
    QCOMPARE(regulations[0].content, QStringLiteral("Agua potable"));
    QCOMPARE(static_cast<int>(regulations[0].references.size()), 1);
    QVERIFY(m_store->regulations(QStringLiteral("Peru")).empty());
}

void TestKnowledgeStore::testEmbeddingHealth()
{
    std::vector<hr::Chunk> full = {makeChunk(QStringLiteral("a"), {1.0f, 0.0f}),
                                   makeChunk(QStringLiteral("b"), {0.0f, 1.0f, 0.0f})};
    std::vector<hr::Chunk> partial = {makeChunk(QStringLiteral("c"), {1.0f, 0.0f}),
                                      makeChunk(QStringLiteral("d"))};
    QVERIFY(m_store->insertDocument(makeDocument(QStringLiteral("full"), hr::DocumentCategory::General,
                                                 QStringLiteral("Full"), QStringLiteral("x"), {}, 1.0), full));
    QVERIFY(m_store->insertDocument(makeDocument(QStringLiteral("partial"), hr::DocumentCategory::General,
                                                 QStringLiteral("Partial"), QStringLiteral("x"), {}, 2.0), partial));
    QVERIFY(m_store->markChunkEmbeddingFailed(partial[1].id, QStringLiteral("malformed")));

    const hr::EmbeddingHealth health = m_store->embeddingHealth(2);
    QCOMPARE(health.totalChunks, static_cast<int64_t>(4));
    QCOMPARE(health.validEmbeddings, static_cast<int64_t>(3));
    QCOMPARE(health.malformedEmbeddings, static_cast<int64_t>(1));
    QCOMPARE(health.missingEmbeddings, static_cast<int64_t>(0));
    QCOMPARE(health.dimensionMismatches, static_cast<int64_t>(1));
    QCOMPARE(health.coveragePct, 75.0);
    QCOMPARE(health.status, QStringLiteral("partially_indexed"));
    QCOMPARE(static_cast<int>(health.documents.size()), 2);
    QCOMPARE(health.documents[0].status, QStringLiteral("fully_indexed"));
    QCOMPARE(health.documents[1].status, QStringLiteral("partially_indexed"));
    QCOMPARE(health.documents[1].corruptedChunks, 1);
}

void TestKnowledgeStore::testSettings()
{
    QCOMPARE(m_store->getSetting(QStringLiteral("schema_version")).value_or(QString()), QStringLiteral("2"));
    QCOMPARE(m_store->getSetting(QStringLiteral("vector_sync_epoch")).value_or(QString()), QStringLiteral("0"));
    QVERIFY(!m_store->getSetting(QStringLiteral("absent")).has_value());

    QVERIFY(m_store->setSetting(QStringLiteral("vector_migration_pending"), QStringLiteral("1")));
    QVERIFY(m_store->setSetting(QStringLiteral("vector_migration_pending"), QStringLiteral("0")));
    QCOMPARE(m_store->getSetting(QStringLiteral("vector_migration_pending")).value_or(QString()),
             QStringLiteral("0"));
}

QTEST_MAIN(TestKnowledgeStore)
#include "test_knowledge_store.moc"
