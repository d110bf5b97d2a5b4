#include <QtTest/QtTest>
#include "core/embedding/embedding_provider_registry.h"
#include "core/index/knowledge_store.h"
#include "core/retrieval/knowledge_engine.h"
#include "core/vector/vector_index_client.h"
#include "document_builders.h"
#include "fake_http_transport.h"
#include "fake_vector_index.h"

#include <memory>

using hr::test::makeDocument;

namespace {

// Each paragraph fits the small chunk size alone but not with its
// neighbour, so the document splits into exactly three chunks.
const QString kFirst = QStringLiteral("Golpe de ariete en la linea de impulsion");
const QString kSecond = QStringLiteral("Valvulas de alivio calibradas a doce bar");
const QString kThird = QStringLiteral("Tanque hidroneumatico con membrana de goma");

QString threeParagraphs()
{
    return kFirst + QStringLiteral("\n\n") + kSecond + QStringLiteral("\n\n") + kThird;
}

} // namespace

class TestDocumentIngestion : public QObject {
    Q_OBJECT

private slots:
    void initTestCase();
    void init();
    void cleanup();

    // ── Add ──────────────────────────────────────────────────────
    void testAddStoresChunksAndVectors();
    void testAddAssignsIdWhenMissing();
    void testAddRejectsEmptyDocument();
    void testAddRejectsDuplicateId();
    void testAddReportsProgress();
    void testFirstChunkFailureAbortsIngestion();
    void testLaterChunkFailureIsRecorded();
    void testUnreachableIndexStillStoresDocument();

    // ── Update ───────────────────────────────────────────────────
    void testUpdateReusesUnchangedVectors();
    void testUpdateMetadataOnlyKeepsChunks();
    void testUpdateUnknownDocumentRejected();
    void testUpdateRejectsEmptyContent();
    void testUpdateWhileIndexUnreachableRepairedBySync();

    // ── Delete ───────────────────────────────────────────────────
    void testDeleteRemovesVectors();
    void testDeleteUnknownDocument();
    void testDeleteWhileIndexUnreachablePrunedBySync();

private:
    std::unique_ptr<hr::KnowledgeStore> m_store;
    std::unique_ptr<hr::test::FakeHttpTransport> m_transport;
    std::unique_ptr<hr::test::FakeVectorIndex> m_index;
    std::unique_ptr<hr::EmbeddingProviderRegistry> m_registry;
    std::unique_ptr<hr::KnowledgeEngine> m_engine;
    QString m_collection;
};

void TestDocumentIngestion::initTestCase()
{
    qunsetenv("OPENAI_API_KEY");
}

void TestDocumentIngestion::init()
{
    auto store = hr::KnowledgeStore::open(QStringLiteral(":memory:"));
    QVERIFY(store.has_value());
    m_store = std::make_unique<hr::KnowledgeStore>(std::move(*store));

    m_transport = std::make_unique<hr::test::FakeHttpTransport>(768);
    m_index = std::make_unique<hr::test::FakeVectorIndex>();

    hr::Settings settings;
    settings.activeProviderId = QStringLiteral("ollama-nomic");
    m_registry = std::make_unique<hr::EmbeddingProviderRegistry>(settings, m_transport.get());

    hr::EngineConfig config;
    config.chunker.maxSize = 60;
    config.chunker.overlap = 0;
    config.sync.pauseMs = 0;
    config.migrateOnProviderSwitch = false;
    m_collection = config.collectionName;
    m_engine = std::make_unique<hr::KnowledgeEngine>(*m_store, *m_index, *m_registry, config);
}

void TestDocumentIngestion::cleanup()
{
    m_engine.reset();
    m_registry.reset();
    m_index.reset();
    m_transport.reset();
    m_store.reset();
}

// ── Add ──────────────────────────────────────────────────────────

void TestDocumentIngestion::testAddStoresChunksAndVectors()
{
    const hr::IngestionResult result = m_engine->addDocument(
        makeDocument(QStringLiteral("surge"), hr::DocumentCategory::Hydraulics,
                     QStringLiteral("Transitorios"), threeParagraphs(), {QStringLiteral("LATAM")}));

    QVERIFY(result.status == hr::IngestionStatus::Indexed);
    QVERIFY(result.ok());
    QCOMPARE(result.documentId, QStringLiteral("surge"));
    QCOMPARE(result.chunkCount, 3);
    QCOMPARE(result.embeddedChunks, 3);
    QVERIFY(result.failures.empty());
    QVERIFY(!result.degraded);
    QVERIFY(result.vectorIndexUpdated);

    const std::vector<hr::Chunk> chunks = m_store->chunksForDocument(QStringLiteral("surge"));
    QCOMPARE(static_cast<int>(chunks.size()), 3);
    for (int i = 0; i < 3; ++i) {
        const hr::Chunk& chunk = chunks[static_cast<size_t>(i)];
        QCOMPARE(chunk.chunkIndex, i);
        QVERIFY(chunk.embeddingState == hr::EmbeddingState::Valid);
        QVERIFY(chunk.embedding.has_value());
        QCOMPARE(chunk.embedding->dimension(), 768);
        QCOMPARE(chunk.embedding->providerId, QStringLiteral("ollama-nomic"));

        const std::optional<hr::VectorRecord> record =
            m_index->record(m_collection, hr::chunkRecordId(chunk.id));
        QVERIFY(record.has_value());
        QCOMPARE(record->documentId, QStringLiteral("surge"));
        QCOMPARE(record->title, QStringLiteral("Transitorios"));
    }
    QCOMPARE(chunks[1].content, kSecond);
    QCOMPARE(m_index->dimension(m_collection), 768);
}

void TestDocumentIngestion::testAddAssignsIdWhenMissing()
{
    const hr::IngestionResult result = m_engine->addDocument(
        makeDocument(QString(), hr::DocumentCategory::General, QStringLiteral("Notas"), kFirst));

    QVERIFY(result.ok());
    QVERIFY(!result.documentId.isEmpty());
    const std::optional<hr::Document> stored = m_engine->getDocument(result.documentId);
    QVERIFY(stored.has_value());
    QCOMPARE(stored->title, QStringLiteral("Notas"));
}

void TestDocumentIngestion::testAddRejectsEmptyDocument()
{
    const hr::IngestionResult noTitle = m_engine->addDocument(
        makeDocument(QStringLiteral("a"), hr::DocumentCategory::General, QStringLiteral("  "), kFirst));
    QVERIFY(noTitle.status == hr::IngestionStatus::Rejected);
    QVERIFY(!noTitle.error.isEmpty());

    const hr::IngestionResult noContent = m_engine->addDocument(
        makeDocument(QStringLiteral("b"), hr::DocumentCategory::General, QStringLiteral("Titulo"), QStringLiteral("\n\n")));
    QVERIFY(noContent.status == hr::IngestionStatus::Rejected);

    QCOMPARE(m_transport->embeddingCalls(), 0);
    QVERIFY(!m_engine->getDocument(QStringLiteral("a")).has_value());
    QVERIFY(!m_engine->getDocument(QStringLiteral("b")).has_value());
}

void TestDocumentIngestion::testAddRejectsDuplicateId()
{
    const hr::Document doc = makeDocument(QStringLiteral("dup"), hr::DocumentCategory::General,
                                          QStringLiteral("Uno"), kFirst);
    QVERIFY(m_engine->addDocument(doc).ok());

    const hr::IngestionResult second = m_engine->addDocument(doc);
    QVERIFY(second.status == hr::IngestionStatus::Rejected);
    QVERIFY(second.error.contains(QLatin1String("dup")));
    QCOMPARE(static_cast<int>(m_store->chunksForDocument(QStringLiteral("dup")).size()), 1);
}

void TestDocumentIngestion::testAddReportsProgress()
{
    std::vector<hr::IngestionProgress> updates;
    const hr::IngestionResult result = m_engine->addDocument(
        makeDocument(QStringLiteral("p"), hr::DocumentCategory::General, QStringLiteral("Progreso"),
                     threeParagraphs()),
        [&updates](const hr::IngestionProgress& progress) { updates.push_back(progress); });

    QVERIFY(result.ok());
    QCOMPARE(static_cast<int>(updates.size()), 3);
    for (int i = 0; i < 3; ++i) {
        QCOMPARE(updates[static_cast<size_t>(i)].current, i + 1);
        QCOMPARE(updates[static_cast<size_t>(i)].total, 3);
    }
}

void TestDocumentIngestion::testFirstChunkFailureAbortsIngestion()
{
    m_transport->setTimeoutWhen([](const QString& text) { return text == kFirst; });

    const hr::IngestionResult result = m_engine->addDocument(
        makeDocument(QStringLiteral("abort"), hr::DocumentCategory::Hydraulics,
                     QStringLiteral("Transitorios"), threeParagraphs()));

    QVERIFY(result.status == hr::IngestionStatus::Failed);
    QVERIFY(!result.ok());
    QVERIFY(result.error.contains(QLatin1String("first chunk")));
    QVERIFY(!m_engine->getDocument(QStringLiteral("abort")).has_value());
    QVERIFY(m_store->chunksForDocument(QStringLiteral("abort")).empty());
    QCOMPARE(m_index->insertCalls(), 0);
}

void TestDocumentIngestion::testLaterChunkFailureIsRecorded()
{
    m_transport->setTimeoutWhen([](const QString& text) { return text == kThird; });

    const hr::IngestionResult result = m_engine->addDocument(
        makeDocument(QStringLiteral("partial"), hr::DocumentCategory::Hydraulics,
                     QStringLiteral("Transitorios"), threeParagraphs()));

    QVERIFY(result.status == hr::IngestionStatus::IndexedWithFailures);
    QCOMPARE(result.chunkCount, 3);
    QCOMPARE(result.embeddedChunks, 2);
    QCOMPARE(static_cast<int>(result.failures.size()), 1);
    QCOMPARE(result.failures[0].chunkIndex, 2);
    QVERIFY(result.failures[0].reason == hr::DegradedReason::Timeout);

    const std::vector<hr::Chunk> chunks = m_store->chunksForDocument(QStringLiteral("partial"));
    QCOMPARE(static_cast<int>(chunks.size()), 3);
    QVERIFY(chunks[2].embeddingState == hr::EmbeddingState::Missing);
    QVERIFY(!chunks[2].embedding.has_value());
    QVERIFY(!m_index->record(m_collection, hr::chunkRecordId(chunks[2].id)).has_value());
    QVERIFY(m_index->record(m_collection, hr::chunkRecordId(chunks[0].id)).has_value());
}

void TestDocumentIngestion::testUnreachableIndexStillStoresDocument()
{
    m_index->setReachable(false);

    const hr::IngestionResult result = m_engine->addDocument(
        makeDocument(QStringLiteral("offline"), hr::DocumentCategory::General,
                     QStringLiteral("Sin indice"), kFirst));

    QVERIFY(result.status == hr::IngestionStatus::Indexed);
    QVERIFY(!result.vectorIndexUpdated);
    QVERIFY(m_engine->getDocument(QStringLiteral("offline")).has_value());

    const std::vector<hr::Chunk> chunks = m_store->chunksForDocument(QStringLiteral("offline"));
    QCOMPARE(static_cast<int>(chunks.size()), 1);
    QVERIFY(chunks[0].embeddingState == hr::EmbeddingState::Valid);
}

// ── Update ───────────────────────────────────────────────────────

void TestDocumentIngestion::testUpdateReusesUnchangedVectors()
{
    QVERIFY(m_engine->addDocument(makeDocument(QStringLiteral("upd"), hr::DocumentCategory::Hydraulics,
                                               QStringLiteral("Transitorios"), threeParagraphs()))
                .ok());
    const std::vector<hr::Chunk> before = m_store->chunksForDocument(QStringLiteral("upd"));
    m_transport->resetCounters();

    const QString replacement = QStringLiteral("Camara de aire en la descarga de la bomba");
    hr::DocumentPatch patch;
    patch.content = kFirst + QStringLiteral("\n\n") + kSecond + QStringLiteral("\n\n") + replacement;
    const hr::IngestionResult result = m_engine->updateDocument(QStringLiteral("upd"), patch);

    QVERIFY(result.status == hr::IngestionStatus::Indexed);
    QCOMPARE(result.chunkCount, 3);
    QCOMPARE(result.embeddedChunks, 3);
    QCOMPARE(m_transport->embeddingCalls(), 1);
    QCOMPARE(m_transport->embeddedTexts(), QStringList{replacement});

    const std::vector<hr::Chunk> after = m_store->chunksForDocument(QStringLiteral("upd"));
    QCOMPARE(static_cast<int>(after.size()), 3);
    QCOMPARE(after[2].content, replacement);
    QVERIFY(after[0].embedding->values == before[0].embedding->values);

    // Old records are gone, new ones are present.
    for (const hr::Chunk& old : before) {
        QVERIFY(!m_index->record(m_collection, hr::chunkRecordId(old.id)).has_value());
    }
    for (const hr::Chunk& chunk : after) {
        QVERIFY(m_index->record(m_collection, hr::chunkRecordId(chunk.id)).has_value());
    }
}

void TestDocumentIngestion::testUpdateMetadataOnlyKeepsChunks()
{
    QVERIFY(m_engine->addDocument(makeDocument(QStringLiteral("meta"), hr::DocumentCategory::Hydraulics,
                                               QStringLiteral("Antes"), threeParagraphs()))
                .ok());
    const std::vector<hr::Chunk> before = m_store->chunksForDocument(QStringLiteral("meta"));
    m_transport->resetCounters();

    hr::DocumentPatch patch;
    patch.title = QStringLiteral("Despues");
    patch.regions = QStringList{QStringLiteral("EU")};
    const hr::IngestionResult result = m_engine->updateDocument(QStringLiteral("meta"), patch);

    QVERIFY(result.ok());
    QCOMPARE(result.chunkCount, 3);
    QCOMPARE(m_transport->embeddingCalls(), 0);

    const std::optional<hr::Document> stored = m_engine->getDocument(QStringLiteral("meta"));
    QVERIFY(stored.has_value());
    QCOMPARE(stored->title, QStringLiteral("Despues"));
    QCOMPARE(stored->regions, QStringList{QStringLiteral("EU")});

    const std::vector<hr::Chunk> after = m_store->chunksForDocument(QStringLiteral("meta"));
    QCOMPARE(after.size(), before.size());
    QCOMPARE(after[0].id, before[0].id);

    // Denormalized fields in the index follow the patch.
    const std::optional<hr::VectorRecord> record =
        m_index->record(m_collection, hr::chunkRecordId(after[0].id));
    QVERIFY(record.has_value());
    QCOMPARE(record->title, QStringLiteral("Despues"));
    QCOMPARE(record->regions, QStringList{QStringLiteral("EU")});
}

void TestDocumentIngestion::testUpdateUnknownDocumentRejected()
{
    hr::DocumentPatch patch;
    patch.title = QStringLiteral("Nada");
    const hr::IngestionResult result = m_engine->updateDocument(QStringLiteral("ghost"), patch);
    QVERIFY(result.status == hr::IngestionStatus::Rejected);
    QVERIFY(result.error.contains(QLatin1String("ghost")));
}

void TestDocumentIngestion::testUpdateRejectsEmptyContent()
{
    QVERIFY(m_engine->addDocument(makeDocument(QStringLiteral("keep"), hr::DocumentCategory::General,
                                               QStringLiteral("Conservar"), kFirst))
                .ok());

    hr::DocumentPatch patch;
    patch.content = QStringLiteral("   ");
    const hr::IngestionResult result = m_engine->updateDocument(QStringLiteral("keep"), patch);
    QVERIFY(result.status == hr::IngestionStatus::Rejected);

    const std::vector<hr::Chunk> chunks = m_store->chunksForDocument(QStringLiteral("keep"));
    QCOMPARE(static_cast<int>(chunks.size()), 1);
    QCOMPARE(chunks[0].content, kFirst);
}

void TestDocumentIngestion::testUpdateWhileIndexUnreachableRepairedBySync()
{
    QVERIFY(m_engine->addDocument(makeDocument(QStringLiteral("upd"), hr::DocumentCategory::Hydraulics,
                                               QStringLiteral("Transitorios"), threeParagraphs()))
                .ok());
    const std::vector<hr::Chunk> before = m_store->chunksForDocument(QStringLiteral("upd"));
    QVERIFY(!m_engine->indexDirty());

    // Same chunk count before and after, so row counts alone still match.
    m_index->setReachable(false);
    hr::DocumentPatch patch;
    patch.content = kFirst + QStringLiteral("\n\n") + kSecond + QStringLiteral("\n\n")
                    + QStringLiteral("Camara de aire en la descarga de la bomba");
    const hr::IngestionResult result = m_engine->updateDocument(QStringLiteral("upd"), patch);
    QVERIFY(result.ok());
    QVERIFY(!result.vectorIndexUpdated);
    QVERIFY(m_engine->indexDirty());
    QVERIFY(m_engine->indexingReport().indexDirty);

    m_index->setReachable(true);
    const hr::SyncReport report = m_engine->synchronize();
    QVERIFY(report.ok());
    QVERIFY(!report.skippedUpToDate);
    QCOMPARE(report.upserted, static_cast<int64_t>(3));
    QCOMPARE(report.pruned, static_cast<int64_t>(3));

    const std::vector<hr::Chunk> after = m_store->chunksForDocument(QStringLiteral("upd"));
    QCOMPARE(static_cast<int>(after.size()), 3);
    for (const hr::Chunk& old : before) {
        QVERIFY(!m_index->record(m_collection, hr::chunkRecordId(old.id)).has_value());
    }
    for (const hr::Chunk& chunk : after) {
        QVERIFY(m_index->record(m_collection, hr::chunkRecordId(chunk.id)).has_value());
    }
    QVERIFY(!m_engine->indexDirty());
    QVERIFY(m_engine->synchronize().skippedUpToDate);
}

// ── Delete ───────────────────────────────────────────────────────

void TestDocumentIngestion::testDeleteRemovesVectors()
{
    QVERIFY(m_engine->addDocument(makeDocument(QStringLiteral("gone"), hr::DocumentCategory::General,
                                               QStringLiteral("Borrar"), threeParagraphs()))
                .ok());
    const std::vector<hr::Chunk> chunks = m_store->chunksForDocument(QStringLiteral("gone"));
    QCOMPARE(static_cast<int>(chunks.size()), 3);

    QVERIFY(m_engine->deleteDocument(QStringLiteral("gone")));
    QVERIFY(!m_engine->getDocument(QStringLiteral("gone")).has_value());
    QVERIFY(m_store->chunksForDocument(QStringLiteral("gone")).empty());
    for (const hr::Chunk& chunk : chunks) {
        QVERIFY(!m_index->record(m_collection, hr::chunkRecordId(chunk.id)).has_value());
    }
}

void TestDocumentIngestion::testDeleteUnknownDocument()
{
    QVERIFY(!m_engine->deleteDocument(QStringLiteral("ghost")));
}

void TestDocumentIngestion::testDeleteWhileIndexUnreachablePrunedBySync()
{
    QVERIFY(m_engine->addDocument(makeDocument(QStringLiteral("keep"), hr::DocumentCategory::General,
                                               QStringLiteral("Conservar"), kFirst))
                .ok());
    QVERIFY(m_engine->addDocument(makeDocument(QStringLiteral("gone"), hr::DocumentCategory::General,
                                               QStringLiteral("Borrar"), threeParagraphs()))
                .ok());
    const std::vector<hr::Chunk> kept = m_store->chunksForDocument(QStringLiteral("keep"));
    const std::vector<hr::Chunk> removed = m_store->chunksForDocument(QStringLiteral("gone"));

    m_index->setReachable(false);
    QVERIFY(m_engine->deleteDocument(QStringLiteral("gone")));
    QVERIFY(m_engine->indexDirty());

    m_index->setReachable(true);
    const hr::SyncReport report = m_engine->synchronize();
    QVERIFY(report.ok());
    QCOMPARE(report.pruned, static_cast<int64_t>(3));
    for (const hr::Chunk& chunk : removed) {
        QVERIFY(!m_index->record(m_collection, hr::chunkRecordId(chunk.id)).has_value());
    }
    QVERIFY(m_index->record(m_collection, hr::chunkRecordId(kept[0].id)).has_value());
    QVERIFY(!m_engine->indexDirty());
}

QTEST_MAIN(TestDocumentIngestion)
#include "test_document_ingestion.moc"
