#include <QtTest/QtTest>
#include "core/embedding/embedding_provider_registry.h"
#include "core/embedding/fallback_embedder.h"
#include "core/index/knowledge_store.h"
#include "core/retrieval/knowledge_engine.h"
#include "core/sync/sync_worker.h"
#include "document_builders.h"
#include "fake_http_transport.h"
#include "fake_vector_index.h"

#include <QSignalSpy>

#include <atomic>
#include <memory>

using hr::test::makeDocument;

namespace {

constexpr int kOldDim = 384;
constexpr int kNewDim = 768;

} // namespace

class TestProviderMigration : public QObject {
    Q_OBJECT

private slots:
    void initTestCase();
    void init();
    void cleanup();

    // ── Switching ────────────────────────────────────────────────
    void testSwitchMarksMigrationPending();
    void testUnknownProviderRejected();
    void testReportShowsDimensionMismatches();

    // ── Migration pass ───────────────────────────────────────────
    void testSynchronizeReembedsEverything();
    void testSearchAfterMigration();
    void testUnreachableIndexKeepsMigrationPending();
    void testBackgroundMigrationOnSwitch();
    void testSwitchDuringBackgroundPassMigratesToLatest();

private:
    void createEngine(bool migrateOnSwitch);
    void seedDocuments();

    std::unique_ptr<hr::KnowledgeStore> m_store;
    std::unique_ptr<hr::test::FakeHttpTransport> m_transport;
    std::unique_ptr<hr::test::FakeVectorIndex> m_index;
    std::unique_ptr<hr::EmbeddingProviderRegistry> m_registry;
    std::unique_ptr<hr::KnowledgeEngine> m_engine;
    QString m_collection;

    std::atomic<bool> m_embedEntered{false};
    std::atomic<bool> m_embedReleased{true};
};

void TestProviderMigration::initTestCase()
{
    qunsetenv("OPENAI_API_KEY");
}

void TestProviderMigration::init()
{
    auto store = hr::KnowledgeStore::open(QStringLiteral(":memory:"));
    QVERIFY(store.has_value());
    m_store = std::make_unique<hr::KnowledgeStore>(std::move(*store));

    m_transport = std::make_unique<hr::test::FakeHttpTransport>(kNewDim);
    m_index = std::make_unique<hr::test::FakeVectorIndex>();

    m_embedEntered = false;
    m_embedReleased = true;
}

void TestProviderMigration::cleanup()
{
    m_embedReleased = true;
    m_engine.reset();
    m_registry.reset();
    m_index.reset();
    m_transport.reset();
    m_store.reset();
}

// Starts on the 384-dim fallback provider; the switch target is the
// 768-dim local model.
void TestProviderMigration::createEngine(bool migrateOnSwitch)
{
    hr::Settings settings;
    settings.activeProviderId = QStringLiteral("fallback");
    settings.fallbackDimension = kOldDim;
    m_registry = std::make_unique<hr::EmbeddingProviderRegistry>(settings, m_transport.get());

    hr::EngineConfig config;
    config.sync.pauseMs = 0;
    config.sync.batchSize = 2;
    config.migrateOnProviderSwitch = migrateOnSwitch;
    m_collection = config.collectionName;
    m_engine = std::make_unique<hr::KnowledgeEngine>(*m_store, *m_index, *m_registry, config);
}

void TestProviderMigration::seedDocuments()
{
    QVERIFY(m_engine->addDocument(makeDocument(QStringLiteral("manning"), hr::DocumentCategory::Hydraulics,
                                               QStringLiteral("Manning"),
                                               QStringLiteral("Coeficiente de rugosidad de Manning para canales")))
                .ok());
    QVERIFY(m_engine->addDocument(makeDocument(QStringLiteral("hazen"), hr::DocumentCategory::Hydraulics,
                                               QStringLiteral("Hazen-Williams"),
                                               QStringLiteral("Formula de Hazen-Williams para tuberias a presion")))
                .ok());
    QVERIFY(m_engine->addDocument(makeDocument(QStringLiteral("norma"), hr::DocumentCategory::Regulations,
                                               QStringLiteral("Norma de agua potable"),
                                               QStringLiteral("Presion minima de servicio en la red de distribucion")))
                .ok());
    QCOMPARE(m_index->dimension(m_collection), kOldDim);
}

// ── Switching ────────────────────────────────────────────────────

void TestProviderMigration::testSwitchMarksMigrationPending()
{
    createEngine(false);
    seedDocuments();
    QVERIFY(!m_engine->migrationPending());

    QVERIFY(m_engine->setActiveProvider(QStringLiteral("ollama-nomic")));
    QVERIFY(m_engine->migrationPending());
    QCOMPARE(m_registry->activeDimension(), kNewDim);

    // Stored vectors are untouched until a sync runs.
    const std::vector<hr::Chunk> chunks = m_store->chunksForDocument(QStringLiteral("manning"));
    QCOMPARE(chunks[0].embedding->dimension(), kOldDim);
    QCOMPARE(m_transport->embeddingCalls(), 0);
}

void TestProviderMigration::testUnknownProviderRejected()
{
    createEngine(false);

    QVERIFY(!m_engine->setActiveProvider(QStringLiteral("does-not-exist")));
    QVERIFY(!m_engine->migrationPending());
    QCOMPARE(m_registry->activeProvider().id, QStringLiteral("fallback"));
}

void TestProviderMigration::testReportShowsDimensionMismatches()
{
    createEngine(false);
    seedDocuments();
    QVERIFY(m_engine->setActiveProvider(QStringLiteral("ollama-nomic")));

    const hr::IndexingReport report = m_engine->indexingReport();
    QCOMPARE(report.activeProvider.id, QStringLiteral("ollama-nomic"));
    QCOMPARE(report.health.totalChunks, static_cast<int64_t>(3));
    QCOMPARE(report.health.dimensionMismatches, static_cast<int64_t>(3));
    QVERIFY(report.migrationPending);
    QVERIFY(report.indexReachable);
    QVERIFY(report.collection.has_value());
    QCOMPARE(report.collection->dimension, kOldDim);

    const QJsonObject json = hr::indexingReportToJson(report);
    QCOMPARE(json.value(QStringLiteral("migrationPending")).toBool(), true);
    QCOMPARE(json.value(QStringLiteral("activeProvider")).toObject().value(QStringLiteral("dimension")).toInt(),
             kNewDim);
}

// ── Migration pass ───────────────────────────────────────────────

void TestProviderMigration::testSynchronizeReembedsEverything()
{
    createEngine(false);
    seedDocuments();
    QVERIFY(m_engine->setActiveProvider(QStringLiteral("ollama-nomic")));

    const hr::SyncReport report = m_engine->synchronize();
    QVERIFY(report.ok());
    QVERIFY(report.collectionRecreated);
    QCOMPARE(report.scanned, static_cast<int64_t>(3));
    QCOMPARE(report.reembedded, static_cast<int64_t>(3));
    QCOMPARE(report.upserted, static_cast<int64_t>(3));
    QCOMPARE(report.failedChunks, static_cast<int64_t>(0));
    QCOMPARE(m_transport->embeddingCalls(), 3);

    QVERIFY(!m_engine->migrationPending());
    QCOMPARE(m_index->dimension(m_collection), kNewDim);

    const std::vector<hr::Chunk> chunks = m_store->chunksForDocument(QStringLiteral("hazen"));
    QVERIFY(chunks[0].embeddingState == hr::EmbeddingState::Valid);
    QCOMPARE(chunks[0].embedding->dimension(), kNewDim);
    QCOMPARE(chunks[0].embedding->providerId, QStringLiteral("ollama-nomic"));

    const hr::IndexingReport after = m_engine->indexingReport();
    QCOMPARE(after.health.dimensionMismatches, static_cast<int64_t>(0));
    QVERIFY(after.lastSyncEpoch > 0);

    // Nothing left to do on the next pass.
    QVERIFY(m_engine->synchronize().skippedUpToDate);
}

void TestProviderMigration::testSearchAfterMigration()
{
    m_transport->setEmbedder([](const QString& text) {
        return hr::test::unitVector(kNewDim, text.contains(QLatin1String("Hazen")) ? 1 : 0);
    });
    createEngine(false);
    seedDocuments();
    QVERIFY(m_engine->setActiveProvider(QStringLiteral("ollama-nomic")));
    QVERIFY(m_engine->synchronize().ok());

    const hr::SearchResponse response = m_engine->search(QStringLiteral("Hazen-Williams tuberias"));
    QVERIFY(!response.degraded);
    QVERIFY(!response.lexicalOnly);
    QVERIFY(!response.indexUnreachable);
    QVERIFY(!response.results.empty());
    QCOMPARE(response.results[0].documentId, QStringLiteral("hazen"));
    QVERIFY(response.results[0].method == hr::SearchMethod::Hybrid);
    QVERIFY(qAbs(response.results[0].score - 1.0) < 1e-6);
}

void TestProviderMigration::testUnreachableIndexKeepsMigrationPending()
{
    createEngine(false);
    seedDocuments();
    QVERIFY(m_engine->setActiveProvider(QStringLiteral("ollama-nomic")));
    m_index->setReachable(false);

    const hr::SyncReport report = m_engine->synchronize();
    QVERIFY(!report.ok());
    QVERIFY(report.indexUnreachable);
    QVERIFY(m_engine->migrationPending());

    m_index->setReachable(true);
    QVERIFY(m_engine->synchronize().ok());
    QVERIFY(!m_engine->migrationPending());
}

void TestProviderMigration::testBackgroundMigrationOnSwitch()
{
    createEngine(true);
    seedDocuments();

    QSignalSpy finishedSpy(m_engine->syncWorker(), &hr::SyncWorker::finished);
    QSignalSpy errorSpy(m_engine->syncWorker(), &hr::SyncWorker::error);

    QVERIFY(m_engine->setActiveProvider(QStringLiteral("ollama-nomic")));
    m_engine->waitForBackgroundSync();

    QCOMPARE(finishedSpy.count(), 1);
    QCOMPARE(errorSpy.count(), 0);
    QVERIFY(!m_engine->migrationPending());
    QCOMPARE(m_index->dimension(m_collection), kNewDim);

    const hr::SyncReport last = m_engine->syncWorker()->lastReport();
    QCOMPARE(last.reembedded, static_cast<int64_t>(3));
}

void TestProviderMigration::testSwitchDuringBackgroundPassMigratesToLatest()
{
    createEngine(true);
    seedDocuments();

    // The first embedding request of the background pass blocks until
    // the test releases it.
    m_embedReleased = false;
    m_transport->setEmbedder([this](const QString& text) {
        m_embedEntered = true;
        while (!m_embedReleased.load()) {
            QThread::msleep(5);
        }
        return hr::generateFallbackEmbedding(text, kNewDim);
    });

    QSignalSpy finishedSpy(m_engine->syncWorker(), &hr::SyncWorker::finished);

    QVERIFY(m_engine->setActiveProvider(QStringLiteral("ollama-nomic")));
    QTRY_VERIFY(m_embedEntered.load());

    // Switch back while the 768-dim pass is still running.
    QVERIFY(m_engine->setActiveProvider(QStringLiteral("fallback")));
    QVERIFY(m_engine->syncWorker()->isRunning());
    QVERIFY(m_engine->migrationPending());

    m_embedReleased = true;
    m_engine->waitForBackgroundSync();

    QCOMPARE(finishedSpy.count(), 1);
    QVERIFY(!m_engine->migrationPending());
    QCOMPARE(m_index->dimension(m_collection), kOldDim);

    const hr::IndexingReport report = m_engine->indexingReport();
    QCOMPARE(report.health.dimensionMismatches, static_cast<int64_t>(0));
    QCOMPARE(report.health.validEmbeddings, static_cast<int64_t>(3));
    for (const QString& id : {QStringLiteral("manning"), QStringLiteral("hazen"), QStringLiteral("norma")}) {
        const std::vector<hr::Chunk> chunks = m_store->chunksForDocument(id);
        QCOMPARE(chunks[0].embedding->dimension(), kOldDim);
        QCOMPARE(chunks[0].embedding->providerId, QStringLiteral("fallback"));
        QVERIFY(m_index->record(m_collection, hr::chunkRecordId(chunks[0].id)).has_value());
    }
}

QTEST_MAIN(TestProviderMigration)
#include "test_provider_migration.moc"
