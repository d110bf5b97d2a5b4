#include <QtTest/QtTest>
#include "core/shared/settings_manager.h"

#include <QFile>
#include <QTemporaryDir>

class TestSettingsManager : public QObject {
    Q_OBJECT

private slots:
    void testDefaults();
    void testSaveLoadRoundTrip();
    void testLoadMissingFile();
    void testLoadCorruptFile();
    void testInvalidValuesReplaced();
    void testApplyDefaultPaths();
    void testResolvedOpenAiKey();
};

void TestSettingsManager::testDefaults()
{
    const hr::Settings settings = hr::SettingsManager::fromJson(QJsonObject());
    QCOMPARE(settings.chunkMaxSize, 1000);
    QCOMPARE(settings.chunkOverlap, 200);
    QCOMPARE(settings.fallbackDimension, 768);
    QCOMPARE(settings.collectionName, QStringLiteral("technical_knowledge"));
    QCOMPARE(settings.defaultAlpha, 0.6);
    QVERIFY(settings.activeProviderId.isEmpty());
}

void TestSettingsManager::testSaveLoadRoundTrip()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("nested/settings.json"));

    hr::Settings settings;
    settings.dbPath = QStringLiteral("/tmp/kb.db");
    settings.activeProviderId = QStringLiteral("ollama-nomic");
    settings.chunkMaxSize = 800;
    settings.chunkOverlap = 100;
    settings.embeddingTimeoutMs = 45000;
    settings.syncPauseMs = 0;
    settings.defaultAlpha = 0.35;
    settings.openaiEnabled = false;

    QVERIFY(hr::SettingsManager::save(settings, path));
    const auto loaded = hr::SettingsManager::load(path);
    QVERIFY(loaded.has_value());
    QCOMPARE(loaded->dbPath, settings.dbPath);
    QCOMPARE(loaded->activeProviderId, settings.activeProviderId);
    QCOMPARE(loaded->chunkMaxSize, 800);
    QCOMPARE(loaded->chunkOverlap, 100);
    QCOMPARE(loaded->embeddingTimeoutMs, settings.embeddingTimeoutMs);
    QCOMPARE(loaded->syncPauseMs, 0u);
    QCOMPARE(loaded->defaultAlpha, 0.35);
    QVERIFY(!loaded->openaiEnabled);
}

void TestSettingsManager::testLoadMissingFile()
{
    QTemporaryDir dir;
    QVERIFY(!hr::SettingsManager::load(dir.filePath(QStringLiteral("absent.json"))).has_value());
}

void TestSettingsManager::testLoadCorruptFile()
{
    QTemporaryDir dir;
    const QString path = dir.filePath(QStringLiteral("settings.json"));
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write("{ not json");
    file.close();
    QVERIFY(!hr::SettingsManager::load(path).has_value());
}

void TestSettingsManager::testInvalidValuesReplaced()
{
    QJsonObject json;
    json.insert(QStringLiteral("chunkMaxSize"), -5);
    json.insert(QStringLiteral("syncBatchSize"), 0);
    const hr::Settings settings = hr::SettingsManager::fromJson(json);
    QCOMPARE(settings.chunkMaxSize, 1000);
    QCOMPARE(settings.syncBatchSize, 50);
}

void TestSettingsManager::testApplyDefaultPaths()
{
    hr::Settings settings;
    hr::SettingsManager::applyDefaultPaths(settings);
    QVERIFY(settings.dbPath.endsWith(QStringLiteral("/hybridrag/knowledge.db")));
    QVERIFY(settings.indexDir.endsWith(QStringLiteral("/hybridrag/vectors")));

    hr::Settings custom;
    custom.dbPath = QStringLiteral("/data/kb.db");
    hr::SettingsManager::applyDefaultPaths(custom);
    QCOMPARE(custom.dbPath, QStringLiteral("/data/kb.db"));
}

void TestSettingsManager::testResolvedOpenAiKey()
{
    qputenv("OPENAI_API_KEY", "env-key");
    hr::Settings settings;
    QCOMPARE(hr::SettingsManager::resolvedOpenAiKey(settings), QStringLiteral("env-key"));
    settings.openaiApiKey = QStringLiteral("file-key");
    QCOMPARE(hr::SettingsManager::resolvedOpenAiKey(settings), QStringLiteral("file-key"));
    qunsetenv("OPENAI_API_KEY");
}

QTEST_MAIN(TestSettingsManager)
#include "test_settings_manager.moc"
