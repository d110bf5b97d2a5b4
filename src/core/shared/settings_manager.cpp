#include "core/shared/settings_manager.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QStandardPaths>

namespace hr {

namespace {

QString dataDirectory()
{
    const QString basePath = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return basePath + QStringLiteral("/hybridrag");
}

} // namespace

std::optional<Settings> SettingsManager::load()
{
    return load(settingsFilePath());
}

std::optional<Settings> SettingsManager::load(const QString& filePath)
{
    QFile file(filePath);
    if (!file.exists()) {
        return std::nullopt;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(hrCore, "Failed to open settings file for read: %s", qUtf8Printable(filePath));
        return std::nullopt;
    }

    const QByteArray rawJson = file.readAll();
    file.close();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(rawJson, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(hrCore,
                 "Failed to parse settings JSON (%s): %s",
                 qUtf8Printable(filePath),
                 qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }

    return fromJson(doc.object());
}

bool SettingsManager::save(const Settings& settings)
{
    return save(settings, settingsFilePath());
}

bool SettingsManager::save(const Settings& settings, const QString& filePath)
{
    const QFileInfo fileInfo(filePath);
    const QString parentDir = fileInfo.absolutePath();

    if (!QDir().mkpath(parentDir)) {
        LOG_ERROR(hrCore, "Failed to create settings directory: %s", qUtf8Printable(parentDir));
        return false;
    }

    const QJsonDocument doc(toJson(settings));
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(hrCore, "Failed to open settings file for write: %s", qUtf8Printable(filePath));
        return false;
    }

    const qint64 bytesWritten = file.write(doc.toJson(QJsonDocument::Indented));
    file.close();

    if (bytesWritten < 0) {
        LOG_ERROR(hrCore, "Failed to write settings file: %s", qUtf8Printable(filePath));
        return false;
    }

    return true;
}

QString SettingsManager::settingsFilePath()
{
    return dataDirectory() + QStringLiteral("/settings.json");
}

void SettingsManager::applyDefaultPaths(Settings& settings)
{
    if (settings.dbPath.isEmpty()) {
        settings.dbPath = dataDirectory() + QStringLiteral("/knowledge.db");
    }
    if (settings.indexDir.isEmpty()) {
        settings.indexDir = dataDirectory() + QStringLiteral("/vectors");
    }
}

QString SettingsManager::resolvedOpenAiKey(const Settings& settings)
{
    if (!settings.openaiApiKey.isEmpty()) {
        return settings.openaiApiKey;
    }
    return qEnvironmentVariable("OPENAI_API_KEY");
}

QJsonObject SettingsManager::toJson(const Settings& settings)
{
    QJsonObject json;
    json.insert(QStringLiteral("dbPath"), settings.dbPath);
    json.insert(QStringLiteral("indexDir"), settings.indexDir);
    json.insert(QStringLiteral("collectionName"), settings.collectionName);
    json.insert(QStringLiteral("chunkMaxSize"), settings.chunkMaxSize);
    json.insert(QStringLiteral("chunkOverlap"), settings.chunkOverlap);
    json.insert(QStringLiteral("embeddingTimeoutMs"), static_cast<int>(settings.embeddingTimeoutMs));
    json.insert(QStringLiteral("localEmbeddingTimeoutMs"),
                static_cast<int>(settings.localEmbeddingTimeoutMs));
    json.insert(QStringLiteral("activeProviderId"), settings.activeProviderId);
    json.insert(QStringLiteral("fallbackDimension"), settings.fallbackDimension);
    json.insert(QStringLiteral("openaiApiKey"), settings.openaiApiKey);
    json.insert(QStringLiteral("openaiEnabled"), settings.openaiEnabled);
    json.insert(QStringLiteral("openaiBaseUrl"), settings.openaiBaseUrl);
    json.insert(QStringLiteral("ollamaBaseUrl"), settings.ollamaBaseUrl);
    json.insert(QStringLiteral("ollamaEnabled"), settings.ollamaEnabled);
    json.insert(QStringLiteral("syncBatchSize"), settings.syncBatchSize);
    json.insert(QStringLiteral("syncPauseMs"), static_cast<int>(settings.syncPauseMs));
    json.insert(QStringLiteral("reembedCharLimit"), settings.reembedCharLimit);
    json.insert(QStringLiteral("defaultAlpha"), settings.defaultAlpha);
    json.insert(QStringLiteral("qualityMaxAgeYears"), settings.qualityMaxAgeYears);
    json.insert(QStringLiteral("minQualityScore"), settings.minQualityScore);
    return json;
}

Settings SettingsManager::fromJson(const QJsonObject& json)
{
    Settings settings;

    settings.dbPath = json.value(QStringLiteral("dbPath")).toString(settings.dbPath);
    settings.indexDir = json.value(QStringLiteral("indexDir")).toString(settings.indexDir);
    settings.collectionName = json.value(QStringLiteral("collectionName"))
                                  .toString(settings.collectionName);

    settings.chunkMaxSize = json.value(QStringLiteral("chunkMaxSize")).toInt(settings.chunkMaxSize);
    settings.chunkOverlap = json.value(QStringLiteral("chunkOverlap")).toInt(settings.chunkOverlap);

    if (json.contains(QStringLiteral("embeddingTimeoutMs"))) {
        settings.embeddingTimeoutMs = json.value(QStringLiteral("embeddingTimeoutMs"))
                                          .toVariant()
                                          .toUInt();
    }
    if (json.contains(QStringLiteral("localEmbeddingTimeoutMs"))) {
        settings.localEmbeddingTimeoutMs = json.value(QStringLiteral("localEmbeddingTimeoutMs"))
                                               .toVariant()
                                               .toUInt();
    }

    settings.activeProviderId = json.value(QStringLiteral("activeProviderId"))
                                    .toString(settings.activeProviderId);
    settings.fallbackDimension = json.value(QStringLiteral("fallbackDimension"))
                                     .toInt(settings.fallbackDimension);
    settings.openaiApiKey = json.value(QStringLiteral("openaiApiKey")).toString(settings.openaiApiKey);
    settings.openaiEnabled = json.value(QStringLiteral("openaiEnabled")).toBool(settings.openaiEnabled);
    settings.openaiBaseUrl = json.value(QStringLiteral("openaiBaseUrl")).toString(settings.openaiBaseUrl);
    settings.ollamaBaseUrl = json.value(QStringLiteral("ollamaBaseUrl")).toString(settings.ollamaBaseUrl);
    settings.ollamaEnabled = json.value(QStringLiteral("ollamaEnabled")).toBool(settings.ollamaEnabled);

    settings.syncBatchSize = json.value(QStringLiteral("syncBatchSize")).toInt(settings.syncBatchSize);
    if (json.contains(QStringLiteral("syncPauseMs"))) {
        settings.syncPauseMs = json.value(QStringLiteral("syncPauseMs")).toVariant().toUInt();
    }
    settings.reembedCharLimit = json.value(QStringLiteral("reembedCharLimit"))
                                    .toInt(settings.reembedCharLimit);

    settings.defaultAlpha = json.value(QStringLiteral("defaultAlpha")).toDouble(settings.defaultAlpha);
    settings.qualityMaxAgeYears = json.value(QStringLiteral("qualityMaxAgeYears"))
                                      .toInt(settings.qualityMaxAgeYears);
    settings.minQualityScore = json.value(QStringLiteral("minQualityScore"))
                                   .toDouble(settings.minQualityScore);

    if (settings.chunkMaxSize <= 0) {
        LOG_WARN(hrCore, "Invalid chunkMaxSize %d, using 1000", settings.chunkMaxSize);
        settings.chunkMaxSize = 1000;
    }
    if (settings.syncBatchSize <= 0) {
        settings.syncBatchSize = 50;
    }

    return settings;
}

} // namespace hr
