#include "cli_runner.h"

#include "core/embedding/embedding_provider_registry.h"
#include "core/embedding/http_transport.h"
#include "core/index/knowledge_store.h"
#include "core/retrieval/knowledge_engine.h"
#include "core/shared/logging.h"
#include "core/shared/settings_manager.h"
#include "core/vector/local_vector_index.h"

#include <QCommandLineParser>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

namespace hr {

namespace {

const QStringList& commandNames()
{
    static const QStringList names = {
        QStringLiteral("ingest"), QStringLiteral("search"), QStringLiteral("sync"),
        QStringLiteral("providers"), QStringLiteral("use-provider"), QStringLiteral("health"),
        QStringLiteral("formulas"), QStringLiteral("regulations"),
    };
    return names;
}

void printJson(QTextStream& out, const QJsonObject& json)
{
    out << QString::fromUtf8(QJsonDocument(json).toJson(QJsonDocument::Indented));
    out.flush();
}

void printJson(QTextStream& out, const QJsonArray& json)
{
    out << QString::fromUtf8(QJsonDocument(json).toJson(QJsonDocument::Indented));
    out.flush();
}

std::optional<DocumentCategory> parseCategory(const QString& value)
{
    if (value.isEmpty()) {
        return std::nullopt;
    }
    return documentCategoryFromString(value);
}

} // namespace

CliRunner::CliRunner(QTextStream& out, QTextStream& err)
    : m_out(out)
    , m_err(err)
{
}

CliRunner::~CliRunner() = default;

bool CliRunner::openEngine(const Settings& settings)
{
    std::optional<KnowledgeStore> store = KnowledgeStore::open(settings.dbPath);
    if (!store) {
        m_err << "Cannot open database " << settings.dbPath << '\n';
        return false;
    }
    m_store = std::make_unique<KnowledgeStore>(std::move(*store));

    if (!settings.indexDir.isEmpty()) {
        QDir().mkpath(settings.indexDir);
    }
    m_transport = std::make_unique<CurlHttpTransport>();
    m_index = std::make_unique<LocalVectorIndex>(settings.indexDir);
    m_registry = std::make_unique<EmbeddingProviderRegistry>(settings, m_transport.get());

    EngineConfig config = EngineConfig::fromSettings(settings);
    // The process exits after one command; migrations run through `sync`.
    config.migrateOnProviderSwitch = false;
    m_engine = std::make_unique<KnowledgeEngine>(*m_store, *m_index, *m_registry, config);
    return true;
}

int CliRunner::run(const QStringList& arguments)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Hybrid lexical/semantic retrieval over technical documents"));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("command"), commandNames().join(QStringLiteral(", ")));

    const QCommandLineOption settingsOption(QStringLiteral("settings"),
        QStringLiteral("Settings file (default: %1).").arg(SettingsManager::settingsFilePath()),
        QStringLiteral("path"));
    const QCommandLineOption titleOption(QStringLiteral("title"), QStringLiteral("Document title."), QStringLiteral("title"));
    const QCommandLineOption idOption(QStringLiteral("id"), QStringLiteral("Document id."), QStringLiteral("id"));
    const QCommandLineOption categoryOption(QStringLiteral("category"),
        QStringLiteral("hydraulics, regulations, best-practices or general."), QStringLiteral("category"));
    const QCommandLineOption subcategoryOption(QStringLiteral("subcategory"), QStringLiteral("Subcategory."), QStringLiteral("name"));
    const QCommandLineOption regionOption(QStringLiteral("region"), QStringLiteral("Region tag (repeatable)."), QStringLiteral("region"));
    const QCommandLineOption languageOption(QStringLiteral("language"), QStringLiteral("Language code."), QStringLiteral("code"));
    const QCommandLineOption topKOption(QStringLiteral("top-k"), QStringLiteral("Number of results."), QStringLiteral("n"), QStringLiteral("10"));
    const QCommandLineOption alphaOption(QStringLiteral("alpha"), QStringLiteral("Semantic weight in [0, 1]."), QStringLiteral("alpha"));
    const QCommandLineOption noRerankOption(QStringLiteral("no-rerank"), QStringLiteral("Skip the re-rank pass."));
    const QCommandLineOption validateOption(QStringLiteral("validate"), QStringLiteral("Apply the quality filter."));
    const QCommandLineOption strictOption(QStringLiteral("strict"), QStringLiteral("Strict quality mode."));
    const QCommandLineOption forceOption(QStringLiteral("force"), QStringLiteral("Scan even if the index looks current."));

    parser.addOptions({settingsOption, titleOption, idOption, categoryOption, subcategoryOption,
                       regionOption, languageOption, topKOption, alphaOption, noRerankOption,
                       validateOption, strictOption, forceOption});

    parser.process(arguments);

    QStringList positional = parser.positionalArguments();
    if (positional.isEmpty() || !commandNames().contains(positional.front())) {
        m_err << parser.helpText();
        return 1;
    }
    const QString command = positional.takeFirst();

    const QString settingsPath = parser.isSet(settingsOption)
        ? parser.value(settingsOption)
        : SettingsManager::settingsFilePath();
    Settings settings = SettingsManager::load(settingsPath).value_or(Settings{});
    SettingsManager::applyDefaultPaths(settings);

    if (!openEngine(settings)) {
        return 2;
    }

    if (command == QLatin1String("ingest")) return ingest(positional, parser);
    if (command == QLatin1String("search")) return search(positional, parser);
    if (command == QLatin1String("sync")) return sync(parser);
    if (command == QLatin1String("providers")) return providers();
    if (command == QLatin1String("use-provider")) return useProvider(positional, settings, settingsPath);
    if (command == QLatin1String("health")) return health();
    if (command == QLatin1String("formulas")) return formulas(positional);
    return regulations(positional);
}

int CliRunner::ingest(const QStringList& positional, const QCommandLineParser& parser)
{
    if (positional.isEmpty()) {
        m_err << "usage: ingest <file> [--title --category --subcategory --region --language --id]\n";
        return 1;
    }

    QFile file(positional.front());
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        m_err << "Cannot read " << positional.front() << '\n';
        return 2;
    }

    Document document;
    document.id = parser.value(QStringLiteral("id"));
    document.title = parser.isSet(QStringLiteral("title"))
        ? parser.value(QStringLiteral("title"))
        : QFileInfo(file.fileName()).completeBaseName();
    document.content = QString::fromUtf8(file.readAll());
    document.category = parseCategory(parser.value(QStringLiteral("category"))).value_or(DocumentCategory::General);
    document.subcategory = parser.value(QStringLiteral("subcategory"));
    document.regions = parser.values(QStringLiteral("region"));
    if (parser.isSet(QStringLiteral("language"))) {
        document.metadata.language = parser.value(QStringLiteral("language"));
    }

    const IngestionResult result = m_engine->addDocument(document, [this](const IngestionProgress& progress) {
        m_err << progress.message << '\n';
        m_err.flush();
    });

    QJsonArray failures;
    for (const ChunkFailure& failure : result.failures) {
        QJsonObject entry;
        entry[QStringLiteral("chunkIndex")] = failure.chunkIndex;
        entry[QStringLiteral("reason")] = degradedReasonToString(failure.reason);
        entry[QStringLiteral("error")] = failure.error;
        failures.append(entry);
    }

    QJsonObject json;
    json[QStringLiteral("status")] = ingestionStatusToString(result.status);
    json[QStringLiteral("documentId")] = result.documentId;
    json[QStringLiteral("chunks")] = result.chunkCount;
    json[QStringLiteral("embeddedChunks")] = result.embeddedChunks;
    json[QStringLiteral("vectorIndexUpdated")] = result.vectorIndexUpdated;
    json[QStringLiteral("degraded")] = result.degraded;
    if (result.degraded) {
        json[QStringLiteral("degradedReason")] = degradedReasonToString(result.degradedReason);
    }
    json[QStringLiteral("failures")] = failures;
    if (!result.error.isEmpty()) {
        json[QStringLiteral("error")] = result.error;
    }
    printJson(m_out, json);
    return result.ok() ? 0 : 3;
}

int CliRunner::search(const QStringList& positional, const QCommandLineParser& parser)
{
    if (positional.isEmpty()) {
        m_err << "usage: search <query> [--top-k --alpha --category --region --language --no-rerank --validate --strict]\n";
        return 1;
    }

    SearchOptions options;
    options.alpha = m_engine->config().defaultAlpha;
    bool ok = false;
    const int topK = parser.value(QStringLiteral("top-k")).toInt(&ok);
    if (ok && topK > 0) {
        options.topK = topK;
    }
    if (parser.isSet(QStringLiteral("alpha"))) {
        const double alpha = parser.value(QStringLiteral("alpha")).toDouble(&ok);
        if (!ok || alpha < 0.0 || alpha > 1.0) {
            m_err << "--alpha must be a number in [0, 1]\n";
            return 1;
        }
        options.alpha = alpha;
    }
    options.category = parseCategory(parser.value(QStringLiteral("category")));
    if (parser.isSet(QStringLiteral("region"))) {
        options.region = parser.value(QStringLiteral("region"));
    }
    if (parser.isSet(QStringLiteral("language"))) {
        options.language = parser.value(QStringLiteral("language"));
    }
    options.rerank = !parser.isSet(QStringLiteral("no-rerank"));
    options.validateQuality = parser.isSet(QStringLiteral("validate")) || parser.isSet(QStringLiteral("strict"));
    options.strictQuality = parser.isSet(QStringLiteral("strict"));

    const SearchResponse response = m_engine->search(positional.join(QLatin1Char(' ')), options);
    printJson(m_out, searchResponseToJson(response));
    return 0;
}

int CliRunner::sync(const QCommandLineParser& parser)
{
    const SyncReport report = m_engine->synchronize(parser.isSet(QStringLiteral("force")));

    QJsonObject json;
    json[QStringLiteral("epoch")] = static_cast<qint64>(report.epoch);
    json[QStringLiteral("skippedBusy")] = report.skippedBusy;
    json[QStringLiteral("skippedUpToDate")] = report.skippedUpToDate;
    json[QStringLiteral("indexUnreachable")] = report.indexUnreachable;
    json[QStringLiteral("collectionRecreated")] = report.collectionRecreated;
    json[QStringLiteral("scanned")] = static_cast<qint64>(report.scanned);
    json[QStringLiteral("reembedded")] = static_cast<qint64>(report.reembedded);
    json[QStringLiteral("upserted")] = static_cast<qint64>(report.upserted);
    json[QStringLiteral("pruned")] = static_cast<qint64>(report.pruned);
    json[QStringLiteral("failedChunks")] = static_cast<qint64>(report.failedChunks);
    json[QStringLiteral("failedBatches")] = static_cast<qint64>(report.failedBatches);
    if (!report.error.isEmpty()) {
        json[QStringLiteral("error")] = report.error;
    }
    printJson(m_out, json);
    return report.ok() ? 0 : 3;
}

int CliRunner::providers()
{
    m_registry->discoverLocalModels();
    const QString activeId = m_registry->activeProvider().id;

    QJsonArray list;
    for (const ProviderDescriptor& provider : m_registry->listProviders()) {
        QJsonObject entry;
        entry[QStringLiteral("id")] = provider.id;
        entry[QStringLiteral("name")] = provider.name;
        entry[QStringLiteral("model")] = provider.model;
        entry[QStringLiteral("dimension")] = provider.dimension;
        entry[QStringLiteral("kind")] = providerKindToString(provider.kind);
        entry[QStringLiteral("active")] = provider.id == activeId;
        list.append(entry);
    }
    printJson(m_out, list);
    return 0;
}

int CliRunner::useProvider(const QStringList& positional, Settings& settings, const QString& settingsPath)
{
    if (positional.isEmpty()) {
        m_err << "usage: use-provider <id>\n";
        return 1;
    }
    const QString id = positional.front();
    if (!m_registry->provider(id)) {
        m_registry->discoverLocalModels();
    }
    if (!m_engine->setActiveProvider(id)) {
        m_err << "Unknown provider " << id << '\n';
        return 3;
    }

    settings.activeProviderId = id;
    if (!SettingsManager::save(settings, settingsPath)) {
        m_err << "Failed to save settings to " << settingsPath << '\n';
        return 2;
    }

    QJsonObject json;
    json[QStringLiteral("activeProvider")] = id;
    json[QStringLiteral("dimension")] = m_registry->activeDimension();
    json[QStringLiteral("migrationPending")] = m_engine->migrationPending();
    printJson(m_out, json);
    return 0;
}

int CliRunner::health()
{
    printJson(m_out, indexingReportToJson(m_engine->indexingReport()));
    return 0;
}

int CliRunner::formulas(const QStringList& positional)
{
    std::optional<QString> subcategory;
    if (!positional.isEmpty()) {
        subcategory = positional.front();
    }

    QJsonArray list;
    for (const Formula& formula : m_engine->getFormulas(subcategory)) {
        list.append(formulaToJson(formula));
    }
    printJson(m_out, list);
    return 0;
}

int CliRunner::regulations(const QStringList& positional)
{
    if (positional.isEmpty()) {
        m_err << "usage: regulations <region>\n";
        return 1;
    }

    QJsonArray list;
    for (const RegulationSummary& regulation : m_engine->getRegulations(positional.front())) {
        QJsonArray references;
        for (const Reference& reference : regulation.references) {
            references.append(referenceToJson(reference));
        }
        QJsonObject entry;
        entry[QStringLiteral("id")] = regulation.id;
        entry[QStringLiteral("title")] = regulation.title;
        entry[QStringLiteral("regions")] = QJsonArray::fromStringList(regulation.regions);
        entry[QStringLiteral("references")] = references;
        entry[QStringLiteral("content")] = regulation.content;
        list.append(entry);
    }
    printJson(m_out, list);
    return 0;
}

} // namespace hr
