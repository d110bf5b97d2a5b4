#include "core/retrieval/knowledge_engine.h"
#include "core/embedding/embedding_provider_registry.h"
#include "core/retrieval/highlighter.h"
#include "core/shared/logging.h"
#include "core/sync/sync_worker.h"

#include <QDateTime>
#include <QHash>
#include <QJsonArray>
#include <QSet>
#include <QUuid>

#include <algorithm>

namespace hr {

namespace {

constexpr double kQuickSearchAlpha = 0.7;
constexpr double kAdvancedSearchAlpha = 0.6;

const char* const kFirstChunkFailure =
    "Embedding failed for the first chunk; check provider configuration";

double nowEpoch()
{
    return static_cast<double>(QDateTime::currentSecsSinceEpoch());
}

SearchResult makeResult(const FusedScore& fused, const ChunkCandidate& candidate)
{
    SearchResult result;
    result.id = chunkRecordId(candidate.chunk.id);
    result.chunkId = candidate.chunk.id;
    result.documentId = candidate.chunk.documentId;
    result.chunkIndex = candidate.chunk.chunkIndex;
    result.title = candidate.title;
    result.content = candidate.chunk.content;
    result.category = candidate.category;
    result.subcategory = candidate.subcategory;
    result.regions = candidate.regions;
    result.language = candidate.language;
    result.documentCreatedAt = candidate.chunk.documentCreatedAt;
    result.referenceCount = candidate.referenceCount;
    result.score = fused.score;
    result.method = fused.method;
    result.scoreBreakdown = fused.breakdown;
    return result;
}

bool passesMethodFloor(const SearchResult& result, const SearchOptions& options)
{
    switch (result.method) {
    case SearchMethod::Semantic: return result.score >= options.minSemanticScore;
    case SearchMethod::Lexical:  return result.score >= options.minBM25Score;
    case SearchMethod::Hybrid:   return true;
    }
    return true;
}

} // namespace

// ── Config and report helpers ───────────────────────────────

EngineConfig EngineConfig::fromSettings(const Settings& settings)
{
    EngineConfig config;
    config.collectionName = settings.collectionName;
    config.chunker.maxSize = settings.chunkMaxSize;
    config.chunker.overlap = settings.chunkOverlap;
    config.sync.collectionName = settings.collectionName;
    config.sync.batchSize = settings.syncBatchSize;
    config.sync.pauseMs = settings.syncPauseMs;
    config.sync.reembedCharLimit = settings.reembedCharLimit;
    config.defaultAlpha = settings.defaultAlpha;
    config.qualityMaxAgeYears = settings.qualityMaxAgeYears;
    return config;
}

QString ingestionStatusToString(IngestionStatus status)
{
    switch (status) {
    case IngestionStatus::Indexed:             return QStringLiteral("indexed");
    case IngestionStatus::IndexedWithFailures: return QStringLiteral("indexed_with_failures");
    case IngestionStatus::Rejected:            return QStringLiteral("rejected");
    case IngestionStatus::Failed:              return QStringLiteral("failed");
    }
    return QStringLiteral("failed");
}

QJsonObject searchResponseToJson(const SearchResponse& response)
{
    QJsonArray results;
    for (size_t i = 0; i < response.results.size(); ++i) {
        QJsonObject entry = searchResultToJson(response.results[i]);
        if (i < response.quality.size()) {
            entry[QStringLiteral("quality")] = qualityMetricsToJson(response.quality[i]);
        }
        results.append(entry);
    }

    QJsonObject json;
    json[QStringLiteral("results")] = results;
    json[QStringLiteral("candidateChunks")] = response.candidateChunks;
    json[QStringLiteral("lexicalOnly")] = response.lexicalOnly;
    json[QStringLiteral("indexUnreachable")] = response.indexUnreachable;
    json[QStringLiteral("reranked")] = response.reranked;
    json[QStringLiteral("degraded")] = response.degraded;
    if (response.degraded) {
        json[QStringLiteral("degradedReason")] = degradedReasonToString(response.degradedReason);
    }
    if (response.qualityReport) {
        json[QStringLiteral("qualityReport")] = qualityReportToJson(*response.qualityReport);
    }
    return json;
}

QJsonObject indexingReportToJson(const IndexingReport& report)
{
    QJsonArray documents;
    for (const DocumentIndexingStatus& status : report.health.documents) {
        QJsonObject entry;
        entry[QStringLiteral("id")] = status.documentId;
        entry[QStringLiteral("title")] = status.title;
        entry[QStringLiteral("totalChunks")] = status.totalChunks;
        entry[QStringLiteral("chunksWithEmbeddings")] = status.chunksWithEmbeddings;
        entry[QStringLiteral("corruptedChunks")] = status.corruptedChunks;
        entry[QStringLiteral("status")] = status.status;
        documents.append(entry);
    }

    QJsonObject provider;
    provider[QStringLiteral("id")] = report.activeProvider.id;
    provider[QStringLiteral("model")] = report.activeProvider.model;
    provider[QStringLiteral("dimension")] = report.activeProvider.dimension;
    provider[QStringLiteral("kind")] = providerKindToString(report.activeProvider.kind);

    QJsonObject json;
    json[QStringLiteral("status")] = report.health.status;
    json[QStringLiteral("totalChunks")] = static_cast<qint64>(report.health.totalChunks);
    json[QStringLiteral("validEmbeddings")] = static_cast<qint64>(report.health.validEmbeddings);
    json[QStringLiteral("missingEmbeddings")] = static_cast<qint64>(report.health.missingEmbeddings);
    json[QStringLiteral("malformedEmbeddings")] = static_cast<qint64>(report.health.malformedEmbeddings);
    json[QStringLiteral("dimensionMismatches")] = static_cast<qint64>(report.health.dimensionMismatches);
    json[QStringLiteral("coveragePct")] = report.health.coveragePct;
    json[QStringLiteral("activeProvider")] = provider;
    json[QStringLiteral("indexReachable")] = report.indexReachable;
    if (report.collection) {
        QJsonObject collection;
        collection[QStringLiteral("name")] = report.collection->name;
        collection[QStringLiteral("dimension")] = report.collection->dimension;
        collection[QStringLiteral("metric")] = report.collection->metric;
        collection[QStringLiteral("rowCount")] = static_cast<qint64>(report.collection->rowCount);
        json[QStringLiteral("collection")] = collection;
    }
    json[QStringLiteral("migrationPending")] = report.migrationPending;
    json[QStringLiteral("indexDirty")] = report.indexDirty;
    json[QStringLiteral("lastSyncEpoch")] = static_cast<qint64>(report.lastSyncEpoch);
    json[QStringLiteral("documents")] = documents;
    return json;
}

// ── Lifecycle ───────────────────────────────────────────────

KnowledgeEngine::KnowledgeEngine(KnowledgeStore& store,
                                 VectorIndexClient& index,
                                 EmbeddingProviderRegistry& registry,
                                 const EngineConfig& config)
    : m_store(store)
    , m_index(index)
    , m_registry(registry)
    , m_config(config)
    , m_chunker(config.chunker)
    , m_sync(store, index, registry, config.sync)
    , m_syncWorker(std::make_unique<SyncWorker>(&m_sync))
{
    m_listenerToken = m_registry.addActiveProviderListener(
        [this](const ProviderDescriptor& previous, const ProviderDescriptor& current) {
            onActiveProviderChanged(previous, current);
        });
}

KnowledgeEngine::~KnowledgeEngine()
{
    m_registry.removeActiveProviderListener(m_listenerToken);
    m_syncWorker->wait();
}

// ── Retrieval ───────────────────────────────────────────────

SearchResponse KnowledgeEngine::search(const QString& query, const SearchOptions& options)
{
    SearchResponse response;
    const int topK = std::max(options.topK, 1);

    if (query.trimmed().isEmpty()) {
        return response;
    }

    const std::vector<ChunkCandidate> candidates =
        m_store.candidateChunks(options.filter(), m_config.maxCandidateDocuments);
    response.candidateChunks = static_cast<int>(candidates.size());
    if (candidates.empty()) {
        return response;
    }

    const size_t stageLimit = static_cast<size_t>(topK) * 2;

    // Lexical stage
    std::vector<ScoredChunk> lexical = m_lexicalScorer.score(query, candidates);
    if (lexical.size() > stageLimit) {
        lexical.resize(stageLimit);
    }

    // Semantic stage
    std::vector<ScoredChunk> semantic;
    const EmbeddingOutcome queryEmbedding = m_registry.generateEmbedding(query);
    if (queryEmbedding.degraded) {
        response.degraded = true;
        response.degradedReason = queryEmbedding.reason;
    }
    if (queryEmbedding.degraded && isTransientEmbeddingFailure(queryEmbedding.reason)) {
        response.lexicalOnly = true;
        LOG_WARN(hrRanking, "No query vector (%s), lexical-only search",
                 qUtf8Printable(degradedReasonToString(queryEmbedding.reason)));
    } else {
        semantic = semanticStage(queryEmbedding.vector, candidates, options, response);
    }

    // Fusion
    const std::vector<FusedScore> fused = HybridRanker::fuse(lexical, semantic, options.alpha);

    QHash<int64_t, const ChunkCandidate*> candidateById;
    candidateById.reserve(static_cast<qsizetype>(candidates.size()));
    for (const ChunkCandidate& candidate : candidates) {
        candidateById.insert(candidate.chunk.id, &candidate);
    }

    std::vector<SearchResult> results;
    results.reserve(fused.size());
    for (const FusedScore& entry : fused) {
        const ChunkCandidate* candidate = candidateById.value(entry.chunkId, nullptr);
        if (candidate) {
            results.push_back(makeResult(entry, *candidate));
        }
    }

    // Re-rank
    if (options.rerank && static_cast<int>(results.size()) > topK) {
        response.reranked = m_ranker.rerank(query, results, topK);
        response.rerankFailed = !response.reranked;
    }

    // Method floors and truncation
    for (const SearchResult& result : results) {
        if (static_cast<int>(response.results.size()) >= topK) {
            break;
        }
        if (passesMethodFloor(result, options)) {
            response.results.push_back(result);
        }
    }

    for (SearchResult& result : response.results) {
        result.highlights = extractHighlights(query, {result.content});
        result.degraded = response.degraded;
        result.degradedReason = response.degradedReason;
    }

    // Quality filter
    if (options.validateQuality) {
        QualityOptions qualityOptions;
        qualityOptions.strictMode = options.strictQuality;
        qualityOptions.minQualityScore = options.minQualityScore;
        qualityOptions.maxContentAgeYears = m_config.qualityMaxAgeYears;
        qualityOptions.preferredSources = options.preferredSources;

        ValidationOutcome outcome = m_validator.validate(query, response.results, qualityOptions);
        response.qualityReport = QualityValidator::generateQualityReport(outcome.report);

        response.results.clear();
        for (ValidatedResult& accepted : outcome.accepted) {
            response.results.push_back(std::move(accepted.result));
            response.quality.push_back(std::move(accepted.metrics));
        }
    }

    LOG_DEBUG(hrRanking, "search: %d candidates, %zu lexical, %zu semantic, %zu returned",
              response.candidateChunks, lexical.size(), semantic.size(), response.results.size());
    return response;
}

std::vector<ScoredChunk> KnowledgeEngine::semanticStage(const std::vector<float>& queryVector,
                                                        const std::vector<ChunkCandidate>& candidates,
                                                        const SearchOptions& options,
                                                        SearchResponse& response)
{
    const size_t stageLimit = static_cast<size_t>(std::max(options.topK, 1)) * 2;

    QSet<int64_t> candidateIds;
    candidateIds.reserve(static_cast<qsizetype>(candidates.size()));
    for (const ChunkCandidate& candidate : candidates) {
        candidateIds.insert(candidate.chunk.id);
    }

    std::optional<std::vector<VectorHit>> hits;
    if (m_index.isReachable()) {
        // Hits outside the candidate set are dropped below, so over-fetch.
        const int fetch = static_cast<int>(std::max<size_t>(stageLimit * 4, 50));
        hits = m_index.search(m_config.collectionName, queryVector, fetch,
                              FilterExpression::fromFilter(options.filter()));
    }

    if (hits) {
        std::vector<ScoredChunk> scored;
        for (const VectorHit& hit : *hits) {
            const std::optional<int64_t> chunkId = chunkIdFromRecordId(hit.id);
            if (!chunkId || !candidateIds.contains(*chunkId)) {
                continue;
            }
            if (hit.score > SemanticScorer::kMinSimilarity) {
                scored.push_back({*chunkId, hit.score});
            }
        }
        std::sort(scored.begin(), scored.end(), [](const ScoredChunk& a, const ScoredChunk& b) {
            return a.score != b.score ? a.score > b.score : a.chunkId < b.chunkId;
        });
        if (scored.size() > stageLimit) {
            scored.resize(stageLimit);
        }
        return scored;
    }

    response.indexUnreachable = true;
    LOG_WARN(hrVector, "Vector index unavailable, scoring stored vectors in process");

    std::vector<ScoredChunk> scored = m_semanticScorer.score(queryVector, candidates);
    if (scored.size() > stageLimit) {
        scored.resize(stageLimit);
    }
    return scored;
}

SearchResponse KnowledgeEngine::quickSearch(const QString& query,
                                            const std::optional<DocumentCategory>& category,
                                            int topK)
{
    SearchOptions options;
    options.topK = topK;
    options.alpha = kQuickSearchAlpha;
    options.rerank = false;
    options.category = category;
    return search(query, options);
}

SearchResponse KnowledgeEngine::advancedSearch(const QString& query, SearchOptions options)
{
    options.alpha = kAdvancedSearchAlpha;
    options.rerank = true;
    return search(query, options);
}

// ── Documents ───────────────────────────────────────────────

KnowledgeEngine::EmbeddedChunks KnowledgeEngine::embedChunks(std::vector<Chunk>& chunks,
                                                             const IngestionProgressCallback& onProgress,
                                                             const std::vector<Chunk>& reusable)
{
    EmbeddedChunks out;
    const int dimension = m_registry.activeDimension();
    const int total = static_cast<int>(chunks.size());

    QHash<QString, const Chunk*> reusableByHash;
    for (const Chunk& old : reusable) {
        if (old.embeddingState == EmbeddingState::Valid && old.embedding
            && old.embedding->dimension() == dimension) {
            reusableByHash.insert(old.contentHash, &old);
        }
    }

    for (int i = 0; i < total; ++i) {
        Chunk& chunk = chunks[static_cast<size_t>(i)];

        const Chunk* previous = reusableByHash.value(chunk.contentHash, nullptr);
        if (previous) {
            chunk.embedding = previous->embedding;
            chunk.embeddingState = EmbeddingState::Valid;
            ++out.embedded;
        } else {
            const EmbeddingOutcome outcome = m_registry.generateEmbedding(chunk.content);
            if (outcome.degraded && isTransientEmbeddingFailure(outcome.reason)) {
                if (i == 0) {
                    out.aborted = true;
                    out.error = QString::fromLatin1(kFirstChunkFailure);
                    LOG_ERROR(hrEmbedding, "%s (%s: %s)", kFirstChunkFailure,
                              qUtf8Printable(degradedReasonToString(outcome.reason)),
                              qUtf8Printable(outcome.error));
                    return out;
                }
                ChunkFailure failure;
                failure.chunkIndex = i;
                failure.reason = outcome.reason;
                failure.error = outcome.error;
                out.failures.push_back(failure);

                chunk.embedding.reset();
                chunk.embeddingState = EmbeddingState::Missing;
                chunk.embeddingError = degradedReasonToString(outcome.reason);
                LOG_WARN(hrEmbedding, "Chunk %d stored without vector (%s)", i,
                         qUtf8Printable(chunk.embeddingError));
            } else {
                if (outcome.degraded) {
                    out.degraded = true;
                    out.degradedReason = outcome.reason;
                }
                StoredEmbedding embedding;
                embedding.values = outcome.vector;
                embedding.providerId = outcome.providerId;
                chunk.embedding = std::move(embedding);
                chunk.embeddingState = EmbeddingState::Valid;
                ++out.embedded;
            }
        }

        if (onProgress) {
            IngestionProgress progress;
            progress.current = i + 1;
            progress.total = total;
            progress.message = QStringLiteral("Embedded chunk %1 of %2").arg(i + 1).arg(total);
            onProgress(progress);
        }
    }
    return out;
}

bool KnowledgeEngine::upsertChunks(const std::vector<Chunk>& chunks, const Document& document)
{
    std::vector<VectorRecord> records;
    for (const Chunk& chunk : chunks) {
        if (chunk.embeddingState == EmbeddingState::Valid && chunk.embedding) {
            records.push_back(makeVectorRecord(chunk, document));
        }
    }
    if (records.empty()) {
        return true;
    }

    if (!m_index.isReachable()) {
        LOG_WARN(hrVector, "Vector index unreachable; %zu records left for the next sync", records.size());
        markIndexDirty();
        return false;
    }
    const EnsureCollectionResult ensured =
        m_index.ensureCollection(m_config.collectionName, m_registry.activeDimension());
    if (ensured == EnsureCollectionResult::Failed) {
        markIndexDirty();
        return false;
    }
    if (ensured == EnsureCollectionResult::Recreated) {
        m_store.setSetting(QString::fromLatin1(kMigrationPendingKey), QStringLiteral("1"));
    }

    const std::optional<int> written = m_index.insert(m_config.collectionName, records);
    if (!written) {
        LOG_WARN(hrVector, "Upsert for document %s failed; the next sync will retry",
                 qUtf8Printable(document.id));
        markIndexDirty();
        return false;
    }
    return true;
}

void KnowledgeEngine::markIndexDirty()
{
    if (!m_store.setSetting(QString::fromLatin1(kIndexDirtyKey), QStringLiteral("1"))) {
        LOG_ERROR(hrSync, "Failed to persist the index dirty flag");
    }
}

IngestionResult KnowledgeEngine::addDocument(Document document, const IngestionProgressCallback& onProgress)
{
    IngestionResult result;

    if (document.title.trimmed().isEmpty() || document.content.trimmed().isEmpty()) {
        result.status = IngestionStatus::Rejected;
        result.error = QStringLiteral("Document title and content are required");
        return result;
    }

    if (document.id.isEmpty()) {
        document.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    } else if (m_store.getDocument(document.id)) {
        result.status = IngestionStatus::Rejected;
        result.documentId = document.id;
        result.error = QStringLiteral("Document %1 already exists").arg(document.id);
        return result;
    }
    result.documentId = document.id;

    const double now = nowEpoch();
    if (document.createdAt <= 0.0) {
        document.createdAt = now;
    }
    document.updatedAt = now;

    std::vector<Chunk> chunks = m_chunker.chunkDocument(document.id, document.content);
    result.chunkCount = static_cast<int>(chunks.size());
    if (chunks.empty()) {
        result.status = IngestionStatus::Rejected;
        result.error = QStringLiteral("Document produced no chunks");
        return result;
    }

    const EmbeddedChunks embedded = embedChunks(chunks, onProgress);
    if (embedded.aborted) {
        result.status = IngestionStatus::Failed;
        result.error = embedded.error;
        return result;
    }
    result.embeddedChunks = embedded.embedded;
    result.failures = embedded.failures;
    result.degraded = embedded.degraded;
    result.degradedReason = embedded.degradedReason;

    std::lock_guard<std::mutex> writer(m_sync.writerLock());

    if (!m_store.insertDocument(document, chunks)) {
        result.status = IngestionStatus::Failed;
        result.error = QStringLiteral("Failed to store document %1").arg(document.id);
        return result;
    }

    result.vectorIndexUpdated = upsertChunks(chunks, document);
    result.status = result.failures.empty() ? IngestionStatus::Indexed
                                            : IngestionStatus::IndexedWithFailures;

    LOG_INFO(hrIndex, "Indexed document %s: %d chunks, %d embedded, %zu failures",
             qUtf8Printable(document.id), result.chunkCount, result.embeddedChunks,
             result.failures.size());
    return result;
}

IngestionResult KnowledgeEngine::updateDocument(const QString& documentId, const DocumentPatch& patch,
                                                const IngestionProgressCallback& onProgress)
{
    IngestionResult result;
    result.documentId = documentId;

    const std::optional<Document> existing = m_store.getDocument(documentId);
    if (!existing) {
        result.status = IngestionStatus::Rejected;
        result.error = QStringLiteral("Document %1 not found").arg(documentId);
        return result;
    }

    if (patch.isEmpty()) {
        result.status = IngestionStatus::Indexed;
        return result;
    }
    if (patch.content && patch.content->trimmed().isEmpty()) {
        result.status = IngestionStatus::Rejected;
        result.error = QStringLiteral("Document content cannot be empty");
        return result;
    }

    const std::vector<Chunk> oldChunks = m_store.chunksForDocument(documentId);
    std::vector<Chunk> chunks;

    if (patch.content) {
        chunks = m_chunker.chunkDocument(documentId, *patch.content);
        const EmbeddedChunks embedded = embedChunks(chunks, onProgress, oldChunks);
        if (embedded.aborted) {
            result.status = IngestionStatus::Failed;
            result.error = embedded.error;
            return result;
        }
        result.embeddedChunks = embedded.embedded;
        result.failures = embedded.failures;
        result.degraded = embedded.degraded;
        result.degradedReason = embedded.degradedReason;
    }

    std::lock_guard<std::mutex> writer(m_sync.writerLock());

    if (!m_store.beginTransaction()) {
        result.status = IngestionStatus::Failed;
        result.error = QStringLiteral("Could not open transaction");
        return result;
    }
    bool stored = m_store.updateDocumentFields(documentId, patch);
    if (stored && patch.content) {
        stored = m_store.replaceChunks(documentId, chunks);
    }
    if (!stored || !m_store.commitTransaction()) {
        m_store.rollbackTransaction();
        result.status = IngestionStatus::Failed;
        result.error = QStringLiteral("Failed to update document %1").arg(documentId);
        return result;
    }

    const std::optional<Document> updated = m_store.getDocument(documentId);
    if (!patch.content) {
        chunks = oldChunks;
    } else if (!oldChunks.empty()) {
        QStringList staleIds;
        for (const Chunk& old : oldChunks) {
            staleIds.append(chunkRecordId(old.id));
        }
        if (!m_index.isReachable() || !m_index.remove(m_config.collectionName, staleIds)) {
            LOG_WARN(hrVector, "Could not remove %d stale records for %s; the next sync will prune them",
                     static_cast<int>(staleIds.size()), qUtf8Printable(documentId));
            markIndexDirty();
        }
    }

    result.chunkCount = static_cast<int>(chunks.size());
    // Denormalized title/category/regions change with any patch.
    result.vectorIndexUpdated = updated && upsertChunks(chunks, *updated);
    result.status = result.failures.empty() ? IngestionStatus::Indexed
                                            : IngestionStatus::IndexedWithFailures;
    return result;
}

bool KnowledgeEngine::deleteDocument(const QString& documentId)
{
    std::lock_guard<std::mutex> writer(m_sync.writerLock());

    const std::vector<Chunk> chunks = m_store.chunksForDocument(documentId);
    if (!m_store.deleteDocument(documentId)) {
        return false;
    }

    QStringList ids;
    for (const Chunk& chunk : chunks) {
        ids.append(chunkRecordId(chunk.id));
    }
    if (!ids.isEmpty() && (!m_index.isReachable() || !m_index.remove(m_config.collectionName, ids))) {
        LOG_WARN(hrVector, "Vector records of %s not removed; the next sync will prune them",
                 qUtf8Printable(documentId));
        markIndexDirty();
    }
    return true;
}

std::optional<Document> KnowledgeEngine::getDocument(const QString& documentId)
{
    return m_store.getDocument(documentId);
}

std::vector<Formula> KnowledgeEngine::getFormulas(const std::optional<QString>& subcategory)
{
    return m_store.formulas(subcategory);
}

std::vector<RegulationSummary> KnowledgeEngine::getRegulations(const QString& region)
{
    return m_store.regulations(region);
}

// ── Providers and sync ──────────────────────────────────────

bool KnowledgeEngine::setActiveProvider(const QString& providerId)
{
    return m_registry.setActiveProvider(providerId);
}

void KnowledgeEngine::onActiveProviderChanged(const ProviderDescriptor& previous,
                                              const ProviderDescriptor& current)
{
    LOG_INFO(hrSync, "Provider switched %s (%d) -> %s (%d); migration pending",
             qUtf8Printable(previous.id), previous.dimension,
             qUtf8Printable(current.id), current.dimension);
    m_store.setSetting(QString::fromLatin1(kMigrationPendingKey), QStringLiteral("1"));

    if (m_config.migrateOnProviderSwitch && !synchronizeInBackground()) {
        LOG_INFO(hrSync, "A sync pass is running; migration to %s queued behind it",
                 qUtf8Printable(current.id));
    }
}

bool KnowledgeEngine::migrationPending()
{
    return m_store.getSetting(QString::fromLatin1(kMigrationPendingKey)).value_or(QString())
           == QLatin1String("1");
}

bool KnowledgeEngine::indexDirty()
{
    return m_store.getSetting(QString::fromLatin1(kIndexDirtyKey)).value_or(QString())
           == QLatin1String("1");
}

SyncReport KnowledgeEngine::synchronize(bool force)
{
    SyncOptions options;
    options.force = force;
    return m_sync.run(options);
}

bool KnowledgeEngine::synchronizeInBackground(bool force)
{
    return m_syncWorker->start(force);
}

void KnowledgeEngine::waitForBackgroundSync()
{
    m_syncWorker->wait();
}

IndexingReport KnowledgeEngine::indexingReport()
{
    IndexingReport report;
    report.activeProvider = m_registry.activeProvider();
    report.health = m_store.embeddingHealth(report.activeProvider.dimension);
    report.indexReachable = m_index.isReachable();
    if (report.indexReachable) {
        report.collection = m_index.describe(m_config.collectionName);
    }
    report.migrationPending = migrationPending();
    report.indexDirty = indexDirty();
    report.lastSyncEpoch = m_store.getSetting(QString::fromLatin1(kSyncEpochKey))
                               .value_or(QStringLiteral("0"))
                               .toLongLong();
    return report;
}

} // namespace hr
