#include "core/sync/vector_index_sync.h"
#include "core/embedding/embedding_provider_registry.h"
#include "core/index/knowledge_store.h"
#include "core/shared/logging.h"

#include <QDateTime>
#include <QHash>
#include <QThread>

namespace hr {

VectorRecord makeVectorRecord(const Chunk& chunk, const Document& document)
{
    VectorRecord record;
    record.id = chunkRecordId(chunk.id);
    if (chunk.embedding) {
        record.vector = chunk.embedding->values;
    }
    record.content = chunk.content;
    record.documentId = document.id;
    record.title = document.title;
    record.category = documentCategoryToString(document.category);
    record.subcategory = document.subcategory;
    record.regions = document.regions;
    record.language = document.metadata.language;
    record.timestamp = static_cast<double>(QDateTime::currentSecsSinceEpoch());
    return record;
}

VectorIndexSync::VectorIndexSync(KnowledgeStore& store,
                                 VectorIndexClient& index,
                                 EmbeddingProviderRegistry& registry,
                                 const SyncConfig& config)
    : m_store(store)
    , m_index(index)
    , m_registry(registry)
    , m_config(config)
{
    if (m_config.batchSize <= 0) {
        m_config.batchSize = 50;
    }
}

bool VectorIndexSync::isRunning() const
{
    return m_running.load();
}

SyncReport VectorIndexSync::run(const SyncOptions& options)
{
    std::unique_lock<std::mutex> lock(m_writerLock, std::try_to_lock);
    if (!lock.owns_lock()) {
        LOG_INFO(hrSync, "Sync already in progress, skipping");
        SyncReport report;
        report.skippedBusy = true;
        return report;
    }

    m_running.store(true);
    SyncReport report = runLocked(options);
    m_running.store(false);
    return report;
}

SyncReport VectorIndexSync::runLocked(const SyncOptions& options)
{
    SyncReport report;

    // Stamp the pass before touching either store.
    const int64_t previousEpoch = m_store.getSetting(QString::fromLatin1(kSyncEpochKey))
                                      .value_or(QStringLiteral("0"))
                                      .toLongLong();
    report.epoch = previousEpoch + 1;
    if (!m_store.setSetting(QString::fromLatin1(kSyncEpochKey), QString::number(report.epoch))) {
        LOG_WARN(hrSync, "Failed to persist sync epoch %lld", static_cast<long long>(report.epoch));
    }

    if (!m_index.isReachable()) {
        report.indexUnreachable = true;
        report.error = QStringLiteral("Vector index unreachable");
        LOG_WARN(hrSync, "Sync epoch %lld aborted: vector index unreachable",
                 static_cast<long long>(report.epoch));
        return report;
    }

    const QString providerId = m_registry.activeProvider().id;
    const int dimension = m_registry.activeDimension();
    const EnsureCollectionResult ensured = m_index.ensureCollection(m_config.collectionName, dimension);
    if (ensured == EnsureCollectionResult::Failed) {
        report.error = QStringLiteral("Could not prepare collection %1").arg(m_config.collectionName);
        LOG_ERROR(hrSync, "%s", qUtf8Printable(report.error));
        return report;
    }
    if (ensured == EnsureCollectionResult::Recreated) {
        report.collectionRecreated = true;
        LOG_WARN(hrSync, "Collection %s recreated for dimension %d",
                 qUtf8Printable(m_config.collectionName), dimension);
    }

    const bool migrationPending = flagSet(kMigrationPendingKey);
    const bool indexDirty = flagSet(kIndexDirtyKey);

    if (!needsWork(dimension, options.force || migrationPending || indexDirty, ensured)) {
        report.skippedUpToDate = true;
        LOG_DEBUG(hrSync, "Sync epoch %lld: index up to date", static_cast<long long>(report.epoch));
        return report;
    }

    const int64_t total = m_store.countChunks().value_or(0);
    LOG_INFO(hrSync, "Sync epoch %lld: scanning %lld chunks (dimension %d)",
             static_cast<long long>(report.epoch), static_cast<long long>(total), dimension);

    QSet<QString> liveIds;
    int64_t cursor = 0;
    while (true) {
        const std::vector<Chunk> batch = m_store.listChunksAfter(cursor, m_config.batchSize);
        if (batch.empty()) {
            break;
        }

        for (const Chunk& chunk : batch) {
            liveIds.insert(chunkRecordId(chunk.id));
        }
        processBatch(batch, dimension, report);
        cursor = batch.back().id;
        report.scanned += static_cast<int64_t>(batch.size());

        if (options.onProgress) {
            options.onProgress(report.scanned, total);
        }

        if (static_cast<int>(batch.size()) < m_config.batchSize) {
            break;
        }
        if (m_config.pauseMs > 0) {
            QThread::msleep(m_config.pauseMs);
        }
    }

    const bool pruned = pruneOrphans(liveIds, report);
    const bool clean = pruned && report.failedBatches == 0 && report.failedChunks == 0;

    if (migrationPending && clean) {
        if (m_registry.activeProvider().id == providerId) {
            m_store.setSetting(QString::fromLatin1(kMigrationPendingKey), QStringLiteral("0"));
        } else {
            LOG_INFO(hrSync, "Provider switched during epoch %lld; migration stays pending",
                     static_cast<long long>(report.epoch));
        }
    }
    if (indexDirty && clean) {
        m_store.setSetting(QString::fromLatin1(kIndexDirtyKey), QStringLiteral("0"));
    }

    LOG_INFO(hrSync, "Sync epoch %lld done: scanned=%lld reembedded=%lld upserted=%lld "
                     "pruned=%lld failedChunks=%lld failedBatches=%lld",
             static_cast<long long>(report.epoch),
             static_cast<long long>(report.scanned),
             static_cast<long long>(report.reembedded),
             static_cast<long long>(report.upserted),
             static_cast<long long>(report.pruned),
             static_cast<long long>(report.failedChunks),
             static_cast<long long>(report.failedBatches));
    return report;
}

bool VectorIndexSync::needsWork(int dimension, bool force, EnsureCollectionResult ensured)
{
    if (force || ensured != EnsureCollectionResult::Existing) {
        return true;
    }

    const std::optional<int64_t> chunkCount = m_store.countChunks();
    const std::optional<CollectionStatistics> stats = m_index.statistics(m_config.collectionName);
    if (!chunkCount || !stats) {
        LOG_WARN(hrSync, "Could not compare row counts, scanning everything");
        return true;
    }
    if (stats->rowCount != *chunkCount) {
        LOG_INFO(hrSync, "Index out of step: %lld rows for %lld chunks",
                 static_cast<long long>(stats->rowCount), static_cast<long long>(*chunkCount));
        return true;
    }

    // Counts match, but stored vectors may still be missing or stale.
    const EmbeddingHealth health = m_store.embeddingHealth(dimension);
    const int64_t stale = health.missingEmbeddings + health.malformedEmbeddings + health.dimensionMismatches;
    if (stale > 0) {
        LOG_INFO(hrSync, "%lld chunks need re-embedding", static_cast<long long>(stale));
        return true;
    }
    return false;
}

void VectorIndexSync::processBatch(const std::vector<Chunk>& batch, int dimension, SyncReport& report)
{
    QHash<QString, std::optional<Document>> documents;
    std::vector<VectorRecord> records;
    records.reserve(batch.size());

    if (!m_store.beginTransaction()) {
        ++report.failedBatches;
        LOG_WARN(hrSync, "Batch after chunk %lld skipped: could not open transaction",
                 static_cast<long long>(batch.front().id));
        return;
    }

    for (Chunk chunk : batch) {
        auto cached = documents.find(chunk.documentId);
        if (cached == documents.end()) {
            cached = documents.insert(chunk.documentId, m_store.getDocument(chunk.documentId));
        }
        if (!cached.value()) {
            ++report.failedChunks;
            LOG_WARN(hrSync, "Chunk %lld references missing document %s",
                     static_cast<long long>(chunk.id), qUtf8Printable(chunk.documentId));
            continue;
        }

        const bool current = chunk.embeddingState == EmbeddingState::Valid
            && chunk.embedding
            && chunk.embedding->dimension() == dimension;

        if (!current) {
            const EmbeddingOutcome outcome =
                m_registry.generateEmbedding(chunk.content.left(m_config.reembedCharLimit));
            if (outcome.degraded && isTransientEmbeddingFailure(outcome.reason)) {
                ++report.failedChunks;
                LOG_WARN(hrSync, "Re-embedding chunk %lld failed (%s): %s",
                         static_cast<long long>(chunk.id),
                         qUtf8Printable(degradedReasonToString(outcome.reason)),
                         qUtf8Printable(outcome.error));
                if (!m_store.markChunkEmbeddingFailed(chunk.id, degradedReasonToString(outcome.reason))) {
                    LOG_WARN(hrSync, "Could not record the failure of chunk %lld",
                             static_cast<long long>(chunk.id));
                }
                continue;
            }
            if (static_cast<int>(outcome.vector.size()) != dimension) {
                // The active provider changed under this pass.
                ++report.failedChunks;
                LOG_WARN(hrSync, "Chunk %lld got %zu dims, pass expects %d; left for the next pass",
                         static_cast<long long>(chunk.id), outcome.vector.size(), dimension);
                continue;
            }

            StoredEmbedding embedding;
            embedding.values = outcome.vector;
            embedding.providerId = outcome.providerId;
            if (!m_store.updateChunkEmbedding(chunk.id, embedding)) {
                ++report.failedChunks;
                continue;
            }
            chunk.embedding = std::move(embedding);
            chunk.embeddingState = EmbeddingState::Valid;
            ++report.reembedded;
        }

        records.push_back(makeVectorRecord(chunk, *cached.value()));
    }

    if (!m_store.commitTransaction()) {
        m_store.rollbackTransaction();
        ++report.failedBatches;
        LOG_WARN(hrSync, "Batch after chunk %lld: commit failed", static_cast<long long>(batch.front().id));
        return;
    }

    if (records.empty()) {
        return;
    }

    const std::optional<int> written = m_index.insert(m_config.collectionName, records);
    if (!written) {
        ++report.failedBatches;
        LOG_WARN(hrSync, "Upsert of %zu records failed, continuing with next batch", records.size());
        return;
    }
    report.upserted += *written;
}

bool VectorIndexSync::pruneOrphans(const QSet<QString>& liveIds, SyncReport& report)
{
    const std::optional<QStringList> indexed = m_index.listIds(m_config.collectionName);
    if (!indexed) {
        LOG_WARN(hrSync, "Could not list records of %s; orphans kept", qUtf8Printable(m_config.collectionName));
        return false;
    }

    QStringList orphans;
    for (const QString& id : *indexed) {
        if (!liveIds.contains(id)) {
            orphans.append(id);
        }
    }
    if (orphans.isEmpty()) {
        return true;
    }

    const std::optional<int> removed = m_index.remove(m_config.collectionName, orphans);
    if (!removed) {
        LOG_WARN(hrSync, "Removing %d orphaned records failed", static_cast<int>(orphans.size()));
        return false;
    }
    report.pruned += *removed;
    LOG_INFO(hrSync, "Pruned %d orphaned records", *removed);
    return true;
}

bool VectorIndexSync::flagSet(const char* key)
{
    return m_store.getSetting(QString::fromLatin1(key)).value_or(QString()) == QLatin1String("1");
}

} // namespace hr
