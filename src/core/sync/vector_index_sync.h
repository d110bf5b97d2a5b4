#pragma once

#include "core/shared/chunk.h"
#include "core/shared/types.h"
#include "core/vector/vector_index_client.h"

#include <QSet>
#include <QString>

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>

namespace hr {

class EmbeddingProviderRegistry;
class KnowledgeStore;

// Setting keys owned by the sync pass.
inline constexpr const char* kSyncEpochKey = "vector_sync_epoch";
inline constexpr const char* kMigrationPendingKey = "vector_migration_pending";
// Set by document writers when an index write or removal was skipped or
// failed; the next pass scans everything and prunes orphans.
inline constexpr const char* kIndexDirtyKey = "vector_index_dirty";

struct SyncConfig {
    QString collectionName = QStringLiteral("technical_knowledge");
    int batchSize = 50;
    uint32_t pauseMs = 100;
    int reembedCharLimit = 8000;
};

struct SyncOptions {
    bool force = false;        // Scan even when counts and vectors look current
    std::function<void(int64_t processed, int64_t total)> onProgress;
};

struct SyncReport {
    bool skippedBusy = false;           // Another pass held the writer lock
    bool skippedUpToDate = false;       // Nothing to do
    bool indexUnreachable = false;
    bool collectionRecreated = false;
    int64_t epoch = 0;
    int64_t scanned = 0;
    int64_t reembedded = 0;
    int64_t upserted = 0;
    int64_t pruned = 0;                 // Index records with no chunk behind them
    int64_t failedChunks = 0;
    int64_t failedBatches = 0;
    QString error;

    bool ok() const { return error.isEmpty() && !skippedBusy; }
};

// Builds the vector-index mirror of a stored chunk. The vector comes from
// the chunk's stored embedding.
VectorRecord makeVectorRecord(const Chunk& chunk, const Document& document);

// VectorIndexSync reconciles the chunk table with the vector index.
//
// Idle -> Scanning -> per batch (Fetch -> Validate -> [Re-embed] -> Upsert)
// -> Prune -> Idle. A failed batch is logged and skipped; the cursor still
// advances. Only one pass runs at a time per instance. The migration flag is
// cleared only by a clean pass that ran under the provider still active at
// its end.
class VectorIndexSync {
public:
    VectorIndexSync(KnowledgeStore& store,
                    VectorIndexClient& index,
                    EmbeddingProviderRegistry& registry,
                    const SyncConfig& config = {});

    VectorIndexSync(const VectorIndexSync&) = delete;
    VectorIndexSync& operator=(const VectorIndexSync&) = delete;

    SyncReport run(const SyncOptions& options = {});

    bool isRunning() const;

    // Advisory single-writer lock. A pass holds it for its whole run;
    // document writers take it so they never interleave with a pass.
    std::mutex& writerLock() { return m_writerLock; }

    const SyncConfig& config() const { return m_config; }

private:
    SyncReport runLocked(const SyncOptions& options);
    bool needsWork(int dimension, bool force, EnsureCollectionResult ensured);
    void processBatch(const std::vector<Chunk>& batch, int dimension, SyncReport& report);
    bool pruneOrphans(const QSet<QString>& liveIds, SyncReport& report);
    bool flagSet(const char* key);

    KnowledgeStore& m_store;
    VectorIndexClient& m_index;
    EmbeddingProviderRegistry& m_registry;
    SyncConfig m_config;

    std::mutex m_writerLock;
    std::atomic<bool> m_running{false};
};

} // namespace hr
