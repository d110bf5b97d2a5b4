#pragma once

#include "core/embedding/provider_types.h"
#include "core/index/knowledge_store.h"
#include "core/indexing/chunker.h"
#include "core/quality/quality_validator.h"
#include "core/ranking/hybrid_ranker.h"
#include "core/ranking/lexical_scorer.h"
#include "core/ranking/semantic_scorer.h"
#include "core/shared/search_options.h"
#include "core/shared/search_result.h"
#include "core/shared/settings.h"
#include "core/sync/vector_index_sync.h"
#include "core/vector/vector_index_client.h"

#include <QString>

#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace hr {

class EmbeddingProviderRegistry;
class SyncWorker;

struct EngineConfig {
    QString collectionName = QStringLiteral("technical_knowledge");
    ChunkerConfig chunker;
    SyncConfig sync;
    double defaultAlpha = 0.6;
    double qualityMaxAgeYears = 10.0;
    int maxCandidateDocuments = 1000;
    bool migrateOnProviderSwitch = true;   // Start a background pass on switch

    static EngineConfig fromSettings(const Settings& settings);
};

// ── Ingestion ───────────────────────────────────────────────

struct IngestionProgress {
    int current = 0;
    int total = 0;
    QString message;
};

using IngestionProgressCallback = std::function<void(const IngestionProgress&)>;

struct ChunkFailure {
    int chunkIndex = 0;
    DegradedReason reason = DegradedReason::None;
    QString error;
};

enum class IngestionStatus {
    Indexed,
    IndexedWithFailures,   // Some later chunks stored without a vector
    Rejected,              // Invalid input, nothing stored
    Failed,                // Provider or storage failure, nothing stored
};

QString ingestionStatusToString(IngestionStatus status);

struct IngestionResult {
    IngestionStatus status = IngestionStatus::Failed;
    QString documentId;
    int chunkCount = 0;
    int embeddedChunks = 0;
    bool degraded = false;
    DegradedReason degradedReason = DegradedReason::None;
    bool vectorIndexUpdated = false;
    std::vector<ChunkFailure> failures;
    QString error;

    bool ok() const
    {
        return status == IngestionStatus::Indexed || status == IngestionStatus::IndexedWithFailures;
    }
};

// ── Search ──────────────────────────────────────────────────

struct SearchResponse {
    std::vector<SearchResult> results;
    std::vector<QualityMetrics> quality;          // Parallel to results when validated
    std::optional<QualityReport> qualityReport;
    int candidateChunks = 0;
    bool lexicalOnly = false;
    bool indexUnreachable = false;
    bool reranked = false;
    bool rerankFailed = false;
    bool degraded = false;
    DegradedReason degradedReason = DegradedReason::None;
};

QJsonObject searchResponseToJson(const SearchResponse& response);

struct IndexingReport {
    EmbeddingHealth health;
    ProviderDescriptor activeProvider;
    bool indexReachable = false;
    std::optional<CollectionDescription> collection;
    bool migrationPending = false;
    bool indexDirty = false;
    int64_t lastSyncEpoch = 0;
};

QJsonObject indexingReportToJson(const IndexingReport& report);

// KnowledgeEngine: the retrieval API over the relational store, the
// vector index and the embedding providers.
//
// The engine owns the consistency protocol between the two stores, not the
// stores themselves. Writes go to the relational store first; the vector
// index is updated best effort and healed by VectorIndexSync.
//
// Query-path failures never reach the caller: an unreachable index falls
// back to in-process scoring, a missing query vector to lexical-only.
class KnowledgeEngine {
public:
    KnowledgeEngine(KnowledgeStore& store,
                    VectorIndexClient& index,
                    EmbeddingProviderRegistry& registry,
                    const EngineConfig& config = {});
    ~KnowledgeEngine();

    KnowledgeEngine(const KnowledgeEngine&) = delete;
    KnowledgeEngine& operator=(const KnowledgeEngine&) = delete;

    // ── Retrieval ───────────────────────────────────────────

    SearchResponse search(const QString& query, const SearchOptions& options = {});

    // alpha 0.7, no re-rank.
    SearchResponse quickSearch(const QString& query,
                               const std::optional<DocumentCategory>& category = std::nullopt,
                               int topK = 5);

    // alpha 0.6, re-rank on; other fields of options are kept.
    SearchResponse advancedSearch(const QString& query, SearchOptions options = {});

    // ── Documents ───────────────────────────────────────────

    // Chunks and embeds sequentially, reporting progress after each chunk.
    // A transient provider failure on chunk 0 aborts the document.
    IngestionResult addDocument(Document document, const IngestionProgressCallback& onProgress = {});

    // Applies the patch. New content is re-chunked; chunks whose text is
    // unchanged keep their vectors.
    IngestionResult updateDocument(const QString& documentId, const DocumentPatch& patch,
                                   const IngestionProgressCallback& onProgress = {});

    bool deleteDocument(const QString& documentId);

    std::optional<Document> getDocument(const QString& documentId);
    std::vector<Formula> getFormulas(const std::optional<QString>& subcategory = std::nullopt);
    std::vector<RegulationSummary> getRegulations(const QString& region);

    // ── Providers and sync ──────────────────────────────────

    // Switches the active provider and marks a migration pass pending.
    bool setActiveProvider(const QString& providerId);
    bool migrationPending();
    // True while an index write or removal awaits the next sync pass.
    bool indexDirty();

    SyncReport synchronize(bool force = false);

    // Returns false if a background pass is already running.
    bool synchronizeInBackground(bool force = false);
    void waitForBackgroundSync();
    SyncWorker* syncWorker() const { return m_syncWorker.get(); }

    IndexingReport indexingReport();

    const EngineConfig& config() const { return m_config; }

private:
    struct EmbeddedChunks {
        bool aborted = false;
        QString error;
        std::vector<ChunkFailure> failures;
        int embedded = 0;
        bool degraded = false;
        DegradedReason degradedReason = DegradedReason::None;
    };

    EmbeddedChunks embedChunks(std::vector<Chunk>& chunks,
                               const IngestionProgressCallback& onProgress,
                               const std::vector<Chunk>& reusable = {});

    bool upsertChunks(const std::vector<Chunk>& chunks, const Document& document);
    void markIndexDirty();

    std::vector<ScoredChunk> semanticStage(const std::vector<float>& queryVector,
                                           const std::vector<ChunkCandidate>& candidates,
                                           const SearchOptions& options,
                                           SearchResponse& response);

    void onActiveProviderChanged(const ProviderDescriptor& previous, const ProviderDescriptor& current);

    KnowledgeStore& m_store;
    VectorIndexClient& m_index;
    EmbeddingProviderRegistry& m_registry;
    EngineConfig m_config;

    Chunker m_chunker;
    LexicalScorer m_lexicalScorer;
    SemanticScorer m_semanticScorer;
    HybridRanker m_ranker;
    QualityValidator m_validator;

    VectorIndexSync m_sync;
    std::unique_ptr<SyncWorker> m_syncWorker;
    int m_listenerToken = 0;
};

} // namespace hr
