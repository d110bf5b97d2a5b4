#pragma once

#include "core/shared/chunk.h"
#include "core/shared/types.h"

#include <QString>
#include <QStringList>

#include <cstdint>
#include <optional>
#include <vector>

#include <sqlite3.h>

namespace hr {

// Chunk joined with the document fields the scorers and the quality
// validator need.
struct ChunkCandidate {
    Chunk chunk;
    QString title;
    DocumentCategory category = DocumentCategory::General;
    QString subcategory;
    QStringList regions;
    QString language;
    int referenceCount = 0;
};

struct DocumentIndexingStatus {
    QString documentId;
    QString title;
    int totalChunks = 0;
    int chunksWithEmbeddings = 0;
    int corruptedChunks = 0;
    QString status;        // fully_indexed, partially_indexed, not_indexed
};

struct EmbeddingHealth {
    int64_t totalChunks = 0;
    int64_t validEmbeddings = 0;
    int64_t missingEmbeddings = 0;
    int64_t malformedEmbeddings = 0;
    int64_t dimensionMismatches = 0;    // Valid vectors whose length != expected
    double coveragePct = 0.0;
    QString status;
    std::vector<DocumentIndexingStatus> documents;
};

// KnowledgeStore is the single owner of the SQLite database holding documents,
// chunks and their typed embedding column.
//
// Every document write is a single transaction: a document is never visible
// without its complete, contiguous chunk list.
class KnowledgeStore {
public:
    ~KnowledgeStore();

    // Move-only (owns sqlite3* handle)
    KnowledgeStore(KnowledgeStore&& other) noexcept : m_db(other.m_db) { other.m_db = nullptr; }
    KnowledgeStore& operator=(KnowledgeStore&& other) noexcept {
        if (this != &other) {
            if (m_db) sqlite3_close(m_db);
            m_db = other.m_db;
            other.m_db = nullptr;
        }
        return *this;
    }
    KnowledgeStore(const KnowledgeStore&) = delete;
    KnowledgeStore& operator=(const KnowledgeStore&) = delete;

    // Open or create the database at the given path (":memory:" works).
    // Creates schema and sets pragmas on first open, migrates older files.
    static std::optional<KnowledgeStore> open(const QString& dbPath);

    // ── Documents ───────────────────────────────────────────

    // Inserts the document and its chunks in one transaction. Assigns
    // chunk ids back into the vector.
    bool insertDocument(const Document& document, std::vector<Chunk>& chunks);

    // Applies every set field of the patch except content chunks.
    bool updateDocumentFields(const QString& documentId, const DocumentPatch& patch);

    // Replaces all chunks of a document in one transaction.
    bool replaceChunks(const QString& documentId, std::vector<Chunk>& chunks);

    bool deleteDocument(const QString& documentId);

    std::optional<Document> getDocument(const QString& documentId);
    std::vector<Document> listDocuments(const DocumentFilter& filter = {}, int limit = 1000);

    // ── Chunks ──────────────────────────────────────────────

    std::vector<Chunk> chunksForDocument(const QString& documentId);
    std::optional<int64_t> countChunks();

    // Page of chunks with id > cursorId, ordered by primary key.
    std::vector<Chunk> listChunksAfter(int64_t cursorId, int limit);
    std::vector<Chunk> chunksByIds(const std::vector<int64_t>& ids);

    bool updateChunkEmbedding(int64_t chunkId, const StoredEmbedding& embedding);
    bool markChunkEmbeddingFailed(int64_t chunkId, const QString& error);

    // Chunks of active documents matching the filter, newest documents
    // first, capped at maxDocuments documents.
    std::vector<ChunkCandidate> candidateChunks(const DocumentFilter& filter, int maxDocuments = 1000);

    // ── Domain lookups ──────────────────────────────────────

    // Formulas of hydraulics documents, optionally narrowed to a subcategory.
    std::vector<Formula> formulas(const std::optional<QString>& subcategory);
    std::vector<RegulationSummary> regulations(const QString& region);

    EmbeddingHealth embeddingHealth(int expectedDimension);

    // ── Settings ────────────────────────────────────────────

    std::optional<QString> getSetting(const QString& key);
    bool setSetting(const QString& key, const QString& value);

    // ── Transactions ────────────────────────────────────────

    bool beginTransaction();
    bool commitTransaction();
    bool rollbackTransaction();

    sqlite3* rawDb() const { return m_db; }

private:
    KnowledgeStore() = default;
    bool init(const QString& dbPath);
    bool execSql(const char* sql);

    bool insertChunkRows(const QString& documentId, double createdAt, std::vector<Chunk>& chunks);
    std::vector<Document> queryDocuments(const char* sql, const std::vector<QString>& binds);
    std::vector<Chunk> queryChunks(sqlite3_stmt* stmt);

    sqlite3* m_db = nullptr;
};

} // namespace hr
