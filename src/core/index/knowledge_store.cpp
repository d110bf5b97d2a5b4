#include "core/index/knowledge_store.h"
#include "core/index/migration.h"
#include "core/index/schema.h"
#include "core/shared/logging.h"

#include <QDateTime>
#include <QFile>
#include <QHash>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QThread>

namespace hr {

namespace {

constexpr const char* kChunkColumns =
    "c.id, c.document_id, c.chunk_index, c.content, c.content_hash, c.embedding, "
    "c.embedding_dim, c.embedding_provider, c.embedding_version, c.embedding_error, c.created_at";

constexpr const char* kDocumentColumns =
    "id, category, subcategory, regions, title, content, metadata, language, version, "
    "status, created_at, updated_at";

constexpr const char* kInsertDocumentSql = R"(
    INSERT INTO documents (id, category, subcategory, regions, title, content, metadata,
                           language, version, status, created_at, updated_at)
    VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12)
)";

constexpr const char* kInsertChunkSql = R"(
    INSERT INTO chunks (document_id, chunk_index, content, content_hash, embedding,
                        embedding_dim, embedding_provider, embedding_version,
                        embedding_error, created_at)
    VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10)
)";

constexpr const char* kUpdateEmbeddingSql = R"(
    UPDATE chunks
    SET embedding = ?2, embedding_dim = ?3, embedding_provider = ?4,
        embedding_version = ?5, embedding_error = NULL
    WHERE id = ?1
)";

constexpr const char* kMarkEmbeddingFailedSql = R"(
    UPDATE chunks
    SET embedding = NULL, embedding_dim = NULL, embedding_provider = NULL,
        embedding_version = NULL, embedding_error = ?2
    WHERE id = ?1
)";

constexpr const char* kDeleteChunksSql = "DELETE FROM chunks WHERE document_id = ?1";
constexpr const char* kDeleteDocumentSql = "DELETE FROM documents WHERE id = ?1";
constexpr const char* kCountChunksSql = "SELECT COUNT(*) FROM chunks";
constexpr const char* kGetSettingSql = "SELECT value FROM settings WHERE key = ?1";
constexpr const char* kSetSettingSql =
    "INSERT OR REPLACE INTO settings (key, value) VALUES (?1, ?2)";

QString columnText(sqlite3_stmt* stmt, int column)
{
    const unsigned char* text = sqlite3_column_text(stmt, column);
    if (!text) {
        return {};
    }
    return QString::fromUtf8(reinterpret_cast<const char*>(text));
}

void bindText(sqlite3_stmt* stmt, int index, const QString& value)
{
    const QByteArray utf8 = value.toUtf8();
    sqlite3_bind_text(stmt, index, utf8.constData(), static_cast<int>(utf8.size()), SQLITE_TRANSIENT);
}

void bindOptionalText(sqlite3_stmt* stmt, int index, const QString& value)
{
    if (value.isEmpty()) {
        sqlite3_bind_null(stmt, index);
    } else {
        bindText(stmt, index, value);
    }
}

QString regionsToJson(const QStringList& regions)
{
    return QString::fromUtf8(QJsonDocument(QJsonArray::fromStringList(regions))
                                 .toJson(QJsonDocument::Compact));
}

QStringList regionsFromJson(const QString& text)
{
    QStringList regions;
    for (const QJsonValue& value : QJsonDocument::fromJson(text.toUtf8()).array()) {
        regions.append(value.toString());
    }
    return regions;
}

QString metadataText(const DocumentMetadata& metadata)
{
    return QString::fromUtf8(QJsonDocument(metadataToJson(metadata)).toJson(QJsonDocument::Compact));
}

DocumentMetadata metadataFromText(const QString& text)
{
    return metadataFromJson(QJsonDocument::fromJson(text.toUtf8()).object());
}

// Reads the typed embedding columns starting at `column` (blob, dim,
// provider, version, error).
void readEmbedding(sqlite3_stmt* stmt, int column, Chunk& chunk)
{
    chunk.embeddingError = columnText(stmt, column + 4);

    if (sqlite3_column_type(stmt, column) == SQLITE_NULL) {
        chunk.embeddingState = chunk.embeddingError == QLatin1String("malformed")
            ? EmbeddingState::Malformed
            : EmbeddingState::Missing;
        return;
    }

    const void* blobData = sqlite3_column_blob(stmt, column);
    const int blobSize = sqlite3_column_bytes(stmt, column);
    const QByteArray blob(static_cast<const char*>(blobData), blobSize);
    const int dimension = sqlite3_column_int(stmt, column + 1);

    std::optional<std::vector<float>> values = decodeEmbeddingBlob(blob, dimension);
    if (!values) {
        chunk.embeddingState = EmbeddingState::Malformed;
        return;
    }

    StoredEmbedding embedding;
    embedding.values = std::move(*values);
    embedding.providerId = columnText(stmt, column + 2);
    embedding.formatVersion = sqlite3_column_int(stmt, column + 3);
    chunk.embedding = std::move(embedding);
    chunk.embeddingState = EmbeddingState::Valid;
}

Chunk readChunk(sqlite3_stmt* stmt)
{
    Chunk chunk;
    chunk.id = sqlite3_column_int64(stmt, 0);
    chunk.documentId = columnText(stmt, 1);
    chunk.chunkIndex = sqlite3_column_int(stmt, 2);
    chunk.content = columnText(stmt, 3);
    chunk.contentHash = columnText(stmt, 4);
    readEmbedding(stmt, 5, chunk);
    chunk.documentCreatedAt = sqlite3_column_double(stmt, 10);
    return chunk;
}

Document readDocument(sqlite3_stmt* stmt)
{
    Document document;
    document.id = columnText(stmt, 0);
    document.category = documentCategoryFromString(columnText(stmt, 1));
    document.subcategory = columnText(stmt, 2);
    document.regions = regionsFromJson(columnText(stmt, 3));
    document.title = columnText(stmt, 4);
    document.content = columnText(stmt, 5);
    document.metadata = metadataFromText(columnText(stmt, 6));
    document.metadata.language = columnText(stmt, 7);
    document.version = columnText(stmt, 8);
    document.status = columnText(stmt, 9);
    document.createdAt = sqlite3_column_double(stmt, 10);
    document.updatedAt = sqlite3_column_double(stmt, 11);
    return document;
}

// Builds " AND ..." clauses for a document filter over table alias `d`.
QString filterClause(const DocumentFilter& filter, std::vector<QString>& binds)
{
    QString clause;
    if (filter.category) {
        clause += QStringLiteral(" AND d.category = ?");
        binds.push_back(documentCategoryToString(*filter.category));
    }
    if (filter.region) {
        clause += QStringLiteral(" AND d.regions LIKE ?");
        binds.push_back(QLatin1Char('%') + *filter.region + QLatin1Char('%'));
    }
    if (filter.language) {
        clause += QStringLiteral(" AND d.language = ?");
        binds.push_back(*filter.language);
    }
    return clause;
}

} // namespace

// ── Lifecycle ───────────────────────────────────────────────

KnowledgeStore::~KnowledgeStore()
{
    if (m_db) {
        sqlite3_close(m_db);
    }
}

std::optional<KnowledgeStore> KnowledgeStore::open(const QString& dbPath)
{
    KnowledgeStore store;
    if (!store.init(dbPath)) {
        return std::nullopt;
    }
    return store;
}

bool KnowledgeStore::init(const QString& dbPath)
{
    int rc = sqlite3_open(dbPath.toUtf8().constData(), &m_db);
    if (rc != SQLITE_OK) {
        LOG_ERROR(hrIndex, "Failed to open database: %s", sqlite3_errmsg(m_db));
        return false;
    }

    // Set busy_timeout FIRST via C API, before running any SQL.
    sqlite3_busy_timeout(m_db, 30000);

    if (!execSql(kConnectionPragmas)) {
        LOG_ERROR(hrIndex, "Failed to set connection pragmas");
        return false;
    }

    bool schemaExists = false;
    {
        sqlite3_stmt* stmt = nullptr;
        rc = sqlite3_prepare_v2(m_db,
            "SELECT count(*) FROM sqlite_master WHERE type='table' AND name='documents'",
            -1, &stmt, nullptr);
        if (rc == SQLITE_OK && sqlite3_step(stmt) == SQLITE_ROW) {
            schemaExists = (sqlite3_column_int(stmt, 0) > 0);
        }
        sqlite3_finalize(stmt);
    }

    if (!schemaExists) {
        // First open: set database-level pragmas (requires write lock).
        // In-memory databases report "memory" instead of WAL; that is fine.
        if (!execSql(kDatabasePragmas)) {
            LOG_ERROR(hrIndex, "Failed to set database pragmas");
            return false;
        }
        if (!execSql(kSchemaV2)) {
            LOG_ERROR(hrIndex, "Failed to create schema");
            return false;
        }
        if (!execSql(kDefaultSettings)) {
            LOG_ERROR(hrIndex, "Failed to insert default settings");
            return false;
        }
    }

    if (!applyMigrations(m_db, kCurrentSchemaVersion)) {
        LOG_ERROR(hrIndex, "Migration failed");
        return false;
    }

    if (dbPath != QLatin1String(":memory:")) {
        // Restrict database file permissions to owner-only (0600)
        QFile dbFile(dbPath);
        dbFile.setPermissions(QFile::ReadOwner | QFile::WriteOwner);
    }

    LOG_INFO(hrIndex, "Database opened successfully: %s", qUtf8Printable(dbPath));
    return true;
}

bool KnowledgeStore::execSql(const char* sql)
{
    char* errMsg = nullptr;
    const int rc = sqlite3_exec(m_db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        LOG_ERROR(hrIndex, "SQL error: %s", errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

// ── Documents ───────────────────────────────────────────────

bool KnowledgeStore::insertChunkRows(const QString& documentId, double createdAt,
                                     std::vector<Chunk>& chunks)
{
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kInsertChunkSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(hrIndex, "chunk insert prepare: %s", sqlite3_errmsg(m_db));
        return false;
    }

    for (size_t i = 0; i < chunks.size(); ++i) {
        Chunk& chunk = chunks[i];
        chunk.documentId = documentId;
        chunk.chunkIndex = static_cast<int>(i);
        chunk.documentCreatedAt = createdAt;
        if (chunk.contentHash.isEmpty()) {
            chunk.contentHash = computeContentHash(chunk.content);
        }

        bindText(stmt, 1, documentId);
        sqlite3_bind_int(stmt, 2, chunk.chunkIndex);
        bindText(stmt, 3, chunk.content);
        bindText(stmt, 4, chunk.contentHash);
        if (chunk.embedding && !chunk.embedding->values.empty()) {
            const QByteArray blob = encodeEmbeddingBlob(chunk.embedding->values);
            sqlite3_bind_blob(stmt, 5, blob.constData(), static_cast<int>(blob.size()), SQLITE_TRANSIENT);
            sqlite3_bind_int(stmt, 6, chunk.embedding->dimension());
            bindOptionalText(stmt, 7, chunk.embedding->providerId);
            sqlite3_bind_int(stmt, 8, chunk.embedding->formatVersion);
            sqlite3_bind_null(stmt, 9);
            chunk.embeddingState = EmbeddingState::Valid;
        } else {
            sqlite3_bind_null(stmt, 5);
            sqlite3_bind_null(stmt, 6);
            sqlite3_bind_null(stmt, 7);
            sqlite3_bind_null(stmt, 8);
            bindOptionalText(stmt, 9, chunk.embeddingError);
            chunk.embeddingState = EmbeddingState::Missing;
        }
        sqlite3_bind_double(stmt, 10, createdAt);

        const int rc = sqlite3_step(stmt);
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);
        if (rc != SQLITE_DONE) {
            LOG_ERROR(hrIndex, "chunk insert failed: %s", sqlite3_errmsg(m_db));
            sqlite3_finalize(stmt);
            return false;
        }
        chunk.id = sqlite3_last_insert_rowid(m_db);
    }

    sqlite3_finalize(stmt);
    return true;
}

bool KnowledgeStore::insertDocument(const Document& document, std::vector<Chunk>& chunks)
{
    if (!execSql("SAVEPOINT insert_document")) return false;

    auto rollback = [this]() {
        execSql("ROLLBACK TO SAVEPOINT insert_document");
        execSql("RELEASE SAVEPOINT insert_document");
        return false;
    };

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kInsertDocumentSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(hrIndex, "document insert prepare: %s", sqlite3_errmsg(m_db));
        return rollback();
    }

    bindText(stmt, 1, document.id);
    bindText(stmt, 2, documentCategoryToString(document.category));
    bindOptionalText(stmt, 3, document.subcategory);
    bindText(stmt, 4, regionsToJson(document.regions));
    bindText(stmt, 5, document.title);
    bindText(stmt, 6, document.content);
    bindText(stmt, 7, metadataText(document.metadata));
    bindText(stmt, 8, document.metadata.language);
    bindText(stmt, 9, document.version);
    bindText(stmt, 10, document.status);
    sqlite3_bind_double(stmt, 11, document.createdAt);
    sqlite3_bind_double(stmt, 12, document.updatedAt);

    // Retry loop: sqlite3_busy_timeout's handler is NOT invoked when SQLite
    // detects a potential WAL deadlock, so retry at the application level.
    int rc = SQLITE_BUSY;
    for (int attempt = 0; attempt < 5 && rc == SQLITE_BUSY; ++attempt) {
        if (attempt > 0) {
            sqlite3_reset(stmt);
            QThread::msleep(50 * attempt);  // 50, 100, 150, 200 ms
        }
        rc = sqlite3_step(stmt);
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        LOG_ERROR(hrIndex, "document insert failed: %s", sqlite3_errmsg(m_db));
        return rollback();
    }

    if (!insertChunkRows(document.id, document.createdAt, chunks)) {
        return rollback();
    }

    return execSql("RELEASE SAVEPOINT insert_document");
}

bool KnowledgeStore::updateDocumentFields(const QString& documentId, const DocumentPatch& patch)
{
    std::optional<Document> existing = getDocument(documentId);
    if (!existing) {
        LOG_WARN(hrIndex, "updateDocumentFields: unknown document %s", qUtf8Printable(documentId));
        return false;
    }

    Document updated = *existing;
    if (patch.category) updated.category = *patch.category;
    if (patch.subcategory) updated.subcategory = *patch.subcategory;
    if (patch.regions) updated.regions = *patch.regions;
    if (patch.title) updated.title = *patch.title;
    if (patch.content) updated.content = *patch.content;
    if (patch.metadata) updated.metadata = *patch.metadata;
    if (patch.version) updated.version = *patch.version;
    updated.updatedAt = static_cast<double>(QDateTime::currentSecsSinceEpoch());

    constexpr const char* sql = R"(
        UPDATE documents
        SET category = ?2, subcategory = ?3, regions = ?4, title = ?5, content = ?6,
            metadata = ?7, language = ?8, version = ?9, updated_at = ?10
        WHERE id = ?1
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(hrIndex, "document update prepare: %s", sqlite3_errmsg(m_db));
        return false;
    }

    bindText(stmt, 1, updated.id);
    bindText(stmt, 2, documentCategoryToString(updated.category));
    bindOptionalText(stmt, 3, updated.subcategory);
    bindText(stmt, 4, regionsToJson(updated.regions));
    bindText(stmt, 5, updated.title);
    bindText(stmt, 6, updated.content);
    bindText(stmt, 7, metadataText(updated.metadata));
    bindText(stmt, 8, updated.metadata.language);
    bindText(stmt, 9, updated.version);
    sqlite3_bind_double(stmt, 10, updated.updatedAt);

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR(hrIndex, "document update failed: %s", sqlite3_errmsg(m_db));
        return false;
    }
    return true;
}

bool KnowledgeStore::replaceChunks(const QString& documentId, std::vector<Chunk>& chunks)
{
    std::optional<Document> document = getDocument(documentId);
    if (!document) {
        return false;
    }

    if (!execSql("SAVEPOINT replace_chunks")) return false;

    sqlite3_stmt* stmt = nullptr;
    bool ok = sqlite3_prepare_v2(m_db, kDeleteChunksSql, -1, &stmt, nullptr) == SQLITE_OK;
    if (ok) {
        bindText(stmt, 1, documentId);
        ok = sqlite3_step(stmt) == SQLITE_DONE;
    }
    sqlite3_finalize(stmt);

    if (!ok || !insertChunkRows(documentId, document->createdAt, chunks)) {
        LOG_ERROR(hrIndex, "replaceChunks failed for %s: %s",
                  qUtf8Printable(documentId), sqlite3_errmsg(m_db));
        execSql("ROLLBACK TO SAVEPOINT replace_chunks");
        execSql("RELEASE SAVEPOINT replace_chunks");
        return false;
    }

    return execSql("RELEASE SAVEPOINT replace_chunks");
}

bool KnowledgeStore::deleteDocument(const QString& documentId)
{
    // Chunks cascade through the foreign key.
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kDeleteDocumentSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(hrIndex, "document delete prepare: %s", sqlite3_errmsg(m_db));
        return false;
    }
    bindText(stmt, 1, documentId);
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR(hrIndex, "document delete failed: %s", sqlite3_errmsg(m_db));
        return false;
    }
    return sqlite3_changes(m_db) > 0;
}

std::vector<Document> KnowledgeStore::queryDocuments(const char* sql, const std::vector<QString>& binds)
{
    std::vector<Document> documents;
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(hrIndex, "document query prepare: %s", sqlite3_errmsg(m_db));
        return documents;
    }
    for (size_t i = 0; i < binds.size(); ++i) {
        bindText(stmt, static_cast<int>(i + 1), binds[i]);
    }
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        documents.push_back(readDocument(stmt));
    }
    sqlite3_finalize(stmt);
    return documents;
}

std::optional<Document> KnowledgeStore::getDocument(const QString& documentId)
{
    const QByteArray sql = QStringLiteral("SELECT %1 FROM documents WHERE id = ?")
                               .arg(QLatin1String(kDocumentColumns))
                               .toUtf8();
    std::vector<Document> rows = queryDocuments(sql.constData(), {documentId});
    if (rows.empty()) {
        return std::nullopt;
    }
    return std::move(rows.front());
}

std::vector<Document> KnowledgeStore::listDocuments(const DocumentFilter& filter, int limit)
{
    std::vector<QString> binds;
    const QString clause = filterClause(filter, binds);
    const QByteArray sql = QStringLiteral(
        "SELECT %1 FROM documents d WHERE d.status = 'active'%2 ORDER BY d.created_at DESC LIMIT %3")
                               .arg(QLatin1String(kDocumentColumns), clause)
                               .arg(std::max(limit, 0))
                               .toUtf8();
    return queryDocuments(sql.constData(), binds);
}

// ── Chunks ──────────────────────────────────────────────────

std::vector<Chunk> KnowledgeStore::queryChunks(sqlite3_stmt* stmt)
{
    std::vector<Chunk> chunks;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        chunks.push_back(readChunk(stmt));
    }
    if (rc != SQLITE_DONE) {
        LOG_ERROR(hrIndex, "chunk query failed: %s", sqlite3_errmsg(m_db));
    }
    sqlite3_finalize(stmt);
    return chunks;
}

std::vector<Chunk> KnowledgeStore::chunksForDocument(const QString& documentId)
{
    const QByteArray sql = QStringLiteral(
        "SELECT %1 FROM chunks c WHERE c.document_id = ?1 ORDER BY c.chunk_index")
                               .arg(QLatin1String(kChunkColumns))
                               .toUtf8();
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(hrIndex, "chunksForDocument prepare: %s", sqlite3_errmsg(m_db));
        return {};
    }
    bindText(stmt, 1, documentId);
    return queryChunks(stmt);
}

std::optional<int64_t> KnowledgeStore::countChunks()
{
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kCountChunksSql, -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }
    std::optional<int64_t> count;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = sqlite3_column_int64(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return count;
}

std::vector<Chunk> KnowledgeStore::listChunksAfter(int64_t cursorId, int limit)
{
    const QByteArray sql = QStringLiteral(
        "SELECT %1 FROM chunks c WHERE c.id > ?1 ORDER BY c.id LIMIT ?2")
                               .arg(QLatin1String(kChunkColumns))
                               .toUtf8();
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(hrIndex, "listChunksAfter prepare: %s", sqlite3_errmsg(m_db));
        return {};
    }
    sqlite3_bind_int64(stmt, 1, cursorId);
    sqlite3_bind_int(stmt, 2, limit);
    return queryChunks(stmt);
}

std::vector<Chunk> KnowledgeStore::chunksByIds(const std::vector<int64_t>& ids)
{
    if (ids.empty()) {
        return {};
    }
    QStringList placeholders;
    for (size_t i = 0; i < ids.size(); ++i) {
        placeholders.append(QStringLiteral("?"));
    }
    const QByteArray sql = QStringLiteral("SELECT %1 FROM chunks c WHERE c.id IN (%2) ORDER BY c.id")
                               .arg(QLatin1String(kChunkColumns), placeholders.join(QLatin1Char(',')))
                               .toUtf8();
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(hrIndex, "chunksByIds prepare: %s", sqlite3_errmsg(m_db));
        return {};
    }
    for (size_t i = 0; i < ids.size(); ++i) {
        sqlite3_bind_int64(stmt, static_cast<int>(i + 1), ids[i]);
    }
    return queryChunks(stmt);
}

bool KnowledgeStore::updateChunkEmbedding(int64_t chunkId, const StoredEmbedding& embedding)
{
    if (embedding.values.empty() || hasNonFiniteComponent(embedding.values)) {
        LOG_WARN(hrIndex, "Refusing to store invalid embedding for chunk %lld",
                 static_cast<long long>(chunkId));
        return false;
    }

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kUpdateEmbeddingSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(hrIndex, "updateChunkEmbedding prepare: %s", sqlite3_errmsg(m_db));
        return false;
    }

    const QByteArray blob = encodeEmbeddingBlob(embedding.values);
    sqlite3_bind_int64(stmt, 1, chunkId);
    sqlite3_bind_blob(stmt, 2, blob.constData(), static_cast<int>(blob.size()), SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 3, embedding.dimension());
    bindOptionalText(stmt, 4, embedding.providerId);
    sqlite3_bind_int(stmt, 5, embedding.formatVersion);

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR(hrIndex, "updateChunkEmbedding failed: %s", sqlite3_errmsg(m_db));
        return false;
    }
    return sqlite3_changes(m_db) > 0;
}

bool KnowledgeStore::markChunkEmbeddingFailed(int64_t chunkId, const QString& error)
{
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kMarkEmbeddingFailedSql, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }
    sqlite3_bind_int64(stmt, 1, chunkId);
    bindText(stmt, 2, error);
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE;
}

std::vector<ChunkCandidate> KnowledgeStore::candidateChunks(const DocumentFilter& filter, int maxDocuments)
{
    std::vector<QString> binds;
    const QString clause = filterClause(filter, binds);
    const QByteArray sql = QStringLiteral(R"(
        SELECT %1, d.title, d.category, d.subcategory, d.regions, d.language, d.metadata
        FROM chunks c
        JOIN (SELECT id, title, category, subcategory, regions, language, metadata
              FROM documents d
              WHERE d.status = 'active'%2
              ORDER BY d.created_at DESC
              LIMIT %3) d ON d.id = c.document_id
        ORDER BY c.id
    )")
                               .arg(QLatin1String(kChunkColumns), clause)
                               .arg(std::max(maxDocuments, 0))
                               .toUtf8();

    std::vector<ChunkCandidate> candidates;
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(hrIndex, "candidateChunks prepare: %s", sqlite3_errmsg(m_db));
        return candidates;
    }
    for (size_t i = 0; i < binds.size(); ++i) {
        bindText(stmt, static_cast<int>(i + 1), binds[i]);
    }

    QHash<QString, int> referenceCounts;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        ChunkCandidate candidate;
        candidate.chunk = readChunk(stmt);
        candidate.title = columnText(stmt, 11);
        candidate.category = documentCategoryFromString(columnText(stmt, 12));
        candidate.subcategory = columnText(stmt, 13);
        candidate.regions = regionsFromJson(columnText(stmt, 14));
        candidate.language = columnText(stmt, 15);

        auto cached = referenceCounts.constFind(candidate.chunk.documentId);
        if (cached == referenceCounts.cend()) {
            const int count = static_cast<int>(metadataFromText(columnText(stmt, 16)).references.size());
            cached = referenceCounts.insert(candidate.chunk.documentId, count);
        }
        candidate.referenceCount = cached.value();

        if (candidate.chunk.embeddingState == EmbeddingState::Malformed) {
            LOG_DEBUG(hrIndex, "Chunk %lld has a malformed embedding",
                      static_cast<long long>(candidate.chunk.id));
        }
        candidates.push_back(std::move(candidate));
    }
    sqlite3_finalize(stmt);
    return candidates;
}

// ── Domain lookups ──────────────────────────────────────────

std::vector<Formula> KnowledgeStore::formulas(const std::optional<QString>& subcategory)
{
    std::vector<QString> binds{documentCategoryToString(DocumentCategory::Hydraulics)};
    QString sql = QStringLiteral("SELECT %1 FROM documents WHERE status = 'active' AND category = ?")
                      .arg(QLatin1String(kDocumentColumns));
    if (subcategory && !subcategory->isEmpty()) {
        sql += QStringLiteral(" AND subcategory = ?");
        binds.push_back(*subcategory);
    }
    sql += QStringLiteral(" ORDER BY created_at");

    std::vector<Formula> out;
    for (const Document& document : queryDocuments(sql.toUtf8().constData(), binds)) {
        out.insert(out.end(), document.metadata.formulas.begin(), document.metadata.formulas.end());
    }
    return out;
}

std::vector<RegulationSummary> KnowledgeStore::regulations(const QString& region)
{
    const QByteArray sql = QStringLiteral(
        "SELECT %1 FROM documents d WHERE d.status = 'active' AND d.category = ? "
        "AND d.regions LIKE ? ORDER BY d.created_at")
                               .arg(QLatin1String(kDocumentColumns))
                               .toUtf8();

    std::vector<RegulationSummary> out;
    for (const Document& document : queryDocuments(
             sql.constData(),
             {documentCategoryToString(DocumentCategory::Regulations),
              QLatin1Char('%') + region + QLatin1Char('%')})) {
        RegulationSummary summary;
        summary.id = document.id;
        summary.title = document.title;
        summary.regions = document.regions;
        summary.references = document.metadata.references;
        summary.content = document.content;
        out.push_back(std::move(summary));
    }
    return out;
}

EmbeddingHealth KnowledgeStore::embeddingHealth(int expectedDimension)
{
    EmbeddingHealth health;

    const QByteArray sql = QStringLiteral(
        "SELECT %1, d.title FROM chunks c JOIN documents d ON d.id = c.document_id "
        "ORDER BY d.created_at, c.document_id, c.chunk_index")
                               .arg(QLatin1String(kChunkColumns))
                               .toUtf8();
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(hrIndex, "embeddingHealth prepare: %s", sqlite3_errmsg(m_db));
        health.status = QStringLiteral("not_indexed");
        return health;
    }

    QHash<QString, size_t> documentSlots;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        const Chunk chunk = readChunk(stmt);

        auto slot = documentSlots.constFind(chunk.documentId);
        if (slot == documentSlots.cend()) {
            DocumentIndexingStatus status;
            status.documentId = chunk.documentId;
            status.title = columnText(stmt, 11);
            health.documents.push_back(status);
            slot = documentSlots.insert(chunk.documentId, health.documents.size() - 1);
        }
        DocumentIndexingStatus& document = health.documents[slot.value()];

        ++health.totalChunks;
        ++document.totalChunks;
        switch (chunk.embeddingState) {
        case EmbeddingState::Valid:
            ++health.validEmbeddings;
            ++document.chunksWithEmbeddings;
            if (expectedDimension > 0 && chunk.embedding->dimension() != expectedDimension) {
                ++health.dimensionMismatches;
            }
            break;
        case EmbeddingState::Malformed:
            ++health.malformedEmbeddings;
            ++document.corruptedChunks;
            break;
        case EmbeddingState::Missing:
            ++health.missingEmbeddings;
            break;
        }
    }
    sqlite3_finalize(stmt);

    auto statusFor = [](int64_t valid, int64_t total) {
        if (total > 0 && valid == total) return QStringLiteral("fully_indexed");
        if (valid > 0) return QStringLiteral("partially_indexed");
        return QStringLiteral("not_indexed");
    };

    for (DocumentIndexingStatus& document : health.documents) {
        document.status = statusFor(document.chunksWithEmbeddings, document.totalChunks);
    }
    health.status = statusFor(health.validEmbeddings, health.totalChunks);
    health.coveragePct = health.totalChunks > 0
        ? 100.0 * static_cast<double>(health.validEmbeddings) / static_cast<double>(health.totalChunks)
        : 0.0;
    return health;
}

// ── Settings ────────────────────────────────────────────────

std::optional<QString> KnowledgeStore::getSetting(const QString& key)
{
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kGetSettingSql, -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }
    bindText(stmt, 1, key);
    std::optional<QString> value;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        value = columnText(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return value;
}

bool KnowledgeStore::setSetting(const QString& key, const QString& value)
{
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kSetSettingSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(hrIndex, "setSetting prepare: %s", sqlite3_errmsg(m_db));
        return false;
    }
    bindText(stmt, 1, key);
    bindText(stmt, 2, value);
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE;
}

// ── Transactions ────────────────────────────────────────────

bool KnowledgeStore::beginTransaction()
{
    return execSql("BEGIN TRANSACTION");
}

bool KnowledgeStore::commitTransaction()
{
    return execSql("COMMIT");
}

bool KnowledgeStore::rollbackTransaction()
{
    return execSql("ROLLBACK");
}

} // namespace hr
