#include "core/index/migration.h"
#include "core/shared/chunk.h"
#include "core/shared/logging.h"

#include <sqlite3.h>

#include <QString>

#include <vector>

namespace hr {

namespace {

bool exec(sqlite3* db, const char* sql)
{
    char* errMsg = nullptr;
    const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        LOG_ERROR(hrIndex, "Migration SQL failed: %s", errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

struct LegacyRow {
    int64_t id = 0;
    QString content;
    QString embeddingJson;
    bool hasEmbedding = false;
};

// Converts chunks.embedding_json into the typed blob columns. Unparseable
// values become NULL with embedding_error = 'malformed'.
bool convertLegacyEmbeddings(sqlite3* db)
{
    std::vector<LegacyRow> rows;
    {
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db, "SELECT id, content, embedding_json FROM chunks ORDER BY id",
                               -1, &stmt, nullptr) != SQLITE_OK) {
            LOG_ERROR(hrIndex, "Legacy chunk scan prepare failed: %s", sqlite3_errmsg(db));
            return false;
        }
        while (sqlite3_step(stmt) == SQLITE_ROW) {
            LegacyRow row;
            row.id = sqlite3_column_int64(stmt, 0);
            row.content = QString::fromUtf8(reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1)));
            row.hasEmbedding = sqlite3_column_type(stmt, 2) != SQLITE_NULL;
            if (row.hasEmbedding) {
                row.embeddingJson = QString::fromUtf8(
                    reinterpret_cast<const char*>(sqlite3_column_text(stmt, 2)));
            }
            rows.push_back(std::move(row));
        }
        sqlite3_finalize(stmt);
    }

    constexpr const char* kUpdateSql = R"(
        UPDATE chunks
        SET content_hash = ?2,
            embedding = ?3,
            embedding_dim = ?4,
            embedding_provider = ?5,
            embedding_version = ?6,
            embedding_error = ?7,
            embedding_json = NULL
        WHERE id = ?1
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, kUpdateSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(hrIndex, "Legacy chunk update prepare failed: %s", sqlite3_errmsg(db));
        return false;
    }

    int converted = 0;
    int malformed = 0;
    for (const LegacyRow& row : rows) {
        const QByteArray hash = computeContentHash(row.content).toUtf8();
        sqlite3_bind_int64(stmt, 1, row.id);
        sqlite3_bind_text(stmt, 2, hash.constData(), -1, SQLITE_TRANSIENT);

        const std::optional<std::vector<float>> values = row.hasEmbedding
            ? parseLegacyEmbeddingJson(row.embeddingJson)
            : std::nullopt;
        if (values) {
            const QByteArray blob = encodeEmbeddingBlob(*values);
            sqlite3_bind_blob(stmt, 3, blob.constData(), static_cast<int>(blob.size()), SQLITE_TRANSIENT);
            sqlite3_bind_int(stmt, 4, static_cast<int>(values->size()));
            sqlite3_bind_text(stmt, 5, "legacy", -1, SQLITE_STATIC);
            sqlite3_bind_int(stmt, 6, kEmbeddingFormatVersion);
            sqlite3_bind_null(stmt, 7);
            ++converted;
        } else {
            sqlite3_bind_null(stmt, 3);
            sqlite3_bind_null(stmt, 4);
            sqlite3_bind_null(stmt, 5);
            sqlite3_bind_null(stmt, 6);
            if (row.hasEmbedding) {
                sqlite3_bind_text(stmt, 7, "malformed", -1, SQLITE_STATIC);
                ++malformed;
            } else {
                sqlite3_bind_null(stmt, 7);
            }
        }

        const int rc = sqlite3_step(stmt);
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);
        if (rc != SQLITE_DONE) {
            LOG_ERROR(hrIndex, "Legacy chunk %lld update failed: %s",
                      static_cast<long long>(row.id), sqlite3_errmsg(db));
            sqlite3_finalize(stmt);
            return false;
        }
    }
    sqlite3_finalize(stmt);

    LOG_INFO(hrIndex, "Converted %d legacy embeddings (%d malformed)", converted, malformed);
    return true;
}

} // namespace

int currentSchemaVersion(sqlite3* db)
{
    const char* sql = "SELECT value FROM settings WHERE key = 'schema_version'";
    sqlite3_stmt* stmt = nullptr;
    int version = 0;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) == SQLITE_OK) {
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            const char* val = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
            if (val) {
                version = QString::fromUtf8(val).toInt();
            }
        }
    }
    sqlite3_finalize(stmt);
    return version;
}

bool applyMigrations(sqlite3* db, int targetVersion)
{
    int current = currentSchemaVersion(db);

    if (current > targetVersion) {
        LOG_ERROR(hrIndex, "Schema version %d is newer than app version %d, downgrade not supported",
                  current, targetVersion);
        return false;
    }

    if (current == targetVersion) {
        return true;
    }

    if (current < 2 && targetVersion >= 2) {
        LOG_INFO(hrIndex, "Applying schema migration 1 -> 2");

        if (!exec(db, "BEGIN IMMEDIATE")) {
            return false;
        }

        const bool ok = exec(db, "ALTER TABLE chunks ADD COLUMN content_hash TEXT;")
            && exec(db, "ALTER TABLE chunks ADD COLUMN embedding BLOB;")
            && exec(db, "ALTER TABLE chunks ADD COLUMN embedding_dim INTEGER;")
            && exec(db, "ALTER TABLE chunks ADD COLUMN embedding_provider TEXT;")
            && exec(db, "ALTER TABLE chunks ADD COLUMN embedding_version INTEGER;")
            && exec(db, "ALTER TABLE chunks ADD COLUMN embedding_error TEXT;")
            && convertLegacyEmbeddings(db)
            && exec(db, "CREATE INDEX IF NOT EXISTS idx_chunks_document_id ON chunks(document_id);")
            && exec(db, "CREATE INDEX IF NOT EXISTS idx_chunks_content_hash ON chunks(content_hash);")
            && exec(db, "CREATE INDEX IF NOT EXISTS idx_documents_category ON documents(category, subcategory);")
            && exec(db, "CREATE INDEX IF NOT EXISTS idx_documents_status ON documents(status, created_at DESC);")
            && exec(db, "INSERT OR IGNORE INTO settings (key, value) VALUES ('vector_sync_epoch', '0');")
            && exec(db, "INSERT OR REPLACE INTO settings (key, value) VALUES ('schema_version', '2');");

        if (!ok) {
            exec(db, "ROLLBACK");
            return false;
        }
        if (!exec(db, "COMMIT")) {
            return false;
        }

        current = 2;
    }

    return current == targetVersion;
}

} // namespace hr
