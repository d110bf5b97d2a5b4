#pragma once

#include <QByteArray>
#include <QString>

#include <cstdint>
#include <optional>
#include <vector>

namespace hr {

// Version tag written next to every stored vector. Bump when the blob
// layout changes.
constexpr int kEmbeddingFormatVersion = 1;

enum class EmbeddingState {
    Missing,
    Valid,
    Malformed,
};

// Typed vector column: float32 values plus the dimension and provider
// that produced them.
struct StoredEmbedding {
    std::vector<float> values;
    QString providerId;
    int formatVersion = kEmbeddingFormatVersion;

    int dimension() const { return static_cast<int>(values.size()); }
};

struct Chunk {
    int64_t id = 0;
    QString documentId;
    int chunkIndex = 0;
    QString content;
    QString contentHash;
    std::optional<StoredEmbedding> embedding;
    EmbeddingState embeddingState = EmbeddingState::Missing;
    QString embeddingError;
    double documentCreatedAt = 0.0;
};

// SHA-256 of the chunk text, used to reuse vectors when a document is
// re-chunked without changing a passage.
QString computeContentHash(const QString& content);

// Record id of a chunk inside the vector index.
QString chunkRecordId(int64_t chunkId);
std::optional<int64_t> chunkIdFromRecordId(const QString& recordId);

QByteArray encodeEmbeddingBlob(const std::vector<float>& values);

// Returns nullopt when the blob length does not match the declared
// dimension or a component is NaN/Inf.
std::optional<std::vector<float>> decodeEmbeddingBlob(const QByteArray& blob, int dimension);

// Parses the JSON array text written by schema v1.
std::optional<std::vector<float>> parseLegacyEmbeddingJson(const QString& text);

bool hasNonFiniteComponent(const std::vector<float>& values);

} // namespace hr
