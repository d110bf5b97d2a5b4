#include "document_builders.h"

namespace hr::test {

Document makeDocument(const QString& id,
                      DocumentCategory category,
                      const QString& title,
                      const QString& content,
                      const QStringList& regions,
                      double createdAt)
{
    Document document;
    document.id = id;
    document.category = category;
    document.title = title;
    document.content = content;
    document.regions = regions;
    document.createdAt = createdAt;
    document.updatedAt = createdAt;
    return document;
}

Chunk makeChunk(const QString& content, const std::vector<float>& vector, const QString& providerId)
{
    Chunk chunk;
    chunk.content = content;
    if (!vector.empty()) {
        StoredEmbedding embedding;
        embedding.values = vector;
        embedding.providerId = providerId;
        chunk.embedding = std::move(embedding);
    }
    return chunk;
}

} // namespace hr::test
