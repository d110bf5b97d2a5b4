#pragma once

#include "core/embedding/http_transport.h"

#include <QString>
#include <QStringList>

#include <functional>
#include <mutex>
#include <vector>

namespace hr::test {

// Scripted HTTP peer that answers like an Ollama server (/api/tags,
// /api/embeddings) and an OpenAI-compatible endpoint (/v1/embeddings).
// Vectors come from the embedder function, generateFallbackEmbedding by
// default.
class FakeHttpTransport : public HttpTransport {
public:
    using Embedder = std::function<std::vector<float>(const QString& text)>;
    using FailurePredicate = std::function<bool(const QString& text)>;

    explicit FakeHttpTransport(int dimension = 384);

    HttpResponse send(const HttpRequest& request) override;

    void setModels(const QStringList& models);
    void setEmbedder(Embedder embedder);

    // Matching embedding requests time out.
    void setTimeoutWhen(FailurePredicate predicate);

    // Every request fails at the connection level.
    void setUnreachable(bool unreachable);

    int embeddingCalls() const;
    QStringList embeddedTexts() const;
    void resetCounters();

private:
    HttpResponse ollamaTags() const;
    HttpResponse ollamaEmbedding(const QByteArray& body);
    HttpResponse openAiEmbeddings(const QByteArray& body);
    bool shouldTimeOut(const QString& text) const;

    int m_dimension = 384;
    QStringList m_models;
    Embedder m_embedder;
    FailurePredicate m_timeoutWhen;
    bool m_unreachable = false;

    mutable std::mutex m_mutex;
    int m_embeddingCalls = 0;
    QStringList m_embeddedTexts;
};

// Vector of the given dimension with 1.0 at axis and 0 elsewhere.
std::vector<float> unitVector(int dimension, int axis);

} // namespace hr::test
