#pragma once

#include "core/embedding/embedding_backend.h"

#include <QStringList>

#include <mutex>
#include <optional>

namespace hr {

class HttpTransport;

struct LocalBackendConfig {
    QString baseUrl = QStringLiteral("http://127.0.0.1:11434");
    bool enabled = true;
    int timeoutMs = 60000;
};

// Ollama-style local model server. There is no native batching: a batch is
// served as sequential single-text calls. The requested model is verified
// against /api/tags before generating.
class LocalModelBackend : public EmbeddingBackend {
public:
    LocalModelBackend(HttpTransport* transport, const LocalBackendConfig& config);

    EmbeddingOutcome embed(const ProviderDescriptor& provider, const QString& text) override;
    std::vector<EmbeddingOutcome> embedBatch(const ProviderDescriptor& provider,
                                             const std::vector<QString>& texts) override;

    // Model names installed on the server, nullopt if it could not be reached.
    std::optional<QStringList> listModels();

    void invalidateModelCache();

private:
    // nullopt when the model is present; the failure reason otherwise.
    std::optional<EmbeddingOutcome> checkModel(const ProviderDescriptor& provider);
    EmbeddingOutcome requestEmbedding(const ProviderDescriptor& provider, const QString& text);

    HttpTransport* m_transport = nullptr;
    LocalBackendConfig m_config;

    std::mutex m_cacheMutex;
    QStringList m_verifiedModels;
};

} // namespace hr
