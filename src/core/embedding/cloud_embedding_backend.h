#pragma once

#include "core/embedding/embedding_backend.h"

namespace hr {

class HttpTransport;

struct CloudBackendConfig {
    QString apiKey;
    bool enabled = true;
    QString baseUrl = QStringLiteral("https://api.openai.com");
    int timeoutMs = 30000;
};

// OpenAI-compatible /v1/embeddings backend. One request per text or per
// batch; a missing or disabled credential yields CredentialMissing without
// touching the network.
class CloudEmbeddingBackend : public EmbeddingBackend {
public:
    CloudEmbeddingBackend(HttpTransport* transport, const CloudBackendConfig& config);

    EmbeddingOutcome embed(const ProviderDescriptor& provider, const QString& text) override;
    std::vector<EmbeddingOutcome> embedBatch(const ProviderDescriptor& provider,
                                             const std::vector<QString>& texts) override;

    bool hasCredential() const;

private:
    HttpTransport* m_transport = nullptr;
    CloudBackendConfig m_config;
};

} // namespace hr
