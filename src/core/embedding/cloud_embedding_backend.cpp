#include "core/embedding/cloud_embedding_backend.h"
#include "core/embedding/http_transport.h"
#include "core/shared/logging.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

namespace hr {

DegradedReason classifyHttpFailure(const HttpResponse& response)
{
    if (response.timedOut) {
        return DegradedReason::Timeout;
    }
    if (!response.error.isEmpty() || response.status == 0 || response.status >= 500) {
        return DegradedReason::BackendUnreachable;
    }
    if (response.status == 401 || response.status == 403) {
        return DegradedReason::CredentialMissing;
    }
    if (response.status == 404) {
        return DegradedReason::ModelNotFound;
    }
    return DegradedReason::InvalidResponse;
}

namespace {

std::vector<float> toFloatVector(const QJsonArray& array)
{
    std::vector<float> values;
    values.reserve(static_cast<size_t>(array.size()));
    for (const QJsonValue& value : array) {
        if (!value.isDouble()) {
            return {};
        }
        values.push_back(static_cast<float>(value.toDouble()));
    }
    return values;
}

} // namespace

CloudEmbeddingBackend::CloudEmbeddingBackend(HttpTransport* transport,
                                             const CloudBackendConfig& config)
    : m_transport(transport)
    , m_config(config)
{
}

bool CloudEmbeddingBackend::hasCredential() const
{
    return m_config.enabled && !m_config.apiKey.isEmpty();
}

EmbeddingOutcome CloudEmbeddingBackend::embed(const ProviderDescriptor& provider, const QString& text)
{
    std::vector<EmbeddingOutcome> outcomes = embedBatch(provider, {text});
    return outcomes.front();
}

std::vector<EmbeddingOutcome> CloudEmbeddingBackend::embedBatch(const ProviderDescriptor& provider,
                                                                const std::vector<QString>& texts)
{
    auto failAll = [&](DegradedReason reason, const QString& error) {
        return std::vector<EmbeddingOutcome>(texts.empty() ? 1 : texts.size(),
                                             failure(provider, reason, error));
    };

    if (!hasCredential()) {
        return failAll(DegradedReason::CredentialMissing,
                       QStringLiteral("No enabled API key for %1").arg(provider.id));
    }
    if (!m_transport) {
        return failAll(DegradedReason::BackendUnreachable, QStringLiteral("No HTTP transport"));
    }
    if (texts.empty()) {
        return {};
    }

    QJsonObject body;
    body.insert(QStringLiteral("model"), provider.model);
    if (texts.size() == 1) {
        body.insert(QStringLiteral("input"), texts.front());
    } else {
        QJsonArray inputs;
        for (const QString& text : texts) {
            inputs.append(text);
        }
        body.insert(QStringLiteral("input"), inputs);
    }
    body.insert(QStringLiteral("encoding_format"), QStringLiteral("float"));

    HttpRequest request;
    request.method = HttpRequest::Method::Post;
    request.url = m_config.baseUrl + QStringLiteral("/v1/embeddings");
    request.headers.append({QByteArrayLiteral("Content-Type"), QByteArrayLiteral("application/json")});
    request.headers.append({QByteArrayLiteral("Authorization"),
                            QByteArrayLiteral("Bearer ") + m_config.apiKey.toUtf8()});
    request.body = QJsonDocument(body).toJson(QJsonDocument::Compact);
    request.timeoutMs = m_config.timeoutMs;

    const HttpResponse response = m_transport->send(request);
    if (!response.isSuccess()) {
        const QString error = response.error.isEmpty()
            ? QStringLiteral("HTTP %1").arg(response.status)
            : response.error;
        return failAll(classifyHttpFailure(response), error);
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(response.body, &parseError);
    const QJsonArray data = doc.object().value(QStringLiteral("data")).toArray();
    if (parseError.error != QJsonParseError::NoError
        || data.size() != static_cast<qsizetype>(texts.size())) {
        return failAll(DegradedReason::InvalidResponse,
                       QStringLiteral("Unexpected embeddings payload"));
    }

    std::vector<EmbeddingOutcome> outcomes(texts.size());
    for (const QJsonValue& entry : data) {
        const QJsonObject item = entry.toObject();
        const int index = item.value(QStringLiteral("index")).toInt(-1);
        if (index < 0 || index >= static_cast<int>(texts.size())) {
            return failAll(DegradedReason::InvalidResponse,
                           QStringLiteral("Embedding index out of range"));
        }

        std::vector<float> values = toFloatVector(item.value(QStringLiteral("embedding")).toArray());
        if (static_cast<int>(values.size()) != provider.dimension) {
            outcomes[static_cast<size_t>(index)] = failure(
                provider, DegradedReason::InvalidResponse,
                QStringLiteral("Expected %1 dimensions, got %2")
                    .arg(provider.dimension)
                    .arg(values.size()));
            continue;
        }
        outcomes[static_cast<size_t>(index)].vector = std::move(values);
        outcomes[static_cast<size_t>(index)].providerId = provider.id;
    }

    // Any slot the payload never filled is a malformed response.
    for (EmbeddingOutcome& outcome : outcomes) {
        if (outcome.vector.empty() && !outcome.degraded) {
            outcome = failure(provider, DegradedReason::InvalidResponse,
                              QStringLiteral("Missing embedding in response"));
        }
    }
    return outcomes;
}

} // namespace hr
