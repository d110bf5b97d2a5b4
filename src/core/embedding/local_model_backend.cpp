#include "core/embedding/local_model_backend.h"
#include "core/embedding/http_transport.h"
#include "core/shared/logging.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

namespace hr {

namespace {

bool modelMatches(const QString& installed, const QString& requested)
{
    return installed == requested
        || installed.startsWith(requested + QLatin1Char(':'));
}

} // namespace

LocalModelBackend::LocalModelBackend(HttpTransport* transport, const LocalBackendConfig& config)
    : m_transport(transport)
    , m_config(config)
{
}

std::optional<QStringList> LocalModelBackend::listModels()
{
    if (!m_transport || !m_config.enabled) {
        return std::nullopt;
    }

    HttpRequest request;
    request.method = HttpRequest::Method::Get;
    request.url = m_config.baseUrl + QStringLiteral("/api/tags");
    request.timeoutMs = m_config.timeoutMs;

    const HttpResponse response = m_transport->send(request);
    if (!response.isSuccess()) {
        LOG_WARN(hrEmbedding, "Local model server unreachable at %s: %s",
                 qUtf8Printable(m_config.baseUrl),
                 qUtf8Printable(response.error.isEmpty()
                                    ? QStringLiteral("HTTP %1").arg(response.status)
                                    : response.error));
        return std::nullopt;
    }

    const QJsonDocument doc = QJsonDocument::fromJson(response.body);
    QStringList names;
    for (const QJsonValue& value : doc.object().value(QStringLiteral("models")).toArray()) {
        const QString name = value.toObject().value(QStringLiteral("name")).toString();
        if (!name.isEmpty()) {
            names.append(name);
        }
    }
    return names;
}

void LocalModelBackend::invalidateModelCache()
{
    std::lock_guard<std::mutex> lock(m_cacheMutex);
    m_verifiedModels.clear();
}

std::optional<EmbeddingOutcome> LocalModelBackend::checkModel(const ProviderDescriptor& provider)
{
    if (!m_config.enabled) {
        return failure(provider, DegradedReason::FallbackActive,
                       QStringLiteral("Local model server disabled"));
    }

    {
        std::lock_guard<std::mutex> lock(m_cacheMutex);
        if (m_verifiedModels.contains(provider.model)) {
            return std::nullopt;
        }
    }

    const std::optional<QStringList> models = listModels();
    if (!models) {
        return failure(provider, DegradedReason::BackendUnreachable,
                       QStringLiteral("Local model server unreachable"));
    }

    for (const QString& installed : *models) {
        if (modelMatches(installed, provider.model)) {
            std::lock_guard<std::mutex> lock(m_cacheMutex);
            m_verifiedModels.append(provider.model);
            return std::nullopt;
        }
    }

    return failure(provider, DegradedReason::ModelNotFound,
                   QStringLiteral("Model %1 not found on local server").arg(provider.model));
}

EmbeddingOutcome LocalModelBackend::requestEmbedding(const ProviderDescriptor& provider,
                                                     const QString& text)
{
    QJsonObject body;
    body.insert(QStringLiteral("model"), provider.model);
    body.insert(QStringLiteral("prompt"), text);

    HttpRequest request;
    request.method = HttpRequest::Method::Post;
    request.url = m_config.baseUrl + QStringLiteral("/api/embeddings");
    request.headers.append({QByteArrayLiteral("Content-Type"), QByteArrayLiteral("application/json")});
    request.body = QJsonDocument(body).toJson(QJsonDocument::Compact);
    request.timeoutMs = m_config.timeoutMs;

    const HttpResponse response = m_transport->send(request);
    if (!response.isSuccess()) {
        const QString error = response.error.isEmpty()
            ? QStringLiteral("HTTP %1").arg(response.status)
            : response.error;
        return failure(provider, classifyHttpFailure(response), error);
    }

    const QJsonArray array = QJsonDocument::fromJson(response.body)
                                 .object()
                                 .value(QStringLiteral("embedding"))
                                 .toArray();
    EmbeddingOutcome outcome;
    outcome.providerId = provider.id;
    outcome.vector.reserve(static_cast<size_t>(array.size()));
    for (const QJsonValue& value : array) {
        outcome.vector.push_back(static_cast<float>(value.toDouble()));
    }

    if (static_cast<int>(outcome.vector.size()) != provider.dimension) {
        return failure(provider, DegradedReason::InvalidResponse,
                       QStringLiteral("Expected %1 dimensions, got %2")
                           .arg(provider.dimension)
                           .arg(outcome.vector.size()));
    }
    return outcome;
}

EmbeddingOutcome LocalModelBackend::embed(const ProviderDescriptor& provider, const QString& text)
{
    if (!m_transport) {
        return failure(provider, DegradedReason::BackendUnreachable, QStringLiteral("No HTTP transport"));
    }
    if (std::optional<EmbeddingOutcome> missing = checkModel(provider)) {
        return *missing;
    }
    return requestEmbedding(provider, text);
}

std::vector<EmbeddingOutcome> LocalModelBackend::embedBatch(const ProviderDescriptor& provider,
                                                            const std::vector<QString>& texts)
{
    std::vector<EmbeddingOutcome> outcomes;
    outcomes.reserve(texts.size());
    for (const QString& text : texts) {
        outcomes.push_back(embed(provider, text));
    }
    return outcomes;
}

} // namespace hr
