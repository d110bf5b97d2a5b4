#include "core/embedding/embedding_provider_registry.h"
#include "core/embedding/cloud_embedding_backend.h"
#include "core/embedding/fallback_embedder.h"
#include "core/embedding/local_model_backend.h"
#include "core/shared/logging.h"
#include "core/shared/settings_manager.h"

#include <QRegularExpression>

#include <algorithm>
#include <chrono>

namespace hr {

namespace {

int64_t steadyNowMs()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
}

// Failures that say something about backend health, as opposed to
// configuration.
bool countsAgainstBreaker(DegradedReason reason)
{
    return reason == DegradedReason::Timeout
        || reason == DegradedReason::BackendUnreachable
        || reason == DegradedReason::InvalidResponse;
}

QString localProviderId(const QString& modelName)
{
    QString base = modelName;
    if (base.endsWith(QLatin1String(":latest"))) {
        base.chop(7);
    }
    static const QRegularExpression unsafe(QStringLiteral("[^A-Za-z0-9._-]"));
    return QStringLiteral("ollama-") + base.replace(unsafe, QStringLiteral("-"));
}

} // namespace

bool EmbeddingCircuitBreaker::isOpen() const
{
    if (consecutiveFailures.load() < kOpenThreshold) {
        return false;
    }
    // Open: after the delay, let one attempt through (half-open)
    const int64_t lastFail = lastFailureTime.load();
    if (steadyNowMs() - lastFail >= kHalfOpenDelayMs) {
        return false;  // half-open: allow one attempt
    }
    return true;
}

void EmbeddingCircuitBreaker::recordSuccess()
{
    consecutiveFailures.store(0);
}

void EmbeddingCircuitBreaker::recordFailure()
{
    consecutiveFailures.fetch_add(1);
    lastFailureTime.store(steadyNowMs());
}

// ── Construction ────────────────────────────────────────────

EmbeddingProviderRegistry::EmbeddingProviderRegistry(const Settings& settings,
                                                     HttpTransport* transport)
{
    CloudBackendConfig cloudConfig;
    cloudConfig.apiKey = SettingsManager::resolvedOpenAiKey(settings);
    cloudConfig.enabled = settings.openaiEnabled;
    cloudConfig.baseUrl = settings.openaiBaseUrl;
    cloudConfig.timeoutMs = static_cast<int>(settings.embeddingTimeoutMs);
    m_cloudBackend = std::make_unique<CloudEmbeddingBackend>(transport, cloudConfig);

    LocalBackendConfig localConfig;
    localConfig.baseUrl = settings.ollamaBaseUrl;
    localConfig.enabled = settings.ollamaEnabled;
    localConfig.timeoutMs = static_cast<int>(settings.localEmbeddingTimeoutMs);
    m_localBackend = std::make_unique<LocalModelBackend>(transport, localConfig);

    m_providers = builtinProviders(settings.fallbackDimension);
    m_activeId = QStringLiteral("fallback");

    if (!settings.activeProviderId.isEmpty()) {
        const bool known = std::any_of(m_providers.begin(), m_providers.end(),
                                       [&](const ProviderDescriptor& d) {
                                           return d.id == settings.activeProviderId;
                                       });
        if (known) {
            m_activeId = settings.activeProviderId;
        } else {
            // Discovered local models are not known yet; keep the id only if
            // discovery later registers it.
            LOG_WARN(hrEmbedding, "Unknown active provider '%s', using fallback",
                     qUtf8Printable(settings.activeProviderId));
        }
    }
}

EmbeddingProviderRegistry::~EmbeddingProviderRegistry() = default;

// ── Catalogue ───────────────────────────────────────────────

std::vector<ProviderDescriptor> EmbeddingProviderRegistry::listProviders() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_providers;
}

std::optional<ProviderDescriptor> EmbeddingProviderRegistry::provider(const QString& id) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const ProviderDescriptor& descriptor : m_providers) {
        if (descriptor.id == id) {
            return descriptor;
        }
    }
    return std::nullopt;
}

ProviderDescriptor EmbeddingProviderRegistry::activeProvider() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const ProviderDescriptor& descriptor : m_providers) {
        if (descriptor.id == m_activeId) {
            return descriptor;
        }
    }
    return m_providers.back();
}

int EmbeddingProviderRegistry::activeDimension() const
{
    return activeProvider().dimension;
}

bool EmbeddingProviderRegistry::setActiveProvider(const QString& id)
{
    ProviderDescriptor previous;
    ProviderDescriptor current;
    std::vector<ActiveProviderListener> listeners;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = std::find_if(m_providers.begin(), m_providers.end(),
                               [&](const ProviderDescriptor& d) { return d.id == id; });
        if (it == m_providers.end()) {
            LOG_WARN(hrEmbedding, "Cannot activate unknown provider '%s'", qUtf8Printable(id));
            return false;
        }
        if (m_activeId == id) {
            return true;
        }
        for (const ProviderDescriptor& d : m_providers) {
            if (d.id == m_activeId) {
                previous = d;
            }
        }
        current = *it;
        m_activeId = id;
        for (const auto& entry : m_listeners) {
            listeners.push_back(entry.second);
        }
    }

    LOG_INFO(hrEmbedding, "Active embedding provider: %s (%s, %d dims)",
             qUtf8Printable(current.id), qUtf8Printable(current.model), current.dimension);

    for (const ActiveProviderListener& listener : listeners) {
        listener(previous, current);
    }
    return true;
}

bool EmbeddingProviderRegistry::registerProvider(const ProviderDescriptor& descriptor)
{
    if (descriptor.id.isEmpty() || descriptor.dimension <= 0) {
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    for (ProviderDescriptor& existing : m_providers) {
        if (existing.id == descriptor.id) {
            existing = descriptor;
            return true;
        }
    }
    // Keep the fallback descriptor last.
    m_providers.insert(m_providers.end() - 1, descriptor);
    return true;
}

int EmbeddingProviderRegistry::discoverLocalModels()
{
    const std::optional<QStringList> models = m_localBackend->listModels();
    if (!models) {
        return 0;
    }

    int added = 0;
    for (const QString& name : *models) {
        // Only models whose output dimension is known can back a collection.
        const int dimension = inferDimensionFromModelName(name);
        if (dimension <= 0) {
            LOG_DEBUG(hrEmbedding, "Skipping local model %s (unknown dimension)",
                      qUtf8Printable(name));
            continue;
        }

        QString model = name;
        if (model.endsWith(QLatin1String(":latest"))) {
            model.chop(7);
        }

        bool known = false;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            known = std::any_of(m_providers.begin(), m_providers.end(),
                                [&](const ProviderDescriptor& d) {
                                    return d.kind == ProviderKind::LocalModelServer && d.model == model;
                                });
        }
        if (known) {
            continue;
        }

        ProviderDescriptor descriptor;
        descriptor.id = localProviderId(name);
        descriptor.name = QStringLiteral("Ollama %1").arg(model);
        descriptor.model = model;
        descriptor.dimension = dimension;
        descriptor.kind = ProviderKind::LocalModelServer;
        if (registerProvider(descriptor)) {
            ++added;
        }
    }

    LOG_INFO(hrEmbedding, "Discovered %d local embedding models", added);
    return added;
}

int EmbeddingProviderRegistry::addActiveProviderListener(ActiveProviderListener listener)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const int token = m_nextListenerToken++;
    m_listeners.emplace(token, std::move(listener));
    return token;
}

void EmbeddingProviderRegistry::removeActiveProviderListener(int token)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_listeners.erase(token);
}

// ── Generation ──────────────────────────────────────────────

EmbeddingCircuitBreaker& EmbeddingProviderRegistry::circuitBreaker(ProviderKind kind)
{
    return kind == ProviderKind::CloudApi ? m_cloudBreaker : m_localBreaker;
}

EmbeddingBackend* EmbeddingProviderRegistry::backendFor(ProviderKind kind) const
{
    switch (kind) {
    case ProviderKind::CloudApi:         return m_cloudBackend.get();
    case ProviderKind::LocalModelServer: return m_localBackend.get();
    case ProviderKind::Fallback:         return nullptr;
    }
    return nullptr;
}

EmbeddingOutcome EmbeddingProviderRegistry::fallbackOutcome(const ProviderDescriptor& provider,
                                                            const QString& text,
                                                            DegradedReason reason,
                                                            const QString& error) const
{
    EmbeddingOutcome outcome;
    outcome.vector = generateFallbackEmbedding(text, provider.dimension);
    outcome.providerId = provider.id;
    outcome.degraded = true;
    outcome.reason = reason;
    outcome.error = error;
    return outcome;
}

EmbeddingOutcome EmbeddingProviderRegistry::generateEmbedding(const QString& text)
{
    std::vector<EmbeddingOutcome> outcomes = generateBatchEmbeddings({text});
    return std::move(outcomes.front());
}

std::vector<EmbeddingOutcome> EmbeddingProviderRegistry::generateBatchEmbeddings(
    const std::vector<QString>& texts)
{
    const ProviderDescriptor provider = activeProvider();
    std::vector<EmbeddingOutcome> outcomes;
    outcomes.reserve(texts.size());

    EmbeddingBackend* backend = backendFor(provider.kind);
    if (!backend) {
        for (const QString& text : texts) {
            outcomes.push_back(fallbackOutcome(provider, text, DegradedReason::FallbackActive, {}));
        }
        return outcomes;
    }

    EmbeddingCircuitBreaker& breaker = circuitBreaker(provider.kind);
    if (breaker.isOpen()) {
        LOG_WARN(hrEmbedding, "Circuit breaker open for %s, using fallback vectors (%s)",
                 qUtf8Printable(provider.id),
                 qUtf8Printable(degradedReasonToString(DegradedReason::CircuitOpen)));
        for (const QString& text : texts) {
            outcomes.push_back(fallbackOutcome(provider, text, DegradedReason::CircuitOpen, {}));
        }
        return outcomes;
    }

    std::vector<EmbeddingOutcome> backendOutcomes = backend->embedBatch(provider, texts);
    for (size_t i = 0; i < texts.size(); ++i) {
        EmbeddingOutcome& outcome = backendOutcomes[i];
        if (!outcome.degraded) {
            breaker.recordSuccess();
            outcomes.push_back(std::move(outcome));
            continue;
        }

        if (countsAgainstBreaker(outcome.reason)) {
            breaker.recordFailure();
        }
        LOG_WARN(hrEmbedding, "Embedding via %s degraded to fallback (%s): %s",
                 qUtf8Printable(provider.id),
                 qUtf8Printable(degradedReasonToString(outcome.reason)),
                 qUtf8Printable(outcome.error));
        outcomes.push_back(fallbackOutcome(provider, texts[i], outcome.reason, outcome.error));
    }
    return outcomes;
}

} // namespace hr
