#pragma once

#include "core/embedding/provider_types.h"
#include "core/shared/settings.h"

#include <QString>

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace hr {

class CloudEmbeddingBackend;
class EmbeddingBackend;
class HttpTransport;
class LocalModelBackend;

struct EmbeddingCircuitBreaker {
    std::atomic<int> consecutiveFailures{0};
    std::atomic<int64_t> lastFailureTime{0};
    static constexpr int kOpenThreshold = 5;          // Open after 5 consecutive failures
    static constexpr int kHalfOpenDelayMs = 30000;    // Try again after 30s

    bool isOpen() const;
    void recordSuccess();
    void recordFailure();
};

// Owns the provider catalogue and the single active provider. Passed by
// reference into the engine; switching providers is an explicit call that
// notifies listeners so a migration pass can be scheduled.
//
// Generation never fails: any backend problem is logged and answered with a
// fallback vector of the active dimension, flagged degraded with a reason.
class EmbeddingProviderRegistry {
public:
    using ActiveProviderListener =
        std::function<void(const ProviderDescriptor& previous, const ProviderDescriptor& current)>;

    EmbeddingProviderRegistry(const Settings& settings, HttpTransport* transport);
    ~EmbeddingProviderRegistry();

    EmbeddingProviderRegistry(const EmbeddingProviderRegistry&) = delete;
    EmbeddingProviderRegistry& operator=(const EmbeddingProviderRegistry&) = delete;
    EmbeddingProviderRegistry(EmbeddingProviderRegistry&&) = delete;
    EmbeddingProviderRegistry& operator=(EmbeddingProviderRegistry&&) = delete;

    std::vector<ProviderDescriptor> listProviders() const;
    std::optional<ProviderDescriptor> provider(const QString& id) const;
    ProviderDescriptor activeProvider() const;
    int activeDimension() const;

    // Returns false for an unknown id. Does not touch stored vectors.
    bool setActiveProvider(const QString& id);

    // Adds or replaces a descriptor. Rejects non-positive dimensions.
    bool registerProvider(const ProviderDescriptor& descriptor);

    // Registers embedding-capable models found on the local server.
    // Returns the number of newly added providers.
    int discoverLocalModels();

    // Returns a token for removeActiveProviderListener().
    int addActiveProviderListener(ActiveProviderListener listener);
    void removeActiveProviderListener(int token);

    EmbeddingOutcome generateEmbedding(const QString& text);
    std::vector<EmbeddingOutcome> generateBatchEmbeddings(const std::vector<QString>& texts);

    // Expose for testing
    EmbeddingCircuitBreaker& circuitBreaker(ProviderKind kind);

private:
    EmbeddingBackend* backendFor(ProviderKind kind) const;
    EmbeddingOutcome fallbackOutcome(const ProviderDescriptor& provider,
                                     const QString& text,
                                     DegradedReason reason,
                                     const QString& error) const;

    std::unique_ptr<CloudEmbeddingBackend> m_cloudBackend;
    std::unique_ptr<LocalModelBackend> m_localBackend;

    mutable std::mutex m_mutex;
    std::vector<ProviderDescriptor> m_providers;
    QString m_activeId;
    std::map<int, ActiveProviderListener> m_listeners;
    int m_nextListenerToken = 1;

    EmbeddingCircuitBreaker m_cloudBreaker;
    EmbeddingCircuitBreaker m_localBreaker;
};

} // namespace hr
