#pragma once

#include "core/embedding/provider_types.h"

#include <QString>
#include <vector>

namespace hr {

// Capability shared by every network backend. A failed call returns an
// outcome with an empty vector, degraded set and the failure reason; the
// registry substitutes the fallback vector.
class EmbeddingBackend {
public:
    virtual ~EmbeddingBackend() = default;

    virtual EmbeddingOutcome embed(const ProviderDescriptor& provider, const QString& text) = 0;
    virtual std::vector<EmbeddingOutcome> embedBatch(const ProviderDescriptor& provider,
                                                     const std::vector<QString>& texts) = 0;

protected:
    static EmbeddingOutcome failure(const ProviderDescriptor& provider,
                                    DegradedReason reason,
                                    const QString& error)
    {
        EmbeddingOutcome outcome;
        outcome.providerId = provider.id;
        outcome.degraded = true;
        outcome.reason = reason;
        outcome.error = error;
        return outcome;
    }
};

struct HttpResponse;

// Maps a failed transport response to a degraded reason.
DegradedReason classifyHttpFailure(const HttpResponse& response);

} // namespace hr
