#pragma once

#include "core/shared/search_result.h"

#include <QString>
#include <vector>

namespace hr {

// Closed set of backend kinds. Dispatch over providers is a switch on this
// value, never an inspection of the provider id.
enum class ProviderKind {
    CloudApi,
    LocalModelServer,
    Fallback,
};

QString providerKindToString(ProviderKind kind);

struct ProviderDescriptor {
    QString id;
    QString name;
    QString model;        // Backend model identifier
    int dimension = 0;
    ProviderKind kind = ProviderKind::Fallback;
};

// Result of one embedding call. vector is always filled with
// descriptor.dimension values; degraded marks a fallback vector.
struct EmbeddingOutcome {
    std::vector<float> vector;
    QString providerId;
    bool degraded = false;
    DegradedReason reason = DegradedReason::None;
    QString error;

    bool ok() const { return !degraded; }
};

// A provider that should work but did not answer: timeout, unreachable
// server, garbage response or an open circuit. Configured degradation
// (fallback selected, no credential, model absent) is not transient.
bool isTransientEmbeddingFailure(DegradedReason reason);

// Built-in provider catalogue plus the fallback descriptor.
std::vector<ProviderDescriptor> builtinProviders(int fallbackDimension);

// Output dimension inferred from a local model name, 0 when unknown.
int inferDimensionFromModelName(const QString& modelName);

} // namespace hr
