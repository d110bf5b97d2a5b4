#include "core/embedding/provider_types.h"

namespace hr {

QString providerKindToString(ProviderKind kind)
{
    switch (kind) {
    case ProviderKind::CloudApi:         return QStringLiteral("cloud");
    case ProviderKind::LocalModelServer: return QStringLiteral("local");
    case ProviderKind::Fallback:         return QStringLiteral("fallback");
    }
    return QStringLiteral("unknown");
}

bool isTransientEmbeddingFailure(DegradedReason reason)
{
    switch (reason) {
    case DegradedReason::Timeout:
    case DegradedReason::BackendUnreachable:
    case DegradedReason::InvalidResponse:
    case DegradedReason::CircuitOpen:
        return true;
    case DegradedReason::None:
    case DegradedReason::FallbackActive:
    case DegradedReason::CredentialMissing:
    case DegradedReason::ModelNotFound:
        return false;
    }
    return false;
}

std::vector<ProviderDescriptor> builtinProviders(int fallbackDimension)
{
    return {
        {QStringLiteral("openai-small"), QStringLiteral("OpenAI Small"),
         QStringLiteral("text-embedding-3-small"), 1536, ProviderKind::CloudApi},
        {QStringLiteral("openai-large"), QStringLiteral("OpenAI Large"),
         QStringLiteral("text-embedding-3-large"), 3072, ProviderKind::CloudApi},
        {QStringLiteral("ollama-nomic"), QStringLiteral("Ollama Nomic Embed"),
         QStringLiteral("nomic-embed-text"), 768, ProviderKind::LocalModelServer},
        {QStringLiteral("ollama-mxbai"), QStringLiteral("Ollama MXBai Embed"),
         QStringLiteral("mxbai-embed-large"), 1024, ProviderKind::LocalModelServer},
        {QStringLiteral("ollama-all-minilm"), QStringLiteral("Ollama All-MiniLM"),
         QStringLiteral("all-minilm"), 384, ProviderKind::LocalModelServer},
        {QStringLiteral("fallback"), QStringLiteral("Deterministic fallback"),
         QStringLiteral("hash"), fallbackDimension, ProviderKind::Fallback},
    };
}

int inferDimensionFromModelName(const QString& modelName)
{
    const QString name = modelName.toLower();
    if (name.contains(QLatin1String("mxbai")))     return 1024;
    if (name.contains(QLatin1String("nomic")))     return 768;
    if (name.contains(QLatin1String("minilm")))    return 384;
    if (name.contains(QLatin1String("bge-large"))) return 1024;
    if (name.contains(QLatin1String("bge-base")))  return 768;
    if (name.contains(QLatin1String("e5-large")))  return 1024;
    if (name.contains(QLatin1String("e5-base")))   return 768;
    return 0;
}

} // namespace hr
