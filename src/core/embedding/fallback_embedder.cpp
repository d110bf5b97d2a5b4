#include "core/embedding/fallback_embedder.h"

namespace hr {

int32_t stableTextHash(const QString& text)
{
    uint32_t h = 0;
    for (const QChar ch : text) {
        h = (h << 5) - h + static_cast<uint32_t>(ch.unicode());
    }
    return static_cast<int32_t>(h);
}

std::vector<float> generateFallbackEmbedding(const QString& text, int dimension)
{
    if (dimension <= 0) {
        return {};
    }

    // Linear congruential step kept to 31 bits.
    uint64_t state = static_cast<uint64_t>(static_cast<int64_t>(stableTextHash(text)));
    std::vector<float> values(static_cast<size_t>(dimension));
    for (float& value : values) {
        state = (state * 1103515245ULL + 12345ULL) & 0x7fffffffULL;
        value = static_cast<float>((static_cast<double>(state) / 2147483647.0) * 2.0 - 1.0);
    }
    return values;
}

} // namespace hr
