#pragma once

#include <QString>
#include <cstdint>
#include <vector>

namespace hr {

// 32-bit rolling hash over UTF-16 code units (h = h * 31 + unit).
int32_t stableTextHash(const QString& text);

// Reproducible pseudo-random vector in [-1, 1]^dimension derived from
// stableTextHash(text). Degraded quality; used so indexing and search never
// block on a missing provider.
std::vector<float> generateFallbackEmbedding(const QString& text, int dimension);

} // namespace hr
