#pragma once

#include <cstdint>

namespace hr {

// Score of one chunk produced by a single retrieval stage.
struct ScoredChunk {
    int64_t chunkId = 0;
    double score = 0.0;
};

} // namespace hr
