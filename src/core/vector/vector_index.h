#pragma once

#include <QString>

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace hnswlib {
class InnerProductSpace;

template <typename dist_t>
class HierarchicalNSW;
} // namespace hnswlib

namespace hr {

// One HNSW graph over L2-normalized vectors (inner product == cosine).
// Labels are allocated monotonically; deleted labels are never reused.
class VectorIndex {
public:
    struct KnnResult {
        uint64_t label = 0;
        float distance = 0.0f;    // 1 - cosine similarity
    };

    using LabelFilter = std::function<bool(uint64_t label)>;

    static constexpr int kM = 16;
    static constexpr int kEfConstruction = 200;
    static constexpr int kEfSearch = 50;
    static constexpr int kInitialCapacity = 1024;

    explicit VectorIndex(int dimensions);
    ~VectorIndex();

    VectorIndex(const VectorIndex&) = delete;
    VectorIndex& operator=(const VectorIndex&) = delete;

    bool create(int initialCapacity = kInitialCapacity);
    bool load(const QString& indexPath, uint64_t nextLabel, int deletedCount, int expectedElements);
    bool save(const QString& indexPath);

    // Normalizes a copy of the vector before insertion. Returns UINT64_MAX
    // on failure.
    uint64_t addVector(const std::vector<float>& embedding);
    bool deleteVector(uint64_t label);

    std::vector<KnnResult> search(const std::vector<float>& queryVector, int k,
                                  const LabelFilter& filter = {});

    int totalElements() const;
    int deletedElements() const;
    int liveElements() const;
    bool isAvailable() const;
    uint64_t nextLabel() const;
    int dimensions() const;

    static std::vector<float> normalized(const std::vector<float>& vector);

private:
    bool ensureCapacityForOneMore();

    int m_dimensions = 0;
    std::unique_ptr<hnswlib::InnerProductSpace> m_space;
    std::unique_ptr<hnswlib::HierarchicalNSW<float>> m_index;
    uint64_t m_nextLabel = 0;
    int m_deletedCount = 0;
    mutable std::mutex m_writeMutex;
};

} // namespace hr
