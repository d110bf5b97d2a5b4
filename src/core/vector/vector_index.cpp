#include "core/vector/vector_index.h"
#include "core/shared/logging.h"

#include "hnswlib/hnswlib.h"

#include <QFileInfo>

#include <algorithm>
#include <cmath>
#include <limits>

namespace hr {

namespace {

constexpr uint64_t kInvalidLabel = std::numeric_limits<uint64_t>::max();

class FunctionLabelFilter : public hnswlib::BaseFilterFunctor {
public:
    explicit FunctionLabelFilter(const VectorIndex::LabelFilter& filter)
        : m_filter(filter)
    {
    }

    bool operator()(hnswlib::labeltype label) override
    {
        return m_filter(static_cast<uint64_t>(label));
    }

private:
    const VectorIndex::LabelFilter& m_filter;
};

} // namespace

VectorIndex::VectorIndex(int dimensions)
    : m_dimensions(dimensions)
{
}

VectorIndex::~VectorIndex() = default;

bool VectorIndex::create(int initialCapacity)
{
    if (m_dimensions <= 0) {
        LOG_ERROR(hrVector, "VectorIndex::create requires a positive dimension");
        return false;
    }

    try {
        const int capacity = std::max(initialCapacity, 1);
        m_space = std::make_unique<hnswlib::InnerProductSpace>(m_dimensions);
        m_index = std::make_unique<hnswlib::HierarchicalNSW<float>>(
            m_space.get(),
            static_cast<size_t>(capacity),
            static_cast<size_t>(kM),
            static_cast<size_t>(kEfConstruction));
        m_index->setEf(static_cast<size_t>(kEfSearch));
        m_nextLabel = 0;
        m_deletedCount = 0;
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR(hrVector, "VectorIndex::create failed: %s", e.what());
        m_index.reset();
        m_space.reset();
        return false;
    }
}

bool VectorIndex::load(const QString& indexPath, uint64_t nextLabel, int deletedCount,
                       int expectedElements)
{
    const QFileInfo indexInfo(indexPath);
    if (!indexInfo.exists() || !indexInfo.isFile()) {
        LOG_ERROR(hrVector, "VectorIndex::load missing index file: %s", qUtf8Printable(indexPath));
        return false;
    }

    // Corrupted/truncated payloads can make downstream HNSW cleanup paths unsafe.
    constexpr qint64 kMinSerializedIndexBytes = 96;
    if (indexInfo.size() < kMinSerializedIndexBytes) {
        LOG_ERROR(hrVector, "VectorIndex::load index payload too small: %lld",
                  static_cast<long long>(indexInfo.size()));
        return false;
    }

    uint64_t targetCapacity = static_cast<uint64_t>(kInitialCapacity);
    targetCapacity = std::max(targetCapacity, static_cast<uint64_t>(std::max(expectedElements, 0)) * 2);
    targetCapacity = std::max(targetCapacity, nextLabel + 1);

    try {
        m_space = std::make_unique<hnswlib::InnerProductSpace>(m_dimensions);
        m_index = std::make_unique<hnswlib::HierarchicalNSW<float>>(m_space.get());
        m_index->loadIndex(indexPath.toStdString(), m_space.get(), static_cast<size_t>(targetCapacity));
        m_index->setEf(static_cast<size_t>(kEfSearch));
        m_nextLabel = nextLabel;
        m_deletedCount = std::max(deletedCount, 0);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR(hrVector, "VectorIndex::load failed: %s", e.what());
        m_index.reset();
        m_space.reset();
        return false;
    }
}

bool VectorIndex::save(const QString& indexPath)
{
    if (!m_index) {
        LOG_WARN(hrVector, "VectorIndex::save called with unavailable index");
        return false;
    }

    std::lock_guard<std::mutex> lock(m_writeMutex);
    try {
        m_index->saveIndex(indexPath.toStdString());
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR(hrVector, "VectorIndex::save failed to persist index: %s", e.what());
        return false;
    }
}

std::vector<float> VectorIndex::normalized(const std::vector<float>& vector)
{
    double sumSquares = 0.0;
    for (const float value : vector) {
        sumSquares += static_cast<double>(value) * static_cast<double>(value);
    }

    std::vector<float> out = vector;
    const double norm = std::sqrt(sumSquares);
    if (norm <= 0.0) {
        return out;
    }
    for (float& value : out) {
        value = static_cast<float>(static_cast<double>(value) / norm);
    }
    return out;
}

uint64_t VectorIndex::addVector(const std::vector<float>& embedding)
{
    if (!m_index || static_cast<int>(embedding.size()) != m_dimensions) {
        LOG_WARN(hrVector, "VectorIndex::addVector rejected vector of %d dims (index has %d)",
                 static_cast<int>(embedding.size()), m_dimensions);
        return kInvalidLabel;
    }

    const std::vector<float> unit = normalized(embedding);

    std::lock_guard<std::mutex> lock(m_writeMutex);

    if (!ensureCapacityForOneMore()) {
        return kInvalidLabel;
    }

    const uint64_t label = m_nextLabel;
    try {
        m_index->addPoint(unit.data(), static_cast<hnswlib::labeltype>(label));
        ++m_nextLabel;
        return label;
    } catch (const std::exception& e) {
        LOG_ERROR(hrVector, "VectorIndex::addVector failed: %s", e.what());
        return kInvalidLabel;
    }
}

bool VectorIndex::deleteVector(uint64_t label)
{
    if (!m_index) {
        LOG_WARN(hrVector, "VectorIndex::deleteVector called with unavailable index");
        return false;
    }

    std::lock_guard<std::mutex> lock(m_writeMutex);
    try {
        m_index->markDelete(static_cast<hnswlib::labeltype>(label));
        ++m_deletedCount;
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR(hrVector, "VectorIndex::deleteVector failed: %s", e.what());
        return false;
    }
}

std::vector<VectorIndex::KnnResult> VectorIndex::search(const std::vector<float>& queryVector,
                                                        int k,
                                                        const LabelFilter& filter)
{
    std::vector<KnnResult> results;
    if (!m_index || static_cast<int>(queryVector.size()) != m_dimensions || k <= 0) {
        return results;
    }

    const std::vector<float> unit = normalized(queryVector);

    std::lock_guard<std::mutex> lock(m_writeMutex);
    const int live = std::max(0, static_cast<int>(m_index->getCurrentElementCount()) - m_deletedCount);
    if (live == 0) {
        return results;
    }

    try {
        m_index->setEf(static_cast<size_t>(std::max(kEfSearch, k)));
        FunctionLabelFilter functor(filter);
        auto queue = m_index->searchKnn(unit.data(),
                                        static_cast<size_t>(std::min(k, live)),
                                        filter ? &functor : nullptr);
        results.reserve(queue.size());
        while (!queue.empty()) {
            const auto entry = queue.top();
            queue.pop();
            results.push_back(KnnResult{static_cast<uint64_t>(entry.second), entry.first});
        }
        std::sort(results.begin(), results.end(), [](const KnnResult& a, const KnnResult& b) {
            return a.distance < b.distance;
        });
        return results;
    } catch (const std::exception& e) {
        LOG_ERROR(hrVector, "VectorIndex::search failed: %s", e.what());
        return {};
    }
}

int VectorIndex::totalElements() const
{
    if (!m_index) {
        return 0;
    }
    return static_cast<int>(m_index->getCurrentElementCount());
}

int VectorIndex::deletedElements() const
{
    return m_deletedCount;
}

int VectorIndex::liveElements() const
{
    return std::max(0, totalElements() - m_deletedCount);
}

bool VectorIndex::isAvailable() const
{
    return m_index != nullptr;
}

uint64_t VectorIndex::nextLabel() const
{
    return m_nextLabel;
}

int VectorIndex::dimensions() const
{
    return m_dimensions;
}

bool VectorIndex::ensureCapacityForOneMore()
{
    const size_t current = m_index->getCurrentElementCount();
    const size_t maxElements = m_index->getMaxElements();
    if (maxElements == 0) {
        LOG_ERROR(hrVector, "VectorIndex has zero max elements");
        return false;
    }

    const size_t threshold = (maxElements * 8) / 10;
    if (current < threshold) {
        return true;
    }

    const size_t newCapacity = maxElements * 2;
    try {
        m_index->resizeIndex(newCapacity);
        LOG_INFO(hrVector, "VectorIndex resized to capacity %llu",
                 static_cast<unsigned long long>(newCapacity));
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR(hrVector, "VectorIndex resize failed: %s", e.what());
        return false;
    }
}

} // namespace hr
