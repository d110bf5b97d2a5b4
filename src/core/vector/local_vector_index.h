#pragma once

#include "core/vector/vector_index.h"
#include "core/vector/vector_index_client.h"

#include <QHash>
#include <QString>

#include <map>
#include <memory>
#include <mutex>

namespace hr {

// In-process vector index: one HNSW graph per collection plus the
// denormalized record fields. With a non-empty index directory each
// collection persists as <name>.hnsw and <name>.meta.json after every
// mutation; with an empty directory it lives in memory only.
class LocalVectorIndex : public VectorIndexClient {
public:
    explicit LocalVectorIndex(const QString& indexDir);
    ~LocalVectorIndex() override;

    LocalVectorIndex(const LocalVectorIndex&) = delete;
    LocalVectorIndex& operator=(const LocalVectorIndex&) = delete;

    bool isReachable() override;
    EnsureCollectionResult ensureCollection(const QString& name, int dimension) override;
    bool dropCollection(const QString& name) override;
    std::optional<int> insert(const QString& name, const std::vector<VectorRecord>& records) override;
    std::optional<std::vector<VectorHit>> search(const QString& name,
                                                 const std::vector<float>& vector,
                                                 int topK,
                                                 const FilterExpression& filter) override;
    std::optional<int> remove(const QString& name, const QStringList& ids) override;
    std::optional<QStringList> listIds(const QString& name) override;
    std::optional<CollectionStatistics> statistics(const QString& name) override;
    std::optional<CollectionDescription> describe(const QString& name) override;

private:
    struct Collection {
        QString name;
        int dimension = 0;
        std::unique_ptr<VectorIndex> index;
        QHash<QString, uint64_t> labelById;
        std::map<uint64_t, VectorRecord> recordsByLabel;
    };

    // Caller holds m_mutex.
    Collection* findCollection(const QString& name);
    std::unique_ptr<Collection> loadCollection(const QString& name);
    bool persist(const Collection& collection);
    bool removeFiles(const QString& name);

    QString indexPath(const QString& name) const;
    QString metaPath(const QString& name) const;
    bool persistent() const { return !m_indexDir.isEmpty(); }

    QString m_indexDir;
    std::mutex m_mutex;
    std::map<QString, std::unique_ptr<Collection>> m_collections;
};

} // namespace hr
