#pragma once

#include "core/vector/filter_expression.h"

#include <QString>
#include <QStringList>

#include <cstdint>
#include <optional>
#include <vector>

namespace hr {

// Mirror of a chunk inside the vector index. The vector length must equal
// the collection dimension.
struct VectorRecord {
    QString id;
    std::vector<float> vector;
    QString content;
    QString documentId;
    QString title;
    QString category;
    QString subcategory;
    QStringList regions;
    QString language;
    double timestamp = 0.0;   // Insertion time, epoch seconds
};

struct VectorHit {
    QString id;
    double score = 0.0;       // Cosine similarity
    VectorRecord record;      // Denormalized fields; vector left empty
};

struct CollectionStatistics {
    int64_t rowCount = 0;
};

struct CollectionDescription {
    QString name;
    int dimension = 0;
    QString metric;
    int64_t rowCount = 0;
};

enum class EnsureCollectionResult {
    Existing,
    Created,
    Recreated,     // Dropped because the dimension differed
    Failed,
};

// Boundary to the vector index service. Every call reports failure through
// its return value; none throws.
class VectorIndexClient {
public:
    virtual ~VectorIndexClient() = default;

    virtual bool isReachable() = 0;

    // Creates the collection, or drops and recreates it when it exists with a
    // different dimension.
    virtual EnsureCollectionResult ensureCollection(const QString& name, int dimension) = 0;
    virtual bool dropCollection(const QString& name) = 0;

    // Upsert by id. Returns the number of records written.
    virtual std::optional<int> insert(const QString& name, const std::vector<VectorRecord>& records) = 0;

    // Hits sorted by descending score. nullopt when the index could not answer.
    virtual std::optional<std::vector<VectorHit>> search(const QString& name,
                                                         const std::vector<float>& vector,
                                                         int topK,
                                                         const FilterExpression& filter) = 0;

    // Returns the number of records removed.
    virtual std::optional<int> remove(const QString& name, const QStringList& ids) = 0;

    // Ids of every record in the collection.
    virtual std::optional<QStringList> listIds(const QString& name) = 0;

    virtual std::optional<CollectionStatistics> statistics(const QString& name) = 0;
    virtual std::optional<CollectionDescription> describe(const QString& name) = 0;
};

} // namespace hr
