#include "core/vector/local_vector_index.h"
#include "core/shared/logging.h"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

#include <limits>

namespace hr {

namespace {

constexpr int kMetaVersion = 1;
constexpr uint64_t kInvalidLabel = std::numeric_limits<uint64_t>::max();

QJsonObject recordToJson(uint64_t label, const VectorRecord& record)
{
    QJsonObject json;
    json.insert(QStringLiteral("label"), static_cast<qint64>(label));
    json.insert(QStringLiteral("id"), record.id);
    json.insert(QStringLiteral("content"), record.content);
    json.insert(QStringLiteral("documentId"), record.documentId);
    json.insert(QStringLiteral("title"), record.title);
    json.insert(QStringLiteral("category"), record.category);
    json.insert(QStringLiteral("subcategory"), record.subcategory);
    json.insert(QStringLiteral("regions"), QJsonArray::fromStringList(record.regions));
    json.insert(QStringLiteral("language"), record.language);
    json.insert(QStringLiteral("timestamp"), record.timestamp);
    return json;
}

VectorRecord recordFromJson(const QJsonObject& json)
{
    VectorRecord record;
    record.id = json.value(QStringLiteral("id")).toString();
    record.content = json.value(QStringLiteral("content")).toString();
    record.documentId = json.value(QStringLiteral("documentId")).toString();
    record.title = json.value(QStringLiteral("title")).toString();
    record.category = json.value(QStringLiteral("category")).toString();
    record.subcategory = json.value(QStringLiteral("subcategory")).toString();
    for (const QJsonValue& region : json.value(QStringLiteral("regions")).toArray()) {
        record.regions.append(region.toString());
    }
    record.language = json.value(QStringLiteral("language")).toString();
    record.timestamp = json.value(QStringLiteral("timestamp")).toDouble();
    return record;
}

} // namespace

LocalVectorIndex::LocalVectorIndex(const QString& indexDir)
    : m_indexDir(indexDir)
{
}

LocalVectorIndex::~LocalVectorIndex() = default;

QString LocalVectorIndex::indexPath(const QString& name) const
{
    return m_indexDir + QLatin1Char('/') + name + QStringLiteral(".hnsw");
}

QString LocalVectorIndex::metaPath(const QString& name) const
{
    return m_indexDir + QLatin1Char('/') + name + QStringLiteral(".meta.json");
}

bool LocalVectorIndex::isReachable()
{
    if (!persistent()) {
        return true;
    }
    return QDir().mkpath(m_indexDir);
}

// ── Collections ─────────────────────────────────────────────

LocalVectorIndex::Collection* LocalVectorIndex::findCollection(const QString& name)
{
    auto it = m_collections.find(name);
    if (it != m_collections.end()) {
        return it->second.get();
    }
    if (!persistent()) {
        return nullptr;
    }

    std::unique_ptr<Collection> loaded = loadCollection(name);
    if (!loaded) {
        return nullptr;
    }
    Collection* raw = loaded.get();
    m_collections.emplace(name, std::move(loaded));
    return raw;
}

std::unique_ptr<LocalVectorIndex::Collection> LocalVectorIndex::loadCollection(const QString& name)
{
    QFile metaFile(metaPath(name));
    if (!metaFile.exists()) {
        return nullptr;
    }
    if (!metaFile.open(QIODevice::ReadOnly)) {
        LOG_ERROR(hrVector, "Failed to open collection meta: %s", qUtf8Printable(metaFile.fileName()));
        return nullptr;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(metaFile.readAll(), &parseError);
    metaFile.close();
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_ERROR(hrVector, "Invalid collection meta JSON for %s: %s",
                  qUtf8Printable(name), qUtf8Printable(parseError.errorString()));
        return nullptr;
    }

    const QJsonObject meta = doc.object();
    const int dimension = meta.value(QStringLiteral("dimension")).toInt(-1);
    if (dimension <= 0) {
        LOG_ERROR(hrVector, "Collection %s has invalid dimension in metadata", qUtf8Printable(name));
        return nullptr;
    }

    auto collection = std::make_unique<Collection>();
    collection->name = name;
    collection->dimension = dimension;
    collection->index = std::make_unique<VectorIndex>(dimension);

    const QJsonArray records = meta.value(QStringLiteral("records")).toArray();
    const uint64_t nextLabel = meta.value(QStringLiteral("next_label")).toVariant().toULongLong();
    const int deleted = meta.value(QStringLiteral("deleted_elements")).toInt(0);

    const bool loaded = QFile::exists(indexPath(name))
        && collection->index->load(indexPath(name), nextLabel, deleted,
                                   static_cast<int>(records.size()) + deleted);
    if (!loaded) {
        // An empty HNSW file may never have been written; start a fresh
        // graph only when no records are expected.
        if (!records.isEmpty() || !collection->index->create()) {
            LOG_ERROR(hrVector, "Failed to load HNSW graph for collection %s", qUtf8Printable(name));
            return nullptr;
        }
    }

    for (const QJsonValue& value : records) {
        const QJsonObject json = value.toObject();
        const uint64_t label = json.value(QStringLiteral("label")).toVariant().toULongLong();
        VectorRecord record = recordFromJson(json);
        collection->labelById.insert(record.id, label);
        collection->recordsByLabel.emplace(label, std::move(record));
    }

    LOG_INFO(hrVector, "Loaded collection %s (%d dims, %d records)",
             qUtf8Printable(name), dimension, static_cast<int>(collection->labelById.size()));
    return collection;
}

bool LocalVectorIndex::persist(const Collection& collection)
{
    if (!persistent()) {
        return true;
    }
    if (!QDir().mkpath(m_indexDir)) {
        LOG_ERROR(hrVector, "Failed to create index directory: %s", qUtf8Printable(m_indexDir));
        return false;
    }

    if (!collection.index->save(indexPath(collection.name))) {
        return false;
    }

    QJsonArray records;
    for (const auto& [label, record] : collection.recordsByLabel) {
        records.append(recordToJson(label, record));
    }

    QJsonObject meta;
    meta.insert(QStringLiteral("version"), kMetaVersion);
    meta.insert(QStringLiteral("name"), collection.name);
    meta.insert(QStringLiteral("dimension"), collection.dimension);
    meta.insert(QStringLiteral("metric"), QStringLiteral("COSINE"));
    meta.insert(QStringLiteral("total_elements"), collection.index->totalElements());
    meta.insert(QStringLiteral("deleted_elements"), collection.index->deletedElements());
    meta.insert(QStringLiteral("next_label"), static_cast<qint64>(collection.index->nextLabel()));
    meta.insert(QStringLiteral("m"), VectorIndex::kM);
    meta.insert(QStringLiteral("ef_construction"), VectorIndex::kEfConstruction);
    meta.insert(QStringLiteral("last_persisted"),
                QDateTime::currentDateTimeUtc().toString(Qt::ISODate));
    meta.insert(QStringLiteral("records"), records);

    QFile metaFile(metaPath(collection.name));
    if (!metaFile.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(hrVector, "Failed to open meta file for write: %s",
                  qUtf8Printable(metaFile.fileName()));
        return false;
    }
    const qint64 written = metaFile.write(QJsonDocument(meta).toJson(QJsonDocument::Compact));
    metaFile.close();
    if (written < 0) {
        LOG_ERROR(hrVector, "Failed writing meta file: %s", qUtf8Printable(metaFile.fileName()));
        return false;
    }
    return true;
}

bool LocalVectorIndex::removeFiles(const QString& name)
{
    if (!persistent()) {
        return true;
    }
    bool ok = true;
    for (const QString& path : {indexPath(name), metaPath(name)}) {
        if (QFile::exists(path) && !QFile::remove(path)) {
            LOG_ERROR(hrVector, "Failed to remove %s", qUtf8Printable(path));
            ok = false;
        }
    }
    return ok;
}

EnsureCollectionResult LocalVectorIndex::ensureCollection(const QString& name, int dimension)
{
    if (dimension <= 0) {
        LOG_ERROR(hrVector, "ensureCollection(%s) rejected dimension %d", qUtf8Printable(name), dimension);
        return EnsureCollectionResult::Failed;
    }

    std::lock_guard<std::mutex> lock(m_mutex);

    EnsureCollectionResult result = EnsureCollectionResult::Created;
    if (Collection* existing = findCollection(name)) {
        if (existing->dimension == dimension) {
            return EnsureCollectionResult::Existing;
        }
        LOG_WARN(hrVector, "Collection %s has %d dims, provider needs %d; recreating",
                 qUtf8Printable(name), existing->dimension, dimension);
        m_collections.erase(name);
        removeFiles(name);
        result = EnsureCollectionResult::Recreated;
    }

    auto collection = std::make_unique<Collection>();
    collection->name = name;
    collection->dimension = dimension;
    collection->index = std::make_unique<VectorIndex>(dimension);
    if (!collection->index->create()) {
        return EnsureCollectionResult::Failed;
    }
    if (!persist(*collection)) {
        return EnsureCollectionResult::Failed;
    }

    LOG_INFO(hrVector, "Created collection %s (%d dims, COSINE)", qUtf8Printable(name), dimension);
    m_collections.emplace(name, std::move(collection));
    return result;
}

bool LocalVectorIndex::dropCollection(const QString& name)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_collections.erase(name);
    return removeFiles(name);
}

// ── Records ─────────────────────────────────────────────────

std::optional<int> LocalVectorIndex::insert(const QString& name, const std::vector<VectorRecord>& records)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    Collection* collection = findCollection(name);
    if (!collection) {
        LOG_WARN(hrVector, "insert into unknown collection %s", qUtf8Printable(name));
        return std::nullopt;
    }

    int written = 0;
    for (const VectorRecord& record : records) {
        if (static_cast<int>(record.vector.size()) != collection->dimension) {
            LOG_WARN(hrVector, "Record %s has %d dims, collection %s expects %d",
                     qUtf8Printable(record.id), static_cast<int>(record.vector.size()),
                     qUtf8Printable(name), collection->dimension);
            continue;
        }

        auto existing = collection->labelById.constFind(record.id);
        if (existing != collection->labelById.cend()) {
            const uint64_t oldLabel = existing.value();
            collection->index->deleteVector(oldLabel);
            collection->recordsByLabel.erase(oldLabel);
            collection->labelById.remove(record.id);
        }

        const uint64_t label = collection->index->addVector(record.vector);
        if (label == kInvalidLabel) {
            continue;
        }

        VectorRecord stored = record;
        stored.vector.clear();
        if (stored.timestamp <= 0.0) {
            stored.timestamp = static_cast<double>(QDateTime::currentSecsSinceEpoch());
        }
        collection->labelById.insert(record.id, label);
        collection->recordsByLabel.emplace(label, std::move(stored));
        ++written;
    }

    if (written > 0 && !persist(*collection)) {
        return std::nullopt;
    }
    return written;
}

std::optional<std::vector<VectorHit>> LocalVectorIndex::search(const QString& name,
                                                               const std::vector<float>& vector,
                                                               int topK,
                                                               const FilterExpression& filter)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    Collection* collection = findCollection(name);
    if (!collection) {
        LOG_WARN(hrVector, "search on unknown collection %s", qUtf8Printable(name));
        return std::nullopt;
    }
    if (static_cast<int>(vector.size()) != collection->dimension) {
        LOG_WARN(hrVector, "Query vector has %d dims, collection %s expects %d",
                 static_cast<int>(vector.size()), qUtf8Printable(name), collection->dimension);
        return std::nullopt;
    }

    const auto& records = collection->recordsByLabel;
    VectorIndex::LabelFilter labelFilter;
    if (!filter.isEmpty()) {
        labelFilter = [&records, &filter](uint64_t label) {
            auto it = records.find(label);
            return it != records.end() && filter.matches(it->second);
        };
    }

    std::vector<VectorHit> hits;
    for (const VectorIndex::KnnResult& knn : collection->index->search(vector, topK, labelFilter)) {
        auto it = records.find(knn.label);
        if (it == records.end()) {
            continue;
        }
        VectorHit hit;
        hit.id = it->second.id;
        hit.score = 1.0 - static_cast<double>(knn.distance);
        hit.record = it->second;
        hits.push_back(std::move(hit));
    }
    return hits;
}

std::optional<int> LocalVectorIndex::remove(const QString& name, const QStringList& ids)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    Collection* collection = findCollection(name);
    if (!collection) {
        return std::nullopt;
    }

    int removed = 0;
    for (const QString& id : ids) {
        auto it = collection->labelById.constFind(id);
        if (it == collection->labelById.cend()) {
            continue;
        }
        const uint64_t label = it.value();
        collection->index->deleteVector(label);
        collection->recordsByLabel.erase(label);
        collection->labelById.remove(id);
        ++removed;
    }

    if (removed > 0 && !persist(*collection)) {
        return std::nullopt;
    }
    return removed;
}

std::optional<QStringList> LocalVectorIndex::listIds(const QString& name)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    Collection* collection = findCollection(name);
    if (!collection) {
        return std::nullopt;
    }
    return QStringList(collection->labelById.keys());
}

std::optional<CollectionStatistics> LocalVectorIndex::statistics(const QString& name)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    Collection* collection = findCollection(name);
    if (!collection) {
        return std::nullopt;
    }
    CollectionStatistics stats;
    stats.rowCount = static_cast<int64_t>(collection->labelById.size());
    return stats;
}

std::optional<CollectionDescription> LocalVectorIndex::describe(const QString& name)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    Collection* collection = findCollection(name);
    if (!collection) {
        return std::nullopt;
    }
    CollectionDescription description;
    description.name = collection->name;
    description.dimension = collection->dimension;
    description.metric = QStringLiteral("COSINE");
    description.rowCount = static_cast<int64_t>(collection->labelById.size());
    return description;
}

} // namespace hr
