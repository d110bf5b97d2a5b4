#include "core/shared/chunk.h"

#include <QCryptographicHash>
#include <QJsonArray>
#include <QJsonDocument>
#include <QtEndian>

#include <cmath>
#include <cstring>

namespace hr {

QString computeContentHash(const QString& content)
{
    const QByteArray hash = QCryptographicHash::hash(
        content.toUtf8(), QCryptographicHash::Sha256);
    return QString::fromLatin1(hash.toHex());
}

QString chunkRecordId(int64_t chunkId)
{
    return QString::number(chunkId);
}

std::optional<int64_t> chunkIdFromRecordId(const QString& recordId)
{
    bool ok = false;
    const qlonglong value = recordId.toLongLong(&ok);
    if (!ok || value <= 0) {
        return std::nullopt;
    }
    return static_cast<int64_t>(value);
}

QByteArray encodeEmbeddingBlob(const std::vector<float>& values)
{
    QByteArray blob;
    blob.resize(static_cast<qsizetype>(values.size() * sizeof(float)));
    char* out = blob.data();
    for (size_t i = 0; i < values.size(); ++i) {
        uint32_t bits = 0;
        std::memcpy(&bits, &values[i], sizeof(bits));
        qToLittleEndian(bits, out + i * sizeof(float));
    }
    return blob;
}

std::optional<std::vector<float>> decodeEmbeddingBlob(const QByteArray& blob, int dimension)
{
    if (dimension <= 0) {
        return std::nullopt;
    }
    const auto expectedBytes = static_cast<qsizetype>(dimension) * static_cast<qsizetype>(sizeof(float));
    if (blob.size() != expectedBytes) {
        return std::nullopt;
    }

    std::vector<float> values(static_cast<size_t>(dimension));
    const char* in = blob.constData();
    for (size_t i = 0; i < values.size(); ++i) {
        const uint32_t bits = qFromLittleEndian<uint32_t>(in + i * sizeof(float));
        std::memcpy(&values[i], &bits, sizeof(bits));
    }

    if (hasNonFiniteComponent(values)) {
        return std::nullopt;
    }
    return values;
}

std::optional<std::vector<float>> parseLegacyEmbeddingJson(const QString& text)
{
    const QString trimmed = text.trimmed();
    if (trimmed.isEmpty() || trimmed == QLatin1String("null")) {
        return std::nullopt;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(trimmed.toUtf8(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isArray()) {
        return std::nullopt;
    }

    const QJsonArray array = doc.array();
    if (array.isEmpty()) {
        return std::nullopt;
    }

    std::vector<float> values;
    values.reserve(static_cast<size_t>(array.size()));
    for (const QJsonValue& entry : array) {
        if (!entry.isDouble()) {
            return std::nullopt;
        }
        values.push_back(static_cast<float>(entry.toDouble()));
    }

    if (hasNonFiniteComponent(values)) {
        return std::nullopt;
    }
    return values;
}

bool hasNonFiniteComponent(const std::vector<float>& values)
{
    for (const float value : values) {
        if (!std::isfinite(value)) {
            return true;
        }
    }
    return false;
}

} // namespace hr
