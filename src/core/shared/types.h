#pragma once

#include <QJsonObject>
#include <QString>
#include <QStringList>

#include <optional>
#include <vector>

namespace hr {

// Top-level classification of a knowledge document.
enum class DocumentCategory {
    Hydraulics,
    Regulations,
    BestPractices,
    General,
};

QString documentCategoryToString(DocumentCategory category);
DocumentCategory documentCategoryFromString(const QString& str);

struct Formula {
    QString id;
    QString name;
    QString category;   // head_loss, pump, flow, water_hammer, tank_sizing
    QString equation;
};

struct Reference {
    QString id;
    QString type;       // standard, book, article, regulation, manual
    QString title;
    QString organization;
    int year = 0;
    QString url;
};

struct DocumentMetadata {
    QStringList keywords;
    std::vector<Formula> formulas;
    QStringList tables;
    QStringList figures;
    QStringList examples;
    std::vector<Reference> references;
    QString language = QStringLiteral("es");
};

QJsonObject metadataToJson(const DocumentMetadata& metadata);
DocumentMetadata metadataFromJson(const QJsonObject& json);

QJsonObject formulaToJson(const Formula& formula);
Formula formulaFromJson(const QJsonObject& json);
QJsonObject referenceToJson(const Reference& reference);
Reference referenceFromJson(const QJsonObject& json);

// A technical document. Owns its chunks in the relational store
// (1 document : N chunks, cascade delete).
struct Document {
    QString id;
    DocumentCategory category = DocumentCategory::General;
    QString subcategory;
    QStringList regions;
    QString title;
    QString content;
    DocumentMetadata metadata;
    QString version = QStringLiteral("1.0");
    QString status = QStringLiteral("active");
    double createdAt = 0.0;   // Epoch seconds
    double updatedAt = 0.0;   // Epoch seconds
};

// Partial update for updateDocument(). Unset fields are left untouched;
// a new content value triggers re-chunking and re-embedding.
struct DocumentPatch {
    std::optional<DocumentCategory> category;
    std::optional<QString> subcategory;
    std::optional<QStringList> regions;
    std::optional<QString> title;
    std::optional<QString> content;
    std::optional<DocumentMetadata> metadata;
    std::optional<QString> version;

    bool isEmpty() const
    {
        return !category.has_value()
            && !subcategory.has_value()
            && !regions.has_value()
            && !title.has_value()
            && !content.has_value()
            && !metadata.has_value()
            && !version.has_value();
    }
};

// Regulation projection returned by getRegulations().
struct RegulationSummary {
    QString id;
    QString title;
    QStringList regions;
    std::vector<Reference> references;
    QString content;
};

// Candidate filter shared by the relational store and the vector index.
struct DocumentFilter {
    std::optional<DocumentCategory> category;
    std::optional<QString> region;     // substring match against the region list
    std::optional<QString> language;

    bool isEmpty() const
    {
        return !category.has_value() && !region.has_value() && !language.has_value();
    }
};

} // namespace hr
