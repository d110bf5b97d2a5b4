#include "core/shared/types.h"

#include <QJsonArray>

namespace hr {

QString documentCategoryToString(DocumentCategory category)
{
    switch (category) {
    case DocumentCategory::Hydraulics:    return QStringLiteral("hydraulics");
    case DocumentCategory::Regulations:   return QStringLiteral("regulations");
    case DocumentCategory::BestPractices: return QStringLiteral("best-practices");
    case DocumentCategory::General:       return QStringLiteral("general");
    }
    return QStringLiteral("general");
}

DocumentCategory documentCategoryFromString(const QString& str)
{
    const QString lowered = str.trimmed().toLower();
    if (lowered == QLatin1String("hydraulics"))     return DocumentCategory::Hydraulics;
    if (lowered == QLatin1String("regulations"))    return DocumentCategory::Regulations;
    if (lowered == QLatin1String("best-practices")) return DocumentCategory::BestPractices;
    return DocumentCategory::General;
}

namespace {

QJsonArray toJsonArray(const QStringList& values)
{
    return QJsonArray::fromStringList(values);
}

QStringList toStringList(const QJsonValue& value)
{
    QStringList out;
    const QJsonArray array = value.toArray();
    out.reserve(array.size());
    for (const QJsonValue& entry : array) {
        if (entry.isString()) {
            out.append(entry.toString());
        } else if (entry.isObject()) {
            // Tables, figures and examples arrive as objects from older
            // exports; keep the title.
            out.append(entry.toObject().value(QStringLiteral("title")).toString());
        }
    }
    return out;
}

} // namespace

QJsonObject formulaToJson(const Formula& formula)
{
    QJsonObject json;
    json.insert(QStringLiteral("id"), formula.id);
    json.insert(QStringLiteral("name"), formula.name);
    json.insert(QStringLiteral("category"), formula.category);
    json.insert(QStringLiteral("equation"), formula.equation);
    return json;
}

Formula formulaFromJson(const QJsonObject& json)
{
    Formula formula;
    formula.id = json.value(QStringLiteral("id")).toString();
    formula.name = json.value(QStringLiteral("name")).toString();
    formula.category = json.value(QStringLiteral("category")).toString();
    formula.equation = json.value(QStringLiteral("equation")).toString();
    return formula;
}

QJsonObject referenceToJson(const Reference& reference)
{
    QJsonObject json;
    json.insert(QStringLiteral("id"), reference.id);
    json.insert(QStringLiteral("type"), reference.type);
    json.insert(QStringLiteral("title"), reference.title);
    if (!reference.organization.isEmpty()) {
        json.insert(QStringLiteral("organization"), reference.organization);
    }
    if (reference.year > 0) {
        json.insert(QStringLiteral("year"), reference.year);
    }
    if (!reference.url.isEmpty()) {
        json.insert(QStringLiteral("url"), reference.url);
    }
    return json;
}

Reference referenceFromJson(const QJsonObject& json)
{
    Reference reference;
    reference.id = json.value(QStringLiteral("id")).toString();
    reference.type = json.value(QStringLiteral("type")).toString();
    reference.title = json.value(QStringLiteral("title")).toString();
    reference.organization = json.value(QStringLiteral("organization")).toString();
    reference.year = json.value(QStringLiteral("year")).toInt(0);
    reference.url = json.value(QStringLiteral("url")).toString();
    return reference;
}

QJsonObject metadataToJson(const DocumentMetadata& metadata)
{
    QJsonArray formulas;
    for (const Formula& formula : metadata.formulas) {
        formulas.append(formulaToJson(formula));
    }
    QJsonArray references;
    for (const Reference& reference : metadata.references) {
        references.append(referenceToJson(reference));
    }

    QJsonObject json;
    json.insert(QStringLiteral("keywords"), toJsonArray(metadata.keywords));
    json.insert(QStringLiteral("formulas"), formulas);
    json.insert(QStringLiteral("tables"), toJsonArray(metadata.tables));
    json.insert(QStringLiteral("figures"), toJsonArray(metadata.figures));
    json.insert(QStringLiteral("examples"), toJsonArray(metadata.examples));
    json.insert(QStringLiteral("references"), references);
    json.insert(QStringLiteral("language"), metadata.language);
    return json;
}

DocumentMetadata metadataFromJson(const QJsonObject& json)
{
    DocumentMetadata metadata;
    metadata.keywords = toStringList(json.value(QStringLiteral("keywords")));
    metadata.tables = toStringList(json.value(QStringLiteral("tables")));
    metadata.figures = toStringList(json.value(QStringLiteral("figures")));
    metadata.examples = toStringList(json.value(QStringLiteral("examples")));
    metadata.language = json.value(QStringLiteral("language")).toString(metadata.language);

    for (const QJsonValue& value : json.value(QStringLiteral("formulas")).toArray()) {
        metadata.formulas.push_back(formulaFromJson(value.toObject()));
    }
    for (const QJsonValue& value : json.value(QStringLiteral("references")).toArray()) {
        metadata.references.push_back(referenceFromJson(value.toObject()));
    }
    return metadata;
}

} // namespace hr
