#pragma once

#include "core/shared/settings.h"

#include <QJsonObject>
#include <QString>

#include <optional>

namespace hr {

// Reads and writes the engine Settings as JSON. The CLI keeps one file at
// <GenericDataLocation>/hybridrag/settings.json unless --settings names
// another one. Keys missing from the file keep their defaults; a
// non-positive chunk size or batch size falls back to the default.
class SettingsManager {
public:
    // nullopt when the file is absent, unreadable or not a JSON object.
    static std::optional<Settings> load();
    static std::optional<Settings> load(const QString& filePath);

    // Creates the parent directory on demand.
    static bool save(const Settings& settings);
    static bool save(const Settings& settings, const QString& filePath);

    static QString settingsFilePath();

    // dbPath and indexDir default to knowledge.db and vectors/ beside the
    // settings file.
    static void applyDefaultPaths(Settings& settings);

    // openaiApiKey, or $OPENAI_API_KEY when that is empty.
    static QString resolvedOpenAiKey(const Settings& settings);

    static QJsonObject toJson(const Settings& settings);
    static Settings fromJson(const QJsonObject& json);
};

} // namespace hr
