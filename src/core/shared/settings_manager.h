#pragma once

#include "core/shared/settings.h"

#include <QJsonObject>
#include <QString>

#include <optional>

namespace rb {

// SettingsManager -- JSON save/load for rulebot settings.
//
// Settings are stored as a JSON file at:
//   <GenericDataLocation>/rulebot/settings.json
class SettingsManager {
public:
    // Load settings from the default location. Returns nullopt if the file
    // doesn't exist or cannot be parsed.
    static std::optional<Settings> load();
    static std::optional<Settings> loadFromFile(const QString& filePath);

    // Save settings to disk. Creates the directory if it doesn't exist.
    static bool save(const Settings& settings);
    static bool saveToFile(const Settings& settings, const QString& filePath);

    static QString settingsFilePath();

    static QString defaultDbPath();

    // Process environment overrides: RULEBOT_DEBUG=1, RULEBOT_DB_PATH.
    // Read once at startup by the executable, never by the engine.
    // Fills dbPath with defaultDbPath() when it is still empty.
    static Settings applyEnvironment(Settings settings);

    static QJsonObject toJson(const Settings& settings);
    static Settings fromJson(const QJsonObject& json);
};

} // namespace rb
