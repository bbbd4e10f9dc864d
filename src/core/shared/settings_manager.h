#pragma once

#include "core/shared/settings.h"

#include <QJsonObject>
#include <QString>

#include <optional>

namespace pm {

// SettingsManager -- JSON save/load for engine settings.
//
// Settings are stored as a JSON file at $PARTMATCH_SETTINGS when set, else
//   <GenericDataLocation>/partmatch/settings.json
class SettingsManager {
public:
    // Load settings from disk. Returns nullopt if file doesn't exist
    // or cannot be parsed.
    static std::optional<Settings> load();
    static std::optional<Settings> load(const QString& filePath);

    // Save settings to disk. Creates the directory if it doesn't exist.
    // Returns true on success.
    static bool save(const Settings& settings);
    static bool save(const Settings& settings, const QString& filePath);

    static QString settingsFilePath();

    static QJsonObject toJson(const Settings& settings);
    static Settings fromJson(const QJsonObject& json);
};

} // namespace pm
