#pragma once

#include "core/shared/settings.h"

#include <QJsonObject>
#include <QString>

#include <optional>

namespace cr {

// SettingsManager -- JSON save/load for engine settings.
//
// The default settings file lives at:
//   <GenericDataLocation>/citerag/settings.json
class SettingsManager {
public:
    // Load settings from disk. Returns nullopt if the file doesn't exist
    // or cannot be parsed. Keys absent from the file keep their defaults.
    static std::optional<RagSettings> load();
    static std::optional<RagSettings> load(const QString& filePath);

    // Save settings to disk. Creates the directory if it doesn't exist.
    // Returns true on success.
    static bool save(const RagSettings& settings);
    static bool save(const RagSettings& settings, const QString& filePath);

    static QString settingsFilePath();

    static QJsonObject toJson(const RagSettings& settings);
    static RagSettings fromJson(const QJsonObject& json);

    // Returns the name of the first out-of-range field, or nullopt when
    // every field is usable.
    static std::optional<QString> validate(const RagSettings& settings);
};

} // namespace cr
