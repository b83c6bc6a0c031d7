#pragma once

#include "core/shared/install_settings.h"

#include <QJsonObject>
#include <QString>

#include <optional>

namespace bi {

// InstallSettingsManager -- JSON save/load for installer settings.
//
// Settings are read from:
//   $BILLBOARD_INSTALLER_CONFIG, or /etc/billboard-installer/settings.json
// Keys absent from the file keep their built-in defaults.
class InstallSettingsManager {
public:
    // Load settings from the given file. Returns nullopt if the file doesn't
    // exist or cannot be parsed; error receives the reason.
    static std::optional<InstallSettings> load(const QString& filePath,
                                               QString* error = nullptr);

    // Save settings to disk. Creates the directory if it doesn't exist.
    static bool save(const InstallSettings& settings, const QString& filePath);

    // Returns the default file path for the settings file.
    static QString settingsFilePath();

    static QJsonObject toJson(const InstallSettings& settings);
    static InstallSettings fromJson(const QJsonObject& json);
};

} // namespace bi
