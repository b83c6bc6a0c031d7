#include "core/shared/install_settings_manager.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>

namespace bi {

namespace {

void readString(const QJsonObject& json, const char* key, QString& target)
{
    const QJsonValue value = json.value(QLatin1String(key));
    if (value.isString()) {
        target = value.toString();
    }
}

} // namespace

std::optional<InstallSettings> InstallSettingsManager::load(const QString& filePath,
                                                            QString* error)
{
    QFile file(filePath);
    if (!file.exists()) {
        if (error) {
            *error = QStringLiteral("Settings file does not exist: %1").arg(filePath);
        }
        return std::nullopt;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(biCore, "Failed to open settings file for read: %s", qUtf8Printable(filePath));
        if (error) {
            *error = QStringLiteral("Cannot read settings file: %1").arg(filePath);
        }
        return std::nullopt;
    }

    const QByteArray rawJson = file.readAll();
    file.close();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(rawJson, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(biCore,
                 "Failed to parse settings JSON (%s): %s",
                 qUtf8Printable(filePath),
                 qUtf8Printable(parseError.errorString()));
        if (error) {
            *error = QStringLiteral("Invalid settings JSON in %1: %2")
                         .arg(filePath, parseError.error != QJsonParseError::NoError
                                            ? parseError.errorString()
                                            : QStringLiteral("top-level value is not an object"));
        }
        return std::nullopt;
    }

    LOG_DEBUG(biCore, "Loaded settings from %s", qUtf8Printable(filePath));
    return fromJson(doc.object());
}

bool InstallSettingsManager::save(const InstallSettings& settings, const QString& filePath)
{
    const QString parentDir = QFileInfo(filePath).absolutePath();
    if (!QDir().mkpath(parentDir)) {
        LOG_ERROR(biCore, "Failed to create settings directory: %s", qUtf8Printable(parentDir));
        return false;
    }

    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(biCore, "Failed to open settings file for write: %s", qUtf8Printable(filePath));
        return false;
    }

    const qint64 bytesWritten =
        file.write(QJsonDocument(toJson(settings)).toJson(QJsonDocument::Indented));
    file.close();

    if (bytesWritten < 0) {
        LOG_ERROR(biCore, "Failed to write settings file: %s", qUtf8Printable(filePath));
        return false;
    }
    return true;
}

QString InstallSettingsManager::settingsFilePath()
{
    const QString envPath = qEnvironmentVariable("BILLBOARD_INSTALLER_CONFIG").trimmed();
    if (!envPath.isEmpty()) {
        return QDir::cleanPath(envPath);
    }
    return QStringLiteral("/etc/billboard-installer/settings.json");
}

QJsonObject InstallSettingsManager::toJson(const InstallSettings& settings)
{
    QJsonObject json;
    json.insert(QStringLiteral("serviceName"), settings.serviceName);
    json.insert(QStringLiteral("description"), settings.description);
    if (!settings.appDir.isEmpty()) {
        json.insert(QStringLiteral("appDir"), settings.appDir);
    }
    if (!settings.venvDir.isEmpty()) {
        json.insert(QStringLiteral("venvDir"), settings.venvDir);
    }
    json.insert(QStringLiteral("unitDir"), settings.unitDir);
    json.insert(QStringLiteral("sourceScript"), settings.sourceScript);
    json.insert(QStringLiteral("requirementsFile"), settings.requirementsFile);
    json.insert(QStringLiteral("runAsUser"), settings.runAsUser);
    json.insert(QStringLiteral("runAsGroup"), settings.runAsGroup);
    json.insert(QStringLiteral("logFile"), settings.logFile);
    json.insert(QStringLiteral("pythonInterpreter"), settings.pythonInterpreter);
    json.insert(QStringLiteral("elevation"), elevationToString(settings.elevation));
    json.insert(QStringLiteral("commandTimeoutMs"), settings.commandTimeoutMs);
    return json;
}

InstallSettings InstallSettingsManager::fromJson(const QJsonObject& json)
{
    InstallSettings settings;

    readString(json, "serviceName", settings.serviceName);
    readString(json, "description", settings.description);
    readString(json, "appDir", settings.appDir);
    readString(json, "venvDir", settings.venvDir);
    readString(json, "unitDir", settings.unitDir);
    readString(json, "sourceScript", settings.sourceScript);
    readString(json, "requirementsFile", settings.requirementsFile);
    readString(json, "runAsUser", settings.runAsUser);
    readString(json, "runAsGroup", settings.runAsGroup);
    readString(json, "logFile", settings.logFile);
    readString(json, "pythonInterpreter", settings.pythonInterpreter);

    if (json.contains(QStringLiteral("elevation"))) {
        const QString raw = json.value(QStringLiteral("elevation")).toString();
        if (const auto elevation = elevationFromString(raw)) {
            settings.elevation = *elevation;
        } else {
            LOG_WARN(biCore, "Ignoring unknown elevation mode '%s'", qUtf8Printable(raw));
        }
    }

    if (json.contains(QStringLiteral("commandTimeoutMs"))) {
        const int timeoutMs = json.value(QStringLiteral("commandTimeoutMs")).toInt(0);
        if (timeoutMs > 0) {
            settings.commandTimeoutMs = timeoutMs;
        }
    }

    return settings;
}

} // namespace bi
