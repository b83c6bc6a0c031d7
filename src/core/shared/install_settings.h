#pragma once

#include <QString>

#include <optional>

namespace bi {

// How privileged filesystem and init-system operations are performed.
enum class Elevation {
    Auto,   // in-process when running as root, sudo otherwise
    Sudo,
    None,
};

QString elevationToString(Elevation elevation);
std::optional<Elevation> elevationFromString(const QString& value);

struct InstallSettings {
    // Service identity
    QString serviceName = QStringLiteral("billboard");
    QString description = QStringLiteral("Image Display Network Daemon");

    // Install locations. Empty appDir/venvDir derive from serviceName.
    QString appDir;
    QString venvDir;
    QString unitDir = QStringLiteral("/etc/systemd/system");

    // Inputs, resolved against the current working directory
    QString sourceScript = QStringLiteral("billboard.py");
    QString requirementsFile = QStringLiteral("requirements.txt");

    // Runtime identity of the daemon
    QString runAsUser = QStringLiteral("pi");
    QString runAsGroup = QStringLiteral("pi");
    QString logFile = QStringLiteral("/var/log/image_display_daemon.log");

    // Interpreter used only to create the venv
    QString pythonInterpreter = QStringLiteral("python3");

    Elevation elevation = Elevation::Auto;

    // Package installs can take a long time on a Pi.
    int commandTimeoutMs = 30 * 60 * 1000;

    QString resolvedAppDir() const;
    QString resolvedVenvDir() const;
    QString unitPath() const;
    QString installedScriptPath() const;
};

} // namespace bi
