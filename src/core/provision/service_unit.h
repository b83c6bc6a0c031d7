#pragma once

#include "core/shared/install_settings.h"

#include <QString>
#include <QStringList>

#include <optional>

namespace bi {

// A systemd service descriptor for a single long-running daemon.
struct ServiceUnit {
    QString description;
    QString after = QStringLiteral("network.target");

    QString execStart;
    QString workingDirectory;
    QString restart = QStringLiteral("on-failure");
    QString user;
    QString group;
    QString standardOutput;
    QString standardError;
    QStringList environment;

    QString wantedBy = QStringLiteral("multi-user.target");

    // Build the descriptor for the daemon described by settings, started by
    // the venv interpreter.
    static ServiceUnit fromSettings(const InstallSettings& settings);

    // Fixed template rendering; field order is stable across runs.
    QString render() const;

    // Reads an installed unit back. Returns nullopt when the text has no
    // [Service] section or no ExecStart.
    static std::optional<ServiceUnit> parse(const QString& text);

    // First token of ExecStart, without systemd's "-@:+!" prefixes.
    QString execStartInterpreter() const;
};

} // namespace bi
