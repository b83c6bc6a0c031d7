#pragma once

#include "core/exec/privileged_runner.h"
#include "core/shared/install_settings.h"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QString>
#include <QStringList>
#include <QTextStream>

namespace bi {

constexpr int kExitOk = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;

struct CliOptions {
    QCommandLineOption config{QStringLiteral("config"),
                              QStringLiteral("Settings JSON file."),
                              QStringLiteral("file")};
    QCommandLineOption serviceName{QStringLiteral("service-name"),
                                   QStringLiteral("systemd service name."),
                                   QStringLiteral("name")};
    QCommandLineOption appDir{QStringLiteral("app-dir"),
                              QStringLiteral("Application directory (default /opt/<service>)."),
                              QStringLiteral("dir")};
    QCommandLineOption script{QStringLiteral("script"),
                              QStringLiteral("Daemon script to install."),
                              QStringLiteral("file")};
    QCommandLineOption requirements{QStringLiteral("requirements"),
                                    QStringLiteral("pip requirements file."),
                                    QStringLiteral("file")};
    QCommandLineOption user{QStringLiteral("user"),
                            QStringLiteral("User the daemon runs as."),
                            QStringLiteral("name")};
    QCommandLineOption group{QStringLiteral("group"),
                             QStringLiteral("Group the daemon runs as."),
                             QStringLiteral("name")};
    QCommandLineOption elevation{QStringLiteral("elevation"),
                                 QStringLiteral("Privilege mode: auto, sudo or none."),
                                 QStringLiteral("mode")};
    QCommandLineOption verbose{QStringList{QStringLiteral("v"), QStringLiteral("verbose")},
                               QStringLiteral("Verbose logging.")};
};

// Registers the options and the [command] positional argument.
void addCliOptions(QCommandLineParser& parser, const CliOptions& options);

// Picks install / render-unit / status from the positional arguments.
// An empty list means install.
bool resolveCommand(const QStringList& positional, QString* command, QString* error);

// Defaults < settings file < command line. The settings file is the one
// named by --config (which must then load), or the default path when it
// exists.
bool resolveSettings(const QCommandLineParser& parser,
                     const CliOptions& options,
                     InstallSettings* settings,
                     QString* error);

int runInstall(const InstallSettings& settings,
               PrivilegedRunner& runner,
               QTextStream& out,
               QTextStream& err);
int runRenderUnit(const InstallSettings& settings, QTextStream& out);

// Exit code is kExitOk only when the unit is both enabled and active.
int runStatus(const InstallSettings& settings, PrivilegedRunner& runner, QTextStream& out);

} // namespace bi
