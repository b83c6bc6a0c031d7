#include "app/cli.h"
#include "core/provision/installer.h"
#include "core/provision/service_unit.h"
#include "core/provision/systemd_control.h"
#include "core/shared/install_settings_manager.h"
#include "core/shared/logging.h"

#include <QFile>
#include <QFileInfo>

namespace bi {

void addCliOptions(QCommandLineParser& parser, const CliOptions& options)
{
    parser.addOptions({options.config, options.serviceName, options.appDir, options.script,
                       options.requirements, options.user, options.group, options.elevation,
                       options.verbose});
    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("install (default), render-unit or status."),
                                 QStringLiteral("[command]"));
}

bool resolveCommand(const QStringList& positional, QString* command, QString* error)
{
    if (positional.size() > 1) {
        *error = QStringLiteral("Too many arguments");
        return false;
    }

    const QString name = positional.isEmpty() ? QStringLiteral("install") : positional.first();
    if (name != QLatin1String("install") && name != QLatin1String("render-unit")
        && name != QLatin1String("status")) {
        *error = QStringLiteral("Unknown command: %1").arg(name);
        return false;
    }
    *command = name;
    return true;
}

bool resolveSettings(const QCommandLineParser& parser,
                     const CliOptions& options,
                     InstallSettings* settings,
                     QString* error)
{
    const bool explicitConfig = parser.isSet(options.config);
    const QString configPath = explicitConfig
        ? parser.value(options.config)
        : InstallSettingsManager::settingsFilePath();

    if (explicitConfig || QFileInfo::exists(configPath)) {
        QString loadError;
        auto loaded = InstallSettingsManager::load(configPath, &loadError);
        if (!loaded) {
            *error = loadError;
            return false;
        }
        *settings = *loaded;
        LOG_DEBUG(biCore, "Loaded settings from %s", qUtf8Printable(configPath));
    }

    if (parser.isSet(options.serviceName)) {
        settings->serviceName = parser.value(options.serviceName);
    }
    if (parser.isSet(options.appDir)) {
        settings->appDir = parser.value(options.appDir);
    }
    if (parser.isSet(options.script)) {
        settings->sourceScript = parser.value(options.script);
    }
    if (parser.isSet(options.requirements)) {
        settings->requirementsFile = parser.value(options.requirements);
    }
    if (parser.isSet(options.user)) {
        settings->runAsUser = parser.value(options.user);
    }
    if (parser.isSet(options.group)) {
        settings->runAsGroup = parser.value(options.group);
    }
    if (parser.isSet(options.elevation)) {
        const QString raw = parser.value(options.elevation);
        const auto elevation = elevationFromString(raw);
        if (!elevation) {
            *error = QStringLiteral("Unknown elevation mode: %1").arg(raw);
            return false;
        }
        settings->elevation = *elevation;
    }
    return true;
}

int runInstall(const InstallSettings& settings,
               PrivilegedRunner& runner,
               QTextStream& out,
               QTextStream& err)
{
    Installer installer(settings, runner);
    const InstallReport report = installer.run();

    if (!report.success) {
        err << "Install failed at " << installStepToString(*report.failedStep) << ": "
            << report.message << Qt::endl;
        return kExitFailed;
    }

    out << report.message << Qt::endl;
    return kExitOk;
}

int runRenderUnit(const InstallSettings& settings, QTextStream& out)
{
    out << ServiceUnit::fromSettings(settings).render();
    out.flush();
    return kExitOk;
}

int runStatus(const InstallSettings& settings, PrivilegedRunner& runner, QTextStream& out)
{
    const QString unitPath = settings.unitPath();

    QFile unitFile(unitPath);
    if (!unitFile.open(QIODevice::ReadOnly)) {
        out << "unit: " << unitPath << " (missing)" << Qt::endl;
    } else {
        const auto unit = ServiceUnit::parse(QString::fromUtf8(unitFile.readAll()));
        unitFile.close();
        out << "unit: " << unitPath << Qt::endl;
        if (unit) {
            out << "exec-start: " << unit->execStart << Qt::endl;
        } else {
            LOG_WARN(biUnit, "%s has no [Service] ExecStart", qUtf8Printable(unitPath));
        }
    }

    SystemdControl systemd(runner);
    const ServiceStatus status = systemd.status(settings.serviceName);
    out << "enabled: " << status.enabledState << Qt::endl;
    out << "active: " << status.activeState << Qt::endl;

    return (status.isEnabled() && status.isActive()) ? kExitOk : kExitFailed;
}

} // namespace bi
