#include "core/provision/installer.h"
#include "core/provision/service_unit.h"
#include "core/provision/systemd_control.h"
#include "core/provision/virtual_env.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFileInfo>
#include <QPair>
#include <QRegularExpression>

namespace bi {

namespace {

constexpr InstallStep kSteps[] = {
    InstallStep::CheckInputs,
    InstallStep::PrepareDirectory,
    InstallStep::CopyScript,
    InstallStep::CreateEnvironment,
    InstallStep::InstallDependencies,
    InstallStep::WriteUnit,
    InstallStep::ActivateService,
};

OperationResult ok()
{
    OperationResult result;
    result.success = true;
    result.exitCode = 0;
    return result;
}

OperationResult failure(const QString& message)
{
    OperationResult result;
    result.message = message;
    return result;
}

OperationResult checkReadableFile(const QString& path, const QString& role)
{
    const QFileInfo info(path);
    if (!info.exists()) {
        return failure(QStringLiteral("%1 not found: %2").arg(role, path));
    }
    if (!info.isFile()) {
        return failure(QStringLiteral("%1 is not a regular file: %2").arg(role, path));
    }
    if (!info.isReadable()) {
        return failure(QStringLiteral("%1 is not readable: %2").arg(role, path));
    }
    return ok();
}

// Target paths end up unquoted in the unit's ExecStart, so they must be
// absolute and free of whitespace.
OperationResult checkTargetPath(const QString& path, const QString& role)
{
    static const QRegularExpression whitespace(QStringLiteral("\\s"));
    if (path.isEmpty() || !QDir::isAbsolutePath(path)) {
        return failure(QStringLiteral("%1 must be an absolute path: %2").arg(role, path));
    }
    if (path.contains(whitespace)) {
        return failure(QStringLiteral("%1 must not contain whitespace: %2").arg(role, path));
    }
    return ok();
}

} // namespace

QString installStepToString(InstallStep step)
{
    switch (step) {
    case InstallStep::CheckInputs:
        return QStringLiteral("check-inputs");
    case InstallStep::PrepareDirectory:
        return QStringLiteral("prepare-directory");
    case InstallStep::CopyScript:
        return QStringLiteral("copy-script");
    case InstallStep::CreateEnvironment:
        return QStringLiteral("create-environment");
    case InstallStep::InstallDependencies:
        return QStringLiteral("install-dependencies");
    case InstallStep::WriteUnit:
        return QStringLiteral("write-unit");
    case InstallStep::ActivateService:
        return QStringLiteral("activate-service");
    }
    return QStringLiteral("unknown");
}

Installer::Installer(const InstallSettings& settings, PrivilegedRunner& runner)
    : m_settings(settings)
    , m_runner(runner)
{
}

QString Installer::resolvedScriptPath() const
{
    return QFileInfo(m_settings.sourceScript).absoluteFilePath();
}

QString Installer::resolvedRequirementsPath() const
{
    return QFileInfo(m_settings.requirementsFile).absoluteFilePath();
}

QString Installer::renderUnit() const
{
    return ServiceUnit::fromSettings(m_settings).render();
}

InstallReport Installer::run()
{
    InstallReport report;

    LOG_INFO(biInstall, "Installing %s into %s (runner: %s)",
             qUtf8Printable(m_settings.serviceName),
             qUtf8Printable(m_settings.resolvedAppDir()),
             qUtf8Printable(m_runner.name()));

    for (InstallStep step : kSteps) {
        LOG_INFO(biInstall, "[%s] starting", qUtf8Printable(installStepToString(step)));
        const OperationResult result = runStep(step);
        if (!result.success) {
            LOG_ERROR(biInstall, "[%s] failed: %s",
                      qUtf8Printable(installStepToString(step)),
                      qUtf8Printable(result.message));
            report.success = false;
            report.failedStep = step;
            report.message = result.message;
            return report;
        }
        report.completedSteps.append(step);
    }

    report.success = true;
    report.message = QStringLiteral("%1 installed and started.").arg(m_settings.serviceName);
    return report;
}

OperationResult Installer::runStep(InstallStep step)
{
    switch (step) {
    case InstallStep::CheckInputs:
        return checkInputs();
    case InstallStep::PrepareDirectory:
        return prepareDirectory();
    case InstallStep::CopyScript:
        return copyScript();
    case InstallStep::CreateEnvironment:
        return createEnvironment();
    case InstallStep::InstallDependencies:
        return installDependencies();
    case InstallStep::WriteUnit:
        return writeUnit();
    case InstallStep::ActivateService:
        return activateService();
    }
    return failure(QStringLiteral("Unknown install step"));
}

OperationResult Installer::checkInputs() const
{
    if (m_settings.serviceName.trimmed().isEmpty()) {
        return failure(QStringLiteral("Service name is empty"));
    }

    const QPair<QString, QString> targets[] = {
        {m_settings.resolvedAppDir(), QStringLiteral("Application directory")},
        {m_settings.resolvedVenvDir(), QStringLiteral("Virtualenv directory")},
        {m_settings.installedScriptPath(), QStringLiteral("Installed script path")},
        {QDir::cleanPath(m_settings.unitDir), QStringLiteral("Unit directory")},
        {m_settings.unitPath(), QStringLiteral("Unit file path")},
    };
    for (const auto& target : targets) {
        const OperationResult result = checkTargetPath(target.first, target.second);
        if (!result.success) {
            return result;
        }
    }

    OperationResult result = checkReadableFile(resolvedScriptPath(), QStringLiteral("Daemon script"));
    if (!result.success) {
        return result;
    }
    return checkReadableFile(resolvedRequirementsPath(), QStringLiteral("Requirements file"));
}

OperationResult Installer::prepareDirectory()
{
    return m_runner.makeDirectory(m_settings.resolvedAppDir());
}

OperationResult Installer::copyScript()
{
    return m_runner.copyFile(resolvedScriptPath(), m_settings.installedScriptPath());
}

OperationResult Installer::createEnvironment()
{
    const VirtualEnv venv(m_settings.resolvedVenvDir(), m_settings.pythonInterpreter);
    return venv.create(m_runner);
}

OperationResult Installer::installDependencies()
{
    const VirtualEnv venv(m_settings.resolvedVenvDir(), m_settings.pythonInterpreter);

    OperationResult result = venv.upgradePip(m_runner);
    if (!result.success) {
        return result;
    }
    return venv.installRequirements(m_runner, resolvedRequirementsPath());
}

OperationResult Installer::writeUnit()
{
    const VirtualEnv venv(m_settings.resolvedVenvDir(), m_settings.pythonInterpreter);
    const ServiceUnit unit = ServiceUnit::fromSettings(m_settings);

    const QString interpreter = unit.execStartInterpreter();
    if (!venv.containsPath(interpreter)) {
        return failure(QStringLiteral("ExecStart interpreter %1 is outside the virtualenv %2")
                           .arg(interpreter, venv.root()));
    }

    const QString unitPath = m_settings.unitPath();
    LOG_INFO(biUnit, "Writing %s", qUtf8Printable(unitPath));
    return m_runner.writeFile(unitPath, unit.render().toUtf8());
}

OperationResult Installer::activateService()
{
    SystemdControl systemd(m_runner);

    OperationResult result = systemd.daemonReexec();
    if (!result.success) {
        return result;
    }
    result = systemd.daemonReload();
    if (!result.success) {
        return result;
    }
    result = systemd.enable(m_settings.serviceName);
    if (!result.success) {
        return result;
    }
    return systemd.start(m_settings.serviceName);
}

} // namespace bi
