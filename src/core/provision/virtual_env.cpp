#include "core/provision/virtual_env.h"
#include "core/shared/logging.h"

#include <QDir>

namespace bi {

VirtualEnv::VirtualEnv(const QString& root, const QString& baseInterpreter)
    : m_root(QDir::cleanPath(root))
    , m_baseInterpreter(baseInterpreter)
{
}

QString VirtualEnv::binDir() const
{
    return QDir(m_root).filePath(QStringLiteral("bin"));
}

QString VirtualEnv::interpreter() const
{
    return QDir(binDir()).filePath(QStringLiteral("python"));
}

bool VirtualEnv::containsPath(const QString& path) const
{
    if (path.isEmpty() || QDir::isRelativePath(path)) {
        return false;
    }
    const QString cleaned = QDir::cleanPath(path);
    const QString prefix = m_root.endsWith(QLatin1Char('/')) ? m_root : m_root + QLatin1Char('/');
    return cleaned.startsWith(prefix);
}

CommandLine VirtualEnv::createCommand() const
{
    return {m_baseInterpreter, {QStringLiteral("-m"), QStringLiteral("venv"), m_root}};
}

CommandLine VirtualEnv::upgradePipCommand() const
{
    return {interpreter(),
            {QStringLiteral("-m"), QStringLiteral("pip"), QStringLiteral("install"),
             QStringLiteral("--upgrade"), QStringLiteral("pip")}};
}

CommandLine VirtualEnv::installRequirementsCommand(const QString& requirementsFile) const
{
    return {interpreter(),
            {QStringLiteral("-m"), QStringLiteral("pip"), QStringLiteral("install"),
             QStringLiteral("-r"), requirementsFile}};
}

OperationResult VirtualEnv::create(PrivilegedRunner& runner) const
{
    const CommandLine cmd = createCommand();
    LOG_INFO(biInstall, "Creating virtualenv at %s", qUtf8Printable(m_root));
    return runner.run(cmd.program, cmd.args);
}

OperationResult VirtualEnv::upgradePip(PrivilegedRunner& runner) const
{
    const CommandLine cmd = upgradePipCommand();
    return runner.run(cmd.program, cmd.args);
}

OperationResult VirtualEnv::installRequirements(PrivilegedRunner& runner,
                                                const QString& requirementsFile) const
{
    const CommandLine cmd = installRequirementsCommand(requirementsFile);
    LOG_INFO(biInstall, "Installing requirements from %s", qUtf8Printable(requirementsFile));
    return runner.run(cmd.program, cmd.args);
}

} // namespace bi
