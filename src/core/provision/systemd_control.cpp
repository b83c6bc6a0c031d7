#include "core/provision/systemd_control.h"
#include "core/shared/logging.h"

namespace bi {

namespace {

const QString kSystemctl = QStringLiteral("systemctl");

} // namespace

SystemdControl::SystemdControl(PrivilegedRunner& runner)
    : m_runner(runner)
{
}

OperationResult SystemdControl::daemonReexec()
{
    return systemctl({QStringLiteral("daemon-reexec")});
}

OperationResult SystemdControl::daemonReload()
{
    return systemctl({QStringLiteral("daemon-reload")});
}

OperationResult SystemdControl::enable(const QString& unitName)
{
    return systemctl({QStringLiteral("enable"), unitName});
}

OperationResult SystemdControl::start(const QString& unitName)
{
    return systemctl({QStringLiteral("start"), unitName});
}

ServiceStatus SystemdControl::status(const QString& unitName)
{
    ServiceStatus status;
    status.enabledState = queryState(QStringLiteral("is-enabled"), unitName);
    status.activeState = queryState(QStringLiteral("is-active"), unitName);
    return status;
}

OperationResult SystemdControl::systemctl(const QStringList& args)
{
    LOG_DEBUG(biInstall, "systemctl %s", qUtf8Printable(args.join(QLatin1Char(' '))));
    return m_runner.run(kSystemctl, args);
}

QString SystemdControl::queryState(const QString& verb, const QString& unitName)
{
    // is-enabled/is-active exit non-zero for "disabled"/"inactive" but still
    // print the state, so stdout is authoritative.
    const OperationResult result = m_runner.query(kSystemctl, {verb, unitName});
    const QString state = result.standardOutput.trimmed();
    if (!state.isEmpty()) {
        return state;
    }
    if (!result.success) {
        LOG_WARN(biInstall, "systemctl %s %s failed: %s",
                 qUtf8Printable(verb), qUtf8Printable(unitName), qUtf8Printable(result.message));
    }
    return QStringLiteral("unknown");
}

} // namespace bi
