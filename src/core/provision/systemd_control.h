#pragma once

#include "core/exec/privileged_runner.h"

#include <QString>

namespace bi {

struct ServiceStatus {
    QString enabledState;  // is-enabled output, e.g. "enabled", "disabled"
    QString activeState;   // is-active output, e.g. "active", "failed"

    bool isEnabled() const { return enabledState == QLatin1String("enabled"); }
    bool isActive() const { return activeState == QLatin1String("active"); }
};

// systemctl front end. Mutating calls go through the runner's privileged
// path; status queries run unprivileged.
class SystemdControl {
public:
    explicit SystemdControl(PrivilegedRunner& runner);

    OperationResult daemonReexec();
    OperationResult daemonReload();
    OperationResult enable(const QString& unitName);
    OperationResult start(const QString& unitName);

    ServiceStatus status(const QString& unitName);

private:
    OperationResult systemctl(const QStringList& args);
    QString queryState(const QString& verb, const QString& unitName);

    PrivilegedRunner& m_runner;
};

} // namespace bi
