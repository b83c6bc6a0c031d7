#pragma once

#include "core/exec/privileged_runner.h"

#include <QString>
#include <QStringList>

namespace bi {

struct CommandLine {
    QString program;
    QStringList args;
};

// Layout of a Python venv and the commands that build it. The venv's own
// interpreter is invoked directly, so no activation script is needed.
class VirtualEnv {
public:
    VirtualEnv(const QString& root, const QString& baseInterpreter);

    QString root() const { return m_root; }
    QString binDir() const;
    QString interpreter() const;

    // True if path resolves to a location inside the venv root.
    bool containsPath(const QString& path) const;

    CommandLine createCommand() const;
    CommandLine upgradePipCommand() const;
    CommandLine installRequirementsCommand(const QString& requirementsFile) const;

    OperationResult create(PrivilegedRunner& runner) const;
    OperationResult upgradePip(PrivilegedRunner& runner) const;
    OperationResult installRequirements(PrivilegedRunner& runner,
                                        const QString& requirementsFile) const;

private:
    QString m_root;
    QString m_baseInterpreter;
};

} // namespace bi
