#pragma once

#include "core/shared/install_settings.h"

#include <QByteArray>
#include <QString>
#include <QStringList>

#include <memory>

namespace bi {

struct OperationResult {
    bool success = false;
    int exitCode = -1;
    QString message;
    QString standardOutput;
    QString standardError;
};

// Performs the operations that need root on the target host. The installer
// only talks to the host through this interface.
class PrivilegedRunner {
public:
    virtual ~PrivilegedRunner() = default;

    // mkdir -p semantics: succeeds when the directory already exists.
    virtual OperationResult makeDirectory(const QString& path) = 0;
    // Replaces destination if it exists.
    virtual OperationResult copyFile(const QString& source, const QString& destination) = 0;
    // Replaces path with contents.
    virtual OperationResult writeFile(const QString& path, const QByteArray& contents) = 0;
    // Runs program with elevated privileges and waits for it to finish.
    virtual OperationResult run(const QString& program, const QStringList& args) = 0;
    // Runs program as the invoking user, for read-only queries.
    virtual OperationResult query(const QString& program, const QStringList& args) = 0;

    virtual QString name() const = 0;

    static std::unique_ptr<PrivilegedRunner> create(Elevation elevation,
                                                    int timeoutMs = kDefaultTimeoutMs);

    // Runner that prefixes every privileged operation with sudoProgram.
    static std::unique_ptr<PrivilegedRunner> createSudo(
        int timeoutMs = kDefaultTimeoutMs,
        const QString& sudoProgram = QStringLiteral("sudo"));

    static constexpr int kDefaultTimeoutMs = 30 * 60 * 1000;
};

bool runningAsRoot();

// Runs a process to completion, optionally feeding stdinData. Non-zero exit,
// crash, start failure and timeout all produce success == false.
OperationResult runProcess(const QString& program,
                           const QStringList& args,
                           int timeoutMs,
                           const QByteArray& stdinData = QByteArray());

} // namespace bi
