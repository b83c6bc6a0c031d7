#include "core/exec/privileged_runner.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QProcess>
#include <QSaveFile>

#include <sys/types.h>
#include <unistd.h>

namespace bi {

namespace {

constexpr int kStartTimeoutMs = 30000;

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
    result.success = false;
    result.message = message;
    return result;
}

QString describeCommand(const QString& program, const QStringList& args)
{
    QStringList parts{program};
    parts.append(args);
    return parts.join(QLatin1Char(' '));
}

class DirectRunner final : public PrivilegedRunner {
public:
    explicit DirectRunner(int timeoutMs)
        : m_timeoutMs(timeoutMs)
    {
    }

    OperationResult makeDirectory(const QString& path) override
    {
        QDir dir(path);
        if (dir.exists()) {
            return ok();
        }
        if (!dir.mkpath(QStringLiteral("."))) {
            return failure(QStringLiteral("Failed to create directory: %1").arg(path));
        }
        return ok();
    }

    OperationResult copyFile(const QString& source, const QString& destination) override
    {
        QFile input(source);
        if (!input.open(QIODevice::ReadOnly)) {
            return failure(QStringLiteral("Cannot read %1: %2").arg(source, input.errorString()));
        }
        const QByteArray contents = input.readAll();
        const QFileDevice::Permissions permissions = input.permissions();
        input.close();

        OperationResult result = writeFile(destination, contents);
        if (!result.success) {
            return result;
        }
        if (!QFile::setPermissions(destination, permissions)) {
            LOG_WARN(biExec, "Could not copy permissions onto %s", qUtf8Printable(destination));
        }
        return result;
    }

    OperationResult writeFile(const QString& path, const QByteArray& contents) override
    {
        QSaveFile file(path);
        if (!file.open(QIODevice::WriteOnly)) {
            return failure(QStringLiteral("Cannot open %1 for writing: %2")
                               .arg(path, file.errorString()));
        }
        if (file.write(contents) != contents.size()) {
            const QString error = file.errorString();
            file.cancelWriting();
            return failure(QStringLiteral("Failed to write %1: %2").arg(path, error));
        }
        if (!file.commit()) {
            return failure(QStringLiteral("Failed to commit %1: %2").arg(path, file.errorString()));
        }
        return ok();
    }

    OperationResult run(const QString& program, const QStringList& args) override
    {
        return runProcess(program, args, m_timeoutMs);
    }

    OperationResult query(const QString& program, const QStringList& args) override
    {
        return runProcess(program, args, m_timeoutMs);
    }

    QString name() const override { return QStringLiteral("direct"); }

private:
    int m_timeoutMs;
};

// Every privileged operation goes through sudo, as an operator would type it.
class SudoRunner final : public PrivilegedRunner {
public:
    SudoRunner(int timeoutMs, const QString& sudoProgram)
        : m_timeoutMs(timeoutMs)
        , m_sudoProgram(sudoProgram)
    {
    }

    OperationResult makeDirectory(const QString& path) override
    {
        return sudo({QStringLiteral("mkdir"), QStringLiteral("-p"), path});
    }

    OperationResult copyFile(const QString& source, const QString& destination) override
    {
        return sudo({QStringLiteral("cp"), QStringLiteral("-f"), source, destination});
    }

    OperationResult writeFile(const QString& path, const QByteArray& contents) override
    {
        return runProcess(m_sudoProgram,
                          {QStringLiteral("tee"), path},
                          m_timeoutMs,
                          contents);
    }

    OperationResult run(const QString& program, const QStringList& args) override
    {
        QStringList sudoArgs{program};
        sudoArgs.append(args);
        return sudo(sudoArgs);
    }

    OperationResult query(const QString& program, const QStringList& args) override
    {
        return runProcess(program, args, m_timeoutMs);
    }

    QString name() const override { return QStringLiteral("sudo"); }

private:
    OperationResult sudo(const QStringList& args)
    {
        return runProcess(m_sudoProgram, args, m_timeoutMs);
    }

    int m_timeoutMs;
    QString m_sudoProgram;
};

} // namespace

bool runningAsRoot()
{
    return ::geteuid() == 0;
}

OperationResult runProcess(const QString& program,
                           const QStringList& args,
                           int timeoutMs,
                           const QByteArray& stdinData)
{
    const QString commandLine = describeCommand(program, args);
    LOG_DEBUG(biExec, "exec: %s", qUtf8Printable(commandLine));

    QProcess process;
    process.start(program, args);

    if (!process.waitForStarted(kStartTimeoutMs)) {
        return failure(QStringLiteral("Failed to start process: %1 (%2)")
                           .arg(program, process.errorString()));
    }

    if (!stdinData.isEmpty()) {
        process.write(stdinData);
    }
    process.closeWriteChannel();

    if (!process.waitForFinished(timeoutMs)) {
        process.kill();
        process.waitForFinished();
        return failure(QStringLiteral("Timed out after %1 ms: %2").arg(timeoutMs).arg(commandLine));
    }

    OperationResult result;
    result.exitCode = process.exitCode();
    result.standardOutput = QString::fromUtf8(process.readAllStandardOutput());
    result.standardError = QString::fromUtf8(process.readAllStandardError());

    if (!result.standardOutput.isEmpty()) {
        LOG_DEBUG(biExec, "%s", qUtf8Printable(result.standardOutput.trimmed()));
    }

    if (process.exitStatus() != QProcess::NormalExit) {
        result.success = false;
        result.message = QStringLiteral("%1 crashed").arg(commandLine);
        return result;
    }

    if (result.exitCode != 0) {
        const QString stderrText = result.standardError.trimmed();
        result.success = false;
        result.message = stderrText.isEmpty()
            ? QStringLiteral("%1 exited with code %2").arg(commandLine).arg(result.exitCode)
            : QStringLiteral("%1 exited with code %2: %3")
                  .arg(commandLine)
                  .arg(result.exitCode)
                  .arg(stderrText.left(2000));
        return result;
    }

    result.success = true;
    return result;
}

std::unique_ptr<PrivilegedRunner> PrivilegedRunner::create(Elevation elevation, int timeoutMs)
{
    switch (elevation) {
    case Elevation::None:
        return std::make_unique<DirectRunner>(timeoutMs);
    case Elevation::Sudo:
        return createSudo(timeoutMs);
    case Elevation::Auto:
        break;
    }

    if (runningAsRoot()) {
        return std::make_unique<DirectRunner>(timeoutMs);
    }
    return createSudo(timeoutMs);
}

std::unique_ptr<PrivilegedRunner> PrivilegedRunner::createSudo(int timeoutMs,
                                                               const QString& sudoProgram)
{
    return std::make_unique<SudoRunner>(timeoutMs, sudoProgram);
}

} // namespace bi
