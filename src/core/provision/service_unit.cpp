#include "core/provision/service_unit.h"
#include "core/provision/virtual_env.h"
#include "core/shared/logging.h"

#include <QRegularExpression>
#include <QTextStream>

namespace bi {

namespace {

QString appendTarget(const QString& path)
{
    return QStringLiteral("append:%1").arg(path);
}

} // namespace

ServiceUnit ServiceUnit::fromSettings(const InstallSettings& settings)
{
    const VirtualEnv venv(settings.resolvedVenvDir(), settings.pythonInterpreter);

    ServiceUnit unit;
    unit.description = settings.description;
    unit.execStart = QStringLiteral("%1 %2").arg(venv.interpreter(), settings.installedScriptPath());
    unit.workingDirectory = settings.resolvedAppDir();
    unit.user = settings.runAsUser;
    unit.group = settings.runAsGroup;
    unit.standardOutput = appendTarget(settings.logFile);
    unit.standardError = appendTarget(settings.logFile);
    unit.environment = {QStringLiteral("PYTHONUNBUFFERED=1")};
    return unit;
}

QString ServiceUnit::render() const
{
    QString text;
    QTextStream out(&text);

    out << "[Unit]\n";
    out << "Description=" << description << '\n';
    out << "After=" << after << '\n';
    out << '\n';

    out << "[Service]\n";
    out << "ExecStart=" << execStart << '\n';
    out << "WorkingDirectory=" << workingDirectory << '\n';
    out << "Restart=" << restart << '\n';
    out << "User=" << user << '\n';
    out << "Group=" << group << '\n';
    out << "StandardOutput=" << standardOutput << '\n';
    out << "StandardError=" << standardError << '\n';
    for (const QString& env : environment) {
        out << "Environment=" << env << '\n';
    }
    out << '\n';

    out << "[Install]\n";
    out << "WantedBy=" << wantedBy << '\n';

    out.flush();
    return text;
}

std::optional<ServiceUnit> ServiceUnit::parse(const QString& text)
{
    ServiceUnit unit;
    unit.after.clear();
    unit.restart.clear();
    unit.wantedBy.clear();

    bool sawService = false;
    QString section;

    const QStringList lines = text.split(QLatin1Char('\n'));
    for (const QString& rawLine : lines) {
        const QString line = rawLine.trimmed();
        if (line.isEmpty() || line.startsWith(QLatin1Char('#'))
            || line.startsWith(QLatin1Char(';'))) {
            continue;
        }

        if (line.startsWith(QLatin1Char('[')) && line.endsWith(QLatin1Char(']'))) {
            section = line.mid(1, line.size() - 2).trimmed();
            if (section == QLatin1String("Service")) {
                sawService = true;
            }
            continue;
        }

        const int eq = line.indexOf(QLatin1Char('='));
        if (eq <= 0) {
            LOG_DEBUG(biUnit, "Skipping malformed unit line: %s", qUtf8Printable(line));
            continue;
        }
        const QString key = line.left(eq).trimmed();
        const QString value = line.mid(eq + 1).trimmed();

        if (section == QLatin1String("Unit")) {
            if (key == QLatin1String("Description")) {
                unit.description = value;
            } else if (key == QLatin1String("After")) {
                unit.after = value;
            }
        } else if (section == QLatin1String("Service")) {
            if (key == QLatin1String("ExecStart")) {
                unit.execStart = value;
            } else if (key == QLatin1String("WorkingDirectory")) {
                unit.workingDirectory = value;
            } else if (key == QLatin1String("Restart")) {
                unit.restart = value;
            } else if (key == QLatin1String("User")) {
                unit.user = value;
            } else if (key == QLatin1String("Group")) {
                unit.group = value;
            } else if (key == QLatin1String("StandardOutput")) {
                unit.standardOutput = value;
            } else if (key == QLatin1String("StandardError")) {
                unit.standardError = value;
            } else if (key == QLatin1String("Environment")) {
                unit.environment.append(value);
            }
        } else if (section == QLatin1String("Install")) {
            if (key == QLatin1String("WantedBy")) {
                unit.wantedBy = value;
            }
        }
    }

    if (!sawService || unit.execStart.isEmpty()) {
        return std::nullopt;
    }
    return unit;
}

QString ServiceUnit::execStartInterpreter() const
{
    static const QRegularExpression kWhitespace(QStringLiteral("\\s+"));
    const QStringList tokens = execStart.trimmed().split(kWhitespace, Qt::SkipEmptyParts);
    if (tokens.isEmpty()) {
        return QString();
    }

    QString program = tokens.first();
    while (!program.isEmpty() && QStringLiteral("-@:+!").contains(program.front())) {
        program.remove(0, 1);
    }
    return program;
}

} // namespace bi
