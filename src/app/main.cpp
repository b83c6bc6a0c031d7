#include "app/cli.h"
#include "core/shared/logging.h"

#include <QCoreApplication>
#include <QTextStream>

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("billboard-installer"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Provision the billboard daemon as a systemd service."));
    parser.addHelpOption();
    parser.addVersionOption();

    const bi::CliOptions options;
    bi::addCliOptions(parser, options);
    parser.process(app);

    bi::configureLogging(parser.isSet(options.verbose));

    QTextStream out(stdout);
    QTextStream err(stderr);

    QString command;
    QString error;
    if (!bi::resolveCommand(parser.positionalArguments(), &command, &error)) {
        err << error << Qt::endl;
        return bi::kExitUsage;
    }

    bi::InstallSettings settings;
    if (!bi::resolveSettings(parser, options, &settings, &error)) {
        LOG_ERROR(biCore, "%s", qUtf8Printable(error));
        return bi::kExitUsage;
    }

    if (command == QLatin1String("render-unit")) {
        return bi::runRenderUnit(settings, out);
    }
    if (command == QLatin1String("status")) {
        auto runner = bi::PrivilegedRunner::create(bi::Elevation::None);
        return bi::runStatus(settings, *runner, out);
    }

    auto runner = bi::PrivilegedRunner::create(settings.elevation, settings.commandTimeoutMs);
    return bi::runInstall(settings, *runner, out, err);
}
