#include <QtTest/QtTest>

#include "app/cli.h"
#include "core/provision/service_unit.h"
#include "core/shared/install_settings_manager.h"
#include "Support/fake_privileged_runner.h"

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include <memory>

namespace {

class ScopedEnvVar {
public:
    ScopedEnvVar(const char* key, const QByteArray& value)
        : m_key(key)
        , m_hadOriginal(qEnvironmentVariableIsSet(key))
        , m_original(qgetenv(key))
    {
        qputenv(m_key, value);
    }

    ~ScopedEnvVar()
    {
        if (m_hadOriginal) {
            qputenv(m_key, m_original);
        } else {
            qunsetenv(m_key);
        }
    }

private:
    const char* m_key;
    bool m_hadOriginal = false;
    QByteArray m_original;
};

QString writeFixture(const QTemporaryDir& dir, const QString& name, const QByteArray& bytes)
{
    const QString path = QDir(dir.path()).filePath(name);
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return QString();
    }
    file.write(bytes);
    file.close();
    return path;
}

// Parses argv (without the program name) and resolves settings against it.
bool resolveFrom(const QStringList& args, bi::InstallSettings* settings, QString* error)
{
    QCommandLineParser parser;
    const bi::CliOptions options;
    bi::addCliOptions(parser, options);
    if (!parser.parse(QStringList{QStringLiteral("billboard-installer")} + args)) {
        *error = parser.errorText();
        return false;
    }
    return bi::resolveSettings(parser, options, settings, error);
}

} // namespace

class TestCli : public QObject {
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void testDefaultsWithoutConfigFile();
    void testDefaultConfigFileOverridesDefaults();
    void testCommandLineOverridesConfigFile();
    void testMissingExplicitConfigFails();
    void testUnknownElevationFails();
    void testResolveCommand();
    void testInstallPrintsConfirmation();
    void testInstallFailureNamesStep();
    void testRenderUnitPrintsTemplate();
    void testStatusExitCodeFollowsServiceState();

private:
    std::unique_ptr<QTemporaryDir> m_dir;
    std::unique_ptr<ScopedEnvVar> m_configEnv;
    QString m_configPath;
};

void TestCli::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
    m_configPath = QDir(m_dir->path()).filePath(QStringLiteral("settings.json"));
    m_configEnv = std::make_unique<ScopedEnvVar>("BILLBOARD_INSTALLER_CONFIG",
                                                 m_configPath.toUtf8());
}

void TestCli::cleanup()
{
    m_configEnv.reset();
    m_dir.reset();
}

void TestCli::testDefaultsWithoutConfigFile()
{
    bi::InstallSettings settings;
    QString error;
    QVERIFY2(resolveFrom({}, &settings, &error), qPrintable(error));

    const bi::InstallSettings defaults;
    QCOMPARE(settings.serviceName, defaults.serviceName);
    QCOMPARE(settings.resolvedAppDir(), QStringLiteral("/opt/billboard"));
    QCOMPARE(settings.runAsUser, QStringLiteral("pi"));
    QCOMPARE(settings.elevation, bi::Elevation::Auto);
}

void TestCli::testDefaultConfigFileOverridesDefaults()
{
    bi::InstallSettings stored;
    stored.serviceName = QStringLiteral("lobby");
    stored.runAsUser = QStringLiteral("kiosk");
    stored.elevation = bi::Elevation::None;
    QVERIFY(bi::InstallSettingsManager::save(stored, m_configPath));

    bi::InstallSettings settings;
    QString error;
    QVERIFY2(resolveFrom({}, &settings, &error), qPrintable(error));
    QCOMPARE(settings.serviceName, QStringLiteral("lobby"));
    QCOMPARE(settings.runAsUser, QStringLiteral("kiosk"));
    QCOMPARE(settings.runAsGroup, QStringLiteral("pi"));
    QCOMPARE(settings.elevation, bi::Elevation::None);
}

void TestCli::testCommandLineOverridesConfigFile()
{
    const QString explicitPath = QDir(m_dir->path()).filePath(QStringLiteral("lobby.json"));
    bi::InstallSettings stored;
    stored.serviceName = QStringLiteral("lobby");
    stored.runAsUser = QStringLiteral("kiosk");
    stored.appDir = QStringLiteral("/srv/lobby");
    QVERIFY(bi::InstallSettingsManager::save(stored, explicitPath));

    bi::InstallSettings settings;
    QString error;
    QVERIFY2(resolveFrom({QStringLiteral("--config"), explicitPath,
                          QStringLiteral("--user"), QStringLiteral("signage"),
                          QStringLiteral("--elevation"), QStringLiteral("sudo")},
                         &settings, &error),
             qPrintable(error));

    QCOMPARE(settings.serviceName, QStringLiteral("lobby"));
    QCOMPARE(settings.resolvedAppDir(), QStringLiteral("/srv/lobby"));
    QCOMPARE(settings.runAsUser, QStringLiteral("signage"));
    QCOMPARE(settings.elevation, bi::Elevation::Sudo);
}

void TestCli::testMissingExplicitConfigFails()
{
    bi::InstallSettings settings;
    QString error;
    const QString absent = QDir(m_dir->path()).filePath(QStringLiteral("absent.json"));
    QVERIFY(!resolveFrom({QStringLiteral("--config"), absent}, &settings, &error));
    QVERIFY(error.contains(QStringLiteral("does not exist")));
    QVERIFY(error.contains(absent));
}

void TestCli::testUnknownElevationFails()
{
    bi::InstallSettings settings;
    QString error;
    QVERIFY(!resolveFrom({QStringLiteral("--elevation"), QStringLiteral("doas")},
                         &settings, &error));
    QCOMPARE(error, QStringLiteral("Unknown elevation mode: doas"));
}

void TestCli::testResolveCommand()
{
    QString command;
    QString error;
    QVERIFY(bi::resolveCommand({}, &command, &error));
    QCOMPARE(command, QStringLiteral("install"));
    QVERIFY(bi::resolveCommand({QStringLiteral("status")}, &command, &error));
    QCOMPARE(command, QStringLiteral("status"));

    QVERIFY(!bi::resolveCommand({QStringLiteral("uninstall")}, &command, &error));
    QCOMPARE(error, QStringLiteral("Unknown command: uninstall"));
    QVERIFY(!bi::resolveCommand({QStringLiteral("install"), QStringLiteral("status")},
                                &command, &error));
    QCOMPARE(error, QStringLiteral("Too many arguments"));
}

void TestCli::testInstallPrintsConfirmation()
{
    bi::InstallSettings settings;
    settings.sourceScript = writeFixture(*m_dir, QStringLiteral("billboard.py"),
                                         QByteArray("print('billboard')\n"));
    settings.requirementsFile = writeFixture(*m_dir, QStringLiteral("requirements.txt"),
                                             QByteArray("Pillow\n"));
    settings.appDir = QDir(m_dir->path()).filePath(QStringLiteral("opt/billboard"));
    settings.unitDir = QDir(m_dir->path()).filePath(QStringLiteral("systemd"));
    QVERIFY(QDir().mkpath(settings.unitDir));

    bi::test::FakePrivilegedRunner runner;
    QString outText;
    QString errText;
    QTextStream out(&outText);
    QTextStream err(&errText);

    QCOMPARE(bi::runInstall(settings, runner, out, err), bi::kExitOk);
    QCOMPARE(outText, QStringLiteral("billboard installed and started.\n"));
    QVERIFY(errText.isEmpty());
}

void TestCli::testInstallFailureNamesStep()
{
    bi::InstallSettings settings;
    settings.sourceScript = QDir(m_dir->path()).filePath(QStringLiteral("missing.py"));

    bi::test::FakePrivilegedRunner runner;
    QString outText;
    QString errText;
    QTextStream out(&outText);
    QTextStream err(&errText);

    QCOMPARE(bi::runInstall(settings, runner, out, err), bi::kExitFailed);
    QVERIFY(outText.isEmpty());
    QVERIFY(errText.startsWith(QStringLiteral("Install failed at check-inputs: ")));
    QVERIFY(errText.contains(QStringLiteral("missing.py")));
    QVERIFY(runner.calls.isEmpty());
}

void TestCli::testRenderUnitPrintsTemplate()
{
    bi::InstallSettings settings;
    QString outText;
    QTextStream out(&outText);

    QCOMPARE(bi::runRenderUnit(settings, out), bi::kExitOk);
    QVERIFY(outText.contains(
        QStringLiteral("ExecStart=/opt/billboard/venv/bin/python /opt/billboard/billboard.py")));
    QVERIFY(outText.contains(QStringLiteral("User=pi")));
}

void TestCli::testStatusExitCodeFollowsServiceState()
{
    bi::InstallSettings settings;
    settings.unitDir = m_dir->path();

    bi::test::FakePrivilegedRunner runner;
    QString outText;
    QTextStream out(&outText);

    QCOMPARE(bi::runStatus(settings, runner, out), bi::kExitFailed);
    QVERIFY(outText.contains(QStringLiteral("(missing)")));
    QVERIFY(outText.contains(QStringLiteral("active: inactive")));

    writeFixture(*m_dir, QStringLiteral("billboard.service"),
                 bi::ServiceUnit::fromSettings(settings).render().toUtf8());
    runner.enabledUnits.insert(QStringLiteral("billboard"));
    runner.activeUnits.insert(QStringLiteral("billboard"));

    QString runningText;
    QTextStream running(&runningText);
    QCOMPARE(bi::runStatus(settings, runner, running), bi::kExitOk);
    QVERIFY(runningText.contains(QStringLiteral("exec-start: /opt/billboard/venv/bin/python")));
    QVERIFY(runningText.contains(QStringLiteral("enabled: enabled")));
    QVERIFY(runningText.contains(QStringLiteral("active: active")));
}

QTEST_MAIN(TestCli)
#include "test_cli.moc"
