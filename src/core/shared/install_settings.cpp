#include "core/shared/install_settings.h"

#include <QDir>
#include <QFileInfo>

namespace bi {

QString elevationToString(Elevation elevation)
{
    switch (elevation) {
    case Elevation::Auto:
        return QStringLiteral("auto");
    case Elevation::Sudo:
        return QStringLiteral("sudo");
    case Elevation::None:
        return QStringLiteral("none");
    }
    return QStringLiteral("auto");
}

std::optional<Elevation> elevationFromString(const QString& value)
{
    const QString normalized = value.trimmed().toLower();
    if (normalized == QLatin1String("auto")) {
        return Elevation::Auto;
    }
    if (normalized == QLatin1String("sudo")) {
        return Elevation::Sudo;
    }
    if (normalized == QLatin1String("none")) {
        return Elevation::None;
    }
    return std::nullopt;
}

QString InstallSettings::resolvedAppDir() const
{
    if (!appDir.isEmpty()) {
        return QDir::cleanPath(appDir);
    }
    return QStringLiteral("/opt/%1").arg(serviceName);
}

QString InstallSettings::resolvedVenvDir() const
{
    if (!venvDir.isEmpty()) {
        return QDir::cleanPath(venvDir);
    }
    return QDir(resolvedAppDir()).filePath(QStringLiteral("venv"));
}

QString InstallSettings::unitPath() const
{
    return QDir(QDir::cleanPath(unitDir)).filePath(serviceName + QStringLiteral(".service"));
}

QString InstallSettings::installedScriptPath() const
{
    return QDir(resolvedAppDir()).filePath(QFileInfo(sourceScript).fileName());
}

} // namespace bi
