#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(biCore)
Q_DECLARE_LOGGING_CATEGORY(biExec)
Q_DECLARE_LOGGING_CATEGORY(biUnit)
Q_DECLARE_LOGGING_CATEGORY(biInstall)

#define LOG_DEBUG(cat, ...) qCDebug(cat, __VA_ARGS__)
#define LOG_INFO(cat, ...)  qCInfo(cat, __VA_ARGS__)
#define LOG_WARN(cat, ...)  qCWarning(cat, __VA_ARGS__)
#define LOG_ERROR(cat, ...) qCCritical(cat, __VA_ARGS__)

namespace bi {

// Installs the message pattern used by the CLI and enables debug output for
// every bi.* category when verbose is set.
void configureLogging(bool verbose);

} // namespace bi
