#include "core/shared/logging.h"

Q_LOGGING_CATEGORY(biCore, "bi.core", QtInfoMsg)
Q_LOGGING_CATEGORY(biExec, "bi.exec", QtInfoMsg)
Q_LOGGING_CATEGORY(biUnit, "bi.unit", QtInfoMsg)
Q_LOGGING_CATEGORY(biInstall, "bi.install", QtInfoMsg)

namespace bi {

void configureLogging(bool verbose)
{
    qSetMessagePattern(QStringLiteral(
        "[%{time yyyy-MM-dd hh:mm:ss}] [%{if-debug}DEBUG%{endif}%{if-info}INFO%{endif}"
        "%{if-warning}WARN%{endif}%{if-critical}ERROR%{endif}%{if-fatal}FATAL%{endif}] "
        "%{category}: %{message}"));

    if (verbose) {
        QLoggingCategory::setFilterRules(QStringLiteral("bi.*.debug=true"));
    }
}

} // namespace bi
