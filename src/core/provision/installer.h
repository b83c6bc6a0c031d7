#pragma once

#include "core/exec/privileged_runner.h"
#include "core/shared/install_settings.h"

#include <QString>
#include <QVector>

#include <optional>

namespace bi {

enum class InstallStep {
    CheckInputs,
    PrepareDirectory,
    CopyScript,
    CreateEnvironment,
    InstallDependencies,
    WriteUnit,
    ActivateService,
};

QString installStepToString(InstallStep step);

struct InstallReport {
    bool success = false;
    std::optional<InstallStep> failedStep;
    QString message;
    QVector<InstallStep> completedSteps;
};

// Provisions the daemon as a systemd service in one forward pass. The first
// failing step stops the run; nothing is rolled back, so a rerun after fixing
// the cause converges on the same end state.
class Installer {
public:
    Installer(const InstallSettings& settings, PrivilegedRunner& runner);

    InstallReport run();

    // The unit text this installer writes.
    QString renderUnit() const;

    QString resolvedScriptPath() const;
    QString resolvedRequirementsPath() const;

private:
    OperationResult checkInputs() const;
    OperationResult prepareDirectory();
    OperationResult copyScript();
    OperationResult createEnvironment();
    OperationResult installDependencies();
    OperationResult writeUnit();
    OperationResult activateService();

    OperationResult runStep(InstallStep step);

    InstallSettings m_settings;
    PrivilegedRunner& m_runner;
};

} // namespace bi
