#pragma once

#include "backup_orchestrator.hpp"
#include "command_executor.hpp"
#include "config.hpp"
#include "connectivity_probe.hpp"
#include "reset_lifecycle.hpp"
#include "session_manager.hpp"

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

struct Completed {};

struct CancelledWithCleanup {
    // Nothing had started yet.
    bool blank = false;
    // The device was already modified; the user should be told.
    bool notify = false;
};

struct Failed {
    std::string cause;
};

using RunOutcome = std::variant<Completed, CancelledWithCleanup, Failed>;

struct InstallPlan {
    std::vector<BackupComponent> backupComponents;
    std::string backupParent = ".";
    bool factoryReset = false;
    std::optional<std::string> archivePath;
    bool runBootstrap = false;
    bool runFeatureScript = false;
    // Clone and install the repository at this branch.
    std::optional<std::string> branch;
    std::vector<BackupComponent> restoreComponents;
    // Defaults to the bundle written by this run's backup step.
    std::optional<std::string> restoreBundle;
};

class DeviceInstaller {
public:
    using CancelCheck = std::function<bool()>;

private:
    SessionManager& sessions;
    CommandExecutor& executor;
    ResetLifecycleController& reset;
    BackupRestoreOrchestrator& orchestrator;
    FileSystem& local;
    InstallerConfig config;
    CancelCheck cancelled;
    ConnectivityProbe::PortCheck portCheck;

    std::optional<std::string> lastBundle;
    std::map<std::string, bool> installSummary;

public:
    DeviceInstaller(SessionManager& sessions, CommandExecutor& executor, ResetLifecycleController& reset,
                    BackupRestoreOrchestrator& orchestrator, FileSystem& local, InstallerConfig config = {},
                    CancelCheck cancelled = {}, ConnectivityProbe::PortCheck portCheck = {});

    // Runs every step the plan selects, in order. Never throws.
    RunOutcome run(const InstallPlan& plan);

    void uploadArchive(const std::string& archivePath);
    void runBootstrapScript();
    void runFeatureScript();
    // `connectivity` is advisory: an unreachable host only produces a warning.
    void cloneAndInstall(const std::string& branch, const ConnectivityStatus& connectivity);

    const std::optional<std::string>& getLastBundle() const { return lastBundle; }
    // Installer name to success, as reported by install.sh.
    const std::map<std::string, bool>& getInstallSummary() const { return installSummary; }
};

const char* describeOutcome(const RunOutcome& outcome);
