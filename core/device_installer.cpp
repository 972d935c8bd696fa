#include "device_installer.hpp"

#include "errors.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <fstream>

#include <spdlog/spdlog.h>

namespace {

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(" \t");
    return text.substr(first, last - first + 1);
}

struct Step {
    std::string name;
    bool modifiesDevice;
    std::function<void()> action;
};

} // namespace

const char* describeOutcome(const RunOutcome& outcome) {
    if (std::holds_alternative<Completed>(outcome)) {
        return "completed";
    }
    if (std::holds_alternative<CancelledWithCleanup>(outcome)) {
        return "cancelled";
    }
    return "failed";
}

DeviceInstaller::DeviceInstaller(SessionManager& sessions, CommandExecutor& executor, ResetLifecycleController& reset,
                                 BackupRestoreOrchestrator& orchestrator, FileSystem& local, InstallerConfig config,
                                 CancelCheck cancelled, ConnectivityProbe::PortCheck portCheck)
    : sessions(sessions), executor(executor), reset(reset), orchestrator(orchestrator), local(local),
      config(std::move(config)), cancelled(std::move(cancelled)), portCheck(std::move(portCheck)) {
    if (!this->cancelled) {
        this->cancelled = []() { return false; };
    }
}

RunOutcome DeviceInstaller::run(const InstallPlan& plan) {
    const auto start = std::chrono::steady_clock::now();
    spdlog::info("[Install] Starting installation for {}", sessions.getConfig().host);

    ConnectivityProbe probe(config.auxiliaryHost, config.auxiliaryPort, config.auxiliaryProbeTimeout, portCheck);
    if (plan.branch) {
        probe.start();
    }

    std::vector<Step> steps;
    steps.push_back({"Setting up SSH access", false, [this]() { executor.ensureAccess(); }});
    if (!plan.backupComponents.empty()) {
        steps.push_back({"Backing up device data", false, [this, &plan]() {
            const std::string bundle = BackupRestoreOrchestrator::createBundleDirectory(
                local, plan.backupParent, sessions.getConfig().host);
            lastBundle = bundle;
            orchestrator.backup(bundle, plan.backupComponents);
        }});
    }
    if (plan.factoryReset) {
        steps.push_back({"Factory resetting device", true, [this]() { reset.resetDevice(); }});
    }
    if (plan.archivePath) {
        steps.push_back({"Uploading bootstrap files", true, [this, &plan]() { uploadArchive(*plan.archivePath); }});
    }
    if (plan.runBootstrap) {
        steps.push_back({"Running bootstrap script", true, [this]() { runBootstrapScript(); }});
    }
    if (plan.runFeatureScript) {
        steps.push_back({"Running feature script (10-20 min)", true, [this]() { runFeatureScript(); }});
    }
    if (plan.branch) {
        steps.push_back({"Cloning and installing repository", true, [this, &plan, &probe]() {
            cloneAndInstall(*plan.branch, probe.await(config.auxiliaryProbeTimeout));
        }});
    }
    if (!plan.restoreComponents.empty()) {
        steps.push_back({"Restoring device data", true, [this, &plan]() {
            const auto bundle = plan.restoreBundle ? plan.restoreBundle : lastBundle;
            if (!bundle) {
                throw FileNotFoundError("No backup bundle to restore from");
            }
            try {
                orchestrator.restore(*bundle, plan.restoreComponents);
            }
            catch (const ProvisionError& e) {
                spdlog::error("[Install] Restore failed: {}", e.what());
            }
        }});
    }

    bool started = false;
    bool deviceModified = false;
    RunOutcome outcome = Completed{};

    try {
        for (std::size_t i = 0; i < steps.size(); ++i) {
            if (cancelled()) {
                spdlog::warn("[Install] Cancelled before step {}", steps[i].name);
                outcome = CancelledWithCleanup{!started, deviceModified};
                break;
            }
            started = true;
            deviceModified = deviceModified || steps[i].modifiesDevice;
            spdlog::info("[Install] Step {}/{}: {}", i + 1, steps.size(), steps[i].name);
            steps[i].action();
        }
    }
    catch (const std::exception& e) {
        spdlog::error("[Install] Installation failed: {}", e.what());
        outcome = Failed{e.what()};
    }
    sessions.close();

    const auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - start);
    spdlog::info("[Install] Installation {} after {}m {}s", describeOutcome(outcome),
        elapsed.count() / 60, elapsed.count() % 60);
    return outcome;
}

void DeviceInstaller::uploadArchive(const std::string& archivePath) {
    const auto info = local.stat(archivePath);
    if (!info || info->isDirectory) {
        throw FileNotFoundError("Bootstrap archive not found at " + archivePath);
    }

    std::ifstream stream(archivePath, std::ios::binary);
    if (!stream) {
        throw IOError("Cannot open bootstrap archive " + archivePath);
    }

    const std::string remoteArchive = remote_path::join(config.remoteArchiveDir, config.remoteArchiveName);
    spdlog::info("[Install] Uploading bootstrap archive ({} bytes) to {}", info->size, config.remoteArchiveDir);

    executor.run("mkdir -p " + shellQuote(config.remoteArchiveDir));

    CommandInvocation upload;
    upload.command = "cat > " + shellQuote(remoteArchive);
    upload.input = &stream;
    executor.execute(upload);

    executor.run("cd " + shellQuote(config.remoteArchiveDir) + " && tar -xzf " + shellQuote(config.remoteArchiveName));
    executor.run("rm -f " + shellQuote(remoteArchive));
    spdlog::info("[Install] Bootstrap files uploaded");
}

void DeviceInstaller::runBootstrapScript() {
    CommandInvocation invocation;
    invocation.command = "sh " + shellQuote(remote_path::join(config.remoteArchiveDir, config.bootstrapScript));
    invocation.disconnectExpected = true;
    invocation.successTokens = config.bootstrapTokens;
    executor.execute(invocation);
    spdlog::info("[Install] Bootstrap script completed");
}

void DeviceInstaller::runFeatureScript() {
    CommandInvocation invocation;
    invocation.command = "sh " + shellQuote(config.featureScriptPath);
    invocation.timeout = config.featureScriptTimeout;
    invocation.onLine = [](const std::string& line) {
        if (lowercase(line).find("install_feature") != std::string::npos) {
            spdlog::info("[Install] {}", trim(line));
        }
    };
    executor.execute(invocation);
    spdlog::info("[Install] Feature script completed");
}

void DeviceInstaller::cloneAndInstall(const std::string& branch, const ConnectivityStatus& connectivity) {
    if (!connectivity.reachable) {
        spdlog::warn("[Install] {} looks unreachable ({}); the clone may fail", connectivity.target,
            connectivity.detail);
    }
    spdlog::info("[Install] Cloning repository and switching to branch '{}'", branch);

    // remoteCloneDir may start with ~ and must stay unquoted.
    executor.run("rm -rf " + config.remoteCloneDir);
    executor.run("cd ~ && git clone " + shellQuote(config.repositoryUrl), config.cloneTimeout);
    executor.run("cd " + config.remoteCloneDir + " && git checkout " + shellQuote(branch) + " || git checkout main",
        config.checkoutTimeout);

    installSummary.clear();
    CommandInvocation invocation;
    invocation.command = "cd " + config.remoteCloneDir + " && chmod +x install.sh && ./install.sh";
    invocation.onLine = [this](const std::string& line) {
        const std::string lower = lowercase(line);
        if (lower.find("running") != std::string::npos && lower.find("installer") != std::string::npos) {
            spdlog::info("[Install] {}", trim(line));
        }
        const auto colon = line.find(':');
        if (colon == std::string::npos) {
            return;
        }
        const std::string status = lowercase(trim(line.substr(colon + 1)));
        if (status == "success" || status == "failed") {
            installSummary[trim(line.substr(0, colon))] = status == "success";
        }
    };
    executor.execute(invocation);

    if (!installSummary.empty()) {
        const bool allSucceeded = std::all_of(installSummary.begin(), installSummary.end(),
            [](const auto& entry) { return entry.second; });
        if (allSucceeded) {
            spdlog::info("[Install] All installations succeeded");
        }
        else {
            spdlog::warn("[Install] One or more installations failed");
        }
    }
    spdlog::info("[Install] Repository installation completed");
}
