#include "backup_orchestrator.hpp"

#include "errors.hpp"

#include <ctime>
#include <memory>

#include <spdlog/spdlog.h>

namespace {

constexpr const char* kPrinterData = "/mnt/UDISK/root/printer_data";

std::string bundleDirectory(const std::string& bundleRoot, const BackupComponent& component) {
    if (component.bundleSubdirectory.empty()) {
        return bundleRoot;
    }
    return remote_path::join(bundleRoot, component.bundleSubdirectory);
}

// Files that make up `component` under `directory` on the given side.
std::vector<FileInfo> enumerate(FileSystem& fs, const std::string& directory, const BackupComponent& component) {
    std::vector<FileInfo> files;
    if (component.kind == ComponentKind::FileSet) {
        for (const auto& name : component.fileNames) {
            auto info = fs.stat(remote_path::join(directory, name));
            if (info && !info->isDirectory) {
                info->name = name;
                files.push_back(*info);
            }
        }
        return files;
    }

    const auto dirInfo = fs.stat(directory);
    if (!dirInfo || !dirInfo->isDirectory) {
        return files;
    }
    for (auto& entry : fs.listDirectory(directory)) {
        if (!isTemporaryArtifact(entry.name)) {
            files.push_back(std::move(entry));
        }
    }
    return files;
}

std::map<std::string, ComponentSummary> summarize(FileSystem& fs, const std::vector<BackupComponent>& components,
                                                  const std::function<std::string(const BackupComponent&)>& directoryOf) {
    std::map<std::string, ComponentSummary> summaries;
    for (const auto& component : components) {
        ComponentSummary summary;
        for (const auto& file : enumerate(fs, directoryOf(component), component)) {
            ++summary.fileCount;
            summary.totalBytes += file.size;
        }
        summary.exists = summary.fileCount > 0;
        summaries[component.name] = summary;
    }
    return summaries;
}

void notify(const ComponentProgress& progress, const std::string& component, std::size_t done, std::size_t total) {
    if (!progress) {
        return;
    }
    try {
        progress(component, done, total);
    }
    catch (const std::exception& e) {
        spdlog::debug("[Backup] Progress callback failed: {}", e.what());
    }
}

std::string joinNames(const std::vector<std::string>& names) {
    std::string joined;
    for (const auto& name : names) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += name;
    }
    return joined;
}

// Empty when every component went through.
std::string describeFailures(const std::vector<ComponentReport>& reports) {
    std::vector<std::string> files;
    std::vector<std::string> components;
    for (const auto& report : reports) {
        files.insert(files.end(), report.failedFiles.begin(), report.failedFiles.end());
        if (report.error) {
            components.push_back(report.name + " (" + *report.error + ")");
        }
    }

    std::string description;
    if (!files.empty()) {
        description = "failed files: " + joinNames(files);
    }
    if (!components.empty()) {
        if (!description.empty()) {
            description += "; ";
        }
        description += "failed components: " + joinNames(components);
    }
    return description;
}

} // namespace

BackupComponent moonrakerDatabaseComponent() {
    BackupComponent component;
    component.name = "moonraker";
    component.kind = ComponentKind::FileSet;
    component.remoteDirectory = std::string(kPrinterData) + "/database";
    component.fileNames = {"data.mdb", "moonraker-sql.db"};
    component.liveService = "moonraker";
    return component;
}

BackupComponent timelapseComponent() {
    BackupComponent component;
    component.name = "timelapse";
    component.kind = ComponentKind::Directory;
    component.remoteDirectory = std::string(kPrinterData) + "/timelapse";
    component.bundleSubdirectory = "timelapse";
    return component;
}

BackupComponent gcodesComponent() {
    BackupComponent component;
    component.name = "gcodes";
    component.kind = ComponentKind::Directory;
    component.remoteDirectory = std::string(kPrinterData) + "/gcodes";
    component.bundleSubdirectory = "gcodes";
    return component;
}

std::vector<BackupComponent> defaultComponents() {
    return {moonrakerDatabaseComponent(), timelapseComponent(), gcodesComponent()};
}

BackupRestoreOrchestrator::BackupRestoreOrchestrator(SessionManager& sessions, CommandExecutor& executor,
                                                     FileSystem& local, TransferPolicy policy,
                                                     TransferEngine::Sleeper sleeper)
    : sessions(sessions), executor(executor), local(local), policy(std::move(policy)), sleeper(std::move(sleeper)) {}

std::vector<ComponentReport> BackupRestoreOrchestrator::backup(const std::string& bundleRoot,
                                                               const std::vector<BackupComponent>& components,
                                                               const ComponentProgress& progress) {
    std::vector<ComponentReport> reports;
    {
        // The remote file system borrows the live session; it must be gone
        // before anything closes it.
        std::unique_ptr<FileSystem> remote = sessions.withConnection(
            [](Connection& connection) { return connection.openFileSystem(); });
        TransferEngine engine(local, *remote, policy, sleeper);

        for (const auto& component : components) {
            ComponentReport report;
            report.name = component.name;

            std::vector<FileInfo> files;
            const std::string target = bundleDirectory(bundleRoot, component);
            try {
                files = enumerate(*remote, component.remoteDirectory, component);
                report.present = !files.empty();
                report.filesFound = files.size();
                if (!files.empty()) {
                    spdlog::info("[Backup] Backing up {} {} file(s) to {}", files.size(), component.name, target);
                    local.makeDirectories(target);
                }
            }
            catch (const ProvisionError& e) {
                spdlog::error("[Backup] Skipping {}: {}", component.name, e.what());
                report.error = e.what();
                reports.push_back(std::move(report));
                continue;
            }
            if (files.empty()) {
                spdlog::info("[Backup] No {} files found on device", component.name);
                reports.push_back(std::move(report));
                continue;
            }

            std::size_t done = 0;
            for (const auto& file : files) {
                TransferTask task;
                task.direction = TransferDirection::FromRemote;
                task.source = remote_path::join(component.remoteDirectory, file.name);
                task.destination = remote_path::join(target, file.name);
                task.expectedSize = file.size;
                try {
                    engine.copy(task);
                    ++report.filesTransferred;
                }
                catch (const ProvisionError& e) {
                    spdlog::error("[Backup] {}", e.what());
                    report.failedFiles.push_back(task.source);
                }
                notify(progress, component.name, ++done, files.size());
            }
            reports.push_back(std::move(report));
        }
    }

    const std::string failures = describeFailures(reports);
    if (!failures.empty()) {
        throw FileTransferError("Backup incomplete; " + failures);
    }
    return reports;
}

std::vector<ComponentReport> BackupRestoreOrchestrator::restore(const std::string& bundleRoot,
                                                                const std::vector<BackupComponent>& components,
                                                                const ComponentProgress& progress) {
    std::vector<ComponentReport> reports;
    for (const auto& component : components) {
        ComponentReport report;
        report.name = component.name;
        restoreComponent(bundleRoot, component, report, progress);
        reports.push_back(std::move(report));
    }

    const std::string failures = describeFailures(reports);
    if (!failures.empty()) {
        throw FileTransferError("Restore incomplete; " + failures);
    }
    for (const auto& report : reports) {
        if (report.serviceError) {
            throw CommandExecutionError(*report.serviceError);
        }
    }
    return reports;
}

void BackupRestoreOrchestrator::restoreComponent(const std::string& bundleRoot, const BackupComponent& component,
                                                 ComponentReport& report, const ComponentProgress& progress) {
    const std::string source = bundleDirectory(bundleRoot, component);
    std::vector<FileInfo> files;
    try {
        files = enumerate(local, source, component);
    }
    catch (const ProvisionError& e) {
        spdlog::error("[Restore] Skipping {}: {}", component.name, e.what());
        report.error = e.what();
        return;
    }
    report.present = !files.empty();
    report.filesFound = files.size();
    if (files.empty()) {
        spdlog::warn("[Restore] No {} data in bundle {}; skipping", component.name, bundleRoot);
        return;
    }

    const auto failAll = [&]() {
        for (const auto& file : files) {
            report.failedFiles.push_back(remote_path::join(source, file.name));
        }
    };

    if (component.liveService) {
        try {
            spdlog::info("[Restore] Stopping {} service", *component.liveService);
            executor.run("/etc/init.d/" + *component.liveService + " stop", serviceTimeout);
        }
        catch (const ProvisionError& e) {
            spdlog::error("[Restore] Could not stop {}: {}", *component.liveService, e.what());
            failAll();
            return;
        }
    }

    try {
        executor.run("mkdir -p " + shellQuote(component.remoteDirectory));
    }
    catch (const ProvisionError& e) {
        spdlog::error("[Restore] Could not create {}: {}", component.remoteDirectory, e.what());
        failAll();
    }

    if (report.failedFiles.empty()) {
        // The remote file system must be released before the service is started again.
        try {
            std::unique_ptr<FileSystem> remote = sessions.withConnection(
                [](Connection& connection) { return connection.openFileSystem(); });
            TransferEngine engine(local, *remote, policy, sleeper);

            std::size_t done = 0;
            for (const auto& file : files) {
                TransferTask task;
                task.direction = TransferDirection::ToRemote;
                task.source = remote_path::join(source, file.name);
                task.destination = remote_path::join(component.remoteDirectory, file.name);
                task.expectedSize = file.size;
                try {
                    engine.copy(task);
                    ++report.filesTransferred;
                }
                catch (const ProvisionError& e) {
                    spdlog::error("[Restore] {}", e.what());
                    report.failedFiles.push_back(task.source);
                }
                notify(progress, component.name, ++done, files.size());
            }
        }
        catch (const ProvisionError& e) {
            spdlog::error("[Restore] Could not open device file system for {}: {}", component.name, e.what());
            failAll();
        }
    }

    if (component.liveService) {
        try {
            executor.run("/etc/init.d/" + *component.liveService + " start", serviceTimeout);
            spdlog::info("[Restore] Started {} service", *component.liveService);
        }
        catch (const ProvisionError& e) {
            spdlog::error("[Restore] Could not start {}: {}", *component.liveService, e.what());
            report.serviceError = "Failed to start " + *component.liveService + " after restore: " + e.what();
        }
    }

    if (report.filesTransferred == 0) {
        spdlog::warn("[Restore] No {} files were restored", component.name);
    }
    else {
        spdlog::info("[Restore] Restored {} of {} {} file(s)", report.filesTransferred, files.size(), component.name);
    }
}

std::map<std::string, ComponentSummary> BackupRestoreOrchestrator::inspectRemote(
    const std::vector<BackupComponent>& components) {
    std::unique_ptr<FileSystem> remote = sessions.withConnection(
        [](Connection& connection) { return connection.openFileSystem(); });
    return summarize(*remote, components, [](const BackupComponent& c) { return c.remoteDirectory; });
}

std::map<std::string, ComponentSummary> BackupRestoreOrchestrator::inspectBundle(
    FileSystem& local, const std::string& bundleRoot, const std::vector<BackupComponent>& components) {
    return summarize(local, components,
        [&bundleRoot](const BackupComponent& c) { return bundleDirectory(bundleRoot, c); });
}

std::string BackupRestoreOrchestrator::createBundleDirectory(FileSystem& local, const std::string& parent,
                                                             const std::string& host,
                                                             std::chrono::system_clock::time_point now) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    std::tm parts{};
    localtime_r(&seconds, &parts);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y%m%d_%H%M%S", &parts);

    const std::string path = remote_path::join(parent, "moonraker_backup_" + host + "_" + stamp);
    local.makeDirectories(path);
    spdlog::info("[Backup] Created bundle directory {}", path);
    return path;
}
