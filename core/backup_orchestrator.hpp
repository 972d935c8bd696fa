#pragma once

#include "command_executor.hpp"
#include "config.hpp"
#include "session_manager.hpp"
#include "transfer_engine.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

enum class ComponentKind {
    FileSet,   // fixed file names
    Directory  // whatever the remote directory holds
};

struct BackupComponent {
    std::string name;
    ComponentKind kind = ComponentKind::FileSet;
    std::string remoteDirectory;
    std::vector<std::string> fileNames;
    // Empty means the bundle root.
    std::string bundleSubdirectory;
    // Stopped around a restore so it never sees a half-written dataset.
    std::optional<std::string> liveService;
};

BackupComponent moonrakerDatabaseComponent();
BackupComponent timelapseComponent();
BackupComponent gcodesComponent();
std::vector<BackupComponent> defaultComponents();

struct ComponentReport {
    std::string name;
    bool present = false;
    std::size_t filesFound = 0;
    std::size_t filesTransferred = 0;
    std::vector<std::string> failedFiles;
    // The component could not be enumerated or prepared; none of its files were copied.
    std::optional<std::string> error;
    // Set when the live service could not be started again after a restore.
    std::optional<std::string> serviceError;
};

struct ComponentSummary {
    bool exists = false;
    std::size_t fileCount = 0;
    std::uint64_t totalBytes = 0;
};

using ComponentProgress = std::function<void(const std::string& component, std::size_t done, std::size_t total)>;

class BackupRestoreOrchestrator {
private:
    SessionManager& sessions;
    CommandExecutor& executor;
    FileSystem& local;
    TransferPolicy policy;
    TransferEngine::Sleeper sleeper;
    std::chrono::seconds serviceTimeout{30};

    void restoreComponent(const std::string& bundleRoot, const BackupComponent& component,
                          ComponentReport& report, const ComponentProgress& progress);

public:
    BackupRestoreOrchestrator(SessionManager& sessions, CommandExecutor& executor, FileSystem& local,
                              TransferPolicy policy = {}, TransferEngine::Sleeper sleeper = {});

    // Copies every selected component from the device into bundleRoot. Missing
    // components report 0 files. Throws FileTransferError naming every failed
    // file once all components have been attempted.
    std::vector<ComponentReport> backup(const std::string& bundleRoot, const std::vector<BackupComponent>& components,
                                        const ComponentProgress& progress = {});

    // Pushes the components present in bundleRoot back to the device. Absent
    // components are reported, not raised.
    std::vector<ComponentReport> restore(const std::string& bundleRoot, const std::vector<BackupComponent>& components,
                                         const ComponentProgress& progress = {});

    std::map<std::string, ComponentSummary> inspectRemote(const std::vector<BackupComponent>& components);

    static std::map<std::string, ComponentSummary> inspectBundle(FileSystem& local, const std::string& bundleRoot,
                                                                 const std::vector<BackupComponent>& components);

    // <parent>/moonraker_backup_<host>_<YYYYmmdd_HHMMSS>
    static std::string createBundleDirectory(FileSystem& local, const std::string& parent, const std::string& host,
                                             std::chrono::system_clock::time_point now = std::chrono::system_clock::now());
};
