#pragma once

#include "file_system.hpp"

#include <libssh/libssh.h>
#include <libssh/sftp.h>

#include <string>

// File system view of the device over the SFTP subsystem of an existing SSH
// session. Borrows the session; must be destroyed before it.
class SFTPSession : public FileSystem {
private:
    ssh_session sshSession;
    sftp_session sftpSession = nullptr;

    std::string lastError() const;

public:
    explicit SFTPSession(ssh_session session);
    ~SFTPSession() override;

    SFTPSession(const SFTPSession&) = delete;
    SFTPSession& operator=(const SFTPSession&) = delete;

    std::optional<FileInfo> stat(const std::string& path) override;
    std::vector<FileInfo> listDirectory(const std::string& path) override;

    std::unique_ptr<FileReader> openRead(const std::string& path) override;
    std::unique_ptr<FileWriter> openWrite(const std::string& path) override;

    void makeDirectories(const std::string& path) override;
    void rename(const std::string& from, const std::string& to) override;
    bool remove(const std::string& path) override;

    std::optional<std::uint64_t> availableSpace(const std::string& path) override;
    bool copyMetadata(const std::string& path, const FileInfo& from) override;

    bool isLocal() const override { return false; }
    std::string describe() const override { return "remote (SFTP)"; }
};
