#include "sftp_handler.hpp"

#include "core/errors.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/time.h>

#include <spdlog/spdlog.h>

namespace {

FileInfo toFileInfo(sftp_attributes attributes, const std::string& fallbackName) {
    FileInfo info;
    info.name = attributes->name ? attributes->name : fallbackName;
    info.size = attributes->size;
    info.isDirectory = attributes->type == SSH_FILEXFER_TYPE_DIRECTORY;
    info.permissions = attributes->permissions & 07777;
    info.modifiedTime = static_cast<std::int64_t>(attributes->mtime);
    return info;
}

class SFTPFileReader : public FileReader {
private:
    sftp_file file;
    std::string path;

public:
    SFTPFileReader(sftp_file file, const std::string& path) : file(file), path(path) {}
    ~SFTPFileReader() override { sftp_close(file); }

    std::size_t read(char* buffer, std::size_t length) override {
        ssize_t received = sftp_read(file, buffer, length);
        if (received < 0) {
            throw IOError("Failed to read remote file: " + path);
        }
        return static_cast<std::size_t>(received);
    }
};

class SFTPFileWriter : public FileWriter {
private:
    sftp_session sftpSession;
    sftp_file file;
    std::string path;

public:
    SFTPFileWriter(sftp_session session, sftp_file file, const std::string& path)
        : sftpSession(session), file(file), path(path) {}

    ~SFTPFileWriter() override {
        if (file) {
            sftp_close(file);
        }
    }

    void write(const char* data, std::size_t length) override {
        while (length > 0) {
            ssize_t written = sftp_write(file, data, length);
            if (written < 0) {
                throw IOError("Failed to write remote file " + path + " (sftp error " + std::to_string(sftp_get_error(sftpSession)) + ")");
            }
            data += written;
            length -= static_cast<std::size_t>(written);
        }
    }

    void sync() override {
        // Servers without the extension flush on close.
        if (!sftp_extension_supported(sftpSession, "fsync@openssh.com", "1")) {
            return;
        }
        if (sftp_fsync(file) != 0) {
            throw IOError("Failed to sync remote file " + path);
        }
    }

    void close() override {
        if (!file) {
            return;
        }
        int rc = sftp_close(file);
        file = nullptr;
        if (rc != SSH_NO_ERROR) {
            throw IOError("Failed to close remote file " + path);
        }
    }
};

} // namespace

SFTPSession::SFTPSession(ssh_session session) : sshSession(session) {
    sftpSession = sftp_new(sshSession);
    if (!sftpSession) {
        throw ConnectionError("Failed to create SFTP session: " + std::string(ssh_get_error(sshSession)));
    }
    if (sftp_init(sftpSession) != SSH_OK) {
        std::string reason = lastError();
        sftp_free(sftpSession);
        sftpSession = nullptr;
        throw ConnectionError("Failed to initialize SFTP session: " + reason);
    }
}

SFTPSession::~SFTPSession() {
    if (sftpSession) {
        sftp_free(sftpSession);
        sftpSession = nullptr;
    }
}

std::string SFTPSession::lastError() const {
    return std::string(ssh_get_error(sshSession)) + " (sftp error " + std::to_string(sftp_get_error(sftpSession)) + ")";
}

std::optional<FileInfo> SFTPSession::stat(const std::string& path) {
    sftp_attributes attributes = sftp_stat(sftpSession, path.c_str());
    if (!attributes) {
        if (sftp_get_error(sftpSession) == SSH_FX_NO_SUCH_FILE) {
            return std::nullopt;
        }
        throw IOError("Failed to stat remote path " + path + ": " + lastError());
    }
    FileInfo info = toFileInfo(attributes, remote_path::fileName(path));
    info.name = remote_path::fileName(path);
    sftp_attributes_free(attributes);
    return info;
}

std::vector<FileInfo> SFTPSession::listDirectory(const std::string& path) {
    sftp_dir dir = sftp_opendir(sftpSession, path.c_str());
    if (!dir) {
        if (sftp_get_error(sftpSession) == SSH_FX_NO_SUCH_FILE) {
            throw FileNotFoundError("Remote directory not found: " + path);
        }
        throw IOError("Failed to open remote directory " + path + ": " + lastError());
    }

    std::vector<FileInfo> entries;
    sftp_attributes attributes;
    while ((attributes = sftp_readdir(sftpSession, dir)) != nullptr) {
        if (attributes->type == SSH_FILEXFER_TYPE_REGULAR) {
            entries.push_back(toFileInfo(attributes, ""));
        }
        sftp_attributes_free(attributes);
    }

    bool complete = sftp_dir_eof(dir);
    sftp_closedir(dir);
    if (!complete) {
        throw IOError("Failed to list remote directory " + path + ": " + lastError());
    }
    return entries;
}

std::unique_ptr<FileReader> SFTPSession::openRead(const std::string& path) {
    sftp_file file = sftp_open(sftpSession, path.c_str(), O_RDONLY, 0);
    if (!file) {
        throw IOError("Unable to open remote file for download " + path + ": " + lastError());
    }
    return std::make_unique<SFTPFileReader>(file, path);
}

std::unique_ptr<FileWriter> SFTPSession::openWrite(const std::string& path) {
    sftp_file file = sftp_open(sftpSession, path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH);
    if (!file) {
        throw IOError("Unable to open remote file for upload " + path + ": " + lastError());
    }
    return std::make_unique<SFTPFileWriter>(sftpSession, file, path);
}

void SFTPSession::makeDirectories(const std::string& path) {
    if (path.empty()) {
        return;
    }
    std::string current;
    std::size_t start = 0;
    if (path[0] == '/') {
        current = "/";
        start = 1;
    }
    while (start <= path.size()) {
        std::size_t end = path.find('/', start);
        if (end == std::string::npos) {
            end = path.size();
        }
        std::string part = path.substr(start, end - start);
        start = end + 1;
        if (part.empty()) {
            continue;
        }
        current = remote_path::join(current, part);

        auto existing = stat(current);
        if (existing) {
            if (!existing->isDirectory) {
                throw IOError("Remote path exists and is not a directory: " + current);
            }
            continue;
        }
        if (sftp_mkdir(sftpSession, current.c_str(), S_IRWXU | S_IRGRP | S_IXGRP | S_IROTH | S_IXOTH) != 0
            && sftp_get_error(sftpSession) != SSH_FX_FILE_ALREADY_EXISTS) {
            throw IOError("Failed to create remote directory " + current + ": " + lastError());
        }
    }
}

void SFTPSession::rename(const std::string& from, const std::string& to) {
    if (sftp_rename(sftpSession, from.c_str(), to.c_str()) == 0) {
        return;
    }
    // Plain SFTP rename refuses to overwrite.
    if (stat(to)) {
        sftp_unlink(sftpSession, to.c_str());
        if (sftp_rename(sftpSession, from.c_str(), to.c_str()) == 0) {
            return;
        }
    }
    throw IOError("Failed to rename remote file " + from + " to " + to + ": " + lastError());
}

bool SFTPSession::remove(const std::string& path) {
    return sftp_unlink(sftpSession, path.c_str()) == 0;
}

std::optional<std::uint64_t> SFTPSession::availableSpace(const std::string& path) {
    if (!sftp_extension_supported(sftpSession, "statvfs@openssh.com", "2")) {
        return std::nullopt;
    }
    std::string probe = path;
    while (!probe.empty() && !stat(probe)) {
        std::string parent = remote_path::parent(probe);
        if (parent == probe) {
            break;
        }
        probe = parent;
    }
    if (probe.empty()) {
        probe = ".";
    }

    sftp_statvfs_t info = sftp_statvfs(sftpSession, probe.c_str());
    if (!info) {
        spdlog::debug("[SFTP] statvfs failed for {}: {}", probe, lastError());
        return std::nullopt;
    }
    std::uint64_t blockSize = info->f_frsize > 0 ? info->f_frsize : info->f_bsize;
    std::uint64_t available = info->f_bavail * blockSize;
    sftp_statvfs_free(info);
    return available;
}

bool SFTPSession::copyMetadata(const std::string& path, const FileInfo& from) {
    bool ok = sftp_chmod(sftpSession, path.c_str(), from.permissions) == 0;

    struct timeval times[2];
    times[0].tv_sec = static_cast<time_t>(from.modifiedTime);
    times[0].tv_usec = 0;
    times[1] = times[0];
    if (sftp_utimes(sftpSession, path.c_str(), times) != 0) {
        ok = false;
    }
    return ok;
}
