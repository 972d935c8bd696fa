#include "local_file_system.hpp"

#include "core/errors.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

std::string errnoText(const std::string& what, const std::string& path) {
    return what + " " + path + ": " + std::strerror(errno);
}

class LocalFileReader : public FileReader {
private:
    std::ifstream stream;
    std::string path;

public:
    explicit LocalFileReader(const std::string& path)
        : stream(path, std::ios::binary), path(path) {
        if (!stream.is_open()) {
            throw IOError("Failed to open local file for reading: " + path);
        }
    }

    std::size_t read(char* buffer, std::size_t length) override {
        stream.read(buffer, static_cast<std::streamsize>(length));
        if (stream.bad()) {
            throw IOError("Failed to read local file: " + path);
        }
        return static_cast<std::size_t>(stream.gcount());
    }
};

class LocalFileWriter : public FileWriter {
private:
    int fd = -1;
    std::string path;

public:
    explicit LocalFileWriter(const std::string& path) : path(path) {
        fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
        if (fd < 0) {
            throw IOError(errnoText("Failed to open local file for writing", path));
        }
    }

    ~LocalFileWriter() override {
        if (fd >= 0) {
            ::close(fd);
        }
    }

    void write(const char* data, std::size_t length) override {
        while (length > 0) {
            ssize_t written = ::write(fd, data, length);
            if (written < 0) {
                if (errno == EINTR) {
                    continue;
                }
                throw IOError(errnoText("Failed to write local file", path));
            }
            data += written;
            length -= static_cast<std::size_t>(written);
        }
    }

    void sync() override {
        if (::fsync(fd) != 0) {
            throw IOError(errnoText("Failed to sync local file", path));
        }
    }

    void close() override {
        if (fd < 0) {
            return;
        }
        int rc = ::close(fd);
        fd = -1;
        if (rc != 0) {
            throw IOError(errnoText("Failed to close local file", path));
        }
    }
};

FileInfo toFileInfo(const std::string& name, const struct stat& st) {
    FileInfo info;
    info.name = name;
    info.size = static_cast<std::uint64_t>(st.st_size);
    info.isDirectory = S_ISDIR(st.st_mode);
    info.permissions = static_cast<std::uint32_t>(st.st_mode & 07777);
    info.modifiedTime = static_cast<std::int64_t>(st.st_mtime);
    return info;
}

} // namespace

std::optional<FileInfo> LocalFileSystem::stat(const std::string& path) {
    struct stat st {};
    if (::stat(path.c_str(), &st) != 0) {
        if (errno == ENOENT || errno == ENOTDIR) {
            return std::nullopt;
        }
        throw IOError(errnoText("Failed to stat", path));
    }
    return toFileInfo(fs::path(path).filename().string(), st);
}

std::vector<FileInfo> LocalFileSystem::listDirectory(const std::string& path) {
    std::error_code ec;
    if (!fs::is_directory(path, ec)) {
        throw FileNotFoundError("Local directory not found: " + path);
    }

    std::vector<FileInfo> entries;
    for (const auto& entry : fs::directory_iterator(path, ec)) {
        std::error_code typeEc;
        if (!entry.is_regular_file(typeEc)) {
            continue;
        }
        struct stat st {};
        if (::stat(entry.path().c_str(), &st) != 0) {
            continue;
        }
        entries.push_back(toFileInfo(entry.path().filename().string(), st));
    }
    if (ec) {
        throw IOError("Failed to list local directory " + path + ": " + ec.message());
    }
    return entries;
}

std::unique_ptr<FileReader> LocalFileSystem::openRead(const std::string& path) {
    return std::make_unique<LocalFileReader>(path);
}

std::unique_ptr<FileWriter> LocalFileSystem::openWrite(const std::string& path) {
    return std::make_unique<LocalFileWriter>(path);
}

void LocalFileSystem::makeDirectories(const std::string& path) {
    if (path.empty()) {
        return;
    }
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        throw IOError("Failed to create directory " + path + ": " + ec.message());
    }
}

void LocalFileSystem::rename(const std::string& from, const std::string& to) {
    std::error_code ec;
    fs::rename(from, to, ec);
    if (ec) {
        throw IOError("Failed to rename " + from + " to " + to + ": " + ec.message());
    }
}

bool LocalFileSystem::remove(const std::string& path) {
    std::error_code ec;
    return fs::remove(path, ec);
}

std::optional<std::uint64_t> LocalFileSystem::availableSpace(const std::string& path) {
    fs::path probe = path.empty() ? fs::current_path() : fs::path(path);
    std::error_code ec;
    while (!fs::exists(probe, ec) && probe.has_parent_path() && probe != probe.parent_path()) {
        probe = probe.parent_path();
    }
    if (!fs::exists(probe, ec)) {
        probe = fs::current_path(ec);
    }

    struct statvfs buf {};
    if (::statvfs(probe.c_str(), &buf) != 0) {
        return std::nullopt;
    }
    const std::uint64_t blockSize = buf.f_frsize > 0 ? buf.f_frsize : buf.f_bsize;
    return static_cast<std::uint64_t>(buf.f_bavail) * blockSize;
}

bool LocalFileSystem::copyMetadata(const std::string& path, const FileInfo& from) {
    bool ok = ::chmod(path.c_str(), static_cast<mode_t>(from.permissions & 07777)) == 0;

    struct timespec times[2];
    times[0].tv_sec = 0;
    times[0].tv_nsec = UTIME_OMIT;
    times[1].tv_sec = static_cast<time_t>(from.modifiedTime);
    times[1].tv_nsec = 0;
    if (::utimensat(AT_FDCWD, path.c_str(), times, 0) != 0) {
        ok = false;
    }
    return ok;
}
