#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct FileInfo {
    std::string name;
    std::uint64_t size = 0;
    bool isDirectory = false;
    std::uint32_t permissions = 0644;
    std::int64_t modifiedTime = 0; // seconds since epoch
};

class FileReader {
public:
    // Returns 0 at end of file. Throws IOError.
    virtual std::size_t read(char* buffer, std::size_t length) = 0;
    virtual ~FileReader() {}
};

class FileWriter {
public:
    virtual void write(const char* data, std::size_t length) = 0;
    // Forces written data to durable storage.
    virtual void sync() = 0;
    virtual void close() = 0;
    virtual ~FileWriter() {}
};

// Paths are plain strings; remote paths are always POSIX style.
class FileSystem {
public:
    virtual std::optional<FileInfo> stat(const std::string& path) = 0;
    // Regular files only. Throws FileNotFoundError if the directory is missing.
    virtual std::vector<FileInfo> listDirectory(const std::string& path) = 0;

    virtual std::unique_ptr<FileReader> openRead(const std::string& path) = 0;
    virtual std::unique_ptr<FileWriter> openWrite(const std::string& path) = 0;

    virtual void makeDirectories(const std::string& path) = 0;
    // Replaces the destination if it exists.
    virtual void rename(const std::string& from, const std::string& to) = 0;
    virtual bool remove(const std::string& path) = 0;

    // Free bytes available at path (or its nearest existing ancestor), if known.
    virtual std::optional<std::uint64_t> availableSpace(const std::string& path) = 0;
    // Best effort; returns false when the backend could not apply it.
    virtual bool copyMetadata(const std::string& path, const FileInfo& from) = 0;

    virtual bool isLocal() const = 0;
    virtual std::string describe() const = 0;

    virtual ~FileSystem() {}
};

namespace remote_path {

inline std::string parent(const std::string& path) {
    auto pos = path.find_last_of('/');
    if (pos == std::string::npos) {
        return "";
    }
    if (pos == 0) {
        return "/";
    }
    return path.substr(0, pos);
}

inline std::string fileName(const std::string& path) {
    auto pos = path.find_last_of('/');
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

inline std::string join(const std::string& directory, const std::string& name) {
    if (directory.empty()) {
        return name;
    }
    if (directory.back() == '/') {
        return directory + name;
    }
    return directory + "/" + name;
}

} // namespace remote_path
