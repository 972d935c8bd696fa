#pragma once

#include "file_system.hpp"

class LocalFileSystem : public FileSystem {
public:
    std::optional<FileInfo> stat(const std::string& path) override;
    std::vector<FileInfo> listDirectory(const std::string& path) override;

    std::unique_ptr<FileReader> openRead(const std::string& path) override;
    std::unique_ptr<FileWriter> openWrite(const std::string& path) override;

    void makeDirectories(const std::string& path) override;
    void rename(const std::string& from, const std::string& to) override;
    bool remove(const std::string& path) override;

    std::optional<std::uint64_t> availableSpace(const std::string& path) override;
    bool copyMetadata(const std::string& path, const FileInfo& from) override;

    bool isLocal() const override { return true; }
    std::string describe() const override { return "local"; }
};
