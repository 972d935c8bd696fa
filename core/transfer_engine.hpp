#pragma once

#include "config.hpp"
#include "protocols/file_system.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

enum class TransferDirection {
    ToRemote,
    FromRemote
};

using ProgressSink = std::function<void(std::uint64_t transferred, std::uint64_t total)>;

struct TransferTask {
    TransferDirection direction = TransferDirection::FromRemote;
    std::string source;
    std::string destination;
    std::optional<std::uint64_t> expectedSize;
    ProgressSink progress;
};

// Copies one file at a time into a temporary sibling, verifies it and moves
// it into place. The final path never observes a partial write.
class TransferEngine {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

private:
    FileSystem& local;
    FileSystem& remote;
    TransferPolicy policy;
    Sleeper sleeper;

    void attempt(FileSystem& source, FileSystem& destination, const TransferTask& task,
                 const FileInfo& sourceInfo, const std::string& temporaryPath);

public:
    TransferEngine(FileSystem& local, FileSystem& remote, TransferPolicy policy = {}, Sleeper sleeper = {});

    void copy(const TransferTask& task);

    const TransferPolicy& getPolicy() const { return policy; }
};

// Unique hidden name next to `destination` used while a copy is in flight.
std::string temporarySiblingPath(const std::string& destination);
bool isTemporaryArtifact(const std::string& fileName);
