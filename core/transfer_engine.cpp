#include "transfer_engine.hpp"

#include "errors.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstdio>
#include <random>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>

namespace {

constexpr const char* kTemporaryMarker = ".part-";

std::string uniqueSuffix() {
    static std::atomic<std::uint32_t> counter{0};
    static const std::uint32_t seed = std::random_device{}();
    char buffer[24];
    std::snprintf(buffer, sizeof(buffer), "%08x%04x", seed, counter.fetch_add(1, std::memory_order_relaxed) & 0xffff);
    return buffer;
}

void report(const ProgressSink& sink, std::uint64_t transferred, std::uint64_t total) {
    try {
        sink(transferred, total);
    }
    catch (const std::exception& e) {
        spdlog::debug("[Transfer] Progress sink failed: {}", e.what());
    }
}

} // namespace

std::string temporarySiblingPath(const std::string& destination) {
    const std::string directory = remote_path::parent(destination);
    const std::string name = "." + remote_path::fileName(destination) + kTemporaryMarker + uniqueSuffix();
    return remote_path::join(directory, name);
}

bool isTemporaryArtifact(const std::string& fileName) {
    return !fileName.empty() && fileName[0] == '.' && fileName.find(kTemporaryMarker) != std::string::npos;
}

TransferEngine::TransferEngine(FileSystem& local, FileSystem& remote, TransferPolicy policy, Sleeper sleeper)
    : local(local), remote(remote), policy(std::move(policy)), sleeper(std::move(sleeper)) {
    if (!this->sleeper) {
        this->sleeper = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
    }
}

void TransferEngine::copy(const TransferTask& task) {
    FileSystem& source = task.direction == TransferDirection::ToRemote ? local : remote;
    FileSystem& destination = task.direction == TransferDirection::ToRemote ? remote : local;

    const auto sourceInfo = source.stat(task.source);
    if (!sourceInfo || sourceInfo->isDirectory) {
        throw FileNotFoundError("Source file not found (" + source.describe() + "): " + task.source);
    }

    const std::string destinationDir = remote_path::parent(task.destination);
    const auto available = destination.availableSpace(destinationDir.empty() ? "." : destinationDir);
    const auto required = static_cast<std::uint64_t>(std::ceil(static_cast<double>(sourceInfo->size) * policy.spaceFactor));
    if (available && *available < required) {
        throw InsufficientSpaceError("Insufficient space for " + task.destination + " (" + destination.describe()
            + "): need " + std::to_string(required) + " bytes, " + std::to_string(*available) + " available");
    }
    if (!available && destination.isLocal()) {
        spdlog::warn("[Transfer] Could not determine free space for {}", task.destination);
    }

    const int attempts = std::max(1, policy.maxAttempts);
    auto delay = policy.initialBackoff;
    std::string lastCause;

    for (int attemptNumber = 1; attemptNumber <= attempts; ++attemptNumber) {
        const std::string temporaryPath = temporarySiblingPath(task.destination);
        try {
            destination.makeDirectories(destinationDir);
            attempt(source, destination, task, *sourceInfo, temporaryPath);
            spdlog::debug("[Transfer] Copied {} -> {} ({} bytes)", task.source, task.destination, sourceInfo->size);
            return;
        }
        catch (const IOError& e) {
            lastCause = e.what();
            destination.remove(temporaryPath);
            spdlog::warn("[Transfer] Attempt {}/{} for {} failed: {}", attemptNumber, attempts, task.source, lastCause);
        }
        catch (...) {
            destination.remove(temporaryPath);
            throw;
        }

        if (attemptNumber < attempts) {
            sleeper(delay);
            delay = std::chrono::duration_cast<std::chrono::milliseconds>(delay * policy.backoffMultiplier);
        }
    }

    throw FileTransferError("Failed to copy " + task.source + " to " + task.destination + " after "
        + std::to_string(attempts) + " attempts: " + lastCause);
}

void TransferEngine::attempt(FileSystem& source, FileSystem& destination, const TransferTask& task,
                             const FileInfo& sourceInfo, const std::string& temporaryPath) {
    const std::uint64_t total = task.expectedSize.value_or(sourceInfo.size);
    std::uint64_t transferred = 0;

    {
        auto reader = source.openRead(task.source);
        auto writer = destination.openWrite(temporaryPath);

        std::vector<char> buffer(std::max<std::size_t>(policy.chunkSize, 1));
        auto lastReport = std::chrono::steady_clock::now();
        std::size_t received;
        while ((received = reader->read(buffer.data(), buffer.size())) > 0) {
            writer->write(buffer.data(), received);
            transferred += received;

            if (task.progress) {
                const auto now = std::chrono::steady_clock::now();
                if (now - lastReport >= policy.progressInterval) {
                    report(task.progress, transferred, total);
                    lastReport = now;
                }
            }
        }

        writer->sync();
        writer->close();
    }

    if (!destination.copyMetadata(temporaryPath, sourceInfo)) {
        spdlog::debug("[Transfer] Could not preserve metadata on {}", task.destination);
    }

    const auto written = destination.stat(temporaryPath);
    if (!written) {
        throw IOError("Destination missing after copy: " + temporaryPath);
    }
    if (sourceInfo.size > 0 && written->size == 0) {
        throw IOError("Destination is empty after copy: " + task.destination);
    }
    if (written->size != sourceInfo.size || transferred != sourceInfo.size) {
        throw IOError("Size mismatch for " + task.destination + ": expected " + std::to_string(sourceInfo.size)
            + " bytes, wrote " + std::to_string(transferred) + ", found " + std::to_string(written->size));
    }

    destination.rename(temporaryPath, task.destination);

    if (task.progress) {
        report(task.progress, transferred, total);
    }
}
