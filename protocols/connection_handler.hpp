#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include "file_system.hpp"

enum class StreamKind {
    Stdout,
    Stderr
};

// One remote command execution. Channels are single use.
class Channel {
public:
    virtual void exec(const std::string& command) = 0;
    virtual void write(const char* data, std::size_t length) = 0;
    virtual void sendEof() = 0;

    // Returns what is immediately available on the stream (possibly nothing).
    // Throws TransportError when the underlying session is gone.
    virtual std::string readAvailable(StreamKind stream, std::size_t maxBytes) = 0;
    virtual bool hasPendingData(StreamKind stream) = 0;

    // True once the remote side reported an exit status or closed the channel.
    virtual bool isFinished() = 0;
    virtual std::optional<int> exitStatus() const = 0;

    virtual void close() = 0;
    virtual ~Channel() {}
};

class Connection {
public:
    virtual void connect() = 0;
    virtual void disconnect() = 0;
    virtual void authenticate(const std::string& password) = 0;
    virtual void enableKeepalive(std::chrono::seconds interval) = 0;
    virtual bool isAlive() const = 0;
    virtual std::string getProtocolName() const = 0;

    virtual std::unique_ptr<Channel> openChannel() = 0;
    // The returned file system borrows this connection and must not outlive it.
    virtual std::unique_ptr<FileSystem> openFileSystem() = 0;

    virtual ~Connection() {}
};
