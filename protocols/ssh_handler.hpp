#pragma once

#include "connection_handler.hpp"
#include "core/config.hpp"

#include <libssh/callbacks.h>
#include <libssh/libssh.h>

#include <mutex>
#include <optional>
#include <string>

class SSHChannel : public Channel {
private:
    ssh_session sshSession;
    ssh_channel sshChannel = nullptr;
    ssh_channel_callbacks_struct callbacks{};
    std::optional<int> reportedExitStatus;

    static void onExitStatus(ssh_session session, ssh_channel channel, int exitStatus, void* userdata);
    void ensureSessionAlive() const;

public:
    explicit SSHChannel(ssh_session session);
    ~SSHChannel() override;

    SSHChannel(const SSHChannel&) = delete;
    SSHChannel& operator=(const SSHChannel&) = delete;

    void exec(const std::string& command) override;
    void write(const char* data, std::size_t length) override;
    void sendEof() override;

    std::string readAvailable(StreamKind stream, std::size_t maxBytes) override;
    bool hasPendingData(StreamKind stream) override;

    bool isFinished() override;
    std::optional<int> exitStatus() const override { return reportedExitStatus; }

    void close() override;
};

class SSHConnection : public Connection {
private:
    std::string hostname;
    int port;
    std::string username;
    long connectTimeoutSeconds;
    ssh_session sshSession = nullptr;
    mutable std::mutex sessionMutex;

    void initializeSession();
    void releaseSession();
    void logHostKey();

public:
    SSHConnection(const std::string& hostname, int port, const std::string& username, long connectTimeoutSeconds);
    ~SSHConnection() override;

    SSHConnection(const SSHConnection&) = delete;
    SSHConnection& operator=(const SSHConnection&) = delete;

    void connect() override;
    void disconnect() override;
    void authenticate(const std::string& password) override;
    void enableKeepalive(std::chrono::seconds interval) override;
    bool isAlive() const override;
    std::string getProtocolName() const override { return "SSH"; }

    std::unique_ptr<Channel> openChannel() override;
    std::unique_ptr<FileSystem> openFileSystem() override;
};

// Connection factory for SessionManager.
std::unique_ptr<Connection> makeSSHConnection(const SessionConfig& config);
