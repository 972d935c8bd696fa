#include "ssh_handler.hpp"

#include "sftp_handler.hpp"
#include "core/errors.hpp"

#include <algorithm>
#include <stdexcept>

#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>

#include <spdlog/spdlog.h>

// ---------------------------------------------------------------------------
// SSHChannel
// ---------------------------------------------------------------------------

SSHChannel::SSHChannel(ssh_session session) : sshSession(session) {
    sshChannel = ssh_channel_new(sshSession);
    if (!sshChannel) {
        throw ConnectionError("Failed to create SSH channel: " + std::string(ssh_get_error(sshSession)));
    }
    ssh_callbacks_init(&callbacks);
    callbacks.userdata = this;
    callbacks.channel_exit_status_function = &SSHChannel::onExitStatus;
    ssh_set_channel_callbacks(sshChannel, &callbacks);
}

SSHChannel::~SSHChannel() {
    close();
}

void SSHChannel::onExitStatus(ssh_session, ssh_channel, int exitStatus, void* userdata) {
    static_cast<SSHChannel*>(userdata)->reportedExitStatus = exitStatus;
}

void SSHChannel::ensureSessionAlive() const {
    if (!ssh_is_connected(sshSession)) {
        throw TransportError("SSH connection lost: " + std::string(ssh_get_error(sshSession)));
    }
}

void SSHChannel::exec(const std::string& command) {
    if (ssh_channel_open_session(sshChannel) != SSH_OK) {
        throw ConnectionError("Failed to open SSH channel: " + std::string(ssh_get_error(sshSession)));
    }
    if (ssh_channel_request_exec(sshChannel, command.c_str()) != SSH_OK) {
        throw ConnectionError("Failed to execute remote command: " + std::string(ssh_get_error(sshSession)));
    }
}

void SSHChannel::write(const char* data, std::size_t length) {
    while (length > 0) {
        auto chunk = static_cast<uint32_t>(std::min<std::size_t>(length, 64 * 1024));
        int written = ssh_channel_write(sshChannel, data, chunk);
        if (written == SSH_ERROR) {
            throw TransportError("Failed to write to SSH channel: " + std::string(ssh_get_error(sshSession)));
        }
        data += written;
        length -= static_cast<std::size_t>(written);
    }
}

void SSHChannel::sendEof() {
    if (ssh_channel_send_eof(sshChannel) != SSH_OK) {
        throw TransportError("Failed to send EOF on SSH channel: " + std::string(ssh_get_error(sshSession)));
    }
}

std::string SSHChannel::readAvailable(StreamKind stream, std::size_t maxBytes) {
    ensureSessionAlive();
    const int isStderr = stream == StreamKind::Stderr ? 1 : 0;

    int available = ssh_channel_poll(sshChannel, isStderr);
    if (available == SSH_ERROR) {
        throw TransportError("SSH channel poll failed: " + std::string(ssh_get_error(sshSession)));
    }
    if (available <= 0) {
        return {};
    }

    std::string buffer(std::min<std::size_t>(static_cast<std::size_t>(available), maxBytes), '\0');
    int received = ssh_channel_read_nonblocking(sshChannel, &buffer[0], static_cast<uint32_t>(buffer.size()), isStderr);
    if (received == SSH_ERROR) {
        throw TransportError("SSH channel read failed: " + std::string(ssh_get_error(sshSession)));
    }
    buffer.resize(received > 0 ? static_cast<std::size_t>(received) : 0);
    return buffer;
}

bool SSHChannel::hasPendingData(StreamKind stream) {
    int available = ssh_channel_poll(sshChannel, stream == StreamKind::Stderr ? 1 : 0);
    if (available == SSH_ERROR) {
        throw TransportError("SSH channel poll failed: " + std::string(ssh_get_error(sshSession)));
    }
    return available > 0;
}

bool SSHChannel::isFinished() {
    ensureSessionAlive();
    return reportedExitStatus.has_value() || ssh_channel_is_closed(sshChannel);
}

void SSHChannel::close() {
    if (!sshChannel) {
        return;
    }
    if (ssh_channel_is_open(sshChannel)) {
        ssh_channel_close(sshChannel);
    }
    ssh_channel_free(sshChannel);
    sshChannel = nullptr;
}

// ---------------------------------------------------------------------------
// SSHConnection
// ---------------------------------------------------------------------------

SSHConnection::SSHConnection(const std::string& hostname, int port, const std::string& username, long connectTimeoutSeconds)
    : hostname(hostname), port(port), username(username), connectTimeoutSeconds(connectTimeoutSeconds) {
    if (hostname.empty() || port <= 0 || username.empty()) {
        throw std::invalid_argument("Invalid arguments for SSHConnection");
    }
}

SSHConnection::~SSHConnection() {
    disconnect();
}

void SSHConnection::initializeSession() {
    sshSession = ssh_new();
    if (!sshSession) {
        throw ConnectionError("Failed to create SSH session");
    }
    // Password only: no ~/.ssh/config, no host key enforcement.
    bool processConfig = false;
    int strictHostKeyCheck = 0;
    ssh_options_set(sshSession, SSH_OPTIONS_HOST, hostname.c_str());
    ssh_options_set(sshSession, SSH_OPTIONS_PORT, &port);
    ssh_options_set(sshSession, SSH_OPTIONS_USER, username.c_str());
    ssh_options_set(sshSession, SSH_OPTIONS_TIMEOUT, &connectTimeoutSeconds);
    ssh_options_set(sshSession, SSH_OPTIONS_PROCESS_CONFIG, &processConfig);
    ssh_options_set(sshSession, SSH_OPTIONS_STRICTHOSTKEYCHECK, &strictHostKeyCheck);
}

void SSHConnection::releaseSession() {
    if (sshSession) {
        if (ssh_is_connected(sshSession)) {
            ssh_disconnect(sshSession);
        }
        ssh_free(sshSession);
        sshSession = nullptr;
    }
}

void SSHConnection::logHostKey() {
    ssh_key key = nullptr;
    if (ssh_get_server_publickey(sshSession, &key) != SSH_OK) {
        return;
    }
    unsigned char* hash = nullptr;
    size_t hashLength = 0;
    if (ssh_get_publickey_hash(key, SSH_PUBLICKEY_HASH_SHA256, &hash, &hashLength) == SSH_OK) {
        char* fingerprint = ssh_get_fingerprint_hash(SSH_PUBLICKEY_HASH_SHA256, hash, hashLength);
        if (fingerprint) {
            spdlog::debug("[SSH] Accepting host key for {}: {}", hostname, fingerprint);
            ssh_string_free_char(fingerprint);
        }
        ssh_clean_pubkey_hash(&hash);
    }
    ssh_key_free(key);
}

void SSHConnection::connect() {
    std::lock_guard<std::mutex> lock(sessionMutex);
    releaseSession();
    initializeSession();

    if (ssh_connect(sshSession) != SSH_OK) {
        std::string reason = ssh_get_error(sshSession);
        releaseSession();
        throw ConnectionError("Unable to establish SSH connection to " + hostname + ":" + std::to_string(port) + ": " + reason);
    }
    logHostKey();
}

void SSHConnection::disconnect() {
    std::lock_guard<std::mutex> lock(sessionMutex);
    releaseSession();
}

void SSHConnection::authenticate(const std::string& password) {
    std::lock_guard<std::mutex> lock(sessionMutex);
    if (!sshSession) {
        throw ConnectionError("SSH session is not initialized");
    }

    int rc = ssh_userauth_password(sshSession, nullptr, password.c_str());
    if (rc == SSH_AUTH_SUCCESS) {
        return;
    }
    std::string reason = ssh_get_error(sshSession);
    releaseSession();
    if (rc == SSH_AUTH_ERROR) {
        throw ConnectionError("SSH error during authentication: " + reason);
    }
    throw AuthenticationError("Authentication to " + username + "@" + hostname + " failed");
}

void SSHConnection::enableKeepalive(std::chrono::seconds interval) {
    std::lock_guard<std::mutex> lock(sessionMutex);
    if (!sshSession) {
        return;
    }
    socket_t fd = ssh_get_fd(sshSession);
    if (fd == SSH_INVALID_SOCKET) {
        return;
    }
    int enable = 1;
    int idle = static_cast<int>(interval.count());
    int probes = 3;
    if (setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &enable, sizeof(enable)) != 0
        || setsockopt(fd, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle)) != 0
        || setsockopt(fd, IPPROTO_TCP, TCP_KEEPINTVL, &idle, sizeof(idle)) != 0
        || setsockopt(fd, IPPROTO_TCP, TCP_KEEPCNT, &probes, sizeof(probes)) != 0) {
        spdlog::warn("[SSH] Could not enable keepalive on connection to {}", hostname);
    }
}

bool SSHConnection::isAlive() const {
    std::lock_guard<std::mutex> lock(sessionMutex);
    return sshSession && ssh_is_connected(sshSession);
}

std::unique_ptr<Channel> SSHConnection::openChannel() {
    std::lock_guard<std::mutex> lock(sessionMutex);
    if (!sshSession || !ssh_is_connected(sshSession)) {
        throw TransportError("SSH transport became unavailable");
    }
    return std::make_unique<SSHChannel>(sshSession);
}

std::unique_ptr<FileSystem> SSHConnection::openFileSystem() {
    std::lock_guard<std::mutex> lock(sessionMutex);
    if (!sshSession || !ssh_is_connected(sshSession)) {
        throw TransportError("SSH transport became unavailable");
    }
    return std::make_unique<SFTPSession>(sshSession);
}

std::unique_ptr<Connection> makeSSHConnection(const SessionConfig& config) {
    return std::make_unique<SSHConnection>(config.host, config.port, config.username,
        static_cast<long>(config.connectTimeout.count()));
}
