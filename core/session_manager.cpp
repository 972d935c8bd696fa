#include "session_manager.hpp"

#include <spdlog/spdlog.h>

namespace {

// Tears down a half-open connection without masking the error that caused it.
void discard(Connection& candidate, const std::string& host) {
    try {
        candidate.disconnect();
    }
    catch (const std::exception& e) {
        spdlog::debug("[Session] Ignoring error while discarding connection to {}: {}", host, e.what());
    }
}

} // namespace

SessionManager::SessionManager(SessionConfig config, ConnectionFactory factory)
    : config(std::move(config)), factory(std::move(factory)) {
    if (!this->factory) {
        throw std::invalid_argument("SessionManager requires a connection factory");
    }
}

SessionManager::~SessionManager() {
    close();
}

void SessionManager::connect(bool force) {
    if (!force && isConnected()) {
        return;
    }

    close();

    spdlog::debug("[Session] Connecting to {}@{}:{}", config.username, config.host, config.port);
    auto candidate = factory(config);
    try {
        candidate->connect();
        candidate->authenticate(config.password);
    }
    catch (const AuthenticationError&) {
        discard(*candidate, config.host);
        spdlog::error("[Session] Authentication to {} failed", config.host);
        throw;
    }
    catch (const ConnectionError&) {
        discard(*candidate, config.host);
        throw;
    }
    catch (const std::exception& e) {
        discard(*candidate, config.host);
        throw ConnectionError("Unable to establish SSH connection to " + config.host + ": " + e.what());
    }

    candidate->enableKeepalive(config.keepaliveInterval);
    connection = std::move(candidate);
    spdlog::debug("[Session] Connected to {}", config.host);
}

void SessionManager::close() {
    if (!connection) {
        return;
    }
    auto closing = std::move(connection);
    try {
        closing->disconnect();
    }
    catch (const std::exception& e) {
        spdlog::debug("[Session] Ignoring error while closing connection to {}: {}", config.host, e.what());
    }
}

bool SessionManager::isConnected() const {
    return connection && connection->isAlive();
}
