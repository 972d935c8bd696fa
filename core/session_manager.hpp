#pragma once

#include "config.hpp"
#include "errors.hpp"
#include "protocols/connection_handler.hpp"

#include <functional>
#include <memory>
#include <type_traits>
#include <utility>

// Owns the single connection to the device and reopens it on demand.
class SessionManager {
public:
    using ConnectionFactory = std::function<std::unique_ptr<Connection>(const SessionConfig&)>;

private:
    SessionConfig config;
    ConnectionFactory factory;
    std::unique_ptr<Connection> connection;

public:
    SessionManager(SessionConfig config, ConnectionFactory factory);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    // No-op while the current connection is alive, unless forced.
    void connect(bool force = false);
    // Idempotent. Errors while closing are logged, never thrown.
    void close();
    bool isConnected() const;

    const SessionConfig& getConfig() const { return config; }

    template<typename F>
    auto withConnection(F&& f) -> std::invoke_result_t<F, Connection&> {
        connect();
        if constexpr (std::is_same_v<std::invoke_result_t<F, Connection&>, void>) {
            std::forward<F>(f)(*connection);
        }
        else {
            return std::forward<F>(f)(*connection);
        }
    }
};
