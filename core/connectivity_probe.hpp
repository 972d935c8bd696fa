#pragma once

#include <chrono>
#include <functional>
#include <future>
#include <optional>
#include <string>

struct ConnectivityStatus {
    std::string target;
    bool completed = false;
    bool reachable = false;
    std::string detail;
};

// Checks in the background whether an auxiliary host answers on a TCP port.
// The outcome is assigned exactly once and read through await().
class ConnectivityProbe {
public:
    using PortCheck = std::function<bool(const std::string& host, int port, std::chrono::milliseconds timeout)>;

private:
    std::string host;
    int port;
    std::chrono::milliseconds timeout;
    PortCheck portCheck;

    std::future<ConnectivityStatus> pending;
    std::optional<ConnectivityStatus> result;

public:
    ConnectivityProbe(std::string host, int port, std::chrono::milliseconds timeout, PortCheck portCheck = {});

    // Starts the probe thread. Later calls are ignored.
    void start();
    bool isStarted() const { return pending.valid() || result.has_value(); }

    // Blocks for at most `limit`. A probe that has not finished by then is
    // reported as not completed and unreachable.
    ConnectivityStatus await(std::chrono::milliseconds limit);

    std::string target() const { return host + ":" + std::to_string(port); }
};
