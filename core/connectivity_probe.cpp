#include "connectivity_probe.hpp"

#include "protocols/tcp_probe.hpp"

#include <thread>

#include <spdlog/spdlog.h>

ConnectivityProbe::ConnectivityProbe(std::string host, int port, std::chrono::milliseconds timeout, PortCheck portCheck)
    : host(std::move(host)), port(port), timeout(timeout), portCheck(std::move(portCheck)) {
    if (!this->portCheck) {
        this->portCheck = &isPortOpen;
    }
}

void ConnectivityProbe::start() {
    if (isStarted()) {
        return;
    }

    std::promise<ConnectivityStatus> promise;
    pending = promise.get_future();

    spdlog::debug("[Connectivity] Probing {}", target());
    std::thread([promise = std::move(promise), check = portCheck, host = host, port = port,
                 timeout = timeout, name = target()]() mutable {
        ConnectivityStatus status;
        status.target = name;
        status.completed = true;
        try {
            status.reachable = check(host, port, timeout);
            status.detail = status.reachable ? "reachable" : "connection failed or timed out";
        }
        catch (const std::exception& e) {
            status.reachable = false;
            status.detail = e.what();
        }
        promise.set_value(std::move(status));
    }).detach();
}

ConnectivityStatus ConnectivityProbe::await(std::chrono::milliseconds limit) {
    if (result) {
        return *result;
    }
    if (!pending.valid()) {
        ConnectivityStatus status;
        status.target = target();
        status.detail = "probe not started";
        return status;
    }

    if (pending.wait_for(limit) != std::future_status::ready) {
        ConnectivityStatus status;
        status.target = target();
        status.detail = "probe still running";
        return status;
    }

    result = pending.get();
    if (result->reachable) {
        spdlog::info("[Connectivity] {} is reachable", result->target);
    }
    else {
        spdlog::warn("[Connectivity] {} is not reachable: {}", result->target, result->detail);
    }
    return *result;
}
