#include "reset_lifecycle.hpp"

#include "errors.hpp"
#include "protocols/tcp_probe.hpp"

#include <thread>

#include <spdlog/spdlog.h>

const char* toString(ResetState state) {
    switch (state) {
    case ResetState::Idle: return "Idle";
    case ResetState::ResetIssued: return "ResetIssued";
    case ResetState::Rebooting: return "Rebooting";
    case ResetState::Polling: return "Polling";
    case ResetState::Online: return "Online";
    case ResetState::Failed: return "Failed";
    }
    return "Unknown";
}

ResetLifecycleController::ResetLifecycleController(SessionManager& sessions, CommandExecutor& executor,
                                                   ResetConfig config, PortCheck portCheck, Sleeper sleeper)
    : sessions(sessions), executor(executor), config(std::move(config)),
      portCheck(std::move(portCheck)), sleeper(std::move(sleeper)) {
    if (!this->portCheck) {
        this->portCheck = &isPortOpen;
    }
    if (!this->sleeper) {
        this->sleeper = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
    }
}

void ResetLifecycleController::transition(ResetState next) {
    spdlog::debug("[Reset] {} -> {}", toString(state), toString(next));
    state = next;
}

void ResetLifecycleController::resetDevice() {
    unsuccessfulProbes = 0;
    pollingElapsed = std::chrono::milliseconds{0};
    state = ResetState::Idle;

    spdlog::info("[Reset] Reset requested. Initiating device wipe...");
    transition(ResetState::ResetIssued);
    issueReset();

    spdlog::info("[Reset] Reset acknowledged; waiting {} seconds for device to reboot",
        std::chrono::duration_cast<std::chrono::seconds>(config.gracePeriod).count());
    transition(ResetState::Rebooting);
    sessions.close();
    sleeper(config.gracePeriod);

    transition(ResetState::Polling);
    waitUntilOnline();
    transition(ResetState::Online);
    spdlog::info("[Reset] Device back online after {}s",
        std::chrono::duration_cast<std::chrono::seconds>(pollingElapsed).count());
}

void ResetLifecycleController::issueReset() {
    CommandInvocation invocation;
    invocation.command = config.resetCommand;
    invocation.timeout = config.resetTimeout;
    invocation.disconnectExpected = true;
    invocation.successTokens = config.acknowledgementTokens;

    try {
        executor.ensureAccess();
        executor.execute(invocation);
    }
    catch (const ProvisionError& e) {
        transition(ResetState::Failed);
        spdlog::error("[Reset] Reset command failed: {}", e.what());
        throw;
    }
}

void ResetLifecycleController::waitUntilOnline() {
    const SessionConfig& target = sessions.getConfig();
    const auto start = std::chrono::steady_clock::now();

    while (true) {
        pollingElapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
        if (config.deadline && pollingElapsed >= *config.deadline) {
            transition(ResetState::Failed);
            throw TimeoutError("Device " + target.host + " did not come back online within "
                + std::to_string(config.deadline->count()) + " ms after reset");
        }

        sleeper(config.pollInterval);
        if (probeOnce()) {
            pollingElapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
            return;
        }
        ++unsuccessfulProbes;
    }
}

bool ResetLifecycleController::probeOnce() {
    const SessionConfig& target = sessions.getConfig();
    if (!portCheck(target.host, target.port, config.probeTimeout)) {
        spdlog::debug("[Reset] Port {} on {} still closed", target.port, target.host);
        return false;
    }

    try {
        sessions.connect(true);
        CommandResult result = executor.run(config.echoCommand, config.echoTimeout);
        if (result.stdoutText().find(config.onlineMarker) != std::string::npos) {
            return true;
        }
        spdlog::debug("[Reset] Echo probe answered without '{}'", config.onlineMarker);
    }
    catch (const ProvisionError& e) {
        spdlog::debug("[Reset] Device not ready yet: {}", e.what());
        sessions.close();
    }
    return false;
}
