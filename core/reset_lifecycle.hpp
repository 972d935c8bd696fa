#pragma once

#include "command_executor.hpp"
#include "config.hpp"
#include "session_manager.hpp"

#include <chrono>
#include <functional>
#include <string>

enum class ResetState {
    Idle,
    ResetIssued,
    Rebooting,
    Polling,
    Online,
    Failed
};

const char* toString(ResetState state);

// Factory-resets the device and waits for it to come back.
//
// Idle -> ResetIssued -> Rebooting -> Polling -> Online, or Failed when the
// reset command itself fails or the optional deadline passes. Polling never
// fails on its own: closed ports and failed echo probes just mean the device
// is not back yet.
class ResetLifecycleController {
public:
    using PortCheck = std::function<bool(const std::string& host, int port, std::chrono::milliseconds timeout)>;
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

private:
    SessionManager& sessions;
    CommandExecutor& executor;
    ResetConfig config;
    PortCheck portCheck;
    Sleeper sleeper;

    ResetState state = ResetState::Idle;
    int unsuccessfulProbes = 0;
    std::chrono::milliseconds pollingElapsed{0};

    void transition(ResetState next);
    void issueReset();
    void waitUntilOnline();
    bool probeOnce();

public:
    ResetLifecycleController(SessionManager& sessions, CommandExecutor& executor, ResetConfig config = {},
                             PortCheck portCheck = {}, Sleeper sleeper = {});

    void resetDevice();

    ResetState getState() const { return state; }
    int getUnsuccessfulProbes() const { return unsuccessfulProbes; }
    std::chrono::milliseconds getPollingElapsed() const { return pollingElapsed; }
};
