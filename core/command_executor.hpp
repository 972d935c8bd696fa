#pragma once

#include "config.hpp"
#include "session_manager.hpp"

#include <chrono>
#include <functional>
#include <istream>
#include <optional>
#include <string>
#include <vector>

struct CommandInvocation {
    std::string command;
    std::optional<std::chrono::milliseconds> timeout;
    // Case-insensitive substrings that confirm success when no exit status arrives.
    std::vector<std::string> successTokens;
    // The command is expected to sever the connection (logout, reboot).
    bool disconnectExpected = false;
    std::function<void(const std::string&)> onLine;
    // Fed to the remote process in chunks, then end-of-input. Not owned.
    std::istream* input = nullptr;
};

struct CommandResult {
    std::string command;
    std::vector<std::string> stdoutLines;
    std::vector<std::string> stderrLines;
    // Absent when the invocation ended in an accepted disconnection.
    std::optional<int> exitStatus;
    bool successTokenSeen = false;
    std::chrono::milliseconds elapsed{0};

    std::string stdoutText() const;
    std::string stderrText() const;
    bool ok() const { return !exitStatus || *exitStatus == 0; }
};

class CommandExecutor {
private:
    SessionManager& sessions;
    ExecutorConfig config;

public:
    explicit CommandExecutor(SessionManager& sessions, ExecutorConfig config = {});

    CommandResult execute(const CommandInvocation& invocation);

    // Convenience for plain commands that must exit 0.
    CommandResult run(const std::string& command, std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    // Runs `echo test` and checks the device answers; ConnectionError otherwise.
    void ensureAccess();

    const ExecutorConfig& getConfig() const { return config; }
};

std::string formatCommandFailure(const std::string& command, std::optional<int> exitStatus,
                                 const std::string& stdoutText, const std::string& stderrText);

// Single-quotes `text` for a POSIX shell.
std::string shellQuote(const std::string& text);
