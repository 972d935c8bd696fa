#include "command_executor.hpp"

#include "errors.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <thread>

#include <spdlog/spdlog.h>

namespace {

constexpr std::size_t kMaxDiagnosticLength = 400;

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string joinLines(const std::vector<std::string>& lines) {
    std::string text;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            text += '\n';
        }
        text += lines[i];
    }
    return text;
}

std::string trimForDiagnostics(const std::string& text) {
    auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    auto last = text.find_last_not_of(" \t\r\n");
    std::string trimmed = text.substr(first, last - first + 1);
    if (trimmed.size() > kMaxDiagnosticLength) {
        return trimmed.substr(0, kMaxDiagnosticLength) + "... [truncated]";
    }
    return trimmed;
}

std::string diagnosticTail(const std::string& stdoutText, const std::string& stderrText) {
    std::string tail;
    const std::string out = trimForDiagnostics(stdoutText);
    const std::string err = trimForDiagnostics(stderrText);
    if (!out.empty()) {
        tail += " | STDOUT: " + out;
    }
    if (!err.empty()) {
        tail += " | STDERR: " + err;
    }
    return tail;
}

// Splits both output streams into lines and applies the per-line policy.
class OutputCollector {
private:
    const CommandInvocation& invocation;
    std::vector<std::string> lowerTokens;
    std::array<std::string, 2> pending;

    static std::size_t slot(StreamKind kind) { return kind == StreamKind::Stdout ? 0 : 1; }

    void emit(StreamKind kind, std::string line) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        spdlog::debug("[Remote] {}: {}", kind == StreamKind::Stdout ? "STDOUT" : "STDERR", line);

        if (!successSeen && !lowerTokens.empty()) {
            const std::string lowered = toLower(line);
            for (const auto& token : lowerTokens) {
                if (lowered.find(token) != std::string::npos) {
                    successSeen = true;
                    break;
                }
            }
        }

        if (invocation.onLine) {
            try {
                invocation.onLine(line);
            }
            catch (const std::exception& e) {
                spdlog::debug("[Remote] Line callback failed: {}", e.what());
            }
        }

        if (kind == StreamKind::Stdout) {
            stdoutLines.push_back(std::move(line));
        }
        else {
            stderrLines.push_back(std::move(line));
        }
    }

public:
    std::vector<std::string> stdoutLines;
    std::vector<std::string> stderrLines;
    bool successSeen = false;

    explicit OutputCollector(const CommandInvocation& invocation) : invocation(invocation) {
        for (const auto& token : invocation.successTokens) {
            if (!token.empty()) {
                lowerTokens.push_back(toLower(token));
            }
        }
    }

    void feed(StreamKind kind, const std::string& chunk) {
        std::string& buffer = pending[slot(kind)];
        buffer += chunk;
        std::size_t newline;
        while ((newline = buffer.find('\n')) != std::string::npos) {
            std::string line = buffer.substr(0, newline);
            buffer.erase(0, newline + 1);
            emit(kind, std::move(line));
        }
    }

    // Emits partial lines still lacking a trailing newline.
    void flush() {
        for (StreamKind kind : {StreamKind::Stdout, StreamKind::Stderr}) {
            std::string& buffer = pending[slot(kind)];
            if (!buffer.empty()) {
                std::string line = std::move(buffer);
                buffer.clear();
                emit(kind, std::move(line));
            }
        }
    }
};

void streamInput(Channel& channel, std::istream& input, std::size_t chunkSize) {
    std::vector<char> buffer(chunkSize);
    while (input.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || input.gcount() > 0) {
        channel.write(buffer.data(), static_cast<std::size_t>(input.gcount()));
    }
    if (input.bad()) {
        throw IOError("Failed to read input stream");
    }
    channel.sendEof();
}

} // namespace

std::string CommandResult::stdoutText() const {
    return joinLines(stdoutLines);
}

std::string CommandResult::stderrText() const {
    return joinLines(stderrLines);
}

std::string formatCommandFailure(const std::string& command, std::optional<int> exitStatus,
                                 const std::string& stdoutText, const std::string& stderrText) {
    return "Remote command failed with exit status "
        + (exitStatus ? std::to_string(*exitStatus) : std::string("unknown")) + ": " + command
        + diagnosticTail(stdoutText, stderrText);
}

std::string shellQuote(const std::string& text) {
    std::string quoted = "'";
    for (char c : text) {
        if (c == '\'') {
            quoted += "'\\''";
        }
        else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

CommandExecutor::CommandExecutor(SessionManager& sessions, ExecutorConfig config)
    : sessions(sessions), config(std::move(config)) {}

CommandResult CommandExecutor::execute(const CommandInvocation& invocation) {
    const std::string& command = invocation.command;
    const std::string fullCommand = config.pathExport.empty() ? command : config.pathExport + " " + command;
    spdlog::debug("[Remote] Executing: {}", fullCommand);

    sessions.connect();
    std::unique_ptr<Channel> channel;
    try {
        channel = sessions.withConnection([](Connection& connection) { return connection.openChannel(); });
        channel->exec(fullCommand);
    }
    catch (const ConnectionError& e) {
        channel.reset();
        sessions.close();
        throw ConnectionError("Failed to open SSH channel for '" + command + "': " + e.what());
    }

    if (invocation.input) {
        try {
            streamInput(*channel, *invocation.input, config.inputChunkSize);
        }
        catch (const std::exception& e) {
            channel.reset();
            sessions.close();
            throw CommandExecutionError("Failed while streaming input to remote command '" + command + "': " + e.what());
        }
    }

    OutputCollector output(invocation);
    const auto start = std::chrono::steady_clock::now();
    auto elapsed = [&start] {
        return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    };

    auto makeResult = [&](std::optional<int> exitStatus) {
        CommandResult result;
        result.command = command;
        result.stdoutLines = std::move(output.stdoutLines);
        result.stderrLines = std::move(output.stderrLines);
        result.exitStatus = exitStatus;
        result.successTokenSeen = output.successSeen;
        result.elapsed = elapsed();
        return result;
    };

    std::optional<int> exitStatus;
    try {
        while (true) {
            if (invocation.timeout && elapsed() > *invocation.timeout) {
                channel->close();
                throw TimeoutError("Remote command timed out after " + std::to_string(invocation.timeout->count())
                    + " ms: " + command);
            }

            bool received = false;
            for (StreamKind kind : {StreamKind::Stdout, StreamKind::Stderr}) {
                std::string chunk = channel->readAvailable(kind, config.readChunkSize);
                if (!chunk.empty()) {
                    output.feed(kind, chunk);
                    received = true;
                }
            }

            if (channel->isFinished()
                && !channel->hasPendingData(StreamKind::Stdout)
                && !channel->hasPendingData(StreamKind::Stderr)) {
                break;
            }
            if (!received) {
                std::this_thread::sleep_for(config.pollInterval);
            }
        }
        output.flush();
        exitStatus = channel->exitStatus();
    }
    catch (const TransportError& e) {
        output.flush();
        const std::optional<int> reported = channel->exitStatus();
        channel.reset();
        sessions.close();

        if (invocation.disconnectExpected && (!reported || *reported == 0 || output.successSeen)) {
            spdlog::info("[Remote] Connection closed by device as expected: {}", command);
            return makeResult(std::nullopt);
        }
        throw CommandExecutionError("Remote command failed during execution: " + command + ": " + e.what()
            + diagnosticTail(joinLines(output.stdoutLines), joinLines(output.stderrLines)));
    }
    channel.reset();

    if (invocation.disconnectExpected) {
        if (!exitStatus || *exitStatus == 0 || output.successSeen) {
            return makeResult(std::nullopt);
        }
        const std::string message = formatCommandFailure(command, exitStatus,
            joinLines(output.stdoutLines), joinLines(output.stderrLines));
        spdlog::error("[Remote] {}", message);
        throw CommandExecutionError(message);
    }

    if (!exitStatus || *exitStatus != 0) {
        const std::string message = formatCommandFailure(command, exitStatus,
            joinLines(output.stdoutLines), joinLines(output.stderrLines));
        spdlog::error("[Remote] {}", message);
        throw CommandExecutionError(message);
    }

    return makeResult(exitStatus);
}

CommandResult CommandExecutor::run(const std::string& command, std::optional<std::chrono::milliseconds> timeout) {
    CommandInvocation invocation;
    invocation.command = command;
    invocation.timeout = timeout;
    return execute(invocation);
}

void CommandExecutor::ensureAccess() {
    spdlog::debug("[Remote] Ensuring SSH access to {}", sessions.getConfig().host);
    CommandResult result;
    try {
        result = run("echo test");
    }
    catch (const CommandExecutionError& e) {
        throw ConnectionError(std::string("Failed to verify SSH access: ") + e.what());
    }
    if (result.stdoutText().find("test") == std::string::npos) {
        throw ConnectionError("Printer did not respond with expected output");
    }
    spdlog::debug("[Remote] SSH access verified");
}
