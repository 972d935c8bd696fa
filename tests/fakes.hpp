#pragma once

#include "core/config.hpp"
#include "core/errors.hpp"
#include "protocols/connection_handler.hpp"
#include "protocols/local_file_system.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct ScriptStep {
    enum Kind { Stdout, Stderr, Exit, Drop, Close };
    Kind kind;
    std::string text;
    int code = 0;
};

using Script = std::vector<ScriptStep>;

inline ScriptStep out(const std::string& text) { return {ScriptStep::Stdout, text, 0}; }
inline ScriptStep err(const std::string& text) { return {ScriptStep::Stderr, text, 0}; }
inline ScriptStep exitWith(int code) { return {ScriptStep::Exit, "", code}; }
inline ScriptStep drop() { return {ScriptStep::Drop, "", 0}; }
inline ScriptStep closeChannel() { return {ScriptStep::Close, "", 0}; }

// Scripted stand-in for the printer. Commands are matched by substring; the
// most recently added rule wins. A rule with several scripts plays them in
// order and then keeps repeating the last one.
class FakeDevice {
private:
    struct Rule {
        std::string pattern;
        std::vector<Script> scripts;
        std::size_t used = 0;
    };
    std::vector<Rule> rules;

public:
    std::vector<std::string> commands;
    std::map<std::string, std::string> inputs;
    int connectAttempts = 0;
    int disconnects = 0;
    int failConnects = 0;
    bool rejectPassword = false;
    bool failDisconnect = false;
    bool failFileSystem = false;
    // Device paths containing this text cannot be stat'ed or listed.
    std::string unreadablePath;
    std::optional<std::chrono::seconds> keepalive;
    std::string remoteRoot;

    FakeDevice() {
        on("echo test", {out("test\n"), exitWith(0)});
        on("echo online", {out("online\n"), exitWith(0)});
    }

    void on(const std::string& pattern, Script script) {
        rules.push_back({pattern, {std::move(script)}, 0});
    }

    void onSequence(const std::string& pattern, std::vector<Script> scripts) {
        rules.push_back({pattern, std::move(scripts), 0});
    }

    Script scriptFor(const std::string& command) {
        for (auto it = rules.rbegin(); it != rules.rend(); ++it) {
            if (command.find(it->pattern) == std::string::npos) {
                continue;
            }
            const std::size_t index = std::min(it->used, it->scripts.size() - 1);
            ++it->used;
            return it->scripts[index];
        }
        return {exitWith(0)};
    }

    std::size_t count(const std::string& pattern) const {
        std::size_t n = 0;
        for (const auto& command : commands) {
            if (command.find(pattern) != std::string::npos) {
                ++n;
            }
        }
        return n;
    }

    bool ran(const std::string& pattern) const { return count(pattern) > 0; }
};

// Maps absolute device paths onto a local directory.
class RootedFileSystem : public FileSystem {
private:
    std::string root;
    std::optional<std::uint64_t> space;
    std::string unreadable;
    LocalFileSystem disk;

    std::string map(const std::string& path) const {
        if (!path.empty() && path.front() == '/') {
            return root + path;
        }
        return root + "/" + path;
    }

    void checkReadable(const std::string& path) const {
        if (!unreadable.empty() && path.find(unreadable) != std::string::npos) {
            throw IOError("stat failed: " + path);
        }
    }

public:
    explicit RootedFileSystem(std::string root, std::optional<std::uint64_t> space = std::nullopt,
                              std::string unreadable = "")
        : root(std::move(root)), space(space), unreadable(std::move(unreadable)) {}

    std::optional<FileInfo> stat(const std::string& path) override {
        checkReadable(path);
        return disk.stat(map(path));
    }
    std::vector<FileInfo> listDirectory(const std::string& path) override {
        checkReadable(path);
        return disk.listDirectory(map(path));
    }
    std::unique_ptr<FileReader> openRead(const std::string& path) override { return disk.openRead(map(path)); }
    std::unique_ptr<FileWriter> openWrite(const std::string& path) override { return disk.openWrite(map(path)); }
    void makeDirectories(const std::string& path) override { disk.makeDirectories(map(path)); }
    void rename(const std::string& from, const std::string& to) override { disk.rename(map(from), map(to)); }
    bool remove(const std::string& path) override { return disk.remove(map(path)); }
    std::optional<std::uint64_t> availableSpace(const std::string& path) override {
        return space ? space : disk.availableSpace(map(path));
    }
    bool copyMetadata(const std::string& path, const FileInfo& from) override {
        return disk.copyMetadata(map(path), from);
    }
    bool isLocal() const override { return false; }
    std::string describe() const override { return "device"; }
};

// Local file system whose writes fail for the first `failures` files opened.
class FlakyFileSystem : public LocalFileSystem {
private:
    class FailingWriter : public FileWriter {
    public:
        void write(const char*, std::size_t) override { throw IOError("simulated write failure"); }
        void sync() override {}
        void close() override {}
    };

public:
    int failures;
    int writesOpened = 0;

    explicit FlakyFileSystem(int failures) : failures(failures) {}

    std::unique_ptr<FileWriter> openWrite(const std::string& path) override {
        ++writesOpened;
        if (failures > 0) {
            --failures;
            LocalFileSystem::openWrite(path)->close();
            return std::make_unique<FailingWriter>();
        }
        return LocalFileSystem::openWrite(path);
    }
};

class FakeChannel : public Channel {
private:
    FakeDevice& device;
    bool& alive;
    std::string command;
    std::string input;
    std::deque<ScriptStep> steps;
    std::optional<int> exitCode;
    bool closed = false;

    bool isChunkOf(StreamKind kind) const {
        if (steps.empty()) {
            return false;
        }
        const auto& step = steps.front();
        return (kind == StreamKind::Stdout && step.kind == ScriptStep::Stdout)
            || (kind == StreamKind::Stderr && step.kind == ScriptStep::Stderr);
    }

public:
    FakeChannel(FakeDevice& device, bool& alive) : device(device), alive(alive) {}

    void exec(const std::string& fullCommand) override {
        command = fullCommand;
        device.commands.push_back(fullCommand);
        const Script script = device.scriptFor(fullCommand);
        steps.assign(script.begin(), script.end());
    }

    void write(const char* data, std::size_t length) override { input.append(data, length); }
    void sendEof() override { device.inputs[command] = input; }

    std::string readAvailable(StreamKind stream, std::size_t) override {
        if (!steps.empty() && steps.front().kind == ScriptStep::Drop) {
            alive = false;
            throw TransportError("connection reset by peer");
        }
        if (!isChunkOf(stream)) {
            return "";
        }
        std::string text = steps.front().text;
        steps.pop_front();
        return text;
    }

    bool hasPendingData(StreamKind stream) override { return isChunkOf(stream); }

    // A Drop scripted after Exit keeps the channel open so the next read
    // fails after the status has already been delivered.
    bool isFinished() override {
        while (!steps.empty() && (steps.front().kind == ScriptStep::Exit || steps.front().kind == ScriptStep::Close)) {
            if (steps.front().kind == ScriptStep::Exit) {
                exitCode = steps.front().code;
            }
            else {
                closed = true;
            }
            steps.pop_front();
        }
        if (!steps.empty() && steps.front().kind == ScriptStep::Drop) {
            return false;
        }
        return exitCode.has_value() || closed;
    }

    std::optional<int> exitStatus() const override { return exitCode; }
    void close() override { closed = true; }
};

class FakeConnection : public Connection {
private:
    std::shared_ptr<FakeDevice> device;
    bool alive = false;

public:
    explicit FakeConnection(std::shared_ptr<FakeDevice> device) : device(std::move(device)) {}

    void connect() override {
        ++device->connectAttempts;
        if (device->failConnects > 0) {
            --device->failConnects;
            throw ConnectionError("connection refused");
        }
    }

    void disconnect() override {
        if (alive) {
            ++device->disconnects;
        }
        alive = false;
        if (device->failDisconnect) {
            throw ConnectionError("socket already closed");
        }
    }

    void authenticate(const std::string& password) override {
        if (device->rejectPassword || password.empty()) {
            throw AuthenticationError("Authentication failed");
        }
        alive = true;
    }

    void enableKeepalive(std::chrono::seconds interval) override { device->keepalive = interval; }
    bool isAlive() const override { return alive; }
    std::string getProtocolName() const override { return "fake"; }

    std::unique_ptr<Channel> openChannel() override {
        if (!alive) {
            throw TransportError("not connected");
        }
        return std::make_unique<FakeChannel>(*device, alive);
    }

    std::unique_ptr<FileSystem> openFileSystem() override {
        if (!alive) {
            throw TransportError("not connected");
        }
        if (device->failFileSystem) {
            throw ConnectionError("sftp subsystem unavailable");
        }
        return std::make_unique<RootedFileSystem>(device->remoteRoot, std::nullopt, device->unreadablePath);
    }
};

inline std::function<std::unique_ptr<Connection>(const SessionConfig&)> fakeFactory(std::shared_ptr<FakeDevice> device) {
    return [device](const SessionConfig&) { return std::make_unique<FakeConnection>(device); };
}

inline SessionConfig fakeSessionConfig() {
    SessionConfig config;
    config.host = "192.0.2.10";
    config.password = "secret";
    return config;
}

inline ExecutorConfig fastExecutorConfig() {
    ExecutorConfig config;
    config.pollInterval = std::chrono::milliseconds(1);
    return config;
}

class TempDir {
private:
    std::filesystem::path path;

public:
    TempDir() {
        std::string pattern = (std::filesystem::temp_directory_path() / "provisioner-test-XXXXXX").string();
        if (::mkdtemp(pattern.data()) == nullptr) {
            throw IOError("mkdtemp failed");
        }
        path = pattern;
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::string str() const { return path.string(); }
    std::string operator/(const std::string& name) const { return (path / name).string(); }
};

inline void writeFile(const std::string& path, const std::string& content) {
    std::filesystem::create_directories(std::filesystem::path(path).parent_path());
    std::ofstream stream(path, std::ios::binary);
    stream << content;
}

inline std::string readFile(const std::string& path) {
    std::ifstream stream(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>());
}
