#include "core/command_executor.hpp"

#include "fakes.hpp"

#include <sstream>

#include <gtest/gtest.h>

class CommandExecutorTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeDevice> device = std::make_shared<FakeDevice>();
    SessionManager sessions{fakeSessionConfig(), fakeFactory(device)};
    CommandExecutor executor{sessions, fastExecutorConfig()};
};

TEST_F(CommandExecutorTest, CollectsBothStreamsOnSuccess) {
    device->on("uname", {out("Linux\nK2"), err("warning\n"), out("\n"), exitWith(0)});

    CommandResult result = executor.run("uname -a");

    ASSERT_TRUE(result.exitStatus.has_value());
    EXPECT_EQ(*result.exitStatus, 0);
    EXPECT_EQ(result.stdoutLines, (std::vector<std::string>{"Linux", "K2"}));
    EXPECT_EQ(result.stderrLines, (std::vector<std::string>{"warning"}));
    EXPECT_TRUE(result.ok());
}

TEST_F(CommandExecutorTest, PrependsPathExport) {
    executor.run("ls");

    ASSERT_EQ(device->commands.size(), 1u);
    EXPECT_EQ(device->commands[0], fastExecutorConfig().pathExport + " ls");
}

TEST_F(CommandExecutorTest, NonZeroExitIsCommandExecutionError) {
    device->on("false", {out("partial\n"), err("boom\n"), exitWith(2)});

    try {
        executor.run("false");
        FAIL() << "expected CommandExecutionError";
    }
    catch (const CommandExecutionError& e) {
        const std::string message = e.what();
        EXPECT_NE(message.find("exit status 2"), std::string::npos);
        EXPECT_NE(message.find("false"), std::string::npos);
        EXPECT_NE(message.find("boom"), std::string::npos);
    }
}

TEST_F(CommandExecutorTest, StripsCarriageReturnsAndFlushesPartialLines) {
    device->on("printf", {out("one\r\ntwo"), exitWith(0)});

    CommandResult result = executor.run("printf");

    EXPECT_EQ(result.stdoutLines, (std::vector<std::string>{"one", "two"}));
}

TEST_F(CommandExecutorTest, LineCallbackSeesEveryLineInOrder) {
    device->on("stream", {out("a\nb\n"), out("c\n"), exitWith(0)});
    std::vector<std::string> seen;

    CommandInvocation invocation;
    invocation.command = "stream";
    invocation.onLine = [&seen](const std::string& line) { seen.push_back(line); };
    executor.execute(invocation);

    EXPECT_EQ(seen, (std::vector<std::string>{"a", "b", "c"}));
}

TEST_F(CommandExecutorTest, LineCallbackFailureDoesNotAbortCommand) {
    device->on("stream", {out("a\nb\n"), exitWith(0)});

    CommandInvocation invocation;
    invocation.command = "stream";
    invocation.onLine = [](const std::string&) { throw std::runtime_error("sink broke"); };
    CommandResult result = executor.execute(invocation);

    EXPECT_EQ(result.stdoutLines.size(), 2u);
}

TEST_F(CommandExecutorTest, TimeoutRaisesTimeoutError) {
    device->on("sleep", {out("working\n")});

    EXPECT_THROW(executor.run("sleep 100", std::chrono::milliseconds(20)), TimeoutError);
}

TEST_F(CommandExecutorTest, ExpectedDisconnectWithTokenSucceeds) {
    device->on("reboot", {out("Logging you out NOW\n"), drop()});

    CommandInvocation invocation;
    invocation.command = "reboot";
    invocation.disconnectExpected = true;
    invocation.successTokens = {"logging you out now"};
    CommandResult result = executor.execute(invocation);

    EXPECT_FALSE(result.exitStatus.has_value());
    EXPECT_TRUE(result.successTokenSeen);
    EXPECT_FALSE(sessions.isConnected());
}

TEST_F(CommandExecutorTest, ExpectedDisconnectAfterFailureStatusFails) {
    device->on("reboot", {out("something else\n"), exitWith(1), drop()});

    CommandInvocation invocation;
    invocation.command = "reboot";
    invocation.disconnectExpected = true;
    invocation.successTokens = {"logging you out now"};

    EXPECT_THROW(executor.execute(invocation), CommandExecutionError);
    EXPECT_FALSE(sessions.isConnected());
}

TEST_F(CommandExecutorTest, ExpectedDisconnectWithoutStatusSucceeds) {
    device->on("bootstrap", {out("rebooting\n"), drop()});

    CommandInvocation invocation;
    invocation.command = "sh bootstrap.sh";
    invocation.disconnectExpected = true;
    CommandResult result = executor.execute(invocation);

    EXPECT_FALSE(result.exitStatus.has_value());
    EXPECT_FALSE(result.successTokenSeen);
    EXPECT_EQ(result.stdoutLines, std::vector<std::string>{"rebooting"});
    EXPECT_FALSE(sessions.isConnected());
}

TEST_F(CommandExecutorTest, ExpectedDisconnectAfterZeroExitSucceeds) {
    device->on("logout", {out("bye\n"), exitWith(0), drop()});

    CommandInvocation invocation;
    invocation.command = "logout";
    invocation.disconnectExpected = true;
    invocation.successTokens = {"logging you out now"};
    CommandResult result = executor.execute(invocation);

    EXPECT_FALSE(result.exitStatus.has_value());
    EXPECT_FALSE(result.successTokenSeen);
    EXPECT_FALSE(sessions.isConnected());
    EXPECT_EQ(device->connectAttempts, 1);
}

TEST_F(CommandExecutorTest, UnexpectedDisconnectFails) {
    device->on("long", {out("halfway\n"), drop()});

    EXPECT_THROW(executor.run("long"), CommandExecutionError);

    // The next command opens a fresh session.
    executor.run("ls");
    EXPECT_EQ(device->connectAttempts, 2);
}

TEST_F(CommandExecutorTest, ExpectedDisconnectAcceptsCleanExit) {
    device->on("bootstrap", {out("done\n"), exitWith(0)});

    CommandInvocation invocation;
    invocation.command = "bootstrap";
    invocation.disconnectExpected = true;
    CommandResult result = executor.execute(invocation);

    EXPECT_FALSE(result.exitStatus.has_value());
}

TEST_F(CommandExecutorTest, ExpectedDisconnectAcceptsChannelCloseWithoutStatus) {
    device->on("bootstrap", {out("bye\n"), closeChannel()});

    CommandInvocation invocation;
    invocation.command = "bootstrap";
    invocation.disconnectExpected = true;

    EXPECT_NO_THROW(executor.execute(invocation));
}

TEST_F(CommandExecutorTest, ExpectedDisconnectStillRejectsFailingExit) {
    device->on("bootstrap", {err("missing file\n"), exitWith(1)});

    CommandInvocation invocation;
    invocation.command = "bootstrap";
    invocation.disconnectExpected = true;
    invocation.successTokens = {"ok"};

    EXPECT_THROW(executor.execute(invocation), CommandExecutionError);
}

TEST_F(CommandExecutorTest, StreamsInputThenEndOfInput) {
    const std::string payload(1500, 'x');
    std::istringstream input(payload);
    ExecutorConfig config = fastExecutorConfig();
    config.inputChunkSize = 256;
    CommandExecutor chunked(sessions, config);

    CommandInvocation invocation;
    invocation.command = "cat > /tmp/archive";
    invocation.input = &input;
    chunked.execute(invocation);

    ASSERT_EQ(device->inputs.size(), 1u);
    EXPECT_EQ(device->inputs.begin()->second, payload);
}

TEST_F(CommandExecutorTest, EnsureAccessChecksEcho) {
    EXPECT_NO_THROW(executor.ensureAccess());

    device->on("echo test", {out("nope\n"), exitWith(0)});
    EXPECT_THROW(executor.ensureAccess(), ConnectionError);

    device->on("echo test", {exitWith(255)});
    EXPECT_THROW(executor.ensureAccess(), ConnectionError);
}

TEST_F(CommandExecutorTest, AuthenticationErrorIsNotWrapped) {
    device->rejectPassword = true;

    EXPECT_THROW(executor.run("ls"), AuthenticationError);
}

TEST(ShellQuoteTest, EscapesSingleQuotes) {
    EXPECT_EQ(shellQuote("plain"), "'plain'");
    EXPECT_EQ(shellQuote("it's"), "'it'\\''s'");
}

TEST(FormatCommandFailureTest, TruncatesLongOutput) {
    const std::string message = formatCommandFailure("cmd", 1, std::string(1000, 'a'), "");

    EXPECT_NE(message.find("[truncated]"), std::string::npos);
    EXPECT_LT(message.size(), 600u);
}
