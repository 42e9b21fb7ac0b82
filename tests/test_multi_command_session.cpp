#include <gtest/gtest.h>
#include <shell/multi_command_session.hpp>
#include <ssh/terminal_modes.hpp>
#include <core/constants.hpp>
#include "fake_channel.hpp"
#include <chrono>
#include <thread>

using namespace std::chrono_literals;

class MultiCommandSessionTest : public ::testing::Test {
protected:
    FakeTransport transport;
    ScriptedShell shell;
    SessionConfig config;

    void SetUp() override {
        shell.outputs["echo hi"] = "hi";
        shell.outputs["ls /tmp"] = "a.txt\r\nb.txt";
    }

    std::unique_ptr<MultiCommandSession> open_session() {
        shell.install(*transport.state);
        auto opened = MultiCommandSession::open(transport, config);
        EXPECT_TRUE(opened.is_ok()) << opened.error;
        return std::move(opened.value);
    }

    // Poll until the session reports it has stopped.
    static bool wait_stopped(const MultiCommandSession& s) {
        auto until = std::chrono::steady_clock::now() + 2s;
        while (s.is_running() && std::chrono::steady_clock::now() < until) {
            std::this_thread::sleep_for(5ms);
        }
        return !s.is_running();
    }
};

// ── Handshake ────────────────────────────────────────────────

TEST_F(MultiCommandSessionTest, HandshakeLearnsPromptAndKernel) {
    auto session = open_session();
    ASSERT_TRUE(session);

    EXPECT_EQ(session->shell_prompt(), "$ ");
    EXPECT_EQ(session->kernel_name(), "linux");
    EXPECT_TRUE(session->is_running());

    EXPECT_EQ(transport.state->program, "/bin/bash");
    ASSERT_EQ(transport.state->writes.size(), 2u);
    EXPECT_EQ(transport.state->writes[0], "\n");
    EXPECT_EQ(transport.state->writes[1], "uname -s\n");
}

TEST_F(MultiCommandSessionTest, PtyAndEnvironmentRequested) {
    config.term = "vt100";
    config.rows = 40;
    config.columns = 132;
    config.env["LANG"] = "C";
    auto session = open_session();
    ASSERT_TRUE(session);

    EXPECT_EQ(transport.state->env.at("LANG"), "C");
    ASSERT_EQ(transport.state->pty_requests.size(), 1u);
    const auto& pty = transport.state->pty_requests[0];
    EXPECT_EQ(pty.term, "vt100");
    EXPECT_EQ(pty.rows, 40);
    EXPECT_EQ(pty.columns, 132);
    ASSERT_FALSE(pty.modes.empty());
    EXPECT_EQ(pty.modes[0].opcode, TTY_OP_ECHO);
    EXPECT_EQ(pty.modes[0].value, 0u);
}

TEST_F(MultiCommandSessionTest, CustomPromptAndDarwin) {
    shell.prompt = "me@box:~$ ";
    shell.kernel_reply = "Darwin\n";
    auto session = open_session();
    ASSERT_TRUE(session);

    EXPECT_EQ(session->shell_prompt(), "me@box:~$ ");
    EXPECT_EQ(session->kernel_name(), "darwin");

    auto r = session->run("echo hi", 2000);
    EXPECT_EQ(r.exit_code, SHELL_STATUS_OK);
    EXPECT_EQ(r.stdout_data, "hi");
}

TEST_F(MultiCommandSessionTest, OpenChannelFailure) {
    transport.fail_open = true;
    auto opened = MultiCommandSession::open(transport, config);
    EXPECT_TRUE(opened.is_err());
    EXPECT_FALSE(opened.value);
    EXPECT_NE(opened.error.find("administratively prohibited"), std::string::npos);
}

TEST_F(MultiCommandSessionTest, SetenvFailureClosesChannel) {
    config.env["FOO"] = "bar";
    transport.state->fail_setenv = true;
    auto opened = MultiCommandSession::open(transport, config);
    EXPECT_TRUE(opened.is_err());
    EXPECT_NE(opened.error.find("FOO"), std::string::npos);
    EXPECT_TRUE(transport.state->closed);
}

TEST_F(MultiCommandSessionTest, PtyFailureClosesChannel) {
    transport.state->fail_pty = true;
    auto opened = MultiCommandSession::open(transport, config);
    EXPECT_TRUE(opened.is_err());
    EXPECT_NE(opened.error.find("pty"), std::string::npos);
    EXPECT_TRUE(transport.state->closed);
}

TEST_F(MultiCommandSessionTest, StartFailureDiscardsSession) {
    shell.install(*transport.state);
    transport.state->fail_start = true;
    auto opened = MultiCommandSession::open(transport, config);
    EXPECT_TRUE(opened.is_err());
    EXPECT_FALSE(opened.value);
    EXPECT_NE(opened.error.find("/bin/bash"), std::string::npos);
    EXPECT_TRUE(transport.state->closed);
}

TEST_F(MultiCommandSessionTest, KernelProbeErrorFailsHandshake) {
    shell.install(*transport.state);
    auto scripted = transport.state->on_write;
    transport.state->on_write = [scripted](FakeShellState& s, const std::string& data) {
        if (data == "uname -s\n") {
            s.push_stderr("uname: not found\r\n");
            s.wait_consumed();
            std::this_thread::sleep_for(20ms);
            s.push_stdout("$ ");
            return;
        }
        scripted(s, data);
    };

    auto opened = MultiCommandSession::open(transport, config);
    ASSERT_TRUE(opened.is_err());
    EXPECT_NE(opened.error.find("uname: not found"), std::string::npos);
    EXPECT_TRUE(transport.state->closed);
}

TEST_F(MultiCommandSessionTest, BannerErrorFailsHandshake) {
    shell.install(*transport.state);
    transport.state->on_start = [](FakeShellState& s) {
        s.push_stderr("bash: /etc/bashrc: Permission denied\r\n");
        s.wait_consumed();
        std::this_thread::sleep_for(20ms);
        s.push_stdout("Welcome\r\n$ ");
    };

    auto opened = MultiCommandSession::open(transport, config);
    ASSERT_TRUE(opened.is_err());
    EXPECT_FALSE(opened.value);
    EXPECT_NE(opened.error.find("Shell startup reported"), std::string::npos);
    EXPECT_NE(opened.error.find("/etc/bashrc: Permission denied"), std::string::npos);
    EXPECT_TRUE(transport.state->closed);
    EXPECT_TRUE(transport.state->writes.empty());
}

// ── Commands ─────────────────────────────────────────────────

TEST_F(MultiCommandSessionTest, RunReturnsOutputWithoutPrompt) {
    auto session = open_session();
    ASSERT_TRUE(session);

    auto r = session->run("echo hi", 2000);
    EXPECT_EQ(r.exit_code, SHELL_STATUS_OK);
    EXPECT_EQ(r.stdout_data, "hi");
    EXPECT_TRUE(r.stderr_data.empty());

    auto r2 = session->run("ls /tmp");
    EXPECT_EQ(r2.stdout_data, "a.txt\r\nb.txt");
    EXPECT_EQ(transport.state->writes.back(), "ls /tmp\n");
}

TEST_F(MultiCommandSessionTest, RemoteErrorIsSoft) {
    auto session = open_session();
    ASSERT_TRUE(session);

    auto r = session->run("nosuchcmd", 2000);
    EXPECT_EQ(r.exit_code, SHELL_STATUS_REMOTE_ERROR);
    EXPECT_EQ(r.stderr_data, "bash: nosuchcmd: command not found\r\n");
    EXPECT_TRUE(session->is_running());

    auto next = session->run("echo hi", 2000);
    EXPECT_EQ(next.exit_code, SHELL_STATUS_OK);
    EXPECT_EQ(next.stdout_data, "hi");
}

TEST_F(MultiCommandSessionTest, CallerTerminators) {
    auto session = open_session();
    ASSERT_TRUE(session);
    transport.state->on_write = [](FakeShellState& s, const std::string&) {
        s.push_stdout("Are you sure? [y/N] ");
    };

    auto start = std::chrono::steady_clock::now();
    auto r = session->run("rm -i file", 3000, {"[y/N] $"});
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
    EXPECT_EQ(r.stdout_data, "Are you sure? [y/N] ");
}

TEST_F(MultiCommandSessionTest, SilentCommandTimesOut) {
    auto session = open_session();
    ASSERT_TRUE(session);
    transport.state->on_write = [](FakeShellState& s, const std::string&) {
        s.push_stdout("partial");
    };

    auto start = std::chrono::steady_clock::now();
    auto r = session->run("sleep 100", 100);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(r.exit_code, SHELL_STATUS_OK);
    EXPECT_EQ(r.stdout_data, "partial");
    EXPECT_GE(elapsed, 90ms);
    EXPECT_TRUE(session->is_running());
}

TEST_F(MultiCommandSessionTest, StaleOutputIsFlushed) {
    auto session = open_session();
    ASSERT_TRUE(session);

    transport.state->push_stdout("[1]+  Done   sleep 1\r\n$ ");
    ASSERT_TRUE(transport.state->wait_consumed());
    std::this_thread::sleep_for(20ms);

    auto r = session->run("echo hi", 2000);
    EXPECT_EQ(r.stdout_data, "hi");
}

TEST_F(MultiCommandSessionTest, WriteFailureIsIoError) {
    auto session = open_session();
    ASSERT_TRUE(session);
    transport.state->fail_write = true;

    auto start = std::chrono::steady_clock::now();
    auto r = session->run("echo hi", 5000);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);

    EXPECT_EQ(r.exit_code, SHELL_STATUS_IO_ERROR);
    EXPECT_TRUE(r.stdout_data.empty());
    EXPECT_NE(r.stderr_data.find("Failed to execute command: echo hi"), std::string::npos);
    EXPECT_NE(r.stderr_data.find("broken pipe"), std::string::npos);
}

// ── Teardown ─────────────────────────────────────────────────

TEST_F(MultiCommandSessionTest, ReadFailureTearsDownSession) {
    auto session = open_session();
    ASSERT_TRUE(session);

    transport.state->break_reads();
    EXPECT_TRUE(wait_stopped(*session));
    EXPECT_TRUE(transport.state->closed);
    EXPECT_TRUE(transport.state->input_closed);

    auto r = session->run("echo hi", 500);
    EXPECT_EQ(r.exit_code, SHELL_STATUS_IO_ERROR);
}

TEST_F(MultiCommandSessionTest, CloseIsIdempotent) {
    auto session = open_session();
    ASSERT_TRUE(session);

    session->close();
    session->close();
    EXPECT_FALSE(session->is_running());
    EXPECT_EQ(transport.state->close_calls, 1);

    session.reset();
    EXPECT_EQ(transport.state->close_calls, 1);
}

TEST_F(MultiCommandSessionTest, DestructorClosesChannel) {
    auto session = open_session();
    ASSERT_TRUE(session);
    session.reset();
    EXPECT_TRUE(transport.state->closed);
    EXPECT_TRUE(transport.state->input_closed);
}

// ── Kernel name ──────────────────────────────────────────────

TEST(KernelName, Normalize) {
    EXPECT_EQ(normalize_kernel_name("Linux"), "linux");
    EXPECT_EQ(normalize_kernel_name("  Darwin \r\n"), "darwin");
    EXPECT_EQ(normalize_kernel_name("Linux\n$ "), "linux");
    EXPECT_EQ(normalize_kernel_name(""), "");
}
