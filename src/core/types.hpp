#pragma once

#include <string>
#include <optional>
#include <vector>
#include <map>
#include <functional>
#include <cstdint>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Outcome of one command on a remote shell.
// exit_code is one of the SHELL_STATUS_* values (core/constants.hpp):
// remote error-stream text lands in stderr_data with SHELL_STATUS_REMOTE_ERROR,
// local failures carry their message in stderr_data with SHELL_STATUS_IO_ERROR.
struct SSHResult {
    int exit_code;
    std::string stdout_data;
    std::string stderr_data;

    bool success() const { return exit_code == 0; }
    bool failed() const { return exit_code != 0; }
};

// Where and how to reach the remote host
struct HostConfig {
    std::string host;
    int port = 22;
    std::string user;
    std::string password;
    int timeout = 30;                            // connect timeout, seconds
    std::optional<std::string> ssh_key_path;     // private key; public key is <path>.pub
};

// Remote shell channel settings
struct SessionConfig {
    std::string shell = "/bin/bash";
    std::string term = "xterm";
    int rows = 100;
    int columns = 100;
    std::map<std::string, std::string> env;
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
