#pragma once

#include <string>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load from a YAML file (see create_default_config for the layout)
    static Result<Config> load(const fs::path& path = get_default_config_path());

    // Parse YAML text; used by load() and directly by tests
    static Result<Config> parse(const std::string& yaml_text);

    // Accessors
    const HostConfig& host() const { return host_; }
    const SessionConfig& session() const { return session_; }

    // Config directory and file: ~/.mcsh/config.yaml
    static fs::path get_default_config_dir();
    static fs::path get_default_config_path();

public:
    Config() = default;

private:
    HostConfig host_;
    SessionConfig session_;
};

bool default_config_exists();

// Write a commented template config; existing files are left untouched.
Result<void> create_default_config();
