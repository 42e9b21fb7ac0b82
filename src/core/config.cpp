#include "config.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

fs::path Config::get_default_config_dir() {
    return platform::home_dir() / ".mcsh";
}

fs::path Config::get_default_config_path() {
    return get_default_config_dir() / "config.yaml";
}

bool default_config_exists() {
    return fs::exists(Config::get_default_config_path());
}

Result<void> create_default_config() {
    fs::path config_path = Config::get_default_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    fs::create_directories(config_path.parent_path());

    const char* default_config = R"(# mcsh configuration

host: ""
port: 22
user: ""
password: ""                 # or set MCSH_PASSWORD
# ssh_key_path: "~/.ssh/id_ed25519"
timeout: 30                  # connect timeout, seconds

session:
  shell: "/bin/bash"
  term: "xterm"
  rows: 100
  columns: 100
  env: {}
)";

    std::ofstream out(config_path);
    if (!out) {
        return Result<void>::Err("Failed to create config file at " + config_path.string());
    }
    out << default_config;
    if (!out) {
        return Result<void>::Err("Failed to write config file at " + config_path.string());
    }
    return Result<void>::Ok();
}

static HostConfig parse_host_config(const YAML::Node& node) {
    HostConfig host;
    host.host = node["host"].as<std::string>("");
    host.port = node["port"].as<int>(22);
    host.user = node["user"].as<std::string>("");
    host.password = node["password"].as<std::string>("");
    host.timeout = node["timeout"].as<int>(30);

    if (node["ssh_key_path"] && !node["ssh_key_path"].IsNull()) {
        host.ssh_key_path = node["ssh_key_path"].as<std::string>();
    }

    if (const char* pw = std::getenv("MCSH_PASSWORD")) {
        host.password = pw;
    }

    return host;
}

static SessionConfig parse_session_config(const YAML::Node& node) {
    SessionConfig session;
    if (!node || !node.IsMap()) return session;

    session.shell = node["shell"].as<std::string>(session.shell);
    session.term = node["term"].as<std::string>(session.term);
    session.rows = node["rows"].as<int>(session.rows);
    session.columns = node["columns"].as<int>(session.columns);

    if (node["env"] && node["env"].IsMap()) {
        for (const auto& kv : node["env"]) {
            session.env[kv.first.as<std::string>()] = kv.second.as<std::string>("");
        }
    }

    if (session.shell.empty()) session.shell = "/bin/bash";
    return session;
}

Result<Config> Config::parse(const std::string& yaml_text) {
    try {
        YAML::Node root = YAML::Load(yaml_text);
        Config config;
        if (root && root.IsMap()) {
            config.host_ = parse_host_config(root);
            config.session_ = parse_session_config(root["session"]);
        } else if (root && !root.IsNull()) {
            return Result<Config>::Err("Config root must be a mapping");
        } else {
            config.host_ = parse_host_config(YAML::Node(YAML::NodeType::Map));
        }
        return Result<Config>::Ok(std::move(config));
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err("Failed to parse config: " + std::string(e.what()));
    }
}

Result<Config> Config::load(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Result<Config>::Err("Cannot read config file: " + path.string());
    }
    std::stringstream ss;
    ss << in.rdbuf();

    auto parsed = parse(ss.str());
    if (parsed.is_err()) {
        return Result<Config>::Err(path.string() + ": " + parsed.error);
    }
    return parsed;
}
