#include <gtest/gtest.h>
#include <core/config.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        unsetenv("MCSH_PASSWORD");
        test_dir = fs::temp_directory_path() / "mcsh_config_test";
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        unsetenv("MCSH_PASSWORD");
        fs::remove_all(test_dir);
    }

    fs::path write_file(const std::string& name, const std::string& content) {
        auto path = test_dir / name;
        std::ofstream(path) << content;
        return path;
    }
};

TEST_F(ConfigTest, FullConfig) {
    auto result = Config::parse(R"(
host: build01.example.com
port: 2222
user: ci
password: hunter2
ssh_key_path: ~/.ssh/id_ed25519
timeout: 10
session:
  shell: /bin/zsh
  term: vt100
  rows: 50
  columns: 160
  env:
    LANG: C
    TZ: UTC
)");
    ASSERT_TRUE(result.is_ok()) << result.error;
    const auto& host = result.value.host();
    EXPECT_EQ(host.host, "build01.example.com");
    EXPECT_EQ(host.port, 2222);
    EXPECT_EQ(host.user, "ci");
    EXPECT_EQ(host.password, "hunter2");
    ASSERT_TRUE(host.ssh_key_path.has_value());
    EXPECT_EQ(*host.ssh_key_path, "~/.ssh/id_ed25519");
    EXPECT_EQ(host.timeout, 10);

    const auto& session = result.value.session();
    EXPECT_EQ(session.shell, "/bin/zsh");
    EXPECT_EQ(session.term, "vt100");
    EXPECT_EQ(session.rows, 50);
    EXPECT_EQ(session.columns, 160);
    ASSERT_EQ(session.env.size(), 2u);
    EXPECT_EQ(session.env.at("LANG"), "C");
    EXPECT_EQ(session.env.at("TZ"), "UTC");
}

TEST_F(ConfigTest, Defaults) {
    auto result = Config::parse("host: example.org\n");
    ASSERT_TRUE(result.is_ok()) << result.error;
    const auto& host = result.value.host();
    EXPECT_EQ(host.port, 22);
    EXPECT_EQ(host.timeout, 30);
    EXPECT_FALSE(host.ssh_key_path.has_value());

    const auto& session = result.value.session();
    EXPECT_EQ(session.shell, "/bin/bash");
    EXPECT_EQ(session.term, "xterm");
    EXPECT_EQ(session.rows, 100);
    EXPECT_EQ(session.columns, 100);
    EXPECT_TRUE(session.env.empty());
}

TEST_F(ConfigTest, EmptyDocumentGivesDefaults) {
    auto result = Config::parse("");
    ASSERT_TRUE(result.is_ok()) << result.error;
    EXPECT_EQ(result.value.host().port, 22);
    EXPECT_EQ(result.value.session().shell, "/bin/bash");
}

TEST_F(ConfigTest, EmptyShellFallsBackToBash) {
    auto result = Config::parse("session:\n  shell: \"\"\n");
    ASSERT_TRUE(result.is_ok()) << result.error;
    EXPECT_EQ(result.value.session().shell, "/bin/bash");
}

TEST_F(ConfigTest, PasswordFromEnvironment) {
    setenv("MCSH_PASSWORD", "from-env", 1);
    auto result = Config::parse("password: from-file\n");
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value.host().password, "from-env");
}

TEST_F(ConfigTest, MalformedYaml) {
    auto result = Config::parse("host: [unclosed\n");
    EXPECT_TRUE(result.is_err());
    EXPECT_NE(result.error.find("Failed to parse config"), std::string::npos);
}

TEST_F(ConfigTest, NonMapRoot) {
    auto result = Config::parse("- a\n- b\n");
    EXPECT_TRUE(result.is_err());
}

TEST_F(ConfigTest, UnparsableNumberKeepsDefault) {
    auto result = Config::parse("port: twenty-two\ntimeout: soon\n");
    ASSERT_TRUE(result.is_ok()) << result.error;
    EXPECT_EQ(result.value.host().port, 22);
    EXPECT_EQ(result.value.host().timeout, 30);
}

TEST_F(ConfigTest, LoadFromFile) {
    auto path = write_file("config.yaml", "host: h\nuser: u\n");
    auto result = Config::load(path);
    ASSERT_TRUE(result.is_ok()) << result.error;
    EXPECT_EQ(result.value.host().host, "h");
    EXPECT_EQ(result.value.host().user, "u");
}

TEST_F(ConfigTest, LoadMissingFile) {
    auto result = Config::load(test_dir / "nope.yaml");
    EXPECT_TRUE(result.is_err());
    EXPECT_NE(result.error.find("nope.yaml"), std::string::npos);
}

TEST_F(ConfigTest, LoadReportsPathOnParseError) {
    auto path = write_file("bad.yaml", "host: [\n");
    auto result = Config::load(path);
    EXPECT_TRUE(result.is_err());
    EXPECT_NE(result.error.find("bad.yaml"), std::string::npos);
}
