#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <variant>
#include <vector>

#include "config/config_loader.hpp"
#include "sandbox/workspace.hpp"
#include "test_util.hpp"
#include "utils/logging.hpp"

using pyexec::config::Config;
using pyexec::config::ExecutorConfig;
using pyexec::config::LoadConfig;
using pyexec::config::ValidateConfig;
using pyexec::test::TempWorkspace;
using pyexec::test::WriteFile;
using pyexec::utils::LogLevel;

namespace {

constexpr const char* kManagedVariables[] = {
    "PYTHON_EXECUTE_WORKSPACE",
    "PYEXEC_EXECUTOR__WORKSPACE",
    "PYEXEC_EXECUTOR__TMP_DIR_NAME",
    "PYEXEC_EXECUTOR__DEFAULT_TIMEOUT_S",
    "PYEXEC_EXECUTOR__MAX_TIMEOUT_S",
    "PYEXEC_EXECUTOR__LAUNCHER",
    "PYEXEC_EXECUTOR__LAUNCHER_ARGS",
    "PYEXEC_EXECUTOR__MAX_OUTPUT_BYTES",
    "PYEXEC_EXECUTOR__KILL_GRACE_MS",
    "PYEXEC_LOG_LEVEL",
};

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override { ClearEnvironment(); }
    void TearDown() override { ClearEnvironment(); }

    std::filesystem::path WriteConfig(const std::string& content) {
        const auto path = dir_.path() / "config.json";
        WriteFile(path, content);
        return path;
    }

    TempWorkspace dir_;

private:
    static void ClearEnvironment() {
        for (const char* name : kManagedVariables) {
            unsetenv(name);
        }
    }
};

}  // namespace

// NOLINTNEXTLINE
TEST_F(ConfigTest, defaults_without_file) {
    const Config config = LoadConfig(dir_.path() / "missing.json");
    EXPECT_EQ(config.executor.workspace, ".");
    EXPECT_EQ(config.executor.tmp_dir_name, ".python_tmp");
    EXPECT_EQ(config.executor.script_extension, ".py");
    EXPECT_EQ(config.executor.default_timeout_s, 30);
    EXPECT_EQ(config.executor.max_timeout_s, 120);
    EXPECT_EQ(config.executor.launcher, "uv");
    EXPECT_EQ(config.executor.launcher_args, (std::vector<std::string>{"run", "--directory", "{workspace}"}));
    EXPECT_EQ(config.executor.kill_grace_ms, 2000);
    EXPECT_EQ(config.logging.min_level, LogLevel::kInfo);
    EXPECT_EQ(ValidateConfig(config.executor), "");
}

// NOLINTNEXTLINE
TEST_F(ConfigTest, json_file_overrides_defaults) {
    const auto path = WriteConfig(R"({
        "executor": {
            "workspace": "/srv/agent",
            "tmpDirName": ".scratch",
            "defaultTimeoutS": 10,
            "maxTimeoutS": 60,
            "launcher": "python3",
            "launcherArgs": ["-u"],
            "maxOutputBytes": 4096,
            "killGraceMs": 250
        },
        "logging": {"level": "debug"}
    })");
    const Config config = LoadConfig(path);
    EXPECT_EQ(config.executor.workspace, "/srv/agent");
    EXPECT_EQ(config.executor.tmp_dir_name, ".scratch");
    EXPECT_EQ(config.executor.default_timeout_s, 10);
    EXPECT_EQ(config.executor.max_timeout_s, 60);
    EXPECT_EQ(config.executor.launcher, "python3");
    EXPECT_EQ(config.executor.launcher_args, std::vector<std::string>{"-u"});
    EXPECT_EQ(config.executor.max_output_bytes, 4096u);
    EXPECT_EQ(config.executor.kill_grace_ms, 250);
    EXPECT_EQ(config.logging.min_level, LogLevel::kDebug);
}

// NOLINTNEXTLINE
TEST_F(ConfigTest, wrong_types_are_ignored) {
    const auto path = WriteConfig(R"({"executor": {"defaultTimeoutS": "ten", "launcher": 5}})");
    const Config config = LoadConfig(path);
    EXPECT_EQ(config.executor.default_timeout_s, 30);
    EXPECT_EQ(config.executor.launcher, "uv");
}

// NOLINTNEXTLINE
TEST_F(ConfigTest, out_of_range_integers_are_ignored) {
    const auto path = WriteConfig(R"({"executor": {
        "defaultTimeoutS": 4294967326,
        "maxTimeoutS": -9999999999,
        "killGraceMs": 18446744073709551615,
        "launcher": "python3"
    }})");
    const Config config = LoadConfig(path);
    EXPECT_EQ(config.executor.default_timeout_s, 30);
    EXPECT_EQ(config.executor.max_timeout_s, 120);
    EXPECT_EQ(config.executor.kill_grace_ms, 2000);
    EXPECT_EQ(config.executor.launcher, "python3");
}

// NOLINTNEXTLINE
TEST_F(ConfigTest, malformed_json_keeps_defaults) {
    const auto path = WriteConfig("{ \"executor\": { \"maxTimeoutS\": 5, ");
    const Config config = LoadConfig(path);
    EXPECT_EQ(config.executor.max_timeout_s, 120);
    EXPECT_EQ(config.executor.launcher, "uv");
}

// NOLINTNEXTLINE
TEST_F(ConfigTest, environment_overrides_file) {
    const auto path = WriteConfig(R"({"executor": {"workspace": "/from/file", "maxTimeoutS": 60}})");
    setenv("PYEXEC_EXECUTOR__WORKSPACE", "/from/env", 1);
    setenv("PYEXEC_EXECUTOR__MAX_TIMEOUT_S", "90", 1);
    setenv("PYEXEC_EXECUTOR__LAUNCHER", "python3", 1);
    setenv("PYEXEC_EXECUTOR__LAUNCHER_ARGS", " -u , -X,utf8 ,", 1);
    setenv("PYEXEC_LOG_LEVEL", "WARNING", 1);
    const Config config = LoadConfig(path);
    EXPECT_EQ(config.executor.workspace, "/from/env");
    EXPECT_EQ(config.executor.max_timeout_s, 90);
    EXPECT_EQ(config.executor.launcher, "python3");
    EXPECT_EQ(config.executor.launcher_args, (std::vector<std::string>{"-u", "-X", "utf8"}));
    EXPECT_EQ(config.logging.min_level, LogLevel::kWarn);
}

// NOLINTNEXTLINE
TEST_F(ConfigTest, legacy_workspace_variable_is_a_fallback) {
    setenv("PYTHON_EXECUTE_WORKSPACE", "/legacy", 1);
    EXPECT_EQ(LoadConfig(dir_.path() / "missing.json").executor.workspace, "/legacy");

    setenv("PYEXEC_EXECUTOR__WORKSPACE", "/preferred", 1);
    EXPECT_EQ(LoadConfig(dir_.path() / "missing.json").executor.workspace, "/preferred");
}

// NOLINTNEXTLINE
TEST_F(ConfigTest, non_integer_environment_values_fall_back) {
    setenv("PYEXEC_EXECUTOR__DEFAULT_TIMEOUT_S", "soon", 1);
    setenv("PYEXEC_EXECUTOR__KILL_GRACE_MS", "1e3", 1);
    setenv("PYEXEC_LOG_LEVEL", "chatty", 1);
    const Config config = LoadConfig(dir_.path() / "missing.json");
    EXPECT_EQ(config.executor.default_timeout_s, 30);
    EXPECT_EQ(config.executor.kill_grace_ms, 2000);
    EXPECT_EQ(config.logging.min_level, LogLevel::kInfo);
}

// NOLINTNEXTLINE
TEST(validate_config, rejects_unusable_settings) {
    const auto with = [](auto mutate) {
        ExecutorConfig config{};
        mutate(config);
        return ValidateConfig(config);
    };
    EXPECT_NE(with([](ExecutorConfig& c) { c.default_timeout_s = 0; }), "");
    EXPECT_NE(with([](ExecutorConfig& c) { c.max_timeout_s = -1; }), "");
    EXPECT_NE(with([](ExecutorConfig& c) { c.default_timeout_s = 200; }), "");
    EXPECT_NE(with([](ExecutorConfig& c) { c.launcher.clear(); }), "");
    EXPECT_NE(with([](ExecutorConfig& c) { c.tmp_dir_name = ".."; }), "");
    EXPECT_NE(with([](ExecutorConfig& c) { c.tmp_dir_name = "a/b"; }), "");
    EXPECT_NE(with([](ExecutorConfig& c) { c.script_extension = "py"; }), "");
    EXPECT_NE(with([](ExecutorConfig& c) { c.script_extension = "."; }), "");
    EXPECT_NE(with([](ExecutorConfig& c) { c.kill_grace_ms = -5; }), "");
    EXPECT_EQ(with([](ExecutorConfig& c) { c.default_timeout_s = c.max_timeout_s; }), "");
}

// NOLINTNEXTLINE
TEST(workspace, empty_path_is_current_directory) {
    const auto res = pyexec::sandbox::ResolveWorkspace("");
    ASSERT_TRUE(std::holds_alternative<std::filesystem::path>(res));
    EXPECT_EQ(std::get<std::filesystem::path>(res), std::filesystem::current_path().lexically_normal());
}

// NOLINTNEXTLINE
TEST(workspace, relative_and_trailing_separator_paths_normalize) {
    const auto res = pyexec::sandbox::ResolveWorkspace("some/dir/../ws/");
    ASSERT_TRUE(std::holds_alternative<std::filesystem::path>(res));
    EXPECT_EQ(std::get<std::filesystem::path>(res), std::filesystem::current_path() / "some" / "ws");
}

// NOLINTNEXTLINE
TEST(workspace, tilde_expands_to_home) {
    const char* home = std::getenv("HOME");
    if (!home || std::string(home).empty() || home[0] != '/') {
        GTEST_SKIP() << "HOME is not an absolute path";
    }
    const auto res = pyexec::sandbox::ResolveWorkspace("~/agent");
    ASSERT_TRUE(std::holds_alternative<std::filesystem::path>(res));
    EXPECT_EQ(std::get<std::filesystem::path>(res),
              (std::filesystem::path(home) / "agent").lexically_normal());
}

// NOLINTNEXTLINE
TEST(log_level, parses_known_names) {
    EXPECT_EQ(pyexec::utils::ParseLogLevel("debug"), LogLevel::kDebug);
    EXPECT_EQ(pyexec::utils::ParseLogLevel("Info"), LogLevel::kInfo);
    EXPECT_EQ(pyexec::utils::ParseLogLevel("warn"), LogLevel::kWarn);
    EXPECT_EQ(pyexec::utils::ParseLogLevel("ERROR"), LogLevel::kError);
    EXPECT_FALSE(pyexec::utils::ParseLogLevel("verbose").has_value());
}
