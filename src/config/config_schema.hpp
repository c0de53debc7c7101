#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "utils/logging.hpp"

namespace pyexec::config {

struct ExecutorConfig {
    std::string workspace = ".";
    std::string tmp_dir_name = ".python_tmp";
    std::string script_extension = ".py";
    int default_timeout_s = 30;
    int max_timeout_s = 120;
    std::string launcher = "uv";
    // "{workspace}" is replaced with the resolved workspace root.
    std::vector<std::string> launcher_args = {"run", "--directory", "{workspace}"};
    std::size_t max_output_bytes = 8 * 1024 * 1024;
    int kill_grace_ms = 2000;
};

struct Config {
    ExecutorConfig executor;
    pyexec::utils::LogConfig logging;
};

}  // namespace pyexec::config
