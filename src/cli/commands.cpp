#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

#include "agent/tools/python_execute.hpp"
#include "agent/tools/tool_registry.hpp"
#include "config/config_loader.hpp"
#include "nlohmann/json.hpp"
#include "sandbox/python_executor.hpp"
#include "sandbox/report_formatter.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace {

struct CliOptions {
    std::string command;
    std::optional<std::filesystem::path> config_path;
    std::optional<std::string> workspace;
    std::optional<std::string> filename;
    std::optional<std::string> timeout;
    std::optional<std::string> input_file;
};

void PrintUsage() {
    std::cout << "Usage: pyexec <command> [options]\n"
              << "\n"
              << "Commands:\n"
              << "  run [FILE]     execute code from FILE (or stdin) and print the report\n"
              << "  action         read an agent action from stdin and print the observation\n"
              << "  call           read a JSON tool call {\"name\", \"arguments\"} from stdin\n"
              << "  tools          print tool definitions as JSON\n"
              << "  instructions   print the action format instructions\n"
              << "\n"
              << "Options:\n"
              << "  --config PATH      config file (default ~/.pyexec/config.json)\n"
              << "  --workspace DIR    workspace root\n"
              << "  --filename NAME    script name inside the scratch directory (run)\n"
              << "  --timeout SECONDS  execution timeout (run)\n";
}

std::optional<CliOptions> ParseArgs(int argc, char** argv) {
    if (argc < 2) {
        return std::nullopt;
    }
    CliOptions options{};
    options.command = argv[1];
    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next = [&](std::optional<std::string>& target) {
            if (i + 1 >= argc) {
                std::cerr << "missing value for " << arg << std::endl;
                return false;
            }
            target = argv[++i];
            return true;
        };
        if (arg == "--config") {
            std::optional<std::string> value;
            if (!next(value)) {
                return std::nullopt;
            }
            options.config_path = *value;
        } else if (arg == "--workspace") {
            if (!next(options.workspace)) {
                return std::nullopt;
            }
        } else if (arg == "--filename") {
            if (!next(options.filename)) {
                return std::nullopt;
            }
        } else if (arg == "--timeout") {
            if (!next(options.timeout)) {
                return std::nullopt;
            }
        } else if (!arg.empty() && arg[0] == '-' && arg != "-") {
            std::cerr << "unknown option " << arg << std::endl;
            return std::nullopt;
        } else if (!options.input_file) {
            options.input_file = arg;
        } else {
            std::cerr << "unexpected argument " << arg << std::endl;
            return std::nullopt;
        }
    }
    return options;
}

std::optional<std::string> ReadInput(const std::optional<std::string>& path) {
    if (!path || *path == "-") {
        return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }
    std::ifstream input(*path, std::ios::in | std::ios::binary);
    if (!input.is_open()) {
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

std::unordered_map<std::string, std::string> ParseArguments(const nlohmann::json& args) {
    std::unordered_map<std::string, std::string> parsed;
    if (args.is_object()) {
        for (const auto& item : args.items()) {
            if (item.value().is_string()) {
                parsed[item.key()] = item.value().get<std::string>();
            } else if (!item.value().is_null()) {
                parsed[item.key()] = item.value().dump();
            }
        }
    }
    return parsed;
}

int RunCode(const pyexec::sandbox::PythonExecutor& executor, const CliOptions& options) {
    const auto code = ReadInput(options.input_file);
    if (!code) {
        std::cerr << "cannot read " << *options.input_file << std::endl;
        return 1;
    }
    pyexec::sandbox::ExecutionRequest request{};
    request.code = *code;
    request.filename = options.filename;
    if (options.timeout) {
        int value = 0;
        if (!pyexec::utils::ParseStrictInt(*options.timeout, value)) {
            std::cout << pyexec::sandbox::FormatError(pyexec::sandbox::MakeError(
                             pyexec::sandbox::ErrorKind::kInvalidTimeout,
                             "timeout must be an integer, got '" + *options.timeout + "'"))
                      << std::endl;
            return 1;
        }
        request.timeout_seconds = value;
    }
    const auto outcome = executor.ExecuteDetailed(request);
    std::cout << pyexec::sandbox::PythonExecutor::Render(outcome) << std::endl;
    return outcome.HasError() ? 1 : 0;
}

int RunAction(const pyexec::agent::tools::PythonExecuteTool& tool) {
    const auto action = ReadInput(std::nullopt);
    const auto outcome = tool.ExecuteAction(*action);
    if (!outcome.is_valid) {
        std::cerr << "no valid <python_execute> block with <code> found" << std::endl;
        return 2;
    }
    std::cout << outcome.observation << std::flush;
    return outcome.has_error ? 1 : 0;
}

int RunCall(pyexec::agent::tools::ToolRegistry& registry) {
    const auto input = ReadInput(std::nullopt);
    const auto call = nlohmann::json::parse(*input, nullptr, false);
    if (call.is_discarded() || !call.is_object() || !call.contains("name") || !call["name"].is_string()) {
        std::cerr << "expected a JSON object with a string \"name\"" << std::endl;
        return 2;
    }
    nlohmann::json arguments = nlohmann::json::object();
    if (call.contains("arguments")) {
        arguments = call["arguments"];
        if (arguments.is_string()) {
            arguments = nlohmann::json::parse(arguments.get<std::string>(), nullptr, false);
        }
    }
    std::cout << registry.Execute(call["name"].get<std::string>(), ParseArguments(arguments)) << std::endl;
    return 0;
}

int PrintTools(const pyexec::agent::tools::ToolRegistry& registry) {
    nlohmann::json defs = nlohmann::json::array();
    for (const auto& def : registry.GetDefinitions()) {
        defs.push_back({
            {"name", def.name},
            {"description", def.description},
            {"parameters", nlohmann::json::parse(def.parameters_json)}
        });
    }
    std::cout << defs.dump(2) << std::endl;
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    const auto options = ParseArgs(argc, argv);
    if (!options) {
        PrintUsage();
        return 2;
    }

    auto config = pyexec::config::LoadConfig(options->config_path);
    pyexec::utils::SetLogConfig(config.logging);
    if (options->workspace) {
        config.executor.workspace = *options->workspace;
    }

    auto created = pyexec::sandbox::PythonExecutor::Create(config.executor);
    if (const auto* error = std::get_if<pyexec::sandbox::ExecError>(&created)) {
        pyexec::utils::LogError("pyexec", error->message);
        return 1;
    }
    const auto& executor = std::get<pyexec::sandbox::PythonExecutor>(created);
    pyexec::utils::LogDebug("pyexec", "workspace " + executor.Workspace().string());

    pyexec::agent::tools::ToolRegistry registry;
    auto tool = std::make_unique<pyexec::agent::tools::PythonExecuteTool>(&executor);
    const auto* python_tool = tool.get();
    registry.Register(std::move(tool));

    if (options->command == "run") {
        return RunCode(executor, *options);
    }
    if (options->command == "action") {
        return RunAction(*python_tool);
    }
    if (options->command == "call") {
        return RunCall(registry);
    }
    if (options->command == "tools") {
        return PrintTools(registry);
    }
    if (options->command == "instructions") {
        std::cout << python_tool->InstructionString() << std::endl;
        return 0;
    }
    PrintUsage();
    return 2;
}
