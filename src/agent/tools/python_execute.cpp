#include "agent/tools/python_execute.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

#include "nlohmann/json.hpp"
#include "sandbox/report_formatter.hpp"
#include "utils/common.hpp"

namespace pyexec::agent::tools {
namespace {

std::optional<std::string> GetParam(const std::unordered_map<std::string, std::string>& params,
                                    const std::string& name) {
    auto it = params.find(name);
    if (it == params.end()) {
        return std::nullopt;
    }
    return it->second;
}

// Text between the first <tag> and the </tag> that follows it.
std::optional<std::string> ExtractTag(const std::string& text, const std::string& tag) {
    const std::string open = "<" + tag + ">";
    const std::string close = "</" + tag + ">";
    const auto begin = text.find(open);
    if (begin == std::string::npos) {
        return std::nullopt;
    }
    const auto content_begin = begin + open.size();
    const auto end = text.find(close, content_begin);
    if (end == std::string::npos) {
        return std::nullopt;
    }
    return text.substr(content_begin, end - content_begin);
}

bool IsAllDigits(const std::string& value) {
    return !value.empty() && std::all_of(value.begin(), value.end(), [](unsigned char c) {
        return std::isdigit(c) != 0;
    });
}

}  // namespace

PythonExecuteTool::PythonExecuteTool(const pyexec::sandbox::PythonExecutor* executor)
    : executor_(executor) {}

std::string PythonExecuteTool::Description() const {
    return "Execute Python code directly under the agent workspace, and returns stdout, stderr, "
           "return code, and execution time in a structured format.";
}

std::string PythonExecuteTool::ParametersJson() const {
    const auto& config = executor_->Config();
    nlohmann::json schema = {
        {"type", "object"},
        {"properties", {
            {"code", {
                {"type", "string"},
                {"description", "Python code to execute (can be directly pasted into a .py file)"}
            }},
            {"filename", {
                {"type", "string"},
                {"description", "Filename for the Python file (including " + config.script_extension
                                    + " extension). If not provided, a random UUID will be used."}
            }},
            {"timeout", {
                {"type", "integer"},
                {"description", "Maximum execution time in seconds. Cannot exceed "
                                    + std::to_string(config.max_timeout_s)
                                    + " seconds; larger values are limited to the maximum. Default is "
                                    + std::to_string(config.default_timeout_s) + " seconds."}
            }}
        }},
        {"required", {"code"}}
    };
    return schema.dump();
}

std::string PythonExecuteTool::Execute(const std::unordered_map<std::string, std::string>& params) {
    const auto code = GetParam(params, "code");
    if (!code) {
        return "Error: code is required";
    }

    pyexec::sandbox::ExecutionRequest request{};
    request.code = *code;
    const auto filename = GetParam(params, "filename");
    if (filename && !filename->empty()) {
        request.filename = *filename;
    }
    const auto timeout = GetParam(params, "timeout");
    if (timeout && !pyexec::utils::Trim(*timeout).empty()) {
        int value = 0;
        if (!pyexec::utils::ParseStrictInt(*timeout, value)) {
            return pyexec::sandbox::FormatError(pyexec::sandbox::MakeError(
                pyexec::sandbox::ErrorKind::kInvalidTimeout,
                "timeout must be an integer, got '" + *timeout + "'"));
        }
        request.timeout_seconds = value;
    }
    return pyexec::sandbox::PythonExecutor::Render(executor_->ExecuteDetailed(request));
}

std::optional<ParsedAction> PythonExecuteTool::ParseAction(const std::string& action) {
    const std::string open = "<python_execute>";
    const std::string close = "</python_execute>";
    const auto begin = action.find(open);
    if (begin == std::string::npos) {
        return std::nullopt;
    }
    const auto end = action.find(close, begin + open.size());
    if (end == std::string::npos) {
        return std::nullopt;
    }
    const auto content = action.substr(begin + open.size(), end - begin - open.size());

    const auto code = ExtractTag(content, "code");
    if (!code) {
        return std::nullopt;
    }

    ParsedAction parsed{};
    parsed.parsed_action = action.substr(begin, end + close.size() - begin);
    parsed.code = pyexec::utils::Trim(*code);

    const auto filename = ExtractTag(content, "filename");
    if (filename && filename->find('\n') == std::string::npos) {
        const auto trimmed = pyexec::utils::Trim(*filename);
        if (!trimmed.empty()) {
            parsed.filename = trimmed;
        }
    }

    const auto timeout = ExtractTag(content, "timeout");
    int value = 0;
    if (timeout && IsAllDigits(*timeout) && pyexec::utils::ParseStrictInt(*timeout, value)) {
        parsed.timeout_seconds = value;
    }
    return parsed;
}

ActionOutcome PythonExecuteTool::ExecuteAction(const std::string& action) const {
    ActionOutcome outcome{};
    const auto parsed = ParseAction(action);
    if (!parsed) {
        return outcome;
    }

    pyexec::sandbox::ExecutionRequest request{};
    request.code = parsed->code;
    request.filename = parsed->filename;
    request.timeout_seconds = parsed->timeout_seconds;
    const auto result = executor_->ExecuteDetailed(request);

    outcome.is_valid = true;
    outcome.has_error = result.HasError();
    outcome.observation = "\n" + pyexec::sandbox::PythonExecutor::Render(result) + "\n";
    outcome.parsed_action = parsed->parsed_action;
    return outcome;
}

std::string PythonExecuteTool::InstructionString() const {
    const auto& config = executor_->Config();
    std::ostringstream oss;
    oss << "You have access to a Python code executor that runs code in an isolated workspace.\n\n"
        << "To execute Python code, use the following format:\n"
        << "<python_execute>\n"
        << "<code>\n"
        << "# Your Python code here\n"
        << "print('Hello, World!')\n"
        << "</code>\n"
        << "<filename>optional_name" << config.script_extension << "</filename>  <!-- Optional: specify filename -->\n"
        << "<timeout>" << config.default_timeout_s << "</timeout>  <!-- Optional: execution timeout in seconds (max "
        << config.max_timeout_s << ") -->\n"
        << "</python_execute>\n\n"
        << "Default timeout: " << config.default_timeout_s << " seconds\n"
        << "Maximum timeout: " << config.max_timeout_s << " seconds\n\n"
        << "The executor will return:\n"
        << "- Standard output (stdout)\n"
        << "- Standard error (stderr)\n"
        << "- Return code\n"
        << "- Execution time";
    return oss.str();
}

}  // namespace pyexec::agent::tools
