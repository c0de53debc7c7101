#pragma once

#include <optional>
#include <string>
#include <unordered_map>

#include "agent/tools/tool.hpp"
#include "sandbox/python_executor.hpp"

namespace pyexec::agent::tools {

// Action text format understood by ParseAction:
//   <python_execute>
//   <code>...</code>
//   <filename>optional.py</filename>
//   <timeout>30</timeout>
//   </python_execute>
struct ParsedAction {
    std::string code;
    std::optional<std::string> filename;
    std::optional<int> timeout_seconds;
    // The whole <python_execute>...</python_execute> block as it appeared.
    std::string parsed_action;
};

struct ActionOutcome {
    bool is_valid = false;
    bool has_error = true;
    std::string observation;
    std::string parsed_action;
};

class PythonExecuteTool : public Tool {
public:
    explicit PythonExecuteTool(const pyexec::sandbox::PythonExecutor* executor);

    std::string Name() const override { return "python_execute"; }
    std::string Description() const override;
    std::string ParametersJson() const override;
    std::string Execute(const std::unordered_map<std::string, std::string>& params) override;

    static std::optional<ParsedAction> ParseAction(const std::string& action);
    ActionOutcome ExecuteAction(const std::string& action) const;
    std::string InstructionString() const;

private:
    const pyexec::sandbox::PythonExecutor* executor_ = nullptr;
};

}  // namespace pyexec::agent::tools
