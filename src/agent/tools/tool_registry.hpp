#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "agent/tools/tool.hpp"

namespace pyexec::agent::tools {

// Owns tools by name and dispatches calls to them. Not synchronized: register
// everything before serving calls.
class ToolRegistry {
public:
    // A tool with the same name is replaced.
    void Register(std::unique_ptr<Tool> tool);
    // nullptr when no tool has that name.
    Tool* Get(const std::string& name);
    bool Has(const std::string& name) const;
    // Sorted by name.
    std::vector<ToolDefinition> GetDefinitions() const;
    // Logs the call; an unknown name yields "Error: Tool '<name>' not found".
    std::string Execute(const std::string& name,
                        const std::unordered_map<std::string, std::string>& params);

    // Sorted tool names.
    std::vector<std::string> List() const;

private:
    std::unordered_map<std::string, std::unique_ptr<Tool>> tools_;
};

}  // namespace pyexec::agent::tools
