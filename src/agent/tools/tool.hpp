#pragma once

#include <string>
#include <unordered_map>

namespace pyexec::agent::tools {

// What a caller needs to offer a tool to a model: name, prose, JSON schema.
struct ToolDefinition {
    std::string name;
    std::string description;
    std::string parameters_json;
};

// A named operation driven by string parameters and answering with text.
class Tool {
public:
    virtual ~Tool() = default;

    // Registry key; unique per registry.
    virtual std::string Name() const = 0;
    virtual std::string Description() const = 0;
    // JSON schema object describing the accepted parameters.
    virtual std::string ParametersJson() const = 0;
    // Never throws for bad input; problems come back as text the model can read.
    virtual std::string Execute(const std::unordered_map<std::string, std::string>& params) = 0;
};

}  // namespace pyexec::agent::tools
