#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "sandbox/exec_types.hpp"

namespace pyexec::sandbox {

// Writes submitted source text to <workspace>/<tmp_dir_name>/<name><extension>.
// Files are kept after the call; the scratch directory is never cleaned up here.
// Two concurrent calls with the same explicit name race: last write wins.
class ScriptMaterializer {
public:
    ScriptMaterializer(std::filesystem::path workspace,
                       std::string tmp_dir_name,
                       std::string extension);

    Result<ScratchFile> Materialize(const std::string& code,
                                    const std::optional<std::string>& filename) const;

    // Lexical checks only, touches nothing on disk. Returns the name relative to the scratch dir.
    Result<std::filesystem::path> ResolveName(const std::optional<std::string>& filename) const;

    const std::filesystem::path& ScratchDir() const { return scratch_dir_; }

private:
    std::filesystem::path workspace_;
    std::string tmp_dir_name_;
    std::string extension_;
    std::filesystem::path scratch_dir_;
};

}  // namespace pyexec::sandbox
