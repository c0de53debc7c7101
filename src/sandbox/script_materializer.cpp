#include "sandbox/script_materializer.hpp"

#include <fstream>
#include <utility>

#include "utils/common.hpp"
#include "utils/logging.hpp"
#include "utils/uuid.hpp"

namespace pyexec::sandbox {
namespace {

bool EndsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size()
        && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// True when path is base itself or lies underneath it. Both must be normalized.
bool IsWithin(const std::filesystem::path& path, const std::filesystem::path& base) {
    const auto relative = path.lexically_relative(base);
    if (relative.empty()) {
        return false;
    }
    return *relative.begin() != "..";
}

}  // namespace

ScriptMaterializer::ScriptMaterializer(std::filesystem::path workspace,
                                       std::string tmp_dir_name,
                                       std::string extension)
    : workspace_(std::move(workspace)),
      tmp_dir_name_(std::move(tmp_dir_name)),
      extension_(std::move(extension)),
      scratch_dir_((workspace_ / tmp_dir_name_).lexically_normal()) {}

Result<std::filesystem::path> ScriptMaterializer::ResolveName(
    const std::optional<std::string>& filename) const {
    std::string name = filename ? *filename : pyexec::utils::GenerateUuid() + extension_;
    if (pyexec::utils::Trim(name).empty()) {
        return MakeError(ErrorKind::kInvalidName, "filename is empty");
    }
    if (name.find('\0') != std::string::npos) {
        return MakeError(ErrorKind::kInvalidName, "filename contains a NUL byte");
    }
    if (!EndsWith(name, extension_)) {
        name += extension_;
    }

    const std::filesystem::path requested(name);
    if (requested.has_root_path()) {
        return MakeError(ErrorKind::kInvalidName, "filename '" + name + "' is an absolute path");
    }
    const auto target = (scratch_dir_ / requested).lexically_normal();
    const auto relative = target.lexically_relative(scratch_dir_);
    if (relative.empty() || relative == "." || *relative.begin() == "..") {
        return MakeError(ErrorKind::kInvalidName,
                         "filename '" + name + "' escapes the scratch directory");
    }
    return relative;
}

Result<ScratchFile> ScriptMaterializer::Materialize(
    const std::string& code,
    const std::optional<std::string>& filename) const {
    auto resolved = ResolveName(filename);
    if (!IsOk(resolved)) {
        return std::get<ExecError>(std::move(resolved));
    }
    const auto& relative = std::get<std::filesystem::path>(resolved);
    const auto target = scratch_dir_ / relative;

    // A symlinked component below the scratch dir could still point outside of it.
    std::error_code ec;
    const auto canonical_scratch = std::filesystem::weakly_canonical(scratch_dir_, ec);
    if (ec) {
        return MakeError(ErrorKind::kUnexpected,
                         "cannot inspect scratch directory " + scratch_dir_.string() + ": " + ec.message());
    }
    const auto canonical_parent = std::filesystem::weakly_canonical(target.parent_path(), ec);
    if (ec) {
        return MakeError(ErrorKind::kUnexpected,
                         "cannot inspect " + target.parent_path().string() + ": " + ec.message());
    }
    if (!IsWithin(canonical_parent, canonical_scratch)) {
        return MakeError(ErrorKind::kInvalidName,
                         "filename '" + relative.string() + "' resolves outside the scratch directory");
    }
    const auto status = std::filesystem::symlink_status(target, ec);
    if (std::filesystem::is_symlink(status)) {
        return MakeError(ErrorKind::kInvalidName, "refusing to write through symlink " + target.string());
    }
    if (std::filesystem::is_directory(status)) {
        return MakeError(ErrorKind::kInvalidName, target.string() + " is a directory");
    }

    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec) {
        return MakeError(ErrorKind::kUnexpected,
                         "cannot create " + target.parent_path().string() + ": " + ec.message());
    }

    std::ofstream file(target, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return MakeError(ErrorKind::kUnexpected, "failed to open " + target.string() + " for writing");
    }
    file.write(code.data(), static_cast<std::streamsize>(code.size()));
    file.close();
    if (!file) {
        return MakeError(ErrorKind::kUnexpected, "failed to write " + target.string());
    }

    pyexec::utils::LogDebug("materialize", "wrote " + std::to_string(code.size()) + " bytes to " + target.string());
    ScratchFile scratch{};
    scratch.path = target;
    scratch.relative_path = "./" + tmp_dir_name_ + "/" + relative.generic_string();
    return scratch;
}

}  // namespace pyexec::sandbox
