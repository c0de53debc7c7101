#include "sandbox/workspace.hpp"

#include <cstdlib>

namespace pyexec::sandbox {
namespace {

std::string ExpandHome(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }
    if (path.size() > 1 && path[1] != '/') {
        return path;
    }
    const char* home = std::getenv("HOME");
    if (!home) {
        return path;
    }
    return std::string(home) + path.substr(1);
}

}  // namespace

Result<std::filesystem::path> ResolveWorkspace(const std::string& configured_path) {
    const auto expanded = ExpandHome(configured_path.empty() ? std::string(".") : configured_path);
    std::error_code ec;
    auto absolute = std::filesystem::absolute(expanded, ec);
    if (ec) {
        return MakeError(ErrorKind::kUnexpected,
                         "cannot resolve workspace '" + configured_path + "': " + ec.message());
    }
    absolute = absolute.lexically_normal();
    // "/a/b/" normalizes to "/a/b/" with an empty filename; drop it so joins stay clean.
    if (absolute.has_relative_path() && absolute.filename().empty()) {
        absolute = absolute.parent_path();
    }
    return absolute;
}

}  // namespace pyexec::sandbox
