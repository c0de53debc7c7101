#include "sandbox/report_formatter.hpp"

#include <iomanip>
#include <sstream>
#include <vector>

#include "utils/common.hpp"

namespace pyexec::sandbox {

std::string FormatReport(const ExecutionResult& result, int timeout_seconds) {
    std::vector<std::string> parts;
    if (result.output.empty() && result.error.empty()) {
        parts.emplace_back(kNoOutputMarker);
    }
    if (!result.output.empty()) {
        parts.emplace_back(kStdoutHeader);
        parts.push_back(pyexec::utils::TrimRight(result.output));
    }
    if (!result.error.empty()) {
        parts.emplace_back(kStderrHeader);
        parts.push_back(pyexec::utils::TrimRight(result.error));
    }
    if (result.timed_out) {
        parts.emplace_back(kTimeoutHeader);
        parts.push_back("Execution timed out after " + std::to_string(timeout_seconds) + " seconds");
    }

    parts.emplace_back(kInfoHeader);
    parts.push_back(result.timed_out ? std::string("Return code: TIMEOUT")
                                     : "Return code: " + std::to_string(result.exit_code));
    std::ostringstream elapsed;
    elapsed << std::fixed << std::setprecision(3) << result.elapsed_seconds;
    parts.push_back("Execution time: " + elapsed.str() + " seconds");
    parts.push_back("Timeout limit: " + std::to_string(timeout_seconds) + " seconds");
    return pyexec::utils::Join(parts, "\n");
}

std::string FormatError(const ExecError& error) {
    return std::string(kErrorHeader) + "\n" + ToString(error.kind) + ": " + error.message;
}

}  // namespace pyexec::sandbox
