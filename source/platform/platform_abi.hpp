#ifndef TBMCPS_PLATFORM_ABI_HPP
#define TBMCPS_PLATFORM_ABI_HPP

// Platform abstraction interface.
// Each OS-specific implementation lives under platform/<os>/ and provides
// definitions for the functions declared here.

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace platform {

// Everything needed to run one child process to completion.
struct ProcessRequest {
    std::string executable_path;              // Absolute path (see find_executable).
    std::vector<std::string> arguments;       // argv[1..], argv[0] is the executable.
    std::optional<std::string> working_directory;
    std::optional<std::string> stdin_data;    // No payload: child stdin is /dev/null.
    std::map<std::string, std::string> extra_environment; // Added on top of our environment.
    int timeout_seconds = 120;
    size_t max_output_bytes = 16 * 1024 * 1024;  // Per stream; the rest is read and dropped.
};

enum class ProcessStatus {
    Exited,          // Ran to completion (exit_code is valid).
    TimedOut,        // Deadline elapsed, process group was killed.
    NotFound,        // Executable could not be located or executed.
    SpawnFailed      // Any other failure before the child started.
};

struct ProcessResult {
    ProcessStatus status = ProcessStatus::SpawnFailed;
    int exit_code = -1;
    std::string stdout_text;
    std::string stderr_text;
    bool output_truncated = false;  // Either stream hit max_output_bytes.
    std::string error_message;
};

// Spawn a child process, feed stdin, capture stdout and stderr separately and
// wait for it, killing its whole process group once timeout_seconds elapse.
ProcessResult run_process(const ProcessRequest &request);

// Locate an executable. Names containing '/' are checked directly and made
// absolute, bare names are searched on PATH. Returns empty string when not found.
std::string find_executable(const std::string &name);

// Read the entire contents of a text file into a string.
// Returns true on success, false on failure (file not found, permission, etc.).
bool read_file_contents(const std::string &file_path, std::string &output_contents);

// Write (truncate) a text file. Returns true on success.
bool write_file_contents(const std::string &file_path, const std::string &contents);

} // namespace platform

#endif // TBMCPS_PLATFORM_ABI_HPP
