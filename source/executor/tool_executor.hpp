#ifndef TBMCPS_TOOL_EXECUTOR_HPP
#define TBMCPS_TOOL_EXECUTOR_HPP

// Tool execution engine: turns a ToolDef plus call arguments into a subprocess
// invocation for the tool's runtime, runs it under the tool's timeout and
// shapes the captured output into text for the client.

#include "manifest/manifest.hpp"
#include "platform/platform_abi.hpp"

#include <nlohmann/json.hpp>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace tool_executor {

using json = nlohmann::json;

enum class ExecutionErrorKind {
    None,
    Configuration,       // The tool does not say how to run itself for its runtime.
    MissingParameter,    // A {placeholder} names an argument that was not given.
    ExecutableNotFound,  // Interpreter or shell binary not available.
    TimedOut,            // Deadline elapsed; the process was killed.
    ProcessFailed,       // Non-zero exit (exit_code and stderr_text are set) or spawn failure.
    UnknownTool          // Name not present in the tool table.
};

std::string error_kind_to_string(ExecutionErrorKind kind);

struct ExecutionResult {
    bool success = false;
    std::string output;
    ExecutionErrorKind error_kind = ExecutionErrorKind::None;
    std::string error_message;
    int exit_code = 0;
    std::string stderr_text;
};

// A fully resolved process invocation, or the reason one could not be built.
struct InvocationPlan {
    bool success = false;
    platform::ProcessRequest request;
    ExecutionErrorKind error_kind = ExecutionErrorKind::None;
    std::string error_message;
};

struct InterpolationResult {
    bool success = false;
    std::string command;
    std::string missing_parameter;
};

// POSIX shell quoting: values made only of safe characters pass through,
// everything else is wrapped in single quotes ('' for the empty string).
std::string shell_quote(const std::string &value);

// Textual form of an argument value: strings verbatim, booleans as
// true/false, numbers as JSON literals, null as empty, anything else as JSON.
std::string argument_to_text(const json &value);

// Replace {name} placeholders with argument values. Strings (and any other
// non-number, non-boolean value) are shell-quoted first. {{ and }} produce
// literal braces; braces around anything other than a plain identifier are
// left untouched. Fails on the first placeholder without a matching argument.
InterpolationResult interpolate_command(const std::string &template_text, const json &arguments);

// One named PowerShell argument: "-Name 'value'", "-Count 42", "-Force",
// "-Tags @('a','b')". A false (or null) value renders as "" and is dropped.
std::string format_powershell_parameter(const std::string &name, const json &value);

// The -Command text for a PowerShell tool.
std::string build_powershell_command(const manifest::ToolDef &tool, const json &arguments);

// The one-shot program run for a Python module+function tool.
std::string build_python_inline_program(const std::string &module_name, const std::string &function_name);

// Turn a finished (or failed) process into the client-facing result.
ExecutionResult shape_process_result(const platform::ProcessResult &process,
                                     const platform::ProcessRequest &request,
                                     manifest::OutputFormat output_format);

class ToolExecutor {
public:
    // Run the tool with the given arguments (a JSON object). Never throws for
    // tool-level failures; they come back in the result.
    ExecutionResult execute(const manifest::ToolDef &tool, const json &arguments);

    // Resolve the runtime strategy into a process request without running it.
    InvocationPlan plan(const manifest::ToolDef &tool, const json &arguments);

private:
    InvocationPlan plan_powershell(const manifest::ToolDef &tool, const json &arguments);
    InvocationPlan plan_python(const manifest::ToolDef &tool, const json &arguments);
    InvocationPlan plan_bash(const manifest::ToolDef &tool, const json &arguments);
    InvocationPlan plan_node(const manifest::ToolDef &tool, const json &arguments);
    InvocationPlan plan_cli(const manifest::ToolDef &tool, const json &arguments);

    // First candidate found on PATH, cached per candidate list.
    std::string resolve_executable(const std::vector<std::string> &candidates);

    std::mutex cache_mutex_;
    std::map<std::string, std::string> resolved_executables_;
};

} // namespace tool_executor

#endif // TBMCPS_TOOL_EXECUTOR_HPP
