#include "executor/tool_executor.hpp"
#include "utils/debug_log.hpp"
#include "utils/text_utils.hpp"

#include <cctype>
#include <utility>

namespace tool_executor {

namespace {

const char kNoOutputPlaceholder[] = "(no output)";
const char kTruncatedMarker[] = "\n\n[output truncated]";

bool is_shell_safe_character(unsigned char character) {
    if (std::isalnum(character)) {
        return true;
    }
    switch (character) {
    case '_': case '@': case '%': case '+': case '=': case ':':
    case ',': case '.': case '/': case '-':
        return true;
    default:
        return false;
    }
}

bool is_placeholder_name(const std::string &name) {
    if (name.empty()) {
        return false;
    }
    for (unsigned char character : name) {
        if (!std::isalnum(character) && character != '_' && character != '-') {
            return false;
        }
    }
    return true;
}

// Argument keys exported as TOOL_<KEY> must be [A-Za-z0-9_]+.
bool is_environment_name(const std::string &key) {
    if (key.empty()) {
        return false;
    }
    for (unsigned char character : key) {
        if (!std::isalnum(character) && character != '_') {
            return false;
        }
    }
    return true;
}

// PowerShell single-quoted literal: embedded quotes are doubled.
std::string powershell_quote(const std::string &value) {
    std::string quoted = "'";
    for (char character : value) {
        if (character == '\'') {
            quoted += "''";
        } else {
            quoted += character;
        }
    }
    quoted += "'";
    return quoted;
}

InvocationPlan plan_failure(ExecutionErrorKind kind, const std::string &message) {
    InvocationPlan plan;
    plan.success = false;
    plan.error_kind = kind;
    plan.error_message = message;
    return plan;
}

InvocationPlan executable_not_found(const std::vector<std::string> &candidates) {
    return plan_failure(ExecutionErrorKind::ExecutableNotFound,
                        "Executable not found: " + text_utils::join(candidates, ", ") +
                            ". Install it or add it to PATH.");
}

InvocationPlan missing_parameter(const InterpolationResult &interpolation) {
    return plan_failure(ExecutionErrorKind::MissingParameter,
                        "Missing required parameter in command template: " +
                            interpolation.missing_parameter);
}

// Request with the settings every runtime shares.
platform::ProcessRequest base_request(const manifest::ToolDef &tool, const std::string &executable) {
    platform::ProcessRequest request;
    request.executable_path = executable;
    request.working_directory = tool.working_directory;
    request.timeout_seconds = tool.timeout_seconds;
    return request;
}

std::string describe_request(const platform::ProcessRequest &request) {
    std::string description = request.executable_path;
    for (const auto &argument : request.arguments) {
        description += " " + shell_quote(argument);
    }
    return description;
}

} // namespace

std::string error_kind_to_string(ExecutionErrorKind kind) {
    switch (kind) {
    case ExecutionErrorKind::None:
        return "none";
    case ExecutionErrorKind::Configuration:
        return "configuration";
    case ExecutionErrorKind::MissingParameter:
        return "missing_parameter";
    case ExecutionErrorKind::ExecutableNotFound:
        return "executable_not_found";
    case ExecutionErrorKind::TimedOut:
        return "timed_out";
    case ExecutionErrorKind::ProcessFailed:
        return "process_failed";
    case ExecutionErrorKind::UnknownTool:
        return "unknown_tool";
    }
    return "unknown";
}

std::string shell_quote(const std::string &value) {
    if (value.empty()) {
        return "''";
    }
    bool safe = true;
    for (unsigned char character : value) {
        if (!is_shell_safe_character(character)) {
            safe = false;
            break;
        }
    }
    if (safe) {
        return value;
    }

    // Close the quote, emit an escaped quote, reopen: ' -> '"'"'
    std::string quoted = "'";
    for (char character : value) {
        if (character == '\'') {
            quoted += "'\"'\"'";
        } else {
            quoted += character;
        }
    }
    quoted += "'";
    return quoted;
}

std::string argument_to_text(const json &value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_boolean()) {
        return value.get<bool>() ? "true" : "false";
    }
    if (value.is_null()) {
        return "";
    }
    return value.dump();
}

InterpolationResult interpolate_command(const std::string &template_text, const json &arguments) {
    InterpolationResult result;
    std::string command;
    command.reserve(template_text.size());

    size_t position = 0;
    while (position < template_text.size()) {
        char character = template_text[position];

        if (character == '{' && position + 1 < template_text.size() && template_text[position + 1] == '{') {
            command += '{';
            position += 2;
            continue;
        }
        if (character == '}' && position + 1 < template_text.size() && template_text[position + 1] == '}') {
            command += '}';
            position += 2;
            continue;
        }
        if (character != '{') {
            command += character;
            ++position;
            continue;
        }

        size_t closing = template_text.find('}', position + 1);
        if (closing == std::string::npos) {
            command += template_text.substr(position);
            break;
        }
        std::string name = template_text.substr(position + 1, closing - position - 1);
        if (!is_placeholder_name(name)) {
            // Not ours (e.g. awk '{print $1}'): copy the brace and keep scanning.
            command += character;
            ++position;
            continue;
        }

        if (!arguments.is_object() || !arguments.contains(name)) {
            result.success = false;
            result.missing_parameter = name;
            return result;
        }
        const json &value = arguments[name];
        if (value.is_number() || value.is_boolean()) {
            command += argument_to_text(value);
        } else {
            command += shell_quote(argument_to_text(value));
        }
        position = closing + 1;
    }

    result.success = true;
    result.command = command;
    return result;
}

std::string format_powershell_parameter(const std::string &name, const json &value) {
    if (value.is_boolean()) {
        return value.get<bool>() ? "-" + name : "";
    }
    if (value.is_null()) {
        return "";
    }
    if (value.is_number()) {
        return "-" + name + " " + value.dump();
    }
    if (value.is_array()) {
        std::vector<std::string> items;
        for (const auto &item : value) {
            items.push_back(powershell_quote(argument_to_text(item)));
        }
        return "-" + name + " @(" + text_utils::join(items, ",") + ")";
    }
    return "-" + name + " " + powershell_quote(argument_to_text(value));
}

std::string build_powershell_command(const manifest::ToolDef &tool, const json &arguments) {
    std::vector<std::string> parameter_parts;
    if (arguments.is_object()) {
        for (auto iterator = arguments.begin(); iterator != arguments.end(); ++iterator) {
            std::string part = format_powershell_parameter(iterator.key(), iterator.value());
            if (!part.empty()) {
                parameter_parts.push_back(part);
            }
        }
    }

    std::vector<std::string> statements;
    if (tool.module) {
        statements.push_back("Import-Module " + powershell_quote(*tool.module) + " -ErrorAction Stop");
    }

    std::string call = tool.function.value_or(tool.name);
    if (!parameter_parts.empty()) {
        call += " " + text_utils::join(parameter_parts, " ");
    }
    if (tool.output_format == manifest::OutputFormat::Json) {
        call += " | ConvertTo-Json -Depth 10 -Compress";
    }
    statements.push_back(call);

    return text_utils::join(statements, "; ");
}

std::string build_python_inline_program(const std::string &module_name, const std::string &function_name) {
    return "import json, sys; "
           "from " + module_name + " import " + function_name + "; "
           "args = json.loads(sys.stdin.read()); "
           "result = " + function_name + "(**args); "
           "print(json.dumps(result) if isinstance(result, (dict, list)) else str(result))";
}

ExecutionResult shape_process_result(const platform::ProcessResult &process,
                                     const platform::ProcessRequest &request,
                                     manifest::OutputFormat output_format) {
    ExecutionResult result;

    switch (process.status) {
    case platform::ProcessStatus::NotFound:
        result.error_kind = ExecutionErrorKind::ExecutableNotFound;
        result.error_message = "Executable not found: " + request.executable_path;
        return result;
    case platform::ProcessStatus::SpawnFailed:
        result.error_kind = ExecutionErrorKind::ProcessFailed;
        result.error_message = process.error_message;
        return result;
    case platform::ProcessStatus::TimedOut:
        result.error_kind = ExecutionErrorKind::TimedOut;
        result.error_message = "Tool execution timed out after " + std::to_string(request.timeout_seconds) +
                               " seconds.";
        return result;
    case platform::ProcessStatus::Exited:
        break;
    }

    std::string stdout_text = text_utils::trim(text_utils::sanitize_utf8(process.stdout_text));
    std::string stderr_text = text_utils::trim(text_utils::sanitize_utf8(process.stderr_text));

    if (process.exit_code != 0) {
        result.error_kind = ExecutionErrorKind::ProcessFailed;
        result.exit_code = process.exit_code;
        result.stderr_text = stderr_text;
        if (!stderr_text.empty()) {
            result.error_message = stderr_text;
        } else if (!stdout_text.empty()) {
            result.error_message = stdout_text;
        } else {
            result.error_message = "Process exited with code " + std::to_string(process.exit_code);
        }
        return result;
    }

    if (output_format == manifest::OutputFormat::Json && !stdout_text.empty()) {
        json structured = json::parse(stdout_text, nullptr, false);
        if (!structured.is_discarded()) {
            stdout_text = structured.dump(2);
        }
    }

    result.success = true;
    if (!stdout_text.empty() && !stderr_text.empty()) {
        result.output = stdout_text + "\n\n[stderr]\n" + stderr_text;
    } else if (!stdout_text.empty()) {
        result.output = stdout_text;
    } else if (!stderr_text.empty()) {
        result.output = stderr_text;
    } else {
        result.output = kNoOutputPlaceholder;
    }
    if (process.output_truncated) {
        result.output += kTruncatedMarker;
    }
    return result;
}

ExecutionResult ToolExecutor::execute(const manifest::ToolDef &tool, const json &arguments) {
    InvocationPlan invocation = plan(tool, arguments);
    if (!invocation.success) {
        ExecutionResult result;
        result.error_kind = invocation.error_kind;
        result.error_message = invocation.error_message;
        return result;
    }

    debug_log::log("Running " + tool.name + ": " + describe_request(invocation.request));
    debug_log::ScopedTimer timer("Tool " + tool.name);

    platform::ProcessResult process = platform::run_process(invocation.request);
    if (process.status == platform::ProcessStatus::Exited) {
        debug_log::log("Tool " + tool.name + " exited with code " + std::to_string(process.exit_code));
    }
    return shape_process_result(process, invocation.request, tool.output_format);
}

InvocationPlan ToolExecutor::plan(const manifest::ToolDef &tool, const json &arguments) {
    const json call_arguments = arguments.is_object() ? arguments : json::object();

    switch (tool.runtime) {
    case manifest::Runtime::PowerShell:
        return plan_powershell(tool, call_arguments);
    case manifest::Runtime::Python:
        return plan_python(tool, call_arguments);
    case manifest::Runtime::Bash:
        return plan_bash(tool, call_arguments);
    case manifest::Runtime::Node:
        return plan_node(tool, call_arguments);
    case manifest::Runtime::Cli:
        return plan_cli(tool, call_arguments);
    }
    return plan_failure(ExecutionErrorKind::Configuration,
                        "Unsupported runtime for tool '" + tool.name + "'");
}

InvocationPlan ToolExecutor::plan_powershell(const manifest::ToolDef &tool, const json &arguments) {
    const std::vector<std::string> candidates = {"pwsh", "powershell"};
    std::string executable = resolve_executable(candidates);
    if (executable.empty()) {
        return executable_not_found(candidates);
    }

    InvocationPlan plan;
    plan.request = base_request(tool, executable);
    plan.request.arguments = {"-NoProfile", "-NonInteractive", "-Command",
                              build_powershell_command(tool, arguments)};
    plan.success = true;
    return plan;
}

InvocationPlan ToolExecutor::plan_python(const manifest::ToolDef &tool, const json &arguments) {
    bool has_function_call = tool.module.has_value() && tool.function.has_value();
    if (!tool.script && !has_function_call) {
        return plan_failure(ExecutionErrorKind::Configuration,
                            "Python tool '" + tool.name +
                                "' must specify 'script' or both 'module' and 'function'.");
    }

    const std::vector<std::string> candidates = {"python3", "python"};
    std::string executable = resolve_executable(candidates);
    if (executable.empty()) {
        return executable_not_found(candidates);
    }

    InvocationPlan plan;
    plan.request = base_request(tool, executable);
    if (tool.script) {
        plan.request.arguments = {*tool.script};
    } else {
        plan.request.arguments = {"-c", build_python_inline_program(*tool.module, *tool.function)};
    }
    plan.request.stdin_data = arguments.dump();
    plan.success = true;
    return plan;
}

InvocationPlan ToolExecutor::plan_bash(const manifest::ToolDef &tool, const json &arguments) {
    if (!tool.script && !tool.command) {
        return plan_failure(ExecutionErrorKind::Configuration,
                            "Bash tool '" + tool.name + "' must specify 'command' or 'script'.");
    }

    std::string interpolated;
    if (!tool.script) {
        InterpolationResult interpolation = interpolate_command(*tool.command, arguments);
        if (!interpolation.success) {
            return missing_parameter(interpolation);
        }
        interpolated = interpolation.command;
    }

    const std::vector<std::string> candidates = {"bash"};
    std::string executable = resolve_executable(candidates);
    if (executable.empty()) {
        return executable_not_found(candidates);
    }

    InvocationPlan plan;
    plan.request = base_request(tool, executable);
    if (tool.script) {
        plan.request.arguments = {*tool.script};
        for (auto iterator = arguments.begin(); iterator != arguments.end(); ++iterator) {
            if (!is_environment_name(iterator.key())) {
                debug_log::log("Tool " + tool.name + ": argument '" + iterator.key() +
                               "' is not a valid variable name, not exported");
                continue;
            }
            plan.request.extra_environment["TOOL_" + text_utils::to_upper(iterator.key())] =
                argument_to_text(iterator.value());
        }
    } else {
        plan.request.arguments = {"-c", interpolated};
    }
    plan.success = true;
    return plan;
}

InvocationPlan ToolExecutor::plan_node(const manifest::ToolDef &tool, const json &arguments) {
    if (!tool.script && !tool.command) {
        return plan_failure(ExecutionErrorKind::Configuration,
                            "Node tool '" + tool.name + "' must specify 'script' or 'command'.");
    }

    const std::vector<std::string> candidates = {"node"};
    std::string executable = resolve_executable(candidates);
    if (executable.empty()) {
        return executable_not_found(candidates);
    }

    InvocationPlan plan;
    plan.request = base_request(tool, executable);
    if (tool.script) {
        plan.request.arguments = {*tool.script};
    } else {
        plan.request.arguments = {"-e", *tool.command};
    }
    plan.request.stdin_data = arguments.dump();
    plan.success = true;
    return plan;
}

InvocationPlan ToolExecutor::plan_cli(const manifest::ToolDef &tool, const json &arguments) {
    if (!tool.command) {
        return plan_failure(ExecutionErrorKind::Configuration,
                            "CLI tool '" + tool.name + "' must specify 'command'.");
    }

    InterpolationResult interpolation = interpolate_command(*tool.command, arguments);
    if (!interpolation.success) {
        return missing_parameter(interpolation);
    }

    const std::string shell = tool.shell.value_or("bash");
    const std::vector<std::string> candidates = {shell};
    std::string executable = resolve_executable(candidates);
    if (executable.empty()) {
        return executable_not_found(candidates);
    }

    InvocationPlan plan;
    plan.request = base_request(tool, executable);
    if (shell == "cmd") {
        plan.request.arguments = {"/c", interpolation.command};
    } else {
        plan.request.arguments = {"-c", interpolation.command};
    }
    plan.success = true;
    return plan;
}

std::string ToolExecutor::resolve_executable(const std::vector<std::string> &candidates) {
    std::string cache_key = text_utils::join(candidates, "|");
    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        auto cached = resolved_executables_.find(cache_key);
        if (cached != resolved_executables_.end()) {
            return cached->second;
        }
    }

    for (const auto &candidate : candidates) {
        std::string path = platform::find_executable(candidate);
        if (!path.empty()) {
            debug_log::log("Resolved " + candidate + " -> " + path);
            std::lock_guard<std::mutex> lock(cache_mutex_);
            resolved_executables_[cache_key] = path;
            return path;
        }
    }
    // Misses are not cached: the interpreter may be installed later.
    return "";
}

} // namespace tool_executor
