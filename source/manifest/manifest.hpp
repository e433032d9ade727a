#ifndef TBMCPS_MANIFEST_HPP
#define TBMCPS_MANIFEST_HPP

// Manifest data model: the contract between tool authors and the bridge.
// A manifest is a JSON file describing one or more tools, the parameters they
// accept and the runtime that executes them. Manifests are written by hand or
// by discovery tooling; the bridge only reads (and can re-save) them.

#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace manifest {

using json = nlohmann::json;

// Execution strategy used to run a tool.
enum class Runtime {
    PowerShell,  // Module function call through pwsh/powershell.
    Python,      // Script file or module.function through the interpreter.
    Bash,        // Script file or command template through bash.
    Node,        // Script file or inline program through node.
    Cli          // Command template through the declared or default shell.
};

enum class OutputFormat {
    Text,
    Json
};

constexpr int kDefaultTimeoutSeconds = 120;

// "powershell", "python", "bash", "node", "cli".
std::string runtime_to_string(Runtime runtime);

// Returns std::nullopt for anything that is not one of the names above.
std::optional<Runtime> runtime_from_string(const std::string &name);

std::string output_format_to_string(OutputFormat format);
std::optional<OutputFormat> output_format_from_string(const std::string &name);

// Maps a declared parameter type (including foreign aliases such as Int32,
// SwitchParameter or String[]) to one of: string, integer, number, boolean,
// array. Unrecognized names map to string.
std::string normalize_parameter_type(const std::string &declared_type);

// One tool parameter.
struct ParameterDef {
    std::string type = "string";        // As declared; normalized on schema output.
    std::string description;
    bool required = false;
    std::optional<json> default_value;
    std::vector<json> enum_values;      // Empty: no restriction.
    std::optional<double> minimum;
    std::optional<double> maximum;

    // JSON-Schema fragment for client-side validation. Total: never fails.
    json to_json_schema() const;
};

// One invocable tool.
struct ToolDef {
    std::string name;
    std::string description;
    Runtime runtime = Runtime::Cli;
    std::optional<std::string> module;
    std::optional<std::string> function;    // Defaults to name where a function is needed.
    std::optional<std::string> command;     // Template with {param} placeholders.
    std::optional<std::string> script;
    std::optional<std::string> working_directory;
    int timeout_seconds = kDefaultTimeoutSeconds;
    OutputFormat output_format = OutputFormat::Text;
    std::map<std::string, ParameterDef> parameters;
    std::optional<std::string> shell;       // Cli runtime only.

    // {"type":"object","properties":{...},"required":[...]}; "required" is
    // omitted when no parameter is required.
    json input_schema() const;
};

// A named collection of tools plus defaults inherited by each tool entry.
struct ToolManifest {
    std::string version = "1.0";
    std::string description;
    std::optional<Runtime> default_runtime;
    std::optional<std::string> default_module;
    int default_timeout_seconds = kDefaultTimeoutSeconds;
    std::vector<ToolDef> tools;

    // Raw (persisted) form. Fields equal to the manifest-level default are omitted.
    json serialize() const;
};

enum class ManifestErrorKind {
    None,
    ParseError,      // Malformed document or missing tools[].name.
    InvalidRuntime   // A runtime string that names no known runtime.
};

struct ManifestParseResult {
    bool success = false;
    ToolManifest manifest;
    ManifestErrorKind error_kind = ManifestErrorKind::None;
    std::string error_message;
};

// Parse the raw form. Tools inherit runtime/module/timeout from "defaults"
// unless they set their own. Unknown fields are ignored.
ManifestParseResult parse_manifest(const json &raw);

// Read and parse one manifest file. Unreadable files and invalid JSON are
// reported as ParseError.
ManifestParseResult load_manifest_file(const std::string &file_path);

// Write manifest.serialize() as indented JSON. Returns false if the file
// cannot be written.
bool save_manifest_file(const ToolManifest &manifest, const std::string &file_path);

} // namespace manifest

#endif // TBMCPS_MANIFEST_HPP
