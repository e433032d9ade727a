#include "manifest/manifest.hpp"
#include "platform/platform_abi.hpp"

#include <climits>
#include <cmath>
#include <utility>

namespace manifest {

namespace {

// Declared type name -> normalized schema type. Covers the names discovery
// tooling emits for PowerShell and Python in addition to the schema names.
const std::map<std::string, std::string> &parameter_type_aliases() {
    static const std::map<std::string, std::string> aliases = {
        {"string", "string"},   {"String", "string"},   {"str", "string"},
        {"char", "string"},     {"Char", "string"},     {"guid", "string"},
        {"Guid", "string"},     {"DateTime", "string"},
        {"integer", "integer"}, {"int", "integer"},     {"Int16", "integer"},
        {"Int32", "integer"},   {"Int64", "integer"},   {"UInt16", "integer"},
        {"UInt32", "integer"},  {"UInt64", "integer"},  {"long", "integer"},
        {"Byte", "integer"},
        {"number", "number"},   {"float", "number"},    {"Single", "number"},
        {"double", "number"},   {"Double", "number"},   {"Decimal", "number"},
        {"boolean", "boolean"}, {"bool", "boolean"},    {"Boolean", "boolean"},
        {"SwitchParameter", "boolean"},
        {"array", "array"},     {"list", "array"},      {"tuple", "array"},
        {"String[]", "array"},  {"Int32[]", "array"},   {"Object[]", "array"},
    };
    return aliases;
}

// Integral values print as integers ("minimum": 1, not 1.0).
json number_to_json(double value) {
    if (std::floor(value) == value && std::fabs(value) < 9.0e15) {
        return static_cast<long long>(value);
    }
    return value;
}

ManifestParseResult make_failure(ManifestErrorKind kind, const std::string &message) {
    ManifestParseResult result;
    result.success = false;
    result.error_kind = kind;
    result.error_message = message;
    return result;
}

bool is_present(const json &object, const char *key) {
    return object.contains(key) && !object[key].is_null();
}

// Field readers: an absent (or null) field leaves the output untouched and
// succeeds; a field of the wrong JSON type fails with a message in error.

bool read_string(const json &object, const char *key, const std::string &context,
                 std::string &output, std::string &error) {
    if (!is_present(object, key)) {
        return true;
    }
    if (!object[key].is_string()) {
        error = context + ": field '" + key + "' must be a string";
        return false;
    }
    output = object[key].get<std::string>();
    return true;
}

// Empty strings count as absent.
bool read_optional_string(const json &object, const char *key, const std::string &context,
                          std::optional<std::string> &output, std::string &error) {
    std::string value;
    if (!read_string(object, key, context, value, error)) {
        return false;
    }
    if (!value.empty()) {
        output = value;
    }
    return true;
}

bool read_bool(const json &object, const char *key, const std::string &context,
               bool &output, std::string &error) {
    if (!is_present(object, key)) {
        return true;
    }
    if (!object[key].is_boolean()) {
        error = context + ": field '" + key + "' must be a boolean";
        return false;
    }
    output = object[key].get<bool>();
    return true;
}

bool read_optional_number(const json &object, const char *key, const std::string &context,
                          std::optional<double> &output, std::string &error) {
    if (!is_present(object, key)) {
        return true;
    }
    if (!object[key].is_number()) {
        error = context + ": field '" + key + "' must be a number";
        return false;
    }
    output = object[key].get<double>();
    return true;
}

bool read_timeout(const json &object, const std::string &context, int &output, std::string &error) {
    if (!is_present(object, "timeout")) {
        return true;
    }
    const json &value = object["timeout"];
    if (!value.is_number()) {
        error = context + ": field 'timeout' must be a number of seconds";
        return false;
    }
    double seconds = value.get<double>();
    if (!(seconds > 0.0) || seconds > static_cast<double>(INT_MAX)) {
        error = context + ": field 'timeout' must be a positive number of seconds";
        return false;
    }
    output = static_cast<int>(std::ceil(seconds));
    return true;
}

std::string invalid_runtime_message(const std::string &context, const std::string &value) {
    return context + ": invalid runtime '" + value +
           "' (expected one of: powershell, python, bash, node, cli)";
}

bool parse_parameter(const std::string &parameter_name, const json &raw_parameter,
                     const std::string &tool_context, ParameterDef &parameter, std::string &error) {
    std::string context = tool_context + " parameter '" + parameter_name + "'";
    if (!raw_parameter.is_object()) {
        error = context + ": must be an object";
        return false;
    }

    std::string declared_type;
    if (!read_string(raw_parameter, "type", context, declared_type, error) ||
        !read_string(raw_parameter, "description", context, parameter.description, error) ||
        !read_bool(raw_parameter, "required", context, parameter.required, error) ||
        !read_optional_number(raw_parameter, "minimum", context, parameter.minimum, error) ||
        !read_optional_number(raw_parameter, "maximum", context, parameter.maximum, error)) {
        return false;
    }
    if (!declared_type.empty()) {
        parameter.type = declared_type;
    }

    if (is_present(raw_parameter, "default")) {
        parameter.default_value = raw_parameter["default"];
    }
    if (is_present(raw_parameter, "enum")) {
        if (!raw_parameter["enum"].is_array()) {
            error = context + ": field 'enum' must be an array";
            return false;
        }
        for (const auto &choice : raw_parameter["enum"]) {
            parameter.enum_values.push_back(choice);
        }
    }
    return true;
}

ManifestParseResult parse_tool(const json &raw_tool, size_t index, const ToolManifest &owner,
                               ToolDef &tool) {
    std::string context = "tools[" + std::to_string(index) + "]";
    if (!raw_tool.is_object()) {
        return make_failure(ManifestErrorKind::ParseError, context + ": must be an object");
    }
    if (!is_present(raw_tool, "name")) {
        return make_failure(ManifestErrorKind::ParseError,
                            context + ": missing required field 'name'");
    }
    if (!raw_tool["name"].is_string() || raw_tool["name"].get<std::string>().empty()) {
        return make_failure(ManifestErrorKind::ParseError,
                            context + ": field 'name' must be a non-empty string");
    }
    tool.name = raw_tool["name"].get<std::string>();
    context = "tool '" + tool.name + "'";

    std::string error;
    std::string runtime_name;
    std::string output_format_name;
    if (!read_string(raw_tool, "description", context, tool.description, error) ||
        !read_string(raw_tool, "runtime", context, runtime_name, error) ||
        !read_optional_string(raw_tool, "module", context, tool.module, error) ||
        !read_optional_string(raw_tool, "function", context, tool.function, error) ||
        !read_optional_string(raw_tool, "command", context, tool.command, error) ||
        !read_optional_string(raw_tool, "script", context, tool.script, error) ||
        !read_optional_string(raw_tool, "working_directory", context, tool.working_directory, error) ||
        !read_optional_string(raw_tool, "shell", context, tool.shell, error) ||
        !read_string(raw_tool, "output_format", context, output_format_name, error)) {
        return make_failure(ManifestErrorKind::ParseError, error);
    }

    if (!runtime_name.empty()) {
        std::optional<Runtime> runtime = runtime_from_string(runtime_name);
        if (!runtime) {
            return make_failure(ManifestErrorKind::InvalidRuntime,
                                invalid_runtime_message(context, runtime_name));
        }
        tool.runtime = *runtime;
    } else {
        tool.runtime = owner.default_runtime.value_or(Runtime::Cli);
    }

    if (!tool.module) {
        tool.module = owner.default_module;
    }

    tool.timeout_seconds = owner.default_timeout_seconds;
    if (!read_timeout(raw_tool, context, tool.timeout_seconds, error)) {
        return make_failure(ManifestErrorKind::ParseError, error);
    }

    if (!output_format_name.empty()) {
        std::optional<OutputFormat> format = output_format_from_string(output_format_name);
        if (!format) {
            return make_failure(ManifestErrorKind::ParseError,
                                context + ": unknown output_format '" + output_format_name +
                                    "' (expected text or json)");
        }
        tool.output_format = *format;
    }

    if (is_present(raw_tool, "parameters")) {
        const json &raw_parameters = raw_tool["parameters"];
        if (!raw_parameters.is_object()) {
            return make_failure(ManifestErrorKind::ParseError,
                                context + ": field 'parameters' must be an object");
        }
        for (auto iterator = raw_parameters.begin(); iterator != raw_parameters.end(); ++iterator) {
            ParameterDef parameter;
            if (!parse_parameter(iterator.key(), iterator.value(), context, parameter, error)) {
                return make_failure(ManifestErrorKind::ParseError, error);
            }
            tool.parameters[iterator.key()] = std::move(parameter);
        }
    }

    ManifestParseResult success;
    success.success = true;
    return success;
}

json serialize_parameter(const ParameterDef &parameter) {
    json raw_parameter;
    raw_parameter["type"] = parameter.type;
    if (!parameter.description.empty()) {
        raw_parameter["description"] = parameter.description;
    }
    if (parameter.required) {
        raw_parameter["required"] = true;
    }
    if (parameter.default_value) {
        raw_parameter["default"] = *parameter.default_value;
    }
    if (!parameter.enum_values.empty()) {
        raw_parameter["enum"] = parameter.enum_values;
    }
    if (parameter.minimum) {
        raw_parameter["minimum"] = number_to_json(*parameter.minimum);
    }
    if (parameter.maximum) {
        raw_parameter["maximum"] = number_to_json(*parameter.maximum);
    }
    return raw_parameter;
}

} // namespace

std::string runtime_to_string(Runtime runtime) {
    switch (runtime) {
    case Runtime::PowerShell:
        return "powershell";
    case Runtime::Python:
        return "python";
    case Runtime::Bash:
        return "bash";
    case Runtime::Node:
        return "node";
    case Runtime::Cli:
        return "cli";
    }
    return "cli";
}

std::optional<Runtime> runtime_from_string(const std::string &name) {
    static const std::map<std::string, Runtime> runtimes = {
        {"powershell", Runtime::PowerShell},
        {"python", Runtime::Python},
        {"bash", Runtime::Bash},
        {"node", Runtime::Node},
        {"cli", Runtime::Cli},
    };
    auto found = runtimes.find(name);
    if (found == runtimes.end()) {
        return std::nullopt;
    }
    return found->second;
}

std::string output_format_to_string(OutputFormat format) {
    return format == OutputFormat::Json ? "json" : "text";
}

std::optional<OutputFormat> output_format_from_string(const std::string &name) {
    if (name == "text") {
        return OutputFormat::Text;
    }
    if (name == "json") {
        return OutputFormat::Json;
    }
    return std::nullopt;
}

std::string normalize_parameter_type(const std::string &declared_type) {
    const auto &aliases = parameter_type_aliases();
    auto found = aliases.find(declared_type);
    if (found == aliases.end()) {
        return "string";
    }
    return found->second;
}

json ParameterDef::to_json_schema() const {
    std::string schema_type = normalize_parameter_type(type);

    json schema;
    schema["type"] = schema_type;
    schema["description"] = description;
    if (default_value) {
        schema["default"] = *default_value;
    }
    if (!enum_values.empty()) {
        schema["enum"] = enum_values;
    }
    // Range bounds are meaningless for non-numeric schema types.
    if (schema_type == "integer" || schema_type == "number") {
        if (minimum) {
            schema["minimum"] = number_to_json(*minimum);
        }
        if (maximum) {
            schema["maximum"] = number_to_json(*maximum);
        }
    }
    return schema;
}

json ToolDef::input_schema() const {
    json properties = json::object();
    json required = json::array();
    for (const auto &entry : parameters) {
        properties[entry.first] = entry.second.to_json_schema();
        if (entry.second.required) {
            required.push_back(entry.first);
        }
    }

    json schema;
    schema["type"] = "object";
    schema["properties"] = properties;
    if (!required.empty()) {
        schema["required"] = required;
    }
    return schema;
}

json ToolManifest::serialize() const {
    json raw;
    raw["version"] = version;
    raw["description"] = description;

    json defaults = json::object();
    if (default_runtime) {
        defaults["runtime"] = runtime_to_string(*default_runtime);
    }
    if (default_module) {
        defaults["module"] = *default_module;
    }
    if (default_timeout_seconds != kDefaultTimeoutSeconds) {
        defaults["timeout"] = default_timeout_seconds;
    }
    if (!defaults.empty()) {
        raw["defaults"] = defaults;
    }

    json raw_tools = json::array();
    for (const auto &tool : tools) {
        json raw_tool;
        raw_tool["name"] = tool.name;
        if (!tool.description.empty()) {
            raw_tool["description"] = tool.description;
        }
        // Runtime and module only when they differ from what parsing would inherit.
        if (!default_runtime || tool.runtime != *default_runtime) {
            raw_tool["runtime"] = runtime_to_string(tool.runtime);
        }
        if (tool.module && tool.module != default_module) {
            raw_tool["module"] = *tool.module;
        }
        if (tool.function) {
            raw_tool["function"] = *tool.function;
        }
        if (tool.command) {
            raw_tool["command"] = *tool.command;
        }
        if (tool.script) {
            raw_tool["script"] = *tool.script;
        }
        if (tool.working_directory) {
            raw_tool["working_directory"] = *tool.working_directory;
        }
        if (tool.timeout_seconds != default_timeout_seconds) {
            raw_tool["timeout"] = tool.timeout_seconds;
        }
        if (tool.output_format != OutputFormat::Text) {
            raw_tool["output_format"] = output_format_to_string(tool.output_format);
        }
        if (tool.shell) {
            raw_tool["shell"] = *tool.shell;
        }
        if (!tool.parameters.empty()) {
            json raw_parameters = json::object();
            for (const auto &entry : tool.parameters) {
                raw_parameters[entry.first] = serialize_parameter(entry.second);
            }
            raw_tool["parameters"] = raw_parameters;
        }
        raw_tools.push_back(raw_tool);
    }
    raw["tools"] = raw_tools;
    return raw;
}

ManifestParseResult parse_manifest(const json &raw) {
    if (!raw.is_object()) {
        return make_failure(ManifestErrorKind::ParseError, "manifest root must be a JSON object");
    }

    ManifestParseResult result;
    ToolManifest &parsed = result.manifest;
    std::string error;

    if (!read_string(raw, "version", "manifest", parsed.version, error) ||
        !read_string(raw, "description", "manifest", parsed.description, error)) {
        return make_failure(ManifestErrorKind::ParseError, error);
    }

    if (is_present(raw, "defaults")) {
        const json &defaults = raw["defaults"];
        if (!defaults.is_object()) {
            return make_failure(ManifestErrorKind::ParseError, "manifest: field 'defaults' must be an object");
        }
        std::string runtime_name;
        if (!read_string(defaults, "runtime", "defaults", runtime_name, error) ||
            !read_optional_string(defaults, "module", "defaults", parsed.default_module, error) ||
            !read_timeout(defaults, "defaults", parsed.default_timeout_seconds, error)) {
            return make_failure(ManifestErrorKind::ParseError, error);
        }
        if (!runtime_name.empty()) {
            parsed.default_runtime = runtime_from_string(runtime_name);
            if (!parsed.default_runtime) {
                return make_failure(ManifestErrorKind::InvalidRuntime,
                                    invalid_runtime_message("defaults", runtime_name));
            }
        }
    }

    if (is_present(raw, "tools")) {
        const json &raw_tools = raw["tools"];
        if (!raw_tools.is_array()) {
            return make_failure(ManifestErrorKind::ParseError, "manifest: field 'tools' must be an array");
        }
        for (size_t index = 0; index < raw_tools.size(); ++index) {
            ToolDef tool;
            ManifestParseResult tool_result = parse_tool(raw_tools[index], index, parsed, tool);
            if (!tool_result.success) {
                return tool_result;
            }
            parsed.tools.push_back(std::move(tool));
        }
    }

    result.success = true;
    return result;
}

ManifestParseResult load_manifest_file(const std::string &file_path) {
    std::string contents;
    if (!platform::read_file_contents(file_path, contents)) {
        return make_failure(ManifestErrorKind::ParseError, "cannot read file " + file_path);
    }

    json raw;
    try {
        raw = json::parse(contents);
    } catch (const json::parse_error &error) {
        return make_failure(ManifestErrorKind::ParseError, "invalid JSON: " + std::string(error.what()));
    }
    return parse_manifest(raw);
}

bool save_manifest_file(const ToolManifest &manifest, const std::string &file_path) {
    return platform::write_file_contents(file_path, manifest.serialize().dump(2) + "\n");
}

} // namespace manifest
