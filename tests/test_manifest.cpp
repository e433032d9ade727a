// Tests for the manifest model: schema generation, default inheritance,
// parse errors and serialize/parse round trips. No processes are spawned.

#include "manifest/manifest.hpp"
#include "test_support.hpp"

#include <nlohmann/json.hpp>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

using json = nlohmann::json;
using test_support::check;

namespace test_manifest {

// Test: every alias of a type yields the same schema "type".
static bool test_type_aliases_normalize() {
    const std::vector<std::pair<std::vector<std::string>, std::string>> groups = {
        {{"string", "String", "str"}, "string"},
        {{"integer", "int", "Int32", "Int64"}, "integer"},
        {{"number", "float", "Double"}, "number"},
        {{"boolean", "bool", "Boolean", "SwitchParameter"}, "boolean"},
        {{"array", "String[]"}, "array"},
        {{"Hashtable", "PSCredential", ""}, "string"},
    };

    bool all_match = true;
    for (const auto &group : groups) {
        for (const auto &alias : group.first) {
            manifest::ParameterDef parameter;
            parameter.type = alias;
            if (parameter.to_json_schema()["type"] != group.second) {
                std::cout << "  alias '" << alias << "' did not map to " << group.second << std::endl;
                all_match = false;
            }
        }
    }
    return check(all_match, "Type aliases normalize to the same schema type");
}

// Test: string parameter schema carries type and description.
static bool test_string_parameter_schema() {
    manifest::ParameterDef parameter;
    parameter.type = "string";
    parameter.description = "A name";
    parameter.required = true;
    json schema = parameter.to_json_schema();
    return check(schema["type"] == "string" && schema["description"] == "A name" &&
                     !schema.contains("default") && !schema.contains("enum"),
                 "String parameter schema has type and description only");
}

// Test: numeric range, enum and default are carried through.
static bool test_range_enum_and_default() {
    manifest::ParameterDef days;
    days.type = "Int32";
    days.minimum = 1;
    days.maximum = 90;
    days.default_value = 30;
    json days_schema = days.to_json_schema();

    manifest::ParameterDef severity;
    severity.enum_values = {"High", "Medium", "Low"};
    severity.default_value = "High";
    json severity_schema = severity.to_json_schema();

    bool passed = days_schema["type"] == "integer" && days_schema["minimum"] == 1 &&
                  days_schema["maximum"] == 90 && days_schema["default"] == 30 &&
                  severity_schema["enum"] == json::array({"High", "Medium", "Low"}) &&
                  severity_schema["default"] == "High";
    return check(passed, "Range, enum and default appear in the schema");
}

// Test: minimum/maximum are dropped for non-numeric types.
static bool test_range_only_for_numeric_types() {
    manifest::ParameterDef parameter;
    parameter.type = "string";
    parameter.minimum = 1;
    parameter.maximum = 5;
    json schema = parameter.to_json_schema();
    return check(!schema.contains("minimum") && !schema.contains("maximum"),
                 "String parameter schema has no minimum/maximum");
}

// Test: tool schema collects required names, omits "required" when none.
static bool test_tool_input_schema() {
    manifest::ToolDef tool;
    tool.name = "Get-Something";
    manifest::ParameterDef name_parameter;
    name_parameter.required = true;
    manifest::ParameterDef count_parameter;
    count_parameter.type = "integer";
    count_parameter.default_value = 10;
    tool.parameters["Name"] = name_parameter;
    tool.parameters["Count"] = count_parameter;
    json schema = tool.input_schema();

    manifest::ToolDef optional_only;
    optional_only.name = "Get-All";
    manifest::ParameterDef limit;
    limit.type = "integer";
    optional_only.parameters["Limit"] = limit;
    json optional_schema = optional_only.input_schema();

    manifest::ToolDef no_parameters;
    no_parameters.name = "Get-Nothing";
    json empty_schema = no_parameters.input_schema();

    bool passed = schema["type"] == "object" && schema["properties"].contains("Name") &&
                  schema["properties"].contains("Count") && schema["required"] == json::array({"Name"}) &&
                  !optional_schema.contains("required") &&
                  empty_schema["properties"].is_object() && empty_schema["properties"].empty();
    return check(passed, "Tool schema lists required parameters and omits an empty required list");
}

// Test: tools inherit runtime, module and timeout from defaults unless overridden.
static bool test_defaults_inheritance() {
    json raw = {
        {"defaults", {{"runtime", "powershell"}, {"module", "MyModule"}, {"timeout", 30}}},
        {"tools", json::array({
            {{"name", "Get-Foo"}, {"description", "Gets foo"}},
            {{"name", "Get-Bar"}, {"runtime", "bash"}, {"command", "echo bar"}, {"timeout", 5},
             {"module", "Other"}},
        })},
    };
    manifest::ManifestParseResult result = manifest::parse_manifest(raw);
    if (!check(result.success, "Manifest with defaults parses")) {
        return false;
    }
    const auto &tools = result.manifest.tools;
    bool passed = tools.size() == 2 &&
                  tools[0].runtime == manifest::Runtime::PowerShell && tools[0].module == std::string("MyModule") &&
                  tools[0].timeout_seconds == 30 &&
                  tools[1].runtime == manifest::Runtime::Bash && tools[1].module == std::string("Other") &&
                  tools[1].timeout_seconds == 5;
    return check(passed, "Tools inherit defaults and explicit values override them");
}

// Test: a tool without runtime or defaults falls back to cli and 120 seconds.
static bool test_builtin_fallbacks() {
    json raw = {{"tools", json::array({{{"name", "plain"}, {"command", "true"}}})}};
    manifest::ManifestParseResult result = manifest::parse_manifest(raw);
    bool passed = result.success && result.manifest.tools.size() == 1 &&
                  result.manifest.tools[0].runtime == manifest::Runtime::Cli &&
                  result.manifest.tools[0].timeout_seconds == 120 &&
                  result.manifest.tools[0].output_format == manifest::OutputFormat::Text &&
                  !result.manifest.tools[0].module.has_value();
    return check(passed, "Tool without runtime falls back to cli, 120 s, text output");
}

// Test: a missing tools[].name is a ParseError.
static bool test_missing_name_is_parse_error() {
    json raw = {{"tools", json::array({{{"description", "no name"}}})}};
    manifest::ManifestParseResult result = manifest::parse_manifest(raw);
    return check(!result.success && result.error_kind == manifest::ManifestErrorKind::ParseError &&
                     result.error_message.find("name") != std::string::npos,
                 "Missing tool name fails with ParseError");
}

// Test: an unknown runtime string fails with InvalidRuntime naming the value.
static bool test_invalid_runtime() {
    json raw = {{"tools", json::array({{{"name", "x"}, {"runtime", "cobol"}}})}};
    manifest::ManifestParseResult result = manifest::parse_manifest(raw);

    json raw_defaults = {{"defaults", {{"runtime", "perl"}}}, {"tools", json::array()}};
    manifest::ManifestParseResult defaults_result = manifest::parse_manifest(raw_defaults);

    bool passed = !result.success && result.error_kind == manifest::ManifestErrorKind::InvalidRuntime &&
                  result.error_message.find("cobol") != std::string::npos &&
                  !defaults_result.success &&
                  defaults_result.error_kind == manifest::ManifestErrorKind::InvalidRuntime &&
                  defaults_result.error_message.find("perl") != std::string::npos;
    return check(passed, "Unknown runtime fails with InvalidRuntime naming the value");
}

// Test: unknown fields are ignored, wrongly typed known fields are rejected.
static bool test_unknown_and_malformed_fields() {
    json forward = {{"x-generator", "future"},
                    {"tools", json::array({{{"name", "t"}, {"command", "true"}, {"icon", "gear"}}})}};
    manifest::ManifestParseResult forward_result = manifest::parse_manifest(forward);

    json bad_timeout = {{"tools", json::array({{{"name", "t"}, {"timeout", "soon"}}})}};
    manifest::ManifestParseResult timeout_result = manifest::parse_manifest(bad_timeout);

    json bad_root = json::array({1, 2});
    manifest::ManifestParseResult root_result = manifest::parse_manifest(bad_root);

    bool passed = forward_result.success && forward_result.manifest.tools.size() == 1 &&
                  !timeout_result.success &&
                  timeout_result.error_kind == manifest::ManifestErrorKind::ParseError &&
                  !root_result.success;
    return check(passed, "Unknown fields ignored, malformed known fields rejected");
}

// Test: a manifest with no tools is valid.
static bool test_empty_manifest_is_valid() {
    manifest::ManifestParseResult empty_object = manifest::parse_manifest(json::object());
    manifest::ManifestParseResult empty_tools = manifest::parse_manifest({{"tools", json::array()}});
    return check(empty_object.success && empty_object.manifest.tools.empty() &&
                     empty_tools.success && empty_tools.manifest.tools.empty(),
                 "Manifest without tools parses to zero tools");
}

static manifest::ToolManifest build_sample_manifest() {
    manifest::ToolManifest sample;
    sample.description = "Test manifest";
    sample.default_runtime = manifest::Runtime::PowerShell;
    sample.default_module = "TestModule";
    sample.default_timeout_seconds = 60;

    manifest::ToolDef get_thing;
    get_thing.name = "Get-Thing";
    get_thing.description = "Gets a thing";
    get_thing.runtime = manifest::Runtime::PowerShell;
    get_thing.module = "TestModule";
    get_thing.timeout_seconds = 60;
    get_thing.output_format = manifest::OutputFormat::Json;
    manifest::ParameterDef name_parameter;
    name_parameter.required = true;
    name_parameter.description = "Thing name";
    manifest::ParameterDef days;
    days.type = "Int32";
    days.minimum = 1;
    days.maximum = 90;
    manifest::ParameterDef level;
    level.enum_values = {"High", "Low"};
    level.default_value = "Low";
    get_thing.parameters["Name"] = name_parameter;
    get_thing.parameters["Days"] = days;
    get_thing.parameters["Level"] = level;

    manifest::ToolDef list_files;
    list_files.name = "list-files";
    list_files.runtime = manifest::Runtime::Cli;
    list_files.command = "ls {path}";
    list_files.shell = "sh";
    list_files.working_directory = "/tmp";
    list_files.timeout_seconds = 10;
    manifest::ParameterDef path_parameter;
    path_parameter.required = true;
    list_files.parameters["path"] = path_parameter;

    sample.tools = {get_thing, list_files};
    return sample;
}

// Test: serialize omits values equal to the manifest defaults.
static bool test_serialize_omits_defaults() {
    json raw = build_sample_manifest().serialize();
    const json &get_thing = raw["tools"][0];
    const json &list_files = raw["tools"][1];
    bool passed = raw["defaults"]["runtime"] == "powershell" && raw["defaults"]["module"] == "TestModule" &&
                  raw["defaults"]["timeout"] == 60 &&
                  !get_thing.contains("runtime") && !get_thing.contains("module") &&
                  !get_thing.contains("timeout") && get_thing["output_format"] == "json" &&
                  list_files["runtime"] == "cli" && list_files["timeout"] == 10 &&
                  list_files["working_directory"] == "/tmp" && list_files["shell"] == "sh";
    return check(passed, "Serialized form omits fields equal to the defaults");
}

// Test: parse(serialize(m)) keeps names, runtimes and parameter schemas.
static bool test_round_trip() {
    manifest::ToolManifest original = build_sample_manifest();
    manifest::ManifestParseResult reparsed = manifest::parse_manifest(original.serialize());
    if (!check(reparsed.success, "Serialized manifest parses again")) {
        return false;
    }

    bool passed = reparsed.manifest.tools.size() == original.tools.size() &&
                  reparsed.manifest.default_timeout_seconds == original.default_timeout_seconds;
    for (size_t index = 0; passed && index < original.tools.size(); ++index) {
        const manifest::ToolDef &before = original.tools[index];
        const manifest::ToolDef &after = reparsed.manifest.tools[index];
        passed = before.name == after.name && before.runtime == after.runtime &&
                 before.command == after.command &&
                 before.shell == after.shell && before.working_directory == after.working_directory &&
                 before.timeout_seconds == after.timeout_seconds &&
                 before.output_format == after.output_format &&
                 before.input_schema() == after.input_schema();
    }
    return check(passed, "Round trip preserves names, runtimes and schemas");
}

// Test: save to disk and load back.
static bool test_save_and_load_file() {
    test_support::TempDirectory directory("manifest_file");
    std::string path = directory.file("saved.json");
    bool saved = manifest::save_manifest_file(build_sample_manifest(), path);
    manifest::ManifestParseResult loaded = manifest::load_manifest_file(path);

    bool passed = saved && loaded.success && loaded.manifest.tools.size() == 2 &&
                  loaded.manifest.tools[0].parameters.at("Name").required &&
                  loaded.manifest.tools[0].parameters.at("Days").minimum == 1.0;

    manifest::ManifestParseResult missing = manifest::load_manifest_file(directory.file("absent.json"));
    passed = passed && !missing.success && missing.error_kind == manifest::ManifestErrorKind::ParseError;
    return check(passed, "Manifest survives save/load; missing file is a ParseError");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_type_aliases_normalize();
    all_passed &= test_string_parameter_schema();
    all_passed &= test_range_enum_and_default();
    all_passed &= test_range_only_for_numeric_types();
    all_passed &= test_tool_input_schema();
    all_passed &= test_defaults_inheritance();
    all_passed &= test_builtin_fallbacks();
    all_passed &= test_missing_name_is_parse_error();
    all_passed &= test_invalid_runtime();
    all_passed &= test_unknown_and_malformed_fields();
    all_passed &= test_empty_manifest_is_valid();
    all_passed &= test_serialize_omits_defaults();
    all_passed &= test_round_trip();
    all_passed &= test_save_and_load_file();
    return all_passed;
}

} // namespace test_manifest
