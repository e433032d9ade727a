#ifndef TBMCPS_TOOL_REGISTRY_HPP
#define TBMCPS_TOOL_REGISTRY_HPP

// Tool registry: loads every manifest in a directory into one name-keyed table.

#include "manifest/manifest.hpp"

#include <map>
#include <string>
#include <vector>

namespace tool_registry {

// Name-keyed tool table. Ordered by name so listings are deterministic.
using ToolTable = std::map<std::string, manifest::ToolDef>;

// A manifest file that could not be loaded.
struct LoadWarning {
    std::string file_name;
    std::string message;
};

// A manifest file that loaded, and how many tools it declared.
struct LoadedFile {
    std::string file_name;
    size_t tool_count = 0;
};

struct LoadResult {
    ToolTable tools;
    std::vector<LoadedFile> loaded_files;
    std::vector<LoadWarning> warnings;
};

// Load every *.json file in directory_path in lexical file-name order. A file
// that fails to parse becomes a warning and does not stop the others. On a
// duplicate tool name the file loaded later wins. A missing directory, or one
// without manifests, yields an empty result.
LoadResult load_all(const std::string &directory_path);

// Sorted list of tool names in the table.
std::vector<std::string> tool_names(const ToolTable &tools);

} // namespace tool_registry

#endif // TBMCPS_TOOL_REGISTRY_HPP
