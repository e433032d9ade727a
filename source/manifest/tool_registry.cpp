#include "manifest/tool_registry.hpp"
#include "utils/debug_log.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>
#include <utility>

namespace tool_registry {

namespace {

// Regular *.json files directly inside directory_path, sorted by file name.
std::vector<std::filesystem::path> list_manifest_files(const std::string &directory_path) {
    std::vector<std::filesystem::path> files;

    std::error_code filesystem_error;
    if (!std::filesystem::is_directory(directory_path, filesystem_error)) {
        return files;
    }

    std::filesystem::directory_iterator iterator(directory_path, filesystem_error);
    if (filesystem_error) {
        debug_log::log("Cannot list manifest directory " + directory_path + ": " + filesystem_error.message());
        return files;
    }
    const std::filesystem::directory_iterator end;
    for (; iterator != end; iterator.increment(filesystem_error)) {
        if (filesystem_error) {
            break;
        }
        std::error_code entry_error;
        if (!iterator->is_regular_file(entry_error)) {
            continue;
        }
        if (iterator->path().extension() == ".json") {
            files.push_back(iterator->path());
        }
    }

    std::sort(files.begin(), files.end(),
              [](const std::filesystem::path &left, const std::filesystem::path &right) {
                  return left.filename().string() < right.filename().string();
              });
    return files;
}

} // namespace

LoadResult load_all(const std::string &directory_path) {
    LoadResult result;

    for (const auto &file_path : list_manifest_files(directory_path)) {
        std::string file_name = file_path.filename().string();
        manifest::ManifestParseResult parsed = manifest::load_manifest_file(file_path.string());
        if (!parsed.success) {
            result.warnings.push_back({file_name, parsed.error_message});
            continue;
        }

        for (auto &tool : parsed.manifest.tools) {
            auto existing = result.tools.find(tool.name);
            if (existing != result.tools.end()) {
                debug_log::log("Tool '" + tool.name + "' from " + file_name + " replaces an earlier definition");
            }
            result.tools[tool.name] = std::move(tool);
        }
        result.loaded_files.push_back({file_name, parsed.manifest.tools.size()});
    }

    return result;
}

std::vector<std::string> tool_names(const ToolTable &tools) {
    std::vector<std::string> names;
    names.reserve(tools.size());
    for (const auto &entry : tools) {
        names.push_back(entry.first);
    }
    return names;
}

} // namespace tool_registry
