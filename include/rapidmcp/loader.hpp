#pragma once
#include "registry.hpp"
#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace rapidmcp {

/// Reads YAML command files into raw JSON definitions.
/// Every failure is a LoadError naming the offending file.
class CommandLoader {
public:
    /// Every *.yaml / *.yml regular file directly inside `dir`, in file-name order.
    [[nodiscard]] static std::vector<std::filesystem::path> list_files(const std::filesystem::path& dir);

    /// Raw definitions of every command file in `dir`, in file-name order.
    [[nodiscard]] static std::vector<nlohmann::json> load_directory(const std::filesystem::path& dir);

    [[nodiscard]] static nlohmann::json load_file(const std::filesystem::path& path);

    [[nodiscard]] static nlohmann::json load_string(const std::string& yaml,
                                                    const std::string& origin = "<string>");
};

/// Load every command file in `dir` and build the registry.
/// Throws LoadError for unreadable or malformed files and RegistryError for
/// conflicts across files (duplicate names).
[[nodiscard]] RegistryHandle load_registry(const std::filesystem::path& dir);

} // namespace rapidmcp
