#include "rapidmcp/loader.hpp"
#include "rapidmcp/error.hpp"
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cerrno>
#include <charconv>
#include <cstdlib>
#include <system_error>

namespace rapidmcp {

namespace {

bool looks_like_float(const std::string& s) {
    bool digit = false;
    for (char c : s) {
        if (c >= '0' && c <= '9') {
            digit = true;
        } else if (c != '+' && c != '-' && c != '.' && c != 'e' && c != 'E') {
            return false;
        }
    }
    return digit;
}

// Plain scalars get YAML 1.2 core-schema typing; quoted scalars stay strings.
nlohmann::json scalar_to_json(const YAML::Node& node) {
    const std::string& s = node.Scalar();
    if (node.Tag() == "!") return s;

    if (s == "true" || s == "True" || s == "TRUE") return true;
    if (s == "false" || s == "False" || s == "FALSE") return false;
    if (s == "null" || s == "Null" || s == "NULL" || s == "~") return nullptr;

    int64_t i = 0;
    const char* first = s.data();
    const char* last = s.data() + s.size();
    if (!s.empty() && s.front() == '+') ++first;
    auto [ptr, ec] = std::from_chars(first, last, i);
    if (ec == std::errc() && ptr == last && first != last) return i;

    if (looks_like_float(s)) {
        char* end = nullptr;
        errno = 0;
        double d = std::strtod(s.c_str(), &end);
        if (end == s.c_str() + s.size() && errno == 0) return d;
    }
    return s;
}

nlohmann::json yaml_to_json(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Scalar:
            return scalar_to_json(node);
        case YAML::NodeType::Sequence: {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto& item : node) {
                arr.push_back(yaml_to_json(item));
            }
            return arr;
        }
        case YAML::NodeType::Map: {
            nlohmann::json obj = nlohmann::json::object();
            for (const auto& kv : node) {
                obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
            }
            return obj;
        }
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            return nullptr;
    }
    return nullptr;
}

// String parameters keep the source text of plain scalars (`default: 1.10`
// stays "1.10" rather than becoming 1.1). Null scalars stay null.
void restore_string_scalars(const YAML::Node& doc, nlohmann::json& raw) {
    const YAML::Node params = doc["parameters"];
    if (!params || !params.IsSequence() || !raw.contains("parameters")) return;
    auto& raw_params = raw["parameters"];
    if (!raw_params.is_array()) return;

    for (size_t i = 0; i < params.size() && i < raw_params.size(); ++i) {
        const YAML::Node p = params[i];
        auto& rp = raw_params[i];
        if (!p.IsMap() || !rp.is_object()) continue;
        const YAML::Node type = p["type"];
        if (!type || !type.IsScalar() || type.Scalar() != "string") continue;

        const YAML::Node def = p["default"];
        if (def && def.IsScalar() && !rp["default"].is_null()) rp["default"] = def.Scalar();

        const YAML::Node validation = p["validation"];
        if (!validation || !validation.IsMap()) continue;
        const YAML::Node allowed = validation["allowed_values"];
        if (!allowed || !allowed.IsSequence()) continue;
        auto& raw_allowed = rp["validation"]["allowed_values"];
        for (size_t k = 0; k < allowed.size() && k < raw_allowed.size(); ++k) {
            if (allowed[k].IsScalar() && !raw_allowed[k].is_null()) {
                raw_allowed[k] = allowed[k].Scalar();
            }
        }
    }
}

nlohmann::json convert_document(const YAML::Node& doc, const std::string& origin) {
    if (!doc || doc.IsNull()) {
        throw LoadError(origin, "empty document");
    }
    if (!doc.IsMap()) {
        throw LoadError(origin, "top level must be a mapping");
    }
    nlohmann::json raw;
    try {
        raw = yaml_to_json(doc);
        restore_string_scalars(doc, raw);
    } catch (const YAML::Exception& e) {
        throw LoadError(origin, e.what());
    }
    return raw;
}

} // anonymous namespace

std::vector<std::filesystem::path> CommandLoader::list_files(const std::filesystem::path& dir) {
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        throw LoadError(dir.string(), "not a readable directory");
    }

    std::vector<std::filesystem::path> files;
    for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
        if (!entry.is_regular_file()) continue;
        const auto ext = entry.path().extension();
        if (ext == ".yaml" || ext == ".yml") {
            files.push_back(entry.path());
        }
    }
    if (ec) {
        throw LoadError(dir.string(), ec.message());
    }
    std::sort(files.begin(), files.end(),
              [](const auto& a, const auto& b) { return a.filename() < b.filename(); });
    return files;
}

std::vector<nlohmann::json> CommandLoader::load_directory(const std::filesystem::path& dir) {
    std::vector<nlohmann::json> raw;
    for (const auto& path : list_files(dir)) {
        raw.push_back(load_file(path));
    }
    return raw;
}

nlohmann::json CommandLoader::load_file(const std::filesystem::path& path) {
    YAML::Node doc;
    try {
        doc = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw LoadError(path.string(), e.what());
    }
    return convert_document(doc, path.string());
}

nlohmann::json CommandLoader::load_string(const std::string& yaml, const std::string& origin) {
    YAML::Node doc;
    try {
        doc = YAML::Load(yaml);
    } catch (const YAML::Exception& e) {
        throw LoadError(origin, e.what());
    }
    return convert_document(doc, origin);
}

RegistryHandle load_registry(const std::filesystem::path& dir) {
    std::vector<CommandDefinition> defs;
    for (const auto& path : CommandLoader::list_files(dir)) {
        nlohmann::json raw = CommandLoader::load_file(path);
        try {
            defs.push_back(parse_command_definition(raw));
        } catch (const RegistryError& e) {
            throw LoadError(path.string(), e.what());
        }
        spdlog::info("Loaded command: {} ({})", defs.back().name, path.filename().string());
    }
    auto registry = std::make_shared<const CommandRegistry>(std::move(defs));
    spdlog::info("Loaded {} command(s) from {}", registry->size(), dir.string());
    return registry;
}

} // namespace rapidmcp
