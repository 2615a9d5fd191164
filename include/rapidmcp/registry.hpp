#pragma once
#include "types.hpp"
#include "template.hpp"
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

namespace rapidmcp {

/// One loaded command together with everything derived from it at load time.
struct RegisteredCommand {
    CommandDefinition definition;
    ToolDescriptor descriptor;
    PromptTemplate prompt;
};

/// Immutable, load-ordered command catalog.
/// Construction either succeeds with every command or throws RegistryError.
class CommandRegistry {
public:
    CommandRegistry() = default;
    explicit CommandRegistry(std::vector<CommandDefinition> commands);

    /// Build from raw definitions as produced by a command-source loader.
    [[nodiscard]] static CommandRegistry from_raw(const std::vector<nlohmann::json>& raw);

    /// Exact, case-sensitive lookup; nullptr when absent.
    [[nodiscard]] const RegisteredCommand* find(std::string_view name) const;

    const std::vector<RegisteredCommand>& commands() const { return commands_; }

    /// Tool descriptors in load order.
    std::vector<ToolDescriptor> descriptors() const;

    size_t size() const { return commands_.size(); }
    bool empty() const { return commands_.empty(); }

private:
    std::vector<RegisteredCommand> commands_;
    std::unordered_map<std::string, size_t> index_;
};

/// Shared read-only handle passed to the server.
using RegistryHandle = std::shared_ptr<const CommandRegistry>;

/// Convert one raw definition, throwing RegistryError naming the command on failure.
[[nodiscard]] CommandDefinition parse_command_definition(const nlohmann::json& raw);

/// JSON-Schema object describing the command's parameters.
[[nodiscard]] nlohmann::json compile_input_schema(const CommandDefinition& command);

} // namespace rapidmcp
