#ifndef WORKHOOKS_HOOK_REGISTRY_HPP
#define WORKHOOKS_HOOK_REGISTRY_HPP

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>
#include <workhooks/options.hpp>
#include <workhooks/types.hpp>

namespace workhooks
{

constexpr const char* HOOKS_CONFIG_VERSION = "1.0";
constexpr double MAX_HOOK_TIMEOUT_SECONDS = 600.0;

/// Result of a dry-run validation of hooks.yaml
struct ValidationReport
{
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    std::size_t hook_count = 0;
    bool config_found = false;

    bool ok() const
    {
        return errors.empty();
    }
};

/**
 * Immutable, ordered collection of hook definitions.
 *
 * Loading is all-or-nothing: malformed configuration raises
 * ConfigurationError listing every problem found, so no hook runs on a
 * partially understood file.
 */
class HookRegistry
{
  public:
    HookRegistry() = default;

    /// Takes definitions as-is (names must be unique). Throws ConfigurationError otherwise.
    explicit HookRegistry(std::vector<HookDefinition> hooks);

    /// Load hooks.yaml. A missing file yields an empty registry.
    static HookRegistry load(const std::filesystem::path& path);

    /// Parse YAML text; source_name only appears in error messages.
    static HookRegistry parse(const std::string& yaml_text,
                              const std::string& source_name = "<string>");

    /// Enabled hooks matching the event, in declaration order
    std::vector<HookDefinition> match(const Event& event) const;

    const HookDefinition* find(const std::string& name) const;

    const std::vector<HookDefinition>& hooks() const
    {
        return hooks_;
    }

    std::size_t size() const
    {
        return hooks_.size();
    }

    bool empty() const
    {
        return hooks_.empty();
    }

  private:
    std::vector<HookDefinition> hooks_;
};

/// "*", "<prefix>.*", "*.<suffix>" or an exact event type
bool is_valid_pattern(const std::string& pattern);

bool matches_pattern(const std::string& pattern, const std::string& event_type);

/// Every filter key must hold against the context (see hooks.yaml documentation)
bool matches_filter(const json& filter, const json& context);

/// True when the hook is enabled and one of its matchers (plus the hook filter) accepts the event
bool hook_matches(const HookDefinition& hook, const Event& event);

/// Dry-run check of hooks.yaml: schema errors plus script and working-directory lint
ValidationReport validate_hooks_file(const std::filesystem::path& path, const Options& options);

} // namespace workhooks

#endif // WORKHOOKS_HOOK_REGISTRY_HPP
