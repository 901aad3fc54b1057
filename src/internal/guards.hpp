#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace workhooks::internal
{

/// True when any component of the path is ".."
bool has_parent_reference(const std::filesystem::path& path);

/// True when candidate equals base or lies below it (both should be canonical)
bool is_within(const std::filesystem::path& base, const std::filesystem::path& candidate);

/// Resolve a script reference below the hooks directory.
/// Throws SecurityViolationError for absolute paths, ".." segments or symlinks
/// leading outside. The returned path may not exist.
std::filesystem::path resolve_script_path(const std::filesystem::path& hooks_dir,
                                          const std::string& script);

/// Resolve a hook working directory ("." is the project root).
/// Throws SecurityViolationError unless it is an existing directory inside the project.
std::filesystem::path resolve_working_directory(const std::filesystem::path& project_root,
                                                const std::string& working_directory);

/// Descriptions of dangerous constructs found in a script (empty when clean).
/// Findings are warnings; they never block execution.
std::vector<std::string> scan_dangerous_content(const std::string& content);

} // namespace workhooks::internal
