#include "guards.hpp"

#include <regex>
#include <utility>
#include <workhooks/errors.hpp>

namespace fs = std::filesystem;

namespace workhooks::internal
{

bool has_parent_reference(const fs::path& path)
{
    for (const auto& part : path)
        if (part == "..")
            return true;
    return false;
}

bool is_within(const fs::path& base, const fs::path& candidate)
{
    fs::path relative = candidate.lexically_relative(base);
    if (relative.empty())
        return false;
    return *relative.begin() != "..";
}

fs::path resolve_script_path(const fs::path& hooks_dir, const std::string& script)
{
    fs::path reference(script);
    if (reference.is_absolute())
        throw SecurityViolationError("Absolute script path not allowed: " + script);
    if (has_parent_reference(reference))
        throw SecurityViolationError("Path traversal in script reference: " + script);

    std::error_code ec;
    fs::path base = fs::weakly_canonical(hooks_dir, ec);
    if (ec)
        base = fs::absolute(hooks_dir).lexically_normal();

    fs::path candidate = base / reference;
    fs::path resolved = fs::weakly_canonical(candidate, ec);
    if (ec)
        resolved = candidate.lexically_normal();

    if (!is_within(base, resolved))
        throw SecurityViolationError("Script resolves outside the hooks directory: " + script +
                                     " -> " + resolved.string());
    return resolved;
}

fs::path resolve_working_directory(const fs::path& project_root,
                                   const std::string& working_directory)
{
    std::error_code ec;
    fs::path root = fs::weakly_canonical(project_root, ec);
    if (ec)
        root = fs::absolute(project_root).lexically_normal();

    if (working_directory.empty() || working_directory == ".")
        return root;

    fs::path reference(working_directory);
    if (reference.is_absolute())
        throw SecurityViolationError("Absolute working directory not allowed: " +
                                     working_directory);
    if (has_parent_reference(reference))
        throw SecurityViolationError("Path traversal in working directory: " + working_directory);

    fs::path resolved = fs::weakly_canonical(root / reference, ec);
    if (ec || !is_within(root, resolved))
        throw SecurityViolationError("Working directory escapes the project: " +
                                     working_directory);
    if (!fs::is_directory(resolved, ec))
        throw SecurityViolationError("Working directory does not exist: " + working_directory);
    return resolved;
}

std::vector<std::string> scan_dangerous_content(const std::string& content)
{
    static const std::vector<std::pair<std::regex, std::string>> patterns = {
        {std::regex(R"(rm\s+-rf\s+/)"), "Recursive deletion of root directory"},
        {std::regex(R"(rm\s+-rf\s+~)"), "Recursive deletion of home directory"},
        {std::regex(R"(rm\s+-rf\s+\$HOME)"), "Recursive deletion of home directory"},
        {std::regex(R"(dd\s+if=)"), "Direct disk access (dd command)"},
        {std::regex(R"(>\s*/dev/sd[a-z])"), "Writing to block device"},
        {std::regex(R"(mkfs\.)"), "Filesystem formatting"},
        {std::regex(R"(:\(\)\s*\{\s*:\|:\s*&\s*\}\s*;\s*:)"), "Fork bomb pattern"},
        {std::regex(R"(chmod\s+-R\s+777)"), "Overly permissive file permissions"},
        {std::regex(R"(curl.*\|\s*(ba)?sh)"), "Piping remote content to shell"},
        {std::regex(R"(wget.*\|\s*(ba)?sh)"), "Piping remote content to shell"},
        {std::regex(R"(eval\s+\$\(curl)"), "Evaluating remote code"},
        {std::regex(R"(base64\s+-d.*\|\s*(ba)?sh)"), "Executing base64-encoded commands"},
    };

    std::vector<std::string> findings;
    for (const auto& [pattern, description] : patterns)
        if (std::regex_search(content, pattern))
            findings.push_back(description);
    return findings;
}

} // namespace workhooks::internal
