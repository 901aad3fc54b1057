#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace workhooks::internal
{

/// Hex-encoded (lower-case, 64 characters) SHA-256 of a byte string
std::string sha256_hex(const std::string& data);

/// Hex-encoded SHA-256 of a file's contents, or std::nullopt when it cannot be read
std::optional<std::string> compute_file_sha256(const std::filesystem::path& file_path);

} // namespace workhooks::internal
