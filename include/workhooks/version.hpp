#ifndef WORKHOOKS_VERSION_HPP
#define WORKHOOKS_VERSION_HPP

#include <string>

namespace workhooks
{

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

// Event payload schema and audit record format versions
constexpr const char* EVENT_SCHEMA_VERSION = "1.0";
constexpr const char* AUDIT_FORMAT_VERSION = "1.0";

constexpr const char* TOOL_NAME = "workhooks";

std::string version_string();

} // namespace workhooks

#endif // WORKHOOKS_VERSION_HPP
