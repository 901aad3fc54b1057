#include <sstream>
#include <workhooks/version.hpp>

namespace workhooks
{

std::string version_string()
{
    std::ostringstream oss;
    oss << VERSION_MAJOR << "." << VERSION_MINOR << "." << VERSION_PATCH;
    return oss.str();
}

} // namespace workhooks
