#include "sha256.hpp"

#include <fstream>
#include <iomanip>
#include <openssl/sha.h>
#include <sstream>
#include <stdexcept>

namespace workhooks::internal
{

namespace
{

std::string to_hex(const unsigned char* hash, size_t length)
{
    std::ostringstream oss;
    for (size_t i = 0; i < length; ++i)
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    return oss.str();
}

} // namespace

std::string sha256_hex(const std::string& data)
{
    SHA256_CTX sha256;
    unsigned char hash[SHA256_DIGEST_LENGTH];
    if (!SHA256_Init(&sha256) || !SHA256_Update(&sha256, data.data(), data.size()) ||
        !SHA256_Final(hash, &sha256))
        throw std::runtime_error("SHA-256 computation failed");
    return to_hex(hash, SHA256_DIGEST_LENGTH);
}

std::optional<std::string> compute_file_sha256(const std::filesystem::path& file_path)
{
    std::ifstream file(file_path, std::ios::binary);
    if (!file)
        return std::nullopt;

    SHA256_CTX sha256;
    if (!SHA256_Init(&sha256))
        return std::nullopt;

    const size_t BUFFER_SIZE = 8192;
    char buffer[BUFFER_SIZE];
    while (file.read(buffer, BUFFER_SIZE) || file.gcount() > 0)
        if (!SHA256_Update(&sha256, buffer, static_cast<size_t>(file.gcount())))
            return std::nullopt;

    if (file.bad())
        return std::nullopt;

    unsigned char hash[SHA256_DIGEST_LENGTH];
    if (!SHA256_Final(hash, &sha256))
        return std::nullopt;

    return to_hex(hash, SHA256_DIGEST_LENGTH);
}

} // namespace workhooks::internal
