#ifndef INSTSHARE_HASHER_HPP
#define INSTSHARE_HASHER_HPP

#include <array>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

// SHA-256 produces a 32-byte hash.
constexpr size_t HASH_SIZE = 32;
using hash_t = std::array<uint8_t, HASH_SIZE>;

namespace Hasher {

/**
 * @brief Calculates the SHA-256 hash of a data buffer.
 * @param data The data to hash.
 * @return A 32-byte SHA-256 hash.
 */
hash_t sha256(const std::vector<uint8_t>& data);

    // Calculate SHA-256 hash of a string
    hash_t sha256(const std::string& data);

    /**
     * @brief Streams a file through SHA-256 without loading it whole.
     * @throws std::runtime_error if the file cannot be read.
     */
    hash_t sha256_file(const std::filesystem::path& path);

    // Helpers
    hash_t hex_to_hash(const std::string& hex);
    std::string hash_to_hex(const hash_t& hash);
    std::string to_hex(const uint8_t* data, size_t len);
    bool is_hex_hash(const std::string& hex);

    // Cryptographically secure random bytes from OpenSSL.
    std::vector<uint8_t> random_bytes(size_t count);

    // Hex encoding of `bytes` random bytes, used for share access tokens.
    std::string random_token(size_t bytes = 32);

    // RFC 4122 version 4 identifier.
    std::string generate_uuid();

    // Comparison whose duration does not depend on where the inputs differ.
    bool constant_time_equals(const std::string& a, const std::string& b);

    // Hex SHA-256 of password followed by salt.
    std::string hash_password(const std::string& password, const std::string& salt);

} // namespace Hasher

#endif //INSTSHARE_HASHER_HPP
