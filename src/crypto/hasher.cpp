#include "crypto/hasher.hpp"
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <fstream>
#include <stdexcept>
#include <sstream>
#include <iomanip>
#include <memory>
#include <cctype>

namespace Hasher {

// Helper deleter
struct EVP_MD_CTX_Deleter { void operator()(EVP_MD_CTX* c) { EVP_MD_CTX_free(c); } };
using DigestCtx = std::unique_ptr<EVP_MD_CTX, EVP_MD_CTX_Deleter>;

namespace {

DigestCtx start_sha256() {
    DigestCtx ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    if (!EVP_DigestInit_ex(ctx.get(), EVP_sha256(), NULL)) {
        throw std::runtime_error("EVP_DigestInit_ex failed");
    }
    return ctx;
}

hash_t finish(DigestCtx& ctx) {
    hash_t hash;
    unsigned int len = 0;
    if (!EVP_DigestFinal_ex(ctx.get(), hash.data(), &len)) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    return hash;
}

} // namespace

hash_t sha256(const std::vector<uint8_t>& data) {
    DigestCtx ctx = start_sha256();
    if (!EVP_DigestUpdate(ctx.get(), data.data(), data.size())) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
    return finish(ctx);
}

hash_t sha256(const std::string& data) {
    DigestCtx ctx = start_sha256();
    if (!EVP_DigestUpdate(ctx.get(), data.data(), data.size())) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
    return finish(ctx);
}

hash_t sha256_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for hashing: " + path.string());
    }

    DigestCtx ctx = start_sha256();
    std::vector<char> buffer(64 * 1024);
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize n = file.gcount();
        if (n > 0 && !EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(n))) {
            throw std::runtime_error("EVP_DigestUpdate failed");
        }
    }
    if (file.bad()) {
        throw std::runtime_error("Read error while hashing: " + path.string());
    }
    return finish(ctx);
}

hash_t hex_to_hash(const std::string& hex_str) {
    if (!is_hex_hash(hex_str)) {
        throw std::invalid_argument("Not a 64-digit hex hash: " + hex_str);
    }
    hash_t hash;
    for (size_t i = 0; i < HASH_SIZE; ++i) {
        hash[i] = static_cast<uint8_t>(std::stoul(hex_str.substr(i * 2, 2), nullptr, 16));
    }
    return hash;
}

std::string hash_to_hex(const hash_t& hash) {
    return to_hex(hash.data(), hash.size());
}

std::string to_hex(const uint8_t* data, size_t len) {
    std::stringstream ss;
    for (size_t i = 0; i < len; ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0') << (int)data[i];
    }
    return ss.str();
}

bool is_hex_hash(const std::string& hex) {
    if (hex.size() != HASH_SIZE * 2) return false;
    for (char c : hex) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

std::vector<uint8_t> random_bytes(size_t count) {
    std::vector<uint8_t> out(count);
    if (count > 0 && RAND_bytes(out.data(), static_cast<int>(count)) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return out;
}

std::string random_token(size_t bytes) {
    auto raw = random_bytes(bytes);
    return to_hex(raw.data(), raw.size());
}

std::string generate_uuid() {
    auto b = random_bytes(16);
    b[6] = static_cast<uint8_t>((b[6] & 0x0f) | 0x40);
    b[8] = static_cast<uint8_t>((b[8] & 0x3f) | 0x80);
    std::string hex = to_hex(b.data(), b.size());
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

bool constant_time_equals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

std::string hash_password(const std::string& password, const std::string& salt) {
    return hash_to_hex(sha256(password + salt));
}

} // namespace Hasher
