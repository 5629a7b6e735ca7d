#ifndef INSTSHARE_PACKAGE_ARCHIVE_HPP
#define INSTSHARE_PACKAGE_ARCHIVE_HPP

#include "content_inventory.hpp"
#include "../crypto/hasher.hpp"
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

/**
 * Single-file package container:
 *
 *   "ISPK" | version (u16) | manifest_len (u32) | manifest JSON
 *   | entry_count (u32) | entry_count x [path_len (u32) | path | size (u64) | sha256 (32)]
 *   | entry data, concatenated in index order
 *
 * All integers are big-endian. Entry paths are '/'-separated and relative.
 */
namespace PackageArchive {

constexpr const char* FILE_EXTENSION = ".ishare";
constexpr uint16_t FORMAT_VERSION = 1;

constexpr uint32_t MAX_MANIFEST_BYTES = 16 * 1024 * 1024;
constexpr uint32_t MAX_ENTRIES = 1000000;
constexpr uint32_t MAX_PATH_BYTES = 4096;

struct Entry {
    std::string path;
    uint64_t size = 0;
    hash_t sha256{};
    uint64_t offset = 0; // absolute offset of the entry data in the package
};

struct Index {
    std::string manifest_json;
    std::vector<Entry> entries;
    uint64_t data_bytes = 0;
};

// (bytes done, bytes total)
using ByteProgress = std::function<void(uint64_t, uint64_t)>;

/**
 * @brief Hashes and writes `files` into a new package at `out`.
 * @throws std::runtime_error on any read or write failure. The partial file is left for the caller.
 */
std::vector<Entry> write(const fs::path& out, const std::string& manifest_json,
                         const std::vector<ContentFile>& files, const ByteProgress& progress);

/**
 * @brief Reads and bounds-checks the header and entry index.
 * @throws SharingError(VALIDATION) if the file is not a well-formed package.
 */
Index read_index(const fs::path& package);

/**
 * @brief Extracts every entry under `destination`, verifying each SHA-256.
 * @throws SharingError(VALIDATION) on a corrupt entry, SharingError(MATERIALIZATION) on write failure.
 */
void extract(const fs::path& package, const Index& index, const fs::path& destination,
             const ByteProgress& progress);

// False for absolute paths, '..' or '.' segments, backslashes and drive letters.
bool is_safe_entry_path(const std::string& path);

} // namespace PackageArchive

#endif // INSTSHARE_PACKAGE_ARCHIVE_HPP
