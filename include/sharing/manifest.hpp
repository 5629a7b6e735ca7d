#ifndef INSTSHARE_MANIFEST_HPP
#define INSTSHARE_MANIFEST_HPP

#include "types.hpp"
#include "workspace.hpp"
#include <array>
#include <optional>
#include <string>
#include <vector>

struct ManifestFile {
    std::string path;
    uint64_t size_bytes = 0;
    std::optional<std::string> sha256;
};

struct ContentSection {
    bool included = false;
    uint32_t count = 0;
    uint64_t total_size_bytes = 0;
    std::vector<ManifestFile> files;
};

struct SavesSection {
    bool included = false;
    std::vector<WorldEntry> worlds;
};

struct ManifestInstance {
    std::string name;
    std::string game_version;
    std::optional<std::string> loader;
    std::optional<std::string> loader_version;
    bool is_server = false;
    bool is_proxy = false;
    std::optional<uint32_t> memory_min_mb;
    std::optional<uint32_t> memory_max_mb;
    std::optional<std::string> jvm_args;
};

/**
 * @brief Self-describing summary of a package, checked before anything is written.
 *
 * total_size_bytes always equals the included sections plus the listed worlds.
 */
struct SharingManifest {
    std::string version;
    std::string app_version;
    std::string created_at;
    ManifestInstance instance;
    std::array<ContentSection, 4> contents{};
    SavesSection saves;
    uint64_t total_size_bytes = 0;

    const ContentSection& section(ContentCategory c) const { return contents[static_cast<size_t>(c)]; }
    ContentSection& section(ContentCategory c) { return contents[static_cast<size_t>(c)]; }

    // Sum of the included sections and listed worlds; std::nullopt if it overflows.
    std::optional<uint64_t> derived_total() const;
};

namespace ManifestCodec {

constexpr const char* FORMAT_VERSION = "1.0";
constexpr const char* MANIFEST_FILE_NAME = "instshare-manifest.json";

/**
 * @brief Builds the manifest for an export.
 *
 * Selections the inventory does not report as available are dropped, so the
 * size invariant holds by construction.
 */
SharingManifest build(const WorkspaceInfo& workspace, const ExportOptions& options,
                      const ContentInventory& inventory);

std::string encode(const SharingManifest& manifest);

/**
 * @brief Parses and validates a manifest.
 * @throws SharingError(VALIDATION) on malformed JSON, a version mismatch, missing
 *         instance fields or a total that does not match the sections.
 */
SharingManifest decode(const std::string& text);

// Structural checks shared by decode() and callers holding an in-memory manifest.
void validate(const SharingManifest& manifest);

// Reverse of build(): the options a manifest was exported with.
ExportOptions options_of(const SharingManifest& manifest);

} // namespace ManifestCodec

#endif // INSTSHARE_MANIFEST_HPP
