#ifndef INSTSHARE_TYPES_HPP
#define INSTSHARE_TYPES_HPP

#include <array>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <vector>

enum class ContentCategory {
    MODS,
    CONFIG,
    RESOURCE_PACKS,
    SHADER_PACKS
};

constexpr std::array<ContentCategory, 4> ALL_CATEGORIES = {
    ContentCategory::MODS,
    ContentCategory::CONFIG,
    ContentCategory::RESOURCE_PACKS,
    ContentCategory::SHADER_PACKS
};

// Key used for the category in manifests and on the command line.
const char* category_key(ContentCategory category);
std::optional<ContentCategory> category_from_key(const std::string& key);

struct CategoryStats {
    bool available = false;
    uint32_t count = 0;
    uint64_t total_size_bytes = 0;
};

struct WorldEntry {
    std::string name;
    std::string folder_name;
    uint64_t size_bytes = 0;
    bool is_server_world = false;
    std::vector<std::string> additional_folders; // world_nether, world_the_end on servers
};

// Read-only snapshot of a workspace, recomputed on every request.
struct ContentInventory {
    std::array<CategoryStats, 4> categories{};
    std::vector<WorldEntry> worlds;

    const CategoryStats& stats(ContentCategory c) const { return categories[static_cast<size_t>(c)]; }
    CategoryStats& stats(ContentCategory c) { return categories[static_cast<size_t>(c)]; }
    const WorldEntry* find_world(const std::string& folder_name) const;
};

struct ExportOptions {
    std::array<bool, 4> include{};
    std::set<std::string> worlds; // selected folder_names

    bool includes(ContentCategory c) const { return include[static_cast<size_t>(c)]; }
    void set(ContentCategory c, bool on) { include[static_cast<size_t>(c)] = on; }
};

/**
 * @brief Drops selections the inventory did not report as available.
 *
 * Unavailable categories and unknown world folders are removed silently.
 */
ExportOptions sanitize_options(const ExportOptions& options, const ContentInventory& inventory);

// Bytes the options select, per the inventory sizes.
uint64_t selected_bytes(const ExportOptions& options, const ContentInventory& inventory);

struct PreparedExport {
    std::string export_id;
    std::filesystem::path package_path;
    uint64_t content_bytes = 0;  // manifest total_size_bytes
    uint64_t package_bytes = 0;  // artifact size on disk
    std::string instance_name;
};

enum class ShareProvider {
    BORE,        // relay-A tunnel
    CLOUDFLARE,  // relay-B tunnel
    SWARM        // peer-to-peer seeding
};

const char* provider_key(ShareProvider provider);
std::optional<ShareProvider> provider_from_key(const std::string& key);

enum class ShareStatus {
    CONNECTING,
    CONNECTED,
    ERROR,
    STOPPED
};

const char* status_key(ShareStatus status);

struct ActiveShare {
    std::string share_id;
    ShareProvider provider = ShareProvider::BORE;
    std::optional<std::string> public_url;
    uint32_t download_count = 0;
    uint64_t uploaded_bytes = 0;
    std::time_t started_at = 0;
    std::optional<std::string> password_hash;
    std::optional<std::string> password_salt;
    std::optional<std::time_t> expires_at;
    std::filesystem::path package_path;
    uint64_t package_bytes = 0;
    std::string instance_name;
};

// Generic progress shape shared by export and import.
struct ProgressEvent {
    std::string operation_id;
    std::string stage;
    uint64_t current = 0;
    uint64_t total = 0;
    std::string message;
};

using ProgressCallback = std::function<void(const ProgressEvent&)>;

struct ShareStatusEvent {
    std::string share_id;
    ShareStatus status = ShareStatus::CONNECTING;
    std::optional<std::string> url;
    std::optional<std::string> error;
};

struct ShareDownloadEvent {
    std::string share_id;
    uint32_t download_count = 0;
    uint64_t uploaded_bytes = 0;
    std::optional<uint32_t> peer_count; // swarm shares only
};

struct AgentInfo {
    ShareProvider provider = ShareProvider::BORE;
    std::optional<std::string> version;
    std::filesystem::path path;
    bool installed = false;
};

// Client-side projection of a swarm seed, never a source of truth.
struct SeedSession {
    std::string export_id;
    std::string share_id;
    std::string magnet;
    uint32_t peer_count = 0;
    uint64_t uploaded_bytes = 0;
};

#endif // INSTSHARE_TYPES_HPP
