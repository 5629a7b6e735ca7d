#include "sharing/types.hpp"

const char* category_key(ContentCategory category) {
    switch (category) {
        case ContentCategory::MODS: return "mods";
        case ContentCategory::CONFIG: return "config";
        case ContentCategory::RESOURCE_PACKS: return "resourcepacks";
        case ContentCategory::SHADER_PACKS: return "shaderpacks";
    }
    return "unknown";
}

std::optional<ContentCategory> category_from_key(const std::string& key) {
    for (ContentCategory c : ALL_CATEGORIES) {
        if (key == category_key(c)) return c;
    }
    return std::nullopt;
}

const WorldEntry* ContentInventory::find_world(const std::string& folder_name) const {
    for (const auto& w : worlds) {
        if (w.folder_name == folder_name) return &w;
    }
    return nullptr;
}

ExportOptions sanitize_options(const ExportOptions& options, const ContentInventory& inventory) {
    ExportOptions clean;
    for (ContentCategory c : ALL_CATEGORIES) {
        clean.set(c, options.includes(c) && inventory.stats(c).available);
    }
    for (const auto& folder : options.worlds) {
        if (inventory.find_world(folder)) {
            clean.worlds.insert(folder);
        }
    }
    return clean;
}

uint64_t selected_bytes(const ExportOptions& options, const ContentInventory& inventory) {
    ExportOptions clean = sanitize_options(options, inventory);
    uint64_t total = 0;
    for (ContentCategory c : ALL_CATEGORIES) {
        if (clean.includes(c)) total += inventory.stats(c).total_size_bytes;
    }
    for (const auto& folder : clean.worlds) {
        total += inventory.find_world(folder)->size_bytes;
    }
    return total;
}

const char* provider_key(ShareProvider provider) {
    switch (provider) {
        case ShareProvider::BORE: return "bore";
        case ShareProvider::CLOUDFLARE: return "cloudflare";
        case ShareProvider::SWARM: return "swarm";
    }
    return "unknown";
}

std::optional<ShareProvider> provider_from_key(const std::string& key) {
    if (key == "bore") return ShareProvider::BORE;
    if (key == "cloudflare") return ShareProvider::CLOUDFLARE;
    if (key == "swarm") return ShareProvider::SWARM;
    return std::nullopt;
}

const char* status_key(ShareStatus status) {
    switch (status) {
        case ShareStatus::CONNECTING: return "connecting";
        case ShareStatus::CONNECTED: return "connected";
        case ShareStatus::ERROR: return "error";
        case ShareStatus::STOPPED: return "stopped";
    }
    return "unknown";
}
