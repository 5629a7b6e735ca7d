#include "sharing/content_inventory.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <cctype>

namespace {

const char* const PLUGIN_LOADERS[] = {"paper", "purpur", "velocity", "bungeecord", "waterfall"};

constexpr const char* SERVER_WORLD = "world";
constexpr const char* SERVER_NETHER = "world_nether";
constexpr const char* SERVER_END = "world_the_end";

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

uint64_t entry_size(const fs::directory_entry& entry) {
    std::error_code ec;
    if (entry.is_directory(ec)) return ContentScanner::directory_size(entry.path());
    uint64_t size = entry.file_size(ec);
    return ec ? 0 : size;
}

} // namespace

std::string ContentScanner::category_folder(const WorkspaceInfo& workspace, ContentCategory category) {
    switch (category) {
        case ContentCategory::MODS:
            if (workspace.loader) {
                std::string loader = *workspace.loader;
                std::transform(loader.begin(), loader.end(), loader.begin(),
                               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
                for (const char* p : PLUGIN_LOADERS) {
                    if (loader == p) return "plugins";
                }
            }
            return "mods";
        case ContentCategory::CONFIG: return "config";
        case ContentCategory::RESOURCE_PACKS: return "resourcepacks";
        case ContentCategory::SHADER_PACKS: return "shaderpacks";
    }
    return "";
}

bool ContentScanner::category_supported(const WorkspaceInfo& workspace, ContentCategory category) {
    if (category == ContentCategory::RESOURCE_PACKS || category == ContentCategory::SHADER_PACKS) {
        return !workspace.is_server && !workspace.is_proxy;
    }
    return true;
}

uint64_t ContentScanner::directory_size(const fs::path& dir) {
    uint64_t total = 0;
    std::error_code ec;
    fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) return 0;
    for (const auto& entry : it) {
        std::error_code fec;
        if (entry.is_regular_file(fec)) {
            uint64_t size = entry.file_size(fec);
            if (!fec) total += size;
        }
    }
    return total;
}

ContentInventory ContentScanner::scan(const WorkspaceInfo& workspace) {
    ContentInventory inventory;

    for (ContentCategory c : ALL_CATEGORIES) {
        CategoryStats& stats = inventory.stats(c);
        if (!category_supported(workspace, c)) continue;

        fs::path dir = workspace.directory / category_folder(workspace, c);
        std::error_code ec;
        if (!fs::is_directory(dir, ec)) continue;

        // Sub-directories count as a single entry
        for (const auto& entry : fs::directory_iterator(dir, ec)) {
            stats.count++;
            stats.total_size_bytes += entry_size(entry);
        }
        stats.available = stats.count > 0;
    }

    inventory.worlds = scan_worlds(workspace);
    LOG_DEBUG("Inventory for ", workspace.name, ": ", inventory.worlds.size(), " worlds");
    return inventory;
}

std::vector<WorldEntry> ContentScanner::scan_worlds(const WorkspaceInfo& workspace) {
    std::vector<WorldEntry> worlds;
    std::error_code ec;

    if (workspace.is_proxy) return worlds;

    if (workspace.is_server) {
        fs::path main_world = workspace.directory / SERVER_WORLD;
        if (!fs::is_directory(main_world, ec)) return worlds;

        WorldEntry entry;
        entry.name = "Server World";
        entry.folder_name = SERVER_WORLD;
        entry.is_server_world = true;
        entry.size_bytes = directory_size(main_world);
        for (const char* extra : {SERVER_NETHER, SERVER_END}) {
            fs::path p = workspace.directory / extra;
            if (fs::is_directory(p, ec)) {
                entry.additional_folders.push_back(extra);
                entry.size_bytes += directory_size(p);
            }
        }
        worlds.push_back(std::move(entry));
        return worlds;
    }

    fs::path saves = workspace.directory / "saves";
    if (!fs::is_directory(saves, ec)) return worlds;

    for (const auto& dir : fs::directory_iterator(saves, ec)) {
        if (!dir.is_directory()) continue;
        if (!fs::exists(dir.path() / "level.dat")) continue;

        WorldEntry entry;
        entry.folder_name = dir.path().filename().string();
        entry.name = entry.folder_name;
        entry.size_bytes = directory_size(dir.path());
        worlds.push_back(std::move(entry));
    }
    std::sort(worlds.begin(), worlds.end(),
              [](const WorldEntry& a, const WorldEntry& b) { return a.folder_name < b.folder_name; });
    return worlds;
}

void ContentScanner::collect(const fs::path& base, const fs::path& dir, bool keep_meta,
                             std::vector<ContentFile>& out) {
    std::error_code ec;
    fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) return;
    for (const auto& entry : it) {
        std::error_code fec;
        if (!entry.is_regular_file(fec)) continue;
        std::string file_name = entry.path().filename().string();
        if (!keep_meta && ends_with(file_name, ".meta.json")) continue;

        ContentFile file;
        file.source = entry.path();
        file.relative_path = fs::relative(entry.path(), base).generic_string();
        file.size_bytes = entry.file_size(fec);
        out.push_back(std::move(file));
    }
}

std::vector<ContentFile> ContentScanner::category_files(const WorkspaceInfo& workspace, ContentCategory category) {
    std::vector<ContentFile> files;
    if (!category_supported(workspace, category)) return files;
    fs::path dir = workspace.directory / category_folder(workspace, category);
    collect(workspace.directory, dir, category == ContentCategory::MODS, files);
    std::sort(files.begin(), files.end(),
              [](const ContentFile& a, const ContentFile& b) { return a.relative_path < b.relative_path; });
    return files;
}

std::vector<std::string> ContentScanner::world_folders(const WorkspaceInfo& workspace, const WorldEntry& world) {
    std::vector<std::string> folders;
    if (world.is_server_world || workspace.is_server) {
        folders.push_back(world.folder_name);
    } else {
        folders.push_back("saves/" + world.folder_name);
    }
    for (const auto& extra : world.additional_folders) {
        folders.push_back(extra);
    }
    return folders;
}

std::vector<ContentFile> ContentScanner::world_files(const WorkspaceInfo& workspace, const WorldEntry& world) {
    std::vector<ContentFile> files;
    for (const auto& folder : world_folders(workspace, world)) {
        collect(workspace.directory, workspace.directory / folder, true, files);
    }
    std::sort(files.begin(), files.end(),
              [](const ContentFile& a, const ContentFile& b) { return a.relative_path < b.relative_path; });
    return files;
}
