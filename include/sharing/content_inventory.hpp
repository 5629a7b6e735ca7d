#ifndef INSTSHARE_CONTENT_INVENTORY_HPP
#define INSTSHARE_CONTENT_INVENTORY_HPP

#include "types.hpp"
#include "workspace.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// A file selected for packaging, relative to the workspace directory.
struct ContentFile {
    fs::path source;
    std::string relative_path; // always '/'-separated
    uint64_t size_bytes = 0;
};

/**
 * @brief Read-only inspection of a workspace's optional content.
 *
 * Nothing here writes to the workspace.
 */
class ContentScanner {
public:
    static ContentInventory scan(const WorkspaceInfo& workspace);

    // Folder name holding the category ("plugins" replaces "mods" on plugin servers).
    static std::string category_folder(const WorkspaceInfo& workspace, ContentCategory category);

    // Resource and shader packs only exist on clients.
    static bool category_supported(const WorkspaceInfo& workspace, ContentCategory category);

    /**
     * @brief Lists every file a category contributes, recursing into sub-directories.
     *
     * `.meta.json` sidecars are skipped everywhere except the mods folder.
     */
    static std::vector<ContentFile> category_files(const WorkspaceInfo& workspace, ContentCategory category);

    // Folders (relative to the workspace) that make up a world entry.
    static std::vector<std::string> world_folders(const WorkspaceInfo& workspace, const WorldEntry& world);

    static std::vector<ContentFile> world_files(const WorkspaceInfo& workspace, const WorldEntry& world);

    static uint64_t directory_size(const fs::path& dir);

private:
    static std::vector<WorldEntry> scan_worlds(const WorkspaceInfo& workspace);
    static void collect(const fs::path& base, const fs::path& dir, bool keep_meta,
                        std::vector<ContentFile>& out);
};

#endif // INSTSHARE_CONTENT_INVENTORY_HPP
