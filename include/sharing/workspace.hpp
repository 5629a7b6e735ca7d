#ifndef INSTSHARE_WORKSPACE_HPP
#define INSTSHARE_WORKSPACE_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

struct WorkspaceInfo {
    std::string id;          // directory name under the instances dir
    std::string name;
    std::string game_version;
    std::optional<std::string> loader;
    std::optional<std::string> loader_version;
    bool is_server = false;
    bool is_proxy = false;
    std::optional<uint32_t> memory_min_mb;
    std::optional<uint32_t> memory_max_mb;
    std::optional<std::string> jvm_args;
    fs::path directory;
};

/**
 * @brief Directory-backed view of the local workspaces.
 *
 * Each workspace is `<root>/<id>/` described by an `instance.json` file.
 */
class WorkspaceCatalog {
public:
    static constexpr const char* DESCRIPTOR_FILE = "instance.json";

    explicit WorkspaceCatalog(fs::path root);

    const fs::path& root() const { return root_; }

    std::vector<WorkspaceInfo> list() const;

    // Throws SharingError(PRECONDITION) when the workspace does not exist.
    WorkspaceInfo resolve(const std::string& id) const;

    bool name_taken(const std::string& name) const;

    // "Name", then "Name (2)", "Name (3)", ... until no workspace uses it.
    std::string unique_name(const std::string& base) const;

    // Lower-cased, filesystem-safe directory name not yet present under the root.
    std::string allocate_directory(const std::string& name) const;

    static void write_descriptor(const WorkspaceInfo& info);
    static std::optional<WorkspaceInfo> read_descriptor(const fs::path& directory);

private:
    fs::path root_;
};

// Replaces characters that are unsafe in file names with '_'.
std::string sanitize_file_name(const std::string& name);

#endif // INSTSHARE_WORKSPACE_HPP
