#ifndef INSTSHARE_PACKAGER_HPP
#define INSTSHARE_PACKAGER_HPP

#include "types.hpp"
#include "workspace.hpp"
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace fs = std::filesystem;

// Archive creation collaborator of the export flow.
class Packager {
public:
    virtual ~Packager() = default;

    /**
     * @brief Packages the selected content of a workspace into one artifact.
     * @throws SharingError(PACKAGING). No partial artifact survives a failure.
     */
    virtual PreparedExport prepare_export(const WorkspaceInfo& workspace, const ExportOptions& options,
                                          const ProgressCallback& progress) = 0;

    // Deletes the artifact of an export. Unknown ids are acknowledged silently.
    virtual void cleanup_export(const std::string& export_id) = 0;

    // Re-associates an artifact that survived a restart with an export id.
    virtual void adopt_export(const std::string& export_id, const fs::path& package_path) = 0;
};

class ArchivePackager : public Packager {
public:
    explicit ArchivePackager(fs::path temp_dir);

    PreparedExport prepare_export(const WorkspaceInfo& workspace, const ExportOptions& options,
                                  const ProgressCallback& progress) override;
    void cleanup_export(const std::string& export_id) override;
    void adopt_export(const std::string& export_id, const fs::path& package_path) override;

    std::optional<fs::path> artifact(const std::string& export_id) const;

private:
    fs::path temp_dir_;
    mutable std::mutex mutex_;
    std::map<std::string, fs::path> artifacts_;
};

#endif // INSTSHARE_PACKAGER_HPP
