#ifndef INSTSHARE_MATERIALIZER_HPP
#define INSTSHARE_MATERIALIZER_HPP

#include "manifest.hpp"
#include "package_archive.hpp"
#include "types.hpp"
#include "workspace.hpp"
#include <filesystem>
#include <mutex>
#include <string>

namespace fs = std::filesystem;

struct InspectedPackage {
    SharingManifest manifest;
    PackageArchive::Index index;
};

/**
 * @brief Reads a package, decodes its manifest and checks that every entry
 * belongs to a section or world the manifest declares.
 * @throws SharingError(VALIDATION)
 */
InspectedPackage inspect_package(const fs::path& package);

// The workspace shape a manifest describes, used to resolve folder names.
WorkspaceInfo workspace_of(const ManifestInstance& instance);

// Local filesystem mutator of the import flow.
class Materializer {
public:
    virtual ~Materializer() = default;

    /**
     * @brief Creates a new workspace from a validated package.
     * @param destination_name Display name of the new workspace, made unique if taken.
     * @throws SharingError(MATERIALIZATION). No partial workspace survives a failure.
     */
    virtual WorkspaceInfo materialize(const fs::path& package, const SharingManifest& manifest,
                                      const std::string& destination_name,
                                      const ProgressCallback& progress) = 0;
};

class WorkspaceMaterializer : public Materializer {
public:
    explicit WorkspaceMaterializer(WorkspaceCatalog catalog);

    WorkspaceInfo materialize(const fs::path& package, const SharingManifest& manifest,
                              const std::string& destination_name,
                              const ProgressCallback& progress) override;

private:
    WorkspaceCatalog catalog_;
    std::mutex allocation_mutex_;
};

#endif // INSTSHARE_MATERIALIZER_HPP
