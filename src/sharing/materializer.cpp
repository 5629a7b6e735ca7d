#include "sharing/materializer.hpp"
#include "sharing/content_inventory.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"

namespace {

bool under(const std::string& path, const std::string& folder) {
    return path.size() > folder.size() && path.compare(0, folder.size(), folder) == 0 &&
           path[folder.size()] == '/';
}

} // namespace

WorkspaceInfo workspace_of(const ManifestInstance& instance) {
    WorkspaceInfo info;
    info.name = instance.name;
    info.game_version = instance.game_version;
    info.loader = instance.loader;
    info.loader_version = instance.loader_version;
    info.is_server = instance.is_server;
    info.is_proxy = instance.is_proxy;
    info.memory_min_mb = instance.memory_min_mb;
    info.memory_max_mb = instance.memory_max_mb;
    info.jvm_args = instance.jvm_args;
    return info;
}

InspectedPackage inspect_package(const fs::path& package) {
    InspectedPackage inspected;
    inspected.index = PackageArchive::read_index(package);
    inspected.manifest = ManifestCodec::decode(inspected.index.manifest_json);

    const SharingManifest& m = inspected.manifest;
    WorkspaceInfo shape = workspace_of(m.instance);

    std::vector<std::string> allowed;
    for (ContentCategory c : ALL_CATEGORIES) {
        if (m.section(c).included) allowed.push_back(ContentScanner::category_folder(shape, c));
    }
    for (const auto& world : m.saves.worlds) {
        for (const auto& folder : ContentScanner::world_folders(shape, world)) {
            if (!PackageArchive::is_safe_entry_path(folder)) {
                throw SharingError(ErrorKind::VALIDATION, "Invalid manifest: unsafe world folder '" + folder + "'");
            }
            allowed.push_back(folder);
        }
    }

    for (const auto& entry : inspected.index.entries) {
        bool covered = false;
        for (const auto& folder : allowed) {
            if (under(entry.path, folder)) {
                covered = true;
                break;
            }
        }
        if (!covered) {
            throw SharingError(ErrorKind::VALIDATION,
                               "Invalid package: entry '" + entry.path + "' is not declared by the manifest");
        }
    }
    return inspected;
}

WorkspaceMaterializer::WorkspaceMaterializer(WorkspaceCatalog catalog) : catalog_(std::move(catalog)) {}

WorkspaceInfo WorkspaceMaterializer::materialize(const fs::path& package, const SharingManifest& manifest,
                                                 const std::string& destination_name,
                                                 const ProgressCallback& progress) {
    const std::string op = package.filename().string();
    auto emit = [&](const std::string& stage, uint64_t current, const std::string& message) {
        if (progress) progress(ProgressEvent{op, stage, current, 100, message});
    };

    emit("validating", 0, "Checking package");
    InspectedPackage inspected;
    try {
        inspected = inspect_package(package);
    } catch (const SharingError& e) {
        throw SharingError(ErrorKind::MATERIALIZATION, std::string("Package changed since validation: ") + e.what());
    }

    WorkspaceInfo info = workspace_of(manifest.instance);
    {
        std::lock_guard<std::mutex> lock(allocation_mutex_);
        std::error_code ec;
        fs::create_directories(catalog_.root(), ec);
        info.name = catalog_.unique_name(destination_name.empty() ? manifest.instance.name : destination_name);
        info.id = catalog_.allocate_directory(info.name);
        info.directory = catalog_.root() / info.id;
        if (!fs::create_directory(info.directory, ec) || ec) {
            throw SharingError(ErrorKind::MATERIALIZATION, "Cannot create workspace directory " +
                               info.directory.string() + (ec ? ": " + ec.message() : std::string()));
        }
    }

    try {
        emit("extracting", 20, "Extracting " + std::to_string(inspected.index.entries.size()) + " files");
        PackageArchive::extract(package, inspected.index, info.directory, [&](uint64_t done, uint64_t total) {
            uint64_t pct = total == 0 ? 80 : 20 + (done * 60) / total;
            emit("extracting", pct, "Extracting content");
        });

        emit("installing", 80, "Writing workspace descriptor");
        WorkspaceCatalog::write_descriptor(info);
    } catch (const std::exception& e) {
        std::error_code ec;
        fs::remove_all(info.directory, ec);
        LOG_ERR("Materializing ", info.name, " failed: ", e.what());
        throw SharingError(ErrorKind::MATERIALIZATION, std::string("Import failed: ") + e.what());
    }

    emit("complete", 100, "Imported as " + info.name);
    LOG_INFO("Imported workspace ", info.name, " into ", info.directory);
    return info;
}
