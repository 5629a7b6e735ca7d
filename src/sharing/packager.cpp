#include "sharing/packager.hpp"
#include "sharing/content_inventory.hpp"
#include "sharing/manifest.hpp"
#include "sharing/package_archive.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "crypto/hasher.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace {

std::string local_stamp() {
    std::time_t now = std::time(nullptr);
    std::tm tm_buf{};
    localtime_r(&now, &tm_buf);
    std::stringstream ss;
    ss << std::put_time(&tm_buf, "%Y%m%d_%H%M%S");
    return ss.str();
}

void emit(const ProgressCallback& progress, const std::string& id, const std::string& stage,
          uint64_t current, const std::string& message) {
    if (progress) progress(ProgressEvent{id, stage, current, 100, message});
}

} // namespace

ArchivePackager::ArchivePackager(fs::path temp_dir) : temp_dir_(std::move(temp_dir)) {}

PreparedExport ArchivePackager::prepare_export(const WorkspaceInfo& workspace, const ExportOptions& options,
                                               const ProgressCallback& progress) {
    PreparedExport prepared;
    prepared.export_id = Hasher::generate_uuid();
    prepared.instance_name = workspace.name;

    emit(progress, prepared.export_id, "preparing", 0, "Preparing export of " + workspace.name);

    std::error_code ec;
    fs::create_directories(temp_dir_, ec);
    if (ec) {
        throw SharingError(ErrorKind::PACKAGING, "Cannot create " + temp_dir_.string() + ": " + ec.message());
    }

    fs::path out = temp_dir_ / (sanitize_file_name(workspace.name) + "-" + local_stamp() + PackageArchive::FILE_EXTENSION);
    for (int i = 2; fs::exists(out, ec); ++i) {
        out = temp_dir_ / (sanitize_file_name(workspace.name) + "-" + local_stamp() + "-" + std::to_string(i) +
                           PackageArchive::FILE_EXTENSION);
    }

    try {
        emit(progress, prepared.export_id, "scanning", 10, "Scanning workspace content");
        ContentInventory inventory = ContentScanner::scan(workspace);
        SharingManifest manifest = ManifestCodec::build(workspace, options, inventory);

        std::vector<ContentFile> files;
        for (ContentCategory c : ALL_CATEGORIES) {
            if (!manifest.section(c).included) continue;
            auto category = ContentScanner::category_files(workspace, c);
            ContentSection& section = manifest.section(c);
            // Counted from what is packed; the inventory also sees sidecars outside mods.
            section.count = 0;
            section.total_size_bytes = 0;
            for (const auto& f : category) {
                section.files.push_back(ManifestFile{f.relative_path, f.size_bytes, std::nullopt});
                ++section.count;
                section.total_size_bytes += f.size_bytes;
            }
            files.insert(files.end(), category.begin(), category.end());
        }
        auto total = manifest.derived_total();
        if (!total) throw SharingError(ErrorKind::PACKAGING, "Content sizes overflow");
        manifest.total_size_bytes = *total;
        for (const auto& world : manifest.saves.worlds) {
            auto world_files = ContentScanner::world_files(workspace, world);
            files.insert(files.end(), world_files.begin(), world_files.end());
        }

        emit(progress, prepared.export_id, "packaging", 30, "Packaging " + std::to_string(files.size()) + " files");
        auto entries = PackageArchive::write(out, ManifestCodec::encode(manifest), files,
            [&](uint64_t done, uint64_t total) {
                uint64_t pct = total == 0 ? 90 : 30 + (done * 60) / total;
                emit(progress, prepared.export_id, "packaging", pct, "Packaging content");
            });

        prepared.package_path = out;
        prepared.content_bytes = manifest.total_size_bytes;
        prepared.package_bytes = fs::file_size(out);
        LOG_INFO("Packaged ", workspace.name, " into ", out, " (", entries.size(), " entries, ",
                 prepared.package_bytes, " bytes)");
    } catch (const std::exception& e) {
        fs::remove(out, ec);
        LOG_ERR("Packaging ", workspace.name, " failed: ", e.what());
        if (auto sharing = dynamic_cast<const SharingError*>(&e)) {
            if (sharing->kind() == ErrorKind::PACKAGING) throw;
        }
        throw SharingError(ErrorKind::PACKAGING, std::string("Packaging failed: ") + e.what());
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        artifacts_[prepared.export_id] = prepared.package_path;
    }
    emit(progress, prepared.export_id, "ready", 100, "Package ready");
    return prepared;
}

void ArchivePackager::cleanup_export(const std::string& export_id) {
    fs::path path;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = artifacts_.find(export_id);
        if (it == artifacts_.end()) return;
        path = it->second;
        artifacts_.erase(it);
    }
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        throw SharingError(ErrorKind::STORAGE, "Cannot delete artifact " + path.string() + ": " + ec.message());
    }
    LOG_DEBUG("Removed export artifact ", path);
}

void ArchivePackager::adopt_export(const std::string& export_id, const fs::path& package_path) {
    std::lock_guard<std::mutex> lock(mutex_);
    artifacts_[export_id] = package_path;
}

std::optional<fs::path> ArchivePackager::artifact(const std::string& export_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = artifacts_.find(export_id);
    if (it == artifacts_.end()) return std::nullopt;
    return it->second;
}
