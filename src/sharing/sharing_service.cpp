#include "sharing/sharing_service.hpp"
#include "sharing/content_inventory.hpp"
#include "retrieval/http_retriever.hpp"
#include "retrieval/swarm_retriever.hpp"
#include "swarm/magnet.hpp"
#include "transport/swarm_strategy.hpp"
#include "transport/tunnel_strategy.hpp"
#include "common/logger.hpp"
#include "crypto/hasher.hpp"
#include "sharing/package_archive.hpp"
#include <ctime>

SharingService::Collaborators SharingService::default_collaborators(const Config& config,
                                                                    asio::io_context& io_context) {
    Collaborators c;
    c.packager = std::make_shared<ArchivePackager>(config.temp_dir());
    c.materializer = std::make_shared<WorkspaceMaterializer>(WorkspaceCatalog(config.instances_dir));
    c.strategies.push_back(std::make_shared<TunnelStrategy>(io_context, ShareProvider::BORE, config.tunnel));
    c.strategies.push_back(std::make_shared<TunnelStrategy>(io_context, ShareProvider::CLOUDFLARE, config.tunnel));
    c.strategies.push_back(std::make_shared<SwarmStrategy>(io_context, config.swarm));
    c.retriever_factory = &SharingService::default_retriever;
    c.storage = std::make_shared<StorageManager>(config.database.string());
    return c;
}

std::unique_ptr<Retriever> SharingService::default_retriever(const std::string& locator) {
    if (MagnetLink::looks_like_magnet(locator)) {
        return std::make_unique<SwarmRetriever>();
    }
    if (HttpUrl::parse(locator)) {
        return std::make_unique<HttpRetriever>();
    }
    return nullptr;
}

SharingService::SharingService(Config config, asio::io_context& io_context, TaskRunner& tasks,
                               Collaborators collaborators)
    : config_(std::move(config)),
      tasks_(tasks),
      catalog_(config_.instances_dir),
      agents_(config_.tunnel),
      provisioner_(io_context, registry_, bus_, config_.tunnel),
      packager_(std::move(collaborators.packager)),
      materializer_(std::move(collaborators.materializer)),
      storage_(std::move(collaborators.storage)),
      retriever_factory_(std::move(collaborators.retriever_factory)) {
    if (!packager_ || !materializer_) {
        throw std::invalid_argument("SharingService needs a packager and a materializer");
    }
    for (auto& strategy : collaborators.strategies) {
        provisioner_.register_strategy(std::move(strategy));
    }

    // Expiry takes the same teardown path as a manual stop, off the io thread.
    provisioner_.set_expiry_handler([this](const std::string& share_id) {
        tasks_.post([this, share_id]() {
            TeardownReport report = stop_share(share_id);
            if (!report.clean()) {
                LOG_WARN("Expired share ", share_id, " left ", report.failures.size(), " teardown failure(s)");
            }
        });
    });
}

SharingService::~SharingService() {
    shutdown();
}

std::vector<WorkspaceInfo> SharingService::workspaces() const {
    return catalog_.list();
}

ContentInventory SharingService::inventory(const std::string& workspace_id) const {
    return ContentScanner::scan(catalog_.resolve(workspace_id));
}

PreparedExport SharingService::prepare_export(const std::string& workspace_id, const ExportOptions& options,
                                              const ProgressCallback& progress) {
    WorkspaceInfo workspace = catalog_.resolve(workspace_id);
    ContentInventory inventory = ContentScanner::scan(workspace);
    ExportOptions selection = sanitize_options(options, inventory);
    if (selected_bytes(selection, inventory) == 0) {
        throw SharingError(ErrorKind::PRECONDITION, "Nothing selected to export");
    }

    LOG_INFO("Preparing export of workspace '", workspace.name, "'");
    PreparedExport prepared = packager_->prepare_export(workspace, selection,
        [this, &progress](const ProgressEvent& event) {
            bus_.publish(event);
            if (progress) progress(event);
        });
    LOG_INFO("Export ", prepared.export_id, " ready: ", prepared.package_path, " (", prepared.package_bytes, " bytes)");
    return prepared;
}

ActiveShare SharingService::start_share(const PreparedExport& prepared, ShareProvider provider,
                                        const std::optional<std::string>& password) {
    StartShareOptions options;
    options.password = password;
    return provision(prepared, provider, options);
}

ActiveShare SharingService::provision(const PreparedExport& prepared, ShareProvider provider,
                                      const StartShareOptions& base) {
    StartShareOptions options = base;
    options.export_id = prepared.export_id;
    options.package_path = prepared.package_path;
    options.package_bytes = prepared.package_bytes;
    options.instance_name = prepared.instance_name;
    options.provider = provider;

    ActiveShare share = provisioner_.start_share(options);
    auto record = registry_.get(share.share_id);
    if (record) persist(*record);
    return share;
}

void SharingService::persist(const ShareRecord& record) {
    if (!storage_) return;
    PersistedShare row;
    row.share_id = record.share.share_id;
    row.export_id = record.export_id;
    row.instance_name = record.share.instance_name;
    row.package_path = record.share.package_path.string();
    row.provider = record.share.provider;
    row.password_hash = record.share.password_hash;
    row.password_salt = record.share.password_salt;
    row.file_size = record.share.package_bytes;
    row.created_at = record.share.started_at;
    row.expires_at = record.share.expires_at;
    if (!storage_->save_share(row)) {
        LOG_WARN("Share ", row.share_id, " will not survive a restart: persisting it failed");
    }
}

TeardownReport SharingService::stop_share(const std::string& share_id) {
    TeardownReport report;
    auto record = registry_.get(share_id);

    try {
        provisioner_.stop_share(share_id);
    } catch (const std::exception& e) {
        report.add("transport", e.what());
    }

    if (record) {
        bool artifact_shared_elsewhere = false;
        for (const auto& other : registry_.list()) {
            if (other.share.share_id != share_id && other.export_id == record->export_id) {
                artifact_shared_elsewhere = true;
                break;
            }
        }
        if (!artifact_shared_elsewhere) {
            try {
                packager_->cleanup_export(record->export_id);
            } catch (const std::exception& e) {
                report.add("artifact", e.what());
            }
        }
    }

    try {
        registry_.remove(share_id);
        if (record) registry_.remove_seed_session(record->export_id);
    } catch (const std::exception& e) {
        report.add("registry", e.what());
    }

    if (storage_ && !storage_->delete_share(share_id)) {
        report.add("storage", "could not delete the persisted share");
    }

    if (record) {
        bus_.publish(ShareStatusEvent{share_id, ShareStatus::STOPPED, std::nullopt, std::nullopt});
        LOG_INFO("Share ", share_id, " stopped");
    }
    for (const auto& failure : report.failures) {
        LOG_ERR("Teardown of share ", share_id, ": ", failure);
    }
    return report;
}

void SharingService::cleanup_export(const std::string& export_id) {
    packager_->cleanup_export(export_id);
}

SharingManifest SharingService::validate_import_package(const fs::path& package) const {
    return inspect_package(package).manifest;
}

WorkspaceInfo SharingService::import_instance(const fs::path& package, const std::optional<std::string>& new_name,
                                              const ProgressCallback& progress) {
    SharingManifest manifest = inspect_package(package).manifest;
    std::string name = new_name && !new_name->empty() ? *new_name : manifest.instance.name;
    WorkspaceInfo created = materializer_->materialize(package, manifest, name,
        [this, &progress](const ProgressEvent& event) {
            bus_.publish(event);
            if (progress) progress(event);
        });
    LOG_INFO("Imported '", created.name, "' into ", created.directory);
    return created;
}

std::optional<AgentInfo> SharingService::check_tunnel_agent(ShareProvider provider) const {
    return agents_.check_agent(provider);
}

AgentInfo SharingService::install_tunnel_agent(ShareProvider provider) {
    return agents_.install_agent(provider);
}

std::vector<ActiveShare> SharingService::restore_shares() {
    std::vector<ActiveShare> restored;
    if (!storage_) return restored;

    std::time_t now = std::time(nullptr);
    for (const auto& row : storage_->get_all_shares()) {
        std::error_code ec;
        fs::path package(row.package_path);

        if (row.expires_at && *row.expires_at <= now) {
            LOG_INFO("Dropping expired share ", row.share_id);
            fs::remove(package, ec);
            storage_->delete_share(row.share_id);
            continue;
        }
        if (!fs::is_regular_file(package, ec)) {
            LOG_WARN("Dropping share ", row.share_id, ": artifact ", package, " is gone");
            storage_->delete_share(row.share_id);
            continue;
        }

        PreparedExport prepared;
        prepared.export_id = row.export_id;
        prepared.package_path = package;
        prepared.package_bytes = row.file_size;
        prepared.instance_name = row.instance_name;

        StartShareOptions options;
        if (row.password_hash && row.password_salt) {
            options.credential = PasswordCredential{*row.password_hash, *row.password_salt};
        }
        options.expires_at = row.expires_at;

        try {
            packager_->adopt_export(row.export_id, package);
            ActiveShare share = provision(prepared, row.provider, options);
            storage_->delete_share(row.share_id);
            LOG_INFO("Restored share of '", row.instance_name, "' as ", share.share_id);
            restored.push_back(share);
        } catch (const SharingError& e) {
            LOG_ERR("Could not restore share ", row.share_id, ": ", e.what());
        }
    }
    return restored;
}

TeardownReport SharingService::stop_all_shares() {
    TeardownReport report;
    for (const auto& id : registry_.ids()) {
        TeardownReport one = stop_share(id);
        report.failures.insert(report.failures.end(), one.failures.begin(), one.failures.end());
    }
    return report;
}

void SharingService::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shut_down_) return;
        shut_down_ = true;
    }
    provisioner_.shutdown();
    for (const auto& id : registry_.ids()) {
        auto record = registry_.remove(id);
        if (record) registry_.remove_seed_session(record->export_id);
    }
    LOG_INFO("Sharing transports shut down");
}

std::unique_ptr<Retriever> SharingService::retriever_for(const std::string& locator) const {
    RetrieverFactory factory;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        factory = retriever_factory_;
    }
    std::unique_ptr<Retriever> retriever = factory ? factory(locator) : nullptr;
    if (!retriever) {
        throw SharingError(ErrorKind::PRECONDITION, "Unsupported share locator: expected an http(s) URL or a magnet link");
    }
    return retriever;
}

void SharingService::set_retriever_factory(RetrieverFactory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    retriever_factory_ = std::move(factory);
}

fs::path SharingService::new_download_path() const {
    return config_.downloads_dir() / ("download-" + Hasher::generate_uuid() + PackageArchive::FILE_EXTENSION);
}

TransportCapabilities SharingService::capabilities(ShareProvider provider) const {
    return provisioner_.capabilities(provider);
}

bool SharingService::has_provider(ShareProvider provider) const {
    return provisioner_.has_strategy(provider);
}

std::vector<ShareRecord> SharingService::shares() const {
    return registry_.list();
}

std::optional<ShareRecord> SharingService::share(const std::string& share_id) const {
    return registry_.get(share_id);
}

std::vector<SeedSession> SharingService::seed_sessions() const {
    return registry_.seed_sessions();
}
