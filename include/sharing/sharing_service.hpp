#ifndef INSTSHARE_SHARING_SERVICE_HPP
#define INSTSHARE_SHARING_SERVICE_HPP

#include "event_bus.hpp"
#include "manifest.hpp"
#include "materializer.hpp"
#include "packager.hpp"
#include "share_registry.hpp"
#include "task_runner.hpp"
#include "types.hpp"
#include "workspace.hpp"
#include "../common/config.hpp"
#include "../common/errors.hpp"
#include "../retrieval/retriever.hpp"
#include "../storage/storage_manager.hpp"
#include "../transport/transport_provisioner.hpp"
#include "../transport/tunnel_agent.hpp"
#include <asio.hpp>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Backend boundary of the sharing subsystem.
 *
 * Every operation the orchestrators and the command line use goes through
 * here. Operations block the calling thread; the orchestrators call them from
 * the task runner.
 */
class SharingService {
public:
    using RetrieverFactory = std::function<std::unique_ptr<Retriever>(const std::string& locator)>;

    struct Collaborators {
        std::shared_ptr<Packager> packager;
        std::shared_ptr<Materializer> materializer;
        std::vector<std::shared_ptr<TransportStrategy>> strategies;
        RetrieverFactory retriever_factory;
        std::shared_ptr<StorageManager> storage; // optional, shares are not persisted without it
    };

    /**
     * @brief The production wiring: archive packager, workspace materializer,
     * both tunnel relays, the swarm, HTTP and swarm retrievers and the SQLite store.
     * @throws SharingError(STORAGE) if the database cannot be opened.
     */
    static Collaborators default_collaborators(const Config& config, asio::io_context& io_context);

    // Picks the HTTP retriever for http(s) locators and the swarm retriever for magnets.
    static std::unique_ptr<Retriever> default_retriever(const std::string& locator);

    SharingService(Config config, asio::io_context& io_context, TaskRunner& tasks, Collaborators collaborators);
    ~SharingService();

    SharingService(const SharingService&) = delete;
    SharingService& operator=(const SharingService&) = delete;

    std::vector<WorkspaceInfo> workspaces() const;

    // Throws SharingError(PRECONDITION) for an unknown workspace.
    ContentInventory inventory(const std::string& workspace_id) const;

    /**
     * @brief Packages the selection of a workspace.
     *
     * Unavailable selections are dropped first.
     * @throws SharingError(PRECONDITION) when nothing remains selected,
     *         SharingError(PACKAGING) when the archive cannot be written.
     */
    PreparedExport prepare_export(const std::string& workspace_id, const ExportOptions& options,
                                  const ProgressCallback& progress = nullptr);

    /**
     * @brief Exposes a prepared export.
     * @return The registered share, whose public_url arrives later for tunnels.
     */
    ActiveShare start_share(const PreparedExport& prepared, ShareProvider provider,
                            const std::optional<std::string>& password = std::nullopt);

    /**
     * @brief Tears a share down: transport, artifact, registry entry, persisted row.
     *
     * Every step runs even when an earlier one fails. Idempotent.
     */
    TeardownReport stop_share(const std::string& share_id);

    // Deletes the artifact of an export that was never shared or is no longer shared.
    void cleanup_export(const std::string& export_id);

    // Throws SharingError(VALIDATION).
    SharingManifest validate_import_package(const fs::path& package) const;

    /**
     * @brief Validates a package and creates a workspace from it.
     * @throws SharingError(VALIDATION) or SharingError(MATERIALIZATION).
     */
    WorkspaceInfo import_instance(const fs::path& package, const std::optional<std::string>& new_name,
                                  const ProgressCallback& progress = nullptr);

    std::optional<AgentInfo> check_tunnel_agent(ShareProvider provider) const;
    AgentInfo install_tunnel_agent(ShareProvider provider);

    /**
     * @brief Re-advertises the shares persisted by a previous run.
     *
     * Each one gets a fresh share id and URL. Expired rows and rows whose
     * artifact is gone are deleted.
     */
    std::vector<ActiveShare> restore_shares();

    TeardownReport stop_all_shares();

    // Stops every transport but keeps persisted rows and artifacts for restore_shares().
    void shutdown();

    // Throws SharingError(PRECONDITION) for a locator no retriever understands.
    std::unique_ptr<Retriever> retriever_for(const std::string& locator) const;
    void set_retriever_factory(RetrieverFactory factory);

    // Fresh file name under the downloads directory.
    fs::path new_download_path() const;

    TransportCapabilities capabilities(ShareProvider provider) const;
    bool has_provider(ShareProvider provider) const;

    std::vector<ShareRecord> shares() const;
    std::optional<ShareRecord> share(const std::string& share_id) const;
    std::vector<SeedSession> seed_sessions() const;

    SharingEventBus& events() { return bus_; }
    const Config& config() const { return config_; }
    TaskRunner& tasks() { return tasks_; }

private:
    ActiveShare provision(const PreparedExport& prepared, ShareProvider provider, const StartShareOptions& options);
    void persist(const ShareRecord& record);

    Config config_;
    TaskRunner& tasks_;
    WorkspaceCatalog catalog_;
    AgentManager agents_;
    SharingEventBus bus_;
    ShareRegistry registry_;
    TransportProvisioner provisioner_;

    std::shared_ptr<Packager> packager_;
    std::shared_ptr<Materializer> materializer_;
    std::shared_ptr<StorageManager> storage_;

    mutable std::mutex mutex_;
    RetrieverFactory retriever_factory_;
    bool shut_down_ = false;
};

#endif // INSTSHARE_SHARING_SERVICE_HPP
