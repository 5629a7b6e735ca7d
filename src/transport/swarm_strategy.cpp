#include "transport/swarm_strategy.hpp"
#include "swarm/chunker.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <vector>

SwarmStrategy::SwarmStrategy(asio::io_context& io_context, SwarmConfig config)
    : io_context_(io_context), config_(std::move(config)) {}

SwarmStrategy::~SwarmStrategy() {
    shutdown();
}

TransportCapabilities SwarmStrategy::capabilities() const {
    TransportCapabilities caps;
    caps.supports_password = false;
    caps.requires_agent = false;
    caps.url_based = false;
    return caps;
}

uint16_t SwarmStrategy::listen_port() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return seeder_ ? seeder_->port() : 0;
}

std::string SwarmStrategy::detect_advertise_host() {
    try {
        asio::io_context io;
        asio::ip::udp::socket socket(io);
        socket.connect(asio::ip::udp::endpoint(asio::ip::make_address("8.8.8.8"), 53));
        auto address = socket.local_endpoint().address();
        if (!address.is_unspecified()) return address.to_string();
    } catch (const asio::system_error& e) {
        LOG_DEBUG("Could not detect the outbound interface: ", e.what());
    }
    return "127.0.0.1";
}

void SwarmStrategy::ensure_seeder() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (seeder_) return;

    try {
        seeder_ = Seeder::create(io_context_, config_.listen_port);
    } catch (const asio::system_error& e) {
        throw SharingError(ErrorKind::PROVISIONING,
                           "Cannot listen on swarm port " + std::to_string(config_.listen_port) + ": " + e.what());
    }
    seeder_->start();

    advertise_host_ = config_.advertise_host;
    advertise_port_ = seeder_->port();

    if (config_.enable_upnp) {
        auto mapper = std::make_unique<PortMapper>();
        if (mapper->discover_devices() &&
            mapper->add_port_mapping(advertise_port_, advertise_port_, "instshare swarm")) {
            std::string external_ip = mapper->get_external_ip();
            if (advertise_host_.empty() && !external_ip.empty()) advertise_host_ = external_ip;
            port_mapper_ = std::move(mapper);
        } else {
            LOG_WARN("UPnP port mapping unavailable, peers outside the LAN may not reach this seed");
        }
    }

    if (advertise_host_.empty()) advertise_host_ = detect_advertise_host();
    LOG_INFO("Swarm peers will be pointed at ", advertise_host_, ":", advertise_port_);
}

void SwarmStrategy::start(const ShareRequest& request, TransportSink sink) {
    PieceManifest manifest;
    try {
        manifest = Chunker::create_manifest_from_file(request.package_path, config_.piece_size);
    } catch (const std::runtime_error& e) {
        throw SharingError(ErrorKind::PROVISIONING, std::string("Cannot seed package: ") + e.what());
    }

    ensure_seeder();

    MagnetLink link;
    link.root_hash = manifest.root_hash;
    link.display_name = manifest.file_name;
    link.size = manifest.file_size;

    bool first_for_root = false;
    std::shared_ptr<Seeder> seeder;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        link.peers.push_back(PeerAddress{advertise_host_, advertise_port_});
        auto& root = roots_[manifest.root_hash];
        first_for_root = root.share_ids.empty();
        root.share_ids.insert(request.share_id);
        shares_[request.share_id] = ShareEntry{manifest.root_hash, sink};
        seeder = seeder_;
    }

    if (first_for_root) {
        hash_t root_hash = manifest.root_hash;
        seeder->add_seed(manifest, request.package_path,
                         [this, root_hash](const SeedStats& stats) { dispatch_stats(root_hash, stats); });
    }

    sink(TransportEvent::connected(request.share_id, link.to_uri()));
}

void SwarmStrategy::dispatch_stats(const hash_t& root_hash, const SeedStats& stats) {
    std::vector<std::pair<std::string, TransportSink>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = roots_.find(root_hash);
        if (it == roots_.end()) return;
        for (const auto& id : it->second.share_ids) {
            auto share = shares_.find(id);
            if (share != shares_.end()) targets.emplace_back(id, share->second.sink);
        }
    }
    for (auto& [id, sink] : targets) {
        sink(TransportEvent::progress(id, stats.completed_downloads, stats.uploaded_bytes, stats.peer_count));
    }
}

void SwarmStrategy::stop(const std::string& share_id) {
    std::shared_ptr<Seeder> seeder;
    hash_t root_hash{};
    bool last_for_root = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = shares_.find(share_id);
        if (it == shares_.end()) return;
        root_hash = it->second.root_hash;
        shares_.erase(it);

        auto root = roots_.find(root_hash);
        if (root != roots_.end()) {
            root->second.share_ids.erase(share_id);
            if (root->second.share_ids.empty()) {
                roots_.erase(root);
                last_for_root = true;
            }
        }
        seeder = seeder_;
    }
    if (last_for_root && seeder) {
        seeder->remove_seed(root_hash);
    }
    LOG_INFO("Stopped seeding share ", share_id);
}

void SwarmStrategy::shutdown() {
    std::shared_ptr<Seeder> seeder;
    std::unique_ptr<PortMapper> mapper;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        seeder.swap(seeder_);
        mapper.swap(port_mapper_);
        roots_.clear();
        shares_.clear();
    }
    if (seeder) seeder->stop();
    // PortMapper removes its mapping on destruction.
}
