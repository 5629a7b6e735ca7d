#include "swarm/seeder.hpp"
#include "common/logger.hpp"
#include "common/serializer.hpp"
#include "crypto/hasher.hpp"
#include <cstring>
#include <fstream>

std::shared_ptr<Seeder> Seeder::create(asio::io_context& io_context, uint16_t port) {
    return std::shared_ptr<Seeder>(new Seeder(io_context, port));
}

Seeder::Seeder(asio::io_context& io_context, uint16_t port)
    : io_context_(io_context),
      acceptor_(io_context, asio::ip::tcp::endpoint(asio::ip::tcp::v4(), port)) {
    port_ = acceptor_.local_endpoint().port();
    auto id = Hasher::random_bytes(PEER_ID_SIZE);
    std::memcpy(peer_id_.data(), id.data(), PEER_ID_SIZE);
    LOG_INFO("Swarm seeder listening on TCP port ", port_);
}

void Seeder::start() {
    asio::post(io_context_, [self = shared_from_this()]() { self->start_accept(); });
}

void Seeder::stop() {
    asio::post(io_context_, [self = shared_from_this()]() {
        asio::error_code ec;
        self->acceptor_.close(ec);
        auto connections = self->connections_;
        for (auto& conn : connections) {
            conn->close();
        }
        self->connections_.clear();
    });
}

void Seeder::add_seed(const PieceManifest& manifest, const fs::path& file_path, StatsCallback on_stats) {
    std::lock_guard<std::mutex> lock(mutex_);
    Seed seed;
    seed.manifest = manifest;
    seed.file_path = file_path;
    seed.on_stats = std::move(on_stats);
    seeds_[manifest.root_hash] = std::move(seed);
    LOG_INFO("Seeding ", manifest.file_name, " (", manifest.pieces_count, " pieces, root ",
             Hasher::hash_to_hex(manifest.root_hash), ")");
}

void Seeder::remove_seed(const hash_t& root_hash) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (seeds_.erase(root_hash) > 0) {
        LOG_INFO("Stopped seeding ", Hasher::hash_to_hex(root_hash));
    }
}

bool Seeder::has_seed(const hash_t& root_hash) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return seeds_.count(root_hash) > 0;
}

std::optional<PieceManifest> Seeder::get_manifest(const hash_t& root_hash) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = seeds_.find(root_hash);
    if (it == seeds_.end()) return std::nullopt;
    return it->second.manifest;
}

std::vector<uint8_t> Seeder::get_piece(const hash_t& root_hash, uint32_t piece_index) const {
    PieceManifest manifest;
    fs::path file_path;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = seeds_.find(root_hash);
        if (it == seeds_.end()) {
            throw std::runtime_error("Artifact is not seeded.");
        }
        manifest = it->second.manifest;
        file_path = it->second.file_path;
    }

    if (piece_index >= manifest.pieces_count) {
        throw std::runtime_error("Piece index out of bounds.");
    }

    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open shared file for reading: " + file_path.string());
    }

    uint64_t offset = manifest.piece_offset(piece_index);
    uint64_t bytes_to_read = manifest.piece_length(piece_index);
    file.seekg(static_cast<std::streamoff>(offset));

    std::vector<uint8_t> piece_data(bytes_to_read);
    file.read(reinterpret_cast<char*>(piece_data.data()), static_cast<std::streamsize>(bytes_to_read));
    if (static_cast<uint64_t>(file.gcount()) != bytes_to_read) {
        throw std::runtime_error("Failed to read the full piece from file.");
    }
    return piece_data;
}

void Seeder::start_accept() {
    auto new_connection = std::make_shared<Connection>(io_context_);
    std::weak_ptr<Seeder> weak_self = shared_from_this();

    new_connection->set_message_handler([weak_self, conn_weak = std::weak_ptr<Connection>(new_connection)](Message msg) {
        auto self = weak_self.lock();
        auto conn = conn_weak.lock();
        if (self && conn) {
            self->handle_message(msg, conn);
        }
    });
    new_connection->set_close_handler([weak_self, conn_weak = std::weak_ptr<Connection>(new_connection)]() {
        auto self = weak_self.lock();
        auto conn = conn_weak.lock();
        if (self && conn) {
            self->handle_disconnect(conn);
        }
    });

    acceptor_.async_accept(new_connection->socket(),
        [self = shared_from_this(), new_connection](const asio::error_code& error) {
            if (error == asio::error::operation_aborted) {
                return;
            }
            if (!error) {
                asio::error_code ec;
                LOG_DEBUG("Swarm peer connected from ", new_connection->socket().remote_endpoint(ec));
                self->connections_.insert(new_connection);
                new_connection->start();
            } else {
                LOG_ERR("Error accepting swarm connection: ", error.message());
            }
            if (self->acceptor_.is_open()) {
                self->start_accept();
            }
        });
}

void Seeder::handle_message(const Message& msg, const std::shared_ptr<Connection>& connection) {
    try {
        switch (msg.type) {
            case MessageType::HANDSHAKE:
                handle_handshake(msg, connection);
                break;
            case MessageType::QUERY_SEARCH:
                handle_query_search(msg, connection);
                break;
            case MessageType::REQUEST_PIECE:
                handle_request_piece(msg, connection);
                break;
            case MessageType::KEEPALIVE:
                break;
            default:
                LOG_DEBUG("Seeder received unhandled message type: ", static_cast<int>(msg.type));
                break;
        }
    } catch (const std::runtime_error& e) {
        LOG_WARN("Malformed swarm message: ", e.what());
        connection->close();
    }
}

void Seeder::handle_handshake(const Message& msg, const std::shared_ptr<Connection>& connection) {
    HandshakePayload received = Serializer::deserialize_handshake_payload(msg.payload);
    if (received.protocol_version != PROTOCOL_VERSION) {
        LOG_WARN("Peer speaks protocol version ", received.protocol_version, ", closing.");
        connection->close();
        return;
    }

    HandshakePayload own_hs;
    own_hs.peer_id = peer_id_;

    Message response;
    response.type = MessageType::HANDSHAKE;
    response.payload = Serializer::serialize_handshake_payload(own_hs);
    connection->send_message(response);
}

void Seeder::handle_query_search(const Message& msg, const std::shared_ptr<Connection>& connection) {
    QuerySearchPayload payload = Serializer::deserialize_query_search_payload(msg.payload);

    std::optional<PieceManifest> manifest;
    StatsCallback on_stats;
    SeedStats stats;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = seeds_.find(payload.root_hash);
        if (it != seeds_.end()) {
            manifest = it->second.manifest;
            if (it->second.peers.insert(connection).second) {
                it->second.stats.peer_count = static_cast<uint32_t>(it->second.peers.size());
                on_stats = it->second.on_stats;
                stats = it->second.stats;
            }
        }
    }

    Message response;
    response.type = MessageType::SEARCH_RESPONSE;
    response.payload = Serializer::serialize_search_response(manifest ? &*manifest : nullptr);
    connection->send_message(response);

    if (on_stats) on_stats(stats);
}

void Seeder::handle_request_piece(const Message& msg, const std::shared_ptr<Connection>& connection) {
    RequestPiecePayload payload = Serializer::deserialize_request_piece_payload(msg.payload);

    std::vector<uint8_t> piece_data;
    try {
        piece_data = get_piece(payload.root_hash, payload.piece_index);
    } catch (const std::runtime_error& e) {
        LOG_WARN("Cannot serve piece ", payload.piece_index, ": ", e.what());
        send_error(connection);
        return;
    }

    Message response;
    response.type = MessageType::PIECE;
    response.payload = Serializer::serialize_piece_payload(payload.root_hash, payload.piece_index, piece_data);
    connection->send_message(response);

    StatsCallback on_stats;
    SeedStats stats;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = seeds_.find(payload.root_hash);
        if (it == seeds_.end()) return;
        Seed& seed = it->second;
        seed.stats.uploaded_bytes += piece_data.size();
        seed.unreported_bytes += piece_data.size();

        auto& served = seed.served[connection];
        bool completed_now = served.insert(payload.piece_index).second &&
                             served.size() == seed.manifest.pieces_count;
        if (completed_now) {
            seed.stats.completed_downloads++;
        }
        if (completed_now || seed.unreported_bytes >= STATS_INTERVAL_BYTES) {
            seed.unreported_bytes = 0;
            on_stats = seed.on_stats;
            stats = seed.stats;
        }
    }
    if (on_stats) on_stats(stats);
}

void Seeder::handle_disconnect(const std::shared_ptr<Connection>& connection) {
    connections_.erase(connection);

    std::vector<std::pair<StatsCallback, SeedStats>> notify;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [hash, seed] : seeds_) {
            seed.served.erase(connection);
            if (seed.peers.erase(connection) > 0) {
                seed.stats.peer_count = static_cast<uint32_t>(seed.peers.size());
                if (seed.on_stats) notify.emplace_back(seed.on_stats, seed.stats);
            }
        }
    }
    for (auto& [callback, stats] : notify) {
        callback(stats);
    }
}

void Seeder::send_error(const std::shared_ptr<Connection>& connection) {
    Message error_msg;
    error_msg.type = MessageType::ERROR_UNSPECIFIED;
    connection->send_message(error_msg);
}
