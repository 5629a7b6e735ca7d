#ifndef INSTSHARE_SEEDER_HPP
#define INSTSHARE_SEEDER_HPP

#include <asio.hpp>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>

#include "connection.hpp"
#include "piece_manifest.hpp"
#include "protocol.hpp"

namespace fs = std::filesystem;

struct SeedStats {
    uint32_t peer_count = 0;
    uint64_t uploaded_bytes = 0;
    uint32_t completed_downloads = 0;
};

/**
 * @brief Serves pieces of every registered artifact to swarm peers.
 *
 * The seeder owns the TCP acceptor and all inbound connections. Artifacts are
 * registered and removed from any thread; network handling runs on the
 * io_context thread. Statistics callbacks are invoked on the io_context thread.
 */
class Seeder : public std::enable_shared_from_this<Seeder> {
public:
    using StatsCallback = std::function<void(const SeedStats&)>;

    // Upload statistics are reported at least every this many bytes.
    static constexpr uint64_t STATS_INTERVAL_BYTES = 256 * 1024;

    /**
     * @brief Binds the listen socket.
     * @param port TCP port, 0 picks an ephemeral one.
     * @throws asio::system_error if the port cannot be bound.
     */
    static std::shared_ptr<Seeder> create(asio::io_context& io_context, uint16_t port);

    void start();
    void stop();

    uint16_t port() const { return port_; }

    void add_seed(const PieceManifest& manifest, const fs::path& file_path, StatsCallback on_stats);
    void remove_seed(const hash_t& root_hash);
    bool has_seed(const hash_t& root_hash) const;

    std::optional<PieceManifest> get_manifest(const hash_t& root_hash) const;

    /**
     * @brief Reads one piece of a registered artifact from disk.
     * @throws std::runtime_error if the artifact is unknown, the index is out of range or the read is short.
     */
    std::vector<uint8_t> get_piece(const hash_t& root_hash, uint32_t piece_index) const;

private:
    Seeder(asio::io_context& io_context, uint16_t port);

    struct Seed {
        PieceManifest manifest;
        fs::path file_path;
        StatsCallback on_stats;
        SeedStats stats;
        uint64_t unreported_bytes = 0;
        std::set<std::shared_ptr<Connection>> peers;
        std::map<std::shared_ptr<Connection>, std::set<uint32_t>> served;
    };

    void start_accept();
    void handle_message(const Message& msg, const std::shared_ptr<Connection>& connection);
    void handle_handshake(const Message& msg, const std::shared_ptr<Connection>& connection);
    void handle_query_search(const Message& msg, const std::shared_ptr<Connection>& connection);
    void handle_request_piece(const Message& msg, const std::shared_ptr<Connection>& connection);
    void handle_disconnect(const std::shared_ptr<Connection>& connection);
    void send_error(const std::shared_ptr<Connection>& connection);

    asio::io_context& io_context_;
    asio::ip::tcp::acceptor acceptor_;
    uint16_t port_ = 0;
    peer_id_t peer_id_{};
    std::set<std::shared_ptr<Connection>> connections_;

    mutable std::mutex mutex_;
    std::map<hash_t, Seed> seeds_;
};

#endif //INSTSHARE_SEEDER_HPP
