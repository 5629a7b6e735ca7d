#ifndef INSTSHARE_SWARM_FETCHER_HPP
#define INSTSHARE_SWARM_FETCHER_HPP

#include "connection.hpp"
#include "magnet.hpp"
#include "piece_manifest.hpp"
#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace fs = std::filesystem;

struct SwarmProgress {
    double fraction = 0.0;
    uint32_t peers = 0;
    uint64_t bytes_downloaded = 0;
    std::optional<uint64_t> eta_seconds;
};

/**
 * @brief Downloads one magnet-addressed artifact from its swarm peers.
 *
 * run() blocks the calling thread on a private io_context until the artifact
 * is complete, every peer is gone, the transfer stalls or `cancelled` is set.
 */
class SwarmFetcher {
public:
    using ProgressHandler = std::function<void(const SwarmProgress&)>;

    static constexpr size_t REQUEST_WINDOW_SIZE = 5; // Max concurrent requests per peer
    static constexpr int MAX_STRIKES = 3;

    SwarmFetcher(MagnetLink link, fs::path destination,
                 std::chrono::seconds stall_timeout = std::chrono::seconds(60));

    /**
     * @brief Fetches the artifact into the destination file.
     * @throws SharingError (TRANSFER) on failure or cancellation. The caller owns the partial file.
     */
    void run(const std::atomic<bool>& cancelled, const ProgressHandler& on_progress);

    const std::optional<PieceManifest>& manifest() const { return manifest_; }

private:
    enum class PieceState {
        Needed,
        Requested,
        Have
    };

    enum class FetchState {
        CONNECTING,
        REQUESTING_MANIFEST,
        DOWNLOADING,
        COMPLETED,
        FAILED,
        CANCELLED
    };

    void connect(const PeerAddress& peer);
    void handle_message(const Message& msg, const std::shared_ptr<Connection>& peer);
    void handle_handshake(const std::shared_ptr<Connection>& peer);
    void handle_search_response(const Message& msg, const std::shared_ptr<Connection>& peer);
    void handle_piece_response(const Message& msg, const std::shared_ptr<Connection>& peer);
    void handle_peer_closed(const std::shared_ptr<Connection>& peer);

    void schedule_work();
    void request_piece_from_peer(uint32_t piece_index, const std::shared_ptr<Connection>& peer);
    bool verify_and_write_piece(uint32_t piece_index, const std::vector<uint8_t>& data);
    void strike_peer(const std::shared_ptr<Connection>& peer, const std::string& reason);
    void ban_peer(const std::shared_ptr<Connection>& peer);
    void finish(FetchState state, const std::string& error = {});
    void check_peers_left();
    void report_progress();
    void arm_watchdog(const std::atomic<bool>& cancelled);

    MagnetLink link_;
    fs::path destination_;
    std::chrono::seconds stall_timeout_;

    asio::io_context io_context_;
    asio::steady_timer watchdog_;
    FetchState state_ = FetchState::CONNECTING;
    std::string error_;
    std::optional<PieceManifest> manifest_;
    std::fstream file_;
    ProgressHandler on_progress_;

    size_t pending_connects_ = 0;
    std::set<std::shared_ptr<Connection>> peers_;          // connected and handshaken
    std::set<std::shared_ptr<Connection>> ready_peers_;    // delivered a valid manifest
    std::map<std::shared_ptr<Connection>, std::set<uint32_t>> in_flight_requests_;
    std::map<std::shared_ptr<Connection>, int> peer_strikes_;

    std::vector<PieceState> piece_states_;
    uint32_t pieces_have_ = 0;
    uint64_t bytes_downloaded_ = 0;
    std::chrono::steady_clock::time_point started_at_;
    std::chrono::steady_clock::time_point last_activity_;
};

#endif //INSTSHARE_SWARM_FETCHER_HPP
