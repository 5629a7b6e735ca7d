#include "swarm/swarm_fetcher.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "common/serializer.hpp"
#include "crypto/hasher.hpp"
#include <algorithm>
#include <cstring>

SwarmFetcher::SwarmFetcher(MagnetLink link, fs::path destination, std::chrono::seconds stall_timeout)
    : link_(std::move(link)),
      destination_(std::move(destination)),
      stall_timeout_(stall_timeout),
      watchdog_(io_context_) {}

void SwarmFetcher::run(const std::atomic<bool>& cancelled, const ProgressHandler& on_progress) {
    if (link_.peers.empty()) {
        throw SharingError(ErrorKind::TRANSFER, "Magnet link names no peers to fetch from");
    }

    on_progress_ = on_progress;
    started_at_ = std::chrono::steady_clock::now();
    last_activity_ = started_at_;

    LOG_INFO("Fetching ", Hasher::hash_to_hex(link_.root_hash), " from ", link_.peers.size(), " peer(s)");
    for (const auto& peer : link_.peers) {
        connect(peer);
    }
    arm_watchdog(cancelled);

    io_context_.run();

    if (file_.is_open()) file_.close();

    switch (state_) {
        case FetchState::COMPLETED:
            LOG_INFO("Swarm download complete: ", destination_);
            return;
        case FetchState::CANCELLED:
            throw SharingError(ErrorKind::TRANSFER, "Download cancelled");
        default:
            throw SharingError(ErrorKind::TRANSFER,
                               error_.empty() ? std::string("Swarm download failed") : error_);
    }
}

void SwarmFetcher::arm_watchdog(const std::atomic<bool>& cancelled) {
    watchdog_.expires_after(std::chrono::milliseconds(100));
    watchdog_.async_wait([this, &cancelled](const asio::error_code& error) {
        if (error) return;
        if (state_ == FetchState::COMPLETED || state_ == FetchState::FAILED ||
            state_ == FetchState::CANCELLED) {
            return;
        }
        if (cancelled.load()) {
            LOG_INFO("Swarm download cancelled");
            finish(FetchState::CANCELLED);
            return;
        }
        if (std::chrono::steady_clock::now() - last_activity_ > stall_timeout_) {
            finish(FetchState::FAILED, "Swarm download stalled: no data for " +
                                       std::to_string(stall_timeout_.count()) + "s");
            return;
        }
        arm_watchdog(cancelled);
    });
}

void SwarmFetcher::connect(const PeerAddress& peer) {
    auto conn = std::make_shared<Connection>(io_context_);
    conn->set_message_handler([this, conn_weak = std::weak_ptr<Connection>(conn)](Message msg) {
        if (auto c = conn_weak.lock()) {
            handle_message(msg, c);
        }
    });
    conn->set_close_handler([this, conn_weak = std::weak_ptr<Connection>(conn)]() {
        if (auto c = conn_weak.lock()) {
            handle_peer_closed(c);
        }
    });

    ++pending_connects_;
    auto resolver = std::make_shared<asio::ip::tcp::resolver>(io_context_);
    resolver->async_resolve(peer.host, std::to_string(peer.port),
        [this, conn, resolver, peer](const asio::error_code& error, asio::ip::tcp::resolver::results_type results) {
            if (error) {
                LOG_WARN("Cannot resolve swarm peer ", peer.to_string(), ": ", error.message());
                --pending_connects_;
                check_peers_left();
                return;
            }
            asio::async_connect(conn->socket(), results,
                [this, conn, peer](const asio::error_code& ec, const asio::ip::tcp::endpoint&) {
                    --pending_connects_;
                    if (ec) {
                        LOG_WARN("Error connecting to swarm peer ", peer.to_string(), ": ", ec.message());
                        check_peers_left();
                        return;
                    }
                    if (state_ == FetchState::COMPLETED || state_ == FetchState::FAILED ||
                        state_ == FetchState::CANCELLED) {
                        conn->close();
                        return;
                    }
                    LOG_DEBUG("Connected to swarm peer ", peer.to_string());
                    peers_.insert(conn);
                    conn->start();

                    HandshakePayload hs;
                    auto id = Hasher::random_bytes(PEER_ID_SIZE);
                    std::memcpy(hs.peer_id.data(), id.data(), PEER_ID_SIZE);
                    Message msg;
                    msg.type = MessageType::HANDSHAKE;
                    msg.payload = Serializer::serialize_handshake_payload(hs);
                    conn->send_message(msg);
                });
        });
}

void SwarmFetcher::handle_message(const Message& msg, const std::shared_ptr<Connection>& peer) {
    if (peers_.find(peer) == peers_.end()) return;
    last_activity_ = std::chrono::steady_clock::now();

    try {
        switch (msg.type) {
            case MessageType::HANDSHAKE:
                handle_handshake(peer);
                break;
            case MessageType::SEARCH_RESPONSE:
                handle_search_response(msg, peer);
                break;
            case MessageType::PIECE:
                handle_piece_response(msg, peer);
                break;
            case MessageType::ERROR_UNSPECIFIED:
                strike_peer(peer, "peer reported an error");
                break;
            default:
                break;
        }
    } catch (const std::runtime_error& e) {
        LOG_WARN("Malformed message from swarm peer: ", e.what());
        ban_peer(peer);
    }
}

void SwarmFetcher::handle_handshake(const std::shared_ptr<Connection>& peer) {
    QuerySearchPayload payload;
    payload.root_hash = link_.root_hash;

    Message msg;
    msg.type = MessageType::QUERY_SEARCH;
    msg.payload = Serializer::serialize_query_search_payload(payload);
    peer->send_message(msg);

    if (state_ == FetchState::CONNECTING) {
        state_ = FetchState::REQUESTING_MANIFEST;
    }
}

void SwarmFetcher::handle_search_response(const Message& msg, const std::shared_ptr<Connection>& peer) {
    Serializer::Reader reader(msg.payload);
    bool found = reader.u8() != 0;
    if (!found) {
        LOG_WARN("Artifact not found on swarm peer");
        ban_peer(peer);
        return;
    }

    PieceManifest received = Serializer::deserialize_manifest(reader.rest());
    if (received.root_hash != link_.root_hash || !received.consistent() ||
        (link_.size != 0 && received.file_size != link_.size)) {
        LOG_ERR("Swarm peer sent a manifest that does not match the magnet link");
        ban_peer(peer);
        return;
    }

    if (!manifest_) {
        manifest_ = received;
        LOG_INFO("Received piece manifest for ", manifest_->file_name, " (", manifest_->pieces_count, " pieces)");

        std::ofstream(destination_, std::ios::binary | std::ios::trunc).close();
        std::error_code ec;
        fs::resize_file(destination_, manifest_->file_size, ec);
        if (ec) {
            finish(FetchState::FAILED, "Cannot allocate download file: " + ec.message());
            return;
        }
        file_.open(destination_, std::ios::binary | std::ios::in | std::ios::out);
        if (!file_.is_open()) {
            finish(FetchState::FAILED, "Cannot open download file " + destination_.string());
            return;
        }
        piece_states_.assign(manifest_->pieces_count, PieceState::Needed);
        state_ = FetchState::DOWNLOADING;
    }

    ready_peers_.insert(peer);
    report_progress();
    schedule_work();
}

void SwarmFetcher::schedule_work() {
    if (state_ != FetchState::DOWNLOADING) return;

    if (pieces_have_ == manifest_->pieces_count) {
        file_.flush();
        finish(file_.good() ? FetchState::COMPLETED : FetchState::FAILED, "Failed writing download file");
        return;
    }

    std::vector<uint32_t> needed;
    for (uint32_t i = 0; i < manifest_->pieces_count; ++i) {
        if (piece_states_[i] == PieceState::Needed) {
            needed.push_back(i);
        }
    }

    // End game: few pieces left and several peers, allow duplicate requests.
    bool end_game = !needed.empty() && needed.size() < 5 && ready_peers_.size() > 1;
    if (end_game) {
        for (uint32_t i = 0; i < manifest_->pieces_count; ++i) {
            if (piece_states_[i] == PieceState::Requested) needed.push_back(i);
        }
    }

    for (const auto& peer : ready_peers_) {
        auto& in_flight = in_flight_requests_[peer];
        for (uint32_t piece_index : needed) {
            if (in_flight.size() >= REQUEST_WINDOW_SIZE) break;
            if (in_flight.count(piece_index)) continue;
            if (piece_states_[piece_index] == PieceState::Have) continue;
            if (piece_states_[piece_index] == PieceState::Requested && !end_game) continue;
            request_piece_from_peer(piece_index, peer);
        }
    }
}

void SwarmFetcher::request_piece_from_peer(uint32_t piece_index, const std::shared_ptr<Connection>& peer) {
    piece_states_[piece_index] = PieceState::Requested;
    in_flight_requests_[peer].insert(piece_index);

    RequestPiecePayload payload;
    payload.root_hash = link_.root_hash;
    payload.piece_index = piece_index;

    Message msg;
    msg.type = MessageType::REQUEST_PIECE;
    msg.payload = Serializer::serialize_request_piece_payload(payload);
    peer->send_message(msg);
}

void SwarmFetcher::handle_piece_response(const Message& msg, const std::shared_ptr<Connection>& peer) {
    if (state_ != FetchState::DOWNLOADING) return;

    PiecePayload payload = Serializer::deserialize_piece_payload(msg.payload);
    if (payload.root_hash != link_.root_hash || payload.piece_index >= manifest_->pieces_count) {
        strike_peer(peer, "piece for an unknown artifact or index");
        return;
    }

    auto& in_flight = in_flight_requests_[peer];
    if (in_flight.erase(payload.piece_index) == 0) {
        strike_peer(peer, "unrequested piece");
        return;
    }

    if (piece_states_[payload.piece_index] == PieceState::Have) {
        schedule_work();
        return;
    }

    if (verify_and_write_piece(payload.piece_index, payload.data)) {
        piece_states_[payload.piece_index] = PieceState::Have;
        ++pieces_have_;
        bytes_downloaded_ += payload.data.size();
        LOG_DEBUG("Piece ", payload.piece_index, " downloaded and verified.");
        report_progress();
        schedule_work();
    } else {
        piece_states_[payload.piece_index] = PieceState::Needed;
        strike_peer(peer, "piece " + std::to_string(payload.piece_index) + " failed verification");
    }
}

bool SwarmFetcher::verify_and_write_piece(uint32_t piece_index, const std::vector<uint8_t>& data) {
    if (data.size() != manifest_->piece_length(piece_index)) return false;
    if (Hasher::sha256(data) != manifest_->piece_hashes[piece_index]) return false;

    file_.seekp(static_cast<std::streamoff>(manifest_->piece_offset(piece_index)));
    file_.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!file_.good()) {
        finish(FetchState::FAILED, "Failed writing piece to " + destination_.string());
        return false;
    }
    return true;
}

void SwarmFetcher::strike_peer(const std::shared_ptr<Connection>& peer, const std::string& reason) {
    LOG_WARN("Swarm peer strike: ", reason);
    if (++peer_strikes_[peer] >= MAX_STRIKES) {
        ban_peer(peer);
    } else {
        schedule_work();
    }
}

void SwarmFetcher::ban_peer(const std::shared_ptr<Connection>& peer) {
    LOG_WARN("Dropping swarm peer after repeated failures.");
    peer->close();
}

void SwarmFetcher::handle_peer_closed(const std::shared_ptr<Connection>& peer) {
    peers_.erase(peer);
    ready_peers_.erase(peer);
    peer_strikes_.erase(peer);

    auto it = in_flight_requests_.find(peer);
    if (it != in_flight_requests_.end()) {
        for (uint32_t piece_index : it->second) {
            if (piece_states_[piece_index] == PieceState::Requested) {
                bool requested_elsewhere = false;
                for (const auto& [other, pieces] : in_flight_requests_) {
                    if (other != peer && pieces.count(piece_index)) requested_elsewhere = true;
                }
                if (!requested_elsewhere) piece_states_[piece_index] = PieceState::Needed;
            }
        }
        in_flight_requests_.erase(it);
    }

    check_peers_left();
    if (state_ == FetchState::DOWNLOADING) {
        report_progress();
        schedule_work();
    }
}

void SwarmFetcher::check_peers_left() {
    if (state_ == FetchState::COMPLETED || state_ == FetchState::FAILED ||
        state_ == FetchState::CANCELLED) {
        return;
    }
    if (peers_.empty() && pending_connects_ == 0) {
        finish(FetchState::FAILED, "No reachable swarm peers for this artifact");
    }
}

void SwarmFetcher::report_progress() {
    if (!on_progress_ || !manifest_) return;

    SwarmProgress progress;
    progress.peers = static_cast<uint32_t>(ready_peers_.size());
    progress.bytes_downloaded = bytes_downloaded_;
    progress.fraction = manifest_->file_size == 0
        ? 1.0
        : static_cast<double>(bytes_downloaded_) / static_cast<double>(manifest_->file_size);

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started_at_).count();
    if (bytes_downloaded_ > 0 && elapsed > 0) {
        double rate = static_cast<double>(bytes_downloaded_) / (static_cast<double>(elapsed) / 1000.0);
        uint64_t remaining = manifest_->file_size - bytes_downloaded_;
        progress.eta_seconds = static_cast<uint64_t>(static_cast<double>(remaining) / rate);
    }
    on_progress_(progress);
}

void SwarmFetcher::finish(FetchState state, const std::string& error) {
    state_ = state;
    if (state == FetchState::FAILED) {
        error_ = error;
        LOG_ERR("Swarm download failed: ", error);
    }
    watchdog_.cancel();
    auto peers = peers_;
    for (const auto& peer : peers) {
        peer->close();
    }
    io_context_.stop();
}
