#ifndef INSTSHARE_PROTOCOL_HPP
#define INSTSHARE_PROTOCOL_HPP

#include <cstdint>
#include <array>
#include <vector>
#include "../crypto/hasher.hpp"

constexpr size_t PEER_ID_SIZE = 20;
using peer_id_t = std::array<uint8_t, PEER_ID_SIZE>;

// Protocol version
constexpr uint16_t PROTOCOL_VERSION = 1;

// Message framing: [len (uint32, big-endian)][msg_type (uint8)][payload...]
constexpr size_t HEADER_SIZE = sizeof(uint32_t) + sizeof(uint8_t);

// Largest payload accepted from a peer: one 16 MiB piece plus its header.
constexpr uint32_t MAX_PAYLOAD_SIZE = 16 * 1024 * 1024 + 64;

enum class MessageType : uint8_t {
    HANDSHAKE = 0,
    KEEPALIVE = 1,
    QUERY_SEARCH = 2,
    SEARCH_RESPONSE = 3,
    REQUEST_PIECE = 4,
    PIECE = 5,

    ERROR_UNSPECIFIED = 255
};

struct Message {
    MessageType type = MessageType::KEEPALIVE;
    std::vector<uint8_t> payload;
};

struct HandshakePayload {
    uint16_t protocol_version = PROTOCOL_VERSION;
    peer_id_t peer_id{};
};

struct QuerySearchPayload {
    hash_t root_hash{};
};

struct RequestPiecePayload {
    hash_t root_hash{};
    uint32_t piece_index = 0;
};

struct PiecePayload {
    hash_t root_hash{};
    uint32_t piece_index = 0;
    std::vector<uint8_t> data;
};

#endif //INSTSHARE_PROTOCOL_HPP
