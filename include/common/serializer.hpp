#ifndef INSTSHARE_SERIALIZER_HPP
#define INSTSHARE_SERIALIZER_HPP

#include "../swarm/piece_manifest.hpp"
#include "../swarm/protocol.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace Serializer {

// Big-endian writers appending to a buffer.
void put_u8(std::vector<uint8_t>& buf, uint8_t v);
void put_u16(std::vector<uint8_t>& buf, uint16_t v);
void put_u32(std::vector<uint8_t>& buf, uint32_t v);
void put_u64(std::vector<uint8_t>& buf, uint64_t v);
void put_hash(std::vector<uint8_t>& buf, const hash_t& h);
// Length-prefixed (uint32) byte string.
void put_string(std::vector<uint8_t>& buf, const std::string& s);

/**
 * @brief Bounds-checked big-endian reader over a byte range.
 *
 * Every accessor throws std::runtime_error instead of reading past the end.
 */
class Reader {
public:
    Reader(const uint8_t* data, size_t size) : data_(data), size_(size) {}
    explicit Reader(const std::vector<uint8_t>& buf) : Reader(buf.data(), buf.size()) {}

    uint8_t u8();
    uint16_t u16();
    uint32_t u32();
    uint64_t u64();
    hash_t hash();
    std::string string(uint32_t max_len);
    std::vector<uint8_t> rest();

    size_t remaining() const { return size_ - offset_; }

private:
    void need(size_t n) const;

    const uint8_t* data_;
    size_t size_;
    size_t offset_ = 0;
};

uint32_t decode_u32(const uint8_t* p);
void encode_u32(uint8_t* p, uint32_t v);

/**
 * @brief Serializes a PieceManifest object into a byte vector.
 */
std::vector<uint8_t> serialize_manifest(const PieceManifest& m);

/**
 * @brief Deserializes a byte vector into a PieceManifest object.
 */
PieceManifest deserialize_manifest(const std::vector<uint8_t>& buffer);

std::vector<uint8_t> serialize_handshake_payload(const HandshakePayload& p);
HandshakePayload deserialize_handshake_payload(const std::vector<uint8_t>& buffer);

std::vector<uint8_t> serialize_query_search_payload(const QuerySearchPayload& p);
QuerySearchPayload deserialize_query_search_payload(const std::vector<uint8_t>& buffer);

std::vector<uint8_t> serialize_request_piece_payload(const RequestPiecePayload& p);
RequestPiecePayload deserialize_request_piece_payload(const std::vector<uint8_t>& buffer);

std::vector<uint8_t> serialize_piece_payload(const hash_t& root_hash, uint32_t piece_index, const std::vector<uint8_t>& data);
PiecePayload deserialize_piece_payload(const std::vector<uint8_t>& buffer);

// SEARCH_RESPONSE: [found (uint8)][manifest...]
std::vector<uint8_t> serialize_search_response(const PieceManifest* manifest);

} // namespace Serializer

#endif //INSTSHARE_SERIALIZER_HPP
