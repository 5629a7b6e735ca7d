#include "common/serializer.hpp"
#include <cstring> // For std::memcpy
#include <stdexcept>

namespace Serializer {

void put_u8(std::vector<uint8_t>& buf, uint8_t v) {
    buf.push_back(v);
}

void put_u16(std::vector<uint8_t>& buf, uint16_t v) {
    buf.push_back(static_cast<uint8_t>(v >> 8));
    buf.push_back(static_cast<uint8_t>(v));
}

void put_u32(std::vector<uint8_t>& buf, uint32_t v) {
    for (int shift = 24; shift >= 0; shift -= 8) {
        buf.push_back(static_cast<uint8_t>(v >> shift));
    }
}

void put_u64(std::vector<uint8_t>& buf, uint64_t v) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        buf.push_back(static_cast<uint8_t>(v >> shift));
    }
}

void put_hash(std::vector<uint8_t>& buf, const hash_t& h) {
    buf.insert(buf.end(), h.begin(), h.end());
}

void put_string(std::vector<uint8_t>& buf, const std::string& s) {
    put_u32(buf, static_cast<uint32_t>(s.size()));
    buf.insert(buf.end(), s.begin(), s.end());
}

uint32_t decode_u32(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}

void encode_u32(uint8_t* p, uint32_t v) {
    p[0] = static_cast<uint8_t>(v >> 24);
    p[1] = static_cast<uint8_t>(v >> 16);
    p[2] = static_cast<uint8_t>(v >> 8);
    p[3] = static_cast<uint8_t>(v);
}

void Reader::need(size_t n) const {
    if (n > size_ - offset_) {
        throw std::runtime_error("Truncated buffer: need " + std::to_string(n) +
                                 " bytes, have " + std::to_string(size_ - offset_));
    }
}

uint8_t Reader::u8() {
    need(1);
    return data_[offset_++];
}

uint16_t Reader::u16() {
    need(2);
    uint16_t v = static_cast<uint16_t>((data_[offset_] << 8) | data_[offset_ + 1]);
    offset_ += 2;
    return v;
}

uint32_t Reader::u32() {
    need(4);
    uint32_t v = decode_u32(data_ + offset_);
    offset_ += 4;
    return v;
}

uint64_t Reader::u64() {
    uint64_t hi = u32();
    uint64_t lo = u32();
    return (hi << 32) | lo;
}

hash_t Reader::hash() {
    need(HASH_SIZE);
    hash_t h;
    std::memcpy(h.data(), data_ + offset_, HASH_SIZE);
    offset_ += HASH_SIZE;
    return h;
}

std::string Reader::string(uint32_t max_len) {
    uint32_t len = u32();
    if (len > max_len) {
        throw std::runtime_error("String length " + std::to_string(len) + " exceeds limit");
    }
    need(len);
    std::string s(reinterpret_cast<const char*>(data_ + offset_), len);
    offset_ += len;
    return s;
}

std::vector<uint8_t> Reader::rest() {
    std::vector<uint8_t> out(data_ + offset_, data_ + size_);
    offset_ = size_;
    return out;
}

std::vector<uint8_t> serialize_manifest(const PieceManifest& m) {
    std::vector<uint8_t> buffer;
    buffer.reserve(
        sizeof(uint32_t) + m.file_name.length() +
        sizeof(uint64_t) + sizeof(uint32_t) * 2 +
        HASH_SIZE + m.piece_hashes.size() * HASH_SIZE
    );

    put_string(buffer, m.file_name);
    put_u64(buffer, m.file_size);
    put_u32(buffer, m.piece_size);
    put_u32(buffer, m.pieces_count);
    put_hash(buffer, m.root_hash);
    for (const auto& h : m.piece_hashes) {
        put_hash(buffer, h);
    }
    return buffer;
}

PieceManifest deserialize_manifest(const std::vector<uint8_t>& buffer) {
    Reader r(buffer);
    PieceManifest m;
    m.file_name = r.string(4096);
    m.file_size = r.u64();
    m.piece_size = r.u32();
    m.pieces_count = r.u32();
    m.root_hash = r.hash();
    if (static_cast<uint64_t>(m.pieces_count) * HASH_SIZE > r.remaining()) {
        throw std::runtime_error("Manifest piece count exceeds payload");
    }
    m.piece_hashes.reserve(m.pieces_count);
    for (uint32_t i = 0; i < m.pieces_count; ++i) {
        m.piece_hashes.push_back(r.hash());
    }
    return m;
}

std::vector<uint8_t> serialize_handshake_payload(const HandshakePayload& p) {
    std::vector<uint8_t> buffer;
    put_u16(buffer, p.protocol_version);
    buffer.insert(buffer.end(), p.peer_id.begin(), p.peer_id.end());
    return buffer;
}

HandshakePayload deserialize_handshake_payload(const std::vector<uint8_t>& buffer) {
    Reader r(buffer);
    HandshakePayload p;
    p.protocol_version = r.u16();
    for (auto& b : p.peer_id) b = r.u8();
    return p;
}

std::vector<uint8_t> serialize_query_search_payload(const QuerySearchPayload& p) {
    std::vector<uint8_t> buffer;
    put_hash(buffer, p.root_hash);
    return buffer;
}

QuerySearchPayload deserialize_query_search_payload(const std::vector<uint8_t>& buffer) {
    Reader r(buffer);
    QuerySearchPayload p;
    p.root_hash = r.hash();
    return p;
}

std::vector<uint8_t> serialize_request_piece_payload(const RequestPiecePayload& p) {
    std::vector<uint8_t> buffer;
    put_hash(buffer, p.root_hash);
    put_u32(buffer, p.piece_index);
    return buffer;
}

RequestPiecePayload deserialize_request_piece_payload(const std::vector<uint8_t>& buffer) {
    Reader r(buffer);
    RequestPiecePayload p;
    p.root_hash = r.hash();
    p.piece_index = r.u32();
    return p;
}

std::vector<uint8_t> serialize_piece_payload(const hash_t& root_hash, uint32_t piece_index, const std::vector<uint8_t>& data) {
    std::vector<uint8_t> buffer;
    buffer.reserve(HASH_SIZE + sizeof(uint32_t) + data.size());
    put_hash(buffer, root_hash);
    put_u32(buffer, piece_index);
    buffer.insert(buffer.end(), data.begin(), data.end());
    return buffer;
}

PiecePayload deserialize_piece_payload(const std::vector<uint8_t>& buffer) {
    Reader r(buffer);
    PiecePayload p;
    p.root_hash = r.hash();
    p.piece_index = r.u32();
    p.data = r.rest();
    return p;
}

std::vector<uint8_t> serialize_search_response(const PieceManifest* manifest) {
    std::vector<uint8_t> buffer;
    if (!manifest) {
        put_u8(buffer, 0);
        return buffer;
    }
    put_u8(buffer, 1);
    std::vector<uint8_t> body = serialize_manifest(*manifest);
    buffer.insert(buffer.end(), body.begin(), body.end());
    return buffer;
}

} // namespace Serializer
