#ifndef INSTSHARE_PIECE_MANIFEST_HPP
#define INSTSHARE_PIECE_MANIFEST_HPP

#include "../crypto/hasher.hpp"
#include <cstdint>
#include <string>
#include <vector>

// Largest piece a peer may announce, bounded by the wire frame limit.
constexpr uint32_t MAX_PIECE_SIZE = 16 * 1024 * 1024;

// Piece layout of one seeded artifact.
struct PieceManifest {
    std::string file_name;
    uint64_t file_size = 0;
    uint32_t piece_size = 0;
    uint32_t pieces_count = 0;
    std::vector<hash_t> piece_hashes;
    hash_t root_hash{}; // SHA-256 of the concatenated piece hashes

    uint64_t piece_offset(uint32_t index) const { return static_cast<uint64_t>(index) * piece_size; }

    // Length of a piece, the last one may be short.
    uint64_t piece_length(uint32_t index) const {
        if (index + 1 < pieces_count) return piece_size;
        return file_size - piece_offset(index);
    }

    hash_t compute_root() const;

    // Piece count, sizes and root hash agree with each other.
    bool consistent() const;
};

#endif //INSTSHARE_PIECE_MANIFEST_HPP
