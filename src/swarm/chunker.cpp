#include "swarm/chunker.hpp"
#include <fstream>
#include <stdexcept>
#include <vector>

hash_t PieceManifest::compute_root() const {
    std::string all_piece_hashes_concatenated;
    all_piece_hashes_concatenated.reserve(piece_hashes.size() * HASH_SIZE);
    for (const auto& h : piece_hashes) {
        all_piece_hashes_concatenated.append(reinterpret_cast<const char*>(h.data()), HASH_SIZE);
    }
    return Hasher::sha256(all_piece_hashes_concatenated);
}

bool PieceManifest::consistent() const {
    if (piece_size == 0 || piece_size > MAX_PIECE_SIZE || piece_hashes.size() != pieces_count) return false;
    uint64_t expected_pieces = (file_size + piece_size - 1) / piece_size;
    if (expected_pieces != pieces_count) return false;
    return compute_root() == root_hash;
}

PieceManifest Chunker::create_manifest_from_file(const fs::path& file_path, uint32_t piece_size) {
    if (piece_size == 0) {
        throw std::invalid_argument("Piece size must be positive");
    }
    if (!fs::exists(file_path) || !fs::is_regular_file(file_path)) {
        throw std::runtime_error("File does not exist or is not a regular file: " + file_path.string());
    }

    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + file_path.string());
    }

    PieceManifest manifest;
    manifest.file_name = file_path.filename().string();
    manifest.file_size = fs::file_size(file_path);
    manifest.piece_size = piece_size;
    manifest.pieces_count = static_cast<uint32_t>((manifest.file_size + piece_size - 1) / piece_size);

    std::vector<uint8_t> piece_buffer(piece_size);
    for (uint32_t i = 0; i < manifest.pieces_count; ++i) {
        uint64_t length = manifest.piece_length(i);
        piece_buffer.resize(length);
        file.read(reinterpret_cast<char*>(piece_buffer.data()), static_cast<std::streamsize>(length));
        if (static_cast<uint64_t>(file.gcount()) != length) {
            throw std::runtime_error("Short read while hashing piece " + std::to_string(i) + " of " + file_path.string());
        }
        manifest.piece_hashes.push_back(Hasher::sha256(piece_buffer));
    }

    manifest.root_hash = manifest.compute_root();
    return manifest;
}
