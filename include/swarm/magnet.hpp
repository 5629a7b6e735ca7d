#ifndef INSTSHARE_MAGNET_HPP
#define INSTSHARE_MAGNET_HPP

#include "../crypto/hasher.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct PeerAddress {
    std::string host;
    uint16_t port = 0;

    std::string to_string() const;
    static std::optional<PeerAddress> parse(const std::string& text);
};

/**
 * @brief Content-addressed locator of a seeded artifact.
 *
 * magnet:?xt=urn:sha256:<root hex>&dn=<file name>&xl=<size>&x.pe=<host>:<port>
 * Several x.pe parameters may be present, one per known peer.
 */
struct MagnetLink {
    hash_t root_hash{};
    std::string display_name;
    uint64_t size = 0;
    std::vector<PeerAddress> peers;

    std::string to_uri() const;

    // Returns std::nullopt for anything that is not a sha256 magnet.
    static std::optional<MagnetLink> parse(const std::string& uri);

    static bool looks_like_magnet(const std::string& text);
};

#endif //INSTSHARE_MAGNET_HPP
