#include "swarm/magnet.hpp"
#include <cctype>
#include <iomanip>
#include <sstream>

namespace {

const std::string MAGNET_PREFIX = "magnet:?";
const std::string XT_PREFIX = "urn:sha256:";

std::string url_encode(const std::string& value) {
    std::ostringstream out;
    out << std::hex << std::uppercase;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out << c;
        } else {
            out << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return out.str();
}

std::optional<std::string> url_decode(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (c == '+') {
            out += ' ';
        } else if (c == '%') {
            if (i + 2 >= value.size() ||
                !std::isxdigit(static_cast<unsigned char>(value[i + 1])) ||
                !std::isxdigit(static_cast<unsigned char>(value[i + 2]))) {
                return std::nullopt;
            }
            out += static_cast<char>(std::stoi(value.substr(i + 1, 2), nullptr, 16));
            i += 2;
        } else {
            out += c;
        }
    }
    return out;
}

} // namespace

std::string PeerAddress::to_string() const {
    if (host.find(':') != std::string::npos) {
        return "[" + host + "]:" + std::to_string(port);
    }
    return host + ":" + std::to_string(port);
}

std::optional<PeerAddress> PeerAddress::parse(const std::string& text) {
    size_t colon = text.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 >= text.size()) {
        return std::nullopt;
    }
    std::string host = text.substr(0, colon);
    std::string port_str = text.substr(colon + 1);
    if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
        host = host.substr(1, host.size() - 2);
    }
    for (char c : port_str) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
    }
    if (port_str.size() > 5) return std::nullopt;
    unsigned long port = std::stoul(port_str);
    if (port == 0 || port > 65535) return std::nullopt;
    return PeerAddress{host, static_cast<uint16_t>(port)};
}

std::string MagnetLink::to_uri() const {
    std::string uri = MAGNET_PREFIX + "xt=" + XT_PREFIX + Hasher::hash_to_hex(root_hash);
    if (!display_name.empty()) {
        uri += "&dn=" + url_encode(display_name);
    }
    uri += "&xl=" + std::to_string(size);
    for (const auto& peer : peers) {
        uri += "&x.pe=" + url_encode(peer.to_string());
    }
    return uri;
}

bool MagnetLink::looks_like_magnet(const std::string& text) {
    return text.compare(0, MAGNET_PREFIX.size(), MAGNET_PREFIX) == 0;
}

std::optional<MagnetLink> MagnetLink::parse(const std::string& uri) {
    if (!looks_like_magnet(uri)) return std::nullopt;

    MagnetLink link;
    bool have_hash = false;
    std::istringstream query(uri.substr(MAGNET_PREFIX.size()));
    std::string param;
    while (std::getline(query, param, '&')) {
        size_t eq = param.find('=');
        if (eq == std::string::npos) continue;
        std::string key = param.substr(0, eq);
        auto value = url_decode(param.substr(eq + 1));
        if (!value) return std::nullopt;

        if (key == "xt") {
            if (value->compare(0, XT_PREFIX.size(), XT_PREFIX) != 0) return std::nullopt;
            std::string hex = value->substr(XT_PREFIX.size());
            if (!Hasher::is_hex_hash(hex)) return std::nullopt;
            link.root_hash = Hasher::hex_to_hash(hex);
            have_hash = true;
        } else if (key == "dn") {
            link.display_name = *value;
        } else if (key == "xl") {
            if (value->empty() || value->size() > 19) return std::nullopt;
            for (char c : *value) {
                if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
            }
            link.size = std::stoull(*value);
        } else if (key == "x.pe") {
            auto peer = PeerAddress::parse(*value);
            if (peer) link.peers.push_back(*peer);
        }
    }

    if (!have_hash) return std::nullopt;
    return link;
}
