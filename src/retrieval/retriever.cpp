#include "retrieval/retriever.hpp"
#include <algorithm>
#include <cctype>

std::optional<HttpUrl> HttpUrl::parse(const std::string& url) {
    HttpUrl result;
    std::string rest;
    std::string lower = url.substr(0, 8);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower.compare(0, 7, "http://") == 0) {
        result.port = 80;
        rest = url.substr(7);
    } else if (lower.compare(0, 8, "https://") == 0) {
        result.tls = true;
        result.port = 443;
        rest = url.substr(8);
    } else {
        return std::nullopt;
    }

    size_t slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    if (slash != std::string::npos) result.target = rest.substr(slash);
    if (authority.empty() || authority.find('@') != std::string::npos) return std::nullopt;

    std::string port_text;
    if (authority[0] == '[') {
        size_t close = authority.find(']');
        if (close == std::string::npos) return std::nullopt;
        result.host = authority.substr(1, close - 1);
        std::string tail = authority.substr(close + 1);
        if (!tail.empty()) {
            if (tail[0] != ':') return std::nullopt;
            port_text = tail.substr(1);
        }
    } else {
        size_t colon = authority.rfind(':');
        result.host = authority.substr(0, colon);
        if (colon != std::string::npos) port_text = authority.substr(colon + 1);
    }
    if (result.host.empty()) return std::nullopt;

    if (!port_text.empty()) {
        if (port_text.size() > 5 ||
            !std::all_of(port_text.begin(), port_text.end(), [](unsigned char c) { return std::isdigit(c); })) {
            return std::nullopt;
        }
        unsigned long port = std::stoul(port_text);
        if (port == 0 || port > 65535) return std::nullopt;
        result.port = static_cast<uint16_t>(port);
    }

    size_t fragment = result.target.find('#');
    if (fragment != std::string::npos) result.target.resize(fragment);
    if (result.target.empty()) result.target = "/";
    return result;
}
