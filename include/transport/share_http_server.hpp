#ifndef INSTSHARE_SHARE_HTTP_SERVER_HPP
#define INSTSHARE_SHARE_HTTP_SERVER_HPP

#include <asio.hpp>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

struct ShareHttpStats {
    uint32_t download_count = 0;
    uint64_t uploaded_bytes = 0;
};

// A parsed HTTP/1.1 request head.
struct HttpRequest {
    std::string method;
    std::string target;
    std::map<std::string, std::string> headers; // lower-cased names

    std::optional<std::string> header(const std::string& name) const;
    static std::optional<HttpRequest> parse(const std::string& head);
};

// Inclusive byte range, already clamped to the resource size.
struct ByteRange {
    uint64_t first = 0;
    uint64_t last = 0;
};

/**
 * @brief Parses a "bytes=a-b", "bytes=a-" or "bytes=-n" Range header.
 * @return std::nullopt for an unsatisfiable or malformed range.
 */
std::optional<ByteRange> parse_range(const std::string& value, uint64_t size);

/**
 * @brief Loopback HTTP server exposing one package behind an access token.
 *
 * Everything lives under /<token>: "/", "/download" and "/instance.ishare"
 * serve the package, "/manifest" its manifest JSON. With a password set,
 * requests must carry X-Share-Password. Statistics callbacks run on the
 * io_context thread.
 */
class ShareHttpServer : public std::enable_shared_from_this<ShareHttpServer> {
public:
    struct Options {
        fs::path package_path;
        std::string token;
        std::optional<std::string> password_hash;
        std::optional<std::string> password_salt;
        std::string manifest_json;
        std::string download_name = "instance.ishare";
        uint32_t max_connections = 10;
        std::chrono::seconds request_timeout{300};
    };

    using StatsCallback = std::function<void(const ShareHttpStats&)>;

    static constexpr uint64_t STATS_INTERVAL_BYTES = 256 * 1024;
    static constexpr std::chrono::milliseconds REJECT_DELAY{100};

    // Binds 127.0.0.1 on an ephemeral port. Throws asio::system_error.
    static std::shared_ptr<ShareHttpServer> create(asio::io_context& io_context, Options options,
                                                   StatsCallback on_stats);

    void start();
    void stop();

    uint16_t port() const { return port_; }

private:
    class Session;
    friend class Session;

    ShareHttpServer(asio::io_context& io_context, Options options, StatsCallback on_stats);

    void start_accept();
    void session_closed();
    void record_upload(uint64_t bytes);
    void response_finished(bool completed_download);

    asio::io_context& io_context_;
    asio::ip::tcp::acceptor acceptor_;
    Options options_;
    StatsCallback on_stats_;
    uint16_t port_ = 0;
    uint32_t active_sessions_ = 0;
    std::vector<std::weak_ptr<Session>> sessions_;
    bool stopped_ = false;

    ShareHttpStats stats_;
    uint64_t unreported_bytes_ = 0;
};

#endif // INSTSHARE_SHARE_HTTP_SERVER_HPP
