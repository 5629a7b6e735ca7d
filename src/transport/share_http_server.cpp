#include "transport/share_http_server.hpp"
#include "common/logger.hpp"
#include "crypto/hasher.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace {

constexpr size_t MAX_REQUEST_HEAD = 16 * 1024;
constexpr size_t BODY_CHUNK_SIZE = 64 * 1024;

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r");
    return s.substr(b, e - b + 1);
}

const char* reason_phrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 206: return "Partial Content";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 416: return "Range Not Satisfiable";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default: return "Unknown";
    }
}

bool parse_u64(const std::string& s, uint64_t& out) {
    if (s.empty() || s.size() > 19) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    out = std::stoull(s);
    return true;
}

} // namespace

std::optional<std::string> HttpRequest::header(const std::string& name) const {
    auto it = headers.find(to_lower(name));
    if (it == headers.end()) return std::nullopt;
    return it->second;
}

std::optional<HttpRequest> HttpRequest::parse(const std::string& head) {
    std::istringstream in(head);
    std::string line;
    if (!std::getline(in, line)) return std::nullopt;
    if (!line.empty() && line.back() == '\r') line.pop_back();

    HttpRequest req;
    std::istringstream request_line(line);
    std::string version;
    if (!(request_line >> req.method >> req.target >> version)) return std::nullopt;
    if (version.compare(0, 5, "HTTP/") != 0) return std::nullopt;

    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) break;
        size_t colon = line.find(':');
        if (colon == std::string::npos) return std::nullopt;
        req.headers[to_lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    }
    return req;
}

std::optional<ByteRange> parse_range(const std::string& value, uint64_t size) {
    const std::string prefix = "bytes=";
    if (value.compare(0, prefix.size(), prefix) != 0 || size == 0) return std::nullopt;
    std::string ranges = trim(value.substr(prefix.size()));
    if (ranges.find(',') != std::string::npos) return std::nullopt; // single ranges only

    size_t dash = ranges.find('-');
    if (dash == std::string::npos) return std::nullopt;
    std::string a = ranges.substr(0, dash);
    std::string b = ranges.substr(dash + 1);

    ByteRange range;
    if (a.empty()) {
        uint64_t suffix = 0;
        if (!parse_u64(b, suffix) || suffix == 0) return std::nullopt;
        range.first = suffix >= size ? 0 : size - suffix;
        range.last = size - 1;
        return range;
    }

    if (!parse_u64(a, range.first) || range.first >= size) return std::nullopt;
    if (b.empty()) {
        range.last = size - 1;
    } else {
        if (!parse_u64(b, range.last) || range.last < range.first) return std::nullopt;
        range.last = std::min(range.last, size - 1);
    }
    return range;
}

class ShareHttpServer::Session : public std::enable_shared_from_this<ShareHttpServer::Session> {
public:
    Session(std::shared_ptr<ShareHttpServer> server, asio::ip::tcp::socket socket, bool counted)
        : server_(std::move(server)),
          socket_(std::move(socket)),
          timer_(server_->io_context_),
          buffer_(MAX_REQUEST_HEAD),
          counted_(counted) {}

    void start() {
        timer_.expires_after(server_->options_.request_timeout);
        timer_.async_wait([self = shared_from_this()](const asio::error_code& error) {
            if (!error) {
                LOG_DEBUG("Share request timed out");
                self->close();
            }
        });
        read_head();
    }

    void reject_busy() {
        respond_simple(503, "Too many connections\n");
    }

    void close() {
        if (closed_) return;
        closed_ = true;
        asio::error_code ec;
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
        timer_.cancel();
        if (counted_) server_->session_closed();
    }

private:
    void read_head() {
        asio::async_read_until(socket_, buffer_, "\r\n\r\n",
            [self = shared_from_this()](const asio::error_code& error, size_t bytes) {
                if (error) {
                    if (error == asio::error::not_found) {
                        self->respond_simple(400, "Request head too large\n");
                    } else {
                        self->close();
                    }
                    return;
                }
                std::string head(asio::buffers_begin(self->buffer_.data()),
                                 asio::buffers_begin(self->buffer_.data()) + static_cast<std::ptrdiff_t>(bytes));
                self->buffer_.consume(bytes);
                self->handle_request(head);
            });
    }

    void handle_request(const std::string& head) {
        auto parsed = HttpRequest::parse(head);
        if (!parsed) {
            respond_simple(400, "Bad request\n");
            return;
        }
        request_ = *parsed;

        std::string target = request_.target;
        size_t query = target.find('?');
        if (query != std::string::npos) target.resize(query);
        if (target.empty() || target[0] != '/') {
            respond_simple(400, "Bad request\n");
            return;
        }

        size_t slash = target.find('/', 1);
        std::string token = target.substr(1, slash == std::string::npos ? std::string::npos : slash - 1);
        std::string route = slash == std::string::npos ? "" : target.substr(slash);

        if (!Hasher::constant_time_equals(token, server_->options_.token)) {
            asio::error_code ec;
            LOG_WARN("[SECURITY] Rejected request with an invalid access token from ",
                     socket_.remote_endpoint(ec));
            delayed_response(403, "Access denied\n", "text/plain");
            return;
        }

        bool head_only = request_.method == "HEAD";
        if (request_.method != "GET" && !head_only) {
            respond_simple(404, "Not found\n");
            return;
        }

        bool file_route = route.empty() || route == "/" || route == "/download" || route == "/instance.ishare";
        bool manifest_route = route == "/manifest";
        if (!file_route && !manifest_route) {
            respond_simple(404, "Not found\n");
            return;
        }

        const auto& opts = server_->options_;
        if (opts.password_hash) {
            auto supplied = request_.header("x-share-password");
            if (!supplied) {
                respond(401, "application/json", "{\"error\":\"PASSWORD_REQUIRED\"}\n", head_only);
                return;
            }
            std::string hashed = Hasher::hash_password(*supplied, opts.password_salt.value_or(""));
            if (!Hasher::constant_time_equals(hashed, *opts.password_hash)) {
                LOG_WARN("[SECURITY] Rejected request with a wrong share password");
                delayed_response(403, "{\"error\":\"INVALID_PASSWORD\"}\n", "application/json");
                return;
            }
        }

        if (manifest_route) {
            respond(200, "application/json", opts.manifest_json, head_only);
            return;
        }
        serve_file(head_only);
    }

    void serve_file(bool head_only) {
        file_.open(server_->options_.package_path, std::ios::binary);
        std::error_code ec;
        uint64_t size = fs::file_size(server_->options_.package_path, ec);
        if (!file_.is_open() || ec) {
            LOG_ERR("Shared package is no longer readable: ", server_->options_.package_path);
            respond_simple(500, "Package unavailable\n");
            return;
        }

        int status = 200;
        ByteRange range{0, size == 0 ? 0 : size - 1};
        auto range_header = request_.header("range");
        if (range_header) {
            auto parsed = parse_range(*range_header, size);
            if (!parsed) {
                std::ostringstream head;
                head << "HTTP/1.1 416 " << reason_phrase(416) << "\r\n"
                     << "Content-Range: bytes */" << size << "\r\n"
                     << "Content-Length: 0\r\nConnection: close\r\n\r\n";
                write_then_close(head.str());
                return;
            }
            range = *parsed;
            status = 206;
        }

        uint64_t length = size == 0 ? 0 : range.last - range.first + 1;
        std::ostringstream head;
        head << "HTTP/1.1 " << status << " " << reason_phrase(status) << "\r\n"
             << "Content-Type: application/octet-stream\r\n"
             << "Content-Length: " << length << "\r\n"
             << "Accept-Ranges: bytes\r\n"
             << "Content-Disposition: attachment; filename=\"" << server_->options_.download_name << "\"\r\n";
        if (status == 206) {
            head << "Content-Range: bytes " << range.first << "-" << range.last << "/" << size << "\r\n";
        }
        head << "Connection: close\r\n\r\n";

        if (head_only) {
            write_then_close(head.str());
            return;
        }

        remaining_ = length;
        full_body_ = range.first == 0 && length == size;
        file_.seekg(static_cast<std::streamoff>(range.first));
        response_head_ = head.str();
        asio::async_write(socket_, asio::buffer(response_head_),
            [self = shared_from_this()](const asio::error_code& error, size_t) {
                if (error) {
                    self->close();
                    return;
                }
                self->write_body_chunk();
            });
    }

    void write_body_chunk() {
        if (remaining_ == 0) {
            server_->response_finished(full_body_);
            close();
            return;
        }
        size_t chunk = static_cast<size_t>(std::min<uint64_t>(remaining_, BODY_CHUNK_SIZE));
        chunk_.resize(chunk);
        file_.read(chunk_.data(), static_cast<std::streamsize>(chunk));
        if (static_cast<size_t>(file_.gcount()) != chunk) {
            LOG_ERR("Short read from shared package");
            server_->response_finished(false);
            close();
            return;
        }
        asio::async_write(socket_, asio::buffer(chunk_),
            [self = shared_from_this()](const asio::error_code& error, size_t bytes) {
                if (error) {
                    LOG_DEBUG("Download aborted by client: ", error.message());
                    self->server_->response_finished(false);
                    self->close();
                    return;
                }
                self->remaining_ -= bytes;
                self->server_->record_upload(bytes);
                self->write_body_chunk();
            });
    }

    void respond(int status, const std::string& content_type, const std::string& body, bool head_only) {
        std::ostringstream out;
        out << "HTTP/1.1 " << status << " " << reason_phrase(status) << "\r\n"
            << "Content-Type: " << content_type << "\r\n"
            << "Content-Length: " << body.size() << "\r\n"
            << "Connection: close\r\n\r\n";
        if (!head_only) out << body;
        write_then_close(out.str());
    }

    void respond_simple(int status, const std::string& body) {
        respond(status, "text/plain", body, false);
    }

    void delayed_response(int status, const std::string& body, const std::string& content_type) {
        auto delay = std::make_shared<asio::steady_timer>(server_->io_context_, REJECT_DELAY);
        delay->async_wait([self = shared_from_this(), delay, status, body, content_type](const asio::error_code& error) {
            if (error) {
                self->close();
                return;
            }
            self->respond(status, content_type, body, false);
        });
    }

    void write_then_close(std::string data) {
        response_head_ = std::move(data);
        asio::async_write(socket_, asio::buffer(response_head_),
            [self = shared_from_this()](const asio::error_code&, size_t) {
                self->close();
            });
    }

    std::shared_ptr<ShareHttpServer> server_;
    asio::ip::tcp::socket socket_;
    asio::steady_timer timer_;
    asio::streambuf buffer_;
    HttpRequest request_;
    std::ifstream file_;
    std::string response_head_;
    std::vector<char> chunk_;
    uint64_t remaining_ = 0;
    bool full_body_ = false;
    bool counted_;
    bool closed_ = false;
};

std::shared_ptr<ShareHttpServer> ShareHttpServer::create(asio::io_context& io_context, Options options,
                                                         StatsCallback on_stats) {
    return std::shared_ptr<ShareHttpServer>(new ShareHttpServer(io_context, std::move(options), std::move(on_stats)));
}

ShareHttpServer::ShareHttpServer(asio::io_context& io_context, Options options, StatsCallback on_stats)
    : io_context_(io_context),
      acceptor_(io_context, asio::ip::tcp::endpoint(asio::ip::address_v4::loopback(), 0)),
      options_(std::move(options)),
      on_stats_(std::move(on_stats)) {
    port_ = acceptor_.local_endpoint().port();
    LOG_DEBUG("Share HTTP server listening on 127.0.0.1:", port_);
}

void ShareHttpServer::start() {
    asio::post(io_context_, [self = shared_from_this()]() { self->start_accept(); });
}

void ShareHttpServer::stop() {
    asio::post(io_context_, [self = shared_from_this()]() {
        self->stopped_ = true;
        asio::error_code ec;
        self->acceptor_.close(ec);
        auto sessions = self->sessions_;
        for (auto& weak : sessions) {
            if (auto session = weak.lock()) session->close();
        }
        self->sessions_.clear();
    });
}

void ShareHttpServer::start_accept() {
    if (stopped_) return;
    acceptor_.async_accept(
        [self = shared_from_this()](const asio::error_code& error, asio::ip::tcp::socket socket) {
            if (error == asio::error::operation_aborted || self->stopped_) return;
            if (error) {
                LOG_ERR("Error accepting share connection: ", error.message());
                self->start_accept();
                return;
            }

            self->sessions_.erase(std::remove_if(self->sessions_.begin(), self->sessions_.end(),
                                                 [](const std::weak_ptr<Session>& w) { return w.expired(); }),
                                  self->sessions_.end());

            if (self->active_sessions_ >= self->options_.max_connections) {
                LOG_WARN("[SECURITY] Connection limit of ", self->options_.max_connections, " reached, refusing");
                auto session = std::make_shared<Session>(self, std::move(socket), false);
                session->reject_busy();
            } else {
                ++self->active_sessions_;
                auto session = std::make_shared<Session>(self, std::move(socket), true);
                self->sessions_.push_back(session);
                session->start();
            }
            self->start_accept();
        });
}

void ShareHttpServer::session_closed() {
    if (active_sessions_ > 0) --active_sessions_;
}

void ShareHttpServer::record_upload(uint64_t bytes) {
    stats_.uploaded_bytes += bytes;
    unreported_bytes_ += bytes;
    if (unreported_bytes_ >= STATS_INTERVAL_BYTES) {
        unreported_bytes_ = 0;
        if (on_stats_) on_stats_(stats_);
    }
}

void ShareHttpServer::response_finished(bool completed_download) {
    if (completed_download) {
        ++stats_.download_count;
        LOG_INFO("Package downloaded in full (", stats_.download_count, " so far)");
    }
    if (completed_download || unreported_bytes_ > 0) {
        unreported_bytes_ = 0;
        if (on_stats_) on_stats_(stats_);
    }
}
