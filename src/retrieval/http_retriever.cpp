#include "retrieval/http_retriever.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "common/version.hpp"
#include <asio.hpp>
#include <asio/ssl.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <map>
#include <memory>
#include <sstream>

namespace {

constexpr size_t MAX_RESPONSE_HEAD = 16 * 1024;
constexpr size_t READ_CHUNK = 64 * 1024;
constexpr size_t MAX_ERROR_BODY = 4096;
constexpr auto POLL_INTERVAL = std::chrono::milliseconds(100);

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

struct ResponseHead {
    int status = 0;
    std::map<std::string, std::string> headers;

    std::optional<std::string> header(const std::string& name) const {
        auto it = headers.find(name);
        if (it == headers.end()) return std::nullopt;
        return it->second;
    }

    std::optional<uint64_t> content_length() const {
        auto value = header("content-length");
        if (!value || value->empty() || value->size() > 19) return std::nullopt;
        if (!std::all_of(value->begin(), value->end(), [](unsigned char c) { return std::isdigit(c); })) {
            return std::nullopt;
        }
        return std::stoull(*value);
    }

    bool chunked() const {
        auto value = header("transfer-encoding");
        return value && to_lower(*value).find("chunked") != std::string::npos;
    }
};

// One request/response exchange driven on a private io_context so that
// every wait can observe the cancel flag.
class HttpTransfer {
public:
    HttpTransfer(HttpUrl url, const std::atomic<bool>& cancelled, std::chrono::seconds idle_timeout)
        : url_(std::move(url)),
          cancelled_(cancelled),
          idle_timeout_(idle_timeout),
          ssl_context_(asio::ssl::context::tls_client) {}

    ~HttpTransfer() { close(); }

    void connect() {
        asio::ip::tcp::resolver resolver(io_context_);
        asio::ip::tcp::resolver::results_type endpoints;
        bool done = false;
        asio::error_code result;
        resolver.async_resolve(url_.host, std::to_string(url_.port),
            [&](const asio::error_code& ec, asio::ip::tcp::resolver::results_type r) {
                result = ec;
                endpoints = std::move(r);
                done = true;
            });
        await(done);
        if (result) {
            throw SharingError(ErrorKind::TRANSFER, "Cannot resolve " + url_.host + ": " + result.message());
        }

        if (url_.tls) {
            ssl_context_.set_default_verify_paths();
            tls_ = std::make_unique<asio::ssl::stream<asio::ip::tcp::socket>>(io_context_, ssl_context_);
            tls_->set_verify_mode(asio::ssl::verify_peer);
            tls_->set_verify_callback(asio::ssl::host_name_verification(url_.host));
            if (!SSL_set_tlsext_host_name(tls_->native_handle(), url_.host.c_str())) {
                throw SharingError(ErrorKind::TRANSFER, "Cannot set the TLS server name for " + url_.host);
            }
        } else {
            socket_ = std::make_unique<asio::ip::tcp::socket>(io_context_);
        }

        done = false;
        asio::async_connect(lowest_layer(), endpoints,
            [&](const asio::error_code& ec, const asio::ip::tcp::endpoint&) {
                result = ec;
                done = true;
            });
        await(done);
        if (result) {
            throw SharingError(ErrorKind::TRANSFER, "Cannot connect to " + url_.host + ":" +
                               std::to_string(url_.port) + ": " + result.message());
        }

        if (tls_) {
            done = false;
            tls_->async_handshake(asio::ssl::stream_base::client, [&](const asio::error_code& ec) {
                result = ec;
                done = true;
            });
            await(done);
            if (result) {
                throw SharingError(ErrorKind::TRANSFER, "TLS handshake with " + url_.host + " failed: " +
                                   result.message());
            }
        }
    }

    void send_request(const std::optional<std::string>& password) {
        std::ostringstream req;
        req << "GET " << url_.target << " HTTP/1.1\r\n"
            << "Host: " << host_header() << "\r\n"
            << "User-Agent: instshare/" << INSTSHARE_VERSION << "\r\n"
            << "Accept: */*\r\n"
            << "Connection: close\r\n";
        if (password) {
            if (password->find_first_of("\r\n") != std::string::npos) {
                throw SharingError(ErrorKind::TRANSFER, "Password contains invalid characters");
            }
            req << "X-Share-Password: " << *password << "\r\n";
        }
        req << "\r\n";
        request_ = req.str();

        bool done = false;
        asio::error_code result;
        with_stream([&](auto& stream) {
            asio::async_write(stream, asio::buffer(request_), [&](const asio::error_code& ec, size_t) {
                result = ec;
                done = true;
            });
        });
        await(done);
        if (result) {
            throw SharingError(ErrorKind::TRANSFER, "Sending the request failed: " + result.message());
        }
    }

    ResponseHead read_head() {
        size_t end = fill_until("\r\n\r\n", MAX_RESPONSE_HEAD);
        std::istringstream in(take(end));

        ResponseHead head;
        std::string line;
        std::getline(in, line);
        std::istringstream status_line(line);
        std::string version;
        if (!(status_line >> version >> head.status) || version.compare(0, 5, "HTTP/") != 0) {
            throw SharingError(ErrorKind::TRANSFER, "Malformed response from the share host");
        }
        while (std::getline(in, line)) {
            line = trim(line);
            if (line.empty()) continue;
            size_t colon = line.find(':');
            if (colon == std::string::npos) continue;
            head.headers[to_lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
        }
        return head;
    }

    void read_body(const ResponseHead& head, std::ofstream& out, const Retriever::ProgressHandler& on_progress) {
        total_ = head.chunked() ? std::nullopt : head.content_length();
        if (head.chunked()) {
            for (;;) {
                size_t end = fill_until("\r\n", MAX_RESPONSE_HEAD);
                std::string size_line = trim(take(end));
                size_t ext = size_line.find(';');
                if (ext != std::string::npos) size_line = trim(size_line.substr(0, ext));
                if (size_line.empty() || size_line.size() > 16 ||
                    !std::all_of(size_line.begin(), size_line.end(),
                                 [](unsigned char c) { return std::isxdigit(c); })) {
                    throw SharingError(ErrorKind::TRANSFER, "Malformed chunked response");
                }
                uint64_t chunk = std::stoull(size_line, nullptr, 16);
                if (chunk == 0) break;
                copy_exact(chunk, out, on_progress);
                fill_at_least(2);
                if (take(2) != "\r\n") {
                    throw SharingError(ErrorKind::TRANSFER, "Malformed chunked response");
                }
            }
        } else if (total_) {
            copy_exact(*total_, out, on_progress);
        } else {
            for (;;) {
                write_buffered(buffer_.size(), out, on_progress);
                if (eof_) break;
                read_some();
            }
        }
    }

    std::string read_error_body(const ResponseHead& head) {
        auto length = head.content_length();
        while (!eof_ && buffer_.size() < MAX_ERROR_BODY && (!length || buffer_.size() < *length)) {
            read_some();
        }
        return take(std::min(buffer_.size(), MAX_ERROR_BODY));
    }

private:
    asio::ip::tcp::socket& lowest_layer() {
        return tls_ ? tls_->next_layer() : *socket_;
    }

    template <typename Fn>
    void with_stream(Fn&& fn) {
        if (tls_) {
            fn(*tls_);
        } else {
            fn(*socket_);
        }
    }

    std::string host_header() const {
        std::string host = url_.host.find(':') != std::string::npos ? "[" + url_.host + "]" : url_.host;
        bool default_port = (url_.tls && url_.port == 443) || (!url_.tls && url_.port == 80);
        return default_port ? host : host + ":" + std::to_string(url_.port);
    }

    void await(const bool& done) {
        auto started = std::chrono::steady_clock::now();
        while (!done) {
            if (cancelled_.load()) {
                close();
                throw SharingError(ErrorKind::TRANSFER, "Download cancelled");
            }
            if (std::chrono::steady_clock::now() - started > idle_timeout_) {
                close();
                throw SharingError(ErrorKind::TRANSFER, "Connection to the share host timed out");
            }
            io_context_.restart();
            io_context_.run_for(POLL_INTERVAL);
        }
    }

    size_t read_some() {
        bool done = false;
        asio::error_code result;
        size_t bytes = 0;
        auto buffers = buffer_.prepare(READ_CHUNK);
        with_stream([&](auto& stream) {
            stream.async_read_some(buffers, [&](const asio::error_code& ec, size_t n) {
                result = ec;
                bytes = n;
                done = true;
            });
        });
        await(done);
        buffer_.commit(bytes);
        if (result == asio::error::eof || result == asio::ssl::error::stream_truncated) {
            eof_ = true;
        } else if (result) {
            throw SharingError(ErrorKind::TRANSFER, "Connection lost: " + result.message());
        }
        return bytes;
    }

    // Returns the offset just past the delimiter.
    size_t fill_until(const std::string& delimiter, size_t limit) {
        for (;;) {
            std::string data(asio::buffers_begin(buffer_.data()), asio::buffers_end(buffer_.data()));
            size_t pos = data.find(delimiter);
            if (pos != std::string::npos) return pos + delimiter.size();
            if (data.size() > limit) {
                throw SharingError(ErrorKind::TRANSFER, "Malformed response from the share host");
            }
            if (eof_) {
                throw SharingError(ErrorKind::TRANSFER, "Connection closed before the response was complete");
            }
            read_some();
        }
    }

    void fill_at_least(size_t n) {
        while (buffer_.size() < n) {
            if (eof_) {
                throw SharingError(ErrorKind::TRANSFER, "Connection closed before the response was complete");
            }
            read_some();
        }
    }

    std::string take(size_t n) {
        std::string out(asio::buffers_begin(buffer_.data()),
                        asio::buffers_begin(buffer_.data()) + static_cast<std::ptrdiff_t>(n));
        buffer_.consume(n);
        return out;
    }

    void copy_exact(uint64_t length, std::ofstream& out, const Retriever::ProgressHandler& on_progress) {
        uint64_t remaining = length;
        while (remaining > 0) {
            if (buffer_.size() == 0) {
                if (eof_) {
                    throw SharingError(ErrorKind::TRANSFER, "Connection closed after " +
                                       std::to_string(received_) + " bytes");
                }
                read_some();
                continue;
            }
            size_t n = static_cast<size_t>(std::min<uint64_t>(buffer_.size(), remaining));
            write_buffered(n, out, on_progress);
            remaining -= n;
        }
    }

    void write_buffered(size_t n, std::ofstream& out, const Retriever::ProgressHandler& on_progress) {
        if (n == 0) return;
        out.write(static_cast<const char*>(buffer_.data().data()), static_cast<std::streamsize>(n));
        if (!out) {
            throw SharingError(ErrorKind::TRANSFER, "Cannot write the download file");
        }
        buffer_.consume(n);
        received_ += n;
        if (on_progress) {
            RetrievalProgress progress;
            progress.received_bytes = received_;
            progress.total_bytes = total_;
            on_progress(progress);
        }
    }

    void close() {
        asio::error_code ec;
        if (tls_) tls_->next_layer().close(ec);
        if (socket_) socket_->close(ec);
    }

    HttpUrl url_;
    const std::atomic<bool>& cancelled_;
    std::chrono::seconds idle_timeout_;

    asio::io_context io_context_;
    asio::ssl::context ssl_context_;
    std::unique_ptr<asio::ip::tcp::socket> socket_;
    std::unique_ptr<asio::ssl::stream<asio::ip::tcp::socket>> tls_;
    asio::streambuf buffer_;
    std::string request_;
    bool eof_ = false;
    uint64_t received_ = 0;
    std::optional<uint64_t> total_;
};

SharingError refusal(int status, const std::string& body) {
    switch (status) {
        case 401:
            return SharingError(ErrorKind::TRANSFER, "This share is password protected", "PASSWORD_REQUIRED");
        case 403:
            if (body.find("INVALID_PASSWORD") != std::string::npos) {
                return SharingError(ErrorKind::TRANSFER, "Incorrect share password", "INVALID_PASSWORD");
            }
            return SharingError(ErrorKind::TRANSFER, "Access denied, the share link is invalid or has expired");
        case 404:
            return SharingError(ErrorKind::TRANSFER, "Share not found");
        case 503:
            return SharingError(ErrorKind::TRANSFER, "The share host is busy, try again later");
        default:
            return SharingError(ErrorKind::TRANSFER, "Share host answered HTTP " + std::to_string(status));
    }
}

} // namespace

HttpRetriever::HttpRetriever(std::chrono::seconds idle_timeout) : idle_timeout_(idle_timeout) {}

void HttpRetriever::retrieve(const std::string& locator, const fs::path& destination,
                             const std::optional<std::string>& password,
                             const std::atomic<bool>& cancelled, const ProgressHandler& on_progress) {
    auto url = HttpUrl::parse(locator);
    if (!url) {
        throw SharingError(ErrorKind::TRANSFER, "Not an http(s) share URL");
    }

    std::error_code ec;
    if (destination.has_parent_path()) fs::create_directories(destination.parent_path(), ec);
    std::ofstream out(destination, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw SharingError(ErrorKind::TRANSFER, "Cannot create the download file " + destination.string());
    }

    // The target carries the access token, only the host is logged.
    LOG_INFO("Downloading package from ", url->host, ":", url->port, url->tls ? " over TLS" : "");
    try {
        HttpTransfer transfer(*url, cancelled, idle_timeout_);
        transfer.connect();
        transfer.send_request(password);
        ResponseHead head = transfer.read_head();
        if (head.status != 200) {
            throw refusal(head.status, transfer.read_error_body(head));
        }
        transfer.read_body(head, out, on_progress);
        out.close();
        if (out.fail()) {
            throw SharingError(ErrorKind::TRANSFER, "Cannot write the download file");
        }
    } catch (const SharingError& e) {
        out.close();
        fs::remove(destination, ec);
        LOG_WARN("Download failed: ", e.what());
        throw;
    } catch (const std::exception& e) {
        out.close();
        fs::remove(destination, ec);
        LOG_WARN("Download failed: ", e.what());
        throw SharingError(ErrorKind::TRANSFER, e.what());
    }
}
