#ifndef INSTSHARE_RETRIEVER_HPP
#define INSTSHARE_RETRIEVER_HPP

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace fs = std::filesystem;

struct RetrievalProgress {
    uint64_t received_bytes = 0;
    std::optional<uint64_t> total_bytes;    // unknown for chunked responses
    std::optional<uint32_t> peers;          // swarm only
    std::optional<uint64_t> eta_seconds;    // swarm only
};

/**
 * @brief Fetches a remote artifact named by a locator into a local file.
 *
 * Implementations block the calling thread and poll `cancelled`. On any
 * failure, cancellation included, they throw SharingError(TRANSFER) and
 * leave no file at `destination`.
 */
class Retriever {
public:
    using ProgressHandler = std::function<void(const RetrievalProgress&)>;

    virtual ~Retriever() = default;

    virtual void retrieve(const std::string& locator, const fs::path& destination,
                          const std::optional<std::string>& password,
                          const std::atomic<bool>& cancelled, const ProgressHandler& on_progress) = 0;
};

struct HttpUrl {
    bool tls = false;
    std::string host;
    uint16_t port = 0;
    std::string target = "/";

    // http:// and https:// only; IPv6 hosts in brackets.
    static std::optional<HttpUrl> parse(const std::string& url);
};

#endif // INSTSHARE_RETRIEVER_HPP
