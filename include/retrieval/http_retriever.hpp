#ifndef INSTSHARE_HTTP_RETRIEVER_HPP
#define INSTSHARE_HTTP_RETRIEVER_HPP

#include "retriever.hpp"
#include <chrono>

/**
 * @brief Downloads a package from a tunnel share URL over HTTP or HTTPS.
 *
 * HTTPS certificates are verified against the system trust store with SNI.
 * A password, when given, travels in the X-Share-Password header. Refusals
 * by a password gate are reported through SharingError::auth_code().
 */
class HttpRetriever : public Retriever {
public:
    explicit HttpRetriever(std::chrono::seconds idle_timeout = std::chrono::seconds(60));

    void retrieve(const std::string& locator, const fs::path& destination,
                  const std::optional<std::string>& password,
                  const std::atomic<bool>& cancelled, const ProgressHandler& on_progress) override;

private:
    std::chrono::seconds idle_timeout_;
};

#endif // INSTSHARE_HTTP_RETRIEVER_HPP
