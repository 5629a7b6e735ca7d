#include "retrieval/swarm_retriever.hpp"
#include "swarm/magnet.hpp"
#include "swarm/swarm_fetcher.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"

SwarmRetriever::SwarmRetriever(std::chrono::seconds stall_timeout) : stall_timeout_(stall_timeout) {}

void SwarmRetriever::retrieve(const std::string& locator, const fs::path& destination,
                              const std::optional<std::string>& password,
                              const std::atomic<bool>& cancelled, const ProgressHandler& on_progress) {
    auto link = MagnetLink::parse(locator);
    if (!link) {
        throw SharingError(ErrorKind::TRANSFER, "Not a valid magnet link");
    }
    if (password && !password->empty()) {
        LOG_WARN("Swarm shares are not password protected, ignoring the supplied password");
    }

    try {
        SwarmFetcher fetcher(*link, destination, stall_timeout_);
        fetcher.run(cancelled, [&on_progress, &link](const SwarmProgress& p) {
            if (!on_progress) return;
            RetrievalProgress progress;
            progress.received_bytes = p.bytes_downloaded;
            progress.total_bytes = link->size;
            progress.peers = p.peers;
            progress.eta_seconds = p.eta_seconds;
            on_progress(progress);
        });
    } catch (const SharingError&) {
        std::error_code ec;
        fs::remove(destination, ec);
        throw;
    } catch (const std::exception& e) {
        std::error_code ec;
        fs::remove(destination, ec);
        LOG_WARN("Swarm download failed: ", e.what());
        throw SharingError(ErrorKind::TRANSFER, e.what());
    }
}
