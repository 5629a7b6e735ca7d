#ifndef INSTSHARE_SWARM_RETRIEVER_HPP
#define INSTSHARE_SWARM_RETRIEVER_HPP

#include "retriever.hpp"
#include <chrono>

// Downloads a magnet-addressed package from its swarm peers.
class SwarmRetriever : public Retriever {
public:
    explicit SwarmRetriever(std::chrono::seconds stall_timeout = std::chrono::seconds(60));

    void retrieve(const std::string& locator, const fs::path& destination,
                  const std::optional<std::string>& password,
                  const std::atomic<bool>& cancelled, const ProgressHandler& on_progress) override;

private:
    std::chrono::seconds stall_timeout_;
};

#endif // INSTSHARE_SWARM_RETRIEVER_HPP
