#include "sharing/share_registry.hpp"
#include "common/logger.hpp"

void ShareRegistry::insert(ShareRecord record) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string id = record.share.share_id;
    shares_[id] = std::move(record);
}

std::optional<ShareRecord> ShareRegistry::remove(const std::string& share_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = shares_.find(share_id);
    if (it == shares_.end()) return std::nullopt;
    ShareRecord record = std::move(it->second);
    shares_.erase(it);
    return record;
}

bool ShareRegistry::apply_connected(const std::string& share_id, const std::string& url) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = shares_.find(share_id);
    if (it == shares_.end()) {
        LOG_DEBUG("Ignoring connect for unknown share ", share_id);
        return false;
    }
    it->second.share.public_url = url;
    it->second.status = ShareStatus::CONNECTED;
    it->second.error.reset();
    return true;
}

bool ShareRegistry::apply_status(const std::string& share_id, ShareStatus status,
                                 const std::optional<std::string>& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = shares_.find(share_id);
    if (it == shares_.end()) return false;
    it->second.status = status;
    it->second.error = error;
    return true;
}

bool ShareRegistry::apply_download_stats(const std::string& share_id, uint32_t download_count,
                                         uint64_t uploaded_bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = shares_.find(share_id);
    if (it == shares_.end()) return false;
    it->second.share.download_count = download_count;
    it->second.share.uploaded_bytes = uploaded_bytes;
    return true;
}

std::optional<ShareRecord> ShareRegistry::get(const std::string& share_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = shares_.find(share_id);
    if (it == shares_.end()) return std::nullopt;
    return it->second;
}

std::vector<ShareRecord> ShareRegistry::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ShareRecord> out;
    out.reserve(shares_.size());
    for (const auto& [id, record] : shares_) {
        out.push_back(record);
    }
    return out;
}

std::vector<std::string> ShareRegistry::ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    out.reserve(shares_.size());
    for (const auto& [id, record] : shares_) {
        out.push_back(id);
    }
    return out;
}

bool ShareRegistry::contains(const std::string& share_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return shares_.count(share_id) > 0;
}

size_t ShareRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return shares_.size();
}

void ShareRegistry::put_seed_session(const SeedSession& session) {
    std::lock_guard<std::mutex> lock(mutex_);
    seed_sessions_[session.export_id] = session;
}

void ShareRegistry::update_seed_session(const std::string& export_id, uint32_t peer_count, uint64_t uploaded_bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = seed_sessions_.find(export_id);
    if (it == seed_sessions_.end()) return;
    it->second.peer_count = peer_count;
    it->second.uploaded_bytes = uploaded_bytes;
}

void ShareRegistry::remove_seed_session(const std::string& export_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    seed_sessions_.erase(export_id);
}

std::optional<SeedSession> ShareRegistry::seed_session(const std::string& export_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = seed_sessions_.find(export_id);
    if (it == seed_sessions_.end()) return std::nullopt;
    return it->second;
}

std::vector<SeedSession> ShareRegistry::seed_sessions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SeedSession> out;
    for (const auto& [id, session] : seed_sessions_) {
        out.push_back(session);
    }
    return out;
}
