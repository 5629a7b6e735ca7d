#include "sharing/import_orchestrator.hpp"
#include "common/logger.hpp"

namespace {

void remove_download(const fs::path& package) {
    std::error_code ec;
    if (fs::remove(package, ec)) {
        LOG_DEBUG("Removed download ", package);
    } else if (ec) {
        LOG_WARN("Could not remove download ", package, ": ", ec.message());
    }
}

} // namespace

const char* import_state_name(ImportState state) {
    switch (state) {
        case ImportState::AWAITING_SOURCE: return "awaiting-source";
        case ImportState::RETRIEVING: return "retrieving";
        case ImportState::VALIDATING: return "validating";
        case ImportState::AWAITING_CONFIRMATION: return "awaiting-confirmation";
        case ImportState::MATERIALIZING: return "materializing";
        case ImportState::COMPLETE: return "complete";
        case ImportState::FAILED: return "failed";
    }
    return "unknown";
}

ImportOrchestrator::ImportOrchestrator(SharingService& service, TaskRunner& tasks)
    : service_(service),
      tasks_(tasks),
      channel_(std::make_shared<Channel>()),
      gate_(std::make_shared<AttemptGate>()) {}

ImportOrchestrator::~ImportOrchestrator() {
    if (cancel_flag_) cancel_flag_->store(true);
    bump_attempt();
    channel_->close();
    if (state_ == ImportState::AWAITING_CONFIRMATION) discard_download();
}

template<typename Result>
bool ImportOrchestrator::deliver(const std::shared_ptr<AttemptGate>& gate, const std::weak_ptr<Channel>& channel,
                                 uint64_t attempt, Result&& result) {
    std::lock_guard<std::mutex> lock(gate->mutex);
    if (gate->current != attempt) return false;
    auto ch = channel.lock();
    return ch && ch->push(std::forward<Result>(result));
}

uint64_t ImportOrchestrator::bump_attempt() {
    std::lock_guard<std::mutex> lock(gate_->mutex);
    attempt_ = ++gate_->current;
    return attempt_;
}

bool ImportOrchestrator::set_remote_source(const std::string& locator, const std::optional<std::string>& password) {
    if (state_ != ImportState::AWAITING_SOURCE) return false;
    source_kind_ = SourceKind::REMOTE;
    locator_ = locator;
    password_ = (password && !password->empty()) ? password : std::nullopt;
    local_path_.clear();
    retrieval_ = RetrievalStatus{};
    return true;
}

bool ImportOrchestrator::set_local_source(const fs::path& package) {
    if (state_ != ImportState::AWAITING_SOURCE) return false;
    source_kind_ = SourceKind::LOCAL_FILE;
    local_path_ = package;
    locator_.clear();
    password_.reset();
    retrieval_ = RetrievalStatus{};
    return true;
}

bool ImportOrchestrator::clear_source() {
    if (state_ != ImportState::AWAITING_SOURCE) return false;
    source_kind_ = SourceKind::NONE;
    locator_.clear();
    password_.reset();
    local_path_.clear();
    return true;
}

bool ImportOrchestrator::begin() {
    if (state_ != ImportState::AWAITING_SOURCE) return false;

    std::shared_ptr<Retriever> retriever;
    try {
        switch (source_kind_) {
            case SourceKind::NONE:
                throw SharingError(ErrorKind::PRECONDITION, "No source provided");
            case SourceKind::REMOTE:
                if (locator_.empty()) throw SharingError(ErrorKind::PRECONDITION, "No source provided");
                retriever = service_.retriever_for(locator_);
                break;
            case SourceKind::LOCAL_FILE: {
                std::error_code ec;
                if (!fs::is_regular_file(local_path_, ec)) {
                    throw SharingError(ErrorKind::PRECONDITION, "Package not found: " + local_path_.string());
                }
                break;
            }
        }
    } catch (const SharingError& e) {
        LOG_WARN("Import not started: ", e.what());
        last_error_ = ErrorRecord::from(e);
        return false;
    }

    last_error_.reset();
    manifest_.reset();
    result_.reset();
    progress_.reset();
    retrieval_ = RetrievalStatus{};
    uint64_t attempt = bump_attempt();

    if (source_kind_ == SourceKind::LOCAL_FILE) {
        begin_validation(local_path_, false);
        return true;
    }

    cancel_flag_ = std::make_shared<std::atomic<bool>>(false);
    transition(ImportState::RETRIEVING);

    auto gate = gate_;
    std::weak_ptr<Channel> channel = channel_;
    auto cancelled = cancel_flag_;
    std::string locator = locator_;
    std::optional<std::string> password = password_;
    fs::path destination = service_.new_download_path();
    tasks_.post([gate, channel, attempt, retriever, cancelled, locator, password, destination]() {
        try {
            retriever->retrieve(locator, destination, password, *cancelled,
                [gate, channel, attempt](const RetrievalProgress& progress) {
                    deliver(gate, channel, attempt, import_events::RetrievalProgressed{attempt, progress});
                });
            if (!deliver(gate, channel, attempt, import_events::Retrieved{attempt, destination})) {
                remove_download(destination);
            }
        } catch (const SharingError& e) {
            deliver(gate, channel, attempt, import_events::RetrievalFailed{attempt, ErrorRecord::from(e)});
        } catch (const std::exception& e) {
            deliver(gate, channel, attempt,
                    import_events::RetrievalFailed{attempt, ErrorRecord{ErrorKind::TRANSFER, e.what(), ""}});
        }
    });
    return true;
}

void ImportOrchestrator::begin_validation(const fs::path& package, bool downloaded) {
    package_ = package;
    downloaded_ = downloaded;
    transition(ImportState::VALIDATING);

    auto gate = gate_;
    std::weak_ptr<Channel> channel = channel_;
    SharingService& service = service_;
    uint64_t attempt = attempt_;
    tasks_.post([&service, gate, channel, attempt, package, downloaded]() {
        bool queued = false;
        try {
            SharingManifest manifest = service.validate_import_package(package);
            queued = deliver(gate, channel, attempt, import_events::Validated{attempt, package, downloaded, manifest});
        } catch (const SharingError& e) {
            queued = deliver(gate, channel, attempt,
                             import_events::ValidationFailed{attempt, package, downloaded, ErrorRecord::from(e)});
        } catch (const std::exception& e) {
            queued = deliver(gate, channel, attempt,
                             import_events::ValidationFailed{attempt, package, downloaded,
                                                             ErrorRecord{ErrorKind::VALIDATION, e.what(), ""}});
        }
        if (!queued && downloaded) remove_download(package);
    });
}

bool ImportOrchestrator::cancel() {
    if (state_ != ImportState::RETRIEVING && state_ != ImportState::VALIDATING) return false;
    if (cancel_flag_) cancel_flag_->store(true);
    bump_attempt();
    LOG_INFO("Import cancelled");
    package_.clear();
    downloaded_ = false;
    transition(ImportState::AWAITING_SOURCE);
    // Results queued before the cancel are discarded here.
    process_events();
    return true;
}

bool ImportOrchestrator::set_destination_name(const std::string& name) {
    if (state_ != ImportState::AWAITING_CONFIRMATION || name.empty()) return false;
    destination_name_ = name;
    return true;
}

bool ImportOrchestrator::confirm() {
    if (state_ != ImportState::AWAITING_CONFIRMATION || !manifest_) return false;

    last_error_.reset();
    progress_.reset();
    transition(ImportState::MATERIALIZING);

    auto gate = gate_;
    std::weak_ptr<Channel> channel = channel_;
    SharingService& service = service_;
    uint64_t attempt = attempt_;
    fs::path package = package_;
    std::string name = destination_name_;
    tasks_.post([&service, gate, channel, attempt, package, name]() {
        try {
            WorkspaceInfo created = service.import_instance(package, name,
                [gate, channel, attempt](const ProgressEvent& progress) {
                    deliver(gate, channel, attempt, import_events::MaterializeProgressed{attempt, progress});
                });
            deliver(gate, channel, attempt, import_events::Materialized{attempt, created});
        } catch (const SharingError& e) {
            deliver(gate, channel, attempt, import_events::MaterializeFailed{attempt, ErrorRecord::from(e)});
        } catch (const std::exception& e) {
            deliver(gate, channel, attempt,
                    import_events::MaterializeFailed{attempt, ErrorRecord{ErrorKind::MATERIALIZATION, e.what(), ""}});
        }
    });
    return true;
}

bool ImportOrchestrator::reset() {
    if (state_ != ImportState::AWAITING_CONFIRMATION && state_ != ImportState::COMPLETE) return false;
    bump_attempt();
    discard_download();
    manifest_.reset();
    result_.reset();
    progress_.reset();
    destination_name_.clear();
    transition(ImportState::AWAITING_SOURCE);
    return true;
}

size_t ImportOrchestrator::process_events() {
    size_t applied = 0;
    while (auto event = channel_->try_pop()) {
        apply(*event);
        ++applied;
    }
    return applied;
}

bool ImportOrchestrator::wait_for_event(std::chrono::milliseconds timeout) {
    auto event = channel_->wait_pop(timeout);
    if (!event) return false;
    apply(*event);
    return true;
}

void ImportOrchestrator::apply(const ImportEvent& event) {
    if (const auto* e = std::get_if<import_events::Retrieved>(&event)) {
        on_retrieved(*e);
    } else if (const auto* e = std::get_if<import_events::RetrievalProgressed>(&event)) {
        on_retrieval_progress(*e);
    } else if (const auto* e = std::get_if<import_events::RetrievalFailed>(&event)) {
        on_retrieval_failed(*e);
    } else if (const auto* e = std::get_if<import_events::Validated>(&event)) {
        on_validated(*e);
    } else if (const auto* e = std::get_if<import_events::ValidationFailed>(&event)) {
        on_validation_failed(*e);
    } else if (const auto* e = std::get_if<import_events::MaterializeProgressed>(&event)) {
        if (e->attempt == attempt_ && state_ == ImportState::MATERIALIZING) progress_ = e->progress;
    } else if (const auto* e = std::get_if<import_events::Materialized>(&event)) {
        on_materialized(*e);
    } else if (const auto* e = std::get_if<import_events::MaterializeFailed>(&event)) {
        on_materialize_failed(*e);
    }
}

void ImportOrchestrator::on_retrieved(const import_events::Retrieved& event) {
    if (event.attempt != attempt_ || state_ != ImportState::RETRIEVING) {
        remove_download(event.package);
        return;
    }
    if (retrieval_.total_bytes) retrieval_.fraction = 1.0;
    begin_validation(event.package, true);
}

void ImportOrchestrator::on_retrieval_progress(const import_events::RetrievalProgressed& event) {
    if (event.attempt != attempt_ || state_ != ImportState::RETRIEVING) return;
    const auto& p = event.progress;
    retrieval_.bytes_downloaded = p.received_bytes;
    retrieval_.total_bytes = p.total_bytes;
    retrieval_.peers = p.peers;
    retrieval_.eta_seconds = p.eta_seconds;
    if (p.total_bytes && *p.total_bytes > 0) {
        retrieval_.fraction = static_cast<double>(p.received_bytes) / static_cast<double>(*p.total_bytes);
    }
}

void ImportOrchestrator::on_retrieval_failed(const import_events::RetrievalFailed& event) {
    if (event.attempt != attempt_ || state_ != ImportState::RETRIEVING) return;
    LOG_ERR("Retrieval failed: ", event.error.message);
    fail(event.error, ImportState::AWAITING_SOURCE);
}

void ImportOrchestrator::on_validated(const import_events::Validated& event) {
    if (event.attempt != attempt_ || state_ != ImportState::VALIDATING) {
        if (event.downloaded) remove_download(event.package);
        return;
    }
    manifest_ = event.manifest;
    destination_name_ = event.manifest.instance.name;
    transition(ImportState::AWAITING_CONFIRMATION);
}

void ImportOrchestrator::on_validation_failed(const import_events::ValidationFailed& event) {
    if (event.downloaded) remove_download(event.package);
    if (event.attempt != attempt_ || state_ != ImportState::VALIDATING) return;
    LOG_ERR("Package rejected: ", event.error.message);
    package_.clear();
    downloaded_ = false;
    fail(event.error, ImportState::AWAITING_SOURCE);
}

void ImportOrchestrator::on_materialized(const import_events::Materialized& event) {
    if (event.attempt != attempt_ || state_ != ImportState::MATERIALIZING) return;
    result_ = event.workspace;
    discard_download();
    transition(ImportState::COMPLETE);
}

void ImportOrchestrator::on_materialize_failed(const import_events::MaterializeFailed& event) {
    if (event.attempt != attempt_ || state_ != ImportState::MATERIALIZING) return;
    LOG_ERR("Import failed: ", event.error.message);
    fail(event.error, ImportState::AWAITING_CONFIRMATION);
}

void ImportOrchestrator::discard_download() {
    if (downloaded_ && !package_.empty()) remove_download(package_);
    package_.clear();
    downloaded_ = false;
}

void ImportOrchestrator::fail(const ErrorRecord& error, ImportState recovery) {
    last_error_ = error;
    transition(ImportState::FAILED);
    transition(recovery);
}

void ImportOrchestrator::transition(ImportState to) {
    ImportState from = state_;
    state_ = to;
    LOG_DEBUG("Import: ", import_state_name(from), " -> ", import_state_name(to));
    if (listener_) listener_(from, to);
}
