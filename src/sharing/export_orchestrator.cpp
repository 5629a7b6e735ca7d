#include "sharing/export_orchestrator.hpp"
#include "common/logger.hpp"

namespace {

enum class Delivery {
    STALE,     // the attempt was stopped or replaced
    DETACHED   // nobody listens any more
};

} // namespace

const char* export_state_name(ExportState state) {
    switch (state) {
        case ExportState::SELECTING: return "selecting";
        case ExportState::PREPARING: return "preparing";
        case ExportState::EXPOSING: return "exposing";
        case ExportState::ACTIVE: return "active";
        case ExportState::STOPPED: return "stopped";
        case ExportState::FAILED: return "failed";
    }
    return "unknown";
}

ExportOrchestrator::ExportOrchestrator(SharingService& service, TaskRunner& tasks, std::string workspace_id)
    : service_(service),
      tasks_(tasks),
      workspace_id_(std::move(workspace_id)),
      channel_(std::make_shared<Channel>()),
      gate_(std::make_shared<AttemptGate>()) {}

ExportOrchestrator::~ExportOrchestrator() {
    detach();
}

template<typename Result>
bool ExportOrchestrator::deliver(const std::shared_ptr<AttemptGate>& gate, const std::weak_ptr<Channel>& channel,
                                 uint64_t attempt, Result&& result) {
    std::lock_guard<std::mutex> lock(gate->mutex);
    if (gate->current != attempt) return false;
    auto ch = channel.lock();
    return ch && ch->push(std::forward<Result>(result));
}

namespace {

// Distinguishes why deliver() refused, read after the fact under the gate.
template<typename Gate, typename Channel>
Delivery why_refused(const std::shared_ptr<Gate>& gate, const std::weak_ptr<Channel>& channel, uint64_t attempt) {
    std::lock_guard<std::mutex> lock(gate->mutex);
    if (gate->current != attempt) return Delivery::STALE;
    auto ch = channel.lock();
    return (!ch || ch->closed()) ? Delivery::DETACHED : Delivery::STALE;
}

} // namespace

uint64_t ExportOrchestrator::bump_attempt() {
    std::lock_guard<std::mutex> lock(gate_->mutex);
    attempt_ = ++gate_->current;
    return attempt_;
}

const ContentInventory& ExportOrchestrator::refresh_inventory() {
    if (state_ == ExportState::SELECTING || !inventory_) {
        inventory_ = service_.inventory(workspace_id_);
        options_ = sanitize_options(options_, *inventory_);
    }
    return *inventory_;
}

bool ExportOrchestrator::set_options(const ExportOptions& options) {
    if (state_ != ExportState::SELECTING) return false;
    if (!inventory_) refresh_inventory();
    options_ = sanitize_options(options, *inventory_);
    return true;
}

bool ExportOrchestrator::set_provider(ShareProvider provider) {
    if (state_ != ExportState::SELECTING) return false;
    provider_ = provider;
    return true;
}

bool ExportOrchestrator::set_password(const std::optional<std::string>& password) {
    if (state_ != ExportState::SELECTING) return false;
    password_ = (password && !password->empty()) ? password : std::nullopt;
    return true;
}

uint64_t ExportOrchestrator::selected_bytes() const {
    return inventory_ ? ::selected_bytes(options_, *inventory_) : 0;
}

bool ExportOrchestrator::start() {
    if (state_ != ExportState::SELECTING) return false;

    try {
        if (!inventory_) refresh_inventory();
        if (selected_bytes() == 0) {
            throw SharingError(ErrorKind::PRECONDITION, "Nothing selected to export");
        }
        if (!service_.has_provider(provider_)) {
            throw SharingError(ErrorKind::PRECONDITION,
                               std::string("Provider '") + provider_key(provider_) + "' is not available");
        }
        if (password_ && !service_.capabilities(provider_).supports_password) {
            throw SharingError(ErrorKind::PRECONDITION,
                               std::string("Provider '") + provider_key(provider_) +
                               "' does not support password protection");
        }
    } catch (const SharingError& e) {
        LOG_WARN("Export not started: ", e.what());
        last_error_ = ErrorRecord::from(e);
        return false;
    }

    last_error_.reset();
    prepared_.reset();
    share_.reset();
    share_status_.reset();
    progress_.reset();

    uint64_t attempt = bump_attempt();

    std::weak_ptr<Channel> channel = channel_;
    subscription_ = service_.events().subscribe([channel](const SharingEvent& event) {
        auto ch = channel.lock();
        if (!ch) return;
        if (const auto* status = std::get_if<ShareStatusEvent>(&event)) {
            ch->push(export_events::ShareStatusChanged{*status});
        } else if (const auto* stats = std::get_if<ShareDownloadEvent>(&event)) {
            ch->push(export_events::ShareStatsChanged{*stats});
        }
    });

    transition(ExportState::PREPARING);

    auto gate = gate_;
    SharingService& service = service_;
    std::string workspace_id = workspace_id_;
    ExportOptions options = options_;
    tasks_.post([&service, gate, channel, attempt, workspace_id, options]() {
        try {
            PreparedExport prepared = service.prepare_export(workspace_id, options,
                [gate, channel, attempt](const ProgressEvent& progress) {
                    deliver(gate, channel, attempt, export_events::Progress{attempt, progress});
                });
            if (!deliver(gate, channel, attempt, export_events::Prepared{attempt, prepared})) {
                LOG_INFO("Export ", prepared.export_id, " was abandoned, removing its artifact");
                try {
                    service.cleanup_export(prepared.export_id);
                } catch (const std::exception& e) {
                    LOG_ERR("Removing abandoned export ", prepared.export_id, " failed: ", e.what());
                }
            }
        } catch (const SharingError& e) {
            deliver(gate, channel, attempt, export_events::PrepareFailed{attempt, ErrorRecord::from(e)});
        } catch (const std::exception& e) {
            deliver(gate, channel, attempt,
                    export_events::PrepareFailed{attempt, ErrorRecord{ErrorKind::PACKAGING, e.what(), ""}});
        }
    });
    return true;
}

void ExportOrchestrator::begin_exposing() {
    transition(ExportState::EXPOSING);

    auto gate = gate_;
    std::weak_ptr<Channel> channel = channel_;
    SharingService& service = service_;
    uint64_t attempt = attempt_;
    PreparedExport prepared = *prepared_;
    ShareProvider provider = provider_;
    std::optional<std::string> password = password_;
    tasks_.post([&service, gate, channel, attempt, prepared, provider, password]() {
        try {
            ActiveShare share = service.start_share(prepared, provider, password);
            if (deliver(gate, channel, attempt, export_events::ShareStarted{attempt, share})) return;
            if (why_refused(gate, channel, attempt) == Delivery::STALE) {
                LOG_INFO("Share ", share.share_id, " belongs to a stopped export, tearing it down");
                service.stop_share(share.share_id);
            }
        } catch (const SharingError& e) {
            if (deliver(gate, channel, attempt, export_events::ShareFailed{attempt, ErrorRecord::from(e)})) return;
            try {
                service.cleanup_export(prepared.export_id);
            } catch (const std::exception& cleanup) {
                LOG_ERR("Removing export ", prepared.export_id, " failed: ", cleanup.what());
            }
        }
    });
}

TeardownReport ExportOrchestrator::stop() {
    TeardownReport report;
    switch (state_) {
        case ExportState::SELECTING:
        case ExportState::STOPPED:
        case ExportState::FAILED:
            return report;
        case ExportState::PREPARING:
        case ExportState::EXPOSING:
            bump_attempt();
            break;
        case ExportState::ACTIVE:
            bump_attempt();
            if (share_) report = service_.stop_share(share_->share_id);
            break;
    }

    if (share_) share_status_ = ShareStatus::STOPPED;
    transition(ExportState::STOPPED);
    release_subscription();
    // Results queued before the attempt moved on are cleaned up here.
    process_events();
    return report;
}

void ExportOrchestrator::detach() {
    release_subscription();
    channel_->close();
}

bool ExportOrchestrator::reset() {
    if (state_ != ExportState::STOPPED && state_ != ExportState::SELECTING) return false;
    prepared_.reset();
    share_.reset();
    share_status_.reset();
    progress_.reset();
    last_error_.reset();
    if (state_ != ExportState::SELECTING) transition(ExportState::SELECTING);
    return true;
}

size_t ExportOrchestrator::process_events() {
    size_t applied = 0;
    while (auto event = channel_->try_pop()) {
        apply(*event);
        ++applied;
    }
    return applied;
}

bool ExportOrchestrator::wait_for_event(std::chrono::milliseconds timeout) {
    auto event = channel_->wait_pop(timeout);
    if (!event) return false;
    apply(*event);
    return true;
}

void ExportOrchestrator::apply(const ExportEvent& event) {
    if (const auto* e = std::get_if<export_events::Prepared>(&event)) {
        on_prepared(*e);
    } else if (const auto* e = std::get_if<export_events::PrepareFailed>(&event)) {
        on_prepare_failed(*e);
    } else if (const auto* e = std::get_if<export_events::Progress>(&event)) {
        if (e->attempt == attempt_ && state_ == ExportState::PREPARING) progress_ = e->progress;
    } else if (const auto* e = std::get_if<export_events::ShareStarted>(&event)) {
        on_share_started(*e);
    } else if (const auto* e = std::get_if<export_events::ShareFailed>(&event)) {
        on_share_failed(*e);
    } else if (const auto* e = std::get_if<export_events::ShareStatusChanged>(&event)) {
        on_share_status(e->status);
    } else if (const auto* e = std::get_if<export_events::ShareStatsChanged>(&event)) {
        on_share_stats(e->stats);
    }
}

void ExportOrchestrator::on_prepared(const export_events::Prepared& event) {
    if (event.attempt != attempt_ || state_ != ExportState::PREPARING) {
        LOG_DEBUG("Discarding stale export ", event.prepared.export_id);
        std::string export_id = event.prepared.export_id;
        SharingService& service = service_;
        tasks_.post([&service, export_id]() {
            try {
                service.cleanup_export(export_id);
            } catch (const std::exception& e) {
                LOG_ERR("Removing stale export ", export_id, " failed: ", e.what());
            }
        });
        return;
    }
    prepared_ = event.prepared;
    progress_ = ProgressEvent{event.prepared.export_id, "ready", 100, 100, "Package ready"};
    begin_exposing();
}

void ExportOrchestrator::on_prepare_failed(const export_events::PrepareFailed& event) {
    if (event.attempt != attempt_ || state_ != ExportState::PREPARING) return;
    LOG_ERR("Packaging failed: ", event.error.message);
    last_error_ = event.error;
    release_subscription();
    transition(ExportState::SELECTING);
}

void ExportOrchestrator::on_share_started(const export_events::ShareStarted& event) {
    if (event.attempt != attempt_ || state_ != ExportState::EXPOSING) {
        std::string share_id = event.share.share_id;
        SharingService& service = service_;
        tasks_.post([&service, share_id]() { service.stop_share(share_id); });
        return;
    }

    share_ = event.share;
    share_status_ = ShareStatus::CONNECTING;
    // The registry may already hold the URL if it arrived before this event.
    auto record = service_.share(event.share.share_id);
    if (record) {
        share_ = record->share;
        share_status_ = record->status;
    }
    transition(ExportState::ACTIVE);
    if (!record) {
        share_status_ = ShareStatus::STOPPED;
        release_subscription();
        transition(ExportState::STOPPED);
    }
}

void ExportOrchestrator::on_share_failed(const export_events::ShareFailed& event) {
    if (event.attempt != attempt_ || state_ != ExportState::EXPOSING) return;
    LOG_ERR("Could not expose the export: ", event.error.message);
    ErrorRecord error = event.error;
    if (error.kind == ErrorKind::PROVISIONING && provider_ != ShareProvider::SWARM) {
        error.message += " (check the tunnel agent with 'agent' or install it with 'install-agent')";
    }

    if (prepared_) {
        std::string export_id = prepared_->export_id;
        SharingService& service = service_;
        tasks_.post([&service, export_id]() {
            try {
                service.cleanup_export(export_id);
            } catch (const std::exception& e) {
                LOG_ERR("Removing export ", export_id, " failed: ", e.what());
            }
        });
        prepared_.reset();
    }
    fail(error, ExportState::SELECTING);
}

void ExportOrchestrator::on_share_status(const ShareStatusEvent& event) {
    if (!share_ || event.share_id != share_->share_id || state_ != ExportState::ACTIVE) return;

    switch (event.status) {
        case ShareStatus::CONNECTING:
            share_status_ = ShareStatus::CONNECTING;
            break;
        case ShareStatus::CONNECTED:
            share_status_ = ShareStatus::CONNECTED;
            if (event.url) share_->public_url = event.url;
            if (last_error_ && last_error_->kind == ErrorKind::PROVISIONING) last_error_.reset();
            break;
        case ShareStatus::ERROR:
            share_status_ = ShareStatus::ERROR;
            if (!last_error_) {
                last_error_ = ErrorRecord{ErrorKind::PROVISIONING, event.error.value_or("Transport error"), ""};
            }
            break;
        case ShareStatus::STOPPED:
            // Stopped elsewhere: expiry or a bulk stop.
            share_status_ = ShareStatus::STOPPED;
            release_subscription();
            transition(ExportState::STOPPED);
            break;
    }
}

void ExportOrchestrator::on_share_stats(const ShareDownloadEvent& event) {
    if (!share_ || event.share_id != share_->share_id || state_ != ExportState::ACTIVE) return;
    share_->download_count = event.download_count;
    share_->uploaded_bytes = event.uploaded_bytes;
}

void ExportOrchestrator::fail(const ErrorRecord& error, ExportState recovery) {
    last_error_ = error;
    release_subscription();
    transition(ExportState::FAILED);
    transition(recovery);
}

void ExportOrchestrator::transition(ExportState to) {
    ExportState from = state_;
    state_ = to;
    LOG_DEBUG("Export of ", workspace_id_, ": ", export_state_name(from), " -> ", export_state_name(to));
    if (listener_) listener_(from, to);
}

void ExportOrchestrator::release_subscription() {
    subscription_.reset();
}
