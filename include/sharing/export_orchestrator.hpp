#ifndef INSTSHARE_EXPORT_ORCHESTRATOR_HPP
#define INSTSHARE_EXPORT_ORCHESTRATOR_HPP

#include "sharing_service.hpp"
#include "task_runner.hpp"
#include "types.hpp"
#include "../common/errors.hpp"
#include "../common/event_channel.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>

enum class ExportState {
    SELECTING,
    PREPARING,
    EXPOSING,
    ACTIVE,
    STOPPED,
    FAILED
};

const char* export_state_name(ExportState state);

namespace export_events {

struct Prepared {
    uint64_t attempt = 0;
    PreparedExport prepared;
};

struct PrepareFailed {
    uint64_t attempt = 0;
    ErrorRecord error;
};

struct Progress {
    uint64_t attempt = 0;
    ProgressEvent progress;
};

struct ShareStarted {
    uint64_t attempt = 0;
    ActiveShare share;
};

struct ShareFailed {
    uint64_t attempt = 0;
    ErrorRecord error;
};

// Pushed from the event bus; matched against the current share id.
struct ShareStatusChanged {
    ShareStatusEvent status;
};

struct ShareStatsChanged {
    ShareDownloadEvent stats;
};

} // namespace export_events

using ExportEvent = std::variant<export_events::Prepared, export_events::PrepareFailed, export_events::Progress,
                                 export_events::ShareStarted, export_events::ShareFailed,
                                 export_events::ShareStatusChanged, export_events::ShareStatsChanged>;

/**
 * @brief State machine of one export attempt: packaging, then exposure.
 *
 * Selecting -> Preparing -> Exposing -> Active -> {Stopped, Failed}
 *
 * Collaborator work runs on the task runner and comes back as ExportEvents
 * through the orchestrator's own channel. The owner drives the machine with
 * process_events() or wait_for_event(); nothing else mutates it. Events that
 * belong to an earlier attempt or to another share are discarded.
 *
 * Destroying or detaching the orchestrator leaves an active share running;
 * only stop() ends it.
 */
class ExportOrchestrator {
public:
    using TransitionListener = std::function<void(ExportState from, ExportState to)>;

    ExportOrchestrator(SharingService& service, TaskRunner& tasks, std::string workspace_id);
    ~ExportOrchestrator();

    ExportOrchestrator(const ExportOrchestrator&) = delete;
    ExportOrchestrator& operator=(const ExportOrchestrator&) = delete;

    // Re-reads the workspace. Only while selecting.
    const ContentInventory& refresh_inventory();

    // Returns false outside Selecting. Unavailable selections are dropped silently.
    bool set_options(const ExportOptions& options);
    bool set_provider(ShareProvider provider);
    bool set_password(const std::optional<std::string>& password);

    /**
     * @brief Leaves Selecting and starts packaging.
     * @return false when refused locally: nothing selected, or a password
     *         for a provider without password support. last_error() says why.
     */
    bool start();

    /**
     * @brief Ends the attempt. Idempotent.
     *
     * In Active this tears the share down; in Preparing or Exposing the work
     * in flight is abandoned and its result cleaned up when it lands.
     */
    TeardownReport stop();

    // Stops listening without stopping the share.
    void detach();

    // Back to Selecting after Stopped, for a new independent attempt.
    bool reset();

    // Applies every queued event. Returns how many were applied.
    size_t process_events();

    // Waits for one event and applies it. Returns false on timeout.
    bool wait_for_event(std::chrono::milliseconds timeout);

    ExportState state() const { return state_; }
    const std::string& workspace_id() const { return workspace_id_; }
    const std::optional<ContentInventory>& inventory() const { return inventory_; }
    const ExportOptions& options() const { return options_; }
    ShareProvider provider() const { return provider_; }
    uint64_t selected_bytes() const;

    const std::optional<PreparedExport>& prepared() const { return prepared_; }
    const std::optional<ActiveShare>& share() const { return share_; }
    std::optional<ShareStatus> share_status() const { return share_status_; }
    const std::optional<ProgressEvent>& progress() const { return progress_; }
    const std::optional<ErrorRecord>& last_error() const { return last_error_; }
    uint64_t attempt() const { return attempt_; }

    void set_transition_listener(TransitionListener listener) { listener_ = std::move(listener); }

private:
    using Channel = EventChannel<ExportEvent>;

    // Attempt number shared with tasks in flight, so a result is either queued
    // for the current attempt or handled by the task as abandoned.
    struct AttemptGate {
        std::mutex mutex;
        uint64_t current = 0;
    };

    void apply(const ExportEvent& event);
    void on_prepared(const export_events::Prepared& event);
    void on_prepare_failed(const export_events::PrepareFailed& event);
    void on_share_started(const export_events::ShareStarted& event);
    void on_share_failed(const export_events::ShareFailed& event);
    void on_share_status(const ShareStatusEvent& event);
    void on_share_stats(const ShareDownloadEvent& event);

    void begin_exposing();
    void transition(ExportState to);
    void fail(const ErrorRecord& error, ExportState recovery);
    void release_subscription();
    uint64_t bump_attempt();

    // Queues a task result if its attempt is still current and the channel open.
    template<typename Result>
    static bool deliver(const std::shared_ptr<AttemptGate>& gate, const std::weak_ptr<Channel>& channel,
                        uint64_t attempt, Result&& result);

    SharingService& service_;
    TaskRunner& tasks_;
    std::string workspace_id_;

    std::shared_ptr<Channel> channel_;
    std::shared_ptr<AttemptGate> gate_;
    SharingEventBus::Subscription subscription_;

    ExportState state_ = ExportState::SELECTING;
    uint64_t attempt_ = 0;
    std::optional<ContentInventory> inventory_;
    ExportOptions options_;
    ShareProvider provider_ = ShareProvider::BORE;
    std::optional<std::string> password_;

    std::optional<PreparedExport> prepared_;
    std::optional<ActiveShare> share_;
    std::optional<ShareStatus> share_status_;
    std::optional<ProgressEvent> progress_;
    std::optional<ErrorRecord> last_error_;
    TransitionListener listener_;
};

#endif // INSTSHARE_EXPORT_ORCHESTRATOR_HPP
