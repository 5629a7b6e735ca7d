#ifndef INSTSHARE_IMPORT_ORCHESTRATOR_HPP
#define INSTSHARE_IMPORT_ORCHESTRATOR_HPP

#include "manifest.hpp"
#include "sharing_service.hpp"
#include "task_runner.hpp"
#include "types.hpp"
#include "workspace.hpp"
#include "../common/errors.hpp"
#include "../common/event_channel.hpp"
#include "../retrieval/retriever.hpp"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>

namespace fs = std::filesystem;

enum class ImportState {
    AWAITING_SOURCE,
    RETRIEVING,
    VALIDATING,
    AWAITING_CONFIRMATION,
    MATERIALIZING,
    COMPLETE,
    FAILED
};

const char* import_state_name(ImportState state);

enum class SourceKind {
    NONE,
    REMOTE,     // URL or magnet link
    LOCAL_FILE
};

namespace import_events {

struct Retrieved {
    uint64_t attempt = 0;
    fs::path package;
};

struct RetrievalProgressed {
    uint64_t attempt = 0;
    RetrievalProgress progress;
};

struct RetrievalFailed {
    uint64_t attempt = 0;
    ErrorRecord error;
};

struct Validated {
    uint64_t attempt = 0;
    fs::path package;
    bool downloaded = false;
    SharingManifest manifest;
};

struct ValidationFailed {
    uint64_t attempt = 0;
    fs::path package;
    bool downloaded = false;
    ErrorRecord error;
};

struct MaterializeProgressed {
    uint64_t attempt = 0;
    ProgressEvent progress;
};

struct Materialized {
    uint64_t attempt = 0;
    WorkspaceInfo workspace;
};

struct MaterializeFailed {
    uint64_t attempt = 0;
    ErrorRecord error;
};

} // namespace import_events

using ImportEvent = std::variant<import_events::Retrieved, import_events::RetrievalProgressed,
                                 import_events::RetrievalFailed, import_events::Validated,
                                 import_events::ValidationFailed, import_events::MaterializeProgressed,
                                 import_events::Materialized, import_events::MaterializeFailed>;

// What the retrieving sub-state exposes.
struct RetrievalStatus {
    double fraction = 0.0;
    uint64_t bytes_downloaded = 0;
    std::optional<uint64_t> total_bytes;
    std::optional<uint32_t> peers;
    std::optional<uint64_t> eta_seconds;
};

/**
 * @brief State machine of one import: retrieval, validation, confirmation, materialization.
 *
 * AwaitingSource -> Retrieving -> Validating -> AwaitingConfirmation
 *                -> Materializing -> {Complete, Failed}
 *
 * A local file skips Retrieving. Failures come back to AwaitingSource (with
 * the locator kept) or, for a failed write, to AwaitingConfirmation so the
 * retry does not download again. Downloads are removed once the attempt is
 * over, whatever its outcome.
 */
class ImportOrchestrator {
public:
    using TransitionListener = std::function<void(ImportState from, ImportState to)>;

    ImportOrchestrator(SharingService& service, TaskRunner& tasks);
    ~ImportOrchestrator();

    ImportOrchestrator(const ImportOrchestrator&) = delete;
    ImportOrchestrator& operator=(const ImportOrchestrator&) = delete;

    // Only while awaiting a source. Setting one kind clears the other.
    bool set_remote_source(const std::string& locator, const std::optional<std::string>& password = std::nullopt);
    bool set_local_source(const fs::path& package);
    bool clear_source();

    /**
     * @brief Starts the attempt with the current source.
     * @return false when refused locally (no source, unknown locator, missing file).
     */
    bool begin();

    // Abandons retrieval or validation and returns to AwaitingSource.
    bool cancel();

    // Only while awaiting confirmation. Defaults to the manifest's instance name.
    bool set_destination_name(const std::string& name);

    bool confirm();

    // Drops a previewed or completed import and waits for a new source.
    bool reset();

    size_t process_events();
    bool wait_for_event(std::chrono::milliseconds timeout);

    ImportState state() const { return state_; }
    SourceKind source_kind() const { return source_kind_; }
    const std::string& locator() const { return locator_; }
    const fs::path& local_path() const { return local_path_; }
    const RetrievalStatus& retrieval() const { return retrieval_; }
    const std::optional<SharingManifest>& manifest() const { return manifest_; }
    const std::string& destination_name() const { return destination_name_; }
    const std::optional<ProgressEvent>& progress() const { return progress_; }
    const std::optional<WorkspaceInfo>& result() const { return result_; }
    const std::optional<ErrorRecord>& last_error() const { return last_error_; }
    uint64_t attempt() const { return attempt_; }

    void set_transition_listener(TransitionListener listener) { listener_ = std::move(listener); }

private:
    using Channel = EventChannel<ImportEvent>;

    struct AttemptGate {
        std::mutex mutex;
        uint64_t current = 0;
    };

    void apply(const ImportEvent& event);
    void on_retrieved(const import_events::Retrieved& event);
    void on_retrieval_progress(const import_events::RetrievalProgressed& event);
    void on_retrieval_failed(const import_events::RetrievalFailed& event);
    void on_validated(const import_events::Validated& event);
    void on_validation_failed(const import_events::ValidationFailed& event);
    void on_materialized(const import_events::Materialized& event);
    void on_materialize_failed(const import_events::MaterializeFailed& event);

    void begin_validation(const fs::path& package, bool downloaded);
    void discard_download();
    void transition(ImportState to);
    void fail(const ErrorRecord& error, ImportState recovery);
    uint64_t bump_attempt();

    template<typename Result>
    static bool deliver(const std::shared_ptr<AttemptGate>& gate, const std::weak_ptr<Channel>& channel,
                        uint64_t attempt, Result&& result);

    SharingService& service_;
    TaskRunner& tasks_;

    std::shared_ptr<Channel> channel_;
    std::shared_ptr<AttemptGate> gate_;
    std::shared_ptr<std::atomic<bool>> cancel_flag_;

    ImportState state_ = ImportState::AWAITING_SOURCE;
    uint64_t attempt_ = 0;
    SourceKind source_kind_ = SourceKind::NONE;
    std::string locator_;
    std::optional<std::string> password_;
    fs::path local_path_;

    fs::path package_;          // artifact being validated or materialized
    bool downloaded_ = false;   // package_ is ours to delete
    RetrievalStatus retrieval_;
    std::optional<SharingManifest> manifest_;
    std::string destination_name_;
    std::optional<ProgressEvent> progress_;
    std::optional<WorkspaceInfo> result_;
    std::optional<ErrorRecord> last_error_;
    TransitionListener listener_;
};

#endif // INSTSHARE_IMPORT_ORCHESTRATOR_HPP
