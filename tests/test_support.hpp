#ifndef INSTSHARE_TEST_SUPPORT_HPP
#define INSTSHARE_TEST_SUPPORT_HPP

#include "gmock/gmock.h"
#include "sharing/materializer.hpp"
#include "sharing/packager.hpp"
#include "sharing/task_runner.hpp"
#include "sharing/workspace.hpp"
#include "retrieval/retriever.hpp"
#include "transport/transport_strategy.hpp"
#include <deque>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

namespace fs = std::filesystem;

// Unique scratch directory removed on destruction.
class TempDir {
public:
    TempDir();
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return path_; }
    fs::path operator/(const std::string& child) const { return path_ / child; }

private:
    fs::path path_;
};

// Writes `size` bytes of a repeating pattern, creating parent directories.
void write_file(const fs::path& path, size_t size, char fill = 'x');

// Creates a sparse file of `size` bytes.
void write_sparse_file(const fs::path& path, uint64_t size);

std::string read_file(const fs::path& path);

// Writes a /bin/sh script with `body` and marks it executable.
void write_script(const fs::path& path, const std::string& body);

// Replaces PATH for the lifetime of the object.
class ScopedPath {
public:
    explicit ScopedPath(const std::string& value);
    ~ScopedPath();

    ScopedPath(const ScopedPath&) = delete;
    ScopedPath& operator=(const ScopedPath&) = delete;

private:
    std::optional<std::string> saved_;
};

// Workspace directory with an instance.json under `root/<id>`.
WorkspaceInfo make_workspace(const fs::path& root, const std::string& id, const std::string& name,
                             bool is_server = false, const std::optional<std::string>& loader = std::string("fabric"));

/**
 * @brief Task runner that queues work until the test runs it.
 *
 * Lets a test interleave orchestrator calls with collaborator completions.
 */
class QueuedTaskRunner : public TaskRunner {
public:
    void post(Task task) override;

    // Runs the oldest queued task. False when nothing is queued.
    bool run_next();

    // Runs tasks, including ones posted meanwhile, until the queue is empty.
    size_t run_all();

    size_t pending() const;

private:
    mutable std::mutex mutex_;
    std::deque<Task> tasks_;
};

class MockPackager : public Packager {
public:
    MOCK_METHOD(PreparedExport, prepare_export,
                (const WorkspaceInfo& workspace, const ExportOptions& options, const ProgressCallback& progress),
                (override));
    MOCK_METHOD(void, cleanup_export, (const std::string& export_id), (override));
    MOCK_METHOD(void, adopt_export, (const std::string& export_id, const fs::path& package_path), (override));
};

class MockMaterializer : public Materializer {
public:
    MOCK_METHOD(WorkspaceInfo, materialize,
                (const fs::path& package, const SharingManifest& manifest, const std::string& destination_name,
                 const ProgressCallback& progress),
                (override));
};

class MockTransportStrategy : public TransportStrategy {
public:
    MOCK_METHOD(ShareProvider, provider, (), (const, override));
    MOCK_METHOD(TransportCapabilities, capabilities, (), (const, override));
    MOCK_METHOD(void, start, (const ShareRequest& request, TransportSink sink), (override));
    MOCK_METHOD(void, stop, (const std::string& share_id), (override));
    MOCK_METHOD(void, shutdown, (), (override));
};

class MockRetriever : public Retriever {
public:
    MOCK_METHOD(void, retrieve,
                (const std::string& locator, const fs::path& destination, const std::optional<std::string>& password,
                 const std::atomic<bool>& cancelled, const ProgressHandler& on_progress),
                (override));
};

// Forwards to a mock owned by the test, so a factory can hand out unique_ptrs.
class ForwardingRetriever : public Retriever {
public:
    explicit ForwardingRetriever(Retriever& target) : target_(target) {}

    void retrieve(const std::string& locator, const fs::path& destination,
                  const std::optional<std::string>& password,
                  const std::atomic<bool>& cancelled, const ProgressHandler& on_progress) override {
        target_.retrieve(locator, destination, password, cancelled, on_progress);
    }

private:
    Retriever& target_;
};

#endif // INSTSHARE_TEST_SUPPORT_HPP
