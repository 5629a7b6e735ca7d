#include "gtest/gtest.h"
#include "sharing/import_orchestrator.hpp"
#include "sharing/content_inventory.hpp"
#include "sharing/package_archive.hpp"
#include "sharing/packager.hpp"
#include "test_support.hpp"

using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;

namespace {

size_t entry_count(const fs::path& dir) {
    std::error_code ec;
    if (!fs::exists(dir, ec)) return 0;
    size_t count = 0;
    for (auto it = fs::directory_iterator(dir, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
        ++count;
    }
    return count;
}

} // namespace

class ImportOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.data_dir = dir_ / "data";
        config_.resolve_defaults();

        source_ = make_workspace(dir_ / "source", "island", "Island Pack");
        write_file(source_.directory / "mods" / "a.jar", 400);
        write_file(source_.directory / "config" / "b.toml", 30, 'c');
        write_file(source_.directory / "saves" / "Island" / "level.dat", 50, 'l');

        ExportOptions options;
        options.set(ContentCategory::MODS, true);
        options.set(ContentCategory::CONFIG, true);
        options.worlds.insert("Island");
        ArchivePackager packager(dir_ / "exports");
        package_ = packager.prepare_export(source_, options, nullptr).package_path;

        materializer_ = std::make_shared<NiceMock<MockMaterializer>>();
        SharingService::Collaborators c;
        c.packager = std::make_shared<NiceMock<MockPackager>>();
        c.materializer = materializer_;
        c.retriever_factory = [this](const std::string& locator) -> std::unique_ptr<Retriever> {
            if (HttpUrl::parse(locator)) return std::make_unique<ForwardingRetriever>(retriever_);
            return nullptr;
        };
        service_ = std::make_unique<SharingService>(config_, io_, tasks_, c);
    }

    // Package whose manifest claims more bytes than its sections hold.
    fs::path inconsistent_package() {
        ExportOptions options;
        options.set(ContentCategory::MODS, true);
        options.set(ContentCategory::CONFIG, true);
        options.worlds.insert("Island");
        ContentInventory inventory = ContentScanner::scan(source_);
        SharingManifest manifest = ManifestCodec::build(source_, options, inventory);
        EXPECT_EQ(manifest.total_size_bytes, 480u);
        manifest.total_size_bytes = 500;

        std::vector<ContentFile> files = ContentScanner::category_files(source_, ContentCategory::MODS);
        auto config = ContentScanner::category_files(source_, ContentCategory::CONFIG);
        files.insert(files.end(), config.begin(), config.end());
        fs::path out = dir_ / "inconsistent.ishare";
        PackageArchive::write(out, ManifestCodec::encode(manifest), files, nullptr);
        return out;
    }

    WorkspaceInfo created(const std::string& name) const {
        WorkspaceInfo ws;
        ws.id = "island_pack";
        ws.name = name;
        ws.game_version = "1.20.1";
        ws.directory = config_.instances_dir / "island_pack";
        return ws;
    }

    TempDir dir_;
    Config config_;
    asio::io_context io_;
    QueuedTaskRunner tasks_;
    WorkspaceInfo source_;
    fs::path package_;
    NiceMock<MockRetriever> retriever_;
    std::shared_ptr<NiceMock<MockMaterializer>> materializer_;
    std::unique_ptr<SharingService> service_;
};

TEST_F(ImportOrchestratorTest, BeginNeedsASource) {
    ImportOrchestrator orchestrator(*service_, tasks_);
    EXPECT_FALSE(orchestrator.begin());
    EXPECT_EQ(orchestrator.last_error()->kind, ErrorKind::PRECONDITION);

    orchestrator.set_local_source(dir_ / "missing.ishare");
    EXPECT_FALSE(orchestrator.begin());

    orchestrator.set_remote_source("ftp://example.com/pack.ishare");
    EXPECT_FALSE(orchestrator.begin());
    EXPECT_EQ(orchestrator.last_error()->kind, ErrorKind::PRECONDITION);
    EXPECT_EQ(orchestrator.state(), ImportState::AWAITING_SOURCE);
    EXPECT_EQ(tasks_.pending(), 0u);
}

TEST_F(ImportOrchestratorTest, LocalPackageImportsAfterConfirmation) {
    ImportOrchestrator orchestrator(*service_, tasks_);
    ASSERT_TRUE(orchestrator.set_local_source(package_));
    ASSERT_TRUE(orchestrator.begin());
    EXPECT_EQ(orchestrator.state(), ImportState::VALIDATING);
    tasks_.run_all();
    orchestrator.process_events();

    ASSERT_EQ(orchestrator.state(), ImportState::AWAITING_CONFIRMATION);
    ASSERT_TRUE(orchestrator.manifest().has_value());
    EXPECT_EQ(orchestrator.manifest()->total_size_bytes, 480u);
    EXPECT_EQ(orchestrator.destination_name(), "Island Pack");
    EXPECT_TRUE(orchestrator.set_destination_name("Copy of Island"));

    EXPECT_CALL(*materializer_, materialize(package_, _, "Copy of Island", _))
        .WillOnce(Return(created("Copy of Island")));
    ASSERT_TRUE(orchestrator.confirm());
    tasks_.run_all();
    orchestrator.process_events();

    EXPECT_EQ(orchestrator.state(), ImportState::COMPLETE);
    ASSERT_TRUE(orchestrator.result().has_value());
    EXPECT_EQ(orchestrator.result()->name, "Copy of Island");
    EXPECT_TRUE(fs::exists(package_)); // a local source is never deleted
}

TEST_F(ImportOrchestratorTest, InconsistentManifestIsRejectedBeforeMaterializing) {
    fs::path bad = inconsistent_package();
    EXPECT_CALL(*materializer_, materialize(_, _, _, _)).Times(0);

    ImportOrchestrator orchestrator(*service_, tasks_);
    orchestrator.set_local_source(bad);
    ASSERT_TRUE(orchestrator.begin());
    tasks_.run_all();
    orchestrator.process_events();

    EXPECT_EQ(orchestrator.state(), ImportState::AWAITING_SOURCE);
    ASSERT_TRUE(orchestrator.last_error().has_value());
    EXPECT_EQ(orchestrator.last_error()->kind, ErrorKind::VALIDATION);
    EXPECT_FALSE(orchestrator.confirm());
    EXPECT_EQ(entry_count(config_.instances_dir), 0u);
}

TEST_F(ImportOrchestratorTest, MaterializeFailureAllowsRetryWithoutRetrieval) {
    ImportOrchestrator orchestrator(*service_, tasks_);
    orchestrator.set_local_source(package_);
    orchestrator.begin();
    tasks_.run_all();
    orchestrator.process_events();
    ASSERT_EQ(orchestrator.state(), ImportState::AWAITING_CONFIRMATION);

    std::vector<ImportState> states;
    orchestrator.set_transition_listener([&states](ImportState, ImportState to) { states.push_back(to); });

    EXPECT_CALL(*materializer_, materialize(_, _, _, _))
        .WillOnce(Invoke([](const fs::path&, const SharingManifest&, const std::string&,
                            const ProgressCallback&) -> WorkspaceInfo {
            throw SharingError(ErrorKind::MATERIALIZATION, "No space left on device");
        }))
        .WillOnce(Return(created("Island Pack")));

    orchestrator.confirm();
    tasks_.run_all();
    orchestrator.process_events();
    EXPECT_EQ(orchestrator.state(), ImportState::AWAITING_CONFIRMATION);
    EXPECT_EQ(orchestrator.last_error()->kind, ErrorKind::MATERIALIZATION);
    EXPECT_TRUE(orchestrator.manifest().has_value());

    orchestrator.confirm();
    tasks_.run_all();
    orchestrator.process_events();
    EXPECT_EQ(orchestrator.state(), ImportState::COMPLETE);
    EXPECT_EQ(states, (std::vector<ImportState>{ImportState::MATERIALIZING, ImportState::FAILED,
                                                ImportState::AWAITING_CONFIRMATION, ImportState::MATERIALIZING,
                                                ImportState::COMPLETE}));
}

TEST_F(ImportOrchestratorTest, RemoteSourceDownloadsValidatesAndCleansUp) {
    fs::path downloaded;
    EXPECT_CALL(retriever_, retrieve("https://x.trycloudflare.com/tok", _, std::optional<std::string>("pw"), _, _))
        .WillOnce(Invoke([this, &downloaded](const std::string&, const fs::path& destination,
                                             const std::optional<std::string>&, const std::atomic<bool>&,
                                             const Retriever::ProgressHandler& progress) {
            fs::create_directories(destination.parent_path());
            fs::copy_file(package_, destination);
            downloaded = destination;
            uint64_t size = fs::file_size(destination);
            progress(RetrievalProgress{size, size, std::nullopt, std::nullopt});
        }));

    ImportOrchestrator orchestrator(*service_, tasks_);
    orchestrator.set_remote_source("https://x.trycloudflare.com/tok", std::string("pw"));
    ASSERT_TRUE(orchestrator.begin());
    EXPECT_EQ(orchestrator.state(), ImportState::RETRIEVING);
    tasks_.run_all();
    orchestrator.process_events();
    EXPECT_DOUBLE_EQ(orchestrator.retrieval().fraction, 1.0);
    EXPECT_EQ(orchestrator.state(), ImportState::VALIDATING);
    tasks_.run_all();
    orchestrator.process_events();
    ASSERT_EQ(orchestrator.state(), ImportState::AWAITING_CONFIRMATION);
    EXPECT_TRUE(fs::exists(downloaded));
    EXPECT_EQ(downloaded.parent_path(), config_.downloads_dir());

    ON_CALL(*materializer_, materialize(_, _, _, _)).WillByDefault(Return(created("Island Pack")));
    orchestrator.confirm();
    tasks_.run_all();
    orchestrator.process_events();
    EXPECT_EQ(orchestrator.state(), ImportState::COMPLETE);
    EXPECT_FALSE(fs::exists(downloaded));
}

TEST_F(ImportOrchestratorTest, CancelDuringRetrievalLeavesNothingBehind) {
    bool saw_cancel = false;
    EXPECT_CALL(retriever_, retrieve(_, _, _, _, _))
        .WillOnce(Invoke([&saw_cancel](const std::string&, const fs::path& destination,
                                       const std::optional<std::string>&, const std::atomic<bool>& cancelled,
                                       const Retriever::ProgressHandler&) {
            saw_cancel = cancelled.load();
            EXPECT_FALSE(fs::exists(destination));
            throw SharingError(ErrorKind::TRANSFER, "Download cancelled");
        }));
    EXPECT_CALL(*materializer_, materialize(_, _, _, _)).Times(0);

    ImportOrchestrator orchestrator(*service_, tasks_);
    orchestrator.set_remote_source("http://bore.pub:40000/tok");
    ASSERT_TRUE(orchestrator.begin());
    ASSERT_TRUE(orchestrator.cancel());
    EXPECT_EQ(orchestrator.state(), ImportState::AWAITING_SOURCE);

    tasks_.run_all();
    orchestrator.process_events();

    EXPECT_TRUE(saw_cancel);
    EXPECT_EQ(orchestrator.state(), ImportState::AWAITING_SOURCE);
    EXPECT_FALSE(orchestrator.last_error().has_value());
    EXPECT_EQ(orchestrator.locator(), "http://bore.pub:40000/tok");
    EXPECT_EQ(entry_count(config_.instances_dir), 0u);
    EXPECT_EQ(entry_count(config_.downloads_dir()), 0u);
    EXPECT_FALSE(orchestrator.cancel());
}

TEST_F(ImportOrchestratorTest, CancelledDownloadThatFinishesIsRemoved) {
    fs::path downloaded;
    EXPECT_CALL(retriever_, retrieve(_, _, _, _, _))
        .WillOnce(Invoke([this, &downloaded](const std::string&, const fs::path& destination,
                                             const std::optional<std::string>&, const std::atomic<bool>&,
                                             const Retriever::ProgressHandler&) {
            fs::create_directories(destination.parent_path());
            fs::copy_file(package_, destination);
            downloaded = destination;
        }));

    ImportOrchestrator orchestrator(*service_, tasks_);
    orchestrator.set_remote_source("http://bore.pub:40000/tok");
    orchestrator.begin();
    orchestrator.cancel();
    tasks_.run_all();
    orchestrator.process_events();

    EXPECT_FALSE(downloaded.empty());
    EXPECT_FALSE(fs::exists(downloaded));
    EXPECT_EQ(orchestrator.state(), ImportState::AWAITING_SOURCE);
}

TEST_F(ImportOrchestratorTest, PasswordRefusalKeepsLocator) {
    EXPECT_CALL(retriever_, retrieve(_, _, _, _, _))
        .WillOnce(Invoke([](const std::string&, const fs::path&, const std::optional<std::string>&,
                            const std::atomic<bool>&, const Retriever::ProgressHandler&) {
            throw SharingError(ErrorKind::TRANSFER, "This share is password protected", "PASSWORD_REQUIRED");
        }));

    ImportOrchestrator orchestrator(*service_, tasks_);
    orchestrator.set_remote_source("http://bore.pub:40000/tok");
    orchestrator.begin();
    tasks_.run_all();
    orchestrator.process_events();

    EXPECT_EQ(orchestrator.state(), ImportState::AWAITING_SOURCE);
    ASSERT_TRUE(orchestrator.last_error().has_value());
    EXPECT_EQ(orchestrator.last_error()->kind, ErrorKind::TRANSFER);
    EXPECT_EQ(orchestrator.last_error()->auth_code, "PASSWORD_REQUIRED");
    EXPECT_EQ(orchestrator.source_kind(), SourceKind::REMOTE);
    EXPECT_EQ(orchestrator.locator(), "http://bore.pub:40000/tok");
}

TEST_F(ImportOrchestratorTest, ResetDiscardsPreview) {
    ImportOrchestrator orchestrator(*service_, tasks_);
    orchestrator.set_local_source(package_);
    orchestrator.begin();
    EXPECT_FALSE(orchestrator.reset());
    tasks_.run_all();
    orchestrator.process_events();

    EXPECT_TRUE(orchestrator.reset());
    EXPECT_EQ(orchestrator.state(), ImportState::AWAITING_SOURCE);
    EXPECT_FALSE(orchestrator.manifest().has_value());
    EXPECT_FALSE(orchestrator.confirm());
    EXPECT_TRUE(fs::exists(package_));
}
