#include "gtest/gtest.h"
#include "transport/transport_provisioner.hpp"
#include "sharing/sharing_service.hpp"
#include "storage/storage_manager.hpp"
#include "crypto/hasher.hpp"
#include "test_support.hpp"

#include <future>
#include <mutex>
#include <thread>

using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;

namespace {

std::shared_ptr<NiceMock<MockTransportStrategy>> make_strategy(ShareProvider provider, bool password) {
    auto strategy = std::make_shared<NiceMock<MockTransportStrategy>>();
    ON_CALL(*strategy, provider()).WillByDefault(Return(provider));
    TransportCapabilities caps;
    caps.supports_password = password;
    caps.url_based = provider != ShareProvider::SWARM;
    ON_CALL(*strategy, capabilities()).WillByDefault(Return(caps));
    return strategy;
}

StartShareOptions options_for(ShareProvider provider, const std::string& export_id = "export-1") {
    StartShareOptions options;
    options.export_id = export_id;
    options.package_path = "/tmp/pack.ishare";
    options.package_bytes = 4096;
    options.instance_name = "Skyblock";
    options.provider = provider;
    return options;
}

} // namespace

class TransportProvisionerTest : public ::testing::Test {
protected:
    void SetUp() override {
        subscription_ = bus_.subscribe([this](const SharingEvent& event) {
            if (auto status = std::get_if<ShareStatusEvent>(&event)) statuses_.push_back(status->status);
            if (std::holds_alternative<ShareDownloadEvent>(event)) ++download_events_;
        });
        tunnel_ = make_strategy(ShareProvider::BORE, true);
        swarm_ = make_strategy(ShareProvider::SWARM, false);
        provisioner_.register_strategy(tunnel_);
        provisioner_.register_strategy(swarm_);
    }

    asio::io_context io_;
    ShareRegistry registry_;
    SharingEventBus bus_;
    TunnelConfig config_;
    TransportProvisioner provisioner_{io_, registry_, bus_, config_};
    std::shared_ptr<NiceMock<MockTransportStrategy>> tunnel_;
    std::shared_ptr<NiceMock<MockTransportStrategy>> swarm_;
    SharingEventBus::Subscription subscription_;
    std::vector<ShareStatus> statuses_;
    int download_events_ = 0;
};

TEST_F(TransportProvisionerTest, RegistersBeforeStrategyRuns) {
    TransportSink sink;
    EXPECT_CALL(*tunnel_, start(_, _)).WillOnce(Invoke([&](const ShareRequest& request, TransportSink s) {
        auto record = registry_.get(request.share_id);
        ASSERT_TRUE(record.has_value());
        EXPECT_EQ(record->status, ShareStatus::CONNECTING);
        EXPECT_EQ(record->export_id, "export-1");
        EXPECT_EQ(request.package_bytes, 4096u);
        EXPECT_FALSE(request.password_hash.has_value());
        sink = std::move(s);
    }));

    ActiveShare share = provisioner_.start_share(options_for(ShareProvider::BORE));
    EXPECT_FALSE(share.public_url.has_value());
    EXPECT_FALSE(share.expires_at.has_value()); // no TTL without a password by default
    EXPECT_EQ(statuses_, std::vector<ShareStatus>{ShareStatus::CONNECTING});

    sink(TransportEvent::connected(share.share_id, "http://bore.pub:41234/tok"));
    auto record = registry_.get(share.share_id);
    EXPECT_EQ(record->status, ShareStatus::CONNECTED);
    EXPECT_EQ(record->share.public_url, std::optional<std::string>("http://bore.pub:41234/tok"));

    sink(TransportEvent::progress(share.share_id, 1, 4096));
    EXPECT_EQ(registry_.get(share.share_id)->share.download_count, 1u);
    EXPECT_EQ(download_events_, 1);

    sink(TransportEvent::error(share.share_id, "tunnel disconnected"));
    EXPECT_EQ(registry_.get(share.share_id)->error, std::optional<std::string>("tunnel disconnected"));
    EXPECT_EQ(statuses_, (std::vector<ShareStatus>{ShareStatus::CONNECTING, ShareStatus::CONNECTED, ShareStatus::ERROR}));
}

TEST_F(TransportProvisionerTest, ConnectedDuringStartIsKept) {
    EXPECT_CALL(*tunnel_, start(_, _)).WillOnce(Invoke([](const ShareRequest& request, TransportSink sink) {
        sink(TransportEvent::connected(request.share_id, "https://x.trycloudflare.com/tok"));
    }));
    ActiveShare share = provisioner_.start_share(options_for(ShareProvider::BORE));
    EXPECT_EQ(share.public_url, std::optional<std::string>("https://x.trycloudflare.com/tok"));
}

TEST_F(TransportProvisionerTest, StrategyFailureUnregisters) {
    EXPECT_CALL(*tunnel_, start(_, _)).WillOnce(Invoke([](const ShareRequest&, TransportSink) {
        throw std::runtime_error("agent exited");
    }));
    try {
        provisioner_.start_share(options_for(ShareProvider::BORE));
        FAIL() << "provisioning succeeded";
    } catch (const SharingError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::PROVISIONING);
    }
    EXPECT_EQ(registry_.size(), 0u);
}

TEST_F(TransportProvisionerTest, PasswordNeedsCapableProvider) {
    EXPECT_CALL(*swarm_, start(_, _)).Times(0);
    StartShareOptions options = options_for(ShareProvider::SWARM);
    options.password = "secret";
    try {
        provisioner_.start_share(options);
        FAIL() << "password accepted";
    } catch (const SharingError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::PRECONDITION);
    }
    EXPECT_EQ(registry_.size(), 0u);
    EXPECT_TRUE(statuses_.empty());

    EXPECT_THROW(provisioner_.capabilities(ShareProvider::CLOUDFLARE), SharingError);
    EXPECT_FALSE(provisioner_.has_strategy(ShareProvider::CLOUDFLARE));
}

TEST_F(TransportProvisionerTest, PasswordIsHashedWithSaltAndGetsTtl) {
    ShareRequest seen;
    EXPECT_CALL(*tunnel_, start(_, _)).WillOnce(Invoke([&seen](const ShareRequest& request, TransportSink) {
        seen = request;
    }));
    StartShareOptions options = options_for(ShareProvider::BORE);
    options.password = "secret";
    ActiveShare share = provisioner_.start_share(options);

    ASSERT_TRUE(seen.password_hash.has_value());
    ASSERT_TRUE(seen.password_salt.has_value());
    EXPECT_EQ(*seen.password_hash, Hasher::hash_password("secret", *seen.password_salt));
    ASSERT_TRUE(share.expires_at.has_value());
    EXPECT_EQ(*share.expires_at, share.started_at + 1440 * 60);
}

TEST_F(TransportProvisionerTest, ExpiryCallsHandler) {
    std::vector<std::string> expired;
    provisioner_.set_expiry_handler([&expired](const std::string& id) { expired.push_back(id); });

    StartShareOptions options = options_for(ShareProvider::BORE);
    options.expires_at = std::time(nullptr) - 1;
    ActiveShare share = provisioner_.start_share(options);

    io_.run_for(std::chrono::seconds(2));
    EXPECT_EQ(expired, std::vector<std::string>{share.share_id});
}

TEST_F(TransportProvisionerTest, StopDisarmsExpiryAndIgnoresLateEvents) {
    std::vector<std::string> expired;
    provisioner_.set_expiry_handler([&expired](const std::string& id) { expired.push_back(id); });

    TransportSink sink;
    EXPECT_CALL(*tunnel_, start(_, _)).WillOnce(Invoke([&sink](const ShareRequest&, TransportSink s) {
        sink = std::move(s);
    }));
    StartShareOptions options = options_for(ShareProvider::BORE);
    options.expires_at = std::time(nullptr) + 1;
    ActiveShare share = provisioner_.start_share(options);

    EXPECT_CALL(*tunnel_, stop(share.share_id)).Times(1);
    provisioner_.stop_share(share.share_id);
    provisioner_.stop_share(share.share_id); // second stop is a no-op
    registry_.remove(share.share_id);

    sink(TransportEvent::connected(share.share_id, "http://late.example/tok"));
    sink(TransportEvent::progress(share.share_id, 3, 300));
    EXPECT_FALSE(registry_.contains(share.share_id));
    EXPECT_EQ(download_events_, 0);

    io_.run_for(std::chrono::milliseconds(1500));
    EXPECT_TRUE(expired.empty());
}

TEST_F(TransportProvisionerTest, StopDuringStartTearsDownTheLateExposure) {
    std::promise<std::string> started;
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    EXPECT_CALL(*tunnel_, start(_, _)).WillOnce(Invoke([&](const ShareRequest& request, TransportSink) {
        started.set_value(request.share_id);
        released.wait();
    }));
    std::mutex stops_mutex;
    std::vector<std::string> stops;
    EXPECT_CALL(*tunnel_, stop(_)).WillRepeatedly(Invoke([&](const std::string& id) {
        std::lock_guard<std::mutex> lock(stops_mutex);
        stops.push_back(id);
    }));

    std::optional<ErrorKind> failure;
    std::thread starter([&]() {
        try {
            provisioner_.start_share(options_for(ShareProvider::BORE));
        } catch (const SharingError& e) {
            failure = e.kind();
        }
    });

    std::string id = started.get_future().get();
    provisioner_.stop_share(id);
    registry_.remove(id);
    size_t stops_before_release;
    {
        std::lock_guard<std::mutex> lock(stops_mutex);
        stops_before_release = stops.size();
    }
    release.set_value();
    starter.join();

    EXPECT_EQ(failure, std::optional<ErrorKind>(ErrorKind::PROVISIONING));
    ASSERT_EQ(stops.size(), stops_before_release + 1);
    EXPECT_EQ(stops.back(), id);
    EXPECT_FALSE(registry_.contains(id));

    // Nothing is left for a second stop to find.
    provisioner_.stop_share(id);
    EXPECT_EQ(stops.size(), stops_before_release + 1);
}

TEST_F(TransportProvisionerTest, SwarmConnectOpensSeedSession) {
    EXPECT_CALL(*swarm_, start(_, _)).WillOnce(Invoke([](const ShareRequest& request, TransportSink sink) {
        sink(TransportEvent::connected(request.share_id, "magnet:?xt=urn:sha256:ab"));
        sink(TransportEvent::progress(request.share_id, 0, 2048, 2u));
    }));
    provisioner_.start_share(options_for(ShareProvider::SWARM, "export-9"));

    auto session = registry_.seed_session("export-9");
    ASSERT_TRUE(session.has_value());
    EXPECT_EQ(session->peer_count, 2u);
    EXPECT_EQ(session->uploaded_bytes, 2048u);
}

class SharingServiceShareTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.data_dir = dir_.path();
        config_.resolve_defaults();
        storage_ = std::make_shared<StorageManager>(config_.database.string());
        packager_ = std::make_shared<NiceMock<MockPackager>>();
        tunnel_ = make_strategy(ShareProvider::CLOUDFLARE, true);
    }

    std::unique_ptr<SharingService> make_service() {
        SharingService::Collaborators c;
        c.packager = packager_;
        c.materializer = std::make_shared<NiceMock<MockMaterializer>>();
        c.strategies.push_back(tunnel_);
        c.storage = storage_;
        return std::make_unique<SharingService>(config_, io_, tasks_, c);
    }

    PersistedShare row(const std::string& id, const fs::path& package, std::optional<std::time_t> expires) {
        PersistedShare r;
        r.share_id = id;
        r.export_id = "export-" + id;
        r.instance_name = "Skyblock";
        r.package_path = package.string();
        r.provider = ShareProvider::CLOUDFLARE;
        r.password_salt = "00ff00ff";
        r.password_hash = Hasher::hash_password("secret", "00ff00ff");
        r.file_size = 64;
        r.created_at = std::time(nullptr) - 60;
        r.expires_at = expires;
        return r;
    }

    TempDir dir_;
    Config config_;
    asio::io_context io_;
    QueuedTaskRunner tasks_;
    std::shared_ptr<StorageManager> storage_;
    std::shared_ptr<NiceMock<MockPackager>> packager_;
    std::shared_ptr<NiceMock<MockTransportStrategy>> tunnel_;
};

TEST_F(SharingServiceShareTest, RestoreReprovisionsLiveRowsOnly) {
    fs::path live = dir_ / "live.ishare";
    fs::path stale = dir_ / "stale.ishare";
    write_file(live, 64);
    write_file(stale, 64);
    std::time_t expires = std::time(nullptr) + 3600;
    ASSERT_TRUE(storage_->save_share(row("live", live, expires)));
    ASSERT_TRUE(storage_->save_share(row("expired", stale, std::time(nullptr) - 10)));
    ASSERT_TRUE(storage_->save_share(row("gone", dir_ / "missing.ishare", std::nullopt)));

    ShareRequest seen;
    EXPECT_CALL(*packager_, adopt_export("export-live", live)).Times(1);
    EXPECT_CALL(*tunnel_, start(_, _)).WillOnce(Invoke([&seen](const ShareRequest& request, TransportSink) {
        seen = request;
    }));

    auto service = make_service();
    std::vector<ActiveShare> restored = service->restore_shares();

    ASSERT_EQ(restored.size(), 1u);
    EXPECT_NE(restored[0].share_id, "live");
    EXPECT_EQ(restored[0].expires_at, std::optional<std::time_t>(expires));
    EXPECT_EQ(seen.password_salt, std::optional<std::string>("00ff00ff"));
    EXPECT_EQ(seen.password_hash, std::optional<std::string>(Hasher::hash_password("secret", "00ff00ff")));
    EXPECT_FALSE(fs::exists(stale));

    auto rows = storage_->get_all_shares();
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].share_id, restored[0].share_id);
    EXPECT_EQ(rows[0].export_id, "export-live");
}

TEST_F(SharingServiceShareTest, StopShareTearsEverythingDown) {
    auto service = make_service();
    PreparedExport prepared{"export-1", dir_ / "pack.ishare", 64, 64, "Skyblock"};

    ActiveShare share = service->start_share(prepared, ShareProvider::CLOUDFLARE);
    ASSERT_TRUE(storage_->get_share(share.share_id).has_value());

    EXPECT_CALL(*tunnel_, stop(share.share_id)).Times(1);
    EXPECT_CALL(*packager_, cleanup_export("export-1")).Times(1);
    TeardownReport report = service->stop_share(share.share_id);
    EXPECT_TRUE(report.clean());
    EXPECT_FALSE(service->share(share.share_id).has_value());
    EXPECT_FALSE(storage_->get_share(share.share_id).has_value());

    // Idempotent.
    EXPECT_TRUE(service->stop_share(share.share_id).clean());
}

TEST_F(SharingServiceShareTest, TeardownContinuesPastFailures) {
    auto service = make_service();
    PreparedExport prepared{"export-1", dir_ / "pack.ishare", 64, 64, "Skyblock"};
    ActiveShare share = service->start_share(prepared, ShareProvider::CLOUDFLARE);

    EXPECT_CALL(*tunnel_, stop(_)).WillOnce(Invoke([](const std::string&) {
        throw SharingError(ErrorKind::PROVISIONING, "agent did not exit");
    }));
    EXPECT_CALL(*packager_, cleanup_export("export-1")).Times(1);
    TeardownReport report = service->stop_share(share.share_id);
    EXPECT_FALSE(report.clean());
    EXPECT_FALSE(service->share(share.share_id).has_value());
    EXPECT_FALSE(storage_->get_share(share.share_id).has_value());
}

TEST_F(SharingServiceShareTest, ArtifactSurvivesWhileAnotherShareUsesIt) {
    auto service = make_service();
    PreparedExport prepared{"export-1", dir_ / "pack.ishare", 64, 64, "Skyblock"};
    ActiveShare first = service->start_share(prepared, ShareProvider::CLOUDFLARE);
    ActiveShare second = service->start_share(prepared, ShareProvider::CLOUDFLARE);

    EXPECT_CALL(*packager_, cleanup_export("export-1")).Times(0);
    service->stop_share(first.share_id);
    ::testing::Mock::VerifyAndClearExpectations(packager_.get());

    EXPECT_CALL(*packager_, cleanup_export("export-1")).Times(1);
    service->stop_share(second.share_id);
}

TEST_F(SharingServiceShareTest, StopAllSharesStopsEveryShareDespiteFailures) {
    auto service = make_service();
    ActiveShare first = service->start_share(PreparedExport{"export-1", dir_ / "one.ishare", 64, 64, "Skyblock"},
                                             ShareProvider::CLOUDFLARE);
    ActiveShare second = service->start_share(PreparedExport{"export-2", dir_ / "two.ishare", 64, 64, "Skyblock"},
                                              ShareProvider::CLOUDFLARE);
    ASSERT_EQ(service->shares().size(), 2u);

    EXPECT_CALL(*tunnel_, stop(first.share_id)).WillOnce(Invoke([](const std::string&) {
        throw SharingError(ErrorKind::PROVISIONING, "agent did not exit");
    }));
    EXPECT_CALL(*tunnel_, stop(second.share_id)).Times(1);
    EXPECT_CALL(*packager_, cleanup_export("export-1")).Times(1);
    EXPECT_CALL(*packager_, cleanup_export("export-2")).Times(1);

    TeardownReport report = service->stop_all_shares();
    EXPECT_EQ(report.failures.size(), 1u);
    EXPECT_TRUE(service->shares().empty());
    EXPECT_TRUE(storage_->get_all_shares().empty());

    EXPECT_TRUE(service->stop_all_shares().clean());
}

TEST_F(SharingServiceShareTest, InstallsTunnelAgentFoundOnPath) {
    fs::path bin = dir_ / "bin";
    fs::create_directories(bin);
    ScopedPath path(bin.string());
    auto service = make_service();

    EXPECT_FALSE(service->check_tunnel_agent(ShareProvider::BORE).has_value());
    try {
        service->install_tunnel_agent(ShareProvider::BORE);
        FAIL() << "installed an agent that does not exist";
    } catch (const SharingError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::PROVISIONING);
        EXPECT_NE(std::string(e.what()).find("github.com/ekzhang/bore"), std::string::npos);
    }
    try {
        service->install_tunnel_agent(ShareProvider::SWARM);
        FAIL() << "swarm agent installed";
    } catch (const SharingError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::PRECONDITION);
    }

    write_script(bin / "bore", "echo 'bore-cli 0.5.1'");
    AgentInfo info = service->install_tunnel_agent(ShareProvider::BORE);
    EXPECT_EQ(info.provider, ShareProvider::BORE);
    EXPECT_EQ(info.path, config_.tunnel.agent_dir / "bore");
    EXPECT_TRUE(info.installed);
    EXPECT_EQ(info.version, std::optional<std::string>("bore-cli 0.5.1"));
    EXPECT_TRUE(fs::is_regular_file(config_.tunnel.agent_dir / "bore"));

    fs::remove(bin / "bore");
    auto checked = service->check_tunnel_agent(ShareProvider::BORE);
    ASSERT_TRUE(checked.has_value());
    EXPECT_EQ(checked->path, config_.tunnel.agent_dir / "bore");
}
