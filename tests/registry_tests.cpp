#include "gtest/gtest.h"
#include "sharing/event_bus.hpp"
#include "sharing/share_registry.hpp"
#include "common/event_channel.hpp"

#include <thread>

namespace {

ShareRecord record(const std::string& id, const std::string& export_id) {
    ShareRecord r;
    r.share.share_id = id;
    r.share.provider = ShareProvider::BORE;
    r.export_id = export_id;
    return r;
}

} // namespace

TEST(ShareRegistryTest, ConnectAndStatsUpdateLiveShare) {
    ShareRegistry registry;
    registry.insert(record("s1", "e1"));

    ASSERT_TRUE(registry.apply_connected("s1", "https://a.example/tok"));
    ASSERT_TRUE(registry.apply_download_stats("s1", 2, 4096));

    auto r = registry.get("s1");
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->status, ShareStatus::CONNECTED);
    EXPECT_EQ(r->share.public_url, std::optional<std::string>("https://a.example/tok"));
    EXPECT_EQ(r->share.download_count, 2u);
    EXPECT_EQ(r->share.uploaded_bytes, 4096u);
}

TEST(ShareRegistryTest, StopWinsOverLateEvents) {
    ShareRegistry registry;
    registry.insert(record("s1", "e1"));
    registry.insert(record("s2", "e2"));

    ASSERT_TRUE(registry.remove("s1").has_value());
    EXPECT_FALSE(registry.apply_connected("s1", "https://late.example"));
    EXPECT_FALSE(registry.apply_download_stats("s1", 9, 999));
    EXPECT_FALSE(registry.apply_status("s1", ShareStatus::ERROR, std::string("late")));
    EXPECT_FALSE(registry.contains("s1"));
    EXPECT_FALSE(registry.remove("s1").has_value());

    // The other share is untouched.
    EXPECT_TRUE(registry.apply_download_stats("s2", 1, 10));
    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(registry.ids(), std::vector<std::string>{"s2"});
}

TEST(ShareRegistryTest, ErrorClearedOnReconnect) {
    ShareRegistry registry;
    registry.insert(record("s1", "e1"));
    registry.apply_status("s1", ShareStatus::ERROR, std::string("tunnel disconnected"));
    EXPECT_EQ(registry.get("s1")->error, std::optional<std::string>("tunnel disconnected"));

    registry.apply_connected("s1", "http://bore.pub:4000/tok");
    EXPECT_EQ(registry.get("s1")->status, ShareStatus::CONNECTED);
    EXPECT_FALSE(registry.get("s1")->error.has_value());
}

TEST(ShareRegistryTest, SeedSessionsAreKeyedByExport) {
    ShareRegistry registry;
    registry.put_seed_session(SeedSession{"e1", "s1", "magnet:?xt=urn:sha256:00", 0, 0});
    registry.update_seed_session("e1", 3, 1024);
    registry.update_seed_session("unknown", 5, 5);

    auto session = registry.seed_session("e1");
    ASSERT_TRUE(session.has_value());
    EXPECT_EQ(session->peer_count, 3u);
    EXPECT_EQ(session->uploaded_bytes, 1024u);
    EXPECT_EQ(registry.seed_sessions().size(), 1u);

    registry.remove_seed_session("e1");
    EXPECT_TRUE(registry.seed_sessions().empty());
}

TEST(ShareRegistryTest, ConcurrentUpdatesAndRemoval) {
    ShareRegistry registry;
    registry.insert(record("s1", "e1"));

    std::thread updater([&registry]() {
        for (uint32_t i = 0; i < 1000; ++i) {
            registry.apply_download_stats("s1", i, i * 10);
        }
    });
    std::thread remover([&registry]() { registry.remove("s1"); });
    updater.join();
    remover.join();

    EXPECT_FALSE(registry.contains("s1"));
    EXPECT_FALSE(registry.apply_download_stats("s1", 1, 1));
}

TEST(EventBusTest, SubscriptionEndsWhenReleased) {
    SharingEventBus bus;
    int received = 0;
    {
        auto subscription = bus.subscribe([&received](const SharingEvent&) { ++received; });
        EXPECT_TRUE(subscription.active());
        EXPECT_EQ(bus.subscriber_count(), 1u);
        bus.publish(ShareStatusEvent{"s1", ShareStatus::CONNECTING, std::nullopt, std::nullopt});
    }
    EXPECT_EQ(bus.subscriber_count(), 0u);
    bus.publish(ShareStatusEvent{"s1", ShareStatus::STOPPED, std::nullopt, std::nullopt});
    EXPECT_EQ(received, 1);
}

TEST(EventBusTest, SubscriptionMayOutliveBus) {
    SharingEventBus::Subscription subscription;
    {
        SharingEventBus bus;
        subscription = bus.subscribe([](const SharingEvent&) {});
        EXPECT_TRUE(subscription.active());
    }
    EXPECT_FALSE(subscription.active());
    subscription.reset();
}

TEST(EventBusTest, DeliversEveryEventKind) {
    SharingEventBus bus;
    std::vector<size_t> kinds;
    auto subscription = bus.subscribe([&kinds](const SharingEvent& e) { kinds.push_back(e.index()); });

    bus.publish(ProgressEvent{"e1", "packaging", 30, 100, "Packaging"});
    bus.publish(ShareStatusEvent{"s1", ShareStatus::CONNECTED, std::string("http://x"), std::nullopt});
    bus.publish(ShareDownloadEvent{"s1", 1, 10, std::nullopt});
    EXPECT_EQ(kinds, (std::vector<size_t>{0, 1, 2}));
}

TEST(EventChannelTest, ClosedChannelDropsPushes) {
    EventChannel<int> channel;
    EXPECT_TRUE(channel.push(1));
    EXPECT_TRUE(channel.push(2));
    EXPECT_EQ(channel.size(), 2u);
    EXPECT_EQ(channel.try_pop(), std::optional<int>(1));

    channel.close();
    EXPECT_TRUE(channel.closed());
    EXPECT_FALSE(channel.push(3));
    EXPECT_FALSE(channel.try_pop().has_value());
    EXPECT_FALSE(channel.wait_pop(std::chrono::milliseconds(10)).has_value());
}

TEST(EventChannelTest, WaitPopWakesOnPush) {
    EventChannel<int> channel;
    std::thread producer([&channel]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        channel.push(42);
    });
    auto value = channel.wait_pop(std::chrono::seconds(5));
    producer.join();
    EXPECT_EQ(value, std::optional<int>(42));
}
