#include "gtest/gtest.h"
#include "common/errors.hpp"
#include "common/serializer.hpp"
#include "retrieval/swarm_retriever.hpp"
#include "swarm/chunker.hpp"
#include "swarm/magnet.hpp"
#include "swarm/seeder.hpp"
#include "swarm/swarm_fetcher.hpp"
#include "transport/swarm_strategy.hpp"
#include "test_support.hpp"

#include <asio.hpp>
#include <atomic>
#include <thread>

TEST(SerializerTest, PieceManifestSerialization) {
    PieceManifest m_orig;
    m_orig.file_name = "test_file.ishare";
    m_orig.file_size = 123456;
    m_orig.piece_size = 65536;
    m_orig.piece_hashes.push_back(Hasher::hex_to_hash("1111111111111111111111111111111111111111111111111111111111111111"));
    m_orig.piece_hashes.push_back(Hasher::hex_to_hash("2222222222222222222222222222222222222222222222222222222222222222"));
    m_orig.pieces_count = static_cast<uint32_t>(m_orig.piece_hashes.size());
    m_orig.root_hash = m_orig.compute_root();
    ASSERT_TRUE(m_orig.consistent());

    std::vector<uint8_t> buffer = Serializer::serialize_manifest(m_orig);
    PieceManifest m_deserialized = Serializer::deserialize_manifest(buffer);

    ASSERT_EQ(m_orig.file_name, m_deserialized.file_name);
    ASSERT_EQ(m_orig.file_size, m_deserialized.file_size);
    ASSERT_EQ(m_orig.piece_size, m_deserialized.piece_size);
    ASSERT_EQ(m_orig.pieces_count, m_deserialized.pieces_count);
    ASSERT_EQ(m_orig.root_hash, m_deserialized.root_hash);
    ASSERT_EQ(m_orig.piece_hashes, m_deserialized.piece_hashes);
}

TEST(SerializerTest, TruncatedManifestThrows) {
    PieceManifest m;
    m.file_name = "x";
    m.file_size = 10;
    m.piece_size = 10;
    m.pieces_count = 1;
    m.piece_hashes.push_back(Hasher::sha256(std::string("x")));
    std::vector<uint8_t> buffer = Serializer::serialize_manifest(m);
    buffer.resize(buffer.size() - 5);
    ASSERT_THROW(Serializer::deserialize_manifest(buffer), std::runtime_error);

    // A piece count larger than the payload is refused before allocating.
    std::vector<uint8_t> bogus;
    Serializer::put_string(bogus, "y");
    Serializer::put_u64(bogus, 1);
    Serializer::put_u32(bogus, 1);
    Serializer::put_u32(bogus, 0xFFFFFFFF);
    Serializer::put_hash(bogus, hash_t{});
    ASSERT_THROW(Serializer::deserialize_manifest(bogus), std::runtime_error);
}

TEST(SerializerTest, HandshakeSerialization) {
    HandshakePayload hs_orig;
    hs_orig.protocol_version = 1;
    for (size_t i = 0; i < hs_orig.peer_id.size(); ++i) hs_orig.peer_id[i] = static_cast<uint8_t>(i * 3);

    std::vector<uint8_t> buffer = Serializer::serialize_handshake_payload(hs_orig);
    HandshakePayload hs_deserialized = Serializer::deserialize_handshake_payload(buffer);

    ASSERT_EQ(hs_orig.protocol_version, hs_deserialized.protocol_version);
    ASSERT_EQ(hs_orig.peer_id, hs_deserialized.peer_id);
}

TEST(MagnetTest, UriCarriesHashNameSizeAndPeers) {
    MagnetLink link;
    link.root_hash = Hasher::sha256(std::string("artifact"));
    link.display_name = "My Pack.ishare";
    link.size = 987654;
    link.peers.push_back(PeerAddress{"192.168.1.20", 6881});
    link.peers.push_back(PeerAddress{"::1", 7000});

    std::string uri = link.to_uri();
    EXPECT_EQ(uri.rfind("magnet:?xt=urn:sha256:" + Hasher::hash_to_hex(link.root_hash), 0), 0u);
    EXPECT_NE(uri.find("dn=My%20Pack.ishare"), std::string::npos);

    auto parsed = MagnetLink::parse(uri);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->root_hash, link.root_hash);
    EXPECT_EQ(parsed->display_name, "My Pack.ishare");
    EXPECT_EQ(parsed->size, 987654u);
    ASSERT_EQ(parsed->peers.size(), 2u);
    EXPECT_EQ(parsed->peers[0].host, "192.168.1.20");
    EXPECT_EQ(parsed->peers[1].host, "::1");
    EXPECT_EQ(parsed->peers[1].port, 7000);
}

TEST(MagnetTest, RejectsForeignLinks) {
    EXPECT_FALSE(MagnetLink::parse("https://example.com").has_value());
    EXPECT_FALSE(MagnetLink::parse("magnet:?dn=nohash").has_value());
    EXPECT_FALSE(MagnetLink::parse("magnet:?xt=urn:btih:c12fe1c06bba254a9dc9f519b335aa7c1367a88a").has_value());
    EXPECT_FALSE(MagnetLink::parse("magnet:?xt=urn:sha256:1234").has_value());
    EXPECT_FALSE(MagnetLink::parse("magnet:?xt=urn:sha256:" + std::string(64, 'a') + "&xl=12x").has_value());
    EXPECT_TRUE(MagnetLink::looks_like_magnet("magnet:?xt=anything"));
    EXPECT_FALSE(MagnetLink::looks_like_magnet("http://host/magnet:?"));

    EXPECT_FALSE(PeerAddress::parse("host").has_value());
    EXPECT_FALSE(PeerAddress::parse("host:0").has_value());
    EXPECT_FALSE(PeerAddress::parse("host:70000").has_value());
    EXPECT_EQ(PeerAddress::parse("[fe80::1]:6881")->host, "fe80::1");
}

TEST(ChunkerTest, ManifestIsConsistent) {
    TempDir dir;
    fs::path file = dir / "pkg.ishare";
    write_file(file, 100000);

    PieceManifest m = Chunker::create_manifest_from_file(file, 32768);
    EXPECT_EQ(m.file_size, 100000u);
    EXPECT_EQ(m.pieces_count, 4u);
    EXPECT_EQ(m.piece_length(3), 100000u - 3 * 32768u);
    EXPECT_TRUE(m.consistent());

    m.piece_hashes[1][0] ^= 0x01;
    EXPECT_FALSE(m.consistent());

    EXPECT_THROW(Chunker::create_manifest_from_file(dir / "missing", 32768), std::runtime_error);
}

class SwarmLoopbackTest : public ::testing::Test {
protected:
    void SetUp() override {
        guard_.emplace(asio::make_work_guard(io_context_));
        io_thread_ = std::thread([this]() { io_context_.run(); });
    }

    void TearDown() override {
        guard_.reset();
        io_context_.stop();
        if (io_thread_.joinable()) io_thread_.join();
    }

    TempDir dir_;
    asio::io_context io_context_;
    std::optional<asio::executor_work_guard<asio::io_context::executor_type>> guard_;
    std::thread io_thread_;
};

TEST_F(SwarmLoopbackTest, FetcherDownloadsFromSeeder) {
    fs::path source = dir_ / "seed.ishare";
    write_file(source, 300000, 'q');
    PieceManifest manifest = Chunker::create_manifest_from_file(source, 65536);

    auto seeder = Seeder::create(io_context_, 0);
    seeder->start();
    std::atomic<uint32_t> completed{0};
    seeder->add_seed(manifest, source, [&completed](const SeedStats& stats) {
        completed = stats.completed_downloads;
    });
    ASSERT_TRUE(seeder->has_seed(manifest.root_hash));

    MagnetLink link;
    link.root_hash = manifest.root_hash;
    link.display_name = manifest.file_name;
    link.size = manifest.file_size;
    link.peers.push_back(PeerAddress{"127.0.0.1", seeder->port()});

    fs::path destination = dir_ / "fetched.ishare";
    SwarmFetcher fetcher(link, destination, std::chrono::seconds(10));
    std::atomic<bool> cancelled{false};
    SwarmProgress last;
    fetcher.run(cancelled, [&last](const SwarmProgress& p) { last = p; });

    EXPECT_EQ(read_file(destination), read_file(source));
    EXPECT_DOUBLE_EQ(last.fraction, 1.0);
    EXPECT_EQ(last.bytes_downloaded, 300000u);

    seeder->remove_seed(manifest.root_hash);
    EXPECT_FALSE(seeder->has_seed(manifest.root_hash));
    seeder->stop();
}

TEST_F(SwarmLoopbackTest, UnknownArtifactFails) {
    auto seeder = Seeder::create(io_context_, 0);
    seeder->start();

    MagnetLink link;
    link.root_hash = Hasher::sha256(std::string("not seeded"));
    link.size = 10;
    link.peers.push_back(PeerAddress{"127.0.0.1", seeder->port()});

    fs::path destination = dir_ / "nothing.ishare";
    std::atomic<bool> cancelled{false};
    SwarmRetriever retriever(std::chrono::seconds(5));
    try {
        retriever.retrieve(link.to_uri(), destination, std::nullopt, cancelled, nullptr);
        FAIL() << "download of an unseeded artifact succeeded";
    } catch (const SharingError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::TRANSFER);
    }
    EXPECT_FALSE(fs::exists(destination));
    seeder->stop();
}

TEST_F(SwarmLoopbackTest, FailingProgressHandlerRemovesPartialFile) {
    fs::path source = dir_ / "seed.ishare";
    write_file(source, 300000, 's');
    PieceManifest manifest = Chunker::create_manifest_from_file(source, 65536);

    auto seeder = Seeder::create(io_context_, 0);
    seeder->start();
    seeder->add_seed(manifest, source, nullptr);

    MagnetLink link;
    link.root_hash = manifest.root_hash;
    link.display_name = manifest.file_name;
    link.size = manifest.file_size;
    link.peers.push_back(PeerAddress{"127.0.0.1", seeder->port()});

    fs::path destination = dir_ / "partial.ishare";
    std::atomic<bool> cancelled{false};
    try {
        SwarmRetriever(std::chrono::seconds(10)).retrieve(link.to_uri(), destination, std::nullopt, cancelled,
            [](const RetrievalProgress&) { throw std::runtime_error("progress sink gone"); });
        FAIL() << "download finished despite the failing handler";
    } catch (const SharingError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::TRANSFER);
        EXPECT_NE(std::string(e.what()).find("progress sink gone"), std::string::npos);
    }
    EXPECT_FALSE(fs::exists(destination));
    seeder->stop();
}

TEST_F(SwarmLoopbackTest, StrategySeedsUntilLastShareStops) {
    fs::path package = dir_ / "pack.ishare";
    write_file(package, 150000, 'k');

    SwarmConfig config;
    config.listen_port = 0;
    config.advertise_host = "127.0.0.1";
    config.piece_size = 65536;
    SwarmStrategy strategy(io_context_, config);

    std::vector<TransportEvent> events;
    std::mutex events_mutex;
    auto sink = [&](const TransportEvent& e) {
        std::lock_guard<std::mutex> lock(events_mutex);
        events.push_back(e);
    };

    ShareRequest first;
    first.share_id = "share-1";
    first.export_id = "export-1";
    first.package_path = package;
    strategy.start(first, sink);

    ShareRequest second = first;
    second.share_id = "share-2";
    strategy.start(second, sink);

    std::string magnet;
    {
        std::lock_guard<std::mutex> lock(events_mutex);
        ASSERT_EQ(events.size(), 2u);
        EXPECT_EQ(events[0].kind, TransportEvent::Kind::CONNECTED);
        magnet = events[0].url;
    }
    auto link = MagnetLink::parse(magnet);
    ASSERT_TRUE(link.has_value());
    ASSERT_EQ(link->peers.size(), 1u);
    EXPECT_EQ(link->peers[0].port, strategy.listen_port());

    strategy.stop("share-1");

    std::atomic<bool> cancelled{false};
    fs::path fetched = dir_ / "fetched.ishare";
    SwarmRetriever retriever(std::chrono::seconds(10));
    std::optional<RetrievalProgress> progress;
    retriever.retrieve(magnet, fetched, std::string("ignored"), cancelled,
                       [&progress](const RetrievalProgress& p) { progress = p; });
    EXPECT_EQ(read_file(fetched), read_file(package));
    ASSERT_TRUE(progress.has_value());
    EXPECT_EQ(progress->total_bytes, std::optional<uint64_t>(150000));

    strategy.stop("share-2");
    fs::remove(fetched);
    try {
        SwarmRetriever(std::chrono::seconds(3)).retrieve(magnet, fetched, std::nullopt, cancelled, nullptr);
        FAIL() << "artifact still seeded after the last share stopped";
    } catch (const SharingError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::TRANSFER);
    }
    strategy.shutdown();
}

TEST(SwarmRetrieverTest, InvalidMagnetIsATransferError) {
    TempDir dir;
    std::atomic<bool> cancelled{false};
    SwarmRetriever retriever;
    try {
        retriever.retrieve("magnet:?xt=urn:btih:abc", dir / "x.ishare", std::nullopt, cancelled, nullptr);
        FAIL() << "invalid magnet accepted";
    } catch (const SharingError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::TRANSFER);
    }
}
