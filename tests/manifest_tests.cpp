#include "gtest/gtest.h"
#include "sharing/manifest.hpp"
#include "common/errors.hpp"
#include "nlohmann/json.hpp"
#include <limits>

using json = nlohmann::json;

namespace {

SharingManifest sample_manifest() {
    SharingManifest m;
    m.version = ManifestCodec::FORMAT_VERSION;
    m.app_version = "1.0.0";
    m.created_at = "2026-10-19T10:00:00Z";
    m.instance.name = "Skyblock";
    m.instance.game_version = "1.20.1";
    m.instance.loader = "fabric";
    m.instance.loader_version = "0.15.7";
    m.instance.memory_max_mb = 4096;

    ContentSection& mods = m.section(ContentCategory::MODS);
    mods.included = true;
    mods.count = 2;
    mods.total_size_bytes = 400;
    mods.files = {{"mods/a.jar", 250, std::nullopt}, {"mods/b.jar", 150, std::nullopt}};

    ContentSection& config = m.section(ContentCategory::CONFIG);
    config.included = true;
    config.count = 1;
    config.total_size_bytes = 30;

    WorldEntry world;
    world.name = "Island";
    world.folder_name = "Island";
    world.size_bytes = 50;
    m.saves.included = true;
    m.saves.worlds.push_back(world);

    m.total_size_bytes = 480;
    return m;
}

void expect_rejected(const std::string& text) {
    try {
        ManifestCodec::decode(text);
        FAIL() << "manifest was accepted";
    } catch (const SharingError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::VALIDATION);
    }
}

} // namespace

TEST(ManifestCodecTest, EncodeDecodeKeepsCountsWorldsAndTotal) {
    SharingManifest original = sample_manifest();
    SharingManifest decoded = ManifestCodec::decode(ManifestCodec::encode(original));

    EXPECT_EQ(decoded.version, "1.0");
    EXPECT_EQ(decoded.instance.name, "Skyblock");
    EXPECT_EQ(decoded.instance.loader, std::optional<std::string>("fabric"));
    EXPECT_EQ(decoded.instance.memory_max_mb, std::optional<uint32_t>(4096));
    EXPECT_FALSE(decoded.instance.memory_min_mb.has_value());
    for (ContentCategory c : ALL_CATEGORIES) {
        EXPECT_EQ(decoded.section(c).included, original.section(c).included);
        EXPECT_EQ(decoded.section(c).count, original.section(c).count);
        EXPECT_EQ(decoded.section(c).total_size_bytes, original.section(c).total_size_bytes);
    }
    EXPECT_EQ(decoded.section(ContentCategory::MODS).files.size(), 2u);
    ASSERT_EQ(decoded.saves.worlds.size(), 1u);
    EXPECT_EQ(decoded.saves.worlds[0].folder_name, "Island");
    EXPECT_EQ(decoded.total_size_bytes, 480u);

    // A second pass changes nothing.
    EXPECT_EQ(ManifestCodec::encode(decoded), ManifestCodec::encode(original));
}

TEST(ManifestCodecTest, UsesSnakeCaseWireKeys) {
    json j = json::parse(ManifestCodec::encode(sample_manifest()));
    EXPECT_EQ(j.at("version"), "1.0");
    EXPECT_TRUE(j.at("contents").contains("mods"));
    EXPECT_TRUE(j.at("contents").contains("resourcepacks"));
    EXPECT_TRUE(j.at("contents").contains("shaderpacks"));
    EXPECT_EQ(j.at("contents").at("saves").at("worlds").size(), 1u);
    EXPECT_EQ(j.at("total_size_bytes"), 480);
    EXPECT_EQ(j.at("instance").at("game_version"), "1.20.1");
}

TEST(ManifestCodecTest, RejectsTotalThatDoesNotMatchSections) {
    SharingManifest m = sample_manifest();
    m.total_size_bytes = 500; // sections add up to 480
    expect_rejected(ManifestCodec::encode(m));
    EXPECT_THROW(ManifestCodec::validate(m), SharingError);
}

TEST(ManifestCodecTest, RejectsVersionMismatch) {
    SharingManifest m = sample_manifest();
    m.version = "2.0";
    expect_rejected(ManifestCodec::encode(m));
}

TEST(ManifestCodecTest, RejectsMissingInstanceFields) {
    SharingManifest m = sample_manifest();
    m.instance.game_version.clear();
    expect_rejected(ManifestCodec::encode(m));

    json j = json::parse(ManifestCodec::encode(sample_manifest()));
    j.at("instance").erase("name");
    expect_rejected(j.dump());
}

TEST(ManifestCodecTest, RejectsExcludedSectionWithContent) {
    SharingManifest m = sample_manifest();
    m.section(ContentCategory::SHADER_PACKS).count = 3;
    expect_rejected(ManifestCodec::encode(m));
}

TEST(ManifestCodecTest, RejectsMalformedDocuments) {
    expect_rejected("");
    expect_rejected("{not json");
    expect_rejected("[1, 2, 3]");

    json j = json::parse(ManifestCodec::encode(sample_manifest()));
    j["total_size_bytes"] = -480;
    expect_rejected(j.dump());

    json missing_saves = json::parse(ManifestCodec::encode(sample_manifest()));
    missing_saves.at("contents").erase("saves");
    expect_rejected(missing_saves.dump());
}

TEST(ManifestCodecTest, ExcludedWorldsDoNotCount) {
    SharingManifest m = sample_manifest();
    m.saves.included = false;
    m.saves.worlds.clear();
    m.total_size_bytes = 430;
    EXPECT_NO_THROW(ManifestCodec::validate(m));
    EXPECT_EQ(m.derived_total(), std::optional<uint64_t>(430));
}

TEST(ManifestCodecTest, RejectsSizesThatWrapAround) {
    json j = json::parse(ManifestCodec::encode(sample_manifest()));
    j["contents"]["mods"]["total_size_bytes"] = 9223372036854775808ULL;
    j["contents"]["config"]["total_size_bytes"] = 9223372036854775808ULL;
    j["contents"]["saves"]["included"] = false;
    j["contents"]["saves"]["worlds"] = json::array();
    j["total_size_bytes"] = 0u;
    try {
        ManifestCodec::decode(j.dump());
        FAIL() << "manifest was accepted";
    } catch (const SharingError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::VALIDATION);
        EXPECT_NE(std::string(e.what()).find("sizes overflow"), std::string::npos);
    }

    SharingManifest m = sample_manifest();
    m.section(ContentCategory::MODS).total_size_bytes = std::numeric_limits<uint64_t>::max();
    EXPECT_FALSE(m.derived_total().has_value());
    EXPECT_THROW(ManifestCodec::validate(m), SharingError);
}

TEST(ManifestCodecTest, OptionsOfReflectsSelection) {
    ExportOptions options = ManifestCodec::options_of(sample_manifest());
    EXPECT_TRUE(options.includes(ContentCategory::MODS));
    EXPECT_TRUE(options.includes(ContentCategory::CONFIG));
    EXPECT_FALSE(options.includes(ContentCategory::RESOURCE_PACKS));
    EXPECT_EQ(options.worlds, std::set<std::string>{"Island"});
}
