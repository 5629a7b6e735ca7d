#include "gtest/gtest.h"
#include "sharing/content_inventory.hpp"
#include "sharing/manifest.hpp"
#include "common/errors.hpp"
#include "test_support.hpp"

class InventoryTest : public ::testing::Test {
protected:
    TempDir root_;
};

TEST_F(InventoryTest, ScansClientWorkspace) {
    WorkspaceInfo ws = make_workspace(root_.path(), "client", "Client Pack");
    write_file(ws.directory / "mods" / "a.jar", 100);
    write_file(ws.directory / "mods" / "b.jar", 200);
    write_file(ws.directory / "config" / "sodium.json", 10);
    write_file(ws.directory / "saves" / "Alpha" / "level.dat", 40);
    write_file(ws.directory / "saves" / "Alpha" / "region" / "r.0.0.mca", 60);
    write_file(ws.directory / "saves" / "NotAWorld" / "readme.txt", 5);
    fs::create_directories(ws.directory / "shaderpacks");

    ContentInventory inv = ContentScanner::scan(ws);

    EXPECT_TRUE(inv.stats(ContentCategory::MODS).available);
    EXPECT_EQ(inv.stats(ContentCategory::MODS).count, 2u);
    EXPECT_EQ(inv.stats(ContentCategory::MODS).total_size_bytes, 300u);
    EXPECT_EQ(inv.stats(ContentCategory::CONFIG).total_size_bytes, 10u);
    EXPECT_FALSE(inv.stats(ContentCategory::RESOURCE_PACKS).available);
    EXPECT_FALSE(inv.stats(ContentCategory::SHADER_PACKS).available); // present but empty

    ASSERT_EQ(inv.worlds.size(), 1u);
    EXPECT_EQ(inv.worlds[0].folder_name, "Alpha");
    EXPECT_EQ(inv.worlds[0].size_bytes, 100u);
    EXPECT_FALSE(inv.worlds[0].is_server_world);
}

TEST_F(InventoryTest, ServerWorkspaceUsesPluginsAndServerWorld) {
    WorkspaceInfo ws = make_workspace(root_.path(), "server", "Survival", true, std::string("Paper"));
    write_file(ws.directory / "plugins" / "essentials.jar", 500);
    write_file(ws.directory / "mods" / "ignored.jar", 999);
    write_file(ws.directory / "resourcepacks" / "pack.zip", 70);
    write_file(ws.directory / "world" / "level.dat", 10);
    write_file(ws.directory / "world_nether" / "level.dat", 20);

    ContentInventory inv = ContentScanner::scan(ws);

    EXPECT_EQ(ContentScanner::category_folder(ws, ContentCategory::MODS), "plugins");
    EXPECT_EQ(inv.stats(ContentCategory::MODS).total_size_bytes, 500u);
    EXPECT_FALSE(inv.stats(ContentCategory::RESOURCE_PACKS).available);

    ASSERT_EQ(inv.worlds.size(), 1u);
    const WorldEntry& world = inv.worlds[0];
    EXPECT_TRUE(world.is_server_world);
    EXPECT_EQ(world.folder_name, "world");
    EXPECT_EQ(world.additional_folders, std::vector<std::string>{"world_nether"});
    EXPECT_EQ(world.size_bytes, 30u);
    EXPECT_EQ(ContentScanner::world_folders(ws, world), (std::vector<std::string>{"world", "world_nether"}));
}

TEST_F(InventoryTest, CategoryFilesSkipSidecarsOutsideMods) {
    WorkspaceInfo ws = make_workspace(root_.path(), "client", "Client");
    write_file(ws.directory / "mods" / "a.jar", 10);
    write_file(ws.directory / "mods" / "a.jar.meta.json", 3);
    write_file(ws.directory / "config" / "nested" / "b.toml", 4);
    write_file(ws.directory / "config" / "b.meta.json", 3);

    auto mods = ContentScanner::category_files(ws, ContentCategory::MODS);
    ASSERT_EQ(mods.size(), 2u);
    EXPECT_EQ(mods[0].relative_path, "mods/a.jar");
    EXPECT_EQ(mods[1].relative_path, "mods/a.jar.meta.json");

    auto config = ContentScanner::category_files(ws, ContentCategory::CONFIG);
    ASSERT_EQ(config.size(), 1u);
    EXPECT_EQ(config[0].relative_path, "config/nested/b.toml");
    EXPECT_EQ(config[0].size_bytes, 4u);
}

TEST_F(InventoryTest, SanitizeDropsUnavailableSelections) {
    WorkspaceInfo ws = make_workspace(root_.path(), "client", "Client");
    write_file(ws.directory / "mods" / "a.jar", 100);
    write_file(ws.directory / "saves" / "Alpha" / "level.dat", 40);
    ContentInventory inv = ContentScanner::scan(ws);

    ExportOptions options;
    options.set(ContentCategory::MODS, true);
    options.set(ContentCategory::SHADER_PACKS, true);
    options.worlds = {"Alpha", "Missing"};

    ExportOptions clean = sanitize_options(options, inv);
    EXPECT_TRUE(clean.includes(ContentCategory::MODS));
    EXPECT_FALSE(clean.includes(ContentCategory::SHADER_PACKS));
    EXPECT_EQ(clean.worlds, std::set<std::string>{"Alpha"});
    EXPECT_EQ(selected_bytes(options, inv), 140u);
    EXPECT_EQ(selected_bytes(ExportOptions{}, inv), 0u);
}

TEST_F(InventoryTest, ModsOnlySelectionTotalsModsSize) {
    WorkspaceInfo ws = make_workspace(root_.path(), "big", "Big Pack");
    for (int i = 0; i < 40; ++i) {
        write_sparse_file(ws.directory / "mods" / ("mod" + std::to_string(i) + ".jar"), 2000000);
    }
    for (int i = 0; i < 5; ++i) {
        write_sparse_file(ws.directory / "config" / ("c" + std::to_string(i) + ".toml"), 4000);
    }
    ContentInventory inv = ContentScanner::scan(ws);
    ASSERT_EQ(inv.stats(ContentCategory::MODS).count, 40u);
    ASSERT_EQ(inv.stats(ContentCategory::MODS).total_size_bytes, 80000000u);
    ASSERT_EQ(inv.stats(ContentCategory::CONFIG).count, 5u);
    ASSERT_EQ(inv.stats(ContentCategory::CONFIG).total_size_bytes, 20000u);

    ExportOptions options;
    options.set(ContentCategory::MODS, true);
    EXPECT_EQ(selected_bytes(options, inv), 80000000u);

    SharingManifest m = ManifestCodec::build(ws, options, inv);
    EXPECT_EQ(m.total_size_bytes, 80000000u);
    EXPECT_TRUE(m.section(ContentCategory::MODS).included);
    EXPECT_FALSE(m.section(ContentCategory::CONFIG).included);
    EXPECT_EQ(m.section(ContentCategory::CONFIG).total_size_bytes, 0u);
    EXPECT_NO_THROW(ManifestCodec::validate(m));
}

TEST_F(InventoryTest, CatalogResolvesAndNamesWorkspaces) {
    WorkspaceCatalog catalog(root_.path());
    make_workspace(root_.path(), "pack", "My Pack");
    make_workspace(root_.path(), "pack_2", "My Pack (2)");

    EXPECT_EQ(catalog.list().size(), 2u);
    EXPECT_EQ(catalog.resolve("pack").name, "My Pack");
    EXPECT_EQ(catalog.unique_name("My Pack"), "My Pack (3)");
    EXPECT_EQ(catalog.unique_name("Other"), "Other");
    EXPECT_EQ(catalog.allocate_directory("My Pack"), "my_pack");
    EXPECT_EQ(catalog.allocate_directory("Pack"), "pack_3");

    try {
        catalog.resolve("nope");
        FAIL() << "unknown workspace resolved";
    } catch (const SharingError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::PRECONDITION);
    }
    EXPECT_THROW(catalog.resolve(".."), SharingError);
}

TEST(WorkspaceTest, SanitizeFileName) {
    EXPECT_EQ(sanitize_file_name("My Pack"), "My Pack");
    EXPECT_EQ(sanitize_file_name("a/b\\c:d"), "a_b_c_d");
    EXPECT_EQ(sanitize_file_name(".."), "instance");
    EXPECT_EQ(sanitize_file_name("..hidden"), "hidden");
    EXPECT_EQ(sanitize_file_name(""), "instance");
}
