#include <gtest/gtest.h>

#include "editions/iso_inspector.hpp"
#include "testing.hpp"

#include <filesystem>

namespace deployer {
namespace {

class FakeImageInspector final : public IImageInspector {
  public:
    std::vector<EditionOption> editions;
    mutable std::string inspected;
    mutable std::string inspected_contents;

    std::expected<std::vector<EditionOption>, std::string>
    ListEditions(const std::string& image_path) const override {
        inspected = image_path;
        inspected_contents = testutil::ReadFile(image_path);
        return editions;
    }
};

TEST(ArchiveIsoInspectorTest, StagesInstallImageAndInspectsIt) {
    testutil::TemporaryDirectory tmp;
    const std::string iso = tmp.Join("win11.iso");
    testutil::BuildIso(iso, {
        {"README.TXT", "hello"},
        {"sources/boot.wim", "boot"},
        {"sources/install.wim", "install-image-bytes"},
    });

    auto images = std::make_shared<FakeImageInspector>();
    images->editions = {EditionOption{.index = 1, .name = "Windows 11 Home"},
                        EditionOption{.index = 6, .name = "Windows 11 Pro"}};
    ArchiveIsoInspector inspector(tmp.Join("staging"), images);

    auto r = inspector.MountAndInspect(iso);
    ASSERT_TRUE(r.has_value()) << r.error();
    EXPECT_EQ(r->mount.iso_path, iso);
    EXPECT_TRUE(std::filesystem::is_directory(r->mount.mount_point));
    EXPECT_EQ(r->mount.install_image_path, r->mount.mount_point + "/sources/install.wim");
    EXPECT_EQ(images->inspected, r->mount.install_image_path);
    EXPECT_EQ(images->inspected_contents, "install-image-bytes");
    ASSERT_EQ(r->editions.size(), 2u);
    EXPECT_EQ(r->editions[1].index, 6);

    auto d = inspector.Dismount(r->mount);
    ASSERT_TRUE(d.is_ok()) << d.msg;
    EXPECT_FALSE(std::filesystem::exists(r->mount.mount_point));
}

TEST(ArchiveIsoInspectorTest, AcceptsInstallEsd) {
    testutil::TemporaryDirectory tmp;
    const std::string iso = tmp.Join("win10.iso");
    testutil::BuildIso(iso, {{"sources/install.esd", "esd"}});

    ArchiveIsoInspector inspector(tmp.Join("staging"), std::make_shared<FakeImageInspector>());
    auto r = inspector.MountAndInspect(iso);
    ASSERT_TRUE(r.has_value()) << r.error();
    EXPECT_EQ(std::filesystem::path(r->mount.install_image_path).filename(), "install.esd");
    EXPECT_TRUE(r->editions.empty());
    EXPECT_TRUE(inspector.Dismount(r->mount).is_ok());
}

TEST(ArchiveIsoInspectorTest, IsoWithoutInstallImageLeavesNothingBehind) {
    testutil::TemporaryDirectory tmp;
    const std::string iso = tmp.Join("tools.iso");
    testutil::BuildIso(iso, {{"tools/setup.exe", "exe"}});

    const std::string staging = tmp.Join("staging");
    ArchiveIsoInspector inspector(staging, std::make_shared<FakeImageInspector>());
    auto r = inspector.MountAndInspect(iso);
    EXPECT_FALSE(r.has_value());
    EXPECT_TRUE(std::filesystem::is_empty(staging));
}

TEST(ArchiveIsoInspectorTest, UnreadableIsoFails) {
    testutil::TemporaryDirectory tmp;
    ArchiveIsoInspector inspector(tmp.Join("staging"), nullptr);
    auto r = inspector.MountAndInspect(tmp.Join("missing.iso"));
    EXPECT_FALSE(r.has_value());
}

} // namespace
} // namespace deployer
