#include <gtest/gtest.h>

#include "editions/edition_resolver.hpp"

#include <memory>

namespace deployer {
namespace {

class FakeImageInspector final : public IImageInspector {
  public:
    std::expected<std::vector<EditionOption>, std::string> result = std::vector<EditionOption>{};
    mutable int calls = 0;

    std::expected<std::vector<EditionOption>, std::string> ListEditions(const std::string&) const override {
        ++calls;
        return result;
    }
};

class FakeIsoInspector final : public IIsoInspector {
  public:
    std::expected<IsoInspection, std::string> result = std::unexpected(std::string("not mounted"));
    mutable int mount_calls = 0;
    mutable int dismount_calls = 0;

    std::expected<IsoInspection, std::string> MountAndInspect(const std::string&) const override {
        ++mount_calls;
        return result;
    }

    Result Dismount(const IsoMount&) const override {
        ++dismount_calls;
        return Result::Ok();
    }
};

IsoInspection Inspection(std::vector<EditionOption> editions) {
    IsoInspection i;
    i.mount = IsoMount{.iso_path = "/srv/win.iso",
                       .mount_point = "/tmp/iso-1",
                       .install_image_path = "/tmp/iso-1/sources/install.wim"};
    i.editions = std::move(editions);
    return i;
}

class EditionResolverTest : public ::testing::Test {
  protected:
    std::shared_ptr<FakeImageInspector> images_ = std::make_shared<FakeImageInspector>();
    std::shared_ptr<FakeIsoInspector> isos_ = std::make_shared<FakeIsoInspector>();
    EditionResolver resolver_{images_, isos_};
};

TEST_F(EditionResolverTest, EsdEditionsComeFromTheInspector) {
    images_->result = std::vector<EditionOption>{EditionOption{.index = 1, .name = "Windows 11 Home"},
                                                 EditionOption{.index = 5, .name = "Windows 11 Pro"}};

    auto out = resolver_.ResolveEditions("/srv/base/install.esd", ImageKind::ESD);
    ASSERT_EQ(out.value.editions.size(), 2u);
    EXPECT_EQ(out.value.editions[1].index, 5);
    EXPECT_FALSE(out.value.used_fallback);
    EXPECT_FALSE(out.value.mount.Held());
    EXPECT_EQ(out.value.install_image_path, "/srv/base/install.esd");
    EXPECT_FALSE(out.HasWarnings());
}

TEST_F(EditionResolverTest, EmptyInspectionFallsBackToEnterpriseAndPro) {
    auto out = resolver_.ResolveEditions("/srv/base/install.esd", ImageKind::ESD, "Windows 11 24H2");
    ASSERT_EQ(out.value.editions.size(), 2u);
    EXPECT_EQ(out.value.editions[0].index, 4);
    EXPECT_EQ(out.value.editions[0].name, "Windows Enterprise");
    EXPECT_EQ(out.value.editions[1].index, 6);
    EXPECT_EQ(out.value.editions[1].name, "Windows Pro");
    EXPECT_EQ(out.value.editions[0].architecture, "x64");
    EXPECT_EQ(out.value.editions[0].version, "Windows 11 24H2");
    EXPECT_TRUE(out.value.used_fallback);
    EXPECT_TRUE(out.HasWarnings());
}

TEST_F(EditionResolverTest, FailedInspectionFallsBackToo) {
    images_->result = std::unexpected(std::string("wimlib-imagex: not found"));
    auto out = resolver_.ResolveEditions("/srv/base/install.wim", ImageKind::WIM);
    ASSERT_EQ(out.value.editions.size(), 2u);
    EXPECT_EQ(out.value.editions[0].index, 4);
    EXPECT_EQ(out.value.editions[1].index, 6);
    EXPECT_TRUE(out.value.used_fallback);
}

TEST_F(EditionResolverTest, FfuHasNothingToResolve) {
    auto out = resolver_.ResolveEditions("/srv/a.ffu", ImageKind::FFU);
    EXPECT_TRUE(out.value.editions.empty());
    EXPECT_EQ(images_->calls, 0);
    EXPECT_EQ(isos_->mount_calls, 0);
}

TEST_F(EditionResolverTest, IsoKeepsTheMountHeld) {
    isos_->result = Inspection({EditionOption{.index = 6, .name = "Windows 11 Pro"}});

    auto out = resolver_.ResolveEditions("/srv/win.iso", ImageKind::ISO);
    ASSERT_EQ(out.value.editions.size(), 1u);
    EXPECT_TRUE(out.value.mount.Held());
    EXPECT_EQ(out.value.install_image_path, "/tmp/iso-1/sources/install.wim");
    EXPECT_EQ(isos_->dismount_calls, 0);

    ASSERT_TRUE(out.value.mount.Release().is_ok());
    EXPECT_EQ(isos_->dismount_calls, 1);
}

TEST_F(EditionResolverTest, IsoWithoutEditionsIsReleasedAndEmpty) {
    isos_->result = Inspection({});

    auto out = resolver_.ResolveEditions("/srv/win.iso", ImageKind::ISO);
    EXPECT_TRUE(out.value.editions.empty());
    EXPECT_FALSE(out.value.mount.Held());
    EXPECT_FALSE(out.value.used_fallback);
    EXPECT_EQ(isos_->dismount_calls, 1);
    EXPECT_TRUE(out.HasWarnings());
}

TEST_F(EditionResolverTest, IsoMountFailureIsEmpty) {
    auto out = resolver_.ResolveEditions("/srv/win.iso", ImageKind::ISO);
    EXPECT_TRUE(out.value.editions.empty());
    EXPECT_FALSE(out.value.mount.Held());
    EXPECT_EQ(isos_->dismount_calls, 0);
    EXPECT_TRUE(out.HasWarnings());
}

} // namespace
} // namespace deployer
