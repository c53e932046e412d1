#include <gtest/gtest.h>

#include "editions/iso_mount_lease.hpp"

#include <deque>
#include <memory>

namespace deployer {
namespace {

class FakeIsoInspector final : public IIsoInspector {
  public:
    // Results handed out by successive Dismount calls; Ok once exhausted.
    mutable std::deque<Result> dismount_results;
    mutable int dismount_calls = 0;
    mutable std::string last_mount_point;

    std::expected<IsoInspection, std::string> MountAndInspect(const std::string&) const override {
        return std::unexpected(std::string("not used"));
    }

    Result Dismount(const IsoMount& mount) const override {
        ++dismount_calls;
        last_mount_point = mount.mount_point;
        if (dismount_results.empty())
            return Result::Ok();
        Result r = dismount_results.front();
        dismount_results.pop_front();
        return r;
    }
};

IsoMount SampleMount() {
    return IsoMount{.iso_path = "/srv/iso/win.iso",
                    .mount_point = "/tmp/pe-deployer-iso-abc",
                    .install_image_path = "/tmp/pe-deployer-iso-abc/sources/install.wim"};
}

TEST(IsoMountLeaseTest, ReleaseDismountsOnce) {
    auto ops = std::make_shared<FakeIsoInspector>();
    IsoMountLease lease(ops, SampleMount());
    ASSERT_TRUE(lease.Held());

    auto r = lease.Release();
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_FALSE(lease.Held());
    EXPECT_EQ(ops->dismount_calls, 1);
    EXPECT_EQ(ops->last_mount_point, "/tmp/pe-deployer-iso-abc");

    EXPECT_TRUE(lease.Release().is_ok());
    EXPECT_EQ(ops->dismount_calls, 1);
}

TEST(IsoMountLeaseTest, FailedDismountIsRetriedOnce) {
    auto ops = std::make_shared<FakeIsoInspector>();
    ops->dismount_results.push_back(Result::Fail(16, "busy"));
    IsoMountLease lease(ops, SampleMount());

    auto r = lease.Release();
    EXPECT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(ops->dismount_calls, 2);
    EXPECT_FALSE(lease.Held());
}

TEST(IsoMountLeaseTest, SecondFailureAbandonsTheMount) {
    auto ops = std::make_shared<FakeIsoInspector>();
    ops->dismount_results.push_back(Result::Fail(16, "busy"));
    ops->dismount_results.push_back(Result::Fail(16, "still busy"));
    IsoMountLease lease(ops, SampleMount());

    auto r = lease.Release();
    EXPECT_FALSE(r.is_ok());
    EXPECT_EQ(r.msg, "still busy");
    EXPECT_EQ(ops->dismount_calls, 2);
    EXPECT_FALSE(lease.Held());

    EXPECT_TRUE(lease.Release().is_ok());
    EXPECT_EQ(ops->dismount_calls, 2);
}

TEST(IsoMountLeaseTest, DestructorReleasesHeldLease) {
    auto ops = std::make_shared<FakeIsoInspector>();
    {
        IsoMountLease lease(ops, SampleMount());
    }
    EXPECT_EQ(ops->dismount_calls, 1);
}

TEST(IsoMountLeaseTest, MoveTransfersOwnership) {
    auto ops = std::make_shared<FakeIsoInspector>();
    IsoMountLease a(ops, SampleMount());
    IsoMountLease b(std::move(a));
    EXPECT_FALSE(a.Held());
    EXPECT_TRUE(b.Held());
    EXPECT_EQ(b.Mount().iso_path, "/srv/iso/win.iso");

    IsoMountLease c;
    c = std::move(b);
    EXPECT_TRUE(c.Held());
    EXPECT_EQ(ops->dismount_calls, 0);

    // Assigning over a held lease releases it first.
    c = IsoMountLease(ops, SampleMount());
    EXPECT_EQ(ops->dismount_calls, 1);
    EXPECT_TRUE(c.Held());
}

} // namespace
} // namespace deployer
