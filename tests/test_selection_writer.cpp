#include <gtest/gtest.h>

#include "deploy/deployment_engine.hpp"
#include "deploy/selection_builder.hpp"
#include "deploy/selection_writer.hpp"
#include "testing.hpp"

#include <filesystem>
#include <stdexcept>

namespace deployer {
namespace {

DeploymentSelection IsoSelection() {
    ImageDescriptor d;
    d.id = "Custom";
    d.name = "Custom ISO";
    d.path = "/srv/base/custom/win.iso";
    d.kind = ImageKind::ISO;

    DeploymentContext ctx;
    ctx.customer_name = "Acme";
    ctx.order_number = "SO-42";
    ctx.device_info = DeviceInfo{.manufacturer = "HP", .model = "EliteBook 840", .serial_number = "5CG1"};
    ctx.operator_flags = DeploymentFlags{.required_updates = true, .apply_unattend = true, .driver_inject = false};

    DeploymentSelectionBuilder builder{config::DeploymentSettings{}};
    auto sel = builder.BuildSelection(d, EditionOption{.index = 6, .name = "Windows 11 Pro"}, ctx,
                                      "/tmp/iso-1/sources/install.wim");
    if (!sel)
        throw std::runtime_error(sel.error().msg);
    return *sel;
}

DeploymentSelection WimSelection() {
    ImageDescriptor d;
    d.id = "Golden";
    d.path = "/srv/customers/Acme/golden.wim";
    d.kind = ImageKind::WIM;
    d.edition = kCustomImageEdition;
    DeploymentSelectionBuilder builder{config::DeploymentSettings{}};
    auto sel = builder.BuildSelection(d, std::nullopt, DeploymentContext{});
    if (!sel)
        throw std::runtime_error(sel.error().msg);
    return *sel;
}

TEST(SelectionWriterTest, JsonCarriesEveryField) {
    const Json j = SelectionToJson(IsoSelection());
    EXPECT_EQ(j["Id"], "Custom");
    EXPECT_EQ(j["Name"], "Custom ISO");
    EXPECT_EQ(j["FullPath"], "/tmp/iso-1/sources/install.wim");
    EXPECT_EQ(j["ISOPath"], "/srv/base/custom/win.iso");
    EXPECT_EQ(j["ImageIndex"], 6);
    EXPECT_EQ(j["Edition"], "Windows 11 Pro");
    EXPECT_EQ(j["Kind"], "ISO");
    EXPECT_EQ(j["RequiredUpdates"], true);
    EXPECT_EQ(j["ApplyUnattend"], true);
    EXPECT_EQ(j["DriverInject"], false);
    EXPECT_EQ(j["CustomerName"], "Acme");
    EXPECT_EQ(j["OrderNumber"], "SO-42");
    EXPECT_EQ(j["DeviceInfo"]["Manufacturer"], "HP");
    EXPECT_EQ(j["DeviceInfo"]["Model"], "EliteBook 840");
    EXPECT_EQ(j["DeviceInfo"]["SerialNumber"], "5CG1");
}

TEST(SelectionWriterTest, NonIsoSelectionHasNullIsoPath) {
    const Json j = SelectionToJson(WimSelection());
    EXPECT_TRUE(j["ISOPath"].is_null());
    EXPECT_EQ(j["Kind"], "WIM");
}

TEST(SelectionWriterTest, WritesAtomically) {
    testutil::TemporaryDirectory tmp;
    const std::string path = testutil::WriteFile(tmp.Join("selection.json"), "stale");

    auto r = WriteSelectionJson(IsoSelection(), path);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_FALSE(std::filesystem::exists(path + ".tmp"));

    const Json j = Json::parse(testutil::ReadFile(path));
    EXPECT_EQ(j["OrderNumber"], "SO-42");
    EXPECT_EQ(j.begin().key(), "Id");
}

TEST(SelectionWriterTest, UnwritableDirectoryFails) {
    testutil::TemporaryDirectory tmp;
    EXPECT_FALSE(WriteSelectionJson(WimSelection(), tmp.Join("missing/selection.json")).is_ok());
    EXPECT_FALSE(WriteSelectionJson(WimSelection(), "").is_ok());
}

TEST(CommandDeploymentEngineTest, WritesHandoffAndRunsCommand) {
    testutil::TemporaryDirectory tmp;
    const std::string handoff = tmp.Join("selection.json");
    const std::string copy = tmp.Join("seen.json");

    // The hand-off path arrives as $0.
    CommandDeploymentEngine copier("sh -c 'cp \"$0\" " + copy + "'", handoff);
    auto r = copier.Deploy(WimSelection());
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(Json::parse(testutil::ReadFile(copy))["Id"], "Golden");

    CommandDeploymentEngine failing("false", handoff);
    EXPECT_FALSE(failing.Deploy(WimSelection()).is_ok());
}

TEST(CommandDeploymentEngineTest, WithoutCommandOnlyWritesHandoff) {
    testutil::TemporaryDirectory tmp;
    const std::string handoff = tmp.Join("selection.json");
    CommandDeploymentEngine engine("", handoff);
    ASSERT_TRUE(engine.Deploy(WimSelection()).is_ok());
    EXPECT_TRUE(std::filesystem::exists(handoff));
}

} // namespace
} // namespace deployer
