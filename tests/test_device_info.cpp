#include <gtest/gtest.h>

#include "deploy/device_info.hpp"
#include "testing.hpp"

namespace {

TEST(DeviceInfoTest, ReadsDmiFields) {
    testutil::TemporaryDirectory tmp;
    testutil::WriteFile(tmp.Join("sys_vendor"), "LENOVO\n");
    testutil::WriteFile(tmp.Join("product_name"), "  21HD  \n");
    testutil::WriteFile(tmp.Join("product_serial"), "PF4XYZ12\n");

    auto info = deployer::ReadDeviceInfo(tmp.Path());
    EXPECT_EQ(info.manufacturer, "LENOVO");
    EXPECT_EQ(info.model, "21HD");
    EXPECT_EQ(info.serial_number, "PF4XYZ12");
}

TEST(DeviceInfoTest, UnreadableOrBlankFieldsAreUnknown) {
    testutil::TemporaryDirectory tmp;
    testutil::WriteFile(tmp.Join("sys_vendor"), "Dell Inc.\n");
    testutil::WriteFile(tmp.Join("product_name"), "\n");

    auto info = deployer::ReadDeviceInfo(tmp.Path());
    EXPECT_EQ(info.manufacturer, "Dell Inc.");
    EXPECT_EQ(info.model, deployer::kUnknownDeviceField);
    EXPECT_EQ(info.serial_number, deployer::kUnknownDeviceField);
}

} // namespace
