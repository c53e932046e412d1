#pragma once

#include "deploy/deployment_selection.hpp"

#include <string>

namespace deployer {

inline constexpr const char* kDmiSysfsDir = "/sys/class/dmi/id";
inline constexpr const char* kUnknownDeviceField = "Unknown";

// sys_vendor, product_name and product_serial from the DMI sysfs directory.
// Fields that cannot be read (product_serial needs root) become "Unknown".
DeviceInfo ReadDeviceInfo(const std::string& dmi_dir = kDmiSysfsDir);

} // namespace deployer
