#include "deploy/device_info.hpp"

#include "util/logger.hpp"

#include <filesystem>
#include <fstream>

namespace deployer {

namespace {

std::string Trim(std::string s) {
    const char* ws = " \t\r\n";
    const auto b = s.find_first_not_of(ws);
    if (b == std::string::npos)
        return {};
    const auto e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

std::string ReadField(const std::string& dmi_dir, const char* name) {
    const std::string path = (std::filesystem::path(dmi_dir) / name).string();
    std::ifstream is(path);
    std::string line;
    if (!is.good() || !std::getline(is, line)) {
        LogDebug("DMI field %s unreadable", path.c_str());
        return kUnknownDeviceField;
    }
    line = Trim(std::move(line));
    return line.empty() ? std::string(kUnknownDeviceField) : line;
}

} // namespace

DeviceInfo ReadDeviceInfo(const std::string& dmi_dir) {
    DeviceInfo info;
    info.manufacturer = ReadField(dmi_dir, "sys_vendor");
    info.model = ReadField(dmi_dir, "product_name");
    info.serial_number = ReadField(dmi_dir, "product_serial");
    LogInfo("Device: %s %s (serial %s)",
            info.manufacturer.c_str(),
            info.model.c_str(),
            info.serial_number.c_str());
    return info;
}

} // namespace deployer
