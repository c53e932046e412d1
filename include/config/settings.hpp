#pragma once

#include "util/logger.hpp"
#include "util/result.hpp"

#include <string>

namespace deployer::config {

inline constexpr const char* kDefaultSettingsPath = "/etc/pe-deployer/deployer.json";

// Tool-level settings. Storage roots are injected so the core can run against
// any mounted share or a temporary directory.
struct Settings {
    std::string base_images_root;
    std::string customer_images_root;
    std::string customer_config_root;
    std::string default_customer = "Default";
    std::string iso_staging_dir = "/tmp";
    std::string inspector_command = "wimlib-imagex info";
    LogLevel log_level = LogLevel::Info;
    std::string log_file;

    void Reset();

    // Fields absent from the file keep their current values.
    Result LoadFile(const std::string& path);

    // Empty roots are an error; callers validate after applying CLI overrides.
    Result Validate() const;
};

} // namespace deployer::config
