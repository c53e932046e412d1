#pragma once

#include "config/customer_profile.hpp"

#include <expected>
#include <string>
#include <vector>

namespace deployer::config {

enum class ConfigErrorCode {
    ConfigurationMissing,
    ConfigurationInvalid,
};

struct ConfigError {
    ConfigErrorCode code;
    std::string msg;
};

const char* ToString(ConfigErrorCode code);

inline constexpr const char* kConfigFileName = "Config.json";

// Loads per-customer Config.json documents from <config_root>/<customer>/.
class ConfigStore {
  public:
    ConfigStore(std::string config_root, std::string default_customer);

    std::expected<CustomerProfile, ConfigError> LoadCustomerConfig(const std::string& customer) const;

    // Customer directories that carry a Config.json, sorted by name.
    std::vector<std::string> ListCustomers() const;

    std::string ConfigPathFor(const std::string& customer) const;

  private:
    std::string config_root_;
    std::string default_customer_;
};

} // namespace deployer::config
