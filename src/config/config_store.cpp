#include "config/config_store.hpp"

#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <algorithm>
#include <cerrno>
#include <filesystem>

namespace fs = std::filesystem;

namespace deployer::config {

namespace {

const std::vector<std::string>& CanonicalSpellings() {
    static const std::vector<std::string> kSpellings = {
        section::kWimImages,
        section::kFfuImages,
        section::kCustomerImages,
        section::kBaseImages,
        section::kDeploymentSettings,
    };
    return kSpellings;
}

Result LoadCanonicalDocument(const std::string& path, Json& out) {
    auto r = json::LoadObjectFromFile(path, out);
    if (!r.is_ok())
        return r;

    std::vector<std::string> dropped;
    json::CanonicalizeKeys(out, CanonicalSpellings(), dropped);
    for (const auto& key : dropped) {
        LogWarn("Config %s: dropped key '%s' (differs only by case from a kept key)",
                path.c_str(), key.c_str());
    }
    return Result::Ok();
}

} // namespace

const char* ToString(ConfigErrorCode code) {
    switch (code) {
        case ConfigErrorCode::ConfigurationMissing: return "ConfigurationMissing";
        case ConfigErrorCode::ConfigurationInvalid: return "ConfigurationInvalid";
    }
    return "ConfigurationInvalid";
}

ConfigStore::ConfigStore(std::string config_root, std::string default_customer)
    : config_root_(std::move(config_root)), default_customer_(std::move(default_customer)) {}

std::string ConfigStore::ConfigPathFor(const std::string& customer) const {
    return (fs::path(config_root_) / customer / kConfigFileName).string();
}

std::expected<CustomerProfile, ConfigError>
ConfigStore::LoadCustomerConfig(const std::string& customer) const {
    std::string path = ConfigPathFor(customer);
    Json doc;
    Result customer_res = customer.empty()
                              ? Result::Fail(ENOENT, "empty customer name")
                              : LoadCanonicalDocument(path, doc);
    bool from_default = false;

    if (!customer_res.is_ok()) {
        if (customer_res.err == ENOENT) {
            LogWarn("No config for customer '%s' (%s), using %s",
                    customer.c_str(), path.c_str(), default_customer_.c_str());
        } else {
            LogWarn("%s; falling back to %s", customer_res.msg.c_str(), default_customer_.c_str());
        }

        if (EqualsIgnoreCase(customer, default_customer_)) {
            const auto code = customer_res.err == ENOENT ? ConfigErrorCode::ConfigurationMissing
                                                         : ConfigErrorCode::ConfigurationInvalid;
            LogError("%s: %s", ToString(code), customer_res.msg.c_str());
            return std::unexpected(ConfigError{code, customer_res.msg});
        }

        path = ConfigPathFor(default_customer_);
        doc = Json{};
        auto default_res = LoadCanonicalDocument(path, doc);
        if (!default_res.is_ok()) {
            const bool both_missing = customer_res.err == ENOENT && default_res.err == ENOENT;
            const auto code = both_missing ? ConfigErrorCode::ConfigurationMissing
                                           : ConfigErrorCode::ConfigurationInvalid;
            const std::string msg = customer_res.msg + "; default: " + default_res.msg;
            LogError("%s: %s", ToString(code), msg.c_str());
            return std::unexpected(ConfigError{code, msg});
        }
        from_default = true;
    }

    std::vector<std::string> skipped;
    CustomerProfile profile = ProfileFromJson(doc, skipped);
    for (const auto& s : skipped) {
        LogWarn("Config %s: skipped malformed entry %s", path.c_str(), s.c_str());
    }

    profile.name = customer.empty() ? default_customer_ : customer;
    profile.directory = (fs::path(config_root_) / profile.name).string();
    profile.source_file = path;
    profile.from_default = from_default;

    LogInfo("Loaded config for '%s' from %s: %zu WIM, %zu FFU, %zu legacy, %zu base overrides",
            profile.name.c_str(),
            path.c_str(),
            profile.wim_images.size(),
            profile.ffu_images.size(),
            profile.legacy_images.size(),
            profile.base_overrides.size());
    return profile;
}

std::vector<std::string> ConfigStore::ListCustomers() const {
    std::vector<std::string> out;
    std::error_code ec;
    fs::directory_iterator it(config_root_, ec);
    if (ec) {
        LogWarn("Cannot list customers in %s: %s", config_root_.c_str(), ec.message().c_str());
        return out;
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec)
            break;
        const auto& entry = *it;
        std::error_code entry_ec;
        if (!entry.is_directory(entry_ec))
            continue;
        if (!fs::is_regular_file(entry.path() / kConfigFileName, entry_ec))
            continue;
        out.push_back(entry.path().filename().string());
    }
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace deployer::config
