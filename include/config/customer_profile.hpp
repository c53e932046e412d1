#pragma once

#include "util/json_utils.hpp"

#include <optional>
#include <string>
#include <vector>

namespace deployer::config {

// One record of WIMImages / FFUImages / CustomerImages. Every field keeps
// whether it was present; defaults are applied by the catalog resolver.
struct DeclaredImage {
    std::string key;
    std::optional<std::string> image_id;
    std::optional<std::string> image_name;
    std::optional<std::string> description;
    std::optional<std::string> path;          // FullPath, else Path
    std::optional<std::string> capture_type;  // CaptureMethod, else Type
    std::optional<int> image_index;
    std::optional<bool> active;
    std::optional<bool> required_updates;
    std::optional<bool> apply_unattend;
    std::optional<bool> driver_inject;

    std::string Id() const { return image_id.value_or(key); }
};

struct BaseImageOverride {
    std::string key;
    std::optional<std::string> image_id;
    std::optional<std::string> display_name;
    std::optional<std::string> windows_version;
    std::optional<std::string> build_version;
    std::optional<std::string> path;
    std::optional<bool> active;

    std::string Id() const { return image_id.value_or(key); }
};

struct DeploymentSettings {
    std::optional<bool> default_required_updates;
    std::optional<bool> default_apply_unattend;
    std::optional<bool> default_driver_inject;

    bool RequiredUpdates() const { return default_required_updates.value_or(true); }
    bool ApplyUnattend() const { return default_apply_unattend.value_or(true); }
    bool DriverInject() const { return default_driver_inject.value_or(true); }
};

struct CustomerProfile {
    std::string name;
    std::string directory;
    // Document actually read; differs from `directory` after a fallback.
    std::string source_file;
    bool from_default = false;

    std::vector<DeclaredImage> wim_images;
    std::vector<DeclaredImage> ffu_images;
    std::vector<DeclaredImage> legacy_images;
    std::vector<BaseImageOverride> base_overrides;
    DeploymentSettings deployment_settings;

    Json document;
};

namespace section {
inline constexpr const char* kWimImages = "WIMImages";
inline constexpr const char* kFfuImages = "FFUImages";
inline constexpr const char* kCustomerImages = "CustomerImages";
inline constexpr const char* kBaseImages = "baseImages";
inline constexpr const char* kDeploymentSettings = "DeploymentSettings";
} // namespace section

// Builds the typed profile from a canonicalized document. Malformed records
// (non-object values) are skipped and reported in `skipped`.
CustomerProfile ProfileFromJson(const Json& doc, std::vector<std::string>& skipped);

} // namespace deployer::config
