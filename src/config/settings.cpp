#include "config/settings.hpp"

#include "util/json_utils.hpp"

#include <cerrno>
#include <utility>

namespace deployer::config {

namespace {

// Present-but-mistyped values are errors rather than silently ignored.
Result ReadString(const Json& j, const char* key, std::string& out) {
    const Json* v = json::FindMember(j, key);
    if (!v)
        return Result::Ok();
    if (!v->is_string())
        return Result::Fail(EINVAL, std::string(key) + " must be a string");
    out = v->get<std::string>();
    return Result::Ok();
}

} // namespace

void Settings::Reset() {
    *this = Settings{};
}

Result Settings::LoadFile(const std::string& path) {
    Json j;
    auto load = json::LoadObjectFromFile(path, j);
    if (!load.is_ok())
        return load;

    for (auto [key, out] : {std::pair{"BaseImagesRoot", &base_images_root},
                            std::pair{"CustomerImagesRoot", &customer_images_root},
                            std::pair{"CustomerConfigRoot", &customer_config_root},
                            std::pair{"DefaultCustomer", &default_customer},
                            std::pair{"IsoStagingDir", &iso_staging_dir},
                            std::pair{"InspectorCommand", &inspector_command},
                            std::pair{"LogFile", &log_file}}) {
        auto r = ReadString(j, key, *out);
        if (!r.is_ok())
            return Result::Fail(r.err, r.msg + " in " + path);
    }

    std::string level;
    auto r = ReadString(j, "LogLevel", level);
    if (!r.is_ok())
        return Result::Fail(r.err, r.msg + " in " + path);
    if (!level.empty() && !ParseLogLevel(level, log_level))
        return Result::Fail(EINVAL, "unknown LogLevel '" + level + "' in " + path);

    return Result::Ok();
}

Result Settings::Validate() const {
    if (base_images_root.empty())
        return Result::Fail(EINVAL, "BaseImagesRoot is not set");
    if (customer_images_root.empty())
        return Result::Fail(EINVAL, "CustomerImagesRoot is not set");
    if (customer_config_root.empty())
        return Result::Fail(EINVAL, "CustomerConfigRoot is not set");
    if (default_customer.empty())
        return Result::Fail(EINVAL, "DefaultCustomer is empty");
    return Result::Ok();
}

} // namespace deployer::config
