#include "config/customer_profile.hpp"

namespace deployer::config {

namespace {

DeclaredImage ParseDeclaredImage(const std::string& key, const Json& rec) {
    DeclaredImage d;
    d.key = key;
    d.image_id = json::GetFirstString(rec, {"ImageID"});
    d.image_name = json::GetFirstString(rec, {"ImageName", "Name"});
    d.description = json::GetString(rec, "Description");
    d.path = json::GetFirstString(rec, {"FullPath", "Path"});
    d.capture_type = json::GetFirstString(rec, {"CaptureMethod", "Type"});
    if (auto idx = json::GetInt(rec, "ImageIndex"); idx && *idx > 0)
        d.image_index = static_cast<int>(*idx);
    d.active = json::GetBool(rec, "active");
    d.required_updates = json::GetBool(rec, "RequiredUpdates");
    d.apply_unattend = json::GetBool(rec, "ApplyUnattend");
    d.driver_inject = json::GetBool(rec, "DriverInject");
    return d;
}

BaseImageOverride ParseOverride(const std::string& key, const Json& rec) {
    BaseImageOverride o;
    o.key = key;
    o.image_id = json::GetFirstString(rec, {"ImageID"});
    o.display_name = json::GetFirstString(rec, {"DisplayName", "ImageName", "Name"});
    o.windows_version = json::GetFirstString(rec, {"WindowsVersion"});
    o.build_version = json::GetFirstString(rec, {"BuildVersion"});
    o.path = json::GetFirstString(rec, {"FullPath", "Path"});
    o.active = json::GetBool(rec, "active");
    return o;
}

// A section is a mapping key -> record. Arrays of records are accepted too;
// their key is the record's ImageID or its position.
template <typename T, typename ParseFn>
std::vector<T> ParseSection(const Json& doc,
                            const char* name,
                            ParseFn parse,
                            std::vector<std::string>& skipped) {
    std::vector<T> out;
    const Json* sec = json::FindMember(doc, name);
    if (!sec || sec->is_null())
        return out;

    if (sec->is_object()) {
        for (const auto& [key, rec] : sec->items()) {
            if (!rec.is_object()) {
                skipped.push_back(std::string(name) + "." + key);
                continue;
            }
            out.push_back(parse(key, rec));
        }
    } else if (sec->is_array()) {
        for (size_t i = 0; i < sec->size(); ++i) {
            const Json& rec = (*sec)[i];
            if (!rec.is_object()) {
                skipped.push_back(std::string(name) + "[" + std::to_string(i) + "]");
                continue;
            }
            const std::string key =
                json::GetFirstString(rec, {"ImageID"}).value_or(std::to_string(i));
            out.push_back(parse(key, rec));
        }
    } else {
        skipped.push_back(name);
    }
    return out;
}

} // namespace

CustomerProfile ProfileFromJson(const Json& doc, std::vector<std::string>& skipped) {
    CustomerProfile p;
    p.document = doc;
    p.wim_images = ParseSection<DeclaredImage>(doc, section::kWimImages, ParseDeclaredImage, skipped);
    p.ffu_images = ParseSection<DeclaredImage>(doc, section::kFfuImages, ParseDeclaredImage, skipped);
    p.legacy_images =
        ParseSection<DeclaredImage>(doc, section::kCustomerImages, ParseDeclaredImage, skipped);
    p.base_overrides = ParseSection<BaseImageOverride>(doc, section::kBaseImages, ParseOverride, skipped);

    if (const Json* ds = json::FindMember(doc, section::kDeploymentSettings); ds && ds->is_object()) {
        p.deployment_settings.default_required_updates = json::GetBool(*ds, "DefaultRequiredUpdates");
        p.deployment_settings.default_apply_unattend = json::GetBool(*ds, "DefaultApplyUnattend");
        p.deployment_settings.default_driver_inject = json::GetBool(*ds, "DefaultDriverInject");
    }
    return p;
}

} // namespace deployer::config
