#include "editions/edition_resolver.hpp"

#include "util/logger.hpp"

namespace deployer {

EditionResolver::EditionResolver(std::shared_ptr<const IImageInspector> image_inspector,
                                 std::shared_ptr<const IIsoInspector> iso_inspector)
    : image_inspector_(std::move(image_inspector)), iso_inspector_(std::move(iso_inspector)) {}

std::vector<EditionOption> EditionResolver::FallbackEditions(std::string_view version) {
    return {
        EditionOption{.index = 4,
                      .name = "Windows Enterprise",
                      .description = "Windows Enterprise",
                      .architecture = "x64",
                      .version = std::string(version)},
        EditionOption{.index = 6,
                      .name = "Windows Pro",
                      .description = "Windows Pro",
                      .architecture = "x64",
                      .version = std::string(version)},
    };
}

Outcome<EditionSet> EditionResolver::ResolveEditions(const std::string& source_path,
                                                     ImageKind kind,
                                                     std::string_view version_hint) const {
    switch (kind) {
        case ImageKind::ISO:
            return ResolveIso(source_path);
        case ImageKind::ESD:
        case ImageKind::WIM:
            return ResolveImageFile(source_path, version_hint);
        case ImageKind::FFU:
            break;
    }

    Outcome<EditionSet> out;
    out.value.install_image_path = source_path;
    LogDebug("FFU %s is single-edition, nothing to resolve", source_path.c_str());
    return out;
}

Outcome<EditionSet> EditionResolver::ResolveImageFile(const std::string& image_path,
                                                      std::string_view version_hint) const {
    Outcome<EditionSet> out;
    out.value.install_image_path = image_path;

    if (image_inspector_) {
        auto editions = image_inspector_->ListEditions(image_path);
        if (editions) {
            out.value.editions = std::move(*editions);
        } else {
            Note(out.diagnostics, Severity::Warn, "edition query for " + image_path + " failed: " + editions.error());
        }
    } else {
        Note(out.diagnostics, Severity::Warn, "no image inspector configured for " + image_path);
    }

    if (out.value.editions.empty()) {
        Note(out.diagnostics, Severity::Warn,
             "no editions reported for " + image_path + ", offering Enterprise (4) and Pro (6)");
        out.value.editions = FallbackEditions(version_hint);
        out.value.used_fallback = true;
    }
    return out;
}

Outcome<EditionSet> EditionResolver::ResolveIso(const std::string& iso_path) const {
    Outcome<EditionSet> out;
    if (!iso_inspector_) {
        Note(out.diagnostics, Severity::Warn, "no ISO inspector configured for " + iso_path);
        return out;
    }

    auto inspection = iso_inspector_->MountAndInspect(iso_path);
    if (!inspection) {
        Note(out.diagnostics, Severity::Warn, "cannot mount " + iso_path + ": " + inspection.error());
        return out;
    }

    IsoMountLease lease(iso_inspector_, std::move(inspection->mount));
    if (inspection->editions.empty()) {
        Note(out.diagnostics, Severity::Warn, "no editions found in " + iso_path + ", releasing it");
        auto r = lease.Release();
        if (!r.is_ok())
            Note(out.diagnostics, Severity::Error, "release of " + iso_path + " failed: " + r.msg);
        return out;
    }

    out.value.install_image_path = lease.Mount().install_image_path;
    out.value.editions = std::move(inspection->editions);
    out.value.mount = std::move(lease);
    LogInfo("ISO %s: %zu edition(s) in %s",
            iso_path.c_str(),
            out.value.editions.size(),
            out.value.install_image_path.c_str());
    return out;
}

} // namespace deployer
