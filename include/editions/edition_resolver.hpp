#pragma once

#include "catalog/image_types.hpp"
#include "editions/image_inspector.hpp"
#include "editions/iso_inspector.hpp"
#include "editions/iso_mount_lease.hpp"
#include "util/result.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace deployer {

struct EditionSet {
    // Reported order; the first entry is the default choice.
    std::vector<EditionOption> editions;
    // Image the editions index into: the source itself, or the staged
    // install image of a mounted ISO.
    std::string install_image_path;
    // Held for ISO sources only.
    IsoMountLease mount;
    bool used_fallback = false;
};

class EditionResolver {
  public:
    EditionResolver(std::shared_ptr<const IImageInspector> image_inspector,
                    std::shared_ptr<const IIsoInspector> iso_inspector);

    // Never fails: inspection problems degrade to the fallback set (ESD/WIM)
    // or to an empty set (ISO, FFU) and are reported as diagnostics.
    Outcome<EditionSet> ResolveEditions(const std::string& source_path,
                                        ImageKind kind,
                                        std::string_view version_hint = {}) const;

    // Enterprise (4), then Pro (6); the only editions shipped in our ESDs.
    static std::vector<EditionOption> FallbackEditions(std::string_view version);

  private:
    Outcome<EditionSet> ResolveIso(const std::string& iso_path) const;
    Outcome<EditionSet> ResolveImageFile(const std::string& image_path, std::string_view version_hint) const;

    std::shared_ptr<const IImageInspector> image_inspector_;
    std::shared_ptr<const IIsoInspector> iso_inspector_;
};

} // namespace deployer
