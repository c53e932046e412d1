#pragma once

#include "catalog/image_types.hpp"
#include "editions/image_inspector.hpp"
#include "util/result.hpp"

#include <expected>
#include <memory>
#include <string>
#include <vector>

namespace deployer {

struct IsoMount {
    std::string iso_path;
    std::string mount_point;
    // sources/install.wim or sources/install.esd inside the mount.
    std::string install_image_path;
};

struct IsoInspection {
    IsoMount mount;
    std::vector<EditionOption> editions;
};

// Mounts an ISO and reports the editions of its install image. A successful
// MountAndInspect leaves the ISO mounted; the caller owns the Dismount.
class IIsoInspector {
  public:
    virtual ~IIsoInspector() = default;
    virtual std::expected<IsoInspection, std::string> MountAndInspect(const std::string& iso_path) const = 0;
    virtual Result Dismount(const IsoMount& mount) const = 0;
};

// Stages sources/install.{wim,esd} out of the ISO with libarchive into a
// private directory under `staging_dir`; that directory is the mount point.
class ArchiveIsoInspector final : public IIsoInspector {
  public:
    ArchiveIsoInspector(std::string staging_dir, std::shared_ptr<const IImageInspector> image_inspector);

    std::expected<IsoInspection, std::string> MountAndInspect(const std::string& iso_path) const override;
    Result Dismount(const IsoMount& mount) const override;

  private:
    Result StageInstallImage(const std::string& iso_path,
                             const std::string& dest_dir,
                             std::string& out_image) const;

    std::string staging_dir_;
    std::shared_ptr<const IImageInspector> image_inspector_;
};

} // namespace deployer
