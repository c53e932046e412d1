#pragma once

#include "catalog/image_types.hpp"
#include "util/result.hpp"

#include <string>
#include <vector>

namespace deployer {

using ImageList = std::vector<ImageDescriptor>;

// Stats `path` into the descriptor's existence/size/timestamp snapshot.
// Returns the new `exists` value.
bool SnapshotFile(const std::string& path, ImageDescriptor& d);

// Walks the image shares. Layouts:
//   <base root>/Windows/<version digits>/<build>/install.esd (+ sibling .esd/.wim/.iso)
//   <customer images root>/<customer>/**/*.wim
// The scanner reports every file it finds. The catalog matches discovered
// paths against declared ones case-insensitively (NormalizeImagePath), so on
// a case-sensitive root a file is treated as declared when its path differs
// from a declared path only in case. Discovered files never suppress each
// other; a case-only id clash gets a -N suffix.
class FilesystemImageScanner {
  public:
    explicit FilesystemImageScanner(std::string customer_images_root);

    Outcome<ImageList> ScanBaseImages(const std::string& root) const;
    Outcome<ImageList> ScanCustomerImages(const std::string& customer) const;

    std::string CustomerImageDir(const std::string& customer) const;

    static std::string BaseImageId(const std::string& version,
                                   const std::string& build,
                                   const std::string& stem = {});

  private:
    std::string customer_images_root_;
};

} // namespace deployer
