#pragma once

#include "catalog/filesystem_scanner.hpp"
#include "catalog/image_types.hpp"
#include "config/customer_profile.hpp"
#include "util/result.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace deployer {

// Well-known base image that may sit outside the scanned layout.
struct BaseImageDefault {
    std::string windows_version;
    std::string build_version;
    std::string relative_path;  // relative to the base images root
};

const std::vector<BaseImageDefault>& DefaultBaseImages();

struct CatalogRoots {
    std::string base_images_root;
    std::string customer_images_root;
};

class ImageCatalogResolver {
  public:
    // Existence check used for default entries and the final safety filter.
    class IFileProbe {
      public:
        virtual ~IFileProbe() = default;
        virtual bool Exists(std::string_view path) const = 0;
    };

    explicit ImageCatalogResolver(CatalogRoots roots);
    ImageCatalogResolver(CatalogRoots roots,
                         std::shared_ptr<const IFileProbe> probe,
                         std::vector<BaseImageDefault> defaults = DefaultBaseImages());

    // Declared (WIMImages, FFUImages, CustomerImages) plus discovered customer
    // WIMs. Inactive and missing images are dropped.
    Outcome<ImageList> BuildCustomerCatalog(const config::CustomerProfile& profile) const;

    // Scanned base images plus present defaults, filtered by the profile's
    // baseImages overrides when it declares any.
    Outcome<ImageList> BuildBaseCatalog(const config::CustomerProfile& profile) const;

    // Keeps the first descriptor of every (id, path) pair. Case-insensitive.
    static void DedupByIdentity(ImageList& images, std::vector<Diagnostic>& diags);

  private:
    ImageList ApplyBaseOverrides(const ImageList& images,
                                 const std::vector<config::BaseImageOverride>& overrides,
                                 std::vector<Diagnostic>& diags) const;
    void DropMissing(ImageList& images, std::vector<Diagnostic>& diags) const;

    static std::shared_ptr<const IFileProbe> DefaultFileProbe();

    CatalogRoots roots_;
    FilesystemImageScanner scanner_;
    std::shared_ptr<const IFileProbe> probe_;
    std::vector<BaseImageDefault> defaults_;
};

} // namespace deployer
