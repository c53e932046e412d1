#include "catalog/catalog_resolver.hpp"

#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <filesystem>
#include <unordered_map>
#include <unordered_set>

namespace fs = std::filesystem;

namespace deployer {

namespace {

class FilesystemProbe final : public ImageCatalogResolver::IFileProbe {
  public:
    bool Exists(std::string_view path) const override {
        if (path.empty())
            return false;
        std::error_code ec;
        return fs::is_regular_file(fs::path(path), ec) && !ec;
    }
};

std::string IdentityKey(const ImageDescriptor& d) {
    return ToLower(d.id) + '\n' + NormalizeImagePath(d.path);
}

ImageKind InferDeclaredKind(const config::DeclaredImage& rec,
                            const std::string& path,
                            ImageSource source) {
    if (rec.capture_type) {
        const std::string t = ToLower(*rec.capture_type);
        if (t == "ffu")
            return ImageKind::FFU;
        if (t == "wim" || t == "esd")
            return ImageKind::WIM;
    }
    if (auto k = KindFromExtension(ExtensionLower(path)); k && *k != ImageKind::ISO)
        return *k == ImageKind::ESD ? ImageKind::WIM : *k;
    return source == ImageSource::FfuSection ? ImageKind::FFU : ImageKind::WIM;
}

ImageDescriptor FromDeclared(const config::DeclaredImage& rec,
                             ImageSource source,
                             const std::string& customer_image_dir) {
    ImageDescriptor d;
    d.id = rec.Id();
    d.name = rec.image_name.value_or(d.id);
    d.description = rec.description.value_or("");
    d.path = rec.path ? ResolveAgainst(customer_image_dir, *rec.path) : std::string{};
    d.kind = InferDeclaredKind(rec, d.path, source);
    d.active = rec.active.value_or(true);
    d.edition = kCustomImageEdition;
    d.required_updates = rec.required_updates;
    d.apply_unattend = rec.apply_unattend;
    d.driver_inject = rec.driver_inject;
    d.image_index = rec.image_index;
    d.source = source;
    return d;
}

void FillMissingFlags(ImageDescriptor& keep, const ImageDescriptor& other) {
    if (!keep.required_updates) keep.required_updates = other.required_updates;
    if (!keep.apply_unattend) keep.apply_unattend = other.apply_unattend;
    if (!keep.driver_inject) keep.driver_inject = other.driver_inject;
}

bool MatchesOverride(const ImageDescriptor& d,
                     const config::BaseImageOverride& ov,
                     const std::string& ov_path) {
    if (EqualsIgnoreCase(d.id, ov.Id()) || EqualsIgnoreCase(d.id, ov.key))
        return true;
    if (!ov_path.empty() && SameImagePath(d.path, ov_path))
        return true;
    return ov.display_name && EqualsIgnoreCase(d.name, *ov.display_name);
}

void Overlay(ImageDescriptor& d, const config::BaseImageOverride& ov) {
    if (ov.display_name) d.name = *ov.display_name;
    if (ov.windows_version) d.windows_version = ov.windows_version;
    if (ov.build_version) d.build_version = ov.build_version;
}

} // namespace

const std::vector<BaseImageDefault>& DefaultBaseImages() {
    // Flat layout used before the Windows/<version>/<build>/ convention.
    static const std::vector<BaseImageDefault> kDefaults = {
        {"10", "22H2", "Windows/Windows10-22H2.esd"},
        {"11", "23H2", "Windows/Windows11-23H2.esd"},
        {"11", "24H2", "Windows/Windows11-24H2.esd"},
    };
    return kDefaults;
}

std::shared_ptr<const ImageCatalogResolver::IFileProbe> ImageCatalogResolver::DefaultFileProbe() {
    static const std::shared_ptr<const IFileProbe> kDefault = std::make_shared<FilesystemProbe>();
    return kDefault;
}

ImageCatalogResolver::ImageCatalogResolver(CatalogRoots roots)
    : ImageCatalogResolver(std::move(roots), nullptr) {}

ImageCatalogResolver::ImageCatalogResolver(CatalogRoots roots,
                                           std::shared_ptr<const IFileProbe> probe,
                                           std::vector<BaseImageDefault> defaults)
    : roots_(std::move(roots)), scanner_(roots_.customer_images_root),
      probe_(probe ? std::move(probe) : DefaultFileProbe()), defaults_(std::move(defaults)) {}

Outcome<ImageList> ImageCatalogResolver::BuildCustomerCatalog(const config::CustomerProfile& profile) const {
    Outcome<ImageList> out;
    const std::string image_dir = scanner_.CustomerImageDir(profile.name);

    ImageList declared;
    std::unordered_map<std::string, size_t> index_by_id;
    // Every declared path, including conflict losers and inactive records.
    std::unordered_set<std::string> declared_paths;

    auto add_section = [&](const std::vector<config::DeclaredImage>& records, ImageSource source) {
        for (const auto& rec : records) {
            ImageDescriptor d = FromDeclared(rec, source, image_dir);
            if (d.path.empty()) {
                Note(out.diagnostics, Severity::Warn,
                     std::string(ToString(source)) + "." + rec.key + " has no FullPath/Path, skipped");
                continue;
            }
            declared_paths.insert(NormalizeImagePath(d.path));

            const std::string id_key = ToLower(d.id);
            auto it = index_by_id.find(id_key);
            if (it != index_by_id.end()) {
                ImageDescriptor& first = declared[it->second];
                if (SameImagePath(first.path, d.path))
                    FillMissingFlags(first, d);
                Note(out.diagnostics, Severity::Warn,
                     "image id '" + d.id + "' declared in both " + ToString(first.source) + " and " +
                         ToString(source) + "; keeping the " + ToString(first.source) + " declaration");
                continue;
            }

            index_by_id.emplace(id_key, declared.size());
            declared.push_back(std::move(d));
        }
    };

    add_section(profile.wim_images, ImageSource::WimSection);
    add_section(profile.ffu_images, ImageSource::FfuSection);
    add_section(profile.legacy_images, ImageSource::LegacySection);

    for (auto& d : declared) {
        (void)SnapshotFile(d.path, d);
    }

    auto scan = scanner_.ScanCustomerImages(profile.name);
    out.Append(std::move(scan.diagnostics));

    for (auto& found : scan.value) {
        if (declared_paths.contains(NormalizeImagePath(found.path))) {
            LogDebug("Discovered %s is declared in config", found.path.c_str());
            continue;
        }

        if (index_by_id.contains(ToLower(found.id))) {
            const fs::path rel = fs::path(found.path).lexically_relative(image_dir);
            std::string alt = (rel.parent_path() / rel.stem()).generic_string();
            std::string candidate = alt;
            for (int n = 2; index_by_id.contains(ToLower(candidate)); ++n)
                candidate = alt + "-" + std::to_string(n);
            LogInfo("Discovered image id '%s' already taken, using '%s'",
                    found.id.c_str(), candidate.c_str());
            found.id = candidate;
        }

        found.edition = kDiscoveredImageEdition;
        found.required_updates = false;
        found.apply_unattend = true;
        found.driver_inject = true;
        index_by_id.emplace(ToLower(found.id), declared.size());
        declared.push_back(std::move(found));
    }

    ImageList active;
    active.reserve(declared.size());
    for (auto& d : declared) {
        if (!d.active) {
            LogInfo("Image '%s' (%s) is inactive, not offered", d.id.c_str(), ToString(d.source));
            continue;
        }
        active.push_back(std::move(d));
    }

    DedupByIdentity(active, out.diagnostics);
    DropMissing(active, out.diagnostics);

    LogInfo("Customer catalog for '%s': %zu image(s)", profile.name.c_str(), active.size());
    out.value = std::move(active);
    return out;
}

Outcome<ImageList> ImageCatalogResolver::BuildBaseCatalog(const config::CustomerProfile& profile) const {
    Outcome<ImageList> out;

    auto scan = scanner_.ScanBaseImages(roots_.base_images_root);
    out.Append(std::move(scan.diagnostics));
    ImageList images = std::move(scan.value);

    for (const auto& def : defaults_) {
        const std::string id = FilesystemImageScanner::BaseImageId(def.windows_version, def.build_version);
        const std::string path = ResolveAgainst(roots_.base_images_root, def.relative_path);

        bool known = false;
        for (const auto& d : images) {
            if (EqualsIgnoreCase(d.id, id) || SameImagePath(d.path, path)) {
                known = true;
                break;
            }
        }
        if (known) {
            LogDebug("Default base image %s already found by scan", id.c_str());
            continue;
        }
        if (!probe_->Exists(path)) {
            LogDebug("Default base image %s not present at %s", id.c_str(), path.c_str());
            continue;
        }

        ImageDescriptor d;
        d.id = id;
        d.name = "Windows " + def.windows_version + " " + def.build_version;
        d.description = "Windows " + def.windows_version + " " + def.build_version + " base image";
        d.path = path;
        d.kind = KindFromExtension(ExtensionLower(path)).value_or(ImageKind::ESD);
        d.windows_version = def.windows_version;
        d.build_version = def.build_version;
        d.source = ImageSource::DefaultList;
        (void)SnapshotFile(path, d);
        d.exists = true;
        images.push_back(std::move(d));
    }

    if (!profile.base_overrides.empty()) {
        images = ApplyBaseOverrides(images, profile.base_overrides, out.diagnostics);
    }

    DedupByIdentity(images, out.diagnostics);
    DropMissing(images, out.diagnostics);

    LogInfo("Base catalog for '%s': %zu image(s)", profile.name.c_str(), images.size());
    out.value = std::move(images);
    return out;
}

ImageList ImageCatalogResolver::ApplyBaseOverrides(const ImageList& images,
                                                   const std::vector<config::BaseImageOverride>& overrides,
                                                   std::vector<Diagnostic>& diags) const {
    ImageList kept;
    for (const auto& ov : overrides) {
        if (ov.active && !*ov.active) {
            LogInfo("baseImages.%s is inactive, skipped", ov.key.c_str());
            continue;
        }

        const std::string ov_path = ov.path ? ResolveAgainst(roots_.base_images_root, *ov.path) : std::string{};

        const ImageDescriptor* match = nullptr;
        for (const auto& d : images) {
            if (MatchesOverride(d, ov, ov_path)) {
                match = &d;
                break;
            }
        }

        if (match) {
            ImageDescriptor d = *match;
            Overlay(d, ov);
            LogInfo("baseImages.%s keeps %s (%s)", ov.key.c_str(), d.id.c_str(), d.path.c_str());
            kept.push_back(std::move(d));
            continue;
        }

        if (ov_path.empty() || !probe_->Exists(ov_path)) {
            Note(diags, Severity::Warn,
                 "baseImages." + ov.key + " matches no base image and " +
                     (ov_path.empty() ? std::string("declares no path") : ov_path + " does not exist") +
                     "; dropped");
            continue;
        }

        const auto kind = KindFromExtension(ExtensionLower(ov_path));
        if (!kind || *kind == ImageKind::FFU) {
            Note(diags, Severity::Warn,
                 "baseImages." + ov.key + " path " + ov_path + " is not an ESD/WIM/ISO image; dropped");
            continue;
        }

        ImageDescriptor d;
        d.id = ov.Id();
        d.name = ov.display_name.value_or(ov.key);
        d.description = "Configured base image";
        d.path = ov_path;
        d.kind = *kind;
        d.windows_version = ov.windows_version;
        d.build_version = ov.build_version;
        d.source = ImageSource::BaseOverride;
        (void)SnapshotFile(ov_path, d);
        d.exists = true;
        LogInfo("baseImages.%s synthesized from %s", ov.key.c_str(), ov_path.c_str());
        kept.push_back(std::move(d));
    }
    return kept;
}

void ImageCatalogResolver::DedupByIdentity(ImageList& images, std::vector<Diagnostic>& diags) {
    std::unordered_set<std::string> seen;
    ImageList unique;
    unique.reserve(images.size());
    for (auto& d : images) {
        if (!seen.insert(IdentityKey(d)).second) {
            Note(diags, Severity::Info,
                 "duplicate image '" + d.id + "' at " + d.path + " from " + ToString(d.source) + " dropped");
            continue;
        }
        unique.push_back(std::move(d));
    }
    images = std::move(unique);
}

void ImageCatalogResolver::DropMissing(ImageList& images, std::vector<Diagnostic>& diags) const {
    ImageList present;
    present.reserve(images.size());
    for (auto& d : images) {
        d.exists = probe_->Exists(d.path);
        if (!d.exists) {
            Note(diags, Severity::Warn, "image '" + d.id + "' not found at " + d.path + ", not offered");
            continue;
        }
        present.push_back(std::move(d));
    }
    images = std::move(present);
}

} // namespace deployer
