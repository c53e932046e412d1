#include "catalog/filesystem_scanner.hpp"

#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>

namespace fs = std::filesystem;

namespace deployer {

namespace {

constexpr const char* kPrimaryImageName = "install.esd";

bool IsAllDigits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

// Immediate children of `dir` matching `want_dirs`, sorted by name.
std::vector<fs::path> ListChildren(const fs::path& dir, bool want_dirs, std::vector<Diagnostic>& diags) {
    std::vector<fs::path> out;
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        Note(diags, Severity::Warn, "cannot read " + dir.string() + ": " + ec.message());
        return out;
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            Note(diags, Severity::Warn, "error while reading " + dir.string() + ": " + ec.message());
            break;
        }
        std::error_code type_ec;
        const bool is_dir = it->is_directory(type_ec);
        const bool is_file = it->is_regular_file(type_ec);
        if ((want_dirs && is_dir) || (!want_dirs && is_file))
            out.push_back(it->path());
    }
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace

bool SnapshotFile(const std::string& path, ImageDescriptor& d) {
    std::error_code ec;
    d.exists = !path.empty() && fs::is_regular_file(path, ec) && !ec;
    if (!d.exists) {
        d.size_gib = 0.0;
        d.last_modified.reset();
        return false;
    }

    const auto bytes = fs::file_size(path, ec);
    d.size_gib = ec ? 0.0 : BytesToRoundedGiB(bytes);

    const auto ftime = fs::last_write_time(path, ec);
    if (ec) {
        d.last_modified.reset();
    } else {
        d.last_modified = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
            std::chrono::file_clock::to_sys(ftime));
    }
    return true;
}

FilesystemImageScanner::FilesystemImageScanner(std::string customer_images_root)
    : customer_images_root_(std::move(customer_images_root)) {}

std::string FilesystemImageScanner::CustomerImageDir(const std::string& customer) const {
    return (fs::path(customer_images_root_) / customer).string();
}

std::string FilesystemImageScanner::BaseImageId(const std::string& version,
                                                const std::string& build,
                                                const std::string& stem) {
    std::string id = "Windows" + version + "-" + build;
    if (!stem.empty())
        id += "-" + stem;
    return id;
}

Outcome<ImageList> FilesystemImageScanner::ScanBaseImages(const std::string& root) const {
    Outcome<ImageList> out;
    const fs::path windows_dir = fs::path(root) / "Windows";

    std::error_code ec;
    if (root.empty() || !fs::is_directory(windows_dir, ec)) {
        Note(out.diagnostics, Severity::Warn, "base image directory not found: " + windows_dir.string());
        return out;
    }

    auto version_dirs = ListChildren(windows_dir, true, out.diagnostics);
    version_dirs.erase(std::remove_if(version_dirs.begin(), version_dirs.end(),
                                      [](const fs::path& p) { return !IsAllDigits(p.filename().string()); }),
                       version_dirs.end());
    std::sort(version_dirs.begin(), version_dirs.end(), [](const fs::path& a, const fs::path& b) {
        const std::string sa = a.filename().string();
        const std::string sb = b.filename().string();
        if (sa.size() != sb.size())
            return sa.size() < sb.size();
        return sa < sb;
    });

    for (const auto& version_dir : version_dirs) {
        const std::string version = version_dir.filename().string();
        for (const auto& build_dir : ListChildren(version_dir, true, out.diagnostics)) {
            const std::string build = build_dir.filename().string();

            ImageList primary;
            ImageList secondary;
            for (const auto& file : ListChildren(build_dir, false, out.diagnostics)) {
                const auto kind = KindFromExtension(ExtensionLower(file));
                if (!kind || *kind == ImageKind::FFU)
                    continue;

                const std::string filename = file.filename().string();
                const bool is_primary = EqualsIgnoreCase(filename, kPrimaryImageName);

                ImageDescriptor d;
                d.id = is_primary ? BaseImageId(version, build)
                                  : BaseImageId(version, build, file.stem().string());
                d.name = is_primary ? "Windows " + version + " " + build
                                    : "Windows " + version + " " + build + " (" + filename + ")";
                d.description = "Windows " + version + " " + build + " base image";
                d.path = file.string();
                d.kind = *kind;
                d.windows_version = version;
                d.build_version = build;
                d.source = ImageSource::BaseScan;
                if (!SnapshotFile(d.path, d)) {
                    Note(out.diagnostics, Severity::Warn, "base image vanished during scan: " + d.path);
                    continue;
                }

                (is_primary ? primary : secondary).push_back(std::move(d));
            }

            if (primary.empty() && !secondary.empty()) {
                LogDebug("No %s in %s, %zu other image(s)", kPrimaryImageName,
                         build_dir.string().c_str(), secondary.size());
            }
            for (auto& d : primary) out.value.push_back(std::move(d));
            for (auto& d : secondary) out.value.push_back(std::move(d));
        }
    }

    LogInfo("Base scan of %s: %zu image(s)", root.c_str(), out.value.size());
    return out;
}

Outcome<ImageList> FilesystemImageScanner::ScanCustomerImages(const std::string& customer) const {
    Outcome<ImageList> out;
    const fs::path dir = CustomerImageDir(customer);

    std::error_code ec;
    if (customer.empty() || !fs::is_directory(dir, ec)) {
        Note(out.diagnostics, Severity::Warn, "customer image directory not found: " + dir.string());
        return out;
    }

    std::vector<fs::path> files;
    fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        Note(out.diagnostics, Severity::Warn, "cannot read " + dir.string() + ": " + ec.message());
        return out;
    }
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            Note(out.diagnostics, Severity::Warn, "error while reading " + dir.string() + ": " + ec.message());
            break;
        }
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec))
            continue;
        if (ExtensionLower(it->path()) != ".wim")
            continue;
        files.push_back(it->path());
    }
    std::sort(files.begin(), files.end());

    for (const auto& file : files) {
        ImageDescriptor d;
        d.id = file.stem().string();
        d.name = file.stem().string();
        const fs::path rel_parent = file.parent_path().lexically_relative(dir);
        d.description = rel_parent.empty() || rel_parent == "."
                            ? "Discovered in " + customer
                            : "Discovered in " + customer + "/" + rel_parent.generic_string();
        d.path = file.string();
        d.kind = ImageKind::WIM;
        d.source = ImageSource::CustomerScan;
        if (!SnapshotFile(d.path, d)) {
            Note(out.diagnostics, Severity::Warn, "customer image vanished during scan: " + d.path);
            continue;
        }
        out.value.push_back(std::move(d));
    }

    LogInfo("Customer scan of %s: %zu WIM file(s)", dir.string().c_str(), out.value.size());
    return out;
}

} // namespace deployer
