#include "editions/iso_inspector.hpp"

#include "io/fd.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <memory>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

namespace deployer {

namespace {

constexpr const char* kInstallWim = "sources/install.wim";
constexpr const char* kInstallEsd = "sources/install.esd";

struct ArchiveReadDeleter {
    void operator()(archive* a) const {
        if (a) archive_read_free(a);
    }
};

std::string ArchiveErr(archive* a) {
    const char* s = archive_error_string(a);
    return s ? s : "unknown libarchive error";
}

Result MakeStagingDir(const std::string& base, std::string& out_dir) {
    const fs::path base_dir = base.empty() ? fs::path("/tmp") : fs::path(base);
    std::error_code ec;
    fs::create_directories(base_dir, ec);

    std::string tmpl = (base_dir / "pe-deployer-iso-XXXXXX").string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    char* created = ::mkdtemp(buf.data());
    if (!created) {
        const int err = errno;
        return Result::Fail(err, "mkdtemp failed: " + std::string(std::strerror(err)));
    }
    out_dir = created;
    return Result::Ok();
}

} // namespace

ArchiveIsoInspector::ArchiveIsoInspector(std::string staging_dir,
                                         std::shared_ptr<const IImageInspector> image_inspector)
    : staging_dir_(std::move(staging_dir)), image_inspector_(std::move(image_inspector)) {}

Result ArchiveIsoInspector::StageInstallImage(const std::string& iso_path,
                                              const std::string& dest_dir,
                                              std::string& out_image) const {
    std::unique_ptr<archive, ArchiveReadDeleter> ar(archive_read_new());
    if (!ar) return Result::Fail(-1, "archive_read_new failed");

    archive_read_support_format_iso9660(ar.get());
    archive_read_support_format_udf(ar.get());

    if (archive_read_open_filename(ar.get(), iso_path.c_str(), 64 * 1024) != ARCHIVE_OK) {
        return Result::Fail(-1, "cannot open ISO " + iso_path + ": " + ArchiveErr(ar.get()));
    }

    archive_entry* entry = nullptr;
    while (true) {
        const int r = archive_read_next_header(ar.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r != ARCHIVE_OK && r != ARCHIVE_WARN)
            return Result::Fail(-1, "archive_read_next_header: " + ArchiveErr(ar.get()));

        const char* raw = archive_entry_pathname(entry);
        const std::string rel = ToLower(NormalizeArchivePath(raw ? raw : ""));
        if (rel != kInstallWim && rel != kInstallEsd) {
            (void)archive_read_data_skip(ar.get());
            continue;
        }

        const fs::path target = fs::path(dest_dir) / rel;
        std::error_code ec;
        fs::create_directories(target.parent_path(), ec);
        if (ec) return Result::Fail(ec.value(), "cannot create " + target.parent_path().string() + ": " + ec.message());

        Fd out;
        auto open_res = Fd::CreateForWrite(target.string(), out);
        if (!open_res.is_ok()) return open_res;

        LogInfo("Staging %s from %s", rel.c_str(), iso_path.c_str());
        if (archive_read_data_into_fd(ar.get(), out.Get()) != ARCHIVE_OK)
            return Result::Fail(-1, "extract " + rel + ": " + ArchiveErr(ar.get()));

        auto close_res = out.Close();
        if (!close_res.is_ok()) return close_res;

        out_image = target.string();
        return Result::Ok();
    }

    return Result::Fail(ENOENT, "no " + std::string(kInstallWim) + " or " + kInstallEsd + " in " + iso_path);
}

std::expected<IsoInspection, std::string>
ArchiveIsoInspector::MountAndInspect(const std::string& iso_path) const {
    IsoInspection out;
    out.mount.iso_path = iso_path;

    auto dir_res = MakeStagingDir(staging_dir_, out.mount.mount_point);
    if (!dir_res.is_ok())
        return std::unexpected(dir_res.msg);

    auto stage_res = StageInstallImage(iso_path, out.mount.mount_point, out.mount.install_image_path);
    if (!stage_res.is_ok()) {
        auto cleanup = Dismount(out.mount);
        if (!cleanup.is_ok())
            LogWarn("ISO staging cleanup: %s", cleanup.msg.c_str());
        return std::unexpected(stage_res.msg);
    }

    if (!image_inspector_) {
        LogWarn("No image inspector configured, editions of %s unknown", iso_path.c_str());
        return out;
    }

    auto editions = image_inspector_->ListEditions(out.mount.install_image_path);
    if (!editions) {
        LogWarn("Inspect %s: %s", out.mount.install_image_path.c_str(), editions.error().c_str());
        return out;
    }
    out.editions = std::move(*editions);
    return out;
}

Result ArchiveIsoInspector::Dismount(const IsoMount& mount) const {
    if (mount.mount_point.empty())
        return Result::Ok();

    std::error_code ec;
    fs::remove_all(mount.mount_point, ec);
    if (ec)
        return Result::Fail(ec.value(), "remove " + mount.mount_point + ": " + ec.message());
    return Result::Ok();
}

} // namespace deployer
