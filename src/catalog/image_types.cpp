#include "catalog/image_types.hpp"

#include "util/path_utils.hpp"

#include <cmath>

namespace deployer {

const char* ToString(ImageKind kind) {
    switch (kind) {
        case ImageKind::WIM: return "WIM";
        case ImageKind::FFU: return "FFU";
        case ImageKind::ESD: return "ESD";
        case ImageKind::ISO: return "ISO";
    }
    return "WIM";
}

std::optional<ImageKind> KindFromExtension(std::string_view ext) {
    const std::string e = ToLower(ext);
    if (e == ".wim") return ImageKind::WIM;
    if (e == ".ffu") return ImageKind::FFU;
    if (e == ".esd") return ImageKind::ESD;
    if (e == ".iso") return ImageKind::ISO;
    return std::nullopt;
}

const char* ToString(ImageSource source) {
    switch (source) {
        case ImageSource::WimSection:    return "WIMImages";
        case ImageSource::FfuSection:    return "FFUImages";
        case ImageSource::LegacySection: return "CustomerImages";
        case ImageSource::CustomerScan:  return "customer scan";
        case ImageSource::BaseScan:      return "base scan";
        case ImageSource::DefaultList:   return "default list";
        case ImageSource::BaseOverride:  return "baseImages";
    }
    return "unknown";
}

double BytesToRoundedGiB(std::uintmax_t bytes) {
    const double gib = static_cast<double>(bytes) / (1024.0 * 1024.0 * 1024.0);
    return std::round(gib * 100.0) / 100.0;
}

} // namespace deployer
