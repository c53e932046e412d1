#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace deployer {

enum class ImageKind {
    WIM,
    FFU,
    ESD,
    ISO,
};

const char* ToString(ImageKind kind);

// From a file extension (".wim", ".ESD", ...). Unknown extensions yield nullopt.
std::optional<ImageKind> KindFromExtension(std::string_view ext);

inline constexpr const char* kCustomImageEdition = "Custom Image";
inline constexpr const char* kDiscoveredImageEdition = "Discovered Image";

// Where a descriptor came from. Only used for logging and tie-breaking.
enum class ImageSource {
    WimSection,
    FfuSection,
    LegacySection,
    CustomerScan,
    BaseScan,
    DefaultList,
    BaseOverride,
};

const char* ToString(ImageSource source);

struct ImageDescriptor {
    std::string id;
    std::string name;
    std::string description;
    std::string path;
    ImageKind kind = ImageKind::WIM;
    bool active = true;
    std::string edition;

    std::optional<bool> required_updates;
    std::optional<bool> apply_unattend;
    std::optional<bool> driver_inject;
    std::optional<int> image_index;

    // Snapshots taken when the descriptor was produced.
    bool exists = false;
    double size_gib = 0.0;
    std::optional<std::chrono::system_clock::time_point> last_modified;

    std::optional<std::string> windows_version;
    std::optional<std::string> build_version;

    ImageSource source = ImageSource::BaseScan;

    bool IsCustomerImage() const {
        return edition == kCustomImageEdition || edition == kDiscoveredImageEdition;
    }
};

struct EditionOption {
    int index = 0;
    std::string name;
    std::string description;
    std::string architecture;
    std::string version;
};

// Bytes to GiB rounded to the nearest 0.01.
double BytesToRoundedGiB(std::uintmax_t bytes);

} // namespace deployer
