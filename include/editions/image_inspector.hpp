#pragma once

#include "catalog/image_types.hpp"

#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace deployer {

// Lists the editions stored in a WIM/ESD file.
class IImageInspector {
  public:
    virtual ~IImageInspector() = default;
    virtual std::expected<std::vector<EditionOption>, std::string>
    ListEditions(const std::string& image_path) const = 0;
};

// "x86_64"/"amd64" -> "x64", "aarch64" -> "arm64", "i386".."i686" -> "x86".
std::string NormalizeArchitecture(std::string_view arch);

// Parses `wimlib-imagex info` and DISM /Get-WimInfo style "Key : Value"
// output. Lines before the first "Index" belong to the container and are
// ignored. Blocks without a positive index are dropped.
std::vector<EditionOption> ParseWimInfoOutput(std::string_view text);

// Runs "<command> '<image>'" and parses its output.
class CommandImageInspector final : public IImageInspector {
  public:
    explicit CommandImageInspector(std::string command);

    std::expected<std::vector<EditionOption>, std::string>
    ListEditions(const std::string& image_path) const override;

  private:
    std::string command_;
};

} // namespace deployer
