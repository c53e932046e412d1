#include "editions/image_inspector.hpp"

#include "util/logger.hpp"
#include "util/path_utils.hpp"
#include "util/process.hpp"

#include <charconv>
#include <optional>

namespace deployer {

namespace {

std::string_view Trim(std::string_view s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos)
        return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

struct Block {
    EditionOption edition;
    std::string version;
    std::string major;
    std::string minor;
    std::string build;
    std::string sp_build;

    EditionOption Finish() {
        if (version.empty() && !major.empty()) {
            version = major + "." + (minor.empty() ? "0" : minor);
            if (!build.empty()) version += "." + build;
            if (!build.empty() && !sp_build.empty()) version += "." + sp_build;
        }
        edition.version = version;
        return edition;
    }
};

std::optional<int> ParseIndex(std::string_view v) {
    int out = 0;
    auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), out);
    if (ec != std::errc() || ptr != v.data() + v.size())
        return std::nullopt;
    return out;
}

} // namespace

std::string NormalizeArchitecture(std::string_view arch) {
    const std::string a = ToLower(Trim(arch));
    if (a == "x86_64" || a == "amd64" || a == "x64")
        return "x64";
    if (a == "aarch64" || a == "arm64")
        return "arm64";
    if (a == "x86" || a == "i386" || a == "i486" || a == "i586" || a == "i686")
        return "x86";
    return std::string(Trim(arch));
}

std::vector<EditionOption> ParseWimInfoOutput(std::string_view text) {
    std::vector<EditionOption> out;
    std::optional<Block> cur;

    auto flush = [&]() {
        if (cur && cur->edition.index > 0)
            out.push_back(cur->Finish());
        cur.reset();
    };

    size_t pos = 0;
    while (pos <= text.size()) {
        const size_t eol = text.find('\n', pos);
        const std::string_view line =
            text.substr(pos, eol == std::string_view::npos ? std::string_view::npos : eol - pos);
        pos = (eol == std::string_view::npos) ? text.size() + 1 : eol + 1;

        const size_t colon = line.find(':');
        if (colon == std::string_view::npos)
            continue;
        const std::string key = ToLower(Trim(line.substr(0, colon)));
        const std::string_view value = Trim(line.substr(colon + 1));

        if (key == "index") {
            flush();
            cur.emplace();
            cur->edition.index = ParseIndex(value).value_or(0);
            continue;
        }
        if (!cur)
            continue;

        if (key == "name") {
            cur->edition.name = std::string(value);
        } else if (key == "description") {
            cur->edition.description = std::string(value);
        } else if (key == "architecture") {
            cur->edition.architecture = NormalizeArchitecture(value);
        } else if (key == "version") {
            cur->version = std::string(value);
        } else if (key == "major version") {
            cur->major = std::string(value);
        } else if (key == "minor version") {
            cur->minor = std::string(value);
        } else if (key == "build") {
            cur->build = std::string(value);
        } else if (key == "service pack build" || key == "servicepack build") {
            cur->sp_build = std::string(value);
        }
    }
    flush();
    return out;
}

CommandImageInspector::CommandImageInspector(std::string command) : command_(std::move(command)) {}

std::expected<std::vector<EditionOption>, std::string>
CommandImageInspector::ListEditions(const std::string& image_path) const {
    if (command_.empty())
        return std::unexpected("no inspector command configured");

    const std::string cmd = command_ + " " + ShellQuote(image_path) + " 2>/dev/null";
    LogDebug("Inspect: %s", cmd.c_str());

    std::string output;
    auto r = RunCommandCapture(cmd, output);
    if (!r.is_ok())
        return std::unexpected(r.msg);

    auto editions = ParseWimInfoOutput(output);
    LogDebug("Inspect: %zu edition(s) in %s", editions.size(), image_path.c_str());
    return editions;
}

} // namespace deployer
