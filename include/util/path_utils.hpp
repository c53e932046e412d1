#pragma once

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string>
#include <string_view>

namespace deployer {

inline std::string ToLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

inline bool EqualsIgnoreCase(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    }
    return true;
}

// Lowercased extension with the leading dot (".wim"), empty if none.
inline std::string ExtensionLower(const std::filesystem::path& p) {
    return ToLower(p.extension().string());
}

// Normalize an image path for identity comparison:
// - backslashes become slashes
// - duplicate slashes collapse
// - trailing slash is dropped
// - case is folded (image shares are case-insensitive)
inline std::string NormalizeImagePath(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    bool prev_slash = false;
    for (char c : s) {
        const bool slash = (c == '/' || c == '\\');
        if (slash && prev_slash) continue;
        out.push_back(slash ? '/' : static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        prev_slash = slash;
    }
    while (out.size() > 1 && out.back() == '/') out.pop_back();
    return out;
}

inline bool SameImagePath(std::string_view a, std::string_view b) {
    if (a.empty() || b.empty()) return false;
    return NormalizeImagePath(a) == NormalizeImagePath(b);
}

// Normalize an archive entry path to a clean relative form:
// - strip leading "./"
// - strip leading "/"
// - collapse duplicate slashes
inline std::string NormalizeArchivePath(std::string s) {
    while (s.rfind("./", 0) == 0) s.erase(0, 2);
    while (!s.empty() && s.front() == '/') s.erase(0, 1);

    std::string out;
    out.reserve(s.size());
    bool prev_slash = false;
    for (char c : s) {
        const bool slash = (c == '/');
        if (slash && prev_slash) continue;
        out.push_back(c);
        prev_slash = slash;
    }
    return out;
}

// Resolves `p` against `base` unless it is already absolute.
inline std::string ResolveAgainst(const std::string& base, const std::string& p) {
    if (p.empty()) return p;
    std::string unified = p;
    std::replace(unified.begin(), unified.end(), '\\', '/');
    const std::filesystem::path path(unified);
    if (path.is_absolute() || base.empty()) return path.lexically_normal().string();
    return (std::filesystem::path(base) / path).lexically_normal().string();
}

} // namespace deployer
