#include "util/json_utils.hpp"

#include "util/path_utils.hpp"

#include <cctype>
#include <cerrno>
#include <charconv>
#include <fstream>
#include <unordered_map>

namespace deployer::json {

namespace {

bool StartsLower(const std::string& s) {
    return !s.empty() && std::islower(static_cast<unsigned char>(s.front()));
}

// Index into `spellings` of the spelling to keep.
size_t PickSpelling(const std::vector<std::string>& spellings,
                    const std::vector<std::string>& canonical) {
    for (const auto& c : canonical) {
        for (size_t i = 0; i < spellings.size(); ++i) {
            if (spellings[i] == c) return i;
        }
    }
    for (size_t i = 0; i < spellings.size(); ++i) {
        if (StartsLower(spellings[i])) return i;
    }
    return 0;
}

void CanonicalizeAt(Json& j,
                    const std::string& where,
                    const std::vector<std::string>& canonical,
                    std::vector<std::string>& dropped) {
    if (j.is_array()) {
        for (size_t i = 0; i < j.size(); ++i) {
            CanonicalizeAt(j[i], where + "[" + std::to_string(i) + "]", canonical, dropped);
        }
        return;
    }
    if (!j.is_object()) return;

    std::vector<std::string> order;
    std::unordered_map<std::string, std::vector<std::string>> groups;
    for (const auto& [key, val] : j.items()) {
        (void)val;
        const std::string folded = ToLower(key);
        auto& g = groups[folded];
        if (g.empty()) order.push_back(folded);
        g.push_back(key);
    }

    if (order.size() != j.size()) {
        Json rebuilt = Json::object();
        for (const auto& folded : order) {
            const auto& spellings = groups[folded];
            const size_t keep = PickSpelling(spellings, canonical);
            for (size_t i = 0; i < spellings.size(); ++i) {
                if (i != keep) dropped.push_back(where.empty() ? spellings[i] : where + "." + spellings[i]);
            }
            rebuilt[spellings[keep]] = std::move(j[spellings[keep]]);
        }
        j = std::move(rebuilt);
    }

    for (auto& [key, val] : j.items()) {
        CanonicalizeAt(val, where.empty() ? key : where + "." + key, canonical, dropped);
    }
}

} // namespace

Result LoadObjectFromFile(const std::string& path, Json& out) {
    std::ifstream is(path);
    if (!is.good()) {
        return Result::Fail(ENOENT, "cannot open " + path);
    }

    try {
        out = Json::parse(is);
    } catch (const std::exception& e) {
        return Result::Fail(EINVAL, "invalid JSON in " + path + ": " + e.what());
    }

    if (!out.is_object()) {
        return Result::Fail(EINVAL, "root must be JSON object: " + path);
    }

    return Result::Ok();
}

void CanonicalizeKeys(Json& j,
                      const std::vector<std::string>& canonical,
                      std::vector<std::string>& dropped) {
    CanonicalizeAt(j, "", canonical, dropped);
}

const Json* FindMember(const Json& j, std::string_view key) {
    if (!j.is_object()) return nullptr;
    auto exact = j.find(std::string(key));
    if (exact != j.end()) return &*exact;
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (EqualsIgnoreCase(it.key(), key)) return &*it;
    }
    return nullptr;
}

std::optional<std::string> GetString(const Json& j, std::string_view key) {
    const Json* v = FindMember(j, key);
    if (!v || !v->is_string()) return std::nullopt;
    return v->get<std::string>();
}

std::optional<bool> GetBool(const Json& j, std::string_view key) {
    const Json* v = FindMember(j, key);
    if (!v) return std::nullopt;
    if (v->is_boolean()) return v->get<bool>();
    if (v->is_string()) {
        const std::string s = ToLower(v->get<std::string>());
        if (s == "true") return true;
        if (s == "false") return false;
    }
    return std::nullopt;
}

std::optional<std::int64_t> GetInt(const Json& j, std::string_view key) {
    const Json* v = FindMember(j, key);
    if (!v) return std::nullopt;
    if (v->is_number_integer()) return v->get<std::int64_t>();
    if (v->is_string()) {
        const std::string s = v->get<std::string>();
        std::int64_t out{};
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
        if (ec == std::errc() && ptr == s.data() + s.size()) return out;
    }
    return std::nullopt;
}

std::optional<std::string> GetFirstString(const Json& j, std::initializer_list<std::string_view> keys) {
    for (auto key : keys) {
        if (auto v = GetString(j, key); v && !v->empty()) return v;
    }
    return std::nullopt;
}

} // namespace deployer::json
