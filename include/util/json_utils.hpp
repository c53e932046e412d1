#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <initializer_list>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace deployer {

// Declaration order matters for configuration sections (first-declared wins),
// so documents are kept in an insertion-ordered tree.
using Json = nlohmann::ordered_json;

namespace json {

// err == ENOENT: file absent. err == EINVAL: unreadable, not JSON, or root not an object.
Result LoadObjectFromFile(const std::string& path, Json& out);

// Collapses keys that differ only by case, recursively through objects and
// arrays. The kept spelling is the first of `canonical` that matches, else a
// spelling starting with a lowercase letter, else the first in document
// order. Dropped spellings are reported as "path.Key".
void CanonicalizeKeys(Json& j,
                      const std::vector<std::string>& canonical,
                      std::vector<std::string>& dropped);

// Case-insensitive member lookup. Returns nullptr when absent or `j` is not an object.
const Json* FindMember(const Json& j, std::string_view key);

std::optional<std::string> GetString(const Json& j, std::string_view key);

// Accepts JSON booleans and the strings "true"/"false" (any case). Any other
// type counts as absent.
std::optional<bool> GetBool(const Json& j, std::string_view key);

// Accepts integers and numeric strings.
std::optional<std::int64_t> GetInt(const Json& j, std::string_view key);

// First present string among `keys`.
std::optional<std::string> GetFirstString(const Json& j, std::initializer_list<std::string_view> keys);

} // namespace json
} // namespace deployer
