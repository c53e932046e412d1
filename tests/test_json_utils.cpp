#include <gtest/gtest.h>

#include "testing.hpp"
#include "util/json_utils.hpp"

#include <cerrno>

using deployer::Json;
namespace json = deployer::json;

namespace {

TEST(JsonUtilsTest, LoadObjectFromFileReportsMissingAndInvalid) {
    testutil::TemporaryDirectory tmp;
    Json j;

    auto missing = json::LoadObjectFromFile(tmp.Join("nope.json"), j);
    EXPECT_FALSE(missing.is_ok());
    EXPECT_EQ(missing.err, ENOENT);

    auto bad = json::LoadObjectFromFile(testutil::WriteFile(tmp.Join("bad.json"), "{ not json"), j);
    EXPECT_FALSE(bad.is_ok());
    EXPECT_EQ(bad.err, EINVAL);

    auto array = json::LoadObjectFromFile(testutil::WriteFile(tmp.Join("arr.json"), "[1, 2]"), j);
    EXPECT_FALSE(array.is_ok());
    EXPECT_EQ(array.err, EINVAL);

    auto ok = json::LoadObjectFromFile(testutil::WriteFile(tmp.Join("ok.json"), R"({"a": 1})"), j);
    ASSERT_TRUE(ok.is_ok()) << ok.msg;
    EXPECT_EQ(j["a"], 1);
}

TEST(JsonUtilsTest, CanonicalizeKeysPrefersCanonicalSpelling) {
    Json j = Json::parse(R"({"wimimages": {"a": {}}, "WIMImages": {"b": {}}, "Other": 1})");
    std::vector<std::string> dropped;
    json::CanonicalizeKeys(j, {"WIMImages"}, dropped);

    ASSERT_EQ(j.size(), 2u);
    ASSERT_TRUE(j.contains("WIMImages"));
    EXPECT_TRUE(j["WIMImages"].contains("b"));
    EXPECT_FALSE(j.contains("wimimages"));
    ASSERT_EQ(dropped.size(), 1u);
    EXPECT_EQ(dropped[0], "wimimages");
    EXPECT_EQ(j.begin().key(), "WIMImages");
}

TEST(JsonUtilsTest, CanonicalizeKeysPrefersLowercaseInitialOtherwise) {
    Json j = Json::parse(R"({"sec": {"Active": false, "active": true}})");
    std::vector<std::string> dropped;
    json::CanonicalizeKeys(j, {}, dropped);

    ASSERT_EQ(j["sec"].size(), 1u);
    EXPECT_EQ(j["sec"]["active"], true);
    ASSERT_EQ(dropped.size(), 1u);
    EXPECT_EQ(dropped[0], "sec.Active");
}

TEST(JsonUtilsTest, GettersAreCaseInsensitiveAndLenient) {
    Json j = Json::parse(R"({"FullPath": "/a.wim", "Active": "TRUE", "ImageIndex": "3", "Count": 7, "Empty": ""})");

    EXPECT_EQ(json::GetString(j, "fullpath").value_or(""), "/a.wim");
    EXPECT_EQ(json::GetBool(j, "active"), std::optional<bool>(true));
    EXPECT_EQ(json::GetInt(j, "imageindex"), std::optional<std::int64_t>(3));
    EXPECT_EQ(json::GetInt(j, "Count"), std::optional<std::int64_t>(7));
    EXPECT_FALSE(json::GetBool(j, "Count").has_value());
    EXPECT_FALSE(json::GetString(j, "missing").has_value());
    EXPECT_EQ(json::GetFirstString(j, {"Empty", "FullPath"}).value_or(""), "/a.wim");
}

} // namespace
