/**
 * ============================================================================
 * NetGuard JSONUtils Unit Tests
 * ============================================================================
 */

#include "../../../src/Utils/JSONUtils.hpp"
#include "../../TestHelpers.hpp"

#include <gtest/gtest.h>

using namespace NetGuard;
using namespace NetGuard::Utils::JSON;

TEST(JSONUtilsTest, ParseAcceptsComments) {
    Json j;
    Error err;
    ASSERT_TRUE(Parse("{ // sensitivity\n \"decision\": { \"sensitivity\": 70 } }", j, &err)) << err.message;
    EXPECT_EQ(j["decision"]["sensitivity"].get<int>(), 70);
    EXPECT_FALSE(err.hasError());
}

TEST(JSONUtilsTest, ParseReportsOffset) {
    Json j = Json::object();
    Error err;
    EXPECT_FALSE(Parse("{\"a\": [1, 2,, 3]}", j, &err));
    EXPECT_TRUE(err.hasError());
    EXPECT_GT(err.byteOffset, 0u);
    EXPECT_TRUE(j.is_null());
}

TEST(JSONUtilsTest, ParseRejectsExcessiveDepth) {
    const std::string deep = std::string(MAX_JSON_DEPTH + 5, '[') + std::string(MAX_JSON_DEPTH + 5, ']');
    Json j;
    Error err;
    EXPECT_FALSE(Parse(deep, j, &err));
    EXPECT_NE(err.message.find("deep"), std::string::npos);
}

TEST(JSONUtilsTest, StringifyReplacesInvalidUtf8) {
    Json j = { {"body", std::string("ok\xFF")} };
    std::string out;
    ASSERT_TRUE(Stringify(j, out));
    EXPECT_NE(out.find("ok"), std::string::npos);
}

TEST(JSONUtilsTest, SaveAndLoadFile) {
    Testing::TempDir dir("json");
    const auto path = dir / "nested" / "model.json";
    const Json original = { {"version", 3}, {"terms", {"slot", "casino"}} };

    Error err;
    ASSERT_TRUE(SaveToFile(path, original, &err)) << err.message;
    EXPECT_TRUE(std::filesystem::exists(path));

    Json loaded;
    ASSERT_TRUE(LoadFromFile(path, loaded, &err)) << err.message;
    EXPECT_EQ(loaded, original);

    // no temp files left behind
    size_t files = 0;
    for (const auto& entry : std::filesystem::directory_iterator(path.parent_path())) {
        (void)entry;
        ++files;
    }
    EXPECT_EQ(files, 1u);
}

TEST(JSONUtilsTest, LoadStripsBomAndHonoursLimit) {
    Testing::TempDir dir("json");
    Testing::WriteFile(dir / "bom.json", "\xEF\xBB\xBF{\"ok\": true}");

    Json j;
    Error err;
    ASSERT_TRUE(LoadFromFile(dir / "bom.json", j, &err)) << err.message;
    EXPECT_TRUE(j["ok"].get<bool>());

    EXPECT_FALSE(LoadFromFile(dir / "bom.json", j, &err, 4));
    EXPECT_NE(err.message.find("size limit"), std::string::npos);

    EXPECT_FALSE(LoadFromFile(dir / "missing.json", j, &err));
    EXPECT_EQ(err.path, dir / "missing.json");
}
