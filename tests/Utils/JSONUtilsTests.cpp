/*
 * StrideGraph - Architecture Threat Modeling Engine
 * Copyright (C) 2026 StrideGraph Security
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program. If not, see <https://www.gnu.org/licenses/>.
 */

#include "pch.h"
#include <gtest/gtest.h>

#include "TestHelpers.hpp"
#include "Utils/JSONUtils.hpp"

namespace JSON = StrideGraph::Utils::JSON;
using JSON::Json;
using StrideGraph::Testing::TempDir;

// ============================================================================
// Parse / Stringify
// ============================================================================

TEST(JSONUtilsTests, ParsesDocumentsWithComments) {
    Json j;
    JSON::Error err;
    ASSERT_TRUE(JSON::Parse(R"({
        // detector thresholds
        "a": 1, /* inline */ "b": [true, null]
    })", j, &err)) << err.message;
    EXPECT_EQ(j["a"], 1);
    EXPECT_TRUE(j["b"][1].is_null());
}

TEST(JSONUtilsTests, CommentsCanBeDisallowed) {
    Json j;
    JSON::ParseOptions opt;
    opt.allowComments = false;
    EXPECT_FALSE(JSON::Parse("{ // no\n \"a\": 1 }", j, nullptr, opt));
    EXPECT_TRUE(j.is_null());
}

TEST(JSONUtilsTests, ParseErrorsReportOffset) {
    Json j;
    JSON::Error err;
    EXPECT_FALSE(JSON::Parse("{\"a\": }", j, &err));
    EXPECT_TRUE(err.hasError());
    EXPECT_GT(err.byteOffset, 0u);
}

TEST(JSONUtilsTests, DepthLimitIsEnforced) {
    Json j;
    JSON::Error err;
    JSON::ParseOptions opt;
    opt.maxDepth = 3;

    EXPECT_TRUE(JSON::Parse("[[[1]]]", j, &err, opt));
    EXPECT_FALSE(JSON::Parse("[[[[1]]]]", j, &err, opt));
    EXPECT_NE(err.message.find("depth"), std::string::npos);

    // Brackets inside strings do not count
    EXPECT_TRUE(JSON::Parse(R"(["[[[[[["])", j, &err, opt));
}

TEST(JSONUtilsTests, ByteOrderMarkIsIgnored) {
    Json j;
    EXPECT_TRUE(JSON::Parse("\xEF\xBB\xBF{\"k\": \"v\"}", j));
    EXPECT_EQ(j["k"], "v");
}

TEST(JSONUtilsTests, StringifyKeepsInsertionOrder) {
    Json j = Json::object();
    j["zeta"] = 1;
    j["alpha"] = 2;

    std::string compact;
    ASSERT_TRUE(JSON::Stringify(j, compact));
    EXPECT_EQ(compact, R"({"zeta":1,"alpha":2})");

    JSON::StringifyOptions pretty;
    pretty.pretty = true;
    pretty.indentSpaces = 4;
    std::string text;
    ASSERT_TRUE(JSON::Stringify(j, text, pretty));
    EXPECT_EQ(text, "{\n    \"zeta\": 1,\n    \"alpha\": 2\n}");
}

// ============================================================================
// Files
// ============================================================================

TEST(JSONUtilsTests, SaveAndLoadFile) {
    TempDir dir("json");
    const auto path = dir.Path() / "nested" / "out.json";

    const Json j = { { "version", "v1" }, { "rules", Json::array({ 1, 2, 3 }) } };
    JSON::Error err;
    ASSERT_TRUE(JSON::SaveToFile(path, j, &err)) << err.message;
    EXPECT_FALSE(std::filesystem::exists(path.string() + ".tmp"));

    Json loaded;
    ASSERT_TRUE(JSON::LoadFromFile(path, loaded, &err)) << err.message;
    EXPECT_EQ(loaded, j);
}

TEST(JSONUtilsTests, LoadReportsMissingAndOversizedFiles) {
    TempDir dir("json");
    Json j;
    JSON::Error err;

    EXPECT_FALSE(JSON::LoadFromFile(dir.Path() / "none.json", j, &err));
    EXPECT_EQ(err.message, "file not found");
    EXPECT_EQ(err.path, dir.Path() / "none.json");

    const auto big = dir.Path() / "big.json";
    ASSERT_TRUE(JSON::SaveTextToFile(big, "[1,2,3,4,5,6,7,8,9]"));
    EXPECT_FALSE(JSON::LoadFromFile(big, j, &err, {}, 4));
    EXPECT_NE(err.message.find("size limit"), std::string::npos);
}

TEST(JSONUtilsTests, LoadAttachesPathToParseErrors) {
    TempDir dir("json");
    const auto path = dir.Path() / "bad.json";
    ASSERT_TRUE(JSON::SaveTextToFile(path, "{ \"a\": ", nullptr, false));

    Json j;
    JSON::Error err;
    EXPECT_FALSE(JSON::LoadFromFile(path, j, &err));
    EXPECT_EQ(err.path, path);
    EXPECT_TRUE(j.is_null());
}

// ============================================================================
// Paths
// ============================================================================

TEST(JSONUtilsTests, DottedPathsBecomeJsonPointers) {
    EXPECT_EQ(JSON::ToJsonPointer("a.b[0].c"), "/a/b/0/c");
    EXPECT_EQ(JSON::ToJsonPointer("severityWeights.Tampering"), "/severityWeights/Tampering");
    EXPECT_EQ(JSON::ToJsonPointer("/already/pointer"), "/already/pointer");
    EXPECT_EQ(JSON::ToJsonPointer(""), "");
}

TEST(JSONUtilsTests, TypedGettersFallBackOnMismatch) {
    const Json j = {
        { "image", { { "width", 1600 }, { "height", 900 } } },
        { "detections", Json::array({ { { "label", "db" } } }) },
    };

    EXPECT_TRUE(JSON::Contains(j, "image.width"));
    EXPECT_FALSE(JSON::Contains(j, "image.depth"));

    int width = 0;
    EXPECT_TRUE(JSON::Get(j, "image.width", width));
    EXPECT_EQ(width, 1600);

    EXPECT_EQ(JSON::GetOr<std::string>(j, "detections[0].label", "?"), "db");
    EXPECT_EQ(JSON::GetOr<std::string>(j, "detections[1].label", "?"), "?");
    EXPECT_EQ(JSON::GetOr<int>(j, "detections[0].label", -1), -1);
}
