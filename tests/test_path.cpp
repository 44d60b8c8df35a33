/**
 * @file test_path.cpp
 * @brief Tests for Path construction, dot notation and command-line paths
 *
 * @copyright (c) 2026. MIT License.
 */

#include <gtest/gtest.h>
#include "pathmap/Path.hpp"

using namespace pathmap;

// ============================================================================
// Construction
// ============================================================================

TEST(PathTest, DefaultIsEmptyRoot) {
    Path p;
    EXPECT_TRUE(p.valid());
    EXPECT_TRUE(p.empty());
    EXPECT_EQ(p.raw(), Value::array());
}

TEST(PathTest, FromKeys) {
    Path p{"db", "host"};
    EXPECT_TRUE(p.valid());
    EXPECT_EQ(p.size(), 2u);
    EXPECT_EQ(p.keys(), Keys({"db", "host"}));
    EXPECT_EQ(p.raw(), Value({"db", "host"}));
}

TEST(PathTest, FromVector) {
    Keys keys = {"a", "b", "c"};
    Path p(keys);
    EXPECT_TRUE(p.valid());
    EXPECT_EQ(p.keys(), keys);
}

TEST(PathTest, FromArrayValue) {
    Path p(Value::parse(R"(["x", "y"])"));
    EXPECT_TRUE(p.valid());
    EXPECT_EQ(p.keys(), Keys({"x", "y"}));
}

TEST(PathTest, FromEmptyArrayValue) {
    Path p(Value::array());
    EXPECT_TRUE(p.valid());
    EXPECT_TRUE(p.empty());
}

TEST(PathTest, NonArrayValueIsInvalid) {
    for (const Value& raw : {Value("a.b"), Value(1), Value(nullptr), Value::object()}) {
        Path p(raw);
        EXPECT_FALSE(p.valid()) << raw.dump();
        EXPECT_TRUE(p.keys().empty());
        EXPECT_EQ(p.raw(), raw);
    }
}

TEST(PathTest, NonStringElementIsInvalid) {
    Value raw = Value::parse(R"(["a", 2, "c"])");
    Path p(raw);
    EXPECT_FALSE(p.valid());
    EXPECT_TRUE(p.keys().empty());
    EXPECT_EQ(p.raw(), raw);
}

TEST(PathTest, KeysMayContainDots) {
    Path p{"example.com", "port"};
    EXPECT_EQ(p.size(), 2u);
    EXPECT_EQ(p.keys()[0], "example.com");
}

TEST(PathTest, Equality) {
    EXPECT_EQ(Path({"a", "b"}), Path(Value::parse(R"(["a", "b"])")));
    EXPECT_NE(Path({"a"}), Path({"b"}));
    EXPECT_NE(Path(Value(1)), Path(Value(2)));
}

// ============================================================================
// Dot notation
// ============================================================================

TEST(DotPathTest, Split) {
    EXPECT_EQ(split_dot_path("database.host"), std::vector<std::string>({"database", "host"}));
    EXPECT_EQ(split_dot_path("single"), std::vector<std::string>({"single"}));
    EXPECT_TRUE(split_dot_path("").empty());
    EXPECT_EQ(split_dot_path("a..b"), std::vector<std::string>({"a", "", "b"}));
}

TEST(DotPathTest, Join) {
    EXPECT_EQ(join_dot_path({"a", "b", "c"}), "a.b.c");
    EXPECT_EQ(join_dot_path({}), "");
    EXPECT_EQ(join_dot_path({"only"}), "only");
}

TEST(DotPathTest, ParseDot) {
    Path p = Path::parse_dot("server.http.port");
    EXPECT_TRUE(p.valid());
    EXPECT_EQ(p.keys(), Keys({"server", "http", "port"}));
    EXPECT_EQ(p.to_dot(), "server.http.port");
}

TEST(DotPathTest, ParseDotEmptyIsRoot) {
    Path p = Path::parse_dot("");
    EXPECT_TRUE(p.valid());
    EXPECT_TRUE(p.empty());
}

TEST(DotPathTest, EmptySegmentsAreInvalid) {
    for (const char* text : {"a..b", ".a", "a.", "."}) {
        Path p = Path::parse_dot(text);
        EXPECT_FALSE(p.valid()) << text;
        EXPECT_EQ(p.raw(), text);
    }
}

// ============================================================================
// Command-line paths
// ============================================================================

TEST(PathArgTest, DotNotation) {
    EXPECT_EQ(parse_path_arg("a.b").keys(), Keys({"a", "b"}));
}

TEST(PathArgTest, JsonArray) {
    Path p = parse_path_arg(R"(["example.com", "port"])");
    EXPECT_TRUE(p.valid());
    EXPECT_EQ(p.keys(), Keys({"example.com", "port"}));
}

TEST(PathArgTest, EmptyJsonArrayIsRoot) {
    Path p = parse_path_arg("[]");
    EXPECT_TRUE(p.valid());
    EXPECT_TRUE(p.empty());
}

TEST(PathArgTest, MalformedJsonIsInvalid) {
    Path p = parse_path_arg("[\"a\"");
    EXPECT_FALSE(p.valid());
    EXPECT_EQ(p.raw(), "[\"a\"");
}

TEST(PathArgTest, NonStringElementIsInvalid) {
    Path p = parse_path_arg("[1, 2]");
    EXPECT_FALSE(p.valid());
    EXPECT_EQ(p.raw(), Value({1, 2}));
}
