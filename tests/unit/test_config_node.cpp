/**
 * @file test_config_node.cpp
 * @brief Unit tests for configuration trees and path addressing
 */

#include <gtest/gtest.h>
#include <configs/decoder/config_node.hpp>

#include <cmath>
#include <limits>
#include <string>
#include <variant>
#include <vector>

using namespace configs::decoder;
using configs::common::ErrorKind;

namespace {

ConfigNode sample_tree() {
    ConfigNode::Object server;
    server.emplace("host", ConfigNode::string("localhost"));
    server.emplace("port", ConfigNode::integer(8080));
    server.emplace("tags", ConfigNode::sequence({ConfigNode::string("a"), ConfigNode::string("b")}));
    server.emplace("proxy", ConfigNode::null());

    ConfigNode::Object root;
    root.emplace("server", ConfigNode::object(std::move(server)));
    root.emplace("a.b", ConfigNode::integer(1));
    root.emplace("name", ConfigNode::string("app"));
    return ConfigNode::object(std::move(root));
}

}  // namespace

// ============================================================================
// ConfigNode Tests
// ============================================================================

class ConfigNodeTest : public ::testing::Test {};

TEST_F(ConfigNodeTest, DefaultIsNull) {
    ConfigNode node;
    EXPECT_TRUE(node.is_null());
    EXPECT_EQ(node.type(), NodeType::NULL_VALUE);
    EXPECT_EQ(node.size(), 0u);
    EXPECT_EQ(node.scalar_text(), "null");
}

TEST_F(ConfigNodeTest, ScalarTypes) {
    EXPECT_EQ(ConfigNode::boolean(true).type(), NodeType::BOOLEAN);
    EXPECT_EQ(ConfigNode::integer(1).type(), NodeType::INTEGER);
    EXPECT_EQ(ConfigNode::number(1.5).type(), NodeType::DOUBLE);
    EXPECT_EQ(ConfigNode::string("x").type(), NodeType::STRING);
    EXPECT_TRUE(ConfigNode::string("x").is_scalar());
    EXPECT_FALSE(ConfigNode::sequence({}).is_scalar());
}

TEST_F(ConfigNodeTest, RawAccessorTypeMismatchThrows) {
    EXPECT_THROW((void)ConfigNode::string("1").as_int(), std::bad_variant_access);
    EXPECT_THROW((void)ConfigNode::null().as_bool(), std::bad_variant_access);
    EXPECT_THROW((void)ConfigNode::integer(1).fields(), std::bad_variant_access);
}

TEST_F(ConfigNodeTest, ScalarText) {
    EXPECT_EQ(ConfigNode::boolean(false).scalar_text(), "false");
    EXPECT_EQ(ConfigNode::integer(-42).scalar_text(), "-42");
    EXPECT_EQ(ConfigNode::number(1.5).scalar_text(), "1.5");
    EXPECT_EQ(ConfigNode::number(3.0).scalar_text(), "3.0");
    EXPECT_EQ(ConfigNode::number(std::numeric_limits<double>::infinity()).scalar_text(),
              "Infinity");
    EXPECT_EQ(ConfigNode::number(std::nan("")).scalar_text(), "NaN");
    EXPECT_THROW((void)ConfigNode::object({}).scalar_text(), std::logic_error);
}

TEST_F(ConfigNodeTest, ObjectMembers) {
    auto tree = sample_tree();
    EXPECT_TRUE(tree.is_object());
    EXPECT_EQ(tree.size(), 3u);
    EXPECT_TRUE(tree.contains("server"));
    EXPECT_FALSE(tree.contains("client"));
    EXPECT_EQ(tree.keys(), (std::vector<std::string>{"a.b", "name", "server"}));
    EXPECT_EQ(ConfigNode::integer(1).find("x"), nullptr);
}

TEST_F(ConfigNodeTest, StructuralEquality) {
    EXPECT_EQ(sample_tree(), sample_tree());
    EXPECT_EQ(ConfigNode::null(), ConfigNode());
    EXPECT_FALSE(ConfigNode::integer(1) == ConfigNode::number(1.0));
    EXPECT_FALSE(ConfigNode::string("a") == ConfigNode::string("b"));
}

TEST_F(ConfigNodeTest, CopiesShareStorage) {
    auto tree = sample_tree();
    ConfigNode copy = tree;
    EXPECT_EQ(&copy.fields(), &tree.fields());
}

// ============================================================================
// Path Tests
// ============================================================================

class PathTest : public ::testing::Test {};

TEST_F(PathTest, SplitSimple) {
    EXPECT_EQ(split_path("a.b.c").value(), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(split_path("single").value(), (std::vector<std::string>{"single"}));
}

TEST_F(PathTest, SplitQuoted) {
    EXPECT_EQ(split_path("\"a.b\".c").value(), (std::vector<std::string>{"a.b", "c"}));
    EXPECT_EQ(split_path("x.\"\"").value(), (std::vector<std::string>{"x", ""}));
}

TEST_F(PathTest, SplitMalformed) {
    EXPECT_EQ(split_path("").kind(), ErrorKind::BAD_PATH);
    EXPECT_EQ(split_path("a..b").kind(), ErrorKind::BAD_PATH);
    EXPECT_EQ(split_path(".a").kind(), ErrorKind::BAD_PATH);
    EXPECT_EQ(split_path("a.").kind(), ErrorKind::BAD_PATH);
    EXPECT_EQ(split_path("\"open").kind(), ErrorKind::BAD_PATH);
}

TEST_F(PathTest, JoinQuotesSpecialKeys) {
    EXPECT_EQ(join_path("", "a"), "a");
    EXPECT_EQ(join_path("a", "b"), "a.b");
    EXPECT_EQ(join_path("a", "b.c"), "a.\"b.c\"");
    EXPECT_EQ(join_path("a", "first-name"), "a.first-name");
    EXPECT_EQ(element_path("hosts", 3), "hosts[3]");
}

TEST_F(PathTest, JoinThenSplitRecoversKey) {
    auto joined = join_path("root", "x.y");
    EXPECT_EQ(split_path(joined).value(), (std::vector<std::string>{"root", "x.y"}));
}

TEST_F(PathTest, Resolve) {
    auto tree = sample_tree();
    EXPECT_EQ(resolve_path(tree, "server.port").value(), ConfigNode::integer(8080));
    EXPECT_EQ(resolve_path(tree, "\"a.b\"").value(), ConfigNode::integer(1));
    EXPECT_TRUE(has_path(tree, "server.tags"));
    EXPECT_FALSE(has_path(tree, "server.user"));
}

TEST_F(PathTest, ResolveAbsentIsMissingWithFullPath) {
    auto r = resolve_path(sample_tree(), "server.user.name");
    ASSERT_EQ(r.kind(), ErrorKind::MISSING);
    EXPECT_EQ(r.error().path(), "server.user.name");
}

TEST_F(PathTest, ResolveNullIsMissing) {
    auto r = resolve_path(sample_tree(), "server.proxy");
    EXPECT_EQ(r.kind(), ErrorKind::MISSING);
}

TEST_F(PathTest, ResolveThroughScalarIsWrongType) {
    auto r = resolve_path(sample_tree(), "name.first");
    ASSERT_EQ(r.kind(), ErrorKind::WRONG_TYPE);
    EXPECT_EQ(r.error().path(), "name");
    EXPECT_EQ(r.error().expected(), "object");
    EXPECT_EQ(r.error().actual(), "string");

    auto root = resolve_path(ConfigNode::integer(1), "a");
    EXPECT_EQ(root.error().path(), "<root>");
}

TEST_F(PathTest, ResolveMalformedIsBadPath) {
    EXPECT_EQ(resolve_path(sample_tree(), "server..port").kind(), ErrorKind::BAD_PATH);
}

TEST_F(PathTest, ShapeChecks) {
    auto tree = sample_tree();
    EXPECT_TRUE(as_object(tree, "").is_success());
    EXPECT_EQ(as_sequence(tree, "x").error().expected(), "list");
    EXPECT_EQ(as_scalar(tree, "x").kind(), ErrorKind::WRONG_TYPE);
    EXPECT_TRUE(as_scalar(ConfigNode::integer(1), "x").is_success());
}
