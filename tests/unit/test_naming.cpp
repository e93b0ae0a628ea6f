/**
 * @file test_naming.cpp
 * @brief Unit tests for identifier spellings, probe lists and key lookup
 */

#include <gtest/gtest.h>
#include <configs/decoder/naming.hpp>
#include <configs/testing/property_test.hpp>

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

using namespace configs::decoder;
using namespace configs::decoder::naming;
using configs::common::ErrorKind;
using configs::testing::PropertyCheck;
using configs::testing::RandomGen;

using Strings = std::vector<std::string>;

// ============================================================================
// Word Splitting
// ============================================================================

class SplitWordsTest : public ::testing::Test {};

TEST_F(SplitWordsTest, CaseStyles) {
    EXPECT_EQ(split_words("lowerCamel"), (Strings{"lower", "camel"}));
    EXPECT_EQ(split_words("UpperCamel"), (Strings{"upper", "camel"}));
    EXPECT_EQ(split_words("lower_snake"), (Strings{"lower", "snake"}));
    EXPECT_EQ(split_words("UPPER_SNAKE"), (Strings{"upper", "snake"}));
    EXPECT_EQ(split_words("lower-hyphen"), (Strings{"lower", "hyphen"}));
}

TEST_F(SplitWordsTest, UpperCaseRuns) {
    EXPECT_EQ(split_words("UPPERThenCamel"), (Strings{"upper", "then", "camel"}));
    EXPECT_EQ(split_words("HTTPServer"), (Strings{"http", "server"}));
    EXPECT_EQ(split_words("ID"), (Strings{"id"}));
}

TEST_F(SplitWordsTest, Digits) {
    EXPECT_EQ(split_words("v2Api"), (Strings{"v2", "api"}));
    EXPECT_EQ(split_words("ipv4"), (Strings{"ipv4"}));
}

TEST_F(SplitWordsTest, SeparatorsCollapse) {
    EXPECT_EQ(split_words("__a--b_"), (Strings{"a", "b"}));
}

// ============================================================================
// Spellings
// ============================================================================

class SpellingTest : public ::testing::Test {};

TEST_F(SpellingTest, Conversions) {
    EXPECT_EQ(to_lower_hyphen("UPPERThenCamel"), "upper-then-camel");
    EXPECT_EQ(to_lower_camel("lower_snake"), "lowerSnake");
    EXPECT_EQ(to_upper_camel("lower-hyphen"), "LowerHyphen");
    EXPECT_EQ(to_lower_snake("UpperCamel"), "upper_camel");
    EXPECT_EQ(to_upper_snake("lowerCamel"), "LOWER_CAMEL");
}

TEST_F(SpellingTest, ProbeListOrder) {
    EXPECT_EQ(probe_list("lowerCamel"),
              (Strings{"lowerCamel", "lower-camel", "LowerCamel", "lower_camel", "LOWER_CAMEL"}));
    EXPECT_EQ(probe_list("UPPER_SNAKE"),
              (Strings{"UPPER_SNAKE", "upper-snake", "upperSnake", "UpperSnake", "upper_snake"}));
    EXPECT_EQ(probe_list("name"), (Strings{"name", "Name", "NAME"}));
}

TEST_F(SpellingTest, EmptyIdentifierThrows) {
    EXPECT_THROW(probe_list(""), std::invalid_argument);
}

TEST_F(SpellingTest, ProbeListProperties) {
    PropertyCheck check(7);
    auto result = check.for_all(
        500, [](RandomGen& rng) { return rng.identifier(); },
        [](const std::string& id) {
            auto probes = probe_list(id);
            Strings sorted = probes;
            std::sort(sorted.begin(), sorted.end());
            bool unique = std::adjacent_find(sorted.begin(), sorted.end()) == sorted.end();
            bool canonical_present =
                std::find(probes.begin(), probes.end(), to_lower_hyphen(id)) != probes.end();
            return probes.front() == id && unique && canonical_present;
        });
    EXPECT_TRUE(result.passed) << "counterexample: " << result.counterexample;
    EXPECT_EQ(result.iterations, 500u);
}

TEST_F(SpellingTest, SpellingsShareWords) {
    PropertyCheck check;
    auto result = check.for_all(
        300, [](RandomGen& rng) { return rng.identifier(); },
        [](const std::string& id) {
            auto words = split_words(id);
            return split_words(to_lower_camel(id)) == words &&
                   split_words(to_upper_snake(id)) == words &&
                   split_words(to_lower_hyphen(id)) == words;
        });
    EXPECT_TRUE(result.passed) << "counterexample: " << result.counterexample;
}

// ============================================================================
// Collision Removal
// ============================================================================

class CollisionTest : public ::testing::Test {};

TEST_F(CollisionTest, SharedSpellingsAreDropped) {
    std::vector<Strings> lists{probe_list("duplicateName"), probe_list("DuplicateName")};
    auto removed = remove_collisions(lists);

    EXPECT_EQ(lists[0], (Strings{"duplicateName"}));
    EXPECT_EQ(lists[1], (Strings{"DuplicateName"}));
    EXPECT_NE(std::find(removed.begin(), removed.end(), "duplicate-name"), removed.end());
}

TEST_F(CollisionTest, ExactSpellingsStay) {
    std::vector<Strings> lists{probe_list("duplicateName"), probe_list("duplicate-name")};
    remove_collisions(lists);
    EXPECT_EQ(lists[0].front(), "duplicateName");
    EXPECT_EQ(lists[1].front(), "duplicate-name");
    EXPECT_EQ(std::count(lists[0].begin(), lists[0].end(), "duplicate-name"), 0);
}

TEST_F(CollisionTest, UnrelatedListsUntouched) {
    std::vector<Strings> lists{probe_list("host"), probe_list("port")};
    auto before = lists;
    EXPECT_TRUE(remove_collisions(lists).empty());
    EXPECT_EQ(lists, before);
}

// ============================================================================
// Key Lookup
// ============================================================================

class LookupTest : public ::testing::Test {
protected:
    static ConfigNode object_with(const Strings& keys) {
        ConfigNode::Object fields;
        for (const auto& k : keys) {
            fields.emplace(k, ConfigNode::string(k));
        }
        return ConfigNode::object(std::move(fields));
    }
};

TEST_F(LookupTest, ExactWins) {
    auto r = lookup_key(object_with({"firstName", "first-name", "first_name"}),
                        probe_list("firstName"));
    EXPECT_EQ(r.status, LookupStatus::FOUND);
    EXPECT_EQ(r.key, "firstName");
}

TEST_F(LookupTest, SingleDerivedSpelling) {
    auto r = lookup_key(object_with({"first-name"}), probe_list("firstName"));
    EXPECT_EQ(r.status, LookupStatus::FOUND);
    EXPECT_EQ(r.key, "first-name");
}

TEST_F(LookupTest, SeveralDerivedSpellingsAreAmbiguous) {
    auto r = lookup_key(object_with({"first-name", "first_name"}), probe_list("firstName"));
    ASSERT_EQ(r.status, LookupStatus::AMBIGUOUS);
    EXPECT_EQ(r.conflicts, (Strings{"first-name", "first_name"}));

    auto e = ambiguity_error("person", "firstName", r);
    EXPECT_EQ(e.kind(), ErrorKind::MISSING);
    EXPECT_EQ(e.path(), "person.firstName");
    EXPECT_NE(e.message().find("first-name"), std::string::npos);
}

TEST_F(LookupTest, AbsentAndNull) {
    EXPECT_EQ(lookup_key(object_with({"other"}), probe_list("name")).status,
              LookupStatus::ABSENT);

    ConfigNode::Object fields;
    fields.emplace("name", ConfigNode::null());
    EXPECT_EQ(lookup_key(ConfigNode::object(std::move(fields)), probe_list("name")).status,
              LookupStatus::ABSENT);
}
