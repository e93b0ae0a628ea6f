/**
 * @file test_containers.cpp
 * @brief Unit tests for decoder combinators, containers and wrappers
 *
 * Tests coverage for:
 * - Decoder: from/attempt/on_path/pure factories, map/flat_map/or_else/map_each
 * - Sequences and maps with element error paths
 * - optional / either / Attempt / or-default wrappers and catch predicates
 * - Exception handling inside user decoders
 */

#include <gtest/gtest.h>
#include <configs/configs.hpp>

#include <list>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

using namespace configs;
using namespace configs::decoder;

namespace {

/// Address given as "a.b.c.d"
struct Ipv4Address {
    uint8_t octets[4] = {0, 0, 0, 0};

    static Ipv4Address parse(const std::string& text) {
        Ipv4Address addr;
        size_t start = 0;
        for (int i = 0; i < 4; ++i) {
            size_t end = text.find('.', start);
            if ((i < 3) != (end != std::string::npos)) {
                throw std::invalid_argument("not an IPv4 address: " + text);
            }
            int value = std::stoi(text.substr(start, end - start));
            if (value < 0 || value > 255) {
                throw std::out_of_range("octet out of range: " + text);
            }
            addr.octets[i] = static_cast<uint8_t>(value);
            start          = end + 1;
        }
        return addr;
    }
};

struct NotAnException {};

ConfigNode list_of_ints(std::initializer_list<int64_t> values) {
    ConfigNode::Sequence items;
    for (auto v : values) {
        items.push_back(ConfigNode::integer(v));
    }
    return ConfigNode::sequence(std::move(items));
}

ConfigNode tree_of(std::initializer_list<std::pair<const std::string, ConfigNode>> members) {
    return ConfigNode::object(ConfigNode::Object(members));
}

}  // namespace

template<>
struct configs::decoder::DecoderTraits<Ipv4Address> {
    static Decoder<Ipv4Address> make() {
        return decoder_of<std::string>().map(&Ipv4Address::parse);
    }
};

// ============================================================================
// Decoder Factories and Combinators
// ============================================================================

class DecoderCombinatorTest : public ::testing::Test {
protected:
    ConfigNode tree = tree_of({{"port", ConfigNode::integer(8080)},
                               {"name", ConfigNode::string("svc")},
                               {"kind", ConfigNode::string("tcp")},
                               {"server", tree_of({{"host", ConfigNode::string("h")}})}});
};

TEST_F(DecoderCombinatorTest, Map) {
    auto d = decoder_of<int>().map([](int v) { return v + 1; });
    EXPECT_EQ(d.get(tree, "port").value(), 8081);
    EXPECT_EQ(d.get(tree, "nope").kind(), ErrorKind::MISSING);
}

TEST_F(DecoderCombinatorTest, FlatMapChoosesNextDecoder) {
    auto d = decoder_of<std::string>().flat_map([](const std::string& kind) {
        return Decoder<std::string>::pure(kind == "tcp" ? "stream" : "datagram");
    });
    EXPECT_EQ(d.get(tree, "kind").value(), "stream");
}

TEST_F(DecoderCombinatorTest, OrElseFallsBack) {
    auto d = decoder_of<int>().or_else(Decoder<int>::pure(-1));
    EXPECT_EQ(d.get(tree, "port").value(), 8080);
    EXPECT_EQ(d.get(tree, "name").value(), -1);
}

TEST_F(DecoderCombinatorTest, MapEach) {
    auto t = tree_of({{"xs", list_of_ints({1, 2, 3})}});
    auto d = decoder_of<std::vector<int>>().map_each([](int v) { return std::to_string(v); });
    EXPECT_EQ(d.get(t, "xs").value(), (std::vector<std::string>{"1", "2", "3"}));
}

TEST_F(DecoderCombinatorTest, FromTurnsExceptionsIntoBadValue) {
    auto d = Decoder<int>::from([](const ConfigNode&, std::string_view) -> int {
        throw std::runtime_error("boom");
    });
    auto r = d.get(tree, "port");
    ASSERT_EQ(r.kind(), ErrorKind::BAD_VALUE);
    EXPECT_EQ(r.error().path(), "port");
    EXPECT_EQ(r.error().message(), "boom");
}

TEST_F(DecoderCombinatorTest, FromPassesDecodeExceptionThrough) {
    auto d = Decoder<int>::from([](const ConfigNode& t, std::string_view) {
        return get<int>(t, "name").get_or_throw();
    });
    auto r = d.get(tree, "port");
    ASSERT_EQ(r.kind(), ErrorKind::WRONG_TYPE);
    EXPECT_EQ(r.error().path(), "name");
}

TEST_F(DecoderCombinatorTest, NonStandardExceptionsPropagate) {
    auto d = Decoder<int>::from([](const ConfigNode&, std::string_view) -> int {
        throw NotAnException{};
    });
    EXPECT_THROW((void)d.get(tree, "port"), NotAnException);
}

TEST_F(DecoderCombinatorTest, AttemptFactory) {
    auto d = Decoder<int>::attempt([](const ConfigNode& t, std::string_view path) {
        return get<int>(t, path).map([](int v) { return v * 2; });
    });
    EXPECT_EQ(d.get(tree, "port").value(), 16160);
}

TEST_F(DecoderCombinatorTest, OnPathReceivesTheObject) {
    auto d = Decoder<std::string>::on_path([](const ConfigNode& obj) {
        return obj.find("host")->as_string();
    });
    EXPECT_EQ(d.get(tree, "server").value(), "h");
    EXPECT_EQ(d.get(tree, "name").kind(), ErrorKind::WRONG_TYPE);

    auto a = Decoder<std::string>::attempt_on_path([](const ConfigNode& obj) {
        return get<std::string>(obj, "host");
    });
    EXPECT_EQ(a.get(tree, "server").value(), "h");
}

TEST_F(DecoderCombinatorTest, ExtractDecodesTheRoot) {
    auto d = Decoder<std::string>::on_path([](const ConfigNode& obj) {
        return obj.find("name")->as_string();
    });
    EXPECT_EQ(d.extract(tree).value(), "svc");

    auto r = decoder_of<int>().extract(tree);
    ASSERT_EQ(r.kind(), ErrorKind::WRONG_TYPE);
    EXPECT_EQ(r.error().path(), "");
}

TEST_F(DecoderCombinatorTest, UserDefinedDecoder) {
    auto t = tree_of({{"addr", ConfigNode::string("10.0.0.1")},
                      {"bad", ConfigNode::string("10.0.1")},
                      {"list", ConfigNode::sequence({ConfigNode::string("127.0.0.1"),
                                                     ConfigNode::string("256.0.0.1")})}});
    auto addr = get<Ipv4Address>(t, "addr");
    ASSERT_TRUE(addr.is_success());
    EXPECT_EQ(addr.value().octets[0], 10);
    EXPECT_EQ(addr.value().octets[3], 1);

    EXPECT_EQ(get<Ipv4Address>(t, "bad").kind(), ErrorKind::BAD_VALUE);

    auto list = get<std::vector<Ipv4Address>>(t, "list");
    ASSERT_EQ(list.kind(), ErrorKind::BAD_VALUE);
    EXPECT_EQ(list.error().path(), "list[1]");
}

// ============================================================================
// Sequence and Map Tests
// ============================================================================

class ContainerDecoderTest : public ::testing::Test {};

TEST_F(ContainerDecoderTest, Sequences) {
    auto t = tree_of({{"xs", list_of_ints({3, 1, 3})}});
    EXPECT_EQ(get<std::vector<int>>(t, "xs").value(), (std::vector<int>{3, 1, 3}));
    EXPECT_EQ(get<std::list<int>>(t, "xs").value(), (std::list<int>{3, 1, 3}));
    EXPECT_EQ(get<std::set<int>>(t, "xs").value(), (std::set<int>{1, 3}));
}

TEST_F(ContainerDecoderTest, EmptySequence) {
    auto t = tree_of({{"xs", ConfigNode::sequence({})}});
    EXPECT_TRUE(get<std::vector<std::string>>(t, "xs").value().empty());
}

TEST_F(ContainerDecoderTest, FirstBadElementStops) {
    auto t = tree_of({{"xs", ConfigNode::sequence({ConfigNode::integer(1),
                                                   ConfigNode::string("two"),
                                                   ConfigNode::string("three")})}});
    auto r = get<std::vector<int>>(t, "xs");
    ASSERT_EQ(r.kind(), ErrorKind::WRONG_TYPE);
    EXPECT_EQ(r.error().path(), "xs[1]");
}

TEST_F(ContainerDecoderTest, NestedSequencePaths) {
    auto t = tree_of({{"m", ConfigNode::sequence({list_of_ints({1}),
                                                  ConfigNode::sequence({ConfigNode::null()})})}});
    auto r = get<std::vector<std::vector<int>>>(t, "m");
    ASSERT_EQ(r.kind(), ErrorKind::MISSING);
    EXPECT_EQ(r.error().path(), "m[1][0]");
}

TEST_F(ContainerDecoderTest, NotASequence) {
    auto t = tree_of({{"xs", ConfigNode::string("a")}});
    auto r = get<std::vector<int>>(t, "xs");
    ASSERT_EQ(r.kind(), ErrorKind::WRONG_TYPE);
    EXPECT_EQ(r.error().expected(), "list");
}

TEST_F(ContainerDecoderTest, Maps) {
    auto t = tree_of({{"limits", tree_of({{"cpu", ConfigNode::integer(2)},
                                          {"mem.max", ConfigNode::integer(512)}})}});
    auto m = get<std::map<std::string, int>>(t, "limits").value();
    EXPECT_EQ(m.at("cpu"), 2);
    EXPECT_EQ(m.at("mem.max"), 512);

    auto u = get<std::unordered_map<std::string, int>>(t, "limits").value();
    EXPECT_EQ(u.size(), 2u);
}

TEST_F(ContainerDecoderTest, MapValueErrorPathQuotesKey) {
    auto t = tree_of({{"limits", tree_of({{"mem.max", ConfigNode::string("lots")}})}});
    auto r = get<std::map<std::string, int>>(t, "limits");
    ASSERT_EQ(r.kind(), ErrorKind::WRONG_TYPE);
    EXPECT_EQ(r.error().path(), "limits.\"mem.max\"");
}

TEST_F(ContainerDecoderTest, MapWithTypedKeys) {
    auto t = tree_of({{"ports", tree_of({{"80", ConfigNode::string("http")},
                                         {"443", ConfigNode::string("https")}})}});
    auto m = get<std::map<int, std::string>>(t, "ports").value();
    EXPECT_EQ(m.at(443), "https");

    auto bad = tree_of({{"ports", tree_of({{"web", ConfigNode::string("http")}})}});
    EXPECT_EQ((get<std::map<int, std::string>>(bad, "ports").error().path()), "ports.web");
}

TEST_F(ContainerDecoderTest, SubtreeAsNode) {
    auto inner = tree_of({{"a", ConfigNode::integer(1)}});
    auto t     = tree_of({{"sub", inner}, {"leaf", ConfigNode::integer(2)}});
    EXPECT_EQ(get<ConfigNode>(t, "sub").value(), inner);
    EXPECT_EQ(get<ConfigNode>(t, "leaf").kind(), ErrorKind::WRONG_TYPE);
}

// ============================================================================
// Wrapper Tests
// ============================================================================

class WrapperDecoderTest : public ::testing::Test {
protected:
    ConfigNode tree = tree_of({{"port", ConfigNode::integer(80)},
                               {"name", ConfigNode::string("x")},
                               {"timeout", ConfigNode::string("later")}});
};

TEST_F(WrapperDecoderTest, OptAbsorbsRecoverableErrors) {
    EXPECT_EQ(opt<int>(tree, "port").value(), 80);
    EXPECT_FALSE(opt<int>(tree, "absent").value().has_value());
    EXPECT_FALSE(opt<int>(tree, "name").value().has_value());
    EXPECT_FALSE(opt<int>(tree, "a..b").value().has_value());
}

TEST_F(WrapperDecoderTest, OptKeepsBadValue) {
    auto r = opt<std::chrono::seconds>(tree, "timeout");
    EXPECT_EQ(r.kind(), ErrorKind::BAD_VALUE);

    auto all = opt<std::chrono::seconds>(tree, "timeout", any_error());
    EXPECT_FALSE(all.value().has_value());
}

TEST_F(WrapperDecoderTest, CustomPredicate) {
    EXPECT_FALSE(opt<int>(tree, "absent", missing_only()).value().has_value());
    EXPECT_EQ(opt<int>(tree, "name", missing_only()).kind(), ErrorKind::WRONG_TYPE);
}

TEST_F(WrapperDecoderTest, OptionalTrait) {
    EXPECT_FALSE(get<std::optional<int>>(tree, "absent").value().has_value());
    EXPECT_EQ(get<std::optional<int>>(tree, "port").value(), 80);
}

TEST_F(WrapperDecoderTest, Either) {
    auto good = either<int>(tree, "port").value();
    ASSERT_EQ(good.index(), 1u);
    EXPECT_EQ(std::get<1>(good), 80);

    auto bad = either<int>(tree, "name").value();
    ASSERT_EQ(bad.index(), 0u);
    EXPECT_EQ(std::get<0>(bad).kind(), ErrorKind::WRONG_TYPE);

    EXPECT_EQ(either<std::chrono::seconds>(tree, "timeout").kind(), ErrorKind::BAD_VALUE);
}

TEST_F(WrapperDecoderTest, AttemptAsValue) {
    auto inner = get<Attempt<int>>(tree, "absent").value();
    EXPECT_EQ(inner.kind(), ErrorKind::MISSING);

    auto success = get<Attempt<int>>(tree, "port").value();
    EXPECT_EQ(success.value(), 80);
}

TEST_F(WrapperDecoderTest, GetOrElse) {
    EXPECT_EQ(get_or_else<int>(tree, "port", 1).value(), 80);
    EXPECT_EQ(get_or_else<int>(tree, "absent", 1).value(), 1);
    EXPECT_EQ(get_or_else<std::string>(tree, "absent", "dflt").value(), "dflt");
    EXPECT_EQ(get_or_else<std::chrono::seconds>(tree, "timeout", std::chrono::seconds(5)).kind(),
              ErrorKind::BAD_VALUE);
}
