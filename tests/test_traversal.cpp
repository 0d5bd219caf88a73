/// @file test_traversal.cpp
/// @brief Tests for skipping, materializing and decoding streamed values.

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <map>
#include <optional>
#include <string>
#include <vector>

using namespace sjson;
using namespace sjson::test;

namespace {

struct Person {
    std::string name;
    int age = 0;
};
SJSON_DEFINE_TYPE_NON_INTRUSIVE(Person, name, age)

using TopArray = Element<Compound::Array, Root>;
using TopObject = Element<Compound::Object, Root>;

Parser<Element<Compound::Array, Root>> top_array() {
    return root().bind([](ParseResult<Root> r) { return r.array(); });
}

Parser<Element<Compound::Object, Root>> top_object() {
    return root().bind([](ParseResult<Root> r) { return r.object(); });
}

/// Every remaining item value of the top-level array, as integers.
Parser<std::vector<int64_t>> remaining_ints(Parser<TopArray> elements) {
    return parse_rest_of_array(elements).map([](std::pair<Unit, Array> p) {
        std::vector<int64_t> out;
        for (const auto& v : p.second) out.push_back(v.as_integer());
        return out;
    });
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Element walking
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Traversal, ElementsCarryIndices) {
    auto p = top_object().bind([](TopObject e) {
        EXPECT_TRUE(e.is_item());
        EXPECT_EQ(e.index(), "first");
        EXPECT_EQ(e.component(), PathComponent::field("first"));
        return e.value().next();
    }).map([](TopObject e) {
        EXPECT_EQ(e.index(), "second");
        return e.value().as_string();
    });
    auto out = parse_all(p, R"({"first": 1, "second": "two"})");
    ASSERT_TRUE(out.done()) << out.failure().to_string();
    EXPECT_EQ(out.value(), "two");
}

TEST(Traversal, EndElementContinuesTheParent) {
    auto p = top_array().bind([](TopArray e) {
        EXPECT_TRUE(e.is_end());
        EXPECT_THROW((void)e.index(), TypeError);
        EXPECT_THROW((void)e.value(), TypeError);
        return pure(e.next());
    });
    auto out = parse_all(p, "[] ");
    ASSERT_TRUE(out.done());
    EXPECT_EQ(out.value(), Unit{});
    EXPECT_EQ(out.leftover(), " ");
}

TEST(Traversal, ResultAccessorsCheckTheKind) {
    auto p = top_array().map([](TopArray e) {
        auto v = e.value();
        EXPECT_THROW((void)v.array(), TypeError);
        EXPECT_THROW((void)v.as_bool(), TypeError);
        EXPECT_TRUE(v.atom().has_value());
        return v.as_string();
    });
    EXPECT_EQ(parse_all(p, R"(["s"])").value(), "s");

    auto compound = top_array().map([](TopArray e) {
        auto v = e.value();
        EXPECT_FALSE(v.atom().has_value());
        EXPECT_THROW((void)v.next(), TypeError);
        return v.is_object();
    });
    EXPECT_TRUE(parse_all(compound, "[{}]").value());
}

// ═══════════════════════════════════════════════════════════════════════════════
// skip_value / skip_rest_of_compound
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Traversal, SkipThenContinue) {
    auto p = top_array()
        .bind([](TopArray e) { return e.value().next(); })          // 1
        .bind([](TopArray e) { return skip_value(e.value()); })     // [2,3]
        .bind([](Parser<TopArray> next) { return next; })
        .map([](TopArray e) { return e.value().number().as_integer(); });
    auto out = parse_all(p, "[1,[2,3],4]");
    ASSERT_TRUE(out.done()) << out.failure().to_string();
    EXPECT_EQ(out.value(), 4);
}

TEST(Traversal, SkipAtomDoesNotConsume) {
    auto p = top_array()
        .bind([](TopArray e) { return skip_value(e.value()); })
        .bind([](Parser<TopArray> next) { return next; })
        .map([](TopArray e) { return e.value().as_string(); });
    EXPECT_EQ(parse_all(p, R"([true, "x"])").value(), "x");
}

TEST(Traversal, SkipWholeDocument) {
    auto p = root().bind([](ParseResult<Root> r) { return skip_value(r); });
    auto out = parse_all(p, R"({"a": [1, {"b": [[], {}]}], "c": "}]"} tail)");
    ASSERT_TRUE(out.done()) << out.failure().to_string();
    EXPECT_EQ(out.leftover(), " tail");
}

TEST(Traversal, SkipRestOfCompound) {
    auto p = top_array()
        .bind([](TopArray e) { return e.value().array(); })
        .bind([](Element<Compound::Array, InArray<Root>> inner) {
            EXPECT_EQ(inner.value().number().as_integer(), 1);
            return skip_rest_of_compound(inner.value().next());
        })
        .bind([](Parser<TopArray> next) { return next; })
        .map([](TopArray e) { return e.value().number().as_integer(); });
    auto out = parse_all(p, "[[1, [2], {\"x\": 3}], 4]");
    ASSERT_TRUE(out.done()) << out.failure().to_string();
    EXPECT_EQ(out.value(), 4);
}

TEST(Traversal, SkipDeeplyNested) {
    ParseOptions opts;
    opts.max_depth = 20000;
    auto doc = nested_arrays(10000) + " ";
    auto p = root(opts).bind([](ParseResult<Root> r) { return skip_value(r); });
    auto out = parse_all(p, doc);
    ASSERT_TRUE(out.done()) << out.failure().to_string();
    EXPECT_EQ(out.leftover(), " ");
    EXPECT_EQ(out.stats().depth, 0u);
}

// ═══════════════════════════════════════════════════════════════════════════════
// parse_value / parse_rest_*
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Traversal, ParseValueLeavesTheContinuation) {
    auto p = top_array()
        .bind([](TopArray e) { return parse_value(e.value()); })
        .bind([](std::pair<Parser<TopArray>, Value> r) {
            EXPECT_EQ(r.second["a"][1].as_integer(), 2);
            return r.first;
        })
        .map([](TopArray e) { return e.value().as_string(); });
    auto out = parse_all(p, R"([{"a": [1, 2]}, "x"])");
    ASSERT_TRUE(out.done()) << out.failure().to_string();
    EXPECT_EQ(out.value(), "x");
}

TEST(Traversal, ParseValueOfAnAtom) {
    auto p = top_array()
        .bind([](TopArray e) { return parse_value(e.value()); })
        .map([](std::pair<Parser<TopArray>, Value> r) { return r.second.as_integer(); });
    EXPECT_EQ(parse_all(p, "[5, 6]").value(), 5);
}

TEST(Traversal, ObjectsKeepTheLastDuplicate) {
    auto v = parse_tree(R"({"a": 1, "b": 2, "a": 3})");
    EXPECT_EQ(v.size(), 2u);
    EXPECT_EQ(v["a"].as_integer(), 3);
    EXPECT_EQ(v["b"].as_integer(), 2);
}

TEST(Traversal, LargeObjectsKeepTheLastDuplicate) {
    std::string doc = "{";
    for (int i = 0; i < 40; ++i) doc += "\"k" + std::to_string(i % 20) + "\":" + std::to_string(i) + ",";
    doc += "\"end\":true}";
    auto v = parse_tree(doc);
    EXPECT_EQ(v.size(), 21u);
    EXPECT_EQ(v["k0"].as_integer(), 20);
    EXPECT_EQ(v["k19"].as_integer(), 39);
}

TEST(Traversal, ParseRestOfArray) {
    auto p = top_array().bind([](TopArray e) {
        EXPECT_EQ(e.value().number().as_integer(), 1);
        return remaining_ints(e.value().next());
    });
    auto out = parse_all(p, "[1, 2, 3]");
    ASSERT_TRUE(out.done()) << out.failure().to_string();
    EXPECT_EQ(out.value(), (std::vector<int64_t>{2, 3}));
}

TEST(Traversal, ParseRestOfEmptyArray) {
    auto p = root().bind([](ParseResult<Root> r) { return remaining_ints(r.array()); });
    auto out = parse_all(p, "[]");
    ASSERT_TRUE(out.done());
    EXPECT_TRUE(out.value().empty());
}

TEST(Traversal, ParseRestOfObject) {
    auto p = top_object()
        .bind([](TopObject e) { return parse_rest_of_object(e.value().next()); })
        .map([](std::pair<Unit, Object> r) { return Value(std::move(r.second)); });
    auto out = parse_all(p, R"({"skip": 0, "b": [true], "c": {"d": null}, "b": 1})");
    ASSERT_TRUE(out.done()) << out.failure().to_string();
    const Value& v = out.value();
    EXPECT_FALSE(v.contains("skip"));
    EXPECT_EQ(v["b"].as_integer(), 1);
    EXPECT_TRUE(v["c"]["d"].is_null());
}

TEST(Traversal, RoundTrip) {
    for (const char* doc : {R"({"a":[1,2.5,"x\ny",null,true,false],"b":{"c":{}},"d":[]})",
                            R"([[[]],{"k":"\u0001"},-7,18446744073709551615])",
                            R"("just a string")", "0"}) {
        EXPECT_EQ(to_json(parse_tree(doc)), doc);
    }
}

// ═══════════════════════════════════════════════════════════════════════════════
// decode_value
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Traversal, DecodeValue) {
    auto p = root().bind([](ParseResult<Root> r) { return decode_value<Person>(r); });
    auto out = parse_all(p, R"({"name": "Ada", "age": 36, "extra": [1]})");
    ASSERT_TRUE(out.done());
    const auto& d = out.value().second;
    ASSERT_TRUE(d);
    EXPECT_EQ(d.value.name, "Ada");
    EXPECT_EQ(d.value.age, 36);
}

TEST(Traversal, DecodeMismatchDoesNotStopTheStream) {
    auto p = top_array()
        .bind([](TopArray e) { return decode_value<Person>(e.value()); })
        .bind([](std::pair<Parser<TopArray>, decode_result<Person>> r) {
            EXPECT_FALSE(r.second);
            EXPECT_EQ(r.second.ec, make_error_code(errc::decode_failed));
            EXPECT_FALSE(r.second.message.empty());
            return r.first;
        })
        .map([](TopArray e) { return e.value().number().as_integer(); });
    auto out = parse_all(p, R"([{"name": "Bob", "age": "old"}, 7])");
    ASSERT_TRUE(out.done()) << out.failure().to_string();
    EXPECT_EQ(out.value(), 7);
}

TEST(Traversal, DecodeOrFailFails) {
    auto p = root().bind([](ParseResult<Root> r) { return decode_value_or_fail<std::vector<int>>(r); });
    auto ok = parse_all(p, "[1, 2, 3]");
    ASSERT_TRUE(ok.done());
    EXPECT_EQ(ok.value().second, (std::vector<int>{1, 2, 3}));

    auto bad = parse_all(p, R"([1, "two"])");
    ASSERT_TRUE(bad.failed());
    EXPECT_TRUE(has_code(bad.failure(), errc::decode_failed));
}

TEST(Traversal, DecodeIntegerOverflow) {
    auto p = root().bind([](ParseResult<Root> r) { return decode_value<short>(r); });
    auto out = parse_all(p, "70000");
    ASSERT_TRUE(out.done());
    EXPECT_FALSE(out.value().second);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Depth-erased handles
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Traversal, ErasedSkipKeepsFrames) {
    auto p = top_array().bind([](TopArray e) {
        SomeParseResult some = e.value();
        EXPECT_EQ(some.depth(), 1u);
        EXPECT_TRUE(some.is<InArray<Root>>());
        EXPECT_FALSE(some.is<Root>());
        return skip_value(some);
    }).bind([](SomeNextParser next) {
        EXPECT_FALSE(next.is_root());
        EXPECT_TRUE(next.is<InArray<Root>>());
        return next.parser();
    }).map([](SomeElement e) {
        EXPECT_EQ(e.compound(), Compound::Array);
        EXPECT_EQ(e.index(), PathComponent::offset(1));
        return e.value().as_string();
    });
    auto out = parse_all(p, R"([{"a": [1]}, "b"])");
    ASSERT_TRUE(out.done()) << out.failure().to_string();
    EXPECT_EQ(out.value(), "b");
}

TEST(Traversal, ErasedRecoversTypedView) {
    auto p = root().bind([](ParseResult<Root> r) {
        SomeParseResult some = r;
        EXPECT_THROW((void)some.as<InArray<Root>>(), TypeError);
        return some.as<Root>().object();
    }).map([](TopObject e) { return e.index(); });
    EXPECT_EQ(parse_all(p, R"({"k": 1})").value(), "k");
}

TEST(Traversal, ErasedViewAtTheWrongFrameFails) {
    auto p = root().bind([](ParseResult<Root> r) {
        return SomeParseResult(r).array().as<InObject<Root>>();
    });
    auto out = parse_all(p, "[1]");
    ASSERT_TRUE(out.failed());
    EXPECT_TRUE(has_code(out.failure(), errc::frame_mismatch));

    auto next = root().bind([](ParseResult<Root> r) { return r.array(); })
                      .map([](TopArray e) {
                          SomeNextParser some = e.value().next();
                          try {
                              (void)some.as<InObject<Root>>();
                              ADD_FAILURE() << "typed view recovered at the wrong frame";
                          } catch (const TypeError& err) {
                              EXPECT_EQ(err.code(), make_error_code(errc::frame_mismatch));
                          }
                          return some.is<InArray<Root>>();
                      });
    EXPECT_TRUE(parse_all(next, "[1, 2]").value());
}

TEST(Traversal, ErasedElementParserFeedsDirectly) {
    auto start = root().feed("[10, 20]");
    ASSERT_TRUE(start.done());
    SomeArrayParser elements = SomeParseResult(start.value()).array();
    EXPECT_TRUE(elements.parent_frames().empty());

    auto first = elements.feed(start.leftover());
    ASSERT_TRUE(first.done()) << first.failure().to_string();
    EXPECT_EQ(first.value().index(), PathComponent::offset(0));
    EXPECT_EQ(first.value().value().number().as_integer(), 10);
    EXPECT_NE(first.leftover().find("20]"), std::string_view::npos);
}

TEST(Traversal, ErasedParseValue) {
    auto p = root().bind([](ParseResult<Root> r) { return parse_value(SomeParseResult(r)); })
                   .map([](std::pair<SomeNextParser, Value> r) {
                       EXPECT_TRUE(r.first.is_root());
                       return r.second.size();
                   });
    EXPECT_EQ(parse_all(p, "[1, [2], {}]").value(), 3u);
}

TEST(Traversal, ErasedRestOfObject) {
    auto p = root().bind([](ParseResult<Root> r) {
        return parse_rest_of_object(SomeParseResult(r).object());
    }).map([](std::pair<SomeNextParser, Object> r) { return r.second.size(); });
    EXPECT_EQ(parse_all(p, R"({"a": 1, "b": {"c": 2}})").value(), 2u);
}

TEST(Traversal, ErasedDecode) {
    auto p = root().bind([](ParseResult<Root> r) {
        return decode_value_or_fail<std::map<std::string, int>>(SomeParseResult(r));
    }).map([](std::pair<SomeNextParser, std::map<std::string, int>> r) { return r.second; });
    auto out = parse_all(p, R"({"x": 1, "y": 2})");
    ASSERT_TRUE(out.done());
    EXPECT_EQ(out.value().at("y"), 2);
}
