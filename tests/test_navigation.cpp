/// @file test_navigation.cpp
/// @brief Tests for find_element, navigate_from_to and path expressions.

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace sjson;
using namespace sjson::test;

namespace {

using TopArray = Element<Compound::Array, Root>;
using TopObject = Element<Compound::Object, Root>;

Parser<TopObject> top_object() {
    return root().bind([](ParseResult<Root> r) { return r.object(); });
}

Parser<TopArray> top_array() {
    return root().bind([](ParseResult<Root> r) { return r.array(); });
}

Outcome<Navigation> navigate(std::string_view doc, const std::string& path) {
    return parse_all(navigate_to(parse_path(path)), doc);
}

/// Navigate and materialize the target.
Outcome<Value> value_at(std::string_view doc, const std::string& path) {
    auto p = navigate_to_or_fail(parse_path(path)).bind([](SomeParseResult r) {
        return parse_value(r).map([](std::pair<SomeNextParser, Value> v) { return std::move(v.second); });
    });
    return parse_all(p, doc);
}

const char* const kDoc = R"({
    "meta": {"version": 2, "tags": ["a", "b"]},
    "items": [
        {"id": 1, "name": "first"},
        {"id": 2, "name": "second", "extra": {"deep": [10, 20, 30]}}
    ],
    "count": 2
})";

} // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// find_element
// ═══════════════════════════════════════════════════════════════════════════════

TEST(FindElement, FieldPresent) {
    auto q = root().bind([](ParseResult<Root> r) { return find_element("b", r.object()); })
                   .map([](Found<Compound::Object, Root> f) {
                       EXPECT_TRUE(f.found());
                       EXPECT_THROW((void)f.next(), TypeError);
                       return f.result().number().as_integer();
                   });
    auto out = parse_all(q, R"({"a": [1, 2, {"b": 0}], "b": 2, "c": 3})");
    ASSERT_TRUE(out.done()) << out.failure().to_string();
    EXPECT_EQ(out.value(), 2);
}

TEST(FindElement, ContinuesAfterTheMatch) {
    auto p = root()
        .bind([](ParseResult<Root> r) { return find_element("b", r.object()); })
        .bind([](Found<Compound::Object, Root> f) { return f.result().next(); })
        .map([](TopObject e) { return e.index(); });
    EXPECT_EQ(parse_all(p, R"({"a": 1, "b": 2, "c": 3})").value(), "c");
}

TEST(FindElement, AbsentYieldsTheParentContinuation) {
    auto p = root()
        .bind([](ParseResult<Root> r) { return find_element("z", r.object()); })
        .map([](Found<Compound::Object, Root> f) {
            EXPECT_FALSE(f);
            EXPECT_THROW((void)f.result(), TypeError);
            return f.next();
        });
    auto out = parse_all(p, R"({"a": {"z": 1}} rest)");
    ASSERT_TRUE(out.done()) << out.failure().to_string();
    EXPECT_EQ(out.leftover(), " rest");
}

TEST(FindElement, ArrayOffset) {
    auto p = top_array()
        .bind([](TopArray first) { return find_element(size_t{2}, first); })
        .map([](Found<Compound::Array, Root> f) { return f.result().as_string(); });
    auto out = parse_all(p, R"(["a", ["b"], "c", "d"])");
    ASSERT_TRUE(out.done()) << out.failure().to_string();
    EXPECT_EQ(out.value(), "c");
}

TEST(FindElement, StartingFromTheTarget) {
    auto p = top_array()
        .bind([](TopArray first) { return find_element(size_t{0}, first); })
        .map([](Found<Compound::Array, Root> f) { return f.found(); });
    EXPECT_TRUE(parse_all(p, "[7]").value());
}

TEST(FindElement, InsideNestedCompound) {
    auto p = top_array()
        .bind([](TopArray e) { return find_element("k", e.value().object()); })
        .bind([](Found<Compound::Object, InArray<Root>> f) { return skip_value(f.result()); })
        .bind([](Parser<Element<Compound::Object, InArray<Root>>> rest) {
            return skip_rest_of_compound(rest);
        })
        .bind([](Parser<TopArray> next) { return next; })
        .map([](TopArray e) { return e.value().as_bool(); });
    auto out = parse_all(p, R"([{"j": [1], "k": {"x": 1}, "l": 2}, true])");
    ASSERT_TRUE(out.done()) << out.failure().to_string();
    EXPECT_TRUE(out.value());
}

TEST(FindElement, OrFailFromAnElement) {
    auto p = top_array()
        .bind([](TopArray first) { return find_element_or_fail(size_t{1}, first); })
        .map([](ParseResult<InArray<Root>> v) { return v.as_string(); });
    EXPECT_EQ(parse_all(p, R"(["a", "b"])").value(), "b");

    auto out = parse_all(p, R"(["a"])");
    ASSERT_TRUE(out.failed());
    EXPECT_TRUE(has_code(out.failure(), errc::navigation_absent));
}

TEST(FindElement, OrFail) {
    auto p = root().bind([](ParseResult<Root> r) { return find_element_or_fail("x", r.object()); })
                   .map([](ParseResult<InObject<Root>> v) { return v.number().as_integer(); });
    EXPECT_EQ(parse_all(p, R"({"x": 5})").value(), 5);

    auto out = parse_all(p, R"({"y": 5})");
    ASSERT_TRUE(out.failed());
    EXPECT_TRUE(has_code(out.failure(), errc::navigation_absent));
}

// ═══════════════════════════════════════════════════════════════════════════════
// navigate_from_to
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Navigate, FoundValue) {
    auto out = value_at(kDoc, "items[1].extra.deep[2]");
    ASSERT_TRUE(out.done()) << out.failure().to_string();
    EXPECT_EQ(out.value().as_integer(), 30);
}

TEST(Navigate, FoundCompoundIsUnconsumed) {
    auto out = value_at(kDoc, "meta.tags");
    ASSERT_TRUE(out.done()) << out.failure().to_string();
    EXPECT_EQ(to_json(out.value()), R"(["a","b"])");
}

TEST(Navigate, EmptyPathIsTheValueItself) {
    auto out = navigate("[1]", "");
    ASSERT_TRUE(out.done());
    ASSERT_TRUE(out.value().found());
    EXPECT_TRUE(out.value().result().is_array());
    EXPECT_EQ(out.value().result().depth(), 0u);
}

TEST(Navigate, ResultCarriesItsFrames) {
    auto out = navigate(kDoc, "items[0].id");
    ASSERT_TRUE(out.done());
    const Navigation& nav = out.value();
    ASSERT_TRUE(nav.found());
    EXPECT_EQ(nav.result().frames(),
              (std::vector<Compound>{Compound::Object, Compound::Array, Compound::Object}));
    EXPECT_TRUE((nav.result().is<InObject<InArray<InObject<Root>>>>()));
    EXPECT_EQ(nav.result().number().as_integer(), 1);
}

TEST(Navigate, AbsentVersusTypeMismatch) {
    const std::string doc = R"({"a": 1})";

    auto absent = navigate(doc, "b");
    ASSERT_TRUE(absent.done());
    EXPECT_TRUE(absent.value().absent());
    EXPECT_EQ(absent.value().failed_prefix(), parse_path("b"));
    EXPECT_FALSE(absent.value().mismatch().has_value());

    auto mismatch = navigate(doc, "a.x");
    ASSERT_TRUE(mismatch.done());
    EXPECT_TRUE(mismatch.value().type_mismatch());
    EXPECT_EQ(mismatch.value().failed_prefix(), parse_path("a.x"));
    ASSERT_TRUE(mismatch.value().mismatch().has_value());
    EXPECT_EQ(mismatch.value().mismatch()->kind(), ResultKind::Number);

    auto offset = navigate(doc, "[0]");
    ASSERT_TRUE(offset.done());
    EXPECT_TRUE(offset.value().type_mismatch());
    EXPECT_EQ(offset.value().failed_prefix(), parse_path("[0]"));
    EXPECT_EQ(offset.value().mismatch()->kind(), ResultKind::ObjectStart);
}

TEST(Navigate, ArrayOffsetOutOfRangeIsAbsent) {
    auto out = navigate(kDoc, "items[5].id");
    ASSERT_TRUE(out.done());
    EXPECT_TRUE(out.value().absent());
    EXPECT_EQ(out.value().failed_prefix(), parse_path("items[5]"));
    EXPECT_THROW((void)out.value().result(), TypeError);
}

TEST(Navigate, AbsentLeavesTheRestReadable) {
    auto p = navigate_to(parse_path("a.z")).bind([](Navigation nav) {
        EXPECT_TRUE(nav.absent());
        const auto& rest = nav.rest();
        EXPECT_TRUE(rest.has_value());
        EXPECT_EQ(rest->depth(), 1u);
        return rest->parser();
    }).map([](SomeElement e) {
        EXPECT_EQ(e.index(), PathComponent::field("c"));
        return e.value().number().as_integer();
    });
    auto out = parse_all(p, R"({"a": {"b": 1}, "c": 2})");
    ASSERT_TRUE(out.done()) << out.failure().to_string();
    EXPECT_EQ(out.value(), 2);
}

TEST(Navigate, FromAnElementValue) {
    auto p = top_array()
        .bind([](TopArray first) { return find_element(size_t{1}, first); })
        .bind([](Found<Compound::Array, Root> f) {
            return navigate_from_to_or_fail(parse_path("x[1]"), f.result());
        })
        .map([](SomeParseResult r) { return r.as_string(); });
    auto out = parse_all(p, R"([{"x": [0]}, {"x": ["p", "q"]}])");
    ASSERT_TRUE(out.done()) << out.failure().to_string();
    EXPECT_EQ(out.value(), "q");
}

TEST(Navigate, PointerDigitTokensFollowTheValue) {
    const std::string doc = R"({"0": "zero", "1": {"2": [5, 6, 7]}})";

    auto member = value_at(doc, "/0");
    ASSERT_TRUE(member.done()) << member.failure().to_string();
    EXPECT_EQ(member.value().as_string(), "zero");

    auto mixed = value_at(doc, "/1/2/2");
    ASSERT_TRUE(mixed.done()) << mixed.failure().to_string();
    EXPECT_EQ(mixed.value().as_integer(), 7);

    auto absent = navigate(doc, "/5");
    ASSERT_TRUE(absent.done());
    EXPECT_TRUE(absent.value().absent());

    auto bracket = navigate(doc, "[0]");
    ASSERT_TRUE(bracket.done());
    EXPECT_TRUE(bracket.value().type_mismatch());
}

TEST(Navigate, OrFailCodes) {
    auto absent = value_at(R"({"a": {}})", "a.b");
    ASSERT_TRUE(absent.failed());
    EXPECT_TRUE(has_code(absent.failure(), errc::navigation_absent));

    auto mismatch = value_at(R"({"a": "s"})", "a[0]");
    ASSERT_TRUE(mismatch.failed());
    EXPECT_TRUE(has_code(mismatch.failure(), errc::navigation_type_mismatch));
    EXPECT_NE(mismatch.failure().message.find("a[0]"), std::string::npos);
}

TEST(Navigate, SyntaxErrorsStillFail) {
    auto out = navigate(R"({"a": [1, 2 3]})", "b");
    ASSERT_TRUE(out.failed());
    EXPECT_TRUE(has_code(out.failure(), errc::unexpected_character));
}

TEST(Navigate, ChunkingInvariance) {
    const std::string doc = kDoc;
    auto p = navigate_to_or_fail(parse_path("items[1].extra.deep[1]"))
        .map([](SomeParseResult r) { return r.number().as_integer(); });
    for (size_t at = 1; at < doc.size(); ++at) {
        auto out = parse_chunks(p, split_at(doc, at));
        ASSERT_TRUE(out.done()) << "split at " << at;
        EXPECT_EQ(out.value(), 20) << "split at " << at;
    }
    EXPECT_EQ(parse_chunks(p, chunked(doc, 1)).value(), 20);
}

TEST(Navigate, SkippedSubtreesAreNotBuffered) {
    std::string doc = R"({"skip": [)";
    for (int i = 0; i < 5000; ++i) {
        if (i) doc += ',';
        doc += R"({"s": "0123456789", "n": )" + std::to_string(i) + "}";
    }
    doc += R"(], "target": "found"})";

    auto p = navigate_to_or_fail(parse_path("target"))
        .map([](SomeParseResult r) { return r.as_string(); });
    auto out = parse_chunks(p, chunked(doc, 7));
    ASSERT_TRUE(out.done()) << out.failure().to_string();
    EXPECT_EQ(out.value(), "found");
    EXPECT_LE(out.stats().peak_buffered_bytes, std::string(R"("0123456789")").size());
}

// ═══════════════════════════════════════════════════════════════════════════════
// Path expressions
// ═══════════════════════════════════════════════════════════════════════════════

TEST(PathExpression, DottedAndBracketed) {
    EXPECT_EQ(parse_path("a.b[2]"),
              (Path{PathComponent::field("a"), PathComponent::field("b"), PathComponent::offset(2)}));
    EXPECT_EQ(parse_path(R"(.a["x y"][0])"),
              (Path{PathComponent::field("a"), PathComponent::field("x y"), PathComponent::offset(0)}));
    EXPECT_EQ(parse_path("[3]"), (Path{PathComponent::offset(3)}));
    EXPECT_EQ(parse_path(R"(["a\"b"])"), (Path{PathComponent::field("a\"b")}));
    EXPECT_TRUE(parse_path("").empty());
}

TEST(PathExpression, JsonPointer) {
    EXPECT_EQ(parse_path("/a/b~1c/2"),
              (Path{PathComponent::field("a"), PathComponent::field("b/c"), PathComponent::offset(2)}));
    EXPECT_EQ(parse_path("/m~0n"), (Path{PathComponent::field("m~n")}));
    EXPECT_EQ(parse_path("/01"), (Path{PathComponent::field("01")}));
    EXPECT_EQ(parse_path("/"), (Path{PathComponent::field("")}));
    EXPECT_TRUE(parse_path("/2").front().is_pointer_index());
    EXPECT_FALSE(parse_path("[2]").front().is_pointer_index());
    EXPECT_EQ(parse_path("/2").front().resolved_for(Compound::Object), PathComponent::field("2"));
    EXPECT_EQ(parse_path("/2").front().resolved_for(Compound::Array), PathComponent::offset(2));
}

TEST(PathExpression, Malformed) {
    for (const char* text : {"a[", "a[x]", "a..b", R"(["x)", "a[1", "/a~2"}) {
        try {
            (void)parse_path(text);
            ADD_FAILURE() << "no error for " << text;
        } catch (const ParseError& e) {
            EXPECT_EQ(e.code(), make_error_code(errc::invalid_path)) << text;
        }
    }
}

TEST(PathExpression, Rendering) {
    EXPECT_EQ(to_string(parse_path("a.b[2]")), ".a.b[2]");
    EXPECT_EQ(to_string(parse_path(R"(["x y"])")), R"(["x y"])");
    EXPECT_EQ(to_string(Path{}), "<root>");
    EXPECT_EQ(PathComponent("_id").to_string(), "._id");
    EXPECT_EQ(PathComponent("1st").to_string(), R"(["1st"])");
}

TEST(PathExpression, Components) {
    PathComponent offset = 4;
    EXPECT_TRUE(offset.is_offset());
    EXPECT_EQ(offset.applies_to(), Compound::Array);
    EXPECT_THROW((void)offset.name(), TypeError);

    PathComponent field = "key";
    EXPECT_TRUE(field.is_field());
    EXPECT_EQ(field.applies_to(), Compound::Object);
    EXPECT_THROW((void)field.index(), TypeError);

    EXPECT_THROW(PathComponent(-1), OutOfRangeError);
    EXPECT_NE(PathComponent("0"), PathComponent(0));
}
