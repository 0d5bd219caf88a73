/// @file test_conversion.cpp
/// @brief Tests for from_json/from_value decoding of materialized values.

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

using namespace sjson;
using namespace sjson::test;

namespace shop {

struct Address {
    std::string city;
    std::optional<std::string> zip;
};
SJSON_DEFINE_TYPE_NON_INTRUSIVE(Address, city, zip)

class Order {
public:
    int id = 0;
    std::vector<std::string> items;
    Address ship_to;
    std::map<std::string, double> prices;

    SJSON_DEFINE_TYPE_INTRUSIVE(Order, id, items, ship_to, prices)
};

} // namespace shop

// ═══════════════════════════════════════════════════════════════════════════════
// Builtin types
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Conversion, Scalars) {
    EXPECT_EQ(from_value<int>(parse_tree("42")), 42);
    EXPECT_EQ(from_value<unsigned long long>(parse_tree("18446744073709551615")),
              18446744073709551615ULL);
    EXPECT_DOUBLE_EQ(from_value<double>(parse_tree("2.5")), 2.5);
    EXPECT_DOUBLE_EQ(from_value<double>(parse_tree("7")), 7.0);
    EXPECT_TRUE(from_value<bool>(parse_tree("true")));
    EXPECT_EQ(from_value<std::string>(parse_tree(R"("s")")), "s");
}

TEST(Conversion, IntegerRangeIsChecked) {
    try {
        (void)from_value<short>(parse_tree("40000"));
        FAIL() << "expected OutOfRangeError";
    } catch (const OutOfRangeError& e) {
        EXPECT_EQ(e.code(), make_error_code(errc::integer_overflow));
    }
    EXPECT_THROW((void)from_value<unsigned>(parse_tree("-1")), TypeError);
    EXPECT_THROW((void)from_value<int>(parse_tree("1.5")), TypeError);
}

TEST(Conversion, Containers) {
    auto v = from_value<std::vector<int>>(parse_tree("[1, 2, 3]"));
    EXPECT_EQ(v, (std::vector<int>{1, 2, 3}));

    auto m = from_value<std::map<std::string, int>>(parse_tree(R"({"b": 2, "a": 1})"));
    EXPECT_EQ(m.at("a"), 1);
    EXPECT_EQ(m.at("b"), 2);

    auto u = from_value<std::unordered_map<std::string, std::string>>(parse_tree(R"({"k": "v"})"));
    EXPECT_EQ(u.at("k"), "v");
}

TEST(Conversion, Optional) {
    EXPECT_FALSE(from_value<std::optional<int>>(parse_tree("null")).has_value());
    EXPECT_EQ(from_value<std::optional<int>>(parse_tree("3")), 3);
}

// ═══════════════════════════════════════════════════════════════════════════════
// User types
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Conversion, NonIntrusiveMacro) {
    auto a = from_value<shop::Address>(parse_tree(R"({"city": "Oslo", "zip": "0150"})"));
    EXPECT_EQ(a.city, "Oslo");
    EXPECT_EQ(a.zip, "0150");

    auto missing_zip = from_value<shop::Address>(parse_tree(R"({"city": "Bergen"})"));
    EXPECT_FALSE(missing_zip.zip.has_value());
}

TEST(Conversion, IntrusiveMacroNests) {
    auto o = from_value<shop::Order>(parse_tree(R"({
        "id": 7,
        "items": ["pen", "ink"],
        "ship_to": {"city": "Rome"},
        "prices": {"pen": 1.5, "ink": 3}
    })"));
    EXPECT_EQ(o.id, 7);
    EXPECT_EQ(o.items.size(), 2u);
    EXPECT_EQ(o.ship_to.city, "Rome");
    EXPECT_DOUBLE_EQ(o.prices.at("ink"), 3.0);
}

TEST(Conversion, MissingRequiredFieldFails) {
    EXPECT_THROW((void)from_value<shop::Address>(parse_tree(R"({"zip": "1"})")), TypeError);
    EXPECT_THROW((void)from_value<shop::Address>(parse_tree("[]")), TypeError);
}

TEST(Conversion, TryFromValueReportsData) {
    auto ok = try_from_value<shop::Address>(parse_tree(R"({"city": "Lyon"})"));
    ASSERT_TRUE(ok);
    EXPECT_EQ(ok.value.city, "Lyon");

    auto bad = try_from_value<int>(parse_tree(R"("nope")"));
    EXPECT_FALSE(bad);
    EXPECT_EQ(bad.ec, make_error_code(errc::decode_failed));
    EXPECT_EQ(bad.value, 0);
    EXPECT_FALSE(bad.message.empty());
}
