#include <richdoc-cpp/value.hpp>

#include <gtest/gtest.h>

#include <functional>
#include <string>

using namespace richdoc_cpp;

// -- Null ---------------------------------------------------------------------

TEST(Null, all_nulls_are_equal) {
    EXPECT_EQ(Null{}, Null{});
}

// -- ScalarValue --------------------------------------------------------------

TEST(ScalarValue, holds_each_alternative) {
    EXPECT_TRUE(std::holds_alternative<Null>(ScalarValue{Null{}}));
    EXPECT_TRUE(std::holds_alternative<bool>(ScalarValue{true}));
    EXPECT_TRUE(std::holds_alternative<std::int64_t>(ScalarValue{std::int64_t{7}}));
    EXPECT_TRUE(std::holds_alternative<double>(ScalarValue{2.5}));
    EXPECT_TRUE(std::holds_alternative<std::string>(ScalarValue{std::string{"x"}}));
}

TEST(ScalarValue, get_scalar_matches_type) {
    const auto v = ScalarValue{std::int64_t{42}};
    EXPECT_EQ(get_scalar<std::int64_t>(v), std::int64_t{42});
    EXPECT_FALSE(get_scalar<std::string>(v).has_value());
}

TEST(ScalarValue, to_string_renders_every_alternative) {
    EXPECT_EQ(to_string(ScalarValue{Null{}}), "null");
    EXPECT_EQ(to_string(ScalarValue{false}), "false");
    EXPECT_EQ(to_string(ScalarValue{std::int64_t{-3}}), "-3");
    EXPECT_EQ(to_string(ScalarValue{0.5}), "0.5");
    EXPECT_EQ(to_string(ScalarValue{std::string{"hi"}}), "\"hi\"");
}

TEST(ScalarValue, equal_values_hash_equal) {
    const auto h = std::hash<ScalarValue>{};
    EXPECT_EQ(h(ScalarValue{std::string{"a"}}), h(ScalarValue{std::string{"a"}}));
    EXPECT_EQ(h(ScalarValue{Null{}}), h(ScalarValue{Null{}}));
}

// -- Metadata -----------------------------------------------------------------

TEST(Metadata, get_scalar_by_key) {
    const auto m = Metadata{
        {"align", std::string{"center"}},
        {"level", std::int64_t{2}},
    };

    EXPECT_EQ(get_scalar<std::string>(m, "align"), std::string{"center"});
    EXPECT_EQ(get_scalar<std::int64_t>(m, "level"), std::int64_t{2});
    EXPECT_FALSE(get_scalar<std::int64_t>(m, "align").has_value());
    EXPECT_FALSE(get_scalar<bool>(m, "missing").has_value());
}

TEST(Metadata, to_string_lists_keys_in_order) {
    const auto m = Metadata{
        {"b", true},
        {"a", std::int64_t{1}},
    };
    EXPECT_EQ(to_string(m), "{a: 1, b: true}");
    EXPECT_EQ(to_string(Metadata{}), "{}");
}

TEST(Metadata, equal_maps_hash_equal) {
    const auto a = Metadata{{"k", std::string{"v"}}};
    const auto b = Metadata{{"k", std::string{"v"}}};
    EXPECT_EQ(std::hash<Metadata>{}(a), std::hash<Metadata>{}(b));
}

// -- overload -----------------------------------------------------------------

TEST(Overload, dispatches_on_alternative) {
    const auto describe = [](const ScalarValue& v) {
        return std::visit(overload{
            [](const std::string&) { return std::string{"string"}; },
            [](std::int64_t) { return std::string{"int"}; },
            [](const auto&) { return std::string{"other"}; },
        }, v);
    };

    EXPECT_EQ(describe(ScalarValue{std::string{"s"}}), "string");
    EXPECT_EQ(describe(ScalarValue{std::int64_t{1}}), "int");
    EXPECT_EQ(describe(ScalarValue{1.0}), "other");
}
