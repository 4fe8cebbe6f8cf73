#include "minitest.hpp"
#include "pattern/Catalog.hpp"

using namespace combre::pattern;

static Pattern get(std::string_view name) {
    auto p = builtin(name);
    if (!p) throw mini::AssertionError("missing builtin " + std::string(name));
    return *p;
}

TEST(catalog_lists_every_name) {
    const auto& names = builtin_names();
    ASSERT_EQ(names.size(), 5u);
    for (auto n : names) ASSERT_TRUE(builtin(n).has_value());
    ASSERT_FALSE(builtin("nope").has_value());
}

TEST(catalog_binary) {
    auto p = get("binary");
    ASSERT_TRUE(p.is_match("0"));
    ASSERT_TRUE(p.is_match("1101001"));
    ASSERT_FALSE(p.is_match("01"));
}

TEST(catalog_integer) {
    auto p = get("integer");
    ASSERT_TRUE(p.is_match("0"));
    ASSERT_TRUE(p.is_match("-42"));
    ASSERT_FALSE(p.is_match("-"));
    ASSERT_FALSE(p.is_match("007"));
}

TEST(catalog_decimal) {
    auto p = get("decimal");
    ASSERT_TRUE(p.is_match("31415926535897932384626.4338327950288419716939937"));
    ASSERT_FALSE(p.is_match("31415926535897932384626.4338327.95028841971693993"));
}

TEST(catalog_identifier) {
    auto p = get("identifier");
    ASSERT_TRUE(p.is_match("_tmp1"));
    ASSERT_TRUE(p.is_match("Matcher"));
    ASSERT_FALSE(p.is_match("1abc"));
    ASSERT_FALSE(p.is_match(""));
    ASSERT_FALSE(p.is_match("a-b"));
}

TEST(catalog_kernel_thread) {
    auto p = get("kernel_thread");
    ASSERT_TRUE(p.is_match("[kworker/0:0]"));
    ASSERT_TRUE(p.is_match("[rcu_preempt]"));
    ASSERT_FALSE(p.is_match("firefox"));
    ASSERT_FALSE(p.is_match("[]"));
    ASSERT_FALSE(p.is_match("["));
}
