#include "minitest.hpp"
#include "pattern/Combinators.hpp"
#include "pattern/Describe.hpp"

using namespace combre::pattern;

TEST(describe_leaves) {
    ASSERT_EQ(describe(empty()), "empty");
    ASSERT_EQ(describe(dot()), ".");
    ASSERT_EQ(describe(literal('x')), "'x'");
    ASSERT_EQ(describe(literal(U'é')), "'U+00E9'");
    ASSERT_EQ(describe(literal(' ')), "'U+0020'");
    ASSERT_EQ(describe(range('a', 'f')), "[a-f]");
}

TEST(describe_merges_set_ranges) {
    ASSERT_EQ(describe(one_of("01")), "[0-1]");
    ASSERT_EQ(describe(one_of("cabx")), "[a-cx]");
    ASSERT_EQ(describe(one_of("a-")), "[U+002Da]");
}

TEST(describe_composites) {
    auto p = alternation(literal('0'), sequence(literal('1'), zero_or_more(one_of("01"))));
    ASSERT_EQ(p.describe(), "alt('0', seq('1', star([0-1])))");
    ASSERT_EQ(describe(optional(dot())), "opt(.)");
}
