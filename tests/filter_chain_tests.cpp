#include <gtest/gtest.h>

#include "expression_evaluator.h"
#include "filter_chain.h"
#include "variable_manager.h"

using lqv::ExpressionValue;

namespace {

class FilterChainTest : public ::testing::Test {
   protected:
    ExpressionValue apply(const ExpressionValue& value, const std::string& filter) {
        return lqv::filter_chain::apply_filter(value, filter, evaluator, variables);
    }

    ExpressionValue eval(const std::string& expression) {
        return evaluator.evaluate(expression, variables);
    }

    lqv::ExpressionEvaluator evaluator{nullptr};
    lqv::VariableManager variables;
};

}  // namespace

TEST_F(FilterChainTest, SplitDefaultsToComma) {
    ExpressionValue result = apply(ExpressionValue::from_string("a,b"), "split");
    ASSERT_TRUE(result.is_array());
    EXPECT_EQ(result.array_items().size(), 2u);
}

TEST_F(FilterChainTest, SplitOnEmptyDelimiterGivesCharacters) {
    ExpressionValue result = apply(ExpressionValue::from_string("abc"), "split: ''");
    ASSERT_TRUE(result.is_array());
    EXPECT_EQ(result.to_output_string(), "a,b,c");
}

TEST_F(FilterChainTest, ReplaceIsLiteralAndGlobal) {
    EXPECT_EQ(eval("'a-b-c' | replace: '-', '_'").string_value(), "a_b_c");
    EXPECT_EQ(eval("'a.b' | replace: '.', ''").string_value(), "ab");
}

TEST_F(FilterChainTest, ReplaceWithVariable) {
    variables.set_variable("sep", ExpressionValue::from_string("/"));
    EXPECT_EQ(eval("'a-b' | replace: '-', sep").string_value(), "a/b");
}

TEST_F(FilterChainTest, ArithmeticRoundsToFivePlaces) {
    EXPECT_DOUBLE_EQ(eval("10 | divided_by: 3").number_value(), 3.33333);
    EXPECT_DOUBLE_EQ(eval("10 | divided_by: 0").number_value(), 0.0);
    EXPECT_DOUBLE_EQ(eval("10 | minus: 4").number_value(), 6.0);
    EXPECT_DOUBLE_EQ(eval("10 | plus: 2.5").number_value(), 12.5);
    EXPECT_DOUBLE_EQ(eval("'abc' | times: 2").number_value(), 0.0);
    EXPECT_DOUBLE_EQ(eval("'14px' | times: 2").number_value(), 28.0);
}

TEST_F(FilterChainTest, UniqKeepsFirstOccurrence) {
    ExpressionValue result = eval("'b,a,b,c,a' | split: ',' | uniq");
    EXPECT_EQ(result.to_output_string(), "b,a,c");
}

TEST_F(FilterChainTest, SortNaturalOrdersDigitRuns) {
    ExpressionValue result = eval("'item10,item2,Item1' | split: ',' | sort_natural");
    EXPECT_EQ(result.to_output_string(), "Item1,item2,item10");
}

TEST_F(FilterChainTest, FindIndexMatchesTextThenNumber) {
    variables.set_variable("list", eval("'12,14,16' | split: ','"));
    EXPECT_DOUBLE_EQ(eval("list | find_index: '14'").number_value(), 1.0);
    EXPECT_DOUBLE_EQ(eval("list | find_index: '012'").number_value(), 0.0);
    EXPECT_DOUBLE_EQ(eval("list | find_index: '99'").number_value(), -1.0);
    EXPECT_DOUBLE_EQ(eval("'plain' | find_index: 'p'").number_value(), -1.0);
}

TEST_F(FilterChainTest, UnknownFiltersPassThrough) {
    ExpressionValue value = ExpressionValue::from_string("Inter");
    EXPECT_EQ(apply(value, "font_modify: 'weight', 'bold'").string_value(), "Inter");
    EXPECT_EQ(apply(value, "upcase").string_value(), "Inter");
    EXPECT_EQ(apply(value, "not a filter").string_value(), "Inter");
}

TEST(NaturalCompare, ComparesNumbersByValue) {
    EXPECT_LT(lqv::filter_chain::natural_compare("a2", "a10"), 0);
    EXPECT_GT(lqv::filter_chain::natural_compare("B", "a"), 0);
    EXPECT_EQ(lqv::filter_chain::natural_compare("x01", "x1"), 0);
    EXPECT_LT(lqv::filter_chain::natural_compare("ab", "abc"), 0);
}

TEST(RoundToFivePlaces, RoundsHalfUp) {
    EXPECT_DOUBLE_EQ(lqv::filter_chain::round_to_five_places(1.234567), 1.23457);
    EXPECT_DOUBLE_EQ(lqv::filter_chain::round_to_five_places(2.0), 2.0);
}
