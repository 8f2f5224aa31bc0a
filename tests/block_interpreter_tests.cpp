#include <gtest/gtest.h>

#include <memory>

#include "block_interpreter.h"
#include "expression_evaluator.h"
#include "loop_evaluator.h"
#include "settings_resolver.h"
#include "variable_manager.h"

using lqv::ExpressionValue;

namespace {

class BlockInterpreterTest : public ::testing::Test {
   protected:
    void SetUp() override {
        auto store = std::make_shared<lqv::SettingsStore>();
        store->current = lqv::ordered_json::parse(R"({"radius": 14, "scale": 120})");
        resolver = std::make_unique<lqv::SettingsResolver>(store);
        evaluator = std::make_unique<lqv::ExpressionEvaluator>(resolver.get());
        interpreter = std::make_unique<lqv::LiquidBlockInterpreter>(*evaluator);
    }

    std::unique_ptr<lqv::SettingsResolver> resolver;
    std::unique_ptr<lqv::ExpressionEvaluator> evaluator;
    std::unique_ptr<lqv::LiquidBlockInterpreter> interpreter;
};

}  // namespace

TEST_F(BlockInterpreterTest, AssignAndEcho) {
    std::string code = R"(
        assign r = settings.radius | times: 2
        echo '--radius: ' | append: r | append: 'px;'
    )";
    EXPECT_EQ(interpreter->execute(code), "--radius: 28px;");
}

TEST_F(BlockInterpreterTest, SkipsCommentBlocks) {
    std::string code = "comment\necho 'hidden'\nendcomment\necho 'shown'";
    EXPECT_EQ(interpreter->execute(code), "shown");

    std::string labelled = "comment explains things\necho 'hidden'\nendcomment";
    EXPECT_EQ(interpreter->execute(labelled), "");
}

TEST_F(BlockInterpreterTest, IgnoresUnsupportedStatements) {
    std::string code = "render 'icon'\ncapture x\necho 'ok'";
    EXPECT_EQ(interpreter->execute(code), "ok");
}

TEST_F(BlockInterpreterTest, ConditionalsSeeAssignedValues) {
    std::string code = R"(
        assign scale = settings.scale | divided_by: 100.0
        if scale > 1
          echo '--scale: large;'
        else
          echo '--scale: normal;'
        endif
        unless scale > 2
          echo '--cap: none;'
        endunless
    )";
    EXPECT_EQ(interpreter->execute(code), "--scale: large;--cap: none;");
}

TEST_F(BlockInterpreterTest, AssignedZeroIsTruthy) {
    EXPECT_EQ(interpreter->execute("assign z = 0\nif z\necho 'yes'\nendif"), "yes");
    EXPECT_EQ(interpreter->execute("assign w = 1.50\necho w"), "1.50");
}

TEST_F(BlockInterpreterTest, ForLoopBindsItemAndIndex) {
    std::string code = R"(
        assign sizes = '12,14' | split: ','
        for size in sizes
          echo '--size-' | append: forloop.index | append: ': ' | append: size | append: 'px;'
        endfor
        echo 'done'
    )";
    EXPECT_EQ(interpreter->execute(code), "--size-1: 12px;--size-2: 14px;done");
}

TEST_F(BlockInterpreterTest, ForLoopBodyRunsIfBlocks) {
    std::string code = R"(
        assign sizes = '1,2,3' | split: ','
        for size in sizes
          if forloop.index == 2
            echo size
          endif
        endfor
    )";
    EXPECT_EQ(interpreter->execute(code), "2");
}

TEST_F(BlockInterpreterTest, BindingsCanBeShared) {
    lqv::VariableManager variables;
    interpreter->execute("assign gap = 4", variables);
    EXPECT_EQ(interpreter->execute("echo gap", variables), "4");
    EXPECT_EQ(interpreter->execute("echo gap"), "gap");
}

TEST(LoopEvaluator, NonArrayCollectionRunsNothing) {
    lqv::ExpressionEvaluator evaluator(nullptr);
    lqv::VariableManager variables;
    variables.set_variable("items", ExpressionValue::from_string("a,b"));

    std::vector<std::string> lines = {"for item in items", "echo item", "endfor", "echo 'x'"};
    size_t idx = 0;
    EXPECT_EQ(lqv::loop_evaluator::handle_for_block(lines, idx, evaluator, variables), "");
    EXPECT_EQ(idx, 2u);
}

TEST(LoopEvaluator, NestedLoopsMatchTheirEndfor) {
    lqv::ExpressionEvaluator evaluator(nullptr);
    lqv::VariableManager variables;
    variables.set_variable("outer", evaluator.evaluate("'a,b' | split: ','", variables));

    std::vector<std::string> lines = {"for o in outer", "for i in inner", "endfor", "echo o",
                                      "endfor", "echo 'after'"};
    size_t idx = 0;
    EXPECT_EQ(lqv::loop_evaluator::handle_for_block(lines, idx, evaluator, variables), "ab");
    EXPECT_EQ(idx, 4u);
}

TEST(VariableManager, LaterBindingReplacesEarlier) {
    lqv::VariableManager variables;
    EXPECT_FALSE(variables.variable_is_set("a"));
    EXPECT_TRUE(variables.get_variable_value("a").is_absent());

    variables.set_variable("a", ExpressionValue::from_number(1));
    variables.set_variable("a", ExpressionValue::from_string("x"));
    EXPECT_TRUE(variables.variable_is_set("a"));
    EXPECT_EQ(variables.get_variable_value("a").string_value(), "x");

    variables.set_variable("a", ExpressionValue::absent());
    EXPECT_FALSE(variables.variable_is_set("a"));
}
