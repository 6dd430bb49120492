#include <gtest/gtest.h>

#include "const_fold.h"
#include "test_support.h"

namespace {

// Source after folding every decidable condition
std::string fold(const std::string& src) {
  AstNodePtr root = parseForTest(src);
  if (!root) return src;
  FoldResult r = foldConstantConditions(*root, src);
  return applyForTest(src, r.replacements);
}

// Value of the expression statement `src`, evaluated with no bindings
bool evaluate(const std::string& src, JsValue& out) {
  AstNodePtr root = parseForTest(src);
  if (!root) return false;
  const auto& body = root->list("body");
  if (body.size() != 1 || !body[0]->is("ExpressionStatement")) {
    ADD_FAILURE() << "not a single expression statement: " << src;
    return false;
  }
  return evaluateConstant(*body[0]->child("expression"), Scope(), out);
}

// =============================================================================
// Evaluator
// =============================================================================

TEST(ConstEvalTest, Arithmetic) {
  JsValue v;
  ASSERT_TRUE(evaluate("(7 + 3) * 2 - 10 / 4;", v));
  EXPECT_EQ(v.kind, JsValue::Number);
  EXPECT_DOUBLE_EQ(v.number, 17.5);

  ASSERT_TRUE(evaluate("-7 % 3;", v));
  EXPECT_DOUBLE_EQ(v.number, -1);
}

TEST(ConstEvalTest, BitwiseUsesInt32) {
  JsValue v;
  ASSERT_TRUE(evaluate("-1 >>> 28;", v));
  EXPECT_DOUBLE_EQ(v.number, 15);

  ASSERT_TRUE(evaluate("1 << 31;", v));
  EXPECT_DOUBLE_EQ(v.number, -2147483648.0);

  ASSERT_TRUE(evaluate("~5 ^ 3;", v));
  EXPECT_DOUBLE_EQ(v.number, -7);
}

TEST(ConstEvalTest, EqualityAndCoercion) {
  JsValue v;
  ASSERT_TRUE(evaluate("null == void 0;", v));
  EXPECT_TRUE(v.boolean);

  ASSERT_TRUE(evaluate("null === void 0;", v));
  EXPECT_FALSE(v.boolean);

  ASSERT_TRUE(evaluate("true == 1;", v));
  EXPECT_TRUE(v.boolean);

  ASSERT_TRUE(evaluate("typeof null;", v));
  EXPECT_EQ(v.kind, JsValue::String);
  EXPECT_EQ(v.string, "object");
}

TEST(ConstEvalTest, StringsConcatenateAndCompare) {
  JsValue v;
  ASSERT_TRUE(evaluate("'a' + 'b' === 'ab';", v));
  EXPECT_TRUE(v.boolean);

  ASSERT_TRUE(evaluate("'apple' < 'banana';", v));
  EXPECT_TRUE(v.boolean);
}

TEST(ConstEvalTest, StringNumberMixAborts) {
  JsValue v;
  EXPECT_FALSE(evaluate("'1' == 1;", v));
  EXPECT_FALSE(evaluate("'1' + 1;", v));
  EXPECT_FALSE(evaluate("-'3';", v));
}

TEST(ConstEvalTest, LogicalOperatorsReturnOperands) {
  JsValue v;
  ASSERT_TRUE(evaluate("0 || 'x';", v));
  EXPECT_EQ(v.string, "x");

  ASSERT_TRUE(evaluate("1 && null;", v));
  EXPECT_EQ(v.kind, JsValue::Null);
}

TEST(ConstEvalTest, UnresolvedOperandAborts) {
  JsValue v;
  EXPECT_FALSE(evaluate("x + 1;", v));
  EXPECT_FALSE(evaluate("true || x;", v));
  EXPECT_FALSE(evaluate("Math.PI > 3;", v));
  EXPECT_FALSE(evaluate("f();", v));
  EXPECT_FALSE(evaluate("[] == 0;", v));
}

TEST(ConstEvalTest, DeepNestingAborts) {
  std::string src;
  for (int i = 0; i < 300; ++i) src += "- ";
  src += "1;";
  JsValue v;
  EXPECT_FALSE(evaluate(src, v));
}

// =============================================================================
// Folding
// =============================================================================

TEST(ConstFoldTest, LiteralArithmeticConditionFolds) {
  EXPECT_EQ(fold("if (2 + 2 > 3) { run(); }"), "if (true) { run(); }");
  EXPECT_EQ(fold("if (1 > 2) { a(); } else { b(); }"), "if (false) { a(); } else { b(); }");
}

TEST(ConstFoldTest, UnboundIdentifierIsLeftAlone) {
  EXPECT_EQ(fold("if (x > 3) { run(); }"), "if (x > 3) { run(); }");
}

TEST(ConstFoldTest, MathReferenceIsCalled) {
  const std::string src = "var a = Math.log;\nif (a(100) > a(1)) { go(); }";
  EXPECT_EQ(fold(src), "var a = Math.log;\nif (true) { go(); }");
}

TEST(ConstFoldTest, MathConstantAndLiteralBindings) {
  EXPECT_EQ(fold("var p = Math.PI, k = 3;\nif (p > k) {}"), "var p = Math.PI, k = 3;\nif (true) {}");
}

TEST(ConstFoldTest, MathRandomNeverFolds) {
  const std::string src = "var r = Math.random;\nif (r() > 2) {}";
  EXPECT_EQ(fold(src), src);
}

TEST(ConstFoldTest, NumericResultIsTrueOnlyWhenPositive) {
  EXPECT_EQ(fold("if (5 - 3) {}"), "if (true) {}");
  EXPECT_EQ(fold("if (2 - 3) {}"), "if (false) {}");
  EXPECT_EQ(fold("if (0 / 0) {}"), "if (false) {}");
}

TEST(ConstFoldTest, StringResultIsUndecided) {
  EXPECT_EQ(fold("if ('a') {}"), "if ('a') {}");
}

TEST(ConstFoldTest, AlreadyFoldedTestIsNotReemitted) {
  const std::string src = "if (true) {}";
  AstNodePtr root = parseForTest(src);
  ASSERT_TRUE(root);
  FoldResult r = foldConstantConditions(*root, src);
  EXPECT_TRUE(r.replacements.empty());
  EXPECT_EQ(r.examined, 1u);
}

TEST(ConstFoldTest, WrittenNamesAreNeverConstant) {
  const std::string a = "var k = 5;\nk = next();\nif (k > 3) {}";
  EXPECT_EQ(fold(a), a);

  const std::string b = "var k = 5;\nfunction f() { if (k > 3) {} }\nk++;";
  EXPECT_EQ(fold(b), b);
}

TEST(ConstFoldTest, ParameterHidesOuterBinding) {
  const std::string src = "var x = 5;\nfunction f(x) { if (x > 3) {} }";
  EXPECT_EQ(fold(src), src);
}

TEST(ConstFoldTest, DestructuringWritesAreNeverConstant) {
  for (const char* write : {"[x] = [5];\n", "({ k: x } = o);\n", "for ([x] of pairs) {}\n",
                            "var [x] = [5];\n"}) {
    const std::string src = std::string("var x = 1;\n") + write + "if (x > 3) {}";
    EXPECT_EQ(fold(src), src) << write;
  }
}

TEST(ConstFoldTest, CatchParameterHidesOuterBinding) {
  const std::string src = "var e = 0;\ntry { go(); } catch (e) { if (e) {} }";
  EXPECT_EQ(fold(src), src);
}

TEST(ConstFoldTest, DestructuredParameterHidesOuterBinding) {
  const std::string src = "var x = 5, z = 1;\nfunction f([x], { y: z }) { if (x > 3) {} if (z) {} }";
  EXPECT_EQ(fold(src), src);
}

TEST(ConstFoldTest, BindingsFlowIntoNestedBlocks) {
  EXPECT_EQ(fold("var n = 4;\nfunction f() { if (n === 4) { g(); } }"),
            "var n = 4;\nfunction f() { if (true) { g(); } }");
}

TEST(ConstFoldTest, NestedBlockDeclarationsDoNotLeak) {
  const std::string src = "{ var z = 1; }\nif (z) {}";
  EXPECT_EQ(fold(src), src);
}

TEST(ConstFoldTest, NestedIfInsideFoldedBranch) {
  EXPECT_EQ(fold("if (1 < 2) { if (3 < 2) { a(); } }"), "if (true) { if (false) { a(); } }");
}

TEST(ConstFoldTest, NonIfConditionsAreNotTouched) {
  const std::string src = "while (1 > 2) {}\nvar y = 3 > 2 ? a : b;";
  EXPECT_EQ(fold(src), src);
}

}  // namespace
