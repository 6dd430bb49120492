#include <gtest/gtest.h>

#include "js_parser.h"
#include "scope.h"
#include "test_support.h"

namespace {

const AstNode* statement(const AstNode& root, size_t i) {
  const auto& body = root.list("body");
  return i < body.size() ? body[i].get() : nullptr;
}

TEST(JsParserTest, ProgramSpansCallerText) {
  const std::string src = "var a = 1;\nfoo(a);";
  AstNodePtr root = parseForTest(src);
  ASSERT_TRUE(root);
  EXPECT_TRUE(root->is("Program"));
  EXPECT_EQ(root->start, 0u);
  EXPECT_EQ(root->end, src.size());
  ASSERT_EQ(root->list("body").size(), 2u);

  const AstNode* call = statement(*root, 1);
  ASSERT_TRUE(call);
  EXPECT_EQ(call->start, 11u);
  EXPECT_EQ(nodeText(src, *call), "foo(a);");
}

TEST(JsParserTest, SpansAreByteOffsetsPastMultiByteText) {
  const std::string src = "var s = '\xC3\xA9\xF0\x9F\x98\x80';\r\nx();";
  AstNodePtr root = parseForTest(src);
  ASSERT_TRUE(root);
  const AstNode* second = statement(*root, 1);
  ASSERT_TRUE(second);
  EXPECT_EQ(nodeText(src, *second), "x();");

  std::string value;
  const AstNode* decl = statement(*root, 0)->list("declarations")[0].get();
  ASSERT_TRUE(literalString(decl->child("init"), value));
  EXPECT_EQ(value, "\xC3\xA9\xF0\x9F\x98\x80");
}

TEST(JsParserTest, TopLevelReturnIsAccepted) {
  AstNodePtr root = parseForTest("if (done) return;\nrun();");
  ASSERT_TRUE(root);
  EXPECT_EQ(root->list("body").size(), 2u);
}

TEST(JsParserTest, ModuleTokensAreTolerated) {
  const std::string src =
      "import { a } from './a.js';\n"
      "export var x = 1;\n"
      "function load() { return import('./lazy.js'); }\n"
      "export default x;\n"
      "export { load };\n"
      "run(x);";
  AstNodePtr root = parseForTest(src);
  ASSERT_TRUE(root);
  const auto& body = root->list("body");
  ASSERT_EQ(body.size(), 4u);

  EXPECT_TRUE(body[0]->is("VariableDeclaration"));
  EXPECT_EQ(nodeText(src, *body[0]), "var x = 1;");
  EXPECT_TRUE(body[1]->is("FunctionDeclaration"));
  EXPECT_NE(nodeText(src, *body[1]).find("import('./lazy.js')"), std::string::npos);
  EXPECT_EQ(nodeText(src, *body[2]), "export default x;");
  EXPECT_EQ(nodeText(src, *body[3]), "run(x);");
}

TEST(JsParserTest, NestedExportStillParses) {
  const std::string src = "if (ready) {\n  export function f() {}\n}\ngo();";
  AstNodePtr root = parseForTest(src);
  ASSERT_TRUE(root);
  EXPECT_EQ(nodeText(src, *root->list("body").back()), "go();");
}

TEST(JsParserTest, SyntaxErrorReportsCallerLine) {
  AstNodePtr root;
  ParseError err;
  EXPECT_FALSE(testParser().parse("var a = 1;\nvar = 2;", root, err));
  EXPECT_EQ(err.line, 2u);
  EXPECT_FALSE(err.message.empty());
}

TEST(JsParserTest, SourceClosingTheWrapperIsRejected) {
  AstNodePtr root;
  ParseError err;
  EXPECT_FALSE(testParser().parse("}); (function(){", root, err));
}

TEST(JsParserTest, LiteralValues) {
  AstNodePtr root = parseForTest("null;\n1e999;\n/ab+/g;\n'x';");
  ASSERT_TRUE(root);

  JsValue v;
  ASSERT_TRUE(literalValue(statement(*root, 0)->child("expression"), v));
  EXPECT_EQ(v.kind, JsValue::Null);

  // Non-finite numbers and regular expressions are not plain values
  EXPECT_FALSE(literalValue(statement(*root, 1)->child("expression"), v));
  EXPECT_FALSE(literalValue(statement(*root, 2)->child("expression"), v));

  ASSERT_TRUE(literalValue(statement(*root, 3)->child("expression"), v));
  EXPECT_EQ(v.string, "x");
}

TEST(JsParserTest, ParserIsReusable) {
  for (int i = 0; i < 3; ++i) {
    AstNodePtr root = parseForTest("f(" + std::to_string(i) + ");");
    ASSERT_TRUE(root);
  }
  AstNodePtr root;
  ParseError err;
  EXPECT_FALSE(testParser().parse("(", root, err));
  EXPECT_TRUE(parseForTest("ok();"));
}

}  // namespace
