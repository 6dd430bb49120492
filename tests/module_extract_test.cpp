#include <gtest/gtest.h>

#include "logging.h"
#include "module_extract.h"
#include "test_support.h"

namespace {

class ModuleExtractTest : public ::testing::Test {
 protected:
  void SetUp() override { gDeferredWarnings.clear(); }
  void TearDown() override { gDeferredWarnings.clear(); }
};

// =============================================================================
// Name derivation
// =============================================================================

TEST(ModuleNameTest, FileNameKeepsLastPathSegment) {
  std::string name;
  ASSERT_TRUE(extractFileName("chunks:///_virtual/Foo.ts", name));
  EXPECT_EQ(name, "Foo.ts");

  ASSERT_TRUE(extractFileName("'chunk:\\A\\B.ts'", name));
  EXPECT_EQ(name, "B.ts");

  ASSERT_TRUE(extractFileName("\"plain.js\"", name));
  EXPECT_EQ(name, "plain.js");
}

TEST(ModuleNameTest, FileNameTrimsLeadingJunk) {
  std::string name;
  ASSERT_TRUE(extractFileName("pkg/$@x-y.js", name));
  EXPECT_EQ(name, "x-y.js");
}

TEST(ModuleNameTest, EmptyFileNameIsRejected) {
  std::string name;
  EXPECT_FALSE(extractFileName("chunks:///", name));
  EXPECT_FALSE(extractFileName("''", name));
  EXPECT_FALSE(extractFileName("a/@@@", name));
}

TEST(ModuleNameTest, VirtualChunkWithQueryCharacters) {
  std::string name, base;
  ASSERT_TRUE(extractFileName("chunks:///_virtual/util.mjs_cjs=&original=.js", name));
  ASSERT_TRUE(sanitizeBaseName(name, base));
  EXPECT_EQ(base, "util_mjs_cjs_original");
  EXPECT_EQ(makeSymbolName(base), "RegisterUtil_mjs_cjs_original");
}

TEST(ModuleNameTest, SanitizeDropsExtensionOnly) {
  std::string base;
  ASSERT_TRUE(sanitizeBaseName("game-scene.v2.ts", base));
  EXPECT_EQ(base, "game_scene_v2");
}

TEST(ModuleNameTest, LeadingDotIsNotAnExtension) {
  std::string base;
  ASSERT_TRUE(sanitizeBaseName(".eslintrc", base));
  EXPECT_EQ(base, "eslintrc");
}

TEST(ModuleNameTest, DigitsGetIdentifierPrefix) {
  std::string base;
  ASSERT_TRUE(sanitizeBaseName("404.js", base));
  EXPECT_EQ(base, "_404");
  EXPECT_EQ(makeSymbolName(base), "Register_404");
}

TEST(ModuleNameTest, NothingUsableIsRejected) {
  std::string base;
  EXPECT_FALSE(sanitizeBaseName("---.js", base));
  EXPECT_FALSE(sanitizeBaseName("_.ts", base));
}

TEST(ModuleNameTest, LoadStatement) {
  ModuleArtifact a;
  a.fileName = "Foo.js";
  a.symbol = "RegisterFoo";
  EXPECT_EQ(moduleLoadStatement(a), "const { RegisterFoo } = require('./Foo.js');");
}

// =============================================================================
// Extraction
// =============================================================================

TEST_F(ModuleExtractTest, OneArtifactPerCallInDiscoveryOrder) {
  const std::string src =
      "System.register(\"chunks:///_virtual/a.ts\", [], function (e) { return {}; });\n"
      "System.register(\"chunks:///_virtual/b.ts\", [], function (e) { return {}; });\n";
  AstNodePtr root = parseForTest(src);
  ASSERT_TRUE(root);

  ExtractResult r = extractModules(*root, src);
  EXPECT_EQ(r.matched, 2u);
  EXPECT_EQ(r.skipped, 0u);
  ASSERT_EQ(r.artifacts.size(), 2u);
  ASSERT_EQ(r.replacements.size(), 2u);

  EXPECT_EQ(r.artifacts[0].fileName, "a.js");
  EXPECT_EQ(r.artifacts[0].symbol, "RegisterA");
  EXPECT_EQ(r.artifacts[1].fileName, "b.js");
  EXPECT_EQ(r.artifacts[1].symbol, "RegisterB");
  EXPECT_EQ(r.replacements[0].text, "RegisterA()");

  EXPECT_EQ(applyForTest(src, r.replacements), "RegisterA();\nRegisterB();\n");
}

TEST_F(ModuleExtractTest, ArtifactWrapsCallTextVerbatim) {
  const std::string call = "System.register('x/Foo.ts', ['dep'], function (_export) {\n  var a = 1;\n})";
  const std::string src = "(function(){ " + call + "; })();";
  AstNodePtr root = parseForTest(src);
  ASSERT_TRUE(root);

  ExtractResult r = extractModules(*root, src);
  ASSERT_EQ(r.artifacts.size(), 1u);
  EXPECT_EQ(r.artifacts[0].modulePath, "x/Foo.ts");
  EXPECT_EQ(r.artifacts[0].content,
            "// Generated from x/Foo.ts\n"
            "function RegisterFoo() {\n"
            "    " + call + "\n"
            "}\n\n"
            "module.exports = { RegisterFoo };\n");
  EXPECT_EQ(src.substr(r.replacements[0].start, r.replacements[0].end - r.replacements[0].start), call);
}

TEST_F(ModuleExtractTest, NonLiteralFirstArgumentIsSkipped) {
  const std::string src =
      "System.register(name, [], function () {});\n"
      "System.register();\n"
      "System.register(\"x/c.ts\", [], function () {});\n";
  AstNodePtr root = parseForTest(src);
  ASSERT_TRUE(root);

  ExtractResult r = extractModules(*root, src);
  EXPECT_EQ(r.matched, 3u);
  EXPECT_EQ(r.skipped, 2u);
  ASSERT_EQ(r.artifacts.size(), 1u);
  EXPECT_EQ(r.artifacts[0].fileName, "c.js");
  EXPECT_EQ(gDeferredWarnings.size(), 2u);
}

TEST_F(ModuleExtractTest, NestedRegistrationStaysInsideOuterArtifact) {
  const std::string src =
      "System.register('a.ts', [], function () { System.register('b.ts', [], null); });";
  AstNodePtr root = parseForTest(src);
  ASSERT_TRUE(root);

  ExtractResult r = extractModules(*root, src);
  ASSERT_EQ(r.artifacts.size(), 1u);
  EXPECT_EQ(r.artifacts[0].symbol, "RegisterA");
  EXPECT_NE(r.artifacts[0].content.find("System.register('b.ts'"), std::string::npos);
}

TEST_F(ModuleExtractTest, OnlyPlainMemberCalleeMatches) {
  const std::string src =
      "System['register']('a.ts', []);\n"
      "Other.register('b.ts', []);\n"
      "register('c.ts');\n";
  AstNodePtr root = parseForTest(src);
  ASSERT_TRUE(root);

  ExtractResult r = extractModules(*root, src);
  EXPECT_EQ(r.matched, 0u);
  EXPECT_TRUE(r.artifacts.empty());
}

TEST_F(ModuleExtractTest, MultiLineModulePathStaysOnOneCommentLine) {
  const std::string src = "System.register('a\\nb/Mod.ts', []);";
  AstNodePtr root = parseForTest(src);
  ASSERT_TRUE(root);

  ExtractResult r = extractModules(*root, src);
  ASSERT_EQ(r.artifacts.size(), 1u);
  EXPECT_EQ(r.artifacts[0].content.rfind("// Generated from a b/Mod.ts\n", 0), 0u);
}

}  // namespace
