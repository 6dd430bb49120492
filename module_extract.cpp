#include "module_extract.h"
#include "logging.h"

#include <cctype>

static bool isAsciiAlnum(char c) {
  return std::isalnum((unsigned char)c) != 0;
}

static bool isIdentStart(char c) {
  return std::isalpha((unsigned char)c) != 0 || c == '_';
}

// Generated names must be usable as identifiers and file stems
static std::string ensureIdentStart(const std::string& s) {
  if (!s.empty() && isIdentStart(s[0])) return s;
  return "_" + s;
}

// "chunks:///_virtual/Foo.ts" -> "Foo.ts", "chunk:\\A\\B.ts" -> "B.ts"
bool extractFileName(const std::string& modulePath, std::string& out) {
  std::string clean;
  clean.reserve(modulePath.size());
  for (char c : modulePath) {
    if (c != '\'' && c != '"') clean.push_back(c);
  }

  for (char sep : {'\\', '/', ':'}) {
    size_t pos = clean.rfind(sep);
    if (pos != std::string::npos) clean = clean.substr(pos + 1);
  }

  size_t first = 0;
  while (first < clean.size()) {
    char c = clean[first];
    if (isAsciiAlnum(c) || c == '_' || c == '.' || c == '-') break;
    ++first;
  }
  clean = clean.substr(first);

  if (clean.empty()) return false;
  out = clean;
  return true;
}

bool sanitizeBaseName(const std::string& fileName, std::string& base) {
  // A leading dot is part of the name, not an extension separator
  size_t dot = fileName.rfind('.');
  std::string raw = (dot != std::string::npos && dot > 0) ? fileName.substr(0, dot) : fileName;

  std::string s;
  s.reserve(raw.size());
  for (char c : raw) {
    char mapped = (isAsciiAlnum(c) || c == '_') ? c : '_';
    if (mapped == '_' && !s.empty() && s.back() == '_') continue;
    s.push_back(mapped);
  }

  size_t b = s.find_first_not_of('_');
  if (b == std::string::npos) return false;
  size_t e = s.find_last_not_of('_');
  s = s.substr(b, e - b + 1);

  base = ensureIdentStart(s);
  return true;
}

std::string makeSymbolName(const std::string& base) {
  std::string pascal = base;
  if (!pascal.empty()) pascal[0] = (char)std::toupper((unsigned char)pascal[0]);
  return ensureIdentStart("Register" + pascal);
}

std::string moduleLoadStatement(const ModuleArtifact& artifact) {
  return "const { " + artifact.symbol + " } = require('./" + artifact.fileName + "');";
}

static std::string oneLine(const std::string& s) {
  std::string out = s;
  for (char& c : out) {
    if (c == '\n' || c == '\r') c = ' ';
  }
  return out;
}

static std::string renderArtifact(const std::string& modulePath, const std::string& symbol,
                                  const std::string& body) {
  std::string content;
  content.reserve(body.size() + 128);
  content += "// Generated from " + oneLine(modulePath) + "\n";
  content += "function " + symbol + "() {\n";
  content += "    " + body + "\n";
  content += "}\n\n";
  content += "module.exports = { " + symbol + " };\n";
  return content;
}

static bool isRegistrationCall(const AstNode& n) {
  if (!n.is("CallExpression")) return false;
  const AstNode* callee = n.child("callee");
  if (!callee || !callee->is("MemberExpression") || callee->flag("computed")) return false;
  return isIdentifier(callee->child("object"), "System") &&
         isIdentifier(callee->child("property"), "register");
}

// Pre-order, source order. A matched call is not searched further so the
// resulting replacements stay disjoint.
static void collectRegistrationCalls(const AstNode& n, std::vector<const AstNode*>& calls) {
  if (isRegistrationCall(n)) {
    calls.push_back(&n);
    return;
  }
  forEachChild(n, [&](const AstNode& c) { collectRegistrationCalls(c, calls); });
}

ExtractResult extractModules(const AstNode& root, const std::string& source) {
  ExtractResult result;

  std::vector<const AstNode*> calls;
  collectRegistrationCalls(root, calls);
  result.matched = calls.size();
  logDebugf("found %zu System.register calls", calls.size());

  for (size_t i = 0; i < calls.size(); ++i) {
    const AstNode& call = *calls[i];
    const auto& args = call.list("arguments");
    size_t n = i + 1;

    if (args.empty() || !args[0]) {
      deferWarnf("skipping call %zu: no arguments found", n);
      ++result.skipped;
      continue;
    }

    std::string modulePath;
    if (!literalString(args[0].get(), modulePath)) {
      deferWarnf("skipping call %zu: first argument is not a string literal (type: %s)",
                 n, args[0]->type.c_str());
      ++result.skipped;
      continue;
    }

    std::string fileName;
    if (!extractFileName(modulePath, fileName)) {
      deferWarnf("skipping call %zu: could not extract file name from \"%s\"", n, modulePath.c_str());
      ++result.skipped;
      continue;
    }

    std::string base;
    if (!sanitizeBaseName(fileName, base)) {
      deferWarnf("skipping call %zu: \"%s\" has no usable name characters", n, fileName.c_str());
      ++result.skipped;
      continue;
    }

    ModuleArtifact artifact;
    artifact.fileName = base + ".js";
    artifact.symbol = makeSymbolName(base);
    artifact.modulePath = modulePath;
    artifact.content = renderArtifact(modulePath, artifact.symbol, nodeText(source, call));
    logDebugf("processing: %s -> %s (%s)", modulePath.c_str(), artifact.fileName.c_str(),
              artifact.symbol.c_str());

    Replacement rep;
    rep.start = call.start;
    rep.end = call.end;
    rep.text = artifact.symbol + "()";

    result.artifacts.push_back(std::move(artifact));
    result.replacements.push_back(std::move(rep));
  }

  return result;
}
