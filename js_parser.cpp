/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "js_parser.h"
#include "source_index.h"
#include "logging.h"

#include <algorithm>
#include <cstdint>

// Suppress SpiderMonkey offsetof warnings on non-standard-layout types
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Winvalid-offsetof"
#include <jsapi.h>
#pragma clang diagnostic pop

using json = nlohmann::ordered_json;

// The script is parsed as the body of a function expression so that a
// top-level return (common in packer output) is legal. The prologue ends with
// a newline, so every position in the caller's text is exactly one line lower.
static const char16_t kWrapPrologue[] = u"(function(){\n";
static const char16_t kWrapEpilogue[] = u"\n})";
static const unsigned kWrapLines = 1;

// import/export tokens the engine rejects inside the wrapper are masked in
// place and the parse retried, at most this many times per source.
static const int kMaxMaskedTokens = 256;

static const JSClass global_class = {
  "global", JSCLASS_GLOBAL_FLAGS,
  JS_PropertyStub, JS_DeletePropertyStub, JS_PropertyStub, JS_StrictPropertyStub,
  JS_EnumerateStub, JS_ResolveStub, JS_ConvertStub, nullptr,
  nullptr, nullptr, nullptr, JS_GlobalObjectTraceHook
};

struct JsParser::Impl {
  JSRuntime* rt = nullptr;
  JSContext* cx = nullptr;
  std::unique_ptr<JS::PersistentRootedObject> global;
  bool engineStarted = false;

  // Last report delivered by the engine's error reporter
  bool haveReport = false;
  unsigned line = 0;
  unsigned column = 0;
  std::string message;
};

static void reportError(JSContext* cx, const char* message, JSErrorReport* report) {
  auto* impl = static_cast<JsParser::Impl*>(JS_GetContextPrivate(cx));
  if (!impl) return;
  impl->haveReport = true;
  impl->message = message ? message : "syntax error";
  impl->line = report ? report->lineno : 0;
  impl->column = report ? report->column : 0;
}

static bool writeJson(const jschar* buf, uint32_t len, void* data) {
  static_cast<std::u16string*>(data)->append(reinterpret_cast<const char16_t*>(buf), len);
  return true;
}

// Errors raised outside a script frame reach the reporter directly;
// the rest are still pending here.
static void captureReport(JsParser::Impl& impl) {
  if (JS_IsExceptionPending(impl.cx) && !JS_ReportPendingException(impl.cx))
    JS_ClearPendingException(impl.cx);
}

// Move the pending exception (if any) into err, rebased onto the caller's text
static void takeError(JsParser::Impl& impl, const SourceIndex& index, const char* fallback,
                      ParseError& err) {
  captureReport(impl);
  if (!impl.haveReport) {
    err.message = fallback;
    return;
  }
  err.message = impl.message;
  unsigned line = impl.line > kWrapLines ? impl.line - kWrapLines : 1;
  if (line > index.lineCount()) line = (unsigned)index.lineCount();
  err.line = line;
  err.column = impl.column + 1;
}

// ---- Module token masking ----------------------------------------------------

static bool isLineTerminator(char16_t c) {
  return c == u'\n' || c == u'\r' || c == 0x2028 || c == 0x2029;
}

static bool isIdentChar(char16_t c) {
  return c == u'_' || c == u'$' || (c >= u'0' && c <= u'9') || (c >= u'a' && c <= u'z') ||
         (c >= u'A' && c <= u'Z') || c >= 0x80;
}

static size_t skipSpace(const std::u16string& t, size_t i) {
  while (i < t.size() && (t[i] == u' ' || t[i] == u'\t' || isLineTerminator(t[i]))) ++i;
  return i;
}

// kw at pos as a whole word, not a property name after '.'
static bool keywordAt(const std::u16string& t, size_t pos, const std::u16string& kw) {
  if (pos >= t.size() || t.compare(pos, kw.size(), kw) != 0) return false;
  if (pos > 0 && (isIdentChar(t[pos - 1]) || t[pos - 1] == u'.')) return false;
  return pos + kw.size() >= t.size() || !isIdentChar(t[pos + kw.size()]);
}

static bool lineBounds(const std::u16string& t, unsigned line, size_t& begin, size_t& end) {
  size_t pos = 0;
  for (unsigned l = 1; l < line; ++l) {
    while (pos < t.size() && !isLineTerminator(t[pos])) ++pos;
    if (pos >= t.size()) return false;
    if (t[pos] == u'\r' && pos + 1 < t.size() && t[pos + 1] == u'\n') ++pos;
    ++pos;
  }
  begin = pos;
  end = pos;
  while (end < t.size() && !isLineTerminator(t[end])) ++end;
  return true;
}

// End of an import/export clause: through its module specifier, or through
// a local export list, plus the terminating semicolon.
static size_t clauseEnd(const std::u16string& t, size_t i) {
  while (i < t.size()) {
    char16_t c = t[i];
    if (c == u';') return i + 1;
    if (c == u'\'' || c == u'"') {
      for (++i; i < t.size() && t[i] != c && !isLineTerminator(t[i]); ++i) {
        if (t[i] == u'\\') ++i;
      }
      i = std::min(i + 1, t.size());
      break;
    }
    if (c == u'}') {
      size_t next = skipSpace(t, i + 1);
      if (!keywordAt(t, next, u"from")) {
        ++i;
        break;
      }
      i = next + 4;
      continue;
    }
    ++i;
  }
  size_t next = i;
  while (next < t.size() && (t[next] == u' ' || t[next] == u'\t')) ++next;
  return next < t.size() && t[next] == u';' ? next + 1 : i;
}

// Overwrite [from, to) with spaces, keeping line terminators
static void blank(std::u16string& t, size_t from, size_t to) {
  for (size_t i = from; i < to && i < t.size(); ++i) {
    if (!isLineTerminator(t[i])) t[i] = u' ';
  }
}

// Rewrite the import/export token nearest the reported position into script
// syntax of the same length. False when the line holds no such token.
static bool maskModuleToken(std::u16string& t, unsigned line, unsigned column) {
  size_t begin = 0, end = 0;
  if (!lineBounds(t, line, begin, end)) return false;

  size_t at = std::u16string::npos;
  for (size_t i = begin; i < end; ++i) {
    if (!keywordAt(t, i, u"import") && !keywordAt(t, i, u"export")) continue;
    if (i <= begin + column || at == std::u16string::npos) at = i;
    if (i > begin + column) break;
  }
  if (at == std::u16string::npos) return false;

  size_t after = skipSpace(t, at + 6);
  if (t[at] == u'i') {
    if (after < t.size() && (t[after] == u'(' || t[after] == u'.')) {
      t[at] = u'I';  // import(...) and import.meta read as a plain identifier
    } else {
      blank(t, at, clauseEnd(t, after));
    }
  } else if (keywordAt(t, after, u"default")) {
    blank(t, at, after + 7);
    t.replace(at, 4, u"void");
  } else if (after < t.size() && (t[after] == u'{' || t[after] == u'*')) {
    blank(t, at, clauseEnd(t, after));
  } else {
    blank(t, at, at + 6);  // export var / function / class
  }
  return true;
}

static const json* member(const json& j, const char* key) {
  if (!j.is_object()) return nullptr;
  auto it = j.find(key);
  return it == j.end() ? nullptr : &*it;
}

static bool hasType(const json* j, const char* type) {
  const json* t = j ? member(*j, "type") : nullptr;
  return t && t->is_string() && t->get<std::string>() == type;
}

// Program > ExpressionStatement > FunctionExpression > BlockStatement > body
static const json* wrappedStatements(const json& doc) {
  const json* top = member(doc, "body");
  if (!top || !top->is_array() || top->size() != 1) return nullptr;
  const json* stmt = &(*top)[0];
  if (!hasType(stmt, "ExpressionStatement")) return nullptr;
  const json* fn = member(*stmt, "expression");
  if (!hasType(fn, "FunctionExpression")) return nullptr;
  const json* block = member(*fn, "body");
  if (!hasType(block, "BlockStatement")) return nullptr;
  const json* body = member(*block, "body");
  if (!body || !body->is_array()) return nullptr;
  return body;
}

JsParser::JsParser() : impl_(new Impl) {}

JsParser::~JsParser() {
  if (impl_->cx) {
    impl_->global.reset();
    JS_DestroyContext(impl_->cx);
  }
  if (impl_->rt) JS_DestroyRuntime(impl_->rt);
  if (impl_->engineStarted) JS_ShutDown();
}

bool JsParser::init(std::string& error) {
  if (impl_->cx) return true;

  if (!JS_Init()) {
    error = "JS_Init failed";
    return false;
  }
  impl_->engineStarted = true;

  impl_->rt = JS_NewRuntime(64 * 1024 * 1024);
  if (!impl_->rt) {
    error = "JS_NewRuntime failed";
    return false;
  }
  impl_->cx = JS_NewContext(impl_->rt, 32 * 1024);
  if (!impl_->cx) {
    error = "JS_NewContext failed";
    return false;
  }
  JS_SetContextPrivate(impl_->cx, impl_.get());
  JS_SetErrorReporter(impl_->cx, reportError);
  logDebugf("JS runtime/context created");

  JSContext* cx = impl_->cx;
  JSAutoRequest ar(cx);
  JS::CompartmentOptions opts;
  JS::RootedObject global(cx, JS_NewGlobalObject(cx, &global_class, nullptr,
                                                 JS::FireOnNewGlobalHook, opts));
  if (!global) {
    error = "JS_NewGlobalObject failed";
    return false;
  }
  JSAutoCompartment ac(cx, global);
  if (!JS_InitStandardClasses(cx, global) || !JS_InitReflect(cx, global)) {
    error = "failed to initialize standard classes / Reflect";
    return false;
  }
  impl_->global.reset(new JS::PersistentRootedObject(cx, global));
  logDebugf("global created, Reflect.parse available");
  return true;
}

bool JsParser::parse(const std::string& source, AstNodePtr& out, ParseError& err) {
  err = ParseError();
  impl_->haveReport = false;
  if (!impl_->cx || !impl_->global) {
    err.message = "parser not initialized";
    return false;
  }

  JSContext* cx = impl_->cx;
  SourceIndex index(source);

  std::u16string wrapped(kWrapPrologue);
  wrapped += index.utf16();
  wrapped += kWrapEpilogue;

  JSAutoRequest ar(cx);
  JS::RootedObject global(cx, impl_->global->get());
  JSAutoCompartment ac(cx, global);

  JS::RootedObject options(cx, JS_NewObject(cx, nullptr, JS::NullPtr(), JS::NullPtr()));
  JS::RootedValue yes(cx, JS::BooleanValue(true));
  if (!options || !JS_SetProperty(cx, options, "loc", yes)) {
    takeError(*impl_, index, "out of memory preparing source", err);
    return false;
  }

  JS::RootedValue reflectVal(cx);
  if (!JS_GetProperty(cx, global, "Reflect", &reflectVal) || !reflectVal.isObject()) {
    takeError(*impl_, index, "Reflect is unavailable", err);
    return false;
  }
  JS::RootedObject reflect(cx, &reflectVal.toObject());

  JS::RootedValue tree(cx);
  for (int masked = 0;; ++masked) {
    JS::RootedString str(cx, JS_NewUCStringCopyN(cx, reinterpret_cast<const jschar*>(wrapped.data()),
                                                 wrapped.size()));
    if (!str) {
      takeError(*impl_, index, "out of memory preparing source", err);
      return false;
    }
    JS::AutoValueArray<2> args(cx);
    args[0].setString(str);
    args[1].setObject(*options);
    if (JS_CallFunctionName(cx, reflect, "parse", args, &tree)) break;

    captureReport(*impl_);
    if (!impl_->haveReport || masked >= kMaxMaskedTokens ||
        !maskModuleToken(wrapped, impl_->line, impl_->column)) {
      takeError(*impl_, index, "parse failed", err);
      return false;
    }
    logDebugf("masked module syntax on line %u, retrying", impl_->line - kWrapLines);
    impl_->haveReport = false;
  }
  logDebugf("Reflect.parse: success (%zu bytes)", source.size());

  std::u16string text;
  if (!JS_Stringify(cx, &tree, JS::NullPtr(), JS::NullHandleValue, writeJson, &text)) {
    takeError(*impl_, index, "failed to serialize syntax tree", err);
    return false;
  }

  json doc;
  try {
    doc = json::parse(utf16ToUtf8(text));
  } catch (const json::exception& e) {
    err.message = std::string("failed to decode syntax tree: ") + e.what();
    return false;
  }

  const json* stmts = wrappedStatements(doc);
  if (!stmts) {
    // Only reachable when the source closes the wrapper function itself
    err.message = "unbalanced script body";
    err.line = (unsigned)index.lineCount();
    err.column = 1;
    return false;
  }

  auto program = std::make_unique<AstNode>();
  program->type = "Program";
  program->start = 0;
  program->end = source.size();

  AstField body;
  body.name = "body";
  body.kind = AstField::List;
  body.list.reserve(stmts->size());
  for (const auto& stmt : *stmts) {
    AstNodePtr node;
    std::string msg;
    if (!astFromEstree(stmt, source, index, kWrapLines, node, msg)) {
      err.message = msg;
      return false;
    }
    body.list.push_back(std::move(node));
  }
  program->fields.push_back(std::move(body));

  out = std::move(program);
  return true;
}
