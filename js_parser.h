#ifndef JS_PARSER_H
#define JS_PARSER_H

#include <memory>
#include <string>

#include "ast.h"

// 1-based line and column relative to the text handed to parse()
struct ParseError {
  unsigned line = 0;
  unsigned column = 0;
  std::string message;
};

/// Owns one SpiderMonkey runtime with a global that has Reflect.parse
/// installed. Not thread-safe; one instance per process is enough.
class JsParser {
public:
  JsParser();
  ~JsParser();

  JsParser(const JsParser&) = delete;
  JsParser& operator=(const JsParser&) = delete;

  bool init(std::string& error);

  /// Parse source as a script body (top-level return allowed, stray
  /// import/export tokens masked). On success out is a Program node whose
  /// spans are byte offsets into source.
  bool parse(const std::string& source, AstNodePtr& out, ParseError& err);

  // Engine state lives in the .cpp to avoid forcing jsapi.h on all users.
  struct Impl;

private:
  std::unique_ptr<Impl> impl_;
};

#endif // JS_PARSER_H
