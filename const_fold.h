#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "ast.h"
#include "rewrite.h"
#include "scope.h"

struct FoldResult {
  std::vector<Replacement> replacements;
  size_t examined = 0;  // if statements looked at
};

/// Typed evaluation of an expression made only of literals, Literal/MathRef
/// bound identifiers, unary/binary/logical operators and calls through
/// MathRef bindings. Anything else (or a coercion we cannot model) fails.
bool evaluateConstant(const AstNode& expr, const Scope& scope, JsValue& out);

/// Branch truth of a test: a boolean result as-is, a number is true iff
/// strictly greater than zero, anything else is undecided.
bool decideCondition(const AstNode& test, const Scope& scope, bool& truth);

/// Replace every statically decidable if-test with true/false.
FoldResult foldConstantConditions(const AstNode& root, const std::string& source);
