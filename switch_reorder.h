#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "ast.h"
#include "rewrite.h"
#include "scope.h"

struct ReorderedLoop {
  size_t start = 0;
  size_t end = 0;
  std::vector<long long> order;  // final permuted sequence driving the loop
};

struct ReorderResult {
  std::vector<Replacement> replacements;
  std::vector<ReorderedLoop> loops;  // same order as replacements
  size_t candidates = 0;             // loops over a tracked array
};

/// Three identifier parameters; body keeps a temp from an indexed read and
/// performs at least two indexed stores.
bool isSwapFunctionShape(const AstNode& fn);

/// Replace every for-of/switch dispatch loop over a statically permuted
/// integer array with its case bodies in execution order.
ReorderResult reorderSwitchLoops(const AstNode& root, const std::string& source);
