#pragma once

#include <cstddef>
#include <string>
#include <vector>

// Span-addressed substitution. Valid only against the snapshot it was
// computed from.
struct Replacement {
  size_t start = 0;
  size_t end = 0;
  std::string text;
};

inline bool spansOverlap(const Replacement& a, const Replacement& b) {
  return a.start < b.end && b.start < a.end;
}

/// Splice every replacement into text, highest start offset first, so edits
/// already applied never move the offsets of pending ones. Fails without
/// touching out when a span is out of range or two spans overlap.
bool applyReplacements(const std::string& text, std::vector<Replacement> reps,
                       std::string& out, std::string& error);

/// Append the candidates that overlap nothing already accepted.
/// Returns how many were discarded.
size_t mergeDisjoint(std::vector<Replacement>& accepted, const std::vector<Replacement>& candidates);
