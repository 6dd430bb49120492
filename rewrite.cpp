#include "rewrite.h"
#include "logging.h"

#include <algorithm>

bool applyReplacements(const std::string& text, std::vector<Replacement> reps,
                       std::string& out, std::string& error) {
  std::sort(reps.begin(), reps.end(), [](const Replacement& a, const Replacement& b) {
    return a.start > b.start;
  });

  for (size_t i = 0; i < reps.size(); ++i) {
    const Replacement& r = reps[i];
    if (r.start > r.end || r.end > text.size()) {
      error = "replacement [" + std::to_string(r.start) + ", " + std::to_string(r.end) +
              ") outside of " + std::to_string(text.size()) + "-byte text";
      return false;
    }
    // reps[i - 1] starts at or after r.start
    if (i > 0 && spansOverlap(r, reps[i - 1])) {
      error = "overlapping replacements at offsets " + std::to_string(r.start) + " and " +
              std::to_string(reps[i - 1].start);
      return false;
    }
  }

  std::string result = text;
  for (const auto& r : reps) {
    result.replace(r.start, r.end - r.start, r.text);
  }
  logDebugf("applied %zu replacements (%zu -> %zu bytes)", reps.size(), text.size(), result.size());
  out = std::move(result);
  return true;
}

size_t mergeDisjoint(std::vector<Replacement>& accepted, const std::vector<Replacement>& candidates) {
  size_t discarded = 0;
  for (const auto& c : candidates) {
    bool clash = false;
    for (const auto& a : accepted) {
      if (spansOverlap(a, c)) { clash = true; break; }
    }
    if (clash) {
      logDebugf("discarding edit [%zu, %zu) nested in a wider one", c.start, c.end);
      ++discarded;
      continue;
    }
    accepted.push_back(c);
  }
  return discarded;
}
