#include "unpacker.h"
#include "const_fold.h"
#include "js_parser.h"
#include "logging.h"
#include "rewrite.h"
#include "switch_reorder.h"

static bool parseSnapshot(JsParser& parser, const std::string& text, const char* what,
                          AstNodePtr& root, std::string& error) {
  ParseError perr;
  if (!parser.parse(text, root, perr)) {
    error = std::string(what) + ": " + perr.message;
    if (perr.line) {
      error += " (line " + std::to_string(perr.line) + ", column " + std::to_string(perr.column) + ")";
    }
    return false;
  }
  return true;
}

bool unpackSource(JsParser& parser, const std::string& source, const UnpackOptions& options,
                  UnpackResult& result, std::string& error) {
  result = UnpackResult();

  AstNodePtr root;
  if (!parseSnapshot(parser, source, "parse failed", root, error)) return false;

  ExtractResult extracted;
  FoldResult folded;
  ReorderResult reordered;
  if (options.extract) extracted = extractModules(*root, source);
  if (options.fold) folded = foldConstantConditions(*root, source);
  if (options.reorder) reordered = reorderSwitchLoops(*root, source);

  // Registration calls win over loops, loops over conditions
  std::vector<Replacement> merged = extracted.replacements;
  size_t loopsDiscarded = mergeDisjoint(merged, reordered.replacements);
  size_t merges = merged.size();
  size_t foldsDiscarded = mergeDisjoint(merged, folded.replacements);

  result.artifacts = std::move(extracted.artifacts);
  result.skippedCalls = extracted.skipped;
  result.reorderedLoops = reordered.replacements.size() - loopsDiscarded;
  result.foldedConditions = merged.size() - merges;
  result.discardedEdits = loopsDiscarded + foldsDiscarded;
  if (result.discardedEdits) {
    logDebugf("%zu edits fell inside extracted modules or recovered loops", result.discardedEdits);
  }

  std::string text;
  if (!applyReplacements(source, std::move(merged), text, error)) return false;

  // Recovered case bodies are new statement lists; their conditions were
  // either discarded above or never visible in the original shape.
  if (options.fold && result.reorderedLoops > 0) {
    AstNodePtr reparsed;
    if (!parseSnapshot(parser, text, "re-parse after reordering failed", reparsed, error)) return false;
    FoldResult refolded = foldConstantConditions(*reparsed, text);
    if (!refolded.replacements.empty()) {
      std::string next;
      if (!applyReplacements(text, refolded.replacements, next, error)) return false;
      text = std::move(next);
      result.foldedConditions += refolded.replacements.size();
    }
  }

  if (result.artifacts.empty()) {
    result.output = std::move(text);
    return true;
  }

  std::string prefix;
  for (const auto& a : result.artifacts) {
    prefix += moduleLoadStatement(a);
    prefix += "\n";
  }
  result.output = prefix + "\n" + text;
  return true;
}
