#ifndef UNPACKER_H
#define UNPACKER_H

#include <cstddef>
#include <string>
#include <vector>

#include "module_extract.h"

class JsParser;

struct UnpackOptions {
  bool extract = true;
  bool fold = true;
  bool reorder = true;
};

struct UnpackResult {
  std::vector<ModuleArtifact> artifacts;  // discovery order
  std::string output;                     // main file: load statements + rewritten text
  size_t foldedConditions = 0;            // across both folding runs
  size_t reorderedLoops = 0;
  size_t discardedEdits = 0;              // nested inside a wider accepted edit
  size_t skippedCalls = 0;
};

/// Run the enabled passes over source and compose their edits.
/// Fails (with error set) when a snapshot does not parse or the rewrite
/// engine rejects the merged edits; result is then unspecified.
bool unpackSource(JsParser& parser, const std::string& source, const UnpackOptions& options,
                  UnpackResult& result, std::string& error);

#endif // UNPACKER_H
