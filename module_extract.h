#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "ast.h"
#include "rewrite.h"

// One recovered System.register module
struct ModuleArtifact {
  std::string fileName;    // <sanitized base>.js
  std::string symbol;      // Register<Base>
  std::string modulePath;  // first argument of the registration call
  std::string content;
};

struct ExtractResult {
  std::vector<ModuleArtifact> artifacts;
  std::vector<Replacement> replacements;  // one per artifact, same order
  size_t matched = 0;
  size_t skipped = 0;
};

// Name derivation
bool extractFileName(const std::string& modulePath, std::string& out);
bool sanitizeBaseName(const std::string& fileName, std::string& base);
std::string makeSymbolName(const std::string& base);

std::string moduleLoadStatement(const ModuleArtifact& artifact);

/// Collect every System.register(...) call in discovery order and turn each
/// one into an artifact plus a replacement of the call with <symbol>().
ExtractResult extractModules(const AstNode& root, const std::string& source);
