#ifndef AST_H
#define AST_H

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

class SourceIndex;

struct AstNode;
using AstNodePtr = std::unique_ptr<AstNode>;

// One named property of an ESTree node. Scalars keep the JSON value the
// parser produced (strings, numbers, booleans, null, or plain objects such
// as regex literal values).
struct AstField {
  enum Kind { Scalar, Node, List };

  std::string name;
  Kind kind = Scalar;
  nlohmann::ordered_json scalar;
  AstNodePtr node;
  std::vector<AstNodePtr> list;  // entries may be null (array holes)
};

// Read-only syntax tree node. [start, end) is a byte span into the snapshot
// that was parsed; it is meaningless against any other text.
struct AstNode {
  std::string type;
  size_t start = 0;
  size_t end = 0;
  std::vector<AstField> fields;

  bool is(const char* t) const { return type == t; }

  const AstField* field(const char* name) const;
  const AstNode* child(const char* name) const;
  const std::vector<AstNodePtr>& list(const char* name) const;
  const nlohmann::ordered_json* scalar(const char* name) const;
  bool flag(const char* name) const;  // boolean scalar, false when absent
};

// Node helpers
const std::string* identifierName(const AstNode* n);
bool isIdentifier(const AstNode* n, const char* name);
bool literalNumber(const AstNode* n, double& out);
bool literalString(const AstNode* n, std::string& out);
bool literalInteger(const AstNode* n, long long& out);
std::string nodeText(const std::string& source, const AstNode& n);

// Calls fn(const AstNode&) for every child node in field order.
template <typename Fn>
void forEachChild(const AstNode& n, Fn&& fn) {
  for (const auto& f : n.fields) {
    if (f.kind == AstField::Node) {
      if (f.node) fn(*f.node);
    } else if (f.kind == AstField::List) {
      for (const auto& c : f.list)
        if (c) fn(*c);
    }
  }
}

/// Build an AstNode tree from a Reflect.parse ESTree JSON document.
/// Positions are shifted up by lineShift lines (wrapper prologue) and resolved
/// through index against source. Fails on malformed shapes or out-of-range positions.
bool astFromEstree(const nlohmann::ordered_json& j, const std::string& source,
                   const SourceIndex& index, unsigned lineShift, AstNodePtr& out,
                   std::string& error);

#endif // AST_H
