#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>

#include "ast.h"

// ECMAScript primitive the static passes can reason about
struct JsValue {
  enum Kind { Undefined, Null, Boolean, Number, String };

  Kind kind = Undefined;
  bool boolean = false;
  double number = 0;
  std::string string;

  static JsValue makeUndefined() { return JsValue(); }
  static JsValue makeNull() { JsValue v; v.kind = Null; return v; }
  static JsValue makeBool(bool b) { JsValue v; v.kind = Boolean; v.boolean = b; return v; }
  static JsValue makeNumber(double d) { JsValue v; v.kind = Number; v.number = d; return v; }
  static JsValue makeString(const std::string& s) { JsValue v; v.kind = String; v.string = s; return v; }
};

// Value of a Literal node; false for regex and unrepresentable literals
bool literalValue(const AstNode* n, JsValue& out);

enum class BindingKind { Literal, MathRef, Array, SwapFunction };

// What a pass knows about an identifier at a given point of the traversal
struct Binding {
  BindingKind kind = BindingKind::Literal;
  JsValue literal;                  // Literal
  std::string mathName;             // MathRef, e.g. "Math.log"
  std::vector<long long> elements;  // Array, the modeled permutation
  int arrayId = 0;                  // Array, identity across scope copies
  int depth = 0;                    // Array, nesting depth of the declaring scope
  int functionLevel = 0;            // Array, function nesting of the declaration

  static Binding makeLiteral(const JsValue& v);
  static Binding makeMathRef(const std::string& name);
  static Binding makeArray(std::vector<long long> elements);
  static Binding makeSwapFunction();
};

// Flat identifier -> binding map. Passed by value into nested bodies so a
// callee's declarations never leak back to the caller.
using Scope = std::map<std::string, Binding>;

const Binding* findBinding(const Scope& scope, const std::string& name, BindingKind kind);
const char* bindingKindName(BindingKind kind);

bool isFunctionNode(const AstNode& n);

// Nodes visited with a copy of the scope so their declarations stay inside
bool opensScope(const AstNode& n);

// Identifiers bound by a declaration id or assignment target. Destructuring
// patterns are walked; member targets contribute nothing.
void collectPatternNames(const AstNode* target, std::vector<std::string>& out);

// Names written anywhere outside their declarators. These are never
// constants: a function body may run after a later write.
void collectWrittenNames(const AstNode& root, std::set<std::string>& out);

// Function parameters and catch parameters hide outer bindings
void hideParameters(const AstNode& n, Scope& scope);
