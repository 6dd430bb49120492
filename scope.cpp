#include "scope.h"

bool literalValue(const AstNode* n, JsValue& out) {
  if (!n || !n->is("Literal")) return false;
  const auto* v = n->scalar("value");
  if (!v) return false;
  if (v->is_null()) {
    out = JsValue::makeNull();
  } else if (v->is_boolean()) {
    out = JsValue::makeBool(v->get<bool>());
  } else if (v->is_number()) {
    out = JsValue::makeNumber(v->get<double>());
  } else if (v->is_string()) {
    out = JsValue::makeString(v->get<std::string>());
  } else {
    return false;
  }
  return true;
}

Binding Binding::makeLiteral(const JsValue& v) {
  Binding b;
  b.kind = BindingKind::Literal;
  b.literal = v;
  return b;
}

Binding Binding::makeMathRef(const std::string& name) {
  Binding b;
  b.kind = BindingKind::MathRef;
  b.mathName = name;
  return b;
}

Binding Binding::makeArray(std::vector<long long> elements) {
  Binding b;
  b.kind = BindingKind::Array;
  b.elements = std::move(elements);
  return b;
}

Binding Binding::makeSwapFunction() {
  Binding b;
  b.kind = BindingKind::SwapFunction;
  return b;
}

const Binding* findBinding(const Scope& scope, const std::string& name, BindingKind kind) {
  auto it = scope.find(name);
  if (it == scope.end() || it->second.kind != kind) return nullptr;
  return &it->second;
}

const char* bindingKindName(BindingKind kind) {
  switch (kind) {
    case BindingKind::Literal:      return "literal";
    case BindingKind::MathRef:      return "math-ref";
    case BindingKind::Array:        return "array";
    case BindingKind::SwapFunction: return "swap-function";
  }
  return "?";
}

bool isFunctionNode(const AstNode& n) {
  return n.is("FunctionDeclaration") || n.is("FunctionExpression") || n.is("ArrowFunctionExpression");
}

bool opensScope(const AstNode& n) {
  return n.is("BlockStatement") || isFunctionNode(n) || n.is("SwitchCase") || n.is("CatchClause");
}

void collectPatternNames(const AstNode* target, std::vector<std::string>& out) {
  if (!target) return;
  if (const std::string* name = identifierName(target)) {
    out.push_back(*name);
  } else if (target->is("ArrayPattern") || target->is("ArrayExpression")) {
    for (const auto& e : target->list("elements")) collectPatternNames(e.get(), out);
  } else if (target->is("ObjectPattern") || target->is("ObjectExpression")) {
    for (const auto& p : target->list("properties")) {
      if (!p) continue;
      // { a: x } binds x; a rest property binds its argument
      if (const AstNode* value = p->child("value")) collectPatternNames(value, out);
      else collectPatternNames(p.get(), out);
    }
  } else if (target->is("AssignmentPattern") || target->is("AssignmentExpression")) {
    collectPatternNames(target->child("left"), out);
  } else if (target->is("RestElement") || target->is("SpreadElement") ||
             target->is("SpreadExpression")) {
    collectPatternNames(target->child("argument"), out);
  } else if (target->is("VariableDeclaration")) {
    for (const auto& d : target->list("declarations")) {
      if (d) collectPatternNames(d->child("id"), out);
    }
  }
}

void collectWrittenNames(const AstNode& n, std::set<std::string>& out) {
  const AstNode* target = nullptr;
  if (n.is("AssignmentExpression")) target = n.child("left");
  else if (n.is("UpdateExpression")) target = n.child("argument");
  else if (n.is("ForInStatement") || n.is("ForOfStatement")) target = n.child("left");

  std::vector<std::string> names;
  collectPatternNames(target, names);
  out.insert(names.begin(), names.end());
  forEachChild(n, [&](const AstNode& c) { collectWrittenNames(c, out); });
}

void hideParameters(const AstNode& n, Scope& scope) {
  std::vector<std::string> names;
  if (isFunctionNode(n)) {
    for (const auto& p : n.list("params")) collectPatternNames(p.get(), names);
    collectPatternNames(n.child("rest"), names);
  } else if (n.is("CatchClause")) {
    collectPatternNames(n.child("param"), names);
  }
  for (const auto& name : names) scope.erase(name);
}
