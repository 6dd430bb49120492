#include "switch_reorder.h"
#include "logging.h"

#include <cmath>
#include <map>
#include <set>
#include <utility>

static const char* const kMutatingMethods[] = {
  "push", "pop", "shift", "unshift", "splice", "reverse", "sort", "fill", "copyWithin",
};

struct ReorderCtx {
  const std::string& source;
  const std::set<std::string>& written;
  const std::set<std::string>& touched;
  ReorderResult& result;
  std::set<int> unstable;  // arrays mutated below their declaring scope
  int nextArrayId = 0;
  int functionLevel = 0;   // function nesting of the node being visited
};

static bool isComputedMember(const AstNode* n) {
  return n && n->is("MemberExpression") && n->flag("computed");
}

static bool isIndexedStore(const AstNode* e) {
  if (!e || !e->is("AssignmentExpression")) return false;
  const auto* op = e->scalar("operator");
  return op && op->is_string() && op->get<std::string>() == "=" && isComputedMember(e->child("left"));
}

bool isSwapFunctionShape(const AstNode& fn) {
  if (!isFunctionNode(fn)) return false;
  const auto& params = fn.list("params");
  if (params.size() != 3) return false;
  for (const auto& p : params) {
    if (!identifierName(p.get())) return false;
  }

  const AstNode* body = fn.child("body");
  if (!body || !body->is("BlockStatement")) return false;

  int temps = 0;
  int stores = 0;
  for (const auto& stmt : body->list("body")) {
    if (!stmt) continue;
    if (stmt->is("VariableDeclaration")) {
      for (const auto& d : stmt->list("declarations")) {
        if (d && isComputedMember(d->child("init"))) ++temps;
      }
    } else if (stmt->is("ExpressionStatement")) {
      const AstNode* e = stmt->child("expression");
      if (e && e->is("SequenceExpression")) {
        // minified: a[i] = a[j], a[j] = t;
        for (const auto& part : e->list("expressions")) {
          if (isIndexedStore(part.get())) ++stores;
        }
      } else if (isIndexedStore(e)) {
        ++stores;
      }
    }
  }
  return temps >= 1 && stores >= 2;
}

// ---- Bindings ----------------------------------------------------------------

// Names an array could be permuted through somewhere in the program: call
// arguments, method receivers, element writes and aliases.
static void collectTouchedNames(const AstNode& n, std::set<std::string>& out) {
  auto add = [&](const AstNode* e) {
    if (const std::string* name = identifierName(e)) out.insert(*name);
  };
  if (n.is("CallExpression") || n.is("NewExpression")) {
    for (const auto& a : n.list("arguments")) add(a.get());
    const AstNode* callee = n.child("callee");
    if (callee && callee->is("MemberExpression")) add(callee->child("object"));
  } else if (n.is("VariableDeclarator")) {
    add(n.child("init"));
  } else if (n.is("AssignmentExpression") || n.is("UpdateExpression")) {
    const AstNode* target = n.child(n.is("UpdateExpression") ? "argument" : "left");
    if (target && target->is("MemberExpression")) add(target->child("object"));
    add(n.child("right"));
  }
  forEachChild(n, [&](const AstNode& c) { collectTouchedNames(c, out); });
}

static bool integralArray(const AstNode* init, std::vector<long long>& out) {
  if (!init || !init->is("ArrayExpression")) return false;
  const auto& elems = init->list("elements");
  if (elems.empty()) return false;
  for (const auto& e : elems) {
    long long v = 0;
    if (!literalInteger(e.get(), v)) return false;  // holes and spreads included
    out.push_back(v);
  }
  return true;
}

static void forgetArray(Scope& scope, const std::string& name, ReorderCtx& ctx, const char* why) {
  auto it = scope.find(name);
  if (it == scope.end() || it->second.kind != BindingKind::Array) return;
  ctx.unstable.insert(it->second.arrayId);
  scope.erase(it);
  deferDebugf("array '%s' no longer tracked: %s", name.c_str(), why);
}

static void bindDeclarator(const AstNode& decl, Scope& scope, int depth, ReorderCtx& ctx) {
  const AstNode* init = decl.child("init");
  if (const std::string* source = identifierName(init)) forgetArray(scope, *source, ctx, "aliased");

  std::vector<std::string> names;
  collectPatternNames(decl.child("id"), names);
  // A redeclared var is the same variable in every enclosing block
  for (const auto& n : names) forgetArray(scope, n, ctx, "redeclared");

  const std::string* name = identifierName(decl.child("id"));
  if (!name) {
    for (const auto& n : names) scope.erase(n);
    return;
  }
  if (ctx.written.count(*name)) {
    scope.erase(*name);
    return;
  }

  std::vector<long long> elements;
  JsValue v;
  if (integralArray(init, elements)) {
    Binding b = Binding::makeArray(std::move(elements));
    b.arrayId = ++ctx.nextArrayId;
    b.depth = depth;
    b.functionLevel = ctx.functionLevel;
    logDebugf("tracking array '%s' (%zu elements)", name->c_str(), b.elements.size());
    scope[*name] = std::move(b);
  } else if (init && isSwapFunctionShape(*init)) {
    logDebugf("'%s' looks like a swap helper", name->c_str());
    scope[*name] = Binding::makeSwapFunction();
  } else if (init && literalValue(init, v)) {
    scope[*name] = Binding::makeLiteral(v);
  } else {
    scope.erase(*name);
  }
}

// Function declarations are visible to the whole list they appear in
static void hoistFunctions(const std::vector<AstNodePtr>& list, Scope& scope) {
  for (const auto& stmt : list) {
    if (!stmt || !stmt->is("FunctionDeclaration")) continue;
    const std::string* name = identifierName(stmt->child("id"));
    if (!name) continue;
    if (isSwapFunctionShape(*stmt)) {
      logDebugf("'%s' looks like a swap helper", name->c_str());
      scope[*name] = Binding::makeSwapFunction();
    } else {
      scope.erase(*name);
    }
  }
}

// Erase arrays a nested visit mutated; their state now depends on control flow
static void dropUnstable(Scope& scope, const ReorderCtx& ctx) {
  for (auto it = scope.begin(); it != scope.end();) {
    if (it->second.kind == BindingKind::Array && ctx.unstable.count(it->second.arrayId))
      it = scope.erase(it);
    else
      ++it;
  }
}

static bool constantIndex(const AstNode* n, const Scope& scope, long long& out) {
  if (literalInteger(n, out)) return true;
  const std::string* name = identifierName(n);
  const Binding* b = name ? findBinding(scope, *name, BindingKind::Literal) : nullptr;
  if (!b || b->literal.kind != JsValue::Number) return false;
  double d = b->literal.number;
  if (!std::isfinite(d) || std::trunc(d) != d) return false;
  out = (long long)d;
  return true;
}

// True when the call was replayed on the model
static bool applySwapCall(const AstNode& call, Scope& scope, int depth, ReorderCtx& ctx) {
  const auto& args = call.list("arguments");
  if (args.size() != 3) return false;
  const std::string* arrName = identifierName(args[0].get());
  if (!arrName) return false;
  auto it = scope.find(*arrName);
  if (it == scope.end() || it->second.kind != BindingKind::Array) return false;

  Binding& arr = it->second;
  if (arr.depth != depth) {
    forgetArray(scope, *arrName, ctx, "swapped inside a nested block or function");
    return false;
  }

  long long i = 0, j = 0;
  if (!constantIndex(args[1].get(), scope, i) || !constantIndex(args[2].get(), scope, j)) {
    forgetArray(scope, *arrName, ctx, "swap with a non-constant index");
    return false;
  }
  long long size = (long long)arr.elements.size();
  if (i < 0 || j < 0 || i >= size || j >= size) {
    forgetArray(scope, *arrName, ctx, "swap index out of range");
    return false;
  }

  std::swap(arr.elements[(size_t)i], arr.elements[(size_t)j]);
  logDebugf("swap(%s, %lld, %lld)", arrName->c_str(), i, j);
  return true;
}

static bool isMutatingMethod(const std::string& name) {
  for (const char* m : kMutatingMethods) {
    if (name == m) return true;
  }
  return false;
}

static void noteCall(const AstNode& call, Scope& scope, int depth, ReorderCtx& ctx) {
  const AstNode* callee = call.child("callee");
  const std::string* fn = identifierName(callee);
  if (fn && findBinding(scope, *fn, BindingKind::SwapFunction) && applySwapCall(call, scope, depth, ctx))
    return;

  if (callee && callee->is("MemberExpression") && !callee->flag("computed")) {
    const std::string* obj = identifierName(callee->child("object"));
    const std::string* method = identifierName(callee->child("property"));
    if (obj && method && isMutatingMethod(*method)) forgetArray(scope, *obj, ctx, "mutating method call");
  }
  // The callee may permute any array it is handed
  for (const auto& arg : call.list("arguments")) {
    if (const std::string* name = identifierName(arg.get())) forgetArray(scope, *name, ctx, "passed to a call");
  }
}

static void noteWrite(const AstNode* target, Scope& scope, ReorderCtx& ctx) {
  if (!target) return;
  if (target->is("MemberExpression")) {
    if (const std::string* obj = identifierName(target->child("object")))
      forgetArray(scope, *obj, ctx, "element written");
    return;
  }
  std::vector<std::string> names;
  collectPatternNames(target, names);
  for (const auto& n : names) forgetArray(scope, n, ctx, "reassigned");
}

// ---- Loop recovery -------------------------------------------------------------

static bool loopVariable(const AstNode& loop, std::string& name) {
  const AstNode* left = loop.child("left");
  if (left && left->is("VariableDeclaration")) {
    const auto& decls = left->list("declarations");
    if (decls.size() != 1 || !decls[0] || decls[0]->child("init")) return false;
    left = decls[0]->child("id");
  }
  const std::string* n = identifierName(left);
  if (!n) return false;
  name = *n;
  return true;
}

// switch (v) directly, or as the only statement of the loop block
static const AstNode* dispatchSwitch(const AstNode& loop, const std::string& var) {
  const AstNode* body = loop.child("body");
  if (body && body->is("BlockStatement")) {
    const AstNode* only = nullptr;
    for (const auto& s : body->list("body")) {
      if (!s || s->is("EmptyStatement")) continue;
      if (only) return nullptr;
      only = s.get();
    }
    body = only;
  }
  if (!body || !body->is("SwitchStatement")) return nullptr;
  if (!isIdentifier(body->child("discriminant"), var.c_str())) return nullptr;
  return body;
}

static bool isTerminator(const AstNode& s) {
  return s.is("BreakStatement") || s.is("ContinueStatement") || s.is("ReturnStatement") ||
         s.is("ThrowStatement");
}

static bool isPlainExit(const AstNode& s) {
  return (s.is("BreakStatement") || s.is("ContinueStatement")) && !s.child("label");
}

// A jump whose target changes once the case body is lifted out of the loop:
// any labeled jump, or an unlabeled one not owned by a nested loop/switch.
static bool hasEscapingJump(const AstNode& n, bool owned) {
  if (isFunctionNode(n)) return false;
  if (n.is("BreakStatement") || n.is("ContinueStatement")) {
    return n.child("label") != nullptr || !owned;
  }
  bool nowOwned = owned || n.is("ForStatement") || n.is("ForInStatement") || n.is("ForOfStatement") ||
                  n.is("WhileStatement") || n.is("DoWhileStatement") || n.is("SwitchStatement");
  bool found = false;
  forEachChild(n, [&](const AstNode& c) {
    if (!found && hasEscapingJump(c, nowOwned)) found = true;
  });
  return found;
}

static bool referencesName(const AstNode& n, const std::string& name) {
  if (const std::string* id = identifierName(&n)) return *id == name;
  bool found = false;
  for (const auto& f : n.fields) {
    if (found) break;
    // obj.name and { name: ... } do not read the variable
    bool skip = (n.is("MemberExpression") && f.name == "property" && !n.flag("computed")) ||
                (n.is("Property") && f.name == "key" && !n.flag("computed"));
    if (skip) continue;
    if (f.kind == AstField::Node && f.node) {
      found = referencesName(*f.node, name);
    } else if (f.kind == AstField::List) {
      for (const auto& c : f.list) {
        if (c && referencesName(*c, name)) { found = true; break; }
      }
    }
  }
  return found;
}

// let/const/class/function would collide or change scope once flattened
static bool isLexicalDeclaration(const AstNode& s) {
  if (s.is("FunctionDeclaration") || s.is("ClassDeclaration")) return true;
  if (!s.is("VariableDeclaration")) return false;
  const auto* kind = s.scalar("kind");
  return kind && kind->is_string() && kind->get<std::string>() != "var";
}

static bool tryReorderLoop(const AstNode& loop, const Scope& scope, bool listItem, ReorderCtx& ctx) {
  const std::string* arrName = identifierName(loop.child("right"));
  const Binding* arr = arrName ? findBinding(scope, *arrName, BindingKind::Array) : nullptr;
  if (!arr) return false;
  ctx.result.candidates++;

  auto untouched = [&](const char* why) {
    deferWarnf("leaving loop at offset %zu over '%s' untouched: %s", loop.start, arrName->c_str(), why);
    return false;
  };

  // The function may run before or after any mutation outside it
  if (arr->functionLevel != ctx.functionLevel && ctx.touched.count(*arrName))
    return untouched("array is mutated outside the function running the loop");

  std::string var;
  if (!loopVariable(loop, var)) return untouched("loop variable is not a plain identifier");
  const AstNode* sw = dispatchSwitch(loop, var);
  if (!sw) return untouched("body is not a switch on the loop variable");

  const auto& cases = sw->list("cases");
  std::map<long long, size_t> firstCase;
  bool hasDefault = false;
  for (size_t i = 0; i < cases.size(); ++i) {
    if (!cases[i]) continue;
    const AstNode* test = cases[i]->child("test");
    if (!test) {
      hasDefault = true;
      continue;
    }
    long long v = 0;
    if (!literalInteger(test, v)) return untouched("case test is not an integer literal");
    firstCase.emplace(v, i);
  }

  std::string text = listItem ? "" : "{\n";
  text += "/* recovered order:";
  for (size_t k = 0; k < arr->elements.size(); ++k)
    text += (k ? ", " : " ") + std::to_string(arr->elements[k]);
  text += " */";

  for (long long value : arr->elements) {
    auto it = firstCase.find(value);
    if (it == firstCase.end()) {
      if (hasDefault) return untouched("sequence value reaches the default case");
      continue;  // no case, no effect
    }

    const auto& stmts = cases[it->second]->list("consequent");
    size_t count = stmts.size();
    bool lastClause = it->second + 1 == cases.size();
    if (count == 0 || !stmts[count - 1] || !isTerminator(*stmts[count - 1])) {
      if (!lastClause) return untouched("case falls through");
    } else if (isPlainExit(*stmts[count - 1])) {
      --count;
    }

    text += "\n/* case " + std::to_string(value) + " */";
    for (size_t k = 0; k < count; ++k) {
      const AstNode* s = stmts[k].get();
      if (!s) continue;
      if (hasEscapingJump(*s, false)) return untouched("case body jumps out of the switch");
      if (referencesName(*s, var)) return untouched("case body reads the loop variable");
      if (referencesName(*s, *arrName)) return untouched("case body uses the dispatch array");
      if (isLexicalDeclaration(*s)) return untouched("case body declares block-scoped names");
      text += "\n" + nodeText(ctx.source, *s);
    }
  }
  if (!listItem) text += "\n}";

  logDebugf("reordered loop at %zu over '%s' (%zu values)", loop.start, arrName->c_str(),
            arr->elements.size());

  Replacement rep;
  rep.start = loop.start;
  rep.end = loop.end;
  rep.text = std::move(text);
  ctx.result.replacements.push_back(std::move(rep));

  ReorderedLoop info;
  info.start = loop.start;
  info.end = loop.end;
  info.order = arr->elements;
  ctx.result.loops.push_back(std::move(info));
  return true;
}

// ---- Traversal -----------------------------------------------------------------

static void visitNode(const AstNode& n, Scope& scope, int depth, bool listItem, ReorderCtx& ctx);

static void visitNested(const AstNode* n, Scope& scope, int depth, ReorderCtx& ctx) {
  if (!n) return;
  Scope inner = scope;
  visitNode(*n, inner, depth + 1, false, ctx);
  dropUnstable(scope, ctx);
}

static void visitHere(const AstNode* n, Scope& scope, int depth, ReorderCtx& ctx) {
  if (n) visitNode(*n, scope, depth, false, ctx);
}

static void visitStatementList(const std::vector<AstNodePtr>& list, Scope& scope, int depth,
                               ReorderCtx& ctx) {
  hoistFunctions(list, scope);
  for (const auto& stmt : list) {
    if (!stmt) continue;
    if (opensScope(*stmt)) visitNested(stmt.get(), scope, depth, ctx);
    else visitNode(*stmt, scope, depth, true, ctx);
  }
}

static void visitChildren(const AstNode& n, Scope& scope, int depth, ReorderCtx& ctx) {
  forEachChild(n, [&](const AstNode& c) {
    if (opensScope(c)) visitNested(&c, scope, depth, ctx);
    else visitHere(&c, scope, depth, ctx);
  });
}

static void visitNode(const AstNode& n, Scope& scope, int depth, bool listItem, ReorderCtx& ctx) {
  if (n.is("Program") || n.is("BlockStatement")) {
    visitStatementList(n.list("body"), scope, depth, ctx);
  } else if (n.is("SwitchCase")) {
    visitHere(n.child("test"), scope, depth, ctx);
    visitStatementList(n.list("consequent"), scope, depth, ctx);
  } else if (isFunctionNode(n)) {
    hideParameters(n, scope);
    ctx.functionLevel++;
    const AstNode* body = n.child("body");
    if (body && body->is("BlockStatement")) visitStatementList(body->list("body"), scope, depth, ctx);
    else visitHere(body, scope, depth, ctx);
    ctx.functionLevel--;
  } else if (n.is("CatchClause")) {
    hideParameters(n, scope);
    visitChildren(n, scope, depth, ctx);
  } else if (n.is("VariableDeclarator")) {
    visitChildren(n, scope, depth, ctx);
    bindDeclarator(n, scope, depth, ctx);
  } else if (n.is("CallExpression") || n.is("NewExpression")) {
    visitChildren(n, scope, depth, ctx);
    noteCall(n, scope, depth, ctx);
  } else if (n.is("AssignmentExpression")) {
    visitChildren(n, scope, depth, ctx);
    noteWrite(n.child("left"), scope, ctx);
    if (const std::string* source = identifierName(n.child("right")))
      forgetArray(scope, *source, ctx, "aliased");
  } else if (n.is("UpdateExpression")) {
    visitChildren(n, scope, depth, ctx);
    noteWrite(n.child("argument"), scope, ctx);
  } else if (n.is("ForOfStatement") || (n.is("ForInStatement") && n.flag("each"))) {
    if (tryReorderLoop(n, scope, listItem, ctx)) return;
    visitHere(n.child("right"), scope, depth, ctx);
    visitNested(n.child("left"), scope, depth, ctx);
    visitNested(n.child("body"), scope, depth, ctx);
  } else if (n.is("ForInStatement")) {
    visitHere(n.child("right"), scope, depth, ctx);
    visitNested(n.child("left"), scope, depth, ctx);
    visitNested(n.child("body"), scope, depth, ctx);
  } else if (n.is("ForStatement")) {
    visitHere(n.child("init"), scope, depth, ctx);
    visitNested(n.child("test"), scope, depth, ctx);
    visitNested(n.child("update"), scope, depth, ctx);
    visitNested(n.child("body"), scope, depth, ctx);
  } else if (n.is("WhileStatement") || n.is("DoWhileStatement")) {
    visitNested(n.child("test"), scope, depth, ctx);
    visitNested(n.child("body"), scope, depth, ctx);
  } else if (n.is("IfStatement") || n.is("ConditionalExpression")) {
    visitHere(n.child("test"), scope, depth, ctx);
    visitNested(n.child("consequent"), scope, depth, ctx);
    visitNested(n.child("alternate"), scope, depth, ctx);
  } else if (n.is("LogicalExpression")) {
    visitHere(n.child("left"), scope, depth, ctx);
    visitNested(n.child("right"), scope, depth, ctx);
  } else if (n.is("SwitchStatement")) {
    visitHere(n.child("discriminant"), scope, depth, ctx);
    for (const auto& c : n.list("cases")) visitNested(c.get(), scope, depth, ctx);
  } else if (n.is("TryStatement")) {
    visitNested(n.child("block"), scope, depth, ctx);
    visitNested(n.child("handler"), scope, depth, ctx);
    for (const auto& h : n.list("guardedHandlers")) visitNested(h.get(), scope, depth, ctx);
    visitNested(n.child("finalizer"), scope, depth, ctx);
  } else {
    visitChildren(n, scope, depth, ctx);
  }
}

ReorderResult reorderSwitchLoops(const AstNode& root, const std::string& source) {
  ReorderResult result;
  std::set<std::string> written;
  std::set<std::string> touched;
  collectWrittenNames(root, written);
  collectTouchedNames(root, touched);

  ReorderCtx ctx{source, written, touched, result};
  Scope scope;
  visitNode(root, scope, 0, true, ctx);
  logDebugf("switch reordering: %zu of %zu candidate loops recovered",
            result.replacements.size(), result.candidates);
  return result;
}
