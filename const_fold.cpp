#include "const_fold.h"
#include "logging.h"

#include <cmath>
#include <cstdint>
#include <limits>
#include <set>

// Attacker-shaped input can nest operators arbitrarily deep
static const int kMaxEvalDepth = 256;

static const double kNaN = std::numeric_limits<double>::quiet_NaN();

// ---- ECMAScript conversions --------------------------------------------------

static bool toBoolean(const JsValue& v) {
  switch (v.kind) {
    case JsValue::Undefined: return false;
    case JsValue::Null:      return false;
    case JsValue::Boolean:   return v.boolean;
    case JsValue::Number:    return v.number != 0 && !std::isnan(v.number);
    case JsValue::String:    return !v.string.empty();
  }
  return false;
}

// String to number needs the full StringToNumber grammar; not modeled
static bool toNumber(const JsValue& v, double& out) {
  switch (v.kind) {
    case JsValue::Undefined: out = kNaN; return true;
    case JsValue::Null:      out = 0; return true;
    case JsValue::Boolean:   out = v.boolean ? 1 : 0; return true;
    case JsValue::Number:    out = v.number; return true;
    case JsValue::String:    return false;
  }
  return false;
}

static uint32_t toUint32(double d) {
  if (!std::isfinite(d)) return 0;
  double t = std::fmod(std::trunc(d), 4294967296.0);
  if (t < 0) t += 4294967296.0;
  return (uint32_t)t;
}

static int32_t toInt32(double d) {
  return (int32_t)toUint32(d);
}

static const char* typeofName(const JsValue& v) {
  switch (v.kind) {
    case JsValue::Undefined: return "undefined";
    case JsValue::Null:      return "object";
    case JsValue::Boolean:   return "boolean";
    case JsValue::Number:    return "number";
    case JsValue::String:    return "string";
  }
  return "undefined";
}

static bool strictEquals(const JsValue& a, const JsValue& b) {
  if (a.kind != b.kind) return false;
  switch (a.kind) {
    case JsValue::Undefined: return true;
    case JsValue::Null:      return true;
    case JsValue::Boolean:   return a.boolean == b.boolean;
    case JsValue::Number:    return a.number == b.number;
    case JsValue::String:    return a.string == b.string;
  }
  return false;
}

static bool looseEquals(const JsValue& a, const JsValue& b, bool& out) {
  if (a.kind == b.kind) {
    out = strictEquals(a, b);
    return true;
  }
  bool aNullish = a.kind == JsValue::Undefined || a.kind == JsValue::Null;
  bool bNullish = b.kind == JsValue::Undefined || b.kind == JsValue::Null;
  if (aNullish || bNullish) {
    out = aNullish && bNullish;
    return true;
  }
  if (a.kind == JsValue::Boolean) return looseEquals(JsValue::makeNumber(a.boolean ? 1 : 0), b, out);
  if (b.kind == JsValue::Boolean) return looseEquals(a, JsValue::makeNumber(b.boolean ? 1 : 0), out);
  // number vs string
  return false;
}

// ---- Math ------------------------------------------------------------------

struct MathConstant {
  const char* name;
  double value;
};

static const MathConstant kMathConstants[] = {
  {"E",       2.718281828459045},
  {"LN10",    2.302585092994046},
  {"LN2",     0.6931471805599453},
  {"LOG10E",  0.4342944819032518},
  {"LOG2E",   1.4426950408889634},
  {"PI",      3.141592653589793},
  {"SQRT1_2", 0.7071067811865476},
  {"SQRT2",   1.4142135623730951},
};

static double jsRound(double x) {
  if (!std::isfinite(x)) return x;
  double r = std::floor(x);
  if (x - r >= 0.5) r += 1;
  return r;
}

static double jsSign(double x) {
  if (std::isnan(x)) return x;
  if (x > 0) return 1;
  if (x < 0) return -1;
  return x;
}

static double jsFround(double x) {
  return (double)(float)x;
}

struct UnaryMath {
  const char* name;
  double (*fn)(double);
};

static const UnaryMath kUnaryMath[] = {
  {"abs",   [](double x) { return std::fabs(x); }},
  {"acos",  [](double x) { return std::acos(x); }},
  {"acosh", [](double x) { return std::acosh(x); }},
  {"asin",  [](double x) { return std::asin(x); }},
  {"asinh", [](double x) { return std::asinh(x); }},
  {"atan",  [](double x) { return std::atan(x); }},
  {"atanh", [](double x) { return std::atanh(x); }},
  {"cbrt",  [](double x) { return std::cbrt(x); }},
  {"ceil",  [](double x) { return std::ceil(x); }},
  {"cos",   [](double x) { return std::cos(x); }},
  {"cosh",  [](double x) { return std::cosh(x); }},
  {"exp",   [](double x) { return std::exp(x); }},
  {"expm1", [](double x) { return std::expm1(x); }},
  {"floor", [](double x) { return std::floor(x); }},
  {"fround", jsFround},
  {"log",   [](double x) { return std::log(x); }},
  {"log10", [](double x) { return std::log10(x); }},
  {"log1p", [](double x) { return std::log1p(x); }},
  {"log2",  [](double x) { return std::log2(x); }},
  {"round", jsRound},
  {"sign",  jsSign},
  {"sin",   [](double x) { return std::sin(x); }},
  {"sinh",  [](double x) { return std::sinh(x); }},
  {"sqrt",  [](double x) { return std::sqrt(x); }},
  {"tan",   [](double x) { return std::tan(x); }},
  {"tanh",  [](double x) { return std::tanh(x); }},
  {"trunc", [](double x) { return std::trunc(x); }},
};

static bool mathConstant(const std::string& mathName, double& out) {
  if (mathName.compare(0, 5, "Math.") != 0) return false;
  std::string prop = mathName.substr(5);
  for (const auto& c : kMathConstants) {
    if (prop == c.name) {
      out = c.value;
      return true;
    }
  }
  return false;
}

// Pure Math.* functions only; Math.random and unknown names are refused.
static bool callMath(const std::string& mathName, const std::vector<double>& args, double& out) {
  if (mathName.compare(0, 5, "Math.") != 0) return false;
  std::string fn = mathName.substr(5);
  auto arg = [&](size_t i) { return i < args.size() ? args[i] : kNaN; };

  for (const auto& u : kUnaryMath) {
    if (fn == u.name) {
      out = u.fn(arg(0));
      return true;
    }
  }
  if (fn == "atan2") {
    out = std::atan2(arg(0), arg(1));
    return true;
  }
  if (fn == "pow") {
    double x = arg(0), y = arg(1);
    // C pow(1, inf) is 1; ECMAScript says NaN
    if (std::fabs(x) == 1 && std::isinf(y)) out = kNaN;
    else out = std::pow(x, y);
    return true;
  }
  if (fn == "max" || fn == "min") {
    bool isMax = fn == "max";
    double r = isMax ? -std::numeric_limits<double>::infinity() : std::numeric_limits<double>::infinity();
    for (double a : args) {
      if (std::isnan(a)) { r = kNaN; break; }
      if (isMax ? a > r : a < r) r = a;
    }
    out = r;
    return true;
  }
  if (fn == "hypot") {
    double sum = 0;
    bool inf = false, nan = false;
    for (double a : args) {
      if (std::isinf(a)) inf = true;
      else if (std::isnan(a)) nan = true;
      else sum += a * a;
    }
    out = inf ? std::numeric_limits<double>::infinity() : (nan ? kNaN : std::sqrt(sum));
    return true;
  }
  return false;
}

// ---- Evaluator ---------------------------------------------------------------

static bool evalNode(const AstNode* e, const Scope& scope, int depth, JsValue& out);

static bool applyBinary(const std::string& op, const JsValue& l, const JsValue& r, JsValue& out) {
  if (op == "===" || op == "!==") {
    bool eq = strictEquals(l, r);
    out = JsValue::makeBool(op == "===" ? eq : !eq);
    return true;
  }
  if (op == "==" || op == "!=") {
    bool eq = false;
    if (!looseEquals(l, r, eq)) return false;
    out = JsValue::makeBool(op == "==" ? eq : !eq);
    return true;
  }

  if (op == "+" && (l.kind == JsValue::String || r.kind == JsValue::String)) {
    if (l.kind != JsValue::String || r.kind != JsValue::String) return false;
    out = JsValue::makeString(l.string + r.string);
    return true;
  }

  if (op == "<" || op == ">" || op == "<=" || op == ">=") {
    if (l.kind == JsValue::String && r.kind == JsValue::String) {
      int c = l.string.compare(r.string);
      bool res = op == "<" ? c < 0 : op == ">" ? c > 0 : op == "<=" ? c <= 0 : c >= 0;
      out = JsValue::makeBool(res);
      return true;
    }
    double a = 0, b = 0;
    if (!toNumber(l, a) || !toNumber(r, b)) return false;
    // every comparison with NaN is false
    bool res = op == "<" ? a < b : op == ">" ? a > b : op == "<=" ? a <= b : a >= b;
    out = JsValue::makeBool(res);
    return true;
  }

  double a = 0, b = 0;
  if (!toNumber(l, a) || !toNumber(r, b)) return false;

  if (op == "+")  { out = JsValue::makeNumber(a + b); return true; }
  if (op == "-")  { out = JsValue::makeNumber(a - b); return true; }
  if (op == "*")  { out = JsValue::makeNumber(a * b); return true; }
  if (op == "/")  { out = JsValue::makeNumber(a / b); return true; }
  if (op == "%")  { out = JsValue::makeNumber(std::fmod(a, b)); return true; }
  if (op == "**") {
    std::vector<double> args{a, b};
    double p = 0;
    if (!callMath("Math.pow", args, p)) return false;
    out = JsValue::makeNumber(p);
    return true;
  }
  if (op == "&")  { out = JsValue::makeNumber(toInt32(a) & toInt32(b)); return true; }
  if (op == "|")  { out = JsValue::makeNumber(toInt32(a) | toInt32(b)); return true; }
  if (op == "^")  { out = JsValue::makeNumber(toInt32(a) ^ toInt32(b)); return true; }

  uint32_t shift = toUint32(b) & 31;
  if (op == "<<") {
    out = JsValue::makeNumber((int32_t)(toUint32(a) << shift));
    return true;
  }
  if (op == ">>") {
    out = JsValue::makeNumber(toInt32(a) >> shift);
    return true;
  }
  if (op == ">>>") {
    out = JsValue::makeNumber(toUint32(a) >> shift);
    return true;
  }

  // in, instanceof
  return false;
}

static bool applyUnary(const std::string& op, const JsValue& v, JsValue& out) {
  if (op == "!")      { out = JsValue::makeBool(!toBoolean(v)); return true; }
  if (op == "typeof") { out = JsValue::makeString(typeofName(v)); return true; }
  if (op == "void")   { out = JsValue::makeUndefined(); return true; }

  double d = 0;
  if (!toNumber(v, d)) return false;
  if (op == "-") { out = JsValue::makeNumber(-d); return true; }
  if (op == "+") { out = JsValue::makeNumber(d); return true; }
  if (op == "~") { out = JsValue::makeNumber(~toInt32(d)); return true; }
  // delete
  return false;
}

static bool operatorOf(const AstNode& e, std::string& op) {
  const auto* v = e.scalar("operator");
  if (!v || !v->is_string()) return false;
  op = v->get<std::string>();
  return true;
}

static bool evalIdentifier(const AstNode& e, const Scope& scope, JsValue& out) {
  const std::string* name = identifierName(&e);
  if (!name) return false;
  auto it = scope.find(*name);
  if (it == scope.end()) return false;

  const Binding& b = it->second;
  switch (b.kind) {
    case BindingKind::Literal:
      out = b.literal;
      return true;
    case BindingKind::MathRef: {
      double c = 0;
      if (!mathConstant(b.mathName, c)) return false;  // a function value is not a primitive
      out = JsValue::makeNumber(c);
      return true;
    }
    case BindingKind::Array:
    case BindingKind::SwapFunction:
      return false;
  }
  return false;
}

static bool evalCall(const AstNode& e, const Scope& scope, int depth, JsValue& out) {
  const std::string* name = identifierName(e.child("callee"));
  if (!name) return false;
  const Binding* b = findBinding(scope, *name, BindingKind::MathRef);
  if (!b) return false;

  std::vector<double> args;
  for (const auto& a : e.list("arguments")) {
    JsValue v;
    double d = 0;
    if (!a || !evalNode(a.get(), scope, depth + 1, v) || !toNumber(v, d)) return false;
    args.push_back(d);
  }

  double r = 0;
  if (!callMath(b->mathName, args, r)) return false;
  out = JsValue::makeNumber(r);
  return true;
}

static bool evalNode(const AstNode* e, const Scope& scope, int depth, JsValue& out) {
  if (!e || depth > kMaxEvalDepth) return false;

  if (e->is("Literal")) return literalValue(e, out);
  if (e->is("Identifier")) return evalIdentifier(*e, scope, out);
  if (e->is("CallExpression")) return evalCall(*e, scope, depth, out);

  std::string op;
  if (e->is("UnaryExpression")) {
    JsValue v;
    if (!operatorOf(*e, op) || !evalNode(e->child("argument"), scope, depth + 1, v)) return false;
    return applyUnary(op, v, out);
  }

  if (e->is("BinaryExpression") || e->is("LogicalExpression")) {
    // Both operands must resolve even where && / || would short-circuit:
    // a partially resolved condition is never folded.
    JsValue l, r;
    if (!operatorOf(*e, op) ||
        !evalNode(e->child("left"), scope, depth + 1, l) ||
        !evalNode(e->child("right"), scope, depth + 1, r)) {
      return false;
    }
    if (op == "&&") { out = toBoolean(l) ? r : l; return true; }
    if (op == "||") { out = toBoolean(l) ? l : r; return true; }
    return applyBinary(op, l, r, out);
  }

  return false;
}

bool evaluateConstant(const AstNode& expr, const Scope& scope, JsValue& out) {
  return evalNode(&expr, scope, 0, out);
}

bool decideCondition(const AstNode& test, const Scope& scope, bool& truth) {
  JsValue v;
  if (!evaluateConstant(test, scope, v)) return false;
  if (v.kind == JsValue::Boolean) {
    truth = v.boolean;
    return true;
  }
  if (v.kind == JsValue::Number) {
    truth = v.number > 0;
    return true;
  }
  return false;
}

// ---- Traversal ---------------------------------------------------------------

struct FoldCtx {
  const std::string& source;
  const std::set<std::string>& written;
  FoldResult& result;
};

static void visitFold(const AstNode& n, Scope& scope, FoldCtx& ctx);

static void visitChildren(const AstNode& n, Scope& scope, FoldCtx& ctx) {
  forEachChild(n, [&](const AstNode& c) {
    if (opensScope(c)) {
      Scope inner = scope;
      visitFold(c, inner, ctx);
    } else {
      visitFold(c, scope, ctx);
    }
  });
}

static void bindDeclarator(const AstNode& decl, Scope& scope, const FoldCtx& ctx) {
  const std::string* name = identifierName(decl.child("id"));
  if (!name) {
    std::vector<std::string> names;
    collectPatternNames(decl.child("id"), names);
    for (const auto& n : names) scope.erase(n);
    return;
  }
  if (ctx.written.count(*name)) {
    scope.erase(*name);
    return;
  }

  const AstNode* init = decl.child("init");
  JsValue v;
  if (init && init->is("MemberExpression") && !init->flag("computed") &&
      isIdentifier(init->child("object"), "Math") && identifierName(init->child("property"))) {
    scope[*name] = Binding::makeMathRef("Math." + *identifierName(init->child("property")));
  } else if (init && literalValue(init, v)) {
    scope[*name] = Binding::makeLiteral(v);
  } else {
    scope.erase(*name);
    return;
  }
  logDebugf("'%s' bound as %s", name->c_str(), bindingKindName(scope[*name].kind));
}

static void foldIf(const AstNode& n, const Scope& scope, FoldCtx& ctx) {
  const AstNode* test = n.child("test");
  if (!test) return;
  ctx.result.examined++;

  bool truth = false;
  if (!decideCondition(*test, scope, truth)) return;

  std::string text = truth ? "true" : "false";
  if (nodeText(ctx.source, *test) == text) return;

  logDebugf("folding condition at %zu: %s", test->start, text.c_str());
  Replacement rep;
  rep.start = test->start;
  rep.end = test->end;
  rep.text = text;
  ctx.result.replacements.push_back(std::move(rep));
}

static void visitFold(const AstNode& n, Scope& scope, FoldCtx& ctx) {
  if (n.is("IfStatement")) {
    foldIf(n, scope, ctx);
    if (const AstNode* test = n.child("test")) visitFold(*test, scope, ctx);
    for (const char* branch : {"consequent", "alternate"}) {
      if (const AstNode* c = n.child(branch)) {
        Scope inner = scope;
        visitFold(*c, inner, ctx);
      }
    }
    return;
  }

  if (isFunctionNode(n) || n.is("CatchClause")) hideParameters(n, scope);

  visitChildren(n, scope, ctx);

  // Bindings take effect after their initializer has been walked
  if (n.is("VariableDeclarator")) bindDeclarator(n, scope, ctx);
}

FoldResult foldConstantConditions(const AstNode& root, const std::string& source) {
  FoldResult result;
  std::set<std::string> written;
  collectWrittenNames(root, written);
  FoldCtx ctx{source, written, result};
  Scope scope;
  visitFold(root, scope, ctx);
  logDebugf("constant folding: %zu of %zu conditions decided",
            result.replacements.size(), result.examined);
  return result;
}
