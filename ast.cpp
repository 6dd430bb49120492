#include "ast.h"
#include "source_index.h"

#include <cmath>

using json = nlohmann::ordered_json;

static const std::vector<AstNodePtr> kEmptyList;

// Deeper trees are rejected rather than risking the native stack
static const int kMaxTreeDepth = 4000;

const AstField* AstNode::field(const char* name) const {
  for (const auto& f : fields)
    if (f.name == name) return &f;
  return nullptr;
}

const AstNode* AstNode::child(const char* name) const {
  const AstField* f = field(name);
  if (!f || f->kind != AstField::Node) return nullptr;
  return f->node.get();
}

const std::vector<AstNodePtr>& AstNode::list(const char* name) const {
  const AstField* f = field(name);
  if (!f || f->kind != AstField::List) return kEmptyList;
  return f->list;
}

const json* AstNode::scalar(const char* name) const {
  const AstField* f = field(name);
  if (!f || f->kind != AstField::Scalar) return nullptr;
  return &f->scalar;
}

bool AstNode::flag(const char* name) const {
  const json* v = scalar(name);
  return v && v->is_boolean() && v->get<bool>();
}

const std::string* identifierName(const AstNode* n) {
  if (!n || !n->is("Identifier")) return nullptr;
  const json* v = n->scalar("name");
  if (!v || !v->is_string()) return nullptr;
  return v->get_ptr<const std::string*>();
}

bool isIdentifier(const AstNode* n, const char* name) {
  const std::string* s = identifierName(n);
  return s && *s == name;
}

bool literalNumber(const AstNode* n, double& out) {
  if (!n || !n->is("Literal")) return false;
  const json* v = n->scalar("value");
  if (!v || !v->is_number()) return false;
  out = v->get<double>();
  return true;
}

bool literalString(const AstNode* n, std::string& out) {
  if (!n || !n->is("Literal")) return false;
  const json* v = n->scalar("value");
  if (!v || !v->is_string()) return false;
  out = v->get<std::string>();
  return true;
}

bool literalInteger(const AstNode* n, long long& out) {
  double d = 0;
  if (!literalNumber(n, d)) return false;
  if (!std::isfinite(d) || std::trunc(d) != d || std::fabs(d) > 9007199254740992.0) return false;
  out = (long long)d;
  return true;
}

std::string nodeText(const std::string& source, const AstNode& n) {
  if (n.start > n.end || n.end > source.size()) return std::string();
  return source.substr(n.start, n.end - n.start);
}

// ---- ESTree bridge ---------------------------------------------------------

struct BridgeCtx {
  const std::string& source;
  const SourceIndex& index;
  unsigned lineShift;
};

static bool isNodeObject(const json& v) {
  return v.is_object() && v.contains("type") && v["type"].is_string();
}

static bool resolvePos(const json& pos, const BridgeCtx& ctx, size_t& out) {
  if (!pos.is_object() || !pos.contains("line") || !pos.contains("column")) return false;
  if (!pos["line"].is_number_integer() || !pos["column"].is_number_integer()) return false;
  long long line = pos["line"].get<long long>();
  long long column = pos["column"].get<long long>();
  if (line <= (long long)ctx.lineShift || column < 0) return false;
  return ctx.index.toOffset((unsigned)(line - ctx.lineShift), (unsigned)column, out);
}

static bool convertNode(const json& j, const BridgeCtx& ctx, int depth,
                        AstNodePtr& out, std::string& error) {
  if (depth > kMaxTreeDepth) {
    error = "syntax tree nesting too deep";
    return false;
  }

  auto node = std::make_unique<AstNode>();
  node->type = j["type"].get<std::string>();

  bool haveLoc = false;
  auto loc = j.find("loc");
  if (loc != j.end() && loc->is_object()) {
    auto s = loc->find("start");
    auto e = loc->find("end");
    if (s == loc->end() || e == loc->end() ||
        !resolvePos(*s, ctx, node->start) || !resolvePos(*e, ctx, node->end)) {
      error = "position out of range in " + node->type + " node";
      return false;
    }
    haveLoc = true;
  }

  for (auto it = j.begin(); it != j.end(); ++it) {
    const std::string& key = it.key();
    if (key == "type" || key == "loc") continue;
    const json& v = it.value();

    AstField f;
    f.name = key;
    if (isNodeObject(v)) {
      f.kind = AstField::Node;
      if (!convertNode(v, ctx, depth + 1, f.node, error)) return false;
    } else if (v.is_array()) {
      f.kind = AstField::List;
      f.list.reserve(v.size());
      for (const auto& e : v) {
        AstNodePtr c;
        if (isNodeObject(e) && !convertNode(e, ctx, depth + 1, c, error)) return false;
        f.list.push_back(std::move(c));
      }
    } else {
      f.kind = AstField::Scalar;
      f.scalar = v;
    }
    node->fields.push_back(std::move(f));
  }

  if (!haveLoc) {
    // Some synthesized nodes carry no location; cover their children instead
    bool any = false;
    forEachChild(*node, [&](const AstNode& c) {
      if (!any || c.start < node->start) node->start = c.start;
      if (!any || c.end > node->end) node->end = c.end;
      any = true;
    });
  }

  // JSON has no spelling for non-finite numbers, they arrive as null.
  // Only a literal actually written "null" keeps a null value.
  if (node->is("Literal")) {
    for (auto& f : node->fields) {
      if (f.name == "value" && f.kind == AstField::Scalar && f.scalar.is_null() &&
          nodeText(ctx.source, *node) != "null") {
        f.scalar = json::object();
      }
    }
  }

  out = std::move(node);
  return true;
}

bool astFromEstree(const json& j, const std::string& source, const SourceIndex& index,
                   unsigned lineShift, AstNodePtr& out, std::string& error) {
  if (!isNodeObject(j)) {
    error = "parser result is not a syntax tree";
    return false;
  }
  BridgeCtx ctx{source, index, lineShift};
  return convertNode(j, ctx, 0, out, error);
}
