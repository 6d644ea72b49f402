#include "ast.h"

namespace {

const char* kNodeKindNames[] = {
#define X(name) #name,
  ENUM_NODE_KIND_
#undef X
};

void Dump(const Node& node, std::string& out) {
  out += '(';
  out += NodeKindName(node.kind);
  if (!node.text.empty()) {
    out += ' ';
    out += node.text;
  }
  if (node.ctx == NameContext::STORE) out += " :store";
  if (node.ctx == NameContext::DEL) out += " :del";
  if (node.is_async) out += " :async";
  for (auto& i : node.children) {
    out += ' ';
    Dump(*i, out);
  }
  out += ')';
}

} // namespace

const Node* Node::Find(NodeKind kind) const {
  for (auto& i : children) {
    if (i->kind == kind) return i.get();
  }
  return nullptr;
}

const char* NodeKindName(NodeKind kind) {
  return kNodeKindNames[(int)kind];
}

bool SetContext(Node& node, NameContext ctx) {
  switch (node.kind) {
    case NodeKind::NAME: [[fallthrough]];
    case NodeKind::ATTRIBUTE: [[fallthrough]];
    case NodeKind::SUBSCRIPT:
      node.ctx = ctx;
      return true;
    case NodeKind::STARRED:
      node.ctx = ctx;
      return SetContext(*node.children[0], ctx);
    case NodeKind::TUPLE: [[fallthrough]];
    case NodeKind::LIST:
      node.ctx = ctx;
      for (auto& i : node.children) {
        if (!SetContext(*i, ctx)) return false;
      }
      return true;
    default:
      return false;
  }
}

std::string DumpTree(const Node& node) {
  std::string ret;
  Dump(node, ret);
  return ret;
}
