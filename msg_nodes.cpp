#include "msg_nodes.h"

#include <utility>

MsgNode MsgNode::text(std::string value) {
  MsgNode n;
  n.kind = Kind::TEXT;
  n.value = std::move(value);
  return n;
}

MsgNode MsgNode::tag(std::string name, std::vector<MsgNode> children) {
  MsgNode n;
  n.kind = Kind::TAG;
  n.value = std::move(name);
  n.children = std::move(children);
  return n;
}

MsgNode MsgNode::void_tag(std::string name) {
  MsgNode n;
  n.kind = Kind::VOID_TAG;
  n.value = std::move(name);
  return n;
}

MsgNode MsgNode::placeholder(std::string name) {
  MsgNode n;
  n.kind = Kind::PLACEHOLDER;
  n.value = std::move(name);
  return n;
}

bool MsgNode::operator==(const MsgNode& other) const {
  return kind == other.kind && value == other.value && children == other.children;
}

const char* msg_node_kind_name(MsgNode::Kind kind) noexcept {
  switch (kind) {
    case MsgNode::Kind::TEXT:        return "text";
    case MsgNode::Kind::TAG:         return "tag";
    case MsgNode::Kind::VOID_TAG:    return "void_tag";
    case MsgNode::Kind::PLACEHOLDER: return "placeholder";
  }
  return "unknown";
}

namespace {
void dump_nodes(const MsgAst& nodes, std::string& out) {
  out += '[';
  for (size_t i = 0; i < nodes.size(); ++i) {
    const MsgNode& n = nodes[i];
    if (i > 0) out += ", ";
    out += msg_node_kind_name(n.kind);
    out += '(';
    if (n.is_text()) {
      out += '"';
      out += n.value;
      out += '"';
    } else {
      out += n.value;
    }
    out += ')';
    if (n.kind == MsgNode::Kind::TAG) dump_nodes(n.children, out);
  }
  out += ']';
}
} // namespace

std::string dump_ast(const MsgAst& ast) {
  std::string out;
  out.reserve(ast.size() * 16);
  dump_nodes(ast, out);
  return out;
}
