#include "msg_structure.h"

#include <vector>

std::vector<const MsgNode*> MsgStructure::structural_nodes(const MsgAst& nodes) {
  std::vector<const MsgNode*> out;
  out.reserve(nodes.size());
  for (const MsgNode& n : nodes) {
    if (!n.is_text()) out.push_back(&n);
  }
  return out;
}

std::string MsgStructure::node_label(const MsgNode& node) {
  switch (node.kind) {
    case MsgNode::Kind::TEXT:        return "text";
    case MsgNode::Kind::TAG:         return "<" + node.name() + ">";
    case MsgNode::Kind::VOID_TAG:    return "<" + node.name() + "/>";
    case MsgNode::Kind::PLACEHOLDER: return "%" + node.name() + "%";
  }
  return {};
}

// Jeder Basisknoten sucht auf seiner Ebene irgendeinen passenden Zielknoten.
// Die Knotenanzahl muss gleich sein, die Reihenfolge nicht.
bool MsgStructure::compare_level(const MsgAst& base, const MsgAst& target, std::string* why) {
  const auto base_nodes = structural_nodes(base);
  const auto target_nodes = structural_nodes(target);

  if (base_nodes.size() != target_nodes.size()) {
    if (why) {
      *why = "node count differs (" + std::to_string(base_nodes.size()) + " vs " +
             std::to_string(target_nodes.size()) + ")";
    }
    return false;
  }

  for (const MsgNode* b : base_nodes) {
    bool matched = false;
    std::string nested_why;

    for (size_t i = 0; i < target_nodes.size() && !matched; ++i) {
      const MsgNode* t = target_nodes[i];
      if (t->kind != b->kind || t->name() != b->name()) continue;

      if (b->kind == MsgNode::Kind::TAG) {
        std::string child_why;
        if (!compare_level(b->children, t->children, why ? &child_why : nullptr)) {
          if (nested_why.empty()) nested_why = std::move(child_why);
          continue;
        }
      }

      matched = true;
    }

    if (!matched) {
      if (why) {
        if (!nested_why.empty()) *why = "inside " + node_label(*b) + ": " + nested_why;
        else *why = "missing " + std::string(msg_node_kind_name(b->kind)) + " " + node_label(*b);
      }
      return false;
    }
  }
  return true;
}

bool MsgStructure::is_equivalent(const MsgAst& base, const MsgAst& target) {
  return compare_level(base, target, nullptr);
}

std::string MsgStructure::describe_mismatch(const MsgAst& base, const MsgAst& target) {
  std::string why;
  if (compare_level(base, target, &why)) return {};
  return why;
}
