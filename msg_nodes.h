#pragma once
#include <cstdint>
#include <string>
#include <vector>

// Knoten des Message-AST. Geschlossene Menge von Arten, alle switch-Stellen
// decken jede Art ab.
struct MsgNode {
  enum class Kind : uint8_t {
    TEXT        = 0,
    TAG         = 1,
    VOID_TAG    = 2,
    PLACEHOLDER = 3
  };

  Kind kind = Kind::TEXT;
  // TEXT: Inhalt, sonst der Name des Tags bzw. Placeholders
  std::string value;
  // nur bei TAG belegt
  std::vector<MsgNode> children;

  static MsgNode text(std::string value);
  static MsgNode tag(std::string name, std::vector<MsgNode> children);
  static MsgNode void_tag(std::string name);
  static MsgNode placeholder(std::string name);

  bool is_text() const noexcept { return kind == Kind::TEXT; }
  const std::string& name() const noexcept { return value; }

  bool operator==(const MsgNode& other) const;
  bool operator!=(const MsgNode& other) const { return !(*this == other); }
};

using MsgAst = std::vector<MsgNode>;

const char* msg_node_kind_name(MsgNode::Kind kind) noexcept;

// Debug-Darstellung, z. B. [text("a "), tag(b)[text("c")], placeholder(n)]
std::string dump_ast(const MsgAst& ast);
