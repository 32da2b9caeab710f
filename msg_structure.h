#pragma once
#include <string>

#include "msg_nodes.h"

// Vergleicht zwei ASTs nur über Tags, Void-Tags und Placeholders (Art + Name,
// Verschachtelung). Text wird ignoriert, die Reihenfolge pro Ebene ebenfalls.
class MsgStructure {
public:
  static bool is_equivalent(const MsgAst& base, const MsgAst& target);

  // Leerer String bei Gleichheit, sonst die erste Abweichung,
  // z. B. "missing tag <a>" oder "node count differs (2 vs 1)".
  static std::string describe_mismatch(const MsgAst& base, const MsgAst& target);

  // "<a>", "<br/>" oder "%n%"
  static std::string node_label(const MsgNode& node);

private:
  static std::vector<const MsgNode*> structural_nodes(const MsgAst& nodes);
  static bool compare_level(const MsgAst& base, const MsgAst& target, std::string* why);
};

inline bool is_structurally_equivalent(const MsgAst& base, const MsgAst& target) {
  return MsgStructure::is_equivalent(base, target);
}
