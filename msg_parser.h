#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "msg_error.h"
#include "msg_nodes.h"

// Parser für die vereinfachte Markup-Syntax:
//   text, <name>...</name>, <name/>, %name%, %% für ein literales '%'.
class MsgParser {
public:
  // Liefert false nur bei unbalancierten Tags (err.code == UNBALANCED_TAGS,
  // err.detail == src). Unterminierte Tags/Placeholders am Ende werden Text.
  static bool parse(const std::string& src, MsgAst& out, MsgError& err);

private:
  enum class State : uint8_t {
    TEXT        = 0,
    TAG         = 1,
    PLACEHOLDER = 2
  };

  // Stack-Eintrag: entweder offener Tag (Marker) oder fertiger Kindknoten
  struct StackEntry {
    bool open_marker = false;
    std::string tag_name;
    MsgNode node;
  };

  struct Context {
    const std::string& src;
    std::vector<StackEntry> stack;
    MsgAst result;
    size_t pos = 0;
    size_t last_state_change = 0;
    std::string tag;
    std::string text;
    std::string placeholder;

    explicit Context(const std::string& s) : src(s) {}
  };

  static State on_text(Context& ctx, char c);
  static State on_placeholder(Context& ctx, char c);
  static bool on_tag(Context& ctx, char c, State& next, MsgError& err);
  static bool close_tag(Context& ctx, MsgError& err);

  static void emit(Context& ctx, MsgNode node);
  static void flush_text(Context& ctx);
  static void set_unbalanced(const Context& ctx, MsgError& err);
};
