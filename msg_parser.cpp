#include "msg_parser.h"
#include "msg_text.h"

#include <utility>

namespace {
constexpr char TAG_OPEN_BRACE = '<';
constexpr char TAG_CLOSE_BRACE = '>';
constexpr char CLOSING_TAG_MARK = '/';
constexpr char PLACEHOLDER_MARK = '%';
} // namespace

void MsgParser::set_unbalanced(const Context& ctx, MsgError& err) {
  err.set(MsgErrorCode::UNBALANCED_TAGS, "String has unbalanced tags: " + ctx.src, ctx.src);
}

// Knoten landet im innersten offenen Tag (Stack) oder auf oberster Ebene
void MsgParser::emit(Context& ctx, MsgNode node) {
  if (!ctx.stack.empty()) {
    StackEntry e;
    e.node = std::move(node);
    ctx.stack.push_back(std::move(e));
  } else {
    ctx.result.push_back(std::move(node));
  }
}

void MsgParser::flush_text(Context& ctx) {
  if (!ctx.text.empty()) emit(ctx, MsgNode::text(std::move(ctx.text)));
  ctx.text.clear();
}

MsgParser::State MsgParser::on_text(Context& ctx, char c) {
  if (c == TAG_OPEN_BRACE) {
    ctx.last_state_change = ctx.pos;
    return State::TAG;
  }
  if (c == PLACEHOLDER_MARK) {
    ctx.last_state_change = ctx.pos;
    return State::PLACEHOLDER;
  }
  ctx.text += c;
  return State::TEXT;
}

MsgParser::State MsgParser::on_placeholder(Context& ctx, char c) {
  if (c != PLACEHOLDER_MARK) {
    ctx.placeholder += c;
    return State::PLACEHOLDER;
  }

  // %% -> literales '%'
  if (ctx.pos - ctx.last_state_change == 1) {
    ctx.text += PLACEHOLDER_MARK;
    return State::TEXT;
  }

  flush_text(ctx);
  emit(ctx, MsgNode::placeholder(std::move(ctx.placeholder)));
  ctx.placeholder.clear();
  return State::TEXT;
}

bool MsgParser::close_tag(Context& ctx, MsgError& err) {
  std::string name = ctx.tag.substr(1);
  msg_trim_inplace(name);

  std::vector<MsgNode> children;
  if (!ctx.text.empty()) {
    children.push_back(MsgNode::text(std::move(ctx.text)));
    ctx.text.clear();
  }

  if (ctx.stack.empty()) {
    set_unbalanced(ctx, err);
    return false;
  }

  bool pair_found = false;
  while (!pair_found && !ctx.stack.empty()) {
    StackEntry top = std::move(ctx.stack.back());
    ctx.stack.pop_back();

    if (!top.open_marker) {
      children.insert(children.begin(), std::move(top.node));
    } else if (top.tag_name == name) {
      emit(ctx, MsgNode::tag(std::move(name), std::move(children)));
      children.clear();
      pair_found = true;
    } else {
      set_unbalanced(ctx, err);
      return false;
    }

    if (ctx.stack.empty() && !children.empty()) {
      set_unbalanced(ctx, err);
      return false;
    }
  }

  ctx.tag.clear();
  return true;
}

bool MsgParser::on_tag(Context& ctx, char c, State& next, MsgError& err) {
  next = State::TAG;

  if (c == TAG_CLOSE_BRACE) {
    next = State::TEXT;

    // </name>
    if (!ctx.tag.empty() && ctx.tag.front() == CLOSING_TAG_MARK) {
      return close_tag(ctx, err);
    }

    // <name/>, auch <> (Void-Tag ohne Namen)
    if (ctx.tag.empty() || ctx.tag.back() == CLOSING_TAG_MARK) {
      if (!ctx.tag.empty()) ctx.tag.pop_back();
      flush_text(ctx);
      emit(ctx, MsgNode::void_tag(std::move(ctx.tag)));
      ctx.tag.clear();
      return true;
    }

    // <name>
    flush_text(ctx);
    StackEntry marker;
    marker.open_marker = true;
    marker.tag_name = std::move(ctx.tag);
    ctx.stack.push_back(std::move(marker));
    ctx.tag.clear();
    return true;
  }

  // Zweites '<' ohne '>': der bisherige Tag-Anlauf war Text
  if (c == TAG_OPEN_BRACE) {
    ctx.text.append(ctx.src, ctx.last_state_change, ctx.pos - ctx.last_state_change);
    ctx.last_state_change = ctx.pos;
    ctx.tag.clear();
    return true;
  }

  ctx.tag += c;
  return true;
}

bool MsgParser::parse(const std::string& src, MsgAst& out, MsgError& err) {
  err.clear();
  out.clear();

  Context ctx(src);
  State state = State::TEXT;

  for (ctx.pos = 0; ctx.pos < src.size(); ++ctx.pos) {
    const char c = src[ctx.pos];
    switch (state) {
      case State::TEXT:
        state = on_text(ctx, c);
        break;
      case State::PLACEHOLDER:
        state = on_placeholder(ctx, c);
        break;
      case State::TAG:
        if (!on_tag(ctx, c, state, err)) return false;
        break;
    }
  }

  // Tag oder Placeholder nie geschlossen -> als Text behandeln
  if (state != State::TEXT) {
    std::string rest = ctx.text;
    rest.append(src, ctx.last_state_change, std::string::npos);
    if (!rest.empty()) ctx.result.push_back(MsgNode::text(std::move(rest)));
  } else if (!ctx.text.empty()) {
    ctx.result.push_back(MsgNode::text(std::move(ctx.text)));
  }

  if (!ctx.stack.empty()) {
    set_unbalanced(ctx, err);
    return false;
  }

  out = std::move(ctx.result);
  return true;
}
