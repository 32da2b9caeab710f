#pragma once
#include <cstdint>
#include <functional>
#include <sstream>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include "msg_error.h"
#include "msg_nodes.h"

// Wert für einen Tag/Void-Tag/Placeholder: Text, Zahl oder Funktion, die den
// gerenderten Kind-Inhalt eines Tags bekommt und ein beliebiges T liefert.
template <typename T>
class MsgValue {
public:
  enum class Kind : uint8_t {
    TEXT     = 0,
    INTEGER  = 1,
    REAL     = 2,
    FUNCTION = 3,
    UNSIGNED = 4
  };

  using Function = std::function<T(const std::string&)>;

  MsgValue(std::string s) : kind_(Kind::TEXT), text_(std::move(s)) {}
  MsgValue(const char* s) : kind_(Kind::TEXT), text_(s ? s : "") {}
  MsgValue(int v) : kind_(Kind::INTEGER), integer_(v) {}
  MsgValue(long v) : kind_(Kind::INTEGER), integer_(v) {}
  MsgValue(long long v) : kind_(Kind::INTEGER), integer_(v) {}
  MsgValue(unsigned v) : kind_(Kind::INTEGER), integer_(v) {}
  MsgValue(unsigned long v) : kind_(Kind::UNSIGNED), unsigned_(v) {}
  MsgValue(unsigned long long v) : kind_(Kind::UNSIGNED), unsigned_(v) {}
  MsgValue(double v) : kind_(Kind::REAL), real_(v) {}

  template <typename F,
            typename = std::enable_if_t<!std::is_convertible_v<F, std::string> &&
                                        std::is_invocable_r_v<T, F, const std::string&>>>
  MsgValue(F fn) : kind_(Kind::FUNCTION), fn_(std::move(fn)) {}

  Kind kind() const noexcept { return kind_; }
  bool is_function() const noexcept { return kind_ == Kind::FUNCTION; }

  // Textform für TEXT/INTEGER/UNSIGNED/REAL
  std::string to_text() const;
  T invoke(const std::string& children) const { return fn_(children); }

private:
  Kind kind_;
  std::string text_;
  long long integer_ = 0;
  unsigned long long unsigned_ = 0;
  double real_ = 0.0;
  Function fn_;
};

template <typename T>
using MsgValues = std::unordered_map<std::string, MsgValue<T>>;

template <typename T>
struct MsgPart {
  std::variant<std::string, T> data;

  bool is_text() const noexcept { return data.index() == 0; }
  const std::string& text() const { return std::get<0>(data); }
  const T& value() const { return std::get<1>(data); }
};

std::string msg_integer_to_text(long long v);
std::string msg_unsigned_to_text(unsigned long long v);
std::string msg_real_to_text(double v);
void set_missing_value(MsgError& err, const std::string& name);

template <typename T>
std::string MsgValue<T>::to_text() const {
  switch (kind_) {
    case Kind::TEXT:     return text_;
    case Kind::INTEGER:  return msg_integer_to_text(integer_);
    case Kind::UNSIGNED: return msg_unsigned_to_text(unsigned_);
    case Kind::REAL:     return msg_real_to_text(real_);
    case Kind::FUNCTION: return {};
  }
  return {};
}

template <typename T>
class MsgFormatter {
public:
  using Parts = std::vector<MsgPart<T>>;

  // Rendert den AST. Bei fehlendem Wert: false, err.code == MISSING_VALUE,
  // out bleibt leer.
  static bool format(const MsgAst& ast, const MsgValues<T>& values, Parts& out, MsgError& err) {
    err.clear();
    out.clear();
    Parts parts;
    if (!format_nodes(ast, values, parts, err)) return false;
    out = std::move(parts);
    return true;
  }

  static std::string part_to_text(const MsgPart<T>& part) {
    if (part.is_text()) return part.text();
    if constexpr (std::is_convertible_v<T, std::string>) {
      return std::string(part.value());
    } else {
      std::ostringstream ss;
      ss << part.value();
      return ss.str();
    }
  }

private:
  static void push_text(Parts& out, std::string s) {
    MsgPart<T> p{ std::variant<std::string, T>(std::in_place_index<0>, std::move(s)) };
    out.push_back(std::move(p));
  }

  static void push_value(Parts& out, T v) {
    MsgPart<T> p{ std::variant<std::string, T>(std::in_place_index<1>, std::move(v)) };
    out.push_back(std::move(p));
  }

  static bool format_nodes(const MsgAst& nodes, const MsgValues<T>& values, Parts& out, MsgError& err) {
    for (const MsgNode& node : nodes) {
      switch (node.kind) {
        case MsgNode::Kind::TEXT:
          push_text(out, node.value);
          break;

        case MsgNode::Kind::TAG: {
          Parts child_parts;
          if (!format_nodes(node.children, values, child_parts, err)) return false;

          auto it = values.find(node.name());
          if (it == values.end()) { set_missing_value(err, node.name()); return false; }

          if (it->second.is_function()) {
            std::string children;
            for (const auto& p : child_parts) children += part_to_text(p);
            push_value(out, it->second.invoke(children));
          } else {
            push_text(out, it->second.to_text());
          }
          break;
        }

        case MsgNode::Kind::VOID_TAG:
        case MsgNode::Kind::PLACEHOLDER: {
          auto it = values.find(node.name());
          if (it == values.end()) { set_missing_value(err, node.name()); return false; }

          if (it->second.is_function()) push_value(out, it->second.invoke(std::string()));
          else push_text(out, it->second.to_text());
          break;
        }
      }
    }
    return true;
  }
};

// Rendert alles zu einem String (Funktionen liefern Strings).
bool format_to_string(const MsgAst& ast, const MsgValues<std::string>& values,
                      std::string& out, MsgError& err);

// parse + format_to_string in einem Schritt
bool render_message(const std::string& src, const MsgValues<std::string>& values,
                    std::string& out, MsgError& err);
