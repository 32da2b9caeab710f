#include "msg_formatter.h"
#include "msg_parser.h"

#include <cmath>
#include <cstdio>
#include <string>

std::string msg_integer_to_text(long long v) {
  return std::to_string(v);
}

std::string msg_unsigned_to_text(unsigned long long v) {
  return std::to_string(v);
}

std::string msg_real_to_text(double v) {
  if (std::isnan(v)) return "NaN";
  if (std::isinf(v)) return v < 0 ? "-Infinity" : "Infinity";

  // ganzzahlige Werte ohne Nachkommastellen
  if (std::fabs(v) < 1e15 && v == std::floor(v)) return std::to_string((long long)v);

  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.15g", v);
  return buf;
}

void set_missing_value(MsgError& err, const std::string& name) {
  err.set(MsgErrorCode::MISSING_VALUE, "Missing value for node " + name, name);
}

bool format_to_string(const MsgAst& ast, const MsgValues<std::string>& values,
                      std::string& out, MsgError& err) {
  out.clear();
  MsgFormatter<std::string>::Parts parts;
  if (!MsgFormatter<std::string>::format(ast, values, parts, err)) return false;

  std::string res;
  for (const auto& p : parts) res += MsgFormatter<std::string>::part_to_text(p);
  out = std::move(res);
  return true;
}

bool render_message(const std::string& src, const MsgValues<std::string>& values,
                    std::string& out, MsgError& err) {
  out.clear();
  MsgAst ast;
  if (!MsgParser::parse(src, ast, err)) return false;
  return format_to_string(ast, values, out, err);
}
