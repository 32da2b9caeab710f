#include "msg_catalog.h"
#include "msg_parser.h"
#include "msg_structure.h"
#include "msg_text.h"
#include "plural_rules.h"

#include <algorithm>
#include <cctype>
#include <utility>

namespace {
constexpr size_t MAX_ID_LENGTH = 128;
} // namespace

void set_catalog_error(MsgCatalog* cat, MsgErrorCode code, const std::string& msg) {
  if (cat) cat->set_last_error(code, msg);
}

void clear_catalog_error(MsgCatalog* cat) {
  if (cat) cat->clear_last_error();
}

bool MsgCatalog::is_ws(unsigned char c) noexcept { return std::isspace(c) != 0; }

bool MsgCatalog::is_message_id(const std::string& s) noexcept {
  if (s.empty() || s.size() > MAX_ID_LENGTH) return false;
  for (char c : s) {
    const unsigned char uc = (unsigned char)c;
    if (!(std::isalnum(uc) || c == '_' || c == '.' || c == '-')) return false;
  }
  return true;
}

void MsgCatalog::strip_utf8_bom(std::string& s) {
  if (s.size() >= 3 &&
      (unsigned char)s[0] == 0xEF &&
      (unsigned char)s[1] == 0xBB &&
      (unsigned char)s[2] == 0xBF) {
    s.erase(0, 3);
  }
}

std::string MsgCatalog::to_lower_ascii(std::string s) {
  for (char& c : s) c = (char)std::tolower((unsigned char)c);
  return s;
}

std::string MsgCatalog::unescape_txt_min(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size(); ++i) {
    if (s[i] == '\\' && i + 1 < s.size()) {
      char c = s[i + 1];
      switch (c) {
        case 'n': out += '\n'; break;
        case 't': out += '\t'; break;
        case 'r': out += '\r'; break;
        case '\\': out += '\\'; break;
        case ':': out += ':'; break;
        default: out += c; break;
      }
      ++i;
    } else {
      out += s[i];
    }
  }
  return out;
}

// id[(label)]: text
bool MsgCatalog::parse_line(const std::string& line_in,
                            std::string& out_id,
                            std::string& out_label,
                            std::string& out_text,
                            std::string& out_err) {
  out_err.clear();
  out_id.clear();
  out_label.clear();
  out_text.clear();

  std::string line = line_in;
  msg_trim_inplace(line);
  if (line.empty()) return false;
  if (line[0] == '#') return false;

  const auto colon = line.find(':');
  if (colon == std::string::npos) {
    out_err = "no ':' found";
    return false;
  }

  std::string head = line.substr(0, colon);
  std::string text = line.substr(colon + 1);
  msg_trim_inplace(head);
  while (!text.empty() && is_ws((unsigned char)text.front())) text.erase(text.begin());

  std::string id;
  std::string label;

  const auto paren_open = head.find('(');
  if (paren_open == std::string::npos) {
    id = head;
  } else {
    id = head.substr(0, paren_open);
    msg_trim_inplace(id);

    const auto paren_close = head.find(')', paren_open + 1);
    if (paren_close == std::string::npos) {
      out_err = "label '(' without closing ')'";
      return false;
    }

    label = head.substr(paren_open + 1, paren_close - (paren_open + 1));
    msg_trim_inplace(label);
  }

  if (!is_message_id(id)) {
    out_err = "invalid message id '" + id + "'";
    return false;
  }

  out_id = std::move(id);
  out_label = std::move(label);
  out_text = unescape_txt_min(text);
  return true;
}

bool MsgCatalog::starts_with(const std::string& s, const char* pref) {
  return s.rfind(pref, 0) == 0;
}

bool MsgCatalog::parse_meta_line(const std::string& line, std::string& key, std::string& value) {
  key.clear();
  value.clear();

  std::string s = line;
  msg_trim_inplace(s);
  if (!starts_with(s, "@meta")) return false;

  s.erase(0, 5);
  msg_trim_inplace(s);
  if (s.empty()) return false;

  const auto eq = s.find('=');
  if (eq == std::string::npos) return false;

  key = s.substr(0, eq);
  value = s.substr(eq + 1);
  msg_trim_inplace(key);
  msg_trim_inplace(value);
  key = to_lower_ascii(key);

  return !key.empty() && !value.empty();
}

const char* MsgCatalog::get_last_error() const noexcept { return last_error.c_str(); }

MsgErrorCode MsgCatalog::get_last_error_code() const noexcept { return last_code; }

void MsgCatalog::set_last_error(const MsgError& err) {
  last_code = err.code;
  last_error = err.message;
}

void MsgCatalog::set_last_error(MsgErrorCode code, std::string msg) {
  last_code = code;
  last_error = std::move(msg);
}

void MsgCatalog::clear_last_error() {
  last_code = MsgErrorCode::NONE;
  last_error.clear();
}

const std::string& MsgCatalog::get_meta_locale() const noexcept { return meta_locale; }
const std::string& MsgCatalog::get_meta_fallback() const noexcept { return meta_fallback; }
const std::string& MsgCatalog::get_meta_note() const noexcept { return meta_note; }

std::string MsgCatalog::plural_locale() const {
  if (!meta_locale.empty() && PluralRules::is_supported(meta_locale)) return meta_locale;
  if (!meta_fallback.empty() && PluralRules::is_supported(meta_fallback)) return meta_fallback;
  return meta_locale;
}

bool MsgCatalog::load_txt_catalog(std::string src, bool strict) {
  clear_last_error();
  if (src.empty()) { set_last_error(MsgErrorCode::CATALOG, "src is empty"); return false; }

  catalog.clear();
  labels.clear();
  plural_ids.clear();
  meta_locale.clear();
  meta_fallback.clear();
  meta_note.clear();

  strip_utf8_bom(src);

  size_t start = 0;
  size_t loaded = 0;
  int line_no = 0;

  auto next_line = [&](std::string& out_line) -> bool {
    if (start >= src.size()) return false;
    size_t end = src.find('\n', start);
    if (end == std::string::npos) end = src.size();

    out_line = src.substr(start, end - start);
    if (!out_line.empty() && out_line.back() == '\r') out_line.pop_back();

    start = (end < src.size()) ? end + 1 : src.size();
    return true;
  };

  std::string line;
  bool seen_any_entry = false;
  while (next_line(line)) {
    ++line_no;

    std::string raw = line;
    msg_trim_inplace(raw);
    if (raw.empty()) continue;
    if (raw[0] == '#') continue;

    std::string key, value;
    if (parse_meta_line(raw, key, value)) {
      if (seen_any_entry) {
        if (strict) {
          set_last_error(MsgErrorCode::CATALOG, "Meta line after entries at line " + std::to_string(line_no));
          return false;
        }
        continue;
      }

      if (key == "locale") { meta_locale = value; continue; }
      if (key == "fallback") { meta_fallback = value; continue; }
      if (key == "note") { meta_note = value; continue; }
      if (strict) {
        set_last_error(MsgErrorCode::CATALOG, "Unknown meta key '" + key + "' at line " + std::to_string(line_no));
        return false;
      }
      continue;
    }

    std::string id, label, text, err;
    const bool ok = parse_line(line, id, label, text, err);

    if (!ok) {
      if (strict && !err.empty()) {
        set_last_error(MsgErrorCode::CATALOG, "Parse error at line " + std::to_string(line_no) + ": " + err);
        return false;
      }
      continue;
    }

    if (catalog.find(id) != catalog.end()) {
      set_last_error(MsgErrorCode::CATALOG, "Duplicate id at line " + std::to_string(line_no) + ": " + id);
      return false;
    }

    if (to_lower_ascii(label) == PLURAL_LABEL) plural_ids.insert(id);
    catalog.emplace(id, std::move(text));
    if (!label.empty()) labels.emplace(std::move(id), std::move(label));
    ++loaded;
    seen_any_entry = true;
  }

  if (loaded == 0) {
    set_last_error(MsgErrorCode::CATALOG, "No valid entry loaded (empty catalog?)");
    return false;
  }
  return true;
}

bool MsgCatalog::has(const std::string& id) const {
  return catalog.find(id) != catalog.end();
}

bool MsgCatalog::is_plural(const std::string& id) const {
  return plural_ids.count(id) != 0;
}

const std::string* MsgCatalog::message(const std::string& id) const {
  auto it = catalog.find(id);
  return it == catalog.end() ? nullptr : &it->second;
}

bool MsgCatalog::translate(const std::string& id, const MsgValues<std::string>& values, std::string& out) {
  clear_last_error();
  out.clear();

  const std::string* raw = message(id);
  if (!raw) {
    out = "⟦" + id + "⟧";
    return true;
  }

  MsgError err;
  if (!render_message(*raw, values, out, err)) {
    set_last_error(err);
    return false;
  }
  return true;
}

bool MsgCatalog::translate_plural(const std::string& id, long long n,
                                  const MsgValues<std::string>& values, std::string& out) {
  clear_last_error();
  out.clear();

  const std::string* raw = message(id);
  if (!raw) {
    out = "⟦" + id + "⟧";
    return true;
  }

  MsgError err;
  std::string form;
  if (!PluralRules::select_form(*raw, n, plural_locale(), id, form, err)) {
    set_last_error(err);
    return false;
  }

  MsgValues<std::string> with_count = values;
  with_count.emplace(COUNT_VALUE, MsgValue<std::string>(n));

  if (!render_message(form, with_count, out, err)) {
    set_last_error(err);
    return false;
  }
  return true;
}

std::vector<std::string> MsgCatalog::sorted_ids() const {
  std::vector<std::string> ids;
  ids.reserve(catalog.size());
  for (const auto& kv : catalog) ids.push_back(kv.first);
  std::sort(ids.begin(), ids.end());
  return ids;
}

std::string MsgCatalog::check_against(const MsgCatalog& base, int& out_code) const {
  out_code = 0;

  if (catalog.empty() || base.catalog.empty()) {
    out_code = 2;
    return "CHECK: FAIL\nReason: catalog is empty or not loaded.\n";
  }

  size_t warnings = 0;
  size_t errors = 0;

  std::string report;
  report.reserve(base.catalog.size() * 96);
  report += "CHECK: REPORT\n";
  report += "------------------------------\n";

  const std::string locale = plural_locale();
  const bool plural_ok = PluralRules::is_supported(locale);
  bool plural_locale_reported = false;

  MsgError err;
  for (const auto& id : base.sorted_ids()) {
    const std::string& base_text = base.catalog.at(id);

    auto it = catalog.find(id);
    if (it == catalog.end()) {
      ++errors;
      report += "ERROR "; report += id; report += ": missing translation\n";
      continue;
    }
    const std::string& text = it->second;

    if (base.is_plural(id)) {
      if (!plural_ok) {
        if (!plural_locale_reported) {
          ++errors;
          report += "ERROR locale '"; report += locale; report += "' has no plural rules\n";
          plural_locale_reported = true;
        }
        continue;
      }
      if (!PluralRules::check_forms(text, locale, id, err)) {
        ++errors;
        report += "ERROR "; report += id; report += ": "; report += err.message; report += "\n";
      }
      continue;
    }

    MsgAst base_ast;
    if (!MsgParser::parse(base_text, base_ast, err)) {
      ++errors;
      report += "ERROR "; report += id; report += ": base message does not parse: ";
      report += err.message; report += "\n";
      continue;
    }

    MsgAst target_ast;
    if (!MsgParser::parse(text, target_ast, err)) {
      ++errors;
      report += "ERROR "; report += id; report += ": "; report += err.message; report += "\n";
      continue;
    }

    const std::string why = MsgStructure::describe_mismatch(base_ast, target_ast);
    if (!why.empty()) {
      ++errors;
      report += "ERROR "; report += id; report += ": structure differs from base, "; report += why;
      report += "\n";
    }
  }

  for (const auto& id : sorted_ids()) {
    if (!base.has(id)) {
      ++warnings;
      report += "WARN "; report += id; report += ": not present in base catalog\n";
    }
  }

  report += "------------------------------\n";
  report += "Messages: "; report += std::to_string(base.catalog.size()); report += "\n";
  report += "Warnings: "; report += std::to_string(warnings); report += "\n";
  report += "Errors: "; report += std::to_string(errors); report += "\n";

  if (errors > 0) {
    report += "CHECK: FAIL\n";
    out_code = 3;
  } else if (warnings > 0) {
    report += "CHECK: OK (with warnings)\n";
  } else {
    report += "CHECK: OK\n";
  }

  return report;
}

std::string MsgCatalog::dump_table() const {
  std::string out;
  out.reserve(catalog.size() * 64);

  out += "Id                       | Label      | Message\n";
  out += "------------------------------------------------------------\n";

  for (const auto& id : sorted_ids()) {
    const std::string& text = catalog.at(id);
    auto itL = labels.find(id);
    const std::string label = (itL != labels.end()) ? itL->second : "";

    out += id;
    if (id.size() < 24) out.append(24 - id.size(), ' ');
    out += " | ";

    out += label;
    if (label.size() < 10) out.append(10 - label.size(), ' ');
    out += " | ";

    out += text;
    out += "\n";
  }

  return out;
}

std::string MsgCatalog::find_any(const std::string& query) const {
  const std::string q = to_lower_ascii(query);

  std::string out;
  for (const auto& id : sorted_ids()) {
    const std::string& text = catalog.at(id);

    std::string lbl;
    auto itL = labels.find(id);
    if (itL != labels.end()) lbl = itL->second;

    if (to_lower_ascii(id).find(q) != std::string::npos ||
        to_lower_ascii(text).find(q) != std::string::npos ||
        (!lbl.empty() && to_lower_ascii(lbl).find(q) != std::string::npos)) {
      out += id;
      out += "(";
      out += lbl;
      out += "): ";
      out += text;
      out += "\n";
    }
  }

  if (out.empty()) out = "(no matches)\n";
  return out;
}
