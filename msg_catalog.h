#pragma once
#include <string>
#include <vector>
#include <unordered_map>
#include <unordered_set>
#include <cstdint>

#include "msg_error.h"
#include "msg_formatter.h"

// Nachrichten einer Locale (id -> Markup-String) plus Meta-Daten.
// Textformat:
//   @meta locale = ru
//   # Kommentar
//   dashboard.title: <b>Panel</b>
//   queries.count(plural): %count% a|%count% b|%count% c|%count% d
// Nicht threadsafe, wie eine Engine-Instanz.
class MsgCatalog {
private:
  std::unordered_map<std::string, std::string> catalog;
  std::unordered_map<std::string, std::string> labels;
  std::unordered_set<std::string> plural_ids;
  std::string last_error;
  MsgErrorCode last_code = MsgErrorCode::NONE;
  std::string meta_locale;
  std::string meta_fallback;
  std::string meta_note;

  static bool is_ws(unsigned char c) noexcept;
  static bool is_message_id(const std::string& s) noexcept;
  static void strip_utf8_bom(std::string& s);
  static std::string to_lower_ascii(std::string s);
  static std::string unescape_txt_min(const std::string& s);
  static bool parse_line(const std::string& line_in,
                         std::string& out_id,
                         std::string& out_label,
                         std::string& out_text,
                         std::string& out_err);
  static bool parse_meta_line(const std::string& line, std::string& key, std::string& value);
  static bool starts_with(const std::string& s, const char* pref);
  std::vector<std::string> sorted_ids() const;
  void set_last_error(const MsgError& err);
  void set_last_error(MsgErrorCode code, std::string msg);
  void clear_last_error();
  friend void set_catalog_error(MsgCatalog* cat, MsgErrorCode code, const std::string& msg);
  friend void clear_catalog_error(MsgCatalog* cat);

public:
  static constexpr const char* PLURAL_LABEL = "plural";
  static constexpr const char* COUNT_VALUE = "count";

  const char* get_last_error() const noexcept;
  MsgErrorCode get_last_error_code() const noexcept;
  const std::string& get_meta_locale() const noexcept;
  const std::string& get_meta_fallback() const noexcept;
  const std::string& get_meta_note() const noexcept;
  // Locale für Plural-Regeln: meta locale, sonst fallback, sonst leer
  std::string plural_locale() const;

  bool load_txt_catalog(std::string src, bool strict);
  size_t size() const noexcept { return catalog.size(); }
  bool has(const std::string& id) const;
  bool is_plural(const std::string& id) const;
  const std::string* message(const std::string& id) const;

  // Unbekannte id -> sichtbarer Marker "⟦id⟧". false nur bei Parse-/Format-Fehlern.
  bool translate(const std::string& id, const MsgValues<std::string>& values, std::string& out);
  // Wählt die Plural-Form für n; "count" wird aus n ergänzt, falls nicht gesetzt.
  bool translate_plural(const std::string& id, long long n,
                        const MsgValues<std::string>& values, std::string& out);

  // QA-Report: diese Übersetzung gegen den Basis-Katalog.
  // out_code: 0 ok, 2 leer, 3 Fehler
  std::string check_against(const MsgCatalog& base, int& out_code) const;
  std::string dump_table() const;
  std::string find_any(const std::string& query) const;
};

void set_catalog_error(MsgCatalog* cat, MsgErrorCode code, const std::string& msg);
void clear_catalog_error(MsgCatalog* cat);
