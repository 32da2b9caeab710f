#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "msg_error.h"

// Plural-Formen pro Locale. Ein Plural-String listet alle Formen der Locale
// mit '|' getrennt: "form0|form1|...". Index 0 ist bei allen Locales die
// Form für n == 0.
class PluralRules {
public:
  static constexpr char DELIMITER = '|';

  // 0 wenn die Locale unbekannt ist
  static int form_count(const std::string& locale);
  // -1 wenn die Locale unbekannt ist
  static int form_index(const std::string& locale, long long n);

  static bool is_supported(const std::string& locale);
  static std::vector<std::string> supported_locales();

  // Prüft nur die Anzahl der Formen. key dient der Fehlermeldung.
  static bool check_forms(const std::string& plural, const std::string& locale,
                          const std::string& key, MsgError& err);

  // Wählt die Form für n (getrimmt).
  static bool select_form(const std::string& plural, long long n, const std::string& locale,
                          const std::string& key, std::string& out, MsgError& err);

  // "pt-BR" / "PT_br" -> "pt"
  static std::string normalize_locale(const std::string& locale);

private:
  using RuleFn = int (*)(long long n);

  struct LocaleRule {
    int forms;
    RuleFn rule;
  };

  static const std::map<std::string, LocaleRule>& table();
  static const LocaleRule* find_rule(const std::string& locale);
  static std::vector<std::string> split_forms(const std::string& plural);
};
