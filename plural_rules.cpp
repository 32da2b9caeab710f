#include "plural_rules.h"
#include "msg_text.h"

#include <cctype>
#include <utility>

namespace {

// Regeln für n != 0; n == 0 behandelt form_index vorab.

// az, ja, zh, ...: keine Unterscheidung außer 0
int rule_no_distinction(long long) { return 1; }

// en, de, ...: 0 | one | other
int rule_one_other(long long n) { return n == 1 ? 1 : 2; }

// fr, hi, ...: 0 und 1 teilen sich Form 0
int rule_zero_one_same(long long n) { return n == 1 ? 0 : 1; }

// be, bs, hr, ru, sr, uk
int rule_slavic(long long n) {
  const long long mod10 = n % 10;
  const long long mod100 = n % 100;
  if (mod10 == 1 && mod100 != 11) return 1;
  if (mod10 >= 2 && mod10 <= 4 && (mod100 < 10 || mod100 >= 20)) return 2;
  return 3;
}

// cs, sk
int rule_czech(long long n) {
  if (n == 1) return 1;
  if (n >= 2 && n <= 4) return 2;
  return 3;
}

int rule_irish(long long n) {
  if (n == 1) return 1;
  if (n == 2) return 2;
  return 3;
}

int rule_lithuanian(long long n) {
  const long long mod10 = n % 10;
  const long long mod100 = n % 100;
  if (mod10 == 1 && mod100 != 11) return 1;
  if (mod10 >= 2 && (mod100 < 10 || mod100 >= 20)) return 2;
  return 3;
}

int rule_slovenian(long long n) {
  const long long mod100 = n % 100;
  if (mod100 == 1) return 1;
  if (mod100 == 2) return 2;
  if (mod100 == 3 || mod100 == 4) return 3;
  return 4;
}

int rule_macedonian(long long n) { return n % 10 == 1 ? 1 : 2; }

int rule_maltese(long long n) {
  const long long mod100 = n % 100;
  if (n == 1) return 1;
  if (mod100 > 1 && mod100 < 11) return 2;
  if (mod100 > 10 && mod100 < 20) return 3;
  return 4;
}

int rule_latvian(long long n) {
  return (n % 10 == 1 && n % 100 != 11) ? 1 : 2;
}

int rule_polish(long long n) {
  const long long mod10 = n % 10;
  const long long mod100 = n % 100;
  if (n == 1) return 1;
  if (mod10 >= 2 && mod10 <= 4 && (mod100 < 12 || mod100 > 14)) return 2;
  return 3;
}

int rule_welsh(long long n) {
  if (n == 1) return 0;
  if (n == 2) return 1;
  if (n == 8 || n == 11) return 2;
  return 3;
}

int rule_romanian(long long n) {
  const long long mod100 = n % 100;
  if (n == 1) return 1;
  if (mod100 > 0 && mod100 < 20) return 2;
  return 3;
}

int rule_arabic(long long n) {
  const long long mod100 = n % 100;
  if (n == 1) return 1;
  if (n == 2) return 2;
  if (mod100 >= 3 && mod100 <= 10) return 3;
  if (mod100 >= 11 && mod100 <= 99) return 4;
  return 5;
}

struct RuleFamily {
  std::vector<const char*> locales;
  int forms;
  int (*rule)(long long);
};

} // namespace

const std::map<std::string, PluralRules::LocaleRule>& PluralRules::table() {
  static const std::map<std::string, LocaleRule> rules = [] {
    const std::vector<RuleFamily> families = {
      { { "az", "bo", "dz", "id", "ja", "jv", "ka", "km", "kn", "ko", "ms", "th", "tr", "vi", "zh" },
        2, rule_no_distinction },
      { { "af", "bn", "bg", "ca", "da", "de", "el", "en", "eo", "es", "et", "eu", "fa", "fi", "fo",
          "fur", "fy", "gl", "gu", "ha", "he", "hu", "is", "it", "ku", "lb", "ml", "mn", "mr", "nah",
          "nb", "ne", "nl", "nn", "no", "oc", "om", "or", "pa", "pap", "ps", "pt", "so", "sq", "sv",
          "sw", "ta", "te", "tk", "ur", "zu" },
        3, rule_one_other },
      { { "am", "bh", "fil", "fr", "gun", "hi", "hy", "ln", "mg", "nso", "xbr", "ti", "wa" },
        2, rule_zero_one_same },
      { { "be", "bs", "hr", "ru", "sr", "uk" }, 4, rule_slavic },
      { { "cs", "sk" }, 4, rule_czech },
      { { "ga" }, 4, rule_irish },
      { { "lt" }, 4, rule_lithuanian },
      { { "sl" }, 5, rule_slovenian },
      { { "mk" }, 3, rule_macedonian },
      { { "mt" }, 5, rule_maltese },
      { { "lv" }, 3, rule_latvian },
      { { "pl" }, 4, rule_polish },
      { { "cy" }, 4, rule_welsh },
      { { "ro" }, 4, rule_romanian },
      { { "ar" }, 6, rule_arabic },
    };

    std::map<std::string, LocaleRule> t;
    for (const auto& f : families) {
      for (const char* loc : f.locales) t.emplace(loc, LocaleRule{ f.forms, f.rule });
    }
    return t;
  }();
  return rules;
}

const PluralRules::LocaleRule* PluralRules::find_rule(const std::string& locale) {
  const auto& rules = table();
  auto it = rules.find(normalize_locale(locale));
  if (it == rules.end()) return nullptr;
  return &it->second;
}

std::string PluralRules::normalize_locale(const std::string& locale) {
  std::string out;
  out.reserve(locale.size());
  for (char c : locale) {
    if (c == '-' || c == '_') break;
    out += (char)std::tolower((unsigned char)c);
  }
  return out;
}

std::vector<std::string> PluralRules::split_forms(const std::string& plural) {
  std::vector<std::string> forms;
  size_t start = 0;
  while (true) {
    const size_t end = plural.find(DELIMITER, start);
    if (end == std::string::npos) {
      forms.push_back(plural.substr(start));
      break;
    }
    forms.push_back(plural.substr(start, end - start));
    start = end + 1;
  }
  return forms;
}

int PluralRules::form_count(const std::string& locale) {
  const LocaleRule* r = find_rule(locale);
  return r ? r->forms : 0;
}

int PluralRules::form_index(const std::string& locale, long long n) {
  const LocaleRule* r = find_rule(locale);
  if (!r) return -1;
  if (n == 0) return 0;
  return r->rule(n);
}

bool PluralRules::is_supported(const std::string& locale) {
  return find_rule(locale) != nullptr;
}

std::vector<std::string> PluralRules::supported_locales() {
  std::vector<std::string> out;
  out.reserve(table().size());
  for (const auto& kv : table()) out.push_back(kv.first);
  return out;
}

bool PluralRules::check_forms(const std::string& plural, const std::string& locale,
                              const std::string& key, MsgError& err) {
  err.clear();
  const LocaleRule* r = find_rule(locale);
  if (!r) {
    err.set(MsgErrorCode::UNKNOWN_LOCALE, "Unsupported plural locale: " + locale, locale);
    return false;
  }

  const size_t given = split_forms(plural).size();
  if (given != (size_t)r->forms) {
    err.set(MsgErrorCode::PLURAL_FORM_COUNT_MISMATCH,
            "Invalid plural string \"" + key + "\" for locale " + locale + ": " +
              std::to_string(given) + " given; need: " + std::to_string(r->forms) +
              " (\"" + plural + "\")",
            plural);
    return false;
  }
  return true;
}

bool PluralRules::select_form(const std::string& plural, long long n, const std::string& locale,
                              const std::string& key, std::string& out, MsgError& err) {
  out.clear();
  if (!check_forms(plural, locale, key, err)) return false;

  std::vector<std::string> forms = split_forms(plural);
  const int idx = form_index(locale, n);
  std::string form = forms[(size_t)idx];
  msg_trim_inplace(form);
  out = std::move(form);
  return true;
}
