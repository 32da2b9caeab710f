#include <catch2/catch.hpp>

#include "plural_rules.h"

#include <set>

namespace {
std::string select_ok(const std::string& plural, long long n, const std::string& locale) {
  std::string out;
  MsgError err;
  REQUIRE(PluralRules::select_form(plural, n, locale, "test.key", out, err));
  return out;
}
} // namespace

TEST_CASE("Plural - form counts", "[plural]") {
  REQUIRE(PluralRules::form_count("ja") == 2);
  REQUIRE(PluralRules::form_count("en") == 3);
  REQUIRE(PluralRules::form_count("fr") == 2);
  REQUIRE(PluralRules::form_count("ru") == 4);
  REQUIRE(PluralRules::form_count("lv") == 3);
  REQUIRE(PluralRules::form_count("sl") == 5);
  REQUIRE(PluralRules::form_count("mt") == 5);
  REQUIRE(PluralRules::form_count("ar") == 6);
  REQUIRE(PluralRules::form_count("xx") == 0);
}

TEST_CASE("Plural - locale lookup ignores case and region", "[plural]") {
  REQUIRE(PluralRules::form_count("pt-BR") == 3);
  REQUIRE(PluralRules::form_count("ZH_tw") == 2);
  REQUIRE(PluralRules::is_supported("Ru"));
  REQUIRE_FALSE(PluralRules::is_supported(""));
  REQUIRE(PluralRules::normalize_locale("PT_br") == "pt");
  REQUIRE(PluralRules::normalize_locale("fil") == "fil");
}

TEST_CASE("Plural - supported locale set", "[plural]") {
  const auto locales = PluralRules::supported_locales();
  REQUIRE(locales.size() == 97);
  for (const auto& loc : locales) {
    const int count = PluralRules::form_count(loc);
    REQUIRE(count >= 2);
    REQUIRE(count <= 6);
  }
}

TEST_CASE("Plural - index stays in range for every locale", "[plural]") {
  for (const auto& loc : PluralRules::supported_locales()) {
    const int count = PluralRules::form_count(loc);
    for (long long n = -3; n <= 250; ++n) {
      const int idx = PluralRules::form_index(loc, n);
      REQUIRE(idx >= 0);
      REQUIRE(idx < count);
    }
  }
}

TEST_CASE("Plural - zero always selects form 0", "[plural]") {
  for (const auto& loc : PluralRules::supported_locales()) {
    REQUIRE(PluralRules::form_index(loc, 0) == 0);
  }
}

TEST_CASE("Plural - English", "[plural]") {
  REQUIRE(PluralRules::form_index("en", 0) == 0);
  REQUIRE(PluralRules::form_index("en", 1) == 1);
  REQUIRE(PluralRules::form_index("en", 2) == 2);
  REQUIRE(PluralRules::form_index("en", 21) == 2);
}

TEST_CASE("Plural - East Asian languages do not distinguish", "[plural]") {
  REQUIRE(PluralRules::form_index("ja", 1) == 1);
  REQUIRE(PluralRules::form_index("zh", 5) == 1);
  REQUIRE(PluralRules::form_index("ko", 100) == 1);
}

TEST_CASE("Plural - French style shares 0 and 1", "[plural]") {
  REQUIRE(PluralRules::form_index("fr", 1) == 0);
  REQUIRE(PluralRules::form_index("fr", 2) == 1);
}

TEST_CASE("Plural - Slavic categories", "[plural]") {
  const std::string loc = "ru";
  const int one = PluralRules::form_index(loc, 1);
  const int few = PluralRules::form_index(loc, 2);
  const int many = PluralRules::form_index(loc, 5);

  REQUIRE(one == 1);
  REQUIRE(few == 2);
  REQUIRE(many == 3);
  const std::set<int> distinct = { one, few, many };
  REQUIRE(distinct.size() == 3);

  REQUIRE(PluralRules::form_index(loc, 11) == many);
  REQUIRE(PluralRules::form_index(loc, 12) == many);
  REQUIRE(PluralRules::form_index(loc, 14) == many);
  REQUIRE(PluralRules::form_index(loc, 21) == one);
  REQUIRE(PluralRules::form_index(loc, 22) == few);
  REQUIRE(PluralRules::form_index(loc, 25) == many);
  REQUIRE(PluralRules::form_index(loc, 111) == many);
  REQUIRE(PluralRules::form_index(loc, 101) == one);
}

TEST_CASE("Plural - Polish differs from Russian for 21", "[plural]") {
  REQUIRE(PluralRules::form_index("pl", 1) == 1);
  REQUIRE(PluralRules::form_index("pl", 21) == 3);
  REQUIRE(PluralRules::form_index("pl", 22) == 2);
  REQUIRE(PluralRules::form_index("pl", 12) == 3);
}

TEST_CASE("Plural - Arabic six categories", "[plural]") {
  std::set<int> seen;
  for (long long n : { 0, 1, 2, 3, 11, 100 }) seen.insert(PluralRules::form_index("ar", n));
  REQUIRE(seen.size() == 6);

  REQUIRE(PluralRules::form_index("ar", 0) == 0);
  REQUIRE(PluralRules::form_index("ar", 1) == 1);
  REQUIRE(PluralRules::form_index("ar", 2) == 2);
  REQUIRE(PluralRules::form_index("ar", 3) == 3);
  REQUIRE(PluralRules::form_index("ar", 10) == 3);
  REQUIRE(PluralRules::form_index("ar", 11) == 4);
  REQUIRE(PluralRules::form_index("ar", 99) == 4);
  REQUIRE(PluralRules::form_index("ar", 100) == 5);
  REQUIRE(PluralRules::form_index("ar", 103) == 3);
}

TEST_CASE("Plural - smaller families", "[plural]") {
  REQUIRE(PluralRules::form_index("cs", 3) == 2);
  REQUIRE(PluralRules::form_index("cs", 5) == 3);
  REQUIRE(PluralRules::form_index("ga", 2) == 2);
  REQUIRE(PluralRules::form_index("lt", 12) == 3);
  REQUIRE(PluralRules::form_index("lt", 22) == 2);
  REQUIRE(PluralRules::form_index("sl", 102) == 2);
  REQUIRE(PluralRules::form_index("sl", 104) == 3);
  REQUIRE(PluralRules::form_index("sl", 5) == 4);
  REQUIRE(PluralRules::form_index("mk", 11) == 1);
  REQUIRE(PluralRules::form_index("mt", 15) == 3);
  REQUIRE(PluralRules::form_index("mt", 20) == 4);
  REQUIRE(PluralRules::form_index("lv", 11) == 2);
  REQUIRE(PluralRules::form_index("cy", 1) == 0);
  REQUIRE(PluralRules::form_index("cy", 8) == 2);
  REQUIRE(PluralRules::form_index("ro", 19) == 2);
  REQUIRE(PluralRules::form_index("ro", 20) == 3);
}

TEST_CASE("Plural - select_form trims the chosen segment", "[plural]") {
  const std::string plural = " no files | one file |  %count% files ";
  REQUIRE(select_ok(plural, 0, "en") == "no files");
  REQUIRE(select_ok(plural, 1, "en") == "one file");
  REQUIRE(select_ok(plural, 7, "en") == "%count% files");
}

TEST_CASE("Plural - select_form for Russian", "[plural]") {
  const std::string plural = "нет правил|%n% правило|%n% правила|%n% правил";
  REQUIRE(select_ok(plural, 21, "ru") == "%n% правило");
  REQUIRE(select_ok(plural, 3, "ru") == "%n% правила");
  REQUIRE(select_ok(plural, 11, "ru") == "%n% правил");
}

TEST_CASE("Plural - form count mismatch fails", "[plural]") {
  std::string out = "stale";
  MsgError err;
  REQUIRE_FALSE(PluralRules::select_form("a|b|c", 1, "ru", "rules.count", out, err));
  REQUIRE(err.code == MsgErrorCode::PLURAL_FORM_COUNT_MISMATCH);
  REQUIRE(err.detail == "a|b|c");
  REQUIRE(err.message.find("rules.count") != std::string::npos);
  REQUIRE(err.message.find("ru") != std::string::npos);
  REQUIRE(err.message.find("3 given; need: 4") != std::string::npos);
  REQUIRE(out.empty());
}

TEST_CASE("Plural - check_forms does not need a count", "[plural]") {
  MsgError err;
  REQUIRE(PluralRules::check_forms("a|b", "fr", "k", err));
  REQUIRE(err.ok());
  REQUIRE_FALSE(PluralRules::check_forms("a", "fr", "k", err));
  REQUIRE(err.code == MsgErrorCode::PLURAL_FORM_COUNT_MISMATCH);
}

TEST_CASE("Plural - unknown locale", "[plural]") {
  REQUIRE(PluralRules::form_index("tlh", 3) == -1);

  std::string out;
  MsgError err;
  REQUIRE_FALSE(PluralRules::select_form("a|b", 1, "tlh", "k", out, err));
  REQUIRE(err.code == MsgErrorCode::UNKNOWN_LOCALE);
  REQUIRE(err.detail == "tlh");
}
