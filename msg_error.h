#pragma once
#include <cstdint>
#include <string>
#include <utility>

enum class MsgErrorCode : uint8_t {
  NONE                       = 0,
  UNBALANCED_TAGS            = 1,
  MISSING_VALUE              = 2,
  PLURAL_FORM_COUNT_MISMATCH = 3,
  UNKNOWN_LOCALE             = 4,
  CATALOG                    = 5
};

// Fehler-Record für alle Komponenten. detail trägt je nach Code den
// Eingabestring, den fehlenden Namen, den Plural-String oder die Locale.
struct MsgError {
  MsgErrorCode code = MsgErrorCode::NONE;
  std::string message;
  std::string detail;

  bool ok() const noexcept { return code == MsgErrorCode::NONE; }

  void set(MsgErrorCode c, std::string msg, std::string det = {}) {
    code = c;
    message = std::move(msg);
    detail = std::move(det);
  }

  void clear() {
    code = MsgErrorCode::NONE;
    message.clear();
    detail.clear();
  }
};

const char* msg_error_code_name(MsgErrorCode code) noexcept;
