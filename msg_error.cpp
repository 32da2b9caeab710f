#include "msg_error.h"

const char* msg_error_code_name(MsgErrorCode code) noexcept {
  switch (code) {
    case MsgErrorCode::NONE:                       return "none";
    case MsgErrorCode::UNBALANCED_TAGS:            return "unbalanced_tags";
    case MsgErrorCode::MISSING_VALUE:              return "missing_value";
    case MsgErrorCode::PLURAL_FORM_COUNT_MISMATCH: return "plural_form_count_mismatch";
    case MsgErrorCode::UNKNOWN_LOCALE:             return "unknown_locale";
    case MsgErrorCode::CATALOG:                    return "catalog";
  }
  return "unknown";
}
