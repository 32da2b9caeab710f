#define MSGTMPL_EXPORTS
#include "msgtmpl_api.h"
#include "msg_catalog.h"
#include "msg_parser.h"
#include "msg_structure.h"
#include "plural_rules.h"

#include <cstring>
#include <string>
#include <vector>
#include <cstdint>
#include <limits>

namespace {
constexpr uint32_t ABI_VERSION = 1;
constexpr size_t RESULT_TOO_LARGE_LIMIT = 16ull * 1024ull * 1024ull; // 16 MiB

MsgCatalog* as_catalog(void* ptr) {
  return static_cast<MsgCatalog*>(ptr);
}

bool begin_catalog_call(MsgCatalog* cat) {
  if (!cat) return false;
  clear_catalog_error(cat);
  return true;
}

MsgValues<std::string> build_values(const char** names, const char** values, int values_len) {
  MsgValues<std::string> out;
  if (!names || !values || values_len <= 0) return out;
  out.reserve((size_t)values_len);
  for (int i = 0; i < values_len; ++i) {
    if (!names[i]) continue;
    out.insert_or_assign(std::string(names[i]), MsgValue<std::string>(values[i] ? values[i] : ""));
  }
  return out;
}
} // namespace

static int copy_to_buffer(MsgCatalog* cat, const std::string& src, char* out_buf, int buf_size) {
  const size_t full_len = src.size();
  if (full_len >= RESULT_TOO_LARGE_LIMIT || full_len > (size_t)std::numeric_limits<int>::max()) {
    set_catalog_error(cat, MsgErrorCode::CATALOG, "RESULT_TOO_LARGE");
    return -1;
  }

  const int result_len = (int)full_len;
  if (out_buf && buf_size > 0) {
    const int n = (result_len < (buf_size - 1)) ? result_len : (buf_size - 1);
    if (n > 0) std::memcpy(out_buf, src.data(), (size_t)n);
    out_buf[n] = '\0';
  }
  return result_len;
}

extern "C" {

MSGTMPL_API void* msgtmpl_new() {
  return new MsgCatalog();
}

MSGTMPL_API void msgtmpl_free(void* ptr) {
  delete static_cast<MsgCatalog*>(ptr);
}

MSGTMPL_API const char* msgtmpl_last_error(void* ptr) {
  if (!ptr) return "ptr == nullptr";
  return as_catalog(ptr)->get_last_error();
}

MSGTMPL_API int msgtmpl_last_error_copy(void* ptr, char* out_buf, int buf_size) {
  if (!ptr) return -1;
  const char* s = as_catalog(ptr)->get_last_error();
  const int len = (int)std::strlen(s);

  if (out_buf && buf_size > 0) {
    const int n = (len < (buf_size - 1)) ? len : (buf_size - 1);
    if (n > 0) std::memcpy(out_buf, s, (size_t)n);
    out_buf[n] = '\0';
  }
  return len;
}

MSGTMPL_API int msgtmpl_last_error_code(void* ptr) {
  if (!ptr) return -1;
  return (int)as_catalog(ptr)->get_last_error_code();
}

MSGTMPL_API uint32_t msgtmpl_abi_version(void) {
  return ABI_VERSION;
}

MSGTMPL_API int msgtmpl_load_txt(void* ptr, const char* txt_str, int strict) {
  if (!ptr || !txt_str) return -1;
  auto* c = as_catalog(ptr);
  if (!begin_catalog_call(c)) return -1;
  return c->load_txt_catalog(txt_str, strict != 0) ? 0 : -1;
}

MSGTMPL_API int msgtmpl_get_meta_locale_copy(void* ptr, char* out_buf, int buf_size) {
  if (!ptr) return -1;
  auto* c = as_catalog(ptr);
  if (!begin_catalog_call(c)) return -1;
  return copy_to_buffer(c, c->get_meta_locale(), out_buf, buf_size);
}

MSGTMPL_API int msgtmpl_translate(void* ptr,
                                  const char* id,
                                  const char** names,
                                  const char** values,
                                  int values_len,
                                  char* out_buf,
                                  int buf_size) {
  if (!ptr || !id) return -1;
  auto* c = as_catalog(ptr);
  if (!begin_catalog_call(c)) return -1;
  std::string res;
  if (!c->translate(id, build_values(names, values, values_len), res)) return -1;
  return copy_to_buffer(c, res, out_buf, buf_size);
}

MSGTMPL_API int msgtmpl_translate_plural(void* ptr,
                                         const char* id,
                                         long long count,
                                         const char** names,
                                         const char** values,
                                         int values_len,
                                         char* out_buf,
                                         int buf_size) {
  if (!ptr || !id) return -1;
  auto* c = as_catalog(ptr);
  if (!begin_catalog_call(c)) return -1;
  std::string res;
  if (!c->translate_plural(id, count, build_values(names, values, values_len), res)) return -1;
  return copy_to_buffer(c, res, out_buf, buf_size);
}

MSGTMPL_API int msgtmpl_check(void* ptr, void* base_ptr, char* report_buf, int report_size) {
  if (!ptr || !base_ptr) return -1;
  auto* c = as_catalog(ptr);
  if (!begin_catalog_call(c)) return -1;
  int code = 0;
  const std::string rep = c->check_against(*as_catalog(base_ptr), code);
  if (copy_to_buffer(c, rep, report_buf, report_size) < 0) return -1;
  return code;
}

MSGTMPL_API int msgtmpl_print(void* ptr, char* out_buf, int buf_size) {
  if (!ptr) return -1;
  auto* c = as_catalog(ptr);
  if (!begin_catalog_call(c)) return -1;
  return copy_to_buffer(c, c->dump_table(), out_buf, buf_size);
}

MSGTMPL_API int msgtmpl_find(void* ptr, const char* query, char* out_buf, int buf_size) {
  if (!ptr || !query) return -1;
  auto* c = as_catalog(ptr);
  if (!begin_catalog_call(c)) return -1;
  return copy_to_buffer(c, c->find_any(query), out_buf, buf_size);
}

MSGTMPL_API int msgtmpl_plural_form_count(const char* locale) {
  if (!locale) return -1;
  const int n = PluralRules::form_count(locale);
  return n > 0 ? n : -1;
}

MSGTMPL_API int msgtmpl_plural_form_index(const char* locale, long long n) {
  if (!locale) return -1;
  return PluralRules::form_index(locale, n);
}

MSGTMPL_API int msgtmpl_select_form(void* ptr,
                                    const char* plural,
                                    long long n,
                                    const char* locale,
                                    const char* key,
                                    char* out_buf,
                                    int buf_size) {
  if (!plural || !locale) return -1;
  auto* c = as_catalog(ptr);
  if (c) clear_catalog_error(c);

  MsgError err;
  std::string form;
  if (!PluralRules::select_form(plural, n, locale, key ? key : "", form, err)) {
    set_catalog_error(c, err.code, err.message);
    return -1;
  }
  return copy_to_buffer(c, form, out_buf, buf_size);
}

MSGTMPL_API int msgtmpl_check_structure(void* ptr, const char* base, const char* target) {
  if (!base || !target) return -1;
  auto* c = as_catalog(ptr);
  if (c) clear_catalog_error(c);

  MsgError err;
  MsgAst base_ast;
  MsgAst target_ast;
  if (!MsgParser::parse(base, base_ast, err) || !MsgParser::parse(target, target_ast, err)) {
    set_catalog_error(c, err.code, err.message);
    return -1;
  }
  return MsgStructure::is_equivalent(base_ast, target_ast) ? 1 : 0;
}

}
