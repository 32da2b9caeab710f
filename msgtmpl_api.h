#pragma once

#ifdef _WIN32
  #ifdef MSGTMPL_EXPORTS
    #define MSGTMPL_API __declspec(dllexport)
  #else
    #define MSGTMPL_API __declspec(dllimport)
  #endif
#else
  #define MSGTMPL_API
#endif

#include <cstdint>

#ifdef __cplusplus
extern "C" {
#endif

// Handle auf einen Nachrichtenkatalog (nicht threadsafe).
MSGTMPL_API void* msgtmpl_new(void);
MSGTMPL_API void  msgtmpl_free(void* ptr);

// Pointer bleibt bis zum nächsten API-Aufruf auf demselben Handle gültig. Besser die Copy-Variante nutzen.
MSGTMPL_API const char* msgtmpl_last_error(void* ptr);
// returns required bytes (ohne NUL), terminiert wenn buf_size>0
MSGTMPL_API int msgtmpl_last_error_copy(void* ptr, char* out_buf, int buf_size);
// MsgErrorCode des letzten Aufrufs (0 = kein Fehler)
MSGTMPL_API int msgtmpl_last_error_code(void* ptr);

MSGTMPL_API uint32_t msgtmpl_abi_version(void);

MSGTMPL_API int msgtmpl_load_txt(void* ptr, const char* txt_str, int strict);
MSGTMPL_API int msgtmpl_get_meta_locale_copy(void* ptr, char* out_buf, int buf_size);

// names/values: parallele Arrays der Länge values_len. Alle Werte sind Text.
// Returns required bytes (without NUL); -1 bei Fehler (Details in last_error).
MSGTMPL_API int msgtmpl_translate(void* ptr,
                                  const char* id,
                                  const char** names,
                                  const char** values,
                                  int values_len,
                                  char* out_buf,
                                  int buf_size);
MSGTMPL_API int msgtmpl_translate_plural(void* ptr,
                                         const char* id,
                                         long long count,
                                         const char** names,
                                         const char** values,
                                         int values_len,
                                         char* out_buf,
                                         int buf_size);

// Report wie MsgCatalog::check_against; Rückgabe ist der Check-Code (0, 2, 3) oder -1.
MSGTMPL_API int msgtmpl_check(void* ptr, void* base_ptr, char* report_buf, int report_size);
MSGTMPL_API int msgtmpl_print(void* ptr, char* out_buf, int buf_size);
MSGTMPL_API int msgtmpl_find(void* ptr, const char* query, char* out_buf, int buf_size);

// Handle-freie Funktionen. ptr darf NULL sein, sonst landet ein Fehler in dessen last_error.
MSGTMPL_API int msgtmpl_plural_form_count(const char* locale);
MSGTMPL_API int msgtmpl_plural_form_index(const char* locale, long long n);
MSGTMPL_API int msgtmpl_select_form(void* ptr,
                                    const char* plural,
                                    long long n,
                                    const char* locale,
                                    const char* key,
                                    char* out_buf,
                                    int buf_size);
// 1 = gleiche Struktur, 0 = verschieden, -1 = Parse-Fehler
MSGTMPL_API int msgtmpl_check_structure(void* ptr, const char* base, const char* target);

#ifdef __cplusplus
}
#endif
