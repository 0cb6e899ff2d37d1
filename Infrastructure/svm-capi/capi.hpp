#pragma once
#include <cstdint>

#if defined(_WIN32)
  #define SVM_API __declspec(dllexport)
#else
  #define SVM_API __attribute__((visibility("default")))
#endif

extern "C" {
  // Compiles and runs a program. Returns 0 on success, 1 on bad arguments,
  // 3 on a runtime error, 4 on compile errors.
  // *out_has_result is 0 when the program left no value on the stack.
  // *out_output receives the lines written by `.`; *out_error a utf8 message
  // (JSON {"compile": [...]} for code 4). Both must be released with svm_free.
  SVM_API int svm_run_source(const char* source_utf8, long long* out_result, int* out_has_result,
                             char** out_output, char** out_error);
  // JSON {"diagnostics": [...]}. 0 on success; *out_json must be released with svm_free.
  SVM_API int svm_check_source(const char* source_utf8, char** out_json, char** out_error);
  SVM_API void svm_free(char* ptr);
}
