#include "capi.hpp"
#include "../../Application/svm-compiler/compiler.hpp"
#include "../../Application/svm-vm/vm.hpp"
#include <cstdlib>
#include <cstring>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>

static char* dup_utf8(const std::string& s){
  char* p = (char*)::malloc(s.size()+1);
  if (!p) return nullptr;
  std::memcpy(p, s.data(), s.size());
  p[s.size()] = '\0';
  return p;
}

extern "C" {

SVM_API void svm_free(char* ptr){ if(ptr) ::free(ptr); }

SVM_API int svm_check_source(const char* source_utf8, char** out_json, char** out_error){
  if (!source_utf8 || !out_json || !out_error) return 1;
  *out_json = nullptr; *out_error = nullptr;
  try{
    svm::Compiler c; auto res = c.compile(std::string(source_utf8));
    nlohmann::json j; j["diagnostics"] = res.diags;
    *out_json = dup_utf8(j.dump());
    if (!*out_json) { *out_error = dup_utf8("alloc failure"); return 2; }
    return 0;
  } catch (const std::exception& ex){
    *out_error = dup_utf8(ex.what());
    return 3;
  } catch (...) {
    *out_error = dup_utf8("unknown error");
    return 3;
  }
}

SVM_API int svm_run_source(const char* source_utf8, long long* out_result, int* out_has_result,
                           char** out_output, char** out_error){
  if (!source_utf8 || !out_result || !out_has_result || !out_output || !out_error) return 1;
  *out_output = nullptr; *out_error = nullptr; *out_has_result = 0;
  std::ostringstream captured;
  try{
    svm::Compiler c; auto res = c.compile(std::string(source_utf8));
    if (!res.diags.empty()){
      nlohmann::json j; j["compile"] = res.diags;
      *out_error = dup_utf8(j.dump());
      return 4;
    }
    svm::VM vm(captured);
    auto rv = vm.execute(res.program);
    *out_output = dup_utf8(captured.str());
    if (rv) { *out_result = *rv; *out_has_result = 1; }
    return 0;
  } catch (const std::exception& ex){
    *out_output = dup_utf8(captured.str());
    *out_error = dup_utf8(ex.what());
    return 3;
  } catch (...) {
    *out_output = dup_utf8(captured.str());
    *out_error = dup_utf8("unknown error");
    return 3;
  }
}

} // extern "C"
