#pragma once

#include <node_api.h>

#include <cstdint>
#include <string>
#include <vector>

#include "errors.h"

namespace display_host {

napi_value MakeObject(napi_env env);
napi_value MakeArray(napi_env env);
napi_value MakeBool(napi_env env, bool value);
napi_value MakeInt32(napi_env env, int32_t value);
napi_value MakeDouble(napi_env env, double value);
napi_value MakeString(napi_env env, const std::string& value);
void SetNamed(napi_env env, napi_value obj, const char* key, napi_value value);

// First argument if it is an object, nullptr otherwise.
napi_value GetFirstArgObject(napi_env env, napi_callback_info info);
bool IsType(napi_env env, napi_value value, napi_valuetype expected);
bool GetNamedProperty(napi_env env, napi_value obj, const char* key, napi_value* out);
bool GetNamedBool(napi_env env, napi_value obj, const char* key, bool fallback = false);
double GetNamedNumber(napi_env env, napi_value obj, const char* key, double fallback = 0.0);
int32_t GetNamedInt32(napi_env env, napi_value obj, const char* key, int32_t fallback = 0);
std::string GetNamedString(napi_env env, napi_value obj, const char* key, const char* fallback = "");
bool GetValueString(napi_env env, napi_value value, std::string* out);
bool GetStringArray(napi_env env, napi_value value, std::vector<std::string>* out);

// Clears a pending JS exception and returns its message.
std::string TakePendingException(napi_env env);

// Calls obj[method](...args). A thrown exception is cleared and reported
// through `error`.
bool CallMethod(napi_env env,
                napi_value obj,
                const char* method,
                const std::vector<napi_value>& args,
                napi_value* result,
                std::string* error);
bool CallFunction(napi_env env,
                  napi_value fn,
                  const std::vector<napi_value>& args,
                  napi_value* result,
                  std::string* error);

// `{ ok: false, reason, message }` on an existing result object.
void SetFailure(napi_env env, napi_value out, DisplayError error, const std::string& message);

// Owning strong reference to a JS value. Must be destroyed on the JS thread.
class JsRef {
 public:
  JsRef(napi_env env, napi_value value);
  ~JsRef();

  JsRef(const JsRef&) = delete;
  JsRef& operator=(const JsRef&) = delete;

  napi_value Value() const;

 private:
  napi_env env_;
  napi_ref ref_ = nullptr;
};

}  // namespace display_host
