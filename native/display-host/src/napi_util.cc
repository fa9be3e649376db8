#include "napi_util.h"

#include <spdlog/spdlog.h>

#include <utility>

namespace display_host {

napi_value MakeObject(napi_env env) {
  napi_value out = nullptr;
  if (napi_create_object(env, &out) != napi_ok) {
    return nullptr;
  }
  return out;
}

napi_value MakeArray(napi_env env) {
  napi_value out = nullptr;
  if (napi_create_array(env, &out) != napi_ok) {
    return nullptr;
  }
  return out;
}

napi_value MakeBool(napi_env env, bool value) {
  napi_value out = nullptr;
  if (napi_get_boolean(env, value, &out) != napi_ok) {
    return nullptr;
  }
  return out;
}

napi_value MakeInt32(napi_env env, int32_t value) {
  napi_value out = nullptr;
  if (napi_create_int32(env, value, &out) != napi_ok) {
    return nullptr;
  }
  return out;
}

napi_value MakeDouble(napi_env env, double value) {
  napi_value out = nullptr;
  if (napi_create_double(env, value, &out) != napi_ok) {
    return nullptr;
  }
  return out;
}

napi_value MakeString(napi_env env, const std::string& value) {
  napi_value out = nullptr;
  if (napi_create_string_utf8(env, value.c_str(), value.size(), &out) != napi_ok) {
    return nullptr;
  }
  return out;
}

void SetNamed(napi_env env, napi_value obj, const char* key, napi_value value) {
  if (obj == nullptr || value == nullptr) {
    return;
  }
  if (napi_set_named_property(env, obj, key, value) != napi_ok) {
    spdlog::warn("napi: failed to set property '{}'", key);
  }
}

napi_value GetFirstArgObject(napi_env env, napi_callback_info info) {
  size_t argc = 1;
  napi_value argv[1] = {nullptr};
  if (napi_get_cb_info(env, info, &argc, argv, nullptr, nullptr) != napi_ok) {
    return nullptr;
  }
  if (argc < 1 || argv[0] == nullptr) {
    return nullptr;
  }
  if (!IsType(env, argv[0], napi_object)) {
    return nullptr;
  }
  return argv[0];
}

bool IsType(napi_env env, napi_value value, napi_valuetype expected) {
  if (value == nullptr) {
    return false;
  }
  napi_valuetype type = napi_undefined;
  if (napi_typeof(env, value, &type) != napi_ok) {
    return false;
  }
  return type == expected;
}

bool GetNamedProperty(napi_env env, napi_value obj, const char* key, napi_value* out) {
  if (obj == nullptr) {
    return false;
  }
  bool has = false;
  if (napi_has_named_property(env, obj, key, &has) != napi_ok || !has) {
    return false;
  }
  return napi_get_named_property(env, obj, key, out) == napi_ok;
}

bool GetNamedBool(napi_env env, napi_value obj, const char* key, bool fallback) {
  napi_value value;
  if (!GetNamedProperty(env, obj, key, &value)) {
    return fallback;
  }
  bool out = fallback;
  if (napi_get_value_bool(env, value, &out) != napi_ok) {
    return fallback;
  }
  return out;
}

double GetNamedNumber(napi_env env, napi_value obj, const char* key, double fallback) {
  napi_value value;
  if (!GetNamedProperty(env, obj, key, &value)) {
    return fallback;
  }
  double out = fallback;
  if (napi_get_value_double(env, value, &out) != napi_ok) {
    return fallback;
  }
  return out;
}

int32_t GetNamedInt32(napi_env env, napi_value obj, const char* key, int32_t fallback) {
  napi_value value;
  if (!GetNamedProperty(env, obj, key, &value)) {
    return fallback;
  }
  int32_t out = fallback;
  if (napi_get_value_int32(env, value, &out) != napi_ok) {
    return fallback;
  }
  return out;
}

std::string GetNamedString(napi_env env, napi_value obj, const char* key, const char* fallback) {
  napi_value value;
  if (!GetNamedProperty(env, obj, key, &value)) {
    return std::string(fallback);
  }
  std::string out;
  if (!GetValueString(env, value, &out)) {
    return std::string(fallback);
  }
  return out;
}

bool GetValueString(napi_env env, napi_value value, std::string* out) {
  size_t len = 0;
  if (napi_get_value_string_utf8(env, value, nullptr, 0, &len) != napi_ok) {
    return false;
  }
  std::string text(len, '\0');
  if (napi_get_value_string_utf8(env, value, text.data(), len + 1, &len) != napi_ok) {
    return false;
  }
  *out = std::move(text);
  return true;
}

bool GetStringArray(napi_env env, napi_value value, std::vector<std::string>* out) {
  bool isArray = false;
  if (value == nullptr || napi_is_array(env, value, &isArray) != napi_ok || !isArray) {
    return false;
  }
  uint32_t length = 0;
  if (napi_get_array_length(env, value, &length) != napi_ok) {
    return false;
  }
  std::vector<std::string> items;
  items.reserve(length);
  for (uint32_t i = 0; i < length; i += 1) {
    napi_value element;
    std::string text;
    if (napi_get_element(env, value, i, &element) != napi_ok || !GetValueString(env, element, &text)) {
      return false;
    }
    items.push_back(std::move(text));
  }
  *out = std::move(items);
  return true;
}

std::string TakePendingException(napi_env env) {
  bool pending = false;
  if (napi_is_exception_pending(env, &pending) != napi_ok || !pending) {
    return std::string();
  }
  napi_value exception;
  if (napi_get_and_clear_last_exception(env, &exception) != napi_ok) {
    return "unknown exception";
  }
  napi_value text;
  std::string message;
  if (napi_coerce_to_string(env, exception, &text) != napi_ok || !GetValueString(env, text, &message)) {
    // Coercion itself may throw (e.g. a throwing toString).
    napi_value ignored;
    napi_get_and_clear_last_exception(env, &ignored);
    return "unprintable exception";
  }
  return message;
}

bool CallFunction(napi_env env,
                  napi_value fn,
                  const std::vector<napi_value>& args,
                  napi_value* result,
                  std::string* error) {
  if (!IsType(env, fn, napi_function)) {
    if (error) {
      *error = "not a function";
    }
    return false;
  }
  napi_value global;
  if (napi_get_global(env, &global) != napi_ok) {
    if (error) {
      *error = "no global object";
    }
    return false;
  }
  napi_value ignored;
  const napi_status status =
      napi_call_function(env, global, fn, args.size(), args.empty() ? nullptr : args.data(), result ? result : &ignored);
  if (status != napi_ok) {
    const std::string message = TakePendingException(env);
    if (error) {
      *error = message.empty() ? "call failed" : message;
    }
    return false;
  }
  return true;
}

bool CallMethod(napi_env env,
                napi_value obj,
                const char* method,
                const std::vector<napi_value>& args,
                napi_value* result,
                std::string* error) {
  napi_value fn;
  if (!GetNamedProperty(env, obj, method, &fn) || !IsType(env, fn, napi_function)) {
    if (error) {
      *error = std::string("missing method ") + method;
    }
    return false;
  }
  napi_value ignored;
  const napi_status status =
      napi_call_function(env, obj, fn, args.size(), args.empty() ? nullptr : args.data(), result ? result : &ignored);
  if (status != napi_ok) {
    const std::string message = TakePendingException(env);
    if (error) {
      *error = message.empty() ? std::string(method) + " failed" : message;
    }
    return false;
  }
  return true;
}

void SetFailure(napi_env env, napi_value out, DisplayError error, const std::string& message) {
  SetNamed(env, out, "ok", MakeBool(env, false));
  SetNamed(env, out, "reason", MakeString(env, ReasonCode(error)));
  if (!message.empty()) {
    SetNamed(env, out, "message", MakeString(env, message));
  }
}

JsRef::JsRef(napi_env env, napi_value value) : env_(env) {
  if (napi_create_reference(env, value, 1, &ref_) != napi_ok) {
    ref_ = nullptr;
  }
}

JsRef::~JsRef() {
  if (ref_ != nullptr) {
    napi_delete_reference(env_, ref_);
  }
}

napi_value JsRef::Value() const {
  if (ref_ == nullptr) {
    return nullptr;
  }
  napi_value value = nullptr;
  if (napi_get_reference_value(env_, ref_, &value) != napi_ok) {
    return nullptr;
  }
  return value;
}

}  // namespace display_host
