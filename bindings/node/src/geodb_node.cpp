/**
 * @file geodb_node.cpp
 * @brief Node.js native bridge for geodb (libGeoIP City lookups).
 *
 * DESIGN INVARIANTS:
 *   1. Built on the C API only; no C++ exception crosses into V8.
 *      node-addon-api is compiled with NAPI_DISABLE_CPP_EXCEPTIONS and all
 *      errors go through Napi::Error::New().
 *   2. Strict lifecycle: close() releases the handle via geodb_close(),
 *      which nulls db_. The ObjectWrap destructor (run when V8 collects the
 *      object) calls the same CloseInternal(), so a GC after close() is a
 *      no-op. Relying on the GC to close is supported but leaks until the
 *      collector gets around to it; call close().
 *   3. lookup() returns null for addresses with no record, never an empty
 *      object.
 */

#include "geodb/geodb_c_api.h"
#include <napi.h>

#include <string>

// ═══════════════════════════════════════════════════════════════════════════════
// Macro: Check geodb_error_t and throw Napi::Error on failure
// ═══════════════════════════════════════════════════════════════════════════════

#define GEODB_CHECK(env, expr, context)                                        \
  do {                                                                         \
    geodb_error_t _rc = (expr);                                                \
    if (_rc != GEODB_OK) {                                                     \
      std::string _msg = std::string("geodb ") + (context) +                   \
                         " failed: " + geodb_error_string(_rc) + " (" +        \
                         std::to_string(static_cast<int>(_rc)) + ")";          \
      Napi::Error::New((env), _msg).ThrowAsJavaScriptException();              \
      return (env).Undefined();                                                \
    }                                                                          \
  } while (0)

// ═══════════════════════════════════════════════════════════════════════════════
// Options parsing: { caching?: 'standard'|'memory'|'index',
//                    reloadOnUpdate?: boolean, useMmap?: boolean }
// ═══════════════════════════════════════════════════════════════════════════════

static bool ParseOptions(Napi::Env env, Napi::Object obj,
                         geodb_options_t *out) {
  *out = geodb_default_options();

  if (obj.Has("caching")) {
    Napi::Value v = obj.Get("caching");
    if (!v.IsString()) {
      Napi::TypeError::New(env, "options.caching must be a string")
          .ThrowAsJavaScriptException();
      return false;
    }
    std::string caching = v.As<Napi::String>().Utf8Value();
    if (caching == "standard") {
      out->caching = GEODB_CACHE_STANDARD;
    } else if (caching == "memory") {
      out->caching = GEODB_CACHE_MEMORY;
    } else if (caching == "index") {
      out->caching = GEODB_CACHE_INDEX;
    } else {
      Napi::RangeError::New(env, "options.caching must be 'standard', "
                                 "'memory' or 'index', got '" +
                                     caching + "'")
          .ThrowAsJavaScriptException();
      return false;
    }
  }

  if (obj.Has("reloadOnUpdate")) {
    out->reload_on_update = obj.Get("reloadOnUpdate").ToBoolean() ? 1 : 0;
  }
  if (obj.Has("useMmap")) {
    out->use_mmap = obj.Get("useMmap").ToBoolean() ? 1 : 0;
  }
  return true;
}

// ═══════════════════════════════════════════════════════════════════════════════
// GeoDB — Napi::ObjectWrap Class
// ═══════════════════════════════════════════════════════════════════════════════

class GeoDB : public Napi::ObjectWrap<GeoDB> {
public:
  /**
   * @brief Register the GeoDB class with the Node.js module exports.
   */
  static Napi::Object Init(Napi::Env env, Napi::Object exports) {
    Napi::Function func =
        DefineClass(env, "GeoDB",
                    {
                        InstanceMethod<&GeoDB::Lookup>("lookup"),
                        InstanceMethod<&GeoDB::Info>("info"),
                        InstanceMethod<&GeoDB::Close>("close"),
                        InstanceMethod<&GeoDB::IsClosed>("isClosed"),
                    });

    Napi::FunctionReference *constructor = new Napi::FunctionReference();
    *constructor = Napi::Persistent(func);
    env.SetInstanceData(constructor);

    exports.Set("GeoDB", func);
    return exports;
  }

  // ─────────────────────────────────────────────────────────────────────────
  // Constructor: GeoDB(path, options?)
  // ─────────────────────────────────────────────────────────────────────────

  GeoDB(const Napi::CallbackInfo &info)
      : Napi::ObjectWrap<GeoDB>(info), db_(nullptr) {
    Napi::Env env = info.Env();

    if (info.Length() < 1 || !info[0].IsString()) {
      Napi::TypeError::New(env, "GeoDB constructor requires a path string: "
                                "(path: string, options?: object)")
          .ThrowAsJavaScriptException();
      return;
    }
    std::string path = info[0].As<Napi::String>().Utf8Value();

    geodb_options_t opts = geodb_default_options();
    if (info.Length() > 1 && !info[1].IsUndefined() && !info[1].IsNull()) {
      if (!info[1].IsObject()) {
        Napi::TypeError::New(env, "options must be an object")
            .ThrowAsJavaScriptException();
        return;
      }
      if (!ParseOptions(env, info[1].As<Napi::Object>(), &opts))
        return;
    }

    char err[512];
    geodb_error_t rc = geodb_open(path.c_str(), &opts, &db_, err, sizeof(err));
    if (rc != GEODB_OK) {
      // Surface libGeoIP's diagnostic as-is when we have one.
      std::string msg = (rc == GEODB_ERR_OPEN && err[0] != '\0')
                            ? std::string(err)
                            : std::string("geodb open failed: ") +
                                  geodb_error_string(rc);
      Napi::Error::New(env, msg).ThrowAsJavaScriptException();
      return;
    }
  }

  // ─────────────────────────────────────────────────────────────────────────
  // Destructor: GC backstop (double-free guarded by geodb_close)
  // ─────────────────────────────────────────────────────────────────────────

  ~GeoDB() { CloseInternal(); }

private:
  bool CheckLive(Napi::Env env) {
    if (!db_) {
      Napi::Error::New(env, "geodb: database is closed")
          .ThrowAsJavaScriptException();
      return false;
    }
    return true;
  }

  // ═══════════════════════════════════════════════════════════════════════
  // lookup(ip: string) → Record | null
  // ═══════════════════════════════════════════════════════════════════════

  Napi::Value Lookup(const Napi::CallbackInfo &info) {
    Napi::Env env = info.Env();
    if (!CheckLive(env))
      return env.Undefined();

    if (info.Length() < 1 || !info[0].IsString()) {
      Napi::TypeError::New(env, "lookup requires an address string")
          .ThrowAsJavaScriptException();
      return env.Undefined();
    }
    std::string ip = info[0].As<Napi::String>().Utf8Value();

    geodb_record_t rec;
    int found = 0;
    GEODB_CHECK(env, geodb_lookup(db_, ip.c_str(), &rec, &found), "lookup");

    if (!found)
      return env.Null();

    Napi::Object obj = Napi::Object::New(env);
    obj.Set("countryCode", Napi::String::New(env, rec.country_code));
    obj.Set("countryCode3", Napi::String::New(env, rec.country_code3));
    obj.Set("countryName", Napi::String::New(env, rec.country_name));
    obj.Set("region", Napi::String::New(env, rec.region));
    obj.Set("city", Napi::String::New(env, rec.city));
    obj.Set("postalCode", Napi::String::New(env, rec.postal_code));
    obj.Set("latitude", Napi::Number::New(env, rec.latitude));
    obj.Set("longitude", Napi::Number::New(env, rec.longitude));
    obj.Set("areaCode", Napi::Number::New(env, rec.area_code));
    obj.Set("continentCode", Napi::String::New(env, rec.continent_code));
    obj.Freeze();
    return obj;
  }

  // ═══════════════════════════════════════════════════════════════════════
  // info() → string
  // ═══════════════════════════════════════════════════════════════════════

  Napi::Value Info(const Napi::CallbackInfo &info) {
    Napi::Env env = info.Env();
    if (!CheckLive(env))
      return env.Undefined();

    std::string buf(256, '\0');
    size_t len = 0;
    geodb_error_t rc = geodb_info(db_, buf.data(), buf.size(), &len);
    if (rc == GEODB_ERR_BUFFER_TOO_SMALL) {
      // len is the full string length; retry once with room for it
      buf.assign(len + 1, '\0');
      rc = geodb_info(db_, buf.data(), buf.size(), &len);
    }
    GEODB_CHECK(env, rc, "info");
    return Napi::String::New(env, buf.data(), len);
  }

  // ═══════════════════════════════════════════════════════════════════════
  // close() → undefined (idempotent)
  // ═══════════════════════════════════════════════════════════════════════

  Napi::Value Close(const Napi::CallbackInfo &info) {
    CloseInternal();
    return info.Env().Undefined();
  }

  Napi::Value IsClosed(const Napi::CallbackInfo &info) {
    return Napi::Boolean::New(info.Env(), db_ == nullptr);
  }

  void CloseInternal() { geodb_close(&db_); }

  geodb_t *db_; ///< Opaque handle; NULL once closed or if open failed
};

// ═══════════════════════════════════════════════════════════════════════════════
// Module Initialization — N-API Entry Point
// ═══════════════════════════════════════════════════════════════════════════════

static Napi::Object Init(Napi::Env env, Napi::Object exports) {
  GeoDB::Init(env, exports);
  exports.Set("version", Napi::String::New(env, geodb_version()));
  exports.Set("nativeVersion", Napi::String::New(env, geodb_native_version()));
  return exports;
}

NODE_API_MODULE(geodb_node, Init)
