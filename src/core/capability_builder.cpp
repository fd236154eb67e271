/**
 * @file capability_builder.cpp
 * @brief Sandbox bindings: bootstrap script plus native host functions
 *
 * The bootstrap is a closure evaluated once per context. It receives the host
 * functions as arguments, so they stay reachable only through the wrappers it
 * builds and never through the global object.
 *
 * Every native host function catches C++ exceptions before they can unwind
 * through interpreter frames and turns them into an InternalError.
 *
 * @date 2025
 */

#include "sealbox/core/capability_builder.hpp"
#include "sealbox/core/execution_context.hpp"
#include "sealbox/core/js_value_codec.hpp"
#include "sealbox/utils/hash_utils.hpp"

#include <spdlog/spdlog.h>

#include <cstring>
#include <limits>

namespace sealbox {
namespace core {

namespace {

// ============================================================================
// BOOTSTRAP SCRIPT
// ============================================================================

const char kBootstrapSource[] = R"JS(
(function (host, identity, params, settings) {
  'use strict';

  const G = globalThis;
  const ObjectCtor = Object;
  const StringCtor = String;
  const NativeArray = Array;
  const NativeArrayBuffer = ArrayBuffer;
  const NativeWeakMap = WeakMap;
  const NativeProxy = Proxy;
  const freeze = Object.freeze;
  const defineProperty = Object.defineProperty;
  const getOwnPropertyNames = Object.getOwnPropertyNames;
  const getPrototypeOf = Object.getPrototypeOf;
  const objectKeys = Object.keys;
  const objectCreate = Object.create;
  const apply = Reflect.apply;
  const construct = Reflect.construct;
  const deleteProperty = Reflect.deleteProperty;
  const isArray = Array.isArray;
  const floor = Math.floor;
  const weakGet = WeakMap.prototype.get;
  const weakSet = WeakMap.prototype.set;
  const JSONstringify = JSON.stringify;
  const JSONparse = JSON.parse;
  const iteratorSymbol = Symbol.iterator;

  const reserve = host.reserve;
  const release = host.release;
  const violation = host.violation;
  const hostLog = host.log;
  const hostGetSecret = host.getSecret;
  const hostFetch = host.fetch;

  const ELEMENT_BYTES = 8;
  const CHAR_BYTES = 2;
  const GRANULARITY = settings.chargeGranularity;

  // ---------------------------------------------------------------- memory
  let pending = 0;
  function charge(bytes) {
    if (!(bytes > 0) || bytes === Infinity) {
      return;
    }
    pending += bytes;
    if (pending >= GRANULARITY) {
      const amount = pending;
      pending = 0;
      reserve(amount);
    }
  }

  const Registry = G.FinalizationRegistry;
  const registry = typeof Registry === 'function' ? new Registry(release) : null;
  const register = registry !== null ? Registry.prototype.register : null;
  function track(object, bytes) {
    if (registry !== null && bytes >= GRANULARITY) {
      apply(register, registry, [object, bytes]);
    }
    return object;
  }

  const chargedLength = new NativeWeakMap();
  function chargeGrowth(target, length) {
    if (target === null || typeof target !== 'object' || typeof length !== 'number') {
      return;
    }
    const prior = apply(weakGet, chargedLength, [target]) || 0;
    if (length > prior) {
      charge((length - prior) * ELEMENT_BYTES);
      apply(weakSet, chargedLength, [target, length]);
    }
  }

  function arrayLength(args) {
    if (args.length === 1 && typeof args[0] === 'number') {
      const n = args[0];
      return n === (n >>> 0) ? n : 0;
    }
    return args.length;
  }

  const ArrayProxy = new NativeProxy(NativeArray, {
    construct(target, args, newTarget) {
      const n = arrayLength(args);
      charge(n * ELEMENT_BYTES);
      const created = construct(target, args, newTarget);
      apply(weakSet, chargedLength, [created, n]);
      return track(created, n * ELEMENT_BYTES);
    },
    apply(target, thisArg, args) {
      const n = arrayLength(args);
      charge(n * ELEMENT_BYTES);
      const created = apply(target, thisArg, args);
      apply(weakSet, chargedLength, [created, n]);
      return track(created, n * ELEMENT_BYTES);
    }
  });

  function replaceConstructor(name, wrapped) {
    const native = G[name];
    defineProperty(native.prototype, 'constructor',
                   { value: wrapped, writable: true, enumerable: false, configurable: true });
    defineProperty(G, name,
                   { value: wrapped, writable: true, enumerable: false, configurable: true });
  }

  function instrument(name, sizeOf) {
    const Native = G[name];
    if (typeof Native !== 'function') {
      return;
    }
    const wrapped = new NativeProxy(Native, {
      construct(target, args, newTarget) {
        const bytes = sizeOf(target, args);
        charge(bytes);
        return track(construct(target, args, newTarget), bytes);
      }
    });
    replaceConstructor(name, wrapped);
  }

  function bufferSize(target, args) {
    const n = +args[0];
    return n >= 0 && n !== Infinity ? n : 0;
  }

  function typedSize(target, args) {
    const bpe = target.BYTES_PER_ELEMENT || 1;
    const source = args[0];
    if (typeof source === 'number') {
      return source >= 0 && source !== Infinity ? source * bpe : 0;
    }
    if (source !== null && typeof source === 'object' && !(source instanceof NativeArrayBuffer)) {
      const length = source.length;
      return typeof length === 'number' && length > 0 && length !== Infinity ? length * bpe : 0;
    }
    return 0;
  }

  replaceConstructor('Array', ArrayProxy);
  instrument('ArrayBuffer', bufferSize);
  const typedNames = ['Int8Array', 'Uint8Array', 'Uint8ClampedArray', 'Int16Array', 'Uint16Array',
                      'Int32Array', 'Uint32Array', 'Float32Array', 'Float64Array',
                      'BigInt64Array', 'BigUint64Array'];
  for (let i = 0; i < typedNames.length; i++) {
    instrument(typedNames[i], typedSize);
  }

  const ArrayProto = NativeArray.prototype;
  const nativePush = ArrayProto.push;
  const nativeConcat = ArrayProto.concat;
  const nativeFill = ArrayProto.fill;
  const nativeRepeat = StringCtor.prototype.repeat;

  const growth = {
    push() {
      if (this !== null && typeof this === 'object') {
        chargeGrowth(this, this.length + arguments.length);
      }
      return apply(nativePush, this, arguments);
    },
    concat() {
      let total = isArray(this) ? this.length : 1;
      for (let i = 0; i < arguments.length; i++) {
        const item = arguments[i];
        total += isArray(item) ? item.length : 1;
      }
      charge(total * ELEMENT_BYTES);
      const result = apply(nativeConcat, this, arguments);
      if (isArray(result)) {
        apply(weakSet, chargedLength, [result, result.length]);
      }
      return result;
    },
    fill() {
      if (this !== null && typeof this === 'object') {
        chargeGrowth(this, this.length);
      }
      return apply(nativeFill, this, arguments);
    },
    repeat(count) {
      if (this !== null && this !== undefined) {
        const n = +count;
        if (n > 0 && n !== Infinity) {
          charge(StringCtor(this).length * floor(n) * CHAR_BYTES);
        }
      }
      return apply(nativeRepeat, this, arguments);
    }
  };

  function replaceMethod(proto, name, fn) {
    defineProperty(proto, name, { value: fn, writable: true, enumerable: false, configurable: true });
  }
  replaceMethod(ArrayProto, 'push', growth.push);
  replaceMethod(ArrayProto, 'concat', growth.concat);
  replaceMethod(ArrayProto, 'fill', growth.fill);
  replaceMethod(StringCtor.prototype, 'repeat', growth.repeat);

  // ---------------------------------------------------------- dynamic code
  function blockConstructor(proto, label) {
    if (proto === null || proto === undefined) {
      return;
    }
    const stub = function () {
      violation('dynamic-code', label + ' constructor is not allowed');
    };
    defineProperty(stub, 'name', { value: label });
    freeze(stub.prototype);
    freeze(stub);
    defineProperty(proto, 'constructor',
                   { value: stub, writable: false, enumerable: false, configurable: false });
  }

  const FunctionProto = getPrototypeOf(function () {});
  const AsyncFunctionProto = getPrototypeOf(async function () {});
  const GeneratorFunctionProto = getPrototypeOf(function* () {});
  const AsyncGeneratorFunctionProto = getPrototypeOf(async function* () {});
  blockConstructor(FunctionProto, 'Function');
  blockConstructor(AsyncFunctionProto, 'AsyncFunction');
  blockConstructor(GeneratorFunctionProto, 'GeneratorFunction');
  blockConstructor(AsyncGeneratorFunctionProto, 'AsyncGeneratorFunction');

  // ---------------------------------------------------------- capabilities
  function format(args) {
    let out = '';
    for (let i = 0; i < args.length; i++) {
      const value = args[i];
      let text;
      if (typeof value === 'string') {
        text = value;
      } else {
        try {
          text = JSONstringify(value);
        } catch (e) {
          text = undefined;
        }
        if (text === undefined) {
          text = StringCtor(value);
        }
      }
      out += (i > 0 ? ' ' : '') + text;
    }
    return out;
  }

  const consoleObject = freeze({
    log(...args) { hostLog('log', format(args)); },
    info(...args) { hostLog('info', format(args)); },
    warn(...args) { hostLog('warn', format(args)); },
    error(...args) { hostLog('error', format(args)); },
    debug(...args) { hostLog('debug', format(args)); }
  });

  const network = {
    fetch(resource, options) {
      const opts = options === undefined || options === null ? {} : options;
      const method = opts.method === undefined ? 'GET' : StringCtor(opts.method).toUpperCase();
      const headers = [];
      let hasContentType = false;
      if (opts.headers !== undefined && opts.headers !== null) {
        const names = objectKeys(opts.headers);
        for (let i = 0; i < names.length; i++) {
          const name = names[i];
          if (name.toLowerCase() === 'content-type') {
            hasContentType = true;
          }
          headers.push([name, StringCtor(opts.headers[name])]);
        }
      }
      let body = '';
      if (opts.body !== undefined && opts.body !== null) {
        if (typeof opts.body === 'string') {
          body = opts.body;
        } else {
          body = JSONstringify(opts.body);
          if (!hasContentType) {
            headers.push(['Content-Type', 'application/json']);
          }
        }
      }
      const raw = hostFetch(StringCtor(resource), method, headers, body);
      const text = raw.body;
      return freeze({
        ok: raw.status >= 200 && raw.status < 300,
        status: raw.status,
        statusText: raw.statusText,
        url: raw.url,
        headers: freeze(raw.headers),
        text() { return text; },
        json() { return JSONparse(text); }
      });
    }
  };

  const capabilities = {
    console: consoleObject,
    getSecret: hostGetSecret,
    secrets: freeze({ get: hostGetSecret }),
    crypto: freeze({ sha256: host.sha256, randomBytes: host.randomBytes }),
    executionContext: freeze(identity),
    params: params
  };
  if (settings.network) {
    capabilities.fetch = network.fetch;
  }

  const allowed = objectCreate(null);
  for (let i = 0; i < settings.allowedGlobals.length; i++) {
    allowed[settings.allowedGlobals[i]] = true;
  }

  const capabilityNames = objectKeys(capabilities);
  for (let i = 0; i < capabilityNames.length; i++) {
    const name = capabilityNames[i];
    if (allowed[name] === true) {
      defineProperty(G, name, { value: capabilities[name], writable: false,
                                enumerable: false, configurable: false });
    }
  }

  // --------------------------------------------------------------- freezing
  function freezeWithPrototype(value) {
    if ((typeof value === 'object' && value !== null) || typeof value === 'function') {
      freeze(value);
      const proto = value.prototype;
      if ((typeof proto === 'object' && proto !== null) || typeof proto === 'function') {
        freeze(proto);
      }
    }
  }

  const globalNames = getOwnPropertyNames(G);
  for (let i = 0; i < globalNames.length; i++) {
    const name = globalNames[i];
    if (name === 'globalThis' || name === 'params') {
      continue;
    }
    freezeWithPrototype(G[name]);
  }

  const arrayIterator = [][iteratorSymbol]();
  const hidden = [
    FunctionProto, AsyncFunctionProto, GeneratorFunctionProto, AsyncGeneratorFunctionProto,
    getPrototypeOf(arrayIterator), getPrototypeOf(getPrototypeOf(arrayIterator)),
    getPrototypeOf(''[iteratorSymbol]()),
    getPrototypeOf(G.Uint8Array), getPrototypeOf(G.Uint8Array.prototype)
  ];
  if (GeneratorFunctionProto) {
    hidden.push(GeneratorFunctionProto.prototype);
  }
  if (AsyncGeneratorFunctionProto) {
    hidden.push(AsyncGeneratorFunctionProto.prototype);
  }
  for (let i = 0; i < hidden.length; i++) {
    freezeWithPrototype(hidden[i]);
  }

  // ---------------------------------------------------------------- removal
  const leftovers = [];
  for (let i = 0; i < globalNames.length; i++) {
    const name = globalNames[i];
    if (allowed[name] === true) {
      continue;
    }
    if (!deleteProperty(G, name)) {
      leftovers.push(name);
    }
  }
  return leftovers;
})
)JS";

// ============================================================================
// HOST FUNCTIONS
// ============================================================================

ExecutionContext& Owner(JSContext* ctx) {
    return *static_cast<ExecutionContext*>(JS_GetContextOpaque(ctx));
}

// C++ exceptions must never unwind through interpreter frames
template <typename Fn>
JSValue Guarded(JSContext* ctx, const char* what, Fn&& fn) {
    try {
        return fn();
    } catch (const std::exception& e) {
        std::string message = std::string(what) + " failed: " + e.what();
        spdlog::error("Host function {}", message);
        Owner(ctx).RecordInternalError(message);
        return JS_ThrowInternalError(ctx, "%s", message.c_str());
    }
}

JSValue ThrowNamedError(JSContext* ctx, const char* name, const std::string& message) {
    JSValue error = JS_NewError(ctx);
    if (JS_IsException(error)) {
        return error;
    }
    JS_DefinePropertyValueStr(ctx, error, "name", JS_NewString(ctx, name),
                              JS_PROP_WRITABLE | JS_PROP_CONFIGURABLE);
    JS_DefinePropertyValueStr(ctx, error, "message",
                              JS_NewStringLen(ctx, message.data(), message.size()),
                              JS_PROP_WRITABLE | JS_PROP_CONFIGURABLE);
    return JS_Throw(ctx, error);
}

JSValue ThrowViolation(JSContext* ctx, const policy::PolicyViolation& violation) {
    return ThrowNamedError(ctx, "SandboxViolation", violation.rule + ": " + violation.detail);
}

std::size_t ClampBytes(double requested) {
    if (!(requested > 0)) {
        return 0;
    }
    if (requested >= static_cast<double>(std::numeric_limits<std::size_t>::max())) {
        return std::numeric_limits<std::size_t>::max();
    }
    return static_cast<std::size_t>(requested);
}

JSValue HostReserve(JSContext* ctx, JSValueConst, int, JSValueConst* argv) {
    return Guarded(ctx, "reserve", [&]() -> JSValue {
        double requested = 0;
        if (JS_ToFloat64(ctx, &requested, argv[0]) < 0) {
            return JS_EXCEPTION;
        }
        std::size_t bytes = ClampBytes(requested);
        if (bytes == 0) {
            return JS_UNDEFINED;
        }
        if (auto violation = Owner(ctx).ReserveMemory(bytes)) {
            return JS_ThrowRangeError(ctx, "%s", violation->Describe().c_str());
        }
        return JS_UNDEFINED;
    });
}

JSValue HostRelease(JSContext* ctx, JSValueConst, int, JSValueConst* argv) {
    return Guarded(ctx, "release", [&]() -> JSValue {
        double released = 0;
        if (JS_ToFloat64(ctx, &released, argv[0]) < 0) {
            return JS_EXCEPTION;
        }
        Owner(ctx).ReleaseMemory(ClampBytes(released));
        return JS_UNDEFINED;
    });
}

JSValue HostViolation(JSContext* ctx, JSValueConst, int, JSValueConst* argv) {
    return Guarded(ctx, "violation", [&]() -> JSValue {
        policy::PolicyViolation violation{ToStdString(ctx, argv[0]), ToStdString(ctx, argv[1])};
        Owner(ctx).RaiseViolation(violation);
        return ThrowViolation(ctx, violation);
    });
}

JSValue HostLog(JSContext* ctx, JSValueConst, int, JSValueConst* argv) {
    return Guarded(ctx, "console", [&]() -> JSValue {
        Owner(ctx).AppendLog(ToStdString(ctx, argv[0]), ToStdString(ctx, argv[1]));
        return JS_UNDEFINED;
    });
}

JSValue HostGetSecret(JSContext* ctx, JSValueConst, int, JSValueConst* argv) {
    return Guarded(ctx, "getSecret", [&]() -> JSValue {
        std::string name = JS_IsString(argv[0]) ? ToStdString(ctx, argv[0]) : std::string();
        auto lookup = Owner(ctx).LookupSecret(name);
        if (!lookup.granted) {
            return ThrowNamedError(ctx, "SecretAccessDenied",
                                   "access to secret '" + name + "' denied");
        }
        return JS_NewStringLen(ctx, lookup.value.data(), lookup.value.size());
    });
}

JSValue HostSha256(JSContext* ctx, JSValueConst, int, JSValueConst* argv) {
    return Guarded(ctx, "crypto.sha256", [&]() -> JSValue {
        if (JS_IsUndefined(argv[0]) || JS_IsNull(argv[0])) {
            return JS_ThrowTypeError(ctx, "sha256 requires an input string");
        }
        std::string digest = utils::HashUtils::Sha256Hex(ToStdString(ctx, argv[0]));
        return JS_NewStringLen(ctx, digest.data(), digest.size());
    });
}

JSValue HostRandomBytes(JSContext* ctx, JSValueConst, int, JSValueConst* argv) {
    return Guarded(ctx, "crypto.randomBytes", [&]() -> JSValue {
        if (JS_IsUndefined(argv[0])) {
            return JS_ThrowTypeError(ctx, "randomBytes requires a length parameter");
        }
        std::int64_t length = 0;
        if (JS_ToInt64(ctx, &length, argv[0]) < 0) {
            return JS_EXCEPTION;
        }
        if (length < 1 || length > 1024) {
            return JS_ThrowRangeError(ctx, "Length must be between 1 and 1024");
        }
        auto bytes = utils::HashUtils::RandomBytes(static_cast<std::size_t>(length));
        std::string encoded = utils::HashUtils::ToBase64(bytes);
        return JS_NewStringLen(ctx, encoded.data(), encoded.size());
    });
}

bool ReadHeaders(JSContext* ctx, JSValueConst list, bridge::HttpRequest& request) {
    JSValue length_value = JS_GetPropertyStr(ctx, list, "length");
    std::int64_t length = 0;
    int rc = JS_ToInt64(ctx, &length, length_value);
    JS_FreeValue(ctx, length_value);
    if (rc < 0) {
        return false;
    }

    for (std::int64_t i = 0; i < length; ++i) {
        JSValue pair = JS_GetPropertyUint32(ctx, list, static_cast<std::uint32_t>(i));
        if (JS_IsException(pair)) {
            return false;
        }
        JSValue name = JS_GetPropertyUint32(ctx, pair, 0);
        JSValue value = JS_GetPropertyUint32(ctx, pair, 1);
        request.headers.emplace_back(ToStdString(ctx, name), ToStdString(ctx, value));
        JS_FreeValue(ctx, name);
        JS_FreeValue(ctx, value);
        JS_FreeValue(ctx, pair);
    }
    return true;
}

JSValue BuildResponse(JSContext* ctx, const bridge::HttpResponse& response) {
    JSValue object = JS_NewObject(ctx);
    if (JS_IsException(object)) {
        return object;
    }

    JSValue headers = JS_NewObject(ctx);
    for (const auto& [name, value] : response.headers) {
        JS_DefinePropertyValueStr(ctx, headers, name.c_str(),
                                  JS_NewStringLen(ctx, value.data(), value.size()), JS_PROP_C_W_E);
    }

    JS_DefinePropertyValueStr(ctx, object, "status", JS_NewInt32(ctx, response.status_code), JS_PROP_C_W_E);
    JS_DefinePropertyValueStr(ctx, object, "statusText",
        JS_NewStringLen(ctx, response.status_text.data(), response.status_text.size()), JS_PROP_C_W_E);
    JS_DefinePropertyValueStr(ctx, object, "url",
        JS_NewStringLen(ctx, response.url.data(), response.url.size()), JS_PROP_C_W_E);
    JS_DefinePropertyValueStr(ctx, object, "headers", headers, JS_PROP_C_W_E);
    JS_DefinePropertyValueStr(ctx, object, "body",
        JS_NewStringLen(ctx, response.body.data(), response.body.size()), JS_PROP_C_W_E);
    return object;
}

JSValue HostFetch(JSContext* ctx, JSValueConst, int, JSValueConst* argv) {
    return Guarded(ctx, "fetch", [&]() -> JSValue {
        auto& owner = Owner(ctx);

        bridge::HttpRequest request;
        request.url = ToStdString(ctx, argv[0]);
        request.method = ToStdString(ctx, argv[1]);
        if (!ReadHeaders(ctx, argv[2], request)) {
            return JS_EXCEPTION;
        }
        request.body = ToStdString(ctx, argv[3]);

        if (auto violation = owner.AuthorizeRequest(request)) {
            owner.RaiseViolation(*violation);
            return ThrowViolation(ctx, *violation);
        }

        bridge::HttpResponse response;
        try {
            response = owner.SendRequest(request);
        } catch (const bridge::TransportError& e) {
            if (e.kind() == bridge::TransportError::Kind::RESPONSE_TOO_LARGE) {
                policy::PolicyViolation violation{"network.response-size", e.what()};
                owner.RaiseViolation(violation);
                return ThrowViolation(ctx, violation);
            }
            return JS_ThrowTypeError(ctx, "fetch failed: %s", e.what());
        }

        if (auto violation = owner.ReserveMemory(response.body.size())) {
            return JS_ThrowRangeError(ctx, "%s", violation->Describe().c_str());
        }
        return BuildResponse(ctx, response);
    });
}

void SetHostFunction(JSContext* ctx, JSValueConst host, const char* name,
                     JSCFunction* fn, int length) {
    JS_DefinePropertyValueStr(ctx, host, name, JS_NewCFunction(ctx, fn, name, length),
                              JS_PROP_C_W_E);
}

std::string TakePendingException(JSContext* ctx) {
    JSValue exception = JS_GetException(ctx);
    std::string description = DescribeException(ctx, exception);
    JS_FreeValue(ctx, exception);
    return description;
}

} // anonymous namespace

// ============================================================================
// CapabilityBuilder
// ============================================================================

CapabilityBuilder::CapabilityBuilder(ExecutionContext& owner)
    : owner_(owner) {
}

void CapabilityBuilder::Install(JSContext* ctx, JSValueConst params) {
    const auto& config = owner_.Policy().Config();
    const auto& request = owner_.Request();

    nlohmann::json settings = {
        {"allowedGlobals", config.allowed_globals},
        {"network", config.network.enabled},
        {"chargeGranularity", kChargeGranularity}
    };
    nlohmann::json identity = {
        {"functionID", request.function_id},
        {"userID", request.user_id},
        {"executionID", owner_.ExecutionId()}
    };

    JSValue bootstrap = JS_Eval(ctx, kBootstrapSource, std::strlen(kBootstrapSource),
                                "<sandbox>", JS_EVAL_TYPE_GLOBAL);
    if (JS_IsException(bootstrap)) {
        throw CapabilityError("sandbox bootstrap failed to compile: " + TakePendingException(ctx));
    }

    JSValue host = JS_NewObject(ctx);
    SetHostFunction(ctx, host, "reserve", HostReserve, 1);
    SetHostFunction(ctx, host, "release", HostRelease, 1);
    SetHostFunction(ctx, host, "violation", HostViolation, 2);
    SetHostFunction(ctx, host, "log", HostLog, 2);
    SetHostFunction(ctx, host, "getSecret", HostGetSecret, 1);
    SetHostFunction(ctx, host, "fetch", HostFetch, 4);
    SetHostFunction(ctx, host, "sha256", HostSha256, 1);
    SetHostFunction(ctx, host, "randomBytes", HostRandomBytes, 1);

    JSValue args[4] = {
        host,
        JsonToJs(ctx, identity),
        JS_DupValue(ctx, params),
        JsonToJs(ctx, settings)
    };

    JSValue leftovers = JS_EXCEPTION;
    if (!JS_IsException(args[1]) && !JS_IsException(args[3])) {
        leftovers = JS_Call(ctx, bootstrap, JS_UNDEFINED, 4, args);
    }

    for (auto& arg : args) {
        JS_FreeValue(ctx, arg);
    }
    JS_FreeValue(ctx, bootstrap);

    if (JS_IsException(leftovers)) {
        throw CapabilityError("sandbox bootstrap failed: " + TakePendingException(ctx));
    }

    try {
        auto names = JsToJson(ctx, leftovers, CodecLimits{4, 256});
        for (const auto& name : names) {
            if (name.is_string()) {
                leftovers_.push_back(name.get<std::string>());
            }
        }
    } catch (const ValueConversionError& e) {
        JS_FreeValue(ctx, leftovers);
        throw CapabilityError(std::string("unexpected bootstrap result: ") + e.what());
    }
    JS_FreeValue(ctx, leftovers);

    if (!leftovers_.empty()) {
        spdlog::debug("Globals kept as non-configurable: {}", leftovers_.size());
    }
}

} // namespace core
} // namespace sealbox
