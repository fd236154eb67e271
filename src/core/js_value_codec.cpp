/**
 * @file js_value_codec.cpp
 * @brief Interpreter value <-> JSON conversion
 *
 * @date 2025
 */

#include "sealbox/core/js_value_codec.hpp"

#include <cmath>
#include <limits>

namespace sealbox {
namespace core {

namespace {

constexpr double kMaxSafeInteger = 9007199254740991.0;  // 2^53 - 1

// Owns one JSValue reference for the duration of a scope
class ScopedValue {
public:
    ScopedValue(JSContext* ctx, JSValue value) : ctx_(ctx), value_(value) {}
    ~ScopedValue() { JS_FreeValue(ctx_, value_); }

    ScopedValue(const ScopedValue&) = delete;
    ScopedValue& operator=(const ScopedValue&) = delete;

    JSValueConst get() const { return value_; }

private:
    JSContext* ctx_;
    JSValue value_;
};

[[noreturn]] void ThrowPending(JSContext* ctx, const std::string& path) {
    JSValue exception = JS_GetException(ctx);
    std::string description = DescribeException(ctx, exception);
    JS_FreeValue(ctx, exception);
    throw ValueConversionError(path + ": " + description);
}

nlohmann::json Convert(JSContext* ctx, JSValueConst value, const CodecLimits& limits,
                       const std::string& path, std::size_t depth);

nlohmann::json ConvertNumber(JSContext* ctx, JSValueConst value) {
    if (JS_VALUE_GET_TAG(value) == JS_TAG_INT) {
        return static_cast<std::int64_t>(JS_VALUE_GET_INT(value));
    }

    double d = 0;
    if (JS_ToFloat64(ctx, &d, value) < 0) {
        ThrowPending(ctx, "number");
    }
    if (!std::isfinite(d)) {
        return nullptr;
    }
    if (std::trunc(d) == d && std::fabs(d) <= kMaxSafeInteger) {
        return static_cast<std::int64_t>(d);
    }
    return d;
}

nlohmann::json ConvertArray(JSContext* ctx, JSValueConst value, const CodecLimits& limits,
                            const std::string& path, std::size_t depth) {
    ScopedValue length_value(ctx, JS_GetPropertyStr(ctx, value, "length"));
    if (JS_IsException(length_value.get())) {
        ThrowPending(ctx, path);
    }

    std::int64_t length = 0;
    if (JS_ToInt64(ctx, &length, length_value.get()) < 0) {
        ThrowPending(ctx, path);
    }
    if (length < 0 || static_cast<std::size_t>(length) > limits.max_entries) {
        throw ValueConversionError(path + ": array length " + std::to_string(length) +
                                   " exceeds limit of " + std::to_string(limits.max_entries));
    }

    nlohmann::json out = nlohmann::json::array();
    for (std::int64_t i = 0; i < length; ++i) {
        std::string child = path + "[" + std::to_string(i) + "]";
        ScopedValue element(ctx, JS_GetPropertyUint32(ctx, value, static_cast<std::uint32_t>(i)));
        if (JS_IsException(element.get())) {
            ThrowPending(ctx, child);
        }
        if (JS_IsUndefined(element.get())) {
            out.push_back(nullptr);
            continue;
        }
        out.push_back(Convert(ctx, element.get(), limits, child, depth + 1));
    }
    return out;
}

nlohmann::json ConvertObject(JSContext* ctx, JSValueConst value, const CodecLimits& limits,
                             const std::string& path, std::size_t depth) {
    JSPropertyEnum* properties = nullptr;
    std::uint32_t count = 0;
    if (JS_GetOwnPropertyNames(ctx, &properties, &count, value,
                               JS_GPN_STRING_MASK | JS_GPN_ENUM_ONLY) < 0) {
        ThrowPending(ctx, path);
    }

    auto release = [ctx, &properties, &count]() {
        for (std::uint32_t i = 0; i < count; ++i) {
            JS_FreeAtom(ctx, properties[i].atom);
        }
        js_free(ctx, properties);
        properties = nullptr;
    };

    if (count > limits.max_entries) {
        std::uint32_t seen = count;
        release();
        throw ValueConversionError(path + ": " + std::to_string(seen) +
                                   " keys exceed limit of " + std::to_string(limits.max_entries));
    }

    nlohmann::json out = nlohmann::json::object();
    try {
        for (std::uint32_t i = 0; i < count; ++i) {
            const char* key_cstr = JS_AtomToCString(ctx, properties[i].atom);
            if (!key_cstr) {
                ThrowPending(ctx, path);
            }
            std::string key(key_cstr);
            JS_FreeCString(ctx, key_cstr);

            std::string child = path + "." + key;
            ScopedValue property(ctx, JS_GetProperty(ctx, value, properties[i].atom));
            if (JS_IsException(property.get())) {
                ThrowPending(ctx, child);
            }
            if (JS_IsUndefined(property.get())) {
                continue;
            }
            out[key] = Convert(ctx, property.get(), limits, child, depth + 1);
        }
    } catch (...) {
        release();
        throw;
    }

    release();
    return out;
}

nlohmann::json Convert(JSContext* ctx, JSValueConst value, const CodecLimits& limits,
                       const std::string& path, std::size_t depth) {
    if (depth > limits.max_depth) {
        throw ValueConversionError(path + ": nesting depth exceeds limit of " +
                                   std::to_string(limits.max_depth));
    }

    if (JS_IsNull(value) || JS_IsUndefined(value)) {
        return nullptr;
    }
    if (JS_IsBool(value)) {
        return JS_ToBool(ctx, value) != 0;
    }
    if (JS_IsNumber(value)) {
        return ConvertNumber(ctx, value);
    }
    if (JS_IsString(value)) {
        return ToStdString(ctx, value);
    }
    if (!JS_IsObject(value)) {
        throw ValueConversionError(path + ": symbols and big integers are not plain data");
    }
    if (JS_IsFunction(ctx, value)) {
        throw ValueConversionError(path + ": functions are not plain data");
    }

    int is_array = JS_IsArray(ctx, value);
    if (is_array < 0) {
        ThrowPending(ctx, path);
    }
    if (is_array) {
        return ConvertArray(ctx, value, limits, path, depth);
    }

    // Date and friends serialize through toJSON, as JSON.stringify would
    ScopedValue to_json(ctx, JS_GetPropertyStr(ctx, value, "toJSON"));
    if (JS_IsException(to_json.get())) {
        ThrowPending(ctx, path);
    }
    if (JS_IsFunction(ctx, to_json.get())) {
        ScopedValue replaced(ctx, JS_Call(ctx, to_json.get(), value, 0, nullptr));
        if (JS_IsException(replaced.get())) {
            ThrowPending(ctx, path);
        }
        if (JS_IsObject(replaced.get())) {
            return ConvertObject(ctx, replaced.get(), limits, path, depth);
        }
        return Convert(ctx, replaced.get(), limits, path, depth + 1);
    }

    return ConvertObject(ctx, value, limits, path, depth);
}

} // anonymous namespace

nlohmann::json JsToJson(JSContext* ctx, JSValueConst value, const CodecLimits& limits) {
    return Convert(ctx, value, limits, "value", 1);
}

JSValue JsonToJs(JSContext* ctx, const nlohmann::json& value) {
    switch (value.type()) {
        case nlohmann::json::value_t::null:
            return JS_NULL;

        case nlohmann::json::value_t::boolean:
            return JS_NewBool(ctx, value.get<bool>());

        case nlohmann::json::value_t::number_integer:
            return JS_NewInt64(ctx, value.get<std::int64_t>());

        case nlohmann::json::value_t::number_unsigned: {
            auto u = value.get<std::uint64_t>();
            if (u <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                return JS_NewInt64(ctx, static_cast<std::int64_t>(u));
            }
            return JS_NewFloat64(ctx, static_cast<double>(u));
        }

        case nlohmann::json::value_t::number_float:
            return JS_NewFloat64(ctx, value.get<double>());

        case nlohmann::json::value_t::string: {
            const auto& s = value.get_ref<const std::string&>();
            return JS_NewStringLen(ctx, s.data(), s.size());
        }

        case nlohmann::json::value_t::array: {
            JSValue array = JS_NewArray(ctx);
            if (JS_IsException(array)) {
                return array;
            }
            std::uint32_t index = 0;
            for (const auto& element : value) {
                JSValue item = JsonToJs(ctx, element);
                if (JS_IsException(item) ||
                    JS_DefinePropertyValueUint32(ctx, array, index++, item, JS_PROP_C_W_E) < 0) {
                    JS_FreeValue(ctx, array);
                    return JS_EXCEPTION;
                }
            }
            return array;
        }

        case nlohmann::json::value_t::object: {
            JSValue object = JS_NewObject(ctx);
            if (JS_IsException(object)) {
                return object;
            }
            for (auto it = value.begin(); it != value.end(); ++it) {
                JSValue item = JsonToJs(ctx, it.value());
                if (JS_IsException(item)) {
                    JS_FreeValue(ctx, object);
                    return JS_EXCEPTION;
                }
                JSAtom atom = JS_NewAtomLen(ctx, it.key().data(), it.key().size());
                int rc = JS_DefinePropertyValue(ctx, object, atom, item, JS_PROP_C_W_E);
                JS_FreeAtom(ctx, atom);
                if (rc < 0) {
                    JS_FreeValue(ctx, object);
                    return JS_EXCEPTION;
                }
            }
            return object;
        }

        default:
            return JS_ThrowTypeError(ctx, "unsupported parameter type");
    }
}

std::string ToStdString(JSContext* ctx, JSValueConst value) {
    std::size_t length = 0;
    const char* cstr = JS_ToCStringLen(ctx, &length, value);
    if (!cstr) {
        JSValue pending = JS_GetException(ctx);
        JS_FreeValue(ctx, pending);
        return "";
    }
    std::string out(cstr, length);
    JS_FreeCString(ctx, cstr);
    return out;
}

std::string GetStringProperty(JSContext* ctx, JSValueConst object, const char* name) {
    if (!JS_IsObject(object)) {
        return "";
    }
    JSValue property = JS_GetPropertyStr(ctx, object, name);
    if (JS_IsException(property)) {
        JSValue pending = JS_GetException(ctx);
        JS_FreeValue(ctx, pending);
        return "";
    }
    std::string out = JS_IsUndefined(property) ? "" : ToStdString(ctx, property);
    JS_FreeValue(ctx, property);
    return out;
}

std::string DescribeException(JSContext* ctx, JSValueConst exception) {
    if (JS_IsObject(exception)) {
        std::string name = GetStringProperty(ctx, exception, "name");
        std::string message = GetStringProperty(ctx, exception, "message");
        if (!name.empty() || !message.empty()) {
            if (name.empty()) {
                name = "Error";
            }
            return message.empty() ? name : name + ": " + message;
        }
    }
    return ToStdString(ctx, exception);
}

} // namespace core
} // namespace sealbox
