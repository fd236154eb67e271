/**
 * @file js_value_codec.hpp
 * @brief Conversion between interpreter values and plain JSON data
 *
 * Only plain data crosses the sandbox boundary: null, booleans, numbers,
 * strings, arrays and plain objects. Functions, symbols, big integers and
 * other host values are refused. Integral numbers below 2^53 come back as
 * JSON integers so they round-trip unchanged.
 *
 * @date 2025
 */

#pragma once

#include "sealbox/core/execution_types.hpp"

#include <nlohmann/json.hpp>
#include <quickjs.h>

#include <string>

namespace sealbox {
namespace core {

/**
 * @class ValueConversionError
 * @brief A value could not be represented as plain data
 */
class ValueConversionError : public SealboxError {
public:
    explicit ValueConversionError(const std::string& msg) : SealboxError(msg) {}
};

/**
 * @struct CodecLimits
 * @brief Bounds applied while walking interpreter values
 */
struct CodecLimits {
    std::size_t max_depth{32};
    std::size_t max_entries{1000};
};

/**
 * @brief Convert an interpreter value into JSON
 *
 * undefined becomes null at the top level and inside arrays and is omitted
 * inside objects. Non-finite numbers become null. Objects with a callable
 * toJSON (Date) are converted through it.
 *
 * @throws ValueConversionError for non-data values, limits breaches, or when
 *         a getter throws (the pending exception is cleared)
 */
nlohmann::json JsToJson(JSContext* ctx, JSValueConst value, const CodecLimits& limits);

/**
 * @brief Build an interpreter value from JSON
 * @return New reference, or JS_EXCEPTION if the interpreter ran out of memory
 */
JSValue JsonToJs(JSContext* ctx, const nlohmann::json& value);

/// "Name: message" for error objects, the string form for anything else
std::string DescribeException(JSContext* ctx, JSValueConst exception);

/// Value of a string property, empty if absent or not convertible
std::string GetStringProperty(JSContext* ctx, JSValueConst object, const char* name);

/// Copy a JS string (or anything convertible) into std::string
std::string ToStdString(JSContext* ctx, JSValueConst value);

} // namespace core
} // namespace sealbox
