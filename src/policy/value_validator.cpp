/**
 * @file value_validator.cpp
 * @brief Implementation of boundary value validation
 *
 * @date 2025
 */

#include "sealbox/policy/value_validator.hpp"
#include "sealbox/core/execution_types.hpp"

#include <algorithm>

namespace sealbox {
namespace policy {

ValueValidator::ValueValidator(const ValueLimits& limits)
    : limits_(limits) {
    for (const auto& pattern : limits_.forbidden_patterns) {
        try {
            patterns_.emplace_back(pattern, std::regex::ECMAScript | std::regex::icase);
        } catch (const std::regex_error& e) {
            throw SealboxError("Invalid forbidden pattern '" + pattern + "': " + e.what());
        }
    }
}

ValidationResult ValueValidator::Validate(const nlohmann::json& value, const std::string& what) const {
    ValidationResult result;

    if (!Walk(value, what, 1, result)) {
        result.valid = false;
        return result;
    }

    // Depth is bounded at this point, so serialization cannot recurse unboundedly
    std::string serialized;
    try {
        serialized = value.dump();
    } catch (const nlohmann::json::type_error& e) {
        result.valid = false;
        result.error = what + ": not serializable (" + e.what() + ")";
        return result;
    }

    if (serialized.size() > limits_.max_bytes) {
        result.valid = false;
        result.error = what + ": serialized size " + std::to_string(serialized.size()) +
                       " bytes exceeds limit of " + std::to_string(limits_.max_bytes);
    }
    return result;
}

bool ValueValidator::Walk(const nlohmann::json& value, const std::string& path,
                          std::size_t depth, ValidationResult& result) const {
    if (depth > limits_.max_depth) {
        result.error = path + ": nesting depth exceeds limit of " + std::to_string(limits_.max_depth);
        return false;
    }

    switch (value.type()) {
        case nlohmann::json::value_t::object: {
            if (value.size() > limits_.max_entries) {
                result.error = path + ": " + std::to_string(value.size()) +
                               " entries exceed limit of " + std::to_string(limits_.max_entries);
                return false;
            }
            for (auto it = value.begin(); it != value.end(); ++it) {
                const std::string& key = it.key();
                std::string child = path + "." + key;
                if (std::find(limits_.forbidden_keys.begin(), limits_.forbidden_keys.end(), key)
                        != limits_.forbidden_keys.end()) {
                    result.error = child + ": forbidden key";
                    return false;
                }
                if (!CheckString(key, child, result) ||
                    !Walk(it.value(), child, depth + 1, result)) {
                    return false;
                }
            }
            return true;
        }

        case nlohmann::json::value_t::array: {
            if (value.size() > limits_.max_entries) {
                result.error = path + ": " + std::to_string(value.size()) +
                               " entries exceed limit of " + std::to_string(limits_.max_entries);
                return false;
            }
            std::size_t index = 0;
            for (const auto& element : value) {
                if (!Walk(element, path + "[" + std::to_string(index) + "]", depth + 1, result)) {
                    return false;
                }
                ++index;
            }
            return true;
        }

        case nlohmann::json::value_t::string:
            return CheckString(value.get_ref<const std::string&>(), path, result);

        case nlohmann::json::value_t::binary:
        case nlohmann::json::value_t::discarded:
            result.error = path + ": unsupported value type";
            return false;

        default:
            return true;
    }
}

bool ValueValidator::CheckString(const std::string& text, const std::string& path,
                                 ValidationResult& result) const {
    if (text.size() > limits_.max_bytes) {
        result.error = path + ": string exceeds " + std::to_string(limits_.max_bytes) + " bytes";
        return false;
    }

    // std::regex recurses per character; scan long strings in overlapping windows
    constexpr std::size_t kWindow = 4096;
    constexpr std::size_t kOverlap = 256;

    for (std::size_t offset = 0; offset == 0 || offset < text.size(); offset += kWindow) {
        std::string window = text.substr(offset, kWindow + kOverlap);
        for (std::size_t i = 0; i < patterns_.size(); ++i) {
            if (std::regex_search(window, patterns_[i])) {
                result.error = path + ": content matches forbidden pattern " +
                               limits_.forbidden_patterns[i];
                return false;
            }
        }
    }
    return true;
}

} // namespace policy
} // namespace sealbox
