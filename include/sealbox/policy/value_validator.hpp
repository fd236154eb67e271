/**
 * @file value_validator.hpp
 * @brief Shape and content checks for values crossing the sandbox boundary
 *
 * Applied to request parameters before a context is built and to the value
 * returned by the entry point before it is accepted.
 *
 * @date 2025
 */

#pragma once

#include "sealbox/policy/sandbox_policy.hpp"

#include <nlohmann/json.hpp>

#include <regex>
#include <string>
#include <vector>

namespace sealbox {
namespace policy {

/**
 * @struct ValidationResult
 * @brief Outcome of a validation pass
 */
struct ValidationResult {
    bool valid{true};
    std::string error;      ///< First problem found, with a JSON-pointer-like path
};

/**
 * @class ValueValidator
 * @brief Validates plain JSON data against ValueLimits
 *
 * Thread-safe after construction (patterns are compiled once).
 *
 * **Usage Example**:
 * @code
 * ValueValidator validator(limits);
 * auto check = validator.Validate(request.parameters, "parameters");
 * if (!check.valid) { ... check.error ... }
 * @endcode
 */
class ValueValidator {
public:
    /**
     * @throws SealboxError if a forbidden pattern is not a valid regex
     */
    explicit ValueValidator(const ValueLimits& limits);

    ValidationResult Validate(const nlohmann::json& value, const std::string& what) const;

    const ValueLimits& Limits() const { return limits_; }

private:
    bool Walk(const nlohmann::json& value, const std::string& path,
              std::size_t depth, ValidationResult& result) const;
    bool CheckString(const std::string& text, const std::string& path,
                     ValidationResult& result) const;

    ValueLimits limits_;
    std::vector<std::regex> patterns_;
};

} // namespace policy
} // namespace sealbox
