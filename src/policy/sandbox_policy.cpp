/**
 * @file sandbox_policy.cpp
 * @brief Per-run policy state: step guard, violation record, console budget
 *
 * @date 2025
 */

#include "sealbox/policy/sandbox_policy.hpp"
#include "sealbox/core/execution_types.hpp"
#include "sealbox/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace sealbox {
namespace policy {

namespace {

constexpr std::size_t kEllipsisBytes = 3;

} // anonymous namespace

SandboxPolicy::SandboxPolicy(std::shared_ptr<const PolicyConfig> config)
    : config_(std::move(config)) {
    if (!config_) {
        throw SealboxError("SandboxPolicy requires a configuration");
    }
}

bool SandboxPolicy::IsGlobalAllowed(const std::string& name) const {
    const auto& allowed = config_->allowed_globals;
    return std::find(allowed.begin(), allowed.end(), name) != allowed.end();
}

std::optional<core::ResourceViolation> SandboxPolicy::Step() {
    std::uint64_t now = steps_.fetch_add(1, std::memory_order_acq_rel) + 1;
    if (config_->max_steps == 0 || now <= config_->max_steps) {
        return std::nullopt;
    }

    core::ResourceViolation violation;
    violation.kind = "steps";
    violation.requested = now;
    violation.ceiling = config_->max_steps;
    return violation;
}

bool SandboxPolicy::RecordViolation(PolicyViolation violation) {
    std::lock_guard<std::mutex> lock(violation_mutex_);
    if (violation_) {
        return false;
    }

    spdlog::warn("Sandbox violation [{}]: {}", violation.rule, violation.detail);
    violation_ = std::move(violation);
    return true;
}

std::optional<PolicyViolation> SandboxPolicy::FirstViolation() const {
    std::lock_guard<std::mutex> lock(violation_mutex_);
    return violation_;
}

std::optional<std::string> SandboxPolicy::AdmitLog(const std::string& line) {
    if (log_entries_ >= config_->max_log_entries || log_bytes_ >= config_->max_log_bytes) {
        logs_truncated_ = true;
        return std::nullopt;
    }

    std::string kept = line;
    std::size_t room = config_->max_log_bytes - log_bytes_;
    if (kept.size() > room) {
        logs_truncated_ = true;
        // Truncate appends "...", which has to fit in the remaining budget too
        if (room <= kEllipsisBytes) {
            log_bytes_ = config_->max_log_bytes;
            return std::nullopt;
        }
        kept = utils::StringUtils::Truncate(kept, room - kEllipsisBytes);
    }

    ++log_entries_;
    log_bytes_ += kept.size();
    return kept;
}

} // namespace policy
} // namespace sealbox
