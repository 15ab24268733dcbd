#include "internal/workflow/confirmation_policy.hpp"

#include <algorithm>

namespace shipx::workflow {

ConfirmationPolicy ConfirmationPolicy::FromConfig(const shipx::runtime::config::PollConfig& config) {
  ConfirmationPolicy policy;
  if (config.interval_ms() > 0) {
    policy.interval = std::chrono::milliseconds(config.interval_ms());
  }
  if (config.has_max_attempts()) {
    policy.max_attempts = config.max_attempts();
  }
  policy.fail_statuses.assign(config.fail_statuses().begin(), config.fail_statuses().end());
  return policy;
}

bool ConfirmationPolicy::IsConfirmed(std::string_view status) const {
  return status == kStatusConfirmed;
}

bool ConfirmationPolicy::IsFailure(std::string_view status) const {
  return std::find(fail_statuses.begin(), fail_statuses.end(), status) != fail_statuses.end();
}

bool ConfirmationPolicy::Exhausted(std::uint32_t attempts_made) const {
  return max_attempts != 0 && attempts_made >= max_attempts;
}

} // namespace shipx::workflow
