#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "config/config.pb.h"

namespace shipx::workflow {

inline constexpr std::string_view kStatusConfirmed = "confirmed";

/*
  How long to wait for the provider to confirm a shipment.

  A shipment is polled every `interval` until its status is "confirmed".
  `max_attempts` bounds the number of polls (0 = no bound). Statuses listed
  in `fail_statuses` end the wait at once; every other status means "not yet".
*/
struct ConfirmationPolicy {
  std::chrono::milliseconds interval{1000};
  std::uint32_t             max_attempts = 300;
  std::vector<std::string>  fail_statuses;

  static ConfirmationPolicy FromConfig(const shipx::runtime::config::PollConfig& config);

  bool IsConfirmed(std::string_view status) const;
  bool IsFailure(std::string_view status) const;

  // True once `attempts_made` polls have used up the budget.
  bool Exhausted(std::uint32_t attempts_made) const;
};

} // namespace shipx::workflow
