#include "credentials.hpp"

#include <cstdlib>
#include <utility>

namespace shipx::config {

namespace {

std::string FromEnvOr(const char* name, const std::string& fallback) {
  if (const char* value = std::getenv(name)) {
    if (*value != '\0') {
      return value;
    }
  }
  return fallback;
}

} // namespace

shipx::util::Result ResolveCredentials(const shipx::runtime::config::RuntimeConfig& config, Credentials* out) {
  Credentials resolved;
  resolved.api_token       = FromEnvOr(kApiTokenEnv, config.credentials().api_token());
  resolved.organization_id = FromEnvOr(kOrganizationIdEnv, config.credentials().organization_id());

  if (!resolved.Complete()) {
    return shipx::util::Result::Err(shipx::util::ErrorCode::kConfiguration, "API token or organization ID not found");
  }

  *out = std::move(resolved);
  return shipx::util::Result::Ok();
}

} // namespace shipx::config
