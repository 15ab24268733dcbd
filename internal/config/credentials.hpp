#pragma once

#include <string>

#include "config/config.pb.h"
#include "internal/util/result.hpp"

namespace shipx::config {

inline constexpr const char* kApiTokenEnv       = "INPOST_API_TOKEN";
inline constexpr const char* kOrganizationIdEnv = "INPOST_ORGANIZATION_ID";

/*
  Operator credentials. Resolved once at startup and never changed.
*/
struct Credentials {
  std::string api_token;
  std::string organization_id;

  bool Complete() const {
    return !api_token.empty() && !organization_id.empty();
  }
};

/*
  Environment variables win over values from the config file. Either value
  missing is a configuration error.
*/
shipx::util::Result ResolveCredentials(const shipx::runtime::config::RuntimeConfig& config, Credentials* out);

} // namespace shipx::config
