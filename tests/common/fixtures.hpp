#pragma once

#include <spdlog/logger.h>
#include <spdlog/sinks/ostream_sink.h>

#include <filesystem>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "api/shipx/courier/v1.hpp"
#include "cmd/shipx-courier/example_shipment.h"
#include "internal/config/credentials.hpp"

namespace shipx::testing {

inline constexpr const char* kBaseUrl        = "https://shipx.test/v1";
inline constexpr const char* kToken          = "test-token";
inline constexpr const char* kOrganizationId = "4242";

inline shipx::config::Credentials TestCredentials() {
  return {kToken, kOrganizationId};
}

// The CLI's built-in sandbox shipment: Anna Nowak (Kraków) to Jan Kowalski
// (Warszawa), one 300x200x100 mm parcel, insured for 25 PLN.
inline shipx::courier::v1::ShipmentRequest TestShipment() {
  return shipx::cli::ExampleShipment();
}

inline std::string ShipmentBody(long id, const std::string& status, long sender_id = 77) {
  return "{\"id\":" + std::to_string(id) + ",\"status\":\"" + status + "\",\"tracking_number\":null,\"sender\":{\"id\":" +
         std::to_string(sender_id) + ",\"first_name\":\"Anna\"},\"parcels\":[{\"id\":1}]}";
}

/*
  Logger writing "<level>|<message>" lines into a string buffer.
*/
class CapturedLog {
 public:
  CapturedLog() {
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(stream_);
    sink->set_pattern("%l|%v");
    logger_ = std::make_shared<spdlog::logger>("test", sink);
    logger_->set_level(spdlog::level::trace);
  }

  std::shared_ptr<spdlog::logger> Logger() const {
    return logger_;
  }

  std::vector<std::string> Lines() const {
    std::vector<std::string> lines;
    std::istringstream       in(stream_.str());
    std::string              line;
    while (std::getline(in, line)) {
      lines.push_back(line);
    }
    return lines;
  }

  std::vector<std::string> LinesAt(const std::string& level) const {
    std::vector<std::string> matched;
    for (const auto& line : Lines()) {
      if (line.rfind(level + "|", 0) == 0) {
        matched.push_back(line);
      }
    }
    return matched;
  }

 private:
  std::ostringstream              stream_;
  std::shared_ptr<spdlog::logger> logger_;
};

inline std::filesystem::path FreshDir(const std::string& suite, const std::string& test_name) {
  const auto dir = std::filesystem::temp_directory_path() / suite / test_name;
  std::filesystem::remove_all(dir);
  return dir;
}

} // namespace shipx::testing
