#include "internal/storage/artifact_store.hpp"

#include <fstream>
#include <system_error>
#include <utility>

namespace shipx::storage {

using shipx::util::ErrorCode;
using shipx::util::Result;

namespace {

Result ValidateName(const std::string& name) {
  if (name.empty()) {
    return Result::Err(ErrorCode::kIOError, "artifact name must not be empty");
  }
  for (char c : name) {
    if (c == '/' || c == '\\' || c == '\0') {
      return Result::Err(ErrorCode::kIOError, "artifact name contains invalid character: " + name);
    }
  }
  if (name == "." || name == "..") {
    return Result::Err(ErrorCode::kIOError, "artifact name must not be a relative path component");
  }
  return Result::Ok();
}

} // namespace

ArtifactStore::ArtifactStore(std::filesystem::path root) : root_(std::move(root)) {
}

std::string ArtifactStore::LabelFileName(std::int64_t shipment_id) {
  return std::to_string(shipment_id) + "_label.pdf";
}

std::string ArtifactStore::PrintoutFileName(std::int64_t shipment_id) {
  return std::to_string(shipment_id) + "_printout.pdf";
}

Result ArtifactStore::Write(const std::string& name, const std::string& bytes, std::filesystem::path* written) const {
  if (auto valid = ValidateName(name); !valid) {
    return valid;
  }

  std::error_code ec;
  std::filesystem::create_directories(root_, ec);
  if (ec) {
    return Result::Err(ErrorCode::kIOError, "cannot create " + root_.string() + ": " + ec.message());
  }

  const auto final_path = root_ / name;
  const auto tmp_path   = std::filesystem::path(final_path.string() + ".tmp");

  {
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out) {
      return Result::Err(ErrorCode::kIOError, "cannot open " + tmp_path.string());
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    out.close();
    if (!out) {
      std::filesystem::remove(tmp_path, ec);
      return Result::Err(ErrorCode::kIOError, "cannot write " + tmp_path.string());
    }
  }

  std::filesystem::rename(tmp_path, final_path, ec);
  if (ec) {
    const std::string reason = ec.message();
    std::filesystem::remove(tmp_path, ec);
    return Result::Err(ErrorCode::kIOError, "cannot rename " + tmp_path.string() + ": " + reason);
  }

  *written = final_path;
  return Result::Ok();
}

} // namespace shipx::storage
