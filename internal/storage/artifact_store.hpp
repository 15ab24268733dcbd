#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "internal/util/result.hpp"

namespace shipx::storage {

/*
  Output directory for shipping documents (labels, dispatch printouts).

  The directory tree is created on the first write, not at construction, so
  a run that fails before any document is fetched leaves nothing behind.
  Writes go to "<name>.tmp" and are renamed into place.
*/
class ArtifactStore {
 public:
  explicit ArtifactStore(std::filesystem::path root);

  shipx::util::Result Write(const std::string& name, const std::string& bytes, std::filesystem::path* written) const;

  const std::filesystem::path& Root() const {
    return root_;
  }

  static std::string LabelFileName(std::int64_t shipment_id);
  static std::string PrintoutFileName(std::int64_t shipment_id);

 private:
  std::filesystem::path root_;
};

} // namespace shipx::storage
