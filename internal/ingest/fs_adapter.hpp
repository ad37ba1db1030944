#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "source_adapter.hpp"

namespace ure::ingest {

/*
  Local filesystem source.

  Locators are directory paths; unit ids are absolute file paths. Content is
  captured when capture_content is set and the file is no larger than
  max_content_bytes; otherwise only the digest is kept.
*/
class FilesystemAdapter final : public SourceAdapter {
 public:
  static constexpr uint64_t kDefaultMaxContentBytes = 16ull * 1024 * 1024;

  explicit FilesystemAdapter(bool capture_content = true, uint64_t max_content_bytes = kDefaultMaxContentBytes);

  std::string Kind() const override {
    return "fs";
  }

  std::vector<DiscoveredUnit> Discover(const std::string& locator) override;

  CandidateOutcome ProduceCandidate(const std::string& session_id, const std::string& unit_id) override;

  // Media type guessed from the file extension.
  static std::string NatureFor(const std::string& path);

 private:
  bool     capture_content_;
  uint64_t max_content_bytes_;
};

} // namespace ure::ingest
