#include "fs_adapter.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <string_view>
#include <system_error>

#include "internal/util/digest.hpp"
#include "internal/util/time.hpp"

namespace fs = std::filesystem;

namespace ure::ingest {

namespace {

constexpr std::size_t kReadChunkBytes = 64 * 1024;

std::string Lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

} // namespace

FilesystemAdapter::FilesystemAdapter(bool capture_content, uint64_t max_content_bytes)
    : capture_content_(capture_content), max_content_bytes_(max_content_bytes) {
}

std::string FilesystemAdapter::NatureFor(const std::string& path) {
  static const std::map<std::string, std::string> kNatures = {
      {".md", "text/markdown"},      {".mdx", "text/markdown"},   {".txt", "text/plain"},
      {".json", "application/json"}, {".yaml", "application/yaml"}, {".yml", "application/yaml"},
      {".csv", "text/csv"},          {".html", "text/html"},      {".htm", "text/html"},
      {".xml", "application/xml"},   {".pdf", "application/pdf"}, {".sql", "application/sql"},
      {".png", "image/png"},         {".jpg", "image/jpeg"},      {".jpeg", "image/jpeg"},
      {".svg", "image/svg+xml"},     {".eml", "message/rfc822"},
  };

  auto it = kNatures.find(Lower(fs::path(path).extension().string()));
  return it == kNatures.end() ? "application/octet-stream" : it->second;
}

std::vector<DiscoveredUnit> FilesystemAdapter::Discover(const std::string& locator) {
  std::vector<DiscoveredUnit> units;

  std::error_code ec;
  const auto      root = fs::absolute(locator, ec);
  if (ec || !fs::is_directory(root, ec)) {
    return units;
  }

  fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
  for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (!it->is_regular_file(ec)) {
      continue;
    }
    const auto abs = it->path().lexically_normal();
    units.push_back(DiscoveredUnit{abs.string(), abs.lexically_relative(root).generic_string()});
  }

  std::sort(units.begin(), units.end(), [](const auto& a, const auto& b) { return a.abs_path < b.abs_path; });
  return units;
}

CandidateOutcome FilesystemAdapter::ProduceCandidate(const std::string&, const std::string& unit_id) {
  std::error_code ec;
  const fs::path  path(unit_id);

  if (!fs::is_regular_file(path, ec)) {
    return CandidateOutcome::Fail("not_found", "not a regular file: " + unit_id);
  }

  const auto size = fs::file_size(path, ec);
  if (ec) {
    return CandidateOutcome::Fail("io", "stat " + unit_id + ": " + ec.message());
  }

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return CandidateOutcome::Fail("permission", "cannot open " + unit_id);
  }

  Candidate candidate;
  candidate.uri    = path.string();
  candidate.nature = NatureFor(unit_id);

  if (capture_content_ && size <= max_content_bytes_) {
    std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
      return CandidateOutcome::Fail("io", "read failed: " + unit_id);
    }
    candidate.size_bytes = static_cast<uint64_t>(bytes.size());
    candidate.content    = std::move(bytes);
  } else {
    // Digest only; never hold the whole file.
    util::Sha256Hasher hasher;
    std::vector<char>  chunk(kReadChunkBytes);
    uint64_t           total = 0;
    while (in) {
      in.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
      const auto got = in.gcount();
      if (got > 0) {
        hasher.Update(std::string_view(chunk.data(), static_cast<std::size_t>(got)));
        total += static_cast<uint64_t>(got);
      }
    }
    if (in.bad()) {
      return CandidateOutcome::Fail("io", "read failed: " + unit_id);
    }
    candidate.size_bytes     = total;
    candidate.content_digest = hasher.HexDigest();
  }

  const auto mtime = fs::last_write_time(path, ec);
  if (!ec) {
    candidate.last_modified_at_ms = util::ToUnixMillis(
        std::chrono::time_point_cast<util::Clock::duration>(std::chrono::file_clock::to_sys(mtime)));
  }
  return CandidateOutcome::Ok(std::move(candidate));
}

} // namespace ure::ingest
