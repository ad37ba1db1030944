#pragma once

#include <memory>
#include <string>
#include <string_view>

namespace ure::util {

/*
  Content digests.

  The digest is the external identity of a resource's bytes, so the
  algorithm and encoding (SHA-256, lowercase hex) must never change.
*/

std::string Sha256Hex(std::string_view bytes);

// Incremental SHA-256 for inputs read in chunks.
class Sha256Hasher {
 public:
  Sha256Hasher();
  ~Sha256Hasher();

  Sha256Hasher(const Sha256Hasher&)            = delete;
  Sha256Hasher& operator=(const Sha256Hasher&) = delete;

  void Update(std::string_view bytes);

  // Lowercase hex digest of everything passed to Update. Call once.
  std::string HexDigest();

 private:
  struct Ctx;
  std::unique_ptr<Ctx> ctx_;
};

// True for a 64-char lowercase hex string.
bool IsSha256Hex(std::string_view digest);

} // namespace ure::util
