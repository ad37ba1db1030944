#include <cassert>
#include <cstddef>
#include <iostream>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "internal/util/digest.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace {

void TestSha256IsStableLowercaseHex() {
  assert(ure::util::Sha256Hex("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  assert(ure::util::Sha256Hex("") == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");

  assert(ure::util::IsSha256Hex(ure::util::Sha256Hex("payload")));
  assert(!ure::util::IsSha256Hex("BA7816BF8F01CFEA414140DE5DAE2223B00361A396177A9CB410FF61F20015AD"));
  assert(!ure::util::IsSha256Hex("abc"));
}

void TestIncrementalSha256MatchesOneShot() {
  std::string body;
  for (int i = 0; i < 5000; ++i) {
    body += static_cast<char>('a' + i % 26);
  }

  for (std::size_t chunk : {std::size_t{1}, std::size_t{7}, std::size_t{4096}, body.size()}) {
    ure::util::Sha256Hasher hasher;
    for (std::size_t offset = 0; offset < body.size(); offset += chunk) {
      hasher.Update(std::string_view(body).substr(offset, chunk));
    }
    assert(hasher.HexDigest() == ure::util::Sha256Hex(body));
  }

  ure::util::Sha256Hasher empty;
  assert(empty.HexDigest() == ure::util::Sha256Hex(""));
}

void TestJsonValidation() {
  assert(ure::util::IsValidJson("{}"));
  assert(ure::util::IsValidJson("[1, 2, 3]"));
  assert(ure::util::IsValidJson("{\"a\": {\"b\": null}}"));
  assert(!ure::util::IsValidJson(""));
  assert(!ure::util::IsValidJson("{"));
  assert(!ure::util::IsValidJson("not json"));

  ure::util::RequireJsonOrNull("elaboration", std::nullopt);
  ure::util::RequireJsonOrNull("elaboration", std::string("{\"k\":1}"));

  bool threw = false;
  try {
    ure::util::RequireJsonOrNull("elaboration", std::string("{broken"));
  } catch (const ure::util::ValidationError& e) {
    threw = std::string(e.what()).find("elaboration") != std::string::npos;
  }
  assert(threw && "malformed structured payloads must be rejected naming the field");
}

void TestStringListsSurviveJson() {
  const std::vector<std::string> globs{"**/*.md", "docs/*.txt", "quote\"d"};
  const auto                     json = ure::util::ToJsonArray(globs);
  assert(ure::util::IsValidJson(json));
  assert(ure::util::FromJsonArray(json) == globs);
  assert(ure::util::FromJsonArray(std::nullopt).empty());

  bool threw = false;
  try {
    (void)ure::util::FromJsonArray(std::string("[1, 2]"));
  } catch (const ure::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
}

void TestJsonObjectParsing() {
  auto object = ure::util::ParseJsonObject(std::string("{\"duplicate\":true,\"uri\":\"a.md\"}"));
  assert(object.has_value());
  assert(object->fields().at("duplicate").bool_value());
  assert(object->fields().at("uri").string_value() == "a.md");

  assert(!ure::util::ParseJsonObject(std::string("[1]")).has_value());
  assert(!ure::util::ParseJsonObject(std::nullopt).has_value());

  assert(ure::util::JsonString("a\"b") == "\"a\\\"b\"");
}

void TestTimeFormatting() {
  assert(ure::util::FormatRfc3339(0) == "1970-01-01T00:00:00.000Z");
  assert(ure::util::FormatRfc3339(1709288130123ULL) == "2024-03-01T10:15:30.123Z");

  const auto now = ure::util::NowMs();
  assert(ure::util::ToUnixMillis(ure::util::FromUnixMillis(now)) == now);
}

void TestIdsAreUniqueCanonicalUuids() {
  std::set<std::string> seen;
  for (int i = 0; i < 256; ++i) {
    const auto id = ure::util::NewId();
    assert(id.size() == 36);
    assert(id[8] == '-' && id[13] == '-' && id[18] == '-' && id[23] == '-');
    assert(id[14] == '4');
    assert(ure::util::ToString(ure::util::FromString(id)) == id);
    seen.insert(id);
  }
  assert(seen.size() == 256);
}

} // namespace

int main() {
  TestSha256IsStableLowercaseHex();
  TestIncrementalSha256MatchesOneShot();
  TestJsonValidation();
  TestStringListsSurviveJson();
  TestJsonObjectParsing();
  TestTimeFormatting();
  TestIdsAreUniqueCanonicalUuids();

  std::cout << "ure_unit_util: pass\n";
  return 0;
}
