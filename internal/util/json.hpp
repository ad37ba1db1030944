#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <google/protobuf/struct.pb.h>

namespace ure::util {

/*
  Structured-attribute helpers.

  Structured columns (front-matter, diagnostics, args, transformations,
  elaboration, ...) are stored as JSON text. They must parse as JSON or be
  absent; shapes are not checked.

  Parsing goes through google.protobuf.Value, which maps to any JSON value.
*/

using JsonText = std::optional<std::string>;

bool IsValidJson(std::string_view text);

// Throws ValidationError naming `field` when `value` is set and not valid JSON.
void RequireJsonOrNull(std::string_view field, const JsonText& value);

// ["a","b"] for string lists (glob patterns, senders, ...).
std::string              ToJsonArray(const std::vector<std::string>& values);
std::vector<std::string> FromJsonArray(const JsonText& text);

std::string ToJson(const google::protobuf::Struct& object);

// nullopt when `text` is absent or not a JSON object.
std::optional<google::protobuf::Struct> ParseJsonObject(const JsonText& text);

// Quoted JSON string literal.
std::string JsonString(std::string_view value);

} // namespace ure::util
