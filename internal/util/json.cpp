#include "json.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace ure::util {

bool IsValidJson(std::string_view text) {
  if (text.empty()) {
    return false;
  }

  google::protobuf::Value value;
  const auto status = google::protobuf::util::JsonStringToMessage(std::string(text), &value);
  return status.ok();
}

void RequireJsonOrNull(std::string_view field, const JsonText& value) {
  if (!value.has_value()) {
    return;
  }
  if (!IsValidJson(*value)) {
    throw ValidationError(std::string(field) + ": structured payload is not valid JSON");
  }
}

std::string ToJsonArray(const std::vector<std::string>& values) {
  google::protobuf::ListValue list;
  for (const auto& v : values) {
    list.add_values()->set_string_value(v);
  }

  std::string json;
  const auto  status = google::protobuf::util::MessageToJsonString(list, &json);
  if (!status.ok()) {
    throw std::runtime_error("serialize string list: " + status.ToString());
  }
  return json;
}

std::vector<std::string> FromJsonArray(const JsonText& text) {
  std::vector<std::string> out;
  if (!text.has_value() || text->empty()) {
    return out;
  }

  google::protobuf::ListValue list;
  const auto status = google::protobuf::util::JsonStringToMessage(*text, &list);
  if (!status.ok()) {
    throw ValidationError("string list is not a JSON array: " + status.ToString());
  }

  out.reserve(static_cast<size_t>(list.values_size()));
  for (const auto& v : list.values()) {
    if (v.kind_case() != google::protobuf::Value::kStringValue) {
      throw ValidationError("string list contains a non-string element");
    }
    out.push_back(v.string_value());
  }
  return out;
}

std::string ToJson(const google::protobuf::Struct& object) {
  std::string json;
  const auto  status = google::protobuf::util::MessageToJsonString(object, &json);
  if (!status.ok()) {
    throw std::runtime_error("serialize structured payload: " + status.ToString());
  }
  return json;
}

std::optional<google::protobuf::Struct> ParseJsonObject(const JsonText& text) {
  if (!text.has_value() || text->empty()) {
    return std::nullopt;
  }

  google::protobuf::Struct object;
  if (!google::protobuf::util::JsonStringToMessage(*text, &object).ok()) {
    return std::nullopt;
  }
  return object;
}

std::string JsonString(std::string_view value) {
  google::protobuf::Value v;
  v.set_string_value(std::string(value));

  std::string json;
  const auto  status = google::protobuf::util::MessageToJsonString(v, &json);
  if (!status.ok()) {
    throw std::runtime_error("serialize string: " + status.ToString());
  }
  return json;
}

} // namespace ure::util
