#include "payload_json.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <cmath>
#include <cstdint>

#include "internal/observability/logging.hpp"

namespace accessres::wire {

using accessres::model::AccessFormat;
using accessres::model::AccessMode;
using accessres::model::AccessPayload;
using accessres::model::HeaderMap;

namespace {

std::string_view LocatorKey(AccessMode mode) {
  switch (mode) {
    case AccessMode::kStream:
    case AccessMode::kFile:
      return "uri";
    case AccessMode::kEmbed:
      return "embed";
    case AccessMode::kOpenWeb:
      return "openWeb";
  }
  return "uri";
}

std::optional<std::string> ToJson(const google::protobuf::Struct& as_struct) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(as_struct, &json);
  if (!status.ok()) {
    ACCESSRES_LOG_ERROR("Failed to serialize JSON", {accessres::observability::StringField("error", std::string(status.message()))});
    return std::nullopt;
  }
  return json;
}

std::optional<google::protobuf::Struct> ParseStruct(std::string_view json) {
  google::protobuf::Struct as_struct;
  auto status = google::protobuf::util::JsonStringToMessage(google::protobuf::StringPiece(json.data(), json.size()), &as_struct);
  if (!status.ok()) {
    return std::nullopt;
  }
  return as_struct;
}

const google::protobuf::Value* Field(const google::protobuf::Struct& as_struct, const std::string& key) {
  auto it = as_struct.fields().find(key);
  if (it == as_struct.fields().end() || it->second.kind_case() == google::protobuf::Value::kNullValue) {
    return nullptr;
  }
  return &it->second;
}

bool ReadString(const google::protobuf::Struct& as_struct, const std::string& key, std::optional<std::string>* out) {
  const auto* value = Field(as_struct, key);
  if (value == nullptr) {
    return true;
  }
  if (value->kind_case() != google::protobuf::Value::kStringValue) {
    return false;
  }
  *out = value->string_value();
  return true;
}

bool ReadUnsigned(const google::protobuf::Struct& as_struct, const std::string& key, std::optional<std::uint64_t>* out) {
  const auto* value = Field(as_struct, key);
  if (value == nullptr) {
    return true;
  }
  auto number = ExactUnsigned(*value);
  if (!number) {
    return false;
  }
  *out = *number;
  return true;
}

bool ReadStringMap(const google::protobuf::Struct& as_struct, HeaderMap* out) {
  for (const auto& [key, value] : as_struct.fields()) {
    if (value.kind_case() != google::protobuf::Value::kStringValue) {
      return false;
    }
    (*out)[key] = value.string_value();
  }
  return true;
}

void WriteStringMap(const HeaderMap& headers, google::protobuf::Struct* out) {
  for (const auto& [key, value] : headers) {
    (*out->mutable_fields())[key].set_string_value(value);
  }
}

} // namespace

std::optional<std::uint64_t> ExactUnsigned(const google::protobuf::Value& value) {
  if (value.kind_case() != google::protobuf::Value::kNumberValue) {
    return std::nullopt;
  }
  const double number = value.number_value();
  if (!std::isfinite(number) || number < 0 || number > kMaxExactInteger || std::floor(number) != number) {
    return std::nullopt;
  }
  return static_cast<std::uint64_t>(number);
}

std::string PayloadToJson(const AccessPayload& payload) {
  google::protobuf::Struct as_struct;
  auto&                    fields = *as_struct.mutable_fields();

  fields["mode"].set_string_value(std::string(accessres::model::ToString(payload.mode())));
  fields["format"].set_string_value(std::string(accessres::model::ToString(payload.format())));
  fields[std::string(LocatorKey(payload.mode()))].set_string_value(payload.Locator());

  const auto& attributes = payload.attributes();
  if (!attributes.headers.empty()) {
    WriteStringMap(attributes.headers, fields["headers"].mutable_struct_value());
  }
  if (attributes.expires_at_ms) {
    fields["expiresAt"].set_number_value(static_cast<double>(*attributes.expires_at_ms));
  }
  if (attributes.quality) {
    fields["quality"].set_string_value(*attributes.quality);
  }
  if (attributes.bitrate) {
    fields["bitrate"].set_number_value(static_cast<double>(*attributes.bitrate));
  }

  return ToJson(as_struct).value_or("{}");
}

std::optional<AccessPayload> PayloadFromJson(std::string_view json) {
  auto as_struct = ParseStruct(json);
  if (!as_struct) {
    return std::nullopt;
  }

  std::optional<std::string> mode_text;
  std::optional<std::string> format_text;
  if (!ReadString(*as_struct, "mode", &mode_text) || !ReadString(*as_struct, "format", &format_text) || !mode_text || !format_text) {
    return std::nullopt;
  }

  const auto mode   = accessres::model::ParseAccessMode(*mode_text);
  const auto format = accessres::model::ParseAccessFormat(*format_text);
  if (!mode || !format) {
    return std::nullopt;
  }

  std::optional<std::string> locator;
  if (!ReadString(*as_struct, std::string(LocatorKey(*mode)), &locator) || !locator || locator->empty()) {
    return std::nullopt;
  }

  AccessPayload::Attributes attributes;
  if (const auto* headers = Field(*as_struct, "headers")) {
    if (headers->kind_case() != google::protobuf::Value::kStructValue || !ReadStringMap(headers->struct_value(), &attributes.headers)) {
      return std::nullopt;
    }
  }
  if (!ReadUnsigned(*as_struct, "expiresAt", &attributes.expires_at_ms) || !ReadString(*as_struct, "quality", &attributes.quality) ||
      !ReadUnsigned(*as_struct, "bitrate", &attributes.bitrate)) {
    return std::nullopt;
  }

  switch (*mode) {
    case AccessMode::kStream:
      return AccessPayload::Stream(*format, std::move(*locator), std::move(attributes));
    case AccessMode::kFile:
      return AccessPayload::File(*format, std::move(*locator), std::move(attributes));
    case AccessMode::kEmbed:
      return AccessPayload::Embed(*format, std::move(*locator), std::move(attributes));
    case AccessMode::kOpenWeb:
      return AccessPayload::OpenWeb(*format, std::move(*locator), std::move(attributes));
  }
  return std::nullopt;
}

std::string HeadersToJson(const HeaderMap& headers) {
  google::protobuf::Struct as_struct;
  WriteStringMap(headers, &as_struct);
  return ToJson(as_struct).value_or("{}");
}

std::optional<HeaderMap> HeadersFromJson(std::string_view json) {
  auto as_struct = ParseStruct(json);
  if (!as_struct) {
    return std::nullopt;
  }

  HeaderMap headers;
  if (!ReadStringMap(*as_struct, &headers)) {
    return std::nullopt;
  }
  return headers;
}

} // namespace accessres::wire
