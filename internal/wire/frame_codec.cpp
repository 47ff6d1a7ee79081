#include "frame_codec.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <limits>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/base64.hpp"
#include "internal/util/checksum.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "payload_json.hpp"

namespace accessres::wire {

using accessres::model::AccessFrame;
using accessres::model::AccessPayload;
using accessres::model::FrameFlag;
using accessres::model::FrameFlags;
using accessres::observability::StringField;

namespace {

constexpr std::size_t kTimestampBytes = 8;
constexpr std::size_t kChecksumBytes  = 4;

class ByteWriter {
 public:
  void U8(std::uint8_t value) { out_.push_back(static_cast<char>(value)); }

  void U16(std::uint16_t value) {
    U8(static_cast<std::uint8_t>(value & 0xFF));
    U8(static_cast<std::uint8_t>(value >> 8));
  }

  void U32(std::uint32_t value) {
    for (int shift = 0; shift < 32; shift += 8) {
      U8(static_cast<std::uint8_t>((value >> shift) & 0xFF));
    }
  }

  void Bytes(std::string_view bytes) { out_.append(bytes.data(), bytes.size()); }

  void Section(std::string_view name, std::string_view json) {
    if (json.size() > std::numeric_limits<std::uint32_t>::max()) {
      throw accessres::util::InvalidArgument(std::string(name) + " section exceeds 4 GiB");
    }
    U32(static_cast<std::uint32_t>(json.size()));
    Bytes(json);
  }

  const std::string& data() const { return out_; }
  std::string        Take() { return std::move(out_); }

 private:
  std::string out_;
};

class ByteReader {
 public:
  explicit ByteReader(std::string_view bytes) : bytes_(bytes) {}

  std::size_t offset() const { return offset_; }
  std::size_t remaining() const { return bytes_.size() - offset_; }

  std::uint8_t U8() { return static_cast<std::uint8_t>(bytes_[offset_++]); }

  std::uint16_t U16() {
    const std::uint16_t low  = U8();
    const std::uint16_t high = U8();
    return static_cast<std::uint16_t>(low | (high << 8));
  }

  std::uint32_t U32() {
    std::uint32_t value = 0;
    for (int shift = 0; shift < 32; shift += 8) {
      value |= static_cast<std::uint32_t>(U8()) << shift;
    }
    return value;
  }

  std::string_view Bytes(std::size_t count) {
    auto view = bytes_.substr(offset_, count);
    offset_ += count;
    return view;
  }

  // Length-prefixed section; nullopt when the prefix or body overruns.
  std::optional<std::string_view> Section() {
    if (remaining() < 4) {
      return std::nullopt;
    }
    const std::size_t length = U32();
    if (remaining() < length) {
      return std::nullopt;
    }
    return Bytes(length);
  }

 private:
  std::string_view bytes_;
  std::size_t      offset_{0};
};

std::optional<AccessFrame> Reject(std::string_view reason, std::string_view item_id = {}) {
  ACCESSRES_LOG_WARN("Dropping undecodable access frame", {StringField("reason", reason), StringField("item_id", item_id)});
  return std::nullopt;
}

std::string TrimWhitespace(std::string_view text) {
  const auto begin = text.find_first_not_of(" \t\r\n");
  if (begin == std::string_view::npos) {
    return {};
  }
  const auto end = text.find_last_not_of(" \t\r\n");
  return std::string(text.substr(begin, end - begin + 1));
}

std::optional<AccessPayload> DecodePayloadSection(ByteReader* reader) {
  auto section = reader->Section();
  if (!section) {
    return std::nullopt;
  }
  return PayloadFromJson(*section);
}

std::optional<AccessPayload> DecodeCompactPayload(const google::protobuf::Struct& compact, const std::string& key, bool* malformed) {
  auto it = compact.fields().find(key);
  if (it == compact.fields().end() || it->second.kind_case() == google::protobuf::Value::kNullValue) {
    return std::nullopt;
  }
  if (it->second.kind_case() != google::protobuf::Value::kStringValue || it->second.string_value().empty()) {
    *malformed = true;
    return std::nullopt;
  }
  auto json = accessres::util::Base64Decode(it->second.string_value());
  if (!json) {
    *malformed = true;
    return std::nullopt;
  }
  auto payload = PayloadFromJson(*json);
  if (!payload) {
    *malformed = true;
  }
  return payload;
}

} // namespace

std::string_view ToString(FrameEncoding encoding) {
  switch (encoding) {
    case FrameEncoding::kBinary:
      return "binary";
    case FrameEncoding::kCompact:
      return "compact";
  }
  return "binary";
}

std::string EncodeFrame(const AccessFrame& frame) {
  if (frame.item_id.size() > std::numeric_limits<std::uint16_t>::max()) {
    throw accessres::util::InvalidArgument("item id exceeds 65535 bytes");
  }

  const FrameFlags flags = frame.flags.With(FrameFlag::kHasAccess, frame.access.has_value())
                               .With(FrameFlag::kHasFallback, frame.fallback.has_value())
                               .With(FrameFlag::kHasHeaders, frame.headers.has_value());

  ByteWriter writer;
  writer.U8(frame.version);
  writer.U8(flags.bits());
  writer.U16(static_cast<std::uint16_t>(frame.item_id.size()));
  writer.U8(accessres::model::ToCode(frame.readiness));
  writer.Bytes(frame.item_id);

  if (frame.access) {
    writer.Section("access", PayloadToJson(*frame.access));
  }
  if (frame.fallback) {
    writer.Section("fallback", PayloadToJson(*frame.fallback));
  }
  if (frame.headers) {
    writer.Section("headers", HeadersToJson(*frame.headers));
  }

  writer.U32(static_cast<std::uint32_t>(frame.timestamp_ms & 0xFFFFFFFFull));
  writer.U32(static_cast<std::uint32_t>(frame.timestamp_ms >> 32));
  writer.U32(accessres::util::Crc32(writer.data()));
  return writer.Take();
}

std::string EncodeFrameBase64(const AccessFrame& frame) {
  return accessres::util::Base64Encode(EncodeFrame(frame));
}

std::string EncodeCompactFrame(const AccessFrame& frame) {
  google::protobuf::Struct compact;
  auto&                    fields = *compact.mutable_fields();

  fields["id"].set_string_value(frame.item_id);
  fields["r"].set_number_value(accessres::model::ToCode(frame.readiness));
  if (frame.access) {
    fields["a"].set_string_value(accessres::util::Base64Encode(PayloadToJson(*frame.access)));
  }
  if (frame.fallback) {
    fields["f"].set_string_value(accessres::util::Base64Encode(PayloadToJson(*frame.fallback)));
  }
  fields["t"].set_number_value(static_cast<double>(frame.timestamp_ms));

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(compact, &json);
  if (!status.ok()) {
    throw accessres::util::InvalidArgument("compact frame serialization failed: " + std::string(status.message()));
  }
  return json;
}

std::optional<AccessFrame> DecodeFrame(std::string_view bytes, std::uint64_t now_ms) {
  if (bytes.size() < kMinFrameBytes) {
    return Reject("frame too short");
  }

  ByteReader  reader(bytes);
  AccessFrame frame;

  frame.version = reader.U8();
  if (frame.version != accessres::model::kFrameVersion) {
    return Reject("unsupported version");
  }
  frame.flags = FrameFlags(reader.U8());

  const std::size_t item_id_length = reader.U16();
  const auto        readiness      = accessres::model::ReadinessFromCode(reader.U8());
  if (!readiness) {
    return Reject("unknown readiness code");
  }
  frame.readiness = *readiness;

  if (reader.remaining() < item_id_length) {
    return Reject("item id overruns frame");
  }
  frame.item_id = std::string(reader.Bytes(item_id_length));
  if (frame.item_id.empty()) {
    return Reject("empty item id");
  }

  if (frame.flags.Has(FrameFlag::kHasAccess)) {
    frame.access = DecodePayloadSection(&reader);
    if (!frame.access) {
      return Reject("bad access section", frame.item_id);
    }
  }
  if (frame.flags.Has(FrameFlag::kHasFallback)) {
    frame.fallback = DecodePayloadSection(&reader);
    if (!frame.fallback) {
      return Reject("bad fallback section", frame.item_id);
    }
  }
  if (frame.flags.Has(FrameFlag::kHasHeaders)) {
    auto section = reader.Section();
    if (section) {
      frame.headers = HeadersFromJson(*section);
    }
    if (!frame.headers) {
      return Reject("bad headers section", frame.item_id);
    }
  }

  // A partial trailer leaves the frame usable: under 8 bytes the timestamp
  // defaults to now, under 12 the checksum is skipped. Bytes past a full
  // trailer are ignored.
  if (reader.remaining() < kTimestampBytes) {
    frame.timestamp_ms = now_ms;
    frame.truncated    = true;
    return frame;
  }

  const std::uint64_t low  = reader.U32();
  const std::uint64_t high = reader.U32();
  frame.timestamp_ms       = (high << 32) | low;

  if (reader.remaining() < kChecksumBytes) {
    frame.truncated = true;
    return frame;
  }

  const std::size_t covered = reader.offset();
  frame.checksum            = reader.U32();
  frame.is_valid            = accessres::util::Crc32(bytes.substr(0, covered)) == frame.checksum;
  return frame;
}

std::optional<AccessFrame> DecodeFrame(std::string_view bytes) {
  return DecodeFrame(bytes, accessres::util::NowMillis());
}

std::optional<AccessFrame> DecodeFrameBase64(std::string_view text, std::uint64_t now_ms) {
  auto bytes = accessres::util::Base64Decode(text);
  if (!bytes) {
    return Reject("invalid base64");
  }
  return DecodeFrame(*bytes, now_ms);
}

std::optional<AccessFrame> DecodeFrameBase64(std::string_view text) {
  return DecodeFrameBase64(text, accessres::util::NowMillis());
}

std::optional<AccessFrame> DecodeCompactFrame(std::string_view json) {
  google::protobuf::Struct compact;
  auto status = google::protobuf::util::JsonStringToMessage(google::protobuf::StringPiece(json.data(), json.size()), &compact);
  if (!status.ok()) {
    return Reject("malformed compact json");
  }

  const auto& fields = compact.fields();
  auto        id     = fields.find("id");
  if (id == fields.end() || id->second.kind_case() != google::protobuf::Value::kStringValue || id->second.string_value().empty()) {
    return Reject("compact frame without id");
  }

  auto r = fields.find("r");
  if (r == fields.end()) {
    return Reject("compact frame without readiness", id->second.string_value());
  }
  auto code      = ExactUnsigned(r->second);
  auto readiness = code ? accessres::model::ReadinessFromCode(*code) : std::nullopt;
  if (!readiness) {
    return Reject("unknown readiness code", id->second.string_value());
  }

  auto t         = fields.find("t");
  auto timestamp = t == fields.end() ? std::nullopt : ExactUnsigned(t->second);
  if (!timestamp) {
    return Reject("compact frame without timestamp", id->second.string_value());
  }

  bool malformed = false;
  auto access    = DecodeCompactPayload(compact, "a", &malformed);
  auto fallback  = DecodeCompactPayload(compact, "f", &malformed);
  if (malformed) {
    return Reject("bad compact payload", id->second.string_value());
  }

  return accessres::model::MakeFrame(id->second.string_value(), *readiness, std::move(access), std::move(fallback), *timestamp);
}

FrameEncoding DetectEncoding(std::string_view line) {
  const auto first = line.find_first_not_of(" \t\r\n");
  return first != std::string_view::npos && line[first] == '{' ? FrameEncoding::kCompact : FrameEncoding::kBinary;
}

std::optional<AccessFrame> DecodeLine(std::string_view line, std::uint64_t now_ms) {
  const std::string trimmed  = TrimWhitespace(line);
  const auto        encoding = DetectEncoding(trimmed);

  auto frame = encoding == FrameEncoding::kCompact ? DecodeCompactFrame(trimmed) : DecodeFrameBase64(trimmed, now_ms);
  accessres::observability::Metrics::Instance().RecordDecode(ToString(encoding), frame.has_value());
  return frame;
}

std::optional<AccessFrame> DecodeLine(std::string_view line) {
  return DecodeLine(line, accessres::util::NowMillis());
}

} // namespace accessres::wire
