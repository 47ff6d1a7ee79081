#include "frame_stream_parser.hpp"

#include <exception>
#include <utility>
#include <vector>

#include "frame_codec.hpp"
#include "internal/observability/logging.hpp"

namespace accessres::wire {

using accessres::observability::StringField;
using accessres::observability::UintField;

namespace {

constexpr std::string_view kDataField = "data:";

std::string_view Trim(std::string_view text) {
  const auto begin = text.find_first_not_of(" \t\r\n");
  if (begin == std::string_view::npos) {
    return {};
  }
  const auto end = text.find_last_not_of(" \t\r\n");
  return text.substr(begin, end - begin + 1);
}

bool IsIgnoredSseField(std::string_view line) {
  return line.front() == ':' || line.starts_with("event:") || line.starts_with("id:") || line.starts_with("retry:");
}

} // namespace

FrameStreamParser::Token FrameStreamParser::Subscribe(FrameHandler handler) {
  const Token token = next_token_++;
  handlers_.emplace(token, std::move(handler));
  return token;
}

bool FrameStreamParser::Unsubscribe(Token token) {
  return handlers_.erase(token) > 0;
}

std::size_t FrameStreamParser::Feed(std::string_view chunk) {
  buffer_.append(chunk.data(), chunk.size());

  const auto last_newline = buffer_.rfind('\n');
  if (last_newline == std::string::npos) {
    return 0;
  }
  // Detach the complete lines first; handlers may call back into Feed.
  const std::string complete = buffer_.substr(0, last_newline);
  buffer_.erase(0, last_newline + 1);

  std::size_t      delivered = 0;
  std::string_view rest(complete);
  while (true) {
    const auto newline = rest.find('\n');
    if (FeedLine(rest.substr(0, newline))) {
      ++delivered;
    }
    if (newline == std::string_view::npos) {
      break;
    }
    rest.remove_prefix(newline + 1);
  }
  return delivered;
}

bool FrameStreamParser::FeedLine(std::string_view line) {
  line = Trim(line);
  if (line.empty() || IsIgnoredSseField(line)) {
    return false;
  }
  if (line.starts_with(kDataField)) {
    line = Trim(line.substr(kDataField.size()));
    if (line.empty()) {
      return false;
    }
  }

  auto frame = DecodeLine(line);
  if (!frame) {
    return false;
  }
  Emit(*frame);
  return true;
}

void FrameStreamParser::Reset() {
  buffer_.clear();
}

void FrameStreamParser::Emit(const accessres::model::AccessFrame& frame) {
  // Snapshot tokens so handlers can unsubscribe themselves or others mid-delivery.
  std::vector<Token> tokens;
  tokens.reserve(handlers_.size());
  for (const auto& [token, handler] : handlers_) {
    tokens.push_back(token);
  }

  for (Token token : tokens) {
    auto it = handlers_.find(token);
    if (it == handlers_.end()) {
      continue;
    }
    FrameHandler handler = it->second;
    try {
      handler(frame);
    } catch (const std::exception& e) {
      ACCESSRES_LOG_ERROR("Access frame handler failed",
                          {UintField("handler", token), StringField("item_id", frame.item_id), StringField("error", e.what())});
    } catch (...) {
      ACCESSRES_LOG_ERROR("Access frame handler failed",
                          {UintField("handler", token), StringField("item_id", frame.item_id), StringField("error", "non-standard exception")});
    }
  }
}

} // namespace accessres::wire
