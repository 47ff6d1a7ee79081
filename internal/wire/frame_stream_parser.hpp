#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>

#include "internal/model/access_frame.hpp"

namespace accessres::wire {

using FrameHandler = std::function<void(const accessres::model::AccessFrame&)>;

/*
  Reassembles frames from an appended push stream.

  Chunks are split on '\n'; the unterminated tail is kept for the next Feed.
  "data:" prefixes are stripped, blank lines, SSE comments (":...") and the
  other SSE fields (event:, id:, retry:) are skipped. Every decoded frame is
  delivered to each registered handler; a handler that throws is logged and
  the remaining handlers still run.

  Handlers may subscribe or unsubscribe from inside a callback. Not thread
  safe.
*/
class FrameStreamParser {
 public:
  using Token = std::uint64_t;

  Token Subscribe(FrameHandler handler);
  bool  Unsubscribe(Token token);

  // Returns the number of frames delivered.
  std::size_t Feed(std::string_view chunk);

  // Decodes one line as if it had arrived on the stream.
  bool FeedLine(std::string_view line);

  void Reset();

  std::size_t handler_count() const { return handlers_.size(); }
  std::size_t buffered_bytes() const { return buffer_.size(); }

 private:
  void Emit(const accessres::model::AccessFrame& frame);

  std::map<Token, FrameHandler> handlers_;
  Token                         next_token_{1};
  std::string                   buffer_;
};

} // namespace accessres::wire
