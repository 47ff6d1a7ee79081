#pragma once

#include <string>

#include "internal/model/resolution.hpp"

namespace accessres::render {

// Write-only receipt channel. Implementations must swallow their own
// transport failures; a receipt never blocks or fails a resolution.
class ReceiptSink {
 public:
  virtual ~ReceiptSink() = default;

  virtual void LogReceipt(const accessres::model::AccessReceipt& receipt, const std::string& identity) = 0;
};

} // namespace accessres::render
