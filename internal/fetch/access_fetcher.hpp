#pragma once

#include <optional>
#include <string>

#include "internal/model/resolution.hpp"
#include "internal/render/receipt_sink.hpp"

namespace accessres::fetch {

/*
  Request/response side of resolution, used to bootstrap an item before any
  push frame arrives.

  Failures never throw: single fetches return nullopt ("no resolution") and
  a failed batch reports an error entry for every requested id.
*/
class AccessFetcher : public accessres::render::ReceiptSink {
 public:
  ~AccessFetcher() override = default;

  virtual std::optional<accessres::model::AccessResolution> FetchAccessManifest(const std::string& item_id) = 0;

  virtual std::optional<accessres::model::GradedResolution> FetchGradedAccessManifest(const std::string& item_id) = 0;

  virtual accessres::model::BatchAccessResponse BatchFetchAccessManifests(const accessres::model::BatchAccessRequest& request) = 0;
};

} // namespace accessres::fetch
