#pragma once

#include <grpcpp/channel.h>
#include <grpcpp/client_context.h>
#include <grpcpp/support/sync_stream.h>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "accessres/resolver/v1.hpp"
#include "internal/fetch/access_fetcher.hpp"
#include "internal/lane/session_lanes.hpp"

namespace accessres::runtime::config {
class ClientConfig;
}

namespace accessres::client {

/*
  gRPC client for the resolution and lane services.

  Transport failures are logged and turned into the fetcher sentinels;
  nothing here throws on a failed call.
*/
class AccessClient : public accessres::fetch::AccessFetcher {
 public:
  struct Options {
    std::chrono::milliseconds request_timeout{5000};
  };

  explicit AccessClient(std::shared_ptr<grpc::Channel> channel, Options options = {});

  static std::shared_ptr<grpc::Channel> CreateChannel(const accessres::runtime::config::ClientConfig& config);
  static Options                        OptionsFromConfig(const accessres::runtime::config::ClientConfig& config);

  std::optional<accessres::model::AccessResolution> FetchAccessManifest(const std::string& item_id) override;
  std::optional<accessres::model::GradedResolution> FetchGradedAccessManifest(const std::string& item_id) override;
  accessres::model::BatchAccessResponse             BatchFetchAccessManifests(const accessres::model::BatchAccessRequest& request) override;

  // Returns immediately; the outcome is only logged.
  void LogReceipt(const accessres::model::AccessReceipt& receipt, const std::string& identity) override;

  std::optional<accessres::lane::SessionLanes> Handshake(const std::vector<std::string>& features = {});

  // Raw chunk stream of one lane. The caller owns `context` (no deadline is
  // set) and cancels it to stop reading.
  std::unique_ptr<grpc::ClientReader<accessres::resolver::v1::LaneChunk>> OpenLane(const std::string& session_id, const std::string& lane,
                                                                                grpc::ClientContext* context) const;

 private:
  void SetDeadline(grpc::ClientContext* context) const;

  std::shared_ptr<grpc::Channel>                                       channel_;
  std::unique_ptr<accessres::resolver::v1::AccessResolutionService::Stub> resolution_stub_;
  std::unique_ptr<accessres::resolver::v1::AccessLaneService::Stub>       lane_stub_;
  Options                                                              options_;
};

} // namespace accessres::client
