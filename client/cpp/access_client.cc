#include "client/cpp/access_client.h"

#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <utility>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/wire/proto_convert.hpp"

namespace accessres::client {

namespace v1 = accessres::resolver::v1;

using accessres::observability::IntField;
using accessres::observability::StringField;
using accessres::observability::UintField;

namespace {

constexpr char kIdentityMetadataKey[] = "x-wallet-address";

// Records count and latency for one RPC route.
class FetchTimer {
 public:
  explicit FetchTimer(std::string_view route) : route_(route), start_(std::chrono::steady_clock::now()) {}

  void Finish(bool success) const {
    const auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start_).count();
    accessres::observability::Metrics::Instance().RecordFetch(route_, success);
    accessres::observability::Metrics::Instance().ObserveFetchLatencyMs(route_, elapsed);
  }

 private:
  std::string_view                      route_;
  std::chrono::steady_clock::time_point start_;
};

void LogRpcFailure(std::string_view route, const grpc::Status& status, std::string_view item_id = {}) {
  ACCESSRES_LOG_WARN("Access RPC failed", {StringField("route", route), StringField("item_id", item_id),
                                        IntField("code", static_cast<int>(status.error_code())),
                                        StringField("error", status.error_message())});
}

} // namespace

AccessClient::AccessClient(std::shared_ptr<grpc::Channel> channel, Options options)
    : channel_(std::move(channel)),
      resolution_stub_(v1::AccessResolutionService::NewStub(channel_)),
      lane_stub_(v1::AccessLaneService::NewStub(channel_)),
      options_(options) {
}

std::shared_ptr<grpc::Channel> AccessClient::CreateChannel(const accessres::runtime::config::ClientConfig& config) {
  auto credentials = config.use_tls() ? grpc::SslCredentials(grpc::SslCredentialsOptions()) : grpc::InsecureChannelCredentials();
  return grpc::CreateChannel(config.endpoint(), credentials);
}

AccessClient::Options AccessClient::OptionsFromConfig(const accessres::runtime::config::ClientConfig& config) {
  Options options;
  if (config.request_timeout_ms() > 0) {
    options.request_timeout = std::chrono::milliseconds(config.request_timeout_ms());
  }
  return options;
}

void AccessClient::SetDeadline(grpc::ClientContext* context) const {
  context->set_deadline(std::chrono::system_clock::now() + options_.request_timeout);
}

std::optional<accessres::model::AccessResolution> AccessClient::FetchAccessManifest(const std::string& item_id) {
  v1::GetAccessRequest request;
  request.set_item_id(item_id);
  v1::AccessResolution response;
  grpc::ClientContext  ctx;
  SetDeadline(&ctx);

  FetchTimer timer("access");
  auto       status = resolution_stub_->GetAccess(&ctx, request, &response);
  if (!status.ok()) {
    timer.Finish(false);
    LogRpcFailure("access", status, item_id);
    return std::nullopt;
  }

  auto resolution = accessres::wire::ResolutionFromProto(response);
  timer.Finish(resolution.has_value());
  if (!resolution) {
    ACCESSRES_LOG_WARN("Unusable access manifest", {StringField("item_id", item_id)});
  }
  return resolution;
}

std::optional<accessres::model::GradedResolution> AccessClient::FetchGradedAccessManifest(const std::string& item_id) {
  v1::GetAccessRequest request;
  request.set_item_id(item_id);
  v1::GradedAccessResolution response;
  grpc::ClientContext        ctx;
  SetDeadline(&ctx);

  FetchTimer timer("graded");
  auto       status = resolution_stub_->GetGradedAccess(&ctx, request, &response);
  if (!status.ok()) {
    timer.Finish(false);
    LogRpcFailure("graded", status, item_id);
    return std::nullopt;
  }

  auto graded = accessres::wire::GradedFromProto(response);
  timer.Finish(graded.has_value());
  if (!graded) {
    ACCESSRES_LOG_WARN("Unusable graded manifest", {StringField("item_id", item_id)});
  }
  return graded;
}

accessres::model::BatchAccessResponse AccessClient::BatchFetchAccessManifests(const accessres::model::BatchAccessRequest& request) {
  v1::BatchGetAccessRequest proto_request;
  for (const auto& item_id : request.item_ids) {
    proto_request.add_item_ids(item_id);
  }
  proto_request.set_priority(accessres::wire::PriorityToProto(request.priority));

  v1::BatchGetAccessResponse response;
  grpc::ClientContext        ctx;
  SetDeadline(&ctx);

  accessres::model::BatchAccessResponse out;
  FetchTimer                         timer("batch");
  auto                               status = resolution_stub_->BatchGetAccess(&ctx, proto_request, &response);
  timer.Finish(status.ok());
  if (!status.ok()) {
    LogRpcFailure("batch", status);
    for (const auto& item_id : request.item_ids) {
      out.errors.push_back({item_id, status.error_message()});
    }
    return out;
  }

  for (const auto& result : response.results()) {
    auto converted = accessres::wire::BatchResultFromProto(result);
    if (!converted) {
      out.errors.push_back({result.item_id(), "unusable access manifest"});
      continue;
    }
    out.results.push_back(std::move(*converted));
  }
  for (const auto& error : response.errors()) {
    out.errors.push_back({error.item_id(), error.error()});
  }
  ACCESSRES_LOG_DEBUG("Batch access resolved", {UintField("results", out.results.size()), UintField("errors", out.errors.size())});
  return out;
}

void AccessClient::LogReceipt(const accessres::model::AccessReceipt& receipt, const std::string& identity) {
  struct Call {
    grpc::ClientContext    ctx;
    v1::LogReceiptRequest  request;
    v1::LogReceiptResponse response;
  };

  auto call = std::make_shared<Call>();
  *call->request.mutable_receipt() = accessres::wire::ReceiptToProto(receipt);
  call->ctx.AddMetadata(kIdentityMetadataKey, identity);
  SetDeadline(&call->ctx);

  resolution_stub_->async()->LogReceipt(&call->ctx, &call->request, &call->response, [call](grpc::Status status) {
    if (!status.ok()) {
      LogRpcFailure("receipt", status, call->request.receipt().item_id());
      return;
    }
    ACCESSRES_LOG_DEBUG("Access receipt logged",
                     {StringField("receipt_id", call->response.receipt_id()), StringField("item_id", call->request.receipt().item_id())});
  });
}

std::optional<accessres::lane::SessionLanes> AccessClient::Handshake(const std::vector<std::string>& features) {
  v1::HandshakeRequest request;
  for (const auto& feature : features) {
    request.add_features(feature);
  }
  v1::HandshakeResponse response;
  grpc::ClientContext   ctx;
  SetDeadline(&ctx);

  FetchTimer timer("handshake");
  auto       status = lane_stub_->Handshake(&ctx, request, &response);
  timer.Finish(status.ok());
  if (!status.ok()) {
    LogRpcFailure("handshake", status);
    return std::nullopt;
  }

  accessres::lane::SessionLanes lanes;
  lanes.session_id            = response.session_id();
  lanes.expires_at_ms         = response.expires_at_ms();
  lanes.heartbeat_interval_ms = response.heartbeat_interval_ms();
  for (const auto& lane : response.lanes()) {
    lanes.lanes.push_back({lane.name(), lane.url()});
  }
  lanes.features.assign(response.features().begin(), response.features().end());

  ACCESSRES_LOG_INFO("Push session established", {StringField("session_id", lanes.session_id), UintField("lanes", lanes.lanes.size())});
  return lanes;
}

std::unique_ptr<grpc::ClientReader<v1::LaneChunk>> AccessClient::OpenLane(const std::string& session_id, const std::string& lane,
                                                                          grpc::ClientContext* context) const {
  v1::SubscribeLaneRequest request;
  request.set_session_id(session_id);
  request.set_lane(lane);
  return lane_stub_->SubscribeLane(context, request);
}

} // namespace accessres::client
