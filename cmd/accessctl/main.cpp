#include <grpcpp/grpcpp.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "client/cpp/access_client.h"
#include "internal/config/config_loader.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/render/access_labels.hpp"
#include "internal/render/descriptor_dispatcher.hpp"
#include "internal/session/access_session.hpp"
#include "internal/util/time.hpp"
#include "internal/wire/frame_codec.hpp"
#include "internal/wire/payload_json.hpp"

using accessres::client::AccessClient;
using accessres::model::AccessPayload;
using accessres::model::Readiness;

static volatile std::sig_atomic_t g_running = 1;

static void HandleSignal(int) {
  g_running = 0;
}

static void Usage() {
  std::cout << "Usage:\n"
            << "  accessctl [--config <file.yaml>] get <item_id>\n"
            << "  accessctl [--config <file.yaml>] graded <item_id>\n"
            << "  accessctl [--config <file.yaml>] batch <item_id>...\n"
            << "  accessctl [--config <file.yaml>] watch <item_id>...\n"
            << "  accessctl decode <frame_line>\n"
            << "  accessctl encode <item_id> <PENDING|READY|DEGRADED> [access_json|-] [fallback_json|-] [--compact]\n";
}

static std::string Describe(const AccessPayload& payload) {
  std::string out = "mode=" + std::string(accessres::model::ToString(payload.mode())) +
                    " format=" + std::string(accessres::model::ToString(payload.format())) + " locator=" + payload.Locator();
  if (payload.attributes().quality) {
    out += " quality=" + *payload.attributes().quality;
  }
  return out;
}

static void PrintFrame(const accessres::model::AccessFrame& frame) {
  std::cout << "item=" << frame.item_id << " readiness=" << accessres::model::ToString(frame.readiness) << " ts=" << frame.timestamp_ms
            << " valid=" << (frame.is_valid ? "true" : "false") << " truncated=" << (frame.truncated ? "true" : "false")
            << " flags=0x" << std::hex << static_cast<int>(frame.flags.bits()) << std::dec << "\n";
  if (frame.access) {
    std::cout << "  access   " << Describe(*frame.access) << "\n";
  }
  if (frame.fallback) {
    std::cout << "  fallback " << Describe(*frame.fallback) << "\n";
  }
  if (frame.headers) {
    for (const auto& [key, value] : *frame.headers) {
      std::cout << "  header   " << key << ": " << value << "\n";
    }
  }
}

static void PrintResult(const std::string& item_id, const accessres::render::RenderResult* result) {
  if (result == nullptr) {
    std::cout << item_id << ": no render\n";
    return;
  }
  std::cout << item_id << ": render=" << accessres::render::ToString(result->type);
  if (result->element) {
    std::cout << " element=" << *result->element;
  }
  if (result->url) {
    std::cout << " url=" << *result->url;
  }
  if (result->error) {
    std::cout << " error=\"" << *result->error << "\"";
  }
  std::cout << "\n";
}

static int Decode(const std::string& line) {
  auto frame = accessres::wire::DecodeLine(line);
  if (!frame) {
    std::cerr << "undecodable frame\n";
    return 2;
  }
  PrintFrame(*frame);
  return frame->is_valid ? 0 : 3;
}

static std::optional<AccessPayload> PayloadArg(int argc, char** argv, int index, bool* ok) {
  if (index >= argc || std::string(argv[index]) == "-" || std::string(argv[index]) == "--compact") {
    return std::nullopt;
  }
  auto payload = accessres::wire::PayloadFromJson(argv[index]);
  if (!payload) {
    std::cerr << "invalid payload json: " << argv[index] << "\n";
    *ok = false;
  }
  return payload;
}

static int Encode(int argc, char** argv, int first) {
  if (argc < first + 2) {
    Usage();
    return 1;
  }

  const auto readiness = accessres::model::ParseReadiness(argv[first + 1]);
  if (!readiness) {
    std::cerr << "unknown readiness: " << argv[first + 1] << "\n";
    return 1;
  }

  bool ok       = true;
  auto primary  = PayloadArg(argc, argv, first + 2, &ok);
  auto fallback = PayloadArg(argc, argv, first + 3, &ok);
  if (!ok) {
    return 1;
  }

  bool compact = false;
  for (int i = first + 2; i < argc; ++i) {
    compact = compact || std::string(argv[i]) == "--compact";
  }

  auto frame = accessres::model::MakeFrame(argv[first], *readiness, std::move(primary), std::move(fallback), accessres::util::NowMillis());
  std::cout << (compact ? accessres::wire::EncodeCompactFrame(frame) : accessres::wire::EncodeFrameBase64(frame)) << "\n";
  return 0;
}

static int Watch(const accessres::runtime::config::RuntimeConfig& config, AccessClient& client, const std::vector<std::string>& item_ids) {
  std::vector<std::string> internal_hosts(config.policy().internal_hosts().begin(), config.policy().internal_hosts().end());
  accessres::render::DescriptorDispatcher dispatcher(std::move(internal_hosts), &client);

  accessres::readiness::AccessObserver observer;
  observer.on_readiness_change = [](const std::string& item_id, Readiness state) {
    std::cout << item_id << ": readiness=" << accessres::model::ToString(state) << "\n";
  };
  observer.on_upgrade_available = [](const std::string& item_id, const AccessPayload& candidate) {
    std::cout << item_id << ": upgrade available " << Describe(candidate) << "\n";
  };

  accessres::session::AccessSession session(accessres::session::SessionOptions::FromConfig(config), dispatcher, &client, std::move(observer));

  auto lanes = client.Handshake({"access-frames"});
  if (!lanes) {
    std::cerr << "handshake failed\n";
    return 2;
  }
  session.SetSessionLanes(*lanes);

  const auto lane_name = config.client().access_lane();
  if (!lanes->Find(lane_name)) {
    std::cerr << "session has no '" << lane_name << "' lane\n";
    return 2;
  }

  auto all_ready = [&] {
    for (const auto& item_id : item_ids) {
      if (session.GetReadinessState(item_id) != Readiness::kReady) {
        return false;
      }
    }
    return true;
  };

  for (const auto& item_id : item_ids) {
    if (!session.Bootstrap(item_id)) {
      std::cerr << item_id << ": no resolution\n";
      return 2;
    }
    PrintResult(item_id, session.CurrentResult(item_id));
  }
  if (all_ready()) {
    return 0;
  }

  grpc::ClientContext ctx;
  auto                reader = client.OpenLane(lanes->session_id, lane_name, &ctx);

  std::atomic<bool> done{false};
  std::thread       canceller([&] {
    while (!done.load() && g_running) {
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    ctx.TryCancel();
  });

  accessres::resolver::v1::LaneChunk chunk;
  while (reader->Read(&chunk)) {
    if (session.FeedLaneChunk(chunk.data()) > 0) {
      for (const auto& item_id : item_ids) {
        PrintResult(item_id, session.CurrentResult(item_id));
      }
    }
    if (all_ready()) {
      break;
    }
  }

  done.store(true);
  canceller.join();
  auto status = reader->Finish();
  if (!status.ok() && status.error_code() != grpc::StatusCode::CANCELLED) {
    std::cerr << status.error_message() << "\n";
    return 2;
  }
  return all_ready() ? 0 : 4;
}

int main(int argc, char** argv) {
  int         first = 1;
  std::string config_path;
  if (argc >= 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
    first       = 3;
  }
  if (argc <= first) {
    Usage();
    return 1;
  }

  const std::string cmd = argv[first++];

  try {
    auto config = config_path.empty() ? accessres::config::ConfigLoader::Defaults() : accessres::config::ConfigLoader::LoadFromYaml(config_path);
    accessres::observability::InitializeLogging(config);
    accessres::observability::InitializeMetrics(config);

    int rc = 1;

    // ------------------------------------------------------------
    // Offline commands
    // ------------------------------------------------------------

    if (cmd == "decode") {
      if (argc <= first) {
        Usage();
        return 1;
      }
      rc = Decode(argv[first]);
    } else if (cmd == "encode") {
      rc = Encode(argc, argv, first);
    } else {
      // ------------------------------------------------------------
      // Commands against the resolution service
      // ------------------------------------------------------------

      std::vector<std::string> item_ids(argv + first, argv + argc);
      if (item_ids.empty()) {
        Usage();
        return 1;
      }

      AccessClient client(AccessClient::CreateChannel(config.client()), AccessClient::OptionsFromConfig(config.client()));

      if (cmd == "get") {
        auto resolution = client.FetchAccessManifest(item_ids.front());
        if (resolution) {
          std::cout << resolution->item_id << " (" << accessres::model::ToString(resolution->item_type) << ") " << resolution->title << "\n"
                    << "  " << accessres::render::AccessLabel(resolution->access, resolution->item_type) << ": " << Describe(resolution->access)
                    << "\n";
          rc = 0;
        } else {
          std::cerr << "no resolution\n";
          rc = 2;
        }
      } else if (cmd == "graded") {
        auto graded = client.FetchGradedAccessManifest(item_ids.front());
        if (graded) {
          std::cout << graded->item_id << " readiness=" << accessres::model::ToString(graded->readiness);
          if (graded->upgrade_eta_ms) {
            std::cout << " eta_ms=" << *graded->upgrade_eta_ms;
          }
          std::cout << "\n";
          if (graded->access) {
            std::cout << "  access   " << Describe(*graded->access) << "\n";
          }
          if (graded->fallback) {
            std::cout << "  fallback " << Describe(*graded->fallback) << "\n";
          }
          rc = 0;
        } else {
          std::cerr << "no resolution\n";
          rc = 2;
        }
      } else if (cmd == "batch") {
        auto response = client.BatchFetchAccessManifests({item_ids, accessres::model::BatchPriority::kNormal});
        for (const auto& result : response.results) {
          std::cout << result.item_id << " readiness=" << accessres::model::ToString(result.readiness);
          if (result.access) {
            std::cout << " " << Describe(*result.access);
          }
          std::cout << "\n";
        }
        for (const auto& error : response.errors) {
          std::cerr << error.item_id << ": " << error.error << "\n";
        }
        rc = response.errors.empty() ? 0 : 2;
      } else if (cmd == "watch") {
        std::signal(SIGINT, HandleSignal);
        std::signal(SIGTERM, HandleSignal);
        rc = Watch(config, client, item_ids);
      } else {
        Usage();
      }
    }

    accessres::observability::ShutdownMetrics();
    accessres::observability::ShutdownLogging();
    return rc;
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    accessres::observability::ShutdownMetrics();
    accessres::observability::ShutdownLogging();
    return 2;
  }
}
