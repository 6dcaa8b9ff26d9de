#include <grpcpp/grpcpp.h>
#include <google/protobuf/util/json_util.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include "receiver/manager/services/v1/receiver_service.grpc.pb.h"
#include "receiver/manager/services/v1/trigger_service.grpc.pb.h"
#include "receiver/manager/v1.hpp"

using namespace receiver::manager::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  receiverctl <addr> list [global] [sort=<key[:dir],...>] [limit=<n>] [marker=<m>] [name|type|cluster_id|action=<v>...]\n"
            << "  receiverctl <addr> create <name> <webhook|signal> <cluster> <action> [key=value...]\n"
            << "  receiverctl <addr> show <id|name>\n"
            << "  receiverctl <addr> delete <id|name>\n"
            << "  receiverctl <addr> trigger <receiver_id> [key=value...]\n"
            << "  receiverctl <addr> signal <receiver_id> [key=value...]\n"
            << "  receiverctl <addr> action <action_id>\n"
            << "\n"
            << "The caller token is read from RECEIVER_AUTH_TOKEN.\n";
}

static bool SplitKeyValue(const std::string& arg, std::string* key, std::string* value) {
  const auto eq = arg.find('=');
  if (eq == std::string::npos || eq == 0) {
    return false;
  }
  *key   = arg.substr(0, eq);
  *value = arg.substr(eq + 1);
  return true;
}

template <typename Map>
static bool ParseParams(int argc, char** argv, int first, Map* out) {
  for (int i = first; i < argc; ++i) {
    std::string key;
    std::string value;
    if (!SplitKeyValue(argv[i], &key, &value)) {
      std::cerr << "expected key=value, got '" << argv[i] << "'\n";
      return false;
    }
    (*out)[key] = value;
  }
  return true;
}

static void PrintJson(const google::protobuf::Message& message) {
  std::string                               json;
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;
  auto status            = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    std::cerr << "failed to render response: " << status.message() << "\n";
    return;
  }
  std::cout << json;
}

static int Fail(const grpc::Status& status) {
  std::cerr << "error(" << status.error_code() << "): " << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto receiver_stub = ReceiverService::NewStub(channel);
  auto trigger_stub  = TriggerService::NewStub(channel);

  grpc::ClientContext ctx;
  if (const char* token = std::getenv("RECEIVER_AUTH_TOKEN")) {
    ctx.AddMetadata("x-auth-token", token);
  }
  ctx.AddMetadata("x-receiver-api-version", "1.0");

  // ------------------------------------------------------------

  if (cmd == "list") {
    ListReceiversRequest req;
    for (int i = 3; i < argc; ++i) {
      std::string arg = argv[i];
      if (arg == "global") {
        req.set_global_project(true);
        continue;
      }

      std::string key;
      std::string value;
      if (!SplitKeyValue(arg, &key, &value)) {
        std::cerr << "unknown list option '" << arg << "'\n";
        return 1;
      }
      if (key == "sort") {
        req.set_sort(value);
      } else if (key == "limit") {
        req.set_limit(static_cast<uint32_t>(std::stoul(value)));
      } else if (key == "marker") {
        req.set_marker(value);
      } else if (key == "name") {
        req.add_name(value);
      } else if (key == "type") {
        req.add_type(value);
      } else if (key == "cluster_id") {
        req.add_cluster_id(value);
      } else if (key == "action") {
        req.add_action(value);
      } else {
        std::cerr << "unknown list option '" << arg << "'\n";
        return 1;
      }
    }

    ListReceiversResponse resp;
    auto status = receiver_stub->ListReceivers(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& item : resp.receivers()) {
      std::cout << item.id() << "  " << item.name() << "  " << item.type() << "  " << item.cluster_id() << "  " << item.action() << "\n";
    }
    if (!resp.next_marker().empty()) {
      std::cout << "next_marker=" << resp.next_marker() << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "create") {
    if (argc < 7) {
      Usage();
      return 1;
    }

    CreateReceiverRequest req;
    req.set_name(argv[3]);
    req.set_type(argv[4]);
    req.set_cluster_id(argv[5]);
    req.set_action(argv[6]);
    if (!ParseParams(argc, argv, 7, req.mutable_params())) return 1;

    CreateReceiverResponse resp;
    auto status = receiver_stub->CreateReceiver(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintJson(resp.receiver());
    std::cout << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "show") {
    if (argc < 4) return 1;

    GetReceiverRequest req;
    req.set_id(argv[3]);

    GetReceiverResponse resp;
    auto status = receiver_stub->GetReceiver(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintJson(resp.receiver());
    std::cout << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "delete") {
    if (argc < 4) return 1;

    DeleteReceiverRequest req;
    req.set_id(argv[3]);

    google::protobuf::Empty resp;
    auto status = receiver_stub->DeleteReceiver(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "deleted\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "trigger" || cmd == "signal") {
    if (argc < 4) return 1;

    TriggerResponse resp;
    grpc::Status    status;
    if (cmd == "trigger") {
      TriggerWebhookRequest req;
      req.set_receiver_id(argv[3]);
      if (!ParseParams(argc, argv, 4, req.mutable_params())) return 1;
      status = trigger_stub->TriggerWebhook(&ctx, req, &resp);
    } else {
      SignalReceiverRequest req;
      req.set_receiver_id(argv[3]);
      if (!ParseParams(argc, argv, 4, req.mutable_params())) return 1;
      status = trigger_stub->SignalReceiver(&ctx, req, &resp);
    }
    if (!status.ok()) return Fail(status);

    std::cout << "action_id=" << resp.action_id() << " state=" << resp.state() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "action") {
    if (argc < 4) return 1;

    GetActionRequest req;
    req.set_action_id(argv[3]);

    GetActionResponse resp;
    auto status = trigger_stub->GetAction(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintJson(resp.action());
    std::cout << "\n";
    return 0;
  }

  Usage();
  return 1;
}
