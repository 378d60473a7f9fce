#include <google/protobuf/empty.pb.h>
#include <google/protobuf/util/json_util.h>
#include <grpcpp/grpcpp.h>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

#include "client/cpp/rulegraph_client.h"

using namespace rulegraph::v1;
using rulegraph::client::RulegraphClient;

static void Usage() {
  std::cout << "Usage:\n"
            << "  rulegraphctl <addr> eval <entity_type> <entity_id> [extra_context_json]\n"
            << "  rulegraphctl <addr> var <variable_id> [trace]\n"
            << "  rulegraphctl <addr> validate <expression_json> [campaign_id entity_type [entity_id]]\n"
            << "  rulegraphctl <addr> exec <entity_type> <entity_id> <timing=pre|on_resolve|post> [actor]\n"
            << "  rulegraphctl <addr> exec-deps <actor> <effect_id>...\n"
            << "  rulegraphctl <addr> preview <effect_id>\n"
            << "  rulegraphctl <addr> order <campaign_id>\n"
            << "  rulegraphctl <addr> invalidate-entity <campaign_id> <entity_type> <entity_id> [field]...\n"
            << "  rulegraphctl <addr> get-entity <entity_type> <entity_id>\n"
            << "  rulegraphctl <addr> put-entity <entity_json> [expected_version]\n"
            << "  rulegraphctl <addr> create-condition <condition_json>\n"
            << "  rulegraphctl <addr> create-variable <variable_json>\n"
            << "  rulegraphctl <addr> create-effect <effect_json>\n"
            << "  rulegraphctl <addr> delete-condition|delete-variable|delete-effect <id> [expected_version]\n";
}

static std::optional<EffectTiming> ParseTiming(const std::string& value) {
  if (value == "pre") {
    return EFFECT_TIMING_PRE;
  }
  if (value == "on_resolve") {
    return EFFECT_TIMING_ON_RESOLVE;
  }
  if (value == "post") {
    return EFFECT_TIMING_POST;
  }
  return std::nullopt;
}

template <typename Message>
static Message ParseJson(const std::string& text) {
  Message msg;
  auto    status = google::protobuf::util::JsonStringToMessage(text, &msg);
  if (!status.ok()) {
    std::cerr << "invalid json: " << status.message() << "\n";
    std::exit(1);
  }
  return msg;
}

static void PrintJson(const google::protobuf::Message& msg) {
  std::string                               out;
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;
  auto status            = google::protobuf::util::MessageToJsonString(msg, &out, options);
  if (!status.ok()) {
    std::cerr << "cannot print response: " << status.message() << "\n";
    return;
  }
  std::cout << out;
}

static int Finish(const grpc::Status& status, const google::protobuf::Message* resp) {
  if (!status.ok()) {
    std::cerr << status.error_message() << "\n";
    return 2;
  }
  if (resp) {
    PrintJson(*resp);
  }
  return 0;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  RulegraphClient client(grpc::CreateChannel(addr, grpc::InsecureChannelCredentials()));

  // ------------------------------------------------------------

  if (cmd == "eval") {
    if (argc < 5) return 1;

    EvaluateComputedFieldsRequest req;
    req.set_entity_type(argv[3]);
    req.set_entity_id(argv[4]);
    if (argc >= 6) {
      *req.mutable_extra_context() = ParseJson<google::protobuf::Struct>(argv[5]);
    }

    EvaluateComputedFieldsResponse resp;
    return Finish(client.EvaluateComputedFields(req, &resp), &resp);
  }

  // ------------------------------------------------------------

  if (cmd == "var") {
    if (argc < 4) return 1;

    EvaluateVariableRequest req;
    req.set_variable_id(argv[3]);
    req.set_include_trace(argc >= 5 && std::string(argv[4]) == "trace");

    EvaluateVariableResponse resp;
    return Finish(client.EvaluateVariable(req, &resp), &resp);
  }

  // ------------------------------------------------------------

  if (cmd == "validate") {
    if (argc < 4) return 1;

    ValidateConditionRequest req;
    *req.mutable_expression() = ParseJson<google::protobuf::Value>(argv[3]);
    if (argc >= 6) {
      req.set_campaign_id(argv[4]);
      req.set_entity_type(argv[5]);
    }
    if (argc >= 7) {
      req.set_entity_id(argv[6]);
    }

    ValidateConditionResponse resp;
    return Finish(client.ValidateCondition(req, &resp), &resp);
  }

  // ------------------------------------------------------------

  if (cmd == "exec") {
    if (argc < 6) return 1;

    auto timing = ParseTiming(argv[5]);
    if (!timing.has_value()) {
      std::cerr << "unsupported timing: " << argv[5] << "\n";
      return 1;
    }

    ExecuteEffectsForEntityRequest req;
    req.set_entity_type(argv[3]);
    req.set_entity_id(argv[4]);
    req.set_timing(timing.value());
    req.set_actor(argc >= 7 ? argv[6] : "rulegraphctl");

    ExecuteEffectsResponse resp;
    return Finish(client.ExecuteEffectsForEntity(req, &resp), &resp);
  }

  // ------------------------------------------------------------

  if (cmd == "exec-deps") {
    if (argc < 5) return 1;

    ExecuteEffectsWithDependenciesRequest req;
    req.set_actor(argv[3]);
    for (int i = 4; i < argc; ++i) {
      req.add_effect_ids(argv[i]);
    }

    ExecuteEffectsResponse resp;
    return Finish(client.ExecuteEffectsWithDependencies(req, &resp), &resp);
  }

  // ------------------------------------------------------------

  if (cmd == "preview") {
    if (argc < 4) return 1;

    PreviewEffectRequest req;
    req.set_effect_id(argv[3]);

    PreviewEffectResponse resp;
    return Finish(client.PreviewEffect(req, &resp), &resp);
  }

  // ------------------------------------------------------------

  if (cmd == "order") {
    if (argc < 4) return 1;

    GetEvaluationOrderRequest req;
    req.set_campaign_id(argv[3]);

    GetEvaluationOrderResponse resp;
    return Finish(client.GetEvaluationOrder(req, &resp), &resp);
  }

  // ------------------------------------------------------------

  if (cmd == "invalidate-entity") {
    if (argc < 6) return 1;

    InvalidateRequest req;
    req.set_campaign_id(argv[3]);
    auto* entity = req.mutable_entity();
    entity->set_entity_type(argv[4]);
    entity->set_entity_id(argv[5]);
    for (int i = 6; i < argc; ++i) {
      entity->add_changed_fields(argv[i]);
    }

    InvalidateResponse resp;
    return Finish(client.Invalidate(req, &resp), &resp);
  }

  // ------------------------------------------------------------

  if (cmd == "get-entity") {
    if (argc < 5) return 1;

    Entity resp;
    return Finish(client.GetEntity(argv[3], argv[4], &resp), &resp);
  }

  // ------------------------------------------------------------

  if (cmd == "put-entity") {
    if (argc < 4) return 1;

    UpsertEntityRequest req;
    *req.mutable_entity() = ParseJson<Entity>(argv[3]);
    req.set_expected_version(argc >= 5 ? std::stoull(argv[4]) : 0);

    Entity resp;
    return Finish(client.UpsertEntity(req, &resp), &resp);
  }

  // ------------------------------------------------------------

  if (cmd == "create-condition") {
    if (argc < 4) return 1;

    Condition resp;
    return Finish(client.CreateCondition(ParseJson<Condition>(argv[3]), &resp), &resp);
  }

  if (cmd == "create-variable") {
    if (argc < 4) return 1;

    StateVariable resp;
    return Finish(client.CreateVariable(ParseJson<StateVariable>(argv[3]), &resp), &resp);
  }

  if (cmd == "create-effect") {
    if (argc < 4) return 1;

    Effect resp;
    return Finish(client.CreateEffect(ParseJson<Effect>(argv[3]), &resp), &resp);
  }

  // ------------------------------------------------------------

  if (cmd == "delete-condition" || cmd == "delete-variable" || cmd == "delete-effect") {
    if (argc < 4) return 1;

    const std::string id               = argv[3];
    const uint64_t    expected_version = argc >= 5 ? std::stoull(argv[4]) : 0;

    grpc::Status status;
    if (cmd == "delete-condition") {
      status = client.DeleteCondition(id, expected_version);
    } else if (cmd == "delete-variable") {
      status = client.DeleteVariable(id, expected_version);
    } else {
      status = client.DeleteEffect(id, expected_version);
    }
    if (Finish(status, nullptr) != 0) {
      return 2;
    }
    std::cout << "deleted\n";
    return 0;
  }

  Usage();
  return 1;
}
