#include <google/protobuf/util/json_util.h>

#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/clock.hpp"
#include "internal/util/errors.hpp"
#include "provenance/ledger/v1.hpp"

using namespace provenance::ledger::v1;

static void Usage() {
  std::cerr << "Usage:\n"
            << "  provenancectl --config <file.yaml> [--caller <principal>] [--height <n>] <command> [args]\n"
            << "\n"
            << "Commands:\n"
            << "  register-model <model_id> <name> <version> <confidence>\n"
            << "  authorize-verifier <principal>\n"
            << "  register-asset <asset_id> <model_id> <initial_score>\n"
            << "  update-score <asset_id> <new_score>\n"
            << "  transfer <asset_id> <new_owner> <price> <verification_hash>\n"
            << "  get-model <model_id>\n"
            << "  get-provenance <asset_id>\n"
            << "  history <asset_id> [transfer_index]\n"
            << "  counters\n"
            << "  is-active-model <model_id>\n"
            << "  is-verifier <principal>\n";
}

static std::optional<uint64_t> ParseUint(const std::string& value) {
  if (value.empty() || value[0] == '-') {
    return std::nullopt;
  }
  try {
    size_t     consumed = 0;
    const auto parsed   = std::stoull(value, &consumed);
    if (consumed != value.size()) {
      return std::nullopt;
    }
    return parsed;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

static std::optional<int64_t> ParseInt(const std::string& value) {
  try {
    size_t     consumed = 0;
    const auto parsed   = std::stoll(value, &consumed);
    if (consumed != value.size()) {
      return std::nullopt;
    }
    return parsed;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

static void Print(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.always_print_primitive_fields = true;
  options.preserve_proto_field_names    = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("failed to render response: " + std::string(status.message()));
  }
  std::cout << json;
}

struct Options {
  std::string              config_path;
  std::string              caller;
  std::optional<uint64_t>  height;
  std::vector<std::string> args; // command first
};

static std::optional<Options> ParseOptions(int argc, char** argv) {
  Options options;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" || arg == "--caller" || arg == "--height") {
      if (i + 1 >= argc) {
        std::cerr << "missing value for " << arg << "\n";
        return std::nullopt;
      }
      const std::string value = argv[++i];
      if (arg == "--config") {
        options.config_path = value;
      } else if (arg == "--caller") {
        options.caller = value;
      } else {
        options.height = ParseUint(value);
        if (!options.height) {
          std::cerr << "invalid height: " << value << "\n";
          return std::nullopt;
        }
      }
      continue;
    }
    options.args.push_back(arg);
  }

  if (options.config_path.empty() || options.args.empty()) {
    return std::nullopt;
  }
  return options;
}

// Returns the process exit status.
static int Run(provenance::service::LedgerService& service, const Options& options) {
  const auto& args   = options.args;
  const auto& cmd    = args[0];
  const auto& caller = options.caller;

  const auto need = [&](size_t count) {
    if (args.size() != count + 1) {
      Usage();
      return false;
    }
    return true;
  };
  const auto need_caller = [&] {
    if (caller.empty()) {
      std::cerr << cmd << " requires --caller\n";
      return false;
    }
    return true;
  };

  // ------------------------------------------------------------

  if (cmd == "register-model") {
    if (!need(4) || !need_caller()) return 1;
    const auto confidence = ParseInt(args[4]);
    if (!confidence) {
      std::cerr << "invalid confidence: " << args[4] << "\n";
      return 1;
    }

    RegisterModelRequest req;
    req.set_model_id(args[1]);
    req.set_name(args[2]);
    req.set_version(args[3]);
    req.set_confidence_level(*confidence);
    Print(service.RegisterModel(caller, req));
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "authorize-verifier") {
    if (!need(1) || !need_caller()) return 1;

    AuthorizeVerifierRequest req;
    req.set_verifier(args[1]);
    Print(service.AuthorizeVerifier(caller, req));
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "register-asset") {
    if (!need(3) || !need_caller()) return 1;
    const auto asset_id = ParseUint(args[1]);
    const auto score    = ParseInt(args[3]);
    if (!asset_id || !score) {
      std::cerr << "invalid asset id or score\n";
      return 1;
    }

    RegisterAssetRequest req;
    req.set_asset_id(*asset_id);
    req.set_model_id(args[2]);
    req.set_initial_score(*score);
    Print(service.RegisterAsset(caller, req));
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "update-score") {
    if (!need(2) || !need_caller()) return 1;
    const auto asset_id = ParseUint(args[1]);
    const auto score    = ParseInt(args[2]);
    if (!asset_id || !score) {
      std::cerr << "invalid asset id or score\n";
      return 1;
    }

    UpdateScoreRequest req;
    req.set_asset_id(*asset_id);
    req.set_new_score(*score);
    Print(service.UpdateScore(caller, req));
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "transfer") {
    if (!need(4) || !need_caller()) return 1;
    const auto asset_id = ParseUint(args[1]);
    const auto price    = ParseUint(args[3]);
    if (!asset_id || !price) {
      std::cerr << "invalid asset id or price\n";
      return 1;
    }

    TransferAssetRequest req;
    req.set_asset_id(*asset_id);
    req.set_new_owner(args[2]);
    req.set_price(*price);
    req.set_verification_hash(args[4]);
    Print(service.TransferAsset(caller, req));
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "get-model") {
    if (!need(1)) return 1;

    GetModelRequest req;
    req.set_model_id(args[1]);
    Print(service.GetModel(req));
    return 0;
  }

  if (cmd == "get-provenance") {
    if (!need(1)) return 1;
    const auto asset_id = ParseUint(args[1]);
    if (!asset_id) {
      std::cerr << "invalid asset id: " << args[1] << "\n";
      return 1;
    }

    GetProvenanceRequest req;
    req.set_asset_id(*asset_id);
    Print(service.GetProvenance(req));
    return 0;
  }

  if (cmd == "history") {
    if (args.size() != 2 && args.size() != 3) {
      Usage();
      return 1;
    }
    const auto asset_id = ParseUint(args[1]);
    if (!asset_id) {
      std::cerr << "invalid asset id: " << args[1] << "\n";
      return 1;
    }

    GetHistoryRequest req;
    req.set_asset_id(*asset_id);
    if (args.size() == 3) {
      const auto index = ParseUint(args[2]);
      if (!index) {
        std::cerr << "invalid transfer index: " << args[2] << "\n";
        return 1;
      }
      req.set_transfer_index(*index);
    }
    Print(service.GetHistory(req));
    return 0;
  }

  if (cmd == "counters") {
    if (!need(0)) return 1;
    Print(service.GetCounters(GetCountersRequest{}));
    return 0;
  }

  if (cmd == "is-active-model") {
    if (!need(1)) return 1;

    IsActiveModelRequest req;
    req.set_model_id(args[1]);
    Print(service.IsActiveModel(req));
    return 0;
  }

  if (cmd == "is-verifier") {
    if (!need(1)) return 1;

    IsAuthorizedVerifierRequest req;
    req.set_principal(args[1]);
    Print(service.IsAuthorizedVerifier(req));
    return 0;
  }

  std::cerr << "unknown command: " << cmd << "\n";
  Usage();
  return 1;
}

int main(int argc, char** argv) {
  const auto options = ParseOptions(argc, argv);
  if (!options) {
    Usage();
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = provenance::config::ConfigLoader::LoadFromYaml(options->config_path);

    provenance::observability::InitializeLogging(config.logging());

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    std::shared_ptr<provenance::util::Clock> clock;
    if (options->height) {
      clock = std::make_shared<provenance::util::ManualClock>(*options->height);
    }
    auto app = provenance::factory::Build(config, std::move(clock));

    const int rc = Run(*app.ledger_service, *options);
    provenance::observability::ShutdownLogging();
    return rc;
  } catch (const provenance::util::StorageError& e) {
    PROVENANCE_LOG_ERROR("Fatal error", {provenance::observability::StringField("error", e.what())});
    provenance::observability::ShutdownLogging();
    return 2;
  } catch (const provenance::util::LedgerError& e) {
    std::cerr << ErrorCode_Name(e.code()) << ": " << e.what() << "\n";
    provenance::observability::ShutdownLogging();
    return 3;
  } catch (const std::exception& e) {
    PROVENANCE_LOG_ERROR("Fatal error", {provenance::observability::StringField("error", e.what())});
    provenance::observability::ShutdownLogging();
    return 2;
  }
}
