#include <google/protobuf/util/json_util.h>

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "list_flags.hpp"
#include "resolver/v1.hpp"

using resolver::observability::StringField;

namespace {

constexpr int kExitUsage           = 1;
constexpr int kExitFailure         = 2;
constexpr int kExitNotFound        = 3;
constexpr int kExitInvalidArgument = 4;

void Usage() {
  std::cout << "Usage:\n"
            << "  resolverctl --config <file.yaml> run\n"
            << "  resolverctl --config <file.yaml> recluster\n"
            << "  resolverctl --config <file.yaml> record <record_id>\n"
            << "  resolverctl --config <file.yaml> golden <golden_id>\n"
            << "  resolverctl --config <file.yaml> golden-of <record_id>\n"
            << "  resolverctl --config <file.yaml> list [--manufacturer M] [--unspsc PREFIX] [--min-size N] [--max-size N]\n"
            << "                                        [--text T] [--sort id|size|manufacturer] [--offset N] [--limit N]\n"
            << "  resolverctl --config <file.yaml> compare <record_id_a> <record_id_b>\n"
            << "  resolverctl --config <file.yaml> stats\n";
}

void PrintJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.preserve_proto_field_names    = true;
  options.always_print_primitive_fields = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("failed to render JSON: " + status.ToString());
  }
  std::cout << json;
}

int Dispatch(resolver::factory::Runtime& runtime, const std::string& cmd, const std::vector<std::string>& args) {
  auto& engine = *runtime.engine;
  auto& query  = *runtime.query;

  // ------------------------------------------------------------

  if (cmd == "run" || cmd == "recluster") {
    if (!args.empty()) return kExitUsage;

    if (cmd == "run") {
      engine.Run();
    } else {
      engine.Recluster();
    }
    PrintJson(query.Stats());
    return 0;
  }

  // Read-only commands answer from the sink's last committed run.
  engine.Hydrate();

  // ------------------------------------------------------------

  if (cmd == "record" || cmd == "golden" || cmd == "golden-of") {
    if (args.size() != 1) return kExitUsage;

    if (cmd == "record") {
      PrintJson(query.GetRecord(args[0]));
    } else if (cmd == "golden") {
      PrintJson(query.GetGoldenRecord(args[0]));
    } else {
      PrintJson(query.GetGoldenRecordForRecord(args[0]));
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "list") {
    PrintJson(query.ListGoldenRecords(resolver::cli::ParseListRequest(args)));
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "compare") {
    if (args.size() != 2) return kExitUsage;

    PrintJson(query.Compare(args[0], args[1]));
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "stats") {
    if (!args.empty()) return kExitUsage;

    PrintJson(query.Stats());
    return 0;
  }

  return kExitUsage;
}

} // namespace

int main(int argc, char** argv) {
  if (argc < 4 || std::string(argv[1]) != "--config") {
    Usage();
    return kExitUsage;
  }

  const std::string              config_path = argv[2];
  const std::string              cmd         = argv[3];
  const std::vector<std::string> args(argv + 4, argv + argc);

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = resolver::config::ConfigLoader::LoadFromYaml(config_path);

    // Keep stdout readable as JSON unless the config asks for more.
    if (config.logging().level().empty()) {
      config.mutable_logging()->set_level("warn");
    }
    resolver::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build runtime and execute
    // ------------------------------------------------------------
    const auto base_dir = std::filesystem::path(config_path).parent_path().string();
    auto       runtime  = resolver::factory::Build(config, base_dir);

    const int rc = Dispatch(runtime, cmd, args);
    if (rc == kExitUsage) {
      Usage();
    }
    resolver::observability::ShutdownLogging();
    return rc;
  } catch (const resolver::util::NotFound& e) {
    std::cerr << e.what() << "\n";
    resolver::observability::ShutdownLogging();
    return kExitNotFound;
  } catch (const resolver::util::InvalidArgument& e) {
    std::cerr << e.what() << "\n";
    resolver::observability::ShutdownLogging();
    return kExitInvalidArgument;
  } catch (const std::exception& e) {
    RESOLVER_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    resolver::observability::ShutdownLogging();
    return kExitFailure;
  }
}
