// -----------------------------------------------------------------------------
// osr_orders — single executable entry point.
//
//   osr_orders [--config PATH] [--dry-run] [--mock-endpoint] <command> ...
//
//   submit <Kind> [--id ID] field=value ...   build, finalize, submit
//   cancel <id>
//   status <id>                               refresh from the OSR
//   show <id>
//   list [--status S]...
//   purge <1d|1w|2w|1m|all|YYYY-MM-DD>
//   resubmit <id> [--id NEW]
//   sandbox <id> [element]                    Test servers only
//   recover
//   serve                                     command endpoint until Ctrl-C
//
// Startup:
//   1) Load EngineConfig (./.osr_orders.json unless --config is given).
//   2) Pick the transport: ZmqTransportClient, or MockTransportClient with
//      --mock-endpoint (offline rehearsal against a scripted OSR).
//   3) Create OrderService and start() it, which settles submissions an
//      earlier process left Pending.
//   4) Run the command and map the outcome to an exit code:
//        0 ok, 1 Failed / not cancellable, 2 usage or validation,
//        3 busy / not found / duplicate / invalid transition,
//        4 storage or configuration.
//
// The transport and the clock are stack-local in main() and outlive the
// service that borrows them.
// -----------------------------------------------------------------------------

#include "osr/config/engine_config.hpp"
#include "osr/domain/errors.hpp"
#include "osr/engine/order_service.hpp"
#include "osr/history/record_codec.hpp"
#include "osr/time/live_time_provider.hpp"
#include "osr/transport/mock_transport_client.hpp"
#include "osr/transport/zmq_transport_client.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;
constexpr int kExitConflict = 3;
constexpr int kExitEnvironment = 4;

// Set by SIGINT; polled by `serve`.
std::atomic<bool> g_stop_requested{false};

void sigint_handler(int /*signum*/) { g_stop_requested.store(true); }

struct UsageError {
  std::string message;
};

int exitCodeFor(osr::ErrorCategory category) {
  switch (category) {
    case osr::ErrorCategory::Validation:
    case osr::ErrorCategory::DocumentState:
      return kExitUsage;
    case osr::ErrorCategory::Busy:
    case osr::ErrorCategory::NotFound:
    case osr::ErrorCategory::DuplicateId:
    case osr::ErrorCategory::InvalidTransition:
      return kExitConflict;
    case osr::ErrorCategory::Storage:
    case osr::ErrorCategory::Config:
      return kExitEnvironment;
    case osr::ErrorCategory::Transport:
      return kExitFailed;
  }
  return kExitFailed;
}

void printUsage() {
  std::cerr
      << "usage: osr_orders [--config PATH] [--dry-run] [--mock-endpoint] "
         "<command> ...\n"
         "  submit <Kind> [--id ID] field=value ...\n"
         "  cancel <id>\n"
         "  status <id>\n"
         "  show <id>\n"
         "  list [--status S]...\n"
         "  purge <1d|1w|2w|1m|all|YYYY-MM-DD>\n"
         "  resubmit <id> [--id NEW]\n"
         "  sandbox <id> [element]\n"
         "  recover\n"
         "  serve\n";
}

void printRecord(const osr::domain::OrderRecord& record) {
  std::cout << osr::recordToJson(record).dump(2) << "\n";
}

int recordExitCode(const osr::domain::OrderRecord& record) {
  return record.status == osr::domain::OrderStatus::Failed ? kExitFailed
                                                           : kExitOk;
}

const std::string& requireArg(const std::vector<std::string>& args,
                              std::size_t index, const char* what) {
  if (index >= args.size()) {
    throw UsageError{std::string("missing ") + what};
  }
  return args[index];
}

// Pulls "--id VALUE" out of `args`, leaving the rest in order.
std::optional<std::string> takeIdOption(std::vector<std::string>& args) {
  std::optional<std::string> id;
  std::vector<std::string> rest;
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == "--id") {
      if (i + 1 >= args.size()) {
        throw UsageError{"--id needs a value"};
      }
      id = args[++i];
    } else {
      rest.push_back(args[i]);
    }
  }
  args = std::move(rest);
  return id;
}

int runSubmit(osr::OrderService& service, std::vector<std::string> args,
              bool dry_run) {
  std::optional<std::string> id = takeIdOption(args);
  const std::string& kind_text = requireArg(args, 0, "order kind");
  auto kind = osr::domain::parseOrderKind(kind_text);
  if (!kind) {
    throw UsageError{"unknown order kind " + kind_text};
  }

  osr::domain::OrderSpec spec;
  spec.kind = *kind;
  spec.dry_run = dry_run;
  for (std::size_t i = 1; i < args.size(); ++i) {
    const auto eq = args[i].find('=');
    if (eq == std::string::npos || eq == 0) {
      throw UsageError{"expected field=value, got " + args[i]};
    }
    spec.fields.emplace_back(args[i].substr(0, eq), args[i].substr(eq + 1));
  }

  const osr::domain::OrderRecord record = service.submit(spec, std::move(id));
  printRecord(record);
  return recordExitCode(record);
}

int runCancel(osr::OrderService& service, const std::string& id) {
  const osr::CancelOutcome outcome = service.cancel(id);
  std::cout << "[main] cancel " << id << ": " << toString(outcome.result);
  if (!outcome.reason.empty()) {
    std::cout << " (" << outcome.reason << ")";
  }
  std::cout << "\n";
  printRecord(outcome.record);
  return outcome.result == osr::CancelOutcome::Result::Cancelled ? kExitOk
                                                                 : kExitFailed;
}

int runList(osr::OrderService& service, const std::vector<std::string>& args) {
  osr::HistoryFilter filter;
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] != "--status" || i + 1 >= args.size()) {
      throw UsageError{"expected --status <Status>"};
    }
    auto status = osr::domain::parseOrderStatus(args[++i]);
    if (!status) {
      throw UsageError{"unknown status " + args[i]};
    }
    filter.statuses.push_back(*status);
  }

  const auto records = service.list(filter);
  for (const auto& record : records) {
    std::cout << record.id << "  " << toString(record.kind) << "  "
              << toString(record.status) << "  "
              << record.remote_reference.value_or("-") << "  "
              << record.last_error.value_or("") << "\n";
  }
  std::cout << "[main] " << records.size() << " record(s).\n";
  return kExitOk;
}

int runServe(osr::OrderService& service) {
  std::signal(SIGINT, sigint_handler);
  std::cout << "[main] Serving commands on " << service.commandEndpoint()
            << ". Press Ctrl-C to stop.\n";
  while (!g_stop_requested.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
  std::cout << "\n[main] SIGINT received. Shutting down...\n";
  return kExitOk;
}

int runCommand(osr::OrderService& service, const std::string& command,
               std::vector<std::string> args, bool dry_run) {
  if (command == "submit") {
    return runSubmit(service, std::move(args), dry_run);
  }
  if (command == "cancel") {
    return runCancel(service, requireArg(args, 0, "order id"));
  }
  if (command == "status") {
    const auto record = service.refreshStatus(requireArg(args, 0, "order id"));
    printRecord(record);
    return recordExitCode(record);
  }
  if (command == "show") {
    const auto record = service.show(requireArg(args, 0, "order id"));
    printRecord(record);
    std::cout << record.document.toXml() << "\n";
    return kExitOk;
  }
  if (command == "list") {
    return runList(service, args);
  }
  if (command == "purge") {
    const std::size_t removed =
        service.purge(requireArg(args, 0, "timeframe"));
    std::cout << "[main] purged " << removed << " record(s).\n";
    return kExitOk;
  }
  if (command == "resubmit") {
    std::optional<std::string> new_id = takeIdOption(args);
    const auto record =
        service.resubmit(requireArg(args, 0, "order id"), std::move(new_id));
    printRecord(record);
    return recordExitCode(record);
  }
  if (command == "sandbox") {
    const std::string element = args.size() > 1 ? args[1] : std::string{};
    const auto commands =
        service.sandboxCommands(requireArg(args, 0, "order id"), element);
    std::cout << commands.insert_now << "\n" << commands.remove_later << "\n";
    return kExitOk;
  }
  if (command == "recover") {
    std::cout << "[main] recovered " << service.recover() << " record(s).\n";
    return kExitOk;
  }
  if (command == "serve") {
    return runServe(service);
  }
  throw UsageError{"unknown command " + command};
}

}  // namespace

int main(int argc, char* argv[]) {
  std::vector<std::string> args(argv + 1, argv + argc);

  // -------------------------------------------------------------------------
  // 1) Global options (before the command word).
  // -------------------------------------------------------------------------
  std::string config_path = osr::kDefaultConfigPath;
  bool explicit_config = false;
  bool dry_run = false;
  bool mock_endpoint = false;

  std::size_t pos = 0;
  for (; pos < args.size() && args[pos].rfind("--", 0) == 0; ++pos) {
    if (args[pos] == "--config" && pos + 1 < args.size()) {
      config_path = args[++pos];
      explicit_config = true;
    } else if (args[pos] == "--dry-run") {
      dry_run = true;
    } else if (args[pos] == "--mock-endpoint") {
      mock_endpoint = true;
    } else {
      std::cerr << "[main] unknown option " << args[pos] << "\n";
      printUsage();
      return kExitUsage;
    }
  }
  if (pos >= args.size()) {
    printUsage();
    return kExitUsage;
  }
  const std::string command = args[pos];
  std::vector<std::string> command_args(args.begin() + pos + 1, args.end());

  try {
    // -----------------------------------------------------------------------
    // 2) Configuration.
    // -----------------------------------------------------------------------
    osr::EngineConfig config =
        osr::loadEngineConfig(config_path, explicit_config);
    if (dry_run) {
      config.dry_run = true;
    }

    // -----------------------------------------------------------------------
    // 3) Transport and clock (outlive the service).
    // -----------------------------------------------------------------------
    osr::LiveTimeProvider clock;
    std::unique_ptr<osr::ITransportClient> transport;
    if (mock_endpoint) {
      transport = std::make_unique<osr::MockTransportClient>();
      std::cout << "[main] Using mock OSR endpoint.\n";
    } else {
      transport = std::make_unique<osr::ZmqTransportClient>(config.endpoint,
                                                            config.osr_id);
    }

    // -----------------------------------------------------------------------
    // 4) Service lifecycle.
    // -----------------------------------------------------------------------
    osr::OrderService service(config, *transport, clock);
    service.start(command == "serve");

    const int code =
        runCommand(service, command, std::move(command_args), config.dry_run);

    service.stop();
    return code;
  } catch (const UsageError& e) {
    std::cerr << "[main] " << e.message << "\n";
    printUsage();
    return kExitUsage;
  } catch (const osr::OrderError& e) {
    std::cerr << "[main] " << toString(e.category()) << " error: " << e.what()
              << "\n";
    return exitCodeFor(e.category());
  } catch (const std::exception& e) {
    std::cerr << "[main] ERROR: " << e.what() << "\n";
    return kExitEnvironment;
  }
}
