#pragma once

#include "osr/catalog/static_catalog.hpp"
#include "osr/concurrent/id_lock_table.hpp"
#include "osr/config/engine_config.hpp"
#include "osr/document/document_builder.hpp"
#include "osr/domain/order_record.hpp"
#include "osr/domain/order_spec.hpp"
#include "osr/history/json_history_store.hpp"
#include "osr/lifecycle/order_lifecycle_engine.hpp"
#include "osr/network/command_server.hpp"
#include "osr/retention/retention_sweeper.hpp"
#include "osr/sandbox/sandbox_commands.hpp"
#include "osr/time/i_time_provider.hpp"
#include "osr/transport/i_transport_client.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace osr {

// -----------------------------------------------------------------------------
// OrderService — application root of the order desk
// -----------------------------------------------------------------------------
//
// @brief  Owns and wires every component from one EngineConfig and exposes
//         the operations the CLI and the command endpoint need.
//
// @details
// Construction order (reverse of destruction):
//
//   1. StaticCatalog: only when config.catalog_path is set.
//   2. JsonHistoryStore: opens config.history_path (StorageError if the
//      log is corrupt).
//   3. IdLockTable: shared by the engine and the sweeper.
//   4. DocumentBuilder: borrows the catalog.
//   5. OrderLifecycleEngine
//   6. RetentionSweeper
//
// The transport and the clock are borrowed: main() picks ZeroMQ or the mock,
// tests pass a MockTransportClient and a SimulationTimeProvider.
//
// start():
//   a. recoverInterrupted(): records a previous process left Pending are
//      marked Failed before anything else can touch them.
//   b. Optionally binds the command endpoint (CommandServer) and starts
//      answering JSON commands via executeCommand().
// stop() joins the command server before the components it calls into are
// destroyed.
//
// executeCommand():
//   {"cmd":"ping"}                                    → {"status":"ok","response":"PONG"}
//   {"cmd":"submit","kind":"Standard","fields":[["item","A100"],...],
//    "id":"opt","dry_run":false}                      → {"status":"ok","record":{...}}
//   {"cmd":"cancel","id":"..."}                       → {"status":"ok","result":"Cancelled",
//                                                        "reason":"...","record":{...}}
//   {"cmd":"status","id":"..."}                       → {"status":"ok","record":{...}}
//   {"cmd":"show","id":"..."}                         → {"status":"ok","record":{...},"xml":"..."}
//   {"cmd":"list","statuses":["Sent",...]}            → {"status":"ok","records":[...]}
//   {"cmd":"purge","older_than":"1w"}                 → {"status":"ok","removed":N}
//   {"cmd":"resubmit","id":"...","new_id":"opt"}      → {"status":"ok","record":{...}}
//   {"cmd":"recover"}                                 → {"status":"ok","recovered":N}
//   {"cmd":"sandbox","id":"...","element":"opt"}      → {"status":"ok","insert_now":"...",
//                                                        "remove_later":"..."}
//   failures                                          → {"status":"error","category":"NotFound",
//                                                        "message":"..."}
// "fields" may also be a JSON object; numeric values are accepted and
// rendered as decimal strings.
//
// Thread model:
//   All operations are safe to call concurrently (the command server thread
//   and the main thread may both be active).
// -----------------------------------------------------------------------------
class OrderService {
 public:
  // @throws ConfigError if the catalog cannot be loaded,
  //         StorageError if the history cannot be opened.
  OrderService(const EngineConfig& config, ITransportClient& transport,
               ITimeProvider& clock);

  ~OrderService();

  OrderService(const OrderService&) = delete;
  OrderService& operator=(const OrderService&) = delete;
  OrderService(OrderService&&) = delete;
  OrderService& operator=(OrderService&&) = delete;

  void start(bool serve_commands = false);
  void stop();
  bool isRunning() const { return running_; }

  // Build, finalize and submit.
  domain::OrderRecord submit(const domain::OrderSpec& spec,
                             std::optional<std::string> id = std::nullopt);
  CancelOutcome cancel(const std::string& id);
  domain::OrderRecord refreshStatus(const std::string& id);
  domain::OrderRecord resubmit(const std::string& source_id,
                               std::optional<std::string> new_id = std::nullopt);

  // @throws NotFoundError
  domain::OrderRecord show(const std::string& id) const;
  std::vector<domain::OrderRecord> list(const HistoryFilter& filter) const;

  // @throws ValidationError("timeframe") for an unrecognised timeframe.
  std::size_t purge(const std::string& timeframe);

  std::size_t recover();

  // Simulator commands for the order's carrier. Test servers only.
  // @throws ConfigError on a Live server or without osr_id, NotFoundError.
  InsertionCommands sandboxCommands(const std::string& id,
                                    const std::string& element = {}) const;

  // Dispatches one JSON command and always returns a JSON reply.
  std::string executeCommand(const std::string& request);

  const EngineConfig& config() const { return config_; }
  IHistoryStore& history() { return history_; }

  // Resolved command endpoint while serving, empty otherwise.
  std::string commandEndpoint() const;

 private:
  EngineConfig config_;
  ITransportClient& transport_;
  ITimeProvider& clock_;

  std::unique_ptr<StaticCatalog> catalog_;
  JsonHistoryStore history_;
  IdLockTable locks_;
  DocumentBuilder builder_;
  OrderLifecycleEngine engine_;
  RetentionSweeper sweeper_;

  std::unique_ptr<CommandServer> command_server_;
  bool running_{false};
};

}  // namespace osr
