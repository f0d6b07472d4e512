#include "osr/engine/order_service.hpp"

#include "osr/domain/errors.hpp"
#include "osr/history/record_codec.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <utility>

namespace osr {

namespace {

std::unique_ptr<StaticCatalog> loadCatalog(const EngineConfig& config) {
  if (config.catalog_path.empty()) {
    return nullptr;
  }
  auto catalog = std::make_unique<StaticCatalog>(
      StaticCatalog::fromJsonFile(config.catalog_path));
  std::cout << "[OrderService] Catalog loaded: " << catalog->size()
            << " entries from " << config.catalog_path << "\n";
  return catalog;
}

std::string requireString(const nlohmann::json& request, const char* key) {
  auto it = request.find(key);
  if (it == request.end() || it->is_null()) {
    throw ValidationError(key, "required field is missing");
  }
  if (!it->is_string()) {
    throw ValidationError(key, "must be a string");
  }
  return it->get<std::string>();
}

std::optional<std::string> optionalString(const nlohmann::json& request,
                                          const char* key) {
  auto it = request.find(key);
  if (it == request.end() || it->is_null()) {
    return std::nullopt;
  }
  if (!it->is_string()) {
    throw ValidationError(key, "must be a string");
  }
  return it->get<std::string>();
}

std::string fieldValueText(const std::string& name,
                           const nlohmann::json& value) {
  if (value.is_string()) {
    return value.get<std::string>();
  }
  if (value.is_number_integer()) {
    return std::to_string(value.get<long long>());
  }
  throw ValidationError(name, "must be a string or a whole number");
}

// "fields" as [["item","A100"], ...] (order kept) or {"item":"A100", ...}.
domain::FieldList parseFields(const nlohmann::json& node) {
  domain::FieldList fields;
  if (node.is_object()) {
    for (auto it = node.begin(); it != node.end(); ++it) {
      fields.emplace_back(it.key(), fieldValueText(it.key(), it.value()));
    }
    return fields;
  }
  if (!node.is_array()) {
    throw ValidationError("fields", "must be an array of pairs or an object");
  }
  for (const auto& pair : node) {
    if (!pair.is_array() || pair.size() != 2 || !pair[0].is_string()) {
      throw ValidationError("fields", "each entry must be [name, value]");
    }
    const std::string name = pair[0].get<std::string>();
    fields.emplace_back(name, fieldValueText(name, pair[1]));
  }
  return fields;
}

nlohmann::json errorReply(const std::string& category,
                          const std::string& message) {
  nlohmann::json reply;
  reply["status"] = "error";
  reply["category"] = category;
  reply["message"] = message;
  return reply;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
OrderService::OrderService(const EngineConfig& config,
                           ITransportClient& transport, ITimeProvider& clock)
    : config_(config),
      transport_(transport),
      clock_(clock),
      catalog_(loadCatalog(config_)),
      history_(config_.history_path),
      builder_(config_, catalog_.get()),
      engine_(config_, history_, transport_, locks_, clock_),
      sweeper_(history_, locks_, clock_) {}

// -----------------------------------------------------------------------------
// Destructor: RAII stop
// -----------------------------------------------------------------------------
OrderService::~OrderService() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void OrderService::start(bool serve_commands) {
  if (running_) {
    return;
  }

  // ---  1) Settle submissions a previous process never finished ------------
  const std::size_t recovered = engine_.recoverInterrupted();
  if (recovered > 0) {
    std::cout << "[OrderService] Recovery complete: " << recovered
              << " interrupted submission(s) marked Failed.\n";
  }

  // ---  2) Command endpoint (optional) --------------------------------------
  if (serve_commands && !config_.command_endpoint.empty()) {
    command_server_ = std::make_unique<CommandServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        config_.command_endpoint);
    command_server_->start();
  }

  running_ = true;

  std::cout << "[OrderService] started. OSR "
            << (config_.osr_id.empty() ? std::string("<unset>")
                                       : config_.osr_id)
            << " (" << toString(config_.server_type) << "), history "
            << history_.path() << ", " << history_.size() << " record(s).\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void OrderService::stop() {
  if (!running_) {
    return;
  }

  // Joins the server thread; executeCommand() must not outlive the engine.
  command_server_.reset();

  running_ = false;

  std::cout << "[OrderService] stopped.\n";
}

std::string OrderService::commandEndpoint() const {
  return command_server_ ? command_server_->boundEndpoint() : std::string{};
}

// -----------------------------------------------------------------------------
// Operations
// -----------------------------------------------------------------------------
domain::OrderRecord OrderService::submit(const domain::OrderSpec& spec,
                                         std::optional<std::string> id) {
  domain::OrderDocument document = builder_.build(spec);
  document.finalize();
  return engine_.submit(document, std::move(id));
}

CancelOutcome OrderService::cancel(const std::string& id) {
  return engine_.cancel(id);
}

domain::OrderRecord OrderService::refreshStatus(const std::string& id) {
  return engine_.refreshStatus(id);
}

domain::OrderRecord OrderService::resubmit(const std::string& source_id,
                                           std::optional<std::string> new_id) {
  return engine_.resubmit(source_id, std::move(new_id));
}

domain::OrderRecord OrderService::show(const std::string& id) const {
  auto record = history_.get(id);
  if (!record) {
    throw NotFoundError(id);
  }
  return *record;
}

std::vector<domain::OrderRecord> OrderService::list(
    const HistoryFilter& filter) const {
  return history_.list(filter);
}

std::size_t OrderService::purge(const std::string& timeframe) {
  auto cutoff = RetentionSweeper::cutoffFor(timeframe, clock_.now_ms());
  if (!cutoff) {
    throw ValidationError("timeframe",
                          "expected 1d, 1w, 2w, 1m, all or YYYY-MM-DD");
  }
  return sweeper_.purgeBefore(*cutoff);
}

std::size_t OrderService::recover() { return engine_.recoverInterrupted(); }

InsertionCommands OrderService::sandboxCommands(
    const std::string& id, const std::string& element) const {
  if (config_.server_type != ServerType::Test) {
    throw ConfigError("sandbox commands are only available for Test servers");
  }
  if (config_.osr_id.empty()) {
    throw ConfigError("osr_id is not configured");
  }
  const domain::OrderRecord record = show(id);
  SandboxCommandGenerator generator(config_.osr_id);
  return generator.insertionCommandsFor(record.document, element);
}

// -----------------------------------------------------------------------------
// executeCommand(): handle command endpoint requests
// -----------------------------------------------------------------------------
std::string OrderService::executeCommand(const std::string& request_text) {
  nlohmann::json response;

  try {
    const nlohmann::json request = nlohmann::json::parse(request_text);
    if (!request.is_object()) {
      return errorReply("Request", "request must be a JSON object").dump();
    }
    const std::string cmd = requireString(request, "cmd");

    if (cmd == "ping") {
      response["status"] = "ok";
      response["response"] = "PONG";
    } else if (cmd == "submit") {
      const std::string kind_text = requireString(request, "kind");
      auto kind = domain::parseOrderKind(kind_text);
      if (!kind) {
        throw ValidationError("kind", "unknown order kind " + kind_text);
      }
      domain::OrderSpec spec;
      spec.kind = *kind;
      if (request.contains("fields")) {
        spec.fields = parseFields(request.at("fields"));
      }
      spec.dry_run = request.value("dry_run", config_.dry_run);

      response["status"] = "ok";
      response["record"] = recordToJson(submit(spec, optionalString(request, "id")));
    } else if (cmd == "cancel") {
      CancelOutcome outcome = cancel(requireString(request, "id"));
      response["status"] = "ok";
      response["result"] = toString(outcome.result);
      response["reason"] = outcome.reason;
      response["record"] = recordToJson(outcome.record);
    } else if (cmd == "status") {
      response["status"] = "ok";
      response["record"] = recordToJson(refreshStatus(requireString(request, "id")));
    } else if (cmd == "show") {
      const domain::OrderRecord record = show(requireString(request, "id"));
      response["status"] = "ok";
      response["record"] = recordToJson(record);
      response["xml"] = record.document.toXml();
    } else if (cmd == "list") {
      HistoryFilter filter;
      if (request.contains("statuses")) {
        for (const auto& status : request.at("statuses")) {
          const std::string text = status.get<std::string>();
          auto parsed = domain::parseOrderStatus(text);
          if (!parsed) {
            throw ValidationError("statuses", "unknown status " + text);
          }
          filter.statuses.push_back(*parsed);
        }
      }
      nlohmann::json records = nlohmann::json::array();
      for (const auto& record : list(filter)) {
        records.push_back(recordToJson(record));
      }
      response["status"] = "ok";
      response["records"] = std::move(records);
    } else if (cmd == "purge") {
      response["status"] = "ok";
      response["removed"] = purge(requireString(request, "older_than"));
    } else if (cmd == "resubmit") {
      response["status"] = "ok";
      response["record"] = recordToJson(resubmit(
          requireString(request, "id"), optionalString(request, "new_id")));
    } else if (cmd == "recover") {
      response["status"] = "ok";
      response["recovered"] = recover();
    } else if (cmd == "sandbox") {
      const InsertionCommands commands =
          sandboxCommands(requireString(request, "id"),
                          optionalString(request, "element").value_or(""));
      response["status"] = "ok";
      response["insert_now"] = commands.insert_now;
      response["remove_later"] = commands.remove_later;
    } else {
      response = errorReply("Request", "unknown command: " + cmd);
    }
  } catch (const ValidationError& e) {
    response = errorReply(toString(e.category()), e.what());
    response["field"] = e.field();
  } catch (const OrderError& e) {
    response = errorReply(toString(e.category()), e.what());
  } catch (const nlohmann::json::exception& e) {
    response = errorReply("Request", e.what());
  } catch (const std::exception& e) {
    std::cerr << "[OrderService] Command failed: " << e.what() << "\n";
    response = errorReply("Internal", e.what());
  }

  return response.dump();
}

}  // namespace osr
