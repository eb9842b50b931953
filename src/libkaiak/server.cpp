#include "kaiak/server.hpp"

#include <algorithm>
#include <boost/asio/post.hpp>
#include <boost/system/system_error.hpp>
#include <exception>

#include "kaiak/errors.hpp"
#include "logger.hpp"
#include "utils.hpp"

namespace asio = boost::asio;
namespace json = boost::json;

namespace kaiak {

using utils::throwf;

/// notifier

asio::awaitable<void> notifier::send(jsonrpc::notification note) {
  try {
    co_await server_->send_notification(note);
  } catch (const std::exception& e) {
    LOG_WARN("Failed to send notification {}: {}", note.method, e.what());
  }
}

asio::awaitable<void> notifier::send(
    std::string method, std::optional<json::value> params) {
  co_await send(jsonrpc::notification::make(std::move(method), std::move(params)));
}

asio::awaitable<void> notifier::progress(std::string token, json::value value) {
  co_await send(jsonrpc::notification::progress(std::move(token), std::move(value)));
}

/// server

server::server(std::unique_ptr<transport> transport)
    : transport_{std::move(transport)} {}

void server::register_method(std::string name, method_handler handler) {
  register_streaming_method(
      std::move(name),
      [handler = std::move(handler)](
          std::optional<json::value> params, notifier /*unused*/) {
        return handler(std::move(params));
      });
}

void server::register_app_method(std::string name, method_handler handler) {
  register_method(
      std::move(name),
      [handler = std::move(handler)](
          std::optional<json::value> params) -> asio::awaitable<json::value> {
        try {
          co_return co_await handler(std::move(params));
        } catch (const app_error& e) {
          throw jsonrpc::rpc_error{to_rpc_error(e)};
        }
      });
}

void server::register_streaming_method(
    std::string name, streaming_handler handler) {
  LOG_DEBUG("Registering method: {}", name);
  auto ptr = std::make_shared<const streaming_handler>(std::move(handler));
  std::lock_guard lock{methods_mutex_};
  methods_.insert_or_assign(std::move(name), std::move(ptr));
}

server::handler_ptr server::find_handler(const std::string& name) const {
  std::lock_guard lock{methods_mutex_};
  auto it = methods_.find(name);
  if (it == methods_.end()) return nullptr;
  return it->second;
}

std::vector<std::string> server::registered_methods() const {
  std::vector<std::string> names{};
  {
    std::lock_guard lock{methods_mutex_};
    names.reserve(methods_.size());
    for (const auto& [name, _] : methods_) names.push_back(name);
  }
  std::ranges::sort(names);
  return names;
}

std::string server::transport_description() const {
  return transport_->description();
}

bool server::is_running() const {
  std::lock_guard lock{state_mutex_};
  return running_;
}

void server::stop() {
  {
    std::lock_guard lock{state_mutex_};
    if (!running_) return;
    running_ = false;
  }
  LOG_INFO("Stopping JSON-RPC server");
  // The transport is only touched from its own executor.  While a request
  // is being dispatched the loop closes it once the response is out.
  asio::post(transport_->get_executor(), [this] {
    bool idle{false};
    {
      std::lock_guard lock{state_mutex_};
      idle = !dispatching_;
    }
    if (idle) transport_->close();
  });
}

asio::awaitable<void> server::start() {
  {
    std::lock_guard lock{state_mutex_};
    if (running_ || looping_)
      throwf<already_running>("Server is already running");
    running_ = true;
    looping_ = true;
  }
  LOG_INFO("Starting JSON-RPC server on {}", transport_->description());

  while (is_running()) {
    std::optional<jsonrpc::request> req{};
    bool bad_frame{false};
    try {
      req = co_await transport_->read_request();
    } catch (const jsonrpc::rpc_error& e) {
      LOG_WARN("Failed to read request: {}", e.what());
      bad_frame = true;
    } catch (const boost::system::system_error& e) {
      if (is_running()) LOG_ERROR("Transport failure: {}", e.what());
      break;
    }

    if (bad_frame) {
      co_await write_response(jsonrpc::response::parse_error());
      continue;
    }
    if (!req) {
      LOG_INFO("Transport closed by peer");
      break;
    }

    {
      std::lock_guard lock{state_mutex_};
      dispatching_ = true;
    }
    auto resp = co_await process_request(*req);
    if (resp) co_await write_response(*resp);
    {
      std::lock_guard lock{state_mutex_};
      dispatching_ = false;
    }
  }

  transport_->close();
  {
    std::lock_guard lock{state_mutex_};
    running_ = false;
    looping_ = false;
  }
  LOG_INFO("JSON-RPC server stopped");
}

asio::awaitable<std::optional<jsonrpc::response>> server::process_request(
    const jsonrpc::request& req) {
  LOG_DEBUG("Processing request: {}", req.method);
  auto id_str = req.id ? utils::id_to_string(*req.id) : std::string{"-"};

  std::optional<jsonrpc::error_object> invalid{};
  try {
    req.validate();
  } catch (const jsonrpc::rpc_error& e) {
    invalid = e.error();
  }
  if (invalid) {
    if (req.is_notification()) {
      LOG_WARN("Dropping invalid notification: {}", invalid->message);
      co_return std::nullopt;
    }
    co_return jsonrpc::response::failure(std::move(*invalid), req.id);
  }

  // Keeps the handler alive while it runs, even if it is re-registered.
  auto handler = find_handler(req.method);
  if (!handler) {
    if (req.is_notification()) {
      LOG_WARN("Notification for unknown method: {}", req.method);
      co_return std::nullopt;
    }
    LOG_WARN("Method not found: {} (id {})", req.method, id_str);
    co_return jsonrpc::response::method_not_found(req.method, req.id);
  }

  std::optional<json::value> result{};
  std::optional<jsonrpc::response> failed{};
  try {
    result = co_await (*handler)(req.params, notifier{*this});
  } catch (const jsonrpc::rpc_error& e) {
    failed = jsonrpc::response::failure(e.error(), req.id);
  } catch (const app_error& e) {
    failed = jsonrpc::response::failure(to_rpc_error(e), req.id);
  } catch (const std::exception& e) {
    failed = jsonrpc::response::internal_error(e.what(), req.id);
  }

  if (req.is_notification()) {
    if (failed)
      LOG_WARN(
          "Notification handler {} failed: {}", req.method,
          failed->error->message);
    co_return std::nullopt;
  }
  if (failed) {
    LOG_DEBUG(
        "Request {} (id {}) failed: {}", req.method, id_str,
        failed->error->message);
    co_return failed;
  }
  co_return jsonrpc::response::success(std::move(*result), req.id);
}

asio::awaitable<void> server::send_notification(
    const jsonrpc::notification& note) {
  co_await transport_->write_notification(note);
}

asio::awaitable<void> server::write_response(const jsonrpc::response& resp) {
  try {
    co_await transport_->write_response(resp);
  } catch (const std::exception& e) {
    LOG_ERROR("Failed to write response: {}", e.what());
  }
}

/// server_builder

server_builder& server_builder::with_transport(transport_config config) {
  config_ = std::move(config);
  return *this;
}

server_builder& server_builder::with_stdio() {
  return with_transport(stdio_config{});
}

server_builder& server_builder::with_unix_socket(std::string path) {
  return with_transport(unix_socket_config{std::move(path)});
}

server_builder& server_builder::register_method(
    std::string name, method_handler handler) {
  methods_.emplace_back(std::move(name), std::move(handler));
  return *this;
}

server_builder& server_builder::register_app_method(
    std::string name, method_handler handler) {
  app_methods_.emplace_back(std::move(name), std::move(handler));
  return *this;
}

server_builder& server_builder::register_streaming_method(
    std::string name, streaming_handler handler) {
  streaming_.emplace_back(std::move(name), std::move(handler));
  return *this;
}

std::unique_ptr<server> server_builder::build(
    const asio::any_io_executor& executor) {
  if (!config_) throwf("Transport configuration not specified");

  LOG_DEBUG("Creating transport: {}", describe(*config_));
  auto srv = std::make_unique<server>(make_server_transport(executor, *config_));
  for (auto& [name, handler] : methods_)
    srv->register_method(name, std::move(handler));
  for (auto& [name, handler] : app_methods_)
    srv->register_app_method(name, std::move(handler));
  for (auto& [name, handler] : streaming_)
    srv->register_streaming_method(name, std::move(handler));
  methods_.clear();
  app_methods_.clear();
  streaming_.clear();
  return srv;
}

}  // namespace kaiak
