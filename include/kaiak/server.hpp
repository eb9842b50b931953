#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/json.hpp>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "kaiak/jsonrpc.hpp"
#include "kaiak/transport.hpp"

namespace kaiak {

class server;

/// Handed to streaming handlers: writes notifications on the server's
/// transport while the handler runs.  Write failures are logged, never
/// thrown back into the handler.
class notifier {
 public:
  explicit notifier(server& srv) : server_{&srv} {}

  boost::asio::awaitable<void> send(jsonrpc::notification note);
  boost::asio::awaitable<void> send(
      std::string method, std::optional<boost::json::value> params);
  boost::asio::awaitable<void> progress(
      std::string token, boost::json::value value);

 private:
  server* server_;
};

// Handlers fail by throwing jsonrpc::rpc_error.  app_error is mapped
// through to_rpc_error(); anything else becomes an internal error.
using method_handler =
    std::function<boost::asio::awaitable<boost::json::value>(
        std::optional<boost::json::value>)>;
using streaming_handler =
    std::function<boost::asio::awaitable<boost::json::value>(
        std::optional<boost::json::value>, notifier)>;

/** @brief JSON-RPC dispatch loop over one transport.
 *
 * Requests are served strictly one at a time: the response to a request
 * is written before the next frame is read.  The method registry may be
 * modified from other threads while the loop runs.
 */
class server {
 public:
  class already_running : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
  };

  explicit server(std::unique_ptr<transport> transport);
  server(const server&) = delete;
  server(server&&) = delete;
  server& operator=(const server&) = delete;
  server& operator=(server&&) = delete;
  ~server() = default;

  // Registering an existing name replaces its handler.
  void register_method(std::string name, method_handler handler);
  void register_app_method(std::string name, method_handler handler);
  void register_streaming_method(std::string name, streaming_handler handler);

  /** @brief Run the loop until stop(), end of input or a transport failure.
   *
   * Throws already_running while a loop is active, including one that was
   * asked to stop and has not returned yet.
   */
  boost::asio::awaitable<void> start();

  /** @brief Ask the loop to finish and close the transport.
   *
   * Safe to call from any thread.  The close itself is posted to the
   * transport's executor, so the server must outlive that executor's
   * pending work.  A request being handled completes and its response is
   * still written.  No-op when stopped.
   */
  void stop();

  [[nodiscard]] bool is_running() const;

  /// Dispatch one request.  Empty for notifications.
  boost::asio::awaitable<std::optional<jsonrpc::response>> process_request(
      const jsonrpc::request& req);

  /// Throws whatever the transport throws.
  boost::asio::awaitable<void> send_notification(
      const jsonrpc::notification& note);

  [[nodiscard]] std::vector<std::string> registered_methods() const;
  [[nodiscard]] std::string transport_description() const;

 private:
  using handler_ptr = std::shared_ptr<const streaming_handler>;

  [[nodiscard]] handler_ptr find_handler(const std::string& name) const;
  boost::asio::awaitable<void> write_response(const jsonrpc::response& resp);

  std::unique_ptr<transport> transport_;

  mutable std::mutex methods_mutex_;
  std::unordered_map<std::string, handler_ptr> methods_;

  mutable std::mutex state_mutex_;
  bool running_{false};
  bool looping_{false};
  bool dispatching_{false};
};

/// Collects a transport configuration and handlers, then creates the
/// server with its transport.
class server_builder {
 public:
  server_builder& with_transport(transport_config config);
  server_builder& with_stdio();
  server_builder& with_unix_socket(std::string path);
  server_builder& register_method(std::string name, method_handler handler);
  server_builder& register_app_method(
      std::string name, method_handler handler);
  server_builder& register_streaming_method(
      std::string name, streaming_handler handler);

  /// Throws std::runtime_error when no transport was configured.
  std::unique_ptr<server> build(const boost::asio::any_io_executor& executor);

 private:
  std::optional<transport_config> config_;
  std::vector<std::pair<std::string, method_handler>> methods_;
  std::vector<std::pair<std::string, method_handler>> app_methods_;
  std::vector<std::pair<std::string, streaming_handler>> streaming_;
};

}  // namespace kaiak
