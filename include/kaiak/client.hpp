#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/json.hpp>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>

#include "kaiak/jsonrpc.hpp"

namespace kaiak {

inline constexpr std::string_view version{"0.1.0"};

/// Identification attached to outgoing calls.  Each instance gets a fresh
/// request id.
struct client_info {
  std::string version;
  std::string socket_path;
  std::string request_id;

  static client_info make(std::string socket_path);
};

struct client_request {
  std::string method;
  std::optional<boost::json::value> params{};
  std::optional<unsigned> timeout_seconds{};
  std::optional<client_info> info{};

  client_request& with_timeout(unsigned seconds) {
    timeout_seconds = seconds;
    return *this;
  }
  client_request& with_client_info(client_info ci) {
    info = std::move(ci);
    return *this;
  }
};

using notification_sink = std::function<void(const jsonrpc::notification&)>;

/// Failure of a call.  code() is set when the peer answered with a
/// JSON-RPC error.
class call_error : public std::runtime_error {
 public:
  explicit call_error(
      const std::string& message, std::optional<int> code = std::nullopt)
      : std::runtime_error{message}, code_{code} {}

  [[nodiscard]] std::optional<int> code() const noexcept { return code_; }

 private:
  std::optional<int> code_;
};

/** @brief One-shot JSON-RPC client over a Unix domain socket.
 *
 * Every call opens its own connection, sends a single request, forwards
 * the notifications the peer writes meanwhile, and returns the result of
 * the response carrying its id.  Calls have no deadline: race them against
 * a timer to bound them.
 */
class client {
 public:
  explicit client(std::string socket_path)
      : socket_path_{std::move(socket_path)} {}

  [[nodiscard]] const std::string& socket_path() const { return socket_path_; }

  /// False when nothing listens at socket_path().
  boost::asio::awaitable<bool> validate_connection() const;

  /// Throws call_error.
  boost::asio::awaitable<boost::json::value> call(
      const client_request& req, const notification_sink& sink = {}) const;

  boost::asio::awaitable<boost::json::value> generate_fix(
      boost::json::value params, const notification_sink& sink = {}) const;
  boost::asio::awaitable<boost::json::value> delete_session(
      boost::json::value params, const notification_sink& sink = {}) const;
  boost::asio::awaitable<boost::json::value> configure(
      boost::json::value params, const notification_sink& sink = {}) const;

 private:
  std::string socket_path_;
};

}  // namespace kaiak
