#pragma once

/**
 * @file jsonrpc.hpp
 * @brief JSON-RPC 2.0 message shapes, validation and JSON conversion.
 *
 * Requests, responses, error objects and notifications are plain structs.
 * Absent optional members are left out of the serialized object, never
 * written as @c null.  The protocol version travels on the wire under the
 * @c "jsonrpc" key.
 */

#include <boost/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace kaiak::jsonrpc {

namespace json = boost::json;

inline constexpr std::string_view version{"2.0"};

namespace error_codes {
constexpr int parse_error{-32700};
constexpr int invalid_request{-32600};
constexpr int method_not_found{-32601};
constexpr int invalid_params{-32602};
constexpr int internal_error{-32603};
}  // namespace error_codes

struct error_object {
  int code{};
  std::string message;
  std::optional<json::value> data{};

  static error_object custom(
      int code, std::string message,
      std::optional<json::value> data = std::nullopt);
};

/// Exception carrying a JSON-RPC error object.  Handlers throw it to fail a
/// call; the transport throws it when a frame cannot become a request.
class rpc_error : public std::runtime_error {
 public:
  explicit rpc_error(error_object err);
  rpc_error(int code, std::string message,
            std::optional<json::value> data = std::nullopt);

  [[nodiscard]] const error_object& error() const noexcept { return err_; }
  [[nodiscard]] int code() const noexcept { return err_.code; }

 private:
  error_object err_;
};

struct request {
  std::string jsonrpc{version};
  std::string method;
  std::optional<json::value> params{};
  std::optional<json::value> id{};

  static request make(
      std::string method, std::optional<json::value> params,
      std::optional<json::value> id);
  static request notification(
      std::string method, std::optional<json::value> params = std::nullopt);

  [[nodiscard]] bool is_notification() const { return !id.has_value(); }

  /** @brief Structural check applied before dispatch.
   *
   * Throws rpc_error with code @c invalid_request when the version is not
   * "2.0", when the method is empty, or when the method uses the reserved
   * "rpc." prefix.
   */
  void validate() const;
};

struct response {
  std::string jsonrpc{version};
  std::optional<json::value> result{};
  std::optional<error_object> error{};
  std::optional<json::value> id{};

  static response success(json::value result, std::optional<json::value> id);
  static response failure(error_object err, std::optional<json::value> id);

  static response parse_error();
  static response invalid_request(std::optional<json::value> id);
  static response method_not_found(
      std::string_view method, std::optional<json::value> id);
  static response invalid_params(
      std::string_view message, std::optional<json::value> id);
  static response internal_error(
      std::string_view message, std::optional<json::value> id);

  [[nodiscard]] bool is_error() const { return error.has_value(); }
};

struct notification {
  std::string jsonrpc{version};
  std::string method;
  std::optional<json::value> params{};

  static notification make(
      std::string method, std::optional<json::value> params = std::nullopt);
  // "$/progress" with {"token": token, "value": value}
  static notification progress(std::string token, json::value value);
};

// Shapes only; the server dispatches one message per frame.
using batch = std::vector<request>;
using batch_response = std::vector<response>;

json::object to_json(const error_object& err);
json::object to_json(const request& req);
json::object to_json(const response& resp);
json::object to_json(const notification& note);
json::array to_json(const batch& reqs);
json::array to_json(const batch_response& resps);

// The parse_* functions throw rpc_error (parse_error or invalid_request)
// when the value does not have the expected shape.  They do not validate.
request parse_request(const json::value& value);
response parse_response(const json::value& value);
notification parse_notification(const json::value& value);
batch parse_batch(const json::value& value);

// Parse JSON text, turning syntax errors into rpc_error(parse_error).
json::value parse_text(std::string_view text);

}  // namespace kaiak::jsonrpc
