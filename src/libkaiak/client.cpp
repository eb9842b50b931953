#include "kaiak/client.hpp"

#include <fmt/format.h>

#include <boost/asio/local/stream_protocol.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/system_error.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <filesystem>
#include <system_error>

#include "kaiak/framing.hpp"
#include "kaiak/methods.hpp"
#include "logger.hpp"
#include "utils.hpp"

namespace asio = boost::asio;
namespace json = boost::json;

namespace kaiak {

namespace fs = std::filesystem;
using utils::throwf;

namespace {

using socket_t = asio::local::stream_protocol::socket;
using endpoint_t = asio::local::stream_protocol::endpoint;

std::string make_uuid() {
  return boost::uuids::to_string(boost::uuids::random_generator{}());
}

// Anything carrying a method and no usable id is pushed by the peer.
bool is_notification(const json::object& msg) {
  if (!msg.contains("method")) return false;
  const auto* id = msg.if_contains("id");
  return id == nullptr || id->is_null();
}

json::value take_result(const json::value& msg, const std::string& expected_id) {
  jsonrpc::response resp{};
  try {
    resp = jsonrpc::parse_response(msg);
  } catch (const jsonrpc::rpc_error& e) {
    throwf<call_error>("Failed to parse response: {}", e.what());
  }

  auto got = resp.id ? utils::id_to_string(*resp.id) : std::string{"null"};
  if (got != expected_id)
    throwf<call_error>(
        "Response ID mismatch: expected {}, got {}", expected_id, got);

  if (resp.error)
    throw call_error{
      fmt::format(
          "JSON-RPC error {}: {}", resp.error->code, resp.error->message),
      resp.error->code};
  if (!resp.result) throw call_error{"Response missing both result and error"};
  return std::move(*resp.result);
}

}  // namespace

client_info client_info::make(std::string socket_path) {
  return {std::string{kaiak::version}, std::move(socket_path), make_uuid()};
}

asio::awaitable<bool> client::validate_connection() const {
  std::error_code fec{};
  if (!fs::exists(socket_path_, fec)) {
    LOG_DEBUG("Socket {} does not exist", socket_path_);
    co_return false;
  }

  socket_t socket{co_await asio::this_coro::executor};
  boost::system::error_code ec{};
  co_await socket.async_connect(
      endpoint_t{socket_path_}, asio::redirect_error(asio::use_awaitable, ec));
  if (ec) {
    LOG_DEBUG("Cannot connect to {}: {}", socket_path_, ec.message());
    co_return false;
  }
  socket.close(ec);
  co_return true;
}

asio::awaitable<json::value> client::call(
    const client_request& req, const notification_sink& sink) const {
  auto id = make_uuid();
  LOG_DEBUG("Calling {} (id {}) on {}", req.method, id, socket_path_);
  if (req.timeout_seconds)
    LOG_DEBUG("Requested timeout: {}s", *req.timeout_seconds);
  if (req.info)
    LOG_DEBUG(
        "Client {} (request {}) via {}", req.info->version,
        req.info->request_id, req.info->socket_path);

  framed_stream<socket_t> stream{socket_t{co_await asio::this_coro::executor}};
  boost::system::error_code ec{};
  co_await stream.next_layer().async_connect(
      endpoint_t{socket_path_}, asio::redirect_error(asio::use_awaitable, ec));
  if (ec)
    throwf<call_error>(
        "Failed to connect to socket {}: {}", socket_path_, ec.message());

  auto msg = jsonrpc::to_json(jsonrpc::request::make(
      req.method, req.params, std::make_optional<json::value>(json::string(id))));
  try {
    co_await stream.write_message(msg);
  } catch (const boost::system::system_error& e) {
    throwf<call_error>("Failed to send request: {}", e.what());
  }

  for (;;) {
    std::optional<std::string> content{};
    try {
      content = co_await stream.read_message();
    } catch (const boost::system::system_error& e) {
      throwf<call_error>("Failed to read response: {}", e.what());
    } catch (const jsonrpc::rpc_error& e) {
      throwf<call_error>("Invalid response frame: {}", e.what());
    }
    if (!content)
      throw call_error{"Connection closed before response was received"};
    LOG_TRACE("Received: {}", *content);

    json::value value{};
    try {
      value = jsonrpc::parse_text(*content);
    } catch (const jsonrpc::rpc_error& e) {
      throwf<call_error>("Failed to parse response: {}", e.what());
    }
    const auto* obj = value.if_object();
    if (obj == nullptr) throw call_error{"Response is not a JSON object"};

    if (!is_notification(*obj)) co_return take_result(value, id);

    jsonrpc::notification note{};
    try {
      note = jsonrpc::parse_notification(value);
    } catch (const jsonrpc::rpc_error& e) {
      throwf<call_error>("Failed to parse notification: {}", e.what());
    }
    LOG_DEBUG("Received notification: {}", note.method);
    if (sink) sink(note);
  }
}

asio::awaitable<json::value> client::generate_fix(
    json::value params, const notification_sink& sink) const {
  client_request req{std::string{methods::generate_fix}, std::move(params)};
  req.with_timeout(300).with_client_info(client_info::make(socket_path_));
  co_return co_await call(req, sink);
}

asio::awaitable<json::value> client::delete_session(
    json::value params, const notification_sink& sink) const {
  client_request req{std::string{methods::delete_session}, std::move(params)};
  req.with_client_info(client_info::make(socket_path_));
  co_return co_await call(req, sink);
}

asio::awaitable<json::value> client::configure(
    json::value params, const notification_sink& sink) const {
  client_request req{std::string{methods::configure}, std::move(params)};
  req.with_client_info(client_info::make(socket_path_));
  co_return co_await call(req, sink);
}

}  // namespace kaiak
