#include "kaiak/jsonrpc.hpp"

#include <fmt/format.h>

#include <system_error>
#include <utility>

namespace kaiak::jsonrpc {

/// Error object

error_object error_object::custom(
    int code, std::string message, std::optional<json::value> data) {
  return error_object{code, std::move(message), std::move(data)};
}

rpc_error::rpc_error(error_object err)
    : std::runtime_error{err.message}, err_{std::move(err)} {}

rpc_error::rpc_error(
    int code, std::string message, std::optional<json::value> data)
    : rpc_error{error_object{code, std::move(message), std::move(data)}} {}

/// Request

request request::make(
    std::string method, std::optional<json::value> params,
    std::optional<json::value> id) {
  request req{};
  req.method = std::move(method);
  req.params = std::move(params);
  req.id = std::move(id);
  return req;
}

request request::notification(
    std::string method, std::optional<json::value> params) {
  return make(std::move(method), std::move(params), std::nullopt);
}

void request::validate() const {
  if (jsonrpc != version)
    throw rpc_error{error_codes::invalid_request, "Invalid JSON-RPC version"};
  if (method.empty())
    throw rpc_error{
      error_codes::invalid_request, "Method name cannot be empty"};
  if (method.starts_with("rpc."))
    throw rpc_error{
      error_codes::invalid_request,
      "Method names starting with 'rpc.' are reserved"};
}

/// Response

response response::success(json::value result, std::optional<json::value> id) {
  response resp{};
  resp.result = std::move(result);
  resp.id = std::move(id);
  return resp;
}

response response::failure(error_object err, std::optional<json::value> id) {
  response resp{};
  resp.error = std::move(err);
  resp.id = std::move(id);
  return resp;
}

response response::parse_error() {
  return failure({error_codes::parse_error, "Parse error"}, std::nullopt);
}

response response::invalid_request(std::optional<json::value> id) {
  return failure(
      {error_codes::invalid_request, "Invalid Request"}, std::move(id));
}

response response::method_not_found(
    std::string_view method, std::optional<json::value> id) {
  json::object data{};
  data["method"] = method;
  return failure(
      {error_codes::method_not_found, "Method not found", std::move(data)},
      std::move(id));
}

response response::invalid_params(
    std::string_view message, std::optional<json::value> id) {
  return failure(
      {error_codes::invalid_params, fmt::format("Invalid params: {}", message)},
      std::move(id));
}

response response::internal_error(
    std::string_view message, std::optional<json::value> id) {
  return failure(
      {error_codes::internal_error, fmt::format("Internal error: {}", message)},
      std::move(id));
}

/// Notification

notification notification::make(
    std::string method, std::optional<json::value> params) {
  notification note{};
  note.method = std::move(method);
  note.params = std::move(params);
  return note;
}

notification notification::progress(std::string token, json::value value) {
  json::object params{};
  params["token"] = std::move(token);
  params["value"] = std::move(value);
  return make("$/progress", json::value(std::move(params)));
}

/// Serialization

json::object to_json(const error_object& err) {
  json::object obj{};
  obj["code"] = err.code;
  obj["message"] = err.message;
  if (err.data) obj["data"] = *err.data;
  return obj;
}

json::object to_json(const request& req) {
  json::object obj{};
  obj["jsonrpc"] = req.jsonrpc;
  obj["method"] = req.method;
  if (req.params) obj["params"] = *req.params;
  if (req.id) obj["id"] = *req.id;
  return obj;
}

json::object to_json(const response& resp) {
  json::object obj{};
  obj["jsonrpc"] = resp.jsonrpc;
  if (resp.result) obj["result"] = *resp.result;
  if (resp.error) obj["error"] = to_json(*resp.error);
  if (resp.id) obj["id"] = *resp.id;
  return obj;
}

json::object to_json(const notification& note) {
  json::object obj{};
  obj["jsonrpc"] = note.jsonrpc;
  obj["method"] = note.method;
  if (note.params) obj["params"] = *note.params;
  return obj;
}

json::array to_json(const batch& reqs) {
  json::array arr{};
  for (const auto& r : reqs) arr.push_back(to_json(r));
  return arr;
}

json::array to_json(const batch_response& resps) {
  json::array arr{};
  for (const auto& r : resps) arr.push_back(to_json(r));
  return arr;
}

/// Parsing

namespace {

const json::object& expect_object(const json::value& value, int code) {
  const auto* obj = value.if_object();
  if (!obj) throw rpc_error{code, "Message must be a JSON object"};
  return *obj;
}

std::string get_string(
    const json::object& obj, std::string_view key, int code) {
  auto it = obj.find(key);
  if (it == obj.end())
    throw rpc_error{code, fmt::format("missing field '{}'", key)};
  const auto* s = it->value().if_string();
  if (!s) throw rpc_error{code, fmt::format("field '{}' must be a string", key)};
  return std::string{*s};
}

std::optional<json::value> get_optional(
    const json::object& obj, std::string_view key) {
  if (auto it = obj.find(key); it != obj.end()) return it->value();
  return std::nullopt;
}

error_object parse_error_object(const json::value& value) {
  const auto& obj = expect_object(value, error_codes::parse_error);
  error_object err{};
  auto code = obj.find("code");
  if (code == obj.end() || !code->value().is_number())
    throw rpc_error{error_codes::parse_error, "error object without code"};
  boost::system::error_code ec{};
  err.code = code->value().to_number<int>(ec);
  if (ec)
    throw rpc_error{error_codes::parse_error, "error code is not an integer"};
  err.message = get_string(obj, "message", error_codes::parse_error);
  err.data = get_optional(obj, "data");
  return err;
}

}  // namespace

request parse_request(const json::value& value) {
  const auto& obj = expect_object(value, error_codes::invalid_request);
  request req{};
  req.jsonrpc = get_string(obj, "jsonrpc", error_codes::invalid_request);
  req.method = get_string(obj, "method", error_codes::invalid_request);
  req.params = get_optional(obj, "params");
  // A present "id" key makes this a request, even when it is null.
  req.id = get_optional(obj, "id");
  return req;
}

response parse_response(const json::value& value) {
  const auto& obj = expect_object(value, error_codes::parse_error);
  response resp{};
  resp.jsonrpc = get_string(obj, "jsonrpc", error_codes::parse_error);
  resp.result = get_optional(obj, "result");
  if (auto err = get_optional(obj, "error"); err && !err->is_null())
    resp.error = parse_error_object(*err);
  resp.id = get_optional(obj, "id");
  return resp;
}

notification parse_notification(const json::value& value) {
  const auto& obj = expect_object(value, error_codes::parse_error);
  notification note{};
  note.jsonrpc = get_string(obj, "jsonrpc", error_codes::parse_error);
  note.method = get_string(obj, "method", error_codes::parse_error);
  note.params = get_optional(obj, "params");
  return note;
}

batch parse_batch(const json::value& value) {
  const auto* arr = value.if_array();
  if (!arr)
    throw rpc_error{error_codes::invalid_request, "Batch must be an array"};
  batch reqs{};
  reqs.reserve(arr->size());
  for (const auto& v : *arr) reqs.push_back(parse_request(v));
  return reqs;
}

json::value parse_text(std::string_view text) {
  std::error_code ec{};
  json::value parsed = json::parse(text, ec);
  if (ec)
    throw rpc_error{
      error_codes::parse_error, fmt::format("Parse error: {}", ec.message())};
  return parsed;
}

}  // namespace kaiak::jsonrpc
