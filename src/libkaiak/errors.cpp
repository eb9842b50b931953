#include "kaiak/errors.hpp"

#include <fmt/format.h>

#include <utility>

namespace kaiak {

namespace json = boost::json;

std::string_view error_kind_name(error_kind kind) {
  // clang-format off
  switch (kind) {
  case error_kind::configuration:          return "configuration";
  case error_kind::session:                return "session";
  case error_kind::session_not_found:      return "session_not_found";
  case error_kind::agent:                  return "agent";
  case error_kind::workspace:              return "workspace";
  case error_kind::agent_initialization:   return "agent_initialization";
  case error_kind::session_in_use:         return "session_in_use";
  case error_kind::resource_exhausted:     return "resource_exhausted";
  case error_kind::io:                     return "io";
  case error_kind::serialization:          return "serialization";
  case error_kind::transport:              return "transport";
  case error_kind::invalid_workspace_path: return "invalid_workspace_path";
  case error_kind::internal:               return "internal";
  case error_kind::agent_integration:      return "agent_integration";
  case error_kind::tool_execution:         return "tool_execution";
  case error_kind::interaction_timeout:    return "interaction_timeout";
  case error_kind::file_operation:         return "file_operation";
  }
  // clang-format on
  return "unknown";
}

int error_code(error_kind kind) {
  using namespace error_codes;
  // clang-format off
  switch (kind) {
  case error_kind::configuration:          return configuration_error;
  case error_kind::session:                return session_error;
  case error_kind::session_not_found:      return session_error;
  case error_kind::agent:                  return agent_error;
  case error_kind::workspace:              return workspace_error;
  case error_kind::agent_initialization:   return operation_failed;
  case error_kind::session_in_use:         return execution_blocked;
  case error_kind::resource_exhausted:     return resource_exhausted;
  case error_kind::io:                     return io_error;
  case error_kind::serialization:          return serialization_error;
  case error_kind::transport:              return transport_error;
  case error_kind::invalid_workspace_path: return workspace_error;
  case error_kind::internal:               return jsonrpc::error_codes::internal_error;
  case error_kind::agent_integration:      return agent_error;
  case error_kind::tool_execution:         return execution_blocked;
  case error_kind::interaction_timeout:    return configuration_error;
  case error_kind::file_operation:         return operation_failed;
  }
  // clang-format on
  return jsonrpc::error_codes::internal_error;
}

app_error::app_error(
    error_kind kind, std::string message, std::optional<std::string> context)
    : std::runtime_error{message},
      kind_{kind},
      message_{std::move(message)},
      context_{std::move(context)} {}

std::string app_error::user_message() const {
  switch (kind_) {
    case error_kind::configuration:
      return fmt::format("Configuration issue: {}", message_);
    case error_kind::session:
      if (context_)
        return fmt::format("Session error ({}): {}", *context_, message_);
      return fmt::format("Session error: {}", message_);
    case error_kind::session_not_found:
      return fmt::format("Session not found: {}", context_.value_or(message_));
    case error_kind::agent:
      return fmt::format("AI agent error: {}", message_);
    case error_kind::workspace:
      if (context_)
        return fmt::format("Workspace error ({}): {}", *context_, message_);
      return fmt::format("Workspace error: {}", message_);
    case error_kind::agent_initialization:
      return fmt::format("Agent initialization failed: {}", message_);
    case error_kind::session_in_use:
      return fmt::format("Session in use: {}", message_);
    case error_kind::resource_exhausted:
      return fmt::format("Resource exhausted: {}", message_);
    case error_kind::io:
      return fmt::format("File system error: {}", message_);
    case error_kind::serialization:
      return fmt::format("Data format error: {}", message_);
    case error_kind::transport:
      return fmt::format("Communication error: {}", message_);
    case error_kind::invalid_workspace_path:
      return fmt::format("Invalid workspace path: {}", message_);
    case error_kind::internal:
      return fmt::format("Internal error: {}", message_);
    case error_kind::agent_integration:
      return fmt::format("Agent integration error: {}", message_);
    case error_kind::tool_execution:
      return fmt::format("Tool execution failed: {}", message_);
    case error_kind::interaction_timeout:
      return fmt::format("Interaction timed out: {}", message_);
    case error_kind::file_operation:
      return fmt::format("File operation failed: {}", message_);
  }
  return message_;
}

app_error app_error::configuration(std::string message) {
  return {error_kind::configuration, std::move(message)};
}

app_error app_error::session(
    std::string message, std::optional<std::string> session_id) {
  return {error_kind::session, std::move(message), std::move(session_id)};
}

app_error app_error::session_not_found(std::string session_id) {
  std::string message{fmt::format("no session with id {}", session_id)};
  return {error_kind::session_not_found, std::move(message),
          std::move(session_id)};
}

app_error app_error::agent(std::string message) {
  return {error_kind::agent, std::move(message)};
}

app_error app_error::workspace(
    std::string message, std::optional<std::string> path) {
  return {error_kind::workspace, std::move(message), std::move(path)};
}

app_error app_error::transport(std::string message) {
  return {error_kind::transport, std::move(message)};
}

app_error app_error::internal(std::string message) {
  return {error_kind::internal, std::move(message)};
}

jsonrpc::error_object to_rpc_error(const app_error& err) {
  json::object data{};
  data["error_type"] = error_kind_name(err.kind());
  return jsonrpc::error_object::custom(
      error_code(err.kind()), err.user_message(), json::value(std::move(data)));
}

}  // namespace kaiak
