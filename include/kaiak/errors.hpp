#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "kaiak/jsonrpc.hpp"

namespace kaiak {

// Application codes, inside the server-error block.  Related kinds share
// a code and are told apart by data.error_type.
namespace error_codes {
constexpr int transport_error{-32001};
constexpr int session_error{-32003};        // session, session_not_found
constexpr int agent_error{-32010};          // agent, agent_integration
constexpr int workspace_error{-32011};      // workspace, invalid_workspace_path
constexpr int operation_failed{-32012};     // agent_initialization, file_operation
constexpr int execution_blocked{-32013};    // session_in_use, tool_execution
constexpr int configuration_error{-32014};  // configuration, interaction_timeout
constexpr int resource_exhausted{-32015};
constexpr int io_error{-32016};
constexpr int serialization_error{-32017};
}  // namespace error_codes

enum class error_kind : uint8_t {
  configuration,
  session,
  session_not_found,
  agent,
  workspace,
  agent_initialization,
  session_in_use,
  resource_exhausted,
  io,
  serialization,
  transport,
  invalid_workspace_path,
  internal,
  agent_integration,
  tool_execution,
  interaction_timeout,
  file_operation,
};

std::string_view error_kind_name(error_kind kind);

/// JSON-RPC code for @p kind.  Several kinds share a code.
int error_code(error_kind kind);

/// Error raised by the layers above the RPC engine (sessions, agents,
/// workspaces).  @c context holds the session id or workspace path when
/// one is known.
class app_error : public std::runtime_error {
 public:
  app_error(
      error_kind kind, std::string message,
      std::optional<std::string> context = std::nullopt);

  [[nodiscard]] error_kind kind() const noexcept { return kind_; }
  [[nodiscard]] const std::string& message() const noexcept {
    return message_;
  }
  [[nodiscard]] const std::optional<std::string>& context() const noexcept {
    return context_;
  }

  [[nodiscard]] std::string user_message() const;

  static app_error configuration(std::string message);
  static app_error session(
      std::string message, std::optional<std::string> session_id = {});
  static app_error session_not_found(std::string session_id);
  static app_error agent(std::string message);
  static app_error workspace(
      std::string message, std::optional<std::string> path = {});
  static app_error transport(std::string message);
  static app_error internal(std::string message);

 private:
  error_kind kind_;
  std::string message_;
  std::optional<std::string> context_;
};

/// Total mapping onto the protocol error shape: code, user message and
/// {"error_type": <kind name>} as data.
jsonrpc::error_object to_rpc_error(const app_error& err);

}  // namespace kaiak
