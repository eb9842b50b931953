#include "options.hpp"

#include <CLI/CLI.hpp>
#include <optional>

#include "kaiak/transport.hpp"

namespace kaiak {

std::optional<int> parse_options(std::span<char*> args, cli_options& opts) {
  CLI::App app{"JSON-RPC agent bridge over stdio or Unix sockets"};
  opts.socket_path = std::string{default_socket_path};

  app.add_option("-d, --debug", opts.loglevel, "Debug log level (3=INFO)")
    ->capture_default_str();
  app.require_subcommand(1);

  auto* serve = app.add_subcommand("serve", "Serve JSON-RPC requests");
  serve
    ->add_option("--transport", opts.transport, "Transport to serve on")
    ->check(CLI::IsMember({"stdio", "socket"}))
    ->capture_default_str();
  serve
    ->add_option(
        "--socket-path", opts.socket_path,
        "Socket path for the socket transport")
    ->capture_default_str();

  auto* call = app.add_subcommand("call", "Call a method on a running server");
  call->add_option("--socket-path", opts.socket_path, "Server socket path")
    ->capture_default_str();
  call->add_option("--method", opts.method, "Method name")->required();
  call->add_option("--params", opts.params, "Parameters as JSON text");

  auto* fix = app.add_subcommand("generate-fix", "Request a fix generation");
  fix->add_option("--socket-path", opts.socket_path, "Server socket path")
    ->capture_default_str();
  fix->add_option("--params", opts.params, "Parameters as JSON text");

  auto* del = app.add_subcommand("delete-session", "Delete an agent session");
  del->add_option("--socket-path", opts.socket_path, "Server socket path")
    ->capture_default_str();
  del->add_option("session-id", opts.session_id, "Session to delete")
    ->required();

  auto* ping = app.add_subcommand("ping", "Check that a server is listening");
  ping->add_option("--socket-path", opts.socket_path, "Server socket path")
    ->capture_default_str();

  try {
    app.parse(std::vector<std::string>(args.begin() + 1, args.end()));
  } catch (const CLI::ParseError& e) {
    return app.exit(e);
  }

  if (call->parsed())
    opts.cmd = command::call;
  else if (fix->parsed())
    opts.cmd = command::generate_fix;
  else if (del->parsed())
    opts.cmd = command::delete_session;
  else if (ping->parsed())
    opts.cmd = command::ping;
  else
    opts.cmd = command::serve;

  return std::nullopt;
}

}  // namespace kaiak
