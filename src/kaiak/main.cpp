#include <fmt/format.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/use_future.hpp>
#include <boost/json.hpp>
#include <csignal>
#include <exception>
#include <iostream>
#include <span>

#include "../libkaiak/logger.hpp"
#include "kaiak/client.hpp"
#include "kaiak/server.hpp"
#include "options.hpp"

namespace asio = boost::asio;
namespace json = boost::json;

namespace {

void register_lifecycle(kaiak::server& srv) {
  srv.register_method(
      "initialize",
      [&srv](std::optional<json::value>) -> asio::awaitable<json::value> {
        json::object server_info;
        server_info["name"] = "kaiak";
        server_info["version"] = kaiak::version;

        json::array methods;
        for (auto&& m : srv.registered_methods()) methods.emplace_back(m);

        json::object capabilities;
        capabilities["methods"] = std::move(methods);

        json::object result;
        result["serverInfo"] = std::move(server_info);
        result["capabilities"] = std::move(capabilities);
        co_return result;
      });
  // The reply still goes out: stop() lets the current request finish.
  srv.register_method(
      "shutdown",
      [&srv](std::optional<json::value>) -> asio::awaitable<json::value> {
        srv.stop();
        co_return nullptr;
      });
  srv.register_method(
      "exit",
      [&srv](std::optional<json::value>) -> asio::awaitable<json::value> {
        srv.stop();
        co_return nullptr;
      });
}

int serve(const kaiak::cli_options& opts) {
  asio::io_context ctx;
  auto config = kaiak::make_transport_config(opts.transport, opts.socket_path);
  auto srv = kaiak::server_builder{}.with_transport(config).build(
      ctx.get_executor());
  register_lifecycle(*srv);

  asio::signal_set signals{ctx, SIGINT, SIGTERM};
  signals.async_wait([&](const boost::system::error_code& ec, int signo) {
    if (ec) return;
    LOG_INFO("Received signal {}", signo);
    srv->stop();
  });

  int retval{0};
  asio::co_spawn(ctx, srv->start(), [&](const std::exception_ptr& e) {
    signals.cancel();
    if (!e) return;
    try {
      std::rethrow_exception(e);
    } catch (const std::exception& ex) {
      LOG_FATAL("Server failed: {}", ex.what());
      retval = 1;
    }
  });
  ctx.run();
  return retval;
}

void print_notification(const kaiak::jsonrpc::notification& note) {
  fmt::print(stderr, "{}\n", json::serialize(kaiak::jsonrpc::to_json(note)));
}

std::optional<json::value> params_of(const kaiak::cli_options& opts) {
  if (!opts.params) return std::nullopt;
  return kaiak::jsonrpc::parse_text(*opts.params);
}

asio::awaitable<json::value> run_client(const kaiak::cli_options& opts) {
  kaiak::client cli{opts.socket_path};
  switch (opts.cmd) {
  case kaiak::command::call:
    co_return co_await cli.call(
        kaiak::client_request{opts.method, params_of(opts)},
        print_notification);
  case kaiak::command::generate_fix:
    co_return co_await cli.generate_fix(
        params_of(opts).value_or(json::object{}), print_notification);
  case kaiak::command::delete_session: {
    json::object params;
    params["session_id"] = opts.session_id;
    co_return co_await cli.delete_session(
        std::move(params), print_notification);
  }
  case kaiak::command::ping:
    co_return co_await cli.validate_connection();
  default:
    break;
  }
  co_return nullptr;
}

int client_main(const kaiak::cli_options& opts) {
  asio::io_context ctx;
  auto result = asio::co_spawn(ctx, run_client(opts), asio::use_future);
  ctx.run();
  try {
    auto value = result.get();
    std::cout << json::serialize(value) << "\n";
    if (opts.cmd == kaiak::command::ping && !value.as_bool()) return 1;
    return 0;
  } catch (const kaiak::call_error& e) {
    std::cerr << e.what() << "\n";
    return e.code() ? 2 : 1;
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 1;
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  kaiak::cli_options opts{};

  auto done = kaiak::parse_options(std::span(argv, argc), opts);
  if (done) return done.value();

  kaiak::logger::set_level(static_cast<kaiak::logger::level>(opts.loglevel));
  LOG_DEBUG("loglevel={}", opts.loglevel);

  try {
    if (opts.cmd == kaiak::command::serve) return serve(opts);
    return client_main(opts);
  } catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << "\n";
    return 1;
  }
}
