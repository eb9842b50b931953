#include <doctest/doctest.h>

#include <boost/asio/io_context.hpp>
#include <boost/json.hpp>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include "kaiak/jsonrpc.hpp"
#include "kaiak/transport.hpp"
#include "test_helpers.hpp"

namespace asio = boost::asio;
namespace json = boost::json;
namespace fs = std::filesystem;
namespace rpc = kaiak::jsonrpc;
using namespace kaiak::test;  // NOLINT

namespace {

// A stdio_transport reading from one pipe and writing to another.
struct pipe_transport {
  asio::io_context ctx;
  pipe_fds in{make_pipe()};
  pipe_fds out{make_pipe()};
  kaiak::stdio_transport transport{ctx.get_executor(), in.read_fd, out.write_fd};

  pipe_transport() = default;
  pipe_transport(const pipe_transport&) = delete;
  pipe_transport(pipe_transport&&) = delete;
  pipe_transport& operator=(const pipe_transport&) = delete;
  pipe_transport& operator=(pipe_transport&&) = delete;
  ~pipe_transport() {
    transport.close();
    close_fd(in.write_fd);
    close_fd(out.read_fd);
  }

  int read_error_code() {
    try {
      run(ctx, transport.read_request());
    } catch (const rpc::rpc_error& e) {
      return e.code();
    }
    FAIL("expected rpc_error");
    return 0;
  }
};

}  // namespace

TEST_CASE("transport-decode-request") {
  auto req = kaiak::decode_request(R"({"jsonrpc":"2.0","method":"m","id":1})");
  CHECK(req.method == "m");
  CHECK_THROWS_AS(
      kaiak::decode_request(R"({"jsonrpc":"1.0","method":"m","id":1})"),
      rpc::rpc_error);
}

TEST_CASE("transport-stdio-reads-requests-until-eof") {
  pipe_transport t;
  write_all(
      t.in.write_fd,
      frame(json::parse(R"({"jsonrpc":"2.0","method":"a","id":1})")) +
          frame(json::parse(R"({"jsonrpc":"2.0","method":"b"})")));
  close_fd(t.in.write_fd);

  auto first = run(t.ctx, t.transport.read_request());
  REQUIRE(first);
  CHECK(first->method == "a");
  auto second = run(t.ctx, t.transport.read_request());
  REQUIRE(second);
  CHECK(second->method == "b");
  CHECK(second->is_notification());
  CHECK_FALSE(run(t.ctx, t.transport.read_request()).has_value());
}

TEST_CASE("transport-stdio-ignores-extra-headers") {
  pipe_transport t;
  std::string body{R"({"jsonrpc":"2.0","method":"x","id":"q"})"};
  write_all(
      t.in.write_fd,
      "Content-Type: application/vscode-jsonrpc; charset=utf-8\r\n"
      "Content-Length: " +
          std::to_string(body.size()) + "\r\n\r\n" + body);
  auto req = run(t.ctx, t.transport.read_request());
  REQUIRE(req);
  CHECK(req->method == "x");
}

TEST_CASE("transport-stdio-read-faults") {
  pipe_transport t;

  SUBCASE("missing content length") {
    write_all(t.in.write_fd, "Content-Type: text/plain\r\n\r\n{}");
    CHECK(t.read_error_code() == rpc::error_codes::internal_error);
  }
  SUBCASE("bad json") {
    write_all(t.in.write_fd, kaiak::frame_message("{nope"));
    CHECK(t.read_error_code() == rpc::error_codes::parse_error);
  }
  SUBCASE("failed validation") {
    write_all(
        t.in.write_fd,
        frame(json::parse(R"({"jsonrpc":"2.0","method":"rpc.x","id":1})")));
    CHECK(t.read_error_code() == rpc::error_codes::invalid_request);
  }
}

TEST_CASE("transport-stdio-writes-frames") {
  pipe_transport t;
  json::object result;
  result["ok"] = true;
  run(t.ctx, t.transport.write_response(
                 rpc::response::success(result, json::value(3))));
  run(t.ctx, t.transport.write_notification(
                 rpc::notification::make("kaiak/stream/system")));
  t.transport.close();
  t.transport.close();

  auto msgs = split_messages(read_all(t.out.read_fd));
  REQUIRE(msgs.size() == 2);
  CHECK(msgs[0] == json::parse(R"({"jsonrpc":"2.0","result":{"ok":true},"id":3})"));
  CHECK(msgs[1] == json::parse(R"({"jsonrpc":"2.0","method":"kaiak/stream/system"})"));
}

TEST_CASE("transport-descriptions") {
  pipe_transport t;
  CHECK(t.transport.description() == "stdin/stdout");

  auto path = temp_socket_path();
  kaiak::socket_listener_transport listener{t.ctx.get_executor(), path};
  CHECK(listener.description() == "Unix socket server (" + path + ")");
}

TEST_CASE("transport-config") {
  CHECK(std::holds_alternative<kaiak::stdio_config>(
      kaiak::make_transport_config("stdio", std::nullopt)));

  auto sock = kaiak::make_transport_config("socket", std::string{"/tmp/x.sock"});
  REQUIRE(std::holds_alternative<kaiak::unix_socket_config>(sock));
  CHECK(std::get<kaiak::unix_socket_config>(sock).path == "/tmp/x.sock");
  CHECK(kaiak::describe(sock) == "Unix socket (/tmp/x.sock)");
  CHECK(kaiak::describe(kaiak::stdio_config{}) == "stdin/stdout");

  CHECK_THROWS_AS(
      kaiak::make_transport_config("socket", std::nullopt),
      std::invalid_argument);
  CHECK_THROWS_AS(
      kaiak::make_transport_config("tcp", std::nullopt), std::invalid_argument);
}

TEST_CASE("transport-listener-replaces-stale-socket-file") {
  asio::io_context ctx;
  auto path = temp_socket_path();
  std::ofstream{path} << "stale";
  REQUIRE(fs::exists(path));

  {
    kaiak::socket_listener_transport listener{ctx.get_executor(), path};
    CHECK(fs::is_socket(path));
    listener.close();
    CHECK_FALSE(fs::exists(path));
  }
}

TEST_CASE("transport-socket-roundtrip") {
  asio::io_context ctx;
  auto path = temp_socket_path();
  kaiak::socket_listener_transport listener{ctx.get_executor(), path};

  auto exchange = [&]() -> asio::awaitable<std::optional<rpc::request>> {
    auto conn = co_await kaiak::socket_transport::connect(path);
    CHECK(conn->description() == "Unix socket (" + path + ")");
    co_await conn->write_notification(rpc::notification::make(
        "ping", json::value(json::object{})));
    auto got = co_await listener.read_request();
    conn->close();
    co_return got;
  };
  auto req = run(ctx, exchange());
  REQUIRE(req);
  CHECK(req->method == "ping");
  CHECK(req->is_notification());
  listener.close();
}
