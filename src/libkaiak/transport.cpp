#include "kaiak/transport.hpp"

#include <fmt/format.h>
#include <unistd.h>

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/system_error.hpp>
#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "logger.hpp"
#include "utils.hpp"

namespace asio = boost::asio;
namespace json = boost::json;

namespace kaiak {

namespace fs = std::filesystem;
using utils::throwf;
using namespace std::chrono_literals;

jsonrpc::request decode_request(std::string_view content) {
  auto value = jsonrpc::parse_text(content);
  auto req = jsonrpc::parse_request(value);
  req.validate();
  return req;
}

namespace {

template <typename Stream>
asio::awaitable<std::optional<jsonrpc::request>> read_frame(
    framed_stream<Stream>& stream) {
  auto content = co_await stream.read_message();
  if (!content) co_return std::nullopt;
  LOG_DEBUG("Received message: {} bytes", content->size());
  LOG_TRACE("Message content: {}", *content);
  co_return decode_request(*content);
}

template <typename Stream>
asio::awaitable<void> write_frame(
    framed_stream<Stream>& stream, const json::object& msg) {
  auto content = json::serialize(msg);
  co_await stream.write_content(content);
  LOG_DEBUG("Sent message: {} bytes", content.size());
  LOG_TRACE("Message content: {}", content);
}

constexpr auto accept_backoff{100ms};

int checked_dup(int fd) {
  int copy = ::dup(fd);
  if (copy < 0)
    throwf(
        "dup({}) failed: {}", fd,
        std::error_code{errno, std::system_category()}.message());
  return copy;
}

}  // namespace

/// stdio_transport

stdio_transport::stdio_transport(const asio::any_io_executor& executor)
    : stdio_transport{
        executor, checked_dup(STDIN_FILENO), checked_dup(STDOUT_FILENO)} {}

stdio_transport::stdio_transport(
    const asio::any_io_executor& executor, int in_fd, int out_fd)
    : in_{descriptor_t{executor, in_fd}}, out_{descriptor_t{executor, out_fd}} {}

asio::awaitable<std::optional<jsonrpc::request>>
stdio_transport::read_request() {
  co_return co_await read_frame(in_);
}

asio::awaitable<void> stdio_transport::write_response(
    const jsonrpc::response& resp) {
  co_await write_frame(out_, jsonrpc::to_json(resp));
}

asio::awaitable<void> stdio_transport::write_notification(
    const jsonrpc::notification& note) {
  co_await write_frame(out_, jsonrpc::to_json(note));
}

void stdio_transport::close() {
  if (!in_.is_open() && !out_.is_open()) return;
  in_.close();
  out_.close();
  LOG_DEBUG("Stdio transport closed");
}

std::string stdio_transport::description() const { return "stdin/stdout"; }

asio::any_io_executor stdio_transport::get_executor() {
  return in_.next_layer().get_executor();
}

/// socket_transport

socket_transport::socket_transport(socket_t socket, std::string path)
    : stream_{std::move(socket)}, path_{std::move(path)} {}

asio::awaitable<std::unique_ptr<socket_transport>> socket_transport::connect(
    std::string path) {
  auto executor = co_await asio::this_coro::executor;
  socket_t socket{executor};
  co_await socket.async_connect(
      asio::local::stream_protocol::endpoint{path}, asio::use_awaitable);
  LOG_DEBUG("Connected to {}", path);
  co_return std::make_unique<socket_transport>(
      std::move(socket), std::move(path));
}

asio::awaitable<std::optional<jsonrpc::request>>
socket_transport::read_request() {
  co_return co_await read_frame(stream_);
}

asio::awaitable<void> socket_transport::write_response(
    const jsonrpc::response& resp) {
  co_await write_frame(stream_, jsonrpc::to_json(resp));
}

asio::awaitable<void> socket_transport::write_notification(
    const jsonrpc::notification& note) {
  co_await write_frame(stream_, jsonrpc::to_json(note));
}

void socket_transport::close() {
  if (!stream_.is_open()) return;
  boost::system::error_code ec{};
  stream_.next_layer().shutdown(socket_t::shutdown_both, ec);
  stream_.close();
  LOG_DEBUG("Socket transport closed: {}", path_);
}

std::string socket_transport::description() const {
  return fmt::format("Unix socket ({})", path_);
}

asio::any_io_executor socket_transport::get_executor() {
  return stream_.next_layer().get_executor();
}

/// socket_listener_transport

socket_listener_transport::socket_listener_transport(
    const asio::any_io_executor& executor, std::string path)
    : acceptor_{executor}, path_{std::move(path)} {
  std::error_code fec{};
  if (fs::exists(path_, fec)) {
    fs::remove(path_, fec);
    if (fec)
      throwf(
          "Failed to remove existing socket file {}: {}", path_,
          fec.message());
  }

  asio::local::stream_protocol::endpoint endpoint{path_};
  boost::system::error_code ec{};
  acceptor_.open(endpoint.protocol(), ec);
  if (!ec) acceptor_.bind(endpoint, ec);
  if (!ec) acceptor_.listen(asio::socket_base::max_listen_connections, ec);
  if (ec) throwf("Failed to bind to socket {}: {}", path_, ec.message());

  LOG_DEBUG("Listening on {}", path_);
}

socket_listener_transport::~socket_listener_transport() { close(); }

socket_transport& socket_listener_transport::connection() {
  if (!current_) throwf("No active connection on {}", path_);
  return *current_;
}

asio::awaitable<std::optional<jsonrpc::request>>
socket_listener_transport::read_request() {
  while (!closed_) {
    if (!current_) {
      LOG_DEBUG("Waiting for client connection on {}", path_);
      std::optional<socket_transport::socket_t> accepted{};
      try {
        accepted = co_await acceptor_.async_accept(asio::use_awaitable);
      } catch (const boost::system::system_error& e) {
        if (closed_) throw;
        // EMFILE, ECONNABORTED and friends: the listener itself is fine.
        LOG_WARN("Failed to accept connection on {}: {}", path_, e.what());
      }
      if (!accepted) {
        asio::steady_timer backoff{acceptor_.get_executor(), accept_backoff};
        boost::system::error_code ec{};
        co_await backoff.async_wait(asio::redirect_error(asio::use_awaitable, ec));
        continue;
      }
      current_ =
          std::make_unique<socket_transport>(std::move(*accepted), path_);
      LOG_DEBUG("Client connected to {}", path_);
    }

    // Framing and validation errors propagate so that the server can
    // answer on this connection; only a lost connection moves on.
    try {
      auto req = co_await current_->read_request();
      if (req) co_return std::move(req);
      LOG_DEBUG("Client disconnected from {}", path_);
    } catch (const boost::system::system_error& e) {
      LOG_DEBUG("Connection error (will accept new connection): {}", e.what());
    }
    current_->close();
    current_.reset();
  }
  co_return std::nullopt;
}

asio::awaitable<void> socket_listener_transport::write_response(
    const jsonrpc::response& resp) {
  co_await connection().write_response(resp);
}

asio::awaitable<void> socket_listener_transport::write_notification(
    const jsonrpc::notification& note) {
  co_await connection().write_notification(note);
}

void socket_listener_transport::close() {
  if (closed_) return;
  closed_ = true;

  // The connection object stays alive: a pending read may still be using
  // it.  read_request() drops it once that read fails.
  if (current_) current_->close();

  boost::system::error_code ec{};
  acceptor_.close(ec);

  std::error_code fec{};
  fs::remove(path_, fec);
  if (fec) LOG_WARN("Failed to remove socket file {}: {}", path_, fec.message());
  LOG_DEBUG("Socket server transport closed: {}", path_);
}

std::string socket_listener_transport::description() const {
  return fmt::format("Unix socket server ({})", path_);
}

asio::any_io_executor socket_listener_transport::get_executor() {
  return acceptor_.get_executor();
}

/// Transport selection

transport_config make_transport_config(
    std::string_view kind, const std::optional<std::string>& socket_path) {
  if (kind == "stdio") return stdio_config{};
  if (kind == "socket") {
    if (!socket_path)
      throwf<std::invalid_argument>(
          "Socket path is required when using socket transport");
    return unix_socket_config{*socket_path};
  }
  throwf<std::invalid_argument>("Unsupported transport type: {}", kind);
}

std::string describe(const transport_config& config) {
  if (const auto* sock = std::get_if<unix_socket_config>(&config))
    return fmt::format("Unix socket ({})", sock->path);
  return "stdin/stdout";
}

std::unique_ptr<transport> make_server_transport(
    const asio::any_io_executor& executor, const transport_config& config) {
  if (const auto* sock = std::get_if<unix_socket_config>(&config))
    return std::make_unique<socket_listener_transport>(executor, sock->path);
  return std::make_unique<stdio_transport>(executor);
}

}  // namespace kaiak
