#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "kaiak/framing.hpp"
#include "kaiak/jsonrpc.hpp"

namespace kaiak {

/** @brief A duplex connection carrying framed JSON-RPC messages.
 *
 * read_request() yields the next validated request, or an empty optional
 * when the peer is gone.  It throws jsonrpc::rpc_error when a frame can't
 * be turned into a valid request (missing header, bad JSON, failed
 * validation) and boost::system::system_error when the connection itself
 * fails.  Writes are atomic per frame.
 */
class transport {
 public:
  transport() = default;
  transport(const transport&) = delete;
  transport(transport&&) = delete;
  transport& operator=(const transport&) = delete;
  transport& operator=(transport&&) = delete;
  virtual ~transport() = default;

  virtual boost::asio::awaitable<std::optional<jsonrpc::request>>
  read_request() = 0;
  virtual boost::asio::awaitable<void> write_response(
      const jsonrpc::response& resp) = 0;
  virtual boost::asio::awaitable<void> write_notification(
      const jsonrpc::notification& note) = 0;
  // Idempotent.
  virtual void close() = 0;
  [[nodiscard]] virtual std::string description() const = 0;
  /// The executor every operation on this transport must run on.
  virtual boost::asio::any_io_executor get_executor() = 0;
};

/// Turn one frame's content into a validated request.
jsonrpc::request decode_request(std::string_view content);

/// Process stdin/stdout, or any pair of descriptors.  The descriptors must
/// support epoll (pipes, ttys, sockets); regular files do not.
class stdio_transport : public transport {
 public:
  using descriptor_t = boost::asio::posix::stream_descriptor;

  // Duplicates STDIN_FILENO and STDOUT_FILENO.
  explicit stdio_transport(const boost::asio::any_io_executor& executor);
  // Takes ownership of both descriptors.
  stdio_transport(
      const boost::asio::any_io_executor& executor, int in_fd, int out_fd);

  boost::asio::awaitable<std::optional<jsonrpc::request>> read_request()
      override;
  boost::asio::awaitable<void> write_response(
      const jsonrpc::response& resp) override;
  boost::asio::awaitable<void> write_notification(
      const jsonrpc::notification& note) override;
  void close() override;
  [[nodiscard]] std::string description() const override;
  boost::asio::any_io_executor get_executor() override;

 private:
  framed_stream<descriptor_t> in_;
  framed_stream<descriptor_t> out_;
};

/// One connected Unix domain socket.
class socket_transport : public transport {
 public:
  using socket_t = boost::asio::local::stream_protocol::socket;

  socket_transport(socket_t socket, std::string path);

  /// Client-side constructor: connect to the server listening on @p path.
  static boost::asio::awaitable<std::unique_ptr<socket_transport>> connect(
      std::string path);

  boost::asio::awaitable<std::optional<jsonrpc::request>> read_request()
      override;
  boost::asio::awaitable<void> write_response(
      const jsonrpc::response& resp) override;
  boost::asio::awaitable<void> write_notification(
      const jsonrpc::notification& note) override;
  void close() override;
  [[nodiscard]] std::string description() const override;
  boost::asio::any_io_executor get_executor() override;

 private:
  framed_stream<socket_t> stream_;
  std::string path_;
};

/// Listens on a Unix socket path and serves one client connection at a
/// time.  When a client disconnects the next one is accepted, so
/// read_request() only returns empty once the listener is closed.
class socket_listener_transport : public transport {
 public:
  // Binds immediately, replacing a stale socket file at @p path.
  socket_listener_transport(
      const boost::asio::any_io_executor& executor, std::string path);
  ~socket_listener_transport() override;

  boost::asio::awaitable<std::optional<jsonrpc::request>> read_request()
      override;
  boost::asio::awaitable<void> write_response(
      const jsonrpc::response& resp) override;
  boost::asio::awaitable<void> write_notification(
      const jsonrpc::notification& note) override;
  // Also removes the socket file.
  void close() override;
  [[nodiscard]] std::string description() const override;
  boost::asio::any_io_executor get_executor() override;

 private:
  socket_transport& connection();

  boost::asio::local::stream_protocol::acceptor acceptor_;
  std::string path_;
  std::unique_ptr<socket_transport> current_;
  bool closed_{false};
};

/// Transport selection

struct stdio_config {};
struct unix_socket_config {
  std::string path;
};
using transport_config = std::variant<stdio_config, unix_socket_config>;

inline constexpr std::string_view default_socket_path{"/tmp/kaiak.sock"};

/// "stdio" or "socket"; a socket needs @p socket_path.  Throws
/// std::invalid_argument otherwise.
transport_config make_transport_config(
    std::string_view kind, const std::optional<std::string>& socket_path);

std::string describe(const transport_config& config);

/// Server side: stdio, or a listener bound to the configured path.
std::unique_ptr<transport> make_server_transport(
    const boost::asio::any_io_executor& executor,
    const transport_config& config);

}  // namespace kaiak
