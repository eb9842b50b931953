// SPDX-License-Identifier: MIT
#pragma once

/**
 * @file framing.hpp
 * @brief JSONRPC 2.0 message framing over async byte streams.
 *
 * Messages are framed using the same Content-Length header convention as
 * the Language Server Protocol: each message is preceded by a header block
 * of the form @c "Content-Length: N\r\n\r\n" followed by exactly @c N bytes
 * of UTF-8 JSON text.  Other headers may precede the blank line and are
 * ignored.  framed_stream works on any Boost.ASIO stream (posix descriptors,
 * Unix domain sockets) and is designed to be used with @c co_await in a
 * coroutine context.
 */

#include <fmt/format.h>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/buffers_iterator.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/streambuf.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/json.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>
#include <cstddef>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "kaiak/jsonrpc.hpp"

namespace kaiak {

/// Upper bound on a header block, separator included.
inline constexpr std::size_t max_header_bytes{64 * 1024};

/// @c "Content-Length: <size>\r\n\r\n<content>"
std::string frame_message(std::string_view content);

/** @brief Extract the Content-Length value from a header block.
 *
 * @p headers holds one header per line, lines separated by CRLF (a bare LF
 * is tolerated).  Unknown headers are skipped.  Throws
 * jsonrpc::rpc_error (internal_error) when no Content-Length is present.
 */
std::size_t parse_content_length(std::string_view headers);

/** @brief Split a complete raw frame and return its content.
 *
 * Throws jsonrpc::rpc_error when the header separator is missing, when
 * Content-Length is missing, or when the body size differs from it.
 */
std::string_view unframe_message(std::string_view raw);

/// Serializes writers on one stream so that frames never interleave.
/// Not thread-safe: use it from a single strand.
class write_gate {
 public:
  explicit write_gate(boost::asio::any_io_executor executor)
      : executor_{std::move(executor)} {}

  class holder {
   public:
    explicit holder(write_gate& gate) : gate_{&gate} {}
    holder(const holder&) = delete;
    holder(holder&&) = delete;
    holder& operator=(const holder&) = delete;
    holder& operator=(holder&&) = delete;
    ~holder() { gate_->release(); }

   private:
    write_gate* gate_;
  };

  boost::asio::awaitable<void> acquire() {
    if (!busy_) {
      busy_ = true;
      co_return;
    }
    auto waiter = std::make_shared<boost::asio::steady_timer>(
        executor_, boost::asio::steady_timer::time_point::max());
    waiters_.push_back(waiter);
    // release() cancels the timer to hand the gate over.
    boost::system::error_code ec{};
    co_await waiter->async_wait(
        boost::asio::redirect_error(boost::asio::use_awaitable, ec));
  }

  void release() {
    if (waiters_.empty()) {
      busy_ = false;
      return;
    }
    auto next = std::move(waiters_.front());
    waiters_.pop_front();
    next->cancel();
  }

 private:
  boost::asio::any_io_executor executor_;
  bool busy_{false};
  std::deque<std::shared_ptr<boost::asio::steady_timer>> waiters_;
};

/// A byte stream carrying Content-Length framed messages.  Bytes read past
/// the end of one frame stay buffered for the next read.
template <typename Stream>
class framed_stream {
 public:
  explicit framed_stream(Stream stream)
      : stream_{std::move(stream)}, gate_{stream_.get_executor()} {}

  framed_stream(const framed_stream&) = delete;
  framed_stream(framed_stream&&) = delete;
  framed_stream& operator=(const framed_stream&) = delete;
  framed_stream& operator=(framed_stream&&) = delete;
  ~framed_stream() = default;

  Stream& next_layer() { return stream_; }
  [[nodiscard]] bool is_open() const { return stream_.is_open(); }

  /** @brief Read one framed message.
   *
   * Returns the raw content, or an empty optional when the stream ends
   * cleanly between two frames.  A missing Content-Length header, or a
   * header block longer than max_header_bytes, throws jsonrpc::rpc_error;
   * I/O failures (including end of stream in the middle of a frame) throw
   * boost::system::system_error.
   */
  boost::asio::awaitable<std::optional<std::string>> read_message() {
    namespace asio = boost::asio;
    std::size_t header_size{};
    try {
      header_size = co_await asio::async_read_until(
          stream_, buffer_, "\r\n\r\n", asio::use_awaitable);
    } catch (const boost::system::system_error& e) {
      if (e.code() == asio::error::eof && buffer_.size() == 0)
        co_return std::nullopt;
      if (e.code() != asio::error::not_found) throw;
      // The next read starts after the bytes dropped here.
      buffer_.consume(buffer_.size());
      throw jsonrpc::rpc_error{
        jsonrpc::error_codes::parse_error,
        fmt::format("Message header exceeds {} bytes", max_header_bytes)};
    }

    auto begin = asio::buffers_begin(buffer_.data());
    std::string headers{begin, begin + static_cast<std::ptrdiff_t>(header_size)};
    buffer_.consume(header_size);

    auto content_length = parse_content_length(headers);

    // Body bytes may already be buffered from the header read; the rest
    // goes straight into the result, so bodies are not bound by the cap.
    std::string content(content_length, '\0');
    auto buffered = asio::buffer_copy(asio::buffer(content), buffer_.data());
    buffer_.consume(buffered);
    if (buffered < content_length) {
      co_await asio::async_read(
          stream_,
          asio::buffer(content.data() + buffered, content_length - buffered),
          asio::use_awaitable);
    }
    co_return content;
  }

  /// Write one frame holding @p content as a single async operation.
  boost::asio::awaitable<void> write_content(std::string_view content) {
    std::string frame{frame_message(content)};
    co_await gate_.acquire();
    write_gate::holder hold{gate_};
    co_await boost::asio::async_write(
        stream_, boost::asio::buffer(frame), boost::asio::use_awaitable);
  }

  boost::asio::awaitable<void> write_message(const boost::json::object& msg) {
    co_await write_content(boost::json::serialize(msg));
  }

  void close() {
    boost::system::error_code ec{};
    if (stream_.is_open()) stream_.close(ec);
  }

 private:
  Stream stream_;
  boost::asio::streambuf buffer_{max_header_bytes};
  write_gate gate_;
};

}  // namespace kaiak
