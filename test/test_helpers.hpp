#pragma once

#include <doctest/doctest.h>
#include <fmt/format.h>
#include <unistd.h>

#include <atomic>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>
#include <boost/json.hpp>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "kaiak/framing.hpp"

namespace kaiak::test {

namespace asio = boost::asio;
namespace json = boost::json;
namespace fs = std::filesystem;

// Run one coroutine to completion on @p ctx, rethrowing its exception.
template <typename T>
T run(asio::io_context& ctx, asio::awaitable<T> aw) {
  auto fut = asio::co_spawn(ctx, std::move(aw), asio::use_future);
  ctx.restart();
  ctx.run();
  return fut.get();
}

struct pipe_fds {
  int read_fd{-1};
  int write_fd{-1};
};

inline pipe_fds make_pipe() {
  int fds[2];  // NOLINT
  REQUIRE(::pipe(fds) == 0);
  return {fds[0], fds[1]};
}

inline void close_fd(int& fd) {
  if (fd >= 0) ::close(fd);
  fd = -1;
}

inline void write_all(int fd, std::string_view data) {
  while (!data.empty()) {
    auto n = ::write(fd, data.data(), data.size());
    REQUIRE(n > 0);
    data.remove_prefix(static_cast<std::size_t>(n));
  }
}

// Until end of file.
inline std::string read_all(int fd) {
  std::string out;
  char buf[4096];  // NOLINT
  for (;;) {
    auto n = ::read(fd, buf, sizeof(buf));
    REQUIRE(n >= 0);
    if (n == 0) break;
    out.append(buf, static_cast<std::size_t>(n));
  }
  return out;
}

inline std::string frame(const json::value& msg) {
  return frame_message(json::serialize(msg));
}

// Split concatenated frames into their raw contents.
inline std::vector<std::string> split_frames(std::string_view raw) {
  std::vector<std::string> contents;
  while (!raw.empty()) {
    auto header_end = raw.find("\r\n\r\n");
    REQUIRE(header_end != std::string_view::npos);
    auto length = parse_content_length(raw.substr(0, header_end));
    raw.remove_prefix(header_end + 4);
    REQUIRE(raw.size() >= length);
    contents.emplace_back(raw.substr(0, length));
    raw.remove_prefix(length);
  }
  return contents;
}

inline std::vector<json::value> split_messages(std::string_view raw) {
  std::vector<json::value> msgs;
  for (auto&& c : split_frames(raw)) msgs.push_back(json::parse(c));
  return msgs;
}

inline std::string temp_socket_path() {
  static std::atomic<int> counter{0};
  auto path = fs::temp_directory_path() /
              fmt::format("kaiak-test-{}-{}.sock", ::getpid(), ++counter);
  std::error_code ec;
  fs::remove(path, ec);
  return path.string();
}

}  // namespace kaiak::test
