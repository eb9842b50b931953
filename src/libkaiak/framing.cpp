// SPDX-License-Identifier: MIT
#include "kaiak/framing.hpp"

#include <fmt/format.h>
#include <re2/re2.h>

#include "kaiak/jsonrpc.hpp"
#include "logger.hpp"

namespace kaiak {

std::string frame_message(std::string_view content) {
  return fmt::format("Content-Length: {}\r\n\r\n{}", content.size(), content);
}

std::size_t parse_content_length(std::string_view headers) {
  static const RE2 content_length_re{R"(Content-Length:\s*(\d+)\s*)"};

  std::optional<std::size_t> content_length{};
  while (!headers.empty()) {
    auto eol = headers.find('\n');
    auto line = headers.substr(0, eol);
    headers.remove_prefix(eol == std::string_view::npos ? headers.size()
                                                        : eol + 1);
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
    if (line.empty()) continue;

    std::size_t length{};
    if (RE2::FullMatch(line, content_length_re, &length)) {
      content_length = length;
    } else {
      LOG_TRACE("ignoring header: {}", line);
    }
  }

  if (!content_length)
    throw jsonrpc::rpc_error{
      jsonrpc::error_codes::internal_error, "Missing Content-Length header"};
  return *content_length;
}

std::string_view unframe_message(std::string_view raw) {
  auto header_end = raw.find("\r\n\r\n");
  if (header_end == std::string_view::npos)
    throw jsonrpc::rpc_error{
      jsonrpc::error_codes::parse_error,
      "Invalid LSP message format: missing header separator"};

  auto expected = parse_content_length(raw.substr(0, header_end));
  auto content = raw.substr(header_end + 4);
  if (content.size() != expected)
    throw jsonrpc::rpc_error{
      jsonrpc::error_codes::parse_error,
      fmt::format(
          "Content length mismatch: expected {}, got {}", expected,
          content.size())};
  return content;
}

}  // namespace kaiak
