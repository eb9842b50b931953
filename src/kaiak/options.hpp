#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace kaiak {

enum class command : uint8_t { serve, call, generate_fix, delete_session, ping };

struct cli_options {
  command cmd{command::serve};
  int loglevel{3};
  std::string transport{"stdio"};
  std::string socket_path;
  std::string method;
  std::optional<std::string> params{};
  std::string session_id;
};

std::optional<int> parse_options(std::span<char*> args, cli_options& opts);
}  // namespace kaiak
