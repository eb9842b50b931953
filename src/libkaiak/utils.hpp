#pragma once

#include <fmt/format.h>

#include <boost/json.hpp>
#include <stdexcept>
#include <string>

namespace kaiak::utils {
template <typename Exception = std::runtime_error, typename... Args>
[[noreturn]] void throwf(
    fmt::format_string<Args...> format_str, Args&&... args) {
  throw Exception(fmt::format(format_str, std::forward<Args>(args)...));
}

// String form of a JSON-RPC id: strings as-is, anything else as compact JSON.
inline std::string id_to_string(const boost::json::value& id) {
  if (auto* s = id.if_string()) return std::string{*s};
  return boost::json::serialize(id);
}

}  // namespace kaiak::utils
