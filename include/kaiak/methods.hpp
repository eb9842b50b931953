#pragma once

#include <string_view>

namespace kaiak::methods {

// Procedures served by the agent side.
inline constexpr std::string_view generate_fix{"kaiak/generate_fix"};
inline constexpr std::string_view delete_session{"kaiak/delete_session"};
inline constexpr std::string_view configure{"kaiak/configure"};

// Streamed while a fix is being generated.
inline constexpr std::string_view stream_progress{"kaiak/stream/progress"};

}  // namespace kaiak::methods
