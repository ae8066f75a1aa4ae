#pragma once
#include <string>
#include <string_view>

namespace itemstream {

inline constexpr std::string_view kReadCountKey = "read.count";

// "<stream_name>.<suffix>". Throws ConfigError for an empty stream name.
std::string FormatContextKey(std::string_view stream_name, std::string_view suffix);

} // namespace itemstream
