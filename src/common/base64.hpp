#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace livegate {

// Standard (padded) base64, as used by the upstream JSON protocol
std::string base64_encode(std::string_view data);

// Returns std::nullopt on malformed input
std::optional<std::string> base64_decode(std::string_view b64);

} // namespace livegate
