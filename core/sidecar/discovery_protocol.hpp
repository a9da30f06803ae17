#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace tether {
namespace sidecar {

// The sidecar announces its listening port with a single stdout line:
//   PORT:<n>     (n in [0, 65535], decimal digits only)
// Every other line is informational output.
constexpr const char *kDiscoveryPrefix = "PORT:";

// Parse one line (without its terminating newline) as a discovery line.
// A single trailing '\r' is ignored. Returns std::nullopt if the line is not
// an exact match or the value does not fit in 16 bits.
std::optional<uint16_t> parse_discovery_line(const std::string &line);

}  // namespace sidecar
}  // namespace tether
