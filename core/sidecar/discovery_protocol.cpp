#include "discovery_protocol.hpp"

#include <cstring>
#include <limits>

namespace tether {
namespace sidecar {

std::optional<uint16_t> parse_discovery_line(const std::string &line) {
    const size_t prefix_len = std::strlen(kDiscoveryPrefix);

    size_t end = line.size();
    if (end > 0 && line[end - 1] == '\r') {
        --end;
    }

    if (end <= prefix_len || line.compare(0, prefix_len, kDiscoveryPrefix) != 0) {
        return std::nullopt;
    }

    uint32_t value = 0;
    for (size_t i = prefix_len; i < end; ++i) {
        const char c = line[i];
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        value = value * 10 + static_cast<uint32_t>(c - '0');
        if (value > std::numeric_limits<uint16_t>::max()) {
            return std::nullopt;
        }
    }

    return static_cast<uint16_t>(value);
}

}  // namespace sidecar
}  // namespace tether
