#pragma once

#include <cstdint>
#include <regex>
#include <stdexcept>
#include <string>

#include <fmt/core.h>

#include "peers/identity.hpp"

namespace peerwire::utils {

/**
 * @brief "<d.d.d.d>:<port>" to peer endpoint. Throws std::runtime_error.
 */
inline auto parse_ip_port(const std::string& ip_port_str) -> peers::PeerEndpoint
{
    std::regex port_ip_regex(  //
      R"((\d{1,3}\.\d{1,3}\.\d{1,3}\.\d{1,3}):(\d{1,5}))"
    );
    std::smatch match;

    if (not std::regex_match(ip_port_str, match, port_ip_regex)) {
        throw std::runtime_error(fmt::format(
          "Peer ip and port must be in format \"<d.d.d.d>:<d>\" (d means "
          "digit). Found: {0}",
          ip_port_str
        ));
    }

    auto port = std::stoul(match[2].str());
    if (port > UINT16_MAX) {
        throw std::runtime_error(fmt::format("Port {} is out of range", port));
    }

    return peers::PeerEndpoint(match[1].str(), uint16_t(port));
}

}  // namespace peerwire::utils
