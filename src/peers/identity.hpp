#pragma once

#include <cstdint>
#include <string>
#include <utility>

#include <fmt/core.h>

namespace peerwire::peers {

/**
 * @brief Who a message came from. Used for log lines only.
 */
class PeerIdentity
{
 public:
    virtual ~PeerIdentity() = default;

    virtual auto display_address() const -> std::string = 0;
};

class PeerEndpoint : public PeerIdentity
{
 public:
    PeerEndpoint(std::string ip, uint16_t port) : _ip(std::move(ip)), _port(port)
    {
    }

    auto ip() const noexcept -> const std::string& { return _ip; }
    auto port() const noexcept -> uint16_t { return _port; }

    auto display_address() const -> std::string override
    {
        return fmt::format("{}:{}", _ip, _port);
    }

 private:
    std::string _ip;
    uint16_t _port;
};

}  // namespace peerwire::peers
