#pragma once
#include <cstdint>
#include <string>
#include <vector>

// Server side RFC 6455 pieces needed to stream over an upgraded HTTP connection
namespace websocket
{
    // SHA-1 digest (20 bytes)
    std::vector<uint8_t> sha1(const std::string &data);

    // Sec-WebSocket-Accept value for a client's Sec-WebSocket-Key
    std::string acceptKey(const std::string &client_key);

    // Unmasked server frames
    std::vector<uint8_t> textFrame(const std::string &payload);
    std::vector<uint8_t> pingFrame();
    std::vector<uint8_t> closeFrame(uint16_t status_code = 1000);

    // Upgrade: websocket plus a Connection header listing "upgrade" (case-insensitive)
    bool isUpgradeRequest(const std::string &upgrade_header, const std::string &connection_header);

} // namespace websocket
