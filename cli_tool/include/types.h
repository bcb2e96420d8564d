#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace Command {
inline constexpr std::string_view SERVE = "serve";
inline constexpr std::string_view FILES = "files";
inline constexpr std::string_view PEERS = "peers";
inline constexpr std::string_view ADD_PEER = "add-peer";
inline constexpr std::string_view GET = "get";
inline constexpr std::string_view MENU = "menu";
}  // namespace Command

namespace Message {
// Request object: {"operation": "download", "filename": "<name>"}
inline constexpr std::string_view Operation = "operation";
inline constexpr std::string_view LegacyOperation = "request";  // older peers
inline constexpr std::string_view Filename = "filename";
inline constexpr std::string_view Download = "download";
}  // namespace Message

namespace Limits {
inline constexpr std::uint16_t DefaultPort = 5000;
inline constexpr std::size_t ChunkSize = 32 * 1024;
inline constexpr std::size_t MaxRequestSize = 1024;
inline constexpr std::size_t DefaultMaxConnections = 64;
}  // namespace Limits

struct TransferRequest {
    std::string operation;
    std::string filename;
};

struct PeerEndpoint {
    std::string host;
    uint16_t port;
};
