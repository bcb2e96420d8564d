#pragma once

#include <asio.hpp>
#include <algorithm>
#include <charconv>
#include <filesystem>
#include <iostream>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "types.h"

using json = nlohmann::json;
namespace ip = asio::ip;

namespace Utils {
// JSON strings must be UTF-8; a name made of arbitrary bytes cannot go on the
// wire and yields nullopt.
inline std::optional<std::string> encode_request(const TransferRequest& request) {
    json payload = {{std::string(Message::Operation), request.operation},
                    {std::string(Message::Filename), request.filename}};
    try {
        return payload.dump();
    } catch (const json::type_error& e) {
        std::cerr << "[CLIENT] cannot encode request: " << e.what() << std::endl;
        return std::nullopt;
    }
}

inline bool encodes_as_json(const std::string& text) {
    try {
        json(text).dump();
        return true;
    } catch (const json::type_error&) {
        return false;
    }
}

// Returns nullopt for anything that is not an object carrying string
// "operation" (or legacy "request") and "filename" members.
inline std::optional<TransferRequest> parse_request(std::string_view data) {
    json payload = json::parse(data.begin(), data.end(), nullptr, false);
    if (payload.is_discarded() || !payload.is_object()) {
        return std::nullopt;
    }
    auto op = payload.find(std::string(Message::Operation));
    if (op == payload.end()) {
        op = payload.find(std::string(Message::LegacyOperation));
    }
    auto name = payload.find(std::string(Message::Filename));
    if (op == payload.end() || name == payload.end() || !op->is_string() || !name->is_string()) {
        return std::nullopt;
    }
    return TransferRequest{op->get<std::string>(), name->get<std::string>()};
}

// A served name must stay inside the served directory: a single path
// component, no separators, no parent references.
inline bool is_safe_filename(std::string_view name) {
    if (name.empty() || name == "." || name == "..") {
        return false;
    }
    if (name.find_first_of(std::string_view("/\\\0", 3)) != std::string_view::npos) {
        return false;
    }
    return !std::filesystem::path(std::string(name)).is_absolute();
}

inline std::optional<PeerEndpoint> parse_endpoint(std::string_view address) {
    auto colon = address.rfind(':');
    if (colon == std::string_view::npos || colon == 0 || colon + 1 == address.size()) {
        return std::nullopt;
    }
    std::string_view host = address.substr(0, colon);
    std::string_view port_text = address.substr(colon + 1);
    unsigned long port = 0;
    auto [end, ec] = std::from_chars(port_text.data(), port_text.data() + port_text.size(), port);
    if (ec != std::errc() || end != port_text.data() + port_text.size() || port == 0 || port > 65535) {
        return std::nullopt;
    }
    // Bracketed IPv6 literal, e.g. [::1]:5000
    if (host.size() > 2 && host.front() == '[' && host.back() == ']') {
        host = host.substr(1, host.size() - 2);
    }
    if (host.find_first_of(" \t") != std::string_view::npos) {
        return std::nullopt;
    }
    return PeerEndpoint{std::string(host), static_cast<uint16_t>(port)};
}

inline bool check_file_exists(const std::filesystem::path& filepath) {
    std::error_code ec;
    return std::filesystem::is_regular_file(filepath, ec);
}

inline std::vector<std::string> list_files(const std::filesystem::path& directory) {
    std::vector<std::string> files;
    std::error_code ec;
    for (std::filesystem::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code type_ec;
        if (it->is_regular_file(type_ec)) {
            files.push_back(it->path().filename().string());
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

inline std::string get_local_ip_address() {
    try {
        asio::io_context io_ctx;
        // Connecting a UDP socket sends nothing; it only lets the OS pick the
        // local endpoint it would route through.
        ip::udp::endpoint ep(ip::make_address("10.254.254.254"), 1);
        ip::udp::socket socket(io_ctx);
        socket.connect(ep);
        ip::address addr = socket.local_endpoint().address();
        return addr.to_string();
    } catch (const std::exception& e) {
        std::cerr << "Could not get IP address. Exception: " << e.what() << std::endl;
        return "Unknown";
    }
}
}  // namespace Utils
