#pragma once

#include <iostream>
#include <string_view>

enum class ErrorKind { None, Input, Network, Protocol, Integrity, NotFound, Resource };

namespace Error {
inline std::string_view to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:
            return "ok";
        case ErrorKind::Input:
            return "input error";
        case ErrorKind::Network:
            return "network error";
        case ErrorKind::Protocol:
            return "protocol error";
        case ErrorKind::Integrity:
            return "verification failed";
        case ErrorKind::NotFound:
            return "not found";
        case ErrorKind::Resource:
            return "i/o error";
    }
    return "unknown error";
}

inline void print_usage() {
    std::cerr << "usage:\n"
              << "    peerdrop [options] serve\n"
              << "    peerdrop [options] files\n"
              << "    peerdrop [options] peers\n"
              << "    peerdrop [options] add-peer [name] [host:port]\n"
              << "    peerdrop [options] get [peer] [filename] [--sha256 digest]\n"
              << "    peerdrop [options] menu\n"
              << "options:\n"
              << "    --port N  --served DIR  --downloads DIR  --peers FILE\n"
              << "    --max-connections N  --workers N\n";
}

inline void invalid_arguments(std::string_view command) {
    std::cerr << "Invalid arguments for '" << command << "'!\n";
    print_usage();
}

inline void invalid_peer_address() {
    std::cerr << "Invalid peer address! Expected host:port\n";
    print_usage();
}

inline void invalid_digest() {
    std::cerr << "Invalid digest! Expected 64 hex characters\n";
    print_usage();
}
}  // namespace Error
