#include "config.hpp"

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string_view>
#include <thread>

namespace {
const char* get_env(const char* key) {
    const char* value = std::getenv(key);
    return (value && *value) ? value : nullptr;
}

std::size_t parse_count(std::string_view setting, std::string_view text, std::size_t max_value) {
    std::size_t value = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || end != text.data() + text.size() || value > max_value) {
        throw std::invalid_argument("Invalid value for " + std::string(setting) + ": '" + std::string(text) + "'");
    }
    return value;
}

uint16_t parse_port(std::string_view setting, std::string_view text) {
    return static_cast<uint16_t>(parse_count(setting, text, std::numeric_limits<uint16_t>::max()));
}
}  // namespace

namespace Config {
NodeConfig from_environment() {
    NodeConfig config;
    if (const char* v = get_env("PEERDROP_SERVED_DIR")) config.served_dir = v;
    if (const char* v = get_env("PEERDROP_DOWNLOADS_DIR")) config.downloads_dir = v;
    if (const char* v = get_env("PEERDROP_ADDRESS_BOOK")) config.address_book = v;
    if (const char* v = get_env("PEERDROP_PORT")) config.port = parse_port("PEERDROP_PORT", v);
    if (const char* v = get_env("PEERDROP_MAX_CONNECTIONS")) {
        config.max_connections = parse_count("PEERDROP_MAX_CONNECTIONS", v, std::numeric_limits<std::size_t>::max());
    }
    if (const char* v = get_env("PEERDROP_WORKERS")) {
        config.worker_threads = parse_count("PEERDROP_WORKERS", v, 1024);
    }
    return config;
}

std::vector<std::string> apply_options(int argc, char* argv[], NodeConfig& config) {
    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        auto value = [&]() -> std::string_view {
            if (i + 1 >= argc) {
                throw std::invalid_argument("Missing value for " + std::string(arg));
            }
            return argv[++i];
        };
        if (arg == "--port") {
            config.port = parse_port(arg, value());
        } else if (arg == "--served") {
            config.served_dir = std::string(value());
        } else if (arg == "--downloads") {
            config.downloads_dir = std::string(value());
        } else if (arg == "--peers") {
            config.address_book = std::string(value());
        } else if (arg == "--max-connections") {
            config.max_connections = parse_count(arg, value(), std::numeric_limits<std::size_t>::max());
        } else if (arg == "--workers") {
            config.worker_threads = parse_count(arg, value(), 1024);
        } else {
            positional.emplace_back(arg);
        }
    }
    return positional;
}

void ensure_directories(const NodeConfig& config) {
    std::filesystem::create_directories(config.served_dir);
    std::filesystem::create_directories(config.downloads_dir);
}

std::size_t resolved_worker_threads(const NodeConfig& config) {
    if (config.worker_threads > 0) {
        return config.worker_threads;
    }
    return std::max<std::size_t>(2, std::thread::hardware_concurrency());
}
}  // namespace Config
