#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "types.h"

struct NodeConfig {
    std::filesystem::path served_dir = "Uploads";
    std::filesystem::path downloads_dir = "Downloads";
    std::filesystem::path address_book = "address_book.json";
    uint16_t port = Limits::DefaultPort;
    std::size_t chunk_size = Limits::ChunkSize;
    std::size_t max_request_size = Limits::MaxRequestSize;
    // 0 means no bound on concurrent handlers.
    std::size_t max_connections = Limits::DefaultMaxConnections;
    std::size_t worker_threads = 0;  // 0 picks max(2, hardware_concurrency)
};

namespace Config {
// Applies PEERDROP_* environment overrides on top of the defaults.
// Throws std::invalid_argument when a numeric variable is malformed.
NodeConfig from_environment();

// Consumes recognised --options from argv, updating config, and returns the
// remaining positional arguments. Throws std::invalid_argument on a missing
// or malformed option value.
std::vector<std::string> apply_options(int argc, char* argv[], NodeConfig& config);

// Creates the served and downloads directories if missing.
void ensure_directories(const NodeConfig& config);

std::size_t resolved_worker_threads(const NodeConfig& config);
}  // namespace Config
