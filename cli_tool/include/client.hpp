// Fetch side of the transfer protocol: request one file from a peer, stream
// it into the downloads directory and verify it.
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "address_book.hpp"
#include "config.hpp"
#include "error.hpp"
#include "types.h"

struct FetchResult {
    ErrorKind kind = ErrorKind::None;
    std::string message;
    std::filesystem::path path;
    std::uintmax_t bytes_received = 0;
    std::string digest;

    bool ok() const { return kind == ErrorKind::None; }
};

// Downloads `filename` from `endpoint`. The received copy is checked against
// `trusted_digest` when given, otherwise against the copy of the same name in
// the served directory. On a mismatch the downloaded file is removed.
FetchResult run_client_session(const NodeConfig& config, const PeerEndpoint& endpoint, const std::string& filename,
                               const std::optional<std::string>& trusted_digest = std::nullopt);

// Resolves `peer` (registered name or host:port) and runs the session.
// Resolution failures are reported as input errors without network I/O.
FetchResult fetch_file(const NodeConfig& config, const AddressBook& book, const std::string& peer,
                       const std::string& filename, const std::optional<std::string>& trusted_digest = std::nullopt);
