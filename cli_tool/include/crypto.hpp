#pragma once

#include <openssl/sha.h>

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "types.h"

namespace Crypto {
// SHA-256 of the empty input.
inline constexpr std::string_view EmptyDigest = "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";

inline std::string to_hex(const unsigned char* hash, std::size_t length) {
    std::stringstream ss;
    for (std::size_t i = 0; i < length; ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str();
}

// Streams the file through SHA-256 in chunk-sized reads. Returns nullopt when
// the file cannot be opened, so a missing file never compares equal to an
// empty one.
inline std::optional<std::string> compute_file_hash(const std::filesystem::path& path,
                                                    std::size_t chunk_size = Limits::ChunkSize) {
    std::ifstream file(path, std::ifstream::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }
    SHA256_CTX sha256_context;
    if (SHA256_Init(&sha256_context) != 1) {
        std::cerr << "[CRYPTO] SHA256_Init failed for " << path << std::endl;
        return std::nullopt;
    }
    std::vector<char> buffer(chunk_size == 0 ? Limits::ChunkSize : chunk_size);
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize n = file.gcount();
        if (n > 0 &&
            SHA256_Update(&sha256_context, reinterpret_cast<const unsigned char*>(buffer.data()),
                          static_cast<std::size_t>(n)) != 1) {
            std::cerr << "[CRYPTO] SHA256_Update failed for " << path << std::endl;
            return std::nullopt;
        }
    }
    if (file.bad()) {
        std::cerr << "[CRYPTO] Error reading file: " << path << std::endl;
        return std::nullopt;
    }

    unsigned char hash[SHA256_DIGEST_LENGTH];
    if (SHA256_Final(hash, &sha256_context) != 1) {
        return std::nullopt;
    }
    return to_hex(hash, SHA256_DIGEST_LENGTH);
}

// Lowercases a user-supplied digest; returns nullopt unless it is 64 hex chars.
inline std::optional<std::string> normalize_digest(std::string_view digest) {
    if (digest.size() != SHA256_DIGEST_LENGTH * 2) {
        return std::nullopt;
    }
    std::string out;
    out.reserve(digest.size());
    for (char c : digest) {
        if (c >= '0' && c <= '9') {
            out.push_back(c);
        } else if (c >= 'a' && c <= 'f') {
            out.push_back(c);
        } else if (c >= 'A' && c <= 'F') {
            out.push_back(static_cast<char>(c - 'A' + 'a'));
        } else {
            return std::nullopt;
        }
    }
    return out;
}
}  // namespace Crypto
