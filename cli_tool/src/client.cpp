#include "client.hpp"

#include <asio.hpp>
#include <fstream>
#include <iostream>
#include <string>
#include <system_error>
#include <vector>

#include "crypto.hpp"
#include "utils.hpp"

using asio::ip::tcp;

namespace {
FetchResult failure(ErrorKind kind, const std::string& message, const std::filesystem::path& path = {}) {
    std::cerr << "[CLIENT] " << Error::to_string(kind) << ": " << message << std::endl;
    FetchResult result;
    result.kind = kind;
    result.message = message;
    result.path = path;
    return result;
}

void discard(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        std::cerr << "[CLIENT] Could not delete " << path << ": " << ec.message() << std::endl;
    }
}
}  // namespace

FetchResult run_client_session(const NodeConfig& config, const PeerEndpoint& endpoint, const std::string& filename,
                               const std::optional<std::string>& trusted_digest) {
    if (!Utils::is_safe_filename(filename)) {
        return failure(ErrorKind::Input, "invalid filename '" + filename + "'");
    }
    std::optional<std::string> trusted;
    if (trusted_digest) {
        trusted = Crypto::normalize_digest(*trusted_digest);
        if (!trusted) {
            return failure(ErrorKind::Input, "trusted digest is not a SHA-256 hex string");
        }
    }
    const auto encoded = Utils::encode_request(TransferRequest{std::string(Message::Download), filename});
    if (!encoded) {
        return failure(ErrorKind::Input, "filename is not valid UTF-8 and cannot be requested");
    }
    const std::string& request = *encoded;
    if (request.size() > config.max_request_size) {
        return failure(ErrorKind::Input, "request for '" + filename + "' exceeds " +
                                             std::to_string(config.max_request_size) + " bytes");
    }

    const std::string peer = endpoint.host + ":" + std::to_string(endpoint.port);
    std::cout << "[CLIENT] Downloading '" << filename << "' from " << peer << "..." << std::endl;

    asio::io_context io;
    tcp::resolver resolver(io);
    tcp::socket socket(io);
    asio::error_code ec;
    auto endpoints = resolver.resolve(endpoint.host, std::to_string(endpoint.port), ec);
    if (ec) {
        return failure(ErrorKind::Network, "cannot resolve " + endpoint.host + ": " + ec.message());
    }
    asio::connect(socket, endpoints, ec);
    if (ec) {
        return failure(ErrorKind::Network, "connection to " + peer + " failed: " + ec.message());
    }
    asio::write(socket, asio::buffer(request), ec);
    if (ec) {
        return failure(ErrorKind::Network, "sending request to " + peer + " failed: " + ec.message());
    }

    std::error_code fs_ec;
    std::filesystem::create_directories(config.downloads_dir, fs_ec);
    const std::filesystem::path file_path = config.downloads_dir / filename;
    std::ofstream out(file_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return failure(ErrorKind::Resource, "cannot open output file: " + file_path.string());
    }

    std::vector<char> chunk(config.chunk_size == 0 ? Limits::ChunkSize : config.chunk_size);
    std::uintmax_t received = 0;
    while (true) {
        std::size_t n = socket.read_some(asio::buffer(chunk), ec);
        if (ec == asio::error::eof) {
            break;
        }
        if (ec) {
            return failure(ErrorKind::Network,
                           "transfer from " + peer + " interrupted after " + std::to_string(received) +
                               " bytes: " + ec.message(),
                           file_path);
        }
        out.write(chunk.data(), static_cast<std::streamsize>(n));
        if (!out) {
            return failure(ErrorKind::Resource, "write failed on " + file_path.string(), file_path);
        }
        received += n;
    }
    out.close();
    if (!out) {
        return failure(ErrorKind::Resource, "write failed on " + file_path.string(), file_path);
    }
    socket.close(ec);

    auto local_digest = Crypto::compute_file_hash(file_path, chunk.size());
    if (!local_digest) {
        return failure(ErrorKind::Resource, "cannot read back " + file_path.string(), file_path);
    }
    auto reference = trusted ? trusted : Crypto::compute_file_hash(config.served_dir / filename, chunk.size());

    if (received == 0 && !(reference && *reference == Crypto::EmptyDigest)) {
        discard(file_path);
        return failure(ErrorKind::NotFound, "'" + filename + "' is not available on " + peer);
    }
    if (!reference) {
        discard(file_path);
        return failure(ErrorKind::Integrity,
                       "no trusted copy of '" + filename + "' to verify against. Deleting downloaded file.");
    }
    if (*reference != *local_digest) {
        discard(file_path);
        return failure(ErrorKind::Integrity, "File verification failed. Deleting corrupt file.");
    }

    FetchResult result;
    result.message = "'" + filename + "' downloaded and verified successfully.";
    result.path = file_path;
    result.bytes_received = received;
    result.digest = *local_digest;
    std::cout << "[CLIENT] " << result.message << " (" << received << " bytes)" << std::endl;
    return result;
}

FetchResult fetch_file(const NodeConfig& config, const AddressBook& book, const std::string& peer,
                       const std::string& filename, const std::optional<std::string>& trusted_digest) {
    auto endpoint = book.resolve(peer);
    if (!endpoint) {
        return failure(ErrorKind::Input, "'" + peer + "' is neither a known peer nor a host:port address");
    }
    return run_client_session(config, *endpoint, filename, trusted_digest);
}
