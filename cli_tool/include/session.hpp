#pragma once

#include <asio.hpp>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "config.hpp"
#include "gate.hpp"
#include "types.h"
#include "utils.hpp"

using asio::ip::tcp;

enum class State { WaitingRequest, Transferring, Closed };

// Serves one download request on one accepted connection. The connection is
// closed exactly once, and the gate slot is released when the last pending
// handler drops the session.
class Session : public std::enable_shared_from_this<Session> {
   public:
    Session(tcp::socket socket, const NodeConfig& config, std::shared_ptr<ConnectionGate> gate)
        : m_socket(std::move(socket)),
          m_served_dir(config.served_dir),
          m_request(config.max_request_size == 0 ? Limits::MaxRequestSize : config.max_request_size),
          m_chunk(config.chunk_size == 0 ? Limits::ChunkSize : config.chunk_size),
          m_gate(std::move(gate)) {
        asio::error_code ec;
        auto remote = m_socket.remote_endpoint(ec);
        m_peer = ec ? std::string("unknown peer") : remote.address().to_string() + ":" + std::to_string(remote.port());
    }

    ~Session() {
        close_connection();
        if (m_gate) m_gate->release();
    }

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    void run() { wait_for_request(); }

   private:
    void report_error(const std::string& what) {
        if (m_error_logged) return;
        m_error_logged = true;
        std::cerr << "[SESSION] Error handling client " << m_peer << ": " << what << std::endl;
    }

    void close_connection() {
        if (m_state == State::Closed) return;
        m_state = State::Closed;
        asio::error_code ec;
        m_socket.shutdown(tcp::socket::shutdown_both, ec);
        m_socket.close(ec);
    }

    void wait_for_request() {
        auto self(shared_from_this());
        m_socket.async_read_some(asio::buffer(m_request), [this, self](asio::error_code ec, std::size_t length) {
            if (ec) {
                report_error("request read failed: " + ec.message());
                close_connection();
                return;
            }
            try {
                handle_request(std::string_view(m_request.data(), length));
            } catch (const std::exception& e) {
                report_error(e.what());
                close_connection();
            }
        });
    }

    void handle_request(std::string_view data) {
        auto request = Utils::parse_request(data);
        if (!request) {
            report_error("malformed request");
            close_connection();
            return;
        }
        if (request->operation != Message::Download) {
            report_error("unsupported operation '" + request->operation + "'");
            close_connection();
            return;
        }
        if (!Utils::is_safe_filename(request->filename)) {
            report_error("rejected filename '" + request->filename + "'");
            close_connection();
            return;
        }

        m_file_path = m_served_dir / request->filename;
        if (!Utils::check_file_exists(m_file_path)) {
            // Nothing is written: an empty stream is the not-found signal.
            std::cout << "[SESSION] " << m_peer << " requested missing file " << request->filename << std::endl;
            close_connection();
            return;
        }
        m_file = std::ifstream(m_file_path, std::ifstream::binary);
        if (!m_file.is_open()) {
            report_error("cannot open " + m_file_path.string());
            close_connection();
            return;
        }
        std::cout << "[SESSION] Sending " << request->filename << " to " << m_peer << std::endl;
        start_chunked_transfer();
    }

    void start_chunked_transfer() {
        m_state = State::Transferring;
        m_sent = 0;
        send_next_chunk();
    }

    void send_next_chunk() {
        m_file.read(m_chunk.data(), static_cast<std::streamsize>(m_chunk.size()));
        std::streamsize n = m_file.gcount();
        if (n <= 0) {
            if (m_file.bad()) {
                report_error("read failed on " + m_file_path.string());
            } else {
                std::cout << "[SESSION] Sent " << m_sent << " bytes of " << m_file_path.filename().string() << " to "
                          << m_peer << std::endl;
            }
            close_connection();
            return;
        }
        auto self(shared_from_this());
        asio::async_write(m_socket, asio::buffer(m_chunk.data(), static_cast<std::size_t>(n)),
                          [this, self](asio::error_code ec, std::size_t bytes_written) {
                              if (ec) {
                                  report_error("write failed: " + ec.message());
                                  close_connection();
                                  return;
                              }
                              m_sent += bytes_written;
                              try {
                                  send_next_chunk();
                              } catch (const std::exception& e) {
                                  report_error(e.what());
                                  close_connection();
                              }
                          });
    }

   private:
    tcp::socket m_socket;
    std::filesystem::path m_served_dir;
    std::string m_peer;
    State m_state = State::WaitingRequest;
    std::vector<char> m_request;
    std::vector<char> m_chunk;
    std::filesystem::path m_file_path;
    std::ifstream m_file;
    std::size_t m_sent = 0;
    bool m_error_logged = false;
    std::shared_ptr<ConnectionGate> m_gate;
};
