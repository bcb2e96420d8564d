#pragma once

#include <asio.hpp>
#include <atomic>
#include <cstdint>
#include <memory>

#include "config.hpp"
#include "gate.hpp"

using asio::ip::tcp;

// Accept loop. Every accepted connection becomes its own Session; the loop
// re-arms immediately unless the connection gate is full, in which case it
// resumes when a session releases its slot.
class Server {
   private:
    NodeConfig m_config;
    tcp::acceptor m_acceptor;
    std::shared_ptr<ConnectionGate> m_gate;
    uint16_t m_port;
    std::atomic<bool> m_failed{false};

   private:
    void do_accept();

   public:
    Server(asio::io_context& io_context, const NodeConfig& config);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    uint16_t port() const { return m_port; }
    bool failed() const { return m_failed; }
};
