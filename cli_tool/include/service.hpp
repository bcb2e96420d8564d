#pragma once

#include <asio.hpp>
#include <cstdint>
#include <memory>
#include <thread>
#include <vector>

#include "config.hpp"
#include "server.hpp"

// Owns the io_context, the worker threads running it and the listening
// Server. start() throws if the port cannot be bound. stop() and wait() must
// not be called from a worker thread.
class TransferService {
   public:
    explicit TransferService(NodeConfig config);
    ~TransferService();

    TransferService(const TransferService&) = delete;
    TransferService& operator=(const TransferService&) = delete;

    void start();
    void stop();
    void wait();

    bool running() const { return !m_workers.empty(); }
    uint16_t port() const;
    bool failed() const;

   private:
    NodeConfig m_config;
    asio::io_context m_io;
    std::unique_ptr<Server> m_server;
    std::vector<std::thread> m_workers;
};
