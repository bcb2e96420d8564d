#include "service.hpp"

#include <iostream>
#include <utility>

TransferService::TransferService(NodeConfig config) : m_config(std::move(config)) {}

TransferService::~TransferService() { stop(); }

void TransferService::start() {
    if (running()) {
        return;
    }
    Config::ensure_directories(m_config);
    m_io.restart();
    m_server = std::make_unique<Server>(m_io, m_config);

    const std::size_t threads = Config::resolved_worker_threads(m_config);
    m_workers.reserve(threads);
    for (std::size_t i = 0; i < threads; ++i) {
        m_workers.emplace_back([this] {
            try {
                m_io.run();
            } catch (const std::exception& e) {
                std::cerr << "[SERVER] worker stopped on error: " << e.what() << std::endl;
            }
        });
    }
}

void TransferService::stop() {
    m_io.stop();
    wait();
    m_server.reset();
}

void TransferService::wait() {
    for (auto& worker : m_workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    m_workers.clear();
}

uint16_t TransferService::port() const { return m_server ? m_server->port() : 0; }

bool TransferService::failed() const { return m_server && m_server->failed(); }
