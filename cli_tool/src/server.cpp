#include "server.hpp"

#include <iostream>

#include "session.hpp"

Server::Server(asio::io_context& io_context, const NodeConfig& config)
    : m_config(config),
      m_acceptor(io_context, tcp::endpoint(tcp::v4(), config.port)),
      m_gate(std::make_shared<ConnectionGate>(config.max_connections)),
      m_port(m_acceptor.local_endpoint().port()) {
    m_gate->set_resume([this] { asio::post(m_acceptor.get_executor(), [this] { do_accept(); }); });
    std::cout << "[SERVER] Listening on port " << m_port << " (max connections: ";
    if (m_gate->limit() == 0) {
        std::cout << "unbounded";
    } else {
        std::cout << m_gate->limit();
    }
    std::cout << ")" << std::endl;
    do_accept();
}

Server::~Server() {
    m_gate->detach();
    asio::error_code ec;
    m_acceptor.close(ec);
}

void Server::do_accept() {
    if (!m_acceptor.is_open()) {
        return;
    }
    // The slot is held by the pending accept and handed to the session.
    if (!m_gate->try_acquire()) {
        return;
    }
    m_acceptor.async_accept([this](asio::error_code ec, tcp::socket socket) {
        if (ec) {
            m_gate->release();
            if (ec != asio::error::operation_aborted) {
                m_failed = true;
                std::cerr << "[SERVER] accept failed, listener stopped: " << ec.message() << std::endl;
            }
            return;
        }
        asio::error_code remote_ec;
        auto remote = socket.remote_endpoint(remote_ec);
        if (!remote_ec) {
            std::cout << "[SERVER] Connection from " << remote.address().to_string() << ":" << remote.port()
                      << std::endl;
        }
        std::shared_ptr<Session> session;
        try {
            session = std::make_shared<Session>(std::move(socket), m_config, m_gate);
        } catch (const std::exception& e) {
            m_gate->release();
            std::cerr << "[SERVER] could not start session: " << e.what() << std::endl;
        }
        if (session) session->run();
        do_accept();
    });
}
