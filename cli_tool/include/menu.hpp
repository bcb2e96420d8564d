#pragma once

#include <cstdint>
#include <iostream>
#include <string>

#include "address_book.hpp"
#include "config.hpp"
#include "service.hpp"

// Line-oriented interactive front end: each action is one synchronous call
// into the core with its result printed to `out`.
class Menu {
   public:
    Menu(const NodeConfig& config, AddressBook& book, std::istream& in, std::ostream& out, uint16_t listen_port = 0);

    // Returns when the user picks Quit or input ends.
    void run();

    void list_files();
    void list_peers();
    void add_peer();
    void download_file();

   private:
    void draw();
    bool prompt(const std::string& label, std::string& value);

    const NodeConfig& m_config;
    AddressBook& m_book;
    std::istream& m_in;
    std::ostream& m_out;
    uint16_t m_listen_port;
    std::string m_ip_address;
};

// Runs the menu against an already started service. Returns 1 when the
// listener died before the user quit, 0 otherwise.
int run_interactive(const TransferService& service, const NodeConfig& config, std::istream& in, std::ostream& out);
