#include "address_book.hpp"

#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

#include "utils.hpp"

using json = nlohmann::json;

void AddressBook::load() {
    m_peers.clear();
    std::ifstream in(m_file);
    if (!in.is_open()) {
        return;
    }
    json data = json::parse(in, nullptr, false);
    if (data.is_discarded() || !data.is_object()) {
        std::cerr << "[PEERS] Ignoring malformed address book: " << m_file << std::endl;
        return;
    }
    for (const auto& item : data.items()) {
        if (item.value().is_string()) {
            m_peers[item.key()] = item.value().get<std::string>();
        } else {
            std::cerr << "[PEERS] Skipping entry '" << item.key() << "': address is not a string" << std::endl;
        }
    }
}

bool AddressBook::save() const {
    std::ofstream out(m_file, std::ios::trunc);
    if (!out.is_open()) {
        std::cerr << "[PEERS] Unable to save address book: " << m_file << std::endl;
        return false;
    }
    try {
        json data(m_peers);
        out << data.dump(2) << "\n";
    } catch (const json::exception& e) {
        std::cerr << "[PEERS] Cannot encode address book: " << e.what() << std::endl;
        return false;
    }
    out.close();
    if (!out) {
        std::cerr << "[PEERS] Write failed for address book: " << m_file << std::endl;
        return false;
    }
    return true;
}

bool AddressBook::add(const std::string& name, const std::string& address) {
    if (name.empty() || !Utils::parse_endpoint(address) || !Utils::encodes_as_json(name) ||
        !Utils::encodes_as_json(address)) {
        return false;
    }
    m_peers[name] = address;
    return true;
}

std::optional<std::string> AddressBook::lookup(const std::string& name) const {
    auto it = m_peers.find(name);
    if (it == m_peers.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<PeerEndpoint> AddressBook::resolve(const std::string& peer) const {
    if (auto address = lookup(peer)) {
        return Utils::parse_endpoint(*address);
    }
    return Utils::parse_endpoint(peer);
}
