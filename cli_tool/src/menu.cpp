#include "menu.hpp"

#include <array>
#include <string_view>

#include "client.hpp"
#include "utils.hpp"

namespace {
constexpr std::array<std::string_view, 5> Options = {"List Files", "List Peers", "Add Peer", "Download File", "Quit"};

std::string trim(const std::string& s) {
    const auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return {};
    const auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}
}  // namespace

Menu::Menu(const NodeConfig& config, AddressBook& book, std::istream& in, std::ostream& out, uint16_t listen_port)
    : m_config(config), m_book(book), m_in(in), m_out(out), m_listen_port(listen_port) {}

void Menu::draw() {
    m_out << "\n";
    for (std::size_t i = 0; i < Options.size(); ++i) {
        m_out << "  " << (i + 1) << ". " << Options[i] << "\n";
    }
    m_out << "IP: " << m_ip_address;
    if (m_listen_port != 0) m_out << "  port: " << m_listen_port;
    m_out << "\n> " << std::flush;
}

bool Menu::prompt(const std::string& label, std::string& value) {
    m_out << label << std::flush;
    if (!std::getline(m_in, value)) {
        return false;
    }
    value = trim(value);
    return true;
}

void Menu::run() {
    m_ip_address = Utils::get_local_ip_address();
    std::string line;
    while (true) {
        draw();
        if (!std::getline(m_in, line)) {
            return;
        }
        const std::string choice = trim(line);
        if (choice == "1") {
            list_files();
        } else if (choice == "2") {
            list_peers();
        } else if (choice == "3") {
            add_peer();
        } else if (choice == "4") {
            download_file();
        } else if (choice == "5" || choice == "q") {
            return;
        } else if (!choice.empty()) {
            m_out << "Unknown option '" << choice << "'\n";
        }
    }
}

void Menu::list_files() {
    const auto files = Utils::list_files(m_config.served_dir);
    if (files.empty()) {
        m_out << "No files available for download.\n";
        return;
    }
    m_out << "Files available for download:\n";
    for (std::size_t i = 0; i < files.size(); ++i) {
        m_out << (i + 1) << ". " << files[i] << "\n";
    }
}

void Menu::list_peers() {
    m_book.load();
    if (m_book.peers().empty()) {
        m_out << "No peers added.\n";
        return;
    }
    m_out << "Saved Peers:\n";
    std::size_t idx = 1;
    for (const auto& [name, address] : m_book.peers()) {
        m_out << idx++ << ". " << name << " (" << address << ")\n";
    }
}

void Menu::add_peer() {
    std::string name;
    std::string address;
    if (!prompt("Enter peer name: ", name) ||
        !prompt("Enter IP address and port (e.g., 192.168.1.2:5000): ", address)) {
        return;
    }
    m_book.load();
    if (!m_book.add(name, address)) {
        m_out << "Error: invalid peer name or address.\n";
        return;
    }
    if (!m_book.save()) {
        m_out << "Error: Unable to save address book.\n";
        return;
    }
    m_out << "Peer '" << name << "' added successfully.\n";
}

void Menu::download_file() {
    std::string peer;
    std::string filename;
    if (!prompt("Enter peer name or IP address: ", peer) ||
        !prompt("Enter the file name you want to download: ", filename)) {
        return;
    }
    m_book.load();
    m_out << "Downloading '" << filename << "' from " << peer << "...\n" << std::flush;
    FetchResult result = fetch_file(m_config, m_book, peer, filename);
    if (result.ok()) {
        m_out << result.message << "\n";
    } else {
        m_out << "Error (" << Error::to_string(result.kind) << "): " << result.message << "\n";
    }
}

int run_interactive(const TransferService& service, const NodeConfig& config, std::istream& in, std::ostream& out) {
    AddressBook book(config.address_book);
    book.load();
    Menu ui(config, book, in, out, service.port());
    ui.run();
    if (service.failed()) {
        std::cerr << "[SERVER] listener stopped during the session" << std::endl;
        return 1;
    }
    return 0;
}
