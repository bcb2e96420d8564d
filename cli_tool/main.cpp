#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "address_book.hpp"
#include "client.hpp"
#include "config.hpp"
#include "error.hpp"
#include "menu.hpp"
#include "service.hpp"
#include "types.h"
#include "utils.hpp"

namespace {
int serve(const NodeConfig& config) {
    TransferService service(config);
    service.start();
    service.wait();
    // wait() only returns once the accept loop has died.
    return service.failed() ? 1 : 0;
}

int list_files(const NodeConfig& config) {
    const auto files = Utils::list_files(config.served_dir);
    if (files.empty()) {
        std::cout << "No files available for download.\n";
    }
    for (const auto& file : files) {
        std::cout << file << "\n";
    }
    return 0;
}

int list_peers(const NodeConfig& config) {
    AddressBook book(config.address_book);
    book.load();
    if (book.peers().empty()) {
        std::cout << "No peers added.\n";
    }
    for (const auto& [name, address] : book.peers()) {
        std::cout << name << " (" << address << ")\n";
    }
    return 0;
}

int add_peer(const NodeConfig& config, const std::vector<std::string>& args) {
    if (args.size() != 3) {
        Error::invalid_arguments(Command::ADD_PEER);
        return 1;
    }
    AddressBook book(config.address_book);
    book.load();
    if (!book.add(args[1], args[2])) {
        Error::invalid_peer_address();
        return 1;
    }
    if (!book.save()) {
        return 1;
    }
    std::cout << "Peer '" << args[1] << "' added successfully.\n";
    return 0;
}

int get(const NodeConfig& config, const std::vector<std::string>& args) {
    std::vector<std::string> positional;
    std::optional<std::string> digest;
    for (std::size_t i = 1; i < args.size(); ++i) {
        if (args[i] == "--sha256") {
            if (i + 1 >= args.size()) {
                Error::invalid_digest();
                return 1;
            }
            digest = args[++i];
        } else {
            positional.push_back(args[i]);
        }
    }
    if (positional.size() != 2) {
        Error::invalid_arguments(Command::GET);
        return 1;
    }
    AddressBook book(config.address_book);
    book.load();
    FetchResult result = fetch_file(config, book, positional[0], positional[1], digest);
    if (!result.ok()) {
        std::cerr << "Error (" << Error::to_string(result.kind) << "): " << result.message << std::endl;
        return 1;
    }
    std::cout << result.message << "\n" << result.digest << "  " << result.path.string() << std::endl;
    return 0;
}

int menu(const NodeConfig& config) {
    TransferService service(config);
    service.start();
    const int status = run_interactive(service, config, std::cin, std::cout);
    service.stop();
    return status;
}
}  // namespace

int main(int argc, char* argv[]) {
    try {
        NodeConfig config = Config::from_environment();
        const std::vector<std::string> args = Config::apply_options(argc, argv, config);
        if (args.empty()) {
            Error::print_usage();
            return 1;
        }
        Config::ensure_directories(config);

        const std::string& cmd = args[0];
        if (cmd == Command::SERVE) {
            return serve(config);
        } else if (cmd == Command::FILES) {
            return list_files(config);
        } else if (cmd == Command::PEERS) {
            return list_peers(config);
        } else if (cmd == Command::ADD_PEER) {
            return add_peer(config, args);
        } else if (cmd == Command::GET) {
            return get(config, args);
        } else if (cmd == Command::MENU) {
            return menu(config);
        }
        std::cerr << "Invalid Command!\n";
        Error::print_usage();
        return 1;
    } catch (const std::invalid_argument& e) {
        std::cerr << "[CONFIG] " << e.what() << std::endl;
        Error::print_usage();
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
