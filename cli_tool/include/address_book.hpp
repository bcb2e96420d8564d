#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <utility>

#include "types.h"

// Name -> "host:port" mapping persisted as a flat JSON object.
class AddressBook {
   public:
    explicit AddressBook(std::filesystem::path file) : m_file(std::move(file)) {}

    // A missing file leaves the book empty; a malformed one is logged and
    // also leaves it empty.
    void load();
    bool save() const;

    // Rejects empty names, names or addresses that are not UTF-8, and
    // addresses that are not host:port.
    bool add(const std::string& name, const std::string& address);
    std::optional<std::string> lookup(const std::string& name) const;

    // Registered name first, then a literal host:port.
    std::optional<PeerEndpoint> resolve(const std::string& peer) const;

    const std::map<std::string, std::string>& peers() const { return m_peers; }
    const std::filesystem::path& file() const { return m_file; }

   private:
    std::filesystem::path m_file;
    std::map<std::string, std::string> m_peers;
};
