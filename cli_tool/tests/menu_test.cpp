#include <fcntl.h>
#include <gtest/gtest.h>
#include <sys/resource.h>
#include <unistd.h>

#include <algorithm>
#include <asio.hpp>
#include <chrono>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "address_book.hpp"
#include "menu.hpp"
#include "service.hpp"
#include "test_support.hpp"

using TestSupport::TempDir;

namespace {
// Lowers the descriptor limit and fills the table so exactly one descriptor
// stays free. Restores everything on destruction.
class DescriptorExhaustion {
   public:
    DescriptorExhaustion() {
        getrlimit(RLIMIT_NOFILE, &m_saved);
        int highest = 0;
        for (const auto& entry : std::filesystem::directory_iterator("/proc/self/fd")) {
            highest = std::max(highest, std::stoi(entry.path().filename().string()));
        }
        rlimit lowered = m_saved;
        lowered.rlim_cur = std::min<rlim_t>(m_saved.rlim_cur, static_cast<rlim_t>(highest) + 16);
        setrlimit(RLIMIT_NOFILE, &lowered);
        while (true) {
            int fd = ::open("/dev/null", O_RDONLY);
            if (fd < 0) break;
            m_held.push_back(fd);
        }
        if (!m_held.empty()) {
            ::close(m_held.back());
            m_held.pop_back();
        }
    }
    ~DescriptorExhaustion() {
        for (int fd : m_held) ::close(fd);
        setrlimit(RLIMIT_NOFILE, &m_saved);
    }
    DescriptorExhaustion(const DescriptorExhaustion&) = delete;
    DescriptorExhaustion& operator=(const DescriptorExhaustion&) = delete;

   private:
    rlimit m_saved{};
    std::vector<int> m_held;
};
}  // namespace

class MenuTest : public ::testing::Test {
   protected:
    void SetUp() override {
        config.served_dir = root / "Uploads";
        config.downloads_dir = root / "Downloads";
        config.address_book = root / "address_book.json";
        config.port = 0;
        config.worker_threads = 2;
        Config::ensure_directories(config);
    }

    std::string run(const std::string& script) {
        std::istringstream in(script);
        std::ostringstream out;
        AddressBook book(config.address_book);
        Menu menu(config, book, in, out);
        menu.run();
        return out.str();
    }

    TempDir root;
    NodeConfig config;
};

TEST_F(MenuTest, ListFiles) {
    EXPECT_NE(run("1\n5\n").find("No files available for download."), std::string::npos);

    TestSupport::write_file(config.served_dir / "b.txt", "b");
    TestSupport::write_file(config.served_dir / "a.txt", "a");
    const std::string out = run("1\n5\n");
    EXPECT_NE(out.find("Files available for download:\n1. a.txt\n2. b.txt\n"), std::string::npos);
}

TEST_F(MenuTest, AddAndListPeers) {
    EXPECT_NE(run("2\n5\n").find("No peers added."), std::string::npos);

    std::string out = run("3\nalice\n192.168.1.2:5000\n5\n");
    EXPECT_NE(out.find("Peer 'alice' added successfully."), std::string::npos);

    out = run("2\n5\n");
    EXPECT_NE(out.find("Saved Peers:\n1. alice (192.168.1.2:5000)\n"), std::string::npos);

    AddressBook book(config.address_book);
    book.load();
    EXPECT_EQ(book.lookup("alice"), "192.168.1.2:5000");
}

TEST_F(MenuTest, AddPeerRejectsBadAddress) {
    const std::string out = run("3\nbob\nnot-an-address\n5\n");
    EXPECT_NE(out.find("Error: invalid peer name or address."), std::string::npos);
    EXPECT_FALSE(std::filesystem::exists(config.address_book));
}

TEST_F(MenuTest, DownloadFromRunningService) {
    TestSupport::write_file(config.served_dir / "menu.txt", "picked from the menu");
    TransferService service(config);
    service.start();

    const std::string script = "4\n127.0.0.1:" + std::to_string(service.port()) + "\nmenu.txt\n5\n";
    const std::string out = run(script);
    EXPECT_NE(out.find("'menu.txt' downloaded and verified successfully."), std::string::npos);
    EXPECT_EQ(TestSupport::read_file(config.downloads_dir / "menu.txt"), "picked from the menu");
}

TEST_F(MenuTest, DownloadReportsNotFound) {
    TransferService service(config);
    service.start();

    const std::string script = "4\n127.0.0.1:" + std::to_string(service.port()) + "\nmissing.txt\nq\n";
    EXPECT_NE(run(script).find("Error (not found)"), std::string::npos);
}

TEST_F(MenuTest, UnknownOptionAndEndOfInput) {
    const std::string out = run("9\n");
    EXPECT_NE(out.find("Unknown option '9'"), std::string::npos);
    EXPECT_NE(out.find("4. Download File"), std::string::npos);
}

TEST_F(MenuTest, InteractiveSessionWithHealthyListenerExitsZero) {
    TransferService service(config);
    service.start();
    std::istringstream in("5\n");
    std::ostringstream out;
    EXPECT_EQ(run_interactive(service, config, in, out), 0);
}

TEST_F(MenuTest, InteractiveSessionReportsDeadListener) {
    TransferService service(config);
    service.start();

    asio::io_context io;
    asio::ip::tcp::socket client(io);
    {
        // The client takes the last descriptor, so the listener's accept fails.
        DescriptorExhaustion exhaustion;
        asio::error_code ec;
        client.connect(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), service.port()), ec);
        ASSERT_FALSE(ec) << ec.message();
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (!service.failed() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }
    ASSERT_TRUE(service.failed());

    std::istringstream in("5\n");
    std::ostringstream out;
    EXPECT_EQ(run_interactive(service, config, in, out), 1);
}
