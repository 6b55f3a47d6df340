#include <catch2/catch_test_macros.hpp>

#include "platform/linux/procfs_port_probe.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

constexpr const char* TCP_TABLE =
    "  sl  local_address rem_address   st tx_queue rx_queue tr tm->when retrnsmt   uid  timeout inode\n"
    "   0: 00000000:223D 00000000:0000 0A 00000000:00000000 00:00000000 00000000  1000        0 41234 1 0000000000000000 100 0 0 10 0\n"
    "   1: 0100007F:0277 00000000:0000 0A 00000000:00000000 00:00000000 00000000     0        0 17001 1 0000000000000000 100 0 0 10 0\n"
    "   2: 0100007F:223D 0100007F:C350 01 00000000:00000000 00:00000000 00000000  1000        0 41999 1 0000000000000000 20 4 30 10 -1\n";

// Fake /proc tree: one process owning socket inode 41234.
struct FakeProc {
    fs::path root;

    FakeProc() {
        root = fs::temp_directory_path() / ("micdrop_test_proc_" + std::to_string(getpid()));
        fs::create_directories(root / "net");
        fs::create_directories(root / "4242" / "fd");
        fs::create_directories(root / "self");

        std::ofstream(root / "net" / "tcp") << TCP_TABLE;
        std::ofstream(root / "4242" / "comm") << "old-micdrop\n";
        fs::create_symlink("socket:[41234]", root / "4242" / "fd" / "7");
        fs::create_symlink("/dev/null", root / "4242" / "fd" / "0");
    }

    ~FakeProc() { fs::remove_all(root); }
};

} // namespace

TEST_CASE("ProcfsPortProbe", "[port]") {

    SECTION("ParsesListeningSockets") {
        std::istringstream in(TCP_TABLE);
        auto inodes = ProcfsPortProbe::parse_listen_inodes(in, 8765);
        REQUIRE(inodes == std::vector<uint64_t>{41234});
    }

    SECTION("IgnoresNonListeningStates") {
        std::istringstream in(TCP_TABLE);
        // 0xC350 only appears as a remote port of an established socket
        REQUIRE(ProcfsPortProbe::parse_listen_inodes(in, 50000).empty());
    }

    SECTION("OtherPort") {
        std::istringstream in(TCP_TABLE);
        REQUIRE(ProcfsPortProbe::parse_listen_inodes(in, 631) == std::vector<uint64_t>{17001});
    }

    SECTION("FindsOwnerInFakeTree") {
        FakeProc proc;
        ProcfsPortProbe probe(proc.root.string());

        REQUIRE(probe.is_listening(8765));
        auto owner = probe.owner(8765);
        REQUIRE(owner.has_value());
        REQUIRE(owner->pid == 4242);
        REQUIRE(owner->command == "old-micdrop");
    }

    SECTION("FreePortHasNoOwner") {
        FakeProc proc;
        ProcfsPortProbe probe(proc.root.string());

        REQUIRE_FALSE(probe.is_listening(9999));
        REQUIRE_FALSE(probe.owner(9999).has_value());
    }

    SECTION("MissingProcRoot") {
        ProcfsPortProbe probe("/nonexistent/micdrop-proc");
        REQUIRE_FALSE(probe.is_listening(8765));
        REQUIRE_FALSE(probe.owner(8765).has_value());
    }
}
