#include <ftw.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>
#include <vector>

#include "port_scanner.h"

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"

namespace {
int remove_entry(const char* path, const struct stat*, int, struct FTW*)
{
    return ::remove(path);
}

// Fake /dev and /sys/class/tty under a temporary directory.
struct FakeTree {
    std::string root;
    std::string dev;
    std::string sys;

    FakeTree()
    {
        char tmpl[] = "/tmp/galileo_scan_XXXXXX";
        root = ::mkdtemp(tmpl);
        dev = root + "/dev";
        sys = root + "/sys";
        ::mkdir(dev.c_str(), 0755);
        ::mkdir(sys.c_str(), 0755);
    }

    ~FakeTree() { ::nftw(root.c_str(), remove_entry, 16, FTW_DEPTH | FTW_PHYS); }

    void node(const std::string& name) { write(dev + "/" + name, ""); }

    void dir(const std::string& rel) { ::mkdir((sys + "/" + rel).c_str(), 0755); }

    void write(const std::string& path, const std::string& content)
    {
        std::ofstream f(path);
        f << content << "\n";
    }

    void sysfile(const std::string& rel, const std::string& content) { write(sys + "/" + rel, content); }

    void driver(const std::string& name, const std::string& target)
    {
        dir(name);
        dir(name + "/device");
        ::symlink(target.c_str(), (sys + "/" + name + "/device/driver").c_str());
    }
};
}  // namespace

TEST_CASE("known bridge vendors rank first, placeholder UARTs are dropped")
{
    FakeTree t;
    t.node("ttyUSB1");
    t.node("ttyUSB0");
    t.node("ttyACM0");
    t.node("ttyS0");
    t.node("ttyS1");
    t.node("ttyS4");
    t.node("ttyUSB");
    t.node("console");

    // FTDI adapter, idVendor on the device directory
    t.dir("ttyUSB0");
    t.dir("ttyUSB0/device");
    t.sysfile("ttyUSB0/device/idVendor", "0403");
    t.sysfile("ttyUSB0/device/idProduct", "6001");
    t.sysfile("ttyUSB0/device/manufacturer", "FTDI");
    t.sysfile("ttyUSB0/device/product", "FT232R USB UART");

    // CDC device of an unknown vendor, idVendor one level up
    t.dir("ttyACM0");
    t.dir("ttyACM0/device");
    t.sysfile("ttyACM0/idVendor", "2341");

    t.driver("ttyS0", "../../../bus/platform/drivers/serial8250");
    t.driver("ttyS1", "../../../bus/platform/drivers/dw-apb-uart");

    PortScanner scanner(t.dev, t.sys);
    std::vector<PortCandidate> ports = scanner.listCandidates();

    REQUIRE(ports.size() == 4);
    CHECK(ports[0].name == "ttyUSB0");
    CHECK(ports[0].device == t.dev + "/ttyUSB0");
    CHECK(ports[0].rank == 0);
    CHECK(ports[0].vendor_id == "0403");
    CHECK(ports[0].product_id == "6001");
    CHECK(ports[0].product == "FT232R USB UART");

    CHECK(ports[1].name == "ttyACM0");
    CHECK(ports[1].rank == 1);
    CHECK(ports[1].vendor_id == "2341");

    CHECK(ports[2].name == "ttyUSB1");
    CHECK(ports[2].rank == 1);
    CHECK(ports[2].vendor_id.empty());

    CHECK(ports[3].name == "ttyS1");
    CHECK(ports[3].rank == 2);
}

TEST_CASE("numeric suffixes sort numerically")
{
    FakeTree t;
    t.node("ttyUSB10");
    t.node("ttyUSB2");
    t.node("ttyUSB0");

    std::vector<PortCandidate> ports = PortScanner(t.dev, t.sys).listCandidates();
    REQUIRE(ports.size() == 3);
    CHECK(ports[0].name == "ttyUSB0");
    CHECK(ports[1].name == "ttyUSB2");
    CHECK(ports[2].name == "ttyUSB10");
}

TEST_CASE("a missing /dev yields no candidates")
{
    PortScanner scanner("/nonexistent/dev", "/nonexistent/sys");
    CHECK(scanner.listCandidates().empty());
}

TEST_CASE("vendor ids match case-insensitively")
{
    CHECK(is_known_vendor("10C4"));
    CHECK(is_known_vendor("1a86"));
    CHECK_FALSE(is_known_vendor("2341"));
    CHECK_FALSE(is_known_vendor(""));
}
