#include <atomic>
#include <string>
#include <thread>

#include "retrieval_worker.h"

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"

namespace {
// The simulated logger only answers at 9600; the rates before it keep a
// retrieval busy for a few probe timeouts.
Config slow_simulated_config()
{
    Config cfg{};
    cfg.http_host = "127.0.0.1";
    cfg.http_port = 5000;
    cfg.serial_port = "auto";
    cfg.baud_rates = {19200, 38400, 57600, 9600};
    cfg.probe_timeout_ms = 50;
    cfg.frame_timeout_ms = 50;
    cfg.simulation = true;
    cfg.log_level = LogLevel::Error;
    return cfg;
}
}  // namespace

TEST_CASE("concurrent starts admit exactly one retrieval")
{
    set_log_level(LogLevel::Error);
    RetrievalWorker worker(slow_simulated_config());

    for (int round = 0; round < 10; ++round) {
        std::atomic<int> ready{0};
        std::atomic<int> accepted{0};
        auto contender = [&] {
            ++ready;
            while (ready.load() < 2) {
            }
            if (worker.start("HELADERA", "")) ++accepted;
        };
        std::thread a(contender);
        std::thread b(contender);
        a.join();
        b.join();

        CHECK(accepted.load() == 1);
        CHECK(worker.running());
        worker.cancel();
        worker.wait();
        CHECK_FALSE(worker.running());
    }
}

TEST_CASE("link settings change only while idle")
{
    set_log_level(LogLevel::Error);
    RetrievalWorker worker(slow_simulated_config());

    LinkSettings settings;
    settings.serial_port = "/dev/ttyUSB7";
    settings.baud_rates = {9600};
    settings.simulation = true;

    REQUIRE(worker.start("FREEZER", "F01"));
    std::string err;
    CHECK_FALSE(worker.updateLinkSettings(settings, err));
    CHECK(err == "retrieval running");
    worker.cancel();
    worker.wait();

    err.clear();
    REQUIRE(worker.updateLinkSettings(settings, err));
    Config cfg = worker.config();
    CHECK(cfg.serial_port == "/dev/ttyUSB7");
    CHECK(cfg.baud_rates == std::vector<int>{9600});

    settings.baud_rates.clear();
    CHECK_FALSE(worker.updateLinkSettings(settings, err));
}

TEST_CASE("a fixed serial port is the only candidate")
{
    Config cfg = slow_simulated_config();
    cfg.simulation = false;
    cfg.serial_port = "/dev/ttyACM3";
    RetrievalWorker worker(cfg);
    std::vector<PortCandidate> ports = worker.candidates();
    REQUIRE(ports.size() == 1);
    CHECK(ports[0].device == "/dev/ttyACM3");
}
