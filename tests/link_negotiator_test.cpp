#include <string>
#include <utility>
#include <vector>

#include "fake_link.h"
#include "link_negotiator.h"

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"

namespace {
std::vector<PortCandidate> ports(const std::vector<std::string>& devices)
{
    std::vector<PortCandidate> out;
    for (const std::string& d : devices) {
        PortCandidate pc;
        pc.device = d;
        pc.name = d;
        out.push_back(pc);
    }
    return out;
}
}  // namespace

TEST_CASE("only the answering port and baud is selected")
{
    FakeDevice dev = make_device(0);
    FakeOpener opener;
    opener.devices[std::make_pair(std::string("PortB"), 19200)] = dev.responder();
    // wrong baud on PortA produces line noise, not an acknowledgment
    opener.devices[std::make_pair(std::string("PortA"), 9600)] = [](const std::vector<uint8_t>&) {
        return std::vector<uint8_t>(16, 0x00);
    };

    LinkNegotiator negotiator(&opener, 20, 50);
    NegotiationResult res = negotiator.negotiate(ports({"PortA", "PortB"}), {9600, 19200});

    REQUIRE(res.status == NegotiationStatus::Found);
    CHECK(res.config.port == "PortB");
    CHECK(res.config.baud == 19200);
    CHECK(res.config.probe_timeout_ms == 20);
    CHECK(res.config.frame_timeout_ms == 50);
    REQUIRE(res.link);
    CHECK(res.link->isOpen());

    std::vector<std::pair<std::string, int>> expected = {
        {"PortA", 9600}, {"PortA", 19200}, {"PortB", 9600}, {"PortB", 19200}};
    CHECK(opener.opened == expected);
    CHECK(opener.closed == 3);
    REQUIRE(res.attempts.size() == 4);
    CHECK(res.attempts[0].outcome.find("garbage") == 0);
    CHECK(res.attempts[1].outcome.find("timeout") == 0);
    CHECK(res.attempts[3].outcome == "acknowledged");
    CHECK(dev.probes == 1);
}

TEST_CASE("silence everywhere exhausts the search")
{
    FakeOpener opener;
    LinkNegotiator negotiator(&opener, 10, 10);
    NegotiationResult res = negotiator.negotiate(ports({"PortA", "PortB"}), {9600, 19200, 38400});

    CHECK(res.status == NegotiationStatus::Exhausted);
    CHECK_FALSE(res.link);
    CHECK(res.attempts.size() == 6);
    CHECK(opener.closed == 6);
}

TEST_CASE("ports that cannot be opened are skipped")
{
    FakeDevice dev = make_device(0);
    FakeOpener opener;
    opener.unavailable.insert("PortA");
    opener.devices[std::make_pair(std::string("PortB"), 9600)] = dev.responder();

    LinkNegotiator negotiator(&opener, 10, 10);
    NegotiationResult res = negotiator.negotiate(ports({"PortA", "PortB"}), {9600, 19200});

    REQUIRE(res.status == NegotiationStatus::Found);
    CHECK(res.config.port == "PortB");
    CHECK(res.config.baud == 9600);
    // one failed open per unavailable port, not one per baud
    CHECK(res.attempts.size() == 2);
    CHECK(res.attempts[0].outcome.find("open failed") == 0);
}

TEST_CASE("no openable port is reported as unavailable")
{
    FakeOpener opener;
    opener.unavailable.insert("PortA");
    LinkNegotiator negotiator(&opener, 10, 10);
    NegotiationResult res = negotiator.negotiate(ports({"PortA"}), {9600});
    CHECK(res.status == NegotiationStatus::PortUnavailable);
    CHECK(opener.opened.empty());
}

TEST_CASE("empty candidate or baud lists exhaust immediately")
{
    FakeOpener opener;
    LinkNegotiator negotiator(&opener, 10, 10);
    CHECK(negotiator.negotiate({}, {9600}).status == NegotiationStatus::Exhausted);
    CHECK(negotiator.negotiate(ports({"PortA"}), {}).status == NegotiationStatus::Exhausted);
    CHECK(opener.opened.empty());
}
