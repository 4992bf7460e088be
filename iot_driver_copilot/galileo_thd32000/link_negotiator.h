#ifndef LINK_NEGOTIATOR_H
#define LINK_NEGOTIATOR_H

#include <memory>
#include <string>
#include <vector>

#include "port_scanner.h"
#include "serial_link.h"

struct LinkConfig {
    std::string port;
    int baud = 0;
    int probe_timeout_ms = 500;
    int frame_timeout_ms = 1500;
};

enum class NegotiationStatus {
    Found,
    Exhausted,        // ports opened but nothing answered the probe
    PortUnavailable   // no candidate could be opened at all
};

struct NegotiationAttempt {
    std::string port;
    int baud = 0;
    std::string outcome;
};

struct NegotiationResult {
    NegotiationStatus status = NegotiationStatus::Exhausted;
    LinkConfig config;
    std::unique_ptr<SerialLink> link;   // open and confirmed when Found
    std::vector<NegotiationAttempt> attempts;
    std::string detail;
};

// Searches (port x baud) in the given order and keeps the first link that
// answers the identity probe. Each failed attempt closes its port before the
// next one is opened.
class LinkNegotiator {
public:
    LinkNegotiator(LinkOpener* opener, int probe_timeout_ms, int frame_timeout_ms);

    NegotiationResult negotiate(const std::vector<PortCandidate>& candidates, const std::vector<int>& baud_rates);

private:
    LinkOpener* opener_;
    int probe_timeout_ms_;
    int frame_timeout_ms_;
};

#endif // LINK_NEGOTIATOR_H
