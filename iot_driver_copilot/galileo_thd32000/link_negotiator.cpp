#include "link_negotiator.h"

#include <utility>

#include "frame_transport.h"
#include "galileo_protocol.h"
#include "logger.h"

LinkNegotiator::LinkNegotiator(LinkOpener* opener, int probe_timeout_ms, int frame_timeout_ms)
: opener_(opener), probe_timeout_ms_(probe_timeout_ms), frame_timeout_ms_(frame_timeout_ms) {}

NegotiationResult LinkNegotiator::negotiate(const std::vector<PortCandidate>& candidates, const std::vector<int>& baud_rates) {
    NegotiationResult result;
    size_t opened_any = 0;

    if (candidates.empty() || baud_rates.empty()) {
        result.status = NegotiationStatus::Exhausted;
        result.detail = candidates.empty() ? "no serial ports found" : "no baud rates configured";
        return result;
    }

    for (const PortCandidate& cand : candidates) {
        for (int baud : baud_rates) {
            NegotiationAttempt attempt;
            attempt.port = cand.device;
            attempt.baud = baud;

            std::string err;
            std::unique_ptr<SerialLink> link = opener_->open(cand.device, baud, err);
            if (!link) {
                attempt.outcome = "open failed: " + err;
                log_warn("Cannot open " + cand.device + ": " + err);
                result.attempts.push_back(attempt);
                // Unavailable at one rate means unavailable at all of them
                break;
            }
            ++opened_any;

            FrameTransport transport(link.get());
            ReadResult probe = transport.exchange(build_probe_request(), probe_timeout_ms_);
            if (probe.ok()) {
                attempt.outcome = "acknowledged";
                result.attempts.push_back(attempt);
                result.status = NegotiationStatus::Found;
                result.config.port = cand.device;
                result.config.baud = baud;
                result.config.probe_timeout_ms = probe_timeout_ms_;
                result.config.frame_timeout_ms = frame_timeout_ms_;
                result.link = std::move(link);
                log_info("Logger found on " + cand.device + " at " + std::to_string(baud) + " baud");
                return result;
            }

            attempt.outcome = std::string(read_status_name(probe.status)) +
                              (probe.detail.empty() ? "" : ": " + probe.detail);
            log_debug("Probe " + cand.device + "@" + std::to_string(baud) + ": " + attempt.outcome);
            result.attempts.push_back(attempt);
            link->closePort();
        }
    }

    if (opened_any == 0) {
        result.status = NegotiationStatus::PortUnavailable;
        result.detail = "none of " + std::to_string(candidates.size()) + " port(s) could be opened";
    } else {
        result.status = NegotiationStatus::Exhausted;
        result.detail = "no response on " + std::to_string(result.attempts.size()) + " port/baud combination(s)";
    }
    return result;
}
