#ifndef RETRIEVAL_SESSION_H
#define RETRIEVAL_SESSION_H

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "frame_transport.h"
#include "link_negotiator.h"
#include "measurement.h"
#include "port_scanner.h"
#include "series.h"
#include "serial_link.h"

enum class SessionState {
    Idle,
    Negotiating,
    FetchingInfo,
    FetchingRecords,
    Assembling,
    Done,
    Failed
};

const char* session_state_name(SessionState s);

enum class ErrorKind {
    None,
    PortUnavailable,
    NegotiationExhausted,
    FrameTimeout,
    FrameGarbage,
    DecodeError,
    DeviceCountMismatch,
    Cancelled
};

const char* error_kind_name(ErrorKind k);

struct SessionFailure {
    ErrorKind kind = ErrorKind::None;
    std::string context;
    uint32_t offset = 0;   // records fetched when the session failed

    std::string describe() const;
};

struct SessionProgress {
    SessionState state = SessionState::Idle;
    uint32_t records_fetched = 0;
    uint32_t records_total = 0;
};

struct SessionOptions {
    std::vector<int> baud_rates;
    int probe_timeout_ms = 500;
    int frame_timeout_ms = 1500;
};

// One end-to-end retrieval: negotiate, read DeviceInfo, read every block,
// assemble. Owns the serial link from Negotiating until Done/Failed. Not
// resumable; a new session renegotiates from Idle. progress(), state() and
// cancel() may be called from other threads while run() executes.
class RetrievalSession {
public:
    RetrievalSession(LinkOpener* opener, std::vector<PortCandidate> candidates, SessionOptions options);
    ~RetrievalSession();

    RetrievalSession(const RetrievalSession&) = delete;
    RetrievalSession& operator=(const RetrievalSession&) = delete;

    // Blocks until Done or Failed.
    SessionState run();

    // Checked between block requests; never interrupts an exchange.
    void cancel() { cancel_requested_.store(true); }

    SessionState state() const;
    SessionProgress progress() const;
    SessionFailure failure() const;
    LinkConfig linkConfig() const;

    // Valid once run() returned Done.
    const Series& series() const { return series_; }
    const DeviceInfo& deviceInfo() const { return info_; }

private:
    void transition(SessionState next);
    SessionState fail(ErrorKind kind, const std::string& context);
    SessionState failRead(const ReadResult& res, const std::string& what);
    bool fetchDeviceInfo(FrameTransport& transport, DeviceInfo& out, SessionState& terminal);
    SessionState fetchRecords(FrameTransport& transport);
    void releaseLink();

    LinkOpener* opener_;
    std::vector<PortCandidate> candidates_;
    SessionOptions options_;

    std::unique_ptr<SerialLink> link_;
    DeviceInfo info_;
    std::vector<std::vector<MeasurementRecord>> chunks_;
    Series series_;

    mutable std::mutex mtx_;
    SessionState state_;
    SessionFailure failure_;
    LinkConfig link_config_;
    uint32_t records_fetched_;
    uint32_t records_total_;
    std::atomic<bool> cancel_requested_;
};

#endif // RETRIEVAL_SESSION_H
