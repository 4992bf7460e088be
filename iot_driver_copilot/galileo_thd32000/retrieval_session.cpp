#include "retrieval_session.h"

#include <algorithm>
#include <utility>

#include "galileo_protocol.h"
#include "logger.h"
#include "record_decoder.h"

const char* session_state_name(SessionState s) {
    switch (s) {
        case SessionState::Idle: return "idle";
        case SessionState::Negotiating: return "negotiating";
        case SessionState::FetchingInfo: return "fetching_info";
        case SessionState::FetchingRecords: return "fetching_records";
        case SessionState::Assembling: return "assembling";
        case SessionState::Done: return "done";
        case SessionState::Failed: return "failed";
    }
    return "unknown";
}

const char* error_kind_name(ErrorKind k) {
    switch (k) {
        case ErrorKind::None: return "none";
        case ErrorKind::PortUnavailable: return "port_unavailable";
        case ErrorKind::NegotiationExhausted: return "negotiation_exhausted";
        case ErrorKind::FrameTimeout: return "frame_timeout";
        case ErrorKind::FrameGarbage: return "frame_garbage";
        case ErrorKind::DecodeError: return "decode_error";
        case ErrorKind::DeviceCountMismatch: return "device_count_mismatch";
        case ErrorKind::Cancelled: return "cancelled";
    }
    return "unknown";
}

std::string SessionFailure::describe() const {
    return std::string(error_kind_name(kind)) + " at record " + std::to_string(offset) + ": " + context;
}

RetrievalSession::RetrievalSession(LinkOpener* opener, std::vector<PortCandidate> candidates, SessionOptions options)
: opener_(opener),
  candidates_(std::move(candidates)),
  options_(std::move(options)),
  state_(SessionState::Idle),
  records_fetched_(0),
  records_total_(0),
  cancel_requested_(false) {}

RetrievalSession::~RetrievalSession() {
    releaseLink();
}

SessionState RetrievalSession::state() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return state_;
}

SessionProgress RetrievalSession::progress() const {
    std::lock_guard<std::mutex> lk(mtx_);
    SessionProgress p;
    p.state = state_;
    p.records_fetched = records_fetched_;
    p.records_total = records_total_;
    return p;
}

SessionFailure RetrievalSession::failure() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return failure_;
}

LinkConfig RetrievalSession::linkConfig() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return link_config_;
}

void RetrievalSession::releaseLink() {
    if (link_) {
        link_->closePort();
        link_.reset();
    }
}

void RetrievalSession::transition(SessionState next) {
    SessionState prev;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        prev = state_;
        state_ = next;
    }
    if (next == SessionState::Done || next == SessionState::Failed) releaseLink();
    log_debug(std::string("session: ") + session_state_name(prev) + " -> " + session_state_name(next));
}

SessionState RetrievalSession::fail(ErrorKind kind, const std::string& context) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        failure_.kind = kind;
        failure_.context = context;
        failure_.offset = records_fetched_;
    }
    log_error("Retrieval failed: " + failure().describe());
    transition(SessionState::Failed);
    return SessionState::Failed;
}

SessionState RetrievalSession::failRead(const ReadResult& res, const std::string& what) {
    std::string ctx = what + ": " + res.detail + " after " + std::to_string(res.attempts) + " attempt(s)";
    switch (res.status) {
        case ReadStatus::Timeout: return fail(ErrorKind::FrameTimeout, ctx);
        case ReadStatus::Garbage: return fail(ErrorKind::FrameGarbage, ctx);
        case ReadStatus::LinkError: return fail(ErrorKind::PortUnavailable, "link lost during " + ctx);
        case ReadStatus::Frame: break;
    }
    return fail(ErrorKind::DecodeError, what + ": unexpected frame outcome");
}

bool RetrievalSession::fetchDeviceInfo(FrameTransport& transport, DeviceInfo& out, SessionState& terminal) {
    ReadResult res = transport.call(build_header_request(), options_.frame_timeout_ms);
    if (!res.ok()) {
        terminal = failRead(res, "header");
        return false;
    }
    std::string err;
    if (!parse_header(res.frame.payload.data(), res.frame.payload.size(), out, err)) {
        terminal = fail(ErrorKind::DecodeError, "header: " + err);
        return false;
    }
    return true;
}

SessionState RetrievalSession::run() {
    if (state() != SessionState::Idle) {
        log_warn("Retrieval session already used; start a new one");
        return state();
    }

    transition(SessionState::Negotiating);
    LinkNegotiator negotiator(opener_, options_.probe_timeout_ms, options_.frame_timeout_ms);
    NegotiationResult neg = negotiator.negotiate(candidates_, options_.baud_rates);
    if (neg.status == NegotiationStatus::PortUnavailable) {
        return fail(ErrorKind::PortUnavailable, neg.detail);
    }
    if (neg.status != NegotiationStatus::Found) {
        return fail(ErrorKind::NegotiationExhausted, neg.detail);
    }
    link_ = std::move(neg.link);
    {
        std::lock_guard<std::mutex> lk(mtx_);
        link_config_ = neg.config;
    }

    if (cancel_requested_.load()) return fail(ErrorKind::Cancelled, "cancelled after negotiation");

    transition(SessionState::FetchingInfo);
    FrameTransport transport(link_.get());
    SessionState terminal = SessionState::Failed;
    if (!fetchDeviceInfo(transport, info_, terminal)) return terminal;

    log_info("Logger " + (info_.model.empty() ? std::string("(unnamed)") : info_.model) + ": " +
             std::to_string(info_.record_count) + " records every " + std::to_string(info_.interval_seconds) +
             "s since " + format_timestamp(info_.start_timestamp));
    {
        std::lock_guard<std::mutex> lk(mtx_);
        records_total_ = info_.record_count;
    }

    if (info_.record_count == 0) {
        series_ = Series();
        transition(SessionState::Done);
        return SessionState::Done;
    }

    transition(SessionState::FetchingRecords);
    return fetchRecords(transport);
}

SessionState RetrievalSession::fetchRecords(FrameTransport& transport) {
    const size_t width = record_width(info_.format);
    const uint32_t per_block = (uint32_t)(kBlockFrameLen / width);
    uint32_t offset = 0;
    uint32_t block = 0;

    while (offset < info_.record_count) {
        if (cancel_requested_.load()) return fail(ErrorKind::Cancelled, "cancelled by request");
        if (block >= kMaxBlocks) {
            return fail(ErrorKind::DeviceCountMismatch,
                        "declared " + std::to_string(info_.record_count) + " records exceed " +
                        std::to_string(kMaxBlocks) + " blocks");
        }

        ReadResult res = transport.call(build_block_request((uint8_t)block), options_.frame_timeout_ms);
        if (!res.ok()) return failRead(res, "block " + std::to_string(block));

        uint32_t want = std::min(per_block, info_.record_count - offset);
        Chunk chunk;
        chunk.first_index = offset;
        chunk.payload.assign(res.frame.payload.begin(), res.frame.payload.begin() + (long)(want * width));

        // The payload stops at the declared count, so no record here can be
        // taken for the end marker.
        DecodeResult dec = decode_chunk(chunk, info_);
        if (!dec.ok) return fail(ErrorKind::DecodeError, "block " + std::to_string(block) + ": " + dec.error);

        offset += (uint32_t)dec.records.size();
        chunks_.push_back(std::move(dec.records));
        {
            std::lock_guard<std::mutex> lk(mtx_);
            records_fetched_ = offset;
        }
        log_debug("block " + std::to_string(block) + ": " + std::to_string(offset) + "/" +
                  std::to_string(info_.record_count));
        ++block;
    }

    // The device must still declare the same history after the download
    DeviceInfo after;
    SessionState terminal = SessionState::Failed;
    if (!fetchDeviceInfo(transport, after, terminal)) return terminal;
    if (after.record_count != info_.record_count) {
        return fail(ErrorKind::DeviceCountMismatch,
                    "record count changed from " + std::to_string(info_.record_count) + " to " +
                    std::to_string(after.record_count) + " during download");
    }

    transition(SessionState::Assembling);
    Series assembled = assemble(chunks_);
    chunks_.clear();
    if (assembled.size() != info_.record_count || assembled.missingCount() != 0) {
        return fail(ErrorKind::DeviceCountMismatch,
                    "assembled " + std::to_string(assembled.size()) + " records, " +
                    std::to_string(assembled.missingCount()) + " missing, declared " +
                    std::to_string(info_.record_count));
    }
    series_ = std::move(assembled);
    transition(SessionState::Done);
    log_info("Retrieved " + std::to_string(series_.size()) + " records");
    return SessionState::Done;
}
