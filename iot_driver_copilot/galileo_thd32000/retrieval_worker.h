#ifndef RETRIEVAL_WORKER_H
#define RETRIEVAL_WORKER_H

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "config.h"
#include "port_scanner.h"
#include "retrieval_session.h"
#include "serial_link.h"

struct WorkerStatus {
    bool running = false;
    bool has_session = false;
    SessionProgress progress;
    SessionFailure failure;
    LinkConfig link;
    std::string equipment;
    std::string tag;
    std::string error;   // unexpected exception in the worker thread
};

// Runtime-adjustable part of Config.
struct LinkSettings {
    std::string serial_port;
    std::vector<int> baud_rates;
    bool simulation = false;
};

struct RetrievalResult {
    bool available = false;
    Series series;
    DeviceInfo info;
    std::string equipment;
    std::string tag;
    std::string file;           // exported CSV name, empty if export failed
    std::string export_error;
};

// Runs one retrieval session at a time on a background thread and keeps the
// last finalized series for the HTTP layer.
class RetrievalWorker {
public:
    explicit RetrievalWorker(const Config& cfg);
    RetrievalWorker(const Config& cfg, const PortScanner& scanner);
    ~RetrievalWorker();

    RetrievalWorker(const RetrievalWorker&) = delete;
    RetrievalWorker& operator=(const RetrievalWorker&) = delete;

    // False when a retrieval is already running. Safe to call from several
    // threads at once; exactly one of concurrent callers wins.
    bool start(const std::string& equipment, const std::string& tag);
    void cancel();
    // Waits for the running retrieval to finish.
    void wait();

    bool running() const { return running_.load(); }
    WorkerStatus status() const;
    RetrievalResult lastResult() const;

    std::vector<PortCandidate> candidates() const;

    Config config() const;
    // Replaces the serial settings used by the next retrieval. Refused while
    // one is running.
    bool updateLinkSettings(const LinkSettings& settings, std::string& error);

private:
    void run(std::shared_ptr<RetrievalSession> session, std::string equipment, std::string tag);
    void exportResult(RetrievalResult& result);

    PortScanner scanner_;

    // start_mtx_ serializes start/wait around thread_
    std::mutex start_mtx_;
    std::thread thread_;
    std::atomic<bool> running_;

    mutable std::mutex mtx_;
    Config cfg_;
    std::unique_ptr<LinkOpener> opener_;
    std::shared_ptr<RetrievalSession> session_;
    std::string equipment_;
    std::string tag_;
    std::string error_;
    RetrievalResult result_;
};

#endif // RETRIEVAL_WORKER_H
