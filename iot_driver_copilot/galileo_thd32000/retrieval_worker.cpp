#include "retrieval_worker.h"

#include <ctime>
#include <exception>
#include <system_error>
#include <utility>

#include "csv_export.h"
#include "equipment_presets.h"
#include "logger.h"
#include "serial_port.h"
#include "simulated_logger.h"

RetrievalWorker::RetrievalWorker(const Config& cfg)
: scanner_(), running_(false), cfg_(cfg) {}

RetrievalWorker::RetrievalWorker(const Config& cfg, const PortScanner& scanner)
: scanner_(scanner), running_(false), cfg_(cfg) {}

RetrievalWorker::~RetrievalWorker() {
    cancel();
    wait();
}

Config RetrievalWorker::config() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return cfg_;
}

bool RetrievalWorker::updateLinkSettings(const LinkSettings& settings, std::string& error) {
    std::lock_guard<std::mutex> start_lk(start_mtx_);
    if (running_.load()) {
        error = "retrieval running";
        return false;
    }
    if (settings.serial_port.empty()) {
        error = "serial_port must not be empty";
        return false;
    }
    if (settings.baud_rates.empty()) {
        error = "baud_rates must list at least one rate";
        return false;
    }

    std::lock_guard<std::mutex> lk(mtx_);
    cfg_.serial_port = settings.serial_port;
    cfg_.baud_rates = settings.baud_rates;
    cfg_.simulation = settings.simulation;
    log_info("Link settings updated: " + describe_config(cfg_));
    return true;
}

std::vector<PortCandidate> RetrievalWorker::candidates() const {
    Config cfg = config();
    if (cfg.simulation) {
        PortCandidate sim;
        sim.device = kSimulatedPort;
        sim.name = kSimulatedPort;
        sim.product = "simulated THD 32000";
        sim.rank = 0;
        return {sim};
    }
    if (cfg.autoDetectPort()) return scanner_.listCandidates();

    PortCandidate fixed;
    fixed.device = cfg.serial_port;
    fixed.name = cfg.serial_port;
    fixed.rank = 0;
    return {fixed};
}

bool RetrievalWorker::start(const std::string& equipment, const std::string& tag) {
    std::lock_guard<std::mutex> start_lk(start_mtx_);
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) return false;
    if (thread_.joinable()) thread_.join();

    Config cfg = config();
    std::vector<PortCandidate> ports = candidates();
    log_info("Starting retrieval for " + equipment + " over " + std::to_string(ports.size()) + " candidate port(s)");

    std::unique_ptr<LinkOpener> opener;
    if (cfg.simulation) {
        SimulationProfile profile;
        const EquipmentPreset* preset = find_preset(equipment);
        if (preset) profile.nominal_temperature = preset->nominal_temperature;
        profile.seed = (uint32_t)std::time(nullptr);
        opener = std::make_unique<SimulatedLoggerOpener>(profile);
    } else {
        opener = std::make_unique<SerialPortOpener>();
    }

    SessionOptions opts;
    opts.baud_rates = cfg.baud_rates;
    opts.probe_timeout_ms = cfg.probe_timeout_ms;
    opts.frame_timeout_ms = cfg.frame_timeout_ms;
    auto session = std::make_shared<RetrievalSession>(opener.get(), std::move(ports), opts);

    {
        std::lock_guard<std::mutex> lk(mtx_);
        opener_ = std::move(opener);
        session_ = session;
        equipment_ = equipment;
        tag_ = tag;
        error_.clear();
    }

    try {
        thread_ = std::thread(&RetrievalWorker::run, this, session, equipment, tag);
    } catch (const std::system_error& ex) {
        log_error(std::string("Cannot start retrieval thread: ") + ex.what());
        running_.store(false);
        return false;
    }
    return true;
}

void RetrievalWorker::cancel() {
    std::shared_ptr<RetrievalSession> session;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        session = session_;
    }
    if (session && running_.load()) {
        log_info("Cancellation requested");
        session->cancel();
    }
}

void RetrievalWorker::wait() {
    std::lock_guard<std::mutex> start_lk(start_mtx_);
    if (thread_.joinable()) thread_.join();
}

void RetrievalWorker::exportResult(RetrievalResult& result) {
    const std::string dir = config().export_dir;
    if (dir.empty() || result.series.empty()) return;
    std::string name = build_export_file_name(std::time(nullptr), result.equipment, result.tag);
    std::string err;
    if (export_series_csv(dir, name, result.equipment, result.tag, result.series, result.info, err)) {
        result.file = name;
        log_info("Exported " + std::to_string(result.series.size()) + " records to " + dir + "/" + name);
    } else {
        result.export_error = err;
        log_error("CSV export failed: " + err);
    }
}

void RetrievalWorker::run(std::shared_ptr<RetrievalSession> session, std::string equipment, std::string tag) {
    try {
        SessionState st = session->run();
        if (st == SessionState::Done) {
            RetrievalResult result;
            result.available = true;
            result.series = session->series();
            result.info = session->deviceInfo();
            result.equipment = equipment;
            result.tag = tag;
            exportResult(result);

            std::lock_guard<std::mutex> lk(mtx_);
            result_ = std::move(result);
        }
    } catch (const std::exception& ex) {
        log_error(std::string("Retrieval worker error: ") + ex.what());
        std::lock_guard<std::mutex> lk(mtx_);
        error_ = ex.what();
    }
    running_.store(false);
}

WorkerStatus RetrievalWorker::status() const {
    WorkerStatus st;
    std::shared_ptr<RetrievalSession> session;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        session = session_;
        st.equipment = equipment_;
        st.tag = tag_;
        st.error = error_;
    }
    st.running = running_.load();
    if (session) {
        st.has_session = true;
        st.progress = session->progress();
        st.failure = session->failure();
        st.link = session->linkConfig();
    }
    return st;
}

RetrievalResult RetrievalWorker::lastResult() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return result_;
}
