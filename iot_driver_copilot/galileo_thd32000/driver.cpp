#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <string>
#include <thread>

#include "config.h"
#include "http_api.h"
#include "http_server.h"
#include "logger.h"
#include "retrieval_worker.h"

static std::atomic<bool> g_should_stop{false};

static void signal_handler(int) {
    g_should_stop.store(true);
}

int main() {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    Config cfg;
    try {
        cfg = load_config_from_env();
    } catch (const std::exception& ex) {
        log_error(std::string("Configuration error: ") + ex.what());
        return 1;
    }
    set_log_level(cfg.log_level);
    log_info(describe_config(cfg));

    RetrievalWorker worker(cfg);

    DriverHttpHandler handler(&worker);
    HttpServer server(cfg.http_host, cfg.http_port, &handler);

    if (!server.start()) {
        log_error("Failed to start HTTP server on " + cfg.http_host + ":" + std::to_string(cfg.http_port) +
                  ": " + server.lastError());
        return 1;
    }

    log_info("HTTP server listening on " + cfg.http_host + ":" + std::to_string(cfg.http_port));
    log_info("Endpoints: GET /status, GET /ports, GET /readings, GET /limits, GET /config, GET /history, "
             "GET /history/load, POST /scan, POST /cancel, POST /config");

    while (!g_should_stop.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    log_info("Shutting down...");
    server.stop();
    worker.cancel();
    worker.wait();
    log_info("Shutdown complete.");
    return 0;
}
