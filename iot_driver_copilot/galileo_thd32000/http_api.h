#ifndef HTTP_API_H
#define HTTP_API_H

#include <string>
#include <vector>

#include "config.h"
#include "equipment_presets.h"
#include "http_server.h"
#include "retrieval_worker.h"
#include "series.h"

std::string build_status_json(const WorkerStatus& st);
std::string build_ports_json(const std::vector<PortCandidate>& ports);
std::string build_readings_json(const RetrievalResult& result);
std::string build_limits_json(const EquipmentPreset& preset);
std::string build_config_json(const Config& cfg);
std::string build_history_json(const std::vector<std::string>& files);

// Routes:
//   GET  /status  /ports  /readings  /limits?equipment=  /config
//        /history  /history/load?file=
//   POST /scan?equipment=&tag=  /cancel
//        /config?serial_port=&baud_rates=&simulation=
class DriverHttpHandler : public IHttpRequestHandler {
public:
    explicit DriverHttpHandler(RetrievalWorker* worker) : worker_(worker) {}

    void handleRequest(const HttpRequest& req, HttpResponse& resp) override;

private:
    void loadHistory(const HttpRequest& req, HttpResponse& resp);
    void saveConfig(const HttpRequest& req, HttpResponse& resp);

    RetrievalWorker* worker_;
};

#endif // HTTP_API_H
