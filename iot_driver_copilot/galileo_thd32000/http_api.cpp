#include "http_api.h"

#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <utility>

#include "csv_export.h"

static void set_json(HttpResponse& resp, int status, const std::string& text, const std::string& body) {
    resp.status = status;
    resp.status_text = text;
    resp.headers["Content-Type"] = "application/json";
    resp.body = body;
}

static std::string error_json(const std::string& msg) {
    return "{\"error\":\"" + json_escape(msg) + "\"}";
}

static void write_channel(std::ostringstream& oss, const ChannelStats& c) {
    oss << "{";
    if (c.has_data) {
        oss << "\"count\":" << c.count << ",";
        oss << "\"min\":" << c.min << ",";
        oss << "\"min_at\":\"" << json_escape(format_timestamp(c.min_timestamp)) << "\",";
        oss << "\"max\":" << c.max << ",";
        oss << "\"max_at\":\"" << json_escape(format_timestamp(c.max_timestamp)) << "\",";
        oss << "\"avg\":" << c.avg;
    } else {
        oss << "\"count\":0,\"min\":null,\"max\":null,\"avg\":null";
    }
    oss << "}";
}

static void write_range(std::ostringstream& oss, const Range& r) {
    oss << "{\"min\":";
    if (r.has_min) oss << r.min; else oss << "null";
    oss << ",\"max\":";
    if (r.has_max) oss << r.max; else oss << "null";
    oss << "}";
}

static void write_limits(std::ostringstream& oss, const ChannelLimits& l) {
    oss << "{\"alert\":";
    write_range(oss, l.alert);
    oss << ",\"action\":";
    write_range(oss, l.action);
    oss << "}";
}

std::string build_status_json(const WorkerStatus& st) {
    std::ostringstream oss;
    oss << "{";
    oss << "\"running\":" << (st.running ? "true" : "false") << ",";
    oss << "\"state\":\"" << (st.has_session ? session_state_name(st.progress.state) : "idle") << "\",";
    oss << "\"equipment\":\"" << json_escape(st.equipment) << "\",";
    oss << "\"tag\":\"" << json_escape(st.tag) << "\",";
    oss << "\"port\":\"" << json_escape(st.link.port) << "\",";
    oss << "\"baud\":" << st.link.baud << ",";
    oss << "\"records_fetched\":" << st.progress.records_fetched << ",";
    oss << "\"records_total\":" << st.progress.records_total << ",";
    if (st.failure.kind != ErrorKind::None) {
        oss << "\"error_kind\":\"" << error_kind_name(st.failure.kind) << "\",";
        oss << "\"last_error\":\"" << json_escape(st.failure.describe()) << "\"";
    } else {
        oss << "\"error_kind\":null,";
        oss << "\"last_error\":\"" << json_escape(st.error) << "\"";
    }
    oss << "}";
    return oss.str();
}

std::string build_ports_json(const std::vector<PortCandidate>& ports) {
    std::ostringstream oss;
    oss << "{\"ports\":[";
    for (size_t i = 0; i < ports.size(); ++i) {
        const PortCandidate& p = ports[i];
        if (i) oss << ",";
        oss << "{";
        oss << "\"device\":\"" << json_escape(p.device) << "\",";
        oss << "\"vendor_id\":\"" << json_escape(p.vendor_id) << "\",";
        oss << "\"product_id\":\"" << json_escape(p.product_id) << "\",";
        oss << "\"manufacturer\":\"" << json_escape(p.manufacturer) << "\",";
        oss << "\"product\":\"" << json_escape(p.product) << "\",";
        oss << "\"rank\":" << p.rank;
        oss << "}";
    }
    oss << "]}";
    return oss.str();
}

// Records outside the alert / action range of a channel. Faulted values are
// not counted.
static void count_excursions(const Series& series, const EquipmentPreset& preset,
                             size_t& temp_alert, size_t& temp_action,
                             size_t& hum_alert, size_t& hum_action) {
    temp_alert = temp_action = hum_alert = hum_action = 0;
    for (const MeasurementRecord& r : series.records()) {
        if (!r.temperatureFaulted()) {
            if (!preset.temperature.alert.contains(r.temperature)) ++temp_alert;
            if (!preset.temperature.action.contains(r.temperature)) ++temp_action;
        }
        if (preset.has_humidity && !r.humidityFaulted()) {
            if (!preset.humidity.alert.contains(r.humidity)) ++hum_alert;
            if (!preset.humidity.action.contains(r.humidity)) ++hum_action;
        }
    }
}

std::string build_readings_json(const RetrievalResult& result) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1);
    oss << "{";
    oss << "\"equipment\":\"" << json_escape(result.equipment) << "\",";
    oss << "\"tag\":\"" << json_escape(result.tag) << "\",";
    oss << "\"model\":\"" << json_escape(result.info.model) << "\",";
    oss << "\"interval_s\":" << result.info.interval_seconds << ",";
    oss << "\"file\":\"" << json_escape(result.file) << "\",";
    oss << "\"missing\":" << result.series.missingCount() << ",";

    Summary sum = summarize(result.series);
    oss << "\"summary\":{";
    oss << "\"samples\":" << sum.samples << ",";
    if (sum.has_data) {
        oss << "\"start\":\"" << json_escape(sum.start) << "\",";
        oss << "\"end\":\"" << json_escape(sum.end) << "\",";
    } else {
        oss << "\"start\":null,\"end\":null,";
    }
    oss << "\"temperature\":";
    write_channel(oss, sum.stats.temperature);
    oss << ",\"humidity\":";
    write_channel(oss, sum.stats.humidity);
    oss << "},";

    const EquipmentPreset* preset = find_preset(result.equipment);
    if (preset) {
        size_t ta, tx, ha, hx;
        count_excursions(result.series, *preset, ta, tx, ha, hx);
        oss << "\"excursions\":{";
        oss << "\"temperature\":{\"alert\":" << ta << ",\"action\":" << tx << "}";
        if (preset->has_humidity) {
            oss << ",\"humidity\":{\"alert\":" << ha << ",\"action\":" << hx << "}";
        }
        oss << "},";
    } else {
        oss << "\"excursions\":null,";
    }

    oss << "\"records\":[";
    const std::vector<MeasurementRecord>& recs = result.series.records();
    for (size_t i = 0; i < recs.size(); ++i) {
        const MeasurementRecord& r = recs[i];
        if (i) oss << ",";
        oss << "{";
        oss << "\"index\":" << r.index << ",";
        oss << "\"timestamp\":\"" << format_timestamp(r.timestamp) << "\",";
        oss << "\"temperature\":";
        if (r.temperatureFaulted()) oss << "null"; else oss << r.temperature;
        oss << ",\"humidity\":";
        if (r.humidityFaulted()) oss << "null"; else oss << r.humidity;
        oss << ",\"status\":\"" << status_to_string(r.status) << "\"";
        oss << "}";
    }
    oss << "]";
    oss << "}";
    return oss.str();
}

std::string build_limits_json(const EquipmentPreset& preset) {
    std::ostringstream oss;
    oss << "{";
    oss << "\"equipment\":\"" << json_escape(preset.name) << "\",";
    oss << "\"temperature\":";
    write_limits(oss, preset.temperature);
    oss << ",\"humidity\":";
    if (preset.has_humidity) write_limits(oss, preset.humidity); else oss << "null";
    oss << "}";
    return oss.str();
}

std::string build_config_json(const Config& cfg) {
    std::ostringstream oss;
    oss << "{";
    oss << "\"serial_port\":\"" << json_escape(cfg.serial_port) << "\",";
    oss << "\"baud_rates\":[";
    for (size_t i = 0; i < cfg.baud_rates.size(); ++i) {
        if (i) oss << ",";
        oss << cfg.baud_rates[i];
    }
    oss << "],";
    oss << "\"probe_timeout_ms\":" << cfg.probe_timeout_ms << ",";
    oss << "\"frame_timeout_ms\":" << cfg.frame_timeout_ms << ",";
    oss << "\"simulation\":" << (cfg.simulation ? "true" : "false") << ",";
    oss << "\"export_dir\":\"" << json_escape(cfg.export_dir) << "\",";
    oss << "\"equipment\":[";
    const std::vector<EquipmentPreset>& presets = equipment_presets();
    for (size_t i = 0; i < presets.size(); ++i) {
        if (i) oss << ",";
        oss << "\"" << json_escape(presets[i].name) << "\"";
    }
    oss << "]";
    oss << "}";
    return oss.str();
}

std::string build_history_json(const std::vector<std::string>& files) {
    std::ostringstream oss;
    oss << "{\"files\":[";
    for (size_t i = 0; i < files.size(); ++i) {
        if (i) oss << ",";
        oss << "\"" << json_escape(files[i]) << "\"";
    }
    oss << "]}";
    return oss.str();
}

static std::string query_value(const HttpRequest& req, const std::string& key) {
    auto it = req.query.find(key);
    return it == req.query.end() ? std::string() : it->second;
}

void DriverHttpHandler::handleRequest(const HttpRequest& req, HttpResponse& resp) {
    bool is_get = req.method == "GET";
    bool is_post = req.method == "POST";

    if (req.path == "/status") {
        if (!is_get) return set_json(resp, 405, "Method Not Allowed", error_json("method not allowed"));
        set_json(resp, 200, "OK", build_status_json(worker_->status()));
    } else if (req.path == "/ports") {
        if (!is_get) return set_json(resp, 405, "Method Not Allowed", error_json("method not allowed"));
        set_json(resp, 200, "OK", build_ports_json(worker_->candidates()));
    } else if (req.path == "/readings") {
        if (!is_get) return set_json(resp, 405, "Method Not Allowed", error_json("method not allowed"));
        RetrievalResult result = worker_->lastResult();
        if (!result.available) return set_json(resp, 404, "Not Found", error_json("no retrieval has completed"));
        set_json(resp, 200, "OK", build_readings_json(result));
    } else if (req.path == "/limits") {
        if (!is_get) return set_json(resp, 405, "Method Not Allowed", error_json("method not allowed"));
        std::string equipment = query_value(req, "equipment");
        const EquipmentPreset* preset = find_preset(equipment);
        if (!preset) return set_json(resp, 404, "Not Found", error_json("unknown equipment: " + equipment));
        set_json(resp, 200, "OK", build_limits_json(*preset));
    } else if (req.path == "/config") {
        if (is_post) return saveConfig(req, resp);
        if (!is_get) return set_json(resp, 405, "Method Not Allowed", error_json("method not allowed"));
        set_json(resp, 200, "OK", build_config_json(worker_->config()));
    } else if (req.path == "/history") {
        if (!is_get) return set_json(resp, 405, "Method Not Allowed", error_json("method not allowed"));
        set_json(resp, 200, "OK", build_history_json(list_export_files(worker_->config().export_dir)));
    } else if (req.path == "/history/load") {
        if (!is_get) return set_json(resp, 405, "Method Not Allowed", error_json("method not allowed"));
        loadHistory(req, resp);
    } else if (req.path == "/scan") {
        if (!is_post) return set_json(resp, 405, "Method Not Allowed", error_json("method not allowed"));
        std::string equipment = query_value(req, "equipment");
        if (equipment.empty()) return set_json(resp, 400, "Bad Request", error_json("equipment is required"));
        if (!worker_->start(equipment, query_value(req, "tag"))) {
            return set_json(resp, 409, "Conflict", error_json("retrieval already running"));
        }
        set_json(resp, 202, "Accepted", "{\"started\":true}");
    } else if (req.path == "/cancel") {
        if (!is_post) return set_json(resp, 405, "Method Not Allowed", error_json("method not allowed"));
        bool was_running = worker_->running();
        worker_->cancel();
        set_json(resp, 200, "OK", std::string("{\"cancelled\":") + (was_running ? "true" : "false") + "}");
    } else {
        set_json(resp, 404, "Not Found", error_json("not found"));
    }
}

void DriverHttpHandler::loadHistory(const HttpRequest& req, HttpResponse& resp) {
    std::string file = query_value(req, "file");
    if (file.empty()) return set_json(resp, 400, "Bad Request", error_json("file is required"));

    LoadedExport loaded;
    std::string err;
    switch (load_export_csv(worker_->config().export_dir, file, loaded, err)) {
        case ExportLoadStatus::Loaded: break;
        case ExportLoadStatus::InvalidName: return set_json(resp, 400, "Bad Request", error_json(err));
        case ExportLoadStatus::NotFound: return set_json(resp, 404, "Not Found", error_json(err));
        case ExportLoadStatus::Malformed: return set_json(resp, 422, "Unprocessable Entity", error_json(err));
    }

    RetrievalResult result;
    result.available = true;
    result.equipment = loaded.equipment;
    result.tag = loaded.tag;
    result.info.model = loaded.model;
    result.info.record_count = (uint32_t)loaded.series.size();
    if (loaded.series.size() >= 2 && loaded.series[1].timestamp > loaded.series[0].timestamp) {
        result.info.interval_seconds = (uint32_t)(loaded.series[1].timestamp - loaded.series[0].timestamp);
    }
    result.file = file;
    result.series = std::move(loaded.series);
    set_json(resp, 200, "OK", build_readings_json(result));
}

// Missing parameters keep their current value.
void DriverHttpHandler::saveConfig(const HttpRequest& req, HttpResponse& resp) {
    Config current = worker_->config();
    LinkSettings settings;
    settings.serial_port = current.serial_port;
    settings.baud_rates = current.baud_rates;
    settings.simulation = current.simulation;

    try {
        if (req.query.count("serial_port")) settings.serial_port = query_value(req, "serial_port");
        if (req.query.count("baud_rates")) settings.baud_rates = parse_baud_list(query_value(req, "baud_rates"));
        if (req.query.count("simulation")) {
            settings.simulation = parse_bool_setting(query_value(req, "simulation"), "simulation");
        }
    } catch (const std::runtime_error& ex) {
        return set_json(resp, 400, "Bad Request", error_json(ex.what()));
    }

    std::string err;
    if (!worker_->updateLinkSettings(settings, err)) {
        if (worker_->running()) return set_json(resp, 409, "Conflict", error_json(err));
        return set_json(resp, 400, "Bad Request", error_json(err));
    }
    set_json(resp, 200, "OK", build_config_json(worker_->config()));
}
