#include <ftw.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

#include "http_api.h"

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"

namespace {
int remove_entry(const char* path, const struct stat*, int, struct FTW*)
{
    return ::remove(path);
}

Config simulated_config(const std::string& export_dir)
{
    Config cfg{};
    cfg.http_host = "127.0.0.1";
    cfg.http_port = 5000;
    cfg.serial_port = "auto";
    cfg.baud_rates = {19200, 9600};
    cfg.probe_timeout_ms = 10;
    cfg.frame_timeout_ms = 10;
    cfg.simulation = true;
    cfg.export_dir = export_dir;
    cfg.log_level = LogLevel::Warn;
    return cfg;
}

HttpResponse request(DriverHttpHandler& h, const std::string& method, const std::string& target)
{
    HttpRequest req;
    req.method = method;
    split_target(target, req.path, req.query);
    HttpResponse resp;
    h.handleRequest(req, resp);
    return resp;
}

bool contains(const std::string& s, const std::string& part)
{
    return s.find(part) != std::string::npos;
}
}  // namespace

TEST_CASE("query strings are split and decoded")
{
    std::string path;
    std::map<std::string, std::string> q;
    split_target("/scan?equipment=ESTUFA%2030-35&tag=a+b&flag", path, q);
    CHECK(path == "/scan");
    CHECK(q["equipment"] == "ESTUFA 30-35");
    CHECK(q["tag"] == "a b");
    CHECK(q.count("flag") == 1);
    CHECK(json_escape("a\"b\\c\n") == "a\\\"b\\\\c\\n");
}

TEST_CASE("a simulated retrieval is served through the HTTP routes")
{
    char tmpl[] = "/tmp/galileo_http_XXXXXX";
    std::string root = ::mkdtemp(tmpl);
    set_log_level(LogLevel::Warn);

    Config cfg = simulated_config(root + "/export");
    RetrievalWorker worker(cfg);
    DriverHttpHandler handler(&worker);

    HttpResponse resp = request(handler, "GET", "/readings");
    CHECK(resp.status == 404);

    resp = request(handler, "GET", "/status");
    CHECK(resp.status == 200);
    CHECK(contains(resp.body, "\"state\":\"idle\""));

    resp = request(handler, "GET", "/ports");
    CHECK(resp.status == 200);
    CHECK(contains(resp.body, "\"device\":\"sim\""));

    resp = request(handler, "POST", "/scan");
    CHECK(resp.status == 400);

    resp = request(handler, "POST", "/scan?equipment=FREEZER&tag=F02");
    REQUIRE(resp.status == 202);
    worker.wait();

    resp = request(handler, "GET", "/status");
    CHECK(contains(resp.body, "\"state\":\"done\""));
    CHECK(contains(resp.body, "\"baud\":9600"));
    CHECK(contains(resp.body, "\"records_fetched\":100"));

    resp = request(handler, "GET", "/readings");
    REQUIRE(resp.status == 200);
    CHECK(resp.headers["Content-Type"] == "application/json");
    CHECK(contains(resp.body, "\"equipment\":\"FREEZER\""));
    CHECK(contains(resp.body, "\"samples\":100"));
    CHECK(contains(resp.body, "\"excursions\":{\"temperature\""));
    CHECK(contains(resp.body, "\"status\":\"ok\""));

    RetrievalResult result = worker.lastResult();
    REQUIRE(result.available);
    CHECK(result.series.size() == 100);
    CHECK_FALSE(result.file.empty());
    struct stat st;
    CHECK(::stat((cfg.export_dir + "/" + result.file).c_str(), &st) == 0);

    resp = request(handler, "GET", "/history");
    REQUIRE(resp.status == 200);
    CHECK(resp.body == "{\"files\":[\"" + result.file + "\"]}");

    resp = request(handler, "GET", "/history/load?file=" + result.file);
    REQUIRE(resp.status == 200);
    CHECK(contains(resp.body, "\"equipment\":\"FREEZER\""));
    CHECK(contains(resp.body, "\"tag\":\"F02\""));
    CHECK(contains(resp.body, "\"model\":\"THD32000-SIM\""));
    CHECK(contains(resp.body, "\"samples\":100"));
    CHECK(contains(resp.body, "\"file\":\"" + result.file + "\""));

    resp = request(handler, "GET", "/history/load?file=..%2Fexport%2F" + result.file);
    CHECK(resp.status == 400);
    resp = request(handler, "GET", "/history/load");
    CHECK(resp.status == 400);
    resp = request(handler, "GET", "/history/load?file=2020-01-01__00-00-00__FREEZER.csv");
    CHECK(resp.status == 404);
    resp = request(handler, "POST", "/history");
    CHECK(resp.status == 405);

    ::nftw(root.c_str(), remove_entry, 16, FTW_DEPTH | FTW_PHYS);
}

TEST_CASE("limits, config and unknown routes")
{
    Config cfg = simulated_config("");
    RetrievalWorker worker(cfg);
    DriverHttpHandler handler(&worker);

    HttpResponse resp = request(handler, "GET", "/limits?equipment=AREAS%20CALIFICADAS");
    REQUIRE(resp.status == 200);
    CHECK(contains(resp.body, "\"humidity\":{\"alert\":{\"min\":null,\"max\":62}"));

    resp = request(handler, "GET", "/limits?equipment=HELADERA");
    CHECK(contains(resp.body, "\"humidity\":null"));

    resp = request(handler, "GET", "/limits?equipment=OVEN");
    CHECK(resp.status == 404);

    resp = request(handler, "GET", "/config");
    CHECK(resp.status == 200);
    CHECK(contains(resp.body, "\"baud_rates\":[19200,9600]"));
    CHECK(contains(resp.body, "\"simulation\":true"));

    resp = request(handler, "POST", "/config?serial_port=%2Fdev%2FttyUSB1&baud_rates=9600,19200");
    REQUIRE(resp.status == 200);
    CHECK(contains(resp.body, "\"serial_port\":\"/dev/ttyUSB1\""));
    CHECK(contains(resp.body, "\"baud_rates\":[9600,19200]"));
    CHECK(contains(resp.body, "\"simulation\":true"));
    CHECK(worker.config().serial_port == "/dev/ttyUSB1");

    resp = request(handler, "POST", "/config?baud_rates=12345");
    CHECK(resp.status == 400);
    resp = request(handler, "POST", "/config?simulation=maybe");
    CHECK(resp.status == 400);
    resp = request(handler, "POST", "/config?serial_port=");
    CHECK(resp.status == 400);
    CHECK(worker.config().baud_rates == std::vector<int>{9600, 19200});

    resp = request(handler, "DELETE", "/status");
    CHECK(resp.status == 405);

    resp = request(handler, "GET", "/scan");
    CHECK(resp.status == 405);

    resp = request(handler, "GET", "/nope");
    CHECK(resp.status == 404);

    resp = request(handler, "POST", "/cancel");
    CHECK(resp.status == 200);
    CHECK(resp.body == "{\"cancelled\":false}");
}
