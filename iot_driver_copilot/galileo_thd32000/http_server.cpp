#include "http_server.h"
#include <sys/types.h>
#include <sys/socket.h>
#include <netdb.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <sys/time.h>
#include <unistd.h>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <sstream>

#include "logger.h"

static const size_t kMaxHeadBytes = 8192;
static const long kClientTimeoutSec = 5;

HttpServer::HttpServer(const std::string& host, int port, IHttpRequestHandler* handler)
: host_(host), port_(port), server_fd_(-1), running_(false), handler_(handler), active_clients_(0) {}

HttpServer::~HttpServer() {
    stop();
}

bool HttpServer::start() {
    if (running_) return true;

    struct addrinfo hints{};
    struct addrinfo* res = nullptr;
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_PASSIVE;

    std::string portstr = std::to_string(port_);
    int err = getaddrinfo(host_.empty() ? nullptr : host_.c_str(), portstr.c_str(), &hints, &res);
    if (err != 0) {
        last_error_ = std::string("getaddrinfo failed: ") + gai_strerror(err);
        return false;
    }

    for (struct addrinfo* p = res; p; p = p->ai_next) {
        int fd = socket(p->ai_family, p->ai_socktype, p->ai_protocol);
        if (fd < 0) continue;
        int opt = 1;
        setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
        if (bind(fd, p->ai_addr, p->ai_addrlen) == 0 && listen(fd, 16) == 0) {
            server_fd_ = fd;
            break;
        }
        last_error_ = std::string("bind/listen failed: ") + std::strerror(errno);
        close(fd);
    }
    freeaddrinfo(res);

    if (server_fd_ < 0) return false;

    // port 0 asks the kernel for a free one
    struct sockaddr_storage bound{};
    socklen_t bound_len = sizeof(bound);
    if (getsockname(server_fd_, (struct sockaddr*)&bound, &bound_len) == 0) {
        if (bound.ss_family == AF_INET) port_ = ntohs(((struct sockaddr_in*)&bound)->sin_port);
        else if (bound.ss_family == AF_INET6) port_ = ntohs(((struct sockaddr_in6*)&bound)->sin6_port);
    }

    running_.store(true);
    thread_ = std::thread(&HttpServer::run, this);
    return true;
}

void HttpServer::stop() {
    if (!running_.load()) return;
    running_.store(false);
    if (server_fd_ >= 0) {
        shutdown(server_fd_, SHUT_RDWR);
        close(server_fd_);
        server_fd_ = -1;
    }
    if (thread_.joinable()) thread_.join();

    std::unique_lock<std::mutex> lk(clients_mtx_);
    clients_cv_.wait(lk, [this] { return active_clients_ == 0; });
}

void HttpServer::clientDone() {
    std::lock_guard<std::mutex> lk(clients_mtx_);
    --active_clients_;
    clients_cv_.notify_all();
}

std::string url_decode(const std::string& s) {
    std::string out;
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '+') {
            out += ' ';
        } else if (s[i] == '%' && i + 2 < s.size() && std::isxdigit((unsigned char)s[i + 1]) &&
                   std::isxdigit((unsigned char)s[i + 2])) {
            out += (char)std::strtol(s.substr(i + 1, 2).c_str(), nullptr, 16);
            i += 2;
        } else {
            out += s[i];
        }
    }
    return out;
}

void split_target(const std::string& target, std::string& path, std::map<std::string, std::string>& query) {
    size_t q = target.find('?');
    path = url_decode(target.substr(0, q));
    if (q == std::string::npos) return;

    std::istringstream iss(target.substr(q + 1));
    std::string pair;
    while (std::getline(iss, pair, '&')) {
        if (pair.empty()) continue;
        size_t eq = pair.find('=');
        std::string key = url_decode(pair.substr(0, eq));
        std::string val = eq == std::string::npos ? "" : url_decode(pair.substr(eq + 1));
        query[key] = val;
    }
}

std::string json_escape(const std::string& s) {
    std::ostringstream oss;
    for (char c : s) {
        switch (c) {
            case '\\': oss << "\\\\"; break;
            case '"': oss << "\\\""; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << (int)(unsigned char)c << std::dec;
                } else {
                    oss << c;
                }
        }
    }
    return oss.str();
}

// Request line and header block, up to the blank line. Header names are
// lower-cased.
static bool parse_request_head(const std::string& head, HttpRequest& req) {
    std::istringstream lines(head);
    std::string line;
    if (!std::getline(lines, line)) return false;
    if (!line.empty() && line.back() == '\r') line.pop_back();

    std::istringstream first(line);
    std::string target, version;
    if (!(first >> req.method >> target >> version)) return false;
    if (version.compare(0, 5, "HTTP/") != 0 || target.empty() || target[0] != '/') return false;
    split_target(target, req.path, req.query);

    while (std::getline(lines, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) break;
        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;
        std::string key = line.substr(0, colon);
        for (char& c : key) c = (char)std::tolower((unsigned char)c);
        size_t v = line.find_first_not_of(" \t", colon + 1);
        req.headers[key] = v == std::string::npos ? "" : line.substr(v);
    }
    return true;
}

static std::string serialize_response(HttpResponse& resp) {
    if (resp.headers.find("Content-Type") == resp.headers.end()) {
        resp.headers["Content-Type"] = "text/plain";
    }
    resp.headers["Content-Length"] = std::to_string(resp.body.size());
    resp.headers["Connection"] = "close";

    std::ostringstream oss;
    oss << "HTTP/1.1 " << resp.status << " " << resp.status_text << "\r\n";
    for (const auto& kv : resp.headers) oss << kv.first << ": " << kv.second << "\r\n";
    oss << "\r\n" << resp.body;
    return oss.str();
}

// Reads until the end of the header block. Fails on EOF, timeout or an
// oversized head.
static bool recv_head(int fd, std::string& out) {
    char buf[1024];
    while (out.find("\r\n\r\n") == std::string::npos) {
        if (out.size() > kMaxHeadBytes) return false;
        ssize_t r = recv(fd, buf, sizeof(buf), 0);
        if (r < 0 && errno == EINTR) continue;
        if (r <= 0) return false;
        out.append(buf, buf + r);
    }
    return true;
}

static bool send_all(int fd, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t w = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (w < 0 && errno == EINTR) continue;
        if (w <= 0) return false;
        sent += (size_t)w;
    }
    return true;
}

void HttpServer::serveClient(int client_fd) {
    timeval tv{kClientTimeoutSec, 0};
    setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    std::string data;
    if (!recv_head(client_fd, data)) {
        close(client_fd);
        clientDone();
        return;
    }

    // Request bodies are not used; parameters travel in the query string.
    HttpRequest req;
    HttpResponse resp;
    if (!parse_request_head(data.substr(0, data.find("\r\n\r\n") + 2), req)) {
        resp.status = 400;
        resp.status_text = "Bad Request";
        resp.headers["Content-Type"] = "application/json";
        resp.body = "{\"error\":\"bad request\"}";
    } else if (handler_) {
        handler_->handleRequest(req, resp);
    }
    log_debug("http " + req.method + " " + req.path + " -> " + std::to_string(resp.status));

    if (!send_all(client_fd, serialize_response(resp))) {
        log_debug(std::string("http send failed: ") + std::strerror(errno));
    }
    close(client_fd);
    clientDone();
}

void HttpServer::run() {
    while (running_.load()) {
        int client_fd = accept(server_fd_, nullptr, nullptr);
        if (client_fd < 0) {
            if (!running_.load()) break;
            if (errno != EINTR) log_warn(std::string("accept failed: ") + std::strerror(errno));
            continue;
        }
        {
            std::lock_guard<std::mutex> lk(clients_mtx_);
            ++active_clients_;
        }
        std::thread(&HttpServer::serveClient, this, client_fd).detach();
    }
}
