#ifndef HTTP_SERVER_H
#define HTTP_SERVER_H

#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <string>
#include <thread>

struct HttpRequest {
    std::string method;
    std::string path;                            // without the query string
    std::map<std::string, std::string> query;    // url-decoded
    std::map<std::string, std::string> headers;
};

struct HttpResponse {
    int status = 200;
    std::string status_text = "OK";
    std::map<std::string, std::string> headers;
    std::string body;
};

class IHttpRequestHandler {
public:
    virtual ~IHttpRequestHandler() {}
    virtual void handleRequest(const HttpRequest& req, HttpResponse& resp) = 0;
};

// Splits "/path?a=1&b=x%20y" into path and decoded query parameters.
void split_target(const std::string& target, std::string& path, std::map<std::string, std::string>& query);
std::string url_decode(const std::string& s);
std::string json_escape(const std::string& s);

class HttpServer {
public:
    HttpServer(const std::string& host, int port, IHttpRequestHandler* handler);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    bool start();
    // Closes the listener and waits for requests already being served.
    void stop();
    std::string lastError() const { return last_error_; }
    // Listening port; the kernel-chosen one after start() with port 0.
    int port() const { return port_; }

private:
    void run();
    void serveClient(int client_fd);
    void clientDone();

    std::string host_;
    int port_;
    int server_fd_;
    std::atomic<bool> running_;
    IHttpRequestHandler* handler_;
    std::thread thread_;
    std::string last_error_;

    std::mutex clients_mtx_;
    std::condition_variable clients_cv_;
    int active_clients_;
};

#endif // HTTP_SERVER_H
