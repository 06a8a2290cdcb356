#pragma once

#include "api_core.hpp"
#include "config.hpp"

#include <httplib.h>
#include <mutex>
#include <string>

// Binds ApiCore to HTTP routes. Requests are served from httplib's own
// thread pool; uploads are streamed to disk as they arrive.
class HttpServer {
public:
    HttpServer(const Config& config, ApiCore& core, bool verbose = false);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Binds the listening socket. Port 0 picks a free port.
    bool bind();

    // Serves until stop(). Returns false if the accept loop failed.
    // Returns at once if stop() was already called.
    bool run();

    // May be called from any thread, before, during or after run().
    void stop();

    int port() const { return port_; }
    bool is_running() const { return svr_.is_running(); }
    void wait_until_ready() const { svr_.wait_until_ready(); }

private:
    void setup_routes();

    void handle_transcribe(const httplib::Request& req, httplib::Response& res,
                           const httplib::ContentReader& content_reader);
    void handle_fix_grammar(const httplib::Request& req, httplib::Response& res);

    static void send(httplib::Response& res, const ApiResponse& r);

    void log(const std::string& msg);

    Config config_;
    ApiCore& core_;
    bool verbose_;

    httplib::Server svr_;
    int port_ = -1;

    std::mutex state_mu_;
    bool stop_requested_ = false;
    bool serving_ = false;
};
