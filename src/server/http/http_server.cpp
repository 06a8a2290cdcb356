#include "http/http_server.hpp"

#include <chrono>
#include <exception>
#include <format>
#include <print>
#include <thread>

HttpServer::HttpServer(const Config& config, ApiCore& core, bool verbose)
    : config_(config), core_(core), verbose_(verbose) {
    setup_routes();
}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::send(httplib::Response& res, const ApiResponse& r) {
    res.status = r.status;
    res.set_content(r.body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
                    "application/json");
}

void HttpServer::setup_routes() {
    const auto& prefix = config_.server.api_prefix;
    const int threads = config_.server.threads > 0 ? config_.server.threads : 1;

    svr_.new_task_queue = [threads] { return new httplib::ThreadPool(threads); };
    svr_.set_payload_max_length(config_.upload.max_bytes);

    if (!config_.server.cors_origin.empty()) {
        svr_.set_default_headers({
            {"Access-Control-Allow-Origin", config_.server.cors_origin},
            {"Access-Control-Allow-Methods", "GET, POST, OPTIONS"},
            {"Access-Control-Allow-Headers", "Content-Type, Authorization"},
        });
        svr_.Options(".*", [](const httplib::Request&, httplib::Response& res) {
            res.status = 204;
        });
    }

    svr_.Get("/", [this](const httplib::Request&, httplib::Response& res) {
        send(res, core_.handle_root());
    });

    svr_.Post(prefix + "/transcribe",
              [this](const httplib::Request& req, httplib::Response& res,
                     const httplib::ContentReader& content_reader) {
                  handle_transcribe(req, res, content_reader);
              });

    svr_.Post(prefix + "/fix-grammar", [this](const httplib::Request& req, httplib::Response& res) {
        handle_fix_grammar(req, res);
    });

    svr_.set_exception_handler([](const httplib::Request& req, httplib::Response& res,
                                  std::exception_ptr ep) {
        std::string what;
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            what = e.what();
        } catch (...) {
            what = "non-standard exception";
        }
        std::println(stderr, "http: {} {} failed: {}", req.method, req.path, what);
        send(res, ApiCore::error(500, "Internal server error: " + what));
    });

    svr_.set_error_handler([](const httplib::Request&, httplib::Response& res) {
        // Handlers already wrote a JSON body for the statuses they produce.
        if (!res.body.empty()) return;
        if (res.status == 404) {
            send(res, ApiCore::error(404, "Not Found"));
        } else if (res.status == 413) {
            send(res, ApiCore::error(413, "Uploaded file is too large."));
        }
    });

    svr_.set_logger([this](const httplib::Request& req, const httplib::Response& res) {
        log(std::format("{} {} -> {}", req.method, req.path, res.status));
    });
}

void HttpServer::handle_transcribe(const httplib::Request& req, httplib::Response& res,
                                   const httplib::ContentReader& content_reader) {
    if (!req.is_multipart_form_data()) {
        // Drain the body so the connection stays usable.
        content_reader([](const char*, size_t) { return true; });
        send(res, core_.handle_transcribe(std::nullopt));
        return;
    }

    UploadStager stager(config_.temp_dir());
    bool ok = content_reader(
        [&](const httplib::FormData& part) {
            return stager.begin_part(part.name, part.filename);
        },
        [&](const char* data, size_t len) {
            return stager.append(data, len);
        });

    auto upload = stager.take();
    if (stager.failed()) {
        send(res, ApiCore::error(500, "Could not store the uploaded file."));
        return;
    }
    if (!ok) {
        log("upload aborted by client");
        send(res, ApiCore::error(400, "Upload was interrupted."));
        return;
    }

    send(res, core_.handle_transcribe(std::move(upload)));
}

void HttpServer::handle_fix_grammar(const httplib::Request& req, httplib::Response& res) {
    send(res, core_.handle_fix_grammar(req.body));
}

bool HttpServer::bind() {
    const auto& host = config_.server.host;
    if (config_.server.port == 0) {
        port_ = svr_.bind_to_any_port(host);
    } else if (svr_.bind_to_port(host, config_.server.port)) {
        port_ = config_.server.port;
    } else {
        port_ = -1;
    }

    if (port_ < 0) {
        std::println(stderr, "http: could not bind {}:{}", host, config_.server.port);
        return false;
    }
    log(std::format("listening on {}:{}", host, port_));
    return true;
}

bool HttpServer::run() {
    {
        std::lock_guard lock(state_mu_);
        if (stop_requested_) return true;
        serving_ = true;
    }
    bool ok = svr_.listen_after_bind();
    {
        std::lock_guard lock(state_mu_);
        serving_ = false;
    }
    return ok;
}

void HttpServer::stop() {
    {
        std::lock_guard lock(state_mu_);
        stop_requested_ = true;
    }

    // run() may have entered listen_after_bind() without the accept loop
    // being up yet; httplib's stop() is a no-op until it is.
    while (!svr_.is_running()) {
        {
            std::lock_guard lock(state_mu_);
            if (!serving_) return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    svr_.stop();
}

void HttpServer::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[audio-scribe] {}", msg);
    }
}
