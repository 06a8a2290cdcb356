#pragma once

#include "api_core.hpp"
#include "audio/normalizer.hpp"
#include "config.hpp"
#include "grammar/curl_transport.hpp"
#include "grammar/grammar_corrector.hpp"
#include "http/http_server.hpp"
#include "transcription_service.hpp"
#include "whisper/backend.hpp"
#include "worker_pool.hpp"

#include <memory>
#include <string>

// Owns every component of the service and runs it until SIGINT/SIGTERM.
class LinuxService {
public:
    explicit LinuxService(Config config, bool verbose = false);
    ~LinuxService();

    LinuxService(const LinuxService&) = delete;
    LinuxService& operator=(const LinuxService&) = delete;

    bool init();
    int run();

private:
    std::unique_ptr<WhisperBackend> make_backend();

    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    // Declaration order is construction order; the pool is drained before
    // the backend it calls into is destroyed.
    std::unique_ptr<WhisperBackend> backend_;
    AudioNormalizer normalizer_;
    CurlTransport transport_;
    std::unique_ptr<WorkerPool> pool_;
    std::unique_ptr<TranscriptionService> transcription_;
    std::unique_ptr<GrammarCorrector> corrector_;
    std::unique_ptr<ApiCore> core_;
    std::unique_ptr<HttpServer> server_;

    int signal_fd_ = -1;
};
