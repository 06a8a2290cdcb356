#include "platform/linux/linux_service.hpp"

#include "whisper/lan_backend.hpp"
#include "whisper/local_backend.hpp"

#include <atomic>
#include <cerrno>
#include <cstring>
#include <print>
#include <signal.h>
#include <sys/signalfd.h>
#include <thread>
#include <unistd.h>

LinuxService::LinuxService(Config config, bool verbose)
    : config_(std::move(config)), verbose_(verbose),
      normalizer_(AudioNormalizer::Options{
          .sample_rate = config_.audio.sample_rate,
          .leading_silence_ms = config_.audio.leading_silence_ms,
          .ffmpeg = config_.audio.ffmpeg,
          // two decoded frames per uploaded byte
          .max_decoded_frames = config_.upload.max_bytes * 2,
      }) {}

LinuxService::~LinuxService() {
    server_.reset();
    pool_.reset();
    if (signal_fd_ >= 0) ::close(signal_fd_);
}

std::unique_ptr<WhisperBackend> LinuxService::make_backend() {
    if (config_.whisper.backend == "lan") {
        return std::make_unique<LanBackend>(LanBackend::Options{
            .url = config_.whisper.url,
            .api_format = config_.whisper.api_format,
            .language = config_.whisper.language,
            .timeout_s = 120,
            .sample_rate = config_.audio.sample_rate,
        });
    }
    if (config_.whisper.backend != "local") {
        std::println(stderr, "Unknown whisper backend: {}", config_.whisper.backend);
        return nullptr;
    }
    return LocalBackend::load(LocalBackend::Options{
        .model_path = config_.model_path(),
        .language = config_.whisper.language,
        .threads = config_.whisper.threads,
    });
}

bool LinuxService::init() {
    // Block the shutdown signals before any thread starts so every thread
    // inherits the mask and only the signalfd sees them.
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigprocmask(SIG_BLOCK, &mask, nullptr);

    signal_fd_ = signalfd(-1, &mask, SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return false;
    }

    // A missing model is not fatal: /transcribe reports it per request.
    backend_ = make_backend();
    if (!backend_) {
        std::println(stderr, "Warning: speech recognizer unavailable, transcription disabled");
    }

    pool_ = std::make_unique<WorkerPool>(
        static_cast<size_t>(config_.whisper.workers > 0 ? config_.whisper.workers : 1));

    transcription_ = std::make_unique<TranscriptionService>(
        normalizer_, backend_.get(), *pool_, verbose_);

    corrector_ = std::make_unique<GrammarCorrector>(
        GrammarCorrector::Options{
            .endpoint = config_.grammar.endpoint,
            .model = config_.grammar.model,
            .api_key_env = config_.grammar.api_key_env,
            .timeout = std::chrono::seconds(config_.grammar.timeout_s),
        },
        transport_,
        ResilientCaller(RetryPolicy{
            .max_attempts = config_.grammar.max_attempts,
            .retry_statuses = {429, 503},
            .base_delay = std::chrono::milliseconds(config_.grammar.backoff_base_ms),
        }),
        verbose_);

    core_ = std::make_unique<ApiCore>(*transcription_, *corrector_, verbose_);

    server_ = std::make_unique<HttpServer>(config_, *core_, verbose_);
    if (!server_->bind()) return false;

    std::println(stderr, "[audio-scribe] listening on http://{}:{}{}",
                 config_.server.host, server_->port(), config_.server.api_prefix);
    return true;
}

int LinuxService::run() {
    std::atomic<bool> served_ok{true};
    std::jthread http_thread([this, &served_ok] {
        served_ok = server_->run();
        if (!served_ok) {
            // Wake the signal wait below.
            ::kill(::getpid(), SIGTERM);
        }
    });

    signalfd_siginfo info;
    while (true) {
        ssize_t n = ::read(signal_fd_, &info, sizeof(info));
        if (n == sizeof(info)) break;
        if (n < 0 && errno == EINTR) continue;
        std::println(stderr, "signalfd read failed: {}", std::strerror(errno));
        break;
    }

    log(served_ok ? "Received signal, shutting down" : "HTTP server stopped unexpectedly");
    server_->stop();
    http_thread.join();

    // Let recognitions already queued finish before the backend goes away.
    pool_.reset();

    return served_ok ? 0 : 1;
}

void LinuxService::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[audio-scribe] {}", msg);
    }
}
