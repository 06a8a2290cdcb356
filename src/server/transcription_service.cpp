#include "transcription_service.hpp"

#include <exception>
#include <format>
#include <print>

TranscriptionService::TranscriptionService(const AudioNormalizer& normalizer,
                                           WhisperBackend* backend,
                                           WorkerPool& pool, bool verbose)
    : normalizer_(normalizer), backend_(backend), pool_(pool), verbose_(verbose) {}

std::expected<std::string, TranscribeError>
TranscriptionService::transcribe(const std::string& audio_path) {
    if (!backend_) {
        return std::unexpected(TranscribeError{
            .kind = TranscribeError::Kind::Unavailable,
            .message = kUnavailableMessage,
        });
    }

    try {
        auto fut = pool_.submit([this, audio_path] { return run_job(audio_path); });
        return fut.get();
    } catch (const std::exception& e) {
        std::println(stderr, "transcription: job for {} failed: {}", audio_path, e.what());
        return std::unexpected(TranscribeError{
            .kind = TranscribeError::Kind::Failed,
            .message = e.what(),
        });
    }
}

std::expected<std::string, TranscribeError>
TranscriptionService::run_job(const std::string& audio_path) {
    auto wav = normalizer_.normalize(audio_path);
    if (!wav) {
        std::println(stderr, "normalizer: {}: {}", audio_path, wav.error());
        return std::unexpected(TranscribeError{
            .kind = TranscribeError::Kind::Failed,
            .message = wav.error(),
        });
    }
    log("normalized " + audio_path + " -> " + wav->path());

    auto result = backend_->transcribe(wav->path());

    // wav is removed here on every path; the destructor would do it too.
    if (!wav->remove()) {
        std::println(stderr, "transcription: could not remove {}", wav->path());
    }

    if (!result) {
        std::println(stderr, "whisper: {}", result.error());
        return std::unexpected(TranscribeError{
            .kind = TranscribeError::Kind::Failed,
            .message = result.error(),
        });
    }

    log(std::format("transcribed {:.1f}s audio in {:.1f}s, {} chars",
                    result->duration_s, result->processing_s, result->text.size()));
    return std::move(result->text);
}

void TranscriptionService::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[audio-scribe] {}", msg);
    }
}
