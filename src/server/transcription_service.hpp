#pragma once

#include "audio/normalizer.hpp"
#include "transcriber.hpp"
#include "whisper/backend.hpp"
#include "worker_pool.hpp"

#include <string>

// Normalizes an uploaded file and runs the recognizer on it, off the
// calling thread. The normalized file never outlives the call.
class TranscriptionService : public Transcriber {
public:
    static constexpr const char* kUnavailableMessage =
        "Whisper model failed to load at startup. Cannot transcribe.";

    // backend may be null when the model could not be loaded.
    TranscriptionService(const AudioNormalizer& normalizer, WhisperBackend* backend,
                         WorkerPool& pool, bool verbose = false);

    std::expected<std::string, TranscribeError>
        transcribe(const std::string& audio_path) override;

    bool available() const { return backend_ != nullptr; }

private:
    // Runs on a worker thread.
    std::expected<std::string, TranscribeError> run_job(const std::string& audio_path);

    void log(const std::string& msg);

    const AudioNormalizer& normalizer_;
    WhisperBackend* backend_;
    WorkerPool& pool_;
    bool verbose_;
};
