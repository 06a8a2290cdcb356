#pragma once

#include <expected>
#include <string>

struct TranscriptResult {
    std::string text;
    double duration_s = 0.0;
    double processing_s = 0.0;
};

class WhisperBackend {
public:
    virtual ~WhisperBackend() = default;

    // wav_path is 16-bit PCM mono WAV as written by AudioNormalizer.
    // Called from recognition workers concurrently.
    virtual std::expected<TranscriptResult, std::string>
        transcribe(const std::string& wav_path) = 0;
};
