#pragma once

#include "backend.hpp"

#include <cstdint>
#include <string>

// Delegates recognition to a whisper server on the network.
class LanBackend : public WhisperBackend {
public:
    struct Options {
        std::string url = "http://localhost:8080";
        std::string api_format = "whisper.cpp"; // or "openai"
        std::string language = "auto";
        long timeout_s = 120;
        uint32_t sample_rate = 16000; // of the files handed to transcribe()
    };

    explicit LanBackend(Options opts);
    ~LanBackend() override;

    std::expected<TranscriptResult, std::string>
        transcribe(const std::string& wav_path) override;

private:
    Options opts_;
};
