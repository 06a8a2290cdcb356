#pragma once

#include <expected>
#include <string>

struct TranscribeError {
    enum class Kind {
        Unavailable, // no recognizer: the model failed to load at startup
        Failed,      // decoding or recognition failed for this input
    };

    Kind kind;
    std::string message;
};

class Transcriber {
public:
    virtual ~Transcriber() = default;

    // Returns the recognized text; an empty string means no speech was found.
    virtual std::expected<std::string, TranscribeError>
        transcribe(const std::string& audio_path) = 0;
};
