#pragma once

#include "upload/temp_file.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>

// Turns an arbitrary audio file into what the recognizer expects:
// mono 16-bit PCM WAV at a fixed rate, with a stretch of digital silence in
// front so very short leading sounds are not clipped.
class AudioNormalizer {
public:
    struct Options {
        uint32_t sample_rate = 16000;
        uint32_t leading_silence_ms = 500;
        std::string ffmpeg = "ffmpeg"; // empty disables the fallback decoder
        // Longest input accepted, in decoded frames at the input's own rate.
        size_t max_decoded_frames = 200 * 1024 * 1024;
    };

    explicit AudioNormalizer(Options opts);

    // Writes the normalized audio next to input_path as
    // temp_wav_<pid>_<stem>_XXXXXX.wav. The caller owns the returned file.
    // On failure nothing is left on disk.
    std::expected<TempFile, std::string> normalize(const std::string& input_path) const;

    const Options& options() const { return opts_; }

private:
    Options opts_;
};
