#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <vector>

enum class AudioFormat { Unknown, Wav, Mp3, Flac };

struct DecodedAudio {
    std::vector<float> samples; // interleaved
    uint32_t sample_rate = 0;
    uint32_t channels = 0;

    double duration_s() const {
        if (sample_rate == 0 || channels == 0) return 0.0;
        return static_cast<double>(samples.size()) / channels / sample_rate;
    }
};

namespace audio {

// Magic-byte detection: RIFF/WAVE, fLaC, ID3 tag or MPEG frame sync.
AudioFormat detect_format(std::span<const uint8_t> header);

// Reads the header of the file; falls back to the extension when the
// content is not recognized.
AudioFormat detect_format(const std::string& path);

const char* format_name(AudioFormat fmt);

// Upper bound on decoded frames when the caller gives none: about 4.6 hours
// at 16 kHz.
constexpr size_t kDefaultMaxFrames = size_t(1) << 28;

// Decodes a WAV, MP3 or FLAC file to float samples. Frame counts in the
// file header are not trusted: decoding runs until the stream ends, and
// fails once more than max_frames frames come out or if none do.
std::expected<DecodedAudio, std::string> decode_file(const std::string& path,
                                                     size_t max_frames = kDefaultMaxFrames);

// Averages interleaved channels into one.
std::vector<float> to_mono(std::span<const float> interleaved, uint32_t channels);

// Linear interpolation resample.
std::vector<float> resample(std::span<const float> input, uint32_t src_rate, uint32_t dst_rate);

} // namespace audio
