#pragma once

#include <cstdint>
#include <expected>
#include <string>

namespace audio {

// Runs `ffmpeg` as a child process to convert any container it understands
// into 16-bit PCM mono WAV at sample_rate. output_path is overwritten.
std::expected<void, std::string> ffmpeg_to_wav(const std::string& ffmpeg,
                                               const std::string& input_path,
                                               const std::string& output_path,
                                               uint32_t sample_rate);

} // namespace audio
