#include "audio/audio_decoder.hpp"

#include <dr_flac.h>
#include <dr_mp3.h>
#include <dr_wav.h>

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <filesystem>
#include <format>
#include <fstream>

namespace fs = std::filesystem;

namespace audio {

AudioFormat detect_format(std::span<const uint8_t> h) {
    if (h.size() < 4) return AudioFormat::Unknown;

    if (h.size() >= 12 && h[0] == 'R' && h[1] == 'I' && h[2] == 'F' && h[3] == 'F' &&
        h[8] == 'W' && h[9] == 'A' && h[10] == 'V' && h[11] == 'E') {
        return AudioFormat::Wav;
    }
    if (h[0] == 'f' && h[1] == 'L' && h[2] == 'a' && h[3] == 'C') {
        return AudioFormat::Flac;
    }
    if (h[0] == 'I' && h[1] == 'D' && h[2] == '3') {
        return AudioFormat::Mp3;
    }
    // MPEG audio frame sync: 11 set bits, layer bits not 00
    if (h[0] == 0xFF && (h[1] & 0xE0) == 0xE0 && (h[1] & 0x06) != 0) {
        return AudioFormat::Mp3;
    }
    return AudioFormat::Unknown;
}

AudioFormat detect_format(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (f.is_open()) {
        uint8_t header[12] = {};
        f.read(reinterpret_cast<char*>(header), sizeof(header));
        auto fmt = detect_format(std::span<const uint8_t>(header, static_cast<size_t>(f.gcount())));
        if (fmt != AudioFormat::Unknown) return fmt;
    }

    auto ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);
    if (ext == ".wav" || ext == ".wave") return AudioFormat::Wav;
    if (ext == ".mp3") return AudioFormat::Mp3;
    if (ext == ".flac") return AudioFormat::Flac;
    return AudioFormat::Unknown;
}

const char* format_name(AudioFormat fmt) {
    switch (fmt) {
        case AudioFormat::Wav:  return "wav";
        case AudioFormat::Mp3:  return "mp3";
        case AudioFormat::Flac: return "flac";
        case AudioFormat::Unknown: break;
    }
    return "unknown";
}

namespace {

constexpr size_t kChunkFrames = 4096;

// Pulls frames through read(frames, out) until it returns 0, appending to
// audio.samples. audio.channels must already be set.
template <typename ReadFn>
std::expected<void, std::string> read_chunked(DecodedAudio& audio, size_t max_frames, ReadFn read) {
    if (audio.channels == 0 || audio.sample_rate == 0) {
        return std::unexpected("stream header has no channels or sample rate");
    }

    std::vector<float> chunk(kChunkFrames * audio.channels);
    size_t frames = 0;
    while (true) {
        size_t n = static_cast<size_t>(read(kChunkFrames, chunk.data()));
        if (n == 0) break;
        if (frames + n > max_frames) {
            return std::unexpected(std::format("audio is longer than {} frames", max_frames));
        }
        audio.samples.insert(audio.samples.end(), chunk.begin(),
                             chunk.begin() + static_cast<std::ptrdiff_t>(n * audio.channels));
        frames += n;
    }

    if (frames == 0) {
        return std::unexpected("stream contains no decodable frames");
    }
    return {};
}

std::expected<DecodedAudio, std::string> decode_wav(const std::string& path, size_t max_frames) {
    drwav wav;
    if (!drwav_init_file(&wav, path.c_str(), nullptr)) {
        return std::unexpected("not a readable WAV file");
    }

    DecodedAudio out;
    out.sample_rate = wav.sampleRate;
    out.channels = wav.channels;
    auto r = read_chunked(out, max_frames, [&wav](size_t n, float* dst) {
        return drwav_read_pcm_frames_f32(&wav, n, dst);
    });
    drwav_uninit(&wav);

    if (!r) return std::unexpected("WAV: " + r.error());
    return out;
}

std::expected<DecodedAudio, std::string> decode_mp3(const std::string& path, size_t max_frames) {
    drmp3 mp3;
    if (!drmp3_init_file(&mp3, path.c_str(), nullptr)) {
        return std::unexpected("not a readable MP3 file");
    }

    DecodedAudio out;
    out.sample_rate = mp3.sampleRate;
    out.channels = mp3.channels;
    auto r = read_chunked(out, max_frames, [&mp3](size_t n, float* dst) {
        return drmp3_read_pcm_frames_f32(&mp3, n, dst);
    });
    drmp3_uninit(&mp3);

    if (!r) return std::unexpected("MP3: " + r.error());
    return out;
}

std::expected<DecodedAudio, std::string> decode_flac(const std::string& path, size_t max_frames) {
    drflac* flac = drflac_open_file(path.c_str(), nullptr);
    if (!flac) {
        return std::unexpected("not a readable FLAC file");
    }

    // totalPCMFrameCount may be 0 ("unknown") for streamed encoders.
    DecodedAudio out;
    out.sample_rate = flac->sampleRate;
    out.channels = flac->channels;
    auto r = read_chunked(out, max_frames, [flac](size_t n, float* dst) {
        return drflac_read_pcm_frames_f32(flac, n, dst);
    });
    drflac_close(flac);

    if (!r) return std::unexpected("FLAC: " + r.error());
    return out;
}

} // namespace

std::expected<DecodedAudio, std::string> decode_file(const std::string& path, size_t max_frames) {
    switch (detect_format(path)) {
        case AudioFormat::Wav:  return decode_wav(path, max_frames);
        case AudioFormat::Mp3:  return decode_mp3(path, max_frames);
        case AudioFormat::Flac: return decode_flac(path, max_frames);
        case AudioFormat::Unknown: break;
    }
    return std::unexpected("unrecognized audio format");
}

std::vector<float> to_mono(std::span<const float> interleaved, uint32_t channels) {
    if (channels <= 1) {
        return {interleaved.begin(), interleaved.end()};
    }
    size_t frames = interleaved.size() / channels;
    std::vector<float> out(frames);
    for (size_t i = 0; i < frames; ++i) {
        float sum = 0.0f;
        for (uint32_t c = 0; c < channels; ++c) {
            sum += interleaved[i * channels + c];
        }
        out[i] = sum / static_cast<float>(channels);
    }
    return out;
}

std::vector<float> resample(std::span<const float> input, uint32_t src_rate, uint32_t dst_rate) {
    if (src_rate == dst_rate || input.empty()) {
        return {input.begin(), input.end()};
    }
    double ratio = static_cast<double>(src_rate) / dst_rate;
    size_t out_len = static_cast<size_t>(static_cast<double>(input.size()) / ratio);
    std::vector<float> out(out_len);
    for (size_t i = 0; i < out_len; ++i) {
        double src_idx = static_cast<double>(i) * ratio;
        size_t i0 = static_cast<size_t>(src_idx);
        size_t i1 = std::min(i0 + 1, input.size() - 1);
        double frac = src_idx - static_cast<double>(i0);
        out[i] = static_cast<float>((1.0 - frac) * input[i0] + frac * input[i1]);
    }
    return out;
}

} // namespace audio
