#include "audio/normalizer.hpp"

#include "audio/audio_decoder.hpp"
#include "audio/ffmpeg.hpp"
#include "audio/wav_encoder.hpp"

#include <filesystem>
#include <format>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;

AudioNormalizer::AudioNormalizer(Options opts) : opts_(std::move(opts)) {}

std::expected<TempFile, std::string>
AudioNormalizer::normalize(const std::string& input_path) const {
    fs::path in(input_path);
    std::string dir = in.has_parent_path() ? in.parent_path().string() : ".";
    std::string prefix = std::format("temp_wav_{}_{}_", ::getpid(),
                                     sanitize_suffix(in.stem().string()));

    auto out = TempFile::create(dir, prefix, ".wav");
    if (!out) return std::unexpected(out.error());

    auto decoded = audio::decode_file(input_path, opts_.max_decoded_frames);
    if (!decoded) {
        if (opts_.ffmpeg.empty()) {
            return std::unexpected("decode failed: " + decoded.error());
        }

        // ffmpeg writes straight into the output slot, which is then
        // decoded and overwritten with the padded result.
        auto conv = audio::ffmpeg_to_wav(opts_.ffmpeg, input_path, out->path(), opts_.sample_rate);
        if (!conv) {
            return std::unexpected(std::format("decode failed: {}; {}", decoded.error(), conv.error()));
        }
        decoded = audio::decode_file(out->path(), opts_.max_decoded_frames);
        if (!decoded) {
            return std::unexpected("decode of ffmpeg output failed: " + decoded.error());
        }
    }

    auto mono = audio::to_mono(decoded->samples, decoded->channels);
    auto resampled = audio::resample(mono, decoded->sample_rate, opts_.sample_rate);

    size_t silence = static_cast<size_t>(opts_.sample_rate) * opts_.leading_silence_ms / 1000;
    std::vector<int16_t> pcm(silence, 0);
    auto body = wav::to_pcm16(resampled);
    pcm.insert(pcm.end(), body.begin(), body.end());

    auto bytes = wav::encode(pcm, opts_.sample_rate);

    std::ofstream f(out->path(), std::ios::binary | std::ios::trunc);
    f.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    f.close();
    if (!f) {
        return std::unexpected("could not write " + out->path());
    }

    return std::move(*out);
}
