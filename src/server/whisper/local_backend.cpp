#include "local_backend.hpp"

#include "../audio/audio_decoder.hpp"
#include "../text_utils.hpp"

#include <chrono>
#include <filesystem>
#include <print>
#include <whisper.h>

std::unique_ptr<LocalBackend> LocalBackend::load(Options opts) {
    if (!std::filesystem::exists(opts.model_path)) {
        std::println(stderr, "whisper: model file {} not found", opts.model_path);
        return nullptr;
    }

    whisper_context_params cparams = whisper_context_default_params();
    // CPU inference, default attention kernels.
    cparams.use_gpu = false;
    cparams.flash_attn = false;

    whisper_context* ctx = whisper_init_from_file_with_params(opts.model_path.c_str(), cparams);
    if (!ctx) {
        std::println(stderr, "whisper: failed to load model {}", opts.model_path);
        return nullptr;
    }

    std::println(stderr, "whisper: model {} loaded", opts.model_path);
    return std::unique_ptr<LocalBackend>(new LocalBackend(std::move(opts), ctx));
}

LocalBackend::LocalBackend(Options opts, whisper_context* ctx)
    : opts_(std::move(opts)), ctx_(ctx) {}

LocalBackend::~LocalBackend() {
    whisper_free(ctx_);
}

std::expected<TranscriptResult, std::string>
LocalBackend::transcribe(const std::string& wav_path) {
    auto decoded = audio::decode_file(wav_path);
    if (!decoded) {
        return std::unexpected("reading " + wav_path + ": " + decoded.error());
    }

    auto pcm = audio::resample(audio::to_mono(decoded->samples, decoded->channels),
                               decoded->sample_rate, WHISPER_SAMPLE_RATE);
    double duration_s = static_cast<double>(pcm.size()) / WHISPER_SAMPLE_RATE;

    using StatePtr = std::unique_ptr<whisper_state, decltype(&whisper_free_state)>;
    StatePtr state(whisper_init_state(ctx_), whisper_free_state);
    if (!state) {
        return std::unexpected("whisper_init_state failed");
    }

    whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    params.n_threads = opts_.threads;
    params.language = opts_.language.c_str();
    params.translate = false;
    params.no_timestamps = true;
    params.print_progress = false;
    params.print_realtime = false;
    params.print_timestamps = false;
    params.print_special = false;

    auto start = std::chrono::steady_clock::now();

    int rc = whisper_full_with_state(ctx_, state.get(), params, pcm.data(),
                                     static_cast<int>(pcm.size()));
    if (rc != 0) {
        return std::unexpected("whisper_full failed with code " + std::to_string(rc));
    }

    std::string joined;
    const int n_segments = whisper_full_n_segments_from_state(state.get());
    for (int i = 0; i < n_segments; ++i) {
        joined += whisper_full_get_segment_text_from_state(state.get(), i);
    }

    auto end = std::chrono::steady_clock::now();

    return TranscriptResult{
        .text = text::trim(joined),
        .duration_s = duration_s,
        .processing_s = std::chrono::duration<double>(end - start).count(),
    };
}
