#include <catch2/catch_test_macros.hpp>

#include "audio/audio_decoder.hpp"
#include "audio/normalizer.hpp"
#include "test_support.hpp"

#include <filesystem>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;
using test_support::TmpDir;

TEST_CASE("AudioNormalizer", "[audio]") {
    TmpDir dir("normalizer");

    SECTION("MonoSixteenKilohertzWithLeadingSilence") {
        auto in = dir.path / "upload_abc123_clip.wav";
        test_support::write_wav(in, test_support::tone(8000, 2, 0.25), 8000, 2);

        AudioNormalizer norm({.sample_rate = 16000, .leading_silence_ms = 500, .ffmpeg = ""});
        auto out = norm.normalize(in.string());
        REQUIRE(out.has_value());
        REQUIRE(fs::path(out->path()).parent_path() == dir.path);

        auto decoded = audio::decode_file(out->path());
        REQUIRE(decoded.has_value());
        REQUIRE(decoded->sample_rate == 16000);
        REQUIRE(decoded->channels == 1);
        // 500 ms of silence + 0.25 s of resampled tone
        REQUIRE(decoded->samples.size() == 8000 + 4000);
        for (size_t i = 0; i < 8000; ++i) {
            REQUIRE(decoded->samples[i] == 0.0f);
        }
        bool has_signal = false;
        for (size_t i = 8000; i < decoded->samples.size(); ++i) {
            if (decoded->samples[i] != 0.0f) has_signal = true;
        }
        REQUIRE(has_signal);
    }

    SECTION("OutputNameCarriesPidAndStem") {
        auto in = dir.path / "voice memo.wav";
        test_support::write_wav(in, test_support::tone(16000, 1, 0.1), 16000);

        AudioNormalizer norm({.ffmpeg = ""});
        auto out = norm.normalize(in.string());
        REQUIRE(out.has_value());

        auto name = fs::path(out->path()).filename().string();
        auto expected_prefix = "temp_wav_" + std::to_string(getpid()) + "_voice_memo_";
        REQUIRE(name.starts_with(expected_prefix));
        REQUIRE(name.ends_with(".wav"));
    }

    SECTION("NoSilenceRequested") {
        auto in = dir.path / "a.wav";
        test_support::write_wav(in, test_support::tone(16000, 1, 0.1), 16000);

        AudioNormalizer norm({.leading_silence_ms = 0, .ffmpeg = ""});
        auto out = norm.normalize(in.string());
        REQUIRE(out.has_value());

        auto decoded = audio::decode_file(out->path());
        REQUIRE(decoded.has_value());
        REQUIRE(decoded->samples.size() == 1600);
    }

    SECTION("OutputRemovedWhenReleased") {
        auto in = dir.path / "a.wav";
        test_support::write_wav(in, test_support::tone(16000, 1, 0.1), 16000);

        AudioNormalizer norm({.ffmpeg = ""});
        {
            auto out = norm.normalize(in.string());
            REQUIRE(out.has_value());
            REQUIRE(dir.file_count() == 2);
        }
        REQUIRE(dir.file_count() == 1);
    }

    SECTION("UndecodableInputWithoutFfmpeg") {
        auto in = dir.path / "test.mp3";
        test_support::write_bytes(in, "definitely not audio");

        AudioNormalizer norm({.ffmpeg = ""});
        auto out = norm.normalize(in.string());
        REQUIRE_FALSE(out.has_value());
        REQUIRE(out.error().find("decode failed") != std::string::npos);
        // only the input remains
        REQUIRE(dir.file_count() == 1);
    }

    SECTION("MissingFfmpegBinary") {
        auto in = dir.path / "test.ogg";
        test_support::write_bytes(in, "definitely not audio");

        AudioNormalizer norm({.ffmpeg = (dir.path / "no-such-ffmpeg").string()});
        auto out = norm.normalize(in.string());
        REQUIRE_FALSE(out.has_value());
        REQUIRE(out.error().find("could not execute") != std::string::npos);
        REQUIRE(dir.file_count() == 1);
    }

    SECTION("InputLongerThanFrameLimit") {
        auto in = dir.path / "long.wav";
        test_support::write_wav(in, test_support::tone(16000, 1, 0.1), 16000);

        AudioNormalizer norm({.ffmpeg = "", .max_decoded_frames = 1000});
        auto out = norm.normalize(in.string());
        REQUIRE_FALSE(out.has_value());
        REQUIRE(out.error().find("longer than 1000 frames") != std::string::npos);
        REQUIRE(dir.file_count() == 1);
    }

    SECTION("MissingDirectory") {
        AudioNormalizer norm({.ffmpeg = ""});
        auto out = norm.normalize((dir.path / "gone" / "a.wav").string());
        REQUIRE_FALSE(out.has_value());
    }
}
