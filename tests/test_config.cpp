#include <catch2/catch_test_macros.hpp>

#include "config.hpp"
#include "test_support.hpp"

#include <string>

using test_support::TmpDir;

namespace {

std::string write_config(const TmpDir& dir, const std::string& content) {
    auto p = dir.path / "config.json";
    test_support::write_bytes(p, content);
    return p.string();
}

} // namespace

TEST_CASE("Config", "[config]") {
    TmpDir dir("config");

    SECTION("DefaultValues") {
        Config cfg;
        REQUIRE(cfg.server.host == "0.0.0.0");
        REQUIRE(cfg.server.port == 8000);
        REQUIRE(cfg.server.api_prefix.empty());
        REQUIRE(cfg.server.cors_origin == "*");
        REQUIRE(cfg.upload.max_bytes == 100 * 1024 * 1024);
        REQUIRE(cfg.whisper.backend == "local");
        REQUIRE(cfg.whisper.language == "auto");
        REQUIRE(cfg.whisper.api_format == "whisper.cpp");
        REQUIRE(cfg.audio.sample_rate == 16000);
        REQUIRE(cfg.audio.leading_silence_ms == 500);
        REQUIRE(cfg.audio.ffmpeg == "ffmpeg");
        REQUIRE(cfg.grammar.model == "gemini-2.5-flash");
        REQUIRE(cfg.grammar.api_key_env == "GEMINI_API_KEY");
        REQUIRE(cfg.grammar.max_attempts == 4);
        REQUIRE(cfg.grammar.backoff_base_ms == 1000);
    }

    SECTION("LoadFullConfig") {
        auto path = write_config(dir, R"({
            "server": { "host": "127.0.0.1", "port": 9000, "threads": 2,
                        "api_prefix": "/api", "cors_origin": "" },
            "upload": { "temp_dir": "/var/tmp/scribe", "max_bytes": 1024 },
            "whisper": { "backend": "lan", "model_path": "/models/small.bin",
                         "language": "ru", "threads": 8, "workers": 1,
                         "url": "http://10.0.0.1:9090", "api_format": "openai" },
            "audio": { "sample_rate": 22050, "leading_silence_ms": 0, "ffmpeg": "" },
            "grammar": { "endpoint": "http://localhost:1/models", "model": "gemini-pro",
                         "api_key_env": "MY_KEY", "timeout_s": 5,
                         "max_attempts": 2, "backoff_base_ms": 10 }
        })");

        auto cfg = Config::load(path);
        REQUIRE(cfg.server.host == "127.0.0.1");
        REQUIRE(cfg.server.port == 9000);
        REQUIRE(cfg.server.threads == 2);
        REQUIRE(cfg.server.api_prefix == "/api");
        REQUIRE(cfg.server.cors_origin.empty());
        REQUIRE(cfg.upload.temp_dir == "/var/tmp/scribe");
        REQUIRE(cfg.upload.max_bytes == 1024);
        REQUIRE(cfg.whisper.backend == "lan");
        REQUIRE(cfg.whisper.model_path == "/models/small.bin");
        REQUIRE(cfg.whisper.language == "ru");
        REQUIRE(cfg.whisper.threads == 8);
        REQUIRE(cfg.whisper.workers == 1);
        REQUIRE(cfg.whisper.url == "http://10.0.0.1:9090");
        REQUIRE(cfg.whisper.api_format == "openai");
        REQUIRE(cfg.audio.sample_rate == 22050);
        REQUIRE(cfg.audio.leading_silence_ms == 0);
        REQUIRE(cfg.audio.ffmpeg.empty());
        REQUIRE(cfg.grammar.endpoint == "http://localhost:1/models");
        REQUIRE(cfg.grammar.model == "gemini-pro");
        REQUIRE(cfg.grammar.api_key_env == "MY_KEY");
        REQUIRE(cfg.grammar.timeout_s == 5);
        REQUIRE(cfg.grammar.max_attempts == 2);
        REQUIRE(cfg.grammar.backoff_base_ms == 10);

        REQUIRE(cfg.model_path() == "/models/small.bin");
        REQUIRE(cfg.temp_dir() == "/var/tmp/scribe");
    }

    SECTION("LoadPartialConfig") {
        auto path = write_config(dir, R"({ "whisper": { "language": "fr" } })");

        auto cfg = Config::load(path);
        REQUIRE(cfg.whisper.language == "fr");
        // Other fields retain defaults
        REQUIRE(cfg.whisper.backend == "local");
        REQUIRE(cfg.server.port == 8000);
        REQUIRE(cfg.audio.sample_rate == 16000);
    }

    SECTION("LoadInvalidJson") {
        auto path = write_config(dir, "not json {{{");

        auto cfg = Config::load(path);
        REQUIRE(cfg.server.port == 8000);
        REQUIRE(cfg.whisper.backend == "local");
    }

    SECTION("WrongValueTypeFallsBackToDefaults") {
        auto path = write_config(dir, R"({ "server": { "port": "eighty" } })");

        auto cfg = Config::load(path);
        REQUIRE(cfg.server.port == 8000);
    }

    SECTION("LoadMissingFile") {
        auto cfg = Config::load((dir.path / "missing.json").string());
        REQUIRE(cfg.server.port == 8000);
        REQUIRE(cfg.audio.sample_rate == 16000);
    }

    SECTION("ResolvedDefaults") {
        Config cfg;
        REQUIRE(cfg.model_path().ends_with("models/ggml-base.bin"));
        REQUIRE_FALSE(cfg.temp_dir().empty());
    }
}
