#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

std::string Config::model_path() const {
    if (!whisper.model_path.empty()) return whisper.model_path;
    auto dir = platform::data_dir();
    if (dir.empty()) return "models/ggml-base.bin";
    return dir + "/models/ggml-base.bin";
}

std::string Config::temp_dir() const {
    if (!upload.temp_dir.empty()) return upload.temp_dir;
    return platform::temp_dir();
}

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("server")) {
            auto& s = j["server"];
            if (s.contains("host")) cfg.server.host = s["host"].get<std::string>();
            if (s.contains("port")) cfg.server.port = s["port"].get<int>();
            if (s.contains("threads")) cfg.server.threads = s["threads"].get<int>();
            if (s.contains("api_prefix")) cfg.server.api_prefix = s["api_prefix"].get<std::string>();
            if (s.contains("cors_origin")) cfg.server.cors_origin = s["cors_origin"].get<std::string>();
        }

        if (j.contains("upload")) {
            auto& u = j["upload"];
            if (u.contains("temp_dir")) cfg.upload.temp_dir = u["temp_dir"].get<std::string>();
            if (u.contains("max_bytes")) cfg.upload.max_bytes = u["max_bytes"].get<size_t>();
        }

        if (j.contains("whisper")) {
            auto& w = j["whisper"];
            if (w.contains("backend")) cfg.whisper.backend = w["backend"].get<std::string>();
            if (w.contains("model_path")) cfg.whisper.model_path = w["model_path"].get<std::string>();
            if (w.contains("language")) cfg.whisper.language = w["language"].get<std::string>();
            if (w.contains("threads")) cfg.whisper.threads = w["threads"].get<int>();
            if (w.contains("workers")) cfg.whisper.workers = w["workers"].get<int>();
            if (w.contains("url")) cfg.whisper.url = w["url"].get<std::string>();
            if (w.contains("api_format")) cfg.whisper.api_format = w["api_format"].get<std::string>();
        }

        if (j.contains("audio")) {
            auto& a = j["audio"];
            if (a.contains("sample_rate")) cfg.audio.sample_rate = a["sample_rate"].get<uint32_t>();
            if (a.contains("leading_silence_ms")) cfg.audio.leading_silence_ms = a["leading_silence_ms"].get<uint32_t>();
            if (a.contains("ffmpeg")) cfg.audio.ffmpeg = a["ffmpeg"].get<std::string>();
        }

        if (j.contains("grammar")) {
            auto& g = j["grammar"];
            if (g.contains("endpoint")) cfg.grammar.endpoint = g["endpoint"].get<std::string>();
            if (g.contains("model")) cfg.grammar.model = g["model"].get<std::string>();
            if (g.contains("api_key_env")) cfg.grammar.api_key_env = g["api_key_env"].get<std::string>();
            if (g.contains("timeout_s")) cfg.grammar.timeout_s = g["timeout_s"].get<int>();
            if (g.contains("max_attempts")) cfg.grammar.max_attempts = g["max_attempts"].get<int>();
            if (g.contains("backoff_base_ms")) cfg.grammar.backoff_base_ms = g["backoff_base_ms"].get<int>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        return Config{};
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
