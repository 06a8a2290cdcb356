#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

struct Config {
    struct Server {
        std::string host = "0.0.0.0";
        int port = 8000;
        int threads = 8;
        std::string api_prefix;             // e.g. "/api"
        std::string cors_origin = "*";      // empty disables CORS headers
    } server;

    struct Upload {
        std::string temp_dir;               // empty: system temp directory
        size_t max_bytes = 100 * 1024 * 1024;
    } upload;

    struct Whisper {
        std::string backend = "local";      // "local" or "lan"
        std::string model_path;             // empty: <data_dir>/models/ggml-base.bin
        std::string language = "auto";
        int threads = 4;
        int workers = 2;
        // lan backend only
        std::string url = "http://localhost:8080";
        std::string api_format = "whisper.cpp"; // "whisper.cpp" or "openai"
    } whisper;

    struct Audio {
        uint32_t sample_rate = 16000;
        uint32_t leading_silence_ms = 500;
        std::string ffmpeg = "ffmpeg";
    } audio;

    struct Grammar {
        std::string endpoint = "https://generativelanguage.googleapis.com/v1beta/models";
        std::string model = "gemini-2.5-flash";
        std::string api_key_env = "GEMINI_API_KEY";
        int timeout_s = 120;
        int max_attempts = 4;
        int backoff_base_ms = 1000;
    } grammar;

    // Resolved paths with the platform defaults filled in.
    std::string model_path() const;
    std::string temp_dir() const;

    static Config load(const std::string& path);
    static Config load_default();
};
