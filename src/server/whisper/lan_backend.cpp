#include "lan_backend.hpp"
#include "../text_utils.hpp"

#include <chrono>
#include <curl/curl.h>
#include <filesystem>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

// Mono 16-bit PCM after a 44-byte header.
static double wav_duration(const std::string& path, uint32_t sample_rate) {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec || size <= 44 || sample_rate == 0) return 0.0;
    return static_cast<double>(size - 44) / (sample_rate * 2.0);
}

LanBackend::LanBackend(Options opts) : opts_(std::move(opts)) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

LanBackend::~LanBackend() {
    curl_global_cleanup();
}

std::expected<TranscriptResult, std::string>
LanBackend::transcribe(const std::string& wav_path) {
    double duration_s = wav_duration(wav_path, opts_.sample_rate);
    if (duration_s <= 0.0) {
        return std::unexpected("empty audio");
    }

    auto start = std::chrono::steady_clock::now();

    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("curl_easy_init failed");
    }

    // "auto" is whisper.cpp's spelling; the OpenAI API wants the field omitted.
    bool send_language = !opts_.language.empty() &&
                         !(opts_.api_format == "openai" && opts_.language == "auto");

    std::string endpoint;
    curl_mime* mime = curl_mime_init(curl);
    curl_mimepart* part;

    part = curl_mime_addpart(mime);
    curl_mime_name(part, "file");
    curl_mime_filedata(part, wav_path.c_str());
    curl_mime_filename(part, "audio.wav");
    curl_mime_type(part, "audio/wav");

    if (opts_.api_format == "openai") {
        endpoint = opts_.url + "/v1/audio/transcriptions";

        part = curl_mime_addpart(mime);
        curl_mime_name(part, "model");
        curl_mime_data(part, "whisper-1", CURL_ZERO_TERMINATED);
    } else {
        endpoint = opts_.url + "/inference";

        part = curl_mime_addpart(mime);
        curl_mime_name(part, "temperature");
        curl_mime_data(part, "0.0", CURL_ZERO_TERMINATED);
    }

    part = curl_mime_addpart(mime);
    curl_mime_name(part, "response_format");
    curl_mime_data(part, "json", CURL_ZERO_TERMINATED);

    if (send_language) {
        part = curl_mime_addpart(mime);
        curl_mime_name(part, "language");
        curl_mime_data(part, opts_.language.c_str(), CURL_ZERO_TERMINATED);
    }

    std::string response_body;
    long http_status = 0;

    curl_easy_setopt(curl, CURLOPT_URL, endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, opts_.timeout_s);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_status);

    curl_mime_free(mime);
    curl_easy_cleanup(curl);

    auto end = std::chrono::steady_clock::now();
    double processing_s = std::chrono::duration<double>(end - start).count();

    if (res != CURLE_OK) {
        return std::unexpected(std::string("curl error: ") + curl_easy_strerror(res));
    }

    try {
        auto j = json::parse(response_body);

        if (j.contains("text") && j["text"].is_string()) {
            return TranscriptResult{
                .text = text::trim(j["text"].get<std::string>()),
                .duration_s = duration_s,
                .processing_s = processing_s,
            };
        }
        if (j.contains("error")) {
            return std::unexpected("server error: " + j["error"].dump());
        }
        return std::unexpected("unexpected response (HTTP " + std::to_string(http_status) +
                               "): " + response_body);
    } catch (const json::exception& e) {
        return std::unexpected(std::string("JSON parse error: ") + e.what());
    }
}
