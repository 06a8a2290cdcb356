#include "api_core.hpp"

#include "text_utils.hpp"

#include <exception>
#include <format>
#include <print>

using json = nlohmann::json;

ApiCore::ApiCore(Transcriber& transcriber, TextCorrector& corrector, bool verbose)
    : transcriber_(transcriber), corrector_(corrector), verbose_(verbose) {}

ApiResponse ApiCore::error(int status, const std::string& detail) {
    return {status, {{"detail", detail}}};
}

ApiResponse ApiCore::validation_error(const std::string& type, const std::string& field,
                                      const std::string& msg) {
    json item = {
        {"type", type},
        {"loc", json::array({"body", field})},
        {"msg", msg},
    };
    return {422, {{"detail", json::array({item})}}};
}

ApiResponse ApiCore::handle_root() const {
    return {200, {{"message", "Welcome to the Audio Scribe API!"}}};
}

ApiResponse ApiCore::handle_transcribe(std::optional<StagedUpload> upload) {
    if (!upload) {
        return error(400, "No file was uploaded.");
    }

    // Owns the staged file from here on; its destructor removes it on every
    // return path below, including exceptions.
    StagedUpload staged = std::move(*upload);
    upload.reset();

    if (staged.bytes == 0) {
        return error(400, "Uploaded file is empty.");
    }

    log(std::format("transcribing {} ({} bytes) staged at {}",
                    staged.filename, staged.bytes, staged.file.path()));

    try {
        auto result = transcriber_.transcribe(staged.file.path());
        staged.file.remove();

        if (!result) {
            const auto& err = result.error();
            // Both are server-side failures; only the detail differs.
            if (err.kind == TranscribeError::Kind::Unavailable) {
                return error(500, err.message);
            }
            return error(500, "Transcription service failed to process the audio.");
        }

        return {200, {{"filename", staged.filename}, {"transcription", *result}}};
    } catch (const std::exception& e) {
        std::println(stderr, "transcribe: unexpected error for {}: {}", staged.filename, e.what());
        return error(500, std::string("An error occurred during transcription: ") + e.what());
    }
}

ApiResponse ApiCore::handle_fix_grammar(const std::string& body) {
    json req = json::parse(body, nullptr, false);
    if (req.is_discarded()) {
        return validation_error("json_invalid", "text", "JSON decode error");
    }
    if (!req.is_object() || !req.contains("text")) {
        return validation_error("missing", "text", "Field required");
    }
    if (!req["text"].is_string()) {
        return validation_error("string_type", "text", "Input should be a valid string");
    }

    const auto& input = req["text"].get_ref<const std::string&>();
    if (text::utf8_length(input) < kMinCorrectionLength) {
        return error(400, "Text provided is too short for grammar correction.");
    }

    auto corrected = corrector_.correct(input);
    if (!corrected) {
        return error(500, "Grammar correction failed to return a result.");
    }

    log(std::format("grammar corrected ({} chars)", text::utf8_length(*corrected)));
    return {200, {{"corrected_text", *corrected}}};
}

void ApiCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[audio-scribe] {}", msg);
    }
}
