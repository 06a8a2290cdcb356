#pragma once

#include "grammar/corrector.hpp"
#include "transcriber.hpp"
#include "upload/upload_stager.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

struct ApiResponse {
    int status = 200;
    nlohmann::json body;
};

// Transport-independent request handling: every outcome of the two
// pipelines becomes a status code and a JSON body here.
class ApiCore {
public:
    static constexpr size_t kMinCorrectionLength = 10;

    ApiCore(Transcriber& transcriber, TextCorrector& corrector, bool verbose = false);

    ApiCore(const ApiCore&) = delete;
    ApiCore& operator=(const ApiCore&) = delete;

    ApiResponse handle_root() const;

    // Takes ownership of the staged file; it is deleted before this returns,
    // whatever the outcome.
    ApiResponse handle_transcribe(std::optional<StagedUpload> upload);

    // body is the raw request body, expected to be {"text": "..."}.
    ApiResponse handle_fix_grammar(const std::string& body);

    static ApiResponse error(int status, const std::string& detail);

private:
    static ApiResponse validation_error(const std::string& type, const std::string& field,
                                        const std::string& msg);

    void log(const std::string& msg);

    Transcriber& transcriber_;
    TextCorrector& corrector_;
    bool verbose_;
};
