#pragma once

#include "corrector.hpp"
#include "http_transport.hpp"
#include "resilient_caller.hpp"

#include <chrono>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

// Grammar correction through the Gemini generateContent API.
class GrammarCorrector : public TextCorrector {
public:
    struct Options {
        std::string endpoint = "https://generativelanguage.googleapis.com/v1beta/models";
        std::string model = "gemini-2.5-flash";
        std::string api_key_env = "GEMINI_API_KEY";
        std::chrono::seconds timeout{120};
    };

    static constexpr const char* kSystemInstruction =
        "You are an expert copy editor and language corrector. Your sole task is to "
        "correct all grammatical errors, spelling mistakes, punctuation issues, "
        "and improve fluency in the user-provided Russian transcription. "
        "Do not add any introductory, conversational, or explanatory text. "
        "Respond only with the corrected text.";

    GrammarCorrector(Options opts, HttpTransport& transport,
                     ResilientCaller caller = ResilientCaller{}, bool verbose = false);

    std::optional<std::string> correct(const std::string& text) override;

    // {"contents":[{"parts":[{"text":...}]}],"systemInstruction":{"parts":[{"text":...}]}}
    static nlohmann::json build_payload(const std::string& text);

    // candidates[0].content.parts[0].text, trimmed. nullopt if any level is
    // missing or the text is empty.
    static std::optional<std::string> extract_text(const nlohmann::json& response);

private:
    // Read on every call; an empty variable counts as unset.
    std::string api_key() const;

    void log(const std::string& msg);

    Options opts_;
    HttpTransport& transport_;
    ResilientCaller caller_;
    bool verbose_;
};
