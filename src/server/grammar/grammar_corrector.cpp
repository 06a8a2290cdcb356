#include "grammar_corrector.hpp"

#include "../text_utils.hpp"

#include <cstdlib>
#include <print>

using json = nlohmann::json;

GrammarCorrector::GrammarCorrector(Options opts, HttpTransport& transport,
                                   ResilientCaller caller, bool verbose)
    : opts_(std::move(opts)), transport_(transport),
      caller_(std::move(caller)), verbose_(verbose) {}

json GrammarCorrector::build_payload(const std::string& text) {
    return {
        {"contents", json::array({
            {{"parts", json::array({{{"text", text}}})}},
        })},
        {"systemInstruction", {
            {"parts", json::array({{{"text", kSystemInstruction}}})},
        }},
    };
}

std::optional<std::string> GrammarCorrector::extract_text(const json& response) {
    if (!response.is_object()) return std::nullopt;

    auto candidates = response.find("candidates");
    if (candidates == response.end() || !candidates->is_array() || candidates->empty()) {
        return std::nullopt;
    }

    const auto& candidate = (*candidates)[0];
    if (!candidate.is_object()) return std::nullopt;

    auto content = candidate.find("content");
    if (content == candidate.end() || !content->is_object()) return std::nullopt;

    auto parts = content->find("parts");
    if (parts == content->end() || !parts->is_array() || parts->empty()) {
        return std::nullopt;
    }

    const auto& part = (*parts)[0];
    if (!part.is_object()) return std::nullopt;

    auto txt = part.find("text");
    if (txt == part.end() || !txt->is_string()) return std::nullopt;

    const auto& raw = txt->get_ref<const std::string&>();
    if (raw.empty()) return std::nullopt;
    return text::trim(raw);
}

std::string GrammarCorrector::api_key() const {
    const char* key = std::getenv(opts_.api_key_env.c_str());
    return key ? std::string(key) : std::string();
}

std::optional<std::string> GrammarCorrector::correct(const std::string& text) {
    if (text.empty()) return std::nullopt;

    auto key = api_key();
    if (key.empty()) {
        std::println(stderr, "grammar: {} environment variable not set or empty", opts_.api_key_env);
        return std::nullopt;
    }

    std::string reply_body;
    try {
        // The key travels in the query string; never log this URL.
        std::string url = opts_.endpoint + "/" + opts_.model + ":generateContent?key=" + key;
        std::string body = build_payload(text).dump();

        auto reply = caller_.call([&] {
            return transport_.post_json(url, body, opts_.timeout);
        });

        if (!reply) {
            if (reply.error().status != 0) {
                std::println(stderr, "grammar: HTTP {} from correction service", reply.error().status);
                std::println(stderr, "grammar: response body: {}", reply.error().body);
            } else {
                std::println(stderr, "grammar: request failed: {}", reply.error().message);
            }
            return std::nullopt;
        }

        reply_body = std::move(reply->body);
        auto result = json::parse(reply_body);

        auto corrected = extract_text(result);
        if (!corrected) {
            std::println(stderr, "grammar: response carried no text: {}", result.dump(2));
            return std::nullopt;
        }

        log("corrected " + std::to_string(text.size()) + " -> " +
            std::to_string(corrected->size()) + " bytes");
        return corrected;
    } catch (const json::exception& e) {
        std::println(stderr, "grammar: response is not valid JSON ({}): {}", e.what(), reply_body);
        return std::nullopt;
    } catch (const std::exception& e) {
        std::println(stderr, "grammar: unexpected error: {}", e.what());
        return std::nullopt;
    }
}

void GrammarCorrector::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[audio-scribe] {}", msg);
    }
}
