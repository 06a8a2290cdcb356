#pragma once

#include <optional>
#include <string>

class TextCorrector {
public:
    virtual ~TextCorrector() = default;

    // Corrected text, or nullopt if no correction could be obtained.
    // Never throws.
    virtual std::optional<std::string> correct(const std::string& text) = 0;
};
