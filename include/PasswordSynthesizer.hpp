#pragma once
#include "PatternTable.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Maps raw service-key bytes onto a pattern template.
//
// keyBytes[0] picks the template (mod template count); keyBytes[i + 1] picks
// the character for template position i (mod alphabet size). Pure function.
class PasswordSynthesizer {
public:
    // Throws InvalidKeyLengthError if keyBytes.size() < template length + 1.
    static std::string synthesize(const std::vector<std::uint8_t>& keyBytes, PatternKey pattern);

    // No pattern -> PatternTable::defaultKey(). Unknown name -> UnknownPatternError.
    static std::string synthesize(const std::vector<std::uint8_t>& keyBytes,
                                  const std::optional<std::string>& patternName);

    // The template keyBytes[0] selects. Throws InvalidKeyLengthError on empty input.
    static const std::string& selectTemplate(const std::vector<std::uint8_t>& keyBytes, PatternKey pattern);
};
