#include "PasswordSynthesizer.hpp"
#include "Errors.hpp"

const std::string& PasswordSynthesizer::selectTemplate(const std::vector<std::uint8_t>& keyBytes,
                                                       PatternKey pattern) {
    if (keyBytes.empty()) {
        throw InvalidKeyLengthError("selectTemplate: no key bytes");
    }
    const auto& templates = PatternTable::templatesFor(pattern);
    return templates[keyBytes[0] % templates.size()];
}

std::string PasswordSynthesizer::synthesize(const std::vector<std::uint8_t>& keyBytes, PatternKey pattern) {
    const std::string& tmpl = selectTemplate(keyBytes, pattern);
    if (keyBytes.size() < tmpl.size() + 1) {
        throw InvalidKeyLengthError("synthesize: need " + std::to_string(tmpl.size() + 1)
                                    + " key bytes, got " + std::to_string(keyBytes.size()));
    }

    std::string out;
    out.reserve(tmpl.size());
    for (std::size_t i = 0; i < tmpl.size(); ++i) {
        const std::string& alphabet = PatternTable::alphabetFor(tmpl[i]);
        out.push_back(alphabet[keyBytes[i + 1] % alphabet.size()]);
    }
    return out;
}

std::string PasswordSynthesizer::synthesize(const std::vector<std::uint8_t>& keyBytes,
                                            const std::optional<std::string>& patternName) {
    if (!patternName) {
        return synthesize(keyBytes, PatternTable::defaultKey());
    }
    auto key = PatternTable::parse(*patternName);
    if (!key) {
        throw UnknownPatternError("unknown pattern '" + *patternName + "'");
    }
    return synthesize(keyBytes, *key);
}
