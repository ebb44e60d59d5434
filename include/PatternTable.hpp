#pragma once
#include <optional>
#include <string>
#include <vector>

// Known pattern families, in declaration order. C16 is the default.
enum class PatternKey { C16, C12, C8, Y16, N6, N5, N4 };

// Static registry of password templates and character-class alphabets.
//
// A template is a string of class tokens, one per output character:
//   v/c  vowels/consonants     V/C  uppercase vowels/consonants
//   a/A  lower/upper alpha     n    digits     o  symbols
//   x    any (alpha, digit, symbol)            y  any minus symbols
//   ' '  literal space
class PatternTable {
public:
    static const std::vector<PatternKey>& allKeys();
    static PatternKey defaultKey() { return PatternKey::C16; }

    static std::string name(PatternKey key);
    static std::optional<PatternKey> parse(const std::string& name);

    static const std::vector<std::string>& templatesFor(PatternKey key);

    // Throws UnknownPatternError for names outside allKeys().
    static const std::vector<std::string>& templatesFor(const std::string& name);

    // Throws std::invalid_argument for an undeclared class token.
    static const std::string& alphabetFor(char classToken);
};
