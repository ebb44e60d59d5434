#include "PatternTable.hpp"
#include "Errors.hpp"

#include <algorithm>
#include <cctype>
#include <map>

namespace {
    const std::string VOWELS     = "aeiou";
    const std::string CONSONANTS = "bcdfghjklmnpqrstvwxyz";
    const std::string DIGITS     = "0123456789";
    const std::string SYMBOLS    = "!#$%*@";

    std::string upper(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
        return s;
    }

    struct PatternEntry {
        PatternKey key;
        const char* name;
        std::vector<std::string> templates;
    };

    const std::vector<PatternEntry>& entries() {
        static const std::vector<PatternEntry> kEntries = {
            { PatternKey::C16, "c16", { "aAnoxxxxxxxxxxxa", "axxxxxxxxxxxAnoa", "axxAxxnxxoxxxxxa", "axxxnxxxoxxxAxxa" } },
            { PatternKey::C12, "c12", { "aAnoxxxxxxxa", "axxxxxxxAnoa", "axAxnxoxxxxa", "axxnxxoxxAxa" } },
            { PatternKey::C8,  "c8",  { "aAnoxxxa", "axnxAxoa", "axxoAnxa", "axxxnoAa" } },
            { PatternKey::Y16, "y16", { "aAnyyyyyyyyyyyya", "ayyyyyyyyyyyAnya", "ayyAyynyyyyyyyya", "ayyynyyyyyyyAyya" } },
            { PatternKey::N6,  "n6",  { "nnnnnn" } },
            { PatternKey::N5,  "n5",  { "nnnnn" } },
            { PatternKey::N4,  "n4",  { "nnnn" } },
        };
        return kEntries;
    }

    const std::map<char, std::string>& alphabets() {
        static const std::map<char, std::string> kAlphabets = {
            { 'V', upper(VOWELS) },
            { 'C', upper(CONSONANTS) },
            { 'v', VOWELS },
            { 'c', CONSONANTS },
            { 'A', upper(VOWELS) + upper(CONSONANTS) },
            { 'a', VOWELS + CONSONANTS },
            { 'n', DIGITS },
            { 'o', SYMBOLS },
            { 'x', upper(VOWELS) + upper(CONSONANTS) + VOWELS + CONSONANTS + DIGITS + SYMBOLS },
            { 'y', upper(VOWELS) + upper(CONSONANTS) + VOWELS + CONSONANTS + DIGITS },
            { ' ', " " },
        };
        return kAlphabets;
    }

    const PatternEntry& entryFor(PatternKey key) {
        for (const auto& e : entries()) {
            if (e.key == key) return e;
        }
        throw UnknownPatternError("pattern key out of range");
    }
}

const std::vector<PatternKey>& PatternTable::allKeys() {
    static const std::vector<PatternKey> kKeys = [] {
        std::vector<PatternKey> keys;
        for (const auto& e : entries()) keys.push_back(e.key);
        return keys;
    }();
    return kKeys;
}

std::string PatternTable::name(PatternKey key) {
    return entryFor(key).name;
}

std::optional<PatternKey> PatternTable::parse(const std::string& name) {
    for (const auto& e : entries()) {
        if (name == e.name) return e.key;
    }
    return std::nullopt;
}

const std::vector<std::string>& PatternTable::templatesFor(PatternKey key) {
    return entryFor(key).templates;
}

const std::vector<std::string>& PatternTable::templatesFor(const std::string& name) {
    auto key = parse(name);
    if (!key) {
        throw UnknownPatternError("unknown pattern '" + name + "'");
    }
    return templatesFor(*key);
}

const std::string& PatternTable::alphabetFor(char classToken) {
    const auto& table = alphabets();
    auto it = table.find(classToken);
    if (it == table.end()) {
        throw std::invalid_argument(std::string("alphabetFor: undeclared class token '") + classToken + "'");
    }
    return it->second;
}
