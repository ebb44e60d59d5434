#pragma once
#include <cstdint>
#include <string>
#include <vector>

// Conversions between UTF-8 text, lowercase hex text and raw bytes.
class ByteCodec {
public:
    static std::vector<std::uint8_t> fromText(const std::string& text);
    static std::string toText(const std::vector<std::uint8_t>& bytes);

    // Two lowercase hex digits per byte.
    static std::string toHex(const std::vector<std::uint8_t>& bytes);

    // Accepts upper or lower case. Throws std::invalid_argument on odd length
    // or a non-hex digit.
    static std::vector<std::uint8_t> fromHex(const std::string& hex);

    // Well-formed UTF-8: no overlongs, surrogates or code points past U+10FFFF.
    static bool isValidUtf8(const std::string& text);

    // Strips leading/trailing ASCII whitespace.
    static std::string trim(const std::string& text);
};
