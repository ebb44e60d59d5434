#include "ByteCodec.hpp"

#include <stdexcept>

namespace {
    int hexValue(char ch) {
        if (ch >= '0' && ch <= '9') return ch - '0';
        if (ch >= 'a' && ch <= 'f') return ch - 'a' + 10;
        if (ch >= 'A' && ch <= 'F') return ch - 'A' + 10;
        return -1;
    }

    bool isSpace(char ch) {
        return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f' || ch == '\v';
    }
}

std::vector<std::uint8_t> ByteCodec::fromText(const std::string& text) {
    return { text.begin(), text.end() };
}

std::string ByteCodec::toText(const std::vector<std::uint8_t>& bytes) {
    return { bytes.begin(), bytes.end() };
}

std::string ByteCodec::toHex(const std::vector<std::uint8_t>& bytes) {
    static const char* kDigits = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (std::uint8_t b : bytes) {
        out.push_back(kDigits[b >> 4]);
        out.push_back(kDigits[b & 0x0F]);
    }
    return out;
}

std::vector<std::uint8_t> ByteCodec::fromHex(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        throw std::invalid_argument("fromHex: odd number of hex digits");
    }
    std::vector<std::uint8_t> out(hex.size() / 2);
    for (std::size_t i = 0; i < out.size(); ++i) {
        int hi = hexValue(hex[2 * i]);
        int lo = hexValue(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("fromHex: invalid hex digit at offset " + std::to_string(2 * i));
        }
        out[i] = static_cast<std::uint8_t>((hi << 4) | lo);
    }
    return out;
}

std::string ByteCodec::trim(const std::string& text) {
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && isSpace(text[begin])) ++begin;
    while (end > begin && isSpace(text[end - 1])) --end;
    return text.substr(begin, end - begin);
}

bool ByteCodec::isValidUtf8(const std::string& text) {
    std::size_t i = 0;
    while (i < text.size()) {
        const auto b0 = static_cast<unsigned char>(text[i]);
        std::size_t len = 0;
        unsigned int lo = 0x80, hi = 0xBF;   // allowed range of the second byte
        if (b0 < 0x80)                    len = 1;
        else if (b0 >= 0xC2 && b0 <= 0xDF) len = 2;
        else if (b0 == 0xE0)              { len = 3; lo = 0xA0; }
        else if (b0 == 0xED)              { len = 3; hi = 0x9F; }
        else if (b0 >= 0xE1 && b0 <= 0xEF) len = 3;
        else if (b0 == 0xF0)              { len = 4; lo = 0x90; }
        else if (b0 == 0xF4)              { len = 4; hi = 0x8F; }
        else if (b0 >= 0xF1 && b0 <= 0xF3) len = 4;
        else return false;

        if (i + len > text.size()) return false;
        for (std::size_t k = 1; k < len; ++k) {
            const auto b = static_cast<unsigned char>(text[i + k]);
            const unsigned int min = (k == 1) ? lo : 0x80;
            const unsigned int max = (k == 1) ? hi : 0xBF;
            if (b < min || b > max) return false;
        }
        i += len;
    }
    return true;
}
