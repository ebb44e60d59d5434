#pragma once
#include <optional>
#include <string>

// Reads and writes the encrypted config text file.
class ConfigFile {
public:
    // std::nullopt if the file does not exist; throws std::runtime_error if it
    // exists but cannot be read. Content is returned normalized.
    static std::optional<std::string> read(const std::string& path);

    // Writes blobHex wrapped to LINE_WIDTH via path + ".tmp" and a rename, so
    // an existing file is replaced whole or not at all. Throws
    // std::runtime_error on I/O failure.
    static void write(const std::string& path, const std::string& blobHex);

    // Trims and removes every CR/LF.
    static std::string normalize(const std::string& text);

    // Splits text into lines of at most width characters, each ending in '\n'.
    static std::string wrapLines(const std::string& text, std::size_t width = LINE_WIDTH);

    static constexpr std::size_t LINE_WIDTH = 120;
};
