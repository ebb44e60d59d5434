#include "ConfigFile.hpp"
#include "ByteCodec.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

std::optional<std::string> ConfigFile::read(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return std::nullopt;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("cannot open config file: " + path);
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    if (in.bad()) {
        throw std::runtime_error("error reading config file: " + path);
    }
    return normalize(buf.str());
}

void ConfigFile::write(const std::string& path, const std::string& blobHex) {
    const std::filesystem::path p(path);
    if (p.has_parent_path()) {
        std::filesystem::create_directories(p.parent_path());
    }

    // Write beside the target, then rename over it; the old file survives
    // any failure before the rename.
    const std::string tmpPath = path + ".tmp";
    {
        std::ofstream out(tmpPath, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw std::runtime_error("cannot open config file for writing: " + tmpPath);
        }
        out << wrapLines(blobHex);
        out.flush();
        if (!out) {
            out.close();
            std::error_code ignored;
            std::filesystem::remove(tmpPath, ignored);
            throw std::runtime_error("error writing config file: " + tmpPath);
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmpPath, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tmpPath, ignored);
        throw std::runtime_error("cannot replace config file " + path + ": " + ec.message());
    }
}

std::string ConfigFile::normalize(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char ch : ByteCodec::trim(text)) {
        if (ch != '\r' && ch != '\n') out.push_back(ch);
    }
    return out;
}

std::string ConfigFile::wrapLines(const std::string& text, std::size_t width) {
    if (width == 0) {
        throw std::invalid_argument("wrapLines: width must be > 0");
    }
    std::string out;
    out.reserve(text.size() + text.size() / width + 1);
    for (std::size_t i = 0; i < text.size(); i += width) {
        out.append(text, i, width);
        out.push_back('\n');
    }
    return out;
}
