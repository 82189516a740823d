#include "core/Log.hpp"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <unistd.h>

namespace dropzone {

std::mutex Log::s_mutex;

namespace {

bool detectColor() {
    if (std::getenv("NO_COLOR") != nullptr) return false;
    return ::isatty(STDOUT_FILENO) == 1;
}

std::atomic<bool>& colorFlag() {
    static std::atomic<bool> flag(detectColor());
    return flag;
}

const char* colorCode(LogColor color) {
    switch (color) {
        case LogColor::Green:  return "\033[32m";
        case LogColor::Yellow: return "\033[33m";
        case LogColor::Red:    return "\033[31m";
        case LogColor::Purple: return "\033[35m";
        case LogColor::Dim:    return "\033[2m";
        case LogColor::None:   return "";
    }
    return "";
}

} // namespace

std::string Log::sanitize(const std::string& text) {
    static const char hex[] = "0123456789abcdef";
    std::string out;
    out.reserve(text.size());
    auto escape = [&](unsigned char c) {
        out += "\\x";
        out += hex[c >> 4];
        out += hex[c & 0x0F];
    };

    size_t i = 0;
    while (i < text.size()) {
        auto c = static_cast<unsigned char>(text[i]);
        if (c < 0x80) {
            if ((c < 0x20 && c != '\t') || c == 0x7F) escape(c);
            else out += static_cast<char>(c);
            ++i;
            continue;
        }

        size_t len = 0;
        if (c >= 0xC2 && c <= 0xDF) len = 2;
        else if (c >= 0xE0 && c <= 0xEF) len = 3;
        else if (c >= 0xF0 && c <= 0xF4) len = 4;

        bool valid = len != 0 && i + len <= text.size();
        for (size_t k = 1; valid && k < len; ++k) {
            valid = (static_cast<unsigned char>(text[i + k]) & 0xC0) == 0x80;
        }
        // U+0080..U+009F are the C1 controls, CSI among them
        if (valid && c == 0xC2 && static_cast<unsigned char>(text[i + 1]) < 0xA0) valid = false;

        if (!valid) {
            escape(c);
            ++i;
            continue;
        }
        out.append(text, i, len);
        i += len;
    }
    return out;
}

std::string Log::timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%H:%M:%S", &tm);
    return buf;
}

std::string Log::paint(const std::string& text, LogColor color, bool bold) {
    if (!colorEnabled() || (color == LogColor::None && !bold)) return text;
    std::string out;
    if (bold) out += "\033[1m";
    out += colorCode(color);
    out += text;
    out += "\033[0m";
    return out;
}

void Log::setColorEnabled(bool enabled) {
    colorFlag().store(enabled);
}

bool Log::colorEnabled() {
    return colorFlag().load();
}

void Log::write(std::ostream& out, const std::string& block) {
    std::lock_guard<std::mutex> lock(s_mutex);
    out << block << std::flush;
}

void Log::info(const std::string& message) {
    write(std::cout, paint("[" + timestamp() + "]", LogColor::Dim) + " " + sanitize(message) + "\n");
}

void Log::warn(const std::string& message) {
    write(std::cerr, paint("[" + timestamp() + "]", LogColor::Dim) + " " +
                     paint("WARN", LogColor::Yellow, true) + " " + sanitize(message) + "\n");
}

void Log::error(const std::string& message) {
    write(std::cerr, paint("[" + timestamp() + "]", LogColor::Dim) + " " +
                     paint("ERROR", LogColor::Red, true) + " " + sanitize(message) + "\n");
}

void Log::event(const std::string& tag, LogColor color, const std::string& text) {
    write(std::cout, paint("[" + timestamp() + "]", LogColor::Dim) + " " +
                     paint(tag, color, true) + " " + sanitize(text) + "\n");
}

} // namespace dropzone
