#include "http/HeaderValue.hpp"

#include <cctype>
#include <cstdint>
#include <vector>

namespace dropzone {
namespace http {

void HeaderValue::trim(std::string& s) {
    size_t start = 0;
    size_t end = s.size();
    while (start < end && (s[start] == ' ' || s[start] == '\t')) ++start;
    while (end > start && (s[end - 1] == ' ' || s[end - 1] == '\t' ||
                            s[end - 1] == '\r' || s[end - 1] == '\n')) --end;
    s = s.substr(start, end - start);
}

void HeaderValue::toLower(std::string& s) {
    for (char& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
}

std::string HeaderValue::mediaType(const std::string& value) {
    std::string mt = value.substr(0, value.find(';'));
    trim(mt);
    toLower(mt);
    return mt;
}

std::unordered_map<std::string, std::string> HeaderValue::parameters(const std::string& value) {
    std::unordered_map<std::string, std::string> out;

    // Split on ';' outside of quotes
    std::vector<std::string> tokens;
    std::string current;
    bool quoted = false;
    bool escaped = false;
    for (char c : value) {
        if (escaped) {
            current.push_back(c);
            escaped = false;
            continue;
        }
        if (quoted && c == '\\') {
            current.push_back(c);
            escaped = true;
            continue;
        }
        if (c == '"') quoted = !quoted;
        if (c == ';' && !quoted) {
            tokens.push_back(current);
            current.clear();
            continue;
        }
        current.push_back(c);
    }
    tokens.push_back(current);

    // tokens[0] is the media type / disposition type
    for (size_t i = 1; i < tokens.size(); ++i) {
        std::string token = tokens[i];
        trim(token);
        if (token.empty()) continue;

        auto eq = token.find('=');
        if (eq == std::string::npos) continue;

        std::string key = token.substr(0, eq);
        std::string val = token.substr(eq + 1);
        trim(key);
        trim(val);
        toLower(key);

        // Remove surrounding quotes and quoted-pair escapes
        if (val.size() >= 2 && val.front() == '"' && val.back() == '"') {
            std::string unquoted;
            for (size_t j = 1; j + 1 < val.size(); ++j) {
                if (val[j] == '\\' && j + 2 < val.size()) ++j;
                unquoted.push_back(val[j]);
            }
            val = unquoted;
        }

        out.emplace(key, val);
    }
    return out;
}

bool HeaderValue::percentDecode(const std::string& in, std::string& out) {
    auto hex = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };

    out.clear();
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        if (in[i] != '%') {
            out.push_back(in[i]);
            continue;
        }
        if (i + 2 >= in.size()) return false;
        int hi = hex(in[i + 1]);
        int lo = hex(in[i + 2]);
        if (hi < 0 || lo < 0) return false;
        out.push_back(static_cast<char>(hi * 16 + lo));
        i += 2;
    }
    return true;
}

bool isValidUtf8(const std::string& text) {
    const auto* s = reinterpret_cast<const unsigned char*>(text.data());
    const size_t n = text.size();
    size_t i = 0;

    while (i < n) {
        unsigned char c = s[i];
        if (c < 0x80) {
            ++i;
            continue;
        }

        size_t len;
        uint32_t cp;
        if ((c & 0xE0) == 0xC0) {
            len = 2;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4;
            cp = c & 0x07;
        } else {
            return false;
        }
        if (i + len > n) return false;

        for (size_t k = 1; k < len; ++k) {
            if ((s[i + k] & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (s[i + k] & 0x3F);
        }

        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) return false;
        if (cp > 0x10FFFF) return false;
        if (cp >= 0xD800 && cp <= 0xDFFF) return false;

        i += len;
    }
    return true;
}

} // namespace http
} // namespace dropzone
