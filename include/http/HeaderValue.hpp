#pragma once

#include <string>
#include <unordered_map>

namespace dropzone {
namespace http {

/**
 * Small string helpers shared by the request and multipart parsers.
 */
struct HeaderValue {
    static void trim(std::string& s);
    static void toLower(std::string& s);

    // "text/plain; charset=utf-8" -> "text/plain" (lower-cased)
    static std::string mediaType(const std::string& value);

    /**
     * Parameters after the first ';' with lower-cased keys and unquoted
     * values. Semicolons inside quoted strings do not split.
     */
    static std::unordered_map<std::string, std::string> parameters(const std::string& value);

    // Decodes %XX escapes; returns false on a malformed escape
    static bool percentDecode(const std::string& in, std::string& out);
};

/**
 * Strict UTF-8 check: no overlong forms, surrogates or code points past U+10FFFF.
 */
bool isValidUtf8(const std::string& text);

} // namespace http
} // namespace dropzone
