#include "core/FilenamePolicy.hpp"
#include "config.hpp"

namespace dropzone {

namespace {

bool isTrimmedLeading(char c) {
    return c == '.' || c == ' ' || c == '\t';
}

bool isTrimmedTrailing(char c) {
    return c == '.' || c == ' ' || c == '\t';
}

// Cut s to at most max bytes without splitting a UTF-8 sequence
std::string truncateUtf8(const std::string& s, std::size_t max) {
    if (s.size() <= max) return s;
    std::size_t cut = max;
    while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) --cut;
    return s.substr(0, cut);
}

} // namespace

std::string FilenamePolicy::sanitize(const std::string& rawName) {
    std::string name = rawName;

    size_t lastSep = name.find_last_of("/\\");
    if (lastSep != std::string::npos) {
        name = name.substr(lastSep + 1);
    }

    std::string clean;
    clean.reserve(name.size());
    for (char c : name) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc < 0x20 || uc == 0x7F) continue;
        clean.push_back(c);
    }

    size_t start = 0;
    size_t end = clean.size();
    while (start < end && isTrimmedLeading(clean[start])) ++start;
    while (end > start && isTrimmedTrailing(clean[end - 1])) --end;
    clean = clean.substr(start, end - start);

    if (clean.empty()) {
        return FALLBACK_NAME;
    }

    // Leave room for a collision suffix such as "-12345"
    const std::size_t limit = MAX_FILENAME_BYTES - 16;
    if (clean.size() > limit) {
        auto parts = splitExtension(clean);
        std::string ext = parts.second;
        if (ext.size() > limit / 2) ext.clear();
        std::string stem = truncateUtf8(parts.first, limit - ext.size());
        clean = stem + ext;
    }

    return clean;
}

std::pair<std::string, std::string> FilenamePolicy::splitExtension(const std::string& name) {
    size_t dotPos = name.find_last_of('.');
    if (dotPos == std::string::npos || dotPos == 0 || dotPos == name.size() - 1) {
        return {name, ""};
    }
    return {name.substr(0, dotPos), name.substr(dotPos)};
}

std::string FilenamePolicy::withSuffix(const std::string& name, unsigned n) {
    if (n == 0) return name;
    auto parts = splitExtension(name);
    return parts.first + "-" + std::to_string(n) + parts.second;
}

std::string FilenamePolicy::resolveCollision(const std::string& safeName,
                                             const std::function<bool(const std::string&)>& isTaken) {
    for (unsigned n = 0;; ++n) {
        std::string candidate = withSuffix(safeName, n);
        if (!isTaken(candidate)) return candidate;
    }
}

std::string FilenamePolicy::resolveCollision(const std::string& safeName,
                                             const std::set<std::string>& existing) {
    return resolveCollision(safeName, [&existing](const std::string& candidate) {
        return existing.count(candidate) != 0;
    });
}

} // namespace dropzone
