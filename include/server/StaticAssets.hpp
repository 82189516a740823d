#pragma once

#include <optional>
#include <string>

namespace dropzone {

struct StaticAsset {
    const char* contentType;
    const std::string* body;
};

/**
 * The web page and icon compiled into the binary.
 */
class StaticAssets {
public:
    // "/", "/index.html" and "/favicon.svg"; empty for anything else
    static std::optional<StaticAsset> find(const std::string& path);
};

} // namespace dropzone
