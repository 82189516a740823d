#pragma once

#include <functional>
#include <set>
#include <string>

namespace dropzone {

/**
 * Pure helpers turning a client-supplied filename into a name that is safe
 * to create directly inside the upload root.
 */
class FilenamePolicy {
public:
    // Name used when nothing usable is left after sanitizing
    static constexpr const char* FALLBACK_NAME = "upload";

    /**
     * Reduce a raw filename to a single safe path component.
     *
     * Keeps only the text after the last '/' or '\', drops control bytes,
     * strips leading dots/spaces and trailing dots/spaces, and caps the
     * length while preserving the extension. Never returns an empty string,
     * ".", ".." or a name starting with '.'.
     */
    static std::string sanitize(const std::string& rawName);

    // "report.tar.gz" -> {"report.tar", ".gz"}; "README" -> {"README", ""}
    static std::pair<std::string, std::string> splitExtension(const std::string& name);

    // "<stem>-<n><ext>"; n == 0 returns the name unchanged
    static std::string withSuffix(const std::string& name, unsigned n);

    /**
     * First of name, name-1, name-2, ... for which isTaken returns false.
     */
    static std::string resolveCollision(const std::string& safeName,
                                        const std::function<bool(const std::string&)>& isTaken);

    static std::string resolveCollision(const std::string& safeName,
                                        const std::set<std::string>& existing);
};

} // namespace dropzone
