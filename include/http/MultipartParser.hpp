#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace dropzone {
namespace http {

/**
 * Represents a single part of a multipart/form-data request
 */
struct MultipartPart {
    std::string name;           // form field name
    std::string filename;       // original filename (empty if not a file)
    std::string content_type;   // MIME type of the content
    std::vector<uint8_t> data;  // binary content, only filled by parse()

    // Convenience methods
    bool isFile() const { return !filename.empty(); }
    std::string dataAsString() const {
        return std::string(data.begin(), data.end());
    }
};

/**
 * Incremental parser for multipart/form-data bodies.
 *
 * Bytes can be fed in arbitrarily sized chunks. Part data is reported through
 * onData as soon as it is known not to belong to a boundary, so memory use is
 * bounded by the chunk size plus the boundary length.
 */
class MultipartParser {
public:
    struct Callbacks {
        // Headers of a new part; data is always empty here
        std::function<void(const MultipartPart&)> onPartBegin;
        std::function<void(const char*, size_t)> onData;
        std::function<void()> onPartEnd;
    };

    MultipartParser(const std::string& boundary, Callbacks callbacks);

    /**
     * Consume the next chunk of the body.
     * @throws MalformedRequestError on a broken part header or boundary line
     */
    void feed(const char* data, size_t size);

    /**
     * Signal end of body.
     * @throws MalformedRequestError if the closing boundary was never seen
     */
    void finish();

    bool isDone() const { return state_ == State::Done; }

    /**
     * Parse a fully buffered body into parts (data included)
     * @param body Raw HTTP body
     * @param boundary Multipart boundary string (without --)
     * @return Vector of parsed parts
     */
    static std::vector<MultipartPart> parse(const std::string& body, const std::string& boundary);

    /**
     * Extract boundary from Content-Type header value
     * @param content_type Full Content-Type header value
     * @return Boundary string or empty if not found
     */
    static std::string extractBoundary(const std::string& content_type);

private:
    enum class State {
        Preamble,
        AfterBoundary,
        Headers,
        Body,
        Done,
    };

    std::string delimiter_;   // "\r\n--" + boundary
    Callbacks callbacks_;
    State state_ = State::Preamble;
    std::string pending_;

    void process();
    bool processPreamble();
    bool processAfterBoundary();
    bool processHeaders();
    bool processBody();

    static void parsePartHeaders(const std::string& block, MultipartPart& part);
    static void parseContentDisposition(const std::string& value, std::string& name, std::string& filename);
};

} // namespace http
} // namespace dropzone
