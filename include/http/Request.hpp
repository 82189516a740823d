#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "const/rest_enums.hpp"

namespace dropzone {
namespace http {

/**
 * Request line and headers of one HTTP request. The body is streamed
 * separately by the dispatcher.
 */
struct RequestHead {
    std::string methodText;                                // as sent, e.g. "POST"
    std::optional<HttpRequest> method;                     // empty for unsupported methods
    std::string target;                                    // raw request target
    std::string path;                                      // target without query string
    std::string version;                                   // "HTTP/1.1"
    std::unordered_map<std::string, std::string> headers;  // lower-cased names
    std::string mediaType;                                 // lower-cased Content-Type without parameters
    std::size_t contentLength = 0;
    bool hasContentLength = false;
    bool keepAlive = true;
    bool expectContinue = false;                           // "Expect: 100-continue"

    std::string header(const std::string& lowerName, const std::string& defaultValue = "") const {
        auto it = headers.find(lowerName);
        return it != headers.end() ? it->second : defaultValue;
    }
};

/**
 * HTTP Response object
 */
struct Response {
    int status = 200;
    std::string contentType = "application/json";
    std::string body;
    std::vector<std::pair<std::string, std::string>> extraHeaders;
    bool closeConnection = false;

    static Response ok(const nlohmann::json& body) {
        return {200, "application/json", body.dump(), {}, false};
    }

    static Response content(const std::string& contentType, const std::string& body) {
        return {200, contentType, body, {}, false};
    }

    static Response noContent() {
        return {204, "", "", {}, false};
    }

    static Response error(int status, const std::string& message) {
        nlohmann::json j;
        j["status"] = "error";
        j["message"] = message;
        return {status, "application/json", j.dump(), {}, false};
    }

    static Response notFound(const std::string& message = "Not found") {
        return error(404, message);
    }

    static Response methodNotAllowed() {
        return error(405, "Method not allowed");
    }

    static Response serverError(const std::string& message) {
        return error(500, message);
    }

    // Status line, headers and body ready to put on the wire
    std::string serialize(bool keepAlive) const;
};

const char* statusText(int status);

} // namespace http
} // namespace dropzone
