#pragma once

#include <string>
#include <stdexcept>

namespace dropzone {

enum class HttpRequest {
    GET,
    POST,
    OPTIONS,
};


inline const char* to_string(HttpRequest method) {
    switch(method) {
        case HttpRequest::GET: return "GET";
        case HttpRequest::POST: return "POST";
        case HttpRequest::OPTIONS: return "OPTIONS";
    }
    return "UNKNOWN";
}


inline HttpRequest from_string(const std::string& method) {
    if (method == "GET") return HttpRequest::GET;
    else if (method == "POST") return HttpRequest::POST;
    else if (method == "OPTIONS") return HttpRequest::OPTIONS;
    else throw std::invalid_argument("Invalid HTTP method string: " + method);
}

/**
 * What a request is asking the server to do. The dispatcher switches over
 * this without a default branch, so a new kind must be handled everywhere.
 */
enum class RequestKind {
    Upload,
    Message,
    StaticAsset,
    Preflight,
    Unrecognized,
};

} // namespace dropzone
