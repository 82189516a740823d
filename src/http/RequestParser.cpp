#include "http/RequestParser.hpp"
#include "http/HeaderValue.hpp"
#include "core/Errors.hpp"

#include <cctype>
#include <sstream>

namespace dropzone {
namespace http {

void RequestParser::parseRequestLine(const std::string& line, RequestHead& req) {
    std::istringstream request_stream(line);
    std::string extra;
    if (!(request_stream >> req.methodText >> req.target >> req.version) || (request_stream >> extra)) {
        throw MalformedRequestError("Invalid request line");
    }
    if (req.version != "HTTP/1.1" && req.version != "HTTP/1.0") {
        throw MalformedRequestError("Unsupported HTTP version: " + req.version);
    }
    if (req.target.empty() || req.target.front() != '/') {
        throw MalformedRequestError("Invalid request target");
    }

    try {
        req.method = from_string(req.methodText);
    } catch (const std::invalid_argument&) {
        req.method.reset();
    }

    req.path = req.target;
    auto qm = req.path.find('?');
    if (qm != std::string::npos) req.path = req.path.substr(0, qm);

    req.keepAlive = req.version == "HTTP/1.1";
}

void RequestParser::applyHeader(const std::string& name, const std::string& value, RequestHead& req) {
    if (name == "content-length") {
        if (value.empty()) throw MalformedRequestError("Empty Content-Length");
        for (char c : value) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                throw MalformedRequestError("Invalid Content-Length");
            }
        }
        size_t length;
        try {
            length = static_cast<size_t>(std::stoull(value));
        } catch (const std::out_of_range&) {
            throw MalformedRequestError("Content-Length out of range");
        }
        if (req.hasContentLength && length != req.contentLength) {
            throw MalformedRequestError("Conflicting Content-Length headers");
        }
        req.contentLength = length;
        req.hasContentLength = true;
    } else if (name == "content-type") {
        req.mediaType = HeaderValue::mediaType(value);
    } else if (name == "transfer-encoding") {
        std::string coding = value;
        HeaderValue::toLower(coding);
        if (coding != "identity") {
            throw LengthRequiredError("Transfer-Encoding is not supported, send Content-Length");
        }
    } else if (name == "connection") {
        std::string v = value;
        HeaderValue::toLower(v);
        if (v.find("close") != std::string::npos) req.keepAlive = false;
        else if (v.find("keep-alive") != std::string::npos) req.keepAlive = true;
    } else if (name == "expect") {
        std::string v = value;
        HeaderValue::toLower(v);
        req.expectContinue = v == "100-continue";
    }
}

RequestHead RequestParser::parse(const std::string& head) {
    RequestHead req;

    size_t line_end = head.find("\r\n");
    std::string request_line = head.substr(0, line_end);
    parseRequestLine(request_line, req);

    size_t pos = (line_end == std::string::npos) ? head.size() : line_end + 2;
    while (pos < head.size()) {
        size_t eol = head.find("\r\n", pos);
        std::string header_line = head.substr(pos, (eol == std::string::npos ? head.size() : eol) - pos);
        pos = (eol == std::string::npos) ? head.size() : eol + 2;

        if (header_line.empty()) continue;
        if (header_line.front() == ' ' || header_line.front() == '\t') {
            throw MalformedRequestError("Obsolete header folding is not supported");
        }

        auto colon = header_line.find(':');
        if (colon == std::string::npos || colon == 0) {
            throw MalformedRequestError("Invalid header line");
        }

        std::string name = header_line.substr(0, colon);
        std::string value = header_line.substr(colon + 1);
        if (name.find_first_of(" \t") != std::string::npos) {
            throw MalformedRequestError("Whitespace in header name");
        }
        HeaderValue::trim(value);
        HeaderValue::toLower(name);

        applyHeader(name, value, req);

        auto existing = req.headers.find(name);
        if (existing == req.headers.end()) {
            req.headers.emplace(name, value);
        } else {
            existing->second += ", " + value;
        }
    }

    return req;
}

} // namespace http
} // namespace dropzone
