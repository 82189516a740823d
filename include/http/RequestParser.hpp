#pragma once

#include <string>
#include "http/Request.hpp"

namespace dropzone {
namespace http {

/**
 * Parser for the request line and header block of an HTTP/1.x request.
 */
class RequestParser {
public:
    /**
     * Parse a request head.
     * @param head Bytes before the blank line, without the final "\r\n\r\n"
     * @return Parsed head; method is empty for unsupported methods
     * @throws MalformedRequestError on a broken request line or header
     * @throws LengthRequiredError when the body uses a transfer coding
     */
    static RequestHead parse(const std::string& head);

private:
    static void parseRequestLine(const std::string& line, RequestHead& req);
    static void applyHeader(const std::string& name, const std::string& value, RequestHead& req);
};

} // namespace http
} // namespace dropzone
