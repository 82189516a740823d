#include "http/Request.hpp"

#include <sstream>

namespace dropzone {
namespace http {

const char* statusText(int status) {
    switch (status) {
        case 200: return "OK";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 408: return "Request Timeout";
        case 411: return "Length Required";
        case 413: return "Payload Too Large";
        case 415: return "Unsupported Media Type";
        case 431: return "Request Header Fields Too Large";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        default:  return "Unknown";
    }
}

std::string Response::serialize(bool keepAlive) const {
    std::ostringstream response;
    response << "HTTP/1.1 " << status << " " << statusText(status) << "\r\n";
    if (!contentType.empty()) {
        response << "Content-Type: " << contentType << "\r\n";
    }
    response << "Content-Length: " << body.size() << "\r\n";
    response << "Access-Control-Allow-Origin: *\r\n";
    for (const auto& h : extraHeaders) {
        response << h.first << ": " << h.second << "\r\n";
    }
    response << "Connection: " << (keepAlive ? "keep-alive" : "close") << "\r\n\r\n";
    response << body;
    return response.str();
}

} // namespace http
} // namespace dropzone
