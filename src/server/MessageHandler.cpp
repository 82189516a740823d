#include "server/MessageHandler.hpp"
#include "http/HeaderValue.hpp"
#include "http/MultipartParser.hpp"
#include "core/Errors.hpp"
#include "config.hpp"

#include <nlohmann/json.hpp>

namespace dropzone {

MessageHandler::MessageHandler(MessageRelay& relay, std::size_t maxMessageSize)
    : relay_(relay), maxMessageSize_(maxMessageSize) {}

std::string MessageHandler::extractText(const http::RequestHead& head, const std::string& body) {
    std::string text;

    if (head.mediaType == "multipart/form-data") {
        std::string boundary = http::MultipartParser::extractBoundary(head.header("content-type"));
        if (boundary.empty()) {
            throw MalformedRequestError("Missing multipart boundary");
        }
        bool found = false;
        for (const auto& part : http::MultipartParser::parse(body, boundary)) {
            if (part.name == "message" && !part.isFile()) {
                text = part.dataAsString();
                found = true;
                break;
            }
        }
        if (!found) {
            throw MalformedRequestError("Missing 'message' field");
        }
    } else if (head.mediaType == "text/plain") {
        text = body;
    } else {
        throw UnsupportedMediaTypeError("Messages must be multipart/form-data or text/plain");
    }

    if (!http::isValidUtf8(text)) {
        throw EncodingError("Message is not valid UTF-8");
    }
    return text;
}

http::Response MessageHandler::handleMessage(const http::RequestHead& head, BodyReader& body, const std::string& client) {
    // Room for the multipart framing around the text itself
    std::string raw = body.readAll(maxMessageSize_ + MAX_PART_HEADER_SIZE);

    std::string text = extractText(head, raw);
    if (text.size() > maxMessageSize_) {
        throw PayloadTooLargeError("Message exceeds " + std::to_string(maxMessageSize_) + " bytes");
    }

    size_t start = text.find_first_not_of(" \t\r\n");
    size_t end = text.find_last_not_of(" \t\r\n");
    text = start == std::string::npos ? std::string() : text.substr(start, end - start + 1);

    nlohmann::json response;
    response["status"] = "ok";
    response["delivered"] = !text.empty();

    if (!text.empty()) {
        Message message;
        message.text = text;
        message.sender = client;
        relay_.deliver(message);
    }
    return http::Response::ok(response);
}

} // namespace dropzone
