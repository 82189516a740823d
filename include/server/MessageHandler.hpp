#pragma once

#include <cstddef>
#include <string>
#include "http/Request.hpp"
#include "server/Connection.hpp"
#include "server/MessageRelay.hpp"

namespace dropzone {

class MessageHandler {
public:
    MessageHandler(MessageRelay& relay, std::size_t maxMessageSize);

    // Buffers the body, validates it as UTF-8 and relays the trimmed text
    http::Response handleMessage(const http::RequestHead& head, BodyReader& body, const std::string& client);

    /**
     * Message text from a multipart "message" field or a text/plain body.
     * @throws UnsupportedMediaTypeError, MalformedRequestError, EncodingError
     */
    static std::string extractText(const http::RequestHead& head, const std::string& body);

private:
    MessageRelay& relay_;
    std::size_t maxMessageSize_;
};

} // namespace dropzone
