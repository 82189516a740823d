#pragma once

#include <string>
#include <unordered_map>
#include "const/rest_enums.hpp"
#include "http/Request.hpp"
#include "server/Connection.hpp"
#include "server/MessageHandler.hpp"
#include "server/UploadHandler.hpp"
#include "server/endpoint.hpp"

namespace dropzone {

struct Route {
    RequestKind kind;
    int rejectStatus = 0;  // 404 or 405 for Unrecognized
};

/**
 * Runs the HTTP exchange on one connection: read head, classify, stream or
 * buffer the body, answer, then keep the connection alive or close it.
 */
class RequestDispatcher {
public:
    RequestDispatcher(UploadHandler& uploads, MessageHandler& messages);

    void add_endpoint(const endpoint& ep);

    // Returns when the client closes or the exchange cannot continue.
    // Throws ConnectionError when the peer vanishes mid-request.
    void serve(Connection& conn);

    Route classify(const http::RequestHead& head) const;

    http::Response handle(const http::RequestHead& head, BodyReader& body, const std::string& client);

private:
    UploadHandler& uploads_;
    MessageHandler& messages_;
    std::unordered_map<std::string, endpoint> handlers_;

    static bool readHead(Connection& conn, std::string& buffer, std::string& head);
    static http::Response preflight();
};

} // namespace dropzone
