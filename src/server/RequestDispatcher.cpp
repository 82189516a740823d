#include "server/RequestDispatcher.hpp"
#include "server/StaticAssets.hpp"
#include "http/RequestParser.hpp"
#include "core/Errors.hpp"
#include "core/Log.hpp"
#include "config.hpp"

namespace dropzone {

RequestDispatcher::RequestDispatcher(UploadHandler& uploads, MessageHandler& messages)
    : uploads_(uploads), messages_(messages) {
    add_endpoint(endpoint(RequestKind::StaticAsset, HttpRequest::GET, "/"));
    add_endpoint(endpoint(RequestKind::StaticAsset, HttpRequest::GET, "/index.html"));
    add_endpoint(endpoint(RequestKind::StaticAsset, HttpRequest::GET, "/favicon.svg"));
    add_endpoint(endpoint(RequestKind::Upload, HttpRequest::POST, "/upload"));
    add_endpoint(endpoint(RequestKind::Message, HttpRequest::POST, "/message"));
}

void RequestDispatcher::add_endpoint(const endpoint& ep) {
    handlers_.insert_or_assign(ep.get_path(), ep);
}

Route RequestDispatcher::classify(const http::RequestHead& head) const {
    auto it = handlers_.find(head.path);
    if (it == handlers_.end()) {
        return {RequestKind::Unrecognized, 404};
    }
    if (head.method == HttpRequest::OPTIONS) {
        return {RequestKind::Preflight};
    }
    if (head.method != it->second.get_rest_type()) {
        return {RequestKind::Unrecognized, 405};
    }
    return {it->second.get_kind()};
}

http::Response RequestDispatcher::preflight() {
    http::Response response = http::Response::noContent();
    response.extraHeaders.emplace_back("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
    response.extraHeaders.emplace_back("Access-Control-Allow-Headers", "*");
    response.extraHeaders.emplace_back("Access-Control-Max-Age", "86400");
    return response;
}

http::Response RequestDispatcher::handle(const http::RequestHead& head, BodyReader& body, const std::string& client) {
    Route route = classify(head);

    bool hasBody = route.kind == RequestKind::Upload || route.kind == RequestKind::Message;
    if (hasBody && !head.hasContentLength) {
        throw LengthRequiredError("Content-Length is required");
    }

    switch (route.kind) {
        case RequestKind::Upload:
            return uploads_.handleUpload(head, body, client);

        case RequestKind::Message:
            return messages_.handleMessage(head, body, client);

        case RequestKind::StaticAsset: {
            auto asset = StaticAssets::find(head.path);
            if (!asset) return http::Response::notFound();
            return http::Response::content(asset->contentType, *asset->body);
        }

        case RequestKind::Preflight:
            return preflight();

        case RequestKind::Unrecognized:
            if (route.rejectStatus == 405) {
                http::Response response = http::Response::methodNotAllowed();
                auto it = handlers_.find(head.path);
                if (it != handlers_.end()) {
                    response.extraHeaders.emplace_back("Allow", std::string(to_string(it->second.get_rest_type())) + ", OPTIONS");
                }
                return response;
            }
            return http::Response::notFound();
    }
    return http::Response::notFound();
}

bool RequestDispatcher::readHead(Connection& conn, std::string& buffer, std::string& head) {
    char chunk[4096];
    while (true) {
        // Stray CRLFs between requests are allowed
        while (buffer.size() >= 2 && buffer.compare(0, 2, "\r\n") == 0) buffer.erase(0, 2);

        size_t end = buffer.find("\r\n\r\n");
        if (end != std::string::npos) {
            if (end > MAX_REQUEST_HEAD_SIZE) {
                throw RequestError(431, "Request head too large");
            }
            head = buffer.substr(0, end);
            buffer.erase(0, end + 4);
            return true;
        }
        if (buffer.size() > MAX_REQUEST_HEAD_SIZE) {
            throw RequestError(431, "Request head too large");
        }

        size_t n;
        try {
            n = conn.readSome(chunk, sizeof(chunk));
        } catch (const ConnectionError&) {
            // An idle keep-alive connection being reaped is not an error
            if (buffer.empty() && conn.isCancelled()) return false;
            throw;
        }
        if (n == 0) {
            if (buffer.empty()) return false;
            throw ConnectionError("client closed the connection in the middle of a request head");
        }
        buffer.append(chunk, n);
    }
}

void RequestDispatcher::serve(Connection& conn) {
    std::string buffer;

    while (true) {
        std::string headText;
        http::RequestHead head;
        try {
            if (!readHead(conn, buffer, headText)) return;
            head = http::RequestParser::parse(headText);
        } catch (const RequestError& e) {
            Log::warn("Malformed request from " + conn.peer() + ": " + e.what());
            conn.writeAll(http::Response::error(e.status(), e.what()).serialize(false));
            return;
        }

        const std::string label = head.methodText + " " + head.path;
        BodyReader body(conn, buffer, head.hasContentLength ? head.contentLength : 0);
        http::Response response;

        // HTTP/1.1 clients waiting on "Expect: 100-continue" get the go-ahead
        // only for routes that read a body
        if (head.expectContinue && head.version == "HTTP/1.1" &&
            head.hasContentLength && head.contentLength > 0) {
            RequestKind kind = classify(head).kind;
            if (kind == RequestKind::Upload || kind == RequestKind::Message) {
                conn.writeAll("HTTP/1.1 100 Continue\r\n\r\n");
            }
        }

        try {
            response = handle(head, body, conn.peer());
        } catch (const ConnectionError&) {
            throw;
        } catch (const RequestError& e) {
            Log::warn(conn.peer() + " " + label + " rejected: " + e.what());
            response = http::Response::error(e.status(), e.what());
            // Body framing can no longer be trusted, so the rest of the stream is dropped
            if (dynamic_cast<const MalformedRequestError*>(&e) != nullptr ||
                dynamic_cast<const EncodingError*>(&e) != nullptr ||
                dynamic_cast<const LengthRequiredError*>(&e) != nullptr) {
                response.closeConnection = true;
            }
        } catch (const IOError& e) {
            Log::error("Storage failure for " + conn.peer() + " " + label + ": " + e.what());
            response = http::Response::serverError("The file could not be stored");
            response.closeConnection = true;
        } catch (const std::exception& e) {
            Log::error("Unexpected failure for " + conn.peer() + " " + label + ": " + e.what());
            response = http::Response::serverError("Internal server error");
            response.closeConnection = true;
        }

        bool keepAlive = head.keepAlive && !response.closeConnection;
        if (!body.complete() && !body.discardRemaining(MAX_DRAIN_SIZE)) {
            keepAlive = false;
        }

        conn.writeAll(response.serialize(keepAlive));
        if (!keepAlive) return;
    }
}

} // namespace dropzone
