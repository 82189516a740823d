#include "server/UploadHandler.hpp"
#include "http/MultipartParser.hpp"
#include "core/Errors.hpp"
#include "core/Log.hpp"
#include "config.hpp"

#include <memory>
#include <vector>
#include <nlohmann/json.hpp>

namespace dropzone {

UploadHandler::UploadHandler(FileStorage& storage, std::optional<uint64_t> maxBodySize)
    : storage_(storage), maxBodySize_(maxBodySize) {}

http::Response UploadHandler::handleUpload(const http::RequestHead& head, BodyReader& body, const std::string& client) {
    if (head.mediaType != "multipart/form-data") {
        throw UnsupportedMediaTypeError("Uploads must be sent as multipart/form-data");
    }

    std::string boundary = http::MultipartParser::extractBoundary(head.header("content-type"));
    if (boundary.empty()) {
        throw MalformedRequestError("Missing multipart boundary");
    }

    if (maxBodySize_ && head.contentLength > *maxBodySize_) {
        throw PayloadTooLargeError("Upload exceeds the " + std::to_string(*maxBodySize_) + " byte limit");
    }

    std::unique_ptr<UploadSession> session;
    std::vector<StoredFile> stored;

    http::MultipartParser::Callbacks callbacks;
    callbacks.onPartBegin = [&](const http::MultipartPart& part) {
        // Non-file fields and empty file inputs are skipped
        if (part.isFile()) {
            session = storage_.beginUpload(part.filename, client);
        }
    };
    callbacks.onData = [&](const char* data, size_t size) {
        if (session) storage_.writeChunk(*session, data, size);
    };
    callbacks.onPartEnd = [&]() {
        if (!session) return;
        const std::string from = session->client();
        StoredFile file = storage_.finalize(*session);
        session.reset();
        std::string text = file.name + " (" + std::to_string(file.size) + " bytes)";
        if (!from.empty()) text += " from " + from;
        Log::event("FILE", LogColor::Green, text);
        stored.push_back(std::move(file));
    };

    try {
        http::MultipartParser parser(boundary, std::move(callbacks));
        std::vector<char> chunk(READ_CHUNK_SIZE);
        while (!body.complete()) {
            size_t n = body.read(chunk.data(), chunk.size());
            parser.feed(chunk.data(), n);
        }
        parser.finish();
    } catch (const std::exception& e) {
        if (session) {
            Log::warn("Aborted upload of " + session->requestedName() + " from " + session->client() +
                      " after " + std::to_string(session->bytesWritten()) + " bytes: " + e.what());
            storage_.abort(*session);
        }
        throw;
    }

    nlohmann::json response;
    response["status"] = "ok";
    response["files"] = nlohmann::json::array();
    for (const auto& file : stored) {
        response["files"].push_back({
            {"name", file.name},
            {"size", file.size}
        });
    }
    return http::Response::ok(response);
}

} // namespace dropzone
