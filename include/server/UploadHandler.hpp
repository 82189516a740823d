#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include "http/Request.hpp"
#include "server/Connection.hpp"
#include "server/FileStorage.hpp"

namespace dropzone {

class UploadHandler {
public:
    UploadHandler(FileStorage& storage, std::optional<uint64_t> maxBodySize);

    /**
     * Stream every file part of a multipart/form-data body into storage.
     * Returns a JSON confirmation listing the stored names and sizes.
     *
     * A failure aborts the file being received; files already finalized
     * earlier in the same request stay stored.
     */
    http::Response handleUpload(const http::RequestHead& head, BodyReader& body, const std::string& client);

private:
    FileStorage& storage_;
    std::optional<uint64_t> maxBodySize_;
};

} // namespace dropzone
