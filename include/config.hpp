#pragma once

#include <cstddef>
#include <cstdint>

namespace dropzone {

constexpr uint16_t DEFAULT_PORT = 8080;
constexpr const char* UPLOAD_DIR_NAME = "dropzone-uploads";
constexpr const char* DEFAULT_CERT_FILE = "cert.crt";
constexpr const char* DEFAULT_KEY_FILE = "cert.key";

constexpr const char* ENV_CERT_PATH = "DROPZONE_CERT_PATH";
constexpr const char* ENV_CERT_KEY_PATH = "DROPZONE_CERT_KEY_PATH";
constexpr const char* ENV_MAX_BODY_SIZE = "DROPZONE_MAX_BODY_SIZE";

constexpr std::size_t MAX_MESSAGE_SIZE = 64 * 1024;
constexpr std::size_t MAX_REQUEST_HEAD_SIZE = 16 * 1024;
constexpr std::size_t MAX_PART_HEADER_SIZE = 8 * 1024;
constexpr std::size_t READ_CHUNK_SIZE = 64 * 1024;

// Leftover body bytes we are willing to read and throw away to keep a
// connection alive after an early response.
constexpr std::size_t MAX_DRAIN_SIZE = 64 * 1024;

constexpr int IDLE_TIMEOUT_SECONDS = 60;
constexpr int REAPER_INTERVAL_MS = 1000;

constexpr std::size_t MAX_FILENAME_BYTES = 255;
constexpr int MAX_PUBLISH_ATTEMPTS = 32;

} // namespace dropzone
