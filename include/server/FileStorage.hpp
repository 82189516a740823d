#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <set>
#include <string>

namespace dropzone {

/**
 * A file that has been completely written and published under its final name.
 */
struct StoredFile {
    std::string name;                  // sanitized, de-duplicated public name
    std::filesystem::path path;        // absolute, always directly under the upload root
    std::uintmax_t size = 0;
    std::chrono::system_clock::time_point createdAt;
};

class FileStorage;

/**
 * One in-flight upload. Bytes go to a hidden staging file; the public name is
 * only reserved, never created, until FileStorage::finalize() succeeds.
 *
 * Destroying a session that was neither finalized nor aborted aborts it.
 */
class UploadSession {
public:
    // Only FileStorage can mint a Key, so only FileStorage creates sessions
    class Key {
        friend class FileStorage;
        Key() {}
    };

    UploadSession(Key,
                  FileStorage& storage,
                  uint64_t id,
                  std::string client,
                  std::string requestedName,
                  std::string safeName,
                  std::string reservedName,
                  std::filesystem::path stagingPath);
    ~UploadSession();

    UploadSession(const UploadSession&) = delete;
    UploadSession& operator=(const UploadSession&) = delete;

    uint64_t id() const { return id_; }
    const std::string& client() const { return client_; }
    const std::string& requestedName() const { return requestedName_; }
    const std::string& reservedName() const { return reservedName_; }
    const std::filesystem::path& stagingPath() const { return stagingPath_; }
    std::uintmax_t bytesWritten() const { return bytesWritten_; }
    bool isOpen() const { return open_; }

private:
    friend class FileStorage;

    FileStorage& storage_;
    uint64_t id_;
    std::string client_;
    std::string requestedName_;
    std::string safeName_;
    std::string reservedName_;
    std::filesystem::path stagingPath_;
    std::ofstream out_;
    std::uintmax_t bytesWritten_ = 0;
    bool open_ = true;
};

/**
 * Writes incoming uploads under a single upload root.
 *
 * Safe to share between connection threads. The only lock is the one
 * guarding name reservation; data writes go to per-session staging files.
 */
class FileStorage {
public:
    explicit FileStorage(const std::filesystem::path& root);

    // Sanitizes the name, reserves a collision-free public name and opens a staging file
    std::unique_ptr<UploadSession> beginUpload(const std::string& rawFilename,
                                               const std::string& client = "");

    // Appends to the staging file; throws IOError on failure
    void writeChunk(UploadSession& session, const char* data, std::size_t size);

    // Flushes and publishes the staging file under its public name
    StoredFile finalize(UploadSession& session);

    // Removes the staging file and releases the reserved name. Idempotent.
    void abort(UploadSession& session) noexcept;

    // Deletes staging files left behind by an earlier process. Call before serving.
    std::size_t removeStaleStagingFiles();

    const std::filesystem::path& root() const { return root_; }

    static bool isStagingName(const std::string& name);

private:
    std::filesystem::path root_;
    std::mutex reserveMutex_;
    std::set<std::string> reserved_;
    std::atomic<uint64_t> nextSessionId_{1};

    void ensureStorageDirectory() const;
    std::filesystem::path stagingPathFor(uint64_t id) const;
    std::filesystem::path publicPathFor(const std::string& name) const;

    // Both expect reserveMutex_ to be held
    bool isTakenLocked(const std::string& name) const;
    std::string reserveLocked(const std::string& safeName);

    void releaseName(const std::string& name);
    void reserveNext(UploadSession& session);
};

} // namespace dropzone
