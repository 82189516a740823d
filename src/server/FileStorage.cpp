#include "server/FileStorage.hpp"
#include "core/Errors.hpp"
#include "core/FilenamePolicy.hpp"
#include "core/Log.hpp"
#include "config.hpp"

#include <cerrno>
#include <cstring>
#include <ios>
#include <system_error>
#include <unistd.h>

namespace dropzone {

namespace fs = std::filesystem;

namespace {

const std::string STAGING_PREFIX = ".dz-";
const std::string STAGING_SUFFIX = ".part";

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool linkUnsupported(const std::error_code& ec) {
    return ec == std::errc::operation_not_supported ||
           ec == std::errc::function_not_supported ||
           ec == std::errc::operation_not_permitted ||
           ec == std::errc::too_many_links;
}

// errno is cleared before each stream call, so a non-zero value belongs to that call
std::string streamFailure(const std::ios& stream, int err) {
    std::string state = stream.bad() ? "stream error" : "stream failure";
    if (err == 0) return state;
    return state + ": " + std::strerror(err);
}

} // namespace

UploadSession::UploadSession(Key,
                             FileStorage& storage,
                             uint64_t id,
                             std::string client,
                             std::string requestedName,
                             std::string safeName,
                             std::string reservedName,
                             fs::path stagingPath)
    : storage_(storage),
      id_(id),
      client_(std::move(client)),
      requestedName_(std::move(requestedName)),
      safeName_(std::move(safeName)),
      reservedName_(std::move(reservedName)),
      stagingPath_(std::move(stagingPath)) {}

UploadSession::~UploadSession() {
    if (open_) {
        storage_.abort(*this);
    }
}

FileStorage::FileStorage(const fs::path& root) {
    std::error_code ec;
    fs::path absolute = fs::absolute(root, ec);
    if (ec) {
        throw IOError("Cannot resolve upload directory " + root.string() + ": " + ec.message());
    }
    root_ = absolute;
    ensureStorageDirectory();
    root_ = fs::weakly_canonical(root_, ec);
    if (ec) {
        throw IOError("Cannot resolve upload directory " + absolute.string() + ": " + ec.message());
    }
}

void FileStorage::ensureStorageDirectory() const {
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec) {
        throw IOError("Cannot create upload directory " + root_.string() + ": " + ec.message());
    }
    if (!fs::is_directory(root_, ec)) {
        throw IOError("Upload path is not a directory: " + root_.string());
    }
}

bool FileStorage::isStagingName(const std::string& name) {
    return name.rfind(STAGING_PREFIX, 0) == 0 && endsWith(name, STAGING_SUFFIX);
}

fs::path FileStorage::stagingPathFor(uint64_t id) const {
    return root_ / (STAGING_PREFIX + std::to_string(::getpid()) + "-" + std::to_string(id) + STAGING_SUFFIX);
}

fs::path FileStorage::publicPathFor(const std::string& name) const {
    fs::path candidate = root_ / name;
    // A sanitized name is a single component; anything else is a bug upstream
    if (candidate.parent_path() != root_ || candidate.filename() != fs::path(name)) {
        throw IOError("Refusing to store outside the upload root: " + name);
    }
    return candidate;
}

bool FileStorage::isTakenLocked(const std::string& name) const {
    if (reserved_.count(name) != 0) return true;
    std::error_code ec;
    fs::file_status st = fs::symlink_status(root_ / name, ec);
    return fs::exists(st);
}

std::string FileStorage::reserveLocked(const std::string& safeName) {
    std::string name = FilenamePolicy::resolveCollision(safeName, [this](const std::string& candidate) {
        return isTakenLocked(candidate);
    });
    reserved_.insert(name);
    return name;
}

void FileStorage::releaseName(const std::string& name) {
    std::lock_guard<std::mutex> lock(reserveMutex_);
    reserved_.erase(name);
}

void FileStorage::reserveNext(UploadSession& session) {
    std::lock_guard<std::mutex> lock(reserveMutex_);
    reserved_.erase(session.reservedName_);
    session.reservedName_ = reserveLocked(session.safeName_);
}

std::unique_ptr<UploadSession> FileStorage::beginUpload(const std::string& rawFilename,
                                                        const std::string& client) {
    std::string safeName = FilenamePolicy::sanitize(rawFilename);
    uint64_t id = nextSessionId_.fetch_add(1);

    std::string reservedName;
    {
        std::lock_guard<std::mutex> lock(reserveMutex_);
        reservedName = reserveLocked(safeName);
    }

    auto session = std::make_unique<UploadSession>(
        UploadSession::Key(), *this, id, client, rawFilename, safeName, reservedName, stagingPathFor(id));

    errno = 0;
    session->out_.open(session->stagingPath_, std::ios::binary | std::ios::trunc);
    if (!session->out_) {
        // session's destructor releases the reservation
        throw IOError("Failed to create staging file for " + reservedName + " (" + streamFailure(session->out_, errno) + ")");
    }
    return session;
}

void FileStorage::writeChunk(UploadSession& session, const char* data, std::size_t size) {
    if (!session.open_) {
        throw IOError("Upload session " + std::to_string(session.id_) + " is closed");
    }
    if (size == 0) return;

    errno = 0;
    session.out_.write(data, static_cast<std::streamsize>(size));
    if (!session.out_) {
        throw IOError("Failed to write " + session.reservedName_ + " (" + streamFailure(session.out_, errno) + ")");
    }
    session.bytesWritten_ += size;
}

StoredFile FileStorage::finalize(UploadSession& session) {
    if (!session.open_) {
        throw IOError("Upload session " + std::to_string(session.id_) + " is closed");
    }

    errno = 0;
    session.out_.flush();
    if (!session.out_) {
        throw IOError("Failed to flush " + session.reservedName_ + " (" + streamFailure(session.out_, errno) + ")");
    }
    errno = 0;
    session.out_.close();
    if (session.out_.fail()) {
        throw IOError("Failed to close " + session.reservedName_ + " (" + streamFailure(session.out_, errno) + ")");
    }

    fs::path finalPath;
    bool published = false;
    for (int attempt = 0; attempt < MAX_PUBLISH_ATTEMPTS && !published; ++attempt) {
        finalPath = publicPathFor(session.reservedName_);

        // A hard link never replaces an existing file
        std::error_code ec;
        fs::create_hard_link(session.stagingPath_, finalPath, ec);
        if (!ec) {
            published = true;
            break;
        }
        if (ec == std::errc::file_exists) {
            reserveNext(session);
            continue;
        }
        if (!linkUnsupported(ec)) {
            throw IOError("Failed to publish " + session.reservedName_ + ": " + ec.message());
        }

        // No hard links on this filesystem: rename while holding the reservation lock
        std::lock_guard<std::mutex> lock(reserveMutex_);
        std::error_code statEc;
        if (fs::exists(fs::symlink_status(finalPath, statEc))) {
            reserved_.erase(session.reservedName_);
            session.reservedName_ = reserveLocked(session.safeName_);
            continue;
        }
        fs::rename(session.stagingPath_, finalPath, ec);
        if (ec) {
            throw IOError("Failed to publish " + session.reservedName_ + ": " + ec.message());
        }
        published = true;
    }

    if (!published) {
        throw IOError("Gave up publishing " + session.safeName_ + " after repeated name collisions");
    }

    std::error_code ec;
    fs::remove(session.stagingPath_, ec);
    if (ec) {
        Log::warn("Could not remove staging file " + session.stagingPath_.filename().string() + ": " + ec.message());
    }

    StoredFile stored;
    stored.name = session.reservedName_;
    stored.path = finalPath;
    stored.size = session.bytesWritten_;
    stored.createdAt = std::chrono::system_clock::now();

    session.open_ = false;
    releaseName(session.reservedName_);
    return stored;
}

void FileStorage::abort(UploadSession& session) noexcept {
    if (!session.open_) return;
    session.open_ = false;

    if (session.out_.is_open()) {
        session.out_.close();
    }

    std::error_code ec;
    fs::remove(session.stagingPath_, ec);
    if (ec) {
        Log::warn("Could not remove staging file " + session.stagingPath_.filename().string() + ": " + ec.message());
    }
    releaseName(session.reservedName_);
}

std::size_t FileStorage::removeStaleStagingFiles() {
    const std::string ownPrefix = STAGING_PREFIX + std::to_string(::getpid()) + "-";
    std::size_t removed = 0;

    std::error_code ec;
    fs::directory_iterator it(root_, ec);
    if (ec) {
        Log::warn("Cannot scan " + root_.string() + " for staging files: " + ec.message());
        return 0;
    }
    for (const auto& entry : it) {
        std::string name = entry.path().filename().string();
        if (!isStagingName(name) || name.rfind(ownPrefix, 0) == 0) continue;

        std::error_code rmEc;
        if (fs::remove(entry.path(), rmEc)) {
            ++removed;
        } else if (rmEc) {
            Log::warn("Could not remove stale staging file " + name + ": " + rmEc.message());
        }
    }
    return removed;
}

} // namespace dropzone
