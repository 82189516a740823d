#include "server/Connection.hpp"
#include "core/Errors.hpp"
#include "config.hpp"

#include <algorithm>
#include <vector>
#include <sys/socket.h>

namespace dropzone {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

Connection::Connection(std::string peer)
    : peer_(std::move(peer)),
      lastActivity_(std::chrono::steady_clock::now().time_since_epoch().count()) {}

void Connection::touch() {
    lastActivity_.store(std::chrono::steady_clock::now().time_since_epoch().count());
}

std::chrono::steady_clock::time_point Connection::lastActivity() const {
    return std::chrono::steady_clock::time_point(std::chrono::steady_clock::duration(lastActivity_.load()));
}

void Connection::fail(const std::string& what, const boost::system::error_code& ec) {
    if (cancelled_.load()) {
        std::lock_guard<std::mutex> lock(closeMutex_);
        throw ConnectionError(what + " cancelled: " + cancelReason_);
    }
    throw ConnectionError(what + " failed: " + ec.message());
}

std::size_t Connection::readSome(char* buffer, std::size_t size) {
    boost::system::error_code ec;
    std::size_t n = doReadSome(buffer, size, ec);
    if (ec == asio::error::eof || ec == asio::ssl::error::stream_truncated) {
        if (cancelled_.load()) fail("read", ec);
        return 0;
    }
    if (ec) fail("read", ec);
    touch();
    return n;
}

void Connection::writeAll(const std::string& data) {
    boost::system::error_code ec;
    doWrite(data.data(), data.size(), ec);
    if (ec) fail("write", ec);
    touch();
}

void Connection::close() {
    std::lock_guard<std::mutex> lock(closeMutex_);
    if (closed_) return;
    closed_ = true;

    boost::system::error_code ec;
    tcpSocket().shutdown(tcp::socket::shutdown_both, ec);
    tcpSocket().close(ec);
}

void Connection::cancel(const std::string& reason) {
    std::lock_guard<std::mutex> lock(closeMutex_);
    if (closed_ || cancelled_.load()) return;
    cancelReason_ = reason;
    cancelled_.store(true);
    // Only the fd is touched here; the socket object stays with its owning thread
    ::shutdown(tcpSocket().native_handle(), SHUT_RDWR);
}

PlainConnection::PlainConnection(tcp::socket socket, std::string peer)
    : Connection(std::move(peer)), socket_(std::move(socket)) {}

std::size_t PlainConnection::doReadSome(char* buffer, std::size_t size, boost::system::error_code& ec) {
    return socket_.read_some(asio::buffer(buffer, size), ec);
}

void PlainConnection::doWrite(const char* data, std::size_t size, boost::system::error_code& ec) {
    asio::write(socket_, asio::buffer(data, size), ec);
}

TlsConnection::TlsConnection(tcp::socket socket, asio::ssl::context& context, std::string peer)
    : Connection(std::move(peer)), stream_(std::move(socket), context) {}

void TlsConnection::handshake() {
    boost::system::error_code ec;
    stream_.handshake(asio::ssl::stream_base::server, ec);
    if (ec) fail("TLS handshake", ec);
    touch();
}

std::size_t TlsConnection::doReadSome(char* buffer, std::size_t size, boost::system::error_code& ec) {
    return stream_.read_some(asio::buffer(buffer, size), ec);
}

void TlsConnection::doWrite(const char* data, std::size_t size, boost::system::error_code& ec) {
    asio::write(stream_, asio::buffer(data, size), ec);
}

BodyReader::BodyReader(Connection& conn, std::string& buffer, std::size_t contentLength)
    : conn_(conn), buffer_(buffer), remaining_(contentLength) {}

std::size_t BodyReader::read(char* out, std::size_t max) {
    if (remaining_ == 0 || max == 0) return 0;
    std::size_t want = std::min(max, remaining_);

    if (!buffer_.empty()) {
        std::size_t n = std::min(want, buffer_.size());
        std::copy(buffer_.data(), buffer_.data() + n, out);
        buffer_.erase(0, n);
        remaining_ -= n;
        return n;
    }

    std::size_t n = conn_.readSome(out, want);
    if (n == 0) {
        throw ConnectionError("client closed the connection with " + std::to_string(remaining_) +
                              " body bytes outstanding");
    }
    remaining_ -= n;
    return n;
}

std::string BodyReader::readAll(std::size_t limit) {
    if (remaining_ > limit) {
        throw PayloadTooLargeError("Body exceeds " + std::to_string(limit) + " bytes");
    }
    std::string body;
    body.reserve(remaining_);
    std::vector<char> chunk(std::min<std::size_t>(READ_CHUNK_SIZE, std::max<std::size_t>(remaining_, 1)));
    while (remaining_ > 0) {
        std::size_t n = read(chunk.data(), chunk.size());
        body.append(chunk.data(), n);
    }
    return body;
}

bool BodyReader::discardRemaining(std::size_t limit) {
    if (remaining_ > limit) return false;
    std::vector<char> chunk(std::max<std::size_t>(remaining_, 1));
    while (remaining_ > 0) {
        read(chunk.data(), chunk.size());
    }
    return true;
}

} // namespace dropzone
