#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>

namespace dropzone {

/**
 * One accepted client connection, plain TCP or TLS.
 *
 * Reads and writes belong to the connection's own thread. cancel() may be
 * called from any thread and makes blocked reads and writes fail.
 */
class Connection {
public:
    explicit Connection(std::string peer);
    virtual ~Connection() = default;

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // TLS server handshake; no-op for plain connections. Throws ConnectionError.
    virtual void handshake() {}

    // Returns 0 on orderly end of stream, throws ConnectionError otherwise
    std::size_t readSome(char* buffer, std::size_t size);
    void writeAll(const std::string& data);

    void close();
    void cancel(const std::string& reason);

    const std::string& peer() const { return peer_; }
    std::chrono::steady_clock::time_point lastActivity() const;
    bool isCancelled() const { return cancelled_.load(); }

protected:
    virtual std::size_t doReadSome(char* buffer, std::size_t size, boost::system::error_code& ec) = 0;
    virtual void doWrite(const char* data, std::size_t size, boost::system::error_code& ec) = 0;
    virtual boost::asio::ip::tcp::socket& tcpSocket() = 0;

    void touch();
    [[noreturn]] void fail(const std::string& what, const boost::system::error_code& ec);

private:
    std::string peer_;
    std::atomic<std::chrono::steady_clock::rep> lastActivity_;
    std::mutex closeMutex_;
    bool closed_ = false;
    std::atomic<bool> cancelled_{false};
    std::string cancelReason_;
};

class PlainConnection final : public Connection {
public:
    explicit PlainConnection(boost::asio::ip::tcp::socket socket, std::string peer);

protected:
    std::size_t doReadSome(char* buffer, std::size_t size, boost::system::error_code& ec) override;
    void doWrite(const char* data, std::size_t size, boost::system::error_code& ec) override;
    boost::asio::ip::tcp::socket& tcpSocket() override { return socket_; }

private:
    boost::asio::ip::tcp::socket socket_;
};

class TlsConnection final : public Connection {
public:
    TlsConnection(boost::asio::ip::tcp::socket socket, boost::asio::ssl::context& context, std::string peer);

    void handshake() override;

protected:
    std::size_t doReadSome(char* buffer, std::size_t size, boost::system::error_code& ec) override;
    void doWrite(const char* data, std::size_t size, boost::system::error_code& ec) override;
    boost::asio::ip::tcp::socket& tcpSocket() override { return stream_.next_layer(); }

private:
    boost::asio::ssl::stream<boost::asio::ip::tcp::socket> stream_;
};

/**
 * Reads exactly one request body (Content-Length bytes) from a connection.
 *
 * Bytes already buffered while reading the head are consumed first. Bytes
 * past the body stay in the buffer for the next request on the connection.
 */
class BodyReader {
public:
    BodyReader(Connection& conn, std::string& buffer, std::size_t contentLength);

    // Up to max bytes; 0 once the body is complete. Throws ConnectionError on early EOF.
    std::size_t read(char* out, std::size_t max);

    // Whole body as a string; throws PayloadTooLargeError when longer than limit
    std::string readAll(std::size_t limit);

    // Reads and drops what is left if it is at most limit bytes
    bool discardRemaining(std::size_t limit);

    std::size_t remaining() const { return remaining_; }
    bool complete() const { return remaining_ == 0; }

private:
    Connection& conn_;
    std::string& buffer_;
    std::size_t remaining_;
};

} // namespace dropzone
