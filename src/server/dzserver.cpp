#include "server/dzserver.hpp"
#include "core/Errors.hpp"
#include "core/Log.hpp"
#include "config.hpp"

#include <chrono>
#include <system_error>
#include <sys/socket.h>

namespace dropzone {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

dzServer::dzServer(const ServerConfig& config,
                   RequestDispatcher& dispatcher,
                   std::shared_ptr<asio::ssl::context> tls)
    : acceptor_(io_context_), config_(config), dispatcher_(dispatcher), tls_(std::move(tls)) {}

dzServer::~dzServer()
{
    stop();
    if (reaper_.joinable()) reaper_.join();
    shutdownConnections();
}

void dzServer::listen()
{
    boost::system::error_code ec;
    asio::ip::address address = asio::ip::make_address(config_.bindAddress, ec);
    if (ec) {
        throw BindError("Invalid bind address " + config_.bindAddress + ": " + ec.message());
    }
    tcp::endpoint endpoint(address, config_.port);

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
        throw BindError("Cannot open listening socket: " + ec.message());
    }
    acceptor_.set_option(tcp::acceptor::reuse_address(true), ec);

    acceptor_.bind(endpoint, ec);
    if (ec == asio::error::address_in_use) {
        acceptor_.close();
        throw BindError("Port " + std::to_string(config_.port) + " is already in use");
    }
    if (ec == asio::error::access_denied) {
        acceptor_.close();
        throw BindError("Permission denied binding port " + std::to_string(config_.port));
    }
    if (ec) {
        acceptor_.close();
        throw BindError("Cannot bind port " + std::to_string(config_.port) + ": " + ec.message());
    }

    acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    if (ec) {
        acceptor_.close();
        throw BindError("Cannot listen on port " + std::to_string(config_.port) + ": " + ec.message());
    }
}

uint16_t dzServer::port() const
{
    boost::system::error_code ec;
    tcp::endpoint local = acceptor_.local_endpoint(ec);
    return ec ? config_.port : local.port();
}

void dzServer::run()
{
    if (!acceptor_.is_open()) listen();
    reaper_ = std::thread(&dzServer::reapLoop, this);

    while (!stopping_.load())
    {
        tcp::socket socket(io_context_);
        boost::system::error_code ec;
        acceptor_.accept(socket, ec);

        if (stopping_.load()) break;
        if (ec) {
            Log::warn("Accept failed: " + ec.message());
            if (ec == asio::error::no_descriptors || ec == asio::error::no_buffer_space) {
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
            continue;
        }

        std::string peer = "unknown";
        tcp::endpoint remote = socket.remote_endpoint(ec);
        if (!ec) peer = remote.address().to_string();

        std::shared_ptr<Connection> connection;
        if (tls_) {
            connection = std::make_shared<TlsConnection>(std::move(socket), *tls_, peer);
        } else {
            connection = std::make_shared<PlainConnection>(std::move(socket), peer);
        }
        spawn(std::move(connection));
        joinFinished();
    }

    reaperCv_.notify_all();
    if (reaper_.joinable()) reaper_.join();
    shutdownConnections();

    std::lock_guard<std::mutex> lock(acceptorMutex_);
    boost::system::error_code ec;
    acceptor_.close(ec);
}

void dzServer::stop()
{
    bool expected = false;
    if (!stopping_.compare_exchange_strong(expected, true)) return;

    // Taking the lock orders the flag with a reaper that is about to wait
    {
        std::lock_guard<std::mutex> lock(reaperMutex_);
    }
    reaperCv_.notify_all();

    // Wakes a thread blocked in accept(); the acceptor itself is closed by run()
    std::lock_guard<std::mutex> lock(acceptorMutex_);
    if (acceptor_.is_open()) {
        ::shutdown(acceptor_.native_handle(), SHUT_RDWR);
    }
}

std::size_t dzServer::activeConnections()
{
    std::lock_guard<std::mutex> lock(workersMutex_);
    std::size_t count = 0;
    for (const auto& worker : workers_) {
        if (!worker->finished.load()) ++count;
    }
    return count;
}

void dzServer::spawn(std::shared_ptr<Connection> connection)
{
    std::lock_guard<std::mutex> lock(workersMutex_);
    workers_.push_back(std::make_unique<Worker>());
    Worker& worker = *workers_.back();
    worker.connection = connection;
    try {
        worker.thread = startThread([this, &worker] { handleConnection(worker); });
    } catch (const std::system_error& e) {
        // Out of threads: drop this client and keep accepting
        workers_.pop_back();
        Log::warn("Cannot start a thread for " + connection->peer() + ": " + e.what());
        connection->close();
    }
}

std::thread dzServer::startThread(std::function<void()> task)
{
    return std::thread(std::move(task));
}

void dzServer::handleConnection(Worker& worker)
{
    Connection& conn = *worker.connection;

    bool ready = true;
    try {
        conn.handshake();
    } catch (const ConnectionError& e) {
        Log::warn("TLS handshake with " + conn.peer() + " failed: " + e.what());
        ready = false;
    }

    if (ready) {
        try {
            dispatcher_.serve(conn);
        } catch (const ConnectionError& e) {
            Log::warn("Connection from " + conn.peer() + " dropped: " + e.what());
        } catch (const std::exception& e) {
            Log::error("Connection from " + conn.peer() + " failed: " + e.what());
        }
    }

    conn.close();
    worker.finished.store(true);
}

void dzServer::reapLoop()
{
    std::unique_lock<std::mutex> lock(reaperMutex_);
    while (!stopping_.load()) {
        reaperCv_.wait_for(lock, std::chrono::milliseconds(REAPER_INTERVAL_MS),
                           [this] { return stopping_.load(); });
        if (stopping_.load()) break;
        cancelIdle();
        joinFinished();
    }
}

void dzServer::cancelIdle()
{
    auto now = std::chrono::steady_clock::now();
    std::lock_guard<std::mutex> lock(workersMutex_);
    for (const auto& worker : workers_) {
        if (worker->finished.load() || worker->connection->isCancelled()) continue;
        if (now - worker->connection->lastActivity() > config_.idleTimeout) {
            worker->connection->cancel("idle for more than " + std::to_string(config_.idleTimeout.count()) + "s");
        }
    }
}

void dzServer::joinFinished()
{
    std::lock_guard<std::mutex> lock(workersMutex_);
    for (auto it = workers_.begin(); it != workers_.end();) {
        if ((*it)->finished.load()) {
            if ((*it)->thread.joinable()) (*it)->thread.join();
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

void dzServer::shutdownConnections()
{
    std::lock_guard<std::mutex> lock(workersMutex_);
    for (const auto& worker : workers_) {
        worker->connection->cancel("server shutting down");
    }
    for (const auto& worker : workers_) {
        if (worker->thread.joinable()) worker->thread.join();
    }
    workers_.clear();
}

} // namespace dropzone
