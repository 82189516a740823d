#pragma once
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <thread>
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include "server/Connection.hpp"
#include "server/RequestDispatcher.hpp"
#include "server/ServerConfig.hpp"

namespace dropzone {

/**
 * Listens on the configured port and runs each accepted connection on its
 * own thread, wrapping it in TLS first when a context is given.
 */
class dzServer
{
  struct Worker {
    std::shared_ptr<Connection> connection;
    std::thread thread;
    std::atomic<bool> finished{false};
  };

  boost::asio::io_context io_context_;
  boost::asio::ip::tcp::acceptor acceptor_;
  std::mutex acceptorMutex_;
  ServerConfig config_;
  RequestDispatcher& dispatcher_;
  std::shared_ptr<boost::asio::ssl::context> tls_;

  std::mutex workersMutex_;
  std::list<std::unique_ptr<Worker>> workers_;

  std::thread reaper_;
  std::mutex reaperMutex_;
  std::condition_variable reaperCv_;
  std::atomic<bool> stopping_{false};

public:
    dzServer(const ServerConfig& config,
             RequestDispatcher& dispatcher,
             std::shared_ptr<boost::asio::ssl::context> tls);
    virtual ~dzServer();

    dzServer(const dzServer&) = delete;
    dzServer& operator=(const dzServer&) = delete;

    // Binds and listens. Throws BindError.
    void listen();

    // Actual port, useful when configured with port 0
    uint16_t port() const;

    // Accept loop; returns after stop() once every connection has finished
    void run();

    // Safe from any thread, including a signal handler thread
    void stop();

    std::size_t activeConnections();

protected:
    // Starts the thread for one connection; throws std::system_error when none can be created
    virtual std::thread startThread(std::function<void()> task);

private:
    void spawn(std::shared_ptr<Connection> connection);
    void handleConnection(Worker& worker);
    void reapLoop();
    void cancelIdle();
    void joinFinished();
    void shutdownConnections();
};

} // namespace dropzone
