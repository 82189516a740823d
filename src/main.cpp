#include <iostream>
#include <string>    
#include <boost/asio.hpp>
#include <csignal>
#include <filesystem>
#include <memory>
#include <thread>
#include <vector>

#include "config.hpp"
#include "core/Errors.hpp"
#include "core/Log.hpp"
#include "server/FileStorage.hpp"
#include "server/MessageHandler.hpp"
#include "server/MessageRelay.hpp"
#include "server/NetworkIdentity.hpp"
#include "server/RequestDispatcher.hpp"
#include "server/ServerConfig.hpp"
#include "server/TlsContext.hpp"
#include "server/UploadHandler.hpp"
#include "server/dzserver.hpp"

using namespace dropzone;

static void print_usage()
{
    std::cerr << "Usage: dropzone [port] [--no-tls] [--flat]\n"
              << "  port       listen port (default " << DEFAULT_PORT << ")\n"
              << "  --no-tls   serve plain HTTP\n"
              << "  --flat     store uploads in the current directory\n"
              << "Environment: " << ENV_CERT_PATH << ", " << ENV_CERT_KEY_PATH
              << ", " << ENV_MAX_BODY_SIZE << std::endl;
}

static void print_banner(const ServerConfig& config, uint16_t port, const std::filesystem::path& upload_dir)
{
    const std::string scheme = config.scheme();

    std::cout << Log::paint("╔══════════════════════════════════╗", LogColor::Purple) << "\n";
    std::cout << Log::paint("║             DropZone             ║", LogColor::Purple) << "\n";
    std::cout << Log::paint("╚══════════════════════════════════╝", LogColor::Purple) << "\n";

    if (!config.tlsEnabled) {
        std::cout << Log::paint("Running in insecure mode", LogColor::Yellow, true) << "\n";
    }

    std::cout << "  " << Log::paint("Local:", LogColor::None, true) << "   "
              << NetworkIdentity::urlFor(scheme, "localhost", port) << "\n";
    for (const auto& address : NetworkIdentity::discoverLanAddresses()) {
        std::cout << "  " << Log::paint("Network:", LogColor::None, true) << " "
                  << NetworkIdentity::urlFor(scheme, address, port) << "\n";
    }
    std::cout << "  " << Log::paint("Uploads:", LogColor::None, true) << " " << upload_dir.string() << "\n";
    if (config.maxBodySize) {
        std::cout << "  " << Log::paint("Limit:", LogColor::None, true) << "   "
                  << *config.maxBodySize << " bytes per upload\n";
    }
    std::cout << Log::paint("  Waiting for connections...", LogColor::Dim) << "\n" << std::endl;
}

int main(int argc, char* argv[])
{
    // Writes to a vanished client must fail with EPIPE, not kill the process
    std::signal(SIGPIPE, SIG_IGN);

    std::vector<std::string> args(argv + 1, argv + argc);

    ServerConfig config;
    try {
        std::error_code ec;
        std::filesystem::path cwd = std::filesystem::current_path(ec);
        if (ec) cwd = ".";
        config = ServerConfig::fromCommandLine(args, ServerConfig::processEnv(), cwd);
    } catch (const ConfigError& e) {
        Log::error(e.what());
        print_usage();
        return 1;
    }

    // TLS material is loaded before anything is bound
    std::shared_ptr<boost::asio::ssl::context> tls;
    try {
        tls = TlsContext::fromConfig(config);
    } catch (const CertificateError& e) {
        Log::error(e.what());
        Log::error(std::string("Set ") + ENV_CERT_PATH + " and " + ENV_CERT_KEY_PATH + ", or run with --no-tls");
        return 1;
    }

    std::unique_ptr<FileStorage> storage;
    try {
        storage = std::make_unique<FileStorage>(config.uploadRoot);
    } catch (const IOError& e) {
        Log::error(e.what());
        return 1;
    }
    std::size_t stale = storage->removeStaleStagingFiles();
    if (stale > 0) {
        Log::info("Removed " + std::to_string(stale) + " unfinished upload(s) from a previous run");
    }

    MessageRelay relay(std::cout);
    UploadHandler uploadHandler(*storage, config.maxBodySize);
    MessageHandler messageHandler(relay, config.maxMessageSize);
    RequestDispatcher dispatcher(uploadHandler, messageHandler);

    dzServer server(config, dispatcher, tls);
    try {
        server.listen();
    } catch (const BindError& e) {
        Log::error(e.what());
        return 1;
    }

    print_banner(config, server.port(), storage->root());

    boost::asio::io_context signal_context;
    boost::asio::signal_set signals(signal_context, SIGINT, SIGTERM);
    signals.async_wait([&server](const boost::system::error_code& ec, int signum) {
        if (ec) return;
        Log::info("Signal " + std::to_string(signum) + " received, shutting down");
        server.stop();
    });
    std::thread signal_thread([&signal_context] { signal_context.run(); });

    server.run();

    signal_context.stop();
    signal_thread.join();
    return 0;
}
