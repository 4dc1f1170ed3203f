#include <iostream>
#include <string>
#include <thread>
#include <vector>
#include <boost/asio.hpp>
#include "config.hpp"
#include "reaper.hpp"
#include "server.hpp"
#include "upload_service.hpp"

namespace {

void usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [--port <port>] [--storage <dir>] [--db <path>] [--threads <n>]" << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    shuttle::ServerConfig config;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (i + 1 >= argc) {
            usage(argv[0]);
            return 1;
        }
        std::string value = argv[++i];
        try {
            if (arg == "--port") {
                config.port = static_cast<unsigned short>(std::stoi(value));
            } else if (arg == "--storage") {
                config.storage_dir = value;
            } else if (arg == "--db") {
                config.db_path = value;
            } else if (arg == "--threads") {
                config.io_threads = static_cast<unsigned int>(std::stoul(value));
            } else {
                usage(argv[0]);
                return 1;
            }
        } catch (const std::exception& e) {
            std::cerr << "Invalid value for " << arg << ": " << value << " (" << e.what() << ")" << std::endl;
            return 1;
        }
    }
    if (config.io_threads == 0) {
        config.io_threads = 1;
    }

    try {
        boost::asio::io_context io_context;
        shuttle::UploadService service(config);

        shuttle::Server server(io_context, service);
        server.listen(config.port);

        shuttle::Reaper reaper(io_context, service.registry(), service.chunks(),
                               config.reaper_interval, config.retention);
        reaper.start();

        boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& /*ec*/, int signo) {
            std::cout << "[Server] Caught signal " << signo << ", shutting down" << std::endl;
            reaper.stop();
            server.stop();
            io_context.stop();
        });

        std::vector<std::thread> threads;
        for (unsigned int i = 1; i < config.io_threads; ++i) {
            threads.emplace_back([&io_context]() { io_context.run(); });
        }
        io_context.run();
        for (auto& t : threads) {
            t.join();
        }
    } catch (std::exception& e) {
        std::cerr << "Exception: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
