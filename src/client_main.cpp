#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <boost/asio.hpp>
#include "chunk_planner.hpp"
#include "config.hpp"
#include "remote_client.hpp"
#include "upload_coordinator.hpp"

int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " <host>:<port> <file>" << std::endl;
        return 1;
    }

    std::string host_port = argv[1];
    size_t colon_pos = host_port.find(':');
    if (colon_pos == std::string::npos) {
        std::cerr << "Invalid host:port format" << std::endl;
        return 1;
    }
    std::string host = host_port.substr(0, colon_pos);
    std::string port = host_port.substr(colon_pos + 1);

    int exit_code = 0;
    try {
        shuttle::CoordinatorOptions options;
        shuttle::ChunkPlanner planner(options.chunk_size);
        shuttle::FilePlan plan = planner.plan(argv[2]);

        boost::asio::io_context io_context;
        shuttle::RemoteClient client(io_context, host, port);
        auto coordinator = std::make_shared<shuttle::UploadCoordinator>(io_context, client, plan, options);

        coordinator->set_progress_handler([](const shuttle::ProgressSnapshot& snap) {
            std::cout << std::fixed << std::setprecision(1) << snap.percent << "%  "
                      << snap.bytes_per_second / (1024.0 * 1024.0) << " MiB/s  ETA ";
            if (snap.eta_seconds) {
                std::cout << static_cast<long>(*snap.eta_seconds) << "s";
            } else {
                std::cout << "unknown";
            }
            std::cout << std::endl;
        });

        coordinator->start([&exit_code](const boost::system::error_code& ec, const shuttle::UploadOutcome& outcome) {
            if (ec) {
                std::cerr << "Upload failed: " << ec.message() << std::endl;
                if (!outcome.session_id.empty()) {
                    std::cerr << "Run again to resume session " << outcome.session_id << std::endl;
                }
                exit_code = 1;
                return;
            }
            std::cout << "Upload completed: session " << outcome.session_id << " (" << outcome.uploaded_chunks
                      << " chunks sent, " << outcome.resumed_chunks << " resumed)" << std::endl;
            std::cout << "sha256 " << outcome.result.final_hash << std::endl;
            for (const auto& entry : outcome.result.preview_entries) {
                std::cout << "  " << entry << std::endl;
            }
        });

        io_context.run();
    } catch (std::exception& e) {
        std::cerr << "Exception: " << e.what() << "\n";
        return 1;
    }

    return exit_code;
}
