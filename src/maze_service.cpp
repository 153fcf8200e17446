#include "maze_request.hpp"
#include "maze_routes.hpp"
#include "shared/http_server.hpp"
#include "shared/logger.hpp"
#include "shared/service_config.hpp"
#include <csignal>
#include <iostream>
#include <string>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

static void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [--config FILE] [--port P] [--log-level LEVEL]\n";
    std::cerr << "  Config file defaults to config/mazegen.yaml\n";
    std::cerr << "  Command line options override config file values\n";
}

int main(int argc, char** argv) {
    auto& config = mazegen::config::ServiceConfig::instance();
    std::string config_file = "config/mazegen.yaml";

    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == "--config" && i + 1 < argc) {
            config_file = argv[++i];
            break;
        }
    }

    if (!config.load(config_file)) {
        std::cerr << "Warning: Could not load config file: " << config_file << std::endl;
        std::cerr << "Using default values and command line options only." << std::endl;
    }

    int port = config.get_int("maze_service.port", 8084);
    int max_dimension = config.get_int("maze_service.max_dimension", mazegen::kDefaultMaxDimension);
    std::string level = config.get_string("logging.level", "info");

    try {
        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i];
            if (a == "--config") {
                ++i; // Skip, already processed
            } else if (a == "--port" && i + 1 < argc) {
                port = std::stoi(argv[++i]);
            } else if (a == "--log-level" && i + 1 < argc) {
                level = argv[++i];
            } else if (a == "-h" || a == "--help") {
                print_usage(argv[0]);
                return 0;
            } else {
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const std::logic_error& e) {
        std::cerr << "Invalid argument: " << e.what() << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    mazegen::log::Logger logger("maze-service", mazegen::log::level_from_string(level));
    mazegen::GenerationConfig defaults = mazegen::generation_defaults(config);

    if (max_dimension < 1) {
        logger.error("maze_service.max_dimension must be positive, got " + std::to_string(max_dimension));
        return 1;
    }

    boost::asio::io_context ioc;
    mazegen::http::Server svr(ioc, static_cast<unsigned short>(port));

    logger.info("Starting maze-service on port " + std::to_string(port));

    mazegen::install_maze_routes(svr, defaults, max_dimension, logger);

    svr.post("/shutdown", [&ioc, &logger](const mazegen::http::Request&, mazegen::http::Response& res, const std::smatch&) {
        logger.info("Shutdown requested via /shutdown endpoint");
        res.result(boost::beast::http::status::ok);
        res.body() = R"({"status":"ok","message":"shutting down"})";
        res.prepare_payload();
        ioc.stop();
    });

    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](auto, auto){
        logger.info("Shutdown signal received");
        ioc.stop();
    });

    svr.run();
    ioc.run();

    logger.info("Service stopped");
    return 0;
}
