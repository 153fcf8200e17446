#include "maze_routes.hpp"
#include "maze_io.hpp"
#include "maze_request.hpp"
#include <string>

namespace mazegen {

namespace bhttp = boost::beast::http;

void install_maze_routes(http::Server& server, const GenerationConfig& defaults, int max_dimension,
                         log::Logger& logger) {
    server.get("/maze", [defaults, max_dimension, &logger](const http::Request& req, http::Response& res,
                                                           const std::smatch&) {
        MazeRequest request = parse_maze_request(std::string(req.target()), defaults);
        const GenerationConfig& cfg = request.config;

        if (cfg.width > max_dimension || cfg.height > max_dimension) {
            logger.warning("Rejected maze request: " + std::to_string(cfg.width) + "x" +
                           std::to_string(cfg.height) + " exceeds " + std::to_string(max_dimension));
            res.result(bhttp::status::bad_request);
            res.body() = R"({"status":"error","message":"width and height must not exceed )" +
                         std::to_string(max_dimension) + R"("})";
            res.prepare_payload();
            return;
        }

        try {
            MazeResult maze = regenerate(cfg);
            logger.debug("Generated " + std::to_string(cfg.width) + "x" + std::to_string(cfg.height) +
                         " " + algorithm_name(cfg.algorithm) + " maze, seed " + std::to_string(cfg.seed));

            res.result(bhttp::status::ok);
            if (request.format == OutputFormat::Ascii) {
                res.set(bhttp::field::content_type, "text/plain; charset=utf-8");
                res.body() = render_ascii(maze);
            } else {
                res.set(bhttp::field::content_type, "application/yaml");
                res.body() = serialize(to_state(maze));
            }
        } catch (const InvalidDimension& e) {
            logger.warning(std::string("Rejected maze request: ") + e.what());
            res.result(bhttp::status::bad_request);
            res.body() = R"({"status":"error","message":"width and height must be positive"})";
        } catch (const std::exception& e) {
            logger.error(std::string("Maze generation failed: ") + e.what());
            res.result(bhttp::status::internal_server_error);
            res.body() = R"({"status":"error","message":"generation failed"})";
        }
        res.prepare_payload();
    });

    server.get("/health", [](const http::Request&, http::Response& res, const std::smatch&) {
        res.result(bhttp::status::ok);
        res.body() = R"({"status":"ok","service":"maze"})";
        res.prepare_payload();
    });
}

} // namespace mazegen
