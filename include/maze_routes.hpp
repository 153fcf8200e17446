#pragma once
#include "mazegen.hpp"
#include "shared/http_server.hpp"
#include "shared/logger.hpp"

namespace mazegen {

// Largest width or height /maze will generate unless configured otherwise.
constexpr int kDefaultMaxDimension = 1024;

// GET /maze and GET /health. Requests wider or taller than max_dimension are
// rejected with 400. The server and logger must outlive the routes.
void install_maze_routes(http::Server& server, const GenerationConfig& defaults, int max_dimension,
                         log::Logger& logger);

} // namespace mazegen
