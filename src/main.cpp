#include "mazegen.hpp"
#include "maze_io.hpp"
#include "maze_request.hpp"
#include "shared/logger.hpp"
#include "shared/service_config.hpp"
#include <cmath>
#include <iostream>
#include <optional>
#include <string>

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [--config FILE] [--width W] [--height H] [--seed N]\n"
              << "       [--algorithm prim|kruskal|custom] [--goal center|corner]\n"
              << "       [--save FILE] [--load FILE] [--quiet] [--verbose]\n";
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
    bool config_loaded = config.load(config_file);

    mazegen::GenerationConfig gen = mazegen::generation_defaults(config);
    mazegen::log::Level level = mazegen::log::level_from_string(config.get_string("logging.level", "info"));
    std::string save_path;
    std::string load_path;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i];
            if (a == "--config") {
                ++i; // Skip, already processed
            } else if (a == "--width" && i + 1 < argc) {
                gen.width = std::stoi(argv[++i]);
            } else if (a == "--height" && i + 1 < argc) {
                gen.height = std::stoi(argv[++i]);
            } else if (a == "--seed" && i + 1 < argc) {
                gen.seed = std::stoull(argv[++i]);
            } else if (a == "--algorithm" && i + 1 < argc) {
                if (!mazegen::parse_algorithm(argv[++i], gen.algorithm)) {
                    print_usage(argv[0]);
                    return 1;
                }
            } else if (a == "--goal" && i + 1 < argc) {
                std::string goal = argv[++i];
                if (goal != "center" && goal != "corner") {
                    print_usage(argv[0]);
                    return 1;
                }
                gen.goal_in_center = goal == "center";
            } else if (a == "--save" && i + 1 < argc) {
                save_path = argv[++i];
            } else if (a == "--load" && i + 1 < argc) {
                load_path = argv[++i];
            } else if (a == "--quiet") {
                level = mazegen::log::Level::ERROR;
            } else if (a == "--verbose") {
                level = mazegen::log::Level::DEBUG;
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

    mazegen::log::Logger logger("mazegen", level);
    if (!config_loaded) {
        logger.debug("No config file at " + config_file + ", using built-in defaults");
    }

    double cell_size = config.get_double("maze.cell_size", 1.0);
    if (!std::isfinite(cell_size) || cell_size <= 0.0) {
        logger.error("maze.cell_size must be positive, got " + std::to_string(cell_size));
        return 1;
    }

    std::optional<mazegen::MazeResult> maze;
    try {
        if (!load_path.empty()) {
            mazegen::MazeState state = mazegen::load_maze(load_path);
            maze = mazegen::restore(state, gen.goal_in_center);
            logger.info("Loaded " + std::to_string(state.width) + "x" + std::to_string(state.height) +
                        " maze from " + load_path);
        } else {
            maze = mazegen::regenerate(gen);
            logger.info("Generated " + std::to_string(gen.width) + "x" + std::to_string(gen.height) +
                        " maze with " + mazegen::algorithm_name(gen.algorithm) +
                        (gen.seed == 0 ? std::string(", random seed") : ", seed " + std::to_string(gen.seed)));
        }

        if (!save_path.empty()) {
            mazegen::save_maze(save_path, mazegen::to_state(*maze));
            logger.info("Saved maze to " + save_path);
        }
    } catch (const std::exception& e) {
        logger.error(e.what());
        return 1;
    }

    mazegen::WorldPosition start = mazegen::start_world_position(*maze, cell_size);
    mazegen::WorldPosition goal = mazegen::goal_world_position(*maze, cell_size);
    logger.debug("Start " + mazegen::to_string(maze->start) + " at (" + std::to_string(start.x) + ", " +
                 std::to_string(start.y) + "), goal " + mazegen::to_string(maze->goal) + " at (" +
                 std::to_string(goal.x) + ", " + std::to_string(goal.y) + ")");
    std::cout << mazegen::render_ascii(*maze) << std::endl;
    return 0;
}
