#pragma once

#include <climits>
#include <sstream>
#include <string>
#include <vector>
#include "config.hpp"
#include "types.hpp"

// How the four tile averages become relative strengths
enum class TileNorm : int {
    SOFTMAX = 0,
    RATIO = 1
};

// Reward shaping and termination policy for GridWorld
struct EnvConfig {
    double pheromone_decay = PHEROMONE_DECAY;
    double deposit_rate = DEPOSIT_RATE;
    double pher_penalty = PHEROMONE_PENALTY;
    double obstacle_penalty = OBSTACLE_PENALTY;
    double wall_penalty = WALL_PENALTY;
    double goal_bonus = GOAL_BONUS;

    // Active policy: wall and obstacle hits end the episode.
    // Setting both to false gives the goal-only variant.
    bool terminate_on_wall = true;
    bool terminate_on_obstacle = true;
    // Obstacles act like walls: the agent stays put instead of entering them
    bool obstacles_block_movement = false;

    void validate() const {
        if (!(pheromone_decay > 0.0 && pheromone_decay < 1.0))
            throw ConfigError("pheromone_decay must be in (0, 1)");
        if (!(deposit_rate > 0.0 && deposit_rate <= 1.0))
            throw ConfigError("deposit_rate must be in (0, 1]");
        if (pher_penalty < 0.0 || obstacle_penalty < 0.0 || wall_penalty < 0.0 || goal_bonus < 0.0)
            throw ConfigError("penalties and goal_bonus must be non-negative magnitudes");
    }
};

struct FeatureConfig {
    int vision_radius = VISION_RADIUS;
    TileNorm tile_norm = TileNorm::SOFTMAX;
    bool bucketize_tiles = true;
    bool bucketize_pheromone = true;
    std::vector<double> thresholds = {0.2, 0.4, 0.6, 0.8};  // 5 buckets => 0..4

    void validate() const {
        if (vision_radius < 1)
            throw ConfigError("vision_radius must be at least 1");
        if (thresholds.empty())
            throw ConfigError("thresholds must not be empty");
        for (size_t i = 1; i < thresholds.size(); i++) {
            if (!(thresholds[i - 1] < thresholds[i]))
                throw ConfigError("thresholds must be strictly ascending");
        }
    }
};

struct TrainConfig {
    int episodes = NUM_EPISODES;
    int max_steps = MAX_EPISODE_STEPS;
    double alpha = ALPHA;
    double gamma = GAMMA;
    double eps = EPSILON;
    double eps_decay = EPSILON_DECAY;
    double eps_min = EPSILON_MIN;
    int report_every_episode = 1;
    unsigned seed = RANDOM_SEED;

    void validate() const {
        if (episodes < 1)
            throw ConfigError("episodes must be at least 1");
        if (max_steps < 1)
            throw ConfigError("max_steps must be at least 1");
        if (!(alpha > 0.0 && alpha <= 1.0))
            throw ConfigError("alpha must be in (0, 1]");
        if (gamma < 0.0 || gamma > 1.0)
            throw ConfigError("gamma must be in [0, 1]");
        if (eps < 0.0 || eps > 1.0)
            throw ConfigError("eps must be in [0, 1]");
        if (!(eps_decay > 0.0 && eps_decay <= 1.0))
            throw ConfigError("eps_decay must be in (0, 1]");
        if (eps_min < 0.0 || eps_min > 1.0)
            throw ConfigError("eps_min must be in [0, 1]");
        if (report_every_episode < 1)
            throw ConfigError("report_every_episode must be at least 1");
    }
};

// Parameters handed to the grid generator
struct GridConfig {
    int width = GRID_WIDTH;
    int height = GRID_HEIGHT;
    double free_prob = FREE_PROBABILITY;
    Coordinates start = Coordinates(START_X, START_Y);
    Coordinates goal = Coordinates(GOAL_X, GOAL_Y);

    void validate() const {
        if (width < 1 || height < 1)
            throw ConfigError("grid dimensions must be positive");
        if ((long long)width * height > INT_MAX)
            throw ConfigError("grid has too many cells: " + std::to_string(width) + " x " + std::to_string(height));
        if (free_prob < 0.0 || free_prob > 1.0)
            throw ConfigError("free_prob must be in [0, 1]");
    }
};

struct Settings {
    GridConfig grid;
    EnvConfig env;
    FeatureConfig features;
    TrainConfig train;
    int step_delay_ms = 20;

    void validate() const {
        grid.validate();
        env.validate();
        features.validate();
        train.validate();
        if (step_delay_ms < 0)
            throw ConfigError("step_delay_ms must be non-negative");
    }
};

namespace detail {

inline double parse_double(const std::string& key, const std::string& value) {
    std::istringstream in(value);
    double out;
    if (!(in >> out) || !in.eof())
        throw ConfigError("invalid number for " + key + ": '" + value + "'");
    return out;
}

inline int parse_int(const std::string& key, const std::string& value) {
    std::istringstream in(value);
    int out;
    if (!(in >> out) || !in.eof())
        throw ConfigError("invalid integer for " + key + ": '" + value + "'");
    return out;
}

inline bool parse_bool(const std::string& key, const std::string& value) {
    if (value == "1" || value == "true" || value == "on")
        return true;
    if (value == "0" || value == "false" || value == "off")
        return false;
    throw ConfigError("invalid boolean for " + key + ": '" + value + "'");
}

inline Coordinates parse_cell(const std::string& key, const std::string& value) {
    size_t comma = value.find(',');
    if (comma == std::string::npos)
        throw ConfigError("expected x,y for " + key + ": '" + value + "'");
    return Coordinates(parse_int(key, value.substr(0, comma)), parse_int(key, value.substr(comma + 1)));
}

inline std::vector<double> parse_list(const std::string& key, const std::string& value) {
    std::vector<double> out;
    std::istringstream in(value);
    std::string item;
    while (std::getline(in, item, ',')) {
        out.push_back(parse_double(key, item));
    }
    if (out.empty())
        throw ConfigError("empty list for " + key);
    return out;
}

}  // namespace detail

// Applies one key=value override, throws ConfigError on unknown keys
inline void apply_override(Settings& s, const std::string& key, const std::string& value) {
    using namespace detail;

    if (key == "width")
        s.grid.width = parse_int(key, value);
    else if (key == "height")
        s.grid.height = parse_int(key, value);
    else if (key == "free_prob")
        s.grid.free_prob = parse_double(key, value);
    else if (key == "start")
        s.grid.start = parse_cell(key, value);
    else if (key == "goal")
        s.grid.goal = parse_cell(key, value);
    else if (key == "pheromone_decay")
        s.env.pheromone_decay = parse_double(key, value);
    else if (key == "deposit_rate")
        s.env.deposit_rate = parse_double(key, value);
    else if (key == "pher_penalty")
        s.env.pher_penalty = parse_double(key, value);
    else if (key == "obstacle_penalty")
        s.env.obstacle_penalty = parse_double(key, value);
    else if (key == "wall_penalty")
        s.env.wall_penalty = parse_double(key, value);
    else if (key == "goal_bonus")
        s.env.goal_bonus = parse_double(key, value);
    else if (key == "terminate_on_wall")
        s.env.terminate_on_wall = parse_bool(key, value);
    else if (key == "terminate_on_obstacle")
        s.env.terminate_on_obstacle = parse_bool(key, value);
    else if (key == "obstacles_block_movement")
        s.env.obstacles_block_movement = parse_bool(key, value);
    else if (key == "vision_radius")
        s.features.vision_radius = parse_int(key, value);
    else if (key == "tile_norm") {
        if (value == "softmax")
            s.features.tile_norm = TileNorm::SOFTMAX;
        else if (value == "ratio")
            s.features.tile_norm = TileNorm::RATIO;
        else
            throw ConfigError("tile_norm must be 'softmax' or 'ratio'");
    } else if (key == "bucketize_tiles")
        s.features.bucketize_tiles = parse_bool(key, value);
    else if (key == "bucketize_pheromone")
        s.features.bucketize_pheromone = parse_bool(key, value);
    else if (key == "thresholds")
        s.features.thresholds = parse_list(key, value);
    else if (key == "episodes")
        s.train.episodes = parse_int(key, value);
    else if (key == "max_steps")
        s.train.max_steps = parse_int(key, value);
    else if (key == "alpha")
        s.train.alpha = parse_double(key, value);
    else if (key == "gamma")
        s.train.gamma = parse_double(key, value);
    else if (key == "eps")
        s.train.eps = parse_double(key, value);
    else if (key == "eps_decay")
        s.train.eps_decay = parse_double(key, value);
    else if (key == "eps_min")
        s.train.eps_min = parse_double(key, value);
    else if (key == "report_every_episode")
        s.train.report_every_episode = parse_int(key, value);
    else if (key == "seed")
        s.train.seed = (unsigned)parse_int(key, value);
    else if (key == "step_delay_ms")
        s.step_delay_ms = parse_int(key, value);
    else
        throw ConfigError("unknown setting: " + key);
}

// Builds validated settings from "key=value" command line arguments
inline Settings parse_settings(int argc, char* argv[]) {
    Settings s;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        size_t eq = arg.find('=');
        if (eq == std::string::npos || eq == 0)
            throw ConfigError("expected key=value, got '" + arg + "'");
        apply_override(s, arg.substr(0, eq), arg.substr(eq + 1));
    }
    s.validate();
    return s;
}
