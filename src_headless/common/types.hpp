#pragma once

#include <random>
#include <stdexcept>
#include <string>
#include "config.hpp"

// Raised for any invalid grid, start/goal or setting, before an episode runs
class ConfigError : public std::invalid_argument {
   public:
    explicit ConfigError(const std::string& what) : std::invalid_argument(what) {}
};

struct Coordinates {
    int x, y;
    Coordinates() : x(0), y(0) {}
    Coordinates(int x, int y) : x(x), y(y) {}

    bool operator==(const Coordinates& other) const { return x == other.x && y == other.y; }
    bool operator!=(const Coordinates& other) const { return !(*this == other); }
};

// Why an episode ended
enum class Termination : int {
    NONE = 0,
    GOAL = 1,
    WALL = 2,
    OBSTACLE = 3,
    MAX_STEPS = 4,
    STOPPED = 5
};

inline const char* termination_name(Termination t) {
    switch (t) {
        case Termination::GOAL:
            return "goal";
        case Termination::WALL:
            return "wall";
        case Termination::OBSTACLE:
            return "obstacle";
        case Termination::MAX_STEPS:
            return "max_steps";
        case Termination::STOPPED:
            return "stopped";
        default:
            return "none";
    }
}

// Diagnostics for a single step
struct StepInfo {
    bool hit_wall = false;
    bool hit_obstacle = false;
    bool reached_goal = false;
};

struct StepResult {
    Coordinates position;
    double reward = 0.0;
    bool done = false;
    StepInfo info;
};

// Random number generator wrapper, owned by whoever drives the episodes
class RNG {
   public:
    RNG(unsigned seed = RANDOM_SEED) : gen(seed), dist(0.0, 1.0) {}

    double random_double() { return dist(gen); }
    int random_int(int min, int max) {
        std::uniform_int_distribution<int> d(min, max);
        return d(gen);
    }

   private:
    std::mt19937 gen;
    std::uniform_real_distribution<double> dist;
};
