#pragma once

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>
#include "config.hpp"
#include "pheromone_field.hpp"
#include "settings.hpp"
#include "types.hpp"

// Static W x H map of cell kinds, row-major
struct Grid {
    int width = 0;
    int height = 0;
    std::vector<CellType> cells;

    Grid() {}
    Grid(int width, int height, CellType fill = CellType::FREE)
        : width(width), height(height), cells(width * height, fill) {}

    bool in_bounds(int x, int y) const { return x >= 0 && x < width && y >= 0 && y < height; }
    CellType at(int x, int y) const { return cells[y * width + x]; }
    void set(int x, int y, CellType type) { cells[y * width + x] = type; }
    bool empty() const { return cells.empty(); }
};

// Rows of FREE_SYMBOL / OBSTACLE_SYMBOL, all the same length
inline Grid parse_grid(const std::vector<std::string>& rows) {
    if (rows.empty() || rows[0].empty())
        throw ConfigError("grid must have at least one row and one column");

    int width = (int)rows[0].size();
    int height = (int)rows.size();
    Grid grid(width, height);

    for (int y = 0; y < height; y++) {
        if ((int)rows[y].size() != width)
            throw ConfigError("grid is not rectangular: row " + std::to_string(y) + " has " +
                              std::to_string(rows[y].size()) + " cells, expected " + std::to_string(width));
        for (int x = 0; x < width; x++) {
            char c = rows[y][x];
            if (c == FREE_SYMBOL) {
                grid.set(x, y, CellType::FREE);
            } else if (c == OBSTACLE_SYMBOL) {
                grid.set(x, y, CellType::OBSTACLE);
            } else {
                throw ConfigError(std::string("unknown cell symbol '") + c + "' at row " + std::to_string(y));
            }
        }
    }
    return grid;
}

inline std::vector<std::string> grid_to_strings(const Grid& grid) {
    std::vector<std::string> rows;
    for (int y = 0; y < grid.height; y++) {
        std::string row;
        for (int x = 0; x < grid.width; x++) {
            row += grid.at(x, y) == CellType::FREE ? FREE_SYMBOL : OBSTACLE_SYMBOL;
        }
        rows.push_back(row);
    }
    return rows;
}

// Obstacle border, random interior
inline Grid random_grid(int width, int height, double free_prob, RNG& rng) {
    GridConfig dims;
    dims.width = width;
    dims.height = height;
    dims.free_prob = free_prob;
    dims.validate();

    Grid grid(width, height, CellType::OBSTACLE);
    for (int y = 1; y < height - 1; y++) {
        for (int x = 1; x < width - 1; x++) {
            grid.set(x, y, rng.random_double() < free_prob ? CellType::FREE : CellType::OBSTACLE);
        }
    }
    return grid;
}

class GridWorld {
   public:
    GridWorld(const Grid& grid, Coordinates start, Coordinates goal, const EnvConfig& config = EnvConfig())
        : grid(grid), start(start), goal(goal), config(config), pos(start), pheromone(grid.width, grid.height) {
        if (grid.empty() || grid.width < 1 || grid.height < 1 ||
            (long long)grid.cells.size() != (long long)grid.width * grid.height)
            throw ConfigError("grid must be a non-empty W x H array");
        if (!grid.in_bounds(start.x, start.y))
            throw ConfigError("start (" + std::to_string(start.x) + "," + std::to_string(start.y) + ") is outside the grid");
        if (!grid.in_bounds(goal.x, goal.y))
            throw ConfigError("goal (" + std::to_string(goal.x) + "," + std::to_string(goal.y) + ") is outside the grid");
        config.validate();
    }

    Coordinates reset() {
        pos = start;
        pheromone.clear();
        return pos;
    }

    StepResult step(int action) {
        if (action < 0 || action >= N_ACTIONS)
            throw std::out_of_range("action index " + std::to_string(action) + " is not in [0, 8)");

        StepResult result;
        StepInfo& info = result.info;

        int nx = pos.x + DX[action];
        int ny = pos.y + DY[action];

        if (!grid.in_bounds(nx, ny)) {
            // Clamp to bounds, the agent never leaves the grid
            info.hit_wall = true;
            nx = std::max(0, std::min(grid.width - 1, nx));
            ny = std::max(0, std::min(grid.height - 1, ny));
        }
        // A clamped diagonal can still slide onto an obstacle
        if ((nx != pos.x || ny != pos.y) && grid.at(nx, ny) == CellType::OBSTACLE) {
            info.hit_obstacle = true;
            if (config.obstacles_block_movement) {
                nx = pos.x;
                ny = pos.y;
            }
        }
        pos = Coordinates(nx, ny);

        // Free tiles are neutral, obstacle tiles are penalized
        double r = 0.0;
        if (info.hit_obstacle || grid.at(pos.x, pos.y) == CellType::OBSTACLE)
            r -= config.obstacle_penalty;
        if (info.hit_wall)
            r -= config.wall_penalty;

        // Pheromone dynamics: decay the whole field, then deposit where we stand
        pheromone.decay(config.pheromone_decay);
        pheromone.deposit(pos.x, pos.y, config.deposit_rate);

        // Penalize high-pheromone cells (discourage loops)
        r -= config.pher_penalty * pheromone.at(pos.x, pos.y);

        info.reached_goal = (pos == goal);
        if (info.reached_goal)
            r += config.goal_bonus;

        result.position = pos;
        result.reward = r;
        result.done = info.reached_goal || (info.hit_wall && config.terminate_on_wall) ||
                      (info.hit_obstacle && config.terminate_on_obstacle);
        return result;
    }

    // Reason a finished step ended the episode, NONE if it did not
    Termination termination(const StepResult& result) const {
        if (!result.done)
            return Termination::NONE;
        if (result.info.reached_goal)
            return Termination::GOAL;
        if (result.info.hit_wall && config.terminate_on_wall)
            return Termination::WALL;
        return Termination::OBSTACLE;
    }

    int get_width() const { return grid.width; }
    int get_height() const { return grid.height; }
    bool in_bounds(int x, int y) const { return grid.in_bounds(x, y); }
    CellType cell(int x, int y) const { return grid.at(x, y); }
    const Grid& get_grid() const { return grid; }
    Coordinates get_position() const { return pos; }
    Coordinates get_start() const { return start; }
    Coordinates get_goal() const { return goal; }
    const PheromoneField& get_pheromone() const { return pheromone; }

   private:
    Grid grid;
    Coordinates start, goal;
    EnvConfig config;

    Coordinates pos;
    PheromoneField pheromone;
};
