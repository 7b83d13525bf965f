#include <algorithm>
#include <chrono>
#include <iostream>
#include <string>
#include <vector>
#include "../common/config.hpp"
#include "../common/grid_world.hpp"
#include "../common/observer.hpp"
#include "../common/settings.hpp"
#include "../common/training.hpp"
#include "../common/types.hpp"

class PathfinderCPU {
   private:
    Settings settings;
    RNG rng;
    GridWorld env;
    TrainingStats stats;

    static Grid make_grid(const Settings& s, RNG& rng) {
        Grid grid = random_grid(s.grid.width, s.grid.height, s.grid.free_prob, rng);
        // Start and goal are always standable
        if (grid.in_bounds(s.grid.start.x, s.grid.start.y))
            grid.set(s.grid.start.x, s.grid.start.y, CellType::FREE);
        if (grid.in_bounds(s.grid.goal.x, s.grid.goal.y))
            grid.set(s.grid.goal.x, s.grid.goal.y, CellType::FREE);
        return grid;
    }

   public:
    PathfinderCPU(const Settings& s)
        : settings(s), rng(s.train.seed), env(make_grid(s, rng), s.grid.start, s.grid.goal, s.env) {}

    void print_grid() const {
        std::vector<std::string> rows = grid_to_strings(env.get_grid());
        for (int y = 0; y < (int)rows.size(); y++) {
            for (int x = 0; x < (int)rows[y].size(); x++) {
                if (Coordinates(x, y) == env.get_start())
                    rows[y][x] = 'S';
                else if (Coordinates(x, y) == env.get_goal())
                    rows[y][x] = 'G';
            }
            std::cout << rows[y] << std::endl;
        }
    }

    void run(bool verbose) {
        ConsoleObserver observer(verbose);

        auto start_time = std::chrono::high_resolution_clock::now();
        QTable q = q_learning(env, settings.train, settings.features, rng, &observer, &stats);
        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);

        size_t tail = std::max<size_t>(1, stats.episodes.size() / 10);

        std::cout << "\n=== Training Complete ===" << std::endl;
        std::cout << "Episodes run: " << stats.episodes.size() << (stats.stopped ? " (stopped)" : "") << std::endl;
        std::cout << "States learned: " << q.size() << std::endl;
        std::cout << "Goal rate (last " << tail << " episodes): " << stats.success_rate(tail) * 100.0 << "%"
                  << std::endl;
        std::cout << "Execution time: " << duration.count() << " ms" << std::endl;

        RolloutResult result = greedy_run(env, q, settings.train.max_steps, settings.features, rng, &observer);

        std::cout << "\n=== Greedy Rollout ===" << std::endl;
        std::cout << "Success: " << (result.success ? "yes" : "no") << std::endl;
        std::cout << "Ended by: " << termination_name(result.reason) << std::endl;
        std::cout << "Steps: " << result.steps << std::endl;
        std::cout << "Total reward: " << result.total_reward << std::endl;
        std::cout << "Path:";
        for (const Coordinates& p : result.path) {
            std::cout << " (" << p.x << "," << p.y << ")";
        }
        std::cout << std::endl;

        observer.close();
    }
};

int main(int argc, char* argv[]) {
    // "-v" prints every step of reported episodes, everything else is key=value
    bool verbose = false;
    std::vector<char*> args;
    for (int i = 0; i < argc; i++) {
        if (i > 0 && std::string(argv[i]) == "-v")
            verbose = true;
        else
            args.push_back(argv[i]);
    }

    try {
        Settings settings = parse_settings((int)args.size(), args.data());

        std::cout << "=== Pheromone Maze Q-Learning (CPU Version) ===" << std::endl;
        std::cout << "Grid size: " << settings.grid.width << " x " << settings.grid.height << std::endl;
        std::cout << "Start: (" << settings.grid.start.x << "," << settings.grid.start.y << ")  Goal: ("
                  << settings.grid.goal.x << "," << settings.grid.goal.y << ")" << std::endl;
        std::cout << "Episodes: " << settings.train.episodes << "  Max steps: " << settings.train.max_steps
                  << std::endl;
        std::cout << "Termination: goal" << (settings.env.terminate_on_wall ? " | wall" : "")
                  << (settings.env.terminate_on_obstacle ? " | obstacle" : "") << std::endl;
        std::cout << "Random seed: " << settings.train.seed << std::endl;
        std::cout << "================================================\n" << std::endl;

        PathfinderCPU trainer(settings);
        trainer.print_grid();
        std::cout << std::endl;
        trainer.run(verbose);
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
