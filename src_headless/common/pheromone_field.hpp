#pragma once

#include <algorithm>
#include <vector>

// Per-cell pheromone level in [0, 1], stored row-major (H x W)
class PheromoneField {
   public:
    PheromoneField(int width, int height) : width(width), height(height), levels(width * height, 0.0) {}

    void clear() { std::fill(levels.begin(), levels.end(), 0.0); }

    // Every cell shrinks by the decay factor
    void decay(double factor) {
        for (double& p : levels) {
            p *= factor;
        }
    }

    // Diminishing deposit, bounded to 1
    void deposit(int x, int y, double rate) {
        double& p = levels[y * width + x];
        p += rate * (1.0 - p);
    }

    double at(int x, int y) const { return levels[y * width + x]; }

    const std::vector<double>& data() const { return levels; }

   private:
    int width, height;
    std::vector<double> levels;
};
