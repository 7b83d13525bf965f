#pragma once

#include <algorithm>
#include "../src_headless/common/config.hpp"
#include "config.hpp"

struct rgb {
    int r, g, b, a;

    rgb() : r(255), g(255), b(255), a(255) {}
    rgb(int r_in, int g_in, int b_in, int alpha = 255) : r(r_in), g(g_in), b(b_in), a(alpha) {}

    // Scales the color channels, factor in [0, 1]
    rgb darken(double factor) const {
        factor = std::max(0.0, std::min(1.0, factor));
        return rgb((int)(r * factor), (int)(g * factor), (int)(b * factor), a);
    }
};

// Free tiles blue, obstacles red
inline rgb tile_color(CellType type) {
    if (type == CellType::FREE)
        return rgb(51, 128, 255);
    return rgb(255, 77, 77);
}

// Tile darkened by its pheromone level
inline rgb cell_color(CellType type, double pheromone, bool show_pheromone) {
    rgb base = tile_color(type);
    if (!show_pheromone)
        return base;
    return base.darken(1.0 - PHEROMONE_SHADE * std::max(0.0, std::min(1.0, pheromone)));
}

inline rgb goal_color() { return rgb(51, 255, 51); }
inline rgb agent_color() { return rgb(0, 0, 0); }
inline rgb background_color() { return rgb(20, 20, 20); }
