#pragma once

#include <array>
#include <functional>
#include <vector>
#include "config.hpp"
#include "grid_world.hpp"
#include "numeric.hpp"
#include "settings.hpp"

constexpr int STATE_SIZE = 2 * N_QUADS;

// 4 tile components followed by 4 pheromone components. Each is a bucket
// index (stored exactly as a small integer) or a raw strength in [0, 1].
struct State {
    std::array<double, STATE_SIZE> values;

    State() { values.fill(0.0); }

    bool operator==(const State& other) const { return values == other.values; }
    bool operator!=(const State& other) const { return !(*this == other); }
};

struct StateHash {
    size_t operator()(const State& s) const {
        size_t h = 0;
        for (double v : s.values) {
            h ^= std::hash<double>()(v) + 0x9e3779b9 + (h << 6) + (h >> 2);
        }
        return h;
    }
};

// State plus the intermediate vectors it was built from
struct StateDebug {
    State state;
    std::vector<double> tile_avgs;
    std::vector<double> pher_avgs;
    std::vector<double> tile_strength;
    std::vector<double> pher_strength;
    std::vector<int> tile_buckets;
    std::vector<int> pher_buckets;
};

// Offsets of each quadrant (UL, UR, DR, DL) for a vision radius. A cell
// belongs to a quadrant when its offset signs match the quadrant's signs;
// the agent's own row and column count toward both neighbors.
inline std::vector<std::vector<Coordinates>> quadrant_offsets(int radius) {
    std::vector<std::vector<Coordinates>> quads(N_QUADS);
    for (int q = 0; q < N_QUADS; q++) {
        for (int dy = -radius; dy <= radius; dy++) {
            for (int dx = -radius; dx <= radius; dx++) {
                if (dx * QUAD_SX[q] >= 0 && dy * QUAD_SY[q] >= 0)
                    quads[q].push_back(Coordinates(dx, dy));
            }
        }
    }
    return quads;
}

inline std::vector<double> tile_strengths(const std::vector<double>& tile_avgs, TileNorm norm) {
    if (norm == TileNorm::SOFTMAX)
        return softmax(tile_avgs);

    // Shift by the sentinel magnitude so every average is non-negative
    std::vector<double> shifted;
    double sum = 0.0;
    for (double t : tile_avgs) {
        shifted.push_back(t - OOB_TILE_VALUE);
        sum += shifted.back();
    }
    if (sum <= 0.0)
        return std::vector<double>(tile_avgs.size(), 1.0 / tile_avgs.size());
    return normalize(shifted);
}

inline std::vector<double> pheromone_strengths(const std::vector<double>& pher_avgs) {
    // Lower pheromone is better
    std::vector<double> goodness;
    for (double p : pher_avgs) {
        goodness.push_back(1.0 / (1.0 + p));
    }
    return normalize(goodness);
}

inline StateDebug get_state_debug(const GridWorld& env, const FeatureConfig& config) {
    Coordinates agent = env.get_position();
    const PheromoneField& pheromone = env.get_pheromone();

    StateDebug out;
    for (const std::vector<Coordinates>& quad : quadrant_offsets(config.vision_radius)) {
        double t_sum = 0.0;
        double p_sum = 0.0;
        for (const Coordinates& d : quad) {
            int x = agent.x + d.x;
            int y = agent.y + d.y;
            if (!env.in_bounds(x, y)) {
                t_sum += OOB_TILE_VALUE;
                p_sum += OOB_PHEROMONE_VALUE;
            } else {
                t_sum += env.cell(x, y) == CellType::FREE ? 1.0 : -1.0;
                p_sum += pheromone.at(x, y);
            }
        }
        out.tile_avgs.push_back(t_sum / quad.size());
        out.pher_avgs.push_back(p_sum / quad.size());
    }

    out.tile_strength = tile_strengths(out.tile_avgs, config.tile_norm);
    out.pher_strength = pheromone_strengths(out.pher_avgs);

    for (int q = 0; q < N_QUADS; q++) {
        out.tile_buckets.push_back(bucketize(out.tile_strength[q], config.thresholds));
        out.pher_buckets.push_back(bucketize(out.pher_strength[q], config.thresholds));

        out.state.values[q] = config.bucketize_tiles ? out.tile_buckets[q] : out.tile_strength[q];
        out.state.values[N_QUADS + q] = config.bucketize_pheromone ? out.pher_buckets[q] : out.pher_strength[q];
    }
    return out;
}

inline State get_state(const GridWorld& env, const FeatureConfig& config) {
    return get_state_debug(env, config).state;
}
