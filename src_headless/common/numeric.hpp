#pragma once

#include <algorithm>
#include <cmath>
#include <vector>
#include "types.hpp"

// Index of the maximum value, ties broken uniformly at random
inline int argmax_index(const std::vector<double>& values, RNG& rng) {
    double m = *std::max_element(values.begin(), values.end());

    std::vector<int> best;
    for (int i = 0; i < (int)values.size(); i++) {
        if (values[i] == m)
            best.push_back(i);
    }

    if (best.size() == 1)
        return best[0];
    return best[rng.random_int(0, (int)best.size() - 1)];
}

inline std::vector<double> softmax(const std::vector<double>& xs) {
    double m = *std::max_element(xs.begin(), xs.end());

    std::vector<double> out(xs.size());
    double sum = 0.0;
    for (size_t i = 0; i < xs.size(); i++) {
        out[i] = std::exp(xs[i] - m);
        sum += out[i];
    }
    for (double& v : out) {
        v /= sum;
    }
    return out;
}

// Plain ratio normalization; eps keeps an all-zero input finite
inline std::vector<double> normalize(const std::vector<double>& xs, double eps = 1e-9) {
    double sum = eps;
    for (double x : xs) {
        sum += x;
    }

    std::vector<double> out(xs.size());
    for (size_t i = 0; i < xs.size(); i++) {
        out[i] = xs[i] / sum;
    }
    return out;
}

// Bucket i for the first threshold x is below, thresholds.size() otherwise
inline int bucketize(double x, const std::vector<double>& thresholds) {
    for (size_t i = 0; i < thresholds.size(); i++) {
        if (x < thresholds[i])
            return (int)i;
    }
    return (int)thresholds.size();
}
