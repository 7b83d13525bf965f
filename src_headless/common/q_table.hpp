#pragma once

#include <algorithm>
#include <unordered_map>
#include <vector>
#include "config.hpp"
#include "featurizer.hpp"

// State -> N_ACTIONS action-values. A row is created as all zeros the first
// time a state is touched through row(); nothing is ever erased.
class QTable {
   public:
    QTable() { table.reserve(1024); }

    std::vector<double>& row(const State& s) {
        auto it = table.find(s);
        if (it == table.end())
            it = table.emplace(s, std::vector<double>(N_ACTIONS, 0.0)).first;
        return it->second;
    }

    // Read-only lookup; an unseen state reads as all zeros
    std::vector<double> values(const State& s) const {
        auto it = table.find(s);
        if (it == table.end())
            return std::vector<double>(N_ACTIONS, 0.0);
        return it->second;
    }

    double best_value(const State& s) const {
        std::vector<double> v = values(s);
        return *std::max_element(v.begin(), v.end());
    }

    bool contains(const State& s) const { return table.find(s) != table.end(); }
    size_t size() const { return table.size(); }

    std::unordered_map<State, std::vector<double>, StateHash>::const_iterator begin() const { return table.begin(); }
    std::unordered_map<State, std::vector<double>, StateHash>::const_iterator end() const { return table.end(); }

   private:
    std::unordered_map<State, std::vector<double>, StateHash> table;
};
