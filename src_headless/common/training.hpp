#pragma once

#include <algorithm>
#include <cstdio>
#include <string>
#include <vector>
#include "config.hpp"
#include "featurizer.hpp"
#include "grid_world.hpp"
#include "numeric.hpp"
#include "observer.hpp"
#include "q_table.hpp"
#include "settings.hpp"
#include "types.hpp"

struct EpisodeRecord {
    int episode = 0;
    int steps = 0;
    double total_reward = 0.0;
    double eps = 0.0;
    Termination reason = Termination::NONE;
};

// Per-episode history of a training run
struct TrainingStats {
    std::vector<EpisodeRecord> episodes;
    bool stopped = false;

    // Fraction of the last n recorded episodes that reached the goal
    double success_rate(size_t n) const {
        n = std::min(n, episodes.size());
        if (n == 0)
            return 0.0;
        size_t hits = 0;
        for (size_t i = episodes.size() - n; i < episodes.size(); i++) {
            if (episodes[i].reason == Termination::GOAL)
                hits++;
        }
        return (double)hits / n;
    }
};

struct RolloutResult {
    double total_reward = 0.0;
    bool success = false;
    int steps = 0;
    Termination reason = Termination::NONE;
    std::vector<Coordinates> path;  // Positions after each step
};

// Human-readable dump of the featurizer's intermediate values
inline std::vector<std::string> state_detail_lines(const StateDebug& d) {
    std::vector<std::string> lines;
    char text[256];
    for (int q = 0; q < N_QUADS; q++) {
        snprintf(text, sizeof(text), "%s  tile avg %+.2f str %.3f b%d | pher avg %.3f str %.3f b%d",
                 QUAD_NAMES[q], d.tile_avgs[q], d.tile_strength[q], d.tile_buckets[q],
                 d.pher_avgs[q], d.pher_strength[q], d.pher_buckets[q]);
        lines.push_back(text);
    }
    return lines;
}

// Epsilon-greedy selection; sets exploring when the random branch was taken
inline int select_action(QTable& q, const State& s, double eps, RNG& rng, bool& exploring) {
    exploring = rng.random_double() < eps;
    if (exploring)
        return rng.random_int(0, N_ACTIONS - 1);
    return argmax_index(q.row(s), rng);
}

// One Bellman backup. No bootstrapping past a terminal transition.
inline void bellman_update(QTable& q, const State& s, int action, double reward, const State& s2, bool done,
                           double alpha, double gamma) {
    double best_next = done ? 0.0 : q.best_value(s2);
    std::vector<double>& row = q.row(s);
    row[action] += alpha * (reward + gamma * best_next - row[action]);
}

// Tabular Q-learning over config.episodes episodes. Returns the table learned
// so far if the observer asks to stop.
inline QTable q_learning(GridWorld& env, const TrainConfig& config, const FeatureConfig& features, RNG& rng,
                         Observer* observer = nullptr, TrainingStats* stats = nullptr) {
    config.validate();
    features.validate();

    QTable q;
    double eps = config.eps;
    char title[256];
    char subtitle[256];

    for (int ep = 1; ep <= config.episodes; ep++) {
        env.reset();
        State s = get_state(env, features);

        EpisodeRecord record;
        record.episode = ep;
        record.eps = eps;
        record.reason = Termination::MAX_STEPS;

        bool show = observer && (ep % config.report_every_episode == 0);

        for (int t = 1; t <= config.max_steps; t++) {
            bool exploring;
            int a = select_action(q, s, eps, rng, exploring);

            StepResult step = env.step(a);
            record.total_reward += step.reward;
            record.steps = t;

            StateDebug next = get_state_debug(env, features);
            bellman_update(q, s, a, step.reward, next.state, step.done, config.alpha, config.gamma);

            if (show) {
                snprintf(title, sizeof(title), "TRAIN  ep %d/%d  t %d/%d", ep, config.episodes, t, config.max_steps);
                snprintf(subtitle, sizeof(subtitle), "a=%s (%s)  r=%.3f  total=%.2f  eps=%.3f", ACTION_NAMES[a],
                         exploring ? "explore" : "exploit", step.reward, record.total_reward, eps);
                if (!observer->report(title, subtitle, state_detail_lines(next))) {
                    record.reason = Termination::STOPPED;
                    if (stats) {
                        stats->episodes.push_back(record);
                        stats->stopped = true;
                    }
                    return q;
                }
            }

            s = next.state;
            if (step.done) {
                record.reason = env.termination(step);
                break;
            }
        }

        if (stats)
            stats->episodes.push_back(record);

        if (show) {
            snprintf(title, sizeof(title), "EPISODE %d/%d", ep, config.episodes);
            snprintf(subtitle, sizeof(subtitle), "end=%s  steps=%d  total=%.2f  eps=%.3f  states=%zu",
                     termination_name(record.reason), record.steps, record.total_reward, eps, q.size());
            if (!observer->summary(title, subtitle)) {
                if (stats)
                    stats->stopped = true;
                return q;
            }
        }

        eps = std::max(config.eps_min, eps * config.eps_decay);
    }

    if (observer)
        observer->summary("Training done.", "");
    return q;
}

// Greedy evaluation with the learned table, no updates
inline RolloutResult greedy_run(GridWorld& env, const QTable& q, int max_steps, const FeatureConfig& features,
                                RNG& rng, Observer* observer = nullptr) {
    RolloutResult result;
    result.reason = Termination::MAX_STEPS;
    char title[256];
    char subtitle[256];

    env.reset();
    State s = get_state(env, features);
    for (int t = 1; t <= max_steps; t++) {
        int a = argmax_index(q.values(s), rng);

        StepResult step = env.step(a);
        result.total_reward += step.reward;
        result.steps = t;
        result.path.push_back(step.position);

        StateDebug d = get_state_debug(env, features);
        s = d.state;

        if (observer) {
            snprintf(title, sizeof(title), "GREEDY  t %d/%d", t, max_steps);
            snprintf(subtitle, sizeof(subtitle), "a=%s  r=%.3f  total=%.2f", ACTION_NAMES[a], step.reward,
                     result.total_reward);
            if (!observer->report(title, subtitle, state_detail_lines(d))) {
                result.reason = Termination::STOPPED;
                return result;
            }
        }

        if (step.done) {
            result.reason = env.termination(step);
            result.success = step.info.reached_goal;
            break;
        }
    }

    if (observer) {
        snprintf(subtitle, sizeof(subtitle), "end=%s  steps=%d  total reward=%.2f", termination_name(result.reason),
                 result.steps, result.total_reward);
        observer->summary(result.success ? "Reached goal." : "Rollout ended.", subtitle);
    }
    return result;
}
