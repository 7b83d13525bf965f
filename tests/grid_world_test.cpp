#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>
#include "../src_headless/common/grid_world.hpp"

namespace {

EnvConfig goal_only() {
    EnvConfig c;
    c.terminate_on_wall = false;
    c.terminate_on_obstacle = false;
    return c;
}

}  // namespace

TEST(PheromoneField, DepositApproachesOneWithoutExceeding) {
    PheromoneField field(2, 2);
    for (int i = 0; i < 200; i++) {
        field.decay(0.97);
        field.deposit(1, 0, 0.6);
        ASSERT_LE(field.at(1, 0), 1.0);
        ASSERT_GE(field.at(1, 0), 0.0);
    }
    EXPECT_GT(field.at(1, 0), 0.9);
    EXPECT_EQ(field.at(0, 0), 0.0);

    field.clear();
    EXPECT_EQ(field.at(1, 0), 0.0);
}

TEST(GridParsing, BuildsCellsFromSymbols) {
    Grid g = parse_grid({"010", "001"});
    EXPECT_EQ(g.width, 3);
    EXPECT_EQ(g.height, 2);
    EXPECT_EQ(g.at(1, 0), CellType::OBSTACLE);
    EXPECT_EQ(g.at(2, 1), CellType::OBSTACLE);
    EXPECT_EQ(g.at(0, 1), CellType::FREE);
    EXPECT_EQ(grid_to_strings(g), (std::vector<std::string>{"010", "001"}));
}

TEST(GridParsing, RejectsEmptyRaggedAndUnknownSymbols) {
    EXPECT_THROW(parse_grid({}), ConfigError);
    EXPECT_THROW(parse_grid({""}), ConfigError);
    EXPECT_THROW(parse_grid({"000", "00"}), ConfigError);
    EXPECT_THROW(parse_grid({"0x0"}), ConfigError);
}

TEST(GridParsing, RandomGridHasObstacleBorder) {
    RNG rng(5);
    Grid g = random_grid(12, 8, 0.7, rng);
    int free_cells = 0;
    for (int y = 0; y < g.height; y++) {
        for (int x = 0; x < g.width; x++) {
            bool border = x == 0 || y == 0 || x == g.width - 1 || y == g.height - 1;
            if (border)
                EXPECT_EQ(g.at(x, y), CellType::OBSTACLE);
            else if (g.at(x, y) == CellType::FREE)
                free_cells++;
        }
    }
    EXPECT_GT(free_cells, 0);
}

TEST(GridWorld, ConstructionFailsFast) {
    Grid g = parse_grid({"000", "000"});
    EXPECT_THROW((GridWorld(Grid(), Coordinates(0, 0), Coordinates(0, 0))), ConfigError);
    EXPECT_THROW((GridWorld(g, Coordinates(3, 0), Coordinates(0, 0))), ConfigError);
    EXPECT_THROW((GridWorld(g, Coordinates(0, 0), Coordinates(0, -1))), ConfigError);

    EnvConfig bad;
    bad.pheromone_decay = 1.0;
    EXPECT_THROW((GridWorld(g, Coordinates(0, 0), Coordinates(1, 1), bad)), ConfigError);
}

TEST(GridWorld, RejectsUnknownAction) {
    GridWorld env(parse_grid({"000"}), Coordinates(1, 0), Coordinates(2, 0));
    env.reset();
    EXPECT_THROW(env.step(8), std::out_of_range);
    EXPECT_THROW(env.step(-1), std::out_of_range);
}

TEST(GridWorld, ResetRestoresStartAndClearsPheromone) {
    GridWorld env(parse_grid({"0000", "0000"}), Coordinates(0, 0), Coordinates(3, 1), goal_only());
    env.step(3);
    env.step(3);
    EXPECT_GT(env.get_pheromone().at(2, 0), 0.0);

    Coordinates p = env.reset();
    EXPECT_EQ(p, Coordinates(0, 0));
    EXPECT_EQ(env.get_position(), Coordinates(0, 0));
    for (double v : env.get_pheromone().data()) {
        EXPECT_EQ(v, 0.0);
    }
}

TEST(GridWorld, WallHitClampsAndPenalizes) {
    GridWorld env(parse_grid({"000", "000", "000"}), Coordinates(0, 1), Coordinates(2, 2));
    env.reset();

    StepResult r = env.step(2);  // LEFT, off the grid
    EXPECT_TRUE(r.info.hit_wall);
    EXPECT_FALSE(r.info.hit_obstacle);
    EXPECT_FALSE(r.info.reached_goal);
    EXPECT_EQ(r.position, Coordinates(0, 1));
    EXPECT_NEAR(r.reward, -WALL_PENALTY - PHEROMONE_PENALTY * DEPOSIT_RATE, 1e-12);
    EXPECT_TRUE(r.done);
    EXPECT_EQ(env.termination(r), Termination::WALL);
}

TEST(GridWorld, DiagonalWallHitClampsToNearestCell) {
    GridWorld env(parse_grid({"000", "000", "000"}), Coordinates(0, 1), Coordinates(2, 2), goal_only());
    env.reset();

    StepResult r = env.step(4);  // UL
    EXPECT_TRUE(r.info.hit_wall);
    EXPECT_EQ(r.position, Coordinates(0, 0));
    EXPECT_FALSE(r.done);
    EXPECT_EQ(env.termination(r), Termination::NONE);
}

TEST(GridWorld, ClampedDiagonalOntoObstacleCountsAsObstacleHit) {
    EnvConfig c;
    c.terminate_on_wall = false;
    c.obstacles_block_movement = true;
    Grid g = parse_grid({"100", "000", "000"});

    GridWorld blocked(g, Coordinates(0, 1), Coordinates(2, 2), c);
    blocked.reset();
    StepResult r = blocked.step(4);  // UL, clamped onto (0, 0)
    EXPECT_TRUE(r.info.hit_wall);
    EXPECT_TRUE(r.info.hit_obstacle);
    EXPECT_EQ(r.position, Coordinates(0, 1));
    EXPECT_TRUE(r.done);
    EXPECT_EQ(blocked.termination(r), Termination::OBSTACLE);

    c.obstacles_block_movement = false;
    GridWorld open(g, Coordinates(0, 1), Coordinates(2, 2), c);
    open.reset();
    r = open.step(4);
    EXPECT_TRUE(r.info.hit_obstacle);
    EXPECT_EQ(r.position, Coordinates(0, 0));
    EXPECT_NEAR(r.reward, -OBSTACLE_PENALTY - WALL_PENALTY - PHEROMONE_PENALTY * DEPOSIT_RATE, 1e-12);
    EXPECT_TRUE(r.done);
}

TEST(GridWorld, ObstacleEntryPenalizesAndTerminates) {
    GridWorld env(parse_grid({"010", "000"}), Coordinates(0, 0), Coordinates(2, 1));
    env.reset();

    StepResult r = env.step(3);  // RIGHT onto the obstacle
    EXPECT_TRUE(r.info.hit_obstacle);
    EXPECT_FALSE(r.info.hit_wall);
    EXPECT_EQ(r.position, Coordinates(1, 0));
    EXPECT_NEAR(r.reward, -OBSTACLE_PENALTY - PHEROMONE_PENALTY * DEPOSIT_RATE, 1e-12);
    EXPECT_TRUE(r.done);
    EXPECT_EQ(env.termination(r), Termination::OBSTACLE);
}

TEST(GridWorld, GoalOnlyPolicyWalksOverObstacles) {
    GridWorld env(parse_grid({"010", "000"}), Coordinates(0, 0), Coordinates(2, 1), goal_only());
    env.reset();

    StepResult r = env.step(3);
    EXPECT_TRUE(r.info.hit_obstacle);
    EXPECT_EQ(r.position, Coordinates(1, 0));
    EXPECT_FALSE(r.done);
}

TEST(GridWorld, BlockingObstaclesKeepAgentInPlace) {
    EnvConfig c = goal_only();
    c.obstacles_block_movement = true;
    GridWorld env(parse_grid({"010", "000"}), Coordinates(0, 0), Coordinates(2, 1), c);
    env.reset();

    StepResult r = env.step(3);
    EXPECT_TRUE(r.info.hit_obstacle);
    EXPECT_EQ(r.position, Coordinates(0, 0));
    EXPECT_NEAR(r.reward, -OBSTACLE_PENALTY - PHEROMONE_PENALTY * DEPOSIT_RATE, 1e-12);
    EXPECT_FALSE(r.done);
}

TEST(GridWorld, ReachingGoalAddsBonusAndEnds) {
    GridWorld env(parse_grid({"000"}), Coordinates(0, 0), Coordinates(1, 0));
    env.reset();

    StepResult r = env.step(3);
    EXPECT_TRUE(r.info.reached_goal);
    EXPECT_TRUE(r.done);
    EXPECT_NEAR(r.reward, GOAL_BONUS - PHEROMONE_PENALTY * DEPOSIT_RATE, 1e-12);
    EXPECT_EQ(env.termination(r), Termination::GOAL);
}

TEST(GridWorld, SingleFreeCellGoalTerminatesWithoutMoving) {
    Grid g = parse_grid({"111", "101", "111"});
    EnvConfig c = goal_only();
    c.obstacles_block_movement = true;
    GridWorld env(g, Coordinates(1, 1), Coordinates(1, 1), c);

    for (int a = 0; a < N_ACTIONS; a++) {
        env.reset();
        StepResult r = env.step(a);
        EXPECT_EQ(r.position, Coordinates(1, 1));
        EXPECT_TRUE(r.info.reached_goal);
        EXPECT_TRUE(r.done);
    }
}

TEST(GridWorld, SingleFreeCellGoalIsLeftUnderDefaultPolicy) {
    GridWorld env(parse_grid({"111", "101", "111"}), Coordinates(1, 1), Coordinates(1, 1));

    for (int a = 0; a < N_ACTIONS; a++) {
        env.reset();
        StepResult r = env.step(a);
        EXPECT_NE(r.position, Coordinates(1, 1));
        EXPECT_FALSE(r.info.reached_goal);
        EXPECT_TRUE(r.info.hit_obstacle);
        EXPECT_TRUE(r.done);
    }
}

TEST(GridWorld, DecayAppliesToWholeFieldBeforeDeposit) {
    GridWorld env(parse_grid({"0000", "0000", "0000"}), Coordinates(1, 1), Coordinates(3, 2), goal_only());
    env.reset();
    env.step(3);
    env.step(1);
    env.step(2);

    std::vector<double> before = env.get_pheromone().data();
    StepResult r = env.step(0);  // back up to (1, 1)
    const PheromoneField& after = env.get_pheromone();

    for (int y = 0; y < 3; y++) {
        for (int x = 0; x < 4; x++) {
            double old = before[y * 4 + x] * PHEROMONE_DECAY;
            if (Coordinates(x, y) == r.position)
                EXPECT_DOUBLE_EQ(after.at(x, y), old + DEPOSIT_RATE * (1.0 - old));
            else
                EXPECT_DOUBLE_EQ(after.at(x, y), old);
        }
    }
}

TEST(GridWorld, PheromoneStaysWithinUnitInterval) {
    RNG rng(11);
    EnvConfig c = goal_only();
    c.deposit_rate = 1.0;
    c.pheromone_decay = 0.5;
    GridWorld env(random_grid(9, 7, 0.6, rng), Coordinates(4, 3), Coordinates(0, 0), c);
    env.reset();

    for (int t = 0; t < 3000; t++) {
        env.step(rng.random_int(0, N_ACTIONS - 1));
        for (double v : env.get_pheromone().data()) {
            ASSERT_GE(v, 0.0);
            ASSERT_LE(v, 1.0);
        }
    }
}

TEST(GridWorld, RevisitingIsPenalized) {
    GridWorld env(parse_grid({"000"}), Coordinates(0, 0), Coordinates(2, 0), goal_only());
    env.reset();

    double first = env.step(3).reward;   // to (1, 0)
    env.step(2);                         // back to (0, 0)
    double second = env.step(3).reward;  // (1, 0) again
    EXPECT_LT(second, first);
}
