#pragma once

// Grid generation defaults - 24x16 grid
#define GRID_WIDTH 24
#define GRID_HEIGHT 16
#define FREE_PROBABILITY 0.72  // Chance that an interior cell is free
#define START_X 1
#define START_Y 1
#define GOAL_X 22
#define GOAL_Y 14

// Environment configuration
#define PHEROMONE_DECAY 0.97   // Whole-field decay per step
#define DEPOSIT_RATE 0.6       // Fraction of the gap to 1.0 added on the occupied cell
#define PHEROMONE_PENALTY 1.0  // Loop-avoidance weight
#define OBSTACLE_PENALTY 1.0
#define WALL_PENALTY 5.0
#define GOAL_BONUS 50.0

// Featurizer configuration
#define VISION_RADIUS 1
#define OOB_TILE_VALUE -2.0       // Tile favorability outside the grid
#define OOB_PHEROMONE_VALUE 1.0   // Pheromone level outside the grid

// Learning configuration
#define NUM_EPISODES 220
#define MAX_EPISODE_STEPS 300
#define ALPHA 0.2
#define GAMMA 0.95
#define EPSILON 0.4
#define EPSILON_DECAY 0.995
#define EPSILON_MIN 0.01
#define RANDOM_SEED 42

// Cell states
enum class CellType : int {
    FREE = 0,
    OBSTACLE = 1
};

// Symbols used by the grid text format
constexpr char FREE_SYMBOL = '0';
constexpr char OBSTACLE_SYMBOL = '1';

// Action offsets: UP, DOWN, LEFT, RIGHT, UL, UR, DL, DR
constexpr int N_ACTIONS = 8;
constexpr int DX[N_ACTIONS] = {0, 0, -1, 1, -1, 1, -1, 1};
constexpr int DY[N_ACTIONS] = {-1, 1, 0, 0, -1, -1, 1, 1};
constexpr const char* ACTION_NAMES[N_ACTIONS] = {"UP", "DOWN", "LEFT", "RIGHT", "UL", "UR", "DL", "DR"};

// Quadrants around the agent: upper-left, upper-right, lower-right, lower-left
constexpr int N_QUADS = 4;
constexpr int QUAD_SX[N_QUADS] = {-1, 1, 1, -1};
constexpr int QUAD_SY[N_QUADS] = {-1, -1, 1, 1};
constexpr const char* QUAD_NAMES[N_QUADS] = {"UL", "UR", "DR", "DL"};
