#pragma once

// Window layout
#define CELL_SIZE 32          // Pixels per grid cell
#define HUD_LINE_HEIGHT 18
#define HUD_LINES 8           // Title, subtitle, controls, state detail lines
#define HUD_PADDING 10
#define MIN_WINDOW_WIDTH 640
#define FONT_SIZE 14

// Pheromone overlay: tile color is darkened by PHEROMONE_SHADE * P
#define PHEROMONE_SHADE 0.6

// Step delay bounds for UP/DOWN speed control (ms)
#define MIN_STEP_DELAY 1
#define MAX_STEP_DELAY 1000
