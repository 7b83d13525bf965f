// Pheromone maze Q-learning with SDL2 visualization
// Uses the same core as the src_headless version

#include <SDL2/SDL.h>
#include <SDL2/SDL_ttf.h>

#include <algorithm>
#include <cstdio>
#include <iostream>
#include <string>
#include <vector>

#include "../src_headless/common/grid_world.hpp"
#include "../src_headless/common/observer.hpp"
#include "../src_headless/common/settings.hpp"
#include "../src_headless/common/training.hpp"
#include "color.hpp"
#include "config.hpp"

// ============================================================================
// View Class - SDL2 window acting as the training observer
// ============================================================================

class View : public Observer {
   public:
    SDL_Window* window;
    SDL_Renderer* renderer;
    TTF_Font* font;
    bool initialized;
    bool running;
    bool paused;
    bool show_pheromone;
    int step_delay_ms;

    const GridWorld& env;
    std::string title;
    std::string subtitle;
    std::vector<std::string> details;

    View(const GridWorld& env, int step_delay_ms)
        : window(nullptr),
          renderer(nullptr),
          font(nullptr),
          initialized(false),
          running(true),
          paused(false),
          show_pheromone(true),
          step_delay_ms(step_delay_ms),
          env(env) {}

    ~View() {
        cleanup();
    }

    int windowWidth() const {
        return std::max(MIN_WINDOW_WIDTH, env.get_width() * CELL_SIZE);
    }

    int windowHeight() const {
        return env.get_height() * CELL_SIZE + HUD_LINES * HUD_LINE_HEIGHT + 2 * HUD_PADDING;
    }

    bool init() {
        if (SDL_Init(SDL_INIT_VIDEO) < 0) {
            std::cerr << "SDL init failed: " << SDL_GetError() << std::endl;
            return false;
        }
        initialized = true;

        if (TTF_Init() < 0) {
            std::cerr << "TTF init failed: " << TTF_GetError() << std::endl;
            return false;
        }

        window = SDL_CreateWindow(
            "Pheromone Maze Q-Learning",
            SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
            windowWidth(), windowHeight(),
            SDL_WINDOW_SHOWN);

        if (!window) {
            std::cerr << "Window creation failed: " << SDL_GetError() << std::endl;
            return false;
        }

        renderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED);
        if (!renderer) {
            renderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_SOFTWARE);
        }
        if (!renderer) {
            std::cerr << "Renderer creation failed: " << SDL_GetError() << std::endl;
            return false;
        }

        const char* font_paths[] = {
            "/usr/share/fonts/truetype/dejavu/DejaVuSansMono.ttf",
            "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
            "/usr/share/fonts/TTF/DejaVuSans.ttf",
            "/usr/share/fonts/dejavu-sans-fonts/DejaVuSans.ttf",
            "/usr/share/fonts/truetype/freefont/FreeSans.ttf",
            nullptr};

        for (int i = 0; font_paths[i] != nullptr; ++i) {
            font = TTF_OpenFont(font_paths[i], FONT_SIZE);
            if (font)
                break;
        }

        if (!font) {
            std::cerr << "Warning: Could not load font, HUD will be disabled" << std::endl;
        }

        return true;
    }

    void cleanup() {
        if (!initialized)
            return;
        if (font)
            TTF_CloseFont(font);
        if (renderer)
            SDL_DestroyRenderer(renderer);
        if (window)
            SDL_DestroyWindow(window);
        font = nullptr;
        renderer = nullptr;
        window = nullptr;
        if (TTF_WasInit())
            TTF_Quit();
        SDL_Quit();
        initialized = false;
    }

    void handleEvents() {
        SDL_Event event;
        while (SDL_PollEvent(&event)) {
            if (event.type == SDL_QUIT) {
                running = false;
            } else if (event.type == SDL_KEYDOWN) {
                switch (event.key.keysym.sym) {
                    case SDLK_ESCAPE:
                    case SDLK_q:
                        running = false;
                        break;
                    case SDLK_SPACE:
                        paused = !paused;
                        break;
                    case SDLK_p:
                        show_pheromone = !show_pheromone;
                        break;
                    case SDLK_UP:
                        step_delay_ms = std::max(step_delay_ms / 2, MIN_STEP_DELAY);
                        break;
                    case SDLK_DOWN:
                        step_delay_ms = std::min(std::max(step_delay_ms, MIN_STEP_DELAY) * 2, MAX_STEP_DELAY);
                        break;
                }
            }
        }
    }

    void fillCell(int x, int y, const rgb& c) {
        SDL_Rect rect = {x * CELL_SIZE, y * CELL_SIZE, CELL_SIZE, CELL_SIZE};
        SDL_SetRenderDrawColor(renderer, c.r, c.g, c.b, c.a);
        SDL_RenderFillRect(renderer, &rect);
    }

    void render() {
        rgb bg = background_color();
        SDL_SetRenderDrawColor(renderer, bg.r, bg.g, bg.b, bg.a);
        SDL_RenderClear(renderer);

        const PheromoneField& pheromone = env.get_pheromone();
        for (int y = 0; y < env.get_height(); y++) {
            for (int x = 0; x < env.get_width(); x++) {
                fillCell(x, y, cell_color(env.cell(x, y), pheromone.at(x, y), show_pheromone));
            }
        }

        Coordinates goal = env.get_goal();
        fillCell(goal.x, goal.y, goal_color());

        Coordinates agent = env.get_position();
        fillCell(agent.x, agent.y, agent_color());

        renderHUD();

        SDL_RenderPresent(renderer);
    }

    void renderHUD() {
        if (!font)
            return;

        SDL_Color white = {255, 255, 255, 255};
        SDL_Color yellow = {255, 255, 0, 255};
        SDL_Color grey = {170, 170, 170, 255};

        int y = env.get_height() * CELL_SIZE + HUD_PADDING;
        renderText(title, HUD_PADDING, y, paused ? yellow : white);
        y += HUD_LINE_HEIGHT;
        renderText(subtitle, HUD_PADDING, y, white);
        y += HUD_LINE_HEIGHT;

        char text[256];
        snprintf(text, sizeof(text), "SPACE=%s  P=Pheromone  UP/DOWN=Speed (%d ms)  Q=Quit",
                 paused ? "Resume" : "Pause", step_delay_ms);
        renderText(text, HUD_PADDING, y, grey);
        y += HUD_LINE_HEIGHT;

        for (size_t i = 0; i < details.size() && i + 3 < HUD_LINES; i++) {
            renderText(details[i], HUD_PADDING, y, white);
            y += HUD_LINE_HEIGHT;
        }
    }

    void renderText(const std::string& text, int x, int y, SDL_Color color) {
        if (text.empty())
            return;
        SDL_Surface* surface = TTF_RenderText_Blended(font, text.c_str(), color);
        if (surface) {
            SDL_Texture* texture = SDL_CreateTextureFromSurface(renderer, surface);
            if (texture) {
                SDL_Rect dst = {x, y, surface->w, surface->h};
                SDL_RenderCopy(renderer, texture, nullptr, &dst);
                SDL_DestroyTexture(texture);
            }
            SDL_FreeSurface(surface);
        }
    }

    // Blocks while paused; returns false once the user asked to quit
    bool report(const std::string& t, const std::string& s, const std::vector<std::string>& lines) override {
        title = t;
        subtitle = s;
        details = lines;

        handleEvents();
        render();
        while (paused && running) {
            SDL_Delay(30);
            handleEvents();
            render();
        }

        if (running && step_delay_ms > 0)
            SDL_Delay(step_delay_ms);
        return running;
    }

    // Keeps the final frame on screen until the window is closed
    void hold() {
        while (running) {
            handleEvents();
            render();
            SDL_Delay(30);
        }
    }

    void close() override {
        cleanup();
    }
};

int main(int argc, char* argv[]) {
    Settings settings;
    try {
        settings = parse_settings(argc, argv);
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    }

    RNG rng(settings.train.seed);

    try {
        Grid grid = random_grid(settings.grid.width, settings.grid.height, settings.grid.free_prob, rng);
        // Start and goal are always standable
        if (grid.in_bounds(settings.grid.start.x, settings.grid.start.y))
            grid.set(settings.grid.start.x, settings.grid.start.y, CellType::FREE);
        if (grid.in_bounds(settings.grid.goal.x, settings.grid.goal.y))
            grid.set(settings.grid.goal.x, settings.grid.goal.y, CellType::FREE);
        GridWorld env(grid, settings.grid.start, settings.grid.goal, settings.env);

        std::cout << "=== Pheromone Maze Q-Learning (Visualization) ===" << std::endl;
        std::cout << "Grid: " << settings.grid.width << "x" << settings.grid.height << std::endl;
        std::cout << "Episodes: " << settings.train.episodes << std::endl;
        std::cout << "Random seed: " << settings.train.seed << std::endl;
        std::cout << std::endl;
        std::cout << "Controls:" << std::endl;
        std::cout << "  SPACE - Pause/Resume" << std::endl;
        std::cout << "  P     - Toggle pheromone overlay" << std::endl;
        std::cout << "  UP    - Faster" << std::endl;
        std::cout << "  DOWN  - Slower" << std::endl;
        std::cout << "  Q/ESC - Quit" << std::endl;
        std::cout << "==================================================" << std::endl;

        View view(env, settings.step_delay_ms);
        if (!view.init()) {
            std::cerr << "Failed to initialize view" << std::endl;
            return 1;
        }

        TrainingStats stats;
        QTable q = q_learning(env, settings.train, settings.features, rng, &view, &stats);
        std::cout << "Training: " << stats.episodes.size() << " episodes, " << q.size() << " states"
                  << (stats.stopped ? " (stopped)" : "") << std::endl;

        if (view.running) {
            RolloutResult result = greedy_run(env, q, settings.train.max_steps, settings.features, rng, &view);
            std::cout << "Greedy rollout: " << (result.success ? "reached goal" : termination_name(result.reason))
                      << " in " << result.steps << " steps, total reward " << result.total_reward << std::endl;
            view.hold();
        }

        view.close();
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
