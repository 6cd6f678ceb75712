#include <SDL2/SDL.h>
#include <SDL2/SDL_ttf.h>
#include <iostream>
#include <sstream>
#include <iomanip>
#include <string>
#include <cmath>
#include <vector>
#include <algorithm>
#include "Config.h"
#include "DebugLog.h"
#include "Material.h"
#include "SceneLoader.h"
#include "SimulationError.h"
#include "World.h"

struct UIDropdown {
    SDL_Rect rect;
    bool isOpen;
    int selectedIndex;
    std::vector<std::string> options;
    std::vector<MaterialType> types;
};

struct CachedText {
    SDL_Texture* texture;
    std::string text;
    int width, height;

    CachedText() : texture(nullptr), text(""), width(0), height(0) {}

    ~CachedText() {
        if (texture) SDL_DestroyTexture(texture);
    }
};

enum class PaintMode : unsigned char {
    MATERIAL,
    TEMPERATURE
};

void drawText(SDL_Renderer* renderer, TTF_Font* font, const std::string& text, int x, int y, SDL_Color color) {
    SDL_Surface* surface = TTF_RenderText_Solid(font, text.c_str(), color);
    if (!surface) return;

    SDL_Texture* texture = SDL_CreateTextureFromSurface(renderer, surface);
    if (!texture) {
        SDL_FreeSurface(surface);
        return;
    }

    SDL_Rect dstRect = {x, y, surface->w, surface->h};
    SDL_RenderCopy(renderer, texture, nullptr, &dstRect);

    SDL_DestroyTexture(texture);
    SDL_FreeSurface(surface);
}

void drawCachedText(SDL_Renderer* renderer, TTF_Font* font, CachedText& cache,
                    const std::string& text, int x, int y, SDL_Color color) {
    if (cache.text != text || cache.texture == nullptr) {
        if (cache.texture) {
            SDL_DestroyTexture(cache.texture);
            cache.texture = nullptr;
        }

        SDL_Surface* surface = TTF_RenderText_Solid(font, text.c_str(), color);
        if (!surface) return;

        cache.texture = SDL_CreateTextureFromSurface(renderer, surface);
        cache.width = surface->w;
        cache.height = surface->h;
        cache.text = text;

        SDL_FreeSurface(surface);
    }

    if (cache.texture) {
        SDL_Rect dstRect = {x, y, cache.width, cache.height};
        SDL_RenderCopy(renderer, cache.texture, nullptr, &dstRect);
    }
}

void drawDropdown(SDL_Renderer* renderer, TTF_Font* font, const UIDropdown& dropdown) {
    SDL_SetRenderDrawColor(renderer, 60, 60, 60, 255);
    SDL_RenderFillRect(renderer, &dropdown.rect);
    SDL_SetRenderDrawColor(renderer, 200, 200, 200, 255);
    SDL_RenderDrawRect(renderer, &dropdown.rect);

    SDL_Color textColor = {255, 255, 255, 255};
    drawText(renderer, font, dropdown.options[dropdown.selectedIndex],
             dropdown.rect.x + 5, dropdown.rect.y + 5, textColor);

    drawText(renderer, font, "v",
             dropdown.rect.x + dropdown.rect.w - 20, dropdown.rect.y + 5, textColor);

    if (dropdown.isOpen) {
        for (size_t i = 0; i < dropdown.options.size(); ++i) {
            SDL_Rect optionRect = {
                dropdown.rect.x,
                dropdown.rect.y + dropdown.rect.h * (int)(i + 1),
                dropdown.rect.w,
                dropdown.rect.h
            };

            if ((int)i == dropdown.selectedIndex) {
                SDL_SetRenderDrawColor(renderer, 80, 80, 80, 255);
            } else {
                SDL_SetRenderDrawColor(renderer, 50, 50, 50, 255);
            }
            SDL_RenderFillRect(renderer, &optionRect);

            SDL_SetRenderDrawColor(renderer, 200, 200, 200, 255);
            SDL_RenderDrawRect(renderer, &optionRect);

            drawText(renderer, font, dropdown.options[i],
                     optionRect.x + 5, optionRect.y + 5, textColor);
        }
    }
}

bool handleDropdownClick(UIDropdown& dropdown, int mouseX, int mouseY) {
    if (mouseX >= dropdown.rect.x && mouseX < dropdown.rect.x + dropdown.rect.w &&
        mouseY >= dropdown.rect.y && mouseY < dropdown.rect.y + dropdown.rect.h) {
        dropdown.isOpen = !dropdown.isOpen;
        return true;
    }

    if (dropdown.isOpen) {
        for (size_t i = 0; i < dropdown.options.size(); ++i) {
            SDL_Rect optionRect = {
                dropdown.rect.x,
                dropdown.rect.y + dropdown.rect.h * (int)(i + 1),
                dropdown.rect.w,
                dropdown.rect.h
            };

            if (mouseX >= optionRect.x && mouseX < optionRect.x + optionRect.w &&
                mouseY >= optionRect.y && mouseY < optionRect.y + optionRect.h) {
                dropdown.selectedIndex = i;
                dropdown.isOpen = false;
                return true;
            }
        }
    }

    return false;
}

bool dropdownContains(const UIDropdown& dropdown, int mouseX, int mouseY) {
    int rows = dropdown.isOpen ? (int)dropdown.options.size() + 1 : 1;
    return mouseX >= dropdown.rect.x && mouseX < dropdown.rect.x + dropdown.rect.w &&
           mouseY >= dropdown.rect.y && mouseY < dropdown.rect.y + dropdown.rect.h * rows;
}

// Window pixel -> grid cell through the integer view scale
bool screenToGrid(const World& world, int viewScale, int screenX, int screenY, int& gridX, int& gridY) {
    if (viewScale <= 0) return false;
    gridX = screenX / viewScale;
    gridY = screenY / viewScale;
    return world.inBounds(gridX, gridY);
}

std::string formatNumber(double value, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

void resetWorld(World& world) {
    world.clear();
    world.fillBorder(MaterialType::BEDROCK);
}

int main(int argc, char* argv[]) {
    Config config;
    const char* rulesPath = argc > 1 ? argv[1] : "rules.txt";
    if (!config.loadFromFile(rulesPath)) {
        std::cout << "Using default configuration\n";
    }

    DebugLog log(config.logFile, DebugLog::parseLevel(config.logLevel));
    if (!log.isOpen()) {
        std::cerr << "Warning: Could not open log file " << config.logFile << "\n";
    }

    if (SDL_Init(SDL_INIT_VIDEO) < 0) {
        std::cerr << "SDL initialization failed: " << SDL_GetError() << "\n";
        return 1;
    }

    if (TTF_Init() < 0) {
        std::cerr << "SDL_ttf initialization failed: " << TTF_GetError() << "\n";
        SDL_Quit();
        return 1;
    }

    int windowWidth = config.worldWidth * config.viewScale;
    int windowHeight = config.worldHeight * config.viewScale;

    SDL_Window* window = SDL_CreateWindow(
        "Thermosand",
        SDL_WINDOWPOS_CENTERED,
        SDL_WINDOWPOS_CENTERED,
        windowWidth,
        windowHeight,
        SDL_WINDOW_SHOWN
    );

    if (!window) {
        std::cerr << "Window creation failed: " << SDL_GetError() << "\n";
        TTF_Quit();
        SDL_Quit();
        return 1;
    }

    SDL_Renderer* renderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED);
    if (!renderer) {
        std::cerr << "Renderer creation failed: " << SDL_GetError() << "\n";
        SDL_DestroyWindow(window);
        TTF_Quit();
        SDL_Quit();
        return 1;
    }

    TTF_Font* font = TTF_OpenFont(config.fontPath.c_str(), 14);
    if (!font) {
        std::cerr << "Font loading failed: " << TTF_GetError() << "\n";
        SDL_DestroyRenderer(renderer);
        SDL_DestroyWindow(window);
        TTF_Quit();
        SDL_Quit();
        return 1;
    }

    TTF_Font* smallFont = TTF_OpenFont(config.fontPath.c_str(), 10);
    if (!smallFont) {
        std::cerr << "Small font loading failed: " << TTF_GetError() << "\n";
        TTF_CloseFont(font);
        SDL_DestroyRenderer(renderer);
        SDL_DestroyWindow(window);
        TTF_Quit();
        SDL_Quit();
        return 1;
    }

    // Grid texture, scaled up by the renderer
    SDL_Texture* gridTexture = SDL_CreateTexture(
        renderer,
        SDL_PIXELFORMAT_ARGB8888,
        SDL_TEXTUREACCESS_STREAMING,
        config.worldWidth,
        config.worldHeight
    );
    if (!gridTexture) {
        std::cerr << "Grid texture creation failed: " << SDL_GetError() << "\n";
        TTF_CloseFont(smallFont);
        TTF_CloseFont(font);
        SDL_DestroyRenderer(renderer);
        SDL_DestroyWindow(window);
        TTF_Quit();
        SDL_Quit();
        return 1;
    }

    World world(config.worldWidth, config.worldHeight, config.seed, config.thermo);
    world.setDebugLog(&log);
    world.setAmbientTemperatureC(config.ambientTemperatureC);
    world.setAmbientPressurePa(config.ambientPressurePa);
    resetWorld(world);

    if (!config.sceneImage.empty()) {
        if (loadSceneImage(world, config.sceneImage)) {
            world.fillBorder(MaterialType::BEDROCK);
        }
    }

    std::vector<Uint32> pixels(world.cellCount());

    // Setup material dropdown
    UIDropdown dropdown;
    dropdown.rect = {10, 10, 130, 26};
    dropdown.isOpen = false;
    dropdown.selectedIndex = 0;
    for (MaterialType type : Materials::paletteForUI()) {
        dropdown.options.push_back(Materials::lookup(type).name);
        dropdown.types.push_back(type);
    }

    bool running = true;
    bool paused = false;
    bool heatmap = false;
    bool singleStep = false;
    PaintMode paintMode = PaintMode::MATERIAL;
    int brushRadius = config.brushRadius;
    double brushTempC = config.temperatureBrushC;
    uint64_t seed = config.seed;

    bool leftHeld = false, rightHeld = false;
    int mouseX = 0, mouseY = 0;

    const double tickSeconds = config.thermo.tickSeconds;
    double accumulator = 0.0;
    int stepsThisFrame = 0;

    Uint32 fpsTimer = SDL_GetTicks();
    int frameCount = 0;
    float currentFPS = 0.0f;

    Uint32 lastFrameTime = SDL_GetTicks();

    CachedText fpsCache, stepsCache, sizeCache, ambientCache, brushCache, hoverCache, modeCache;
    std::vector<CachedText> countCaches(Materials::COUNT);

    while (running) {
        Uint32 frameStart = SDL_GetTicks();
        double deltaTime = (frameStart - lastFrameTime) / 1000.0;
        lastFrameTime = frameStart;

        SDL_Event event;
        while (SDL_PollEvent(&event)) {
            if (event.type == SDL_QUIT) {
                running = false;
            }
            else if (event.type == SDL_KEYDOWN) {
                switch (event.key.keysym.sym) {
                    case SDLK_ESCAPE:
                        running = false;
                        break;
                    case SDLK_m:
                        paintMode = (paintMode == PaintMode::MATERIAL) ? PaintMode::TEMPERATURE : PaintMode::MATERIAL;
                        break;
                    case SDLK_h:
                        heatmap = !heatmap;
                        break;
                    case SDLK_SPACE:
                        paused = !paused;
                        break;
                    case SDLK_n:
                        singleStep = true;
                        break;
                    case SDLK_c:
                        resetWorld(world);
                        log.info("World cleared");
                        break;
                    case SDLK_r:
                        ++seed;
                        world.reseed(seed);
                        resetWorld(world);
                        break;
                    case SDLK_UP:
                        brushTempC = std::min(brushTempC + 50.0, ThermoConstants::MAX_TEMP_C);
                        break;
                    case SDLK_DOWN:
                        brushTempC = std::max(brushTempC - 50.0, ThermoConstants::MIN_TEMP_C);
                        break;
                    case SDLK_RIGHTBRACKET:
                        world.setAmbientTemperatureC(world.ambientTemperature() + 10.0);
                        break;
                    case SDLK_LEFTBRACKET:
                        world.setAmbientTemperatureC(world.ambientTemperature() - 10.0);
                        break;
                    case SDLK_PERIOD:
                        world.setAmbientPressurePa(world.ambientPressure() + 10000.0);
                        break;
                    case SDLK_COMMA:
                        world.setAmbientPressurePa(world.ambientPressure() - 10000.0);
                        break;
                }
            }
            else if (event.type == SDL_MOUSEBUTTONDOWN) {
                if (event.button.button == SDL_BUTTON_LEFT) {
                    if (!handleDropdownClick(dropdown, event.button.x, event.button.y)) {
                        leftHeld = true;
                    }
                } else if (event.button.button == SDL_BUTTON_RIGHT) {
                    rightHeld = true;
                }
            }
            else if (event.type == SDL_MOUSEBUTTONUP) {
                if (event.button.button == SDL_BUTTON_LEFT) leftHeld = false;
                else if (event.button.button == SDL_BUTTON_RIGHT) rightHeld = false;
            }
            else if (event.type == SDL_MOUSEMOTION) {
                mouseX = event.motion.x;
                mouseY = event.motion.y;
            }
            else if (event.type == SDL_MOUSEWHEEL) {
                brushRadius = std::clamp(brushRadius + event.wheel.y, 0, 64);
            }
        }

        // ==================== Painting ====================
        int gridX, gridY;
        bool overGrid = screenToGrid(world, config.viewScale, mouseX, mouseY, gridX, gridY);
        if (overGrid && (leftHeld || rightHeld) && !dropdownContains(dropdown, mouseX, mouseY)) {
            MaterialType selected = dropdown.types[dropdown.selectedIndex];
            try {
                if (paintMode == PaintMode::MATERIAL) {
                    if (leftHeld) world.paintCircleWithTemperature(gridX, gridY, brushRadius, selected, brushTempC);
                    else world.paintCircle(gridX, gridY, brushRadius, MaterialType::AIR);
                } else {
                    double t = leftHeld ? brushTempC : world.ambientTemperature();
                    world.paintTemperatureCircle(gridX, gridY, brushRadius, t);
                }
                world.fillBorder(MaterialType::BEDROCK);
            } catch (const InvalidArgument& e) {
                std::cerr << "Paint failed: " << e.what() << "\n";
                log.error(std::string("Paint failed: ") + e.what());
            }

            if (log.enabled(DebugLog::Level::Debug)) {
                std::ostringstream oss;
                oss << "paint " << (paintMode == PaintMode::MATERIAL ? "material" : "temperature")
                    << " at (" << gridX << "," << gridY << ") r=" << brushRadius
                    << " t=" << brushTempC << (rightHeld ? " erase" : "");
                log.debug(oss.str());
            }
        }

        // ==================== Simulation ====================
        stepsThisFrame = 0;
        if (!paused) {
            accumulator += std::min(deltaTime, config.maxFrameSeconds);
            while (accumulator >= tickSeconds && stepsThisFrame < config.maxStepsPerFrame) {
                world.step();
                accumulator -= tickSeconds;
                ++stepsThisFrame;
            }
            // Drop the backlog rather than spiral
            if (stepsThisFrame == config.maxStepsPerFrame) {
                accumulator = std::min(accumulator, tickSeconds);
            }
        } else {
            accumulator = 0.0;
            if (singleStep) {
                world.step();
                stepsThisFrame = 1;
            }
        }
        singleStep = false;

        // ==================== Rendering ====================
        if (heatmap) world.renderTemperatureHeatmapTo(pixels);
        else world.renderMaterialsTo(pixels);

        SDL_UpdateTexture(gridTexture, nullptr, pixels.data(), world.width() * sizeof(Uint32));

        SDL_SetRenderDrawColor(renderer, 0, 0, 0, 255);
        SDL_RenderClear(renderer);
        SDL_RenderCopy(renderer, gridTexture, nullptr, nullptr);

        // Brush outline
        if (overGrid) {
            SDL_SetRenderDrawColor(renderer, 255, 255, 255, 255);
            int cx = gridX * config.viewScale + config.viewScale / 2;
            int cy = gridY * config.viewScale + config.viewScale / 2;
            int r = brushRadius * config.viewScale + config.viewScale / 2;
            for (int angle = 0; angle < 360; angle += 15) {
                float rad1 = angle * M_PI / 180.0f;
                float rad2 = (angle + 15) * M_PI / 180.0f;
                SDL_RenderDrawLine(renderer,
                                   cx + (int)(std::cos(rad1) * r), cy + (int)(std::sin(rad1) * r),
                                   cx + (int)(std::cos(rad2) * r), cy + (int)(std::sin(rad2) * r));
            }
        }

        // Update FPS counter
        frameCount++;
        Uint32 currentTime = SDL_GetTicks();
        if (currentTime - fpsTimer >= 1000) {
            currentFPS = frameCount / ((currentTime - fpsTimer) / 1000.0f);
            frameCount = 0;
            fpsTimer = currentTime;
        }

        // Draw stats
        SDL_Color whiteColor = {255, 255, 255, 255};
        int textY = windowHeight - 15;
        drawCachedText(renderer, smallFont, fpsCache, "FPS: " + std::to_string((int)currentFPS), 5, textY, whiteColor);
        textY -= 13;
        drawCachedText(renderer, smallFont, stepsCache,
                       "Ticks/frame: " + std::to_string(stepsThisFrame) + (paused ? " (paused)" : ""),
                       5, textY, whiteColor);
        textY -= 13;
        drawCachedText(renderer, smallFont, sizeCache,
                       "World: " + std::to_string(world.width()) + "x" + std::to_string(world.height()),
                       5, textY, whiteColor);
        textY -= 13;
        drawCachedText(renderer, smallFont, ambientCache,
                       "Ambient: " + formatNumber(world.ambientTemperature(), 0) + " C, " +
                       formatNumber(world.ambientPressure() / 100000.0, 2) + " bar",
                       5, textY, whiteColor);
        textY -= 13;
        drawCachedText(renderer, smallFont, brushCache,
                       "Brush: r=" + std::to_string(brushRadius) + " t=" + formatNumber(brushTempC, 0) + " C",
                       5, textY, whiteColor);
        textY -= 13;
        drawCachedText(renderer, smallFont, modeCache,
                       std::string("Mode: ") + (paintMode == PaintMode::MATERIAL ? "material" : "temperature") +
                       (heatmap ? " [heatmap]" : ""),
                       5, textY, whiteColor);

        if (overGrid) {
            const MaterialDefinition& hovered = Materials::lookup(world.materialAt(gridX, gridY));
            drawCachedText(renderer, smallFont, hoverCache,
                           std::string(hovered.name) + " " + formatNumber(world.temperatureAt(gridX, gridY), 1) + " C",
                           5, textY - 13, whiteColor);
        }

        // Material counts
        int yOffset = 5;
        int xPos = windowWidth - 120;
        for (int id = 1; id <= Materials::MAX_ID; ++id) {
            const MaterialDefinition& def = Materials::lookup(id);
            int count = world.countMaterial(def.id);
            if (count == 0) continue;
            SDL_Color color = {(Uint8)((def.argb >> 16) & 0xFF), (Uint8)((def.argb >> 8) & 0xFF), (Uint8)(def.argb & 0xFF), 255};
            drawCachedText(renderer, smallFont, countCaches[id],
                           std::string(def.name) + ": " + std::to_string(count), xPos, yOffset, color);
            yOffset += 12;
        }

        drawDropdown(renderer, font, dropdown);

        SDL_RenderPresent(renderer);

        // Cap the loop near the tick rate
        Uint32 frameTime = SDL_GetTicks() - frameStart;
        int frameDelay = (int)(tickSeconds * 1000.0);
        if (frameDelay > (int)frameTime) {
            SDL_Delay(frameDelay - frameTime);
        }
    }

    // Cached textures belong to the renderer; release them before it goes
    for (CachedText* cache : {&fpsCache, &stepsCache, &sizeCache, &ambientCache, &brushCache, &hoverCache, &modeCache}) {
        if (cache->texture) SDL_DestroyTexture(cache->texture);
        cache->texture = nullptr;
    }
    countCaches.clear();

    TTF_CloseFont(smallFont);
    TTF_CloseFont(font);
    SDL_DestroyTexture(gridTexture);
    SDL_DestroyRenderer(renderer);
    SDL_DestroyWindow(window);
    TTF_Quit();
    SDL_Quit();

    return 0;
}
