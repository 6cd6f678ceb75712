#pragma once
#include "Material.h"
#include <cstdint>
#include <string>

class World;

// Palette material whose color is closest to (r, g, b). Returns false for
// pixels that should be left untouched (transparent or near black).
bool sceneMaterialForPixel(uint8_t r, uint8_t g, uint8_t b, uint8_t a, MaterialType& out);

// Paint an RGBA8 image into the world, top-left aligned and clipped to the
// grid. Returns the number of cells painted.
int paintSceneRGBA(World& world, const unsigned char* rgba, int imageWidth, int imageHeight);

// Load an image file with stb_image and paint it. Reports failures on stderr.
bool loadSceneImage(World& world, const std::string& filepath);
