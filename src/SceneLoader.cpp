#include "SceneLoader.h"
#include "World.h"
#include <algorithm>
#include <limits>

namespace {

// Pixels darker than this on every channel are treated as empty
constexpr int BLACK_THRESHOLD = 16;

} // namespace

bool sceneMaterialForPixel(uint8_t r, uint8_t g, uint8_t b, uint8_t a, MaterialType& out) {
    if (a < 128) return false;
    if (r < BLACK_THRESHOLD && g < BLACK_THRESHOLD && b < BLACK_THRESHOLD) return false;

    int bestDist = std::numeric_limits<int>::max();
    bool found = false;
    for (MaterialType type : Materials::paletteForUI()) {
        uint32_t argb = Materials::lookup(type).argb;
        int dr = static_cast<int>((argb >> 16) & 0xFF) - r;
        int dg = static_cast<int>((argb >> 8) & 0xFF) - g;
        int db = static_cast<int>(argb & 0xFF) - b;
        int dist = dr * dr + dg * dg + db * db;
        if (dist < bestDist) {
            bestDist = dist;
            out = type;
            found = true;
        }
    }
    return found;
}

int paintSceneRGBA(World& world, const unsigned char* rgba, int imageWidth, int imageHeight) {
    if (!rgba || imageWidth <= 0 || imageHeight <= 0) return 0;

    int w = std::min(imageWidth, world.width());
    int h = std::min(imageHeight, world.height());
    int painted = 0;

    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            const unsigned char* px = rgba + (static_cast<size_t>(y) * imageWidth + x) * 4;
            MaterialType type;
            if (!sceneMaterialForPixel(px[0], px[1], px[2], px[3], type)) continue;
            world.setCell(x, y, type);
            ++painted;
        }
    }
    return painted;
}
