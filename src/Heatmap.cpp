#include "Heatmap.h"
#include <cmath>

namespace {

struct HeatAnchor {
    double tempC;
    uint32_t argb;
};

constexpr HeatAnchor ANCHORS[] = {
    {-273.0,  0xFF140028},
    {0.0,     0xFF0050FF},
    {100.0,   0xFF00E0A0},
    {500.0,   0xFFFFE000},
    {1000.0,  0xFFFF4000},
    {3000.0,  0xFFFFB0B0},
    {10000.0, 0xFFFFFFFF},
};

constexpr int ANCHOR_COUNT = sizeof(ANCHORS) / sizeof(ANCHORS[0]);

uint32_t lerpChannel(uint32_t a, uint32_t b, int shift, double t) {
    double ca = static_cast<double>((a >> shift) & 0xFF);
    double cb = static_cast<double>((b >> shift) & 0xFF);
    long v = std::lround(ca + (cb - ca) * t);
    if (v < 0) v = 0;
    if (v > 255) v = 255;
    return static_cast<uint32_t>(v) << shift;
}

} // namespace

uint32_t heatmapColor(double tempC) {
    if (std::isnan(tempC) || tempC <= ANCHORS[0].tempC) return ANCHORS[0].argb;
    if (tempC >= ANCHORS[ANCHOR_COUNT - 1].tempC) return ANCHORS[ANCHOR_COUNT - 1].argb;

    for (int i = 1; i < ANCHOR_COUNT; ++i) {
        if (tempC > ANCHORS[i].tempC) continue;
        const HeatAnchor& lo = ANCHORS[i - 1];
        const HeatAnchor& hi = ANCHORS[i];
        double t = (tempC - lo.tempC) / (hi.tempC - lo.tempC);
        return lerpChannel(lo.argb, hi.argb, 24, t) |
               lerpChannel(lo.argb, hi.argb, 16, t) |
               lerpChannel(lo.argb, hi.argb, 8, t) |
               lerpChannel(lo.argb, hi.argb, 0, t);
    }
    return ANCHORS[ANCHOR_COUNT - 1].argb;
}
