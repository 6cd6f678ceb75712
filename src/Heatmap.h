#pragma once
#include <cstdint>

// ARGB8888 color for a temperature in Celsius. Linear per-channel blend
// between fixed anchors from -273 C (deep violet) to 10000 C (white).
uint32_t heatmapColor(double tempC);
