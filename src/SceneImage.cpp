#include "SceneLoader.h"
#include "World.h"
#include <iostream>

#define STB_IMAGE_IMPLEMENTATION
// Scenes are at most one image pixel per cell
#define STBI_MAX_DIMENSIONS 16384
#include "stb_image.h"

bool loadSceneImage(World& world, const std::string& filepath) {
    int imgWidth, imgHeight, imgChannels;
    unsigned char* data = stbi_load(filepath.c_str(), &imgWidth, &imgHeight, &imgChannels, 4);  // Force RGBA

    if (!data) {
        std::cerr << "Failed to load scene: " << filepath << std::endl;
        std::cerr << "stbi error: " << stbi_failure_reason() << std::endl;
        return false;
    }

    if (imgWidth != world.width() || imgHeight != world.height()) {
        std::cout << "Scene " << filepath << " is " << imgWidth << "x" << imgHeight
                  << ", world is " << world.width() << "x" << world.height() << "; clipping\n";
    }

    int painted = paintSceneRGBA(world, data, imgWidth, imgHeight);
    stbi_image_free(data);

    std::cout << "Loaded scene " << filepath << " (" << painted << " cells)\n";
    return true;
}
