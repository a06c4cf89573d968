#define DOCTEST_CONFIG_IMPLEMENT
#include "doctest/doctest.h"

#include <SDL.h>
#include <SDL_image.h>

#include <iostream>

#include "utils/log.hpp"

int main(int argc, char** argv) {
    if (SDL_Init(0) < 0) {
        std::cerr << "SDL_Init failed: " << SDL_GetError() << "\n";
        return 1;
    }
    IMG_Init(IMG_INIT_PNG);
    charsheet::log::set_level(charsheet::log::Level::Warn);

    doctest::Context context;
    context.applyCommandLine(argc, argv);
    const int result = context.run();

    IMG_Quit();
    SDL_Quit();
    return result;
}
