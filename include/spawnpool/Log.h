#pragma once
#include <SDL3/SDL.h>

// SDL log category used for every diagnostic raised by spawnpool.
enum {
	SPAWNPOOL_LOG_CATEGORY = SDL_LOG_CATEGORY_CUSTOM
};
