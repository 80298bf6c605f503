// Single-header library implementations used by MemoryHost.
#include <cmath>
#include <cstdio>
#include <cstring>

#define NANOSVG_IMPLEMENTATION
#include <nanosvg.h>

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>
