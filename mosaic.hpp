#ifndef MOSAIC_HPP
#define MOSAIC_HPP

#include <random>
#include <string>
#include <vector>

#include "args.hpp"
#include "glyph.hpp"
#include "codecs/image.hpp"

struct Cell
{
    std::string glyph; // already escaped for HTML
    std::string color; // CSS color
};

struct Conversion_result
{
    std::vector<Cell> cells; // one per tile, row-major
    std::size_t columns{0};
};

// Explicit --size if set, otherwise auto_tile_size. Warns on stderr when an
// explicit size doesn't divide the image, but still uses it
[[nodiscard]] int resolve_tile_size(const Args & args, std::size_t width, std::size_t height);

[[nodiscard]] Conversion_result convert_image(const Image & img, int tile_size, const Args & args,
                                              const Darkness_table & darkness, std::mt19937 & rng);

#endif // MOSAIC_HPP
