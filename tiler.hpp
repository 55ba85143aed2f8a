#ifndef TILER_HPP
#define TILER_HPP

#include <vector>

#include <cstddef>

// square region of the source image. May hang off the right / bottom edges
struct Tile
{
    std::size_t x{0}, y{0}, size{0};

    std::size_t area() const { return size * size; }
};

// row-major origins at multiples of size, for every origin inside the image
[[nodiscard]] std::vector<Tile> get_tiles(std::size_t width, std::size_t height, int size);

// floor division, so partial tiles at the right edge are not counted
[[nodiscard]] std::size_t get_column_count(std::size_t width, int size);

#endif // TILER_HPP
