#include "tiler.hpp"

#include <string>

#include "errors.hpp"

static void check_size(int size)
{
    if(size <= 0)
        throw Invalid_configuration{"Tile size must be positive, got " + std::to_string(size)};
}

[[nodiscard]] std::vector<Tile> get_tiles(std::size_t width, std::size_t height, int size)
{
    check_size(size);
    const auto step = static_cast<std::size_t>(size);

    std::vector<Tile> tiles;
    tiles.reserve(((height + step - 1) / step) * ((width + step - 1) / step));

    for(std::size_t y = 0; y < height; y += step)
    {
        for(std::size_t x = 0; x < width; x += step)
            tiles.push_back(Tile{x, y, step});
    }

    return tiles;
}

[[nodiscard]] std::size_t get_column_count(std::size_t width, int size)
{
    check_size(size);
    return width / static_cast<std::size_t>(size);
}
