#include "mosaic.hpp"

#include <iostream>
#include <optional>
#include <string>

#include "errors.hpp"
#include "summarize.hpp"
#include "tile_size.hpp"
#include "tiler.hpp"

[[nodiscard]] int resolve_tile_size(const Args & args, std::size_t width, std::size_t height)
{
    if(!args.tile_size)
        return auto_tile_size(width, height);

    auto size = *args.tile_size;
    if(size <= 0)
        throw Invalid_configuration{"Tile size must be positive, got " + std::to_string(size)};

    if(!is_common_divisor(size, width, height))
    {
        auto divisors = common_divisors(width, height);
        auto [below, above] = nearest_divisors(divisors, size);

        std::cerr<<"WARNING: size "<<size<<" does not evenly divide the image ("<<width<<"x"<<height<<"). The output may look slanted.\n";
        std::cerr<<"  Nearest sizes that do:";
        if(below)
            std::cerr<<' '<<*below;
        if(above)
            std::cerr<<' '<<*above;
        std::cerr<<"\n  All sizes that do:";
        for(auto && d: divisors)
            std::cerr<<' '<<d;
        std::cerr<<'\n';
    }

    return size;
}

[[nodiscard]] Conversion_result convert_image(const Image & img, int tile_size, const Args & args,
                                              const Darkness_table & darkness, std::mt19937 & rng)
{
    // build before any tile work, so an empty pool fails fast
    std::optional<Glyph_pool> pool;
    if(args.glyph_mode == Args::Glyph_mode::random)
        pool.emplace(args.chars, rng);

    Conversion_result result;
    result.columns = get_column_count(img.get_width(), tile_size);

    auto tiles = get_tiles(img.get_width(), img.get_height(), tile_size);
    result.cells.reserve(std::size(tiles));

    for(auto && tile: tiles)
    {
        auto color = summarize_colors(img.get_colors(tile), tile.area(), args.strategy, args.color_space);

        if(args.glyph_mode == Args::Glyph_mode::ascii)
        {
            auto luminance = (args.color_space == Args::Color_space::monochrome) ? color.r : color.to_luma();
            auto glyph = find_closest_glyph(darkness, static_cast<float>(luminance) / 255.0f);
            result.cells.push_back({escape_markup(std::string{glyph}), args.text_color});
        }
        else
        {
            result.cells.push_back({escape_markup(pool->pick()), color.to_hex()});
        }
    }

    return result;
}
