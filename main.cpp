// Convert an image input to a character mosaic HTML page
#include <iostream>
#include <random>
#include <stdexcept>

#include <cstdlib>

#include "args.hpp"
#include "font.hpp"
#include "html.hpp"
#include "mosaic.hpp"
#include "codecs/image.hpp"

int main(int argc, char * argv[])
{
    auto args = parse_args(argc, argv);
    if(!args)
        return EXIT_FAILURE;

    try
    {
        auto darkness = default_darkness_table();
        if(args->glyph_mode == Args::Glyph_mode::ascii && args->font_name != "monospace")
            darkness = get_darkness_table(get_font_path(args->font_name), 12.0f);

        std::mt19937 rng {args->seed ? *args->seed : std::random_device{}()};

        Conversion_result result;
        {
            auto img = get_image_data(*args);

            auto tile_size = resolve_tile_size(*args, img.get_width(), img.get_height());
            result = convert_image(img, tile_size, *args, darkness, rng);
        }

        write_html(result, *args);
    }
    catch(const std::runtime_error & e)
    {
        std::cerr<<e.what()<<'\n';
        return EXIT_FAILURE;
    }
    catch(const std::logic_error & e)
    {
        std::cerr<<"Internal error: "<<e.what()<<'\n';
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
