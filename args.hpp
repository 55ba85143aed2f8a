#ifndef ARGS_HPP
#define ARGS_HPP

#include <optional>
#include <string>

#include <cstdint>

#include "config.h"

struct Args
{
    std::string input_filename {"-"};             // - for stdin
    std::string output_filename {"output.html"};  // - for stdout
    std::optional<int> tile_size;                 // auto-sized when not set
    std::string bg {"#262626"};                   // CSS background color
    std::string text_color {"#ffffff"};           // glyph color in ASCII mode
    int font_size {24};                           // in px, before scaling
    std::string font_name {"monospace"};          // CSS font-family, and fontconfig pattern to measure
    std::string chars {"X"};                      // glyph pool for random mode
    std::optional<std::uint32_t> seed;            // for random glyph selection
    enum class Strategy {average, most_common} strategy {Strategy::average};
    enum class Color_space {rgb, monochrome} color_space {Color_space::rgb};
    enum class Glyph_mode {random, ascii} glyph_mode {Glyph_mode::random};
};

[[nodiscard]] bool is_css_color(const std::string & color);
[[nodiscard]] std::optional<Args> parse_args(int argc, char * argv[]);

#endif // ARGS_HPP
