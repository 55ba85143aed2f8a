#ifndef FONT_HPP
#define FONT_HPP

#include <string>

#include "glyph.hpp"

// path of the first monospace font matching font_name. Empty if not built with fontconfig
[[nodiscard]] std::string get_font_path(const std::string & font_name);

// Rasterize the printable ASCII chars and rank them by ink coverage. Falls
// back to the built-in table when font_path is empty or freetype is missing
[[nodiscard]] Darkness_table get_darkness_table(const std::string & font_path, float font_size);

#endif // FONT_HPP
