#ifndef SUMMARIZE_HPP
#define SUMMARIZE_HPP

#include "args.hpp"
#include "color.hpp"

// per channel quadratic mean: sqrt(sum(count * c^2) / total_pixels), truncated
[[nodiscard]] Color average_color(const Color_histogram & colors, std::size_t total_pixels);

// highest count wins. Among equal counts, the last one encountered wins
[[nodiscard]] Color most_common_color(const Color_histogram & colors);

// arithmetic mean of single channel values (read from the red channel)
[[nodiscard]] unsigned char mean_luminance(const Color_histogram & colors, std::size_t total_pixels);

[[nodiscard]] Color summarize_colors(const Color_histogram & colors, std::size_t total_pixels,
                                     Args::Strategy strategy, Args::Color_space color_space);

#endif // SUMMARIZE_HPP
