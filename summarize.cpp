#include "summarize.hpp"

#include <algorithm>
#include <array>

#include <cmath>
#include <cstdint>

#include "errors.hpp"

static void check_histogram(const Color_histogram & colors, std::size_t total_pixels)
{
    if(std::empty(colors) || total_pixels == 0)
        throw Internal_error{"Empty color histogram"};
}

[[nodiscard]] Color average_color(const Color_histogram & colors, std::size_t total_pixels)
{
    check_histogram(colors, total_pixels);

    // https://sighack.com/post/averaging-rgb-colors-the-right-way
    std::array<std::uint64_t, 3> sums {0, 0, 0};
    for(auto && [count, color]: colors)
    {
        sums[0] += static_cast<std::uint64_t>(color.r) * color.r * count;
        sums[1] += static_cast<std::uint64_t>(color.g) * color.g * count;
        sums[2] += static_cast<std::uint64_t>(color.b) * color.b * count;
    }

    auto channel = [total_pixels](std::uint64_t sum)
    {
        auto v = std::floor(std::sqrt(static_cast<double>(sum) / static_cast<double>(total_pixels)));
        return static_cast<unsigned char>(std::min(v, 255.0));
    };

    return Color{channel(sums[0]), channel(sums[1]), channel(sums[2])};
}

[[nodiscard]] Color most_common_color(const Color_histogram & colors)
{
    if(std::empty(colors))
        throw Internal_error{"Empty color histogram"};

    auto sorted = colors;
    std::stable_sort(std::begin(sorted), std::end(sorted), [](const Color_count & a, const Color_count & b) { return a.count < b.count; });

    return sorted.back().color;
}

[[nodiscard]] unsigned char mean_luminance(const Color_histogram & colors, std::size_t total_pixels)
{
    check_histogram(colors, total_pixels);

    std::uint64_t total {0};
    for(auto && [count, color]: colors)
        total += static_cast<std::uint64_t>(color.r) * count;

    return static_cast<unsigned char>(total / total_pixels);
}

[[nodiscard]] Color summarize_colors(const Color_histogram & colors, std::size_t total_pixels,
                                     Args::Strategy strategy, Args::Color_space color_space)
{
    if(strategy == Args::Strategy::most_common)
    {
        check_histogram(colors, total_pixels);
        return most_common_color(colors);
    }

    // monochrome images only have one value for the color: the luminance
    if(color_space == Args::Color_space::monochrome)
        return Color{mean_luminance(colors, total_pixels)};

    return average_color(colors, total_pixels);
}
