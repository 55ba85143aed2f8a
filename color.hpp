#ifndef COLOR_HPP
#define COLOR_HPP

#include <string>
#include <tuple>
#include <vector>

#include <cstddef>
#include <cstdio>

struct Color
{
    unsigned char r{0}, g{0}, b{0}, a{0xFF};
    constexpr Color(){}
    constexpr Color(unsigned char r, unsigned char g, unsigned char b, unsigned char a = 0xFF): r{r}, g{g}, b{b}, a{a} {}
    constexpr explicit Color(unsigned char y): r{y}, g{y}, b{y} {}

    constexpr bool operator<(const Color & other) const
    {
        return std::tie(r, g, b, a) < std::tie(other.r, other.g, other.b, other.a);
    }

    constexpr bool operator==(const Color & other) const
    {
        return r == other.r
            && g == other.g
            && b == other.b
            && a == other.a;
    }

    // ITU-R 601-2 luma, fixed point
    constexpr unsigned char to_luma() const
    {
        return static_cast<unsigned char>((19595u * r + 38470u * g + 7471u * b + 0x8000u) >> 16);
    }

    // #rrggbb, alpha ignored
    std::string to_hex() const
    {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "#%02x%02x%02x", r, g, b);
        return buf;
    }
};

struct Color_count
{
    std::size_t count{0};
    Color color;
};

// distinct colors in a region, in order of first appearance
using Color_histogram = std::vector<Color_count>;

#endif // COLOR_HPP
