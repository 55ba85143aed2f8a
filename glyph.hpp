#ifndef GLYPH_HPP
#define GLYPH_HPP

#include <random>
#include <string>
#include <string_view>
#include <vector>

struct Darkness_entry
{
    char glyph;
    float darkness; // 0-1, fraction of the cell covered by ink
};

// sorted by darkness, ascending
using Darkness_table = std::vector<Darkness_entry>;

[[nodiscard]] const Darkness_table & default_darkness_table();

// entry closest to value. Ties go to the less dark entry
[[nodiscard]] char find_closest_glyph(const Darkness_table & table, float value);

// split into UTF-8 code points. Malformed bytes become their own glyphs
[[nodiscard]] std::vector<std::string> split_glyphs(std::string_view chars);

// escape the characters HTML reserves in text and attribute values
[[nodiscard]] std::string escape_markup(std::string_view text);

// uniform random glyphs from a non-empty pool
class Glyph_pool
{
public:
    Glyph_pool(std::string_view chars, std::mt19937 & rng);

    const std::string & pick();
    std::size_t size() const { return std::size(glyphs_); }

private:
    std::vector<std::string> glyphs_;
    std::mt19937 & rng_;
    std::uniform_int_distribution<std::size_t> dist_;
};

#endif // GLYPH_HPP
