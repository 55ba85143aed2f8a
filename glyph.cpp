#include "glyph.hpp"

#include <algorithm>
#include <iterator>

#include "errors.hpp"

// measured from a 12pt monospace font, with darkness normalized to 0-1
[[nodiscard]] const Darkness_table & default_darkness_table()
{
    static const Darkness_table table
    {
        {' ', 0.0000f}, {'`', 0.0039f}, {'.', 0.0745f}, {'-', 0.1059f}, {'\'', 0.1098f}, {',', 0.1137f},
        {':', 0.1373f}, {'"', 0.2078f}, {'~', 0.2157f}, {'^', 0.2196f}, {';', 0.2275f}, {'_', 0.2392f},
        {'!', 0.2510f}, {'*', 0.3216f}, {'\\', 0.3804f}, {'/', 0.3882f}, {'r', 0.3922f}, {'(', 0.3961f},
        {')', 0.4039f}, {'|', 0.4078f}, {'+', 0.4157f}, {'>', 0.4196f}, {'<', 0.4235f}, {'=', 0.4275f},
        {'?', 0.4314f}, {'c', 0.4353f}, {'l', 0.4588f}, {'i', 0.4902f}, {'[', 0.5059f}, {']', 0.5098f},
        {'v', 0.5137f}, {'s', 0.5176f}, {'L', 0.5216f}, {'7', 0.5255f}, {'j', 0.5294f}, {'z', 0.5333f},
        {'x', 0.5373f}, {'t', 0.5451f}, {'J', 0.5490f}, {'}', 0.5529f}, {'{', 0.5569f}, {'T', 0.5608f},
        {'Y', 0.5647f}, {'1', 0.5686f}, {'f', 0.5725f}, {'C', 0.5765f}, {'n', 0.5804f}, {'u', 0.6000f},
        {'I', 0.6039f}, {'o', 0.6235f}, {'2', 0.6314f}, {'F', 0.6353f}, {'3', 0.6392f}, {'S', 0.6510f},
        {'y', 0.6627f}, {'5', 0.6745f}, {'V', 0.6784f}, {'e', 0.6824f}, {'a', 0.6863f}, {'w', 0.6902f},
        {'Z', 0.7020f}, {'h', 0.7059f}, {'4', 0.7137f}, {'X', 0.7176f}, {'%', 0.7216f}, {'k', 0.7255f},
        {'P', 0.7294f}, {'$', 0.7373f}, {'G', 0.7451f}, {'U', 0.7647f}, {'E', 0.7765f}, {'&', 0.7843f},
        {'m', 0.7882f}, {'b', 0.7922f}, {'d', 0.8078f}, {'9', 0.8118f}, {'p', 0.8157f}, {'q', 0.8196f},
        {'A', 0.8235f}, {'6', 0.8275f}, {'O', 0.8314f}, {'K', 0.8353f}, {'#', 0.8392f}, {'0', 0.8431f},
        {'H', 0.8471f}, {'8', 0.8549f}, {'D', 0.8745f}, {'g', 0.8824f}, {'R', 0.8902f}, {'Q', 0.8941f},
        {'@', 0.9098f}, {'B', 0.9686f}, {'N', 0.9804f}, {'W', 0.9843f}, {'M', 0.9922f}
    };
    return table;
}

[[nodiscard]] char find_closest_glyph(const Darkness_table & table, float value)
{
    if(std::empty(table))
        throw Internal_error{"Empty darkness table"};

    auto next = std::lower_bound(std::begin(table), std::end(table), value,
            [](const Darkness_entry & e, float v) { return e.darkness < v; });

    if(next == std::begin(table))
        return next->glyph;
    if(next == std::end(table))
        return table.back().glyph;

    auto prev = std::prev(next);
    return (value - prev->darkness <= next->darkness - value) ? prev->glyph : next->glyph;
}

[[nodiscard]] std::vector<std::string> split_glyphs(std::string_view chars)
{
    std::vector<std::string> glyphs;

    for(std::size_t i = 0; i < std::size(chars);)
    {
        auto lead = static_cast<unsigned char>(chars[i]);

        std::size_t len = 1;
        if((lead & 0xE0) == 0xC0)
            len = 2;
        else if((lead & 0xF0) == 0xE0)
            len = 3;
        else if((lead & 0xF8) == 0xF0)
            len = 4;

        // continuation bytes must all be 10xxxxxx
        if(i + len > std::size(chars)
            || !std::all_of(std::begin(chars) + i + 1, std::begin(chars) + i + len, [](char c) { return (static_cast<unsigned char>(c) & 0xC0) == 0x80; }))
        {
            len = 1;
        }

        glyphs.emplace_back(chars.substr(i, len));
        i += len;
    }

    return glyphs;
}

[[nodiscard]] std::string escape_markup(std::string_view text)
{
    std::string out;
    out.reserve(std::size(text));

    for(auto c: text)
    {
        switch(c)
        {
        case '&':  out += "&amp;";  break;
        case '<':  out += "&lt;";   break;
        case '>':  out += "&gt;";   break;
        case '"':  out += "&quot;"; break;
        case '\'': out += "&#39;";  break;
        default:   out += c;        break;
        }
    }

    return out;
}

Glyph_pool::Glyph_pool(std::string_view chars, std::mt19937 & rng):
    glyphs_{split_glyphs(chars)},
    rng_{rng}
{
    if(std::empty(glyphs_))
        throw Invalid_configuration{"Character list cannot be empty"};

    dist_ = std::uniform_int_distribution<std::size_t>{0, std::size(glyphs_) - 1};
}

const std::string & Glyph_pool::pick()
{
    return glyphs_[dist_(rng_)];
}
