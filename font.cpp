#include "font.hpp"

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <vector>

#include "config.h"

#if defined(FONTCONFIG_FOUND) && defined(FREETYPE_FOUND)
#include <fontconfig/fontconfig.h>
#include <ft2build.h>
#include FT_FREETYPE_H

template <typename T, void (*destroy)(T *)>
struct Deleter
{
    void operator()(T * p) const { if(p) destroy(p); }
};

using Fc_pattern = std::unique_ptr<FcPattern, Deleter<FcPattern, FcPatternDestroy>>;

// FT_Library and FT_Face are already pointers, and FT_Done_* return an error code
struct Ft_library_deleter { void operator()(FT_Library lib) const { FT_Done_FreeType(lib); } };
struct Ft_face_deleter { void operator()(FT_Face face) const { FT_Done_Face(face); } };
using Ft_library = std::unique_ptr<FT_LibraryRec_, Ft_library_deleter>;
using Ft_face = std::unique_ptr<FT_FaceRec_, Ft_face_deleter>;

// share of the cell_w x cell_h cell covered by the rendered glyph, 0-1
static float glyph_coverage(FT_Face face, char ch, long cell_w, long cell_h)
{
    if(FT_Load_Char(face, static_cast<FT_ULong>(ch), FT_LOAD_RENDER) != FT_Err_Ok)
        throw std::runtime_error{"Error rendering '" + std::string{ch} + "'"};

    const auto & bitmap = face->glyph->bitmap;

    unsigned long ink = 0;
    for(unsigned int row = 0; row < bitmap.rows; ++row)
    {
        const auto * line = bitmap.buffer + static_cast<long>(row) * bitmap.pitch;
        for(unsigned int col = 0; col < bitmap.width; ++col)
            ink += line[col];
    }

    return static_cast<float>(ink) / (255.0f * static_cast<float>(cell_w * cell_h));
}
#endif

[[nodiscard]] std::string get_font_path(const std::string & font_name)
{
#if defined(FONTCONFIG_FOUND) && defined(FREETYPE_FOUND)
    FcConfig * config = FcInitLoadConfigAndFonts();
    if(!config)
        throw std::runtime_error{"Error loading fontconfig configuration"};
    std::unique_ptr<FcConfig, Deleter<FcConfig, FcConfigDestroy>> config_owner{config};

    Fc_pattern pattern{FcNameParse(reinterpret_cast<const FcChar8 *>(font_name.c_str()))};
    if(!pattern)
        throw std::runtime_error{"Could not parse font pattern: " + font_name};

    // the grid needs every glyph to have the same advance
    FcPatternAddInteger(pattern.get(), FC_SPACING, FC_MONO);
    FcConfigSubstitute(config, pattern.get(), FcMatchPattern);
    FcDefaultSubstitute(pattern.get());

    FcResult result;
    Fc_pattern match{FcFontMatch(config, pattern.get(), &result)};
    if(!match || result != FcResultMatch)
        throw std::runtime_error{"No font found matching: " + font_name};

    int spacing = 0;
    if(FcPatternGetInteger(match.get(), FC_SPACING, 0, &spacing) != FcResultMatch || spacing != FC_MONO)
        throw std::runtime_error{"No monospace font found matching: " + font_name};

    FcChar8 * file = nullptr;
    if(FcPatternGetString(match.get(), FC_FILE, 0, &file) != FcResultMatch)
        throw std::runtime_error{"Could not get path to: " + font_name};

    return reinterpret_cast<const char *>(file);
#else
    (void)font_name;
    return {};
#endif
}

[[nodiscard]] Darkness_table get_darkness_table(const std::string & font_path, float font_size)
{
#if defined(FONTCONFIG_FOUND) && defined(FREETYPE_FOUND)
    if(std::empty(font_path))
        return default_darkness_table();

    FT_Library lib_handle = nullptr;
    if(FT_Init_FreeType(&lib_handle) != FT_Err_Ok)
        throw std::runtime_error{"Error loading Freetype library"};
    Ft_library lib{lib_handle};

    FT_Face face_handle = nullptr;
    if(FT_New_Face(lib.get(), font_path.c_str(), 0, &face_handle) != FT_Err_Ok)
        throw std::runtime_error{"Error opening font file: " + font_path};
    Ft_face face{face_handle};

    if(!face->charmap)
        throw std::runtime_error{"Font has no unicode charmap: " + font_path};

    if(FT_Set_Char_Size(face.get(), 0, static_cast<FT_F26Dot6>(64.0f * font_size), 0, 0) != FT_Err_Ok)
        throw std::runtime_error{"Error setting font size: " + std::to_string(font_size)};

    // 26.6 fixed point
    const long cell_w = FT_MulFix(face->max_advance_width, face->size->metrics.x_scale) / 64;
    const long cell_h = FT_MulFix(face->height, face->size->metrics.y_scale) / 64;
    if(cell_w <= 0 || cell_h <= 0)
        throw std::runtime_error{"Font has no usable cell size: " + font_path};

    Darkness_table table;
    for(char ch = ' '; ch <= '~'; ++ch)
        table.push_back({ch, glyph_coverage(face.get(), ch, cell_w, cell_h)});

    std::stable_sort(std::begin(table), std::end(table), [](const Darkness_entry & a, const Darkness_entry & b) { return a.darkness < b.darkness; });

    const auto lightest = table.front().darkness;
    const auto span = table.back().darkness - lightest;
    if(span <= 0.0f)
        throw std::runtime_error{"Every glyph in " + font_path + " has the same darkness"};

    for(auto && entry: table)
        entry.darkness = (entry.darkness - lightest) / span;

    return table;
#else
    (void)font_path, (void)font_size;
    return default_darkness_table();
#endif
}
