#include "image.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <iterator>
#include <map>
#include <memory>

#include <cerrno>
#include <cstring>

#include "../errors.hpp"
#include "jpeg.hpp"
#include "png.hpp"
#include "pnm.hpp"

void Image::set_size(std::size_t w, std::size_t h)
{
    width_ = w; height_ = h;
    rows_.assign(height_, std::vector<Color>(width_));
}

Color_histogram Image::get_colors(const Tile & tile) const
{
    Color_histogram colors;
    std::map<Color, std::size_t> index;

    auto add = [&colors, &index](const Color & c, std::size_t count)
    {
        if(auto [it, inserted] = index.try_emplace(c, std::size(colors)); inserted)
            colors.push_back({count, c});
        else
            colors[it->second].count += count;
    };

    for(std::size_t row = tile.y; row < tile.y + tile.size; ++row)
    {
        if(row >= height_)
        {
            add(Color{0, 0, 0}, tile.size);
            continue;
        }

        for(std::size_t col = tile.x; col < tile.x + tile.size; ++col)
        {
            if(col >= width_)
            {
                add(Color{0, 0, 0}, tile.x + tile.size - col);
                break;
            }

            auto & pix = rows_[row][col];
            add(Color{pix.r, pix.g, pix.b}, 1);
        }
    }

    return colors;
}

void Decoder::put(Image & img, std::size_t row, std::size_t col, unsigned char r, unsigned char g, unsigned char b) const
{
    Color c{r, g, b};
    img[row][col] = format_ == Pixel_format::luma ? Color{c.to_luma()} : c;
}

std::vector<unsigned char> Decoder::read_all(std::istream & input)
{
    std::vector<unsigned char> data;
    std::transform(std::istreambuf_iterator<char>{input}, std::istreambuf_iterator<char>{}, std::back_inserter(data),
                   [](char c) { return static_cast<unsigned char>(c); });

    if(input.bad())
        throw Decode_error{"Could not read input: " + std::string{std::strerror(errno)}};

    return data;
}

struct Codec
{
    const char * name;
    bool (*matches)(const Signature &);
    std::unique_ptr<Decoder> (*make)(Pixel_format); // null when built without the library
};

template <typename T>
static std::unique_ptr<Decoder> make_decoder(Pixel_format format)
{
    return std::make_unique<T>(format);
}

static const Codec codecs[] =
{
    #ifdef JPEG_FOUND
    {"JPEG", is_jpeg, make_decoder<Jpeg_decoder>},
    #else
    {"JPEG", is_jpeg, nullptr},
    #endif
    #ifdef PNG_FOUND
    {"PNG", is_png, make_decoder<Png_decoder>},
    #else
    {"PNG", is_png, nullptr},
    #endif
    {"PNM", is_pnm, make_decoder<Pnm_decoder>},
};

[[nodiscard]] Image decode_image(std::istream & input, Pixel_format format)
{
    Signature sig;
    input.read(reinterpret_cast<char *>(std::data(sig)), std::size(sig));

    if(input.eof()) // some valid images are smaller than this, but none worth converting
        throw Decode_error{"Could not read file signature: not enough bytes"};
    else if(!input)
        throw Decode_error{"Could not read input: " + std::string{std::strerror(errno)}};

    // rewind (seekg(0) not always supported for pipes)
    for(auto i = std::rbegin(sig); i != std::rend(sig); ++i)
        input.putback(static_cast<char>(*i));
    if(input.bad())
        throw Decode_error{"Unable to rewind stream"};

    for(auto && codec: codecs)
    {
        if(!codec.matches(sig))
            continue;

        if(!codec.make)
            throw Decode_error{std::string{"Not compiled with "} + codec.name + " support"};

        auto img = codec.make(format)->decode(input);
        if(img.empty())
            throw Decode_error{std::string{codec.name} + " image has no pixels"};

        return img;
    }

    throw Decode_error{"Unknown input file format"};
}

[[nodiscard]] Image get_image_data(const Args & args)
{
    auto format = args.color_space == Args::Color_space::monochrome ? Pixel_format::luma : Pixel_format::rgb;

    if(args.input_filename == "-")
        return decode_image(std::cin, format);

    std::ifstream input{args.input_filename, std::ios_base::in | std::ios_base::binary};
    if(!input)
        throw Decode_error{"Could not open input file (" + args.input_filename + "): " + std::string{std::strerror(errno)}};

    try
    {
        return decode_image(input, format);
    }
    catch(const Decode_error & e)
    {
        throw Decode_error{"(" + args.input_filename + ") " + e.what()};
    }
}
