#include "png.hpp"

#include <string>
#include <vector>

#include <png.h>

#include "../errors.hpp"

// png_image frees its internals on error, but not when we throw between calls
struct Png_image: public png_image
{
    Png_image(): png_image{}
    {
        version = PNG_IMAGE_VERSION;
    }
    ~Png_image()
    {
        png_image_free(this);
    }

    Png_image(const Png_image &) = delete;
    Png_image & operator=(const Png_image &) = delete;

    std::string error_message() const
    {
        return (warning_or_error & PNG_IMAGE_ERROR) ? std::string{message} : std::string{"unknown error"};
    }
};

Image Png_decoder::decode(std::istream & input)
{
    auto data = read_all(input);

    Png_image png;
    if(!png_image_begin_read_from_memory(&png, std::data(data), std::size(data)))
        throw Decode_error{"Error reading PNG file: " + png.error_message()};

    // alpha is kept by libpng and dropped by put()
    png.format = PNG_FORMAT_RGBA;

    std::vector<png_byte> pixels(PNG_IMAGE_SIZE(png));
    if(!png_image_finish_read(&png, nullptr, std::data(pixels), 0, nullptr))
        throw Decode_error{"Error reading PNG file: " + png.error_message()};

    Image img{png.width, png.height};
    const auto stride = PNG_IMAGE_ROW_STRIDE(png);

    for(std::size_t row = 0; row < png.height; ++row)
    {
        auto src = std::data(pixels) + row * stride;
        for(std::size_t col = 0; col < png.width; ++col, src += 4)
            put(img, row, col, src[0], src[1], src[2]);
    }

    return img;
}
