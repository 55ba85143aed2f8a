#ifndef IMAGE_HPP
#define IMAGE_HPP

#include <array>
#include <istream>
#include <vector>

#include "../args.hpp"
#include "../color.hpp"
#include "../tiler.hpp"

enum class Pixel_format
{
    rgb,
    luma, // luma stored in all 3 channels
};

// leading bytes of a file, enough to tell every supported format apart
using Signature = std::array<unsigned char, 8>;

// decoded pixels, row-major
class Image
{
public:
    Image() = default;
    Image(std::size_t w, std::size_t h) { set_size(w, h); }

    const std::vector<Color> & operator[](std::size_t i) const { return rows_[i]; }
    std::vector<Color> & operator[](std::size_t i) { return rows_[i]; }

    std::size_t get_width() const { return width_; }
    std::size_t get_height() const { return height_; }
    bool empty() const { return width_ == 0 || height_ == 0; }
    void set_size(std::size_t w, std::size_t h);

    // Colors in the tile and how many pixels have each, in the order first
    // seen scanning row by row. Pixels past the right / bottom edges count as
    // black, so the counts always add up to tile.area(). Alpha is ignored
    Color_histogram get_colors(const Tile & tile) const;

private:
    std::size_t width_{0};
    std::size_t height_{0};
    std::vector<std::vector<Color>> rows_;
};

// One per file format. Codecs decode 8-bit RGB and hand it to put(), which
// applies the requested Pixel_format
class Decoder
{
public:
    explicit Decoder(Pixel_format format): format_{format} {}
    virtual ~Decoder() = default;

    Decoder(const Decoder &) = delete;
    Decoder & operator=(const Decoder &) = delete;

    // throws Decode_error on malformed or truncated input
    virtual Image decode(std::istream & input) = 0;

protected:
    void put(Image & img, std::size_t row, std::size_t col, unsigned char r, unsigned char g, unsigned char b) const;

    // rest of the stream, for libraries that decode from memory
    static std::vector<unsigned char> read_all(std::istream & input);

private:
    Pixel_format format_;
};

// sniff the format from the stream's first bytes and decode it
[[nodiscard]] Image decode_image(std::istream & input, Pixel_format format);

// open args.input_filename (- for stdin) and decode it, in luma when args asks for monochrome
[[nodiscard]] Image get_image_data(const Args & args);

#endif // IMAGE_HPP
