#include "pnm.hpp"

#include <bitset>
#include <limits>
#include <stdexcept>
#include <string>

#include <cstdint>

#include "../errors.hpp"

// restores the caller's exception mask
class Throwing_stream
{
public:
    explicit Throwing_stream(std::istream & input): input_{input}, saved_{input.exceptions()}
    {
        input_.exceptions(std::ios_base::badbit | std::ios_base::failbit);
    }
    ~Throwing_stream()
    {
        input_.clear();
        input_.exceptions(saved_);
    }

    Throwing_stream(const Throwing_stream &) = delete;
    Throwing_stream & operator=(const Throwing_stream &) = delete;

private:
    std::istream & input_;
    std::ios_base::iostate saved_;
};

// next whitespace-delimited token, skipping # comments
static std::string next_token(std::istream & input)
{
    std::string token;
    input >> token;
    while(!std::empty(token) && token[0] == '#')
    {
        input.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
        input >> token;
    }
    return token;
}

static std::uint16_t read_number(std::istream & input)
{
    auto token = next_token(input);
    try
    {
        std::size_t used = 0;
        auto val = std::stol(token, &used);
        if(used != std::size(token) || val < 0 || val > std::numeric_limits<std::uint16_t>::max())
            throw std::out_of_range{token};

        return static_cast<std::uint16_t>(val);
    }
    catch(const std::logic_error &)
    {
        throw Decode_error{"Error reading PNM: invalid value: " + token};
    }
}

// plain PBM pixels may be packed without separators
static bool read_plain_bit(std::istream & input)
{
    int c = 0;
    do { c = input.get(); } while(std::isspace(c));

    if(c != '0' && c != '1')
        throw Decode_error{"Error reading PBM: unexpected character: " + std::string{static_cast<char>(c)}};

    return c == '1';
}

// 1 byte when max_val fits in one, else 2 bytes big-endian
static std::uint16_t read_raw_sample(std::istream & input, std::uint16_t max_val)
{
    if(max_val < 256)
        return static_cast<std::uint16_t>(input.get());

    auto hi = input.get();
    auto lo = input.get();
    return static_cast<std::uint16_t>((hi << 8) | lo);
}

static unsigned char to_8bit(std::uint16_t v, std::uint16_t max_val)
{
    if(v > max_val)
        throw Decode_error{"Error reading PNM: sample " + std::to_string(v) + " above max value " + std::to_string(max_val)};
    return static_cast<unsigned char>(static_cast<float>(v) / static_cast<float>(max_val) * 255.0f);
}

Image Pnm_decoder::decode(std::istream & input)
{
    Throwing_stream guard{input};

    try
    {
        auto magic = next_token(input);
        const auto kind = magic.at(1);

        const bool plain = kind <= '3';
        const bool bitmap = kind == '1' || kind == '4';
        const int channels = (kind == '3' || kind == '6') ? 3 : 1;

        auto width = read_number(input);
        auto height = read_number(input);
        if(width == 0 || height == 0)
            throw Decode_error{"Error reading PNM: image has no pixels"};

        std::uint16_t max_val = bitmap ? 1 : read_number(input);
        if(max_val == 0)
            throw Decode_error{"Error reading PNM: max value must be positive"};

        // single whitespace char between header and raster
        if(!plain)
            input.get();

        Image img{width, height};

        for(std::size_t row = 0; row < height; ++row)
        {
            std::bitset<8> bits;
            for(std::size_t col = 0; col < width; ++col)
            {
                if(bitmap)
                {
                    bool ink = false;
                    if(plain)
                    {
                        ink = read_plain_bit(input);
                    }
                    else
                    {
                        // rows start on a byte boundary
                        if(col % 8 == 0)
                            bits = static_cast<unsigned long>(input.get());
                        ink = bits[7 - col % 8];
                    }

                    unsigned char v = ink ? 0x00 : 0xFF;
                    put(img, row, col, v, v, v);
                    continue;
                }

                unsigned char samples[3];
                for(int i = 0; i < channels; ++i)
                    samples[i] = to_8bit(plain ? read_number(input) : read_raw_sample(input, max_val), max_val);

                if(channels == 3)
                    put(img, row, col, samples[0], samples[1], samples[2]);
                else
                    put(img, row, col, samples[0], samples[0], samples[0]);
            }
        }

        return img;
    }
    catch(const std::ios_base::failure &)
    {
        throw Decode_error{input.bad() ? "Error reading PNM: could not read file" : "Error reading PNM: unexpected end of file"};
    }
    catch(const std::out_of_range &)
    {
        throw Decode_error{"Error reading PNM: bad magic number"};
    }
}
