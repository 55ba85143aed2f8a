#ifndef JPEG_HPP
#define JPEG_HPP

#include "image.hpp"

// SOI marker followed by the start of any other marker. Covers JFIF, Exif, and raw JPEG streams
inline bool is_jpeg(const Signature & sig)
{
    return sig[0] == 0xFF && sig[1] == 0xD8 && sig[2] == 0xFF;
}

#ifdef JPEG_FOUND
class Jpeg_decoder final: public Decoder
{
public:
    using Decoder::Decoder;
    Image decode(std::istream & input) override;
};
#endif
#endif // JPEG_HPP
