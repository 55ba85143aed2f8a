#ifndef PNG_HPP
#define PNG_HPP

#include "image.hpp"

inline bool is_png(const Signature & sig)
{
    return sig == Signature{0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};
}

#ifdef PNG_FOUND
class Png_decoder final: public Decoder
{
public:
    using Decoder::Decoder;
    Image decode(std::istream & input) override;
};
#endif
#endif // PNG_HPP
