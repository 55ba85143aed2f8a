#ifndef PNM_HPP
#define PNM_HPP

#include <cctype>

#include "image.hpp"

// P1 through P6, followed by whitespace
inline bool is_pnm(const Signature & sig)
{
    return sig[0] == 'P' && sig[1] >= '1' && sig[1] <= '6' && std::isspace(sig[2]);
}

// PBM, PGM, and PPM, in both plain (ASCII) and raw variants. Raw samples may be 16-bit
class Pnm_decoder final: public Decoder
{
public:
    using Decoder::Decoder;
    Image decode(std::istream & input) override;
};
#endif // PNM_HPP
