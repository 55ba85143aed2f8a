#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>

// bad user-supplied values. Thrown before any image work is done
struct Invalid_configuration: public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

// unreadable, truncated, or unsupported input image
struct Decode_error: public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

// broken internal invariant. Should be unreachable
struct Internal_error: public std::logic_error
{
    using std::logic_error::logic_error;
};

#endif // ERRORS_HPP
