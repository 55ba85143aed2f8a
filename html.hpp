#ifndef HTML_HPP
#define HTML_HPP

#include <string>

#include "args.hpp"
#include "mosaic.hpp"

[[nodiscard]] std::string render_html(const Conversion_result & result, const Args & args);

// render fully, then write to args.output_filename (- for stdout)
void write_html(const Conversion_result & result, const Args & args);

#endif // HTML_HPP
