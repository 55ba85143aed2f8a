#include "html.hpp"

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include <cerrno>
#include <cmath>
#include <cstring>

#include "glyph.hpp"

[[nodiscard]] std::string render_html(const Conversion_result & result, const Args & args)
{
    // 16 -> 12
    auto cell_size = static_cast<int>(std::ceil(args.font_size * 0.75));

    auto font_family = args.font_name == "monospace" ? std::string{"monospace"} : "'" + escape_markup(args.font_name) + "', monospace";

    std::ostringstream os;
    os<<"<html><head><style>\n"
      <<"body { line-height: "<<cell_size<<"px; background: "<<args.bg<<"; display: grid; "
      <<"grid-template-columns: repeat("<<result.columns<<", "<<cell_size<<"px); align-content: start; }\n"
      <<"span { font-size: "<<cell_size<<"px; font-family: "<<font_family<<"; white-space: pre; }\n"
      <<"</style></head><body>\n";

    for(std::size_t i = 0; i < std::size(result.cells); ++i)
    {
        auto & cell = result.cells[i];
        os<<"<span style=\"color: "<<cell.color<<";\">"<<cell.glyph<<"</span>";

        if(result.columns > 0 && (i + 1) % result.columns == 0)
            os<<'\n';
    }

    os<<"</body></html>\n";

    return os.str();
}

void write_html(const Conversion_result & result, const Args & args)
{
    auto html = render_html(result, args);

    std::ofstream output_file;
    if(args.output_filename != "-")
        output_file.open(args.output_filename, std::ios_base::out | std::ios_base::binary);
    std::ostream & out = args.output_filename == "-" ? std::cout : output_file;

    if(!out)
        throw std::runtime_error{"Could not open output file " + (args.output_filename == "-" ? "" : ("(" + args.output_filename + ") ")) + ": " + std::string{std::strerror(errno)}};

    out<<html;
    out.flush();

    if(!out)
        throw std::runtime_error{"Error writing output file " + (args.output_filename == "-" ? "" : ("(" + args.output_filename + ") ")) + ": " + std::string{std::strerror(errno)}};
}
