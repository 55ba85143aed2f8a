#include "args.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <vector>

#include <cctype>

#include <cxxopts.hpp>

static const std::vector<std::string> input_formats =
{
    #ifdef JPEG_FOUND
    "JPEG",
    #endif
    #ifdef PNG_FOUND
    "PNG",
    #endif
    "PBM", "PGM", "PPM",
};

[[nodiscard]] bool is_css_color(const std::string & color)
{
    if(std::empty(color))
        return false;

    if(color[0] == '#')
    {
        auto digits = std::size(color) - 1;
        if(digits != 3 && digits != 4 && digits != 6 && digits != 8)
            return false;
        return std::all_of(std::begin(color) + 1, std::end(color), [](unsigned char c) { return std::isxdigit(c); });
    }

    // named color
    return std::all_of(std::begin(color), std::end(color), [](unsigned char c) { return std::isalpha(c); });
}

[[nodiscard]] std::optional<Args> parse_args(int argc, char * argv[])
{
    auto prog_name = std::string{argv[0]};
    if(auto sep_pos = prog_name.find_last_of("\\/"); sep_pos != std::string::npos)
        prog_name = prog_name.substr(sep_pos + 1);

    cxxopts::Options options{prog_name, "Convert an image into a mosaic of colored characters, written as an HTML page"};

    std::string input_format_list;
    for(std::size_t i = 0; i < std::size(input_formats); ++i)
    {
        if(i > 0)
            input_format_list += ", ";
        input_format_list += input_formats[i];
    }

    try
    {
        options.add_options()
            ("h,help",   "Show this message and quit")
            ("o,output", "Output HTML file path. Output to stdout if '-'",                                  cxxopts::value<std::string>()->default_value("output.html"), "OUTPUT_FILE")
            ("s,size",   "Size (in px) of the square area of the image each character represents. "
                         "When not set, a size near 2% of the image width that divides both dimensions is used", cxxopts::value<int>(), "SIZE");

        const std::string style_group = "Style";
        options.add_options(style_group)
            ("c,color",    "Background color; hex or CSS color name",                      cxxopts::value<std::string>()->default_value("#262626"),   "COLOR")
            ("fontsize",   "Characters' font size, in px",                                 cxxopts::value<int>()->default_value("24"),                "PX")
            ("f,font",     "Font family. Also used to measure character darkness for --ascii when fontconfig is available", cxxopts::value<std::string>()->default_value("monospace"), "FONT")
            ("text-color", "Character color for --ascii",                                  cxxopts::value<std::string>()->default_value("#ffffff"),   "COLOR");

        const std::string color_group = "Color";
        options.add_options(color_group)
            ("use-common",     "Use the most common color in an area instead of the calculated average")
            ("use-monochrome", "Generate a black and white picture");

        const std::string char_group = "Characters";
        options.add_options(char_group)
            ("ascii", "Pick characters by brightness instead of color. All characters are drawn in --text-color")
            ("chars", "Characters to randomly pick from. UTF-8 allowed", cxxopts::value<std::string>()->default_value("X"), "CHARS")
            ("seed",  "Seed for random character selection",             cxxopts::value<std::uint32_t>(),                  "SEED");

        options.add_options()
            ("input", "Input image path. Read from stdin if -. Supported formats: " + input_format_list, cxxopts::value<std::string>()->default_value("-"));

        options.parse_positional({"input"});
        options.positional_help("INPUT");
    }
    catch(const std::exception & e) // cxxopts renamed its exception class during 3.0; both derive from std::exception
    {
        std::cerr<<"Error building argument parser: "<<e.what()<<'\n';
        return {};
    }

    auto help = [&options, &input_format_list](const std::string & msg = "") -> std::string
    {
        auto txt = options.help();

        txt += "\n\n"
                " Positional arguments:\n"
                "    INPUT  ";

        auto input_help = "Input image path. Read from stdin if -. Supported formats: " + input_format_list + "\n(default: stdin)";

        const int max_col_width = 80;
        const auto indent = std::string{"            "};
        int col = std::size(indent);
        std::string curr_word;

        auto append_word = [&col, &curr_word, &indent, &txt]()
        {
            if(1 + col + std::size(curr_word) > max_col_width)
            {
                txt += '\n' + indent + curr_word;
                col = std::size(indent) + std::size(curr_word);
            }
            else
            {
                txt += " " + curr_word;
                col += 1 + std::size(curr_word);
            }
            curr_word = "";
        };

        for(auto && c : input_help)
        {
            if(std::isspace(static_cast<unsigned char>(c)))
            {
                append_word();
                if(c == '\n')
                    col = max_col_width;
            }
            else
            {
                curr_word += c;
            }
        }
        append_word();

        txt += '\n';

        if(!std::empty(msg))
            txt += '\n' + msg + '\n';

        return txt;
    };

    try
    {
        auto args = options.parse(argc, argv);

        if(args.count("help"))
        {
            std::cerr<<help()<<'\n';
            return {};
        }

        std::optional<int> tile_size;
        if(args.count("size"))
        {
            tile_size = args["size"].as<int>();
            if(*tile_size <= 0)
            {
                std::cerr<<help("Value for --size must be positive")<<'\n';
                return {};
            }
        }

        if(args["fontsize"].as<int>() <= 0)
        {
            std::cerr<<help("Value for --fontsize must be positive")<<'\n';
            return {};
        }

        auto bg = args["color"].as<std::string>();
        if(!is_css_color(bg))
        {
            std::cerr<<help("Invalid value for --color: " + bg)<<'\n';
            return {};
        }

        auto text_color = args["text-color"].as<std::string>();
        if(!is_css_color(text_color))
        {
            std::cerr<<help("Invalid value for --text-color: " + text_color)<<'\n';
            return {};
        }

        auto font_name = args["font"].as<std::string>();
        if(std::empty(font_name) || font_name.find_first_of("<>;{}'\"\\") != std::string::npos)
        {
            std::cerr<<help("Invalid value for --font: " + font_name)<<'\n';
            return {};
        }

        auto glyph_mode = args.count("ascii") ? Args::Glyph_mode::ascii : Args::Glyph_mode::random;

        if(args.count("ascii") && (args.count("chars") || args.count("seed")))
        {
            std::cerr<<help("Can't specify --chars or --seed with --ascii")<<'\n';
            return {};
        }

        if(glyph_mode == Args::Glyph_mode::random && std::empty(args["chars"].as<std::string>()))
        {
            std::cerr<<help("Value for --chars cannot be empty")<<'\n';
            return {};
        }

        return Args{
            .input_filename  = args["input"].as<std::string>(),
            .output_filename = args["output"].as<std::string>(),
            .tile_size       = tile_size,
            .bg              = bg,
            .text_color      = text_color,
            .font_size       = args["fontsize"].as<int>(),
            .font_name       = font_name,
            .chars           = args["chars"].as<std::string>(),
            .seed            = args.count("seed") ? std::optional(args["seed"].as<std::uint32_t>()) : std::nullopt,
            .strategy        = args.count("use-common") ? Args::Strategy::most_common : Args::Strategy::average,
            .color_space     = args.count("use-monochrome") ? Args::Color_space::monochrome : Args::Color_space::rgb,
            .glyph_mode      = glyph_mode
        };
    }
    catch(const std::exception & e)
    {
        std::cerr<<help(e.what())<<'\n';
        return {};
    }
}
