#include "args.hpp"

#include <initializer_list>
#include <string>
#include <vector>

#include <catch2/catch.hpp>

static std::optional<Args> parse(std::initializer_list<std::string> list)
{
    std::vector<std::string> strings {"img2mosaic"};
    strings.insert(std::end(strings), list);

    std::vector<char *> argv;
    for(auto && s: strings)
        argv.push_back(std::data(s));

    return parse_args(static_cast<int>(std::size(argv)), std::data(argv));
}

TEST_CASE("Defaults match the documented options", "[args]")
{
    auto args = parse({"in.png"});
    REQUIRE(args);

    CHECK(args->input_filename == "in.png");
    CHECK(args->output_filename == "output.html");
    CHECK_FALSE(args->tile_size);
    CHECK(args->bg == "#262626");
    CHECK(args->font_size == 24);
    CHECK(args->chars == "X");
    CHECK_FALSE(args->seed);
    CHECK(args->strategy == Args::Strategy::average);
    CHECK(args->color_space == Args::Color_space::rgb);
    CHECK(args->glyph_mode == Args::Glyph_mode::random);
}

TEST_CASE("Options are parsed", "[args]")
{
    auto args = parse({"-s", "8", "--use-common", "--use-monochrome", "-c", "navy", "--fontsize", "16",
                       "--chars", "ab", "--seed", "5", "-o", "out.html", "in.jpg"});
    REQUIRE(args);

    CHECK(args->tile_size == 8);
    CHECK(args->strategy == Args::Strategy::most_common);
    CHECK(args->color_space == Args::Color_space::monochrome);
    CHECK(args->bg == "navy");
    CHECK(args->font_size == 16);
    CHECK(args->chars == "ab");
    CHECK(args->seed == 5u);
    CHECK(args->output_filename == "out.html");
}

TEST_CASE("ASCII mode", "[args]")
{
    auto args = parse({"--ascii", "--text-color", "#0f0", "in.png"});
    REQUIRE(args);

    CHECK(args->glyph_mode == Args::Glyph_mode::ascii);
    CHECK(args->text_color == "#0f0");
}

TEST_CASE("Invalid values are rejected", "[args]")
{
    CHECK_FALSE(parse({"-s", "0", "in.png"}));
    CHECK_FALSE(parse({"-s", "-4", "in.png"}));
    CHECK_FALSE(parse({"--fontsize", "0", "in.png"}));
    CHECK_FALSE(parse({"--chars", "", "in.png"}));
    CHECK_FALSE(parse({"-c", "red;}", "in.png"}));
    CHECK_FALSE(parse({"--ascii", "--chars", "ab", "in.png"}));
    CHECK_FALSE(parse({"--font", "<script>", "in.png"}));
}

TEST_CASE("is_css_color", "[args]")
{
    CHECK(is_css_color("#262626"));
    CHECK(is_css_color("#fff"));
    CHECK(is_css_color("rebeccapurple"));
    CHECK_FALSE(is_css_color(""));
    CHECK_FALSE(is_css_color("#12345"));
    CHECK_FALSE(is_css_color("#gggggg"));
    CHECK_FALSE(is_css_color("red; color: blue"));
}
