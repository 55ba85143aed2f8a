#include "mosaic.hpp"

#include <iostream>
#include <sstream>

#include <catch2/catch.hpp>

#include "errors.hpp"

static Image solid_image(std::size_t w, std::size_t h, const Color & c)
{
    Image img{w, h};
    for(std::size_t row = 0; row < h; ++row)
    {
        for(std::size_t col = 0; col < w; ++col)
            img[row][col] = c;
    }
    return img;
}

TEST_CASE("Solid red image converts to a grid of red cells", "[mosaic]")
{
    auto img = solid_image(20, 20, Color{255, 0, 0});

    Args args;
    std::mt19937 rng{0};
    auto result = convert_image(img, 10, args, default_darkness_table(), rng);

    CHECK(result.columns == 2);
    REQUIRE(std::size(result.cells) == 4);
    for(auto && cell: result.cells)
    {
        CHECK(cell.color == "#ff0000");
        CHECK(cell.glyph == "X");
    }
}

TEST_CASE("Cells follow row-major tile order", "[mosaic]")
{
    Image img{4, 2};
    img[0][0] = img[0][1] = img[1][0] = img[1][1] = Color{0, 0, 255};
    img[0][2] = img[0][3] = img[1][2] = img[1][3] = Color{0, 255, 0};

    Args args;
    std::mt19937 rng{0};
    auto result = convert_image(img, 2, args, default_darkness_table(), rng);

    REQUIRE(std::size(result.cells) == 2);
    CHECK(result.cells[0].color == "#0000ff");
    CHECK(result.cells[1].color == "#00ff00");
}

TEST_CASE("Tiles past the edge count missing pixels as black", "[mosaic]")
{
    // second tile is half image, half overhang
    auto img = solid_image(15, 10, Color{255, 255, 255});

    Args args;
    std::mt19937 rng{0};
    auto result = convert_image(img, 10, args, default_darkness_table(), rng);

    CHECK(result.columns == 1);
    REQUIRE(std::size(result.cells) == 2);
    CHECK(result.cells[0].color == "#ffffff");
    CHECK(result.cells[1].color == "#b4b4b4"); // sqrt(255^2 / 2) = 180
}

TEST_CASE("ASCII mode maps brightness to glyphs in a fixed color", "[mosaic]")
{
    Image img{2, 1};
    img[0][0] = Color{0, 0, 0};
    img[0][1] = Color{255, 255, 255};

    Args args;
    args.glyph_mode = Args::Glyph_mode::ascii;
    args.text_color = "#00ff00";
    args.chars = "";

    std::mt19937 rng{0};
    auto & table = default_darkness_table();
    auto result = convert_image(img, 1, args, table, rng);

    REQUIRE(std::size(result.cells) == 2);
    CHECK(result.cells[0].glyph == std::string{table.front().glyph});
    CHECK(result.cells[1].glyph == std::string{table.back().glyph});
    CHECK(result.cells[0].color == "#00ff00");
    CHECK(result.cells[1].color == "#00ff00");
}

TEST_CASE("ASCII mode escapes reserved glyphs", "[mosaic]")
{
    auto img = solid_image(1, 1, Color{128});

    Args args;
    args.glyph_mode = Args::Glyph_mode::ascii;

    std::mt19937 rng{0};
    auto result = convert_image(img, 1, args, Darkness_table{{'<', 0.0f}}, rng);

    REQUIRE(std::size(result.cells) == 1);
    CHECK(result.cells[0].glyph == "&lt;");
}

TEST_CASE("Random glyphs are escaped", "[mosaic]")
{
    auto img = solid_image(4, 4, Color{10, 20, 30});

    Args args;
    args.chars = "<";

    std::mt19937 rng{0};
    auto result = convert_image(img, 2, args, default_darkness_table(), rng);

    for(auto && cell: result.cells)
        CHECK(cell.glyph == "&lt;");
}

TEST_CASE("Random mode requires characters", "[mosaic]")
{
    auto img = solid_image(4, 4, Color{});

    Args args;
    args.chars = "";

    std::mt19937 rng{0};
    CHECK_THROWS_AS(convert_image(img, 2, args, default_darkness_table(), rng), Invalid_configuration);
}

TEST_CASE("Same seed gives the same mosaic", "[mosaic]")
{
    auto img = solid_image(10, 10, Color{1, 2, 3});

    Args args;
    args.chars = "abcdefghij";

    std::mt19937 rng_a{77};
    std::mt19937 rng_b{77};
    auto a = convert_image(img, 2, args, default_darkness_table(), rng_a);
    auto b = convert_image(img, 2, args, default_darkness_table(), rng_b);

    REQUIRE(std::size(a.cells) == std::size(b.cells));
    for(std::size_t i = 0; i < std::size(a.cells); ++i)
        CHECK(a.cells[i].glyph == b.cells[i].glyph);
}

TEST_CASE("Monochrome most common uses the luminance values", "[mosaic]")
{
    Image img{2, 2};
    img[0][0] = img[0][1] = img[1][0] = Color{90};
    img[1][1] = Color{10};

    Args args;
    args.color_space = Args::Color_space::monochrome;
    args.strategy = Args::Strategy::most_common;

    std::mt19937 rng{0};
    auto result = convert_image(img, 2, args, default_darkness_table(), rng);

    REQUIRE(std::size(result.cells) == 1);
    CHECK(result.cells[0].color == "#5a5a5a");
}

TEST_CASE("resolve_tile_size", "[mosaic]")
{
    Args args;

    SECTION("auto sizes when not set")
    {
        CHECK(resolve_tile_size(args, 100, 50) == 2);
    }
    SECTION("keeps an explicit size that divides")
    {
        args.tile_size = 10;
        CHECK(resolve_tile_size(args, 100, 50) == 10);
    }
    SECTION("keeps an explicit size that doesn't divide, with a warning")
    {
        args.tile_size = 7;

        std::ostringstream err;
        auto old_buf = std::cerr.rdbuf(err.rdbuf());
        auto size = resolve_tile_size(args, 100, 50);
        std::cerr.rdbuf(old_buf);

        CHECK(size == 7);
        CHECK(err.str().find("WARNING") != std::string::npos);
        CHECK(err.str().find("Nearest sizes that do: 5 10\n") != std::string::npos);
        CHECK(err.str().find("All sizes that do: 1 2 5 10 25 50\n") != std::string::npos);
    }
    SECTION("stays quiet for an explicit size that divides")
    {
        args.tile_size = 25;

        std::ostringstream err;
        auto old_buf = std::cerr.rdbuf(err.rdbuf());
        auto size = resolve_tile_size(args, 100, 50);
        std::cerr.rdbuf(old_buf);

        CHECK(size == 25);
        CHECK(err.str().empty());
    }
    SECTION("rejects non-positive sizes")
    {
        args.tile_size = 0;
        CHECK_THROWS_AS(resolve_tile_size(args, 100, 50), Invalid_configuration);
    }
}
