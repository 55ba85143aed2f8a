#include "tile_size.hpp"

#include <algorithm>
#include <string>

#include <cmath>

#include "errors.hpp"

static void check_dimensions(std::size_t width, std::size_t height)
{
    if(width == 0 || height == 0)
        throw Invalid_configuration{"Image dimensions must be positive, got " + std::to_string(width) + "x" + std::to_string(height)};
}

[[nodiscard]] std::vector<int> common_divisors(std::size_t width, std::size_t height)
{
    check_dimensions(width, height);

    std::vector<int> divisors;
    for(std::size_t i = 1; i <= std::min(width, height); ++i)
    {
        if(width % i == 0 && height % i == 0)
            divisors.push_back(static_cast<int>(i));
    }
    return divisors;
}

[[nodiscard]] std::pair<std::optional<int>, std::optional<int>> nearest_divisors(const std::vector<int> & divisors, int size)
{
    auto next = std::lower_bound(std::begin(divisors), std::end(divisors), size);

    std::optional<int> below, above;
    if(next != std::begin(divisors))
        below = *std::prev(next);
    if(next != std::end(divisors) && *next == size)
        ++next;
    if(next != std::end(divisors))
        above = *next;

    return {below, above};
}

[[nodiscard]] int auto_tile_size(std::size_t width, std::size_t height)
{
    check_dimensions(width, height);

    // about 50 columns for most images
    auto target = static_cast<int>(std::floor(static_cast<double>(width) * 0.02));

    auto divisors = common_divisors(width, height);
    if(std::binary_search(std::begin(divisors), std::end(divisors), target))
        return target;

    auto [below, above] = nearest_divisors(divisors, target);

    if(!below)
        return *above;
    if(!above)
        return *below;

    return (target - *below <= *above - target) ? *below : *above;
}

[[nodiscard]] bool is_common_divisor(int size, std::size_t width, std::size_t height)
{
    if(size <= 0)
        return false;
    auto s = static_cast<std::size_t>(size);
    return width % s == 0 && height % s == 0;
}
