#ifndef TILE_SIZE_HPP
#define TILE_SIZE_HPP

#include <optional>
#include <utility>
#include <vector>

#include <cstddef>

// every size in 1..min(width, height) that evenly divides both, ascending
[[nodiscard]] std::vector<int> common_divisors(std::size_t width, std::size_t height);

// closest common divisors below and above size. Either may be missing
[[nodiscard]] std::pair<std::optional<int>, std::optional<int>> nearest_divisors(const std::vector<int> & divisors, int size);

// Pick a tile size near 2% of the width that divides both dimensions, so
// every row of the grid gets the same number of tiles and nothing is cut off
// at the edges. Ties go to the smaller size.
[[nodiscard]] int auto_tile_size(std::size_t width, std::size_t height);

[[nodiscard]] bool is_common_divisor(int size, std::size_t width, std::size_t height);

#endif // TILE_SIZE_HPP
