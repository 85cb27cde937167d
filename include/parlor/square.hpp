#pragma once
#include <optional>
#include <string>
#include <string_view>


namespace parlor {


// Row 0 is rank 8, row 7 is rank 1; col 0 is file 'a'.
struct Square {
int row{0};
int col{0};


bool operator==(const Square&) const = default;
};


constexpr int BOARD_N = 8;


inline constexpr bool in_bounds(int row, int col) {
return row >= 0 && row < BOARD_N && col >= 0 && col < BOARD_N;
}


// "e4" -> {4, 4}. Surrounding whitespace is trimmed and case is ignored.
// Returns std::nullopt for anything that is not a file letter followed by a rank digit.
std::optional<Square> parse_square(std::string_view text);


// {4, 4} -> "e4". Square must be in bounds.
std::string square_name(Square s);


} // namespace parlor
